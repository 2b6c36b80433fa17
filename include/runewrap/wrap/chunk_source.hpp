#pragma once

#include <cstddef>
#include <istream>
#include <optional>
#include <string>
#include <string_view>
#include "runewrap/common.hpp"

namespace runewrap::wrap {

/**
 * @brief Pull-based source of byte chunks
 *
 * Chunks may end anywhere, including inside a multi-byte rune.
 */
class ChunkSource {
public:
    static constexpr size_t kDefaultChunkSize = 4096;

    virtual ~ChunkSource() = default;

    /**
     * @brief Read the next chunk, blocking if needed
     * @return A view valid until the next call, std::nullopt at end of
     *         stream, or kIoError
     */
    virtual Result<std::optional<std::string_view>> read() = 0;

    // Name for log and error messages
    virtual std::string describe() const = 0;
};

/**
 * @brief Reads fixed-size chunks from a std::istream (files, stdin)
 */
class IstreamChunkSource : public ChunkSource {
public:
    IstreamChunkSource(std::istream& in, std::string name, size_t chunk_size = kDefaultChunkSize);

    Result<std::optional<std::string_view>> read() override;
    std::string describe() const override { return name_; }

private:
    std::istream& in_;
    std::string name_;
    std::string buffer_;
};

/**
 * @brief Serves an in-memory string in chunks of at most chunk_size bytes
 */
class StringChunkSource : public ChunkSource {
public:
    explicit StringChunkSource(std::string_view text, size_t chunk_size = kDefaultChunkSize);

    Result<std::optional<std::string_view>> read() override;
    std::string describe() const override { return "<string>"; }

private:
    std::string_view text_;
    size_t chunk_size_;
    size_t position_ = 0;
};

} // namespace runewrap::wrap
