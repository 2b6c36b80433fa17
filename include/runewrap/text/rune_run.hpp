#pragma once

#include <cstddef>
#include <string>
#include <string_view>
#include <vector>

namespace runewrap::text {

/**
 * @brief UTF-8 bytes of a run of runes plus a per-rune byte offset table
 *
 * Lets callers count and split by runes without re-decoding. Every
 * rune/byte conversion in the wrapper goes through this class.
 */
class RuneRun {
public:
    RuneRun() = default;

    /**
     * @brief Append the bytes of exactly one decoded rune
     */
    void appendRune(std::string_view rune_bytes);

    /**
     * @brief Append every rune of another run
     */
    void append(const RuneRun& other);

    // Number of runes
    size_t size() const { return ends_.size(); }
    bool empty() const { return ends_.empty(); }

    size_t byteSize() const { return bytes_.size(); }
    std::string_view bytes() const { return bytes_; }

    /**
     * @brief Bytes of the first @p runes runes (clamped to size())
     */
    std::string_view prefix(size_t runes) const;

    /**
     * @brief Remove the first @p runes runes (clamped to size())
     */
    void dropPrefix(size_t runes);

    void clear();

private:
    size_t byteOffset(size_t runes) const;

    std::string bytes_;
    std::vector<size_t> ends_;  // ends_[i] is the byte offset just past rune i
};

} // namespace runewrap::text
