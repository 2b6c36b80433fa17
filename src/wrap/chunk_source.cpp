#include "runewrap/wrap/chunk_source.hpp"

#include <algorithm>
#include <utility>

namespace runewrap::wrap {

IstreamChunkSource::IstreamChunkSource(std::istream& in, std::string name, size_t chunk_size)
    : in_(in), name_(std::move(name)), buffer_(std::max<size_t>(chunk_size, 1), '\0') {
}

Result<std::optional<std::string_view>> IstreamChunkSource::read() {
    if (in_.bad()) {
        return makeErrorResult<std::optional<std::string_view>>(
            ErrorCode::kIoError, "Stream is unreadable: " + name_);
    }
    if (in_.eof()) {
        return std::optional<std::string_view>{};
    }

    in_.read(buffer_.data(), static_cast<std::streamsize>(buffer_.size()));
    const auto count = static_cast<size_t>(in_.gcount());

    if (in_.bad()) {
        return makeErrorResult<std::optional<std::string_view>>(
            ErrorCode::kIoError, "Read failed: " + name_);
    }
    // A short read sets failbit together with eofbit; failbit alone is an error
    if (in_.fail() && !in_.eof()) {
        return makeErrorResult<std::optional<std::string_view>>(
            ErrorCode::kIoError, "Read failed: " + name_);
    }

    if (count == 0) {
        return std::optional<std::string_view>{};
    }
    return std::optional<std::string_view>(std::string_view(buffer_.data(), count));
}

StringChunkSource::StringChunkSource(std::string_view text, size_t chunk_size)
    : text_(text), chunk_size_(std::max<size_t>(chunk_size, 1)) {
}

Result<std::optional<std::string_view>> StringChunkSource::read() {
    if (position_ >= text_.size()) {
        return std::optional<std::string_view>{};
    }
    auto chunk = text_.substr(position_, chunk_size_);
    position_ += chunk.size();
    return std::optional<std::string_view>(chunk);
}

} // namespace runewrap::wrap
