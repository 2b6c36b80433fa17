#include "runewrap/text/rune_run.hpp"

#include <algorithm>

namespace runewrap::text {

void RuneRun::appendRune(std::string_view rune_bytes) {
    bytes_.append(rune_bytes);
    ends_.push_back(bytes_.size());
}

void RuneRun::append(const RuneRun& other) {
    const size_t base = bytes_.size();
    bytes_.append(other.bytes_);
    ends_.reserve(ends_.size() + other.ends_.size());
    for (size_t end : other.ends_) {
        ends_.push_back(base + end);
    }
}

std::string_view RuneRun::prefix(size_t runes) const {
    return std::string_view(bytes_).substr(0, byteOffset(runes));
}

void RuneRun::dropPrefix(size_t runes) {
    runes = std::min(runes, ends_.size());
    if (runes == 0) {
        return;
    }

    const size_t cut = ends_[runes - 1];
    bytes_.erase(0, cut);
    ends_.erase(ends_.begin(), ends_.begin() + static_cast<std::ptrdiff_t>(runes));
    for (auto& end : ends_) {
        end -= cut;
    }
}

void RuneRun::clear() {
    bytes_.clear();
    ends_.clear();
}

size_t RuneRun::byteOffset(size_t runes) const {
    if (runes == 0 || ends_.empty()) {
        return 0;
    }
    return ends_[std::min(runes, ends_.size()) - 1];
}

} // namespace runewrap::text
