#include "runewrap/text/utf8.hpp"

#include <cstdint>
#include <cstdio>
#include <unicode/utf8.h>

namespace runewrap::text {

DecodedRune Utf8::decode(std::string_view bytes, size_t index) {
    const auto* data = reinterpret_cast<const uint8_t*>(bytes.data());
    const auto length = static_cast<int32_t>(bytes.size());
    const auto start = static_cast<int32_t>(index);

    int32_t next = start;
    UChar32 rune = U_SENTINEL;
    U8_NEXT(data, next, length, rune);

    const auto consumed = static_cast<size_t>(next - start);
    if (rune >= 0) {
        return {DecodeStatus::kRune, rune, consumed};
    }

    // U8_NEXT stops before the first byte that cannot continue the sequence,
    // so running into the end of input means every byte seen so far was valid.
    const uint8_t lead = data[start];
    const auto expected = static_cast<size_t>(U8_COUNT_TRAIL_BYTES(lead)) + 1;
    if (expected > 1 && next == length && consumed < expected) {
        return {DecodeStatus::kIncomplete, U_SENTINEL, consumed};
    }

    return {DecodeStatus::kMalformed, U_SENTINEL, consumed};
}

Result<size_t> Utf8::runeLength(std::string_view text) {
    size_t count = 0;
    size_t index = 0;

    while (index < text.size()) {
        auto decoded = decode(text, index);
        if (decoded.status != DecodeStatus::kRune) {
            return std::unexpected(decodingError(static_cast<unsigned char>(text[index]), index,
                                                 decoded.status == DecodeStatus::kIncomplete));
        }
        index += decoded.length;
        ++count;
    }

    return count;
}

Result<void> Utf8::validate(std::string_view text) {
    auto length = runeLength(text);
    if (!length) {
        return std::unexpected(length.error());
    }
    return {};
}

Error Utf8::decodingError(unsigned char lead, size_t offset, bool truncated) {
    char byte_hex[8];
    std::snprintf(byte_hex, sizeof(byte_hex), "0x%02X", static_cast<unsigned>(lead));

    if (truncated) {
        return makeError(ErrorCode::kDecodingError,
            "Incomplete UTF-8 sequence starting with " + std::string(byte_hex) +
            " at byte " + std::to_string(offset));
    }
    return makeError(ErrorCode::kDecodingError,
        "Invalid UTF-8 sequence starting with " + std::string(byte_hex) +
        " at byte " + std::to_string(offset));
}

} // namespace runewrap::text
