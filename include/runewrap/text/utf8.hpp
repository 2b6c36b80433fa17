#pragma once

#include <cstddef>
#include <string_view>
#include <unicode/utypes.h>
#include "runewrap/common.hpp"

namespace runewrap::text {

/**
 * @brief Outcome of decoding one rune at a byte offset
 */
enum class DecodeStatus {
    kRune,        // A complete code point was decoded
    kIncomplete,  // Input ends inside a well-formed prefix of a multi-byte rune
    kMalformed    // The bytes can never form a valid rune
};

struct DecodedRune {
    DecodeStatus status;
    UChar32 rune;       // U_SENTINEL unless status == kRune
    size_t length;      // Bytes covered by the rune or by the offending prefix
};

/**
 * @brief UTF-8 helpers on top of the ICU utf8.h macros
 *
 * Never substitutes U+FFFD: a malformed sequence is reported to the caller
 * so that width accounting cannot silently change.
 */
class Utf8 {
public:
    /**
     * @brief Decode the rune starting at @p index
     * @param bytes UTF-8 input
     * @param index Byte offset, must be < bytes.size()
     */
    static DecodedRune decode(std::string_view bytes, size_t index);

    /**
     * @brief Count the runes of a complete UTF-8 string
     * @return Rune count, or kDecodingError for malformed or truncated input
     */
    static Result<size_t> runeLength(std::string_view text);

    /**
     * @brief Check that @p text is complete, well-formed UTF-8
     */
    static Result<void> validate(std::string_view text);

    /**
     * @brief Build the error reported for a bad sequence starting with
     *        @p lead at absolute stream position @p offset
     */
    static Error decodingError(unsigned char lead, size_t offset, bool truncated);
};

} // namespace runewrap::text
