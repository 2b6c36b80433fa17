#include "runewrap/text/rune_classifier.hpp"

namespace runewrap::text {

bool RuneClassifier::isWhitespace(UChar32 rune) {
    return u_isUWhiteSpace(rune);
}

bool RuneClassifier::isLineBreak(UChar32 rune) {
    return rune == 0x000A ||  // Line Feed
           rune == 0x000D;    // Carriage Return
}

NormalizedRune RuneClassifier::normalize(UChar32 rune, UChar32 previous) const {
    if (rune == 0x0009) {
        return {tabstop_width_, false};
    }

    if (isLineBreak(rune)) {
        if (fold_line_breaks_) {
            return {isLineBreak(previous) ? 0u : 1u, false};
        }
        // CR LF is a single break
        if (rune == 0x000A && previous == 0x000D) {
            return {0, false};
        }
        return {0, true};
    }

    return {1, false};
}

} // namespace runewrap::text
