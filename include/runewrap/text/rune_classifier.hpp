#pragma once

#include <cstddef>
#include <unicode/uchar.h>

namespace runewrap::text {

/**
 * @brief Width contribution of one whitespace rune after normalization
 */
struct NormalizedRune {
    size_t width;     // Columns, each rendered as one ASCII space
    bool line_break;  // Preserved hard line break (only when folding is off)
};

/**
 * @brief Classifies runes and maps whitespace onto the width model
 *
 * Tabs always expand to tabstop_width columns. With folding on, a run of
 * adjacent CR/LF runes collapses to a single column; with folding off each
 * line break is preserved (CR LF counts once) and takes no columns.
 */
class RuneClassifier {
public:
    RuneClassifier(size_t tabstop_width, bool fold_line_breaks)
        : tabstop_width_(tabstop_width), fold_line_breaks_(fold_line_breaks) {}

    // Unicode White_Space property
    static bool isWhitespace(UChar32 rune);

    // LF or CR
    static bool isLineBreak(UChar32 rune);

    /**
     * @brief Normalize a whitespace rune
     * @param rune Whitespace rune to normalize
     * @param previous Rune before it in the same whitespace run, or U_SENTINEL
     */
    NormalizedRune normalize(UChar32 rune, UChar32 previous) const;

private:
    size_t tabstop_width_;
    bool fold_line_breaks_;
};

} // namespace runewrap::text
