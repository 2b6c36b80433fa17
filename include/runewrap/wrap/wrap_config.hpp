#pragma once

#include <cstddef>
#include <string>
#include "runewrap/common.hpp"

namespace runewrap::wrap {

/**
 * @brief Rune widths of the two indents, known once a config validates
 */
struct IndentWidths {
    size_t first = 0;
    size_t subsequent = 0;
};

/**
 * @brief Wrapping options
 *
 * Plain value: a Wrapper copies it at creation and never changes it, so
 * nothing derived from it (indent widths, columns left after the indent)
 * can go stale.
 */
struct WrapConfig {
    static constexpr size_t kDefaultColumnWidth = 80;
    static constexpr size_t kDefaultTabstopWidth = 1;

    size_t column_width = kDefaultColumnWidth;    // Including the indent
    std::string first_row_indent;                 // Written before the first line
    std::string subsequent_row_indent;            // Written after every inserted line break
    bool fold_line_breaks = true;                 // CR/LF runs become one space
    size_t tabstop_width = kDefaultTabstopWidth;  // Spaces per tab
    std::string line_separator = "\n";

    /**
     * @brief Check the option combination
     * @return Indent widths in runes, or kIndentTooWide / kInvalidArgument /
     *         kDecodingError
     */
    Result<IndentWidths> validate() const;
};

} // namespace runewrap::wrap
