#pragma once

#include <cstddef>

namespace runewrap::wrap {

/**
 * @brief Remaining width of the line being built
 *
 * Widths are in normalized runes. The indent of each line is subtracted up
 * front, so remaining() is what is left for content.
 */
class LineBudget {
public:
    LineBudget(size_t column_width, size_t first_indent_width, size_t subsequent_indent_width);

    /**
     * @brief Start a new line
     * @param is_first_line Use the first-row indent instead of the subsequent one
     */
    void reset(bool is_first_line);

    /**
     * @brief Subtract @p n, saturating at zero
     */
    void charge(size_t n);

    bool wouldOverflow(size_t n) const { return n > remaining_; }

    size_t remaining() const { return remaining_; }

    // Width of a line that starts with the subsequent-row indent
    size_t fresh() const { return column_width_ - subsequent_indent_width_; }

private:
    size_t column_width_;
    size_t first_indent_width_;
    size_t subsequent_indent_width_;
    size_t remaining_;
};

} // namespace runewrap::wrap
