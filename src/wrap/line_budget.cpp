#include "runewrap/wrap/line_budget.hpp"

namespace runewrap::wrap {

LineBudget::LineBudget(size_t column_width, size_t first_indent_width,
                       size_t subsequent_indent_width)
    : column_width_(column_width),
      first_indent_width_(first_indent_width),
      subsequent_indent_width_(subsequent_indent_width),
      remaining_(column_width - first_indent_width) {
}

void LineBudget::reset(bool is_first_line) {
    remaining_ = column_width_ - (is_first_line ? first_indent_width_ : subsequent_indent_width_);
}

void LineBudget::charge(size_t n) {
    remaining_ = n > remaining_ ? 0 : remaining_ - n;
}

} // namespace runewrap::wrap
