#include "runewrap/wrap/wrap_config.hpp"

#include "runewrap/text/utf8.hpp"

namespace runewrap::wrap {

Result<IndentWidths> WrapConfig::validate() const {
    if (tabstop_width == 0) {
        return makeErrorResult<IndentWidths>(ErrorCode::kInvalidArgument,
            "Tabstop width must be at least 1");
    }
    if (line_separator.empty()) {
        return makeErrorResult<IndentWidths>(ErrorCode::kInvalidArgument,
            "Line separator must not be empty");
    }
    if (auto valid = text::Utf8::validate(line_separator); !valid) {
        return makeErrorResult<IndentWidths>(ErrorCode::kDecodingError,
            "Line separator: " + valid.error().message());
    }

    auto first = text::Utf8::runeLength(first_row_indent);
    if (!first) {
        return makeErrorResult<IndentWidths>(ErrorCode::kDecodingError,
            "First row indent: " + first.error().message());
    }
    auto subsequent = text::Utf8::runeLength(subsequent_row_indent);
    if (!subsequent) {
        return makeErrorResult<IndentWidths>(ErrorCode::kDecodingError,
            "Subsequent row indent: " + subsequent.error().message());
    }

    if (column_width <= *first || column_width <= *subsequent) {
        return makeErrorResult<IndentWidths>(ErrorCode::kIndentTooWide,
            "Row width " + std::to_string(column_width) +
            " must be larger than the indents (first " + std::to_string(*first) +
            ", subsequent " + std::to_string(*subsequent) + ")");
    }

    return IndentWidths{*first, *subsequent};
}

} // namespace runewrap::wrap
