#include "runewrap/wrap/output_accumulator.hpp"

#include <utility>

namespace runewrap::wrap {

OutputAccumulator::OutputAccumulator(std::string line_separator, std::string subsequent_indent)
    : line_separator_(std::move(line_separator)),
      subsequent_indent_(std::move(subsequent_indent)) {
}

void OutputAccumulator::appendRunes(std::string_view utf8) {
    buffer_.append(utf8);
}

void OutputAccumulator::appendSpaces(size_t count) {
    buffer_.append(count, ' ');
}

void OutputAccumulator::appendIndent(std::string_view indent) {
    buffer_.append(indent);
}

void OutputAccumulator::appendLineBreak(bool with_indent) {
    buffer_.append(line_separator_);
    if (with_indent) {
        buffer_.append(subsequent_indent_);
    }
}

std::string OutputAccumulator::release() {
    std::string out = std::move(buffer_);
    buffer_.clear();
    return out;
}

} // namespace runewrap::wrap
