#pragma once

#include <cstddef>
#include <string>
#include <string_view>

namespace runewrap::wrap {

/**
 * @brief Append-only buffer receiving wrapped output
 *
 * Knows the separator and the subsequent-row indent, so the line breaker
 * only has to say where a line ends.
 */
class OutputAccumulator {
public:
    OutputAccumulator(std::string line_separator, std::string subsequent_indent);

    void appendRunes(std::string_view utf8);
    void appendSpaces(size_t count);
    void appendIndent(std::string_view indent);

    /**
     * @brief Write the separator and, if @p with_indent, the subsequent-row indent
     *
     * with_indent is false for an empty line.
     */
    void appendLineBreak(bool with_indent = true);

    const std::string& snapshot() const { return buffer_; }

    /**
     * @brief Move the output out, leaving the buffer empty
     */
    std::string release();

    size_t size() const { return buffer_.size(); }
    bool empty() const { return buffer_.empty(); }

    // Session reset only
    void clear() { buffer_.clear(); }

private:
    std::string line_separator_;
    std::string subsequent_indent_;
    std::string buffer_;
};

} // namespace runewrap::wrap
