#pragma once

#include <string>
#include <string_view>
#include "runewrap/common.hpp"
#include "runewrap/wrap/chunk_source.hpp"
#include "runewrap/wrap/wrap_config.hpp"
#include "runewrap/wrap/wrap_session.hpp"

namespace runewrap::wrap {

/**
 * @brief Word wrapper for UTF-8 text
 *
 * Reformats text into lines of at most column_width runes (indent
 * included), breaking at whitespace. Whitespace runs are kept inside a line
 * (each rune as one space, tabs expanded), dropped at line starts and at the
 * end of the text, and never followed by a trailing separator. A word wider
 * than a whole line is broken at the column limit.
 *
 * One-shot calls (wrapText, wrapFromStream) use a private session each and
 * may be repeated on the same Wrapper. addText/finish drive a single
 * incremental session owned by the Wrapper.
 */
class Wrapper {
public:
    /**
     * @brief Validate @p config and build a wrapper
     * @return kIndentTooWide when an indent leaves no room on its line,
     *         kInvalidArgument / kDecodingError for other bad options
     */
    static Result<Wrapper> create(WrapConfig config = WrapConfig{});

    /**
     * @brief Wrap a complete string
     */
    Result<std::string> wrapText(std::string_view text) const;

    /**
     * @brief Pull every chunk from @p source and wrap the whole stream
     *
     * Errors from the source are returned unchanged and the partial output
     * is discarded.
     */
    Result<std::string> wrapFromStream(ChunkSource& source) const;

    /**
     * @brief Append a chunk to the incremental session
     *
     * On kDecodingError the incremental session is discarded.
     */
    Result<void> addText(std::string_view chunk);

    /**
     * @brief Output of the text added so far, as if it ended here
     */
    std::string accumulatedOutput() const;

    /**
     * @brief End the incremental session and return its output
     */
    Result<std::string> finish();

    /**
     * @brief Discard the incremental session
     */
    void reset();

    const WrapConfig& config() const { return config_; }
    const IndentWidths& indentWidths() const { return indents_; }

private:
    Wrapper(WrapConfig config, IndentWidths indents);

    WrapConfig config_;
    IndentWidths indents_;
    WrapSession session_;
};

} // namespace runewrap::wrap
