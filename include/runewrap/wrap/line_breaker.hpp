#pragma once

#include <cstddef>
#include <string>
#include "runewrap/text/rune_run.hpp"
#include "runewrap/text/tokenizer.hpp"
#include "runewrap/wrap/line_budget.hpp"
#include "runewrap/wrap/output_accumulator.hpp"
#include "runewrap/wrap/wrap_config.hpp"

namespace runewrap::wrap {

/**
 * @brief Decides where line breaks go
 *
 * Receives whitespace and word tokens in stream order. The whitespace before
 * a word is held until the word is complete, because whether it is rendered
 * depends on the word's width:
 *
 * - at the start of a line whitespace is dropped;
 * - mid-line, whitespace + word is written when it fits the remaining width;
 * - otherwise the whitespace is dropped and a line break is inserted;
 * - a word wider than the line it starts is split after exactly as many
 *   runes as the line has room for.
 *
 * Output is never retracted, so a decision is only committed once it is
 * certain. For a word that is still arriving that means the two outcomes
 * that more runes cannot undo: a mid-line overflow, and a hard split at the
 * start of a line.
 */
class LineBreaker {
public:
    enum class State {
        kNotStarted,   // Nothing written yet, first indent still pending
        kAtLineStart,  // Line begun, no word on it yet
        kMidLine
    };

    LineBreaker(const WrapConfig& config, IndentWidths indents);

    /**
     * @brief Whitespace token: completes any pending word, then is held
     */
    void onWhitespace(const text::Token& whitespace, OutputAccumulator& out);

    /**
     * @brief Word token or fragment of one (continues == true)
     */
    void onWord(text::Token&& word, OutputAccumulator& out);

    /**
     * @brief End of stream: flush the pending word, drop trailing whitespace
     */
    void finish(OutputAccumulator& out);

    void reset();

    State state() const { return state_; }
    size_t remainingWidth() const { return budget_.remaining(); }
    size_t pendingWhitespaceWidth() const { return pending_whitespace_; }
    size_t pendingWordRunes() const { return word_.size(); }

private:
    // Apply every decision that is already certain; place the word if complete
    void settle(bool word_complete, OutputAccumulator& out);
    void startFirstLine(OutputAccumulator& out);
    void commitLineBreaks(OutputAccumulator& out);
    void wrapLine(OutputAccumulator& out);
    void hardSplit(OutputAccumulator& out);
    void placeWord(OutputAccumulator& out);

    std::string first_row_indent_;
    LineBudget budget_;
    State state_ = State::kNotStarted;
    size_t pending_whitespace_ = 0;
    size_t pending_line_breaks_ = 0;
    text::RuneRun word_;
};

} // namespace runewrap::wrap
