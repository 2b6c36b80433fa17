#include "runewrap/wrap/line_breaker.hpp"

#include <spdlog/spdlog.h>

namespace runewrap::wrap {

LineBreaker::LineBreaker(const WrapConfig& config, IndentWidths indents)
    : first_row_indent_(config.first_row_indent),
      budget_(config.column_width, indents.first, indents.subsequent) {
}

void LineBreaker::onWhitespace(const text::Token& whitespace, OutputAccumulator& out) {
    if (!word_.empty()) {
        settle(true, out);
    }
    pending_whitespace_ += whitespace.width;
    pending_line_breaks_ += whitespace.line_breaks;
}

void LineBreaker::onWord(text::Token&& word, OutputAccumulator& out) {
    word_.append(word.runes);
    settle(!word.continues, out);
}

void LineBreaker::finish(OutputAccumulator& out) {
    if (!word_.empty()) {
        settle(true, out);
    }
    // Trailing whitespace and line breaks are never written
    pending_whitespace_ = 0;
    pending_line_breaks_ = 0;
}

void LineBreaker::reset() {
    budget_.reset(true);
    state_ = State::kNotStarted;
    pending_whitespace_ = 0;
    pending_line_breaks_ = 0;
    word_.clear();
}

void LineBreaker::settle(bool word_complete, OutputAccumulator& out) {
    if (state_ == State::kNotStarted) {
        startFirstLine(out);
    } else if (pending_line_breaks_ > 0) {
        commitLineBreaks(out);
    }

    if (state_ == State::kAtLineStart) {
        pending_whitespace_ = 0;
    } else if (budget_.wouldOverflow(pending_whitespace_ + word_.size())) {
        // Also covers whitespace that alone reaches the end of the line
        wrapLine(out);
    } else if (!word_complete) {
        return;
    }

    if (state_ == State::kAtLineStart) {
        while (word_.size() > budget_.remaining()) {
            hardSplit(out);
        }
    }

    if (word_complete) {
        placeWord(out);
    }
}

void LineBreaker::startFirstLine(OutputAccumulator& out) {
    out.appendIndent(first_row_indent_);
    budget_.reset(true);
    state_ = State::kAtLineStart;
    pending_whitespace_ = 0;
    pending_line_breaks_ = 0;
}

void LineBreaker::commitLineBreaks(OutputAccumulator& out) {
    // The first break ends the current line, each further one is an empty line
    for (size_t i = 1; i < pending_line_breaks_; ++i) {
        out.appendLineBreak(false);
    }
    out.appendLineBreak(true);
    budget_.reset(false);
    state_ = State::kAtLineStart;
    pending_whitespace_ = 0;
    pending_line_breaks_ = 0;
}

void LineBreaker::wrapLine(OutputAccumulator& out) {
    out.appendLineBreak(true);
    budget_.reset(false);
    state_ = State::kAtLineStart;
    pending_whitespace_ = 0;
}

void LineBreaker::hardSplit(OutputAccumulator& out) {
    const size_t room = budget_.remaining();
    spdlog::trace("hard split: {} of {} pending runes", room, word_.size());

    out.appendRunes(word_.prefix(room));
    word_.dropPrefix(room);
    wrapLine(out);
}

void LineBreaker::placeWord(OutputAccumulator& out) {
    out.appendSpaces(pending_whitespace_);
    out.appendRunes(word_.bytes());
    budget_.charge(pending_whitespace_ + word_.size());
    state_ = State::kMidLine;
    pending_whitespace_ = 0;
    word_.clear();
}

} // namespace runewrap::wrap
