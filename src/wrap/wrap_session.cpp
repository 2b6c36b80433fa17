#include "runewrap/wrap/wrap_session.hpp"

#include <utility>
#include <spdlog/spdlog.h>
#include "runewrap/text/utf8.hpp"

namespace runewrap::wrap {

WrapSession::WrapSession(const WrapConfig& config, IndentWidths indents)
    : tokenizer_(text::RuneClassifier(config.tabstop_width, config.fold_line_breaks),
                 config.column_width),
      breaker_(config, indents),
      out_(config.line_separator, config.subsequent_row_indent) {
}

Result<void> WrapSession::addChunk(std::string_view chunk) {
    if (chunk.empty()) {
        return {};
    }

    if (carry_.empty()) {
        return feed(chunk);
    }

    std::string joined = std::move(carry_);
    carry_.clear();
    joined.append(chunk);
    return feed(joined);
}

Result<std::string> WrapSession::finish() {
    if (!carry_.empty()) {
        auto error = text::Utf8::decodingError(static_cast<unsigned char>(carry_.front()),
                                               tokenizer_.offset(), true);
        reset();
        return std::unexpected(error);
    }

    std::string wrapped = drain();
    spdlog::debug("wrap session finished: {} input bytes, {} output bytes",
                  tokenizer_.offset(), wrapped.size());
    reset();
    return wrapped;
}

std::string WrapSession::snapshot() const {
    WrapSession copy(*this);
    copy.carry_.clear();
    return copy.drain();
}

void WrapSession::reset() {
    tokenizer_.reset();
    breaker_.reset();
    out_.clear();
    carry_.clear();
}

Result<void> WrapSession::feed(std::string_view bytes) {
    std::string_view rest = bytes;

    while (true) {
        auto step = tokenizer_.scan(rest);
        if (!step) {
            return std::unexpected(step.error());
        }
        rest.remove_prefix(step->bytes_consumed);

        if (!step->token) {
            break;
        }
        dispatch(std::move(*step->token));
    }

    // Only the start of an incomplete rune can be left over
    carry_.assign(rest);
    return {};
}

void WrapSession::dispatch(text::Token&& token) {
    if (token.kind == text::TokenKind::kWhitespace) {
        breaker_.onWhitespace(token, out_);
    } else {
        breaker_.onWord(std::move(token), out_);
    }
}

std::string WrapSession::drain() {
    if (auto last = tokenizer_.finish()) {
        dispatch(std::move(*last));
    }
    breaker_.finish(out_);
    return out_.release();
}

} // namespace runewrap::wrap
