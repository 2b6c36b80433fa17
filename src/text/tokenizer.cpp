#include "runewrap/text/tokenizer.hpp"

#include <algorithm>
#include <utility>
#include "runewrap/text/utf8.hpp"

namespace runewrap::text {

Tokenizer::Tokenizer(RuneClassifier classifier, size_t max_word_fragment)
    : classifier_(classifier), max_word_fragment_(std::max<size_t>(max_word_fragment, 1)) {
}

Result<ScanResult> Tokenizer::scan(std::string_view input) {
    ScanResult result;
    size_t index = 0;

    while (index < input.size()) {
        auto decoded = Utf8::decode(input, index);

        if (decoded.status == DecodeStatus::kIncomplete) {
            result.needs_more_input = true;
            break;
        }
        if (decoded.status == DecodeStatus::kMalformed) {
            return std::unexpected(Utf8::decodingError(
                static_cast<unsigned char>(input[index]), offset_ + index, false));
        }

        const auto kind = RuneClassifier::isWhitespace(decoded.rune)
                              ? TokenKind::kWhitespace
                              : TokenKind::kWord;

        // A rune of the other class closes the run; it is not consumed here
        if (run_kind_ && *run_kind_ != kind) {
            run_kind_.reset();
            previous_ = U_SENTINEL;
            if (pending_) {
                result.token = take();
                result.bytes_consumed = index;
                offset_ += index;
                return result;
            }
        }

        extend(kind, decoded.rune, input.substr(index, decoded.length));
        index += decoded.length;

        if (kind == TokenKind::kWord && pending_->runes.size() >= max_word_fragment_) {
            result.token = take();
            result.token->continues = true;
            break;
        }
    }

    result.bytes_consumed = index;
    offset_ += index;
    return result;
}

std::optional<Token> Tokenizer::finish() {
    std::optional<Token> last;
    if (pending_) {
        last = take();
    }
    run_kind_.reset();
    previous_ = U_SENTINEL;
    return last;
}

void Tokenizer::reset() {
    run_kind_.reset();
    pending_.reset();
    previous_ = U_SENTINEL;
    offset_ = 0;
}

void Tokenizer::extend(TokenKind kind, UChar32 rune, std::string_view rune_bytes) {
    run_kind_ = kind;
    if (!pending_) {
        pending_.emplace();
        pending_->kind = kind;
    }

    Token& token = *pending_;
    ++token.rune_count;

    if (kind == TokenKind::kWord) {
        token.runes.appendRune(rune_bytes);
        ++token.width;
        return;
    }

    auto normalized = classifier_.normalize(rune, previous_);
    token.width += normalized.width;
    if (normalized.line_break) {
        ++token.line_breaks;
    }
    previous_ = rune;
}

Token Tokenizer::take() {
    Token token = std::move(*pending_);
    pending_.reset();
    return token;
}

} // namespace runewrap::text
