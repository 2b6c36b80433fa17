#pragma once

#include <cstddef>
#include <optional>
#include <string_view>
#include <unicode/utypes.h>
#include "runewrap/common.hpp"
#include "runewrap/text/rune_classifier.hpp"
#include "runewrap/text/rune_run.hpp"

namespace runewrap::text {

enum class TokenKind {
    kWhitespace,
    kWord
};

/**
 * @brief A maximal whitespace run or word run (or a fragment of one)
 */
struct Token {
    TokenKind kind = TokenKind::kWord;
    size_t rune_count = 0;    // Input runes covered by this token
    size_t width = 0;         // Columns after normalization (words: rune_count)
    size_t line_breaks = 0;   // Preserved line breaks (whitespace, folding off)
    RuneRun runes;            // Word runes; empty for whitespace
    bool continues = false;   // Word reached the fragment limit, more of it may follow
};

/**
 * @brief Outcome of one Tokenizer::scan() call
 */
struct ScanResult {
    std::optional<Token> token;      // Set when a run was closed or a word fragment filled up
    size_t bytes_consumed = 0;       // Bytes of the input the caller may drop
    bool needs_more_input = false;   // Input ends inside a multi-byte rune
};

/**
 * @brief Resumable scanner splitting UTF-8 bytes into whitespace and word runs
 *
 * The run in progress is kept between scan() calls, so tokens depend only on
 * the byte sequence and never on where the caller split it into chunks. A
 * trailing partial rune is left unconsumed; the caller presents those bytes
 * again at the front of the next chunk.
 *
 * Words longer than @p max_word_fragment runes are delivered as several
 * tokens with continues=true on all but the last; that keeps memory bounded
 * for input that never contains whitespace.
 */
class Tokenizer {
public:
    Tokenizer(RuneClassifier classifier, size_t max_word_fragment);

    /**
     * @brief Scan @p input from its first byte
     * @return The next completed token, if any, and how many bytes were
     *         consumed; kDecodingError for malformed UTF-8
     */
    Result<ScanResult> scan(std::string_view input);

    /**
     * @brief Close the run in progress at end of stream
     * @return The final token, or std::nullopt when nothing is pending
     */
    std::optional<Token> finish();

    void reset();

    // Total bytes consumed since construction or the last reset()
    size_t offset() const { return offset_; }

private:
    void extend(TokenKind kind, UChar32 rune, std::string_view rune_bytes);
    Token take();

    RuneClassifier classifier_;
    size_t max_word_fragment_;
    std::optional<TokenKind> run_kind_;
    std::optional<Token> pending_;
    UChar32 previous_ = U_SENTINEL;   // Previous rune of the whitespace run in progress
    size_t offset_ = 0;
};

} // namespace runewrap::text
