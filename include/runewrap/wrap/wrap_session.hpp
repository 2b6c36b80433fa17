#pragma once

#include <cstddef>
#include <string>
#include <string_view>
#include "runewrap/common.hpp"
#include "runewrap/text/tokenizer.hpp"
#include "runewrap/wrap/line_breaker.hpp"
#include "runewrap/wrap/output_accumulator.hpp"
#include "runewrap/wrap/wrap_config.hpp"

namespace runewrap::wrap {

/**
 * @brief State of one wrap over a stream of byte chunks
 *
 * Chunk boundaries may fall anywhere, including inside a multi-byte rune;
 * the undecoded tail of a chunk is carried over to the next one. Not safe
 * for concurrent use.
 */
class WrapSession {
public:
    WrapSession(const WrapConfig& config, IndentWidths indents);

    /**
     * @brief Feed the next chunk of UTF-8 bytes
     * @return kDecodingError on malformed input
     */
    Result<void> addChunk(std::string_view chunk);

    /**
     * @brief End the stream and take the wrapped text; the session is reset
     * @return kDecodingError if the stream stopped inside a rune
     */
    Result<std::string> finish();

    /**
     * @brief Output the session would produce if the stream ended now
     *
     * Leaves the session untouched. Carried bytes of an incomplete rune are
     * ignored.
     */
    std::string snapshot() const;

    void reset();

    const LineBreaker& breaker() const { return breaker_; }

private:
    Result<void> feed(std::string_view bytes);
    void dispatch(text::Token&& token);
    std::string drain();

    text::Tokenizer tokenizer_;
    LineBreaker breaker_;
    OutputAccumulator out_;
    std::string carry_;
};

} // namespace runewrap::wrap
