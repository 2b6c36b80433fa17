#include "runewrap/wrap/wrapper.hpp"

#include <utility>
#include <spdlog/spdlog.h>

namespace runewrap::wrap {

Result<Wrapper> Wrapper::create(WrapConfig config) {
    auto indents = config.validate();
    if (!indents) {
        spdlog::debug("rejected wrap configuration: {}", indents.error().message());
        return std::unexpected(indents.error());
    }
    return Wrapper(std::move(config), *indents);
}

Wrapper::Wrapper(WrapConfig config, IndentWidths indents)
    : config_(std::move(config)),
      indents_(indents),
      session_(config_, indents_) {
}

Result<std::string> Wrapper::wrapText(std::string_view text) const {
    WrapSession session(config_, indents_);

    auto added = session.addChunk(text);
    if (!added) {
        return std::unexpected(added.error());
    }
    return session.finish();
}

Result<std::string> Wrapper::wrapFromStream(ChunkSource& source) const {
    WrapSession session(config_, indents_);
    size_t chunks = 0;

    while (true) {
        auto chunk = source.read();
        if (!chunk) {
            spdlog::debug("reading {} failed after {} chunks: {}",
                          source.describe(), chunks, chunk.error().message());
            return std::unexpected(chunk.error());
        }
        if (!chunk->has_value()) {
            break;
        }

        ++chunks;
        auto added = session.addChunk(**chunk);
        if (!added) {
            return makeErrorResult<std::string>(added.error().code(),
                source.describe() + ": " + added.error().message());
        }
    }

    spdlog::debug("read {} chunks from {}", chunks, source.describe());
    auto wrapped = session.finish();
    if (!wrapped) {
        return makeErrorResult<std::string>(wrapped.error().code(),
            source.describe() + ": " + wrapped.error().message());
    }
    return wrapped;
}

Result<void> Wrapper::addText(std::string_view chunk) {
    auto added = session_.addChunk(chunk);
    if (!added) {
        session_.reset();
    }
    return added;
}

std::string Wrapper::accumulatedOutput() const {
    return session_.snapshot();
}

Result<std::string> Wrapper::finish() {
    return session_.finish();
}

void Wrapper::reset() {
    session_.reset();
}

} // namespace runewrap::wrap
