// SPDX-License-Identifier: Apache-2.0
#include "SynthesisWorker.hpp"

#include <core/Log.hpp>

#include <chrono>
#include <format>
#include <utility>

namespace podbuddy
{

SynthesisWorker::SynthesisWorker(SynthesisEngine& engine, SynthesisWorkerConfig config):
    _engine(engine), _config(std::move(config))
{
}

auto SynthesisWorker::synthesize(const SentenceUnit& unit) -> SynthesisResult
{
    auto const fail = [&](Error error) {
        return std::unexpected(SynthesisFailure {
            .text = unit.text,
            .sequenceIndex = unit.sequenceIndex,
            .error = std::move(error),
        });
    };

    auto clean = cleanForSpeech(unit.text, _config.maxChars);
    if (clean.empty())
        return fail(Error { ErrorCode::SynthesisError, "Text is empty after cleanup" });

    auto const start = std::chrono::steady_clock::now();
    auto clip = [&] {
        auto lock = std::lock_guard(_mutex);
        return _engine.synthesize(clean);
    }();

    if (!clip)
        return fail(std::move(clip.error()));
    if (clip->samples.empty())
        return fail(Error { ErrorCode::SynthesisError, "Synthesizer produced no audio" });

    auto const elapsed =
        std::chrono::duration_cast<std::chrono::milliseconds>(std::chrono::steady_clock::now() - start);

    auto buffer = AudioBuffer {
        .sequenceIndex = unit.sequenceIndex,
        .samples = std::move(clip->samples),
        .sampleRate = clip->sampleRate,
        .sourceText = std::move(clean),
    };
    log::debug("Synthesized unit {} in {} ({} of audio)", unit.sequenceIndex, elapsed, buffer.duration());
    return buffer;
}

auto SynthesisWorker::warmUp() -> VoidResult
{
    log::info("Warming up speech synthesis...");

    auto lock = std::lock_guard(_mutex);
    auto clip = _engine.synthesize(_config.warmUpText);
    if (!clip)
        return std::unexpected(clip.error());

    log::info("Speech synthesis ready");
    return {};
}

} // namespace podbuddy
