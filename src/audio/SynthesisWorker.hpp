// SPDX-License-Identifier: Apache-2.0
#pragma once

#include <audio/AudioBuffer.hpp>
#include <audio/SpeechText.hpp>
#include <audio/SynthesisEngine.hpp>
#include <conversation/SentenceSegmenter.hpp>
#include <core/Error.hpp>

#include <cstddef>
#include <expected>
#include <mutex>
#include <string>

namespace podbuddy
{

/// @brief Configuration for the synthesis worker.
struct SynthesisWorkerConfig
{
    /// @brief Character cap applied by cleanForSpeech() before synthesis.
    std::size_t maxChars = DefaultSpeechMaxChars;

    /// @brief Text synthesized (and discarded) by warmUp().
    std::string warmUpText = "Hello.";
};

/// @brief A unit that could not be synthesized. Never fatal to the turn.
struct SynthesisFailure
{
    std::string text;
    int sequenceIndex = 0;
    Error error;
};

using SynthesisResult = std::expected<AudioBuffer, SynthesisFailure>;

/// @brief Serialized front end to a non-reentrant SynthesisEngine.
///
/// Every path to the engine, including warm-up, goes through one mutex. There
/// is no queue: callers block until the engine is free.
class SynthesisWorker
{
  public:
    explicit SynthesisWorker(SynthesisEngine& engine, SynthesisWorkerConfig config = {});

    SynthesisWorker(const SynthesisWorker&) = delete;
    SynthesisWorker& operator=(const SynthesisWorker&) = delete;

    /// @brief Cleans and synthesizes one unit.
    /// @return The audio for the unit, or a failure tagged with the unit's text.
    [[nodiscard]] auto synthesize(const SentenceUnit& unit) -> SynthesisResult;

    /// @brief Synthesizes and discards the warm-up text.
    [[nodiscard]] auto warmUp() -> VoidResult;

  private:
    SynthesisEngine& _engine;
    SynthesisWorkerConfig _config;
    std::mutex _mutex;
};

} // namespace podbuddy
