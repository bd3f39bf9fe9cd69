// SPDX-License-Identifier: Apache-2.0
#pragma once

#include <audio/AudioBuffer.hpp>
#include <core/Error.hpp>

#include <string_view>

namespace podbuddy
{

/// @brief Abstract text-to-speech capability.
///
/// Implementations are NOT required to be reentrant; callers must serialize
/// access (see SynthesisWorker).
class SynthesisEngine
{
  public:
    virtual ~SynthesisEngine() = default;

    /// @brief Converts text into one audio clip.
    /// @param text Already-cleaned text to speak.
    /// @return The synthesized audio or an error.
    [[nodiscard]] virtual auto synthesize(std::string_view text) -> Result<AudioClip> = 0;

    /// @brief Returns the sample rate of produced clips in Hz.
    [[nodiscard]] virtual auto sampleRate() const -> unsigned = 0;
};

} // namespace podbuddy
