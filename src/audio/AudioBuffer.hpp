// SPDX-License-Identifier: Apache-2.0
#pragma once

#include <chrono>
#include <string>
#include <vector>

namespace podbuddy
{

/// @brief Raw synthesizer output: mono float32 PCM.
struct AudioClip
{
    std::vector<float> samples;
    unsigned sampleRate = 22050;
};

/// @brief Synthesized audio for one SentenceUnit, owned by the playback sequencer
///        until it has been played.
struct AudioBuffer
{
    int sequenceIndex = 0;
    std::vector<float> samples;
    unsigned sampleRate = 22050;
    std::string sourceText;

    /// @brief Frees the sample storage.
    void release()
    {
        samples.clear();
        samples.shrink_to_fit();
    }

    [[nodiscard]] auto duration() const -> std::chrono::milliseconds
    {
        if (sampleRate == 0)
            return {};
        return std::chrono::milliseconds { samples.size() * 1000 / sampleRate };
    }
};

} // namespace podbuddy
