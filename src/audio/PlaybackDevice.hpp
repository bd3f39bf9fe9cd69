// SPDX-License-Identifier: Apache-2.0
#pragma once

#include <core/Error.hpp>

#include <span>

namespace podbuddy
{

/// @brief Abstract audio output.
class PlaybackDevice
{
  public:
    virtual ~PlaybackDevice() = default;

    /// @brief Starts playing mono float32 PCM.
    ///
    /// With @p blocking set, returns once all samples were consumed. Otherwise
    /// returns immediately; @p samples must then stay valid until
    /// waitUntilIdle() returns.
    [[nodiscard]] virtual auto play(std::span<const float> samples, unsigned sampleRate, bool blocking)
        -> VoidResult = 0;

    /// @brief Blocks until the current playback (if any) has finished.
    virtual void waitUntilIdle() = 0;

    /// @brief Cuts the current playback short.
    virtual void stop() = 0;
};

} // namespace podbuddy
