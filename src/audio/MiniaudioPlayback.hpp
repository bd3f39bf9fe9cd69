// SPDX-License-Identifier: Apache-2.0
#pragma once

#include <audio/PlaybackDevice.hpp>
#include <core/Error.hpp>

#include <memory>
#include <span>
#include <string>

namespace podbuddy
{

/// @brief Plays raw PCM audio through a playback device using miniaudio.
///
/// Uses PIMPL to isolate miniaudio headers from consumers. play() can either
/// block until all samples are consumed or return immediately; in the latter
/// case waitUntilIdle() is the completion point. The device is re-created when
/// a buffer arrives with a different sample rate.
class MiniaudioPlayback final: public PlaybackDevice
{
  public:
    MiniaudioPlayback();
    ~MiniaudioPlayback() override;

    MiniaudioPlayback(const MiniaudioPlayback&) = delete;
    MiniaudioPlayback& operator=(const MiniaudioPlayback&) = delete;

    /// @brief Initializes the playback device.
    /// @param sampleRate Audio sample rate in Hz (e.g. 22050).
    /// @param deviceName Substring of the device name to use; empty selects the default device.
    /// @return Success or an error.
    [[nodiscard]] auto initialize(unsigned sampleRate, std::string deviceName = {}) -> VoidResult;

    [[nodiscard]] auto play(std::span<const float> samples, unsigned sampleRate, bool blocking)
        -> VoidResult override;
    void waitUntilIdle() override;
    void stop() override;

    struct Impl;

  private:
    std::unique_ptr<Impl> _impl;
};

} // namespace podbuddy
