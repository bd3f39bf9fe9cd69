// SPDX-License-Identifier: Apache-2.0
#pragma once

#include <audio/AudioBuffer.hpp>
#include <audio/PlaybackDevice.hpp>
#include <audio/SynthesisWorker.hpp>
#include <conversation/SentenceSegmenter.hpp>

#include <functional>
#include <optional>
#include <stop_token>

namespace podbuddy
{

/// @brief Counters describing one sequencer run (reset by begin()).
struct PlaybackStats
{
    int submitted = 0;
    int played = 0;
    int dropped = 0;
    int playbackFailures = 0;
};

/// @brief Callback invoked right before a buffer starts playing.
using PlaybackStartedCallback = std::function<void(const AudioBuffer& buffer)>;

/// @brief Two-stage synthesis/playback pipeline for the units of one turn.
///
/// submit() synthesizes its unit on the calling thread while the previous unit
/// is still playing, then waits for that playback to end, releases its buffer
/// and starts the new one without blocking. At most one buffer is retained and
/// at most one plays at any time. Units whose synthesis fails are dropped
/// without stalling the units after them.
///
/// Not thread-safe: one turn drives one sequencer from a single thread.
class PlaybackSequencer
{
  public:
    /// @param worker Synthesis front end.
    /// @param device Primary, non-blocking playback.
    /// @param fallback Device tried (blocking) when the primary fails to start;
    ///        the primary itself in blocking mode if null.
    PlaybackSequencer(SynthesisWorker& worker, PlaybackDevice& device, PlaybackDevice* fallback = nullptr);

    PlaybackSequencer(const PlaybackSequencer&) = delete;
    PlaybackSequencer& operator=(const PlaybackSequencer&) = delete;

    /// @brief Prepares for a new turn: clears counters and the ordering cursor.
    void begin();

    /// @brief Synthesizes and schedules one unit.
    ///
    /// Units must arrive in strictly increasing sequenceIndex order. Cancellation
    /// is checked before synthesis and again before playback is issued.
    /// @return False if the unit was not admitted (cancelled or out of order);
    ///         true otherwise, including when synthesis failed and the unit was dropped.
    auto submit(const SentenceUnit& unit, const std::stop_token& stopToken = {}) -> bool;

    /// @brief Waits for the last playback to finish and releases its buffer.
    void finish();

    /// @brief Stops admitting units; the currently playing unit is allowed to finish.
    void abandon();

    /// @brief Number of buffers currently held (0 or 1).
    [[nodiscard]] auto retainedBuffers() const -> int;

    [[nodiscard]] auto stats() const -> const PlaybackStats&;

    void setPlaybackStartedCallback(PlaybackStartedCallback callback);

  private:
    SynthesisWorker& _worker;
    PlaybackDevice& _device;
    PlaybackDevice* _fallback;
    PlaybackStartedCallback _onStarted;

    std::optional<AudioBuffer> _current;
    bool _currentPlaying = false;
    std::optional<int> _lastIndex;
    bool _abandoned = false;
    PlaybackStats _stats;

    void startPlayback(AudioBuffer buffer);
    void waitAndRelease();
};

} // namespace podbuddy
