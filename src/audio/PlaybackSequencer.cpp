// SPDX-License-Identifier: Apache-2.0
#include "PlaybackSequencer.hpp"

#include <core/Log.hpp>

#include <utility>

namespace podbuddy
{

PlaybackSequencer::PlaybackSequencer(SynthesisWorker& worker, PlaybackDevice& device, PlaybackDevice* fallback):
    _worker(worker), _device(device), _fallback(fallback)
{
}

void PlaybackSequencer::begin()
{
    waitAndRelease();
    _lastIndex.reset();
    _abandoned = false;
    _stats = {};
}

auto PlaybackSequencer::submit(const SentenceUnit& unit, const std::stop_token& stopToken) -> bool
{
    if (_abandoned || stopToken.stop_requested())
    {
        log::debug("Unit {} not admitted: pipeline cancelled", unit.sequenceIndex);
        return false;
    }

    if (_lastIndex && unit.sequenceIndex <= *_lastIndex)
    {
        log::warning("Unit {} arrived after unit {}, ignoring", unit.sequenceIndex, *_lastIndex);
        return false;
    }
    _lastIndex = unit.sequenceIndex;
    ++_stats.submitted;

    // Runs while the previous unit is still playing.
    auto result = _worker.synthesize(unit);
    if (!result)
    {
        ++_stats.dropped;
        log::warning("Dropping unit {} (\"{}\"): {}",
                     result.error().sequenceIndex,
                     result.error().text,
                     result.error().error);
        return true;
    }

    waitAndRelease();

    if (stopToken.stop_requested())
    {
        log::debug("Unit {} synthesized but cancelled before playback", unit.sequenceIndex);
        _abandoned = true;
        return false;
    }

    startPlayback(std::move(*result));
    return true;
}

void PlaybackSequencer::finish()
{
    waitAndRelease();
    _lastIndex.reset();
}

void PlaybackSequencer::abandon()
{
    _abandoned = true;
    waitAndRelease();
}

auto PlaybackSequencer::retainedBuffers() const -> int
{
    return _current ? 1 : 0;
}

auto PlaybackSequencer::stats() const -> const PlaybackStats&
{
    return _stats;
}

void PlaybackSequencer::setPlaybackStartedCallback(PlaybackStartedCallback callback)
{
    _onStarted = std::move(callback);
}

void PlaybackSequencer::startPlayback(AudioBuffer buffer)
{
    _current = std::move(buffer);
    auto const& current = *_current;

    if (_onStarted)
        _onStarted(current);

    log::trace("Playing unit {}: {}", current.sequenceIndex, current.sourceText);

    auto started = _device.play(current.samples, current.sampleRate, false);
    if (started)
    {
        _currentPlaying = true;
        ++_stats.played;
        return;
    }

    ++_stats.playbackFailures;
    log::error("Audio playback error: {}", started.error());

    // One blocking fallback attempt; either way the unit counts as done so the turn never hangs.
    auto& fallback = _fallback ? *_fallback : _device;
    auto retried = fallback.play(current.samples, current.sampleRate, true);
    if (retried)
        ++_stats.played;
    else
        log::error("All playback methods failed for unit {}: {}", current.sequenceIndex, retried.error());

    _currentPlaying = false;
    _current->release();
    _current.reset();
}

void PlaybackSequencer::waitAndRelease()
{
    if (!_current)
        return;

    if (_currentPlaying)
        _device.waitUntilIdle();

    _currentPlaying = false;
    _current->release();
    _current.reset();
}

} // namespace podbuddy
