// SPDX-License-Identifier: Apache-2.0
#include "MiniaudioPlayback.hpp"

#include <core/Log.hpp>

#include <miniaudio.h>

#include <algorithm>
#include <atomic>
#include <cctype>
#include <condition_variable>
#include <format>
#include <mutex>
#include <optional>
#include <span>

namespace podbuddy
{

struct MiniaudioPlayback::Impl
{
    ma_context context {};
    ma_device device {};
    bool contextInitialized = false;
    bool initialized = false;
    unsigned sampleRate = 0;
    std::optional<ma_device_id> deviceId;

    // Buffer state, guarded by mutex and signalled via condvar
    std::span<const float> buffer;
    std::size_t readPos = 0;
    bool playing = false;
    std::mutex mutex;
    std::condition_variable done;
    std::atomic<bool> cancelled { false };

    auto finished() const -> bool
    {
        return readPos >= buffer.size() || cancelled.load(std::memory_order_relaxed);
    }

    auto openDevice(unsigned rate) -> VoidResult;
    void closeDevice();
};

namespace
{

    void playbackDataCallback(ma_device* device, void* output, const void* /*input*/, ma_uint32 frameCount)
    {
        auto* impl = static_cast<MiniaudioPlayback::Impl*>(device->pUserData);
        auto* out = static_cast<float*>(output);
        auto const channels = device->playback.channels;
        auto const totalSamples = static_cast<std::size_t>(frameCount) * channels;

        auto lock = std::unique_lock(impl->mutex);
        auto const remaining = impl->buffer.size() - impl->readPos;
        auto const toCopy = std::min(totalSamples, remaining);

        if (toCopy > 0)
        {
            std::copy_n(impl->buffer.data() + impl->readPos, toCopy, out);
            impl->readPos += toCopy;
        }

        // Zero-fill any remaining output frames
        if (toCopy < totalSamples)
            std::fill_n(out + toCopy, totalSamples - toCopy, 0.0f);

        if (impl->finished())
        {
            lock.unlock();
            impl->done.notify_all();
        }
    }

    auto toLower(std::string s) -> std::string
    {
        std::ranges::transform(s, s.begin(), [](unsigned char c) { return std::tolower(c); });
        return s;
    }

} // namespace

auto MiniaudioPlayback::Impl::openDevice(unsigned rate) -> VoidResult
{
    auto config = ma_device_config_init(ma_device_type_playback);
    config.playback.format = ma_format_f32;
    config.playback.channels = 1;
    config.sampleRate = rate;
    config.dataCallback = playbackDataCallback;
    config.pUserData = this;
    if (deviceId)
        config.playback.pDeviceID = &*deviceId;

    auto const result = ma_device_init(contextInitialized ? &context : nullptr, &config, &device);
    if (result != MA_SUCCESS)
        return makeError(ErrorCode::PlaybackError,
                         std::format("Failed to initialize playback device: {}", static_cast<int>(result)));

    initialized = true;
    sampleRate = rate;
    log::info("Audio playback initialized ({}Hz, mono, f32, device: {})", rate, device.playback.name);
    return {};
}

void MiniaudioPlayback::Impl::closeDevice()
{
    if (!initialized)
        return;
    ma_device_uninit(&device);
    initialized = false;
}

MiniaudioPlayback::MiniaudioPlayback(): _impl(std::make_unique<Impl>())
{
}

MiniaudioPlayback::~MiniaudioPlayback()
{
    stop();
    _impl->closeDevice();
    if (_impl->contextInitialized)
        ma_context_uninit(&_impl->context);
}

auto MiniaudioPlayback::initialize(unsigned sampleRate, std::string deviceName) -> VoidResult
{
    auto const ctxResult = ma_context_init(nullptr, 0, nullptr, &_impl->context);
    if (ctxResult != MA_SUCCESS)
        return makeError(ErrorCode::PlaybackError,
                         std::format("Failed to initialize audio context: {}", static_cast<int>(ctxResult)));
    _impl->contextInitialized = true;

    if (!deviceName.empty())
    {
        ma_device_info* pPlaybackDevices = nullptr;
        auto playbackCount = ma_uint32 { 0 };
        auto const enumResult =
            ma_context_get_devices(&_impl->context, &pPlaybackDevices, &playbackCount, nullptr, nullptr);

        if (enumResult == MA_SUCCESS)
        {
            // Case-insensitive substring match against user-specified name
            auto const target = toLower(deviceName);
            for (auto i = ma_uint32 { 0 }; i < playbackCount; ++i)
            {
                if (toLower(pPlaybackDevices[i].name).find(target) != std::string::npos)
                {
                    log::info(
                        "Matched playback device '{}' for filter '{}'", pPlaybackDevices[i].name, deviceName);
                    _impl->deviceId = pPlaybackDevices[i].id;
                    break;
                }
            }
            if (!_impl->deviceId)
                log::warning("No playback device matching '{}' found, using default", deviceName);
        }
        else
        {
            log::warning("Failed to enumerate playback devices (code: {}), using default",
                         static_cast<int>(enumResult));
        }
    }

    return _impl->openDevice(sampleRate);
}

auto MiniaudioPlayback::play(std::span<const float> samples, unsigned sampleRate, bool blocking) -> VoidResult
{
    if (!_impl->initialized)
        return makeError(ErrorCode::PlaybackError, "Playback device not initialized");

    // Never replace a buffer that is still being consumed.
    waitUntilIdle();

    if (samples.empty())
        return {};

    if (sampleRate != _impl->sampleRate)
    {
        _impl->closeDevice();
        if (auto reopened = _impl->openDevice(sampleRate); !reopened)
            return reopened;
    }

    {
        auto lock = std::lock_guard(_impl->mutex);
        _impl->buffer = samples;
        _impl->readPos = 0;
        _impl->playing = true;
        _impl->cancelled.store(false, std::memory_order_relaxed);
    }

    auto const startResult = ma_device_start(&_impl->device);
    if (startResult != MA_SUCCESS)
    {
        auto lock = std::lock_guard(_impl->mutex);
        _impl->playing = false;
        _impl->buffer = {};
        return makeError(ErrorCode::PlaybackError,
                         std::format("Failed to start playback: {}", static_cast<int>(startResult)));
    }

    if (blocking)
        waitUntilIdle();
    return {};
}

void MiniaudioPlayback::waitUntilIdle()
{
    {
        auto lock = std::unique_lock(_impl->mutex);
        if (!_impl->playing)
            return;
        _impl->done.wait(lock, [this] { return _impl->finished(); });
        _impl->playing = false;
        _impl->buffer = {};
        _impl->readPos = 0;
    }

    ma_device_stop(&_impl->device);
}

void MiniaudioPlayback::stop()
{
    {
        auto lock = std::lock_guard(_impl->mutex);
        _impl->cancelled.store(true, std::memory_order_relaxed);
    }
    _impl->done.notify_all();
}

} // namespace podbuddy
