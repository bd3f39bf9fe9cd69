// SPDX-License-Identifier: Apache-2.0
#include "PiperSynthesisEngine.hpp"

#include <core/Log.hpp>

#include <format>
#include <string>
#include <vector>

extern "C"
{
#include <piper.h>
}

namespace podbuddy
{

namespace
{

    /// @brief Piper output format: float32 PCM, 22050 Hz, mono.
    constexpr auto PiperSampleRate = 22050u;

} // namespace

struct PiperSynthesisEngine::Impl
{
    PiperConfig config;
    piper_synthesizer* synth = nullptr;

    ~Impl()
    {
        if (synth)
            piper_free(synth);
    }
};

PiperSynthesisEngine::PiperSynthesisEngine(): _impl(std::make_unique<Impl>())
{
}

PiperSynthesisEngine::~PiperSynthesisEngine() = default;

auto PiperSynthesisEngine::initialize(const PiperConfig& config) -> VoidResult
{
    _impl->config = config;

    auto const configPath = config.modelPath + ".json";

    auto const& espeakData =
        config.espeakDataPath.empty() ? std::string(PIPER_ESPEAK_DATA_DIR) : config.espeakDataPath;

    _impl->synth = piper_create(config.modelPath.c_str(), configPath.c_str(), espeakData.c_str());
    if (!_impl->synth)
        return makeError(ErrorCode::ModelLoadError,
                         std::format("Failed to create piper synthesizer (model: {}, config: {}, espeak: {})",
                                     config.modelPath,
                                     configPath,
                                     espeakData));

    log::info("Piper synthesizer initialized (model: {}, espeak: {})", config.modelPath, espeakData);
    return {};
}

auto PiperSynthesisEngine::synthesize(std::string_view text) -> Result<AudioClip>
{
    if (!_impl->synth)
        return makeError(ErrorCode::SynthesisError, "Piper synthesizer not initialized");

    auto const input = std::string(text);
    auto opts = piper_default_synthesize_options(_impl->synth);
    auto const startResult = piper_synthesize_start(_impl->synth, input.c_str(), &opts);
    if (startResult != 0)
        return makeError(ErrorCode::SynthesisError, std::format("piper_synthesize_start failed ({})", startResult));

    auto clip = AudioClip { .samples = {}, .sampleRate = PiperSampleRate };
    auto chunk = piper_audio_chunk {};

    while (true)
    {
        auto const rc = piper_synthesize_next(_impl->synth, &chunk);
        if (rc == 1) // PIPER_DONE
            break;
        if (rc < 0) // PIPER_ERR_GENERIC
            return makeError(ErrorCode::SynthesisError, std::format("piper_synthesize_next failed ({})", rc));

        // rc == 0: PIPER_OK
        clip.samples.insert(clip.samples.end(), chunk.samples, chunk.samples + chunk.num_samples);
    }

    return clip;
}

auto PiperSynthesisEngine::sampleRate() const -> unsigned
{
    return PiperSampleRate;
}

} // namespace podbuddy
