// SPDX-License-Identifier: Apache-2.0
#pragma once

#include <audio/SynthesisEngine.hpp>
#include <core/Error.hpp>

#include <memory>
#include <string>

namespace podbuddy
{

/// @brief Configuration for the piper synthesizer.
struct PiperConfig
{
    /// @brief Path to the piper voice model (.onnx file); its config is expected at modelPath + ".json".
    std::string modelPath;

    /// @brief Path to the espeak-ng-data directory (defaults to built-in).
    std::string espeakDataPath;
};

/// @brief SynthesisEngine backed by the piper C API (linked at build time).
///
/// Constructed once at startup and shared by reference; not reentrant.
class PiperSynthesisEngine final: public SynthesisEngine
{
  public:
    PiperSynthesisEngine();
    ~PiperSynthesisEngine() override;

    PiperSynthesisEngine(const PiperSynthesisEngine&) = delete;
    PiperSynthesisEngine& operator=(const PiperSynthesisEngine&) = delete;

    /// @brief Creates the piper synthesizer.
    /// @param config The voice configuration.
    /// @return Success or an error.
    [[nodiscard]] auto initialize(const PiperConfig& config) -> VoidResult;

    [[nodiscard]] auto synthesize(std::string_view text) -> Result<AudioClip> override;
    [[nodiscard]] auto sampleRate() const -> unsigned override;

    struct Impl;

  private:
    std::unique_ptr<Impl> _impl;
};

} // namespace podbuddy
