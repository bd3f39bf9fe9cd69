// SPDX-License-Identifier: Apache-2.0
#pragma once

#include <conversation/PromptBuilder.hpp>
#include <core/Error.hpp>

#include <string>
#include <string_view>

namespace podbuddy
{

/// @brief LLM configuration section.
struct LlmConfig
{
    std::string modelPath;
    int contextSize = 8192;
    int gpuLayers = -1;
    float temperature = 0.7f;
    int maxTokens = 256;
    std::string persona = std::string(DefaultPersona);
};

/// @brief Text-to-speech and playback configuration section.
struct TtsConfig
{
    /// @brief Path to the piper voice model (.onnx file).
    std::string modelPath;

    /// @brief Path to the espeak-ng-data directory (optional, defaults to built-in).
    std::string espeakDataPath;

    /// @brief Substring of the playback device name; empty selects the default device.
    std::string deviceName;

    /// @brief Character cap per spoken sentence.
    int maxChars = 500;

    /// @brief Whether to run a throw-away synthesis at startup.
    bool warmUp = true;
};

/// @brief Conversation configuration section.
struct ConversationConfig
{
    int maxHistory = 20;
    int sentencesPerUnit = 1;
};

/// @brief Turn timing configuration section.
struct TurnTimingConfig
{
    int modelTimeoutMs = 120'000;
    int streamIdleTimeoutMs = 15'000;
};

/// @brief Memory store configuration section.
struct MemoryConfig
{
    /// @brief Path of the JSON memory file; empty selects defaultMemoryPath().
    std::string path;
};

/// @brief Top-level application configuration.
struct AppConfig
{
    LlmConfig llm;
    TtsConfig tts;
    ConversationConfig conversation;
    TurnTimingConfig turn;
    MemoryConfig memory;
};

/// @brief Loads the application configuration from the default config path.
/// @return The loaded configuration, defaults if no file exists, or an error.
[[nodiscard]] auto loadConfig() -> Result<AppConfig>;

/// @brief Loads the application configuration from a specific file path.
/// @param path The path to the config file.
/// @return The loaded configuration or an error.
[[nodiscard]] auto loadConfigFromFile(std::string_view path) -> Result<AppConfig>;

/// @brief Saves the application configuration to a file.
/// @param path The path to the config file.
/// @param config The configuration to save.
/// @return Success or an error.
[[nodiscard]] auto saveConfigToFile(std::string_view path, const AppConfig& config) -> VoidResult;

/// @brief Returns the default config directory path for the current platform.
[[nodiscard]] auto defaultConfigDir() -> std::string;

/// @brief Returns the default config file path for the current platform.
[[nodiscard]] auto defaultConfigPath() -> std::string;

/// @brief Returns the default data directory path for the current platform.
/// On Linux: $XDG_DATA_HOME/podbuddy or ~/.local/share/podbuddy
/// On macOS: ~/Library/Application Support/podbuddy
/// On Windows: %APPDATA%\podbuddy
[[nodiscard]] auto defaultDataDir() -> std::string;

/// @brief Returns the default memory file path.
[[nodiscard]] auto defaultMemoryPath() -> std::string;

} // namespace podbuddy
