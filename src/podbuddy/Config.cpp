// SPDX-License-Identifier: Apache-2.0
#include "Config.hpp"

#include <core/JsonUtils.hpp>
#include <core/Log.hpp>

#include <nlohmann/json.hpp>

#include <cstdlib>
#include <filesystem>

namespace podbuddy
{

auto defaultConfigDir() -> std::string
{
#ifdef _WIN32
    auto const* const appData = std::getenv("APPDATA");
    if (appData)
        return std::string(appData) + "\\podbuddy";
    return ".";
#elif defined(__APPLE__)
    auto const* const home = std::getenv("HOME");
    if (home)
        return std::string(home) + "/Library/Application Support/podbuddy";
    return ".";
#else
    auto const* const xdgConfig = std::getenv("XDG_CONFIG_HOME");
    if (xdgConfig)
        return std::string(xdgConfig) + "/podbuddy";
    auto const* const home = std::getenv("HOME");
    if (home)
        return std::string(home) + "/.config/podbuddy";
    return ".";
#endif
}

auto defaultDataDir() -> std::string
{
#ifdef _WIN32
    auto const* const appData = std::getenv("APPDATA");
    if (appData)
        return std::string(appData) + "\\podbuddy";
    return ".";
#elif defined(__APPLE__)
    auto const* const home = std::getenv("HOME");
    if (home)
        return std::string(home) + "/Library/Application Support/podbuddy";
    return ".";
#else
    auto const* const xdgData = std::getenv("XDG_DATA_HOME");
    if (xdgData)
        return std::string(xdgData) + "/podbuddy";
    auto const* const home = std::getenv("HOME");
    if (home)
        return std::string(home) + "/.local/share/podbuddy";
    return ".";
#endif
}

auto defaultConfigPath() -> std::string
{
    return defaultConfigDir() + "/config.json";
}

auto defaultMemoryPath() -> std::string
{
    return defaultDataDir() + "/memory.json";
}

auto loadConfigFromFile(std::string_view path) -> Result<AppConfig>
{
    auto document = json::readObjectFile(std::filesystem::path(path), ErrorCode::ConfigError);
    if (!document)
        return std::unexpected(document.error());

    auto const& root = *document;
    auto config = AppConfig {};

    auto const llm = json::sectionOf(root, "llm");
    config.llm.modelPath = json::getStringOr(llm, "modelPath", "");
    config.llm.contextSize = json::getIntOr(llm, "contextSize", config.llm.contextSize);
    config.llm.gpuLayers = json::getIntOr(llm, "gpuLayers", config.llm.gpuLayers);
    config.llm.temperature = json::getFloatOr(llm, "temperature", config.llm.temperature);
    config.llm.maxTokens = json::getIntOr(llm, "maxTokens", config.llm.maxTokens);
    config.llm.persona = json::getStringOr(llm, "persona", DefaultPersona);

    auto const tts = json::sectionOf(root, "tts");
    config.tts.modelPath = json::getStringOr(tts, "modelPath", "");
    config.tts.espeakDataPath = json::getStringOr(tts, "espeakDataPath", "");
    config.tts.deviceName = json::getStringOr(tts, "deviceName", "");
    config.tts.maxChars = json::getIntOr(tts, "maxChars", config.tts.maxChars);
    config.tts.warmUp = json::getBoolOr(tts, "warmUp", config.tts.warmUp);

    auto const conversation = json::sectionOf(root, "conversation");
    config.conversation.maxHistory = json::getIntOr(conversation, "maxHistory", config.conversation.maxHistory);
    config.conversation.sentencesPerUnit =
        json::getIntOr(conversation, "sentencesPerUnit", config.conversation.sentencesPerUnit);

    auto const turn = json::sectionOf(root, "turn");
    config.turn.modelTimeoutMs = json::getIntOr(turn, "modelTimeoutMs", config.turn.modelTimeoutMs);
    config.turn.streamIdleTimeoutMs = json::getIntOr(turn, "streamIdleTimeoutMs", config.turn.streamIdleTimeoutMs);

    config.memory.path = json::getStringOr(json::sectionOf(root, "memory"), "path", "");

    if (config.conversation.maxHistory < 1)
        return makeError(ErrorCode::ConfigError, "conversation.maxHistory must be at least 1");
    if (config.conversation.sentencesPerUnit < 1)
        return makeError(ErrorCode::ConfigError, "conversation.sentencesPerUnit must be at least 1");
    if (config.turn.modelTimeoutMs <= 0 || config.turn.streamIdleTimeoutMs <= 0)
        return makeError(ErrorCode::ConfigError, "turn timeouts must be positive");
    if (config.tts.maxChars < 1)
        return makeError(ErrorCode::ConfigError, "tts.maxChars must be at least 1");

    return config;
}

auto saveConfigToFile(std::string_view path, const AppConfig& config) -> VoidResult
{
    auto llm = nlohmann::json {
        { "contextSize", config.llm.contextSize },
        { "gpuLayers", config.llm.gpuLayers },
        { "temperature", config.llm.temperature },
        { "maxTokens", config.llm.maxTokens },
        { "persona", config.llm.persona },
    };
    if (!config.llm.modelPath.empty())
        llm["modelPath"] = config.llm.modelPath;

    auto tts = nlohmann::json {
        { "maxChars", config.tts.maxChars },
        { "warmUp", config.tts.warmUp },
    };
    if (!config.tts.modelPath.empty())
        tts["modelPath"] = config.tts.modelPath;
    if (!config.tts.espeakDataPath.empty())
        tts["espeakDataPath"] = config.tts.espeakDataPath;
    if (!config.tts.deviceName.empty())
        tts["deviceName"] = config.tts.deviceName;

    auto memory = nlohmann::json::object();
    if (!config.memory.path.empty())
        memory["path"] = config.memory.path;

    auto const root = nlohmann::json {
        { "llm", std::move(llm) },
        { "tts", std::move(tts) },
        { "conversation",
          {
              { "maxHistory", config.conversation.maxHistory },
              { "sentencesPerUnit", config.conversation.sentencesPerUnit },
          } },
        { "turn",
          {
              { "modelTimeoutMs", config.turn.modelTimeoutMs },
              { "streamIdleTimeoutMs", config.turn.streamIdleTimeoutMs },
          } },
        { "memory", std::move(memory) },
    };

    return json::writeFile(std::filesystem::path(path), root, 4, ErrorCode::ConfigError);
}

auto loadConfig() -> Result<AppConfig>
{
    auto const path = defaultConfigPath();
    if (!std::filesystem::exists(path))
    {
        log::info("No config file found at {}, using defaults", path);
        return AppConfig {};
    }

    return loadConfigFromFile(path);
}

} // namespace podbuddy
