// SPDX-License-Identifier: Apache-2.0
#pragma once

#include <nlohmann/json.hpp>

#include <filesystem>
#include <format>
#include <fstream>
#include <sstream>
#include <string>
#include <string_view>

#include "Error.hpp"

namespace podbuddy::json
{

/// @brief Parses a JSON document.
/// @param input The text to parse.
/// @param errorCode Code reported on a syntax error.
[[nodiscard]] inline auto parse(std::string_view input, ErrorCode errorCode = ErrorCode::ConfigError)
    -> Result<nlohmann::json>
{
    try
    {
        return nlohmann::json::parse(input);
    }
    catch (const nlohmann::json::parse_error& e)
    {
        return makeError(errorCode, std::format("JSON parse error: {}", e.what()));
    }
}

/// @brief Reads and parses a JSON file that must contain an object.
/// @param path File to read.
/// @param errorCode Code reported when the file cannot be opened, parsed, or is not an object.
[[nodiscard]] inline auto readObjectFile(const std::filesystem::path& path, ErrorCode errorCode)
    -> Result<nlohmann::json>
{
    auto file = std::ifstream(path);
    if (!file.is_open())
        return makeError(errorCode, std::format("Cannot open {}", path.string()));

    auto ss = std::stringstream {};
    ss << file.rdbuf();

    auto parsed = parse(ss.str(), errorCode);
    if (!parsed)
        return parsed;
    if (!parsed->is_object())
        return makeError(errorCode, std::format("{} does not contain a JSON object", path.string()));
    return parsed;
}

/// @brief Writes @p document to @p path, creating missing parent directories.
/// @param indent Indentation passed to nlohmann::json::dump().
[[nodiscard]] inline auto writeFile(const std::filesystem::path& path,
                                    const nlohmann::json& document,
                                    int indent,
                                    ErrorCode errorCode) -> VoidResult
{
    auto const dir = path.parent_path();
    if (!dir.empty())
    {
        auto ec = std::error_code {};
        std::filesystem::create_directories(dir, ec);
        if (ec)
            return makeError(errorCode, std::format("Cannot create directory {}: {}", dir.string(), ec.message()));
    }

    auto file = std::ofstream(path);
    if (!file.is_open())
        return makeError(errorCode, std::format("Cannot write {}", path.string()));

    file << document.dump(indent) << '\n';
    if (!file)
        return makeError(errorCode, std::format("Failed writing {}", path.string()));
    return {};
}

/// @brief Returns the string at @p key, or @p defaultValue if it is missing or not a string.
[[nodiscard]] inline auto getStringOr(const nlohmann::json& obj,
                                      std::string_view key,
                                      std::string_view defaultValue) -> std::string
{
    auto const it = obj.find(std::string(key));
    if (it != obj.end() && it->is_string())
        return it->get<std::string>();
    return std::string(defaultValue);
}

[[nodiscard]] inline auto getIntOr(const nlohmann::json& obj, std::string_view key, int defaultValue) -> int
{
    auto const it = obj.find(std::string(key));
    if (it != obj.end() && it->is_number_integer())
        return it->get<int>();
    return defaultValue;
}

[[nodiscard]] inline auto getFloatOr(const nlohmann::json& obj, std::string_view key, float defaultValue)
    -> float
{
    auto const it = obj.find(std::string(key));
    if (it != obj.end() && it->is_number())
        return it->get<float>();
    return defaultValue;
}

[[nodiscard]] inline auto getBoolOr(const nlohmann::json& obj, std::string_view key, bool defaultValue)
    -> bool
{
    auto const it = obj.find(std::string(key));
    if (it != obj.end() && it->is_boolean())
        return it->get<bool>();
    return defaultValue;
}

/// @brief Returns the object at @p key, or an empty object if it is missing or has another type.
[[nodiscard]] inline auto sectionOf(const nlohmann::json& root, std::string_view key) -> nlohmann::json
{
    auto const it = root.find(std::string(key));
    if (it != root.end() && it->is_object())
        return *it;
    return nlohmann::json::object();
}

} // namespace podbuddy::json
