// SPDX-License-Identifier: Apache-2.0
#include "JsonMemoryStore.hpp"

#include <core/JsonUtils.hpp>
#include <core/Log.hpp>

#include <algorithm>
#include <array>
#include <cctype>
#include <chrono>
#include <filesystem>
#include <format>
#include <vector>

namespace podbuddy
{

namespace
{

    /// @brief First-person phrases that mark a user utterance as an opinion.
    constexpr auto OpinionMarkers = std::array<std::string_view, 14> {
        "i think",    "i believe",  "i love",   "i hate",   "i prefer", "i like",     "i don't like",
        "my opinion", "in my view", "honestly", "actually", "i feel",   "i disagree", "i agree",
    };

    auto emptyDocument() -> nlohmann::json
    {
        return nlohmann::json {
            { "topics_discussed", nlohmann::json::array() },
            { "user_opinions", nlohmann::json::array() },
            { "preferences", nlohmann::json::object() },
            { "conversation_count", 0 },
            { "last_session", nullptr },
        };
    }

    auto timestampNow() -> std::string
    {
        auto const now = std::chrono::floor<std::chrono::seconds>(std::chrono::system_clock::now());
        return std::format("{:%FT%T}", now);
    }

    auto toLower(std::string_view text) -> std::string
    {
        auto lower = std::string(text);
        std::ranges::transform(lower, lower.begin(), [](unsigned char c) { return std::tolower(c); });
        return lower;
    }

    /// @brief Returns false if @p value has another type than the default of a known key.
    auto matchesDefault(const nlohmann::json& defaults, const std::string& key, const nlohmann::json& value)
        -> bool
    {
        auto const it = defaults.find(key);
        if (it == defaults.end() || it->is_null())
            return true;
        if (it->is_number_integer())
            return value.is_number_integer();
        return it->type() == value.type();
    }

    void appendCapped(nlohmann::json& list, nlohmann::json entry, std::size_t cap)
    {
        list.push_back(std::move(entry));
        if (list.size() > cap)
            list.erase(list.begin(), list.begin() + static_cast<std::ptrdiff_t>(list.size() - cap));
    }

    /// @brief Returns the last @p count elements of a JSON array.
    auto lastEntries(const nlohmann::json& list, std::size_t count) -> std::vector<nlohmann::json>
    {
        auto const start = list.size() > count ? list.size() - count : 0;
        auto entries = std::vector<nlohmann::json> {};
        for (auto i = start; i < list.size(); ++i)
            entries.push_back(list[i]);
        return entries;
    }

} // namespace

JsonMemoryStore::JsonMemoryStore(std::string path): _path(std::move(path)), _data(emptyDocument())
{
}

auto JsonMemoryStore::load() -> VoidResult
{
    auto lock = std::lock_guard(_mutex);

    if (!std::filesystem::exists(_path))
    {
        log::debug("No memory file at {}, starting empty", _path);
        return {};
    }

    auto parsed = json::readObjectFile(_path, ErrorCode::IoError);
    if (!parsed)
        return std::unexpected(parsed.error());

    // Saved keys override the defaults; unknown keys are carried along untouched.
    auto const defaults = emptyDocument();
    for (auto const& [key, value]: parsed->items())
    {
        if (!matchesDefault(defaults, key, value))
        {
            log::warning("Ignoring \"{}\" in {}: expected {}, got {}",
                         key,
                         _path,
                         defaults[key].type_name(),
                         value.type_name());
            continue;
        }
        _data[key] = value;
    }

    log::info("Memory loaded: {} topics, {} opinions",
              _data["topics_discussed"].size(),
              _data["user_opinions"].size());
    return {};
}

void JsonMemoryStore::recordTopic(std::string_view topic)
{
    auto lock = std::lock_guard(_mutex);
    appendCapped(_data["topics_discussed"],
                 nlohmann::json { { "topic", std::string(topic) }, { "timestamp", timestampNow() } },
                 MaxEntries);
    saveOrWarn();
}

void JsonMemoryStore::recordOpinion(std::string_view topic, std::string_view text)
{
    auto lock = std::lock_guard(_mutex);
    appendCapped(_data["user_opinions"],
                 nlohmann::json {
                     { "topic", std::string(topic) },
                     { "opinion", std::string(text) },
                     { "timestamp", timestampNow() },
                 },
                 MaxEntries);
    saveOrWarn();
}

auto JsonMemoryStore::extractOpinions(std::string_view text, std::string_view topic) -> bool
{
    auto const lower = toLower(text);
    auto const matched =
        std::ranges::any_of(OpinionMarkers, [&](std::string_view marker) { return lower.contains(marker); });
    if (!matched)
        return false;

    recordOpinion(topic, text);
    log::info("Saved user opinion on '{}'", topic);
    return true;
}

auto JsonMemoryStore::contextSummary() const -> std::string
{
    auto lock = std::lock_guard(_mutex);
    auto parts = std::vector<std::string> {};

    auto const topics = lastEntries(_data["topics_discussed"], SummaryEntries);
    if (!topics.empty())
    {
        auto line = std::string("Recently discussed topics: ");
        for (auto i = std::size_t { 0 }; i < topics.size(); ++i)
        {
            if (i > 0)
                line += ", ";
            line += json::getStringOr(topics[i], "topic", "");
        }
        parts.push_back(std::move(line));
    }

    auto const opinions = lastEntries(_data["user_opinions"], SummaryEntries);
    if (!opinions.empty())
    {
        auto line = std::string("User opinions: ");
        for (auto i = std::size_t { 0 }; i < opinions.size(); ++i)
        {
            if (i > 0)
                line += "; ";
            line += std::format("{}: {}",
                                json::getStringOr(opinions[i], "topic", ""),
                                json::getStringOr(opinions[i], "opinion", ""));
        }
        parts.push_back(std::move(line));
    }

    auto const& prefs = _data["preferences"];
    if (prefs.is_object() && !prefs.empty())
    {
        auto line = std::string("User preferences: ");
        auto first = true;
        for (auto const& [key, value]: prefs.items())
        {
            if (!first)
                line += ", ";
            first = false;
            line += std::format("{}={}", key, value.is_string() ? value.get<std::string>() : value.dump());
        }
        parts.push_back(std::move(line));
    }

    auto const sessions = json::getIntOr(_data, "conversation_count", 0);
    if (sessions > 0)
        parts.push_back(std::format("This is conversation session #{}", sessions + 1));

    auto summary = std::string {};
    for (auto i = std::size_t { 0 }; i < parts.size(); ++i)
    {
        if (i > 0)
            summary += '\n';
        summary += parts[i];
    }
    return summary;
}

auto JsonMemoryStore::getPreference(std::string_view key) const -> std::optional<std::string>
{
    auto lock = std::lock_guard(_mutex);
    auto const& prefs = _data["preferences"];
    auto const keyStr = std::string(key);
    if (!prefs.contains(keyStr) || !prefs[keyStr].is_string())
        return std::nullopt;
    return prefs[keyStr].get<std::string>();
}

void JsonMemoryStore::setPreference(std::string_view key, std::string_view value)
{
    auto lock = std::lock_guard(_mutex);
    _data["preferences"][std::string(key)] = std::string(value);
    saveOrWarn();
}

void JsonMemoryStore::incrementSession()
{
    auto lock = std::lock_guard(_mutex);
    _data["conversation_count"] = json::getIntOr(_data, "conversation_count", 0) + 1;
    saveOrWarn();
}

auto JsonMemoryStore::save() -> VoidResult
{
    auto lock = std::lock_guard(_mutex);
    return saveLocked();
}

auto JsonMemoryStore::sessionCount() const -> int
{
    auto lock = std::lock_guard(_mutex);
    return json::getIntOr(_data, "conversation_count", 0);
}

auto JsonMemoryStore::topicCount() const -> std::size_t
{
    auto lock = std::lock_guard(_mutex);
    return _data["topics_discussed"].size();
}

auto JsonMemoryStore::opinionCount() const -> std::size_t
{
    auto lock = std::lock_guard(_mutex);
    return _data["user_opinions"].size();
}

auto JsonMemoryStore::path() const -> const std::string&
{
    return _path;
}

auto JsonMemoryStore::saveLocked() -> VoidResult
{
    _data["last_session"] = timestampNow();
    return json::writeFile(_path, _data, 2, ErrorCode::IoError);
}

void JsonMemoryStore::saveOrWarn()
{
    if (auto result = saveLocked(); !result)
        log::error("Could not save memory: {}", result.error().message);
}

} // namespace podbuddy
