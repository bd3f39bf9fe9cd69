// SPDX-License-Identifier: Apache-2.0
#pragma once

#include <core/Error.hpp>

#include <optional>
#include <string>
#include <string_view>

namespace podbuddy
{

/// @brief Abstract interface for the durable memory/preference store.
///
/// Records which topics were discussed and what the user said about them, and
/// produces a short digest that is injected verbatim into the system prompt.
class MemoryStore
{
  public:
    virtual ~MemoryStore() = default;

    /// @brief Records that a new topic began.
    virtual void recordTopic(std::string_view topic) = 0;

    /// @brief Records a user opinion about a topic.
    virtual void recordOpinion(std::string_view topic, std::string_view text) = 0;

    /// @brief Records @p text as an opinion if it contains a first-person opinion marker.
    /// @return True if the text was recorded.
    virtual auto extractOpinions(std::string_view text, std::string_view topic) -> bool = 0;

    /// @brief Returns a short multi-line digest of recent topics, opinions, preferences
    ///        and the session number. Empty if nothing is known yet.
    [[nodiscard]] virtual auto contextSummary() const -> std::string = 0;

    [[nodiscard]] virtual auto getPreference(std::string_view key) const -> std::optional<std::string> = 0;

    virtual void setPreference(std::string_view key, std::string_view value) = 0;

    /// @brief Bumps the conversation session counter.
    virtual void incrementSession() = 0;

    /// @brief Persists the current state.
    [[nodiscard]] virtual auto save() -> VoidResult = 0;
};

} // namespace podbuddy
