// SPDX-License-Identifier: Apache-2.0
#pragma once

#include <core/Types.hpp>

#include <cstddef>
#include <span>
#include <string>
#include <vector>

namespace podbuddy
{

/// @brief Bounded conversation history of role-tagged messages.
///
/// Holds at most maxMessages() entries; appending beyond the cap drops the
/// oldest entries first so the tail of the conversation is always kept.
class ConversationHistory
{
  public:
    /// @brief Constructs an empty history.
    /// @param maxMessages Maximum number of retained messages (at least 1).
    explicit ConversationHistory(std::size_t maxMessages = 20);

    /// @brief Appends a message with an explicit role.
    void append(Role role, std::string content);

    /// @brief Replaces the whole history, keeping only the newest maxMessages() entries.
    void restore(std::vector<ChatMessage> messages);

    /// @brief Returns all retained messages, oldest first.
    [[nodiscard]] auto messages() const -> std::span<const ChatMessage>;

    /// @brief Returns at most the last @p count messages.
    [[nodiscard]] auto tail(std::size_t count) const -> std::span<const ChatMessage>;

    /// @brief Removes all messages.
    void clear();

    /// @brief Returns the number of retained messages.
    [[nodiscard]] auto size() const -> std::size_t;

    [[nodiscard]] auto maxMessages() const -> std::size_t;

  private:
    std::size_t _maxMessages;
    std::vector<ChatMessage> _messages;

    void trim();
};

} // namespace podbuddy
