// SPDX-License-Identifier: Apache-2.0
#include "ConversationHistory.hpp"

#include <algorithm>
#include <utility>

namespace podbuddy
{

ConversationHistory::ConversationHistory(std::size_t maxMessages): _maxMessages(std::max<std::size_t>(maxMessages, 1))
{
}

void ConversationHistory::append(Role role, std::string content)
{
    _messages.push_back(ChatMessage {
        .role = role,
        .content = std::move(content),
    });
    trim();
}

void ConversationHistory::restore(std::vector<ChatMessage> messages)
{
    _messages = std::move(messages);
    trim();
}

auto ConversationHistory::messages() const -> std::span<const ChatMessage>
{
    return _messages;
}

auto ConversationHistory::tail(std::size_t count) const -> std::span<const ChatMessage>
{
    auto const all = std::span<const ChatMessage>(_messages);
    if (count >= all.size())
        return all;
    return all.last(count);
}

void ConversationHistory::clear()
{
    _messages.clear();
}

auto ConversationHistory::size() const -> std::size_t
{
    return _messages.size();
}

auto ConversationHistory::maxMessages() const -> std::size_t
{
    return _maxMessages;
}

void ConversationHistory::trim()
{
    if (_messages.size() <= _maxMessages)
        return;

    auto const excess = static_cast<std::ptrdiff_t>(_messages.size() - _maxMessages);
    _messages.erase(_messages.begin(), _messages.begin() + excess);
}

} // namespace podbuddy
