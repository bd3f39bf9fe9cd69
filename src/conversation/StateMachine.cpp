// SPDX-License-Identifier: Apache-2.0
#include "StateMachine.hpp"

#include <core/Log.hpp>
#include <memory/MemoryStore.hpp>

#include <array>
#include <format>
#include <utility>

namespace podbuddy
{

namespace
{

    constexpr auto SilencePrompts = std::array<std::string_view, 4> {
        "The user has been quiet. Ask them an engaging question.",
        "Fill the silence with an interesting fact, then ask for their take.",
        "The user might be thinking. Offer a perspective and invite them to respond.",
        "Keep the conversation going! Share a story related to the topic.",
    };

    constexpr auto Whitespace = std::string_view { " \t\r\n\f\v" };

} // namespace

auto trimmed(std::string_view text) -> std::string_view
{
    auto const first = text.find_first_not_of(Whitespace);
    if (first == std::string_view::npos)
        return {};
    auto const last = text.find_last_not_of(Whitespace);
    return text.substr(first, last - first + 1);
}

auto isBlank(std::string_view text) -> bool
{
    return trimmed(text).empty();
}

StateMachine::StateMachine(std::size_t maxHistory, MemoryStore* memory):
    _context { .history = ConversationHistory(maxHistory) }, _memory(memory)
{
}

auto StateMachine::advance(std::string_view userInput) -> ConversationState
{
    ++_context.turnCount;

    auto const silent = isBlank(userInput);
    if (silent)
        ++_context.silenceStreak;
    else
        _context.silenceStreak = 0;

    if (_context.silenceStreak >= SilenceStreakThreshold)
    {
        log::debug("Silence streak reached {}, forcing {}", _context.silenceStreak, stateName(ConversationState::Ask));
        _context.currentState = ConversationState::Ask;
        _context.silenceStreak = 0;
        return _context.currentState;
    }

    auto const previous = _context.currentState;
    _context.currentState = nextState(previous);
    log::debug("Conversation state {} -> {}", stateName(previous), stateName(_context.currentState));

    if (_memory && !silent && !isBlank(_context.topic))
        _memory->extractOpinions(userInput, _context.topic);

    return _context.currentState;
}

void StateMachine::setTopic(std::string topic, std::string context)
{
    _context.topic = std::move(topic);
    _context.topicContext = std::move(context);
    _context.currentState = ConversationState::Intro;
    _context.turnCount = 0;
    _context.silenceStreak = 0;

    if (isBlank(_context.topic))
    {
        log::info("No topic set, the host picks one");
        return;
    }

    if (_memory)
        _memory->recordTopic(_context.topic);

    log::info("Topic set: {}", _context.topic);
}

void StateMachine::appendHistory(Role role, std::string content)
{
    _context.history.append(role, std::move(content));
}

void StateMachine::clearHistory()
{
    _context.history.clear();
}

void StateMachine::restoreHistory(std::vector<ChatMessage> messages)
{
    _context.history.restore(std::move(messages));
}

auto StateMachine::snapshot() const -> TurnContext
{
    return _context;
}

void StateMachine::restore(TurnContext context)
{
    _context = std::move(context);
}

auto StateMachine::context() const -> const TurnContext&
{
    return _context;
}

auto StateMachine::state() const -> ConversationState
{
    return _context.currentState;
}

auto StateMachine::introPrompt() const -> std::string
{
    auto const topic = isBlank(_context.topic) ? std::string_view { "something interesting" }
                                               : std::string_view { _context.topic };
    return std::format("Let's start today's podcast episode! The topic is: {}. "
                       "Introduce it with energy and excitement. Hook the listener.",
                       topic);
}

auto StateMachine::silencePrompt() const -> std::string_view
{
    return SilencePrompts[static_cast<std::size_t>(_context.turnCount) % SilencePrompts.size()];
}

} // namespace podbuddy
