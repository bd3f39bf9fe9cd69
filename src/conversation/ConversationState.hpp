// SPDX-License-Identifier: Apache-2.0
#pragma once

#include <cstdint>
#include <string_view>

namespace podbuddy
{

/// @brief Conversational mode the host is in; selects the instruction block of the next reply.
enum class ConversationState : std::uint8_t
{
    Intro,
    Explain,
    Ask,
    React,
    Expand,
};

/// @brief Returns the upper-case label used inside the system prompt.
[[nodiscard]] constexpr auto stateName(ConversationState state) -> std::string_view
{
    switch (state)
    {
        case ConversationState::Intro: return "INTRO";
        case ConversationState::Explain: return "EXPLAIN";
        case ConversationState::Ask: return "ASK";
        case ConversationState::React: return "REACT";
        case ConversationState::Expand: return "EXPAND";
    }
    return "UNKNOWN";
}

/// @brief Fixed transition table, applied whenever the silence rule does not force Ask.
///
/// Expand loops back to Ask, never to Intro.
[[nodiscard]] constexpr auto nextState(ConversationState state) -> ConversationState
{
    switch (state)
    {
        case ConversationState::Intro: return ConversationState::Explain;
        case ConversationState::Explain: return ConversationState::Ask;
        case ConversationState::Ask: return ConversationState::React;
        case ConversationState::React: return ConversationState::Expand;
        case ConversationState::Expand: return ConversationState::Ask;
    }
    return ConversationState::Ask;
}

} // namespace podbuddy
