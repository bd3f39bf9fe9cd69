// SPDX-License-Identifier: Apache-2.0
#pragma once

#include <conversation/ConversationState.hpp>
#include <conversation/StateMachine.hpp>
#include <core/Types.hpp>

#include <cstddef>
#include <string>
#include <string_view>
#include <vector>

namespace podbuddy
{

/// @brief Default host persona placed at the top of every system prompt.
constexpr auto DefaultPersona = std::string_view {
    "You are a smart, energetic podcast host and driving companion.\n"
    "You never end conversations.\n"
    "You explain clearly.\n"
    "You ask engaging questions.\n"
    "You speak casually like a friend in a car.\n"
    "You use examples and stories.\n"
    "Keep responses concise - under 4 sentences unless explaining something complex.\n"
    "Always end with a question or invitation to continue."
};

/// @brief User message substituted for an empty (silent) input.
constexpr auto SilentUserPlaceholder =
    std::string_view { "(The user is silent - prompt them with something interesting or ask a question)" };

/// @brief Returns the fixed instruction block for a conversation state.
[[nodiscard]] auto stateInstruction(ConversationState state) -> std::string_view;

/// @brief Assembles the role-tagged prompt for one turn.
///
/// Layout: system (persona, state, instruction, memory), optional system
/// topic-context message, the history tail, then the user message.
class PromptBuilder
{
  public:
    /// @param persona Base persona text.
    /// @param maxHistory Maximum number of history messages included in a prompt.
    explicit PromptBuilder(std::string persona = std::string(DefaultPersona), std::size_t maxHistory = 20);

    /// @brief Builds the system prompt for @p state.
    /// @param memorySummary Memory digest, appended verbatim when non-empty.
    [[nodiscard]] auto systemPrompt(ConversationState state, std::string_view memorySummary) const -> std::string;

    /// @brief Builds the full message list for a turn.
    [[nodiscard]] auto build(const TurnContext& context,
                             std::string_view memorySummary,
                             std::string_view userInput) const -> std::vector<ChatMessage>;

    [[nodiscard]] auto persona() const -> const std::string&;

  private:
    std::string _persona;
    std::size_t _maxHistory;
};

} // namespace podbuddy
