// SPDX-License-Identifier: Apache-2.0
#include "PromptBuilder.hpp"

#include <format>
#include <utility>

namespace podbuddy
{

auto stateInstruction(ConversationState state) -> std::string_view
{
    switch (state)
    {
        case ConversationState::Intro:
            return "You are starting a new topic. Introduce it with excitement and energy. "
                   "Give a brief hook about why this is interesting. End with a question.";
        case ConversationState::Explain:
            return "Explain the current topic in a clear, simple way. "
                   "Use analogies and real-world examples. Keep it conversational.";
        case ConversationState::Ask:
            return "Ask the user a thought-provoking question about the topic. "
                   "Make it personal - 'what do you think?', 'have you ever...?'";
        case ConversationState::React:
            return "React to what the user just said. Show genuine interest. "
                   "Build on their point. Add your perspective.";
        case ConversationState::Expand:
            return "Expand the discussion. Bring in a related angle, a counter-argument, "
                   "or a fun fact. Keep the energy up.";
    }
    return {};
}

PromptBuilder::PromptBuilder(std::string persona, std::size_t maxHistory):
    _persona(std::move(persona)), _maxHistory(maxHistory)
{
}

auto PromptBuilder::systemPrompt(ConversationState state, std::string_view memorySummary) const -> std::string
{
    auto prompt = std::format(
        "{}\n\nCurrent conversation state: {}\n{}", _persona, stateName(state), stateInstruction(state));

    if (!memorySummary.empty())
        prompt += std::format("\n\nUser memory:\n{}", memorySummary);

    return prompt;
}

auto PromptBuilder::build(const TurnContext& context,
                          std::string_view memorySummary,
                          std::string_view userInput) const -> std::vector<ChatMessage>
{
    auto messages = std::vector<ChatMessage> {};
    messages.push_back(ChatMessage {
        .role = Role::System,
        .content = systemPrompt(context.currentState, memorySummary),
    });

    if (!context.topicContext.empty())
    {
        messages.push_back(ChatMessage {
            .role = Role::System,
            .content = std::format("Today's discussion topic context:\n{}", context.topicContext),
        });
    }

    for (const auto& message: context.history.tail(_maxHistory))
        messages.push_back(message);

    messages.push_back(ChatMessage {
        .role = Role::User,
        .content = isBlank(userInput) ? std::string(SilentUserPlaceholder) : std::string(userInput),
    });

    return messages;
}

auto PromptBuilder::persona() const -> const std::string&
{
    return _persona;
}

} // namespace podbuddy
