// SPDX-License-Identifier: Apache-2.0
#pragma once

#include <conversation/ConversationHistory.hpp>
#include <conversation/ConversationState.hpp>

#include <cstddef>
#include <string>
#include <string_view>
#include <vector>

namespace podbuddy
{

class MemoryStore;

/// @brief Number of consecutive silent turns after which the host is forced into Ask.
constexpr auto SilenceStreakThreshold = 2;

/// @brief Per-session conversation context. Mutated only through StateMachine.
struct TurnContext
{
    ConversationState currentState = ConversationState::Intro;
    std::string topic;
    std::string topicContext;
    int silenceStreak = 0;
    int turnCount = 0;
    ConversationHistory history;
};

/// @brief Tracks the conversational mode of one session and decides the next one.
///
/// Silence takes priority over the normal cycle: once SilenceStreakThreshold
/// consecutive empty inputs have been seen, the state is forced to Ask so the
/// host never leaves dead air.
class StateMachine
{
  public:
    /// @brief Constructs a state machine in the Intro state.
    /// @param maxHistory Maximum number of history messages to retain.
    /// @param memory Optional memory collaborator notified of topics and opinions.
    explicit StateMachine(std::size_t maxHistory = 20, MemoryStore* memory = nullptr);

    /// @brief Advances to the next state for the given user input.
    /// @param userInput The user's utterance; empty or whitespace-only counts as silence.
    /// @return The state that is now active.
    auto advance(std::string_view userInput) -> ConversationState;

    /// @brief Starts a new topic: back to Intro with counters cleared.
    void setTopic(std::string topic, std::string context = {});

    /// @brief Appends a message to the capped history.
    void appendHistory(Role role, std::string content);

    void clearHistory();

    /// @brief Replaces the history (e.g. when a client resumes a conversation).
    void restoreHistory(std::vector<ChatMessage> messages);

    /// @brief Returns a copy of the whole context.
    [[nodiscard]] auto snapshot() const -> TurnContext;

    /// @brief Restores a context previously obtained from snapshot().
    void restore(TurnContext context);

    [[nodiscard]] auto context() const -> const TurnContext&;
    [[nodiscard]] auto state() const -> ConversationState;

    /// @brief Returns the user message that kicks off a topic.
    [[nodiscard]] auto introPrompt() const -> std::string;

    /// @brief Returns a filler instruction for a silent turn, rotating with the turn count.
    [[nodiscard]] auto silencePrompt() const -> std::string_view;

  private:
    TurnContext _context;
    MemoryStore* _memory;
};

/// @brief Returns true if @p text is empty or consists only of whitespace.
[[nodiscard]] auto isBlank(std::string_view text) -> bool;

/// @brief Returns @p text without leading and trailing whitespace.
[[nodiscard]] auto trimmed(std::string_view text) -> std::string_view;

} // namespace podbuddy
