// SPDX-License-Identifier: Apache-2.0
#pragma once

#include <audio/AudioBuffer.hpp>
#include <audio/PlaybackSequencer.hpp>
#include <conversation/ConversationState.hpp>
#include <conversation/PromptBuilder.hpp>
#include <conversation/SentenceSegmenter.hpp>
#include <conversation/StateMachine.hpp>
#include <core/Error.hpp>
#include <llm/LlmClient.hpp>

#include <atomic>
#include <chrono>
#include <functional>
#include <mutex>
#include <optional>
#include <stop_token>
#include <string>
#include <string_view>
#include <vector>

namespace podbuddy
{

class MemoryStore;

/// @brief Lifecycle of a single turn.
///
/// Idle -> AwaitingModel -> Streaming -> Draining -> Complete, with Cancelled
/// and Failed as alternate terminals.
enum class TurnPhase
{
    Idle,
    AwaitingModel,
    Streaming,
    Draining,
    Complete,
    Cancelled,
    Failed,
};

[[nodiscard]] constexpr auto phaseName(TurnPhase phase) -> std::string_view
{
    switch (phase)
    {
        case TurnPhase::Idle: return "idle";
        case TurnPhase::AwaitingModel: return "awaiting-model";
        case TurnPhase::Streaming: return "streaming";
        case TurnPhase::Draining: return "draining";
        case TurnPhase::Complete: return "complete";
        case TurnPhase::Cancelled: return "cancelled";
        case TurnPhase::Failed: return "failed";
    }
    return "unknown";
}

/// @brief Spoken when the model is not ready or the stream could not be opened.
constexpr auto ModelUnavailableApology =
    std::string_view { "Sorry, I can't reach my brain right now. Is the model loaded?" };

/// @brief Spoken when the model produced no first token in time.
constexpr auto ModelTimeoutApology = std::string_view { "Hmm, that took too long. Let me try again." };

/// @brief Spoken when the model failed mid-stream before producing any text.
constexpr auto ModelGlitchApology = std::string_view { "I had a brain glitch. Let's keep going though!" };

/// @brief User message that asks the model for the closing words.
constexpr auto FarewellRequest =
    std::string_view { "The user wants to end the podcast. Give a warm, short farewell. Thank them." };

/// @brief Spoken when the farewell itself could not be generated.
constexpr auto FallbackFarewell = std::string_view { "Thanks for riding along with me today. See you next time!" };

/// @brief Timeouts and pipeline settings for turns.
struct TurnConfig
{
    /// Maximum wait for the first token of a reply.
    std::chrono::milliseconds modelTimeout { 120'000 };

    /// Maximum gap between two tokens once streaming started; a longer gap ends the reply.
    std::chrono::milliseconds streamIdleTimeout { 15'000 };

    SegmenterConfig segmenter;
};

/// @brief Outcome of one turn as seen by the caller.
struct TurnResult
{
    TurnPhase outcome = TurnPhase::Idle;

    /// What the host said: the model's reply, an apology or the farewell.
    std::string reply;

    /// Conversation state after the turn.
    ConversationState state = ConversationState::Intro;

    /// The model error behind an apology, if any.
    std::optional<Error> error;
};

/// @brief Optional UI hooks. Called on the thread running the turn.
struct TurnObserver
{
    std::function<void(TurnPhase phase)> onPhaseChanged;
    std::function<void(std::string_view token)> onToken;
    std::function<void(const AudioBuffer& buffer)> onSpeaking;
};

/// @brief Drives one conversation turn at a time through the LLM, speech and playback pipeline.
///
/// runTurn() and startTopic() run on the caller's thread and return once the
/// last sentence finished playing. cancel() and detach() may be called from any
/// other thread while a turn is running.
class TurnOrchestrator
{
  public:
    /// @brief Constructs the orchestrator. All collaborators must outlive it.
    /// @param llm Language-model client.
    /// @param machine Conversation state machine of this session.
    /// @param prompts Prompt assembly.
    /// @param sequencer Synthesis and playback pipeline.
    /// @param memory Optional memory store used for the prompt's memory summary.
    /// @param config Timeouts and segmentation settings.
    TurnOrchestrator(LlmClient& llm,
                     StateMachine& machine,
                     const PromptBuilder& prompts,
                     PlaybackSequencer& sequencer,
                     MemoryStore* memory = nullptr,
                     TurnConfig config = {});

    TurnOrchestrator(const TurnOrchestrator&) = delete;
    TurnOrchestrator& operator=(const TurnOrchestrator&) = delete;

    /// @brief Runs one turn for @p userInput. Blank input is a silent turn.
    /// @return The turn result, TurnInProgress while another turn runs,
    ///         or TransportError after detach().
    [[nodiscard]] auto runTurn(std::string_view userInput) -> Result<TurnResult>;

    /// @brief Sets the topic, clears the history and lets the host introduce it.
    [[nodiscard]] auto startTopic(std::string topic, std::string topicContext = {}) -> Result<TurnResult>;

    /// @brief Asks the model for a short farewell and speaks it.
    [[nodiscard]] auto speakFarewell() -> Result<TurnResult>;

    /// @brief Stops the running turn. The playing sentence finishes, queued ones are
    ///        discarded and the host says goodbye. No-op while idle.
    void cancel();

    /// @brief Stops the running turn without a farewell and refuses further turns.
    void detach();

    [[nodiscard]] auto phase() const -> TurnPhase;
    [[nodiscard]] auto isBusy() const -> bool;
    [[nodiscard]] auto isDetached() const -> bool;

    void setObserver(TurnObserver observer);

  private:
    struct StreamOutcome
    {
        TurnPhase phase = TurnPhase::Complete;
        std::string reply;
        std::optional<Error> error;
    };

    LlmClient& _llm;
    StateMachine& _machine;
    const PromptBuilder& _prompts;
    PlaybackSequencer& _sequencer;
    MemoryStore* _memory;
    TurnConfig _config;
    TurnObserver _observer;

    std::atomic<bool> _busy { false };
    std::atomic<bool> _detached { false };
    std::atomic<TurnPhase> _phase { TurnPhase::Idle };

    // Guards the stop source and the stream a cancel must interrupt.
    std::mutex _cancelMutex;
    std::stop_source _stopSource;
    TokenStream* _activeStream = nullptr;
    bool _farewellRequested = false;

    auto acquire() -> Result<std::stop_token>;
    auto freshStopToken() -> std::stop_token;
    void setPhase(TurnPhase phase);
    void setActiveStream(TokenStream* stream);
    auto takeFarewellRequest() -> bool;
    auto memorySummary() const -> std::string;

    auto streamReply(const std::vector<ChatMessage>& messages, const std::stop_token& stopToken) -> StreamOutcome;
    auto submitUnits(const std::vector<SentenceUnit>& units, const std::stop_token& stopToken) -> bool;
    auto speak(std::string_view text, const std::stop_token& stopToken) -> bool;
    auto resolveReply(const StreamOutcome& outcome, const std::stop_token& stopToken) -> std::string;
    auto finishCancelled() -> TurnResult;
    auto farewell() -> TurnResult;
};

/// @brief Returns true if @p text is one of the phrases that end the show.
///
/// Matching is case-insensitive on the whole trimmed input.
[[nodiscard]] auto isStopPhrase(std::string_view text) -> bool;

} // namespace podbuddy
