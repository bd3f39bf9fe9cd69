// SPDX-License-Identifier: Apache-2.0
#include "TurnOrchestrator.hpp"

#include <core/Log.hpp>
#include <memory/MemoryStore.hpp>

#include <algorithm>
#include <array>
#include <cctype>
#include <utility>

namespace podbuddy
{

namespace
{

    constexpr auto StopPhrases = std::array<std::string_view, 7> {
        "stop", "quit", "exit", "bye", "goodbye", "end podcast", "shut up",
    };

    /// @brief Releases the orchestrator's busy flag when a turn leaves scope.
    class BusyGuard
    {
      public:
        explicit BusyGuard(std::atomic<bool>& flag): _flag(flag) {}
        ~BusyGuard() { _flag.store(false); }

        BusyGuard(const BusyGuard&) = delete;
        BusyGuard& operator=(const BusyGuard&) = delete;

      private:
        std::atomic<bool>& _flag;
    };

    auto toLower(std::string_view text) -> std::string
    {
        auto result = std::string(text);
        std::ranges::transform(result, result.begin(), [](unsigned char c) { return std::tolower(c); });
        return result;
    }

} // namespace

auto isStopPhrase(std::string_view text) -> bool
{
    auto const lowered = toLower(trimmed(text));
    return std::ranges::find(StopPhrases, std::string_view { lowered }) != StopPhrases.end();
}

TurnOrchestrator::TurnOrchestrator(LlmClient& llm,
                                   StateMachine& machine,
                                   const PromptBuilder& prompts,
                                   PlaybackSequencer& sequencer,
                                   MemoryStore* memory,
                                   TurnConfig config):
    _llm(llm), _machine(machine), _prompts(prompts), _sequencer(sequencer), _memory(memory), _config(config)
{
    _sequencer.setPlaybackStartedCallback([this](const AudioBuffer& buffer) {
        if (_observer.onSpeaking)
            _observer.onSpeaking(buffer);
    });
}

auto TurnOrchestrator::runTurn(std::string_view userInput) -> Result<TurnResult>
{
    auto stopToken = acquire();
    if (!stopToken)
        return std::unexpected(stopToken.error());
    auto const guard = BusyGuard(_busy);

    if (isStopPhrase(userInput))
    {
        log::info("Stop phrase \"{}\" received", trimmed(userInput));
        setPhase(TurnPhase::Cancelled);
        return farewell();
    }

    auto const snapshot = _machine.snapshot();
    auto const silent = isBlank(userInput);
    _machine.advance(userInput);

    // A silent turn asks the host to fill the gap instead of answering.
    auto const prompt = silent ? std::string(_machine.silencePrompt()) : std::string(trimmed(userInput));
    auto const messages = _prompts.build(_machine.context(), memorySummary(), prompt);

    auto const outcome = streamReply(messages, *stopToken);
    if (outcome.phase == TurnPhase::Cancelled)
        return finishCancelled();

    if (outcome.phase == TurnPhase::Failed)
    {
        _machine.restore(snapshot);
        if (!speak(ModelTimeoutApology, *stopToken))
            return finishCancelled();
        setPhase(TurnPhase::Failed);
        return TurnResult {
            .outcome = TurnPhase::Failed,
            .reply = std::string(ModelTimeoutApology),
            .state = _machine.state(),
            .error = outcome.error,
        };
    }

    auto reply = resolveReply(outcome, *stopToken);
    if (stopToken->stop_requested())
        return finishCancelled();

    if (!silent)
        _machine.appendHistory(Role::User, std::string(trimmed(userInput)));
    _machine.appendHistory(Role::Assistant, reply);

    setPhase(TurnPhase::Complete);
    return TurnResult {
        .outcome = TurnPhase::Complete,
        .reply = std::move(reply),
        .state = _machine.state(),
        .error = outcome.error,
    };
}

auto TurnOrchestrator::startTopic(std::string topic, std::string topicContext) -> Result<TurnResult>
{
    auto stopToken = acquire();
    if (!stopToken)
        return std::unexpected(stopToken.error());
    auto const guard = BusyGuard(_busy);

    _machine.setTopic(std::move(topic), std::move(topicContext));
    _machine.clearHistory();

    auto const intro = _machine.introPrompt();
    auto const messages = _prompts.build(_machine.context(), memorySummary(), intro);

    auto const outcome = streamReply(messages, *stopToken);
    if (outcome.phase == TurnPhase::Cancelled)
        return finishCancelled();

    if (outcome.phase == TurnPhase::Failed)
    {
        if (!speak(ModelTimeoutApology, *stopToken))
            return finishCancelled();
        setPhase(TurnPhase::Failed);
        return TurnResult {
            .outcome = TurnPhase::Failed,
            .reply = std::string(ModelTimeoutApology),
            .state = _machine.state(),
            .error = outcome.error,
        };
    }

    auto reply = resolveReply(outcome, *stopToken);
    if (stopToken->stop_requested())
        return finishCancelled();

    _machine.appendHistory(Role::User, intro);
    _machine.appendHistory(Role::Assistant, reply);
    _machine.advance(intro);

    setPhase(TurnPhase::Complete);
    return TurnResult {
        .outcome = TurnPhase::Complete,
        .reply = std::move(reply),
        .state = _machine.state(),
        .error = outcome.error,
    };
}

auto TurnOrchestrator::speakFarewell() -> Result<TurnResult>
{
    auto stopToken = acquire();
    if (!stopToken)
        return std::unexpected(stopToken.error());
    auto const guard = BusyGuard(_busy);
    return farewell();
}

void TurnOrchestrator::cancel()
{
    auto lock = std::lock_guard(_cancelMutex);
    if (!_busy.load())
    {
        log::debug("Cancel requested while idle, ignoring");
        return;
    }

    log::info("Cancelling turn");
    _farewellRequested = true;
    _stopSource.request_stop();
    if (_activeStream)
        _activeStream->cancel();
}

void TurnOrchestrator::detach()
{
    auto lock = std::lock_guard(_cancelMutex);
    log::info("Session detached");
    _detached.store(true);
    _farewellRequested = false;
    _stopSource.request_stop();
    if (_activeStream)
        _activeStream->cancel();
}

auto TurnOrchestrator::phase() const -> TurnPhase
{
    return _phase.load();
}

auto TurnOrchestrator::isBusy() const -> bool
{
    return _busy.load();
}

auto TurnOrchestrator::isDetached() const -> bool
{
    return _detached.load();
}

void TurnOrchestrator::setObserver(TurnObserver observer)
{
    _observer = std::move(observer);
}

auto TurnOrchestrator::acquire() -> Result<std::stop_token>
{
    auto lock = std::lock_guard(_cancelMutex);
    if (_detached.load())
        return makeError(ErrorCode::TransportError, "Session detached");
    if (_busy.load())
        return makeError(ErrorCode::TurnInProgress, "Another turn is still running");

    _busy.store(true);
    _farewellRequested = false;
    _stopSource = std::stop_source {};
    return _stopSource.get_token();
}

auto TurnOrchestrator::freshStopToken() -> std::stop_token
{
    auto lock = std::lock_guard(_cancelMutex);
    _stopSource = std::stop_source {};
    if (_detached.load())
        _stopSource.request_stop();
    return _stopSource.get_token();
}

void TurnOrchestrator::setPhase(TurnPhase phase)
{
    auto const previous = _phase.exchange(phase);
    if (previous == phase)
        return;

    log::debug("Turn phase {} -> {}", phaseName(previous), phaseName(phase));
    if (_observer.onPhaseChanged)
        _observer.onPhaseChanged(phase);
}

void TurnOrchestrator::setActiveStream(TokenStream* stream)
{
    auto lock = std::lock_guard(_cancelMutex);
    _activeStream = stream;

    // A cancel that arrived before the stream was registered still has to reach it.
    if (stream && _stopSource.stop_requested())
        stream->cancel();
}

auto TurnOrchestrator::takeFarewellRequest() -> bool
{
    auto lock = std::lock_guard(_cancelMutex);
    auto const requested = _farewellRequested && !_detached.load();
    _farewellRequested = false;
    return requested;
}

auto TurnOrchestrator::memorySummary() const -> std::string
{
    return _memory ? _memory->contextSummary() : std::string {};
}

auto TurnOrchestrator::streamReply(const std::vector<ChatMessage>& messages, const std::stop_token& stopToken)
    -> StreamOutcome
{
    setPhase(TurnPhase::AwaitingModel);

    if (!_llm.isReady())
    {
        log::error("Language model is not ready");
        return StreamOutcome {
            .phase = TurnPhase::Complete,
            .reply = {},
            .error = Error { ErrorCode::ModelUnavailable, "Language model is not ready" },
        };
    }

    auto stream = _llm.streamChat(messages);
    if (!stream)
    {
        log::error("Could not open model stream: {}", stream.error());
        return StreamOutcome {
            .phase = TurnPhase::Complete,
            .reply = {},
            .error = Error { ErrorCode::ModelUnavailable, stream.error().message },
        };
    }

    auto& tokens = **stream;
    setActiveStream(&tokens);

    auto segmenter = SentenceSegmenter(_config.segmenter);
    auto outcome = StreamOutcome {};
    auto receivedAny = false;
    auto cancelled = false;

    _sequencer.begin();

    while (true)
    {
        auto const timeout = receivedAny ? _config.streamIdleTimeout : _config.modelTimeout;
        auto token = tokens.next(timeout);
        if (!token)
        {
            auto const& error = token.error();
            if (error.code == ErrorCode::Cancelled || stopToken.stop_requested())
            {
                cancelled = true;
                break;
            }

            if (error.code == ErrorCode::ModelTimeout && !receivedAny)
            {
                log::warning("No model output within {}", timeout);
                tokens.cancel();
                setActiveStream(nullptr);
                outcome.phase = TurnPhase::Failed;
                outcome.error = error;
                return outcome;
            }

            if (error.code == ErrorCode::ModelTimeout)
            {
                log::warning("Model went quiet for {}, ending the reply", timeout);
                tokens.cancel();
            }
            else
            {
                log::error("Model stream failed: {}", error);
                outcome.error = error;
            }
            break;
        }

        if (!*token)
            break;

        if (!receivedAny)
        {
            receivedAny = true;
            setPhase(TurnPhase::Streaming);
        }

        auto const& piece = **token;
        outcome.reply += piece;
        if (_observer.onToken)
            _observer.onToken(piece);

        if (!submitUnits(segmenter.feed(piece), stopToken))
        {
            cancelled = true;
            break;
        }
    }

    setActiveStream(nullptr);

    if (!cancelled)
    {
        setPhase(TurnPhase::Draining);
        cancelled = !submitUnits(segmenter.finish(), stopToken);
    }

    if (cancelled)
    {
        tokens.cancel();
        _sequencer.abandon();
        log::info("Turn cancelled after {} played sentence(s)", _sequencer.stats().played);
        outcome.phase = TurnPhase::Cancelled;
        return outcome;
    }

    _sequencer.finish();

    auto const& stats = _sequencer.stats();
    log::debug("Reply done: {} sentence(s) played, {} dropped", stats.played, stats.dropped);

    outcome.reply = std::string(trimmed(outcome.reply));

    // A stop that arrived while the last sentence played still cancels the turn.
    if (stopToken.stop_requested())
    {
        log::info("Turn cancelled while draining");
        outcome.phase = TurnPhase::Cancelled;
    }
    return outcome;
}

auto TurnOrchestrator::submitUnits(const std::vector<SentenceUnit>& units, const std::stop_token& stopToken) -> bool
{
    for (auto const& unit: units)
    {
        if (!_sequencer.submit(unit, stopToken))
            return false;
    }
    return true;
}

auto TurnOrchestrator::speak(std::string_view text, const std::stop_token& stopToken) -> bool
{
    _sequencer.begin();
    for (auto const& unit: segmentText(text, _config.segmenter))
    {
        if (!_sequencer.submit(unit, stopToken))
        {
            _sequencer.abandon();
            return false;
        }
    }
    _sequencer.finish();
    return !stopToken.stop_requested();
}

auto TurnOrchestrator::resolveReply(const StreamOutcome& outcome, const std::stop_token& stopToken)
    -> std::string
{
    if (!outcome.error)
        return outcome.reply;

    if (outcome.error->code == ErrorCode::ModelUnavailable)
    {
        speak(ModelUnavailableApology, stopToken);
        return std::string(ModelUnavailableApology);
    }

    // Whatever was already spoken stays the reply.
    if (!outcome.reply.empty())
        return outcome.reply;

    speak(ModelGlitchApology, stopToken);
    return std::string(ModelGlitchApology);
}

auto TurnOrchestrator::finishCancelled() -> TurnResult
{
    setPhase(TurnPhase::Cancelled);
    if (!takeFarewellRequest())
    {
        return TurnResult {
            .outcome = TurnPhase::Cancelled,
            .reply = {},
            .state = _machine.state(),
            .error = std::nullopt,
        };
    }
    return farewell();
}

auto TurnOrchestrator::farewell() -> TurnResult
{
    // Runs outside the pipeline of the turn that was cancelled.
    auto const stopToken = freshStopToken();
    log::info("Saying goodbye");

    auto const messages = _prompts.build(_machine.context(), memorySummary(), FarewellRequest);
    auto const outcome = streamReply(messages, stopToken);

    auto reply = outcome.reply;
    if (outcome.phase != TurnPhase::Cancelled && (outcome.phase == TurnPhase::Failed || reply.empty()))
    {
        reply = std::string(FallbackFarewell);
        if (!speak(reply, stopToken))
            log::debug("Farewell cut short");
    }

    setPhase(TurnPhase::Cancelled);
    return TurnResult {
        .outcome = TurnPhase::Cancelled,
        .reply = std::move(reply),
        .state = _machine.state(),
        .error = outcome.error,
    };
}

} // namespace podbuddy
