// SPDX-License-Identifier: Apache-2.0
#include <turn/TurnOrchestrator.hpp>

#include <tests/TestFakes.hpp>

#include <catch2/catch_test_macros.hpp>

#include <atomic>
#include <future>
#include <string>
#include <thread>
#include <vector>

using namespace podbuddy;
using namespace std::chrono_literals;

namespace
{

struct Pipeline
{
    testing::FakeSynthesisEngine engine;
    testing::FakePlaybackDevice device;
    testing::FakeLlmClient llm;
    testing::FakeMemoryStore memory;
    SynthesisWorker worker { engine };
    PlaybackSequencer sequencer { worker, device };
    StateMachine machine { 20, &memory };
    PromptBuilder prompts { "persona" };
    TurnOrchestrator orchestrator;

    std::vector<TurnPhase> phases;
    std::vector<int> spoken;

    explicit Pipeline(TurnConfig config = {}):
        orchestrator(llm, machine, prompts, sequencer, &memory, config)
    {
        device.playDuration = 1ms;
        orchestrator.setObserver(TurnObserver {
            .onPhaseChanged = [this](TurnPhase phase) { phases.push_back(phase); },
            .onToken = {},
            .onSpeaking = [this](const AudioBuffer& buffer) { spoken.push_back(buffer.sequenceIndex); },
        });
    }

    void waitUntilBusy() const
    {
        while (!orchestrator.isBusy())
            std::this_thread::sleep_for(1ms);
    }
};

auto lastUserMessage(const std::vector<ChatMessage>& request) -> std::string
{
    REQUIRE_FALSE(request.empty());
    CHECK(request.back().role == Role::User);
    return request.back().content;
}

} // namespace

TEST_CASE("isStopPhrase", "[turn]")
{
    CHECK(isStopPhrase("stop"));
    CHECK(isStopPhrase("  Goodbye \n"));
    CHECK(isStopPhrase("END PODCAST"));
    CHECK(isStopPhrase("shut up"));
    CHECK_FALSE(isStopPhrase("please stop talking about cars"));
    CHECK_FALSE(isStopPhrase(""));
    CHECK_FALSE(isStopPhrase("byebye"));
}

TEST_CASE("TurnOrchestrator completes a turn", "[turn]")
{
    auto pipeline = Pipeline();
    pipeline.llm.script({ .tokens = { "Engines ", "are neat. ", "Do you", " drive?" } });

    auto const result = pipeline.orchestrator.runTurn(" hi ");

    REQUIRE(result.has_value());
    CHECK(result->outcome == TurnPhase::Complete);
    CHECK(result->reply == "Engines are neat. Do you drive?");
    CHECK(result->state == ConversationState::Explain);
    CHECK_FALSE(result->error.has_value());

    auto const history = pipeline.machine.context().history.messages();
    REQUIRE(history.size() == 2);
    CHECK(history[0] == ChatMessage { .role = Role::User, .content = "hi" });
    CHECK(history[1] == ChatMessage { .role = Role::Assistant, .content = "Engines are neat. Do you drive?" });

    CHECK(pipeline.spoken == std::vector<int> { 0, 1 });
    CHECK(pipeline.device.overlaps() == 0);
    CHECK(pipeline.phases
          == std::vector<TurnPhase> {
              TurnPhase::AwaitingModel,
              TurnPhase::Streaming,
              TurnPhase::Draining,
              TurnPhase::Complete,
          });
    CHECK(pipeline.orchestrator.phase() == TurnPhase::Complete);
    CHECK_FALSE(pipeline.orchestrator.isBusy());
}

TEST_CASE("TurnOrchestrator prompts with the advanced state and memory", "[turn]")
{
    auto pipeline = Pipeline();
    pipeline.memory.summary = "Session #2";
    pipeline.llm.script({ .tokens = { "Sure." } });

    (void) pipeline.orchestrator.runTurn("tell me");

    auto const requests = pipeline.llm.requests();
    REQUIRE(requests.size() == 1);
    CHECK(requests[0].front().role == Role::System);
    CHECK(requests[0].front().content.contains("Current conversation state: EXPLAIN"));
    CHECK(requests[0].front().content.contains("User memory:\nSession #2"));
    CHECK(lastUserMessage(requests[0]) == "tell me");
}

TEST_CASE("TurnOrchestrator fills silence", "[turn]")
{
    auto pipeline = Pipeline();
    pipeline.llm.script({ .tokens = { "Still there? Here is a fun fact." } });

    auto const result = pipeline.orchestrator.runTurn("   ");

    REQUIRE(result.has_value());
    CHECK(result->outcome == TurnPhase::Complete);

    auto const requests = pipeline.llm.requests();
    REQUIRE(requests.size() == 1);
    CHECK(lastUserMessage(requests[0]) == pipeline.machine.silencePrompt());

    // Only the host's words enter the history on a silent turn.
    auto const history = pipeline.machine.context().history.messages();
    REQUIRE(history.size() == 1);
    CHECK(history[0].role == Role::Assistant);
    CHECK(pipeline.machine.context().silenceStreak == 1);
}

TEST_CASE("TurnOrchestrator apologizes and rolls back when the model times out", "[turn]")
{
    auto pipeline = Pipeline(TurnConfig { .modelTimeout = 30ms });
    pipeline.llm.script({ .tokens = { "Too late." }, .firstTokenDelay = 2s });

    auto const before = pipeline.machine.snapshot();
    auto const result = pipeline.orchestrator.runTurn("hello");

    REQUIRE(result.has_value());
    CHECK(result->outcome == TurnPhase::Failed);
    CHECK(result->reply == ModelTimeoutApology);
    REQUIRE(result->error.has_value());
    CHECK(result->error->code == ErrorCode::ModelTimeout);

    CHECK(pipeline.machine.state() == before.currentState);
    CHECK(pipeline.machine.context().turnCount == before.turnCount);
    CHECK(pipeline.machine.context().history.size() == 0);
    CHECK_FALSE(pipeline.spoken.empty());
    CHECK(pipeline.orchestrator.phase() == TurnPhase::Failed);
}

TEST_CASE("TurnOrchestrator apologizes when the model is unavailable", "[turn]")
{
    auto pipeline = Pipeline();

    SECTION("not ready")
    {
        pipeline.llm.ready = false;
    }

    SECTION("stream cannot be opened")
    {
        pipeline.llm.openError = Error { ErrorCode::TransportError, "connection refused" };
    }

    auto const result = pipeline.orchestrator.runTurn("hi");

    REQUIRE(result.has_value());
    CHECK(result->outcome == TurnPhase::Complete);
    CHECK(result->reply == ModelUnavailableApology);
    REQUIRE(result->error.has_value());
    CHECK(result->error->code == ErrorCode::ModelUnavailable);
    CHECK(result->state == ConversationState::Explain);

    auto const history = pipeline.machine.context().history.messages();
    REQUIRE(history.size() == 2);
    CHECK(history[1].content == ModelUnavailableApology);
    CHECK_FALSE(pipeline.spoken.empty());
}

TEST_CASE("TurnOrchestrator handles a model failing mid-stream", "[turn]")
{
    auto pipeline = Pipeline();

    SECTION("nothing received yet")
    {
        pipeline.llm.script({ .error = Error { ErrorCode::InferenceError, "decode failed" } });

        auto const result = pipeline.orchestrator.runTurn("hi");
        REQUIRE(result.has_value());
        CHECK(result->outcome == TurnPhase::Complete);
        CHECK(result->reply == ModelGlitchApology);
        REQUIRE(result->error.has_value());
        CHECK(result->error->code == ErrorCode::InferenceError);
    }

    SECTION("partial reply already spoken")
    {
        pipeline.llm.script({ .tokens = { "Half an ", "answer. And" },
                              .error = Error { ErrorCode::InferenceError, "decode failed" } });

        auto const result = pipeline.orchestrator.runTurn("hi");
        REQUIRE(result.has_value());
        CHECK(result->outcome == TurnPhase::Complete);
        CHECK(result->reply == "Half an answer. And");
        CHECK(pipeline.spoken == std::vector<int> { 0, 1 });
        CHECK(pipeline.machine.context().history.messages().back().content == "Half an answer. And");
    }
}

TEST_CASE("TurnOrchestrator ends the reply when the model goes quiet", "[turn]")
{
    auto pipeline = Pipeline(TurnConfig { .modelTimeout = 5s, .streamIdleTimeout = 30ms });
    pipeline.llm.script({ .tokens = { "Hello there. ", "More" }, .hang = true });

    auto const result = pipeline.orchestrator.runTurn("hi");

    REQUIRE(result.has_value());
    CHECK(result->outcome == TurnPhase::Complete);
    CHECK(result->reply == "Hello there. More");
    CHECK_FALSE(result->error.has_value());
    CHECK(pipeline.spoken == std::vector<int> { 0, 1 });
}

TEST_CASE("TurnOrchestrator says goodbye on a stop phrase", "[turn]")
{
    auto pipeline = Pipeline();

    SECTION("model farewell")
    {
        pipeline.llm.script({ .tokens = { "Thanks for listening! ", "Bye." } });

        auto const result = pipeline.orchestrator.runTurn("Goodbye");
        REQUIRE(result.has_value());
        CHECK(result->outcome == TurnPhase::Cancelled);
        CHECK(result->reply == "Thanks for listening! Bye.");

        auto const requests = pipeline.llm.requests();
        REQUIRE(requests.size() == 1);
        CHECK(lastUserMessage(requests[0]) == FarewellRequest);
    }

    SECTION("fallback farewell")
    {
        pipeline.llm.script({ .tokens = {} });

        auto const result = pipeline.orchestrator.runTurn("stop");
        REQUIRE(result.has_value());
        CHECK(result->outcome == TurnPhase::Cancelled);
        CHECK(result->reply == FallbackFarewell);
        CHECK_FALSE(pipeline.spoken.empty());
    }

    CHECK(pipeline.machine.state() == ConversationState::Intro);
    CHECK(pipeline.machine.context().history.size() == 0);
    CHECK(pipeline.orchestrator.phase() == TurnPhase::Cancelled);
}

TEST_CASE("TurnOrchestrator cancel stops the reply and says goodbye", "[turn]")
{
    auto pipeline = Pipeline();
    pipeline.llm.script({ .tokens = { "First sentence. ", "Second sentence. ", "Third sentence." }, .tokenDelay = 20ms });
    pipeline.llm.script({ .tokens = { "Okay, see you!" } });

    auto cancelled = false;
    auto observer = TurnObserver {};
    observer.onToken = [&](std::string_view) {
        if (!cancelled)
        {
            cancelled = true;
            pipeline.orchestrator.cancel();
        }
    };
    pipeline.orchestrator.setObserver(std::move(observer));

    auto const result = pipeline.orchestrator.runTurn("tell me everything");

    REQUIRE(result.has_value());
    CHECK(result->outcome == TurnPhase::Cancelled);
    CHECK(result->reply == "Okay, see you!");
    CHECK(pipeline.llm.requests().size() == 2);

    // The state stays advanced; nothing of the cancelled exchange is kept.
    CHECK(pipeline.machine.state() == ConversationState::Explain);
    CHECK(pipeline.machine.context().history.size() == 0);
    CHECK_FALSE(pipeline.orchestrator.isBusy());
}

TEST_CASE("TurnOrchestrator cancel during the last sentence still says goodbye", "[turn]")
{
    auto pipeline = Pipeline();
    pipeline.device.playDuration = 200ms;

    auto cancelAt = 0;
    SECTION("while the reply drains")
    {
        pipeline.llm.script({ .tokens = { "First part. ", "Last part." } });
        cancelAt = 1;
    }

    SECTION("while an apology plays")
    {
        pipeline.llm.script({ .error = Error { ErrorCode::InferenceError, "decode failed" } });
        cancelAt = 0;
    }

    pipeline.llm.script({ .tokens = { "Okay, bye!" } });

    auto cancelled = false;
    auto observer = TurnObserver {};
    observer.onSpeaking = [&](const AudioBuffer& buffer) {
        if (!cancelled && buffer.sequenceIndex == cancelAt)
        {
            cancelled = true;
            pipeline.orchestrator.cancel();
        }
    };
    pipeline.orchestrator.setObserver(std::move(observer));

    auto const result = pipeline.orchestrator.runTurn("hello");

    REQUIRE(cancelled);
    REQUIRE(result.has_value());
    CHECK(result->outcome == TurnPhase::Cancelled);
    CHECK(result->reply == "Okay, bye!");

    auto const requests = pipeline.llm.requests();
    REQUIRE(requests.size() == 2);
    CHECK(lastUserMessage(requests[1]) == FarewellRequest);
    CHECK(pipeline.machine.context().history.size() == 0);
    CHECK(pipeline.orchestrator.phase() == TurnPhase::Cancelled);
}

TEST_CASE("TurnOrchestrator cancel while idle does nothing", "[turn]")
{
    auto pipeline = Pipeline();
    pipeline.orchestrator.cancel();

    pipeline.llm.script({ .tokens = { "Hi." } });
    auto const result = pipeline.orchestrator.runTurn("hello");
    REQUIRE(result.has_value());
    CHECK(result->outcome == TurnPhase::Complete);
}

TEST_CASE("TurnOrchestrator runs one turn at a time", "[turn]")
{
    auto pipeline = Pipeline();
    pipeline.llm.script({ .hang = true });
    pipeline.llm.script({ .tokens = { "Bye now." } });

    auto running = std::async(std::launch::async, [&] { return pipeline.orchestrator.runTurn("first"); });
    pipeline.waitUntilBusy();

    auto const second = pipeline.orchestrator.runTurn("second");
    REQUIRE_FALSE(second.has_value());
    CHECK(second.error().code == ErrorCode::TurnInProgress);

    pipeline.orchestrator.cancel();
    auto const first = running.get();
    REQUIRE(first.has_value());
    CHECK(first->outcome == TurnPhase::Cancelled);
    CHECK(first->reply == "Bye now.");
}

TEST_CASE("TurnOrchestrator detach ends the session silently", "[turn]")
{
    auto pipeline = Pipeline();
    pipeline.llm.script({ .hang = true });

    auto running = std::async(std::launch::async, [&] { return pipeline.orchestrator.runTurn("first"); });
    pipeline.waitUntilBusy();

    pipeline.orchestrator.detach();
    auto const first = running.get();
    REQUIRE(first.has_value());
    CHECK(first->outcome == TurnPhase::Cancelled);
    CHECK(first->reply.empty());
    CHECK(pipeline.llm.requests().size() == 1);

    CHECK(pipeline.orchestrator.isDetached());
    auto const next = pipeline.orchestrator.runTurn("anyone?");
    REQUIRE_FALSE(next.has_value());
    CHECK(next.error().code == ErrorCode::TransportError);
}

TEST_CASE("TurnOrchestrator introduces a topic", "[turn]")
{
    auto pipeline = Pipeline();
    pipeline.machine.appendHistory(Role::User, "old chatter");
    pipeline.llm.script({ .tokens = { "Welcome to the show! ", "Today: cars." } });

    auto const result = pipeline.orchestrator.startTopic("cars", "Electric vs combustion.");

    REQUIRE(result.has_value());
    CHECK(result->outcome == TurnPhase::Complete);
    CHECK(result->reply == "Welcome to the show! Today: cars.");
    CHECK(result->state == ConversationState::Explain);
    CHECK(pipeline.memory.topics == std::vector<std::string> { "cars" });

    auto const requests = pipeline.llm.requests();
    REQUIRE(requests.size() == 1);
    REQUIRE(requests[0].size() == 3);
    CHECK(requests[0][0].content.contains("Current conversation state: INTRO"));
    CHECK(requests[0][1].content == "Today's discussion topic context:\nElectric vs combustion.");
    CHECK(lastUserMessage(requests[0]).contains("The topic is: cars."));

    auto const history = pipeline.machine.context().history.messages();
    REQUIRE(history.size() == 2);
    CHECK(history[0].role == Role::User);
    CHECK(history[1].content == "Welcome to the show! Today: cars.");
}

TEST_CASE("TurnOrchestrator speakFarewell", "[turn]")
{
    auto pipeline = Pipeline();
    pipeline.llm.script({ .tokens = { "So long!" } });

    auto const result = pipeline.orchestrator.speakFarewell();

    REQUIRE(result.has_value());
    CHECK(result->outcome == TurnPhase::Cancelled);
    CHECK(result->reply == "So long!");
    CHECK(pipeline.spoken == std::vector<int> { 0 });
}
