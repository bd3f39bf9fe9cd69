// SPDX-License-Identifier: Apache-2.0
#include "App.hpp"

#include <audio/MiniaudioPlayback.hpp>
#include <audio/PiperSynthesisEngine.hpp>
#include <audio/PlaybackSequencer.hpp>
#include <audio/SynthesisWorker.hpp>
#include <conversation/PromptBuilder.hpp>
#include <conversation/StateMachine.hpp>
#include <core/Log.hpp>
#include <llm/LlamaClient.hpp>
#include <memory/JsonMemoryStore.hpp>
#include <turn/TurnOrchestrator.hpp>

#include <chrono>
#include <cstdio>
#include <iostream>
#include <print>
#include <string>

namespace podbuddy
{

namespace
{

    constexpr auto LastTopicPreference = std::string_view { "lastTopic" };

} // namespace

struct App::Impl
{
    AppConfig config;
    LlamaClient llm;
    PiperSynthesisEngine voice;
    MiniaudioPlayback playback;

    std::unique_ptr<JsonMemoryStore> memory;
    std::unique_ptr<StateMachine> machine;
    std::unique_ptr<PromptBuilder> prompts;
    std::unique_ptr<SynthesisWorker> worker;
    std::unique_ptr<PlaybackSequencer> sequencer;
    std::unique_ptr<TurnOrchestrator> orchestrator;

    bool replyOpen = false;

    explicit Impl(AppConfig cfg): config(std::move(cfg)) {}

    auto initializeLlm() -> VoidResult;
    auto initializeSpeech() -> VoidResult;
    auto initializeMemory() -> VoidResult;
    void createPipeline();

    void printResult(const Result<TurnResult>& result);
    void saveMemory();
};

auto App::Impl::initializeLlm() -> VoidResult
{
    if (config.llm.modelPath.empty())
        return makeError(ErrorCode::ConfigError, "No model configured; pass --model or set llm.modelPath");

    auto const clientConfig = LlamaClientConfig {
        .modelPath = config.llm.modelPath,
        .contextSize = config.llm.contextSize,
        .gpuLayers = config.llm.gpuLayers,
        .threads = 0,
        .sampler = SamplerConfig { .temperature = config.llm.temperature, .maxTokens = config.llm.maxTokens },
    };

    if (auto loaded = llm.load(clientConfig); !loaded)
        return loaded;

    if (!llm.isReady())
        return makeError(ErrorCode::ModelUnavailable, "Model loaded but not ready");
    log::info("LLM ready ({} tokens of context)", llm.contextSize());

    log::info("Warming up LLM...");
    if (auto warmed = llm.warmUp(); !warmed)
        log::warning("LLM warm-up failed: {}", warmed.error());

    return {};
}

auto App::Impl::initializeSpeech() -> VoidResult
{
    if (config.tts.modelPath.empty())
        return makeError(ErrorCode::ConfigError, "No voice configured; pass --voice or set tts.modelPath");

    auto voiceResult = voice.initialize(PiperConfig {
        .modelPath = config.tts.modelPath,
        .espeakDataPath = config.tts.espeakDataPath,
    });
    if (!voiceResult)
        return voiceResult;

    auto playbackResult = playback.initialize(voice.sampleRate(), config.tts.deviceName);
    if (!playbackResult)
        return playbackResult;

    return {};
}

auto App::Impl::initializeMemory() -> VoidResult
{
    auto path = config.memory.path.empty() ? defaultMemoryPath() : config.memory.path;
    memory = std::make_unique<JsonMemoryStore>(std::move(path));
    if (auto loaded = memory->load(); !loaded)
        return loaded;

    memory->incrementSession();
    log::info("Memory loaded from {} (session #{})", memory->path(), memory->sessionCount());
    return {};
}

void App::Impl::createPipeline()
{
    auto const maxHistory = static_cast<std::size_t>(config.conversation.maxHistory);

    machine = std::make_unique<StateMachine>(maxHistory, memory.get());
    prompts = std::make_unique<PromptBuilder>(config.llm.persona, maxHistory);
    worker = std::make_unique<SynthesisWorker>(
        voice, SynthesisWorkerConfig { .maxChars = static_cast<std::size_t>(config.tts.maxChars) });
    sequencer = std::make_unique<PlaybackSequencer>(*worker, playback);

    auto const turnConfig = TurnConfig {
        .modelTimeout = std::chrono::milliseconds { config.turn.modelTimeoutMs },
        .streamIdleTimeout = std::chrono::milliseconds { config.turn.streamIdleTimeoutMs },
        .segmenter = SegmenterConfig { .sentencesPerUnit = config.conversation.sentencesPerUnit },
    };
    orchestrator = std::make_unique<TurnOrchestrator>(llm, *machine, *prompts, *sequencer, memory.get(), turnConfig);

    orchestrator->setObserver(TurnObserver {
        .onPhaseChanged =
            [this](TurnPhase phase) {
                if (phase == TurnPhase::Streaming && !replyOpen)
                {
                    std::print("\nHost: ");
                    replyOpen = true;
                }
            },
        .onToken =
            [](std::string_view token) {
                std::print("{}", token);
                std::fflush(stdout);
            },
        .onSpeaking = [](const AudioBuffer& buffer) {
            log::debug("Speaking unit {} ({})", buffer.sequenceIndex, buffer.duration());
        },
    });
}

void App::Impl::printResult(const Result<TurnResult>& result)
{
    auto const streamed = replyOpen;
    if (replyOpen)
    {
        std::println("");
        replyOpen = false;
    }

    if (!result)
    {
        log::error("Turn failed: {}", result.error());
        return;
    }

    // Apologies and fallbacks never went through the token stream.
    if (!streamed && !result->reply.empty())
        std::println("\nHost: {}", result->reply);

    log::debug("Turn {} in state {}", phaseName(result->outcome), stateName(result->state));
}

void App::Impl::saveMemory()
{
    if (!memory)
        return;
    if (auto saved = memory->save(); !saved)
        log::error("Failed to save memory: {}", saved.error());
}

App::App(AppConfig config): _impl(std::make_unique<Impl>(std::move(config)))
{
}

App::~App() = default;

auto App::initialize() -> VoidResult
{
    if (auto result = _impl->initializeLlm(); !result)
        return result;

    if (auto result = _impl->initializeSpeech(); !result)
        return result;

    if (auto result = _impl->initializeMemory(); !result)
        return result;

    _impl->createPipeline();

    if (_impl->config.tts.warmUp)
    {
        log::info("Warming up TTS...");
        if (auto warmed = _impl->worker->warmUp(); !warmed)
            log::warning("TTS warm-up failed: {}", warmed.error());
    }

    return {};
}

auto App::run(EpisodeOptions episode) -> int
{
    auto& impl = *_impl;

    if (episode.topic.empty())
    {
        if (auto last = impl.memory->getPreference(LastTopicPreference))
        {
            log::info("No topic given, picking up where we left off: {}", *last);
            episode.topic = std::move(*last);
        }
    }
    else
    {
        impl.memory->setPreference(LastTopicPreference, episode.topic);
    }

    std::println("Podcast starting. Type your reply and press Enter; an empty line is silence, 'stop' ends it.");

    impl.printResult(impl.orchestrator->startTopic(episode.topic, episode.topicContext));

    auto line = std::string {};
    while (true)
    {
        std::print("\nYou: ");
        std::fflush(stdout);

        if (!std::getline(std::cin, line))
        {
            // Input closed: the listener is gone, nobody to say goodbye to.
            impl.orchestrator->detach();
            std::println("");
            break;
        }

        auto result = impl.orchestrator->runTurn(line);
        impl.printResult(result);

        if (result && result->outcome == TurnPhase::Cancelled)
            break;
    }

    impl.saveMemory();
    std::println("\nPodcast ended. See you next time!");
    return 0;
}

} // namespace podbuddy
