// SPDX-License-Identifier: Apache-2.0
#include <core/Log.hpp>
#include <podbuddy/App.hpp>
#include <podbuddy/Config.hpp>

#include <CLI/CLI.hpp>

#include <format>

int main(int argc, char** argv)
{
    auto app = CLI::App { "podbuddy - a spoken podcast host that talks with you about a topic" };

    auto modelPath = std::string {};
    auto configPath = std::string {};
    auto voicePath = std::string {};
    auto episode = podbuddy::EpisodeOptions {};
    auto sentencesPerUnit = 0;
    auto verbose = false;

    app.add_option("-m,--model", modelPath, "Path to GGUF model file");
    app.add_option("-c,--config", configPath, "Path to config file");
    app.add_option("--voice", voicePath, "Path to piper voice model (.onnx)");
    app.add_option("-t,--topic", episode.topic, "Topic of the episode");
    app.add_option("--topic-context", episode.topicContext, "Background notes the host may draw on");
    app.add_option("--sentences-per-unit", sentencesPerUnit, "Sentences spoken per synthesis unit")
        ->check(CLI::PositiveNumber);
    app.add_flag("-v,--verbose", verbose, "Enable verbose logging");

    CLI11_PARSE(app, argc, argv);

    if (verbose)
        podbuddy::log::setLevel(podbuddy::log::Level::Debug);

    // Load config
    auto configResult =
        configPath.empty() ? podbuddy::loadConfig() : podbuddy::loadConfigFromFile(configPath);

    if (!configResult)
    {
        podbuddy::log::error("Failed to load config: {}", configResult.error().message);
        return 1;
    }

    auto& config = *configResult;

    // Apply CLI overrides
    if (!modelPath.empty())
        config.llm.modelPath = modelPath;
    if (!voicePath.empty())
        config.tts.modelPath = voicePath;
    if (sentencesPerUnit > 0)
        config.conversation.sentencesPerUnit = sentencesPerUnit;

    auto application = podbuddy::App(std::move(config));
    auto initResult = application.initialize();
    if (!initResult)
    {
        podbuddy::log::error("Initialization failed: {}", initResult.error());
        return 1;
    }

    return application.run(std::move(episode));
}
