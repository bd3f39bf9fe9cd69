// SPDX-License-Identifier: Apache-2.0
#pragma once

#include <core/Error.hpp>
#include <podbuddy/Config.hpp>

#include <memory>
#include <string>

namespace podbuddy
{

/// @brief What the episode is about, as chosen on the command line.
struct EpisodeOptions
{
    std::string topic;
    std::string topicContext;
};

/// @brief Wires the model, speech, memory and turn pipeline together and runs the show.
class App
{
  public:
    /// @brief Constructs the application with the given configuration.
    /// @param config The application configuration.
    explicit App(AppConfig config);
    ~App();

    App(const App&) = delete;
    App& operator=(const App&) = delete;

    /// @brief Loads the model, the voice and the memory file and warms both engines up.
    /// @return Success or an error.
    [[nodiscard]] auto initialize() -> VoidResult;

    /// @brief Introduces the topic, then runs one turn per line read from stdin.
    ///
    /// An empty line is a silent turn, a stop phrase ends the episode with a
    /// farewell and end of input ends it without one.
    /// @return Exit code (0 for success).
    [[nodiscard]] auto run(EpisodeOptions episode) -> int;

  private:
    struct Impl;
    std::unique_ptr<Impl> _impl;
};

} // namespace podbuddy
