// SPDX-License-Identifier: Apache-2.0
#include <core/Error.hpp>
#include <core/Log.hpp>

#include <catch2/catch_test_macros.hpp>

#include <string>
#include <utility>
#include <vector>

using namespace podbuddy;

namespace
{

/// @brief Captures log output for the lifetime of the test and restores the previous level.
struct CapturedLog
{
    std::vector<std::pair<log::Level, std::string>> lines;
    log::Level previousLevel = log::level();

    CapturedLog()
    {
        log::setSink([this](log::Level level, std::string_view message) { lines.emplace_back(level, message); });
    }

    ~CapturedLog()
    {
        log::setSink({});
        log::setLevel(previousLevel);
    }
};

} // namespace

TEST_CASE("log filters by level", "[log]")
{
    auto captured = CapturedLog();
    log::setLevel(log::Level::Info);

    log::error("broken {}", 1);
    log::info("hello {}", "world");
    log::debug("hidden");
    log::trace("hidden too");

    REQUIRE(captured.lines.size() == 2);
    CHECK(captured.lines[0] == std::pair { log::Level::Error, std::string("broken 1") });
    CHECK(captured.lines[1] == std::pair { log::Level::Info, std::string("hello world") });

    log::setLevel(log::Level::Trace);
    log::trace("visible");
    REQUIRE(captured.lines.size() == 3);
    CHECK(captured.lines[2].second == "visible");
}

TEST_CASE("log formats errors with their code", "[log]")
{
    auto captured = CapturedLog();
    log::setLevel(log::Level::Warning);

    log::warning("Turn failed: {}", Error { ErrorCode::ModelTimeout, "no output" });

    REQUIRE(captured.lines.size() == 1);
    CHECK(captured.lines[0].second == "Turn failed: [model-timeout] no output");
}

TEST_CASE("log level names have a fixed width", "[log]")
{
    for (auto const level:
         { log::Level::Error, log::Level::Warning, log::Level::Info, log::Level::Debug, log::Level::Trace })
    {
        CHECK(log::levelName(level).size() == 5);
    }
}
