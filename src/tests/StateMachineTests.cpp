// SPDX-License-Identifier: Apache-2.0
#include <conversation/StateMachine.hpp>

#include <tests/TestFakes.hpp>

#include <catch2/catch_test_macros.hpp>

#include <string>
#include <vector>

using namespace podbuddy;

TEST_CASE("StateMachine starts in Intro", "[state]")
{
    auto machine = StateMachine();

    CHECK(machine.state() == ConversationState::Intro);
    CHECK(machine.context().turnCount == 0);
    CHECK(machine.context().silenceStreak == 0);
    CHECK(machine.context().history.size() == 0);
}

TEST_CASE("StateMachine follows the fixed cycle", "[state]")
{
    auto machine = StateMachine();

    CHECK(machine.advance("tell me more") == ConversationState::Explain);
    CHECK(machine.advance("sure") == ConversationState::Ask);
    CHECK(machine.advance("I like it") == ConversationState::React);
    CHECK(machine.advance("why?") == ConversationState::Expand);
    CHECK(machine.advance("go on") == ConversationState::Ask);
    CHECK(machine.advance("hmm") == ConversationState::React);
    CHECK(machine.context().turnCount == 6);
}

TEST_CASE("StateMachine forces Ask on the second silent turn", "[state]")
{
    auto machine = StateMachine();
    auto states = std::vector<ConversationState> {};

    for (auto const input: { "hi", "", "   ", "ok" })
        states.push_back(machine.advance(input));

    CHECK(states
          == std::vector<ConversationState> {
              ConversationState::Explain,
              ConversationState::Ask,
              ConversationState::Ask,
              ConversationState::React,
          });
    CHECK(machine.context().silenceStreak == 0);
}

TEST_CASE("StateMachine silence overrides every state", "[state]")
{
    auto const prefixes = std::vector<std::vector<std::string>> {
        {},
        { "a" },
        { "a", "b" },
        { "a", "b", "c" },
        { "a", "b", "c", "d" },
    };

    for (auto const& prefix: prefixes)
    {
        auto machine = StateMachine();
        for (auto const& input: prefix)
            (void) machine.advance(input);

        (void) machine.advance("");
        CHECK(machine.advance("\t\n") == ConversationState::Ask);
        CHECK(machine.context().silenceStreak == 0);
    }
}

TEST_CASE("StateMachine tracks the silence streak", "[state]")
{
    auto machine = StateMachine();

    (void) machine.advance("");
    CHECK(machine.context().silenceStreak == 1);

    (void) machine.advance("back again");
    CHECK(machine.context().silenceStreak == 0);

    (void) machine.advance(" ");
    CHECK(machine.context().silenceStreak == 1);
    (void) machine.advance("");
    CHECK(machine.context().silenceStreak == 0); // reset after forcing Ask
    CHECK(machine.state() == ConversationState::Ask);
}

TEST_CASE("StateMachine never returns to Intro through advance", "[state]")
{
    auto machine = StateMachine();
    auto const inputs = std::vector<std::string> { "x", "", "y", "", "", "z", "w", "", "v" };

    for (auto i = 0; i < 5; ++i)
        for (auto const& input: inputs)
            CHECK(machine.advance(input) != ConversationState::Intro);
}

TEST_CASE("StateMachine setTopic resets to Intro", "[state]")
{
    auto machine = StateMachine();
    (void) machine.advance("one");
    (void) machine.advance("");
    machine.appendHistory(Role::User, "one");

    machine.setTopic("cars", "Electric vs combustion.");

    CHECK(machine.state() == ConversationState::Intro);
    CHECK(machine.context().topic == "cars");
    CHECK(machine.context().topicContext == "Electric vs combustion.");
    CHECK(machine.context().turnCount == 0);
    CHECK(machine.context().silenceStreak == 0);
    CHECK(machine.context().history.size() == 1); // history is cleared separately
}

TEST_CASE("StateMachine notifies memory of topics and spoken opinions", "[state][memory]")
{
    auto memory = testing::FakeMemoryStore();
    auto machine = StateMachine(20, &memory);

    SECTION("no topic set")
    {
        (void) machine.advance("I love engines");
        CHECK(memory.extractCalls.empty());
    }

    SECTION("topic set")
    {
        machine.setTopic("cars");
        REQUIRE(memory.topics == std::vector<std::string> { "cars" });

        (void) machine.advance("I love engines");
        (void) machine.advance("   ");
        CHECK(memory.extractCalls == std::vector<std::string> { "I love engines" });
        REQUIRE(memory.opinions.size() == 1);
        CHECK(memory.opinions[0].first == "cars");
    }

    SECTION("blank topic")
    {
        machine.setTopic("  ");
        CHECK(memory.topics.empty());
        CHECK(machine.state() == ConversationState::Intro);
        CHECK(machine.introPrompt().contains("something interesting"));
    }
}

TEST_CASE("StateMachine snapshot and restore", "[state]")
{
    auto machine = StateMachine();
    machine.setTopic("space");
    (void) machine.advance("hello");
    machine.appendHistory(Role::User, "hello");

    auto const saved = machine.snapshot();

    (void) machine.advance("");
    (void) machine.advance("");
    machine.appendHistory(Role::Assistant, "anyone there?");
    REQUIRE(machine.state() == ConversationState::Ask);

    machine.restore(saved);

    CHECK(machine.state() == ConversationState::Explain);
    CHECK(machine.context().turnCount == 1);
    CHECK(machine.context().silenceStreak == 0);
    REQUIRE(machine.context().history.size() == 1);
    CHECK(machine.context().history.messages()[0].content == "hello");
}

TEST_CASE("StateMachine caps the history", "[state]")
{
    auto machine = StateMachine(4);

    for (auto i = 0; i < 10; ++i)
        machine.appendHistory(i % 2 == 0 ? Role::User : Role::Assistant, std::to_string(i));

    auto const messages = machine.context().history.messages();
    REQUIRE(messages.size() == 4);
    CHECK(messages.front().content == "6");
    CHECK(messages.back().content == "9");
}

TEST_CASE("StateMachine restores a saved history", "[state]")
{
    auto machine = StateMachine(2);
    machine.appendHistory(Role::User, "stale");

    machine.restoreHistory({
        ChatMessage { .role = Role::User, .content = "one" },
        ChatMessage { .role = Role::Assistant, .content = "two" },
        ChatMessage { .role = Role::User, .content = "three" },
    });

    auto const messages = machine.context().history.messages();
    REQUIRE(messages.size() == 2);
    CHECK(messages[0].content == "two");
    CHECK(messages[1].content == "three");

    machine.clearHistory();
    CHECK(machine.context().history.size() == 0);
}

TEST_CASE("StateMachine prompts", "[state]")
{
    auto machine = StateMachine();

    CHECK(machine.introPrompt().contains("something interesting"));

    machine.setTopic("volcanoes");
    CHECK(machine.introPrompt().contains("The topic is: volcanoes."));

    auto const first = machine.silencePrompt();
    (void) machine.advance("x");
    CHECK(machine.silencePrompt() != first);
    CHECK_FALSE(machine.silencePrompt().empty());
}

TEST_CASE("trimmed and isBlank", "[state]")
{
    CHECK(trimmed("  a b \n") == "a b");
    CHECK(trimmed("\t\r\n").empty());
    CHECK(isBlank(""));
    CHECK(isBlank(" \t\n"));
    CHECK_FALSE(isBlank(" x "));
}
