// SPDX-License-Identifier: Apache-2.0
#include <conversation/PromptBuilder.hpp>

#include <catch2/catch_test_macros.hpp>

#include <string>

using namespace podbuddy;

TEST_CASE("PromptBuilder system prompt layout", "[prompt]")
{
    auto const builder = PromptBuilder("You are Max.");

    auto const prompt = builder.systemPrompt(ConversationState::React, {});
    CHECK(prompt
          == "You are Max.\n\nCurrent conversation state: REACT\n" + std::string(stateInstruction(ConversationState::React)));
    CHECK_FALSE(prompt.contains("User memory:"));
}

TEST_CASE("PromptBuilder appends the memory summary verbatim", "[prompt]")
{
    auto const builder = PromptBuilder("persona");

    auto const prompt = builder.systemPrompt(ConversationState::Ask, "Session #3\nTopics: cars");
    CHECK(prompt.ends_with("\n\nUser memory:\nSession #3\nTopics: cars"));
    CHECK(prompt.contains("Current conversation state: ASK\n"));
}

TEST_CASE("PromptBuilder uses the default persona", "[prompt]")
{
    auto const builder = PromptBuilder();
    CHECK(builder.persona() == DefaultPersona);
    CHECK(builder.systemPrompt(ConversationState::Intro, {}).starts_with(DefaultPersona));
}

TEST_CASE("Every state has an instruction", "[prompt]")
{
    for (auto const state: { ConversationState::Intro,
                             ConversationState::Explain,
                             ConversationState::Ask,
                             ConversationState::React,
                             ConversationState::Expand })
    {
        CHECK_FALSE(stateInstruction(state).empty());
    }
}

TEST_CASE("PromptBuilder builds system, history and user messages", "[prompt]")
{
    auto const builder = PromptBuilder("persona");
    auto context = TurnContext {};
    context.currentState = ConversationState::Explain;
    context.history.append(Role::User, "hi");
    context.history.append(Role::Assistant, "hello there");

    auto const messages = builder.build(context, {}, "what is a turbo?");

    REQUIRE(messages.size() == 4);
    CHECK(messages[0].role == Role::System);
    CHECK(messages[0].content.contains("EXPLAIN"));
    CHECK(messages[1] == ChatMessage { .role = Role::User, .content = "hi" });
    CHECK(messages[2] == ChatMessage { .role = Role::Assistant, .content = "hello there" });
    CHECK(messages[3] == ChatMessage { .role = Role::User, .content = "what is a turbo?" });
}

TEST_CASE("PromptBuilder adds the topic context as a second system message", "[prompt]")
{
    auto const builder = PromptBuilder("persona");
    auto context = TurnContext {};
    context.topic = "engines";
    context.topicContext = "Four-stroke cycle basics.";

    auto const messages = builder.build(context, {}, "go");

    REQUIRE(messages.size() == 3);
    CHECK(messages[1].role == Role::System);
    CHECK(messages[1].content == "Today's discussion topic context:\nFour-stroke cycle basics.");
}

TEST_CASE("PromptBuilder substitutes a placeholder for silence", "[prompt]")
{
    auto const builder = PromptBuilder("persona");
    auto const context = TurnContext {};

    auto const messages = builder.build(context, {}, "  \n");

    REQUIRE(messages.size() == 2);
    CHECK(messages.back().role == Role::User);
    CHECK(messages.back().content == SilentUserPlaceholder);
}

TEST_CASE("PromptBuilder includes only the history tail", "[prompt]")
{
    auto const builder = PromptBuilder("persona", 2);
    auto context = TurnContext {};
    for (auto const text: { "a", "b", "c", "d" })
        context.history.append(Role::User, text);

    auto const messages = builder.build(context, {}, "e");

    REQUIRE(messages.size() == 4);
    CHECK(messages[1].content == "c");
    CHECK(messages[2].content == "d");
    CHECK(messages[3].content == "e");
}
