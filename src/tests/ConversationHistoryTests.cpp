// SPDX-License-Identifier: Apache-2.0
#include <conversation/ConversationHistory.hpp>

#include <catch2/catch_test_macros.hpp>

#include <string>
#include <vector>

using namespace podbuddy;

TEST_CASE("ConversationHistory appends in order", "[history]")
{
    auto history = ConversationHistory();

    history.append(Role::User, "Hello!");
    history.append(Role::Assistant, "Welcome to the show.");

    REQUIRE(history.size() == 2);
    CHECK(history.messages()[0].role == Role::User);
    CHECK(history.messages()[0].content == "Hello!");
    CHECK(history.messages()[1].role == Role::Assistant);
}

TEST_CASE("ConversationHistory drops the oldest entries beyond the cap", "[history]")
{
    auto history = ConversationHistory(3);

    for (auto i = 0; i < 5; ++i)
        history.append(Role::User, std::to_string(i));

    REQUIRE(history.size() == 3);
    CHECK(history.messages().front().content == "2");
    CHECK(history.messages().back().content == "4");
}

TEST_CASE("ConversationHistory keeps at least one message", "[history]")
{
    auto history = ConversationHistory(0);
    CHECK(history.maxMessages() == 1);

    history.append(Role::User, "a");
    history.append(Role::User, "b");
    REQUIRE(history.size() == 1);
    CHECK(history.messages()[0].content == "b");
}

TEST_CASE("ConversationHistory tail", "[history]")
{
    auto history = ConversationHistory();
    history.append(Role::User, "a");
    history.append(Role::Assistant, "b");
    history.append(Role::User, "c");

    CHECK(history.tail(2).size() == 2);
    CHECK(history.tail(2)[0].content == "b");
    CHECK(history.tail(10).size() == 3);
    CHECK(history.tail(0).empty());
}

TEST_CASE("ConversationHistory restore applies the cap", "[history]")
{
    auto history = ConversationHistory(2);

    history.restore({
        ChatMessage { .role = Role::User, .content = "one" },
        ChatMessage { .role = Role::Assistant, .content = "two" },
        ChatMessage { .role = Role::User, .content = "three" },
    });

    REQUIRE(history.size() == 2);
    CHECK(history.messages()[0].content == "two");

    history.clear();
    CHECK(history.size() == 0);
}
