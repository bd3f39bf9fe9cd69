// SPDX-License-Identifier: Apache-2.0
#include <audio/SpeechText.hpp>

#include <catch2/catch_test_macros.hpp>

#include <string>

using namespace podbuddy;

TEST_CASE("cleanForSpeech strips markdown emphasis and headings", "[speech]")
{
    CHECK(cleanForSpeech("**Bold** and *soft*") == "Bold and soft");
    CHECK(cleanForSpeech("## Heading\nBody text.") == "Heading Body text.");
}

TEST_CASE("cleanForSpeech keeps link labels", "[speech]")
{
    CHECK(cleanForSpeech("See [the docs](https://example.com/a) now.") == "See the docs now.");
    CHECK(cleanForSpeech("Brackets [alone] stay.") == "Brackets [alone] stay.");
}

TEST_CASE("cleanForSpeech drops inline code", "[speech]")
{
    CHECK(cleanForSpeech("Run `ls -la` please.") == "Run please.");
}

TEST_CASE("cleanForSpeech removes emoji", "[speech]")
{
    CHECK(cleanForSpeech("Great \xF0\x9F\x9A\x97 ride \xF0\x9F\x98\x80!") == "Great ride !");
    CHECK(cleanForSpeech("Caf\xC3\xA9 stays.") == "Caf\xC3\xA9 stays.");
}

TEST_CASE("cleanForSpeech collapses whitespace", "[speech]")
{
    CHECK(cleanForSpeech("  lots\n\n of\t space  ") == "lots of space");
    CHECK(cleanForSpeech(" \n\t ").empty());
    CHECK(cleanForSpeech("**").empty());
}

TEST_CASE("cleanForSpeech truncates at the last sentence end", "[speech]")
{
    auto const text = std::string("Short one. Then a much longer tail of words");
    CHECK(cleanForSpeech(text, 20) == "Short one.");
}

TEST_CASE("cleanForSpeech hard-cuts without a usable sentence end", "[speech]")
{
    auto const text = std::string("Hi. abcdefghijklmnopqrstuvwxyz");
    auto const clean = cleanForSpeech(text, 20);
    CHECK(clean == "Hi. abcdefghijklmnop.");
}

TEST_CASE("cleanForSpeech never splits a multi-byte character", "[speech]")
{
    auto text = std::string("a");
    for (auto i = 0; i < 30; ++i)
        text += "\xC3\xA9";

    auto const clean = cleanForSpeech(text, 10);
    CHECK(clean == "a\xC3\xA9\xC3\xA9\xC3\xA9\xC3\xA9.");
}

TEST_CASE("cleanForSpeech leaves short text alone", "[speech]")
{
    CHECK(cleanForSpeech("Fine as it is.", 500) == "Fine as it is.");
    CHECK(cleanForSpeech("No cap at all", 0) == "No cap at all");
}
