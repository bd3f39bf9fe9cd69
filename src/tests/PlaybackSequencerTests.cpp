// SPDX-License-Identifier: Apache-2.0
#include <audio/PlaybackSequencer.hpp>

#include <tests/TestFakes.hpp>

#include <catch2/catch_test_macros.hpp>

#include <algorithm>
#include <stop_token>
#include <vector>

using namespace podbuddy;
using namespace std::chrono_literals;

namespace
{

struct Fixture
{
    testing::FakeSynthesisEngine engine;
    testing::FakePlaybackDevice device;
    SynthesisWorker worker { engine };
    PlaybackSequencer sequencer { worker, device };

    std::vector<int> started;
    int maxRetained = 0;

    Fixture()
    {
        sequencer.setPlaybackStartedCallback([this](const AudioBuffer& buffer) {
            started.push_back(buffer.sequenceIndex);
            maxRetained = std::max(maxRetained, sequencer.retainedBuffers());
        });
    }

    auto submitAll(const std::vector<std::string>& texts, const std::stop_token& stopToken = {}) -> std::vector<bool>
    {
        auto admitted = std::vector<bool> {};
        sequencer.begin();
        for (auto i = std::size_t { 0 }; i < texts.size(); ++i)
        {
            auto const unit = SentenceUnit {
                .text = texts[i],
                .sequenceIndex = static_cast<int>(i),
                .isFinal = i + 1 == texts.size(),
            };
            admitted.push_back(sequencer.submit(unit, stopToken));
        }
        sequencer.finish();
        return admitted;
    }
};

} // namespace

TEST_CASE("PlaybackSequencer plays units in order without overlap", "[playback]")
{
    auto fixture = Fixture();
    fixture.engine.delay = 2ms;
    fixture.device.playDuration = 5ms;

    (void) fixture.submitAll({ "One.", "Two.", "Three.", "Four." });

    CHECK(fixture.started == std::vector<int> { 0, 1, 2, 3 });
    CHECK(fixture.device.overlaps() == 0);
    CHECK_FALSE(fixture.device.isPlaying());

    auto const intervals = fixture.device.intervals();
    REQUIRE(intervals.size() == 4);
    for (auto i = std::size_t { 1 }; i < intervals.size(); ++i)
        CHECK(intervals[i - 1].end <= intervals[i].start);

    CHECK(fixture.sequencer.stats().played == 4);
    CHECK(fixture.sequencer.retainedBuffers() == 0);
}

TEST_CASE("PlaybackSequencer retains at most one buffer", "[playback]")
{
    auto fixture = Fixture();
    (void) fixture.submitAll({ "A.", "B.", "C.", "D.", "E." });

    CHECK(fixture.maxRetained == 1);
    CHECK(fixture.sequencer.retainedBuffers() == 0);
}

TEST_CASE("PlaybackSequencer skips a unit whose synthesis fails", "[playback]")
{
    auto fixture = Fixture();
    fixture.engine.failingTexts.insert("Broken.");

    auto const admitted = fixture.submitAll({ "First.", "Broken.", "Third." });

    CHECK(admitted == std::vector<bool> { true, true, true });
    CHECK(fixture.started == std::vector<int> { 0, 2 });
    CHECK(fixture.sequencer.stats().submitted == 3);
    CHECK(fixture.sequencer.stats().dropped == 1);
    CHECK(fixture.sequencer.stats().played == 2);
}

TEST_CASE("PlaybackSequencer drops units that are empty after cleanup", "[playback]")
{
    auto fixture = Fixture();

    (void) fixture.submitAll({ "**", "Real words." });

    CHECK(fixture.started == std::vector<int> { 1 });
    CHECK(fixture.sequencer.stats().dropped == 1);
}

TEST_CASE("PlaybackSequencer falls back to blocking playback", "[playback]")
{
    SECTION("primary device in blocking mode")
    {
        auto fixture = Fixture();
        fixture.device.failingPlays = 1;

        (void) fixture.submitAll({ "Hello.", "Again." });

        auto const intervals = fixture.device.intervals();
        REQUIRE(intervals.size() == 2);
        CHECK(intervals[0].blocking);
        CHECK_FALSE(intervals[1].blocking);
        CHECK(fixture.sequencer.stats().playbackFailures == 1);
        CHECK(fixture.sequencer.stats().played == 2);
    }

    SECTION("separate fallback device")
    {
        auto engine = testing::FakeSynthesisEngine();
        auto primary = testing::FakePlaybackDevice();
        auto fallback = testing::FakePlaybackDevice();
        auto worker = SynthesisWorker(engine);
        auto sequencer = PlaybackSequencer(worker, primary, &fallback);
        primary.failingPlays = 1;

        sequencer.begin();
        CHECK(sequencer.submit(SentenceUnit { .text = "Hello.", .sequenceIndex = 0 }));
        sequencer.finish();

        CHECK(primary.intervals().empty());
        REQUIRE(fallback.intervals().size() == 1);
        CHECK(fallback.intervals()[0].blocking);
        CHECK(sequencer.retainedBuffers() == 0);
    }

    SECTION("both devices fail")
    {
        auto fixture = Fixture();
        fixture.device.failingPlays = 2;

        auto const admitted = fixture.submitAll({ "Lost.", "Heard." });

        CHECK(admitted == std::vector<bool> { true, true });
        CHECK(fixture.sequencer.stats().playbackFailures == 1);
        CHECK(fixture.sequencer.stats().played == 1);
        CHECK(fixture.device.intervals().size() == 1);
    }
}

TEST_CASE("PlaybackSequencer rejects out-of-order units", "[playback]")
{
    auto fixture = Fixture();
    fixture.sequencer.begin();

    CHECK(fixture.sequencer.submit(SentenceUnit { .text = "Two.", .sequenceIndex = 2 }));
    CHECK_FALSE(fixture.sequencer.submit(SentenceUnit { .text = "One.", .sequenceIndex = 1 }));
    CHECK_FALSE(fixture.sequencer.submit(SentenceUnit { .text = "Two again.", .sequenceIndex = 2 }));
    fixture.sequencer.finish();

    CHECK(fixture.started == std::vector<int> { 2 });
}

TEST_CASE("PlaybackSequencer stops admitting units once cancelled", "[playback]")
{
    auto fixture = Fixture();
    auto stopSource = std::stop_source();

    fixture.sequencer.begin();
    CHECK(fixture.sequencer.submit(SentenceUnit { .text = "Before.", .sequenceIndex = 0 }, stopSource.get_token()));

    stopSource.request_stop();
    CHECK_FALSE(fixture.sequencer.submit(SentenceUnit { .text = "After.", .sequenceIndex = 1 }, stopSource.get_token()));
    fixture.sequencer.abandon();

    CHECK(fixture.started == std::vector<int> { 0 });
    CHECK(fixture.engine.calls() == 1);
    CHECK(fixture.sequencer.retainedBuffers() == 0);
    CHECK_FALSE(fixture.device.isPlaying());

    SECTION("abandon blocks further units until begin")
    {
        CHECK_FALSE(fixture.sequencer.submit(SentenceUnit { .text = "Later.", .sequenceIndex = 2 }));

        fixture.sequencer.begin();
        CHECK(fixture.sequencer.submit(SentenceUnit { .text = "Fresh.", .sequenceIndex = 0 }));
        fixture.sequencer.finish();
        CHECK(fixture.started == std::vector<int> { 0, 0 });
        CHECK(fixture.sequencer.stats().played == 1);
    }
}
