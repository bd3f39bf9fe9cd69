// SPDX-License-Identifier: Apache-2.0
#pragma once

#include <optional>
#include <string>
#include <string_view>
#include <vector>

namespace podbuddy
{

/// @brief One sentence-sized piece of a reply, synthesized and played as a whole.
struct SentenceUnit
{
    std::string text;
    int sequenceIndex = 0;
    bool isFinal = false;

    auto operator==(const SentenceUnit&) const -> bool = default;
};

/// @brief Configuration for the sentence segmenter.
struct SegmenterConfig
{
    /// @brief Number of raw sentences merged into one unit (coarser units sound more natural).
    int sentencesPerUnit = 1;

    /// @brief Drops <think>...</think> blocks emitted by reasoning models.
    bool filterThinkBlocks = true;
};

/// @brief Splits a streamed reply into SentenceUnits as tokens arrive.
///
/// A boundary is '.', '!' or '?' followed by whitespace, or by the end of the
/// stream. No abbreviation or quote handling is attempted. Units are emitted
/// as soon as they are complete; finish() flushes the remainder and resets the
/// segmenter so the next stream starts again at sequence index 0.
class SentenceSegmenter
{
  public:
    explicit SentenceSegmenter(SegmenterConfig config = {});

    /// @brief Appends a token and returns the units it completed, in order.
    [[nodiscard]] auto feed(std::string_view token) -> std::vector<SentenceUnit>;

    /// @brief Ends the stream.
    ///
    /// Returns the non-empty remainder as a unit marked final, or nothing if the
    /// remainder is empty; in that case the previously emitted unit is the final
    /// one and finalSequenceIndex() reports it.
    [[nodiscard]] auto finish() -> std::vector<SentenceUnit>;

    /// @brief Index of the last unit of the most recently finished stream.
    ///
    /// Empty if no stream was finished yet, if the finished stream produced no
    /// units, or once a new stream has started.
    [[nodiscard]] auto finalSequenceIndex() const -> std::optional<int>;

    /// @brief Discards all buffered text and restarts numbering at 0.
    void reset();

  private:
    SegmenterConfig _config;
    std::string _buffer;
    std::vector<std::string> _pendingSentences;
    int _nextIndex = 0;
    std::optional<int> _finalIndex;

    bool _insideThink = false;
    std::string _tagBuffer;

    void appendFiltered(std::string_view token);
    void collectSentences();
    void pushSentence(std::string_view sentence);
    auto emitPending(bool isFinal) -> SentenceUnit;
};

/// @brief Segments a complete text in one go, marking the last unit final.
[[nodiscard]] auto segmentText(std::string_view text, SegmenterConfig config = {}) -> std::vector<SentenceUnit>;

} // namespace podbuddy
