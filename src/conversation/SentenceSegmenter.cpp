// SPDX-License-Identifier: Apache-2.0
#include "SentenceSegmenter.hpp"

#include <conversation/StateMachine.hpp>

#include <algorithm>
#include <cctype>
#include <iterator>
#include <utility>

namespace podbuddy
{

using namespace std::string_view_literals;

namespace
{

    constexpr auto ThinkOpen = "<think>"sv;
    constexpr auto ThinkClose = "</think>"sv;

    auto isTerminal(char ch) -> bool
    {
        return ch == '.' || ch == '!' || ch == '?';
    }

    auto isSpace(char ch) -> bool
    {
        return std::isspace(static_cast<unsigned char>(ch)) != 0;
    }

} // namespace

SentenceSegmenter::SentenceSegmenter(SegmenterConfig config): _config(config)
{
    _config.sentencesPerUnit = std::max(_config.sentencesPerUnit, 1);
}

auto SentenceSegmenter::feed(std::string_view token) -> std::vector<SentenceUnit>
{
    _finalIndex.reset();

    if (_config.filterThinkBlocks)
        appendFiltered(token);
    else
        _buffer.append(token);

    collectSentences();

    auto units = std::vector<SentenceUnit> {};
    while (std::cmp_greater_equal(_pendingSentences.size(), _config.sentencesPerUnit))
        units.push_back(emitPending(false));
    return units;
}

auto SentenceSegmenter::finish() -> std::vector<SentenceUnit>
{
    // A partial tag that never completed is ordinary text.
    if (!_tagBuffer.empty() && !_insideThink)
        _buffer.append(_tagBuffer);
    _tagBuffer.clear();

    collectSentences();
    pushSentence(_buffer);
    _buffer.clear();

    auto units = std::vector<SentenceUnit> {};
    while (!_pendingSentences.empty())
        units.push_back(emitPending(true));

    if (!units.empty())
        _finalIndex = units.back().sequenceIndex;
    else if (_nextIndex > 0)
        _finalIndex = _nextIndex - 1;

    auto const finalIndex = _finalIndex;
    reset();
    _finalIndex = finalIndex;
    return units;
}

auto SentenceSegmenter::finalSequenceIndex() const -> std::optional<int>
{
    return _finalIndex;
}

void SentenceSegmenter::reset()
{
    _buffer.clear();
    _pendingSentences.clear();
    _nextIndex = 0;
    _finalIndex.reset();
    _insideThink = false;
    _tagBuffer.clear();
}

void SentenceSegmenter::appendFiltered(std::string_view token)
{
    // Tags may span token boundaries, so filter character by character.
    for (auto const ch: token)
    {
        if (!_tagBuffer.empty())
        {
            _tagBuffer += ch;

            if (_tagBuffer == ThinkOpen)
            {
                _insideThink = true;
                _tagBuffer.clear();
                continue;
            }
            if (_tagBuffer == ThinkClose)
            {
                _insideThink = false;
                _tagBuffer.clear();
                continue;
            }

            if (ThinkOpen.starts_with(_tagBuffer) || ThinkClose.starts_with(_tagBuffer))
                continue;

            if (!_insideThink)
                _buffer.append(_tagBuffer);
            _tagBuffer.clear();
            continue;
        }

        if (ch == '<')
        {
            _tagBuffer = "<";
            continue;
        }

        if (!_insideThink)
            _buffer += ch;
    }
}

void SentenceSegmenter::collectSentences()
{
    auto start = std::size_t { 0 };
    for (auto i = std::size_t { 0 }; i + 1 < _buffer.size(); ++i)
    {
        if (isTerminal(_buffer[i]) && isSpace(_buffer[i + 1]))
        {
            pushSentence(std::string_view(_buffer).substr(start, i + 1 - start));
            start = i + 1;
        }
    }
    _buffer.erase(0, start);
}

void SentenceSegmenter::pushSentence(std::string_view sentence)
{
    auto const text = trimmed(sentence);
    if (!text.empty())
        _pendingSentences.emplace_back(text);
}

auto SentenceSegmenter::emitPending(bool isFinal) -> SentenceUnit
{
    auto const count = std::min(_pendingSentences.size(), static_cast<std::size_t>(_config.sentencesPerUnit));

    auto text = std::string {};
    for (auto i = std::size_t { 0 }; i < count; ++i)
    {
        if (i > 0)
            text += ' ';
        text += _pendingSentences[i];
    }
    _pendingSentences.erase(_pendingSentences.begin(),
                            _pendingSentences.begin() + static_cast<std::ptrdiff_t>(count));

    return SentenceUnit {
        .text = std::move(text),
        .sequenceIndex = _nextIndex++,
        .isFinal = isFinal && _pendingSentences.empty(),
    };
}

auto segmentText(std::string_view text, SegmenterConfig config) -> std::vector<SentenceUnit>
{
    auto segmenter = SentenceSegmenter(config);
    auto units = segmenter.feed(text);
    auto rest = segmenter.finish();
    units.insert(units.end(), std::make_move_iterator(rest.begin()), std::make_move_iterator(rest.end()));

    if (!units.empty())
        units.back().isFinal = true;
    return units;
}

} // namespace podbuddy
