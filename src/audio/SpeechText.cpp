// SPDX-License-Identifier: Apache-2.0
#include "SpeechText.hpp"

#include <libunicode/utf8_grapheme_segmenter.h>

#include <cctype>
#include <cstdint>

namespace podbuddy
{

namespace
{

    auto isSpace(char ch) -> bool
    {
        return std::isspace(static_cast<unsigned char>(ch)) != 0;
    }

    auto stripEmphasisAndHeadings(std::string_view text) -> std::string
    {
        auto out = std::string {};
        out.reserve(text.size());

        for (auto i = std::size_t { 0 }; i < text.size(); ++i)
        {
            auto const ch = text[i];
            if (ch == '*')
                continue;
            if (ch == '#')
            {
                while (i + 1 < text.size() && text[i + 1] == '#')
                    ++i;
                while (i + 1 < text.size() && isSpace(text[i + 1]))
                    ++i;
                continue;
            }
            out += ch;
        }
        return out;
    }

    /// @brief Replaces [label](url) with label and drops `code` spans.
    auto stripLinksAndCode(std::string_view text) -> std::string
    {
        auto out = std::string {};
        out.reserve(text.size());

        auto i = std::size_t { 0 };
        while (i < text.size())
        {
            auto const ch = text[i];

            if (ch == '[')
            {
                auto const labelEnd = text.find(']', i + 1);
                if (labelEnd != std::string_view::npos && labelEnd > i + 1 && labelEnd + 1 < text.size()
                    && text[labelEnd + 1] == '(')
                {
                    auto const urlEnd = text.find(')', labelEnd + 2);
                    if (urlEnd != std::string_view::npos && urlEnd > labelEnd + 2)
                    {
                        out.append(text.substr(i + 1, labelEnd - i - 1));
                        i = urlEnd + 1;
                        continue;
                    }
                }
            }
            else if (ch == '`')
            {
                auto const close = text.find('`', i + 1);
                if (close != std::string_view::npos)
                {
                    i = close + 1;
                    continue;
                }
            }

            out += ch;
            ++i;
        }
        return out;
    }

    auto isStrippedEmoji(std::uint32_t cp) -> bool
    {
        return (cp >= 0x1F600 && cp <= 0x1F64F)    // emoticons
               || (cp >= 0x1F300 && cp <= 0x1F5FF) // symbols & pictographs
               || (cp >= 0x1F680 && cp <= 0x1F6FF) // transport & map
               || (cp >= 0x1F1E0 && cp <= 0x1F1FF); // flags
    }

    auto stripEmoji(std::string_view text) -> std::string
    {
        auto out = std::string {};
        out.reserve(text.size());

        auto i = std::size_t { 0 };
        while (i < text.size())
        {
            auto const lead = static_cast<unsigned char>(text[i]);
            if ((lead & 0xF8) == 0xF0 && i + 3 < text.size())
            {
                auto const cp = (static_cast<std::uint32_t>(lead & 0x07) << 18)
                                | (static_cast<std::uint32_t>(static_cast<unsigned char>(text[i + 1]) & 0x3F) << 12)
                                | (static_cast<std::uint32_t>(static_cast<unsigned char>(text[i + 2]) & 0x3F) << 6)
                                | static_cast<std::uint32_t>(static_cast<unsigned char>(text[i + 3]) & 0x3F);
                if (isStrippedEmoji(cp))
                {
                    i += 4;
                    continue;
                }
            }
            out += text[i];
            ++i;
        }
        return out;
    }

    auto collapseWhitespace(std::string_view text) -> std::string
    {
        auto out = std::string {};
        out.reserve(text.size());

        auto pendingSpace = false;
        for (auto const ch: text)
        {
            if (isSpace(ch))
            {
                pendingSpace = !out.empty();
                continue;
            }
            if (pendingSpace)
                out += ' ';
            pendingSpace = false;
            out += ch;
        }
        return out;
    }

    /// @brief Returns the last grapheme cluster boundary at or before @p pos.
    auto graphemeBoundary(std::string_view text, std::size_t pos) -> std::size_t
    {
        auto segmenter = unicode::utf8_grapheme_segmenter(text);
        auto boundary = std::size_t { 0 };
        for (auto it = segmenter.begin(); it != segmenter.end(); ++it)
        {
            auto const offset = static_cast<std::size_t>(it._clusterStart - text.data());
            if (offset > pos)
                break;
            boundary = offset;
        }
        return boundary;
    }

} // namespace

auto cleanForSpeech(std::string_view text, std::size_t maxChars) -> std::string
{
    auto clean = collapseWhitespace(stripEmoji(stripLinksAndCode(stripEmphasisAndHeadings(text))));

    if (maxChars == 0 || clean.size() <= maxChars)
        return clean;

    auto const dot = clean.rfind('.', maxChars - 1);
    if (dot != std::string::npos && dot > maxChars * 2 / 5)
    {
        clean.resize(dot + 1);
        return clean;
    }

    clean.resize(graphemeBoundary(clean, maxChars));
    while (!clean.empty() && clean.back() == ' ')
        clean.pop_back();
    clean += '.';
    return clean;
}

} // namespace podbuddy
