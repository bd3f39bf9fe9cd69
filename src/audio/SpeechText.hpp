// SPDX-License-Identifier: Apache-2.0
#pragma once

#include <cstddef>
#include <string>
#include <string_view>

namespace podbuddy
{

/// @brief Default character cap applied before synthesis.
constexpr auto DefaultSpeechMaxChars = std::size_t { 500 };

/// @brief Prepares model output for the synthesizer.
///
/// Strips markdown emphasis, headings, links (keeping the label) and inline
/// code, removes emoji, collapses whitespace and truncates overlong text at the
/// last '.' before @p maxChars (or hard-cuts and appends '.' when there is no
/// usable boundary in the last 60% of the cap).
/// @return The cleaned text, possibly empty.
[[nodiscard]] auto cleanForSpeech(std::string_view text, std::size_t maxChars = DefaultSpeechMaxChars)
    -> std::string;

} // namespace podbuddy
