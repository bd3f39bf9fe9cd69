// SPDX-License-Identifier: Apache-2.0
#pragma once

#include <string>
#include <string_view>

namespace podbuddy
{

/// @brief Who produced a prompt message: the persona block, the listener, or the host.
enum class Role
{
    System,
    User,
    Assistant,
};

/// @brief Role name as expected by the model's chat template.
[[nodiscard]] constexpr auto roleToString(Role role) -> std::string_view
{
    switch (role)
    {
        case Role::System: return "system";
        case Role::User: return "user";
        case Role::Assistant: return "assistant";
    }
    return "user";
}

/// @brief A single role-tagged message in a prompt or in the conversation history.
struct ChatMessage
{
    Role role = Role::User;
    std::string content;

    auto operator==(const ChatMessage&) const -> bool = default;
};

} // namespace podbuddy
