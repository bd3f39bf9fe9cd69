// SPDX-License-Identifier: Apache-2.0
#pragma once

#include <core/Error.hpp>
#include <core/Types.hpp>

#include <chrono>
#include <memory>
#include <optional>
#include <span>
#include <string>

namespace podbuddy
{

/// @brief Ordered stream of text fragments produced by the language model.
class TokenStream
{
  public:
    virtual ~TokenStream() = default;

    /// @brief Blocks until the next fragment is available.
    /// @param timeout Maximum time to wait.
    /// @return The next fragment, std::nullopt once the end marker was reached,
    ///         ModelTimeout if nothing arrived in time, Cancelled after cancel(),
    ///         or the error the model reported.
    [[nodiscard]] virtual auto next(std::chrono::milliseconds timeout) -> Result<std::optional<std::string>> = 0;

    /// @brief Stops generation; pending and future next() calls return Cancelled.
    virtual void cancel() = 0;
};

/// @brief Abstract language-model client.
class LlmClient
{
  public:
    virtual ~LlmClient() = default;

    /// @brief Starts a streamed chat completion.
    /// @param messages Role-tagged prompt (system messages, history, user message).
    /// @return The token stream or ModelUnavailable.
    [[nodiscard]] virtual auto streamChat(std::span<const ChatMessage> messages)
        -> Result<std::unique_ptr<TokenStream>> = 0;

    /// @brief Runs a chat completion to the end and returns the whole reply.
    [[nodiscard]] virtual auto chat(std::span<const ChatMessage> messages) -> Result<std::string> = 0;

    /// @brief Cheap readiness check; false when no request can currently be served.
    [[nodiscard]] virtual auto isReady() const -> bool = 0;
};

/// @brief Drains @p stream into one string.
/// @param stream The stream to read.
/// @param timeout Per-fragment timeout.
/// @return The concatenated fragments, or the first error.
[[nodiscard]] auto collectStream(TokenStream& stream, std::chrono::milliseconds timeout) -> Result<std::string>;

} // namespace podbuddy
