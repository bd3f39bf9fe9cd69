// SPDX-License-Identifier: Apache-2.0
#pragma once

#include <llm/LlmClient.hpp>

#include <condition_variable>
#include <deque>
#include <mutex>
#include <optional>
#include <string>

namespace podbuddy
{

/// @brief Thread-safe TokenStream fed by a producer thread.
///
/// The producer calls push() per fragment and exactly one of close() or fail();
/// the consumer reads with next(). Fragments queued before close() or fail()
/// are still delivered in order.
class TokenChannel final: public TokenStream
{
  public:
    /// @brief Appends a fragment. Ignored after close(), fail() or cancel().
    void push(std::string token);

    /// @brief Appends the end marker.
    void close();

    /// @brief Ends the stream with an error.
    void fail(Error error);

    /// @brief Returns true once the consumer cancelled; producers should stop generating.
    [[nodiscard]] auto cancelled() const -> bool;

    [[nodiscard]] auto next(std::chrono::milliseconds timeout) -> Result<std::optional<std::string>> override;
    void cancel() override;

  private:
    mutable std::mutex _mutex;
    std::condition_variable _cv;
    std::deque<std::string> _tokens;
    bool _closed = false;
    bool _cancelled = false;
    std::optional<Error> _error;
};

} // namespace podbuddy
