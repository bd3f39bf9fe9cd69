// SPDX-License-Identifier: Apache-2.0
#include "TokenChannel.hpp"

#include <format>
#include <utility>

namespace podbuddy
{

void TokenChannel::push(std::string token)
{
    {
        auto lock = std::lock_guard(_mutex);
        if (_closed || _cancelled)
            return;
        _tokens.push_back(std::move(token));
    }
    _cv.notify_one();
}

void TokenChannel::close()
{
    {
        auto lock = std::lock_guard(_mutex);
        _closed = true;
    }
    _cv.notify_all();
}

void TokenChannel::fail(Error error)
{
    {
        auto lock = std::lock_guard(_mutex);
        if (_closed)
            return;
        _error = std::move(error);
        _closed = true;
    }
    _cv.notify_all();
}

auto TokenChannel::cancelled() const -> bool
{
    auto lock = std::lock_guard(_mutex);
    return _cancelled;
}

auto TokenChannel::next(std::chrono::milliseconds timeout) -> Result<std::optional<std::string>>
{
    auto lock = std::unique_lock(_mutex);
    _cv.wait_for(lock, timeout, [this] { return _cancelled || !_tokens.empty() || _closed; });

    if (_cancelled)
        return makeError(ErrorCode::Cancelled, "Token stream cancelled");

    if (!_tokens.empty())
    {
        auto token = std::move(_tokens.front());
        _tokens.pop_front();
        return token;
    }

    if (_closed)
    {
        if (_error)
            return std::unexpected(*_error);
        return std::nullopt;
    }

    return makeError(ErrorCode::ModelTimeout, std::format("No model output within {}", timeout));
}

void TokenChannel::cancel()
{
    {
        auto lock = std::lock_guard(_mutex);
        _cancelled = true;
        _tokens.clear();
    }
    _cv.notify_all();
}

auto collectStream(TokenStream& stream, std::chrono::milliseconds timeout) -> Result<std::string>
{
    auto text = std::string {};
    while (true)
    {
        auto token = stream.next(timeout);
        if (!token)
            return std::unexpected(token.error());
        if (!*token)
            return text;
        text += **token;
    }
}

} // namespace podbuddy
