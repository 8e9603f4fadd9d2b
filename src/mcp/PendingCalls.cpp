// SPDX-License-Identifier: Apache-2.0
#include "PendingCalls.hpp"

#include <core/Log.hpp>

#include <format>
#include <vector>

namespace webchat
{

auto PendingCalls::registerCall(int64_t id, std::string method, Clock::time_point deadline)
    -> Result<std::future<Result<nlohmann::json>>>
{
    auto const lock = std::lock_guard(_mutex);

    if (_entries.contains(id))
        return makeError(ErrorCode::InvalidArgument, std::format("Request id {} is already outstanding", id));

    auto entry = Entry {
        .method = std::move(method),
        .registeredAt = Clock::now(),
        .deadline = deadline,
        .promise = {},
    };
    auto future = entry.promise.get_future();
    _entries.emplace(id, std::move(entry));
    return future;
}

auto PendingCalls::resolve(int64_t id, Result<nlohmann::json> outcome) -> bool
{
    auto entry = Entry {};
    {
        auto const lock = std::lock_guard(_mutex);
        auto const it = _entries.find(id);
        if (it == _entries.end())
        {
            log::debug("Discarding response for unknown or expired request id {}", id);
            return false;
        }
        entry = std::move(it->second);
        _entries.erase(it);
    }

    auto const elapsed =
        std::chrono::duration_cast<std::chrono::milliseconds>(Clock::now() - entry.registeredAt);
    log::debug("Request {} ({}) settled after {}ms", id, entry.method, elapsed.count());

    entry.promise.set_value(std::move(outcome));
    return true;
}

auto PendingCalls::expireDue(Clock::time_point now) -> size_t
{
    auto expired = std::vector<std::pair<int64_t, Entry>> {};
    {
        auto const lock = std::lock_guard(_mutex);
        for (auto it = _entries.begin(); it != _entries.end();)
        {
            if (it->second.deadline <= now)
            {
                expired.emplace_back(it->first, std::move(it->second));
                it = _entries.erase(it);
            }
            else
            {
                ++it;
            }
        }
    }

    for (auto& [id, entry]: expired)
    {
        auto const waited =
            std::chrono::duration_cast<std::chrono::milliseconds>(now - entry.registeredAt);
        log::error("Request {} ({}) timed out after {}ms", id, entry.method, waited.count());
        entry.promise.set_value(makeError(
            ErrorCode::TimeoutError,
            std::format("{} request timed out after {}s", entry.method, waited.count() / 1000.0)));
    }

    return expired.size();
}

auto PendingCalls::rejectAll(const Error& error) -> size_t
{
    auto rejected = std::map<int64_t, Entry> {};
    {
        auto const lock = std::lock_guard(_mutex);
        rejected.swap(_entries);
    }

    for (auto& [id, entry]: rejected)
    {
        log::debug("Rejecting request {} ({}): {}", id, entry.method, error.message);
        entry.promise.set_value(std::unexpected(error));
    }

    return rejected.size();
}

auto PendingCalls::size() const -> size_t
{
    auto const lock = std::lock_guard(_mutex);
    return _entries.size();
}

auto PendingCalls::contains(int64_t id) const -> bool
{
    auto const lock = std::lock_guard(_mutex);
    return _entries.contains(id);
}

auto PendingCalls::methodOf(int64_t id) const -> std::string
{
    auto const lock = std::lock_guard(_mutex);
    auto const it = _entries.find(id);
    return it != _entries.end() ? it->second.method : std::string {};
}

} // namespace webchat
