// SPDX-License-Identifier: Apache-2.0
#pragma once

#include <core/Error.hpp>

#include <nlohmann/json.hpp>

#include <chrono>
#include <cstdint>
#include <future>
#include <map>
#include <mutex>
#include <string>

namespace webchat
{

/// @brief Correlates outstanding request ids with the callers waiting on them.
///
/// Every registered call is settled exactly once: by a matching response,
/// by expiry of its deadline, or by rejectAll(). Whichever comes first removes
/// the entry; later attempts find nothing and report false.
///
/// All member functions are thread-safe.
class PendingCalls
{
  public:
    using Clock = std::chrono::steady_clock;

    /// @brief Registers an outstanding call.
    /// @param id The request id; must not already be outstanding.
    /// @param method The method name, kept for diagnostics.
    /// @param deadline When the call expires.
    /// @return The future the caller waits on, or InvalidArgument for a duplicate id.
    [[nodiscard]] auto registerCall(int64_t id, std::string method, Clock::time_point deadline)
        -> Result<std::future<Result<nlohmann::json>>>;

    /// @brief Settles a call with the response outcome.
    /// @param id The request id from the response.
    /// @param outcome The result payload or the error the provider answered with.
    /// @return false if no call with this id is outstanding (late or duplicate response).
    auto resolve(int64_t id, Result<nlohmann::json> outcome) -> bool;

    /// @brief Removes calls whose deadline has passed and settles them with TimeoutError.
    /// @param now The current time.
    /// @return Number of calls expired.
    auto expireDue(Clock::time_point now) -> size_t;

    /// @brief Settles every outstanding call with @p error.
    /// @return Number of calls rejected.
    auto rejectAll(const Error& error) -> size_t;

    /// @brief Number of outstanding calls.
    [[nodiscard]] auto size() const -> size_t;

    /// @brief Returns true if @p id is outstanding.
    [[nodiscard]] auto contains(int64_t id) const -> bool;

    /// @brief Returns the method name of an outstanding call, or an empty string.
    [[nodiscard]] auto methodOf(int64_t id) const -> std::string;

  private:
    struct Entry
    {
        std::string method;
        Clock::time_point registeredAt;
        Clock::time_point deadline;
        std::promise<Result<nlohmann::json>> promise;
    };

    mutable std::mutex _mutex;
    std::map<int64_t, Entry> _entries;
};

} // namespace webchat
