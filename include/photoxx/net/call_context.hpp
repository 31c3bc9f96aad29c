/*

call_context.hpp
----------------

Request-scoped cancellation and deadline handed to every network operation.

*/

#pragma once

#include <chrono>
#include <optional>
#include <stop_token>
#include <utility>

namespace photoxx::net
{

/**
A stop token plus an optional absolute deadline.

A default constructed context never cancels and has no deadline. The context is
only observed, the caller keeps the `std::stop_source` and may request a stop from
another thread while an operation is in flight.
**/
class call_context
{
public:
    using clock = std::chrono::steady_clock;

    call_context() = default;

    explicit call_context(std::stop_token stop)
        : stop_(std::move(stop))
    {
    }

    call_context(std::stop_token stop, clock::time_point deadline)
        : stop_(std::move(stop)), deadline_(deadline)
    {
    }

    [[nodiscard]] static call_context with_timeout(clock::duration timeout, std::stop_token stop = {})
    {
        return call_context(std::move(stop), clock::now() + timeout);
    }

    [[nodiscard]] bool stop_requested() const noexcept { return stop_.stop_requested(); }

    [[nodiscard]] const std::optional<clock::time_point>& deadline() const noexcept { return deadline_; }

    [[nodiscard]] bool expired(clock::time_point now = clock::now()) const noexcept
    {
        return deadline_.has_value() && now >= *deadline_;
    }

    [[nodiscard]] const std::stop_token& stop_token() const noexcept { return stop_; }

private:
    std::stop_token stop_;
    std::optional<clock::time_point> deadline_;
};

} // namespace photoxx::net
