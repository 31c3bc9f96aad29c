/*

http_transport.hpp
------------------

Transport seam between the API clients and the network.

*/

#pragma once

#include <ostream>
#include <string>
#include <string_view>
#include <utility>
#include <vector>

#include <photoxx/detail/ascii.hpp>
#include <photoxx/detail/result.hpp>
#include <photoxx/net/call_context.hpp>

namespace photoxx::net
{

enum class http_method
{
    get,
    post
};

[[nodiscard]] constexpr std::string_view method_name(http_method method) noexcept
{
    switch (method)
    {
        case http_method::get: return "GET";
        case http_method::post: return "POST";
    }
    return "UNKNOWN";
}

inline std::ostream& operator<<(std::ostream& os, http_method method)
{
    return os << method_name(method);
}

struct http_header
{
    std::string name;
    std::string value;
};

struct http_request
{
    http_method method{http_method::get};
    std::string url;
    std::vector<http_header> headers;
    std::string body;

    http_request& set_header(std::string name, std::string value)
    {
        headers.push_back({std::move(name), std::move(value)});
        return *this;
    }

    [[nodiscard]] const std::string* header(std::string_view name) const noexcept
    {
        for (const auto& h : headers)
        {
            if (detail::iequals_ascii(h.name, name))
                return &h.value;
        }
        return nullptr;
    }
};

struct http_response
{
    unsigned status{0};
    std::string reason;
    std::string content_type;
    std::string body;

    [[nodiscard]] bool is_success() const noexcept { return status >= 200 && status < 300; }
};

/**
One blocking HTTP exchange per call.

Implementations report transport failures with a network `errc`, honour the stop
token and deadline of `ctx`, and return any complete HTTP response (whatever its
status) as a value. Status interpretation belongs to the caller.
**/
class http_transport
{
public:
    virtual ~http_transport() = default;

    [[nodiscard]] virtual result<http_response> send(const http_request& request, const call_context& ctx) = 0;
};

/// Fail fast when the context is already stopped or past its deadline.
[[nodiscard]] inline result<void> check_context(const call_context& ctx)
{
    if (ctx.stop_requested())
        return fail<void>(errc::net_cancelled, "operation cancelled before sending");
    if (ctx.expired())
        return fail<void>(errc::net_timeout, "deadline expired before sending");
    return ok();
}

} // namespace photoxx::net
