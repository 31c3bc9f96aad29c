/*

result.hpp
----------

Copyright (C) 2025, Sylvain Guinebert (github.com/sguinebert).

Distributed under the FreeBSD license, see the accompanying file LICENSE or
copy at http://www.freebsd.org/copyright/freebsd-license.html.

Error handling types using std::expected (C++23).
No exceptions are thrown by photoxx - all errors are returned via result<T>.

*/

#pragma once

#include <cstdint>
#include <expected>
#include <ostream>
#include <source_location>
#include <string>
#include <string_view>
#include <system_error>
#include <utility>

namespace photoxx
{

/// Error codes for photoxx operations
enum class errc : std::uint16_t
{
    ok = 0,

    // Network errors (100-199)
    net_resolve_failed = 100,
    net_connect_failed = 101,
    net_connection_refused = 102,
    net_connection_reset = 103,
    net_io_failed = 104,
    net_eof = 105,
    net_timeout = 106,
    net_cancelled = 107,
    tls_handshake_failed = 108,
    tls_verify_failed = 109,

    // Local encoding errors (200-299)
    encode_failed = 200,

    // Protocol errors (300-399)
    http_status_error = 300,
    http_invalid_url = 301,
    protocol_malformed_body = 302,

    // Caller side (700-799)
    invalid_argument = 700,
    config_missing = 701,
    oauth_no_refresh_token = 702,
    cancelled = 703,
};

[[nodiscard]] constexpr std::string_view to_string(errc code) noexcept
{
    switch (code)
    {
        case errc::ok: return "ok";
        case errc::net_resolve_failed: return "net_resolve_failed";
        case errc::net_connect_failed: return "net_connect_failed";
        case errc::net_connection_refused: return "net_connection_refused";
        case errc::net_connection_reset: return "net_connection_reset";
        case errc::net_io_failed: return "net_io_failed";
        case errc::net_eof: return "net_eof";
        case errc::net_timeout: return "net_timeout";
        case errc::net_cancelled: return "net_cancelled";
        case errc::tls_handshake_failed: return "tls_handshake_failed";
        case errc::tls_verify_failed: return "tls_verify_failed";
        case errc::encode_failed: return "encode_failed";
        case errc::http_status_error: return "http_status_error";
        case errc::http_invalid_url: return "http_invalid_url";
        case errc::protocol_malformed_body: return "protocol_malformed_body";
        case errc::invalid_argument: return "invalid_argument";
        case errc::config_missing: return "config_missing";
        case errc::oauth_no_refresh_token: return "oauth_no_refresh_token";
        case errc::cancelled: return "cancelled";
    }
    return "unknown";
}

inline std::ostream& operator<<(std::ostream& os, errc code)
{
    return os << to_string(code);
}

/// Transport failure, timeout or cancellation.
[[nodiscard]] constexpr bool is_network_error(errc code) noexcept
{
    const auto c = static_cast<std::uint16_t>(code);
    return c >= 100 && c < 200;
}

/// Local serialization failure.
[[nodiscard]] constexpr bool is_encoding_error(errc code) noexcept
{
    const auto c = static_cast<std::uint16_t>(code);
    return c >= 200 && c < 300;
}

/// Remote answered with a failure status or an unusable body.
[[nodiscard]] constexpr bool is_protocol_error(errc code) noexcept
{
    const auto c = static_cast<std::uint16_t>(code);
    return c >= 300 && c < 400;
}

struct error_info
{
    errc code{errc::ok};
    std::string message;
    std::string detail;
    std::error_code sys;
    std::source_location where{};

    [[nodiscard]] std::string to_string() const
    {
        std::string out(photoxx::to_string(code));
        if (!message.empty())
        {
            out += ": ";
            out += message;
        }
        return out;
    }
};

template<typename T>
using result = std::expected<T, error_info>;

using result_void = result<void>;

template<typename T>
[[nodiscard]] constexpr result<std::decay_t<T>> ok(T&& value)
{
    return result<std::decay_t<T>>(std::forward<T>(value));
}

[[nodiscard]] inline result<void> ok()
{
    return result<void>{};
}

template<typename T = void>
[[nodiscard]] inline result<T> fail(error_info err)
{
    return std::unexpected(std::move(err));
}

template<typename T = void>
[[nodiscard]] inline result<T> fail(errc code, std::string message, std::string detail = {},
    std::error_code sys = {}, std::source_location where = std::source_location::current())
{
    return std::unexpected(error_info{code, std::move(message), std::move(detail), sys, where});
}

} // namespace photoxx
