/*

error_mapping.hpp
-----------------

Centralized mapping between Asio/Beast error codes and photoxx::errc for HTTP I/O.

*/

#pragma once

#include <string_view>
#include <system_error>

#include <photoxx/detail/asio_decl.hpp>
#include <photoxx/detail/error_detail.hpp>
#include <photoxx/detail/result.hpp>

namespace photoxx::net
{

enum class io_stage
{
    resolve,
    connect,
    handshake,
    write,
    read
};

[[nodiscard]] constexpr std::string_view stage_name(io_stage stage) noexcept
{
    switch (stage)
    {
        case io_stage::resolve: return "resolve";
        case io_stage::connect: return "connect";
        case io_stage::handshake: return "handshake";
        case io_stage::write: return "write";
        case io_stage::read: return "read";
    }
    return "unknown";
}

/**
Map an I/O failure to an errc.

`timeout_triggered` and `cancel_triggered` record that the transport itself aborted the
operation, which is then reported as a timeout or cancellation whatever the error code.
**/
[[nodiscard]] inline errc map_net_error(io_stage stage, const photoxx::asio::error_code& ec,
    bool timeout_triggered, bool cancel_triggered = false) noexcept
{
    if (cancel_triggered)
        return errc::net_cancelled;
    if (timeout_triggered || ec == photoxx::asio::error::timed_out ||
        ec == boost::beast::error::timeout)
        return errc::net_timeout;
    if (ec == photoxx::asio::error::operation_aborted)
        return errc::net_cancelled;
    if (ec == photoxx::asio::error::eof || ec == boost::beast::http::error::end_of_stream)
        return errc::net_eof;
    if (ec == photoxx::asio::error::connection_refused)
        return errc::net_connection_refused;
    if (ec == photoxx::asio::error::connection_reset ||
        ec == photoxx::asio::error::broken_pipe)
        return errc::net_connection_reset;
    if (ec == photoxx::asio::error::host_not_found ||
        ec == photoxx::asio::error::host_not_found_try_again)
        return errc::net_resolve_failed;

    switch (stage)
    {
        case io_stage::resolve: return errc::net_resolve_failed;
        case io_stage::connect: return errc::net_connect_failed;
        case io_stage::handshake: return errc::tls_handshake_failed;
        case io_stage::write: return errc::net_io_failed;
        case io_stage::read: return errc::net_io_failed;
    }
    return errc::net_io_failed;
}

[[nodiscard]] inline detail::error_detail make_net_detail(
    std::string_view host,
    std::string_view service,
    io_stage stage,
    std::string_view op)
{
    detail::error_detail detail;
    detail.add("proto", "HTTP");
    detail.add("host", host);
    detail.add("service", service);
    detail.add("stage", stage_name(stage));
    detail.add("op", op);
    return detail;
}

} // namespace photoxx::net
