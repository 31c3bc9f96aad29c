/*

asio_decl.hpp
-------------

Copyright (C) 2025, Sylvain Guinebert (github.com/sguinebert).

Distributed under the FreeBSD license, see the accompanying file LICENSE or
copy at http://www.freebsd.org/copyright/freebsd-license.html.

Centralized Boost.Asio / Boost.Beast declarations for photoxx.
This header simplifies async notation throughout the library.

*/

#pragma once

#include <boost/asio.hpp>
#include <boost/asio/error.hpp>
#include <boost/asio/ssl.hpp>
#include <boost/beast/core.hpp>
#include <boost/beast/http.hpp>
#include <boost/beast/ssl.hpp>
#include <boost/beast/version.hpp>

#if defined(BOOST_ASIO_HAS_CO_AWAIT)
#include <boost/asio/co_spawn.hpp>
#include <boost/asio/redirect_error.hpp>
#include <boost/asio/use_awaitable.hpp>

namespace photoxx::asio
{
    // Core types
    using boost::asio::awaitable;
    using boost::asio::buffer;
    using boost::asio::co_spawn;
    using boost::asio::detached;
    using boost::asio::use_awaitable;
    using boost::asio::io_context;
    using boost::asio::any_io_executor;
    using boost::asio::steady_timer;
    using boost::asio::redirect_error;
    using boost::asio::post;

    // IP networking
    namespace ip = boost::asio::ip;
    using tcp = boost::asio::ip::tcp;

    namespace ssl = boost::asio::ssl;
    namespace error = boost::asio::error;

    using error_code = boost::system::error_code;
    using system_error = boost::system::system_error;

} // namespace photoxx::asio

namespace photoxx::beast
{
    using boost::beast::flat_buffer;
    using boost::beast::get_lowest_layer;
    using boost::beast::ssl_stream;
    using boost::beast::tcp_stream;

    namespace http = boost::beast::http;
} // namespace photoxx::beast

#else
#error "photoxx requires coroutine support (C++20) in Boost.Asio"
#endif

namespace photoxx
{
    using namespace std::literals::chrono_literals;
    using std::chrono::steady_clock;
}
