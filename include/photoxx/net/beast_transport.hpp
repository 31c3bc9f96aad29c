/*

beast_transport.hpp
-------------------

Copyright (C) 2025, Sylvain Guinebert (github.com/sguinebert).

Distributed under the FreeBSD license, see the accompanying file LICENSE or
copy at http://www.freebsd.org/copyright/freebsd-license.html.

Blocking HTTP/1.1 transport on top of Boost.Beast. Each call runs a private
io_context until the exchange completes, is cancelled or times out.

*/

#pragma once

#include <chrono>
#include <cstddef>
#include <exception>
#include <functional>
#include <stop_token>
#include <string>
#include <utility>

#include <photoxx/config.hpp>
#include <photoxx/detail/asio_decl.hpp>
#include <photoxx/detail/ascii.hpp>
#include <photoxx/detail/log.hpp>
#include <photoxx/detail/redact.hpp>
#include <photoxx/detail/result.hpp>
#include <photoxx/detail/timeout_config.hpp>
#include <photoxx/net/call_context.hpp>
#include <photoxx/net/error_mapping.hpp>
#include <photoxx/net/http_transport.hpp>
#include <photoxx/net/query.hpp>
#include <photoxx/net/tls_options.hpp>
#include <photoxx/net/url.hpp>

namespace photoxx::net
{

class beast_transport : public http_transport
{
public:
    struct options
    {
        http_timeout_config timeouts{};
        tls_options tls{};
        std::string user_agent{"photoxx/" PHOTOXX_VERSION_STRING};
        std::size_t body_limit{8 * 1024 * 1024};
    };

    explicit beast_transport(photoxx::asio::ssl::context& ssl_ctx)
        : beast_transport(ssl_ctx, options{})
    {
    }

    /**
    @param ssl_ctx Client TLS context, owned by the caller and shared by every request.
    @param opts    Timeouts, TLS policy and limits.
    **/
    beast_transport(photoxx::asio::ssl::context& ssl_ctx, options opts)
        : ssl_ctx_(ssl_ctx), options_(std::move(opts))
    {
    }

    beast_transport(const beast_transport&) = delete;
    beast_transport& operator=(const beast_transport&) = delete;

    [[nodiscard]] const options& get_options() const noexcept { return options_; }

    [[nodiscard]] result<http_response> send(const http_request& request, const call_context& ctx) override
    {
        auto ready = check_context(ctx);
        if (!ready)
            return fail<http_response>(std::move(ready).error());

        auto url = parse_url(request.url);
        if (!url)
            return fail<http_response>(std::move(url).error());

        for (const auto& h : request.headers)
        {
            if (!detail::is_valid_header_name(h.name) || !detail::is_valid_header_value(h.value))
                return fail<http_response>(errc::invalid_argument, "invalid HTTP header", h.name);
        }

        if (url->is_tls() && !tls_configured_)
        {
            auto trust_res = configure_trust_store(ssl_ctx_, options_.tls);
            if (!trust_res)
                return fail<http_response>(std::move(trust_res).error());
            auto harden_res = apply_tls_hardening(ssl_ctx_, options_.tls);
            if (!harden_res)
                return fail<http_response>(std::move(harden_res).error());
            tls_configured_ = true;
        }

        trace_request(request);

        photoxx::asio::io_context ioc;
        photoxx::asio::tcp::resolver resolver(ioc);
        photoxx::asio::steady_timer timer(ioc);
        exchange_state state;
        result<http_response> outcome = fail<http_response>(errc::net_io_failed, "HTTP exchange did not complete");

        auto on_done = [&outcome](std::exception_ptr ep, result<http_response> res)
        {
            if (ep)
                std::rethrow_exception(ep);
            outcome = std::move(res);
        };

        if (url->is_tls())
        {
            photoxx::beast::ssl_stream<photoxx::beast::tcp_stream> stream(ioc, ssl_ctx_);
            state.abort = [&resolver, &stream]()
            {
                resolver.cancel();
                photoxx::beast::get_lowest_layer(stream).close();
            };
            std::stop_callback on_stop(ctx.stop_token(), [&ioc, &state]()
            {
                photoxx::asio::post(ioc, [&state]() { state.request_cancel(); });
            });
            photoxx::asio::co_spawn(ioc,
                exchange(stream, resolver, timer, *url, request, ctx, state), on_done);
            ioc.run();
        }
        else
        {
            photoxx::beast::tcp_stream stream(ioc);
            state.abort = [&resolver, &stream]()
            {
                resolver.cancel();
                stream.close();
            };
            std::stop_callback on_stop(ctx.stop_token(), [&ioc, &state]()
            {
                photoxx::asio::post(ioc, [&state]() { state.request_cancel(); });
            });
            photoxx::asio::co_spawn(ioc,
                exchange(stream, resolver, timer, *url, request, ctx, state), on_done);
            ioc.run();
        }

        if (outcome)
            trace_response(*outcome);
        else
            PHOTOXX_DEBUG("HTTP " + std::string(method_name(request.method)) + " " + url->host +
                " failed: " + outcome.error().to_string());
        return outcome;
    }

private:
    struct exchange_state
    {
        io_stage stage{io_stage::resolve};
        bool done{false};
        bool timed_out{false};
        bool cancelled{false};
        std::function<void()> abort;

        [[nodiscard]] bool aborted() const noexcept { return timed_out || cancelled; }

        void request_cancel()
        {
            if (done || aborted())
                return;
            cancelled = true;
            abort();
        }

        void request_timeout()
        {
            if (done || aborted())
                return;
            timed_out = true;
            abort();
        }
    };

    /// Start a phase with its own budget, bounded by the caller's deadline.
    static void arm(photoxx::asio::steady_timer& timer, exchange_state& state, io_stage stage,
        steady_clock::duration budget, const call_context& ctx)
    {
        state.stage = stage;
        auto deadline = steady_clock::now() + budget;
        if (ctx.deadline().has_value() && *ctx.deadline() < deadline)
            deadline = *ctx.deadline();
        timer.expires_at(deadline);
        timer.async_wait([&state](const photoxx::asio::error_code& ec)
        {
            if (ec)
                return;
            state.request_timeout();
        });
    }

    static result<http_response> stage_failure(const exchange_state& state, const url_parts& url,
        const photoxx::asio::error_code& ec, std::string_view op)
    {
        const errc code = map_net_error(state.stage, ec, state.timed_out, state.cancelled);
        auto detail = make_net_detail(url.host, url.port, state.stage, op);
        if (ec)
            detail.add("error", ec.message());
        return fail<http_response>(code, "HTTP " + std::string(stage_name(state.stage)) + " failed",
            detail.str(), ec);
    }

    static void set_server_name(photoxx::beast::tcp_stream&, const url_parts&)
    {
    }

    template<typename Stream>
    void set_server_name(photoxx::beast::ssl_stream<Stream>& stream, const url_parts& url)
    {
#if defined(SSL_CTRL_SET_TLSEXT_HOSTNAME)
        SSL_set_tlsext_host_name(stream.native_handle(), url.host.c_str());
#endif
        if (options_.tls.verify == verify_mode::peer)
        {
            stream.set_verify_mode(photoxx::asio::ssl::verify_peer);
            if (options_.tls.verify_host)
                stream.set_verify_callback(photoxx::asio::ssl::host_name_verification(url.host));
        }
        else
            stream.set_verify_mode(photoxx::asio::ssl::verify_none);
    }

    static photoxx::asio::awaitable<photoxx::asio::error_code> handshake(photoxx::beast::tcp_stream&)
    {
        co_return photoxx::asio::error_code{};
    }

    template<typename Stream>
    static photoxx::asio::awaitable<photoxx::asio::error_code> handshake(photoxx::beast::ssl_stream<Stream>& stream)
    {
        photoxx::asio::error_code ec;
        co_await stream.async_handshake(photoxx::asio::ssl::stream_base::client,
            photoxx::asio::redirect_error(photoxx::asio::use_awaitable, ec));
        co_return ec;
    }

    template<typename Stream>
    photoxx::asio::awaitable<result<http_response>> exchange(Stream& stream,
        photoxx::asio::tcp::resolver& resolver, photoxx::asio::steady_timer& timer,
        const url_parts& url, const http_request& request, const call_context& ctx, exchange_state& state)
    {
        namespace http = photoxx::beast::http;
        using photoxx::asio::redirect_error;
        using photoxx::asio::use_awaitable;

        struct finish_guard
        {
            exchange_state& state;
            photoxx::asio::steady_timer& timer;
            ~finish_guard()
            {
                state.done = true;
                timer.cancel();
            }
        } guard{state, timer};

        photoxx::asio::error_code ec;

        arm(timer, state, io_stage::resolve, options_.timeouts.get_connect(), ctx);
        auto endpoints = co_await resolver.async_resolve(url.host, url.port, redirect_error(use_awaitable, ec));
        if (ec || state.aborted())
            co_return stage_failure(state, url, ec, "async_resolve");

        arm(timer, state, io_stage::connect, options_.timeouts.get_connect(), ctx);
        co_await photoxx::beast::get_lowest_layer(stream).async_connect(endpoints, redirect_error(use_awaitable, ec));
        if (ec || state.aborted())
            co_return stage_failure(state, url, ec, "async_connect");

        set_server_name(stream, url);
        arm(timer, state, io_stage::handshake, options_.timeouts.get_handshake(), ctx);
        ec = co_await handshake(stream);
        if (ec || state.aborted())
            co_return stage_failure(state, url, ec, "async_handshake");

        http::request<http::string_body> req{
            request.method == http_method::post ? http::verb::post : http::verb::get, url.target, 11};
        req.set(http::field::host, url.host_header());
        req.set(http::field::user_agent, options_.user_agent);
        for (const auto& h : request.headers)
            req.set(h.name, h.value);
        req.body() = request.body;
        req.prepare_payload();

        arm(timer, state, io_stage::write, options_.timeouts.get_write(), ctx);
        co_await http::async_write(stream, req, redirect_error(use_awaitable, ec));
        if (ec || state.aborted())
            co_return stage_failure(state, url, ec, "async_write");

        photoxx::beast::flat_buffer buffer;
        http::response_parser<http::string_body> parser;
        parser.body_limit(options_.body_limit);
        arm(timer, state, io_stage::read, options_.timeouts.get_read(), ctx);
        co_await http::async_read(stream, buffer, parser, redirect_error(use_awaitable, ec));
        if (ec || state.aborted())
            co_return stage_failure(state, url, ec, "async_read");

        auto res = parser.release();
        http_response response;
        response.status = res.result_int();
        response.reason = std::string(res.reason());
        response.content_type = std::string(res[http::field::content_type]);
        response.body = std::move(res.body());

        photoxx::asio::error_code ignore_ec;
        photoxx::beast::get_lowest_layer(stream).socket().shutdown(photoxx::asio::tcp::socket::shutdown_both, ignore_ec);
        co_return ok(std::move(response));
    }

    void trace_request(const http_request& request) const
    {
        if (!log::logger::instance().is_trace_enabled())
            return;
        std::string text(method_name(request.method));
        text += ' ';
        text += request.url;
        for (const auto& h : request.headers)
        {
            text += '\n';
            text += detail::redact_line(h.name + ": " + h.value);
        }
        if (!request.body.empty())
        {
            const std::string* type = request.header("Content-Type");
            text += "\n\n";
            if (type != nullptr && detail::starts_with_ci(*type, content_type_form))
                text += detail::redact_form(request.body);
            else
                text += detail::redact_json_tokens(request.body);
        }
        PHOTOXX_TRACE_SEND("HTTP", text);
    }

    static void trace_response(const http_response& response)
    {
        if (!log::logger::instance().is_trace_enabled())
            return;
        std::string text = std::to_string(response.status);
        text += ' ';
        text += response.reason;
        text += "\n\n";
        text += detail::redact_json_tokens(response.body);
        PHOTOXX_TRACE_RECV("HTTP", text);
    }

    photoxx::asio::ssl::context& ssl_ctx_;
    options options_;
    bool tls_configured_{false};
};

} // namespace photoxx::net
