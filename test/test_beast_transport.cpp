/*

test_beast_transport.cpp
------------------------

Copyright (C) 2025, Sylvain Guinebert.

Distributed under the FreeBSD license, see the accompanying file LICENSE or
copy at http://www.freebsd.org/copyright/freebsd-license.html.

*/


#define BOOST_TEST_MODULE beast_transport_test

#include <boost/test/unit_test.hpp>

#include <chrono>
#include <exception>
#include <future>
#include <stop_token>
#include <string>
#include <string_view>
#include <thread>
#include <vector>

#include <photoxx/net/beast_transport.hpp>

namespace asio = photoxx::asio;
namespace http = photoxx::beast::http;
using photoxx::errc;
using photoxx::net::beast_transport;
using photoxx::net::call_context;
using photoxx::net::http_method;
using photoxx::net::http_request;
using namespace std::chrono_literals;

namespace
{

/// Plain HTTP server on 127.0.0.1 serving exactly one exchange on its own thread.
class loopback_server
{
public:
    enum class mode
    {
        reply,
        silent
    };

    explicit loopback_server(mode m, unsigned status = 200, std::string body = {})
        : acceptor_(ioc_, asio::tcp::endpoint(asio::ip::make_address("127.0.0.1"), 0))
    {
        port_ = acceptor_.local_endpoint().port();
        received_ = promise_.get_future();
        thread_ = std::thread([this, m, status, body = std::move(body)]() { serve(m, status, body); });
    }

    ~loopback_server()
    {
        thread_.join();
    }

    loopback_server(const loopback_server&) = delete;
    loopback_server& operator=(const loopback_server&) = delete;

    [[nodiscard]] std::string url(std::string_view target) const
    {
        return "http://127.0.0.1:" + std::to_string(port_) + std::string(target);
    }

    http::request<http::string_body> received()
    {
        return received_.get();
    }

private:
    void serve(mode m, unsigned status, const std::string& body)
    {
        asio::error_code ec;
        asio::tcp::socket socket(ioc_);
        acceptor_.accept(socket, ec);
        if (ec)
        {
            promise_.set_exception(std::make_exception_ptr(asio::system_error(ec)));
            return;
        }

        photoxx::beast::flat_buffer buffer;
        http::request<http::string_body> req;
        http::read(socket, buffer, req, ec);
        if (ec)
        {
            promise_.set_exception(std::make_exception_ptr(asio::system_error(ec)));
            return;
        }
        promise_.set_value(req);

        if (m == mode::reply)
        {
            http::response<http::string_body> res{static_cast<http::status>(status), 11};
            res.set(http::field::content_type, "application/json");
            res.body() = body;
            res.prepare_payload();
            http::write(socket, res, ec);
            socket.shutdown(asio::tcp::socket::shutdown_send, ec);
            return;
        }

        // Hold the connection open until the client gives up.
        char sink[256];
        while (!ec)
            socket.read_some(asio::buffer(sink), ec);
    }

    asio::io_context ioc_;
    asio::tcp::acceptor acceptor_;
    unsigned short port_{0};
    std::promise<http::request<http::string_body>> promise_;
    std::future<http::request<http::string_body>> received_;
    std::thread thread_;
};

http_request search_request(std::string url)
{
    http_request req;
    req.method = http_method::post;
    req.url = std::move(url);
    req.set_header("Authorization", "Bearer A");
    req.set_header("Content-Type", "application/json");
    req.body = R"({"pageSize":100})";
    return req;
}

} // namespace


BOOST_AUTO_TEST_CASE(default_options)
{
    asio::ssl::context ssl_ctx(asio::ssl::context::tls_client);
    const beast_transport transport(ssl_ctx);

    const auto& opts = transport.get_options();
    BOOST_TEST((opts.timeouts.get_read() == 5s));
    BOOST_TEST((opts.tls.verify == photoxx::net::verify_mode::peer));
    BOOST_TEST(opts.tls.verify_host);
    BOOST_TEST(opts.user_agent == "photoxx/" PHOTOXX_VERSION_STRING);
    BOOST_TEST(opts.body_limit == 8u * 1024u * 1024u);
}

BOOST_AUTO_TEST_CASE(exchange_over_loopback)
{
    loopback_server server(loopback_server::mode::reply, 200, R"({"mediaItems":[{"id":"m1"}]})");
    asio::ssl::context ssl_ctx(asio::ssl::context::tls_client);
    beast_transport transport(ssl_ctx);

    auto res = transport.send(search_request(server.url("/v1/mediaItems:search")), call_context{});
    BOOST_REQUIRE(res.has_value());
    BOOST_TEST(res->status == 200u);
    BOOST_TEST(res->is_success());
    BOOST_TEST(res->content_type == "application/json");
    BOOST_TEST(res->body == R"({"mediaItems":[{"id":"m1"}]})");

    auto req = server.received();
    BOOST_TEST((req.method() == http::verb::post));
    BOOST_TEST(std::string(req.target()) == "/v1/mediaItems:search");
    BOOST_TEST(std::string(req[http::field::authorization]) == "Bearer A");
    BOOST_TEST(std::string(req[http::field::user_agent]) == "photoxx/" PHOTOXX_VERSION_STRING);
    BOOST_TEST(std::string(req[http::field::host]).rfind("127.0.0.1:", 0) == 0);
    BOOST_TEST(req.body() == R"({"pageSize":100})");
}

BOOST_AUTO_TEST_CASE(error_status_is_a_value)
{
    loopback_server server(loopback_server::mode::reply, 403, R"({"error":{"code":403}})");
    asio::ssl::context ssl_ctx(asio::ssl::context::tls_client);
    beast_transport transport(ssl_ctx);

    auto res = transport.send(search_request(server.url("/v1/mediaItems:search")), call_context{});
    BOOST_REQUIRE(res.has_value());
    BOOST_TEST(res->status == 403u);
    BOOST_TEST(!res->is_success());
    server.received();
}

BOOST_AUTO_TEST_CASE(read_timeout)
{
    loopback_server server(loopback_server::mode::silent);
    asio::ssl::context ssl_ctx(asio::ssl::context::tls_client);
    beast_transport::options opts;
    opts.timeouts.read = 300ms;
    beast_transport transport(ssl_ctx, opts);

    const auto started = std::chrono::steady_clock::now();
    auto res = transport.send(search_request(server.url("/slow")), call_context{});
    BOOST_REQUIRE(!res.has_value());
    BOOST_TEST(res.error().code == errc::net_timeout);
    BOOST_TEST(res.error().detail.find("stage=read") != std::string::npos);
    BOOST_TEST((std::chrono::steady_clock::now() - started < 4s));
    server.received();
}

BOOST_AUTO_TEST_CASE(call_deadline_bounds_the_exchange)
{
    loopback_server server(loopback_server::mode::silent);
    asio::ssl::context ssl_ctx(asio::ssl::context::tls_client);
    beast_transport transport(ssl_ctx);

    auto res = transport.send(search_request(server.url("/slow")), call_context::with_timeout(300ms));
    BOOST_REQUIRE(!res.has_value());
    BOOST_TEST(res.error().code == errc::net_timeout);
    server.received();
}

BOOST_AUTO_TEST_CASE(stop_while_in_flight)
{
    loopback_server server(loopback_server::mode::silent);
    asio::ssl::context ssl_ctx(asio::ssl::context::tls_client);
    beast_transport transport(ssl_ctx);

    std::stop_source source;
    std::thread canceller([&source]()
    {
        std::this_thread::sleep_for(300ms);
        source.request_stop();
    });

    const auto started = std::chrono::steady_clock::now();
    auto res = transport.send(search_request(server.url("/slow")), call_context(source.get_token()));
    canceller.join();
    BOOST_REQUIRE(!res.has_value());
    BOOST_TEST(res.error().code == errc::net_cancelled);
    BOOST_TEST((std::chrono::steady_clock::now() - started < 4s));
    server.received();
}

BOOST_AUTO_TEST_CASE(stop_before_send)
{
    asio::ssl::context ssl_ctx(asio::ssl::context::tls_client);
    beast_transport transport(ssl_ctx);

    std::stop_source source;
    source.request_stop();
    auto res = transport.send(search_request("http://127.0.0.1:9/never"), call_context(source.get_token()));
    BOOST_REQUIRE(!res.has_value());
    BOOST_TEST(res.error().code == errc::net_cancelled);
}

BOOST_AUTO_TEST_CASE(connection_refused)
{
    unsigned short port = 0;
    {
        asio::io_context ioc;
        asio::tcp::acceptor reserved(ioc, asio::tcp::endpoint(asio::ip::make_address("127.0.0.1"), 0));
        port = reserved.local_endpoint().port();
    }

    asio::ssl::context ssl_ctx(asio::ssl::context::tls_client);
    beast_transport transport(ssl_ctx);
    auto res = transport.send(search_request("http://127.0.0.1:" + std::to_string(port) + "/"), call_context{});
    BOOST_REQUIRE(!res.has_value());
    BOOST_TEST(photoxx::is_network_error(res.error().code));
}

BOOST_AUTO_TEST_CASE(invalid_url)
{
    asio::ssl::context ssl_ctx(asio::ssl::context::tls_client);
    beast_transport transport(ssl_ctx);
    auto res = transport.send(search_request("photoslibrary.googleapis.com/v1"), call_context{});
    BOOST_REQUIRE(!res.has_value());
    BOOST_TEST(res.error().code == errc::http_invalid_url);
}

BOOST_AUTO_TEST_CASE(header_injection_rejected)
{
    asio::ssl::context ssl_ctx(asio::ssl::context::tls_client);
    beast_transport transport(ssl_ctx);
    auto req = search_request("http://127.0.0.1:9/");
    req.set_header("X-Test", "a\r\nInjected: 1");
    auto res = transport.send(req, call_context{});
    BOOST_REQUIRE(!res.has_value());
    BOOST_TEST(res.error().code == errc::invalid_argument);
}

BOOST_AUTO_TEST_CASE(trace_is_redacted)
{
    std::vector<std::string> traces;
    auto& logger = photoxx::log::logger::instance();
    logger.set_callback([&traces](const photoxx::log::entry& e)
    {
        if (e.trace_info)
            traces.push_back(e.trace_info->data);
    });
    logger.set_trace_enabled(true);

    loopback_server server(loopback_server::mode::reply, 200, R"({"access_token":"A2","expires_in":3600})");
    asio::ssl::context ssl_ctx(asio::ssl::context::tls_client);
    beast_transport::options opts;
    opts.timeouts = photoxx::http_timeout_config::uniform(2s);
    beast_transport transport(ssl_ctx, opts);

    http_request req;
    req.method = http_method::post;
    req.url = server.url("/token");
    req.set_header("Content-Type", "application/x-www-form-urlencoded");
    req.body = "client_id=cid&client_secret=s3cr3t&refresh_token=R1&grant_type=refresh_token";
    auto res = transport.send(req, call_context{});

    logger.set_trace_enabled(false);
    logger.clear_callback();

    BOOST_REQUIRE(res.has_value());
    BOOST_TEST(server.received().body() == req.body);
    BOOST_REQUIRE(traces.size() == 2u);
    BOOST_TEST(traces[0].find("s3cr3t") == std::string::npos);
    BOOST_TEST(traces[0].find("refresh_token=<redacted>") != std::string::npos);
    BOOST_TEST(traces[0].find("client_id=cid") != std::string::npos);
    BOOST_TEST(traces[1].find("\"access_token\":\"<redacted>\"") != std::string::npos);
    BOOST_TEST(traces[1].find("A2") == std::string::npos);
}
