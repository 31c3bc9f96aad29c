/*

test_photos_client.cpp
----------------------

Copyright (C) 2025, Sylvain Guinebert.

Distributed under the FreeBSD license, see the accompanying file LICENSE or
copy at http://www.freebsd.org/copyright/freebsd-license.html.

*/


#define BOOST_TEST_MODULE photos_client_test

#include <boost/test/unit_test.hpp>

#include <chrono>
#include <stop_token>
#include <string>

#include <nlohmann/json.hpp>

#include <photoxx/photos/client.hpp>
#include "stub_transport.hpp"

namespace photos = photoxx::photos;
using photoxx::errc;
using photoxx::test::stub_transport;

namespace
{

photos::search_request pets_request()
{
    photos::search_request req;
    req.page_size = 100;
    req.filters.emplace().content_filter.emplace().included_content_categories.push_back(
        photos::content_category::pets);
    return req;
}

} // namespace


BOOST_AUTO_TEST_CASE(search_returns_page_in_order)
{
    stub_transport transport;
    transport.reply(200, R"({"mediaItems":[{"id":"m1"},{"id":"m2"}],"nextPageToken":"T"})");
    photos::client client(transport, "A");

    auto res = client.search(pets_request());
    BOOST_TEST(res.has_value());
    BOOST_TEST(res->next_page_token == "T");
    BOOST_TEST(res->media_items.size() == 2);
    BOOST_TEST(res->media_items[0].id == "m1");
    BOOST_TEST(res->media_items[1].id == "m2");
}

BOOST_AUTO_TEST_CASE(search_request_shape)
{
    stub_transport transport;
    transport.reply(200, "{}");
    photos::client client(transport, "A");

    BOOST_TEST(client.search(pets_request()).has_value());
    BOOST_TEST(transport.requests.size() == 1);
    const auto& req = transport.requests.front();
    BOOST_TEST(req.method == photoxx::net::http_method::post);
    BOOST_TEST(req.url == "https://photoslibrary.googleapis.com/v1/mediaItems:search");
    BOOST_TEST(*req.header("Authorization") == "Bearer A");
    BOOST_TEST(*req.header("Content-Type") == "application/json");

    const auto body = nlohmann::json::parse(req.body);
    BOOST_TEST(body == nlohmann::json::parse(
        R"({"pageSize":100,"filters":{"contentFilter":{"includedContentCategories":["PETS"]}}})"));
}

BOOST_AUTO_TEST_CASE(empty_answer_is_last_page)
{
    stub_transport transport;
    transport.reply(200, "{}");
    photos::client client(transport, "A");

    auto res = client.search(photos::search_request{});
    BOOST_TEST(res.has_value());
    BOOST_TEST(res->media_items.empty());
    BOOST_TEST(res->next_page_token.empty());
    BOOST_TEST(transport.requests.front().body == "{}");
}

BOOST_AUTO_TEST_CASE(caller_driven_pagination)
{
    stub_transport transport;
    transport.reply(200, R"({"mediaItems":[{"id":"m1"}],"nextPageToken":"p2"})");
    transport.reply(200, R"({"mediaItems":[{"id":"m2"}]})");
    photos::client client(transport, "A");

    auto req = pets_request();
    std::size_t items = 0;
    int pages = 0;
    while (true)
    {
        auto page = client.search(req);
        BOOST_REQUIRE(page.has_value());
        ++pages;
        items += page->media_items.size();
        auto next = photos::next_page(req, *page);
        if (!next)
            break;
        req = std::move(*next);
    }
    BOOST_TEST(pages == 2);
    BOOST_TEST(items == 2u);
    BOOST_TEST(nlohmann::json::parse(transport.requests[1].body).at("pageToken").get<std::string>() == "p2");
}

BOOST_AUTO_TEST_CASE(set_access_token_is_used_next)
{
    stub_transport transport;
    transport.reply(200, "{}");
    photos::client client(transport, "A");
    client.set_access_token("A2");

    BOOST_TEST(client.search(photos::search_request{}).has_value());
    BOOST_TEST(*transport.requests.front().header("authorization") == "Bearer A2");
}

BOOST_AUTO_TEST_CASE(custom_base_url)
{
    stub_transport transport;
    transport.reply(200, "{}");
    photos::client client(transport, "A", photos::client::options{"http://127.0.0.1:9000/v1/"});

    BOOST_TEST(client.search(photos::search_request{}).has_value());
    BOOST_TEST(transport.requests.front().url == "http://127.0.0.1:9000/v1/mediaItems:search");
}

BOOST_AUTO_TEST_CASE(error_status_before_decoding)
{
    stub_transport transport;
    transport.reply(401, R"({"error":{"code":401,"status":"UNAUTHENTICATED"}})");
    photos::client client(transport, "expired");

    auto res = client.search(pets_request());
    BOOST_TEST(!res.has_value());
    BOOST_TEST(res.error().code == errc::http_status_error);
    BOOST_TEST(res.error().detail.find("status=401") != std::string::npos);
}

BOOST_AUTO_TEST_CASE(malformed_answer)
{
    stub_transport transport;
    transport.reply(200, "[1,2,3]");
    transport.reply(200, R"({"mediaItems":"nope"})");
    photos::client client(transport, "A");

    auto not_object = client.search(photos::search_request{});
    BOOST_TEST(!not_object.has_value());
    BOOST_TEST(not_object.error().code == errc::protocol_malformed_body);

    auto wrong_type = client.search(photos::search_request{});
    BOOST_TEST(!wrong_type.has_value());
    BOOST_TEST(wrong_type.error().code == errc::protocol_malformed_body);
}

BOOST_AUTO_TEST_CASE(unencodable_request)
{
    stub_transport transport;
    photos::client client(transport, "A");

    photos::search_request req;
    req.filters.emplace().media_type_filter.emplace().media_types.push_back(photos::media_type::unknown);
    auto res = client.search(req);
    BOOST_TEST(!res.has_value());
    BOOST_TEST(res.error().code == errc::encode_failed);
    BOOST_TEST(res.error().message.find("media type") != std::string::npos);
    BOOST_TEST(photoxx::is_encoding_error(res.error().code));
    BOOST_TEST(transport.requests.empty());
}

BOOST_AUTO_TEST_CASE(token_with_line_break_is_rejected)
{
    stub_transport transport;
    photos::client client(transport, "A\r\nX-Evil: 1");

    auto res = client.search(photos::search_request{});
    BOOST_TEST(!res.has_value());
    BOOST_TEST(res.error().code == errc::invalid_argument);
    BOOST_TEST(transport.requests.empty());
}

BOOST_AUTO_TEST_CASE(cancelled_before_send)
{
    stub_transport transport;
    transport.reply(200, "{}");
    photos::client client(transport, "A");

    std::stop_source source;
    source.request_stop();
    auto res = client.search(pets_request(), photoxx::net::call_context(source.get_token()));
    BOOST_TEST(!res.has_value());
    BOOST_TEST(res.error().code == errc::net_cancelled);
    BOOST_TEST(transport.requests.empty());
}

BOOST_AUTO_TEST_CASE(expired_deadline_before_send)
{
    stub_transport transport;
    transport.reply(200, "{}");
    photos::client client(transport, "A");

    const photoxx::net::call_context ctx({}, std::chrono::steady_clock::now() - std::chrono::seconds{1});
    auto res = client.search(pets_request(), ctx);
    BOOST_TEST(!res.has_value());
    BOOST_TEST(res.error().code == errc::net_timeout);
    BOOST_TEST(transport.requests.empty());
}

BOOST_AUTO_TEST_CASE(transport_failure_propagates)
{
    stub_transport transport;
    transport.reply_error(errc::net_connection_refused, "connection refused");
    photos::client client(transport, "A");

    auto res = client.search(pets_request());
    BOOST_TEST(!res.has_value());
    BOOST_TEST(res.error().code == errc::net_connection_refused);
}

BOOST_AUTO_TEST_CASE(generic_request_helper)
{
    stub_transport transport;
    transport.reply(200, R"({"id":"album-1"})");
    photos::client client(transport, "A");

    auto res = client.request<nlohmann::json>("albums", nlohmann::json{{"album", {{"title", "Pets"}}}});
    BOOST_TEST(res.has_value());
    BOOST_TEST(res->at("id").get<std::string>() == "album-1");
    BOOST_TEST(transport.requests.front().url == "https://photoslibrary.googleapis.com/v1/albums");
    BOOST_TEST(transport.requests.front().body == R"({"album":{"title":"Pets"}})");
}
