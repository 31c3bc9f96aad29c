/*

client.hpp
----------

Authenticated JSON client for the Google Photos Library API.

*/

#pragma once

#include <string>
#include <string_view>
#include <utility>

#include <nlohmann/json.hpp>

#include <photoxx/detail/ascii.hpp>
#include <photoxx/detail/error_detail.hpp>
#include <photoxx/detail/log.hpp>
#include <photoxx/detail/result.hpp>
#include <photoxx/net/call_context.hpp>
#include <photoxx/net/http_transport.hpp>
#include <photoxx/net/query.hpp>
#include <photoxx/photos/json.hpp>
#include <photoxx/photos/types.hpp>

namespace photoxx::photos
{

inline constexpr std::string_view library_base_url = "https://photoslibrary.googleapis.com/v1/";
inline constexpr std::string_view endpoint_media_items_search = "mediaItems:search";

/**
Issues bearer-authenticated POST requests against the Photos Library API.

The token is not renewed here; when it expires, refresh it with a token_authority and
hand the new one over with set_access_token(). The transport is borrowed.
**/
class client
{
public:
    struct options
    {
        /// Endpoints are appended to this, so it ends with a slash.
        std::string base_url{library_base_url};
    };

    client(net::http_transport& transport, std::string access_token)
        : client(transport, std::move(access_token), options{})
    {
    }

    client(net::http_transport& transport, std::string access_token, options opts)
        : transport_(&transport), access_token_(std::move(access_token)), options_(std::move(opts))
    {
    }

    void set_access_token(std::string token) { access_token_ = std::move(token); }

    [[nodiscard]] const std::string& access_token() const noexcept { return access_token_; }
    [[nodiscard]] const options& config() const noexcept { return options_; }

    /**
    One page of `mediaItems:search`. Pass the returned `next_page_token` back through
    next_page() to walk the remaining pages.
    **/
    result<search_response> search(const search_request& req, const net::call_context& ctx = {})
    {
        auto page = request<search_response>(endpoint_media_items_search, req, ctx);
        if (page)
        {
            PHOTOXX_DEBUG("photos: search returned " + std::to_string(page->media_items.size()) + " items" +
                (page->has_next_page() ? ", more pages available" : ""));
        }
        return page;
    }

    /**
    POST `body` as JSON to `endpoint` (relative to the base URL) and decode the answer
    into `Response`.

    Errors: `encode_failed` when the body cannot be serialized, `invalid_argument` for
    an access token unusable in a header, any transport error as is,
    `http_status_error` for a non-2xx answer (before decoding) and
    `protocol_malformed_body` when the answer does not decode.
    **/
    template<typename Response, typename Request>
    result<Response> request(std::string_view endpoint, const Request& body, const net::call_context& ctx = {})
    {
        if (auto ready = net::check_context(ctx); !ready)
            return fail<Response>(std::move(ready).error());

        if constexpr (requires { check_encodable(body); })
        {
            if (auto encodable = check_encodable(body); !encodable)
                return fail<Response>(std::move(encodable).error());
        }

        std::string payload;
        try
        {
            const nlohmann::json json = body;
            payload = json.dump();
        }
        catch (const nlohmann::json::exception& exc)
        {
            return fail<Response>(errc::encode_failed, "request body cannot be encoded as JSON", exc.what());
        }

        std::string authorization = "Bearer " + access_token_;
        if (!photoxx::detail::is_valid_header_value(authorization))
            return fail<Response>(errc::invalid_argument, "access token contains characters not allowed in a header");

        net::http_request req;
        req.method = net::http_method::post;
        req.url = options_.base_url + std::string(endpoint);
        req.set_header("Authorization", std::move(authorization));
        req.set_header("Content-Type", std::string(net::content_type_json));
        req.set_header("Accept", std::string(net::content_type_json));
        req.body = std::move(payload);

        auto sent = transport_->send(req, ctx);
        if (!sent)
            return fail<Response>(std::move(sent).error());
        return decode<Response>(endpoint, *sent);
    }

private:
    template<typename Response>
    static result<Response> decode(std::string_view endpoint, const net::http_response& response)
    {
        if (!response.is_success())
        {
            photoxx::detail::error_detail detail;
            detail.add("endpoint", endpoint);
            detail.add_int("status", response.status);
            detail.add_body("body", response.body);
            PHOTOXX_ERROR("photos: " + std::string(endpoint) + " answered HTTP " + std::to_string(response.status));
            return fail<Response>(errc::http_status_error,
                std::string(endpoint) + " returned HTTP " + std::to_string(response.status), detail.str());
        }

        const auto json = nlohmann::json::parse(response.body, nullptr, false);
        if (json.is_discarded() || !json.is_object())
        {
            photoxx::detail::error_detail detail;
            detail.add("endpoint", endpoint);
            detail.add_body("body", response.body);
            return fail<Response>(errc::protocol_malformed_body,
                std::string(endpoint) + " returned a body that is not a JSON object", detail.str());
        }

        try
        {
            return ok(json.get<Response>());
        }
        catch (const nlohmann::json::exception& exc)
        {
            photoxx::detail::error_detail detail;
            detail.add("endpoint", endpoint);
            detail.add("json", exc.what());
            return fail<Response>(errc::protocol_malformed_body,
                std::string(endpoint) + " returned members of unexpected type", detail.str());
        }
    }

    net::http_transport* transport_;
    std::string access_token_;
    options options_;
};

} // namespace photoxx::photos
