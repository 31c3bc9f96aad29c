/*

token_authority.hpp
-------------------

OAuth2 authorization-code flow for installed (desktop) applications:
consent URL, code exchange and access token refresh.

*/

#pragma once

#include <initializer_list>
#include <string>
#include <string_view>
#include <utility>

#include <nlohmann/json.hpp>

#include <photoxx/detail/error_detail.hpp>
#include <photoxx/detail/log.hpp>
#include <photoxx/detail/result.hpp>
#include <photoxx/net/call_context.hpp>
#include <photoxx/net/http_transport.hpp>
#include <photoxx/net/query.hpp>
#include <photoxx/oauth2/token.hpp>

namespace photoxx::oauth2
{

inline constexpr std::string_view google_auth_url = "https://accounts.google.com/o/oauth2/v2/auth";
inline constexpr std::string_view google_token_url = "https://www.googleapis.com/oauth2/v4/token";

/// Out-of-band redirect: the provider shows the code to the user instead of redirecting.
inline constexpr std::string_view redirect_uri_oob = "urn:ietf:wg:oauth:2.0:oob";
inline constexpr std::string_view response_type_code = "code";
inline constexpr std::string_view access_type_offline = "offline";
inline constexpr std::string_view grant_type_authorization_code = "authorization_code";
inline constexpr std::string_view grant_type_refresh_token = "refresh_token";

/// Space separated scope list as expected by the `scope` parameter.
[[nodiscard]] inline std::string join_scopes(std::initializer_list<std::string_view> scopes)
{
    std::string joined;
    for (auto scope : scopes)
    {
        if (scope.empty())
            continue;
        if (!joined.empty())
            joined += ' ';
        joined += scope;
    }
    return joined;
}

/**
Owns the client credentials and the token state of one authorization.

Not thread-safe: one logical flow at a time. The transport is borrowed and must
outlive the authority.
**/
class token_authority
{
public:
    struct endpoints
    {
        std::string auth_url{google_auth_url};
        std::string token_url{google_token_url};
    };

    token_authority(client_credentials credentials, net::http_transport& transport)
        : token_authority(std::move(credentials), transport, endpoints{})
    {
    }

    token_authority(client_credentials credentials, net::http_transport& transport, endpoints urls)
        : credentials_(std::move(credentials)), transport_(&transport), endpoints_(std::move(urls))
    {
    }

    void set_scope(std::string scope) { state_.scope = std::move(scope); }

    void set_scopes(std::initializer_list<std::string_view> scopes) { state_.scope = join_scopes(scopes); }

    /// Use an access token obtained elsewhere, e.g. from a previous run.
    void set_access_token(std::string token) { state_.access_token = std::move(token); }

    /// Swap the transport used by subsequent calls.
    void set_transport(net::http_transport& transport) noexcept { transport_ = &transport; }

    [[nodiscard]] const std::string& access_token() const noexcept { return state_.access_token; }
    [[nodiscard]] const std::string& refresh_token() const noexcept { return state_.refresh_token; }
    [[nodiscard]] std::int64_t expires_in() const noexcept { return state_.expires_in; }
    [[nodiscard]] const std::string& scope() const noexcept { return state_.scope; }
    [[nodiscard]] const token_state& state() const noexcept { return state_; }
    [[nodiscard]] const client_credentials& credentials() const noexcept { return credentials_; }

    [[nodiscard]] bool has_refresh_token() const noexcept { return !state_.refresh_token.empty(); }

    /**
    True when the last code exchange produced no refresh token. The provider only issues
    one on the first consent of a user, so the whole authorization has to be redone.
    **/
    [[nodiscard]] bool needs_reauthorization() const noexcept { return state_.refresh_token.empty(); }

    /**
    URL the user opens in a browser to grant access. Pure function of the client id and scope.
    **/
    [[nodiscard]] std::string build_authorization_url() const
    {
        net::query_params params{
            {"client_id", credentials_.client_id},
            {"redirect_uri", std::string(redirect_uri_oob)},
            {"scope", state_.scope},
            {"access_type", std::string(access_type_offline)},
            {"response_type", std::string(response_type_code)}};
        return params.append_to(endpoints_.auth_url);
    }

    /**
    Trade the code the user pasted for tokens.

    On success access token, lifetime and refresh token are all overwritten, even with
    empty values; check needs_reauthorization() afterwards.
    **/
    result<void> exchange_code(std::string_view code, const net::call_context& ctx = {})
    {
        net::query_params form{
            {"code", std::string(code)},
            {"client_id", credentials_.client_id},
            {"client_secret", credentials_.client_secret},
            {"redirect_uri", std::string(redirect_uri_oob)},
            {"grant_type", std::string(grant_type_authorization_code)},
            {"access_type", std::string(access_type_offline)}};

        PHOTOXX_DEBUG("oauth2: exchanging authorization code");
        auto response = post_form(form, ctx);
        if (!response)
            return fail<void>(std::move(response).error());

        state_.access_token = std::move(response->access_token);
        state_.expires_in = response->expires_in;
        state_.refresh_token = std::move(response->refresh_token);

        if (state_.refresh_token.empty())
            PHOTOXX_WARN("oauth2: code exchange returned no refresh token, authorization must be repeated");
        else
            PHOTOXX_INFO("oauth2: authorization code exchanged");
        return ok();
    }

    /**
    Mint a new access token from `refresh_token`.

    Empty or missing fields in the answer never overwrite stored values: the provider
    does not always rotate the refresh token, and the previous one stays valid. Nothing
    is changed when the call fails.
    **/
    result<void> refresh_access_token(std::string_view refresh_token, const net::call_context& ctx = {})
    {
        net::query_params form{
            {"client_id", credentials_.client_id},
            {"client_secret", credentials_.client_secret},
            {"grant_type", std::string(grant_type_refresh_token)},
            {"refresh_token", std::string(refresh_token)}};

        PHOTOXX_DEBUG("oauth2: refreshing access token");
        auto response = post_form(form, ctx);
        if (!response)
            return fail<void>(std::move(response).error());

        state_.refresh_token = std::string(refresh_token);
        if (!response->access_token.empty())
        {
            state_.access_token = std::move(response->access_token);
            state_.expires_in = response->expires_in;
        }
        if (!response->refresh_token.empty())
            state_.refresh_token = std::move(response->refresh_token);

        PHOTOXX_INFO("oauth2: access token refreshed");
        return ok();
    }

private:
    result<token_response> post_form(const net::query_params& form, const net::call_context& ctx)
    {
        net::http_request request;
        request.method = net::http_method::post;
        request.url = endpoints_.token_url;
        request.set_header("Content-Type", std::string(net::content_type_form));
        request.set_header("Accept", std::string(net::content_type_json));
        request.body = form.encode();

        auto sent = transport_->send(request, ctx);
        if (!sent)
            return fail<token_response>(std::move(sent).error());
        return decode_token_response(*sent);
    }

    static result<token_response> decode_token_response(const net::http_response& response)
    {
        if (!response.is_success())
        {
            detail::error_detail detail;
            detail.add_int("status", response.status);
            detail.add_body("body", response.body);
            PHOTOXX_ERROR("oauth2: token endpoint answered HTTP " + std::to_string(response.status));
            return fail<token_response>(errc::http_status_error,
                "token endpoint returned HTTP " + std::to_string(response.status), detail.str());
        }

        const auto json = nlohmann::json::parse(response.body, nullptr, false);
        if (json.is_discarded() || !json.is_object())
        {
            detail::error_detail detail;
            detail.add_body("body", response.body);
            return fail<token_response>(errc::protocol_malformed_body,
                "token endpoint returned a body that is not a JSON object", detail.str());
        }

        try
        {
            return ok(json.get<token_response>());
        }
        catch (const nlohmann::json::exception& exc)
        {
            detail::error_detail detail;
            detail.add("json", exc.what());
            detail.add_body("body", response.body);
            return fail<token_response>(errc::protocol_malformed_body,
                "token endpoint returned fields of unexpected type", detail.str());
        }
    }

    client_credentials credentials_;
    net::http_transport* transport_;
    endpoints endpoints_;
    token_state state_;
};

} // namespace photoxx::oauth2
