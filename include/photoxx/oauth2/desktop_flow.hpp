/*

desktop_flow.hpp
----------------

Interactive driver for the authorization-code flow: show the consent URL, read the
pasted code, exchange it, and start over while the provider withholds the refresh token.

*/

#pragma once

#include <optional>
#include <string>

#include <boost/algorithm/string/trim.hpp>

#include <photoxx/detail/log.hpp>
#include <photoxx/detail/result.hpp>
#include <photoxx/net/call_context.hpp>
#include <photoxx/oauth2/token_authority.hpp>

namespace photoxx::oauth2
{

/// The human side of the flow.
class code_prompt
{
public:
    virtual ~code_prompt() = default;

    virtual void show_authorization_url(const std::string& url) = 0;

    /// Empty optional when input is closed.
    virtual std::optional<std::string> read_authorization_code() = 0;

    /// Called before a new attempt when the previous exchange produced no refresh token.
    virtual void report_retry(int /*attempt*/) {}
};

/**
Run the consent loop until the authority holds a refresh token.

Errors of exchange_code are returned at once. After `max_attempts` exchanges without a
refresh token the result is `oauth_no_refresh_token`; closed input gives `cancelled`.
**/
inline result<void> authorize_interactively(token_authority& authority, code_prompt& prompt,
    const net::call_context& ctx = {}, int max_attempts = 3)
{
    for (int attempt = 1; attempt <= max_attempts; ++attempt)
    {
        if (attempt > 1)
            prompt.report_retry(attempt);

        prompt.show_authorization_url(authority.build_authorization_url());
        auto code = prompt.read_authorization_code();
        if (!code)
            return fail<void>(errc::cancelled, "no authorization code entered");

        const std::string trimmed = boost::algorithm::trim_copy(*code);
        if (trimmed.empty())
        {
            PHOTOXX_WARN("oauth2: empty authorization code");
            continue;
        }

        auto exchanged = authority.exchange_code(trimmed, ctx);
        if (!exchanged)
            return exchanged;
        if (authority.has_refresh_token())
            return ok();
    }
    return fail<void>(errc::oauth_no_refresh_token,
        "provider issued no refresh token after " + std::to_string(max_attempts) + " attempts");
}

} // namespace photoxx::oauth2
