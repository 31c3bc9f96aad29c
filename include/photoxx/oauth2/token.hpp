/*

token.hpp
---------

OAuth2 credential and token types for photoxx.

*/

#pragma once

#include <cstdint>
#include <string>

#include <nlohmann/json.hpp>

#include <photoxx/detail/json_read.hpp>

namespace photoxx::oauth2
{

struct client_credentials
{
    std::string client_id;
    std::string client_secret;
};

/**
Tokens held by a token_authority.

`expires_in` is the lifetime in seconds reported with the access token, relative to
the moment it was issued.
**/
struct token_state
{
    std::string access_token;
    std::int64_t expires_in{0};
    std::string refresh_token;
    std::string scope;
};

/// Answer of the token endpoint for both grants; absent or null fields stay empty.
struct token_response
{
    std::string access_token;
    std::string id_token;
    std::int64_t expires_in{0};
    std::string token_type;
    std::string refresh_token;
};

inline void from_json(const nlohmann::json& j, token_response& t)
{
    t.access_token = detail::read_string(j, "access_token");
    t.id_token = detail::read_string(j, "id_token");
    t.expires_in = detail::read_integer(j, "expires_in");
    t.token_type = detail::read_string(j, "token_type");
    t.refresh_token = detail::read_string(j, "refresh_token");
}

} // namespace photoxx::oauth2
