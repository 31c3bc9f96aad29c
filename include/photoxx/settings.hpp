/*

settings.hpp
------------

Runtime settings of photoxx programs, read from the process environment.

*/

#pragma once

#include <cstdlib>
#include <functional>
#include <optional>
#include <string>
#include <utility>

#include <boost/algorithm/string/trim.hpp>

#include <photoxx/detail/log.hpp>
#include <photoxx/detail/result.hpp>
#include <photoxx/oauth2/token.hpp>

namespace photoxx
{

inline constexpr const char* env_client_id = "GOOGLE_CLIENT_ID";
inline constexpr const char* env_client_secret = "GOOGLE_CLIENT_SECRET";
inline constexpr const char* env_refresh_token = "GOOGLE_REFRESH_TOKEN";
inline constexpr const char* env_log_level = "PHOTOXX_LOG_LEVEL";

struct settings
{
    oauth2::client_credentials credentials;

    /// Refresh token of an earlier authorization; empty when consent is still needed.
    std::string refresh_token;

    std::optional<log::level> log_level;

    /// Set the logger level when one was configured.
    void apply_logging() const
    {
        if (log_level)
            log::logger::instance().set_level(*log_level);
    }
};

/// Returns the raw value of a variable, empty optional when unset.
using env_lookup = std::function<std::optional<std::string>(const char*)>;

/**
Build settings from `lookup`.

Values are trimmed. A missing or blank client id or secret gives `config_missing`,
an unknown log level name gives `invalid_argument`.
**/
inline result<settings> load_settings(const env_lookup& lookup)
{
    auto read = [&lookup](const char* name) -> std::string
    {
        auto value = lookup(name);
        if (!value)
            return {};
        return boost::algorithm::trim_copy(*value);
    };

    settings out;
    out.credentials.client_id = read(env_client_id);
    if (out.credentials.client_id.empty())
        return fail<settings>(errc::config_missing, std::string(env_client_id) + " is not set");

    out.credentials.client_secret = read(env_client_secret);
    if (out.credentials.client_secret.empty())
        return fail<settings>(errc::config_missing, std::string(env_client_secret) + " is not set");

    out.refresh_token = read(env_refresh_token);

    const std::string level_name = read(env_log_level);
    if (!level_name.empty())
    {
        out.log_level = log::level_from_string(level_name);
        if (!out.log_level)
            return fail<settings>(errc::invalid_argument,
                std::string(env_log_level) + " has an unknown level", "value=" + level_name);
    }
    return ok(std::move(out));
}

inline result<settings> load_settings_from_env()
{
    return load_settings([](const char* name) -> std::optional<std::string>
    {
        const char* value = std::getenv(name);
        if (value == nullptr)
            return std::nullopt;
        return std::string(value);
    });
}

} // namespace photoxx
