/*

url.hpp
-------

Splitting absolute http(s) URLs into the parts a connection needs.

*/

#pragma once

#include <optional>
#include <string>
#include <string_view>

#include <photoxx/detail/result.hpp>

namespace photoxx::net
{

struct url_parts
{
    std::string scheme;   // "http" or "https"
    std::string host;
    std::string port;     // defaulted from the scheme when absent
    std::string target;   // path and query, never empty

    [[nodiscard]] bool is_tls() const noexcept { return scheme == "https"; }

    /// Value for the `Host` header; the port is omitted when it is the scheme default.
    [[nodiscard]] std::string host_header() const
    {
        const std::string name = (host.find(':') != std::string::npos) ? "[" + host + "]" : host;
        if ((scheme == "https" && port == "443") || (scheme == "http" && port == "80"))
            return name;
        return name + ":" + port;
    }
};

[[nodiscard]] inline result<url_parts> parse_url(std::string_view url)
{
    url_parts parts;
    const auto scheme_end = url.find("://");
    if (scheme_end == std::string_view::npos)
        return fail<url_parts>(errc::http_invalid_url, "URL has no scheme", std::string(url));

    parts.scheme = std::string(url.substr(0, scheme_end));
    for (char& ch : parts.scheme)
    {
        if (ch >= 'A' && ch <= 'Z')
            ch = static_cast<char>(ch + ('a' - 'A'));
    }
    if (parts.scheme != "http" && parts.scheme != "https")
        return fail<url_parts>(errc::http_invalid_url, "unsupported URL scheme", parts.scheme);

    std::string_view rest = url.substr(scheme_end + 3);
    const auto path_start = rest.find_first_of("/?");
    std::string_view authority = rest.substr(0, path_start);
    parts.target = (path_start == std::string_view::npos) ? std::string("/") : std::string(rest.substr(path_start));
    if (parts.target.front() == '?')
        parts.target.insert(parts.target.begin(), '/');

    if (authority.find('@') != std::string_view::npos)
        return fail<url_parts>(errc::http_invalid_url, "user info in URL is not supported");

    std::string_view host = authority;
    std::optional<std::string_view> port;
    if (!authority.empty() && authority.front() == '[')
    {
        // IPv6 literal, stored without its brackets
        const auto close = authority.find(']');
        if (close == std::string_view::npos)
            return fail<url_parts>(errc::http_invalid_url, "unterminated IPv6 address in URL", std::string(url));
        host = authority.substr(1, close - 1);
        const std::string_view tail = authority.substr(close + 1);
        if (!tail.empty())
        {
            if (tail.front() != ':')
                return fail<url_parts>(errc::http_invalid_url, "invalid authority in URL", std::string(url));
            port = tail.substr(1);
        }
    }
    else if (const auto colon = authority.rfind(':'); colon != std::string_view::npos)
    {
        host = authority.substr(0, colon);
        port = authority.substr(colon + 1);
    }

    parts.host = std::string(host);
    if (port)
    {
        if (port->empty())
            return fail<url_parts>(errc::http_invalid_url, "empty port in URL", std::string(url));
        for (char ch : *port)
        {
            if (ch < '0' || ch > '9')
                return fail<url_parts>(errc::http_invalid_url, "invalid port in URL", std::string(url));
        }
        parts.port = std::string(*port);
    }
    else
        parts.port = parts.is_tls() ? "443" : "80";

    if (parts.host.empty())
        return fail<url_parts>(errc::http_invalid_url, "URL has no host", std::string(url));
    return ok(std::move(parts));
}

} // namespace photoxx::net
