/*

redact.hpp
----------

Masks OAuth2 secrets before they reach a log sink or an error detail:
bearer headers, form-encoded credentials and token fields of JSON bodies.

*/

#pragma once

#include <array>
#include <cstddef>
#include <string>
#include <string_view>

#include <photoxx/detail/ascii.hpp>

namespace photoxx::detail
{

inline constexpr std::string_view redacted_marker = "<redacted>";

inline constexpr std::array<std::string_view, 5> sensitive_keys{
    "client_secret", "code", "refresh_token", "access_token", "id_token"};

[[nodiscard]] inline bool is_sensitive_key(std::string_view key) noexcept
{
    for (auto candidate : sensitive_keys)
    {
        if (iequals_ascii(key, candidate))
            return true;
    }
    return false;
}

/**
Redact the credential of an HTTP header line.

`Authorization: Bearer abc` becomes `Authorization: Bearer <redacted>`, any other
authorization scheme loses everything after the scheme name. Other lines are
returned unchanged.
**/
[[nodiscard]] inline std::string redact_line(std::string_view line)
{
    constexpr std::string_view header = "Authorization:";
    if (!starts_with_ci(line, header))
        return std::string(line);

    std::string_view value = line.substr(header.size());
    std::size_t lead = 0;
    while (lead < value.size() && value[lead] == ' ')
        ++lead;
    value.remove_prefix(lead);

    std::string result(line.substr(0, header.size() + lead));
    const auto space = value.find(' ');
    if (space == std::string_view::npos)
    {
        result.append(redacted_marker);
        return result;
    }
    result.append(value.substr(0, space + 1));
    result.append(redacted_marker);
    return result;
}

/**
Redact the values of sensitive keys in an `application/x-www-form-urlencoded` body.
**/
[[nodiscard]] inline std::string redact_form(std::string_view body)
{
    std::string result;
    result.reserve(body.size());
    while (true)
    {
        const auto amp = body.find('&');
        const std::string_view pair = body.substr(0, amp);
        const auto eq = pair.find('=');
        if (eq != std::string_view::npos && is_sensitive_key(pair.substr(0, eq)))
        {
            result.append(pair.substr(0, eq + 1));
            result.append(redacted_marker);
        }
        else
            result.append(pair);

        if (amp == std::string_view::npos)
            break;
        result.push_back('&');
        body.remove_prefix(amp + 1);
    }
    return result;
}

/**
Redact string values of sensitive keys in a JSON text without parsing it, so that
malformed bodies can be logged safely as well.
**/
[[nodiscard]] inline std::string redact_json_tokens(std::string_view json)
{
    std::string result;
    result.reserve(json.size());
    std::size_t i = 0;
    while (i < json.size())
    {
        if (json[i] != '"')
        {
            result.push_back(json[i++]);
            continue;
        }

        // Copy a complete string literal, remembering its contents.
        const std::size_t start = i++;
        while (i < json.size() && json[i] != '"')
            i += (json[i] == '\\') ? 2 : 1;
        i = (i < json.size()) ? i + 1 : json.size();
        const std::string_view literal = json.substr(start, i - start);
        result.append(literal);

        if (literal.size() < 2 || !is_sensitive_key(literal.substr(1, literal.size() - 2)))
            continue;

        std::size_t j = i;
        while (j < json.size() && (json[j] == ' ' || json[j] == '\t' || json[j] == '\n' || json[j] == '\r'))
            ++j;
        if (j >= json.size() || json[j] != ':')
            continue;
        ++j;
        while (j < json.size() && (json[j] == ' ' || json[j] == '\t' || json[j] == '\n' || json[j] == '\r'))
            ++j;
        if (j >= json.size() || json[j] != '"')
            continue;

        std::size_t end = j + 1;
        while (end < json.size() && json[end] != '"')
            end += (json[end] == '\\') ? 2 : 1;
        if (end >= json.size())
            continue;

        result.append(json.substr(i, j + 1 - i));
        result.append(redacted_marker);
        result.push_back('"');
        i = end + 1;
    }
    return result;
}

} // namespace photoxx::detail
