/*

query.hpp
---------

Ordered key/value builder for URL query strings and form-encoded bodies.

*/

#pragma once

#include <cstddef>
#include <initializer_list>
#include <optional>
#include <string>
#include <string_view>
#include <utility>
#include <vector>

#include <photoxx/codec/percent.hpp>
#include <photoxx/detail/result.hpp>

namespace photoxx::net
{

inline constexpr std::string_view content_type_form = "application/x-www-form-urlencoded";
inline constexpr std::string_view content_type_json = "application/json";

/**
Parameters keep their insertion order; duplicate keys are allowed and emitted as given.
Every key and value is percent-encoded on serialization.
**/
class query_params
{
public:
    using value_type = std::pair<std::string, std::string>;
    using const_iterator = std::vector<value_type>::const_iterator;

    query_params() = default;

    query_params(std::initializer_list<value_type> params)
        : params_(params)
    {
    }

    query_params& add(std::string key, std::string value)
    {
        params_.emplace_back(std::move(key), std::move(value));
        return *this;
    }

    /// First value stored under `key`.
    [[nodiscard]] std::optional<std::string_view> find(std::string_view key) const noexcept
    {
        for (const auto& [k, v] : params_)
        {
            if (k == key)
                return std::string_view(v);
        }
        return std::nullopt;
    }

    [[nodiscard]] bool contains(std::string_view key) const noexcept
    {
        return find(key).has_value();
    }

    [[nodiscard]] std::size_t size() const noexcept { return params_.size(); }
    [[nodiscard]] bool empty() const noexcept { return params_.empty(); }
    [[nodiscard]] const_iterator begin() const noexcept { return params_.begin(); }
    [[nodiscard]] const_iterator end() const noexcept { return params_.end(); }

    /// `k1=v1&k2=v2`
    [[nodiscard]] std::string encode() const
    {
        const percent codec;
        std::string out;
        for (const auto& [key, value] : params_)
        {
            if (!out.empty())
                out += '&';
            out += codec.encode(key);
            out += '=';
            out += codec.encode(value);
        }
        return out;
    }

    /// `base?k1=v1&k2=v2`, or `base` alone when there are no parameters.
    [[nodiscard]] std::string append_to(std::string_view base) const
    {
        std::string out(base);
        if (params_.empty())
            return out;
        out += (base.find('?') == std::string_view::npos) ? '?' : '&';
        out += encode();
        return out;
    }

private:
    std::vector<value_type> params_;
};

/**
Parse a query string or form body. A `+` decodes to a space; empty segments are skipped.
**/
[[nodiscard]] inline result<query_params> parse_query(std::string_view text)
{
    const percent codec;
    query_params params;
    while (!text.empty())
    {
        const auto amp = text.find('&');
        const std::string_view pair = text.substr(0, amp);
        text = (amp == std::string_view::npos) ? std::string_view{} : text.substr(amp + 1);
        if (pair.empty())
            continue;

        const auto eq = pair.find('=');
        std::string key(pair.substr(0, eq));
        std::string value(eq == std::string_view::npos ? std::string_view{} : pair.substr(eq + 1));
        for (char& ch : key)
            if (ch == '+') ch = ' ';
        for (char& ch : value)
            if (ch == '+') ch = ' ';

        auto dec_key = codec.decode(key);
        if (!dec_key)
            return fail<query_params>(std::move(dec_key).error());
        auto dec_value = codec.decode(value);
        if (!dec_value)
            return fail<query_params>(std::move(dec_value).error());
        params.add(std::move(*dec_key), std::move(*dec_value));
    }
    return ok(std::move(params));
}

} // namespace photoxx::net
