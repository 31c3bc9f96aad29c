/*

error_detail.hpp
----------------

Header-only helper to build structured error_detail strings without throwing
(except potential allocation failures).

Each entry is formatted as key=value\n to ease parsing and redaction.

*/

#pragma once

#include <charconv>
#include <cstddef>
#include <cstdint>
#include <iterator>
#include <string>
#include <string_view>
#include <system_error>

#include <photoxx/detail/redact.hpp>

namespace photoxx::detail
{

/// Longest response body excerpt kept in an error detail.
inline constexpr std::size_t max_detail_body = 512;

class error_detail
{
public:
    error_detail() = default;

    error_detail& add(std::string_view key, std::string_view value)
    {
        append_key(key);
        out_.append(value.data(), value.size());
        out_.push_back('\n');
        return *this;
    }

    error_detail& add_int(std::string_view key, std::uint64_t v)
    {
        append_key(key);
        append_int(v);
        out_.push_back('\n');
        return *this;
    }

    error_detail& add_ec(std::string_view key, std::error_code ec)
    {
        append_key(key);
        char buffer[32]{};
        const auto res = std::to_chars(std::begin(buffer), std::end(buffer), ec.value());
        if (res.ec == std::errc{})
            out_.append(buffer, static_cast<std::size_t>(res.ptr - buffer));
        else
            out_.append("0");

        const std::string msg = ec.message();
        if (!msg.empty())
        {
            out_.push_back(' ');
            out_.append(msg);
        }
        out_.push_back('\n');
        return *this;
    }

    /// Body excerpt with token fields masked; newlines are flattened.
    error_detail& add_body(std::string_view key, std::string_view body)
    {
        append_key(key);
        const bool truncated = body.size() > max_detail_body;
        std::string masked = redact_json_tokens(body.substr(0, max_detail_body));
        for (char& ch : masked)
        {
            if (ch == '\r' || ch == '\n')
                ch = ' ';
        }
        out_.append(masked);
        if (truncated)
            out_.append("...");
        out_.push_back('\n');
        return *this;
    }

    [[nodiscard]] std::string str() const
    {
        return out_;
    }

private:
    std::string out_;

    void append_key(std::string_view key)
    {
        out_.append(key.data(), key.size());
        out_.push_back('=');
    }

    void append_int(std::uint64_t v)
    {
        char buffer[32]{};
        const auto res = std::to_chars(std::begin(buffer), std::end(buffer), v);
        if (res.ec == std::errc{})
            out_.append(buffer, static_cast<std::size_t>(res.ptr - buffer));
        else
            out_.append("0");
    }
};

} // namespace photoxx::detail
