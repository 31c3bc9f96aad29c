/*

percent.hpp
-----------

Copyright (C) 2025, Sylvain Guinebert (github.com/sguinebert).

Distributed under the FreeBSD license, see the accompanying file LICENSE or
copy at http://www.freebsd.org/copyright/freebsd-license.html.

*/


#pragma once

#include <string>
#include <string_view>
#include <photoxx/detail/result.hpp>


namespace photoxx
{


/**
Percent encoding and decoding of URI components as described in RFC 3986 section 2.

Unreserved characters (`ALPHA / DIGIT / "-" / "." / "_" / "~"`) are kept, every other
octet is written as `%XX` with uppercase hex digits. The same rule serves query strings
and `application/x-www-form-urlencoded` bodies, so a space always becomes `%20`.
**/
class percent
{
public:

    percent() = default;

    percent(const percent&) = delete;

    percent(percent&&) = delete;

    /**
    Default destructor.
    **/
    ~percent() = default;

    void operator=(const percent&) = delete;

    void operator=(percent&&) = delete;

    /**
    Encoding a string.

    @param txt String to encode.
    @return    Encoded string.
    **/
    std::string encode(std::string_view txt) const
    {
        std::string enc_text;
        enc_text.reserve(txt.size() * 3);
        for (char ch : txt)
        {
            if (is_unreserved(ch))
            {
                enc_text += ch;
                continue;
            }
            const auto octet = static_cast<unsigned char>(ch);
            enc_text += PERCENT_HEX_FLAG;
            enc_text += HEX_DIGITS[octet >> 4];
            enc_text += HEX_DIGITS[octet & 0x0F];
        }
        return enc_text;
    }

    /**
    Decoding a percent encoded string.

    @param txt String to decode.
    @return    Decoded string, or `invalid_argument` on a truncated or non-hex escape.
    **/
    result<std::string> decode(std::string_view txt) const
    {
        std::string dec_text;
        dec_text.reserve(txt.size());
        for (std::string_view::size_type i = 0; i < txt.size(); ++i)
        {
            if (txt[i] != PERCENT_HEX_FLAG)
            {
                dec_text += txt[i];
                continue;
            }
            if (i + 2 >= txt.size())
                return fail<std::string>(errc::invalid_argument, "invalid percent encoding", "truncated escape");
            const int high = hex_digit_to_int(txt[i + 1]);
            const int low = hex_digit_to_int(txt[i + 2]);
            if (high < 0 || low < 0)
                return fail<std::string>(errc::invalid_argument, "invalid percent encoding", "bad hex digit");
            dec_text += static_cast<char>((high << 4) + low);
            i += 2;
        }
        return ok(std::move(dec_text));
    }

    static constexpr bool is_unreserved(char ch) noexcept
    {
        return (ch >= 'A' && ch <= 'Z') || (ch >= 'a' && ch <= 'z') || (ch >= '0' && ch <= '9')
            || ch == '-' || ch == '.' || ch == '_' || ch == '~';
    }

    /**
    Calculating value of the given hex digit, -1 when it is not one.
    **/
    static constexpr int hex_digit_to_int(char digit) noexcept
    {
        if (digit >= '0' && digit <= '9')
            return digit - '0';
        if (digit >= 'A' && digit <= 'F')
            return digit - 'A' + 10;
        if (digit >= 'a' && digit <= 'f')
            return digit - 'a' + 10;
        return -1;
    }

    static constexpr char PERCENT_HEX_FLAG = '%';

private:

    static constexpr std::string_view HEX_DIGITS = "0123456789ABCDEF";
};


} // namespace photoxx
