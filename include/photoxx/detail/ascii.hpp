#pragma once

#include <cstddef>
#include <string_view>

namespace photoxx
{
namespace detail
{
    [[nodiscard]] constexpr char ascii_tolower(char c) noexcept
    {
        return (c >= 'A' && c <= 'Z') ? static_cast<char>(c + ('a' - 'A')) : c;
    }

    [[nodiscard]] inline bool iequals_ascii(std::string_view a, std::string_view b) noexcept
    {
        if (a.size() != b.size())
            return false;

        for (std::size_t i = 0; i < a.size(); ++i)
        {
            if (ascii_tolower(a[i]) != ascii_tolower(b[i]))
                return false;
        }
        return true;
    }

    [[nodiscard]] inline bool starts_with_ci(std::string_view text, std::string_view prefix) noexcept
    {
        if (text.size() < prefix.size())
            return false;
        return iequals_ascii(text.substr(0, prefix.size()), prefix);
    }

    // RFC 9110: field-name = token; tchar = "!" / "#" / "$" / "%" / "&" / "'" / "*" / "+" / "-" / "." / "^" / "_" / "`" / "|" / "~" / DIGIT / ALPHA
    [[nodiscard]] inline bool is_valid_header_name(std::string_view name) noexcept
    {
        constexpr std::string_view tchar_punct = "!#$%&'*+-.^_`|~";
        if (name.empty())
            return false;

        for (char ch : name)
        {
            const bool alnum = (ch >= 'A' && ch <= 'Z') || (ch >= 'a' && ch <= 'z') || (ch >= '0' && ch <= '9');
            if (!alnum && tchar_punct.find(ch) == std::string_view::npos)
                return false;
        }
        return true;
    }

    // Conservative validation: reject CR/LF and other control characters (except TAB).
    [[nodiscard]] inline bool is_valid_header_value(std::string_view value) noexcept
    {
        for (char ch : value)
        {
            unsigned char c = static_cast<unsigned char>(ch);

            if (ch == '\r' || ch == '\n')
                return false;
            if (c < 32 && ch != '\t')
                return false;
            if (c == 127)
                return false;
        }
        return true;
    }
}
}
