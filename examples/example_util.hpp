#pragma once

#include <iostream>
#include <optional>
#include <string>
#include <photoxx/detail/result.hpp>
#include <photoxx/oauth2/desktop_flow.hpp>

inline void print_error(const photoxx::error_info& err)
{
    std::cout << "Error: " << photoxx::to_string(err.code) << " - " << err.message << "\n";
    std::cout << "Detail: " << err.detail << "\n";
    std::cout << "Sys: " << err.sys.message() << "\n";
    std::cout << "Where: " << err.where.file_name() << ":" << err.where.line()
              << " " << err.where.function_name() << "\n";
}

/// Consent prompt on the terminal: prints the URL and reads one line from stdin.
class console_prompt : public photoxx::oauth2::code_prompt
{
public:
    void show_authorization_url(const std::string& url) override
    {
        std::cout << "Go to the following link in your browser then type the authorization code:\n"
                  << url << "\n";
    }

    std::optional<std::string> read_authorization_code() override
    {
        std::cout << "> " << std::flush;
        std::string line;
        if (!std::getline(std::cin, line))
            return std::nullopt;
        return line;
    }

    void report_retry(int attempt) override
    {
        std::cout << "No refresh token was issued. Revoke the app access at "
                     "https://myaccount.google.com/permissions and authorize again (attempt "
                  << attempt << ").\n";
    }
};
