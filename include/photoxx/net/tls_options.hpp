/*

tls_options.hpp
---------------

Copyright (C) 2025, Sylvain Guinebert (github.com/sguinebert).

Distributed under the FreeBSD license, see the accompanying file LICENSE or
copy at http://www.freebsd.org/copyright/freebsd-license.html.

*/

#pragma once

#include <optional>
#include <string>
#include <vector>
#include <openssl/err.h>
#include <openssl/ssl.h>
#include <photoxx/detail/asio_decl.hpp>
#include <photoxx/detail/result.hpp>

namespace photoxx::detail
{

inline std::string openssl_error_message()
{
    const unsigned long err = ERR_get_error();
    if (err == 0)
        return {};
    char buffer[256];
    ERR_error_string_n(err, buffer, sizeof(buffer));
    return std::string(buffer);
}

} // namespace photoxx::detail

namespace photoxx::net
{

enum class verify_mode
{
    none,
    peer
};

struct tls_options
{
    verify_mode verify = verify_mode::peer;
    bool verify_host = true;
    std::optional<int> min_tls_version = TLS1_2_VERSION;
    std::string cipher_list;
    bool use_default_verify_paths = true;
    std::vector<std::string> ca_files;
    std::vector<std::string> ca_paths;
};

/**
Configure the TLS trust store for a context.
**/
inline result<void> configure_trust_store(photoxx::asio::ssl::context& ctx, const tls_options& options)
{
    photoxx::asio::error_code ec;
    if (options.use_default_verify_paths)
    {
        ctx.set_default_verify_paths(ec);
        if (ec)
            return fail<void>(errc::tls_verify_failed, "TLS trust store configuration failed.", ec.message(), ec);
    }

    for (const auto& file : options.ca_files)
    {
        if (!file.empty())
        {
            ctx.load_verify_file(file, ec);
            if (ec)
                return fail<void>(errc::tls_verify_failed, "TLS trust store configuration failed.", ec.message(), ec);
        }
    }

    for (const auto& path : options.ca_paths)
    {
        if (!path.empty())
        {
            ctx.add_verify_path(path, ec);
            if (ec)
                return fail<void>(errc::tls_verify_failed, "TLS trust store configuration failed.", ec.message(), ec);
        }
    }
    return ok();
}

/**
Apply minimum protocol version and cipher policy to the SSL_CTX; an existing minimum
version is not overridden.
**/
inline result<void> apply_tls_hardening(photoxx::asio::ssl::context& context, const tls_options& opt)
{
    if (opt.min_tls_version.has_value())
    {
        const int current = SSL_CTX_get_min_proto_version(context.native_handle());
        if (current == 0)
        {
            if (SSL_CTX_set_min_proto_version(context.native_handle(),
                    opt.min_tls_version.value()) != 1)
            {
                return fail<void>(errc::tls_handshake_failed,
                    "TLS min version configuration failed.", detail::openssl_error_message());
            }
        }
    }

    if (!opt.cipher_list.empty())
    {
        if (SSL_CTX_set_cipher_list(context.native_handle(),
                opt.cipher_list.c_str()) != 1)
        {
            return fail<void>(errc::tls_handshake_failed,
                "TLS cipher list configuration failed.", detail::openssl_error_message());
        }
    }
    return ok();
}

} // namespace photoxx::net
