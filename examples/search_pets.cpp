/*

search_pets.cpp
---------------

Authorizes against Google with the desktop consent flow, then lists the product
URL of every photo in the first page of the PETS category.

Reads GOOGLE_CLIENT_ID, GOOGLE_CLIENT_SECRET and, when an earlier run printed one,
GOOGLE_REFRESH_TOKEN from the environment.


Copyright (C) 2025, Sylvain Guinebert (github.com/sguinebert).

Distributed under the FreeBSD license, see the accompanying file LICENSE or
copy at http://www.freebsd.org/copyright/freebsd-license.html.

*/


#include <iostream>
#include <boost/asio/ssl.hpp>
#include "example_util.hpp"
#include <photoxx/net/beast_transport.hpp>
#include <photoxx/oauth2/desktop_flow.hpp>
#include <photoxx/oauth2/token_authority.hpp>
#include <photoxx/photos/client.hpp>
#include <photoxx/settings.hpp>


using photoxx::oauth2::token_authority;
using std::cout;
using std::endl;


int main()
{
    auto settings_res = photoxx::load_settings_from_env();
    if (!settings_res)
    {
        print_error(settings_res.error());
        return 1;
    }
    const auto& settings = settings_res.value();
    settings.apply_logging();

    boost::asio::ssl::context ssl_ctx(boost::asio::ssl::context::tls_client);
    photoxx::net::beast_transport transport(ssl_ctx);

    token_authority authority(settings.credentials, transport);
    authority.set_scope(std::string(photoxx::photos::scope_library_readonly));

    std::string refresh_token = settings.refresh_token;
    if (refresh_token.empty())
    {
        console_prompt prompt;
        auto auth_res = photoxx::oauth2::authorize_interactively(authority, prompt);
        if (!auth_res)
        {
            print_error(auth_res.error());
            return 1;
        }
        refresh_token = authority.refresh_token();
        cout << "Refresh token (export as GOOGLE_REFRESH_TOKEN to skip consent next time): "
             << refresh_token << endl;
    }

    auto refresh_res = authority.refresh_access_token(refresh_token);
    if (!refresh_res)
    {
        print_error(refresh_res.error());
        return 1;
    }
    PHOTOXX_INFO("access token valid for " + std::to_string(authority.expires_in()) + " s");

    photoxx::photos::client photos(transport, authority.access_token());

    photoxx::photos::search_request request;
    request.page_size = 100;
    request.filters.emplace().content_filter.emplace().included_content_categories.push_back(
        photoxx::photos::content_category::pets);

    auto search_res = photos.search(request);
    if (!search_res)
    {
        print_error(search_res.error());
        return 1;
    }

    for (const auto& item : search_res->media_items)
        cout << item.product_url << endl;
    if (search_res->has_next_page())
        cout << "More results available." << endl;
    return 0;
}
