#pragma once

#include <photoxx/config.hpp>
#include <photoxx/settings.hpp>

#include <photoxx/codec/percent.hpp>

#include <photoxx/net/call_context.hpp>
#include <photoxx/net/http_transport.hpp>
#include <photoxx/net/beast_transport.hpp>
#include <photoxx/net/query.hpp>
#include <photoxx/net/tls_options.hpp>
#include <photoxx/net/url.hpp>

#include <photoxx/oauth2/token.hpp>
#include <photoxx/oauth2/token_authority.hpp>
#include <photoxx/oauth2/desktop_flow.hpp>

#include <photoxx/photos/types.hpp>
#include <photoxx/photos/client.hpp>

// Utilities
#include <photoxx/detail/timeout_config.hpp>
