/**
 * @file timeout_config.hpp
 * @brief Configurable per-phase timeouts for HTTP exchanges.
 * @author photoxx contributors
 *
 * Granular timeout configuration for the phases of one HTTP request.
 */

#ifndef PHOTOXX_DETAIL_TIMEOUT_CONFIG_HPP
#define PHOTOXX_DETAIL_TIMEOUT_CONFIG_HPP

#include <chrono>
#include <optional>

namespace photoxx {

using namespace std::chrono;

/**
 * Per-phase timeout configuration.
 *
 * If a specific timeout is not set, the default_timeout is used.
 *
 * Example:
 * @code
 * http_timeout_config timeouts;
 * timeouts.connect = seconds(3);
 * timeouts.read = seconds(20);
 *
 * net::beast_transport transport(ssl_ctx, {.timeouts = timeouts});
 * @endcode
 */
struct http_timeout_config
{
    /// Default timeout used when specific timeout is not set
    steady_clock::duration default_timeout{seconds(5)};

    /// Name resolution and TCP connection establishment
    std::optional<steady_clock::duration> connect;

    /// TLS handshake
    std::optional<steady_clock::duration> handshake;

    /// Sending the request
    std::optional<steady_clock::duration> write;

    /// Receiving the complete response
    std::optional<steady_clock::duration> read;

    steady_clock::duration get_connect() const
    { return connect.value_or(default_timeout); }

    steady_clock::duration get_handshake() const
    { return handshake.value_or(default_timeout); }

    steady_clock::duration get_write() const
    { return write.value_or(default_timeout); }

    steady_clock::duration get_read() const
    { return read.value_or(default_timeout); }

    /**
     * Default configuration: five seconds for every phase.
     */
    static http_timeout_config defaults()
    {
        return {};
    }

    /**
     * Create uniform configuration with single timeout for all phases.
     */
    static http_timeout_config uniform(steady_clock::duration timeout)
    {
        http_timeout_config cfg;
        cfg.default_timeout = timeout;
        return cfg;
    }
};

} // namespace photoxx

#endif // PHOTOXX_DETAIL_TIMEOUT_CONFIG_HPP
