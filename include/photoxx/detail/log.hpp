/*

log.hpp
-------

Copyright (C) 2025, Sylvain Guinebert (github.com/sguinebert).

Distributed under the FreeBSD license, see the accompanying file LICENSE or
copy at http://www.freebsd.org/copyright/freebsd-license.html.

Lightweight, header-only logging infrastructure for photoxx.
Supports multiple log levels, optional callbacks, and HTTP tracing.

*/

#pragma once

#include <atomic>
#include <chrono>
#include <cstdint>
#include <ctime>
#include <functional>
#include <iomanip>
#include <iostream>
#include <mutex>
#include <optional>
#include <source_location>
#include <sstream>
#include <string>
#include <string_view>

namespace photoxx::log
{

/// Log severity levels
enum class level : std::uint8_t
{
    trace = 0,   ///< HTTP-level tracing (very verbose)
    debug = 1,   ///< Debug information
    info = 2,    ///< Informational messages
    warn = 3,    ///< Warnings (non-fatal issues)
    error = 4,   ///< Errors (operation failures)
    fatal = 5,   ///< Fatal errors (unrecoverable)
    off = 6      ///< Logging disabled
};

/// Direction for HTTP tracing
enum class direction : std::uint8_t
{
    send,     ///< Data sent to server
    receive   ///< Data received from server
};

/// Log entry structure passed to callbacks
struct entry
{
    level lvl;
    std::chrono::system_clock::time_point timestamp;
    std::string message;
    std::source_location location;

    struct trace_info_t
    {
        direction dir;
        std::string protocol;  // "HTTP", "OAUTH2"
        std::string data;      // already redacted
    };
    std::optional<trace_info_t> trace_info;
};

using callback_t = std::function<void(const entry&)>;

[[nodiscard]] constexpr std::string_view level_to_string(level lvl) noexcept
{
    switch (lvl)
    {
        case level::trace: return "TRACE";
        case level::debug: return "DEBUG";
        case level::info:  return "INFO";
        case level::warn:  return "WARN";
        case level::error: return "ERROR";
        case level::fatal: return "FATAL";
        case level::off:   return "OFF";
    }
    return "UNKNOWN";
}

/// Parse a level name (case-insensitive); empty optional on unknown input.
[[nodiscard]] inline std::optional<level> level_from_string(std::string_view name) noexcept
{
    auto equals = [name](std::string_view candidate) noexcept
    {
        if (candidate.size() != name.size())
            return false;
        for (std::size_t i = 0; i < name.size(); ++i)
        {
            char c = name[i];
            if (c >= 'A' && c <= 'Z')
                c = static_cast<char>(c + ('a' - 'A'));
            if (c != candidate[i])
                return false;
        }
        return true;
    };

    if (equals("trace")) return level::trace;
    if (equals("debug")) return level::debug;
    if (equals("info")) return level::info;
    if (equals("warn") || equals("warning")) return level::warn;
    if (equals("error")) return level::error;
    if (equals("fatal")) return level::fatal;
    if (equals("off")) return level::off;
    return std::nullopt;
}

/// Global logger configuration (thread-safe singleton)
class logger
{
public:
    static logger& instance() noexcept
    {
        static logger inst;
        return inst;
    }

    void set_level(level lvl) noexcept
    {
        min_level_.store(static_cast<std::uint8_t>(lvl), std::memory_order_relaxed);
    }

    [[nodiscard]] level get_level() const noexcept
    {
        return static_cast<level>(min_level_.load(std::memory_order_relaxed));
    }

    [[nodiscard]] bool is_enabled(level lvl) const noexcept
    {
        return static_cast<std::uint8_t>(lvl) >= min_level_.load(std::memory_order_relaxed);
    }

    /// Set custom log callback (replaces default stderr output)
    void set_callback(callback_t cb)
    {
        std::lock_guard lock(mutex_);
        callback_ = std::move(cb);
    }

    /// Clear custom callback (restore default stderr output)
    void clear_callback()
    {
        std::lock_guard lock(mutex_);
        callback_ = nullptr;
    }

    void set_trace_enabled(bool enabled) noexcept
    {
        trace_enabled_.store(enabled, std::memory_order_relaxed);
    }

    [[nodiscard]] bool is_trace_enabled() const noexcept
    {
        return trace_enabled_.load(std::memory_order_relaxed);
    }

    void log(level lvl, std::string_view message,
             std::source_location loc = std::source_location::current())
    {
        if (!is_enabled(lvl))
            return;

        entry e{
            .lvl = lvl,
            .timestamp = std::chrono::system_clock::now(),
            .message = std::string(message),
            .location = loc,
            .trace_info = std::nullopt
        };

        dispatch(e);
    }

    /// Callers are responsible for redacting `data` first.
    void trace_protocol(std::string_view protocol, direction dir, std::string_view data,
                       std::source_location loc = std::source_location::current())
    {
        if (!is_trace_enabled())
            return;

        entry e{
            .lvl = level::trace,
            .timestamp = std::chrono::system_clock::now(),
            .message = {},
            .location = loc,
            .trace_info = entry::trace_info_t{
                .dir = dir,
                .protocol = std::string(protocol),
                .data = std::string(data)
            }
        };

        dispatch(e);
    }

private:
    logger() = default;

    void dispatch(const entry& e)
    {
        std::lock_guard lock(mutex_);
        if (callback_)
            callback_(e);
        else
            default_output(e);
    }

    void default_output(const entry& e)
    {
        auto time = std::chrono::system_clock::to_time_t(e.timestamp);
        auto ms = std::chrono::duration_cast<std::chrono::milliseconds>(
            e.timestamp.time_since_epoch()) % 1000;

        std::tm tm_buf{};
#ifdef _WIN32
        localtime_s(&tm_buf, &time);
#else
        localtime_r(&time, &tm_buf);
#endif

        std::ostringstream line;
        line << '[' << std::setfill('0')
             << std::setw(2) << tm_buf.tm_hour << ':'
             << std::setw(2) << tm_buf.tm_min << ':'
             << std::setw(2) << tm_buf.tm_sec << '.'
             << std::setw(3) << ms.count() << "] ";

        if (e.trace_info)
        {
            const char* dir_str = (e.trace_info->dir == direction::send) ? ">>>" : "<<<";
            line << e.trace_info->protocol << ' ' << dir_str << ' ' << sanitize_trace(e.trace_info->data);
        }
        else
            line << '[' << level_to_string(e.lvl) << "] " << e.message;

        line << '\n';
        std::cerr << line.str();
    }

    /// Truncate long data and hide control characters.
    [[nodiscard]] static std::string sanitize_trace(std::string_view data)
    {
        std::string result(data);

        constexpr std::size_t max_len = 2000;
        if (result.size() > max_len)
        {
            result.resize(max_len);
            result += "... [truncated]";
        }

        for (char& c : result)
        {
            if (static_cast<unsigned char>(c) < 32 && c != '\r' && c != '\n')
                c = '.';
        }

        while (!result.empty() && (result.back() == '\r' || result.back() == '\n'))
            result.pop_back();

        return result;
    }

    std::atomic<std::uint8_t> min_level_{static_cast<std::uint8_t>(level::info)};
    std::atomic<bool> trace_enabled_{false};
    std::mutex mutex_;
    callback_t callback_;
};

#define PHOTOXX_LOG(lvl, msg) \
    ::photoxx::log::logger::instance().log(lvl, msg, std::source_location::current())

#define PHOTOXX_TRACE(msg)  PHOTOXX_LOG(::photoxx::log::level::trace, msg)
#define PHOTOXX_DEBUG(msg)  PHOTOXX_LOG(::photoxx::log::level::debug, msg)
#define PHOTOXX_INFO(msg)   PHOTOXX_LOG(::photoxx::log::level::info, msg)
#define PHOTOXX_WARN(msg)   PHOTOXX_LOG(::photoxx::log::level::warn, msg)
#define PHOTOXX_ERROR(msg)  PHOTOXX_LOG(::photoxx::log::level::error, msg)
#define PHOTOXX_FATAL(msg)  PHOTOXX_LOG(::photoxx::log::level::fatal, msg)

#define PHOTOXX_TRACE_SEND(protocol, data) \
    ::photoxx::log::logger::instance().trace_protocol(protocol, ::photoxx::log::direction::send, data)

#define PHOTOXX_TRACE_RECV(protocol, data) \
    ::photoxx::log::logger::instance().trace_protocol(protocol, ::photoxx::log::direction::receive, data)

} // namespace photoxx::log
