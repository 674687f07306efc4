/*

log.hpp
-------

Copyright (C) 2025, Sylvain Guinebert (github.com/sguinebert).

Distributed under the FreeBSD license, see the accompanying file LICENSE or
copy at http://www.freebsd.org/copyright/freebsd-license.html.

Lightweight, header-only logging infrastructure for mimexx.
Supports multiple log levels, optional callbacks, and parser event tracing.

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

namespace mimexx::log
{

/// Log severity levels
enum class level : std::uint8_t
{
    trace = 0,   ///< Parser event tracing (very verbose)
    debug = 1,   ///< Debug information
    info = 2,    ///< Informational messages
    warn = 3,    ///< Warnings (tolerated irregularities)
    error = 4,   ///< Errors (operation failures)
    fatal = 5,   ///< Fatal errors (unrecoverable)
    off = 6      ///< Logging disabled
};

/// Parser stages that emit trace events, combined as a bit mask.
enum class component : std::uint8_t
{
    none = 0,
    cursor = 1,
    scanner = 2,
    headers = 4,
    assembler = 8,
    all = 15
};

[[nodiscard]] constexpr component operator|(component a, component b) noexcept
{
    return static_cast<component>(static_cast<std::uint8_t>(a) | static_cast<std::uint8_t>(b));
}

[[nodiscard]] constexpr std::string_view component_name(component c) noexcept
{
    switch (c)
    {
        case component::cursor:    return "cursor";
        case component::scanner:   return "scanner";
        case component::headers:   return "headers";
        case component::assembler: return "assembler";
        default:                   return "parser";
    }
}

/// Log entry structure passed to callbacks
struct entry
{
    level lvl;
    std::chrono::system_clock::time_point timestamp;
    std::string message;
    std::source_location location;

    // Optional parser trace info
    struct trace_info_t
    {
        std::string component;  // "cursor", "scanner", "headers", "assembler"
        std::string data;       // Event description
    };
    std::optional<trace_info_t> trace_info;
};

/// Log callback signature
using callback_t = std::function<void(const entry&)>;

/// Convert level to string
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

/// Global logger configuration (thread-safe singleton)
class logger
{
public:
    static logger& instance() noexcept
    {
        static logger inst;
        return inst;
    }

    /// Set minimum log level
    void set_level(level lvl) noexcept
    {
        min_level_.store(static_cast<std::uint8_t>(lvl), std::memory_order_relaxed);
    }

    /// Get current minimum log level
    [[nodiscard]] level get_level() const noexcept
    {
        return static_cast<level>(min_level_.load(std::memory_order_relaxed));
    }

    /// Check if level is enabled
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

    /// Enable/disable parser event tracing for every component
    void set_trace_enabled(bool enabled) noexcept
    {
        set_trace_components(enabled ? component::all : component::none);
    }

    /// Restricting the trace to the given components
    void set_trace_components(component mask) noexcept
    {
        trace_mask_.store(static_cast<std::uint8_t>(mask), std::memory_order_relaxed);
    }

    [[nodiscard]] bool is_trace_enabled(component c = component::all) const noexcept
    {
        return (trace_mask_.load(std::memory_order_relaxed) & static_cast<std::uint8_t>(c)) != 0;
    }

    /// Log a message
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

    /// Log a parser event trace
    void trace_event(component source, std::string_view data,
                     std::source_location loc = std::source_location::current())
    {
        if (!is_trace_enabled(source))
            return;

        entry e{
            .lvl = level::trace,
            .timestamp = std::chrono::system_clock::now(),
            .message = {},
            .location = loc,
            .trace_info = entry::trace_info_t{
                .component = std::string(component_name(source)),
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
        {
            callback_(e);
        }
        else
        {
            default_output(e);
        }
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
        line << '[' << std::setfill('0') << std::setw(2) << tm_buf.tm_hour << ':'
             << std::setw(2) << tm_buf.tm_min << ':' << std::setw(2) << tm_buf.tm_sec << '.'
             << std::setw(3) << ms.count() << "] ";

        if (e.trace_info)
            line << e.trace_info->component << " | " << sanitize_trace(e.trace_info->data);
        else
            line << '[' << level_to_string(e.lvl) << "] " << e.message;
        line << '\n';
        std::cerr << line.str();
    }

    /// Sanitize trace data (truncate long data, hide control characters)
    [[nodiscard]] static std::string sanitize_trace(std::string_view data)
    {
        std::string result(data);

        // Truncate very long data
        constexpr std::size_t max_len = 500;
        if (result.size() > max_len)
        {
            result.resize(max_len);
            result += "... [truncated]";
        }

        for (std::size_t i = 0; i < result.size(); ++i)
        {
            unsigned char c = static_cast<unsigned char>(result[i]);
            if (c < 32)
                result[i] = '.';
        }

        return result;
    }

    std::atomic<std::uint8_t> min_level_{static_cast<std::uint8_t>(level::info)};
    std::atomic<std::uint8_t> trace_mask_{0};
    std::mutex mutex_;
    callback_t callback_;
};

// Convenience macros for logging with source location
#define MIMEXX_LOG(lvl, msg) \
    ::mimexx::log::logger::instance().log(lvl, msg, std::source_location::current())

#define MIMEXX_TRACE(msg)  MIMEXX_LOG(::mimexx::log::level::trace, msg)
#define MIMEXX_DEBUG(msg)  MIMEXX_LOG(::mimexx::log::level::debug, msg)
#define MIMEXX_INFO(msg)   MIMEXX_LOG(::mimexx::log::level::info, msg)
#define MIMEXX_WARN(msg)   MIMEXX_LOG(::mimexx::log::level::warn, msg)
#define MIMEXX_ERROR(msg)  MIMEXX_LOG(::mimexx::log::level::error, msg)
#define MIMEXX_FATAL(msg)  MIMEXX_LOG(::mimexx::log::level::fatal, msg)

/// Parser event trace, the data is built only when the component is traced
#define MIMEXX_TRACE_EVENT(source, data) \
    do \
    { \
        if (::mimexx::log::logger::instance().is_trace_enabled(::mimexx::log::component::source)) \
            ::mimexx::log::logger::instance().trace_event(::mimexx::log::component::source, data); \
    } while (false)

namespace detail
{
    /// Whether a message at the given level would be emitted; used to skip building messages.
    [[nodiscard]] inline bool enabled(level lvl) noexcept
    {
        return logger::instance().is_enabled(lvl);
    }
}

} // namespace mimexx::log
