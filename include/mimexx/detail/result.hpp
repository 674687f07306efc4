/*

result.hpp
----------

Copyright (C) 2025, Sylvain Guinebert (github.com/sguinebert).

Distributed under the FreeBSD license, see the accompanying file LICENSE or
copy at http://www.freebsd.org/copyright/freebsd-license.html.

Error handling types using std::expected (C++23).
No exceptions are thrown by the decoder - all errors are returned via result<T>.

*/

#pragma once

#include <expected>
#include <string>
#include <string_view>
#include <cstdint>
#include <utility>

namespace mimexx
{

/// Error categories for mimexx operations
enum class error_code : std::uint16_t
{
    success = 0,

    // Header block errors (100-199)
    truncated_headers = 100,
    orphan_continuation = 101,
    header_line_too_long = 102,

    // Multipart structure errors (200-299)
    missing_boundary_parameter = 200,
    unterminated_multipart = 201,

    // Transfer decoding errors (300-399)
    invalid_base64 = 300,
    truncated_base64 = 301,
    invalid_escape = 302,

    // Input usage (700-799)
    invalid_argument = 700,
    invalid_state = 701,

    // Internal errors (900-999)
    internal_error = 900,
};

/// Convert error code to string
[[nodiscard]] constexpr std::string_view error_code_to_string(error_code ec) noexcept
{
    switch (ec)
    {
        case error_code::success: return "Success";
        case error_code::truncated_headers: return "Truncated headers";
        case error_code::orphan_continuation: return "Orphan continuation line";
        case error_code::header_line_too_long: return "Header line too long";
        case error_code::missing_boundary_parameter: return "Missing boundary parameter";
        case error_code::unterminated_multipart: return "Unterminated multipart";
        case error_code::invalid_base64: return "Invalid Base64";
        case error_code::truncated_base64: return "Truncated Base64";
        case error_code::invalid_escape: return "Invalid escape";
        case error_code::invalid_argument: return "Invalid argument";
        case error_code::invalid_state: return "Invalid state";
        case error_code::internal_error: return "Internal error";
    }
    return "Unknown error";
}

/// Rich error type with code, message, and the stream offset where it was detected
class error
{
public:
    error() noexcept : code_(error_code::success) {}

    explicit error(error_code code)
        : code_(code), message_(error_code_to_string(code)) {}

    error(error_code code, std::string message)
        : code_(code), message_(std::move(message)) {}

    error(error_code code, std::string message, std::uint64_t offset)
        : code_(code), message_(std::move(message)), offset_(offset) {}

    [[nodiscard]] error_code code() const noexcept { return code_; }
    [[nodiscard]] const std::string& message() const noexcept { return message_; }
    [[nodiscard]] std::uint64_t offset() const noexcept { return offset_; }

    [[nodiscard]] bool is_success() const noexcept { return code_ == error_code::success; }
    [[nodiscard]] explicit operator bool() const noexcept { return !is_success(); }

    /// Format error for display
    [[nodiscard]] std::string to_string() const
    {
        std::string out = "[" + std::to_string(static_cast<int>(code_)) + "] " + message_;
        if (offset_ != 0)
            out += " at offset " + std::to_string(offset_);
        return out;
    }

    /// Check if this is a specific error
    [[nodiscard]] bool is(error_code ec) const noexcept { return code_ == ec; }

    /// Check if the error makes the part boundaries undeterminable
    [[nodiscard]] bool is_structural_error() const noexcept
    {
        auto c = static_cast<std::uint16_t>(code_);
        return c >= 100 && c < 300;
    }

    /// Check if the error is scoped to a single decoded body
    [[nodiscard]] bool is_decode_error() const noexcept
    {
        auto c = static_cast<std::uint16_t>(code_);
        return c >= 300 && c < 400;
    }

    friend bool operator==(const error&, const error&) = default;

private:
    error_code code_;
    std::string message_;
    std::uint64_t offset_ = 0;
};

/// Result type alias using std::expected
template<typename T>
using result = std::expected<T, error>;

/// Void result for operations that don't return a value
using result_void = std::expected<void, error>;

/// Helper to create successful result
template<typename T>
[[nodiscard]] constexpr result<std::decay_t<T>> ok(T&& value)
{
    return result<std::decay_t<T>>(std::forward<T>(value));
}

/// Helper to create void success
[[nodiscard]] inline constexpr result_void ok()
{
    return result_void{};
}

/// Helper to create error result
template<typename T = void>
[[nodiscard]] constexpr std::expected<T, error> fail(error err)
{
    return std::unexpected(std::move(err));
}

template<typename T = void>
[[nodiscard]] constexpr std::expected<T, error> fail(error_code code)
{
    return std::unexpected(error(code));
}

template<typename T = void>
[[nodiscard]] constexpr std::expected<T, error> fail(error_code code, std::string message)
{
    return std::unexpected(error(code, std::move(message)));
}

template<typename T = void>
[[nodiscard]] constexpr std::expected<T, error> fail(error_code code, std::string message, std::uint64_t offset)
{
    return std::unexpected(error(code, std::move(message), offset));
}

} // namespace mimexx
