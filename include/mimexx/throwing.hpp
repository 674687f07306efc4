/*

throwing.hpp
------------

Helpers to bridge mimexx::result into exceptions for users who prefer
exception-based error handling.

*/

#pragma once

#include <stdexcept>
#include <string>
#include <utility>

#include <mimexx/config.hpp>
#include <mimexx/detail/result.hpp>
#include <mimexx/mime/part.hpp>

namespace mimexx
{

#if !MIMEXX_THROWING_ENABLED
#error "MIMEXX_NO_EXCEPTIONS is defined; throwing.hpp is disabled."
#endif

class exception : public std::runtime_error
{
public:
    explicit exception(error err)
        : std::runtime_error(err.message().empty() ? std::string(error_code_to_string(err.code())) : err.message()),
          error_(std::move(err))
    {
    }

    [[nodiscard]] const error& info() const noexcept { return error_; }

    [[nodiscard]] error_code code() const noexcept { return error_.code(); }

private:
    error error_;
};

template<class T>
[[nodiscard]] inline T unwrap(result<T>&& r)
{
    if (!r)
        throw exception(std::move(r.error()));
    return std::move(*r);
}

inline void unwrap(result<void>&& r)
{
    if (!r)
        throw exception(std::move(r.error()));
}

/**
Throwing the fatal error of a parsed message, if any.

@param msg Parsed message.
@return    The same message when it was parsed without a fatal error.
**/
[[nodiscard]] inline message unwrap(message&& msg)
{
    if (msg.failed())
        throw exception(*msg.error_state());
    return std::move(msg);
}

} // namespace mimexx
