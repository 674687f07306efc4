/*

transfer_decoder.hpp
--------------------

Copyright (C) 2025, Sylvain Guinebert (github.com/sguinebert).

Distributed under the FreeBSD license, see the accompanying file LICENSE or
copy at http://www.freebsd.org/copyright/freebsd-license.html.

*/


#pragma once

#include <cstdint>
#include <string>
#include <string_view>
#include <type_traits>
#include <variant>
#include <boost/algorithm/string/predicate.hpp>
#include <boost/algorithm/string/trim.hpp>
#include <mimexx/codec/base64_stream.hpp>
#include <mimexx/codec/quoted_printable.hpp>
#include <mimexx/detail/output_sink.hpp>
#include <mimexx/detail/result.hpp>
#include <mimexx/export.hpp>


namespace mimexx
{


/**
Content transfer encodings of a body.

The 7bit, 8bit and binary encodings leave the bytes untouched, so all of them map to `identity`.
**/
enum class transfer_encoding {identity, base64, quoted_printable};


/**
Mapping the value of a `Content-Transfer-Encoding` header to the encoding.

@param value Header value, compared case insensitively.
@return      Recognized encoding, `identity` for an empty or unknown value.
**/
inline transfer_encoding parse_transfer_encoding(std::string_view value)
{
    std::string token = boost::trim_copy(std::string(value));
    auto semicolon = token.find(';');
    if (semicolon != std::string::npos)
        token = boost::trim_copy(token.substr(0, semicolon));

    if (boost::iequals(token, "base64"))
        return transfer_encoding::base64;
    if (boost::iequals(token, "quoted-printable"))
        return transfer_encoding::quoted_printable;
    return transfer_encoding::identity;
}


inline std::string_view to_string(transfer_encoding encoding) noexcept
{
    switch (encoding)
    {
        case transfer_encoding::identity: return "identity";
        case transfer_encoding::base64: return "base64";
        case transfer_encoding::quoted_printable: return "quoted-printable";
    }
    return "identity";
}


/**
Streaming body decoder selecting the transform from the transfer encoding.

The body is fed in slices as the boundary scanner delimits it; the decoded bytes are written to the sink as soon
as they are complete. After an error the decoder stays failed until `reset()`.
**/
class MIMEXX_EXPORT transfer_decoder
{
public:

    /**
    Creating the decoder.

    @param encoding Transfer encoding of the body.
    @param strict   Rejecting the stray equal signs of a quoted printable body.
    **/
    explicit transfer_decoder(transfer_encoding encoding = transfer_encoding::identity, bool strict = false)
        : encoding_(encoding), strict_(strict)
    {
        reset();
    }

    /**
    Decoding the next slice of the body.

    @param chunk Encoded bytes.
    @param sink  Destination of the decoded bytes.
    @return      Decoding error of the selected transform.
    **/
    result_void decode(std::string_view chunk, detail::output_sink& sink)
    {
        consumed_ += chunk.size();
        return std::visit(
            [&](auto& state) -> result_void
            {
                using state_t = std::decay_t<decltype(state)>;
                if constexpr (std::is_same_v<state_t, std::monostate>)
                {
                    if (!chunk.empty())
                        sink.write(chunk);
                    return ok();
                }
                else
                    return state.update(chunk, sink);
            },
            state_);
    }

    /**
    Signaling the end of the body.

    @param sink Destination of the bytes held back by the transform.
    @return     Error if the body ends in the middle of an encoded unit.
    **/
    result_void finish(detail::output_sink& sink)
    {
        return std::visit(
            [&](auto& state) -> result_void
            {
                using state_t = std::decay_t<decltype(state)>;
                if constexpr (std::is_same_v<state_t, std::monostate>)
                    return ok();
                else
                    return state.finalize(sink);
            },
            state_);
    }

    /**
    Restarting the decoder for a new body with the same encoding.
    **/
    void reset()
    {
        consumed_ = 0;
        switch (encoding_)
        {
            case transfer_encoding::base64:
                state_.emplace<base64_stream_decoder>();
                break;

            case transfer_encoding::quoted_printable:
            {
                auto& qp = state_.emplace<quoted_printable>();
                qp.strict_mode(strict_);
                break;
            }

            case transfer_encoding::identity:
                state_.emplace<std::monostate>();
                break;
        }
    }

    transfer_encoding encoding() const noexcept
    {
        return encoding_;
    }

    /**
    Number of encoded bytes fed since the last reset.
    **/
    std::uint64_t consumed() const noexcept
    {
        return consumed_;
    }

private:

    transfer_encoding encoding_;
    bool strict_;
    std::uint64_t consumed_ = 0;
    std::variant<std::monostate, base64_stream_decoder, quoted_printable> state_;
};


} // namespace mimexx
