/*

percent.hpp
-----------

Copyright (C) 2025, Sylvain Guinebert (github.com/sguinebert).

Distributed under the FreeBSD license, see the accompanying file LICENSE or
copy at http://www.freebsd.org/copyright/freebsd-license.html.

*/


#pragma once

#include <string>
#include <string_view>
#include <boost/algorithm/string/case_conv.hpp>
#include <mimexx/codec/codec.hpp>
#include <mimexx/detail/ascii.hpp>
#include <mimexx/export.hpp>


namespace mimexx
{


/**
Percent decoding of the extended parameter values described in RFC 2231 section 4.
**/
class MIMEXX_EXPORT percent : public codec
{
public:

    percent() = default;

    /**
    Decoding a percent encoded string.

    A percent sign not followed by two hex digits is kept as it is.

    @param txt String to decode.
    @return    Decoded string.
    **/
    std::string decode(std::string_view txt) const
    {
        std::string dec_text;
        dec_text.reserve(txt.size());
        for (std::string_view::size_type i = 0; i < txt.size(); i++)
        {
            if (txt[i] == PERCENT_HEX_FLAG && i + 2 < txt.size() && detail::is_hex_digit(txt[i + 1]) &&
                detail::is_hex_digit(txt[i + 2]))
            {
                dec_text += static_cast<char>((detail::hex_value(txt[i + 1]) << 4) + detail::hex_value(txt[i + 2]));
                i += 2;
            }
            else
                dec_text += txt[i];
        }
        return dec_text;
    }

    /**
    Decoding an extended value `charset'language'text`.

    @param value Extended parameter value.
    @return      Decoded text tagged with the upper cased charset, the whole value decoded if the quotes are missing.
    **/
    string_t decode_ext_value(std::string_view value) const
    {
        string_t result;
        std::string_view::size_type first = value.find(ATTRIBUTE_CHARSET_SEPARATOR);
        std::string_view::size_type second = first == std::string_view::npos ? std::string_view::npos :
            value.find(ATTRIBUTE_CHARSET_SEPARATOR, first + 1);
        if (second == std::string_view::npos)
        {
            result.buffer = decode(value);
            return result;
        }

        result.charset = boost::to_upper_copy(std::string(value.substr(0, first)));
        result.buffer = decode(value.substr(second + 1));
        result.codec_type = is_8bit_string(result.buffer) ? codec_t::UTF8 : codec_t::ASCII;
        return result;
    }

    /**
    Percent character introducing an escaped byte.
    **/
    static constexpr char PERCENT_HEX_FLAG = '%';

    /**
    Separator of the charset, the language and the text.
    **/
    static constexpr char ATTRIBUTE_CHARSET_SEPARATOR = '\'';
};


} // namespace mimexx
