/*

q_codec.hpp
-----------

Copyright (C) 2025, Sylvain Guinebert (github.com/sguinebert).

Distributed under the FreeBSD license, see the accompanying file LICENSE or
copy at http://www.freebsd.org/copyright/freebsd-license.html.

*/


#pragma once

#include <optional>
#include <string>
#include <string_view>
#include <boost/algorithm/string/predicate.hpp>
#include <mimexx/codec/codec.hpp>
#include <mimexx/codec/base64_stream.hpp>
#include <mimexx/codec/quoted_printable.hpp>
#include <mimexx/detail/ascii.hpp>
#include <mimexx/detail/log.hpp>
#include <mimexx/export.hpp>


namespace mimexx
{


/**
Q codec, decoder of the RFC 2047 encoded words found in header values.

Any charset is accepted, the decoded bytes are kept as they are and tagged with the declared charset.
**/
class MIMEXX_EXPORT q_codec : public codec
{
public:

    q_codec() = default;

    /**
    Decoding a single encoded word.

    @param word Text starting with `=?` and ending with `?=`.
    @return     Decoded text with its charset and method, or nothing if the word is malformed.
    **/
    std::optional<string_t> decode(std::string_view word) const
    {
        if (word.size() < MIN_WORD_LEN || word.substr(0, 2) != WORD_BEGIN || word.substr(word.size() - 2) != WORD_END)
            return std::nullopt;

        std::string_view inner = word.substr(2, word.size() - 4);
        std::string_view::size_type method_pos = inner.find(QUESTION_MARK_CHAR);
        if (method_pos == std::string_view::npos || method_pos == 0)
            return std::nullopt;
        std::string_view::size_type content_pos = inner.find(QUESTION_MARK_CHAR, method_pos + 1);
        if (content_pos == std::string_view::npos)
            return std::nullopt;

        std::string_view charset = inner.substr(0, method_pos);
        std::string_view method = inner.substr(method_pos + 1, content_pos - method_pos - 1);
        std::string_view text = inner.substr(content_pos + 1);

        for (char ch : charset)
            if (!detail::is_token_char(ch))
                return std::nullopt;
        for (char ch : text)
            if (ch == SPACE_CHAR || ch == TAB_CHAR || ch == QUESTION_MARK_CHAR)
                return std::nullopt;

        // RFC 2231 appends the language to the charset.
        auto lang_pos = charset.find(ASTERISK_CHAR);
        if (lang_pos != std::string_view::npos)
            charset = charset.substr(0, lang_pos);
        if (charset.empty())
            return std::nullopt;

        string_t decoded;
        decoded.charset = std::string(charset);
        if (boost::iequals(method, BASE64_CODEC_STR))
        {
            auto res = decode_base64(text);
            if (!res)
                return std::nullopt;
            decoded.buffer = std::move(*res);
            decoded.codec_type = codec_t::BASE64;
        }
        else if (boost::iequals(method, QP_CODEC_STR))
        {
            auto res = quoted_printable::decode(text, true);
            if (!res)
                return std::nullopt;
            decoded.buffer = std::move(*res);
            decoded.codec_type = codec_t::QUOTED_PRINTABLE;
        }
        else
            return std::nullopt;

        return decoded;
    }

    /**
    Decoding all encoded words of a header value.

    Text outside of the encoded words is kept verbatim, whitespace between two adjacent encoded words is dropped.
    Malformed words are passed through as they are. The charset of the result is the one of the first encoded
    word, empty if there is none.

    @param text Raw header value.
    @return     Decoded value.
    **/
    string_t check_decode(std::string_view text) const
    {
        string_t result;
        result.codec_type = is_8bit_string(text) ? codec_t::UTF8 : codec_t::ASCII;
        bool after_word = false;
        std::string_view::size_type pos = 0;

        while (pos < text.size())
        {
            std::string_view::size_type begin = text.find(WORD_BEGIN, pos);
            if (begin == std::string_view::npos)
            {
                result.buffer.append(text.substr(pos));
                break;
            }

            std::string_view between = text.substr(pos, begin - pos);
            std::optional<std::string_view> word = find_word(text, begin);
            std::optional<string_t> decoded;
            if (word)
                decoded = decode(*word);

            if (!decoded)
            {
                if (log::detail::enabled(log::level::debug))
                    MIMEXX_DEBUG("Malformed encoded word kept verbatim: `" + std::string(text.substr(begin)) + "`.");
                result.buffer.append(between);
                result.buffer.append(WORD_BEGIN);
                pos = begin + WORD_BEGIN.size();
                after_word = false;
                continue;
            }

            if (!(after_word && is_blank(between)))
                result.buffer.append(between);
            result.buffer.append(decoded->buffer);
            if (result.charset.empty())
            {
                result.charset = decoded->charset;
                result.codec_type = decoded->codec_type;
            }
            pos = begin + word->size();
            after_word = true;
        }

        return result;
    }

private:

    /**
    Locating the end of the encoded word starting at the given position.

    @param text  Header value.
    @param begin Position of the `=?` introducer.
    @return      The candidate word, or nothing if it is not terminated.
    **/
    static std::optional<std::string_view> find_word(std::string_view text, std::string_view::size_type begin)
    {
        std::string_view::size_type method_pos = text.find(QUESTION_MARK_CHAR, begin + 2);
        if (method_pos == std::string_view::npos)
            return std::nullopt;
        std::string_view::size_type content_pos = text.find(QUESTION_MARK_CHAR, method_pos + 1);
        if (content_pos == std::string_view::npos)
            return std::nullopt;
        std::string_view::size_type end = text.find(WORD_END, content_pos + 1);
        if (end == std::string_view::npos)
            return std::nullopt;
        return text.substr(begin, end + WORD_END.size() - begin);
    }

    static bool is_blank(std::string_view text)
    {
        for (char ch : text)
            if (!detail::is_wsp(ch) && ch != CR_CHAR && ch != LF_CHAR)
                return false;
        return true;
    }

    /**
    String representation of Base64 method.
    **/
    static constexpr std::string_view BASE64_CODEC_STR{"B"};

    /**
    String representation of Quoted Printable method.
    **/
    static constexpr std::string_view QP_CODEC_STR{"Q"};

    static constexpr std::string_view WORD_BEGIN{"=?"};

    static constexpr std::string_view WORD_END{"?="};

    /**
    Length of `=?c?B??=`.
    **/
    static constexpr std::string_view::size_type MIN_WORD_LEN = 8;
};


} // namespace mimexx
