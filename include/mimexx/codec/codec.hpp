/*

codec.hpp
---------

Copyright (C) 2025, Sylvain Guinebert (github.com/sguinebert).

Distributed under the FreeBSD license, see the accompanying file LICENSE or
copy at http://www.freebsd.org/copyright/freebsd-license.html.

*/


#pragma once

#include <string>
#include <string_view>
#include <boost/algorithm/string/predicate.hpp>
#include <mimexx/export.hpp>


namespace mimexx
{


/**
Base class for the decoders, contains the constants shared by the transfer and header encodings.
**/
class MIMEXX_EXPORT codec
{
public:

    /**
    Checking if a character is eight bit.

    @param ch Character to check.
    @return   True if eight bit, false if seven bit.
    **/
    static constexpr bool is_8bit_char(char ch)
    {
        return static_cast<unsigned char>(ch) > 127;
    }

    /**
    Checking if a string contains eight bit characters.

    @param txt String to check.
    @return    True if it does, false if not.
    **/
    static bool is_8bit_string(std::string_view txt)
    {
        for (auto ch : txt)
            if (is_8bit_char(ch))
                return true;
        return false;
    }

    /**
    Carriage return character.
    **/
    static constexpr char CR_CHAR = '\r';

    /**
    Line feed character.
    **/
    static constexpr char LF_CHAR = '\n';

    /**
    Minus character.
    **/
    static constexpr char MINUS_CHAR = '-';

    /**
    Slash character.
    **/
    static constexpr char SLASH_CHAR = '/';

    /**
    Backslash character.
    **/
    static constexpr char BACKSLASH_CHAR = '\\';

    /**
    Equal character.
    **/
    static constexpr char EQUAL_CHAR = '=';

    /**
    Space character.
    **/
    static constexpr char SPACE_CHAR = ' ';

    /**
    Tab character.
    **/
    static constexpr char TAB_CHAR = '\t';

    /**
    Question mark character.
    **/
    static constexpr char QUESTION_MARK_CHAR = '?';

    /**
    Colon character.
    **/
    static constexpr char COLON_CHAR = ':';

    /**
    Semicolon character.
    **/
    static constexpr char SEMICOLON_CHAR = ';';

    /**
    Quote character.
    **/
    static constexpr char QUOTE_CHAR = '"';

    /**
    Underscore character.
    **/
    static constexpr char UNDERSCORE_CHAR = '_';

    /**
    Asterisk character, separates the charset from the language in RFC 2231.
    **/
    static constexpr char ASTERISK_CHAR = '*';

    /**
    Carriage return plus line feed string.
    **/
    static constexpr std::string_view END_OF_LINE{"\r\n"};

    /**
    Methods used for the MIME header encoding/decoding.
    **/
    enum class codec_t {ASCII, BASE64, QUOTED_PRINTABLE, UTF8};

    codec() : strict_mode_(false)
    {
    }

    /**
    Default destructor.
    **/
    virtual ~codec() = default;

    /**
    Enabling/disabling the strict mode.

    @param mode True to enable strict mode, false to disable.
    **/
    void strict_mode(bool mode)
    {
        strict_mode_ = mode;
    }

    /**
    Returning the strict mode status.

    @return True if strict mode enabled, false if disabled.
    **/
    bool strict_mode() const
    {
        return strict_mode_;
    }

protected:

    /**
    Strict mode for decoding.
    **/
    bool strict_mode_;
};


/**
Decoded text together with the charset it was declared in and the method that produced it.

The buffer keeps the raw decoded bytes, no transcoding to any charset is applied.
**/
struct string_t
{
    /**
    Decoded bytes.
    **/
    std::string buffer;

    /**
    Declared charset as written, empty when the text carried no declaration.
    **/
    std::string charset;

    /**
    Checking the declared charset, names compare case insensitively.
    **/
    bool has_charset(std::string_view name) const
    {
        return boost::iequals(charset, name);
    }

    /**
    Method the buffer was decoded with.
    **/
    codec::codec_t codec_type = codec::codec_t::ASCII;

    friend bool operator==(const string_t&, const string_t&) = default;
};


} // namespace mimexx
