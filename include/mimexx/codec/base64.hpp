/*

base64.hpp
----------

Copyright (C) 2025, Sylvain Guinebert (github.com/sguinebert).

Distributed under the FreeBSD license, see the accompanying file LICENSE or
copy at http://www.freebsd.org/copyright/freebsd-license.html.

*/


#pragma once

#include <array>
#include <string>
#include <string_view>
#include <vector>
#include <mimexx/codec/codec.hpp>
#include <mimexx/export.hpp>


namespace mimexx
{

namespace detail
{

constexpr std::string_view BASE64_ALPHABET{"ABCDEFGHIJKLMNOPQRSTUVWXYZabcdefghijklmnopqrstuvwxyz0123456789+/"};

constexpr std::array<int, 256> make_sextet_table()
{
    std::array<int, 256> table{};
    for (auto& v : table)
        v = -1;
    for (std::size_t i = 0; i < BASE64_ALPHABET.size(); ++i)
        table[static_cast<unsigned char>(BASE64_ALPHABET[i])] = static_cast<int>(i);
    return table;
}

inline constexpr std::array<int, 256> SEXTET_TABLE = make_sextet_table();

} // namespace detail


/**
Base64 alphabet and line oriented encoder.

Decoding is incremental and lives in `base64_stream_decoder`.
**/
class MIMEXX_EXPORT base64 : public codec
{
public:

    /**
    Base64 character set.
    **/
    static constexpr std::string_view CHARSET = detail::BASE64_ALPHABET;

    /**
    Value marking a character outside of the alphabet.
    **/
    static constexpr int INVALID_SEXTET = -1;

    /**
    Setting the encoder line policy.

    Since Base64 encodes three characters into four, the line policy is rounded down to a multiple of four.

    @param line_policy Maximum length of an encoded line, zero for no line splitting.
    **/
    explicit base64(std::string::size_type line_policy = 76)
        : line_policy_(line_policy - line_policy % SEXTETS_NO)
    {
    }

    base64(const base64&) = delete;

    base64(base64&&) = delete;

    /**
    Default destructor.
    **/
    ~base64() = default;

    void operator=(const base64&) = delete;

    void operator=(base64&&) = delete;

    /**
    Mapping a character to its six bit value.

    @param ch Character to map.
    @return   Value in range [0, 63] or `INVALID_SEXTET`.
    **/
    static constexpr int sextet(char ch)
    {
        return detail::SEXTET_TABLE[static_cast<unsigned char>(ch)];
    }

    /**
    Encoding a string into vector of Base64 encoded strings by applying the line policy.

    @param text String to encode.
    @return     Vector of Base64 encoded lines.
    **/
    std::vector<std::string> encode(std::string_view text) const
    {
        std::vector<std::string> enc_text;
        unsigned char octets[OCTETS_NO];
        char sextets[SEXTETS_NO];
        std::string::size_type octets_counter = 0;
        std::string line;

        auto flush_group = [&](std::string::size_type significant)
        {
            sextets[0] = CHARSET[(octets[0] & 0xfc) >> 2];
            sextets[1] = CHARSET[((octets[0] & 0x03) << 4) + ((octets[1] & 0xf0) >> 4)];
            sextets[2] = CHARSET[((octets[1] & 0x0f) << 2) + ((octets[2] & 0xc0) >> 6)];
            sextets[3] = CHARSET[octets[2] & 0x3f];
            for (std::string::size_type i = significant + 1; i < SEXTETS_NO; i++)
                sextets[i] = EQUAL_CHAR;

            if (line_policy_ > 0 && line.length() + SEXTETS_NO > line_policy_)
            {
                enc_text.push_back(line);
                line.clear();
            }
            line.append(sextets, SEXTETS_NO);
        };

        for (char ch : text)
        {
            octets[octets_counter++] = static_cast<unsigned char>(ch);
            if (octets_counter == OCTETS_NO)
            {
                flush_group(OCTETS_NO);
                octets_counter = 0;
            }
        }

        // encode remaining characters if any
        if (octets_counter > 0)
        {
            for (std::string::size_type i = octets_counter; i < OCTETS_NO; i++)
                octets[i] = '\0';
            flush_group(octets_counter);
        }

        if (!line.empty())
            enc_text.push_back(line);

        return enc_text;
    }

    /**
    Number of six bit chunks.
    **/
    static constexpr unsigned short SEXTETS_NO = 4;

    /**
    Number of eight bit characters.
    **/
    static constexpr unsigned short OCTETS_NO = SEXTETS_NO - 1;

private:

    /**
    Maximum length of an encoded line.
    **/
    std::string::size_type line_policy_;
};


} // namespace mimexx
