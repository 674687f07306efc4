/*

test_transfer_decoder.cpp
-------------------------

Copyright (C) 2025, Sylvain Guinebert (github.com/sguinebert).

Distributed under the FreeBSD license, see the accompanying file LICENSE or
copy at http://www.freebsd.org/copyright/freebsd-license.html.

*/


#define BOOST_TEST_MODULE transfer_decoder_test

#include <string>
#include <string_view>
#include <boost/test/unit_test.hpp>
#include <mimexx/codec/transfer_decoder.hpp>
#include <mimexx/detail/output_sink.hpp>


using mimexx::error_code;
using mimexx::parse_transfer_encoding;
using mimexx::result;
using mimexx::transfer_decoder;
using mimexx::transfer_encoding;
using std::string;


namespace
{

result<string> decode(transfer_encoding encoding, std::string_view body, std::size_t chunk, bool strict = false)
{
    transfer_decoder decoder(encoding, strict);
    string out;
    mimexx::detail::string_sink sink(out);
    for (std::size_t offset = 0; offset < body.size(); offset += chunk)
        if (auto res = decoder.decode(body.substr(offset, chunk), sink); !res)
            return std::unexpected(res.error());
    if (auto res = decoder.finish(sink); !res)
        return std::unexpected(res.error());
    return out;
}

} // namespace


BOOST_AUTO_TEST_CASE(encoding_names)
{
    BOOST_TEST((parse_transfer_encoding("base64") == transfer_encoding::base64));
    BOOST_TEST((parse_transfer_encoding(" BASE64 ") == transfer_encoding::base64));
    BOOST_TEST((parse_transfer_encoding("Quoted-Printable") == transfer_encoding::quoted_printable));
    BOOST_TEST((parse_transfer_encoding("7bit") == transfer_encoding::identity));
    BOOST_TEST((parse_transfer_encoding("8bit") == transfer_encoding::identity));
    BOOST_TEST((parse_transfer_encoding("binary") == transfer_encoding::identity));
    BOOST_TEST((parse_transfer_encoding("x-uuencode") == transfer_encoding::identity));
    BOOST_TEST((parse_transfer_encoding("") == transfer_encoding::identity));
    BOOST_TEST((parse_transfer_encoding("base64; comment") == transfer_encoding::base64));
    BOOST_TEST(mimexx::to_string(transfer_encoding::quoted_printable) == "quoted-printable");
}


BOOST_AUTO_TEST_CASE(identity_passes_bytes)
{
    const string body("binary\0bytes\r\n=3D unchanged", 27);
    for (std::size_t chunk : {1u, 5u, 100u})
    {
        auto res = decode(transfer_encoding::identity, body, chunk);
        BOOST_REQUIRE(res);
        BOOST_TEST(*res == body);
    }
}


BOOST_AUTO_TEST_CASE(base64_body)
{
    for (std::size_t chunk : {1u, 3u, 10u})
    {
        auto res = decode(transfer_encoding::base64, "SGVsbG8s\r\nIFdvcmxk\r\nIQ==\r\n", chunk);
        BOOST_REQUIRE(res);
        BOOST_TEST(*res == "Hello, World!");
    }
}


BOOST_AUTO_TEST_CASE(quoted_printable_body)
{
    for (std::size_t chunk : {1u, 2u, 64u})
    {
        auto res = decode(transfer_encoding::quoted_printable, "Caf=C3=A9 =\r\nau lait.\r\n", chunk);
        BOOST_REQUIRE(res);
        BOOST_TEST(*res == "Caf\xC3\xA9 au lait.\r\n");
    }
}


BOOST_AUTO_TEST_CASE(strict_quoted_printable)
{
    auto res = decode(transfer_encoding::quoted_printable, "a = b", 1, false);
    BOOST_REQUIRE(res);
    BOOST_TEST(*res == "a = b");

    res = decode(transfer_encoding::quoted_printable, "a = b", 1, true);
    BOOST_REQUIRE(!res);
    BOOST_TEST(res.error().is(error_code::invalid_escape));
}


BOOST_AUTO_TEST_CASE(errors_of_the_transform)
{
    auto res = decode(transfer_encoding::base64, "SGVs#G8=", 4);
    BOOST_REQUIRE(!res);
    BOOST_TEST(res.error().is(error_code::invalid_base64));

    res = decode(transfer_encoding::base64, "SGVsbG", 4);
    BOOST_REQUIRE(!res);
    BOOST_TEST(res.error().is(error_code::truncated_base64));
}


BOOST_AUTO_TEST_CASE(reset_for_next_body)
{
    transfer_decoder decoder(transfer_encoding::base64);
    string out;
    mimexx::detail::string_sink sink(out);
    BOOST_REQUIRE(!decoder.decode("!!!!", sink));
    BOOST_TEST(decoder.consumed() == 4u);

    decoder.reset();
    BOOST_TEST(decoder.consumed() == 0u);
    BOOST_REQUIRE(decoder.decode("SGk=", sink));
    BOOST_REQUIRE(decoder.finish(sink));
    BOOST_TEST(out == "Hi");
    BOOST_TEST((decoder.encoding() == transfer_encoding::base64));
}
