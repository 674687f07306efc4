/*

test_quoted_printable.cpp
-------------------------

Copyright (C) 2025, Sylvain Guinebert (github.com/sguinebert).

Distributed under the FreeBSD license, see the accompanying file LICENSE or
copy at http://www.freebsd.org/copyright/freebsd-license.html.

*/


#define BOOST_TEST_MODULE quoted_printable_test

#include <string>
#include <string_view>
#include <boost/test/unit_test.hpp>
#include <mimexx/codec/quoted_printable.hpp>
#include <mimexx/detail/output_sink.hpp>


using mimexx::error_code;
using mimexx::quoted_printable;
using mimexx::result;
using std::string;


namespace
{

result<string> decode_chunked(std::string_view text, std::size_t chunk, bool strict = false)
{
    quoted_printable qp;
    qp.strict_mode(strict);
    string out;
    mimexx::detail::string_sink sink(out);
    for (std::size_t offset = 0; offset < text.size(); offset += chunk)
        if (auto res = qp.update(text.substr(offset, chunk), sink); !res)
            return std::unexpected(res.error());
    if (auto res = qp.finalize(sink); !res)
        return std::unexpected(res.error());
    return out;
}

} // namespace


BOOST_AUTO_TEST_CASE(soft_line_breaks)
{
    auto res = quoted_printable::decode("Soft=\r\nbreak and=\nbare");
    BOOST_REQUIRE(res);
    BOOST_TEST(*res == "Softbreak andbare");
}


BOOST_AUTO_TEST_CASE(escapes)
{
    auto res = quoted_printable::decode("a=3Db Caf=C3=A9 caf=c3=a9");
    BOOST_REQUIRE(res);
    BOOST_TEST(*res == "a=b Caf\xC3\xA9 caf\xC3\xA9");
}


BOOST_AUTO_TEST_CASE(hard_line_breaks_kept)
{
    auto res = quoted_printable::decode("line one\r\nline two\r\n");
    BOOST_REQUIRE(res);
    BOOST_TEST(*res == "line one\r\nline two\r\n");
}


/**
Escapes and soft breaks split at every position decode the same.
**/
BOOST_AUTO_TEST_CASE(split_sequences)
{
    const string text = "Hello=2C=\r\nWorld=21 =3D=\n end";
    for (std::size_t chunk = 1; chunk <= text.size(); ++chunk)
    {
        auto res = decode_chunked(text, chunk);
        BOOST_REQUIRE(res);
        BOOST_TEST(*res == "Hello,World! = end");
    }
}


/**
Spaces and tabs between the equal sign of a soft break and the line break are dropped with the break.
**/
BOOST_AUTO_TEST_CASE(padded_soft_breaks)
{
    const string text = "ab= \r\ncd=\t \nef= ";
    for (std::size_t chunk = 1; chunk <= text.size(); ++chunk)
    {
        auto res = decode_chunked(text, chunk);
        BOOST_REQUIRE(res);
        BOOST_TEST(*res == "abcdef");
    }

    auto res = quoted_printable::decode("x = 3D y");
    BOOST_REQUIRE(res);
    BOOST_TEST(*res == "x = 3D y");

    res = decode_chunked("ok= \r\nok", 3, true);
    BOOST_REQUIRE(res);
    BOOST_TEST(*res == "okok");
}


BOOST_AUTO_TEST_CASE(stray_equal_signs)
{
    auto res = quoted_printable::decode("1 + 1 = 2, 50% =off=\rx");
    BOOST_REQUIRE(res);
    BOOST_TEST(*res == "1 + 1 = 2, 50% =off=\rx");

    res = quoted_printable::decode("trailing=");
    BOOST_REQUIRE(res);
    BOOST_TEST(*res == "trailing");
}


BOOST_AUTO_TEST_CASE(strict_mode)
{
    auto res = decode_chunked("1 + 1 = 2", 4, true);
    BOOST_REQUIRE(!res);
    BOOST_TEST(res.error().is(error_code::invalid_escape));

    res = decode_chunked("end=", 4, true);
    BOOST_REQUIRE(!res);
    BOOST_TEST(res.error().is(error_code::invalid_escape));

    res = decode_chunked("ok=3D=\r\nok", 4, true);
    BOOST_REQUIRE(res);
    BOOST_TEST(*res == "ok=ok");
}


BOOST_AUTO_TEST_CASE(invalid_escape)
{
    auto res = quoted_printable::decode("bad =4G escape");
    BOOST_REQUIRE(!res);
    BOOST_TEST(res.error().is(error_code::invalid_escape));
    BOOST_TEST(res.error().offset() == 7u);

    res = decode_chunked("cut =4", 2);
    BOOST_REQUIRE(!res);
    BOOST_TEST(res.error().is(error_code::invalid_escape));
}


BOOST_AUTO_TEST_CASE(q_codec_mode)
{
    auto res = quoted_printable::decode("Zdravo,_Sv=E9te=3F", true);
    BOOST_REQUIRE(res);
    BOOST_TEST(*res == "Zdravo, Sv\xE9te?");
}
