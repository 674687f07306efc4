/*

test_throwing.cpp
-----------------

Copyright (C) 2025, Sylvain Guinebert (github.com/sguinebert).

Distributed under the FreeBSD license, see the accompanying file LICENSE or
copy at http://www.freebsd.org/copyright/freebsd-license.html.

*/


#define BOOST_TEST_MODULE throwing_test

#include <string>
#include <boost/test/unit_test.hpp>
#include <mimexx/codec/base64_stream.hpp>
#include <mimexx/mime/message_parser.hpp>
#include <mimexx/throwing.hpp>


using mimexx::error_code;
using mimexx::unwrap;


BOOST_AUTO_TEST_CASE(unwrap_value)
{
    BOOST_TEST(unwrap(mimexx::decode_base64("SGk=")) == "Hi");
}


BOOST_AUTO_TEST_CASE(unwrap_error)
{
    try
    {
        (void)unwrap(mimexx::decode_base64("SG!="));
        BOOST_FAIL("decoding did not throw");
    }
    catch (const mimexx::exception& exc)
    {
        BOOST_TEST((exc.code() == error_code::invalid_base64));
        BOOST_TEST(exc.info().offset() == 3u);
        BOOST_TEST(std::string(exc.what()).find('!') != std::string::npos);
    }
}


BOOST_AUTO_TEST_CASE(unwrap_void)
{
    mimexx::message_parser parser;
    BOOST_CHECK_NO_THROW(unwrap(parser.feed("Subject: x\r\n\r\n")));
    parser.finish();
    BOOST_CHECK_THROW(unwrap(parser.feed("late")), mimexx::exception);
}


BOOST_AUTO_TEST_CASE(unwrap_message)
{
    auto msg = unwrap(mimexx::parse_message("Subject: ok\r\n\r\nbody"));
    BOOST_TEST(msg.content() == "body");

    BOOST_CHECK_EXCEPTION((void)unwrap(mimexx::parse_message("Content-Type: multipart/mixed\r\n\r\n")),
        mimexx::exception, [](const mimexx::exception& exc) { return exc.code() == error_code::missing_boundary_parameter; });
}
