/*

test_content_type.cpp
---------------------

Copyright (C) 2025, Sylvain Guinebert (github.com/sguinebert).

Distributed under the FreeBSD license, see the accompanying file LICENSE or
copy at http://www.freebsd.org/copyright/freebsd-license.html.

*/


#define BOOST_TEST_MODULE content_type_test

#include <boost/test/unit_test.hpp>
#include <mimexx/mime/content_type.hpp>


using mimexx::content_disposition_t;
using mimexx::content_type_t;
using mimexx::parse_content_disposition;
using mimexx::parse_content_type;


BOOST_AUTO_TEST_CASE(quoted_boundary)
{
    content_type_t ct = parse_content_type("multipart/mixed; boundary=\"simple boundary\"");
    BOOST_TEST(ct.is_multipart());
    BOOST_TEST(ct.type == "multipart");
    BOOST_TEST(ct.subtype == "mixed");
    BOOST_TEST(ct.boundary() == "simple boundary");
}


BOOST_AUTO_TEST_CASE(unquoted_parameters_in_any_order)
{
    content_type_t ct = parse_content_type("Multipart/Alternative; charset=us-ascii ;BOUNDARY=abc123 ");
    BOOST_TEST(ct.mime_type() == "multipart/alternative");
    BOOST_TEST(ct.boundary() == "abc123");
    BOOST_TEST(ct.charset() == "us-ascii");
    BOOST_TEST(ct.parameters.size() == 2u);
}


BOOST_AUTO_TEST_CASE(quoted_specials)
{
    content_type_t ct = parse_content_type("application/octet-stream; name=\"a \\\"b\\\".txt\"; boundary=\"x;y=z\"");
    BOOST_TEST(ct.parameter("name") == "a \"b\".txt");
    BOOST_TEST(ct.boundary() == "x;y=z");
}


BOOST_AUTO_TEST_CASE(defaults_and_malformed_values)
{
    content_type_t ct = parse_content_type("");
    BOOST_TEST(ct.mime_type() == "text/plain");
    BOOST_TEST(!ct.is_multipart());
    BOOST_TEST(ct.boundary().empty());

    ct = parse_content_type("/html");
    BOOST_TEST(ct.mime_type() == "text/plain");

    ct = parse_content_type("text");
    BOOST_TEST(ct.type == "text");
    BOOST_TEST(ct.subtype.empty());

    ct = parse_content_type("text/plain; flowed; charset=utf-8");
    BOOST_TEST(ct.parameters.size() == 1u);
    BOOST_TEST(ct.charset() == "utf-8");
}


/**
RFC 2231 continuations are joined by section number and their extended sections are percent decoded.
**/
BOOST_AUTO_TEST_CASE(parameter_continuations)
{
    content_disposition_t cd = parse_content_disposition(
        "attachment; filename*1=\".txt\"; filename*0*=UTF-8''caf%C3%A9");
    BOOST_TEST(cd.is_attachment());
    BOOST_TEST(cd.filename() == "caf\xC3\xA9.txt");

    content_type_t ct = parse_content_type("message/external-body; access-type=URL;\r\n"
        " URL*0=\"ftp://\"; URL*1=\"cs.utk.edu/pub/moore/bulk-mailer/bulk-mailer.tar\"");
    BOOST_TEST(ct.parameter("url") == "ftp://cs.utk.edu/pub/moore/bulk-mailer/bulk-mailer.tar");
    BOOST_TEST(ct.parameter("access-type") == "URL");
}


BOOST_AUTO_TEST_CASE(extended_value)
{
    content_type_t ct = parse_content_type("application/x-stuff; title*=us-ascii'en-us'This%20is%20%2A%2A%2Afun%2A%2A%2A");
    BOOST_TEST(ct.parameter("title") == "This is ***fun***");

    content_disposition_t cd = parse_content_disposition("attachment; filename*=iso-8859-1'en'%A3%20rates");
    BOOST_TEST(cd.filename() == "\xA3 rates");
}


BOOST_AUTO_TEST_CASE(disposition)
{
    content_disposition_t cd = parse_content_disposition("ATTACHMENT; filename=\"report.pdf\"; size=1024");
    BOOST_TEST(cd.is_attachment());
    BOOST_TEST(cd.filename() == "report.pdf");
    BOOST_TEST(cd.parameters.at("size") == "1024");

    cd = parse_content_disposition("");
    BOOST_TEST(cd.type == "inline");
    BOOST_TEST(!cd.is_attachment());
}
