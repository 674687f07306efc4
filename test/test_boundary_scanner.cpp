/*

test_boundary_scanner.cpp
-------------------------

Copyright (C) 2025, Sylvain Guinebert (github.com/sguinebert).

Distributed under the FreeBSD license, see the accompanying file LICENSE or
copy at http://www.freebsd.org/copyright/freebsd-license.html.

*/


#define BOOST_TEST_MODULE boundary_scanner_test

#include <string>
#include <string_view>
#include <vector>
#include <boost/test/unit_test.hpp>
#include <mimexx/mime/boundary_scanner.hpp>
#include <mimexx/stream/input_cursor.hpp>


using mimexx::boundary_scanner;
using mimexx::input_cursor;
using mimexx::scan_status;
using std::string;


namespace
{

/**
Scanning the text fed in chunks of the given size, collecting the content and the delimiters as a readable trace.

Content is written as is, a delimiter as `<B>` and a final one as `<F>`. A delimiter of the enclosing scanner ends
the trace with `<E>` followed by the unconsumed rest of the text.
**/
string scan(std::string_view text, std::size_t chunk, bool bare_lf = true, bool line_start = false,
    const boundary_scanner* enclosing = nullptr)
{
    input_cursor cursor;
    boundary_scanner scanner("XYZ", bare_lf, enclosing);
    scanner.at_line_start(line_start);
    string trace;
    std::size_t offset = 0;

    while (true)
    {
        auto r = scanner.next(cursor);
        switch (r.status)
        {
            case scan_status::content:
                trace.append(r.data);
                break;
            case scan_status::boundary:
                trace += "<B>";
                break;
            case scan_status::final_boundary:
                trace += "<F>";
                break;
            case scan_status::enclosing_boundary:
                trace += "<E>";
                if (offset < text.size())
                    BOOST_REQUIRE(cursor.feed(text.substr(offset)));
                trace.append(cursor.window());
                return trace;
            case scan_status::need_more_input:
                if (offset < text.size())
                {
                    BOOST_REQUIRE(cursor.feed(text.substr(offset, chunk)));
                    offset += chunk;
                }
                else
                    cursor.finish();
                break;
            case scan_status::end_of_input:
                return trace;
        }
    }
}

} // namespace


BOOST_AUTO_TEST_CASE(delimiters_in_single_chunk)
{
    BOOST_TEST(scan("one\r\n--XYZ\r\ntwo\r\n--XYZ--\r\nepilogue", 1000) == "one<B>two<F>\r\nepilogue");
}


/**
Delimiters straddling any chunk edge are found the same way.
**/
BOOST_AUTO_TEST_CASE(delimiters_across_chunks)
{
    const string text = "one\r\n--XYZ\r\ntwo\r\n--XYZ--\r\nepilogue";
    for (std::size_t chunk = 1; chunk <= text.size(); ++chunk)
        BOOST_TEST(scan(text, chunk) == "one<B>two<F>\r\nepilogue");
}


BOOST_AUTO_TEST_CASE(false_match_is_content)
{
    BOOST_TEST(scan("a\r\n--XYZW\r\nb", 3) == "a\r\n--XYZW\r\nb");
    BOOST_TEST(scan("a\r\n--XY\r\nb", 1) == "a\r\n--XY\r\nb");
    BOOST_TEST(scan("a\r\n-XYZ\r\n", 2) == "a\r\n-XYZ\r\n");
}


BOOST_AUTO_TEST_CASE(partial_tail_is_content_at_end)
{
    BOOST_TEST(scan("body\r\n--XY", 1) == "body\r\n--XY");
    BOOST_TEST(scan("body\r\n--XYZ", 4) == "body\r\n--XYZ");
    BOOST_TEST(scan("body\r", 1) == "body\r");
}


BOOST_AUTO_TEST_CASE(first_delimiter_at_line_start)
{
    BOOST_TEST(scan("--XYZ\r\npart\r\n--XYZ--", 2, true, true) == "<B>part<F>");
    BOOST_TEST(scan("--XYZ\r\npart\r\n--XYZ--", 2, true, false) == "--XYZ\r\npart<F>");
}


BOOST_AUTO_TEST_CASE(transport_padding)
{
    BOOST_TEST(scan("a\r\n--XYZ  \t\r\nb\r\n--XYZ--", 1) == "a<B>b<F>");
}


/**
A delimiter of the enclosing boundary ends the region at any chunk size and stays in the cursor.
**/
BOOST_AUTO_TEST_CASE(enclosing_delimiter_left_in_cursor)
{
    boundary_scanner outer("OUT", true);
    const string text = "inner content\r\n--XYZ-not\r\n--OUTside\r\n--OUT\r\nnext part";
    for (std::size_t chunk = 1; chunk <= text.size(); ++chunk)
        BOOST_TEST(scan(text, chunk, true, false, &outer) == "inner content\r\n--XYZ-not\r\n--OUTside<E>\r\n--OUT\r\nnext part");

    BOOST_TEST(scan("--OUT--\r\nrest", 3, true, true, &outer) == "<E>--OUT--\r\nrest");
    BOOST_TEST(scan("a\r\n--XYZ\r\nb\r\n--OUT\r\n", 2, true, false, &outer) == "a<B>b<E>\r\n--OUT\r\n");
    BOOST_TEST(scan("a\r\n--OUT", 2, true, false, &outer) == "a\r\n--OUT");
}


BOOST_AUTO_TEST_CASE(own_delimiter_wins)
{
    boundary_scanner outer("XYZ", true);
    BOOST_TEST(scan("a\r\n--XYZ\r\nb\r\n--XYZ--", 1, true, false, &outer) == "a<B>b<F>");

    boundary_scanner root("OUT", true);
    boundary_scanner middle("MID", true, &root);
    boundary_scanner inner("XYZ", true, &middle);
    BOOST_TEST(inner.delimiter_owner("--XYZ") == &inner);
    BOOST_TEST(inner.delimiter_owner("--MID--") == &middle);
    BOOST_TEST(inner.delimiter_owner("--OUT ") == &root);
    BOOST_CHECK(inner.delimiter_owner("--OUTER") == nullptr);
    BOOST_CHECK(middle.delimiter_owner("--XYZ") == nullptr);
}


BOOST_AUTO_TEST_CASE(bare_line_feeds)
{
    BOOST_TEST(scan("a\n--XYZ\nb\n--XYZ--\n", 1, true) == "a<B>b<F>\n");
    BOOST_TEST(scan("a\n--XYZ\nb\n--XYZ--\n", 1, false) == "a\n--XYZ\nb\n--XYZ--\n");
}


BOOST_AUTO_TEST_CASE(withholds_undecided_bytes)
{
    input_cursor cursor;
    boundary_scanner scanner("XYZ", false);
    BOOST_REQUIRE(cursor.feed("content\r\n--XY"));

    auto r = scanner.next(cursor);
    BOOST_REQUIRE(r.status == scan_status::content);
    BOOST_TEST(r.data == "content");

    r = scanner.next(cursor);
    BOOST_TEST((r.status == scan_status::need_more_input));
    BOOST_TEST(cursor.window() == "\r\n--XY");

    BOOST_REQUIRE(cursor.feed("Z-"));
    r = scanner.next(cursor);
    BOOST_TEST((r.status == scan_status::need_more_input));

    BOOST_REQUIRE(cursor.feed("-"));
    r = scanner.next(cursor);
    BOOST_TEST((r.status == scan_status::final_boundary));
    BOOST_TEST(cursor.window().empty());
    BOOST_TEST(scanner.delimiters() == 1u);
}


BOOST_AUTO_TEST_CASE(delimiter_lines)
{
    boundary_scanner scanner("XYZ", true);
    BOOST_TEST(scanner.is_delimiter_line("--XYZ"));
    BOOST_TEST(scanner.is_delimiter_line("--XYZ--"));
    BOOST_TEST(scanner.is_delimiter_line("--XYZ  "));
    BOOST_TEST(!scanner.is_delimiter_line("--XYZW"));
    BOOST_TEST(!scanner.is_delimiter_line("XYZ"));
    BOOST_TEST(!scanner.is_delimiter_line("Content-Type: text/plain"));
}
