/*

test_base64_stream.cpp
----------------------

Validate streaming Base64 decoding against the line oriented encoder, for any split of the encoded text.

*/

#define BOOST_TEST_MODULE base64_stream_test

#include <boost/test/unit_test.hpp>
#include <mimexx/codec/base64.hpp>
#include <mimexx/codec/base64_stream.hpp>
#include <mimexx/detail/output_sink.hpp>
#include <vector>
#include <string>
#include <algorithm>
#include <string_view>

using namespace mimexx;

namespace
{
std::string join_lines(const std::vector<std::string>& lines, std::string_view eol)
{
    std::string out;
    for (std::size_t i = 0; i < lines.size(); ++i)
    {
        if (i != 0)
            out.append(eol);
        out.append(lines[i]);
    }
    return out;
}

result<std::string> decode_streaming(std::string_view input, std::size_t chunk)
{
    base64_stream_decoder dec;
    std::string out;
    detail::string_sink sink(out);

    for (std::size_t offset = 0; offset < input.size(); offset += chunk)
    {
        auto res = dec.update(input.substr(offset, chunk), sink);
        if (!res)
            return fail<std::string>(res.error());
    }
    if (auto res = dec.finalize(sink); !res)
        return fail<std::string>(res.error());
    return out;
}

std::string sample(std::size_t size)
{
    std::string text;
    for (std::size_t i = 0; i < size; ++i)
        text += static_cast<char>((i * 37 + 11) % 256);
    return text;
}
} // namespace

BOOST_AUTO_TEST_CASE(stream_matches_classic_encoder)
{
    base64 codec(76);
    for (std::size_t size = 0; size <= 100; ++size)
    {
        const std::string input = sample(size);
        const std::string encoded = join_lines(codec.encode(input), codec::END_OF_LINE);
        for (std::size_t chunk : {1u, 3u, 4u, 7u, 80u})
        {
            auto res = decode_streaming(encoded, chunk);
            BOOST_REQUIRE(res);
            BOOST_TEST(*res == input);
        }
    }
}

BOOST_AUTO_TEST_CASE(whitespace_is_skipped)
{
    auto res = decode_base64("SGVs\r\nbG8s\n IFdv \tcmxk\r\nIQ==\r\n");
    BOOST_REQUIRE(res);
    BOOST_TEST(*res == "Hello, World!");
}

BOOST_AUTO_TEST_CASE(sink_receives_complete_groups_only)
{
    base64_stream_decoder dec;
    std::vector<std::string> writes;
    detail::fn_sink sink([&](std::string_view chunk) { writes.emplace_back(chunk); });

    BOOST_REQUIRE(dec.update("SGV", sink));
    BOOST_TEST(writes.empty());
    BOOST_REQUIRE(dec.update("s", sink));
    BOOST_REQUIRE(writes.size() == 1u);
    BOOST_TEST(writes[0] == "Hel");
    BOOST_REQUIRE(dec.update("bG8=", sink));
    BOOST_REQUIRE(dec.finalize(sink));
    BOOST_REQUIRE(writes.size() == 2u);
    BOOST_TEST(writes[1] == "lo");
    BOOST_TEST(sink.written() == 5u);
    BOOST_TEST(dec.position() == 8u);
}

BOOST_AUTO_TEST_CASE(concatenated_padded_blocks)
{
    auto res = decode_base64("SGk=SGk=");
    BOOST_REQUIRE(res);
    BOOST_TEST(*res == "HiHi");
}

BOOST_AUTO_TEST_CASE(invalid_character)
{
    auto res = decode_streaming("SGVs*G8=", 3);
    BOOST_REQUIRE(!res);
    BOOST_TEST(res.error().is(error_code::invalid_base64));
    BOOST_TEST(res.error().offset() == 5u);
}

BOOST_AUTO_TEST_CASE(decoder_stays_failed)
{
    base64_stream_decoder dec;
    std::string out;
    detail::string_sink sink(out);
    BOOST_REQUIRE(!dec.update("SG!!", sink));
    BOOST_TEST(!dec.update("bG8=", sink));
    BOOST_TEST(!dec.finalize(sink));

    dec.reset();
    BOOST_REQUIRE(dec.update("bG8=", sink));
    BOOST_REQUIRE(dec.finalize(sink));
    BOOST_TEST(out == "lo");
}

BOOST_AUTO_TEST_CASE(truncated_group)
{
    auto res = decode_base64("SGVsbG");
    BOOST_REQUIRE(!res);
    BOOST_TEST(res.error().is(error_code::truncated_base64));

    res = decode_base64("SGVsbA===");
    BOOST_REQUIRE(res);
    BOOST_TEST(*res == "Hell");

    res = decode_base64("S===");
    BOOST_REQUIRE(!res);
    BOOST_TEST(res.error().is(error_code::truncated_base64));
}
