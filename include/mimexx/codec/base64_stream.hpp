/*

base64_stream.hpp
-----------------

Streaming Base64 decoder to avoid buffering entire payloads.

*/

#pragma once

#include <array>
#include <cstdint>
#include <string>
#include <string_view>

#include <mimexx/codec/base64.hpp>
#include <mimexx/detail/output_sink.hpp>
#include <mimexx/detail/result.hpp>

namespace mimexx
{

/**
Base64 decoder fed with arbitrary slices of the encoded text.

Line breaks and other whitespace are skipped. A padding character closes the current group, so concatenated
padded blocks decode one after the other. A group left incomplete without padding at `finalize()` is an error.
**/
class base64_stream_decoder
{
public:
    base64_stream_decoder() = default;

    result_void update(std::string_view chunk, detail::output_sink& sink)
    {
        if (failed_)
            return fail(failure_);

        out_.clear();
        for (char ch : chunk)
        {
            ++position_;
            if (is_skipped(ch))
                continue;

            if (ch == codec::EQUAL_CHAR)
            {
                if (pending_ == 0)
                    // Surplus padding of an already closed group.
                    continue;
                if (pending_ == 1)
                {
                    flush(sink);
                    return failed(error_code::truncated_base64, "Padding after a single Base64 character.");
                }
                emit_partial();
                pending_ = 0;
                continue;
            }

            const int value = base64::sextet(ch);
            if (value == base64::INVALID_SEXTET)
            {
                flush(sink);
                return failed(error_code::invalid_base64, "Bad character `" + std::string(1, ch) + "`.");
            }

            group_[pending_++] = static_cast<std::uint8_t>(value);
            if (pending_ == base64::SEXTETS_NO)
            {
                out_ += static_cast<char>((group_[0] << 2) | (group_[1] >> 4));
                out_ += static_cast<char>(((group_[1] & 0x0f) << 4) | (group_[2] >> 2));
                out_ += static_cast<char>(((group_[2] & 0x03) << 6) | group_[3]);
                pending_ = 0;
            }
        }
        flush(sink);
        return ok();
    }

    result_void finalize(detail::output_sink&)
    {
        if (failed_)
            return fail(failure_);
        if (pending_ != 0)
            return failed(error_code::truncated_base64,
                "Final Base64 group has " + std::to_string(pending_) + " characters and no padding.");
        return ok();
    }

    void reset() noexcept
    {
        pending_ = 0;
        position_ = 0;
        failed_ = false;
        failure_ = error();
    }

    /**
    Number of encoded characters consumed so far, including skipped whitespace.
    **/
    [[nodiscard]] std::uint64_t position() const noexcept { return position_; }

private:
    static constexpr bool is_skipped(char ch) noexcept
    {
        return ch == '\r' || ch == '\n' || ch == ' ' || ch == '\t' || ch == '\f' || ch == '\v';
    }

    void emit_partial()
    {
        out_ += static_cast<char>((group_[0] << 2) | (group_[1] >> 4));
        if (pending_ == 3)
            out_ += static_cast<char>(((group_[1] & 0x0f) << 4) | (group_[2] >> 2));
    }

    void flush(detail::output_sink& sink)
    {
        if (!out_.empty())
            sink.write(out_);
        out_.clear();
    }

    result_void failed(error_code code, std::string message)
    {
        failed_ = true;
        failure_ = error(code, std::move(message), position_);
        return fail(failure_);
    }

    std::array<std::uint8_t, base64::SEXTETS_NO> group_{};
    std::size_t pending_{0};
    std::uint64_t position_{0};
    std::string out_;
    bool failed_{false};
    error failure_;
};

/**
Decoding a complete Base64 text.

@param text Base64 encoded text, possibly split into lines.
@return     Decoded bytes or the decoding error.
**/
[[nodiscard]] inline result<std::string> decode_base64(std::string_view text)
{
    std::string decoded;
    detail::string_sink sink(decoded);
    base64_stream_decoder decoder;
    if (auto res = decoder.update(text, sink); !res)
        return fail<std::string>(res.error());
    if (auto res = decoder.finalize(sink); !res)
        return fail<std::string>(res.error());
    return decoded;
}

} // namespace mimexx
