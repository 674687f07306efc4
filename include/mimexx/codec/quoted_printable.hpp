/*

quoted_printable.hpp
--------------------

Copyright (C) 2025, Sylvain Guinebert (github.com/sguinebert).

Distributed under the FreeBSD license, see the accompanying file LICENSE or
copy at http://www.freebsd.org/copyright/freebsd-license.html.

*/


#pragma once

#include <cstdint>
#include <string>
#include <string_view>
#include <mimexx/codec/codec.hpp>
#include <mimexx/detail/ascii.hpp>
#include <mimexx/detail/output_sink.hpp>
#include <mimexx/detail/result.hpp>
#include <mimexx/export.hpp>


namespace mimexx
{


/**
Quoted Printable decoder fed with arbitrary slices of the encoded text.

An escape sequence split between two slices is kept until its remaining characters arrive. Spaces and tabs between
the equal sign of a soft break and its line break are transport padding and dropped. In the Q codec mode used by
the encoded words, underscore stands for space and there are no soft line breaks.
**/
class MIMEXX_EXPORT quoted_printable : public codec
{
public:

    quoted_printable() : q_codec_mode_(false)
    {
    }

    /**
    Decoding the next slice of the encoded text.

    Without the strict mode, an equal sign which does not start an escape or a soft break is passed through.

    @param chunk Encoded text.
    @param sink  Destination of the decoded bytes.
    @return      Error `invalid_escape` for an equal sign and a hex digit followed by a non hex character.
    **/
    result_void update(std::string_view chunk, detail::output_sink& sink)
    {
        if (failed_)
            return fail(failure_);

        out_.clear();
        for (char ch : chunk)
        {
            ++position_;
            auto res = process(ch);
            if (!res)
            {
                flush(sink);
                return res;
            }
        }
        flush(sink);
        return ok();
    }

    /**
    Signaling the end of the encoded text.

    A trailing equal sign, with or without padding, is a soft break at the end of the text and contributes nothing,
    except in the Q codec mode where it is passed through.

    @param sink Destination of the decoded bytes.
    @return     Error `invalid_escape` if the text ends inside an escape.
    **/
    result_void finalize(detail::output_sink& sink)
    {
        if (failed_)
            return fail(failure_);

        if (pending_len_ == 2 && pending_[1] != CR_CHAR)
            return failed("Escape sequence cut by the end of the text.");
        if (pending_len_ > 0 && strict_mode_)
            return failed("Equal sign at the end of the text.");
        if (pending_len_ > 0 && q_codec_mode_)
            sink.write(std::string_view(pending_, pending_len_));
        pending_len_ = 0;
        padding_.clear();
        return ok();
    }

    void reset() noexcept
    {
        pending_len_ = 0;
        padding_.clear();
        position_ = 0;
        failed_ = false;
        failure_ = error();
    }

    /**
    Setting Q codec mode.

    @param mode True to set, false to unset.
    **/
    void q_codec_mode(bool mode)
    {
        q_codec_mode_ = mode;
    }

    /**
    Decoding a complete text.

    @param text   Encoded text.
    @param q_mode Whether to apply the Q codec variation.
    @return       Decoded bytes or the decoding error.
    **/
    static result<std::string> decode(std::string_view text, bool q_mode = false)
    {
        std::string decoded;
        detail::string_sink sink(decoded);
        quoted_printable qp;
        qp.q_codec_mode(q_mode);
        if (auto res = qp.update(text, sink); !res)
            return fail<std::string>(res.error());
        if (auto res = qp.finalize(sink); !res)
            return fail<std::string>(res.error());
        return decoded;
    }

private:

    result_void process(char ch)
    {
        if (pending_len_ == 0)
        {
            if (ch == EQUAL_CHAR)
                pending_[pending_len_++] = ch;
            else if (q_codec_mode_ && ch == UNDERSCORE_CHAR)
                out_ += SPACE_CHAR;
            else
                out_ += ch;
            return ok();
        }

        if (pending_len_ == 1)
        {
            if (!q_codec_mode_ && detail::is_wsp(ch) && padding_.size() < MAX_PADDING)
            {
                padding_ += ch;
                return ok();
            }
            if ((detail::is_hex_digit(ch) && padding_.empty()) || (!q_codec_mode_ && ch == CR_CHAR))
            {
                pending_[pending_len_++] = ch;
                return ok();
            }
            if (!q_codec_mode_ && ch == LF_CHAR)
            {
                // Soft break with a bare line feed.
                pending_len_ = 0;
                padding_.clear();
                return ok();
            }
            if (strict_mode_)
                return failed("Equal sign not followed by hex digits.");
            pending_len_ = 0;
            pass_stray();
            return process(ch);
        }

        if (pending_[1] == CR_CHAR)
        {
            pending_len_ = 0;
            if (ch == LF_CHAR)
            {
                padding_.clear();
                return ok();
            }
            if (strict_mode_)
                return failed("Equal sign followed by a bare carriage return.");
            pass_stray();
            out_ += CR_CHAR;
            return process(ch);
        }

        if (!detail::is_hex_digit(ch))
            return failed("Bad hexadecimal digit `" + std::string(1, ch) + "`.");
        pending_len_ = 0;
        out_ += static_cast<char>((detail::hex_value(pending_[1]) << 4) + detail::hex_value(ch));
        return ok();
    }

    /**
    Passing through an equal sign which turned out not to start an escape or a soft break, with its padding.
    **/
    void pass_stray()
    {
        out_ += EQUAL_CHAR;
        out_ += padding_;
        padding_.clear();
    }

    void flush(detail::output_sink& sink)
    {
        if (!out_.empty())
            sink.write(out_);
        out_.clear();
    }

    result_void failed(std::string message)
    {
        failed_ = true;
        failure_ = error(error_code::invalid_escape, std::move(message), position_);
        return fail(failure_);
    }

    /**
    Flag for the Q codec mode.
    **/
    bool q_codec_mode_;

    /**
    Escape characters waiting for the rest of the sequence.
    **/
    char pending_[2]{};
    std::size_t pending_len_{0};

    /**
    Spaces and tabs after a pending equal sign.
    **/
    std::string padding_;

    /**
    Longest padding held back after an equal sign, the length limit of an encoded line.
    **/
    static constexpr std::size_t MAX_PADDING = 76;

    std::uint64_t position_{0};
    std::string out_;
    bool failed_{false};
    error failure_;
};


} // namespace mimexx
