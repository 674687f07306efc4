/*

mime/header_parser.hpp
----------------------

Copyright (C) 2025, Sylvain Guinebert (github.com/sguinebert).

Distributed under the FreeBSD license, see the accompanying file LICENSE or
copy at http://www.freebsd.org/copyright/freebsd-license.html.

*/


#pragma once

#include <cstddef>
#include <string>
#include <string_view>
#include <utility>
#include <mimexx/codec/codec.hpp>
#include <mimexx/codec/q_codec.hpp>
#include <mimexx/detail/ascii.hpp>
#include <mimexx/detail/log.hpp>
#include <mimexx/detail/result.hpp>
#include <mimexx/export.hpp>
#include <mimexx/mime/boundary_scanner.hpp>
#include <mimexx/mime/header.hpp>
#include <mimexx/mime/parser_options.hpp>
#include <mimexx/stream/input_cursor.hpp>


namespace mimexx
{


enum class header_status {complete, need_more_input};


/**
Incremental parser of a header block.

Lines are consumed from the cursor only once complete. A line starting with a space or a tab continues the previous
field. The block ends with the blank line, which is consumed too.
**/
class MIMEXX_EXPORT header_parser
{
public:

    /**
    Creating the parser.

    @param options   Line end and line length settings.
    @param enclosing Scanner of the multipart the block belongs to, null for the root header block. The block also
                     stops at a delimiter of the multiparts enclosing that one.
    **/
    explicit header_parser(const parser_options& options, const boundary_scanner* enclosing = nullptr);

    /**
    Consuming the complete lines available in the cursor.

    @param cursor Input positioned inside the header block.
    @return       `complete` once the block ended, `need_more_input` if the blank line was not reached yet.
    @return       Error `truncated_headers` if the input ends before the blank line.
    @return       Error `orphan_continuation` for a continuation line without a preceding field.
    @return       Error `header_line_too_long` for a line longer than the configured limit.
    **/
    result<header_status> parse(input_cursor& cursor);

    const header_block& headers() const
    {
        return headers_;
    }

    /**
    Moving the parsed fields out of the parser.
    **/
    header_block take_headers()
    {
        return std::move(headers_);
    }

    /**
    Checking if the block ended at a delimiter of the enclosing multipart instead of a blank line.

    The delimiter is left in the cursor for the enclosing scanner.
    **/
    bool stopped_at_delimiter() const
    {
        return stopped_at_delimiter_;
    }

    /**
    Number of header bytes consumed, line breaks and the blank line included.
    **/
    std::size_t bytes_consumed() const
    {
        return bytes_consumed_;
    }

private:

    /**
    Locating the end of the next line.

    @param window Buffered bytes.
    @param line   Line without its line break.
    @return       Number of bytes spanned by the line and its line break, zero if the line is not complete.
    **/
    std::size_t next_line(std::string_view window, std::string_view& line) const;

    /**
    Appending the pending field to the block after decoding its value.
    **/
    void flush_field();

    result<header_status> failed(error_code code, std::string message, const input_cursor& cursor);

    parser_options options_;
    const boundary_scanner* enclosing_;
    q_codec q_codec_;
    header_block headers_;
    std::string pending_name_;
    std::string pending_value_;
    bool has_pending_ = false;
    bool stopped_at_delimiter_ = false;
    bool done_ = false;
    std::size_t bytes_consumed_ = 0;
};


inline header_parser::header_parser(const parser_options& options, const boundary_scanner* enclosing)
    : options_(options), enclosing_(enclosing)
{
}


result<header_status> inline header_parser::parse(input_cursor& cursor)
{
    if (done_)
        return header_status::complete;

    while (true)
    {
        std::string_view window = cursor.window();
        std::string_view line;
        const std::size_t span = next_line(window, line);

        if (span == 0)
        {
            if (options_.max_header_line > 0 && window.size() > options_.max_header_line)
                return failed(error_code::header_line_too_long,
                    "Header line exceeds " + std::to_string(options_.max_header_line) + " bytes.", cursor);
            if (cursor.at_end())
                return failed(error_code::truncated_headers, "Input ended inside the header block.", cursor);
            return header_status::need_more_input;
        }

        if (options_.max_header_line > 0 && line.size() > options_.max_header_line)
            return failed(error_code::header_line_too_long,
                "Header line exceeds " + std::to_string(options_.max_header_line) + " bytes.", cursor);

        if (line.empty())
        {
            flush_field();
            cursor.consume(span);
            bytes_consumed_ += span;
            done_ = true;
            return header_status::complete;
        }

        const boundary_scanner* owner = enclosing_ != nullptr ? enclosing_->delimiter_owner(line) : nullptr;
        if (owner != nullptr)
        {
            MIMEXX_WARN("Delimiter of `" + owner->boundary() + "` inside a header block, the part has no body.");
            flush_field();
            stopped_at_delimiter_ = true;
            done_ = true;
            return header_status::complete;
        }

        if (detail::is_wsp(line.front()))
        {
            if (!has_pending_)
                return failed(error_code::orphan_continuation, "Continuation line without a preceding field.", cursor);
            pending_value_ += codec::SPACE_CHAR;
            pending_value_.append(detail::trim_wsp_left(line));
            if (options_.max_header_line > 0 && pending_name_.size() + pending_value_.size() > options_.max_header_line)
                return failed(error_code::header_line_too_long,
                    "Folded header `" + pending_name_ + "` exceeds " + std::to_string(options_.max_header_line) + " bytes.",
                    cursor);
        }
        else
        {
            std::string_view::size_type colon = line.find(codec::COLON_CHAR);
            std::string_view name = colon == std::string_view::npos ? std::string_view() : detail::trim_view(line.substr(0, colon));
            if (!detail::is_valid_header_name(name))
            {
                if (log::detail::enabled(log::level::warn))
                    MIMEXX_WARN("Skipping malformed header line `" + std::string(line.substr(0, 80)) + "`.");
            }
            else
            {
                flush_field();
                pending_name_.assign(name);
                pending_value_.assign(detail::trim_wsp_left(line.substr(colon + 1)));
                has_pending_ = true;
            }
        }

        cursor.consume(span);
        bytes_consumed_ += span;
    }
}


std::size_t inline header_parser::next_line(std::string_view window, std::string_view& line) const
{
    if (options_.allow_bare_lf)
    {
        std::string_view::size_type lf = window.find(codec::LF_CHAR);
        if (lf == std::string_view::npos)
            return 0;
        line = window.substr(0, lf);
        if (!line.empty() && line.back() == codec::CR_CHAR)
            line.remove_suffix(1);
        return lf + 1;
    }

    std::string_view::size_type eol = window.find(codec::END_OF_LINE);
    if (eol == std::string_view::npos)
        return 0;
    line = window.substr(0, eol);
    return eol + codec::END_OF_LINE.size();
}


void inline header_parser::flush_field()
{
    if (!has_pending_)
        return;

    header_field field;
    field.name = std::move(pending_name_);
    field.raw_value = detail::trim_copy(pending_value_);
    string_t decoded = q_codec_.check_decode(field.raw_value);
    field.decoded_value = std::move(decoded.buffer);
    field.charset = std::move(decoded.charset);
    MIMEXX_TRACE_EVENT(headers, field.name + ": " + field.raw_value);
    headers_.add(std::move(field));

    pending_name_.clear();
    pending_value_.clear();
    has_pending_ = false;
}


result<header_status> inline header_parser::failed(error_code code, std::string message, const input_cursor& cursor)
{
    MIMEXX_DEBUG(message);
    return fail<header_status>(code, std::move(message), cursor.position());
}


} // namespace mimexx
