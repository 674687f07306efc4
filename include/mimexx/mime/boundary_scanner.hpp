/*

mime/boundary_scanner.hpp
-------------------------

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
#include <mimexx/detail/ascii.hpp>
#include <mimexx/detail/log.hpp>
#include <mimexx/export.hpp>
#include <mimexx/stream/input_cursor.hpp>


namespace mimexx
{


/**
Outcome of a single scanning step.
**/
enum class scan_status
{
    /**
    Bytes of the region before the next delimiter.
    **/
    content,

    /**
    Delimiter line, consumed through its line end.
    **/
    boundary,

    /**
    Closing delimiter, consumed through its trailing `--`.
    **/
    final_boundary,

    /**
    The buffered bytes might start a delimiter, more input is needed to decide.
    **/
    need_more_input,

    /**
    Delimiter of an enclosing multipart, left in the cursor for the scanner owning it.
    **/
    enclosing_boundary,

    /**
    The input ended and every byte was consumed.
    **/
    end_of_input
};


struct scan_result
{
    scan_status status;

    /**
    Content bytes, set for `scan_status::content` only and valid until the next feed of the cursor.
    **/
    std::string_view data;
};


/**
Locating the delimiter lines of a multipart body in the cursor.

A delimiter is a line break, `--` and the boundary token, followed by a line break or by `--` for the final one.
Transport padding (spaces and tabs) between the token and the line break is accepted. The line break before the
delimiter belongs to it, so it is never part of the content. Bytes which could still turn into a delimiter are
never consumed tentatively: they are withheld until enough input decides, or reported as content at the end of
the input.

The scanner of a nested multipart is chained to the scanner of the multipart enclosing it. A delimiter of any
enclosing boundary ends the nested region too: it is reported as `enclosing_boundary` and not consumed.
**/
class MIMEXX_EXPORT boundary_scanner
{
public:

    /**
    Creating the scanner.

    @param boundary      Boundary token, not empty.
    @param allow_bare_lf Accepting LF alone as the line break around a delimiter.
    @param enclosing     Scanner of the enclosing multipart, null for the root one. It must outlive this scanner.
    **/
    boundary_scanner(std::string boundary, bool allow_bare_lf, const boundary_scanner* enclosing = nullptr)
        : boundary_(std::move(boundary)), allow_bare_lf_(allow_bare_lf), enclosing_(enclosing)
    {
    }

    /**
    Producing the next scanning step.

    @param cursor Input positioned inside the region delimited by the boundary.
    @return       Content span, delimiter, or the need for more input.
    **/
    scan_result next(input_cursor& cursor)
    {
        std::string_view window = cursor.window();
        if (window.empty())
            return scan_result{cursor.at_end() ? scan_status::end_of_input : scan_status::need_more_input, {}};

        const bool end = cursor.at_end();
        if (at_line_start_)
        {
            match m = find_delimiter(window, 0, 0);
            if (m.type == match_type::partial && !end)
                return scan_result{scan_status::need_more_input, {}};
            if (m.type != match_type::none && m.type != match_type::partial)
                return take_delimiter(cursor, m);
        }

        std::string_view::size_type pos = 0;
        while ((pos = find_line_break(window, pos)) != std::string_view::npos)
        {
            std::size_t prefix = (window[pos] == codec::CR_CHAR) ? 2 : 1;
            match m = find_delimiter(window, pos, prefix);
            if (m.type == match_type::none || (m.type == match_type::partial && end))
            {
                ++pos;
                continue;
            }

            if (pos > 0)
                return take_content(cursor, pos);
            if (m.type == match_type::partial)
                return scan_result{scan_status::need_more_input, {}};
            return take_delimiter(cursor, m);
        }

        return take_content(cursor, window.size());
    }

    /**
    Checking if a complete line, without its line break, is a delimiter of this boundary.

    @param line Line to check.
    @return     True for `--token` or `--token--`, with optional transport padding.
    **/
    bool is_delimiter_line(std::string_view line) const
    {
        if (line.size() < boundary_.size() + 2 || line.substr(0, 2) != DELIMITER_DASHES)
            return false;
        if (line.substr(2, boundary_.size()) != boundary_)
            return false;
        std::string_view rest = line.substr(2 + boundary_.size());
        if (rest.substr(0, 2) == DELIMITER_DASHES)
            return true;
        return detail::trim_wsp_left(rest).empty();
    }

    /**
    Finding the scanner, this one or an enclosing one, whose delimiter is the given line.

    @param line Complete line without its line break.
    @return     Scanner owning the delimiter, null if the line is not a delimiter.
    **/
    const boundary_scanner* delimiter_owner(std::string_view line) const
    {
        for (const boundary_scanner* s = this; s != nullptr; s = s->enclosing_)
            if (s->is_delimiter_line(line))
                return s;
        return nullptr;
    }

    const boundary_scanner* enclosing() const
    {
        return enclosing_;
    }

    /**
    Allowing the next delimiter at the current position, without a preceding line break.

    Set after the header block of the part owning the boundary, where the first delimiter may follow the blank line.
    **/
    void at_line_start(bool flag)
    {
        at_line_start_ = flag;
    }

    bool at_line_start() const
    {
        return at_line_start_;
    }

    const std::string& boundary() const
    {
        return boundary_;
    }

    /**
    Number of delimiters found so far, final one included.
    **/
    std::size_t delimiters() const
    {
        return delimiters_;
    }

    /**
    Longest transport padding accepted after the token.
    **/
    static constexpr std::size_t MAX_PADDING = 998;

private:

    enum class match_type {none, partial, boundary, final_boundary, enclosing};

    struct match
    {
        match_type type;
        std::size_t length;
    };

    std::string_view::size_type find_line_break(std::string_view window, std::string_view::size_type from) const
    {
        if (allow_bare_lf_)
            return window.find_first_of("\r\n", from);
        return window.find(codec::CR_CHAR, from);
    }

    /**
    Matching a delimiter of this boundary, or of an enclosing one, at the given position.

    A complete delimiter of this boundary wins; otherwise a candidate still partial for any boundary is partial.
    **/
    match find_delimiter(std::string_view window, std::size_t pos, std::size_t prefix) const
    {
        match m = match_at(window, pos, prefix);
        if (m.type == match_type::boundary || m.type == match_type::final_boundary)
            return m;

        bool partial = (m.type == match_type::partial);
        for (const boundary_scanner* s = enclosing_; s != nullptr; s = s->enclosing_)
        {
            match e = s->match_at(window, pos, prefix);
            if (e.type == match_type::boundary || e.type == match_type::final_boundary)
                return match{match_type::enclosing, 0};
            partial = partial || e.type == match_type::partial;
        }
        return match{partial ? match_type::partial : match_type::none, 0};
    }

    /**
    Matching a delimiter at the given position.

    @param window Buffered bytes.
    @param pos    Start of the candidate.
    @param prefix Length of the line break before the dashes, zero at the start of a line.
    @return       Type of the match and the number of bytes the delimiter spans.
    **/
    match match_at(std::string_view window, std::size_t pos, std::size_t prefix) const
    {
        std::size_t i = pos;
        const std::size_t size = window.size();

        auto expect = [&](std::string_view text) -> match_type
        {
            for (char ch : text)
            {
                if (i >= size)
                    return match_type::partial;
                if (window[i] != ch)
                    return match_type::none;
                ++i;
            }
            return match_type::boundary;
        };

        match_type step = match_type::boundary;
        if (prefix == 2)
            step = expect(codec::END_OF_LINE);
        else if (prefix == 1)
            step = expect(LF_STR);
        if (step == match_type::boundary)
            step = expect(DELIMITER_DASHES);
        if (step == match_type::boundary)
            step = expect(boundary_);
        if (step != match_type::boundary)
            return match{step, 0};

        if (i >= size)
            return match{match_type::partial, 0};
        if (window[i] == codec::MINUS_CHAR)
        {
            if (i + 1 >= size)
                return match{match_type::partial, 0};
            if (window[i + 1] == codec::MINUS_CHAR)
                return match{match_type::final_boundary, i + 2 - pos};
            return match{match_type::none, 0};
        }

        std::size_t padding = 0;
        while (i < size && detail::is_wsp(window[i]))
        {
            if (++padding > MAX_PADDING)
                return match{match_type::none, 0};
            ++i;
        }
        if (i >= size)
            return match{match_type::partial, 0};
        if (window[i] == codec::CR_CHAR)
        {
            if (i + 1 >= size)
                return match{match_type::partial, 0};
            if (window[i + 1] == codec::LF_CHAR)
                return match{match_type::boundary, i + 2 - pos};
            return match{match_type::none, 0};
        }
        if (window[i] == codec::LF_CHAR && allow_bare_lf_)
            return match{match_type::boundary, i + 1 - pos};
        return match{match_type::none, 0};
    }

    scan_result take_content(input_cursor& cursor, std::size_t length)
    {
        std::string_view data = cursor.window().substr(0, length);
        cursor.consume(length);
        at_line_start_ = false;
        return scan_result{scan_status::content, data};
    }

    scan_result take_delimiter(input_cursor& cursor, const match& m)
    {
        if (m.type == match_type::enclosing)
        {
            MIMEXX_TRACE_EVENT(scanner, "enclosing delimiter inside `" + boundary_ + "` at " +
                std::to_string(cursor.position()));
            return scan_result{scan_status::enclosing_boundary, {}};
        }

        const bool final = (m.type == match_type::final_boundary);
        cursor.consume(m.length);
        at_line_start_ = false;
        ++delimiters_;
        MIMEXX_TRACE_EVENT(scanner, std::string(final ? "final delimiter `" : "delimiter `") + boundary_ +
            "` ending at " + std::to_string(cursor.position()));
        return scan_result{final ? scan_status::final_boundary : scan_status::boundary, {}};
    }

    static constexpr std::string_view DELIMITER_DASHES{"--"};

    static constexpr std::string_view LF_STR{"\n"};

    std::string boundary_;
    bool allow_bare_lf_;
    const boundary_scanner* enclosing_;
    bool at_line_start_ = false;
    std::size_t delimiters_ = 0;
};


} // namespace mimexx
