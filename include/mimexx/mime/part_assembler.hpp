/*

mime/part_assembler.hpp
-----------------------

Copyright (C) 2025, Sylvain Guinebert (github.com/sguinebert).

Distributed under the FreeBSD license, see the accompanying file LICENSE or
copy at http://www.freebsd.org/copyright/freebsd-license.html.

*/


#pragma once

#include <cstddef>
#include <memory>
#include <optional>
#include <string>
#include <string_view>
#include <utility>
#include <vector>
#include <mimexx/codec/transfer_decoder.hpp>
#include <mimexx/detail/log.hpp>
#include <mimexx/detail/output_sink.hpp>
#include <mimexx/detail/result.hpp>
#include <mimexx/export.hpp>
#include <mimexx/mime/boundary_scanner.hpp>
#include <mimexx/mime/content_type.hpp>
#include <mimexx/mime/header_parser.hpp>
#include <mimexx/mime/parser_options.hpp>
#include <mimexx/mime/part.hpp>
#include <mimexx/stream/input_cursor.hpp>


namespace mimexx
{


enum class event_type
{
    /**
    Header block of a part parsed, `event::header` is set.
    **/
    part_begin,

    /**
    Decoded bytes of the current opaque body, `event::data` is set.
    **/
    body_data,

    /**
    The current body failed to decode or has no usable structure, `event::failure` is set. The rest of the body is
    skipped.
    **/
    body_error,

    /**
    The current part reached its end.
    **/
    part_end,

    /**
    Every buffered byte was used, the caller has to feed the next chunk or finish the input.
    **/
    need_more_input,

    /**
    The root part ended, no further events follow.
    **/
    end_of_message
};


/**
Unit produced by a pull of the assembler.
**/
struct event
{
    event_type type = event_type::need_more_input;

    /**
    Nesting depth of the part the event belongs to, zero for the root.
    **/
    std::size_t depth = 0;

    /**
    Decoded bytes, valid until the next pull or feed.
    **/
    std::string_view data;

    std::optional<part_header> header;

    std::optional<error> failure;
};


/**
Pull driven assembler of the part tree.

Every pull produces one event of the depth first walk of the tree. The parts under construction form a stack; only
the innermost delimits the input at any time, either through the scanner of its parent multipart or, for the root,
through the end of the input.

The scanner of a nested multipart also stops at the delimiters of the multiparts enclosing it. When such a delimiter
comes before its final delimiter, the nested multipart gets an `unterminated_multipart` body error and is closed; the
delimiter is left for the multipart owning it, so the following siblings are parsed.
**/
class MIMEXX_EXPORT part_assembler
{
public:

    /**
    Creating the assembler for a message starting at the current cursor position.

    @param options Parser configuration.
    **/
    explicit part_assembler(const parser_options& options);

    part_assembler(const part_assembler&) = delete;

    part_assembler(part_assembler&&) = default;

    ~part_assembler() = default;

    part_assembler& operator=(const part_assembler&) = delete;

    part_assembler& operator=(part_assembler&&) = default;

    /**
    Producing the next event.

    @param cursor Input of the message.
    @return       Next event of the walk.
    @return       Error `truncated_headers`, `orphan_continuation` or `header_line_too_long` from the root header
                  block. In a nested part the last two are reported as a `body_error` of that part.
    @return       Error `missing_boundary_parameter` if the root is a multipart without boundary.
    @return       Error `unterminated_multipart` if the input ends before a final delimiter.
    **/
    result<event> next(input_cursor& cursor);

    /**
    Checking if the end of the message was reached.
    **/
    bool done() const
    {
        return finished_;
    }

    /**
    Number of parts under construction.
    **/
    std::size_t open_parts() const
    {
        return stack_.size();
    }

    /**
    Number of parts begun so far, the root included.
    **/
    std::size_t parts_begun() const
    {
        return parts_begun_;
    }

    static constexpr std::string_view CONTENT_TYPE_HEADER{"Content-Type"};

    static constexpr std::string_view CONTENT_TRANSFER_ENCODING_HEADER{"Content-Transfer-Encoding"};

    static constexpr std::string_view CONTENT_DISPOSITION_HEADER{"Content-Disposition"};

private:

    enum class frame_state {awaiting_headers, preamble, nested, streaming, discarding, epilogue, ending};

    /**
    How the region of a part ended.
    **/
    enum class region_end {none, delimiter, final_delimiter, enclosing_delimiter, end_of_input};

    enum class pull_status {data, need_more_input, ended};

    struct region_step
    {
        pull_status status;
        std::string_view data;
    };

    /**
    Part under construction.
    **/
    struct frame
    {
        std::size_t depth = 0;
        frame_state state = frame_state::awaiting_headers;

        /**
        The parent is a `multipart/digest`, the default media type is `message/rfc822`.
        **/
        bool digest_child = false;

        bool digest = false;
        std::unique_ptr<header_parser> parser;
        std::unique_ptr<boundary_scanner> scanner;
        std::optional<transfer_decoder> decoder;
        std::optional<error> pending_error;
        region_end end = region_end::none;
    };

    /**
    Parsing the header block of the innermost part and choosing how its body is read.
    **/
    result<event> begin_part(input_cursor& cursor);

    /**
    Pulling the next slice of the body of the innermost part.
    **/
    result<event> read_body(input_cursor& cursor);

    result<event> read_preamble(input_cursor& cursor);

    result<event> read_epilogue(input_cursor& cursor);

    /**
    Closing the innermost part and moving its parent to the next part or to its epilogue.
    **/
    event end_part();

    /**
    Pulling from the region that bounds the innermost part.

    @param cursor Input of the message.
    @return       Content of the region, the need for more input, or the end of the region.
    @return       Error `unterminated_multipart` if the input ends inside a nested region.
    **/
    result<region_step> pull_region(input_cursor& cursor);

    void push_child(bool digest_child);

    /**
    Setting where the scanners of the first `count` frames resume: at a line start, where an enclosing delimiter was
    left in the cursor, or in the middle of a line after a final delimiter.
    **/
    void hand_over(std::size_t count, bool line_start);

    result<event> fatal(error err);

    static event make_event(event_type type, std::size_t depth)
    {
        event e;
        e.type = type;
        e.depth = depth;
        return e;
    }

    parser_options options_;
    std::vector<frame> stack_;
    std::string decoded_;
    std::optional<error> pending_fatal_;
    std::optional<error> failure_;
    bool started_ = false;
    bool finished_ = false;
    std::size_t parts_begun_ = 0;
};


inline part_assembler::part_assembler(const parser_options& options) : options_(options)
{
}


result<event> inline part_assembler::next(input_cursor& cursor)
{
    if (failure_)
        return fail<event>(*failure_);
    if (pending_fatal_)
        return fatal(std::move(*pending_fatal_));
    if (finished_)
        return make_event(event_type::end_of_message, 0);

    if (!started_)
    {
        started_ = true;
        stack_.emplace_back();
    }

    while (true)
    {
        if (stack_.empty())
        {
            finished_ = true;
            MIMEXX_DEBUG("Message of " + std::to_string(parts_begun_) + " parts assembled, " +
                std::to_string(cursor.position()) + " bytes read.");
            return make_event(event_type::end_of_message, 0);
        }

        frame& f = stack_.back();
        if (f.pending_error && f.state != frame_state::awaiting_headers)
        {
            event e = make_event(event_type::body_error, f.depth);
            e.failure = std::move(f.pending_error);
            f.pending_error.reset();
            return e;
        }

        result<event> res = make_event(event_type::need_more_input, f.depth);
        switch (f.state)
        {
            case frame_state::awaiting_headers:
                res = begin_part(cursor);
                break;

            case frame_state::preamble:
                res = read_preamble(cursor);
                break;

            case frame_state::streaming:
            case frame_state::discarding:
                res = read_body(cursor);
                break;

            case frame_state::epilogue:
                res = read_epilogue(cursor);
                break;

            case frame_state::ending:
                return end_part();

            case frame_state::nested:
                return fatal(error(error_code::internal_error, "Multipart left without an active part.", cursor.position()));
        }

        if (!res)
            return res;
        // An empty body_data means the step made progress without output.
        if (res->type != event_type::body_data || !res->data.empty())
            return res;
    }
}


result<event> inline part_assembler::begin_part(input_cursor& cursor)
{
    const std::size_t k = stack_.size() - 1;
    boundary_scanner* enclosing = k > 0 ? &*stack_[k - 1].scanner : nullptr;
    frame& f = stack_[k];
    if (!f.parser)
        f.parser = std::make_unique<header_parser>(options_, enclosing);

    auto parsed = f.parser->parse(cursor);
    std::optional<error> header_error;
    if (!parsed)
    {
        if (k == 0)
            return fatal(parsed.error());
        if (parsed.error().is(error_code::truncated_headers))
            return fatal(error(error_code::unterminated_multipart,
                "Input ended inside the header block of a part of `" + enclosing->boundary() + "`.", cursor.position()));
        header_error = parsed.error();
    }
    else if (*parsed == header_status::need_more_input)
        return make_event(event_type::need_more_input, f.depth);

    part_header info;
    info.headers = f.parser->take_headers();
    const bool stopped = f.parser->stopped_at_delimiter();
    f.parser.reset();

    if (const header_field* ct = info.headers.find(CONTENT_TYPE_HEADER))
        info.content_type = parse_content_type(ct->raw_value);
    else if (f.digest_child)
    {
        info.content_type.type = "message";
        info.content_type.subtype = "rfc822";
    }
    if (const header_field* cte = info.headers.find(CONTENT_TRANSFER_ENCODING_HEADER))
        info.encoding = parse_transfer_encoding(cte->raw_value);
    if (const header_field* cd = info.headers.find(CONTENT_DISPOSITION_HEADER))
        info.content_disposition = parse_content_disposition(cd->raw_value);

    if (enclosing != nullptr)
        enclosing->at_line_start(true);

    if (header_error)
    {
        MIMEXX_WARN(header_error->to_string() + " Skipping the part.");
        f.pending_error = std::move(header_error);
        f.state = frame_state::discarding;
    }
    else if (info.content_type.is_multipart() && stopped)
        MIMEXX_WARN("Multipart header block cut by a delimiter, reading the part as opaque.");
    else if (info.content_type.is_multipart() && f.depth >= options_.max_depth)
        MIMEXX_WARN("Multipart nested deeper than " + std::to_string(options_.max_depth) + " levels, reading it as opaque.");
    else if (info.content_type.is_multipart() && info.content_type.boundary().empty())
    {
        error err(error_code::missing_boundary_parameter,
            "Content type `" + info.content_type.mime_type() + "` has no boundary parameter.", cursor.position());
        if (k == 0)
        {
            info.multipart = true;
            pending_fatal_ = std::move(err);
        }
        else
        {
            MIMEXX_WARN(err.message() + " Skipping the part.");
            f.pending_error = std::move(err);
            f.state = frame_state::discarding;
        }
    }
    else if (info.content_type.is_multipart())
    {
        info.multipart = true;
        f.scanner = std::make_unique<boundary_scanner>(std::string(info.content_type.boundary()), options_.allow_bare_lf,
            enclosing);
        f.scanner->at_line_start(true);
        f.digest = (info.content_type.subtype == "digest");
        f.state = frame_state::preamble;
    }

    if (f.state == frame_state::awaiting_headers)
    {
        f.decoder.emplace(info.encoding, options_.strict_quoted_printable);
        f.state = frame_state::streaming;
    }

    ++parts_begun_;
    MIMEXX_TRACE_EVENT(assembler, "part " + info.content_type.mime_type() + " at depth " + std::to_string(f.depth) +
        ", encoding " + std::string(to_string(info.encoding)));

    event e = make_event(event_type::part_begin, f.depth);
    e.header = std::move(info);
    return e;
}


result<event> inline part_assembler::read_body(input_cursor& cursor)
{
    auto step = pull_region(cursor);
    if (!step)
        return fail<event>(step.error());

    frame& f = stack_.back();
    if (step->status == pull_status::need_more_input)
        return make_event(event_type::need_more_input, f.depth);

    event e = make_event(event_type::body_data, f.depth);
    if (f.state == frame_state::discarding)
    {
        if (step->status == pull_status::ended)
            f.state = frame_state::ending;
        return e;
    }

    decoded_.clear();
    detail::string_sink sink(decoded_);
    result_void res = ok();
    if (step->status == pull_status::data)
        res = f.decoder->decode(step->data, sink);
    else
    {
        res = f.decoder->finish(sink);
        f.state = frame_state::ending;
    }

    if (!res)
    {
        MIMEXX_WARN("Body at depth " + std::to_string(f.depth) + " failed to decode after " +
            std::to_string(sink.written()) + " bytes of the slice: " + res.error().to_string());
        f.pending_error = res.error();
        if (f.state != frame_state::ending)
            f.state = frame_state::discarding;
    }

    e.data = decoded_;
    return e;
}


result<event> inline part_assembler::read_preamble(input_cursor& cursor)
{
    frame& f = stack_.back();
    scan_result r = f.scanner->next(cursor);
    switch (r.status)
    {
        case scan_status::content:
            return make_event(event_type::body_data, f.depth);

        case scan_status::need_more_input:
            return make_event(event_type::need_more_input, f.depth);

        case scan_status::end_of_input:
            return fatal(error(error_code::unterminated_multipart,
                "Input ended before the first delimiter of `" + f.scanner->boundary() + "`.", cursor.position()));

        case scan_status::boundary:
        {
            f.state = frame_state::nested;
            const bool digest = f.digest;
            push_child(digest);
            return make_event(event_type::body_data, stack_.back().depth);
        }

        case scan_status::final_boundary:
            MIMEXX_DEBUG("Multipart `" + f.scanner->boundary() + "` has no parts.");
            f.state = frame_state::epilogue;
            hand_over(stack_.size() - 1, false);
            return make_event(event_type::body_data, f.depth);

        case scan_status::enclosing_boundary:
        {
            error err(error_code::unterminated_multipart,
                "Delimiter of an enclosing multipart before the first delimiter of `" + f.scanner->boundary() + "`.",
                cursor.position());
            MIMEXX_WARN(err.to_string());
            f.pending_error = std::move(err);
            f.state = frame_state::discarding;
            hand_over(stack_.size() - 1, f.scanner->at_line_start());
            return make_event(event_type::body_data, f.depth);
        }
    }
    return make_event(event_type::body_data, f.depth);
}


result<event> inline part_assembler::read_epilogue(input_cursor& cursor)
{
    auto step = pull_region(cursor);
    if (!step)
        return fail<event>(step.error());

    frame& f = stack_.back();
    if (step->status == pull_status::need_more_input)
        return make_event(event_type::need_more_input, f.depth);
    if (step->status == pull_status::ended)
        f.state = frame_state::ending;
    return make_event(event_type::body_data, f.depth);
}


event inline part_assembler::end_part()
{
    event e = make_event(event_type::part_end, stack_.back().depth);
    const region_end end = stack_.back().end;
    stack_.pop_back();

    if (!stack_.empty())
    {
        frame& parent = stack_.back();
        if (end == region_end::delimiter)
            push_child(parent.digest);
        else if (end == region_end::enclosing_delimiter)
            parent.state = frame_state::discarding;
        else
            parent.state = frame_state::epilogue;
    }
    return e;
}


result<part_assembler::region_step> inline part_assembler::pull_region(input_cursor& cursor)
{
    const std::size_t k = stack_.size() - 1;
    frame& f = stack_[k];

    if (k == 0)
    {
        std::string_view window = cursor.window();
        if (!window.empty())
        {
            cursor.consume(window.size());
            return region_step{pull_status::data, window};
        }
        if (cursor.at_end())
        {
            f.end = region_end::end_of_input;
            return region_step{pull_status::ended, {}};
        }
        return region_step{pull_status::need_more_input, {}};
    }

    boundary_scanner& scanner = *stack_[k - 1].scanner;
    scan_result r = scanner.next(cursor);
    switch (r.status)
    {
        case scan_status::content:
            return region_step{pull_status::data, r.data};

        case scan_status::need_more_input:
            return region_step{pull_status::need_more_input, {}};

        case scan_status::boundary:
            f.end = region_end::delimiter;
            return region_step{pull_status::ended, {}};

        case scan_status::final_boundary:
            f.end = region_end::final_delimiter;
            hand_over(k - 1, false);
            return region_step{pull_status::ended, {}};

        case scan_status::enclosing_boundary:
        {
            error err(error_code::unterminated_multipart,
                "Delimiter of an enclosing multipart before the final delimiter of `" + scanner.boundary() + "`.",
                cursor.position());
            MIMEXX_WARN(err.to_string());
            stack_[k - 1].pending_error = std::move(err);
            f.end = region_end::enclosing_delimiter;
            hand_over(k - 1, scanner.at_line_start());
            return region_step{pull_status::ended, {}};
        }

        case scan_status::end_of_input:
            break;
    }

    auto err = fatal(error(error_code::unterminated_multipart,
        "Input ended before the final delimiter of `" + scanner.boundary() + "`.", cursor.position()));
    return fail<region_step>(err.error());
}


void inline part_assembler::push_child(bool digest_child)
{
    frame child;
    child.depth = stack_.back().depth + 1;
    child.digest_child = digest_child;
    stack_.push_back(std::move(child));
}


void inline part_assembler::hand_over(std::size_t count, bool line_start)
{
    for (std::size_t i = 0; i < count; ++i)
        stack_[i].scanner->at_line_start(line_start);
}


result<event> inline part_assembler::fatal(error err)
{
    MIMEXX_ERROR(err.to_string());
    failure_ = err;
    pending_fatal_.reset();
    return fail<event>(std::move(err));
}


} // namespace mimexx
