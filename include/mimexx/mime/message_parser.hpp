/*

mime/message_parser.hpp
-----------------------

Copyright (C) 2025, Sylvain Guinebert (github.com/sguinebert).

Distributed under the FreeBSD license, see the accompanying file LICENSE or
copy at http://www.freebsd.org/copyright/freebsd-license.html.

*/


#pragma once

#include <algorithm>
#include <cstddef>
#include <string_view>
#include <utility>
#include <vector>
#include <mimexx/detail/log.hpp>
#include <mimexx/detail/result.hpp>
#include <mimexx/export.hpp>
#include <mimexx/mime/parser_options.hpp>
#include <mimexx/mime/part.hpp>
#include <mimexx/mime/part_assembler.hpp>
#include <mimexx/stream/input_cursor.hpp>


namespace mimexx
{


/**
Streaming decoder of a whole message.

The caller feeds the chunks as they arrive and pulls events until `need_more_input`:

@code
message_parser parser;
parser.feed(chunk);
while (true)
{
    auto ev = parser.next();
    if (!ev || ev->type == event_type::need_more_input || ev->type == event_type::end_of_message)
        break;
    // use the event
}
@endcode

A root without `Content-Type` is a `text/plain` opaque body with the identity encoding.
**/
class MIMEXX_EXPORT message_parser
{
public:

    explicit message_parser(parser_options options = parser_options())
        : options_(options), cursor_(options.dot_unstuffing), assembler_(options_)
    {
    }

    message_parser(const message_parser&) = delete;

    message_parser(message_parser&&) = default;

    ~message_parser() = default;

    message_parser& operator=(const message_parser&) = delete;

    message_parser& operator=(message_parser&&) = default;

    /**
    Appending the next chunk of the message.

    @param chunk Bytes of any length.
    @return      Error `invalid_state` after `finish()`.
    **/
    result_void feed(std::string_view chunk)
    {
        return cursor_.feed(chunk);
    }

    /**
    Signaling the end of the message.
    **/
    void finish() noexcept
    {
        cursor_.finish();
    }

    /**
    Pulling the next event.

    @return Event, or the fatal error which stopped the parsing. The same error is returned by the later pulls.
    **/
    result<event> next()
    {
        return assembler_.next(cursor_);
    }

    bool done() const
    {
        return assembler_.done();
    }

    const input_cursor& cursor() const
    {
        return cursor_;
    }

    const parser_options& options() const
    {
        return options_;
    }

private:

    parser_options options_;
    input_cursor cursor_;
    part_assembler assembler_;
};


/**
Collecting the events of a parser into the message tree.
**/
class MIMEXX_EXPORT message_builder
{
public:

    message_builder() = default;

    message_builder(const message_builder&) = delete;

    message_builder& operator=(const message_builder&) = delete;

    /**
    Applying an event to the tree.

    @param ev Event pulled from the parser.
    **/
    void on_event(event& ev)
    {
        switch (ev.type)
        {
            case event_type::part_begin:
                begin(std::move(*ev.header));
                break;

            case event_type::body_data:
                if (!open_.empty())
                    if (opaque_body* ob = open_.back()->opaque())
                        ob->data.append(ev.data);
                break;

            case event_type::body_error:
                if (!open_.empty())
                    open_.back()->failure = std::move(ev.failure);
                break;

            case event_type::part_end:
                end();
                break;

            case event_type::end_of_message:
                msg_.finished(true);
                break;

            case event_type::need_more_input:
                break;
        }
    }

    /**
    Attaching a fatal error to the part under construction and to the message.

    @param err Error returned by the parser.
    **/
    void on_failure(const error& err)
    {
        if (!open_.empty())
            open_.back()->failure = err;
        msg_.fatal(err);
        open_.clear();
    }

    /**
    Moving the message out, the builder is left empty.
    **/
    message take()
    {
        open_.clear();
        return std::move(msg_);
    }

    const message& current() const
    {
        return msg_;
    }

private:

    void begin(part_header header)
    {
        part* target = nullptr;
        if (open_.empty())
            target = &msg_;
        else
        {
            auto* mp = std::get_if<multipart_body>(&open_.back()->body);
            if (mp == nullptr)
                return;
            mp->parts.emplace_back();
            target = &mp->parts.back();
        }

        static_cast<part_header&>(*target) = std::move(header);
        if (target->multipart)
            target->body = multipart_body();
        else
            target->body = opaque_body();
        open_.push_back(target);
    }

    void end()
    {
        if (open_.empty())
            return;
        part* p = open_.back();
        if (opaque_body* ob = p->opaque())
            ob->complete = true;
        else
            std::get<multipart_body>(p->body).complete = true;
        open_.pop_back();
    }

    message msg_;

    /**
    Parts under construction, the innermost last.
    **/
    std::vector<part*> open_;
};


/**
Pulling every available event of the parser into the builder.

@param parser  Parser fed with input.
@param builder Tree under construction.
@return        Error which stopped the parser, already attached to the tree.
**/
inline result_void drain(message_parser& parser, message_builder& builder)
{
    while (true)
    {
        auto ev = parser.next();
        if (!ev)
        {
            builder.on_failure(ev.error());
            return fail(ev.error());
        }
        builder.on_event(*ev);
        if (ev->type == event_type::need_more_input || ev->type == event_type::end_of_message)
            return ok();
    }
}


/**
Parsing a buffered message into its tree.

@param text       Whole message.
@param options    Parser configuration.
@param chunk_size Size of the chunks the text is fed in, zero for a single chunk.
@return           Message tree; a fatal error is reported by `message::error_state()` and the parts parsed before it
                  are kept.
**/
inline message parse_message(std::string_view text, const parser_options& options = parser_options(),
    std::size_t chunk_size = 0)
{
    message_parser parser(options);
    message_builder builder;
    const std::size_t step = chunk_size == 0 ? std::max<std::size_t>(text.size(), 1) : chunk_size;

    for (std::size_t offset = 0; offset < text.size(); offset += step)
    {
        auto fed = parser.feed(text.substr(offset, step));
        if (!fed)
        {
            builder.on_failure(fed.error());
            return builder.take();
        }
        if (!drain(parser, builder))
            return builder.take();
    }

    parser.finish();
    if (!drain(parser, builder))
        return builder.take();
    if (!parser.done())
        MIMEXX_WARN("Parser stopped before the end of the message.");
    return builder.take();
}


} // namespace mimexx
