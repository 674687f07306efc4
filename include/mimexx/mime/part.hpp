/*

mime/part.hpp
-------------

Copyright (C) 2025, Sylvain Guinebert (github.com/sguinebert).

Distributed under the FreeBSD license, see the accompanying file LICENSE or
copy at http://www.freebsd.org/copyright/freebsd-license.html.

*/


#pragma once

#include <cstddef>
#include <optional>
#include <string>
#include <string_view>
#include <variant>
#include <vector>
#include <mimexx/codec/transfer_decoder.hpp>
#include <mimexx/detail/result.hpp>
#include <mimexx/export.hpp>
#include <mimexx/mime/content_type.hpp>
#include <mimexx/mime/header.hpp>


namespace mimexx
{


struct part;


/**
Decoded bytes of a non multipart body.
**/
struct opaque_body
{
    std::string data;

    /**
    The end of the body was reached.
    **/
    bool complete = false;

    friend bool operator==(const opaque_body&, const opaque_body&) = default;
};


/**
Parts of a multipart body, in order.
**/
struct multipart_body
{
    std::vector<part> parts;

    /**
    The final delimiter was reached.
    **/
    bool complete = false;
};


/**
Header fields of a part together with the values the decoder derived from them.
**/
struct part_header
{
    header_block headers;

    content_type_t content_type;

    content_disposition_t content_disposition;

    transfer_encoding encoding = transfer_encoding::identity;

    /**
    The body is parsed into nested parts.
    **/
    bool multipart = false;
};


/**
Node of the message tree.

Owns its nested parts, there are no references to the parent.
**/
struct MIMEXX_EXPORT part : public part_header
{
    using body_t = std::variant<opaque_body, multipart_body>;

    body_t body;

    /**
    Error that ended the body early, decoding or structural.
    **/
    std::optional<error> failure;

    bool is_multipart() const
    {
        return std::holds_alternative<multipart_body>(body);
    }

    /**
    Opaque body or null for a multipart.
    **/
    const opaque_body* opaque() const
    {
        return std::get_if<opaque_body>(&body);
    }

    opaque_body* opaque()
    {
        return std::get_if<opaque_body>(&body);
    }

    /**
    Nested parts, empty for an opaque body.
    **/
    const std::vector<part>& parts() const
    {
        static const std::vector<part> NO_PARTS;
        const multipart_body* mp = std::get_if<multipart_body>(&body);
        return mp == nullptr ? NO_PARTS : mp->parts;
    }

    /**
    Decoded content of an opaque body, empty for a multipart.
    **/
    std::string_view content() const
    {
        const opaque_body* ob = opaque();
        return ob == nullptr ? std::string_view() : std::string_view(ob->data);
    }

    /**
    Checking if the body reached its end.
    **/
    bool complete() const
    {
        if (const opaque_body* ob = opaque())
            return ob->complete;
        return std::get<multipart_body>(body).complete;
    }

    /**
    Number of parts in the subtree, this one included.
    **/
    std::size_t count_parts() const
    {
        std::size_t count = 1;
        for (const auto& p : parts())
            count += p.count_parts();
        return count;
    }

    /**
    Depth first search of the first opaque part of the given media type.

    @param mime_type Lower cased `type/subtype`.
    @return          Matching part or null.
    **/
    const part* find_first(std::string_view mime_type) const
    {
        if (!is_multipart() && content_type.mime_type() == mime_type)
            return this;
        for (const auto& p : parts())
            if (const part* found = p.find_first(mime_type))
                return found;
        return nullptr;
    }
};


inline bool operator==(const part_header& lhs, const part_header& rhs)
{
    return lhs.headers == rhs.headers && lhs.content_type == rhs.content_type &&
        lhs.content_disposition == rhs.content_disposition && lhs.encoding == rhs.encoding && lhs.multipart == rhs.multipart;
}


inline bool operator==(const part& lhs, const part& rhs);


inline bool operator==(const multipart_body& lhs, const multipart_body& rhs)
{
    return lhs.complete == rhs.complete && lhs.parts == rhs.parts;
}


inline bool operator==(const part& lhs, const part& rhs)
{
    return static_cast<const part_header&>(lhs) == static_cast<const part_header&>(rhs) && lhs.body == rhs.body &&
        lhs.failure == rhs.failure;
}


/**
Root of the message tree.

A fatal error keeps the parts produced before it, the part under construction carries the error too.
**/
class MIMEXX_EXPORT message : public part
{
public:

    /**
    Fatal error that stopped the parsing, if any.
    **/
    const std::optional<error>& error_state() const
    {
        return fatal_;
    }

    /**
    Checking whether parsing stopped on a fatal error.
    **/
    bool failed() const
    {
        return fatal_.has_value();
    }

    /**
    Checking whether the whole input was parsed without a fatal error.
    **/
    bool finished() const
    {
        return finished_;
    }

    void fatal(error err)
    {
        fatal_ = std::move(err);
    }

    void finished(bool flag)
    {
        finished_ = flag;
    }

    friend bool operator==(const message& lhs, const message& rhs)
    {
        return static_cast<const part&>(lhs) == static_cast<const part&>(rhs) && lhs.fatal_ == rhs.fatal_ &&
            lhs.finished_ == rhs.finished_;
    }

private:

    std::optional<error> fatal_;
    bool finished_ = false;
};


} // namespace mimexx
