/*

mime/parser_options.hpp
-----------------------

Copyright (C) 2025, Sylvain Guinebert (github.com/sguinebert).

Distributed under the FreeBSD license, see the accompanying file LICENSE or
copy at http://www.freebsd.org/copyright/freebsd-license.html.

*/

#pragma once

#include <cstddef>

namespace mimexx
{

/**
 * Configuration of a message parser.
 *
 * Passed by value to each parser, there is no process wide state.
 */
struct parser_options
{
    /// Accept a bare LF as line end, around delimiters and in header blocks
    bool allow_bare_lf = true;

    /// Remove the SMTP transparency dot at the start of each line
    bool dot_unstuffing = false;

    /// Reject a stray `=` in quoted printable bodies instead of passing it through
    bool strict_quoted_printable = false;

    /// Longest accepted header line, continuation lines included (0 = unlimited)
    std::size_t max_header_line = 65536;

    /// Deepest multipart nesting; deeper multiparts are kept as opaque bodies
    std::size_t max_depth = 64;

    // ==================== Factory Methods ====================

    /// Payload of an SMTP DATA command, still dot stuffed
    static parser_options smtp_data()
    {
        parser_options opts;
        opts.dot_unstuffing = true;
        return opts;
    }

    /// CRLF only line ends and strict quoted printable escapes
    static parser_options strict()
    {
        parser_options opts;
        opts.allow_bare_lf = false;
        opts.strict_quoted_printable = true;
        return opts;
    }
};

} // namespace mimexx
