/*

mime/content_type.hpp
---------------------

Copyright (C) 2025, Sylvain Guinebert (github.com/sguinebert).

Distributed under the FreeBSD license, see the accompanying file LICENSE or
copy at http://www.freebsd.org/copyright/freebsd-license.html.

*/


#pragma once

#include <cctype>
#include <cstddef>
#include <map>
#include <string>
#include <string_view>
#include <utility>
#include <boost/algorithm/string/case_conv.hpp>
#include <boost/algorithm/string/trim.hpp>
#include <mimexx/codec/codec.hpp>
#include <mimexx/codec/percent.hpp>
#include <mimexx/detail/ascii.hpp>
#include <mimexx/detail/log.hpp>
#include <mimexx/export.hpp>


namespace mimexx
{


/**
Parameters of a structured header, keyed by the lower cased name.
**/
using parameters_t = std::map<std::string, std::string>;


/**
Media type with its parameters, as given by the `Content-Type` header.
**/
struct MIMEXX_EXPORT content_type_t
{
    static constexpr std::string_view ATTR_BOUNDARY{"boundary"};

    static constexpr std::string_view ATTR_CHARSET{"charset"};

    static constexpr std::string_view ATTR_NAME{"name"};

    /**
    Primary type, lower cased.
    **/
    std::string type{"text"};

    /**
    Subtype, lower cased.
    **/
    std::string subtype{"plain"};

    parameters_t parameters;

    bool is_multipart() const
    {
        return type == "multipart";
    }

    /**
    Value of a parameter.

    @param name Lower cased parameter name.
    @return     Parameter value, empty if missing.
    **/
    std::string_view parameter(std::string_view name) const
    {
        auto it = parameters.find(std::string(name));
        return it == parameters.end() ? std::string_view() : std::string_view(it->second);
    }

    std::string_view boundary() const
    {
        return parameter(ATTR_BOUNDARY);
    }

    std::string_view charset() const
    {
        return parameter(ATTR_CHARSET);
    }

    /**
    Type and subtype joined by the slash.
    **/
    std::string mime_type() const
    {
        return subtype.empty() ? type : type + codec::SLASH_CHAR + subtype;
    }

    friend bool operator==(const content_type_t&, const content_type_t&) = default;
};


/**
Disposition type with its parameters, as given by the `Content-Disposition` header.
**/
struct MIMEXX_EXPORT content_disposition_t
{
    static constexpr std::string_view ATTR_FILENAME{"filename"};

    /**
    Lower cased disposition type, `inline` if the header is missing.
    **/
    std::string type{"inline"};

    parameters_t parameters;

    bool is_attachment() const
    {
        return type == "attachment";
    }

    std::string_view filename() const
    {
        auto it = parameters.find(std::string(ATTR_FILENAME));
        return it == parameters.end() ? std::string_view() : std::string_view(it->second);
    }

    friend bool operator==(const content_disposition_t&, const content_disposition_t&) = default;
};


namespace detail
{


/**
Longest section number of a parameter continuation.
**/
inline constexpr std::size_t MAX_SECTION_DIGITS = 4;


/**
Reading a parameter value, quoted with backslash escapes or a plain run up to the next semicolon.
**/
inline std::string read_parameter_value(std::string_view text, std::size_t& pos)
{
    std::string value;
    if (pos < text.size() && text[pos] == codec::QUOTE_CHAR)
    {
        ++pos;
        while (pos < text.size() && text[pos] != codec::QUOTE_CHAR)
        {
            if (text[pos] == codec::BACKSLASH_CHAR && pos + 1 < text.size())
                ++pos;
            value += text[pos++];
        }
        if (pos < text.size())
            ++pos;
        while (pos < text.size() && text[pos] != codec::SEMICOLON_CHAR)
            ++pos;
        return value;
    }

    std::size_t end = text.find(codec::SEMICOLON_CHAR, pos);
    if (end == std::string_view::npos)
        end = text.size();
    value = trim_copy(text.substr(pos, end - pos));
    pos = end;
    return value;
}


/**
Parsing the parameter list following the first semicolon of a structured header.

Names are lower cased. Parameters without a value are skipped. RFC 2231 continuations (`name*0`, `name*1`) are
joined, and extended values (`name*=charset''text`) are percent decoded.

@param text Parameter list.
@return     Parameters by name.
**/
inline parameters_t parse_parameters(std::string_view text)
{
    parameters_t params;
    std::map<std::string, std::map<unsigned, std::pair<std::string, bool>>> sections;
    percent pct;
    std::size_t pos = 0;

    while (pos < text.size())
    {
        while (pos < text.size() && (text[pos] == codec::SEMICOLON_CHAR || std::isspace(static_cast<unsigned char>(text[pos]))))
            ++pos;
        if (pos >= text.size())
            break;

        std::size_t name_end = pos;
        while (name_end < text.size() && text[name_end] != codec::EQUAL_CHAR && text[name_end] != codec::SEMICOLON_CHAR)
            ++name_end;
        std::string name = boost::to_lower_copy(trim_copy(text.substr(pos, name_end - pos)));
        if (name_end >= text.size() || text[name_end] == codec::SEMICOLON_CHAR)
        {
            if (!name.empty())
                MIMEXX_DEBUG("Parameter `" + name + "` without value skipped.");
            pos = name_end;
            continue;
        }

        pos = name_end + 1;
        while (pos < text.size() && is_wsp(text[pos]))
            ++pos;
        std::string value = read_parameter_value(text, pos);
        if (name.empty())
            continue;

        bool extended = false;
        if (name.back() == codec::ASTERISK_CHAR)
        {
            extended = true;
            name.pop_back();
        }

        std::string::size_type star = name.rfind(codec::ASTERISK_CHAR);
        if (star != std::string::npos && star + 1 < name.size() && name.size() - star <= MAX_SECTION_DIGITS + 1 &&
            name.find_first_not_of("0123456789", star + 1) == std::string::npos)
        {
            unsigned index = static_cast<unsigned>(std::stoul(name.substr(star + 1)));
            sections[name.substr(0, star)][index] = std::make_pair(std::move(value), extended);
            continue;
        }

        if (extended)
            value = pct.decode_ext_value(value).buffer;
        params[name] = std::move(value);
    }

    for (auto& [name, parts] : sections)
    {
        std::string joined;
        for (auto& [index, section] : parts)
        {
            if (!section.second)
                joined += section.first;
            else if (index == parts.begin()->first)
                joined += pct.decode_ext_value(section.first).buffer;
            else
                joined += pct.decode(section.first);
        }
        params.emplace(name, std::move(joined));
    }

    return params;
}


} // namespace detail


/**
Parsing the value of a `Content-Type` header.

Malformed values fall back to `text/plain`, a missing subtype is left empty.

@param value Raw header value.
@return      Media type and parameters.
**/
inline content_type_t parse_content_type(std::string_view value)
{
    content_type_t ct;
    std::string_view::size_type semicolon = value.find(codec::SEMICOLON_CHAR);
    std::string media = boost::to_lower_copy(detail::trim_copy(value.substr(0, semicolon)));
    std::string::size_type slash = media.find(codec::SLASH_CHAR);
    std::string type = boost::trim_copy(media.substr(0, slash));
    if (type.empty())
    {
        if (!media.empty())
            MIMEXX_WARN("Malformed content type `" + media + "`, using text/plain.");
    }
    else
    {
        ct.type = std::move(type);
        ct.subtype = slash == std::string::npos ? std::string() : boost::trim_copy(media.substr(slash + 1));
    }

    if (semicolon != std::string_view::npos)
        ct.parameters = detail::parse_parameters(value.substr(semicolon + 1));
    return ct;
}


/**
Parsing the value of a `Content-Disposition` header.

@param value Raw header value.
@return      Disposition type and parameters.
**/
inline content_disposition_t parse_content_disposition(std::string_view value)
{
    content_disposition_t cd;
    std::string_view::size_type semicolon = value.find(codec::SEMICOLON_CHAR);
    std::string type = boost::to_lower_copy(detail::trim_copy(value.substr(0, semicolon)));
    if (!type.empty())
        cd.type = std::move(type);
    if (semicolon != std::string_view::npos)
        cd.parameters = detail::parse_parameters(value.substr(semicolon + 1));
    return cd;
}


} // namespace mimexx
