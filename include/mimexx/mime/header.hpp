/*

mime/header.hpp
---------------

Copyright (C) 2025, Sylvain Guinebert (github.com/sguinebert).

Distributed under the FreeBSD license, see the accompanying file LICENSE or
copy at http://www.freebsd.org/copyright/freebsd-license.html.

*/


#pragma once

#include <cstddef>
#include <string>
#include <string_view>
#include <utility>
#include <vector>
#include <mimexx/codec/codec.hpp>
#include <mimexx/detail/ascii.hpp>
#include <mimexx/detail/result.hpp>
#include <mimexx/export.hpp>


namespace mimexx
{


/**
Single field of a header block.
**/
struct header_field
{
    /**
    Field name as written, compared case insensitively.
    **/
    std::string name;

    /**
    Value with the continuation lines merged, before the encoded word decoding.
    **/
    std::string raw_value;

    /**
    Value after the encoded word decoding, raw bytes in the declared charset.
    **/
    std::string decoded_value;

    /**
    Charset declared by the first encoded word, empty if the value has none.
    **/
    std::string charset;

    friend bool operator==(const header_field&, const header_field&) = default;
};


/**
Header fields in the order they appear.

Repeated fields (like the `Received` trace) are all kept.
**/
class MIMEXX_EXPORT header_block
{
public:

    using container_t = std::vector<header_field>;
    using const_iterator = container_t::const_iterator;

    void add(header_field field)
    {
        fields_.push_back(std::move(field));
    }

    /**
    First field with the given name.

    @param name Field name, case insensitive.
    @return     The field or null if missing.
    **/
    const header_field* find(std::string_view name) const
    {
        for (const auto& f : fields_)
            if (detail::iequals_ascii(f.name, name))
                return &f;
        return nullptr;
    }

    /**
    All fields with the given name, in order.
    **/
    std::vector<const header_field*> find_all(std::string_view name) const
    {
        std::vector<const header_field*> found;
        for (const auto& f : fields_)
            if (detail::iequals_ascii(f.name, name))
                found.push_back(&f);
        return found;
    }

    bool contains(std::string_view name) const
    {
        return find(name) != nullptr;
    }

    /**
    Decoded value of the first field with the given name.

    @param name Field name, case insensitive.
    @return     Decoded value, empty if the field is missing.
    **/
    std::string_view value(std::string_view name) const
    {
        const header_field* f = find(name);
        return f == nullptr ? std::string_view() : std::string_view(f->decoded_value);
    }

    /**
    Raw value of the first field with the given name, empty if missing.
    **/
    std::string_view raw_value(std::string_view name) const
    {
        const header_field* f = find(name);
        return f == nullptr ? std::string_view() : std::string_view(f->raw_value);
    }

    header_field& back()
    {
        return fields_.back();
    }

    const header_field& operator[](std::size_t index) const
    {
        return fields_[index];
    }

    std::size_t size() const noexcept
    {
        return fields_.size();
    }

    bool empty() const noexcept
    {
        return fields_.empty();
    }

    const_iterator begin() const noexcept
    {
        return fields_.begin();
    }

    const_iterator end() const noexcept
    {
        return fields_.end();
    }

    friend bool operator==(const header_block&, const header_block&) = default;

private:

    container_t fields_;
};


/**
Canonical spelling of a header name, every letter following a dash or the start in upper case and the others in
lower case.

@param name Header name.
@return     Canonical name, or the name unchanged if it contains characters not allowed in a name.
**/
inline std::string canonical_header_name(std::string_view name)
{
    static constexpr std::string_view NAME_SYMBOLS{"!#$%&'*+-.^_`|~"};

    std::string canonical(name);
    for (char ch : name)
        if (!detail::is_ascii_alnum(ch) && NAME_SYMBOLS.find(ch) == std::string_view::npos)
            return canonical;

    bool upper = true;
    for (auto& ch : canonical)
    {
        ch = upper ? detail::ascii_toupper(ch) : detail::ascii_tolower(ch);
        upper = (ch == codec::MINUS_CHAR);
    }
    return canonical;
}


/**
Size of the header block at the start of a buffered mail.

@param mail Complete mail or at least its header block and separator.
@return     Number of header bytes, the blank separator line excluded, or `truncated_headers` if no separator
            is present.
**/
inline result<std::size_t> count_header_bytes(std::string_view mail)
{
    static constexpr std::string_view SEPARATOR{"\r\n\r\n"};

    if (mail.substr(0, codec::END_OF_LINE.size()) == codec::END_OF_LINE)
        return 0;
    auto pos = mail.find(SEPARATOR);
    if (pos == std::string_view::npos)
        return fail<std::size_t>(error_code::truncated_headers, "No blank line after the header block.", mail.size());
    return pos;
}


} // namespace mimexx
