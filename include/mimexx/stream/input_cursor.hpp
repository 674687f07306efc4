/*

stream/input_cursor.hpp
-----------------------

Copyright (C) 2025, Sylvain Guinebert (github.com/sguinebert).

Distributed under the FreeBSD license, see the accompanying file LICENSE or
copy at http://www.freebsd.org/copyright/freebsd-license.html.

*/

#pragma once

#include <algorithm>
#include <cstddef>
#include <cstdint>
#include <string>
#include <string_view>

#include <mimexx/detail/log.hpp>
#include <mimexx/detail/result.hpp>
#include <mimexx/export.hpp>

namespace mimexx
{

/**
Chunked input cursor over the bytes of a message.

The caller feeds chunks of any size and signals the end of the input explicitly. Consumers look ahead with
`peek()`/`window()` and move the read position forward with `consume()`. The read position never moves back.

Consumed bytes are dropped when the next chunk is fed, so the views returned by `peek()` and `window()` stay
valid until the next `feed()`.
**/
class MIMEXX_EXPORT input_cursor
{
public:

    /**
    Bytes available for lookahead.
    **/
    struct peek_result
    {
        std::string_view bytes;

        /**
        No further bytes will arrive.
        **/
        bool end = false;
    };

    /**
    Creating an empty cursor.

    @param dot_unstuffing Removing the leading dot of each line while feeding, as done by an SMTP server.
    **/
    explicit input_cursor(bool dot_unstuffing = false) : dot_unstuffing_(dot_unstuffing)
    {
    }

    /**
    Appending a chunk.

    @param chunk Next bytes of the message, may be empty.
    @return      Error `invalid_state` if the input was already finished.
    **/
    result_void feed(std::string_view chunk)
    {
        if (finished_)
            return fail(error_code::invalid_state, "Input fed after its end was signaled.", position());

        compact();
        if (dot_unstuffing_)
            append_unstuffed(chunk);
        else
            buffer_.append(chunk.data(), chunk.size());
        peak_buffered_ = std::max(peak_buffered_, buffer_.size());
        return ok();
    }

    /**
    Signaling that no further chunk will be fed.
    **/
    void finish() noexcept
    {
        finished_ = true;
    }

    /**
    Looking ahead without consuming.

    @param n Maximum number of bytes.
    @return  Up to `n` buffered bytes and the end flag.
    **/
    [[nodiscard]] peek_result peek(std::size_t n) const noexcept
    {
        std::string_view bytes = window();
        return peek_result{bytes.substr(0, std::min(n, bytes.size())), finished_};
    }

    /**
    All buffered bytes not consumed yet.
    **/
    [[nodiscard]] std::string_view window() const noexcept
    {
        return std::string_view(buffer_).substr(read_);
    }

    /**
    Advancing the read position.

    @param n Number of bytes, limited to the buffered ones.
    **/
    void consume(std::size_t n) noexcept
    {
        n = std::min(n, buffer_.size() - read_);
        read_ += n;
        consumed_ += n;
    }

    /**
    Checking if the end of the input was signaled.
    **/
    [[nodiscard]] bool at_end() const noexcept
    {
        return finished_;
    }

    /**
    Checking if the input ended and every byte was consumed.
    **/
    [[nodiscard]] bool exhausted() const noexcept
    {
        return finished_ && read_ == buffer_.size();
    }

    /**
    Offset of the read position from the start of the message, after dot unstuffing.
    **/
    [[nodiscard]] std::uint64_t position() const noexcept
    {
        return consumed_;
    }

    [[nodiscard]] std::size_t buffered() const noexcept
    {
        return buffer_.size() - read_;
    }

    /**
    Largest size the internal buffer reached.
    **/
    [[nodiscard]] std::size_t peak_buffered() const noexcept
    {
        return peak_buffered_;
    }

private:

    void compact()
    {
        if (read_ == 0)
            return;
        buffer_.erase(0, read_);
        read_ = 0;
    }

    void append_unstuffed(std::string_view chunk)
    {
        for (char ch : chunk)
        {
            if (line_start_ && ch == '.')
            {
                line_start_ = false;
                ++dots_removed_;
                continue;
            }
            buffer_ += ch;
            line_start_ = (ch == '\n');
        }
        if (dots_removed_ > 0)
            MIMEXX_TRACE_EVENT(cursor, "dots removed so far: " + std::to_string(dots_removed_));
    }

    std::string buffer_;
    std::size_t read_ = 0;
    std::uint64_t consumed_ = 0;
    std::size_t peak_buffered_ = 0;
    bool finished_ = false;
    bool dot_unstuffing_;
    bool line_start_ = true;
    std::uint64_t dots_removed_ = 0;
};

} // namespace mimexx
