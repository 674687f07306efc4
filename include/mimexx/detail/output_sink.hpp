#pragma once

#include <cstddef>
#include <functional>
#include <string>
#include <string_view>
#include <utility>

namespace mimexx
{
namespace detail
{

/**
Destination of decoded body bytes.

Decoders call `write()` with each run of bytes they produce; the sink keeps the running total so a caller can tell how
much of a body was decoded before an error stopped it.
**/
class output_sink
{
public:
    virtual ~output_sink() = default;

    void write(std::string_view chunk)
    {
        if (chunk.empty())
            return;
        written_ += chunk.size();
        consume(chunk);
    }

    [[nodiscard]] std::size_t written() const noexcept { return written_; }

protected:
    virtual void consume(std::string_view chunk) = 0;

private:
    std::size_t written_ = 0;
};

/// Appends the decoded bytes to a string owned by the caller.
class string_sink : public output_sink
{
public:
    explicit string_sink(std::string& out) : out_(&out) {}

protected:
    void consume(std::string_view chunk) override
    {
        out_->append(chunk.data(), chunk.size());
    }

private:
    std::string* out_;
};

class fn_sink : public output_sink
{
public:
    explicit fn_sink(std::function<void(std::string_view)> fn)
        : fn_(std::move(fn))
    {
    }

protected:
    void consume(std::string_view chunk) override
    {
        if (fn_)
            fn_(chunk);
    }

private:
    std::function<void(std::string_view)> fn_;
};

} // namespace detail
} // namespace mimexx
