#include "pipe.hpp"

#include <stdexcept>
#include <utility>

namespace b64stream {

pipe::pipe(asio::any_io_executor executor)
    : executor_(std::move(executor))
{
}

void pipe::write(asio::const_buffer data)
{
    if (completed_)
        throw std::logic_error("write after pipe completed");

    auto first = static_cast<const std::uint8_t *>(data.data());
    auto& target = leased_ ? staged_ : data_;
    target.insert(target.end(), first, first + data.size());
    wake();
}

void pipe::complete()
{
    completed_ = true;
    wake();
}

bool pipe::readable() const
{
    return completed_ or data_.size() > examined_;
}

void pipe::wake()
{
    if (pending_ and not leased_ and readable()) {
        auto handler = std::move(pending_);
        pending_ = nullptr;
        deliver(std::move(handler), false);
    }
}

void pipe::deliver(pipe_reader::read_handler handler, bool canceled)
{
    leased_ = true;

    auto result = read_result();
    result.buffer       = asio::buffer(data_);
    result.is_completed = completed_ and staged_.empty();
    result.is_canceled  = canceled;

    asio::post(executor_, [handler = std::move(handler), result]
    {
        handler(error_code(), result);
    });
}

auto pipe::reader_impl::get_executor() -> executor_type
{
    return owner_.executor_;
}

void pipe::reader_impl::async_read(read_handler handler)
{
    auto& p = owner_;
    if (p.pending_)
        throw std::logic_error("read already in progress");
    if (p.leased_)
        throw std::logic_error("advance must be called before reading again");

    if (p.cancel_requested_) {
        p.cancel_requested_ = false;
        p.deliver(std::move(handler), true);
    }
    else if (p.readable()) {
        p.deliver(std::move(handler), false);
    }
    else {
        p.pending_ = std::move(handler);
    }
}

void pipe::reader_impl::advance(std::size_t consumed, std::size_t examined)
{
    auto& p = owner_;
    if (not p.leased_)
        throw std::logic_error("advance called without a read result");
    if (consumed > examined or examined > p.data_.size())
        throw std::out_of_range("advance position outside of the returned buffer");

    p.data_.erase(p.data_.begin(), p.data_.begin() + consumed);
    p.examined_ = examined - consumed;
    p.leased_   = false;

    p.data_.insert(p.data_.end(), p.staged_.begin(), p.staged_.end());
    p.staged_.clear();
}

void pipe::reader_impl::cancel_pending_read()
{
    auto& p = owner_;
    if (p.pending_) {
        auto handler = std::move(p.pending_);
        p.pending_ = nullptr;
        p.deliver(std::move(handler), true);
    }
    else {
        p.cancel_requested_ = true;
    }
}

}
