#include "base64_reader.hpp"

#include <stdexcept>
#include <utility>

namespace b64stream {

base64_reader::base64_reader(pipe_reader& inner)
    : inner_(inner)
    , gate_(std::make_shared<cancellation_gate>())
{
}

auto base64_reader::get_executor() -> executor_type
{
    return inner_.get_executor();
}

void base64_reader::async_read(read_handler handler)
{
    if (handler_)
        throw std::logic_error("read already in progress");
    if (result_pending_)
        throw std::logic_error("advance must be called before reading again");

    if (failed_) {
        asio::post(get_executor(), [handler = std::move(handler), ec = failed_]
        {
            handler(ec, read_result());
        });
        return;
    }

    if (gate_->fire()) {
        // a leftover group never holds a whole group, so only decoded_ is returned
        result_pending_ = true;
        asio::post(get_executor(), [handler = std::move(handler), result = canceled_result()]
        {
            handler(error_code(), result);
        });
        return;
    }

    handler_ = std::move(handler);

    // a read answered by a cancel is still out; its result starts this one
    if (not inner_reading_)
        read_inner();
}

void base64_reader::read_inner()
{
    inner_reading_ = true;
    inner_.async_read([this](error_code const& ec, read_result result)
    {
        this->handle_inner_read(ec, result);
    });
}

void base64_reader::handle_inner_read(error_code const& ec, read_result result)
{
    inner_reading_ = false;

    if (ec) {
        failed_   = ec;
        orphaned_ = false;
        if (handler_)
            deliver(ec, read_result());
        return;
    }

    inner_leased_ = true;
    inner_buffer_ = result.buffer;

    if (orphaned_ or deferred_ > 0) {
        orphaned_ = false;
        auto consumed = deferred_;
        deferred_ = 0;
        release_inner(consumed, consumed);
        if (handler_)
            read_inner();
        return;
    }

    translator_.observe(leftover_.size(), result.buffer.size());
    auto run = raw_run(leftover_, result.buffer);

    if (result.is_canceled or gate_->armed()) {
        if (gate_->fire()) {
            complete_canceled(run, result.is_completed);
            return;
        }
        // the inner reader reports a request the gate has already answered
        release_inner(0, 0);
        read_inner();
        return;
    }

    auto decode_error = error_code();
    auto window = decode_window(run, translator_.raw_decoded(), result.is_completed, false,
                                decoded_, decode_error);
    translator_.record(window);
    if (decode_error) {
        failed_ = decode_error;
        deliver(decode_error, read_result());
        return;
    }

    if (window.status == window_status::need_more_data
        and (decoded_.empty() or wait_for_more_))
    {
        release_inner(0, result.buffer.size());
        read_inner();
        return;
    }

    auto out = read_result();
    out.buffer       = decoded_buffer();
    out.is_completed = result.is_completed
                       and translator_.raw_decoded() == translator_.run_size();
    deliver(error_code(), out);
}

void base64_reader::complete_canceled(raw_run const& run, bool source_ended)
{
    // An invalid group stops the best-effort pass and is reported by the
    // next read, which decodes from the same position.
    auto deferred = error_code();
    auto window   = decode_window(run, translator_.raw_decoded(), source_ended, true,
                                  decoded_, deferred);
    translator_.record(window);
    deliver(error_code(), canceled_result());
}

void base64_reader::handle_cancel()
{
    inner_.cancel_pending_read();

    // answer the read here in case the inner reader ignores the request
    if (handler_ and inner_reading_ and gate_->fire()) {
        orphaned_ = true;
        deliver(error_code(), canceled_result());
    }
}

read_result base64_reader::canceled_result() const
{
    auto out = read_result();
    out.buffer      = decoded_buffer();
    out.is_canceled = true;
    return out;
}

void base64_reader::deliver(error_code const& ec, read_result result)
{
    result_pending_ = not ec;
    auto handler = std::move(handler_);
    handler_ = nullptr;
    handler(ec, result);
}

void base64_reader::advance(std::size_t consumed, std::size_t examined)
{
    if (not result_pending_)
        throw std::logic_error("advance called without a read result");

    auto release   = translator_.translate(consumed, examined);
    auto presented = decoded_.size();

    if (not inner_leased_) {
        // The source bytes are not in hand: release whole groups once the
        // outstanding inner read returns, and leave the tail in the source.
        auto raw = release.groups_released * 4;
        deferred_ += raw > leftover_.size() ? raw - leftover_.size() : 0;
        if (release.groups_released > 0)
            leftover_.clear();
    }
    else if (release.keep_tail) {
        auto first = static_cast<const std::uint8_t *>(inner_buffer_.data());
        auto tail  = translator_.raw_decoded() - leftover_.size();
        leftover_.assign(first + tail, first + inner_buffer_.size());
    }
    else if (release.groups_released > 0) {
        leftover_.clear();
    }

    decoded_.erase(decoded_.begin(), decoded_.begin() + release.decoded_released);
    translator_.commit(release);

    wait_for_more_  = examined == presented;
    result_pending_ = false;
    release_inner(release.inner_consumed, release.inner_examined);
}

void base64_reader::cancel_pending_read()
{
    gate_->arm();

    auto gate = std::weak_ptr<cancellation_gate>(gate_);
    asio::post(get_executor(), [this, gate]
    {
        if (gate.lock())
            this->handle_cancel();
    });
}

void base64_reader::release_inner(std::size_t consumed, std::size_t examined)
{
    if (not inner_leased_)
        return;
    inner_leased_ = false;
    inner_.advance(consumed, examined);
}

asio::const_buffer base64_reader::decoded_buffer() const
{
    return asio::buffer(decoded_);
}

}
