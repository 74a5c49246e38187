#pragma once

#include "config.hpp"
#include "pipe_reader.hpp"

#include <cstdint>
#include <string>
#include <vector>

namespace b64stream {

/// In-memory byte pipe: a writer side and a pipe_reader side sharing one
/// buffer.
///
/// Not thread safe: write(), complete() and the reader side must be used from
/// the executor's thread. Read handlers are posted to the executor.
class pipe
{
public:
    explicit pipe(asio::any_io_executor executor);

    pipe(pipe const&) = delete;
    pipe& operator=(pipe const&) = delete;

    pipe_reader& reader() { return reader_; }

    /// Append bytes. Throws std::logic_error after complete().
    void write(asio::const_buffer data);

    void write(std::string const& data)
    {
        write(asio::buffer(data));
    }

    /// No more writes will follow.
    void complete();

    bool is_completed() const { return completed_; }

    /// Bytes written and not yet consumed by the reader.
    std::size_t buffered() const { return data_.size() + staged_.size(); }

private:
    struct reader_impl
        : pipe_reader
    {
        explicit reader_impl(pipe& owner) : owner_(owner) {}

        using pipe_reader::advance;

        executor_type get_executor() override;

        void async_read(read_handler handler) override;

        void advance(std::size_t consumed, std::size_t examined) override;

        void cancel_pending_read() override;

        pipe& owner_;
    };

    bool readable() const;

    void deliver(pipe_reader::read_handler handler, bool canceled);

    void wake();

    asio::any_io_executor     executor_;
    std::vector<std::uint8_t> data_;
    std::vector<std::uint8_t> staged_;      // written while a result is out
    std::size_t               examined_         = 0;
    bool                      completed_        = false;
    bool                      cancel_requested_ = false;
    bool                      leased_           = false;
    pipe_reader::read_handler pending_;
    reader_impl               reader_ { *this };
};

}
