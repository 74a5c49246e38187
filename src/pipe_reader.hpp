#pragma once

#include "config.hpp"

#include <cstddef>
#include <functional>

namespace b64stream {

struct read_result
{
    /// Unconsumed bytes, valid until the next advance().
    asio::const_buffer buffer;

    /// The writer finished and buffer holds everything that is left.
    bool is_completed = false;

    /// The read was ended early by cancel_pending_read().
    bool is_canceled = false;
};

/// A pull based, flow controlled byte reader.
///
/// Every successful async_read must be answered by one advance() before the
/// next async_read. Positions passed to advance() are offsets into the
/// buffer of the last result: bytes before consumed are released, bytes in
/// [consumed, examined) are kept, and the next read waits for data beyond
/// examined.
class pipe_reader
{
public:
    using executor_type = asio::any_io_executor;
    using read_handler  = std::function<void(error_code const&, read_result)>;

    virtual ~pipe_reader() = default;

    virtual executor_type get_executor() = 0;

    /// Handlers are always invoked through get_executor(), never from
    /// inside async_read itself.
    virtual void async_read(read_handler handler) = 0;

    virtual void advance(std::size_t consumed, std::size_t examined) = 0;

    void advance(std::size_t consumed)
    {
        advance(consumed, consumed);
    }

    /// Ends the pending read, or the next one if none is pending, with
    /// is_canceled set.
    virtual void cancel_pending_read() = 0;
};

}
