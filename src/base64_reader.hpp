#pragma once

#include "config.hpp"
#include "pipe_reader.hpp"
#include "decode_window.hpp"
#include "position_translator.hpp"
#include "cancellation_gate.hpp"

#include <cstdint>
#include <memory>
#include <vector>

namespace b64stream {

/// Decodes a base64 byte stream read from another pipe_reader.
///
/// Groups are decoded as soon as four characters are available. A read stops
/// after the first padded group even when more data is buffered, so units
/// that were encoded separately and concatenated (as gRPC-Web text streams
/// do) are returned one per read. Decoded bytes the caller does not consume
/// stay at the front of the next result.
///
/// Decode errors complete the read with a b64stream::error code and are
/// repeated for every later read. Cancellation is not an error: the read
/// completes with is_canceled set and decoding resumes where it stopped.
/// A canceled read resolves even if the inner reader ignores the request.
///
/// The reader must be destroyed on its executor's thread.
class base64_reader
    : public pipe_reader
{
public:
    explicit base64_reader(pipe_reader& inner);

    base64_reader(base64_reader const&) = delete;
    base64_reader& operator=(base64_reader const&) = delete;

    using pipe_reader::advance;

    executor_type get_executor() override;

    void async_read(read_handler handler) override;

    void advance(std::size_t consumed, std::size_t examined) override;

    /// Safe to call from any thread. The request is forwarded to the inner
    /// reader on its executor.
    void cancel_pending_read() override;

private:
    void read_inner();

    void handle_inner_read(error_code const& ec, read_result result);

    void handle_cancel();

    read_result canceled_result() const;

    void complete_canceled(raw_run const& run, bool source_ended);

    void deliver(error_code const& ec, read_result result);

    void release_inner(std::size_t consumed, std::size_t examined);

    asio::const_buffer decoded_buffer() const;

    pipe_reader&                       inner_;
    leftover_group                     leftover_;
    std::vector<std::uint8_t>          decoded_;
    position_translator                translator_;
    std::shared_ptr<cancellation_gate> gate_;
    read_handler                       handler_;
    asio::const_buffer                 inner_buffer_;
    bool                               inner_reading_  = false;
    bool                               inner_leased_   = false;
    bool                               orphaned_       = false;  // the inner read still out was answered by a cancel
    std::size_t                        deferred_       = 0;      // source bytes released while the inner read was out
    bool                               result_pending_ = false;
    bool                               wait_for_more_  = false;
    error_code                         failed_;
};

}
