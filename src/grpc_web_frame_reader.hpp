#pragma once

#include "config.hpp"
#include "pipe_reader.hpp"

#include <cstddef>
#include <cstdint>
#include <functional>
#include <string>
#include <utility>
#include <vector>

namespace b64stream {

struct grpc_web_frame
{
    static constexpr std::uint8_t trailers_flag = 0x80;
    static constexpr std::size_t  header_size   = 5;

    std::uint8_t flags = 0;
    std::string  payload;

    bool is_trailers() const { return (flags & trailers_flag) != 0; }
};

using trailer_list = std::vector<std::pair<std::string, std::string>>;

/// Split a trailers payload ("name: value" lines separated by CRLF).
/// Names are lower-cased, surrounding whitespace is dropped and lines
/// without a colon are ignored.
trailer_list parse_trailers(std::string const& payload);

/// Reads length-prefixed gRPC-Web frames from a pipe_reader.
///
/// The handler receives asio::error::eof once the source completes on a
/// frame boundary, asio::error::operation_aborted when the read was
/// canceled, and error::truncated_frame or error::frame_too_large for
/// malformed input. Errors from the source are passed through.
class grpc_web_frame_reader
{
public:
    using frame_handler = std::function<void(error_code const&, grpc_web_frame)>;

    explicit grpc_web_frame_reader(pipe_reader& source,
                                   std::size_t max_frame_size = default_max_frame_size);

    void async_read_frame(frame_handler handler);

    void cancel()
    {
        source_.cancel_pending_read();
    }

    std::size_t max_frame_size() const { return max_frame_size_; }

private:
    void read_some();

    void handle_read(error_code const& ec, read_result result);

    void finish(error_code const& ec, grpc_web_frame frame = grpc_web_frame());

    pipe_reader&  source_;
    std::size_t   max_frame_size_;
    frame_handler handler_;
};

}
