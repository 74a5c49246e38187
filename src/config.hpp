#pragma once

#include <boost/asio.hpp>
#include <boost/system/error_code.hpp>
#include <boost/system/system_error.hpp>

#include <cstddef>

#define B64STREAM_VERSION "1.0.0"

namespace b64stream {

    namespace asio = boost::asio;

    using error_code = boost::system::error_code;
    using system_error = boost::system::system_error;

    // gRPC-Web servers reject anything larger by default
    constexpr std::size_t default_max_frame_size = 4 * 1024 * 1024;

    constexpr std::size_t default_chunk_size = 4096;
}
