#include "grpc_web_frame_reader.hpp"
#include "error.hpp"

#include <algorithm>
#include <cctype>
#include <stdexcept>

namespace b64stream {

constexpr std::uint8_t grpc_web_frame::trailers_flag;
constexpr std::size_t  grpc_web_frame::header_size;

namespace {

    std::string trim(std::string const& s)
    {
        auto first = s.find_first_not_of(" \t");
        if (first == std::string::npos)
            return std::string();
        auto last = s.find_last_not_of(" \t\r");
        return s.substr(first, last - first + 1);
    }

    std::uint32_t read_length(const std::uint8_t *p)
    {
        return (std::uint32_t(p[0]) << 24)
               | (std::uint32_t(p[1]) << 16)
               | (std::uint32_t(p[2]) << 8)
               | std::uint32_t(p[3]);
    }
}

trailer_list parse_trailers(std::string const& payload)
{
    trailer_list result;
    std::string::size_type pos = 0;
    while (pos < payload.size()) {
        auto eol = payload.find("\r\n", pos);
        if (eol == std::string::npos)
            eol = payload.size();

        auto line  = payload.substr(pos, eol - pos);
        auto colon = line.find(':');
        if (colon != std::string::npos) {
            auto name = trim(line.substr(0, colon));
            std::transform(name.begin(), name.end(), name.begin(), [](unsigned char c)
            {
                return static_cast<char>(std::tolower(c));
            });
            result.emplace_back(std::move(name), trim(line.substr(colon + 1)));
        }
        pos = eol + 2;
    }
    return result;
}

grpc_web_frame_reader::grpc_web_frame_reader(pipe_reader& source, std::size_t max_frame_size)
    : source_(source)
    , max_frame_size_(max_frame_size)
{
}

void grpc_web_frame_reader::async_read_frame(frame_handler handler)
{
    if (handler_)
        throw std::logic_error("frame read already in progress");
    handler_ = std::move(handler);
    read_some();
}

void grpc_web_frame_reader::read_some()
{
    source_.async_read([this](error_code const& ec, read_result result)
    {
        this->handle_read(ec, result);
    });
}

void grpc_web_frame_reader::handle_read(error_code const& ec, read_result result)
{
    if (ec) {
        finish(ec);
        return;
    }

    if (result.is_canceled) {
        source_.advance(0, 0);
        finish(asio::error::operation_aborted);
        return;
    }

    auto data = static_cast<const std::uint8_t *>(result.buffer.data());
    auto size = result.buffer.size();

    if (size >= grpc_web_frame::header_size) {
        auto length = read_length(data + 1);
        if (length > max_frame_size_) {
            source_.advance(0, 0);
            finish(error::frame_too_large);
            return;
        }

        auto frame_size = grpc_web_frame::header_size + length;
        if (size >= frame_size) {
            auto frame = grpc_web_frame();
            frame.flags = data[0];
            frame.payload.assign(reinterpret_cast<const char *>(data + grpc_web_frame::header_size), length);
            source_.advance(frame_size);
            finish(error_code(), std::move(frame));
            return;
        }
    }

    if (result.is_completed) {
        source_.advance(0, size);
        if (size == 0)
            finish(asio::error::eof);
        else
            finish(error::truncated_frame);
        return;
    }

    source_.advance(0, size);
    read_some();
}

void grpc_web_frame_reader::finish(error_code const& ec, grpc_web_frame frame)
{
    auto handler = std::move(handler_);
    handler_ = nullptr;
    handler(ec, std::move(frame));
}

}
