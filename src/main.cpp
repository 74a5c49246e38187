#include "config.hpp"
#include "descriptor.hpp"
#include "error.hpp"
#include "logging.hpp"
#include "options.hpp"
#include "pipe.hpp"
#include "base64_reader.hpp"
#include "grpc_web_frame_reader.hpp"

#include <google/protobuf/text_format.h>
#include <google/protobuf/unknown_field_set.h>

#include <unistd.h>

#include <iostream>
#include <string>
#include <vector>

using namespace b64stream;

/// Copies standard input into a pipe, completing it at end of input.
struct stdin_pump
{
    stdin_pump(asio::io_context& ioc, b64stream::pipe& target, std::size_t chunk_size)
        : input_(ioc, duplicate_descriptor(STDIN_FILENO))
        , target_(target)
        , buffer_(chunk_size)
    {
    }

    void start()
    {
        input_.async_read_some(asio::buffer(buffer_),
                               [this](auto&& ...args)
                               {
                                   this->handle_read(std::forward<decltype(args)>(args)...);
                               });
    }

    error_code error;

private:
    void handle_read(error_code const& ec, std::size_t bytes_transferred)
    {
        if (bytes_transferred > 0) {
            B64STREAM_LOG(debug, "%1% bytes from standard input", bytes_transferred);
            target_.write(asio::buffer(buffer_.data(), bytes_transferred));
        }

        if (ec == asio::error::eof) {
            B64STREAM_LOG(debug, "end of input");
            target_.complete();
        }
        else if (ec) {
            B64STREAM_LOG(error, "%1%", ec.message());
            error = ec;
            target_.complete();
        }
        else {
            start();
        }
    }

    asio::posix::stream_descriptor input_;
    b64stream::pipe&               target_;
    std::vector<char>              buffer_;
};

/// Writes decoded bytes to an output stream as they are produced.
struct raw_printer
{
    raw_printer(asio::io_context& ioc, pipe_reader& reader, std::ostream& out)
        : ioc_(ioc)
        , reader_(reader)
        , out_(out)
    {
    }

    void start()
    {
        reader_.async_read([this](auto&& ...args)
                           {
                               this->handle_read(std::forward<decltype(args)>(args)...);
                           });
    }

    error_code error;
    std::size_t total = 0;

private:
    void handle_read(error_code const& ec, read_result result)
    {
        if (ec) {
            B64STREAM_LOG(error, "%1%", ec.message());
            error = ec;
            ioc_.stop();
            return;
        }

        auto size = result.buffer.size();
        B64STREAM_LOG(debug, "decoded %1% bytes (completed: %2%)", size, result.is_completed);
        out_.write(static_cast<const char *>(result.buffer.data()), static_cast<std::streamsize>(size));
        out_.flush();
        total += size;
        reader_.advance(size);

        if (not result.is_completed)
            start();
    }

    asio::io_context& ioc_;
    pipe_reader&      reader_;
    std::ostream&     out_;
};

/// Prints each gRPC-Web frame: messages as schemaless protobuf text,
/// trailers as name: value lines.
struct frame_printer
{
    frame_printer(asio::io_context& ioc, pipe_reader& reader, std::size_t max_frame_size, std::ostream& out)
        : ioc_(ioc)
        , frames_(reader, max_frame_size)
        , out_(out)
    {
    }

    void start()
    {
        frames_.async_read_frame([this](auto&& ...args)
                                 {
                                     this->handle_frame(std::forward<decltype(args)>(args)...);
                                 });
    }

    error_code error;
    std::size_t count = 0;

private:
    void handle_frame(error_code const& ec, grpc_web_frame frame)
    {
        if (ec == asio::error::eof) {
            B64STREAM_LOG(info, "%1% frames", count);
            return;
        }
        if (ec) {
            B64STREAM_LOG(error, "%1%", ec.message());
            error = ec;
            ioc_.stop();
            return;
        }

        ++count;
        B64STREAM_LOG(info, "frame %1%: flags 0x%2$02x, %3% bytes", count, unsigned(frame.flags), frame.payload.size());

        if (frame.is_trailers()) {
            out_ << "trailers {\n";
            for (auto&& trailer : parse_trailers(frame.payload))
                out_ << "  " << trailer.first << ": " << trailer.second << "\n";
            out_ << "}" << std::endl;
        }
        else {
            print_message(frame.payload);
        }

        start();
    }

    void print_message(std::string const& payload)
    {
        google::protobuf::UnknownFieldSet fields;
        std::string text;
        if (fields.ParseFromString(payload)
            and google::protobuf::TextFormat::PrintUnknownFieldsToString(fields, &text))
        {
            out_ << "message {\n" << text << "}" << std::endl;
        }
        else {
            out_ << "message (" << payload.size() << " bytes, not protobuf)" << std::endl;
        }
    }

    asio::io_context&     ioc_;
    grpc_web_frame_reader frames_;
    std::ostream&         out_;
};

int main(int argc, char *argv[])
{
    auto options = decode_options();
    switch (parse_options(argc, argv, options, std::cout, std::cerr)) {
        case parse_outcome::exit_success:
            return 0;
        case parse_outcome::exit_failure:
            return 2;
        case parse_outcome::run:
            break;
    }

    logging::set_level(options.log_level);
    B64STREAM_LOG(info, "grpc-web: %1%, chunk size: %2%, max frame size: %3%",
                  options.grpc_web, options.chunk_size, options.max_frame_size);

    try {
        asio::io_context ioc;
        b64stream::pipe source(ioc.get_executor());
        base64_reader   decoder(source.reader());

        stdin_pump pump(ioc, source, options.chunk_size);
        pump.start();

        error_code failure;
        if (options.grpc_web) {
            frame_printer printer(ioc, decoder, options.max_frame_size, std::cout);
            printer.start();
            ioc.run();
            failure = printer.error;
        }
        else {
            raw_printer printer(ioc, decoder, std::cout);
            printer.start();
            ioc.run();
            failure = printer.error;
            B64STREAM_LOG(info, "%1% bytes decoded", printer.total);
        }

        if (not failure)
            failure = pump.error;
        if (failure) {
            std::cerr << "b64stream-decode: " << failure.message() << std::endl;
            return 1;
        }
    }
    catch (system_error const& se) {
        std::cerr << "b64stream-decode: " << se.code().message() << std::endl;
        return 1;
    }
    catch (std::exception const& e) {
        std::cerr << "b64stream-decode: " << e.what() << std::endl;
        return 1;
    }

    return 0;
}
