#include "options.hpp"

#include <boost/program_options.hpp>

#include <ostream>

namespace b64stream {

namespace po = boost::program_options;

parse_outcome parse_options(int argc, const char *const argv[],
                            decode_options& options,
                            std::ostream& out,
                            std::ostream& err)
{
    std::string log_level = logging::name(options.log_level);

    po::options_description desc("Usage: b64stream-decode [options] < input\n\n"
                                 "Decode a base64 stream read from standard input.\n"
                                 "Options");
    desc.add_options()
        ("help,h", "show this help message")
        ("version,v", "show version information")
        ("grpc-web,g", po::bool_switch(&options.grpc_web),
         "read gRPC-Web frames and print them instead of raw bytes")
        ("chunk-size,c", po::value<std::size_t>(&options.chunk_size)->default_value(options.chunk_size),
         "bytes requested from standard input per read")
        ("max-frame-size", po::value<std::size_t>(&options.max_frame_size)->default_value(options.max_frame_size),
         "largest gRPC-Web frame payload accepted")
        ("log-level,l", po::value<std::string>(&log_level)->default_value(log_level),
         "debug, info, warning or error");

    po::variables_map vm;
    try {
        po::store(po::parse_command_line(argc, argv, desc), vm);
        po::notify(vm);
    }
    catch (po::error const& e) {
        err << "b64stream-decode: " << e.what() << "\n" << desc << std::endl;
        return parse_outcome::exit_failure;
    }

    if (vm.count("help")) {
        out << desc << std::endl;
        return parse_outcome::exit_success;
    }

    if (vm.count("version")) {
        out << "b64stream-decode " << B64STREAM_VERSION << std::endl;
        return parse_outcome::exit_success;
    }

    if (options.chunk_size == 0) {
        err << "b64stream-decode: chunk-size must be at least 1" << std::endl;
        return parse_outcome::exit_failure;
    }

    if (not logging::parse_level(log_level, options.log_level)) {
        err << "b64stream-decode: unknown log level '" << log_level << "'" << std::endl;
        return parse_outcome::exit_failure;
    }

    return parse_outcome::run;
}

}
