#pragma once

#include "config.hpp"
#include "logging.hpp"

#include <cstddef>
#include <iosfwd>
#include <string>

namespace b64stream {

struct decode_options
{
    bool           grpc_web       = false;
    std::size_t    chunk_size     = default_chunk_size;
    std::size_t    max_frame_size = default_max_frame_size;
    logging::level log_level      = logging::level::warning;
};

enum class parse_outcome
{
    run,
    exit_success,   // --help or --version was printed
    exit_failure    // diagnostic written to err
};

/// Parse command line arguments with boost::program_options.
parse_outcome parse_options(int argc, const char *const argv[],
                            decode_options& options,
                            std::ostream& out,
                            std::ostream& err);

}
