#pragma once

#include <boost/system/error_code.hpp>

#include <type_traits>

namespace b64stream {
namespace error {

    enum errors
    {
        /// The source ended in the middle of a 4 character group.
        truncated_input = 1,

        /// A byte outside the alphabet, or padding where it is not allowed.
        invalid_character,

        /// The decoded stream ended in the middle of a gRPC-Web frame.
        truncated_frame,

        /// A gRPC-Web frame header announced a payload over the limit.
        frame_too_large
    };

    boost::system::error_category const& get_category();

    inline boost::system::error_code make_error_code(errors e)
    {
        return boost::system::error_code(static_cast<int>(e), get_category());
    }

} // namespace error
} // namespace b64stream

namespace boost {
namespace system {

    template<>
    struct is_error_code_enum<b64stream::error::errors>
        : std::true_type
    {
    };

} // namespace system
} // namespace boost
