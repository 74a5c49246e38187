#include "error.hpp"

#include <string>

namespace b64stream {
namespace error {

    namespace {

        struct category_impl
            : boost::system::error_category
        {
            const char *name() const noexcept override
            {
                return "b64stream";
            }

            std::string message(int value) const override
            {
                switch (static_cast<errors>(value)) {
                    case truncated_input:
                        return "Unexpected end of data when reading base64 content.";
                    case invalid_character:
                        return "Invalid base64 character in encoded content.";
                    case truncated_frame:
                        return "Unexpected end of data when reading gRPC-Web frame.";
                    case frame_too_large:
                        return "gRPC-Web frame exceeds the maximum frame size.";
                }
                return "b64stream error";
            }
        };

    }

    boost::system::error_category const& get_category()
    {
        static const category_impl instance {};
        return instance;
    }

} // namespace error
} // namespace b64stream
