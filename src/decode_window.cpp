#include "decode_window.hpp"
#include "base64.hpp"
#include "error.hpp"

#include <algorithm>
#include <iterator>
#include <stdexcept>

namespace b64stream {

constexpr std::size_t leftover_group::capacity;

void leftover_group::assign(const std::uint8_t *first, const std::uint8_t *last)
{
    auto n = static_cast<std::size_t>(std::distance(first, last));
    if (n > capacity)
        throw std::length_error("leftover group holds at most 3 bytes");
    std::copy(first, last, bytes_.begin());
    size_ = n;
}

window_result decode_window(raw_run const& run,
                            std::size_t offset,
                            bool source_ended,
                            bool best_effort,
                            std::vector<std::uint8_t>& output,
                            error_code& ec)
{
    ec = error_code();

    auto result = window_result { window_status::decoded, 0, 0, false };
    auto n      = run.size() - offset;

    if (n < 4) {
        if (not source_ended)
            result.status = window_status::need_more_data;
        else if (n == 0)
            result.status = window_status::end_of_stream;
        else if (best_effort)
            result.status = window_status::need_more_data;
        else
            ec = error::truncated_input;
        return result;
    }

    std::uint8_t group[4];
    std::uint8_t decoded[3];

    for (auto pos = offset; run.size() - pos >= 4; pos += 4) {
        for (std::size_t i = 0; i < 4; ++i)
            group[i] = run[pos + i];

        auto quad = base64::decode_quad(group, decoded);
        if (not quad.valid) {
            ec = error::invalid_character;
            break;
        }

        output.insert(output.end(), decoded, decoded + quad.length);
        ++result.groups;
        result.last_group_length = quad.length;

        if (quad.padded) {
            result.boundary = true;
            break;
        }
    }

    return result;
}

}
