#pragma once

#include "decode_window.hpp"

#include <cstddef>
#include <deque>

namespace b64stream {

/// What a caller advance over decoded bytes means for the raw source.
struct raw_release
{
    std::size_t inner_consumed;
    std::size_t inner_examined;
    std::size_t decoded_released;  // bytes to drop from the decoded storage
    std::size_t groups_released;
    bool        keep_tail;         // the undecoded tail becomes the leftover group
};

/// Maps the decoded bytes presented to the caller back onto the raw run
/// they were decoded from.
///
/// Decoded groups are kept as segments, one per unit: inside a segment every
/// group decodes to 3 bytes except a padded last one. A decoded offset is
/// resolved to whole raw groups by walking the segments, never by a fixed
/// ratio. When the caller consumes part of a group the raw group is retained
/// and the bytes already handed over are remembered as skip().
class position_translator
{
public:
    /// Sizes of the raw run (leftover + source bytes) seen by the last read.
    void observe(std::size_t leftover_size, std::size_t inner_size);

    void record(window_result const& window);

    /// Decoded bytes currently presented to the caller.
    std::size_t decoded_size() const;

    /// Offset in the raw run of the first byte not yet decoded.
    std::size_t raw_decoded() const { return groups_ * 4; }

    std::size_t run_size() const { return leftover_size_ + inner_size_; }

    std::size_t groups() const { return groups_; }

    std::size_t skip() const { return skip_; }

    /// The most recent decode stopped after a padded group.
    bool boundary() const;

    /// Throws std::out_of_range unless consumed <= examined <= decoded_size().
    raw_release translate(std::size_t consumed, std::size_t examined) const;

    void commit(raw_release const& release);

private:
    struct segment
    {
        std::size_t groups;
        std::size_t last_group_length;
        bool        closed;

        std::size_t decoded_size() const
        {
            return (groups - 1) * 3 + last_group_length;
        }
    };

    struct coverage
    {
        std::size_t groups;     // groups entirely inside the decoded prefix
        std::size_t remainder;  // prefix bytes taken from the next group
    };

    coverage cover(std::size_t absolute) const;

    std::size_t inner_offset(std::size_t raw) const;

    std::deque<segment> segments_;
    std::size_t         leftover_size_ = 0;
    std::size_t         inner_size_    = 0;
    std::size_t         groups_        = 0;
    std::size_t         skip_          = 0;
};

}
