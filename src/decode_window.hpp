#pragma once

#include "config.hpp"

#include <array>
#include <cstddef>
#include <cstdint>
#include <vector>

namespace b64stream {

/// Up to three raw bytes that did not complete a group on a previous read.
struct leftover_group
{
    static constexpr std::size_t capacity = 3;

    std::size_t size() const { return size_; }
    bool empty() const { return size_ == 0; }

    std::uint8_t operator[](std::size_t i) const { return bytes_[i]; }

    void assign(const std::uint8_t *first, const std::uint8_t *last);

    void clear() { size_ = 0; }

private:
    std::array<std::uint8_t, capacity> bytes_ {};
    std::size_t                        size_ = 0;
};

/// The leftover group followed by the bytes the source currently holds,
/// addressed as one sequence without copying the source bytes.
struct raw_run
{
    raw_run(leftover_group const& head, asio::const_buffer tail)
        : head_(head)
        , tail_(static_cast<const std::uint8_t *>(tail.data()))
        , tail_size_(tail.size())
    {}

    std::size_t size() const { return head_.size() + tail_size_; }

    std::uint8_t operator[](std::size_t i) const
    {
        return i < head_.size() ? head_[i] : tail_[i - head_.size()];
    }

    std::size_t head_size() const { return head_.size(); }

    const std::uint8_t *tail() const { return tail_; }

private:
    leftover_group const& head_;
    const std::uint8_t    *tail_;
    std::size_t           tail_size_;
};

enum class window_status
{
    decoded,
    need_more_data,
    end_of_stream
};

struct window_result
{
    window_status status;
    std::size_t   groups;            // complete groups decoded this call
    std::size_t   last_group_length; // decoded length of the final group
    bool          boundary;          // the final group carried padding
};

/// Decode the whole groups of run starting at offset (a multiple of 4),
/// appending to output. Stops after the first padded group.
///
/// In best-effort mode an ended source with a partial group is not an
/// error; invalid groups still stop decoding and set ec, with the groups
/// before them reported as decoded.
window_result decode_window(raw_run const& run,
                            std::size_t offset,
                            bool source_ended,
                            bool best_effort,
                            std::vector<std::uint8_t>& output,
                            error_code& ec);

}
