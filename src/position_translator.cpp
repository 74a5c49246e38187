#include "position_translator.hpp"

#include <algorithm>
#include <stdexcept>

namespace b64stream {

void position_translator::observe(std::size_t leftover_size, std::size_t inner_size)
{
    leftover_size_ = leftover_size;
    inner_size_    = inner_size;
}

void position_translator::record(window_result const& window)
{
    if (window.groups == 0)
        return;

    if (segments_.empty() or segments_.back().closed) {
        segments_.push_back(segment { window.groups, window.last_group_length, window.boundary });
    }
    else {
        auto& open = segments_.back();
        open.groups += window.groups;
        open.last_group_length = window.last_group_length;
        open.closed            = window.boundary;
    }
    groups_ += window.groups;
}

std::size_t position_translator::decoded_size() const
{
    std::size_t total = 0;
    for (auto&& seg : segments_)
        total += seg.decoded_size();
    return total - skip_;
}

bool position_translator::boundary() const
{
    return not segments_.empty() and segments_.back().closed;
}

auto position_translator::cover(std::size_t absolute) const -> coverage
{
    auto result = coverage { 0, absolute };
    for (auto&& seg : segments_) {
        auto size = seg.decoded_size();
        if (result.remainder < size) {
            result.groups += result.remainder / 3;
            result.remainder %= 3;
            break;
        }
        result.groups += seg.groups;
        result.remainder -= size;
    }
    return result;
}

std::size_t position_translator::inner_offset(std::size_t raw) const
{
    return raw > leftover_size_ ? raw - leftover_size_ : 0;
}

raw_release position_translator::translate(std::size_t consumed, std::size_t examined) const
{
    auto presented = decoded_size();
    if (consumed > examined || examined > presented)
        throw std::out_of_range("advance position outside of the returned buffer");

    auto release = raw_release { 0, 0, consumed, 0, false };

    release.groups_released = cover(skip_ + consumed).groups;
    auto raw_released       = release.groups_released * 4;
    release.inner_consumed  = inner_offset(raw_released);

    auto everything = presented > 0 and consumed == presented;
    if (everything and run_size() - raw_released <= leftover_group::capacity) {
        release.inner_consumed = inner_size_;
        release.keep_tail      = true;
    }

    if (examined == presented) {
        // Raw bytes past the decoded groups were only examined on the
        // caller's behalf if they cannot form another group yet.
        if (run_size() - raw_decoded() <= leftover_group::capacity)
            release.inner_examined = inner_size_;
        else
            release.inner_examined = inner_offset(raw_decoded());
    }
    else {
        auto seen    = cover(skip_ + examined);
        auto touched = seen.groups + (seen.remainder > 0 ? 1 : 0);
        release.inner_examined = std::min(inner_offset(touched * 4), inner_size_);
    }
    release.inner_examined = std::max(release.inner_examined, release.inner_consumed);

    return release;
}

void position_translator::commit(raw_release const& release)
{
    auto absolute = skip_ + release.decoded_released;
    auto groups   = release.groups_released;

    groups_ -= groups;
    while (groups > 0) {
        auto& front = segments_.front();
        if (front.groups <= groups) {
            groups -= front.groups;
            absolute -= front.decoded_size();
            segments_.pop_front();
        }
        else {
            front.groups -= groups;
            absolute -= groups * 3;
            groups = 0;
        }
    }
    skip_ = absolute;
}

}
