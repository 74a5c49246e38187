#pragma once

#include <atomic>

namespace b64stream {

/// Single-shot cancellation signal.
///
/// arm() may be called from any thread. fire() returns true exactly once per
/// arm() and puts the gate back to idle.
struct cancellation_gate
{
    enum class state
    {
        idle,
        armed
    };

    void arm() noexcept
    {
        state_.store(state::armed, std::memory_order_release);
    }

    bool armed() const noexcept
    {
        return state_.load(std::memory_order_acquire) == state::armed;
    }

    bool fire() noexcept
    {
        return state_.exchange(state::idle, std::memory_order_acq_rel) == state::armed;
    }

private:
    std::atomic<state> state_ { state::idle };
};

}
