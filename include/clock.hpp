// include/clock.hpp
#pragma once
#include <chrono>
#include <cstdint>

#include "config.hpp"

// Turns wall-clock time into whole 60 Hz frames. The CPU itself never looks at
// the clock: each frame the driver calls CPU::tick once per frame due.
class FramePacer {
public:
    using Clock = std::chrono::steady_clock;

    explicit FramePacer(uint32_t hz = cfg::kFrameHz, int max_catch_up = cfg::kMaxCatchUpFrames);

    void restart(Clock::time_point now = Clock::now());

    // Frames elapsed since the last call. The remainder carries over; a stall
    // longer than max_catch_up frames is dropped rather than replayed.
    int frames_due(Clock::time_point now = Clock::now());

    Clock::duration until_next(Clock::time_point now = Clock::now()) const;
    void wait_for_next();

    Clock::duration period() const { return period_; }

private:
    Clock::duration   period_;
    Clock::time_point next_;
    int               max_catch_up_;
};
