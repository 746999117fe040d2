#include "clock.hpp"

#include <thread>

FramePacer::FramePacer(uint32_t hz, int max_catch_up)
    : period_(std::chrono::duration_cast<Clock::duration>(std::chrono::nanoseconds(1'000'000'000 / (hz ? hz : 1)))),
      max_catch_up_(max_catch_up < 1 ? 1 : max_catch_up) {
    restart();
}

void FramePacer::restart(Clock::time_point now) {
    next_ = now + period_;
}

int FramePacer::frames_due(Clock::time_point now) {
    if (now < next_) return 0;
    auto behind = (now - next_) / period_;
    if (behind + 1 > max_catch_up_) {
        next_ = now + period_;
        return max_catch_up_;
    }
    int n = static_cast<int>(behind) + 1;
    next_ += period_ * n;
    return n;
}

FramePacer::Clock::duration FramePacer::until_next(Clock::time_point now) const {
    return now < next_ ? next_ - now : Clock::duration::zero();
}

void FramePacer::wait_for_next() {
    auto wait = until_next();
    if (wait > Clock::duration::zero()) std::this_thread::sleep_for(wait);
}
