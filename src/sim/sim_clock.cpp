#include "sim/sim_clock.hpp"

#include <algorithm>

namespace salvo::sim {

f64 SimClock::advance(f64 delta_ms) {
    if (paused_ || delta_ms <= 0) return 0;
    f64 scaled = delta_ms * time_scale_;
    now_ms_ += scaled;
    return scaled;
}

void SimClock::set_time_scale(f64 scale) {
    time_scale_ = std::max(0.0, scale);
}

} // namespace salvo::sim
