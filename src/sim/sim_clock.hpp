#pragma once

#include "core/types.hpp"

namespace salvo::sim {

/// Monotonic simulation time in milliseconds, advanced by the driver.
/// Timed weapon behavior compares deadlines against now_ms(); nothing in
/// the engine reads the wall clock.
class SimClock {
public:
    f64 now_ms() const { return now_ms_; }

    /// Advance by delta_ms scaled by the time scale. Returns the applied
    /// delta (0 while paused).
    f64 advance(f64 delta_ms);

    void set_paused(bool paused) { paused_ = paused; }
    bool paused() const { return paused_; }

    void set_time_scale(f64 scale);
    f64 time_scale() const { return time_scale_; }

private:
    f64 now_ms_ = 0;
    f64 time_scale_ = 1;
    bool paused_ = false;
};

} // namespace salvo::sim
