#pragma once

#include "core/types.hpp"

#include <optional>
#include <string>
#include <string_view>
#include <unordered_map>
#include <vector>

namespace salvo::sim {

class TargetRegistry;

using ReservationId = u64;

/// A committed shot that is expected to land on a target.
struct Reservation {
    ReservationId id = 0;
    std::string weapon_id;
    u32 target_id = 0;
    f64 impact_time_ms = 0;
    f32 damage = 0;
    f64 expires_at_ms = 0;
};

/// Tuning knobs for overkill avoidance.
struct CoordinatorOptions {
    u32 candidate_count = 6;         ///< Nearest candidates scored per pass
    f64 eta_tolerance_ms = 120;      ///< Slack added to the impact horizon
    f64 expiry_buffer_ms = 150;      ///< Reservation lifetime past impact
    f32 overkill_tolerance = 0;
    f32 overkill_penalty_weight = 40;
    f32 killshot_window = 3;         ///< HP below which a shot is a kill shot
    f32 killshot_bonus = 120;
};

/// Shared ledger of in-flight damage. Weapons reserve before firing and
/// query predicted HP so several weapons don't all commit lethal damage to
/// the same target. Updated synchronously: later weapons in a tick see
/// reservations made by earlier ones.
class TargetingCoordinator {
public:
    explicit TargetingCoordinator(const TargetRegistry& registry,
                                  CoordinatorOptions options = {});

    /// Record a predicted impact. Empty weapon id or an inactive target is
    /// rejected.
    std::optional<ReservationId> reserve(std::string_view weapon_id,
                                         u32 target_id,
                                         f64 impact_time_ms, f32 damage);

    /// Sum of reserved damage on target landing at or before
    /// horizon + tolerance.
    f32 predicted_damage_before(u32 target_id, f64 horizon_ms,
                                f64 tolerance_ms = 0) const;

    f32 predicted_hp_at_impact(u32 target_id, f32 current_hp,
                               f64 impact_time_ms,
                               f64 tolerance_ms = 0) const;

    /// Remove one reservation. Returns whether it was found.
    bool consume_reservation(ReservationId id);

    /// Drop every reservation made by a weapon. Returns how many.
    size_t release_by_weapon(std::string_view weapon_id);

    void clear_for_target(u32 target_id);

    /// Drop expired reservations and those on inactive targets.
    void prune(f64 now_ms);

    void clear();

    const CoordinatorOptions& options() const { return options_; }
    void set_options(const CoordinatorOptions& options) { options_ = options; }

    size_t reservation_count() const { return index_.size(); }
    size_t reservation_count(u32 target_id) const;

private:
    const TargetRegistry& registry_;
    CoordinatorOptions options_;
    std::unordered_map<u32, std::vector<Reservation>> by_target_;
    std::unordered_map<ReservationId, u32> index_; ///< id -> target
    ReservationId next_id_ = 1;
};

} // namespace salvo::sim
