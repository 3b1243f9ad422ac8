#pragma once

#include "core/types.hpp"
#include "sim/vector2.hpp"

#include <optional>
#include <vector>

namespace salvo::sim {

class TargetRegistry;
class TargetingCoordinator;

struct SelectionQuery {
    Vector2 origin;
    f32 range = 0;
    f32 shot_damage = 0;   ///< Resolved damage of the shot being aimed
    f32 speed = 0;         ///< px/s; 0 means the hit is not travel-delayed
    f64 latency_ms = 0;    ///< Fixed delay before impact (warmup, strike delay)
    f64 now_ms = 0;
};

struct TargetChoice {
    u32 target_id = 0;
    f32 distance = 0;
    f32 predicted_hp = 0;
    f32 score = 0;
    f64 impact_time_ms = 0;
};

/// Predicted impact time for a shot at `distance`.
f64 estimate_impact_ms(const SelectionQuery& query, f32 distance);

/// Score one candidate. Higher is better. Overkill is penalized in
/// proportion to wasted damage; finishing a nearly dead target earns a
/// bonus that fades out across the kill-shot window.
f32 score_candidate(f32 distance, f32 hp, f32 predicted_damage,
                    f32 shot_damage, const TargetingCoordinator& coordinator);

/// Pick a target among the nearest in-range candidates, preferring those
/// not already predicted dead. Falls back to the nearest target when every
/// candidate is predicted dead. Ties break on distance then id.
std::optional<TargetChoice> select_target(const TargetRegistry& registry,
                                          const TargetingCoordinator& coordinator,
                                          const SelectionQuery& query);

/// Nearest active target to a point within radius, skipping `exclude`.
std::optional<u32> nearest_target(const TargetRegistry& registry, Vector2 point,
                                  f32 radius, const std::vector<u32>& exclude = {});

struct AreaQuery {
    Vector2 center;
    f32 radius = 0;
    i32 max_targets = 0;   ///< 0 = unlimited
    f32 arc_deg = 0;       ///< 0 = full circle
    Vector2 aim{1, 0};     ///< Arc center direction
    u32 exclude_id = 0;
};

struct AreaHit {
    u32 target_id = 0;
    f32 distance = 0;
};

/// Active targets touched by an area effect, nearest first.
std::vector<AreaHit> collect_area_targets(const TargetRegistry& registry,
                                          const AreaQuery& query);

/// Damage multiplier at `distance` for a falloff of `falloff` per 100 px.
f32 falloff_multiplier(f32 falloff, f32 distance);

} // namespace salvo::sim
