#include "sim/target_selection.hpp"
#include "sim/target_registry.hpp"
#include "sim/targeting_coordinator.hpp"

#include <algorithm>
#include <cmath>
#include <tuple>

namespace salvo::sim {

f64 estimate_impact_ms(const SelectionQuery& query, f32 distance) {
    f64 travel = query.speed > 0 ? (distance / query.speed) * 1000.0 : 0.0;
    return query.now_ms + query.latency_ms + travel;
}

f32 score_candidate(f32 distance, f32 hp, f32 predicted_damage,
                    f32 shot_damage, const TargetingCoordinator& coordinator) {
    const auto& opt = coordinator.options();
    f32 predicted_hp = hp - predicted_damage;
    f32 kill_window = std::max(opt.killshot_window, shot_damage);
    f32 score = -distance;

    if (predicted_hp <= -opt.overkill_tolerance) {
        score -= opt.overkill_penalty_weight *
                 (std::abs(predicted_hp) + opt.overkill_tolerance);
    } else if (predicted_hp <= 0) {
        score -= opt.overkill_penalty_weight * 0.5f;
    } else if (predicted_hp <= kill_window) {
        f32 closeness = std::clamp(1.0f - predicted_hp / kill_window, 0.0f, 1.0f);
        score += opt.killshot_bonus * closeness;
    } else if (predicted_damage > 0) {
        score -= (predicted_damage / std::max(1.0f, hp)) *
                 opt.overkill_penalty_weight * 0.2f;
    }
    return score;
}

std::optional<TargetChoice> select_target(const TargetRegistry& registry,
                                          const TargetingCoordinator& coordinator,
                                          const SelectionQuery& query) {
    std::vector<std::pair<f32, u32>> in_range;
    f32 r2 = query.range * query.range;
    registry.for_each([&](const Target& t) {
        if (!t.active) return;
        f32 d2 = (t.position - query.origin).length_sq();
        if (d2 <= r2) in_range.emplace_back(std::sqrt(d2), t.id);
    });
    if (in_range.empty()) return std::nullopt;

    std::sort(in_range.begin(), in_range.end());
    size_t n = std::min<size_t>(in_range.size(),
                                std::max<u32>(1, coordinator.options().candidate_count));

    auto evaluate = [&](f32 d, u32 id) {
        const Target* t = registry.find(id);
        TargetChoice c;
        c.target_id = id;
        c.distance = d;
        c.impact_time_ms = estimate_impact_ms(query, d);
        f32 predicted = coordinator.predicted_damage_before(
            id, c.impact_time_ms, coordinator.options().eta_tolerance_ms);
        c.predicted_hp = t->hp - predicted;
        c.score = score_candidate(d, t->hp, predicted, query.shot_damage, coordinator);
        return c;
    };

    std::optional<TargetChoice> best;
    for (size_t i = 0; i < n; i++) {
        TargetChoice c = evaluate(in_range[i].first, in_range[i].second);
        if (c.predicted_hp <= 0) continue;
        if (!best || std::make_tuple(-c.score, c.distance, c.target_id) <
                         std::make_tuple(-best->score, best->distance, best->target_id)) {
            best = c;
        }
    }

    // Everything is predicted dead; shoot the nearest anyway
    if (!best) return evaluate(in_range.front().first, in_range.front().second);
    return best;
}

std::optional<u32> nearest_target(const TargetRegistry& registry, Vector2 point,
                                  f32 radius, const std::vector<u32>& exclude) {
    std::optional<u32> best;
    f32 best_d2 = radius * radius;
    registry.for_each([&](const Target& t) {
        if (!t.active) return;
        if (std::find(exclude.begin(), exclude.end(), t.id) != exclude.end()) return;
        f32 d2 = (t.position - point).length_sq();
        // Ties keep the lower id since iteration is in id order
        if (d2 < best_d2 || (!best && d2 <= best_d2)) {
            best_d2 = d2;
            best = t.id;
        }
    });
    return best;
}

std::vector<AreaHit> collect_area_targets(const TargetRegistry& registry,
                                          const AreaQuery& query) {
    std::vector<AreaHit> hits;
    if (query.radius <= 0) return hits;

    bool use_arc = query.arc_deg > 0 && query.arc_deg < 360;
    f32 half_arc = query.arc_deg * 0.5f * DEG_TO_RAD;
    f32 aim_angle = query.aim.angle();

    registry.for_each([&](const Target& t) {
        if (!t.active || t.id == query.exclude_id) return;
        Vector2 offset = t.position - query.center;
        f32 d = offset.length();
        if (d > query.radius + t.radius) return;
        if (use_arc && d > 0.001f) {
            f32 diff = std::remainder(offset.angle() - aim_angle, 2 * PI);
            if (std::abs(diff) > half_arc) return;
        }
        hits.push_back({t.id, d});
    });

    std::sort(hits.begin(), hits.end(), [](const AreaHit& a, const AreaHit& b) {
        return std::tie(a.distance, a.target_id) < std::tie(b.distance, b.target_id);
    });
    if (query.max_targets > 0 && hits.size() > static_cast<size_t>(query.max_targets)) {
        hits.resize(static_cast<size_t>(query.max_targets));
    }
    return hits;
}

f32 falloff_multiplier(f32 falloff, f32 distance) {
    return std::max(0.0f, 1.0f - falloff * distance / 100.0f);
}

} // namespace salvo::sim
