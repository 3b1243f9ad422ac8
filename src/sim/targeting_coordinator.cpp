#include "sim/targeting_coordinator.hpp"
#include "sim/target_registry.hpp"

#include <algorithm>
#include <cmath>
#include <spdlog/spdlog.h>

namespace salvo::sim {

TargetingCoordinator::TargetingCoordinator(const TargetRegistry& registry,
                                           CoordinatorOptions options)
    : registry_(registry), options_(options) {}

std::optional<ReservationId> TargetingCoordinator::reserve(
    std::string_view weapon_id, u32 target_id, f64 impact_time_ms,
    f32 damage) {
    if (weapon_id.empty() || !registry_.is_active(target_id)) {
        return std::nullopt;
    }
    if (!std::isfinite(impact_time_ms) || !std::isfinite(damage)) {
        return std::nullopt;
    }

    Reservation r;
    r.id = next_id_++;
    ReservationId id = r.id;
    r.weapon_id = std::string(weapon_id);
    r.target_id = target_id;
    r.impact_time_ms = impact_time_ms;
    r.damage = std::max(0.0f, damage);
    r.expires_at_ms = impact_time_ms + options_.expiry_buffer_ms;

    by_target_[target_id].push_back(std::move(r));
    index_[id] = target_id;
    return id;
}

f32 TargetingCoordinator::predicted_damage_before(u32 target_id,
                                                  f64 horizon_ms,
                                                  f64 tolerance_ms) const {
    auto it = by_target_.find(target_id);
    if (it == by_target_.end()) return 0;

    f64 limit = horizon_ms + std::max(0.0, tolerance_ms);
    f32 total = 0;
    for (const auto& r : it->second) {
        if (r.impact_time_ms <= limit) total += r.damage;
    }
    return total;
}

f32 TargetingCoordinator::predicted_hp_at_impact(u32 target_id,
                                                 f32 current_hp,
                                                 f64 impact_time_ms,
                                                 f64 tolerance_ms) const {
    return current_hp -
           predicted_damage_before(target_id, impact_time_ms, tolerance_ms);
}

bool TargetingCoordinator::consume_reservation(ReservationId id) {
    auto idx = index_.find(id);
    if (idx == index_.end()) {
        spdlog::debug("Reservation #{} already consumed or pruned", id);
        return false;
    }

    u32 target_id = idx->second;
    index_.erase(idx);

    auto it = by_target_.find(target_id);
    if (it == by_target_.end()) return false;
    auto& list = it->second;
    std::erase_if(list, [id](const Reservation& r) { return r.id == id; });
    if (list.empty()) by_target_.erase(it);
    return true;
}

size_t TargetingCoordinator::release_by_weapon(std::string_view weapon_id) {
    size_t removed = 0;
    for (auto it = by_target_.begin(); it != by_target_.end();) {
        auto& list = it->second;
        removed += std::erase_if(list, [&](const Reservation& r) {
            if (r.weapon_id != weapon_id) return false;
            index_.erase(r.id);
            return true;
        });
        it = list.empty() ? by_target_.erase(it) : std::next(it);
    }
    return removed;
}

void TargetingCoordinator::clear_for_target(u32 target_id) {
    auto it = by_target_.find(target_id);
    if (it == by_target_.end()) return;
    for (const auto& r : it->second) index_.erase(r.id);
    by_target_.erase(it);
}

void TargetingCoordinator::prune(f64 now_ms) {
    for (auto it = by_target_.begin(); it != by_target_.end();) {
        auto& list = it->second;
        if (!registry_.is_active(it->first)) {
            for (const auto& r : list) index_.erase(r.id);
            it = by_target_.erase(it);
            continue;
        }
        std::erase_if(list, [&](const Reservation& r) {
            if (r.expires_at_ms > now_ms) return false;
            index_.erase(r.id);
            return true;
        });
        it = list.empty() ? by_target_.erase(it) : std::next(it);
    }
}

void TargetingCoordinator::clear() {
    by_target_.clear();
    index_.clear();
}

size_t TargetingCoordinator::reservation_count(u32 target_id) const {
    auto it = by_target_.find(target_id);
    return it != by_target_.end() ? it->second.size() : 0;
}

} // namespace salvo::sim
