#include "sim/target_registry.hpp"

#include <algorithm>

namespace salvo::sim {

u32 TargetRegistry::spawn(Vector2 position, f32 hp, f32 radius) {
    u32 id = next_id_++;
    Target t;
    t.id = id;
    t.position = position;
    t.hp = hp;
    t.max_hp = hp;
    t.radius = radius;
    targets_.emplace(id, t);
    return id;
}

void TargetRegistry::despawn(u32 id) {
    targets_.erase(id);
}

void TargetRegistry::deactivate(u32 id) {
    if (auto* t = find(id)) t->active = false;
}

size_t TargetRegistry::sweep() {
    return std::erase_if(targets_,
                         [](const auto& entry) { return !entry.second.active; });
}

Target* TargetRegistry::find(u32 id) {
    auto it = targets_.find(id);
    return it != targets_.end() ? &it->second : nullptr;
}

const Target* TargetRegistry::find(u32 id) const {
    auto it = targets_.find(id);
    return it != targets_.end() ? &it->second : nullptr;
}

bool TargetRegistry::is_active(u32 id) const {
    const auto* t = find(id);
    return t && t->active;
}

size_t TargetRegistry::active_count() const {
    return static_cast<size_t>(std::count_if(
        targets_.begin(), targets_.end(),
        [](const auto& entry) { return entry.second.active; }));
}

std::vector<u32> TargetRegistry::collect_in_radius(Vector2 center,
                                                   f32 radius) const {
    std::vector<u32> result;
    f32 r2 = radius * radius;
    for (const auto& [id, t] : targets_) {
        if (!t.active) continue;
        if ((t.position - center).length_sq() <= r2)
            result.push_back(id);
    }
    return result;
}

} // namespace salvo::sim
