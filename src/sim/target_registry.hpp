#pragma once

#include "core/types.hpp"
#include "sim/vector2.hpp"

#include <map>
#include <vector>

namespace salvo::sim {

/// An enemy that weapons can acquire and damage. Movement and AI live
/// outside the weapon engine; this is the view it needs.
struct Target {
    u32 id = 0;
    Vector2 position;
    f32 hp = 0;
    f32 max_hp = 0;
    f32 radius = 12;
    bool active = true;
};

class TargetRegistry {
public:
    /// Add a target and assign it a unique ID. Returns the ID.
    u32 spawn(Vector2 position, f32 hp, f32 radius = 12);

    /// Remove a target by ID.
    void despawn(u32 id);

    /// Mark a target inactive (killed). It stays registered until sweep().
    void deactivate(u32 id);

    /// Erase all inactive targets.
    size_t sweep();

    /// Look up a target by ID. Returns nullptr if not found.
    Target* find(u32 id);
    const Target* find(u32 id) const;

    bool is_active(u32 id) const;

    /// Number of active targets.
    size_t active_count() const;
    size_t count() const { return targets_.size(); }

    /// IDs of active targets within radius of a point, in ID order.
    std::vector<u32> collect_in_radius(Vector2 center, f32 radius) const;

    /// Iterate all targets in ID order.
    template <typename F>
    void for_each(F&& fn) {
        for (auto& [id, t] : targets_)
            fn(t);
    }
    template <typename F>
    void for_each(F&& fn) const {
        for (const auto& [id, t] : targets_)
            fn(t);
    }

private:
    std::map<u32, Target> targets_;
    u32 next_id_ = 1;
};

} // namespace salvo::sim
