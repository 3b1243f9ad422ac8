// Per-archetype fire routines for WeaponController. Each routine runs once
// per activation; anything that lands later goes through the projectile
// pool or the pending effect queue so it stays inside the fire scope.

#include "sim/damage_pipeline.hpp"
#include "sim/target_registry.hpp"
#include "sim/target_selection.hpp"
#include "sim/targeting_coordinator.hpp"
#include "sim/weapon_controller.hpp"
#include "sim/weapon_owner.hpp"

#include <algorithm>
#include <cmath>

namespace salvo::sim {

namespace {

/// Area used by cluster bombs, bazooka detonations and strikes.
defs::ExplosionStats area_of(const defs::WeaponStats& stats) {
    if (stats.aoe.enabled) return stats.aoe.as_explosion();
    if (stats.projectile.explosion) return *stats.projectile.explosion;
    return {};
}

/// Damage scale at a chain hop: linear, reaching zero at 1/falloff hops.
f32 hop_scale(f32 falloff_per_hop, u32 hop) {
    return std::max(0.0f, 1.0f - falloff_per_hop * static_cast<f32>(hop));
}

Vector2 random_point_in_disc(std::mt19937& rng, Vector2 center, f32 radius) {
    std::uniform_real_distribution<f32> unit(0.0f, 1.0f);
    f32 angle = unit(rng) * 2 * PI;
    f32 r = radius * std::sqrt(unit(rng));
    return center + Vector2::from_angle(angle) * r;
}

} // namespace

// ---------------------------------------------------------------------------
// Straight shots
// ---------------------------------------------------------------------------

void WeaponController::fire_straight(const Aim& aim, f32 angle, bool reserve_hit,
                                     f64 now) {
    auto handle = pool_.acquire();
    if (!handle) {
        report_skipped("pool-exhausted");
        return;
    }

    const auto& ps = stats_.projectile;
    f32 raw = roll_damage();

    FireParams params;
    params.position = owner_.position();
    params.angle = angle;
    params.speed = ps.speed;
    params.lifetime_ms = ps.lifetime_ms;
    params.pierce = ps.pierce;
    params.damage = raw;
    params.hit_radius = ps.hit_radius;
    params.max_distance = ps.max_distance;
    params.gravity = ps.gravity;
    params.acceleration = ps.acceleration;
    params.rotate_to_velocity = ps.rotate_to_velocity;
    params.explosion = ps.explosion;
    params.scope = current_scope_;

    if (reserve_hit && aim.target_id) {
        if (const Target* t = ctx_.registry.find(*aim.target_id)) {
            f32 d = distance(params.position, t->position);
            f64 eta = now + (ps.speed > 0 ? d / ps.speed * 1000.0 : 0.0);
            params.target_id = t->id;
            params.reservation = reserve(t->id, eta, raw);
        }
    }

    track(current_scope_);
    pool_.fire(*handle, params, now);
}

void WeaponController::fire_archetype(const defs::ProjectileArchetype&,
                                      const Aim& aim, f64 now) {
    const auto& cadence = stats_.cadence;
    i32 count = std::max(1, cadence.salvo);
    f32 center = aim.direction.angle();

    f32 target_radius = 0;
    if (aim.target_id) {
        if (const Target* t = ctx_.registry.find(*aim.target_id)) target_radius = t->radius;
    }

    for (i32 i = 0; i < count; i++) {
        f32 offset = cadence.spread_deg * (i - (count - 1) * 0.5f) * DEG_TO_RAD;
        // Only shots that actually pass through the target claim damage on it
        bool on_target = std::abs(offset) * aim.distance <=
                         stats_.projectile.hit_radius + target_radius;
        f32 angle = center + offset;

        f64 delay = i * cadence.salvo_spacing_ms;
        if (delay <= 0) {
            fire_straight(aim, angle, on_target, now);
        } else {
            schedule(now + delay, [this, aim, angle, on_target](f64 t) {
                fire_straight(aim, angle, on_target, t);
            });
        }
    }
}

void WeaponController::fire_archetype(const defs::BurstArchetype& a,
                                      const Aim& aim, f64 now) {
    i32 count = std::max(1, a.count);
    for (i32 i = 0; i < count; i++) {
        f32 angle;
        if (a.pattern == defs::BurstPattern::Ring) {
            angle = a.base_angle_deg * DEG_TO_RAD + 2 * PI * i / count;
        } else {
            f32 t = count > 1 ? static_cast<f32>(i) / (count - 1) - 0.5f : 0.0f;
            angle = aim.direction.angle() + a.spread_deg * t * DEG_TO_RAD;
        }

        f64 delay = i * a.stagger_ms;
        if (delay <= 0) {
            fire_straight(aim, angle, false, now);
        } else {
            schedule(now + delay,
                     [this, aim, angle](f64 t) { fire_straight(aim, angle, false, t); });
        }
    }
}

void WeaponController::fire_archetype(const defs::BallisticArchetype& a,
                                      const Aim& aim, f64 now) {
    auto handle = pool_.acquire();
    if (!handle) {
        report_skipped("pool-exhausted");
        return;
    }

    // Lob toward the side the owner faces
    f32 angle_deg = a.launch_angle_deg;
    if (aim.direction.x < 0) angle_deg = -180.0f - angle_deg;

    const auto& ps = stats_.projectile;
    FireParams params;
    params.trajectory = Trajectory::Ballistic;
    params.position = owner_.position();
    params.angle = angle_deg * DEG_TO_RAD;
    params.speed = a.launch_speed;
    params.gravity = a.gravity;
    params.lifetime_ms = ps.lifetime_ms;
    params.pierce = 0;
    params.damage = roll_damage();
    params.hit_radius = ps.hit_radius;
    params.rotate_to_velocity = ps.rotate_to_velocity;
    params.explosion = ps.explosion;
    params.scope = current_scope_;

    track(current_scope_);
    pool_.fire(*handle, params, now);
}

void WeaponController::fire_archetype(const defs::BazookaArchetype&, const Aim& aim,
                                      f64 now) {
    fire_straight(aim, aim.direction.angle(), true, now);
}

void WeaponController::detonate(Vector2 point, f32 raw, f64 now) {
    apply_area(point, raw, area_of(stats_));

    const auto* a = std::get_if<defs::BazookaArchetype>(&stats_.archetype);
    if (!a || a->cluster.count <= 0) return;

    // Secondary bomblets, one per tick while the detonation window lasts
    f64 window = a->detonate_seconds * 1000.0;
    f64 tick = std::max(1.0f, a->tick_ms);
    for (i32 i = 0; i < a->cluster.count; i++) {
        f64 offset = (i + 1) * tick;
        if (offset > window) break;
        Vector2 at = random_point_in_disc(ctx_.rng, point, a->cluster.spread_radius);
        schedule(now + offset, [this, at, raw](f64) { apply_area(at, raw, area_of(stats_)); });
    }
}

void WeaponController::explode(ProjectileHandle handle, u32 exclude_id) {
    const auto& p = pool_.get(handle);
    std::optional<defs::ExplosionStats> area = p.explosion;
    if (!area && stats_.aoe.enabled) area = stats_.aoe.as_explosion();
    if (!area || area->radius <= 0) return;

    Vector2 at = p.position;
    f32 raw = p.damage;
    apply_area(at, raw, *area, exclude_id);
}

// ---------------------------------------------------------------------------
// Melee and area
// ---------------------------------------------------------------------------

void WeaponController::fire_archetype(const defs::SlashArchetype& a, const Aim& aim,
                                      f64 now) {
    defs::ExplosionStats area;
    area.radius = std::max(stats_.aoe.radius, a.offset_px + a.length_px);
    if (stats_.aoe.enabled) {
        area.damage_mult = stats_.aoe.damage_mult;
        area.max_targets = stats_.aoe.max_targets;
        area.falloff = stats_.aoe.falloff;
    }

    f32 raw = roll_damage();
    Vector2 origin = aim.origin;
    Vector2 direction = aim.direction;
    bool follow = a.follow_owner;
    f32 arc = a.arc_deg;

    auto swing = [this, area, raw, origin, direction, follow, arc](f64) {
        Vector2 center = follow ? owner_.position() : origin;
        apply_area(center, raw, area, 0, arc, direction);
    };

    if (a.hit_delay_ms > 0) {
        schedule(now + a.hit_delay_ms, swing);
    } else {
        swing(now);
    }
}

void WeaponController::fire_archetype(const defs::ClusterArchetype& a, const Aim& aim,
                                      f64 now) {
    defs::ExplosionStats area = area_of(stats_);
    for (i32 i = 0; i < a.count; i++) {
        Vector2 at = random_point_in_disc(ctx_.rng, aim.point, a.spread_radius);
        f32 raw = roll_damage();

        f64 delay = i * a.stagger_ms;
        if (delay <= 0) {
            apply_area(at, raw, area);
        } else {
            schedule(now + delay, [this, at, raw, area](f64) { apply_area(at, raw, area); });
        }
    }
}

void WeaponController::fire_archetype(const defs::StrikeArchetype&, const Aim& aim,
                                      f64 now) {
    if (!aim.target_id) return;
    u32 target_id = *aim.target_id;
    f32 raw = roll_damage();

    f64 delay = stats_.aoe.timing == defs::AoeTiming::Animation ? stats_.aoe.delay_ms : 0.0;
    auto reservation = reserve(target_id, now + delay, raw);

    auto land = [this, target_id, raw, reservation](f64) {
        if (reservation) ctx_.coordinator.consume_reservation(*reservation);
        Target* t = ctx_.registry.find(target_id);
        if (!t) return;
        Vector2 at = t->position;
        if (t->active) apply_hit(*t, ctx_.damage.resolve(*t, raw), at);
        if (stats_.aoe.enabled) apply_area(at, raw, stats_.aoe.as_explosion(), target_id);
    };

    if (delay > 0) {
        schedule(now + delay, land);
    } else {
        land(now);
    }
}

void WeaponController::fire_archetype(const defs::CrossArchetype& a, const Aim& aim,
                                      f64 now) {
    Vector2 axis = cross_axis_ == defs::CrossAxis::Horizontal ? Vector2{1, 0}
                                                              : Vector2{0, 1};
    cross_axis_ = cross_axis_ == defs::CrossAxis::Horizontal ? defs::CrossAxis::Vertical
                                                             : defs::CrossAxis::Horizontal;

    f32 raw = roll_damage();
    Vector2 origin = aim.origin;
    cross_step(origin, axis, 0, raw);
    for (i32 step = 1; step < a.steps; step++) {
        schedule(now + step * a.frame_ms, [this, origin, axis, step, raw](f64) {
            cross_step(origin, axis, step, raw);
        });
    }
}

void WeaponController::cross_step(Vector2 origin, Vector2 axis, i32 step, f32 raw) {
    const auto* a = std::get_if<defs::CrossArchetype>(&stats_.archetype);
    if (!a) return;

    defs::ExplosionStats area;
    if (stats_.aoe.enabled) {
        area = stats_.aoe.as_explosion();
    } else {
        area.radius = stats_.projectile.hit_radius;
    }

    f32 reach = a->step_px_per_frame * step;
    apply_area(origin + axis * reach, raw, area);
    // Both arms share the center on the first frame
    if (reach > 0) apply_area(origin - axis * reach, raw, area);
}

// ---------------------------------------------------------------------------
// Chains and orbits
// ---------------------------------------------------------------------------

void WeaponController::fire_archetype(const defs::ChainArchetype& a, const Aim& aim,
                                      f64) {
    if (!aim.target_id) return;
    f32 raw = roll_damage();

    std::vector<u32> visited;
    std::optional<u32> current = aim.target_id;
    for (i32 hop = 0; hop < a.max_hops && current; hop++) {
        Target* t = ctx_.registry.find(*current);
        if (!t) break;
        visited.push_back(t->id);
        Vector2 at = t->position;

        f32 scaled = raw * hop_scale(a.falloff_per_hop, static_cast<u32>(hop));
        apply_hit(*t, ctx_.damage.resolve(*t, scaled), at);
        current = nearest_target(ctx_.registry, at, a.hop_radius, visited);
    }
}

void WeaponController::fire_archetype(const defs::ChainThrowArchetype& a,
                                      const Aim& aim, f64 now) {
    if (!aim.target_id) return;
    auto handle = pool_.acquire();
    if (!handle) {
        report_skipped("pool-exhausted");
        return;
    }

    f32 raw = roll_damage();
    f32 hop_s = std::max(1.0f, a.per_hop_duration_ms) / 1000.0f;
    Vector2 to_target = aim.point - owner_.position();
    FireParams params;
    params.position = owner_.position();
    params.angle = to_target.angle();
    params.speed = to_target.length() / hop_s;
    params.rotate_to_velocity = stats_.projectile.rotate_to_velocity;
    params.lifetime_ms = a.per_hop_duration_ms * (a.max_hops + 1);
    params.damage = raw;
    params.hit_radius = stats_.projectile.hit_radius;
    params.collide = false;
    params.target_id = *aim.target_id;
    params.reservation = reserve(*aim.target_id, now + a.per_hop_duration_ms, raw);
    params.scope = current_scope_;

    track(current_scope_);
    pool_.fire(*handle, params, now);

    ProjectileHandle h = *handle;
    u32 generation = pool_.get(h).generation;
    u32 first = *aim.target_id;
    auto visited = std::make_shared<std::vector<u32>>();
    schedule(now + a.per_hop_duration_ms, [this, h, generation, first, visited](f64 t) {
        chain_throw_hop(h, generation, first, 0, visited, t);
    });
}

void WeaponController::chain_throw_hop(ProjectileHandle handle, u32 generation,
                                       u32 target_id, u32 hop,
                                       std::shared_ptr<std::vector<u32>> visited,
                                       f64 now) {
    if (!pool_.is_current(handle, generation)) return;
    const auto* a = std::get_if<defs::ChainThrowArchetype>(&stats_.archetype);
    if (!a) {
        pool_.release(handle);
        return;
    }
    if (hop == 0) pool_.consume_reservation(handle);

    // Target died on the way; bounce to whatever is closest instead
    Target* t = ctx_.registry.find(target_id);
    if (!t || !t->active) {
        auto fallback = nearest_target(ctx_.registry, pool_.get(handle).position,
                                       a->hop_radius, *visited);
        t = fallback ? ctx_.registry.find(*fallback) : nullptr;
    }
    if (!t) {
        pool_.release(handle);
        return;
    }

    Vector2 at = t->position;
    pool_.relocate(handle, at);
    pool_.steer(handle, {});
    visited->push_back(t->id);

    f32 scaled = pool_.get(handle).damage * hop_scale(a->falloff_per_hop, hop);
    apply_hit(*t, ctx_.damage.resolve(*t, scaled), at);

    if (static_cast<i32>(hop) + 1 >= a->max_hops) {
        pool_.release(handle);
        return;
    }
    auto next = nearest_target(ctx_.registry, at, a->hop_radius, *visited);
    if (!next) {
        pool_.release(handle);
        return;
    }

    // Fly toward the next target so it arrives as the hop lands
    u32 next_id = *next;
    f32 hop_s = std::max(1.0f, a->per_hop_duration_ms) / 1000.0f;
    pool_.steer(handle, (ctx_.registry.find(next_id)->position - at) * (1.0f / hop_s));
    schedule(now + a->per_hop_duration_ms,
             [this, handle, generation, next_id, hop, visited](f64 t_ms) {
                 chain_throw_hop(handle, generation, next_id, hop + 1, visited, t_ms);
             });
}

void WeaponController::fire_archetype(const defs::CircularArchetype& a, const Aim&,
                                      f64 now) {
    i32 count = std::max(1, a.count);
    for (i32 i = 0; i < count; i++) {
        auto handle = pool_.acquire();
        if (!handle) {
            report_skipped("pool-exhausted");
            return;
        }

        OrbitParams params;
        params.center = &owner_;
        params.radius = a.radius;
        params.angular_velocity = a.angular_velocity;
        params.clockwise = a.clockwise;
        params.start_phase = a.start_phase + 2 * PI * i / count;
        params.lifetime_ms = stats_.projectile.lifetime_ms;
        if (stats_.projectile.pierce > 0) params.pierce = stats_.projectile.pierce;
        params.damage = roll_damage();
        params.hit_radius = stats_.projectile.hit_radius;
        params.scope = current_scope_;

        track(current_scope_);
        pool_.fire_orbit(*handle, params, now);
    }
}

} // namespace salvo::sim
