#include "sim/projectile_pool.hpp"
#include "sim/target_registry.hpp"
#include "sim/weapon_owner.hpp"

#include <algorithm>
#include <spdlog/spdlog.h>

namespace salvo::sim {

ProjectilePool::ProjectilePool(u32 capacity, TargetingCoordinator* coordinator)
    : capacity_(std::max<u32>(capacity, 1)), coordinator_(coordinator) {
    slots_.reserve(capacity_);
    free_.reserve(capacity_);
    contacts_.reserve(32);
}

ProjectilePool::~ProjectilePool() {
    listener_ = nullptr;
    release_all();
}

std::optional<ProjectileHandle> ProjectilePool::acquire() {
    ProjectileHandle handle;
    if (!free_.empty()) {
        handle = free_.back();
        free_.pop_back();
    } else if (slots_.size() < capacity_) {
        handle = static_cast<ProjectileHandle>(slots_.size());
        slots_.emplace_back();
        slots_.back().hit_set.reserve(HIT_SET_RESERVE);
    } else {
        skipped_acquires_++;
        return std::nullopt;
    }

    auto& p = slots_[handle];
    p.active = true;
    p.in_flight = false;
    active_count_++;
    return handle;
}

void ProjectilePool::reset_flight(Projectile& p) {
    p.hit_set.clear();
    p.explosion.reset();
    p.reservation.reset();
    p.velocity = {};
    p.travelled = 0;
    p.target_id = 0;
    p.hop = 0;
    p.orbit_center = nullptr;
}

void ProjectilePool::fire(ProjectileHandle handle, const FireParams& params,
                          f64 now_ms) {
    if (handle >= slots_.size() || !slots_[handle].active) {
        spdlog::debug("fire() on inactive projectile slot {}", handle);
        return;
    }
    auto& p = slots_[handle];
    if (p.in_flight) {
        // Re-fire replaces the previous flight, including its deadline
        consume_reservation(handle);
        p.generation++;
    }
    reset_flight(p);

    p.in_flight = true;
    p.trajectory = params.trajectory;
    p.position = params.position;
    p.origin = params.position;
    p.angle = params.angle;
    p.velocity = Vector2::from_angle(params.angle) * params.speed;
    p.acceleration = params.acceleration;
    p.gravity = params.gravity;
    p.rotate_to_velocity = params.rotate_to_velocity;
    p.collide = params.collide;
    p.damage = params.damage;
    p.hit_radius = params.hit_radius;
    p.pierce = std::max(0, params.pierce);
    p.max_distance = params.max_distance;
    p.expires_at_ms = now_ms + std::max(0.0f, params.lifetime_ms);
    p.explosion = params.explosion;
    p.target_id = params.target_id;
    p.reservation = params.reservation;
    p.scope = params.scope;
}

void ProjectilePool::fire_orbit(ProjectileHandle handle,
                                const OrbitParams& params, f64 now_ms) {
    if (handle >= slots_.size() || !slots_[handle].active) {
        spdlog::debug("fire_orbit() on inactive projectile slot {}", handle);
        return;
    }
    auto& p = slots_[handle];
    if (p.in_flight) {
        consume_reservation(handle);
        p.generation++;
    }
    reset_flight(p);

    p.in_flight = true;
    p.trajectory = Trajectory::Orbit;
    p.orbit_center = params.center;
    p.orbit_radius = params.radius;
    // Screen space has y pointing down, so a positive angle step is clockwise
    p.orbit_speed = params.clockwise ? params.angular_velocity
                                     : -params.angular_velocity;
    p.orbit_phase = params.start_phase;
    p.origin = params.center ? params.center->position() : Vector2{};
    p.position = p.origin + Vector2::from_angle(p.orbit_phase) * p.orbit_radius;
    p.angle = p.orbit_phase;
    p.acceleration = 0;
    p.gravity = 0;
    p.rotate_to_velocity = false;
    p.collide = true;
    p.damage = params.damage;
    p.hit_radius = params.hit_radius;
    p.pierce = std::max(0, params.pierce);
    p.max_distance = 0;
    p.expires_at_ms = now_ms + std::max(0.0f, params.lifetime_ms);
    p.scope = params.scope;
}

void ProjectilePool::step_motion(Projectile& p, f32 dt_s) {
    if (p.trajectory == Trajectory::Orbit) {
        p.orbit_phase += p.orbit_speed * dt_s;
        Vector2 center = p.orbit_center ? p.orbit_center->position() : p.origin;
        p.position = center + Vector2::from_angle(p.orbit_phase) * p.orbit_radius;
        p.angle = p.orbit_phase;
        return;
    }

    if (p.acceleration != 0) {
        p.velocity += p.velocity.normalized() * (p.acceleration * dt_s);
    }
    if (p.gravity != 0) {
        p.velocity.y += p.gravity * dt_s;
    }

    Vector2 step = p.velocity * dt_s;
    p.position += step;
    p.travelled += step.length();
    if (p.rotate_to_velocity && p.velocity.length_sq() > 0) {
        p.angle = p.velocity.angle();
    }
}

void ProjectilePool::check_contacts(ProjectileHandle handle,
                                    TargetRegistry& registry) {
    const auto& p = slots_[handle];
    contacts_.clear();
    registry.for_each([&](const Target& t) {
        if (!t.active) return;
        if (std::find(p.hit_set.begin(), p.hit_set.end(), t.id) != p.hit_set.end())
            return;
        f32 d = distance(p.position, t.position);
        if (d <= p.hit_radius + t.radius) contacts_.emplace_back(d, t.id);
    });
    if (contacts_.empty()) return;

    // Nearest first
    std::sort(contacts_.begin(), contacts_.end());
    u32 generation = p.generation;
    for (const auto& [d, id] : contacts_) {
        if (!is_current(handle, generation)) break;
        Target* t = registry.find(id);
        if (!t || !t->active) continue;
        register_hit(handle, id);
        if (listener_) listener_->on_projectile_hit(handle, *t);
    }
}

void ProjectilePool::update(f64 delta_ms, f64 now_ms, TargetRegistry& registry) {
    f32 dt_s = static_cast<f32>(delta_ms / 1000.0);
    size_t count = slots_.size();

    for (ProjectileHandle i = 0; i < count; i++) {
        if (!slots_[i].active || !slots_[i].in_flight) continue;
        u32 generation = slots_[i].generation;

        step_motion(slots_[i], dt_s);

        const auto& p = slots_[i];
        if (p.max_distance > 0 && p.travelled >= p.max_distance) {
            release(i);
            continue;
        }

        if (p.collide) {
            check_contacts(i, registry);
            if (!is_current(i, generation)) continue;
        }

        std::optional<ExpiryReason> expiry;
        if (p.trajectory == Trajectory::Ballistic && p.velocity.y > 0 &&
            p.position.y >= p.origin.y) {
            expiry = ExpiryReason::GroundReturn;
        } else if (now_ms >= p.expires_at_ms) {
            expiry = ExpiryReason::Lifetime;
        }

        if (expiry) {
            if (listener_) listener_->on_projectile_expired(i, *expiry);
            if (is_current(i, generation)) release(i);
        }
    }
}

bool ProjectilePool::release(ProjectileHandle handle) {
    if (handle >= slots_.size() || !slots_[handle].active) return false;

    auto& p = slots_[handle];
    if (listener_) listener_->on_projectile_released(p);
    consume_reservation(handle);
    reset_flight(p);
    p.active = false;
    p.in_flight = false;
    p.generation++;
    free_.push_back(handle);
    active_count_--;
    return true;
}

void ProjectilePool::release_all() {
    for (ProjectileHandle i = 0; i < slots_.size(); i++) {
        release(i);
    }
}

bool ProjectilePool::consume_pierce(ProjectileHandle handle) {
    auto& p = slots_[handle];
    if (p.pierce <= 0) return false;
    p.pierce--;
    return true;
}

bool ProjectilePool::has_hit(ProjectileHandle handle, u32 target_id) const {
    const auto& hits = slots_[handle].hit_set;
    return std::find(hits.begin(), hits.end(), target_id) != hits.end();
}

void ProjectilePool::register_hit(ProjectileHandle handle, u32 target_id) {
    if (!has_hit(handle, target_id)) slots_[handle].hit_set.push_back(target_id);
}

void ProjectilePool::clear_hits(ProjectileHandle handle) {
    slots_[handle].hit_set.clear();
}

void ProjectilePool::relocate(ProjectileHandle handle, Vector2 position) {
    slots_[handle].position = position;
}

void ProjectilePool::steer(ProjectileHandle handle, Vector2 velocity) {
    auto& p = slots_[handle];
    p.velocity = velocity;
    if (p.rotate_to_velocity && velocity.length_sq() > 0) p.angle = velocity.angle();
}

void ProjectilePool::consume_reservation(ProjectileHandle handle) {
    auto& p = slots_[handle];
    if (p.reservation && coordinator_) {
        coordinator_->consume_reservation(*p.reservation);
    }
    p.reservation.reset();
}

bool ProjectilePool::is_current(ProjectileHandle handle, u32 generation) const {
    return handle < slots_.size() && slots_[handle].active &&
           slots_[handle].generation == generation;
}

} // namespace salvo::sim
