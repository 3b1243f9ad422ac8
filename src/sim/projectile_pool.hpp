#pragma once

#include "core/types.hpp"
#include "defs/weapon_stats.hpp"
#include "sim/targeting_coordinator.hpp"
#include "sim/vector2.hpp"

#include <optional>
#include <string>
#include <vector>

namespace salvo::sim {

class TargetRegistry;
class WeaponOwner;
struct Target;

using ProjectileHandle = u32;

enum class Trajectory { Straight, Ballistic, Orbit };
enum class ExpiryReason { Lifetime, GroundReturn };

/// Launch parameters for velocity-driven shots.
struct FireParams {
    Vector2 position;
    f32 angle = 0;          ///< radians
    f32 speed = 0;          ///< px/s
    f32 lifetime_ms = 1000;
    i32 pierce = 0;
    f32 damage = 0;
    f32 hit_radius = 12;
    f32 max_distance = 0;   ///< 0 = unlimited
    f32 gravity = 0;        ///< px/s^2 on +y
    f32 acceleration = 0;   ///< px/s^2 along heading
    bool rotate_to_velocity = false;
    bool collide = true;    ///< false for scripted shots moved by the owner
    Trajectory trajectory = Trajectory::Straight;
    std::optional<defs::ExplosionStats> explosion;
    u32 target_id = 0;
    std::optional<ReservationId> reservation;
    u32 scope = 0;
};

/// Launch parameters for a shot orbiting a moving center.
struct OrbitParams {
    const WeaponOwner* center = nullptr;
    f32 radius = 72;
    f32 angular_velocity = 7; ///< rad/s
    bool clockwise = false;
    f32 start_phase = 0;
    f32 lifetime_ms = 2000;
    i32 pierce = 999;
    f32 damage = 0;
    f32 hit_radius = 12;
    u32 scope = 0;
};

struct Projectile {
    bool active = false;
    bool in_flight = false;   ///< fired, not just acquired
    u32 generation = 0;       ///< bumped on every release
    Trajectory trajectory = Trajectory::Straight;
    Vector2 position;
    Vector2 origin;
    Vector2 velocity;
    f32 angle = 0;
    f32 acceleration = 0;
    f32 gravity = 0;
    bool rotate_to_velocity = false;
    bool collide = true;
    f32 damage = 0;
    f32 hit_radius = 12;
    i32 pierce = 0;
    f32 max_distance = 0;
    f32 travelled = 0;
    f64 expires_at_ms = 0;
    std::vector<u32> hit_set;
    std::optional<defs::ExplosionStats> explosion;
    u32 target_id = 0;
    std::optional<ReservationId> reservation;
    u32 scope = 0;
    u32 hop = 0;

    // Orbit state
    const WeaponOwner* orbit_center = nullptr;
    f32 orbit_radius = 0;
    f32 orbit_speed = 0;
    f32 orbit_phase = 0;
};

/// Receives contact and expiry notifications from a pool.
class ProjectileListener {
public:
    virtual ~ProjectileListener() = default;
    virtual void on_projectile_hit(ProjectileHandle handle, Target& target) = 0;
    virtual void on_projectile_expired(ProjectileHandle handle,
                                       ExpiryReason reason) = 0;
    /// Called from release(), before the slot is cleared.
    virtual void on_projectile_released(const Projectile& projectile) = 0;
};

/// Fixed-capacity pool of projectile slots for one weapon. Slots are
/// created lazily up to capacity and recycled through a free list; storage
/// is reserved up front so nothing allocates once warm.
class ProjectilePool {
public:
    ProjectilePool(u32 capacity, TargetingCoordinator* coordinator);
    ~ProjectilePool();

    ProjectilePool(const ProjectilePool&) = delete;
    ProjectilePool& operator=(const ProjectilePool&) = delete;

    void set_listener(ProjectileListener* listener) { listener_ = listener; }

    /// Claim an inactive slot. Empty when the pool is exhausted.
    std::optional<ProjectileHandle> acquire();

    /// Launch an acquired slot. Re-firing a live handle replaces its
    /// deadline and per-flight state.
    void fire(ProjectileHandle handle, const FireParams& params, f64 now_ms);
    void fire_orbit(ProjectileHandle handle, const OrbitParams& params,
                    f64 now_ms);

    /// Integrate motion, auto-release past max distance, then report
    /// contacts and expiry to the listener.
    void update(f64 delta_ms, f64 now_ms, TargetRegistry& registry);

    /// Deactivate a slot. Consumes any held reservation. Idempotent:
    /// returns false if the slot was not active.
    bool release(ProjectileHandle handle);
    void release_all();

    /// Use one pierce charge. Returns false when none remain (the
    /// projectile should retire).
    bool consume_pierce(ProjectileHandle handle);

    bool has_hit(ProjectileHandle handle, u32 target_id) const;
    void register_hit(ProjectileHandle handle, u32 target_id);
    void clear_hits(ProjectileHandle handle);

    /// Move a shot directly (scripted hops).
    void relocate(ProjectileHandle handle, Vector2 position);

    /// Replace a shot's velocity (scripted hops heading for the next target).
    void steer(ProjectileHandle handle, Vector2 velocity);

    /// Drop the held reservation through the coordinator.
    void consume_reservation(ProjectileHandle handle);

    Projectile& get(ProjectileHandle handle) { return slots_[handle]; }
    const Projectile& get(ProjectileHandle handle) const { return slots_[handle]; }

    /// True if handle is still the same flight it was at `generation`.
    bool is_current(ProjectileHandle handle, u32 generation) const;

    template <typename F>
    void for_each_active(F&& fn) {
        for (u32 i = 0; i < slots_.size(); i++) {
            if (slots_[i].active) fn(i, slots_[i]);
        }
    }

    u32 capacity() const { return capacity_; }
    u32 allocated_count() const { return static_cast<u32>(slots_.size()); }
    u32 active_count() const { return active_count_; }
    u64 skipped_acquires() const { return skipped_acquires_; }

private:
    void step_motion(Projectile& p, f32 dt_s);
    void check_contacts(ProjectileHandle handle, TargetRegistry& registry);
    void reset_flight(Projectile& p);

    u32 capacity_;
    TargetingCoordinator* coordinator_;
    ProjectileListener* listener_ = nullptr;
    std::vector<Projectile> slots_;
    std::vector<ProjectileHandle> free_;
    std::vector<std::pair<f32, u32>> contacts_; ///< scratch, reused
    u32 active_count_ = 0;
    u64 skipped_acquires_ = 0;

    static constexpr size_t HIT_SET_RESERVE = 16;
};

} // namespace salvo::sim
