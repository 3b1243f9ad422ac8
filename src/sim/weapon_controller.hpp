#pragma once

#include "core/types.hpp"
#include "defs/weapon_definition.hpp"
#include "sim/projectile_pool.hpp"
#include "sim/weapon_events.hpp"

#include <functional>
#include <map>
#include <memory>
#include <optional>
#include <random>
#include <string>
#include <vector>

namespace salvo::config {
struct CombatConfig;
}

namespace salvo::sim {

class DamagePipeline;
class SimClock;
class TargetRegistry;
class TargetingCoordinator;
class WeaponOwner;
struct Target;

enum class ControllerState { Idle, Warmup, Firing, Cooldown };

const char* controller_state_name(ControllerState state);

/// Collaborators shared by every controller of one manager.
struct CombatContext {
    TargetRegistry& registry;
    TargetingCoordinator& coordinator;
    DamagePipeline& damage;
    EventBus& events;
    const SimClock& clock;
    std::mt19937& rng;
    const config::CombatConfig& config;
};

/// Drives one equipped weapon: cadence, aiming, and the archetype-specific
/// fire routine. Owns the weapon's projectile pool.
class WeaponController : public ProjectileListener {
public:
    WeaponController(std::shared_ptr<const defs::WeaponDefinition> definition,
                     const WeaponOwner& owner, CombatContext context);
    ~WeaponController() override;

    WeaponController(const WeaponController&) = delete;
    WeaponController& operator=(const WeaponController&) = delete;

    /// Recompute resolved stats from the base definition and the composed
    /// modifier list.
    void set_modifiers(const std::vector<defs::Modifier>& modifiers);

    void update(f64 delta_ms);

    /// Release every projectile, pending effect and reservation. Closes any
    /// open fire scope. The controller is inert afterwards.
    void destroy();

    const std::string& key() const { return definition_->key; }
    const defs::WeaponDefinition& definition() const { return *definition_; }
    const defs::WeaponStats& stats() const { return stats_; }
    ControllerState state() const { return state_; }
    u32 activations() const { return activations_; }
    f64 next_fire_at_ms() const { return next_fire_at_ms_; }
    defs::CrossAxis cross_axis() const { return cross_axis_; }
    size_t pending_effect_count() const { return effects_.size(); }
    size_t open_scope_count() const { return live_per_scope_.size(); }

    ProjectilePool& pool() { return pool_; }
    const ProjectilePool& pool() const { return pool_; }

    void on_projectile_hit(ProjectileHandle handle, Target& target) override;
    void on_projectile_expired(ProjectileHandle handle,
                               ExpiryReason reason) override;
    void on_projectile_released(const Projectile& projectile) override;

private:
    struct Aim {
        std::optional<u32> target_id;
        Vector2 origin;
        Vector2 point;
        Vector2 direction{1, 0};
        f32 distance = 0;
    };

    struct PendingEffect {
        f64 due_ms = 0;
        u32 scope = 0;
        std::function<void(f64)> run;
    };

    // Cadence
    void step_cadence(f64 now);
    std::optional<Aim> acquire_aim(f64 now) const;
    bool needs_target() const;
    f32 shot_speed() const;
    f64 impact_latency_ms() const;
    void begin_activation(const Aim& aim, f64 now);

    // Archetype fire routines (weapon_archetypes.cpp)
    void fire_archetype(const defs::ProjectileArchetype& a, const Aim& aim, f64 now);
    void fire_archetype(const defs::SlashArchetype& a, const Aim& aim, f64 now);
    void fire_archetype(const defs::ChainArchetype& a, const Aim& aim, f64 now);
    void fire_archetype(const defs::ChainThrowArchetype& a, const Aim& aim, f64 now);
    void fire_archetype(const defs::ClusterArchetype& a, const Aim& aim, f64 now);
    void fire_archetype(const defs::BurstArchetype& a, const Aim& aim, f64 now);
    void fire_archetype(const defs::BallisticArchetype& a, const Aim& aim, f64 now);
    void fire_archetype(const defs::BazookaArchetype& a, const Aim& aim, f64 now);
    void fire_archetype(const defs::CircularArchetype& a, const Aim& aim, f64 now);
    void fire_archetype(const defs::CrossArchetype& a, const Aim& aim, f64 now);
    void fire_archetype(const defs::StrikeArchetype& a, const Aim& aim, f64 now);

    void fire_straight(const Aim& aim, f32 angle, bool reserve, f64 now);
    void chain_throw_hop(ProjectileHandle handle, u32 generation, u32 target_id,
                         u32 hop, std::shared_ptr<std::vector<u32>> visited,
                         f64 now);
    void cross_step(Vector2 origin, Vector2 axis, i32 step, f32 raw);
    void detonate(Vector2 point, f32 raw, f64 now);
    void explode(ProjectileHandle handle, u32 exclude_id);
    void refresh_orbit_hits(f64 now);
    void report_skipped(const char* reason);

    // Damage
    f32 roll_damage();
    void apply_hit(Target& target, f32 amount, Vector2 point);
    u32 apply_area(Vector2 center, f32 raw, const defs::ExplosionStats& area,
                   u32 exclude_id = 0, f32 arc_deg = 0, Vector2 aim = {1, 0},
                   std::vector<u32>* already_hit = nullptr);
    std::optional<ReservationId> reserve(u32 target_id, f64 impact_ms, f32 raw);

    // Pending effects and fire scopes
    void schedule(f64 due_ms, std::function<void(f64)> run);
    void run_pending_effects(f64 now);
    void track(u32 scope);
    void untrack(u32 scope);
    std::string scope_id(u32 scope) const;
    WeaponEvent make_event(WeaponEventType type) const;

    std::shared_ptr<const defs::WeaponDefinition> definition_;
    const WeaponOwner& owner_;
    CombatContext ctx_;
    defs::WeaponStats stats_;
    ProjectilePool pool_;

    ControllerState state_ = ControllerState::Idle;
    f64 next_fire_at_ms_ = 0;
    f64 warmup_until_ms_ = 0;
    f64 last_rehit_clear_ms_ = 0;
    u32 activations_ = 0;
    u32 scope_seq_ = 0;
    u32 current_scope_ = 0;
    defs::CrossAxis cross_axis_ = defs::CrossAxis::Horizontal;
    bool destroyed_ = false;

    std::vector<PendingEffect> effects_;
    std::map<u32, u32> live_per_scope_; ///< scope -> outstanding shots/effects
};

} // namespace salvo::sim
