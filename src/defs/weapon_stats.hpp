#pragma once

#include "core/types.hpp"

#include <optional>
#include <string_view>
#include <variant>

namespace salvo::defs {

enum class ArchetypeKind {
    Projectile,
    Slash,
    Chain,
    ChainThrow,
    Cluster,
    Burst,
    Ballistic,
    Bazooka,
    Circular,
    Cross,
    Strike,
};

const char* archetype_kind_name(ArchetypeKind kind);
std::optional<ArchetypeKind> parse_archetype_kind(std::string_view name);

enum class TargetingMode { Nearest, Self, Facing };
enum class AoeTiming { Impact, Animation };
enum class BurstPattern { Spread, Ring };
enum class CrossAxis { Horizontal, Vertical };

struct CadenceStats {
    f32 delay_ms = 1000;
    f32 warmup_ms = 0;
    i32 salvo = 1;
    f32 spread_deg = 0;
    f32 salvo_spacing_ms = 30;
};

struct TargetingStats {
    TargetingMode mode = TargetingMode::Nearest;
    f32 range = 0;
};

struct CritStats {
    f32 chance = 0;
    f32 mult = 1.5f;
};

struct DamageStats {
    f32 base = 0;
    CritStats crit;
};

struct ExplosionStats {
    f32 radius = 0;
    f32 damage_mult = 1;
    i32 max_targets = 0; // 0 = unlimited
    f32 falloff = 0;     // fraction of damage lost per 100 px
};

struct ProjectileStats {
    f32 speed = 0;
    i32 pierce = 0;
    f32 lifetime_ms = 1000;
    f32 max_distance = 0; // 0 = unlimited
    f32 gravity = 0;
    f32 acceleration = 0;
    bool rotate_to_velocity = false;
    i32 pool_size = 20;
    f32 hit_radius = 12;
    std::optional<ExplosionStats> explosion;
};

struct AoeStats {
    bool enabled = false;
    f32 radius = 0;
    f32 damage_mult = 1;
    i32 max_targets = 0;
    f32 falloff = 0;
    AoeTiming timing = AoeTiming::Impact;
    f32 delay_ms = 0;

    ExplosionStats as_explosion() const {
        return {radius, damage_mult, max_targets, falloff};
    }
};

// Archetype-specific parameters. Exactly one is active per weapon.

struct ProjectileArchetype {};

struct SlashArchetype {
    f32 offset_px = 28;
    f32 length_px = 80;
    f32 arc_deg = 180;
    f32 hit_delay_ms = 0;
    bool follow_owner = true;
};

struct ChainArchetype {
    i32 max_hops = 5;
    f32 hop_radius = 220;
    f32 falloff_per_hop = 0.1f;
};

struct ChainThrowArchetype {
    i32 max_hops = 5;
    f32 hop_radius = 220;
    f32 falloff_per_hop = 0.15f;
    f32 per_hop_duration_ms = 300;
};

struct ClusterArchetype {
    i32 count = 3;
    f32 spread_radius = 72;
    f32 stagger_ms = 60;
};

struct BurstArchetype {
    i32 count = 8;
    f32 spread_deg = 30;
    BurstPattern pattern = BurstPattern::Spread;
    f32 stagger_ms = 0;
    f32 base_angle_deg = 0;
};

struct BallisticArchetype {
    f32 launch_angle_deg = -75;
    f32 launch_speed = 360;
    f32 gravity = 900;
};

struct BazookaArchetype {
    f32 detonate_seconds = 1.5f;
    f32 tick_ms = 250;
    ClusterArchetype cluster{0, 72, 60};
};

struct CircularArchetype {
    f32 radius = 72;
    f32 angular_velocity = 7; // rad/s
    bool clockwise = false;
    i32 count = 1;
    f32 start_phase = 0;
    f32 rehit_interval_ms = 0; // 0 = each target is hit once per orbit
};

struct CrossArchetype {
    f32 step_px_per_frame = 8;
    i32 steps = 12;
    f32 frame_ms = 1000.0f / 60.0f;
    CrossAxis start_axis = CrossAxis::Horizontal;
};

struct StrikeArchetype {};

using ArchetypeStats =
    std::variant<ProjectileArchetype, SlashArchetype, ChainArchetype,
                 ChainThrowArchetype, ClusterArchetype, BurstArchetype,
                 BallisticArchetype, BazookaArchetype, CircularArchetype,
                 CrossArchetype, StrikeArchetype>;

ArchetypeKind archetype_kind_of(const ArchetypeStats& stats);
ArchetypeStats default_archetype_stats(ArchetypeKind kind);

/// Fully resolved weapon parameters. The definition carries the base set;
/// each controller holds a copy with all modifier layers applied.
struct WeaponStats {
    CadenceStats cadence;
    TargetingStats targeting;
    DamageStats damage;
    ProjectileStats projectile;
    AoeStats aoe;
    ArchetypeStats archetype;
};

} // namespace salvo::defs
