#pragma once

#include "defs/weapon_stats.hpp"

#include <optional>
#include <string_view>
#include <vector>

namespace salvo::defs {

/// Closed set of modifiable weapon fields.
enum class StatPath {
    DamageBase,
    CritChance,
    CritMult,
    CadenceDelayMs,
    CadenceWarmupMs,
    CadenceSalvo,
    CadenceSpreadDeg,
    TargetingRange,
    ProjectileSpeed,
    ProjectilePierce,
    ProjectileLifetimeMs,
    ProjectileMaxDistance,
    AoeRadius,
    AoeDamageMult,
    ClusterCount,
    ClusterSpreadRadius,
    ChainMaxHops,
    ChainHopRadius,
    ChainFalloffPerHop,
    BurstCount,
    BurstSpreadDeg,
    CrossStepPxPerFrame,
};

/// Dotted name of a path, e.g. "damage.base" or "archetype.chain.maxHops".
const char* stat_path_name(StatPath path);
std::optional<StatPath> parse_stat_path(std::string_view name);

enum class ModifierOp { Add, Multiply };

const char* modifier_op_name(ModifierOp op);
std::optional<ModifierOp> parse_modifier_op(std::string_view name);

struct Modifier {
    ModifierOp op = ModifierOp::Add;
    StatPath path = StatPath::DamageBase;
    f32 value = 0;

    bool operator==(const Modifier&) const = default;
};

/// Attack delay never drops below this after modifiers.
constexpr f32 MIN_DELAY_MS = 40.0f;

/// Apply modifiers to stats in list order. Paths that do not exist on the
/// weapon's archetype are ignored. Integer fields are rounded after each
/// operation.
void apply_modifiers(WeaponStats& stats, const std::vector<Modifier>& modifiers,
                     f32 min_delay_ms = MIN_DELAY_MS);

} // namespace salvo::defs
