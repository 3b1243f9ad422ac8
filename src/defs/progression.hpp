#pragma once

#include "defs/modifier.hpp"

#include <array>
#include <optional>
#include <string>
#include <vector>

namespace salvo::defs {

struct WeaponDefinition;

/// Fields a per-level progression entry may set. `*Mult` fields multiply
/// the base stat, `*Add` fields add to it.
enum class LevelField {
    DamageBaseMult,
    DamageBaseAdd,
    CadenceDelayMsMult,
    CadenceDelayMsAdd,
    ProjectileSpeedMult,
    ProjectileSpeedAdd,
    ProjectilePierceAdd,
    ProjectileLifetimeMsMult,
    ProjectileLifetimeMsAdd,
    ProjectileMaxDistanceAdd,
    AoeRadiusAdd,
    AoeDamageMultMult,
    ClusterCountAdd,
    ClusterSpreadRadiusAdd,
    ChainMaxHopsAdd,
    ChainHopRadiusAdd,
    ChainFalloffPerHopAdd,
    BurstCountAdd,
    BurstSpreadDegAdd,
    CrossStepPxPerFrameAdd,
    Count,
};

constexpr size_t LEVEL_FIELD_COUNT = static_cast<size_t>(LevelField::Count);

struct LevelFieldInfo {
    LevelField field;
    const char* group;  ///< Lua group table, e.g. "damage"
    const char* name;   ///< Lua field, e.g. "baseMult"
    StatPath path;
    ModifierOp op;
    const char* label;  ///< Upgrade description label
    const char* unit;   ///< Unit suffix for additive deltas, may be ""
};

const LevelFieldInfo& level_field_info(LevelField field);
const std::array<LevelFieldInfo, LEVEL_FIELD_COUNT>& level_fields();

/// Stat deltas in effect at a given level. Unset fields carry no bonus.
class LevelSpec {
public:
    const std::optional<f32>& get(LevelField field) const {
        return values_[static_cast<size_t>(field)];
    }
    void set(LevelField field, f32 value) {
        values_[static_cast<size_t>(field)] = value;
    }
    bool empty() const;

    /// Overlay every field set in `later` on top of this spec.
    void merge(const LevelSpec& later);

    bool operator==(const LevelSpec&) const = default;

private:
    std::array<std::optional<f32>, LEVEL_FIELD_COUNT> values_{};
};

/// Dotted names ("damage.baseMult") of the fields set in a spec.
std::vector<std::string> affected_fields(const LevelSpec& spec);

/// Merge the progression entries for levels 2..level (level clamped to
/// 1..maxLevel). Level 1 yields an empty spec.
LevelSpec accumulate_level_spec(const WeaponDefinition& def, i32 level);

/// Map the accumulated spec for `level` onto modifier operations, one per
/// set field, in the fixed LevelField order.
std::vector<Modifier> get_level_modifiers(const WeaponDefinition& def, i32 level);

/// Human-readable summary of the bonuses gained going from current to next,
/// e.g. "+20% damage, -10% attack delay".
std::string describe_level_upgrade(const WeaponDefinition& def,
                                   i32 current_level, i32 next_level);

} // namespace salvo::defs
