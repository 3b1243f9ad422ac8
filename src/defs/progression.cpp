#include "defs/progression.hpp"
#include "defs/weapon_definition.hpp"

#include <algorithm>
#include <cmath>
#include <limits>

#include <spdlog/fmt/fmt.h>

namespace salvo::defs {

namespace {

using F = LevelField;
using P = StatPath;
constexpr ModifierOp MUL = ModifierOp::Multiply;
constexpr ModifierOp ADD = ModifierOp::Add;

constexpr std::array<LevelFieldInfo, LEVEL_FIELD_COUNT> FIELDS{{
    {F::DamageBaseMult, "damage", "baseMult", P::DamageBase, MUL, "damage", ""},
    {F::DamageBaseAdd, "damage", "baseAdd", P::DamageBase, ADD, "damage", ""},
    {F::CadenceDelayMsMult, "cadence", "delayMsMult", P::CadenceDelayMs, MUL, "attack delay", ""},
    {F::CadenceDelayMsAdd, "cadence", "delayMsAdd", P::CadenceDelayMs, ADD, "attack delay (ms)", ""},
    {F::ProjectileSpeedMult, "projectile", "speedMult", P::ProjectileSpeed, MUL, "projectile speed", ""},
    {F::ProjectileSpeedAdd, "projectile", "speedAdd", P::ProjectileSpeed, ADD, "projectile speed", ""},
    {F::ProjectilePierceAdd, "projectile", "pierceAdd", P::ProjectilePierce, ADD, "pierce", ""},
    {F::ProjectileLifetimeMsMult, "projectile", "lifetimeMsMult", P::ProjectileLifetimeMs, MUL, "projectile lifetime", ""},
    {F::ProjectileLifetimeMsAdd, "projectile", "lifetimeMsAdd", P::ProjectileLifetimeMs, ADD, "projectile lifetime (ms)", ""},
    {F::ProjectileMaxDistanceAdd, "projectile", "maxDistanceAdd", P::ProjectileMaxDistance, ADD, "range", "px"},
    {F::AoeRadiusAdd, "aoe", "radiusAdd", P::AoeRadius, ADD, "AOE radius", "px"},
    {F::AoeDamageMultMult, "aoe", "damageMultMult", P::AoeDamageMult, MUL, "AOE damage", ""},
    {F::ClusterCountAdd, "cluster", "countAdd", P::ClusterCount, ADD, "cluster count", ""},
    {F::ClusterSpreadRadiusAdd, "cluster", "spreadRadiusAdd", P::ClusterSpreadRadius, ADD, "cluster spread", "px"},
    {F::ChainMaxHopsAdd, "chain", "maxHopsAdd", P::ChainMaxHops, ADD, "max hops", ""},
    {F::ChainHopRadiusAdd, "chain", "hopRadiusAdd", P::ChainHopRadius, ADD, "hop radius", "px"},
    {F::ChainFalloffPerHopAdd, "chain", "falloffPerHopAdd", P::ChainFalloffPerHop, ADD, "hop falloff", ""},
    {F::BurstCountAdd, "burst", "countAdd", P::BurstCount, ADD, "burst count", ""},
    {F::BurstSpreadDegAdd, "burst", "spreadDegAdd", P::BurstSpreadDeg, ADD, "burst spread", "deg"},
    {F::CrossStepPxPerFrameAdd, "cross", "stepPxPerFrameAdd", P::CrossStepPxPerFrame, ADD, "cross stride", "px/frame"},
}};

/// Format an additive delta: integers as-is, others rounded to 2 decimals.
std::string format_amount(f64 value) {
    f64 rounded = std::round(value * 100.0) / 100.0;
    if (rounded == std::floor(rounded)) {
        return fmt::format("{}", static_cast<i64>(rounded));
    }
    std::string text = fmt::format("{:.2f}", rounded);
    while (text.back() == '0') text.pop_back();
    return text;
}

void describe_delta(std::vector<std::string>& changes, const LevelFieldInfo& info,
                    const LevelSpec& current, const LevelSpec& next) {
    f64 neutral = info.op == MUL ? 1.0 : 0.0;
    f64 prev = current.get(info.field).value_or(static_cast<f32>(neutral));
    f64 now = next.get(info.field).value_or(static_cast<f32>(neutral));
    // Deltas are computed in f32 space so 1.2f - 1.0f reads as 20%
    f64 delta = static_cast<f32>(now) - static_cast<f32>(prev);
    if (std::abs(delta) < std::numeric_limits<f32>::epsilon()) return;

    if (info.op == MUL) {
        auto pct = static_cast<i64>(std::llround(delta * 100.0));
        if (pct == 0) return;
        changes.push_back(fmt::format("{}{}% {}", pct > 0 ? "+" : "", pct, info.label));
        return;
    }

    std::string amount = format_amount(delta);
    if (amount == "0") return;
    std::string sign = delta > 0 ? "+" : "";
    if (*info.unit) {
        changes.push_back(fmt::format("{}{} {} {}", sign, amount, info.unit, info.label));
    } else {
        changes.push_back(fmt::format("{}{} {}", sign, amount, info.label));
    }
}

} // namespace

const std::array<LevelFieldInfo, LEVEL_FIELD_COUNT>& level_fields() {
    return FIELDS;
}

const LevelFieldInfo& level_field_info(LevelField field) {
    return FIELDS[static_cast<size_t>(field)];
}

bool LevelSpec::empty() const {
    return std::none_of(values_.begin(), values_.end(),
                        [](const auto& v) { return v.has_value(); });
}

void LevelSpec::merge(const LevelSpec& later) {
    for (size_t i = 0; i < LEVEL_FIELD_COUNT; i++) {
        if (later.values_[i]) values_[i] = later.values_[i];
    }
}

std::vector<std::string> affected_fields(const LevelSpec& spec) {
    std::vector<std::string> names;
    for (const auto& info : FIELDS) {
        if (spec.get(info.field)) {
            names.push_back(std::string(info.group) + "." + info.name);
        }
    }
    return names;
}

LevelSpec accumulate_level_spec(const WeaponDefinition& def, i32 level) {
    i32 target = std::clamp(level, 1, std::max(1, def.max_level));
    LevelSpec spec;
    for (const auto& [lvl, delta] : def.progression) {
        if (lvl < 2 || lvl > target) continue;
        spec.merge(delta);
    }
    return spec;
}

std::vector<Modifier> get_level_modifiers(const WeaponDefinition& def, i32 level) {
    LevelSpec spec = accumulate_level_spec(def, level);
    std::vector<Modifier> mods;
    for (const auto& info : FIELDS) {
        if (const auto& value = spec.get(info.field)) {
            mods.push_back(Modifier{info.op, info.path, *value});
        }
    }
    return mods;
}

std::string describe_level_upgrade(const WeaponDefinition& def,
                                   i32 current_level, i32 next_level) {
    LevelSpec current = accumulate_level_spec(def, current_level);
    LevelSpec next = accumulate_level_spec(def, next_level);

    std::vector<std::string> changes;
    for (const auto& info : FIELDS) {
        describe_delta(changes, info, current, next);
    }

    if (changes.empty()) return "No additional bonuses";
    std::string text;
    for (const auto& change : changes) {
        if (!text.empty()) text += ", ";
        text += change;
    }
    return text;
}

} // namespace salvo::defs
