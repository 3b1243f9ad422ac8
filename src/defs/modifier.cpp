#include "defs/modifier.hpp"

#include <algorithm>
#include <array>
#include <cmath>
#include <utility>

namespace salvo::defs {

namespace {

constexpr std::array<std::pair<StatPath, const char*>, 22> PATH_NAMES{{
    {StatPath::DamageBase, "damage.base"},
    {StatPath::CritChance, "damage.crit.chance"},
    {StatPath::CritMult, "damage.crit.mult"},
    {StatPath::CadenceDelayMs, "cadence.delayMs"},
    {StatPath::CadenceWarmupMs, "cadence.warmupMs"},
    {StatPath::CadenceSalvo, "cadence.salvo"},
    {StatPath::CadenceSpreadDeg, "cadence.spreadDeg"},
    {StatPath::TargetingRange, "targeting.range"},
    {StatPath::ProjectileSpeed, "projectile.speed"},
    {StatPath::ProjectilePierce, "projectile.pierce"},
    {StatPath::ProjectileLifetimeMs, "projectile.lifetimeMs"},
    {StatPath::ProjectileMaxDistance, "projectile.maxDistance"},
    {StatPath::AoeRadius, "aoe.radius"},
    {StatPath::AoeDamageMult, "aoe.damageMult"},
    {StatPath::ClusterCount, "archetype.cluster.count"},
    {StatPath::ClusterSpreadRadius, "archetype.cluster.spreadRadius"},
    {StatPath::ChainMaxHops, "archetype.chain.maxHops"},
    {StatPath::ChainHopRadius, "archetype.chain.hopRadius"},
    {StatPath::ChainFalloffPerHop, "archetype.chain.falloffPerHop"},
    {StatPath::BurstCount, "burst.count"},
    {StatPath::BurstSpreadDeg, "burst.spreadDeg"},
    {StatPath::CrossStepPxPerFrame, "archetype.cross.stepPxPerFrame"},
}};

void apply_op(f32& field, ModifierOp op, f32 value) {
    if (op == ModifierOp::Add)
        field += value;
    else
        field *= value;
}

void apply_op(i32& field, ModifierOp op, f32 value) {
    f32 v = static_cast<f32>(field);
    apply_op(v, op, value);
    field = static_cast<i32>(std::lround(v));
}

/// Resolve a cluster block on either a cluster weapon or a bazooka's
/// secondary cluster.
ClusterArchetype* cluster_of(ArchetypeStats& a) {
    if (auto* c = std::get_if<ClusterArchetype>(&a)) return c;
    if (auto* b = std::get_if<BazookaArchetype>(&a)) return &b->cluster;
    return nullptr;
}

void apply_one(WeaponStats& s, const Modifier& m) {
    auto& a = s.archetype;
    switch (m.path) {
    case StatPath::DamageBase: apply_op(s.damage.base, m.op, m.value); break;
    case StatPath::CritChance: apply_op(s.damage.crit.chance, m.op, m.value); break;
    case StatPath::CritMult: apply_op(s.damage.crit.mult, m.op, m.value); break;
    case StatPath::CadenceDelayMs: apply_op(s.cadence.delay_ms, m.op, m.value); break;
    case StatPath::CadenceWarmupMs: apply_op(s.cadence.warmup_ms, m.op, m.value); break;
    case StatPath::CadenceSalvo: apply_op(s.cadence.salvo, m.op, m.value); break;
    case StatPath::CadenceSpreadDeg: apply_op(s.cadence.spread_deg, m.op, m.value); break;
    case StatPath::TargetingRange: apply_op(s.targeting.range, m.op, m.value); break;
    case StatPath::ProjectileSpeed: apply_op(s.projectile.speed, m.op, m.value); break;
    case StatPath::ProjectilePierce: apply_op(s.projectile.pierce, m.op, m.value); break;
    case StatPath::ProjectileLifetimeMs: apply_op(s.projectile.lifetime_ms, m.op, m.value); break;
    case StatPath::ProjectileMaxDistance: apply_op(s.projectile.max_distance, m.op, m.value); break;
    case StatPath::AoeRadius:
        apply_op(s.aoe.radius, m.op, m.value);
        if (s.projectile.explosion) apply_op(s.projectile.explosion->radius, m.op, m.value);
        break;
    case StatPath::AoeDamageMult:
        apply_op(s.aoe.damage_mult, m.op, m.value);
        if (s.projectile.explosion) apply_op(s.projectile.explosion->damage_mult, m.op, m.value);
        break;
    case StatPath::ClusterCount:
        if (auto* c = cluster_of(a)) apply_op(c->count, m.op, m.value);
        break;
    case StatPath::ClusterSpreadRadius:
        if (auto* c = cluster_of(a)) apply_op(c->spread_radius, m.op, m.value);
        break;
    case StatPath::ChainMaxHops:
        if (auto* c = std::get_if<ChainArchetype>(&a)) apply_op(c->max_hops, m.op, m.value);
        if (auto* c = std::get_if<ChainThrowArchetype>(&a)) apply_op(c->max_hops, m.op, m.value);
        break;
    case StatPath::ChainHopRadius:
        if (auto* c = std::get_if<ChainArchetype>(&a)) apply_op(c->hop_radius, m.op, m.value);
        if (auto* c = std::get_if<ChainThrowArchetype>(&a)) apply_op(c->hop_radius, m.op, m.value);
        break;
    case StatPath::ChainFalloffPerHop:
        if (auto* c = std::get_if<ChainArchetype>(&a)) apply_op(c->falloff_per_hop, m.op, m.value);
        if (auto* c = std::get_if<ChainThrowArchetype>(&a)) apply_op(c->falloff_per_hop, m.op, m.value);
        break;
    case StatPath::BurstCount:
        if (auto* b = std::get_if<BurstArchetype>(&a)) apply_op(b->count, m.op, m.value);
        break;
    case StatPath::BurstSpreadDeg:
        if (auto* b = std::get_if<BurstArchetype>(&a)) apply_op(b->spread_deg, m.op, m.value);
        break;
    case StatPath::CrossStepPxPerFrame:
        if (auto* c = std::get_if<CrossArchetype>(&a)) apply_op(c->step_px_per_frame, m.op, m.value);
        break;
    }
}

} // namespace

const char* stat_path_name(StatPath path) {
    for (const auto& [p, name] : PATH_NAMES) {
        if (p == path) return name;
    }
    return "unknown";
}

std::optional<StatPath> parse_stat_path(std::string_view name) {
    for (const auto& [p, path_name] : PATH_NAMES) {
        if (name == path_name) return p;
    }
    return std::nullopt;
}

const char* modifier_op_name(ModifierOp op) {
    return op == ModifierOp::Add ? "add" : "mult";
}

std::optional<ModifierOp> parse_modifier_op(std::string_view name) {
    if (name == "add") return ModifierOp::Add;
    if (name == "mult") return ModifierOp::Multiply;
    return std::nullopt;
}

void apply_modifiers(WeaponStats& stats, const std::vector<Modifier>& modifiers,
                     f32 min_delay_ms) {
    for (const auto& m : modifiers) {
        apply_one(stats, m);
    }

    stats.cadence.delay_ms = std::max(stats.cadence.delay_ms, min_delay_ms);
    stats.cadence.salvo = std::max(stats.cadence.salvo, 1);
    stats.projectile.pierce = std::max(stats.projectile.pierce, 0);
    stats.damage.crit.chance = std::clamp(stats.damage.crit.chance, 0.0f, 1.0f);
    if (auto* c = std::get_if<ChainArchetype>(&stats.archetype))
        c->falloff_per_hop = std::clamp(c->falloff_per_hop, 0.0f, 1.0f);
    if (auto* c = std::get_if<ChainThrowArchetype>(&stats.archetype))
        c->falloff_per_hop = std::clamp(c->falloff_per_hop, 0.0f, 1.0f);
}

} // namespace salvo::defs
