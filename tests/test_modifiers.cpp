#include <catch2/catch_test_macros.hpp>
#include <catch2/matchers/catch_matchers_floating_point.hpp>

#include "defs/modifier.hpp"

using namespace salvo;
using namespace salvo::defs;
using Catch::Matchers::WithinAbs;

namespace {

WeaponStats projectile_stats() {
    WeaponStats s;
    s.cadence.delay_ms = 600;
    s.damage.base = 10;
    s.projectile.speed = 520;
    s.projectile.pierce = 5;
    s.archetype = ProjectileArchetype{};
    return s;
}

} // namespace

TEST_CASE("Stat paths round-trip through their names", "[modifiers]") {
    CHECK(parse_stat_path("damage.base") == StatPath::DamageBase);
    CHECK(parse_stat_path("archetype.chain.maxHops") == StatPath::ChainMaxHops);
    CHECK(parse_stat_path("burst.count") == StatPath::BurstCount);
    CHECK_FALSE(parse_stat_path("damage.nope").has_value());
    CHECK(std::string(stat_path_name(StatPath::CadenceDelayMs)) == "cadence.delayMs");

    CHECK(parse_modifier_op("mult") == ModifierOp::Multiply);
    CHECK(parse_modifier_op("add") == ModifierOp::Add);
    CHECK_FALSE(parse_modifier_op("pow").has_value());
}

TEST_CASE("Modifiers apply in list order", "[modifiers]") {
    auto s = projectile_stats();
    apply_modifiers(s, {
        {ModifierOp::Add, StatPath::DamageBase, 5},
        {ModifierOp::Multiply, StatPath::DamageBase, 2},
    });
    CHECK_THAT(s.damage.base, WithinAbs(30.0, 1e-4));

    auto t = projectile_stats();
    apply_modifiers(t, {
        {ModifierOp::Multiply, StatPath::DamageBase, 2},
        {ModifierOp::Add, StatPath::DamageBase, 5},
    });
    CHECK_THAT(t.damage.base, WithinAbs(25.0, 1e-4));
}

TEST_CASE("Integer fields are rounded", "[modifiers]") {
    auto s = projectile_stats();
    apply_modifiers(s, {{ModifierOp::Multiply, StatPath::ProjectilePierce, 1.5f}});
    CHECK(s.projectile.pierce == 8); // 7.5 rounds away from zero
}

TEST_CASE("Clamps keep stats in a usable range", "[modifiers]") {
    auto s = projectile_stats();
    apply_modifiers(s, {
        {ModifierOp::Multiply, StatPath::CadenceDelayMs, 0.01f},
        {ModifierOp::Add, StatPath::ProjectilePierce, -20},
        {ModifierOp::Add, StatPath::CadenceSalvo, -5},
        {ModifierOp::Add, StatPath::CritChance, 3},
    });
    CHECK_THAT(s.cadence.delay_ms, WithinAbs(MIN_DELAY_MS, 1e-4));
    CHECK(s.projectile.pierce == 0);
    CHECK(s.cadence.salvo == 1);
    CHECK_THAT(s.damage.crit.chance, WithinAbs(1.0, 1e-6));

    auto t = projectile_stats();
    apply_modifiers(t, {{ModifierOp::Multiply, StatPath::CadenceDelayMs, 0.01f}}, 100);
    CHECK_THAT(t.cadence.delay_ms, WithinAbs(100.0, 1e-4));
}

TEST_CASE("Archetype paths only touch matching archetypes", "[modifiers]") {
    auto s = projectile_stats();
    auto before = s;
    apply_modifiers(s, {
        {ModifierOp::Add, StatPath::ChainMaxHops, 3},
        {ModifierOp::Add, StatPath::BurstCount, 2},
        {ModifierOp::Add, StatPath::CrossStepPxPerFrame, 1},
    });
    CHECK(s.damage.base == before.damage.base);
    CHECK(std::holds_alternative<ProjectileArchetype>(s.archetype));

    WeaponStats chain;
    chain.archetype = ChainThrowArchetype{};
    apply_modifiers(chain, {
        {ModifierOp::Add, StatPath::ChainMaxHops, 2},
        {ModifierOp::Add, StatPath::ChainFalloffPerHop, 5},
    });
    const auto& c = std::get<ChainThrowArchetype>(chain.archetype);
    CHECK(c.max_hops == 7);
    CHECK_THAT(c.falloff_per_hop, WithinAbs(1.0, 1e-6));
}

TEST_CASE("Cluster paths reach a bazooka's secondary cluster", "[modifiers]") {
    WeaponStats s;
    BazookaArchetype bazooka;
    bazooka.cluster.count = 2;
    s.archetype = bazooka;
    apply_modifiers(s, {{ModifierOp::Add, StatPath::ClusterCount, 3}});
    CHECK(std::get<BazookaArchetype>(s.archetype).cluster.count == 5);
}

TEST_CASE("AoE paths also scale a projectile explosion", "[modifiers]") {
    WeaponStats s;
    s.projectile.explosion = ExplosionStats{64, 0.75f, 0, 0};
    apply_modifiers(s, {
        {ModifierOp::Add, StatPath::AoeRadius, 16},
        {ModifierOp::Multiply, StatPath::AoeDamageMult, 2},
    });
    REQUIRE(s.projectile.explosion.has_value());
    CHECK_THAT(s.projectile.explosion->radius, WithinAbs(80.0, 1e-4));
    CHECK_THAT(s.projectile.explosion->damage_mult, WithinAbs(1.5, 1e-4));
}
