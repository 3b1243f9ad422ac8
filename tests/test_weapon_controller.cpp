#include <catch2/catch_test_macros.hpp>
#include <catch2/matchers/catch_matchers_floating_point.hpp>

#include "combat_harness.hpp"

using namespace salvo;
using namespace salvo::sim;
using salvo::test::CombatHarness;
using salvo::test::weapon;
using Catch::Matchers::WithinAbs;

namespace {

defs::WeaponDefinition bolt() {
    auto def = weapon("bolt", defs::ProjectileArchetype{});
    def.base.cadence.delay_ms = 600;
    def.base.targeting.range = 420;
    def.base.projectile.speed = 520;
    def.base.projectile.pierce = 5;
    def.base.projectile.pool_size = 120;
    return def;
}

} // namespace

TEST_CASE("Bolt fires twice in 1200 ms", "[controller]") {
    CombatHarness h;
    h.registry.spawn({300, 0}, 1e6f);
    auto ctrl = h.make(bolt());

    h.run(*ctrl, 1200);
    CHECK(ctrl->activations() == 2);
    CHECK(h.count(WeaponEventType::FireStart) == 2);
    CHECK(ctrl->state() == ControllerState::Cooldown);
}

TEST_CASE("No target means no shot, and the timer stays armed", "[controller]") {
    CombatHarness h;
    auto ctrl = h.make(bolt());
    h.run(*ctrl, 500);
    CHECK(ctrl->activations() == 0);
    CHECK(ctrl->state() == ControllerState::Idle);

    h.registry.spawn({100, 0}, 100);
    h.run(*ctrl, 16);
    CHECK(ctrl->activations() == 1);
}

TEST_CASE("An owner that cannot fire stays idle", "[controller]") {
    CombatHarness h;
    h.registry.spawn({100, 0}, 100);
    h.owner.set_can_fire(false);
    auto ctrl = h.make(bolt());
    h.run(*ctrl, 1000);
    CHECK(ctrl->activations() == 0);
}

TEST_CASE("Warmup delays the first shot", "[controller]") {
    CombatHarness h;
    h.registry.spawn({300, 0}, 1e6f);
    auto def = bolt();
    def.base.cadence.warmup_ms = 200;
    auto ctrl = h.make(def);

    h.run(*ctrl, 16);
    CHECK(ctrl->state() == ControllerState::Warmup);
    CHECK(ctrl->activations() == 0);

    h.run(*ctrl, 208);
    CHECK(ctrl->activations() == 1);
    CHECK(ctrl->pool().active_count() == 1);
}

TEST_CASE("Salvo shots are spaced and only the on-target one reserves", "[controller][projectile]") {
    CombatHarness h;
    h.registry.spawn({300, 0}, 1e6f);
    auto def = bolt();
    def.base.cadence.salvo = 3;
    def.base.cadence.spread_deg = 10;
    def.base.cadence.salvo_spacing_ms = 30;
    def.base.projectile.speed = 10;
    def.base.projectile.lifetime_ms = 5000;
    auto ctrl = h.make(def);

    h.run(*ctrl, 16);
    CHECK(ctrl->pool().active_count() == 1);
    CHECK(ctrl->pending_effect_count() == 2);

    h.run(*ctrl, 96);
    CHECK(ctrl->pool().active_count() == 3);
    CHECK(ctrl->pending_effect_count() == 0);
    CHECK(h.coordinator.reservation_count() == 1);
}

TEST_CASE("An exhausted pool skips the shot", "[controller][projectile]") {
    CombatHarness h;
    h.registry.spawn({300, 0}, 1e6f);
    auto def = bolt();
    def.base.cadence.salvo = 2;
    def.base.cadence.salvo_spacing_ms = 0;
    def.base.projectile.pool_size = 1;
    auto ctrl = h.make(def);

    h.run(*ctrl, 16);
    CHECK(ctrl->pool().active_count() == 1);
    CHECK(h.count(WeaponEventType::SkippedFire) == 1);
}

TEST_CASE("Projectile damage lands and fire scopes close", "[controller][projectile]") {
    CombatHarness h;
    u32 t = h.registry.spawn({60, 0}, 100);
    auto def = bolt();
    def.base.projectile.pierce = 0;
    auto ctrl = h.make(def);

    h.run(*ctrl, 300);
    CHECK_THAT(h.hp(t), WithinAbs(90.0, 1e-4));
    CHECK(ctrl->pool().active_count() == 0);
    CHECK(h.count(WeaponEventType::Impact) == 1);
    CHECK(h.count(WeaponEventType::FireEnd) == 1);
    CHECK(ctrl->open_scope_count() == 0);
    CHECK(h.coordinator.reservation_count() == 0);

    const WeaponEvent* start = nullptr;
    const WeaponEvent* end = nullptr;
    for (const auto& ev : h.log) {
        if (ev.type == WeaponEventType::FireStart) start = &ev;
        if (ev.type == WeaponEventType::FireEnd) end = &ev;
    }
    REQUIRE(start);
    REQUIRE(end);
    CHECK(start->scope_id == end->scope_id);
    CHECK(start->scope_id == "bolt:hero:1");
}

TEST_CASE("Final impact explodes when an explosion is configured", "[controller][projectile]") {
    CombatHarness h;
    u32 hit = h.registry.spawn({60, 0}, 100);
    u32 nearby = h.registry.spawn({60, 30}, 100);
    auto def = bolt();
    def.base.projectile.pierce = 0;
    def.base.projectile.explosion = defs::ExplosionStats{64, 0.5f, 0, 0};
    auto ctrl = h.make(def);

    h.run(*ctrl, 300);
    CHECK_THAT(h.hp(hit), WithinAbs(90.0, 1e-4));    // direct only
    CHECK_THAT(h.hp(nearby), WithinAbs(95.0, 1e-4)); // splash
    CHECK(h.count(WeaponEventType::Aoe) == 1);
}

TEST_CASE("Slash hits only inside its arc", "[controller][slash]") {
    CombatHarness h;
    u32 front = h.registry.spawn({60, 0}, 100);
    u32 behind = h.registry.spawn({-60, 0}, 100);
    auto def = weapon("sword", defs::SlashArchetype{});
    def.base.targeting.mode = defs::TargetingMode::Self;
    auto ctrl = h.make(def);

    h.run(*ctrl, 16);
    CHECK_THAT(h.hp(front), WithinAbs(90.0, 1e-4));
    CHECK_THAT(h.hp(behind), WithinAbs(100.0, 1e-4));
}

TEST_CASE("Delayed slash follows the owner", "[controller][slash]") {
    CombatHarness h;
    u32 t = h.registry.spawn({400, 0}, 100);
    defs::SlashArchetype slash;
    slash.hit_delay_ms = 100;
    auto def = weapon("sword", slash);
    def.base.targeting.mode = defs::TargetingMode::Self;
    auto ctrl = h.make(def);

    h.run(*ctrl, 16);
    CHECK(ctrl->pending_effect_count() == 1);
    h.owner.set_position({350, 0});
    h.run(*ctrl, 112);
    CHECK_THAT(h.hp(t), WithinAbs(90.0, 1e-4));
}

TEST_CASE("Chain hops to the nearest unvisited target with linear falloff", "[controller][chain]") {
    CombatHarness h;
    u32 a = h.registry.spawn({100, 0}, 100, 0);
    u32 b = h.registry.spawn({200, 0}, 100, 0);
    u32 c = h.registry.spawn({300, 0}, 100, 0);
    u32 lone = h.registry.spawn({300, 300}, 100, 0);
    defs::ChainArchetype chain;
    chain.hop_radius = 150;
    chain.falloff_per_hop = 0.5f;
    auto ctrl = h.make(weapon("chainlightning", chain));

    h.run(*ctrl, 16);
    CHECK_THAT(h.hp(a), WithinAbs(90.0, 1e-4));
    CHECK_THAT(h.hp(b), WithinAbs(95.0, 1e-4));
    CHECK_THAT(h.hp(c), WithinAbs(100.0, 1e-4)); // 1 - 0.5 * 2 = 0
    CHECK_THAT(h.hp(lone), WithinAbs(100.0, 1e-4));
    // Instantaneous: the scope opens and closes in the same tick
    CHECK(h.count(WeaponEventType::FireEnd) == 1);
}

TEST_CASE("Chain throw hops over time and retires", "[controller][chain]") {
    CombatHarness h;
    u32 a = h.registry.spawn({100, 0}, 100, 0);
    u32 b = h.registry.spawn({200, 0}, 100, 0);
    defs::ChainThrowArchetype chain;
    chain.max_hops = 3;
    chain.per_hop_duration_ms = 100;
    chain.falloff_per_hop = 0.15f;
    auto ctrl = h.make(weapon("holyhammer", chain, 20));

    h.run(*ctrl, 16);
    CHECK(ctrl->pool().active_count() == 1);
    CHECK(h.coordinator.reservation_count() == 1);
    CHECK_THAT(h.hp(a), WithinAbs(100.0, 1e-4));

    h.run(*ctrl, 112);
    CHECK_THAT(h.hp(a), WithinAbs(80.0, 1e-4));
    CHECK(h.coordinator.reservation_count() == 0);

    h.run(*ctrl, 300);
    CHECK_THAT(h.hp(b), WithinAbs(83.0, 1e-3));
    CHECK(ctrl->pool().active_count() == 0);
    CHECK(ctrl->open_scope_count() == 0);
}

TEST_CASE("Chain throw travels between hop targets", "[controller][chain]") {
    CombatHarness h;
    h.registry.spawn({100, 0}, 100, 0);
    h.registry.spawn({100, 100}, 100, 0);
    defs::ChainThrowArchetype chain;
    chain.max_hops = 3;
    chain.per_hop_duration_ms = 160;
    auto ctrl = h.make(weapon("holyhammer", chain, 20));

    auto position = [&] {
        Vector2 at;
        ctrl->pool().for_each_active([&](ProjectileHandle, Projectile& p) { at = p.position; });
        return at;
    };

    h.run(*ctrl, 16);
    REQUIRE(ctrl->pool().active_count() == 1);

    // Halfway through the first hop
    h.run(*ctrl, 80);
    CHECK_THAT(position().x, WithinAbs(50.0, 1e-2));
    CHECK_THAT(position().y, WithinAbs(0.0, 1e-2));

    // First hop lands on the target, then heads for the next one
    h.run(*ctrl, 80);
    CHECK_THAT(position().x, WithinAbs(100.0, 1e-2));
    h.run(*ctrl, 80);
    CHECK_THAT(position().x, WithinAbs(100.0, 1e-2));
    CHECK_THAT(position().y, WithinAbs(50.0, 1e-2));
}

TEST_CASE("Chain throw falloff is linear per hop", "[controller][chain]") {
    CombatHarness h;
    u32 a = h.registry.spawn({100, 0}, 100, 0);
    u32 b = h.registry.spawn({200, 0}, 100, 0);
    u32 c = h.registry.spawn({300, 0}, 100, 0);
    defs::ChainThrowArchetype chain;
    chain.max_hops = 3;
    chain.per_hop_duration_ms = 50;
    chain.falloff_per_hop = 0.4f;
    auto ctrl = h.make(weapon("holyhammer", chain, 20));

    h.run(*ctrl, 400);
    CHECK_THAT(h.hp(a), WithinAbs(80.0, 1e-3));
    CHECK_THAT(h.hp(b), WithinAbs(88.0, 1e-3));
    CHECK_THAT(h.hp(c), WithinAbs(96.0, 1e-3));
}

TEST_CASE("Cluster drops staggered bombs around the aim point", "[controller][cluster]") {
    CombatHarness h;
    u32 t = h.registry.spawn({200, 0}, 100);
    defs::ClusterArchetype cluster;
    cluster.count = 3;
    cluster.spread_radius = 0;
    cluster.stagger_ms = 60;
    auto def = weapon("clusterbomb", cluster);
    def.base.aoe.enabled = true;
    def.base.aoe.radius = 40;
    auto ctrl = h.make(def);

    h.run(*ctrl, 16);
    CHECK_THAT(h.hp(t), WithinAbs(90.0, 1e-4));
    CHECK(ctrl->pending_effect_count() == 2);

    h.run(*ctrl, 160);
    CHECK_THAT(h.hp(t), WithinAbs(70.0, 1e-4));
    CHECK(h.count(WeaponEventType::Aoe) == 3);
    CHECK(ctrl->open_scope_count() == 0);
}

TEST_CASE("Ring burst fires evenly around the owner", "[controller][burst]") {
    CombatHarness h;
    defs::BurstArchetype burst;
    burst.count = 8;
    burst.pattern = defs::BurstPattern::Ring;
    auto def = weapon("whirlwind", burst);
    def.base.targeting.mode = defs::TargetingMode::Self;
    def.base.projectile.speed = 100;
    auto ctrl = h.make(def);

    h.run(*ctrl, 16);
    REQUIRE(ctrl->pool().active_count() == 8);
    f32 sum_x = 0, sum_y = 0;
    ctrl->pool().for_each_active([&](ProjectileHandle, Projectile& p) {
        sum_x += p.velocity.x;
        sum_y += p.velocity.y;
        CHECK_THAT(p.velocity.length(), WithinAbs(100.0, 1e-3));
    });
    CHECK_THAT(sum_x, WithinAbs(0.0, 1e-3));
    CHECK_THAT(sum_y, WithinAbs(0.0, 1e-3));
    CHECK(h.coordinator.reservation_count() == 0);
}

TEST_CASE("Ballistic lob mirrors when facing left", "[controller][ballistic]") {
    CombatHarness h;
    auto def = weapon("magicpotion", defs::BallisticArchetype{});
    def.base.targeting.mode = defs::TargetingMode::Self;
    def.base.projectile.lifetime_ms = 5000;

    h.owner.set_facing({-1, 0});
    auto ctrl = h.make(def);
    h.run(*ctrl, 16);
    REQUIRE(ctrl->pool().active_count() == 1);
    ctrl->pool().for_each_active([&](ProjectileHandle, Projectile& p) {
        CHECK(p.velocity.x < 0);
        CHECK(p.velocity.y < 0);
        CHECK(p.trajectory == Trajectory::Ballistic);
    });

    // Lands back at launch height and retires
    h.run(*ctrl, 1200);
    CHECK(ctrl->pool().active_count() == 0);
}

TEST_CASE("Bazooka detonates and drops secondary bombs", "[controller][bazooka]") {
    CombatHarness h;
    u32 t = h.registry.spawn({100, 0}, 1000);
    defs::BazookaArchetype bazooka;
    bazooka.detonate_seconds = 1.5f;
    bazooka.tick_ms = 250;
    bazooka.cluster.count = 2;
    bazooka.cluster.spread_radius = 0;
    auto def = weapon("bazooka", bazooka, 14);
    def.base.projectile.speed = 420;
    def.base.projectile.lifetime_ms = 400;
    def.base.projectile.hit_radius = 16;
    def.base.aoe.enabled = true;
    def.base.aoe.radius = 96;
    def.base.aoe.damage_mult = 0.5f;
    auto ctrl = h.make(def);

    h.run(*ctrl, 240);
    CHECK(ctrl->pool().active_count() == 0);
    // Direct hit plus the detonation splash
    CHECK_THAT(h.hp(t), WithinAbs(1000.0 - 14 - 7, 1e-3));

    h.run(*ctrl, 800);
    CHECK_THAT(h.hp(t), WithinAbs(1000.0 - 14 - 7 * 3, 1e-3));
    CHECK(h.count(WeaponEventType::Aoe) == 3);
    CHECK(ctrl->open_scope_count() == 0);
}

TEST_CASE("Orbiting shots hit each target once per flight", "[controller][circular]") {
    CombatHarness h;
    u32 t = h.registry.spawn({50, 0}, 1000, 10);
    defs::CircularArchetype orbit;
    orbit.radius = 50;
    orbit.angular_velocity = 7;
    orbit.count = 2;
    auto def = weapon("shuriken", orbit, 5);
    def.base.targeting.mode = defs::TargetingMode::Self;
    def.base.projectile.lifetime_ms = 1000;
    auto ctrl = h.make(def);

    h.run(*ctrl, 1100);
    CHECK(h.count(WeaponEventType::Impact) == 2);
    CHECK_THAT(h.hp(t), WithinAbs(990.0, 1e-4));
    CHECK(ctrl->pool().active_count() == 0);
}

TEST_CASE("Orbit rehit interval allows repeated hits", "[controller][circular]") {
    CombatHarness h;
    h.registry.spawn({50, 0}, 1000, 10);
    defs::CircularArchetype orbit;
    orbit.radius = 50;
    orbit.angular_velocity = 7;
    orbit.count = 1;
    orbit.rehit_interval_ms = 100;
    auto def = weapon("shuriken", orbit, 5);
    def.base.targeting.mode = defs::TargetingMode::Self;
    def.base.projectile.lifetime_ms = 1000;
    auto ctrl = h.make(def);

    h.run(*ctrl, 1100);
    CHECK(h.count(WeaponEventType::Impact) > 1);
}

TEST_CASE("Cross alternates axes between activations", "[controller][cross]") {
    CombatHarness h;
    u32 horizontal = h.registry.spawn({16, 0}, 100, 0);
    u32 vertical = h.registry.spawn({0, 40}, 100, 0);
    defs::CrossArchetype cross;
    cross.steps = 6;
    cross.step_px_per_frame = 8;
    auto def = weapon("sparkcross", cross);
    def.base.targeting.mode = defs::TargetingMode::Self;
    def.base.cadence.delay_ms = 500;
    def.base.projectile.hit_radius = 4;
    auto ctrl = h.make(def);

    CHECK(ctrl->cross_axis() == defs::CrossAxis::Horizontal);
    h.run(*ctrl, 400);
    CHECK(ctrl->cross_axis() == defs::CrossAxis::Vertical);
    CHECK_THAT(h.hp(horizontal), WithinAbs(90.0, 1e-4));
    CHECK_THAT(h.hp(vertical), WithinAbs(100.0, 1e-4));

    h.run(*ctrl, 400);
    CHECK(ctrl->activations() == 2);
    CHECK(ctrl->cross_axis() == defs::CrossAxis::Horizontal);
    CHECK_THAT(h.hp(horizontal), WithinAbs(90.0, 1e-4));
    CHECK_THAT(h.hp(vertical), WithinAbs(90.0, 1e-4));
}

TEST_CASE("Cross blasts use the aoe block on every frame", "[controller][cross]") {
    CombatHarness h;
    u32 off_arm = h.registry.spawn({100, 50}, 1000, 0);
    u32 behind = h.registry.spawn({0, 0}, 1000, 0);
    defs::CrossArchetype cross;
    cross.steps = 24;
    cross.step_px_per_frame = 8;
    auto def = weapon("sparkcross", cross);
    def.base.targeting.mode = defs::TargetingMode::Self;
    def.base.projectile.hit_radius = 4;
    def.base.aoe.enabled = true;
    def.base.aoe.radius = 64;
    auto ctrl = h.make(def);

    h.run(*ctrl, 16);
    // Frame 0 is a single blast at the center
    CHECK_THAT(h.hp(behind), WithinAbs(990.0, 1e-4));
    CHECK(h.count(WeaponEventType::Aoe) == 1);

    h.run(*ctrl, 500);
    // Reached by the +x arm from 64 px through 136 px: ten frames
    CHECK_THAT(h.hp(off_arm), WithinAbs(900.0, 1e-3));
    CHECK(h.count(WeaponEventType::Aoe) == 1 + 2 * 23);
    CHECK(ctrl->open_scope_count() == 0);
}

TEST_CASE("Strike lands after its animation delay", "[controller][strike]") {
    CombatHarness h;
    u32 a = h.registry.spawn({100, 0}, 100);
    u32 b = h.registry.spawn({120, 0}, 100);
    auto def = weapon("lightning", defs::StrikeArchetype{}, 30);
    def.base.aoe.enabled = true;
    def.base.aoe.radius = 40;
    def.base.aoe.damage_mult = 0.5f;
    def.base.aoe.timing = defs::AoeTiming::Animation;
    def.base.aoe.delay_ms = 200;
    auto ctrl = h.make(def);

    h.run(*ctrl, 16);
    CHECK(h.coordinator.reservation_count(a) == 1);
    CHECK_THAT(h.hp(a), WithinAbs(100.0, 1e-4));

    h.run(*ctrl, 240);
    CHECK_THAT(h.hp(a), WithinAbs(70.0, 1e-4));
    CHECK_THAT(h.hp(b), WithinAbs(85.0, 1e-4));
    CHECK(h.coordinator.reservation_count() == 0);
}

TEST_CASE("Crits multiply damage", "[controller]") {
    CombatHarness h;
    u32 t = h.registry.spawn({60, 0}, 1000, 0);
    auto def = weapon("chainlightning", defs::ChainArchetype{});
    def.base.damage.crit.chance = 1;
    def.base.damage.crit.mult = 2;
    auto ctrl = h.make(def);
    h.run(*ctrl, 16);
    CHECK_THAT(h.hp(t), WithinAbs(980.0, 1e-4));
}

TEST_CASE("Kills are reported", "[controller]") {
    CombatHarness h;
    u32 t = h.registry.spawn({60, 0}, 5, 0);
    auto ctrl = h.make(weapon("chainlightning", defs::ChainArchetype{}));
    h.run(*ctrl, 16);
    CHECK_FALSE(h.registry.is_active(t));
    CHECK(h.count(WeaponEventType::Killed) == 1);
    CHECK(h.damage.kills() == 1);
}

TEST_CASE("Modifiers change resolved stats", "[controller]") {
    CombatHarness h;
    auto ctrl = h.make(bolt());
    ctrl->set_modifiers({{defs::ModifierOp::Multiply, defs::StatPath::CadenceDelayMs, 0.5f}});
    CHECK_THAT(ctrl->stats().cadence.delay_ms, WithinAbs(300.0, 1e-4));
    ctrl->set_modifiers({});
    CHECK_THAT(ctrl->stats().cadence.delay_ms, WithinAbs(600.0, 1e-4));
}

TEST_CASE("Destroy releases projectiles, effects and reservations", "[controller]") {
    CombatHarness h;
    h.registry.spawn({300, 0}, 1e6f);
    auto def = bolt();
    def.base.cadence.salvo = 3;
    def.base.cadence.salvo_spacing_ms = 100;
    auto ctrl = h.make(def);

    h.run(*ctrl, 16);
    REQUIRE(ctrl->pool().active_count() == 1);
    REQUIRE(ctrl->pending_effect_count() == 2);
    REQUIRE(h.coordinator.reservation_count() >= 1);

    ctrl->destroy();
    CHECK(ctrl->pool().active_count() == 0);
    CHECK(ctrl->pending_effect_count() == 0);
    CHECK(ctrl->open_scope_count() == 0);
    CHECK(h.coordinator.reservation_count() == 0);
    CHECK(h.count(WeaponEventType::FireEnd) == 1);

    h.run(*ctrl, 1000);
    CHECK(ctrl->activations() == 1);
}
