#include <catch2/catch_test_macros.hpp>
#include <catch2/matchers/catch_matchers_floating_point.hpp>

#include "defs/progression.hpp"
#include "defs/weapon_definition.hpp"

#include <algorithm>

using namespace salvo;
using namespace salvo::defs;
using Catch::Matchers::WithinAbs;

namespace {

WeaponDefinition upgradable() {
    WeaponDefinition def;
    def.key = "bolt";
    def.max_level = 4;
    def.base.cadence.delay_ms = 600;
    def.base.damage.base = 10;

    LevelSpec l2;
    l2.set(LevelField::DamageBaseMult, 1.2f);
    LevelSpec l3;
    l3.set(LevelField::CadenceDelayMsMult, 0.9f);
    LevelSpec l4;
    l4.set(LevelField::DamageBaseMult, 1.5f);
    l4.set(LevelField::AoeRadiusAdd, 20);
    def.progression[2] = l2;
    def.progression[3] = l3;
    def.progression[4] = l4;
    return def;
}

} // namespace

TEST_CASE("Level 1 has no bonuses", "[progression]") {
    auto def = upgradable();
    CHECK(accumulate_level_spec(def, 1).empty());
    CHECK(accumulate_level_spec(def, 0).empty());
    CHECK(get_level_modifiers(def, 1).empty());
}

TEST_CASE("Accumulated fields grow monotonically with level", "[progression]") {
    auto def = upgradable();
    std::vector<std::string> previous;
    for (i32 level = 1; level <= def.max_level; level++) {
        auto fields = affected_fields(accumulate_level_spec(def, level));
        for (const auto& f : previous) {
            CHECK(std::find(fields.begin(), fields.end(), f) != fields.end());
        }
        previous = fields;
    }
    CHECK(previous.size() == 3);
}

TEST_CASE("Later levels override earlier values of the same field", "[progression]") {
    auto def = upgradable();
    auto spec = accumulate_level_spec(def, 4);
    REQUIRE(spec.get(LevelField::DamageBaseMult).has_value());
    CHECK_THAT(*spec.get(LevelField::DamageBaseMult), WithinAbs(1.5, 1e-6));

    // Levels past the maximum clamp
    CHECK(accumulate_level_spec(def, 99) == spec);
}

TEST_CASE("Upgrade 1 to 3 applies each multiplier once", "[progression]") {
    auto def = upgradable();
    auto mods = get_level_modifiers(def, 3);
    REQUIRE(mods.size() == 2);
    CHECK(mods[0] == Modifier{ModifierOp::Multiply, StatPath::DamageBase, 1.2f});
    CHECK(mods[1] == Modifier{ModifierOp::Multiply, StatPath::CadenceDelayMs, 0.9f});

    WeaponStats stats = def.base;
    apply_modifiers(stats, mods);
    CHECK_THAT(stats.damage.base, WithinAbs(12.0, 1e-4));
    CHECK_THAT(stats.cadence.delay_ms, WithinAbs(540.0, 1e-3));

    CHECK(describe_level_upgrade(def, 1, 3) == "+20% damage, -10% attack delay");
}

TEST_CASE("Upgrade descriptions", "[progression]") {
    auto def = upgradable();
    CHECK(describe_level_upgrade(def, 1, 2) == "+20% damage");
    CHECK(describe_level_upgrade(def, 3, 4) == "+30% damage, +20 px AOE radius");
    CHECK(describe_level_upgrade(def, 4, 4) == "No additional bonuses");
}

TEST_CASE("Level field table matches the field enum", "[progression]") {
    const auto& fields = level_fields();
    for (size_t i = 0; i < fields.size(); i++) {
        CHECK(static_cast<size_t>(fields[i].field) == i);
    }
    const auto& info = level_field_info(LevelField::ChainMaxHopsAdd);
    CHECK(std::string(info.group) == "chain");
    CHECK(std::string(info.name) == "maxHopsAdd");
    CHECK(info.op == ModifierOp::Add);
}
