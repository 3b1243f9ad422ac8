#pragma once

#include "config/combat_config.hpp"
#include "defs/weapon_definition.hpp"
#include "sim/damage_pipeline.hpp"
#include "sim/sim_clock.hpp"
#include "sim/target_registry.hpp"
#include "sim/targeting_coordinator.hpp"
#include "sim/weapon_controller.hpp"
#include "sim/weapon_events.hpp"
#include "sim/weapon_owner.hpp"

#include <algorithm>
#include <memory>
#include <random>
#include <vector>

namespace salvo::test {

constexpr f64 TICK_MS = 16;

/// Everything a controller needs, wired together, plus an event log.
struct CombatHarness {
    sim::TargetRegistry registry;
    sim::TargetingCoordinator coordinator{registry};
    sim::RegistryDamagePipeline damage{registry};
    sim::EventBus events;
    sim::SimClock clock;
    std::mt19937 rng{7};
    config::CombatConfig config;
    sim::BasicOwner owner{"hero"};
    std::vector<sim::WeaponEvent> log;

    CombatHarness() {
        events.subscribe([this](const sim::WeaponEvent& ev) { log.push_back(ev); });
    }

    sim::CombatContext context() {
        return {registry, coordinator, damage, events, clock, rng, config};
    }

    std::unique_ptr<sim::WeaponController> make(defs::WeaponDefinition def) {
        return std::make_unique<sim::WeaponController>(
            std::make_shared<const defs::WeaponDefinition>(std::move(def)), owner,
            context());
    }

    void run(sim::WeaponController& controller, f64 duration_ms) {
        auto ticks = static_cast<int>(duration_ms / TICK_MS);
        for (int i = 0; i < ticks; i++) {
            f64 delta = clock.advance(TICK_MS);
            coordinator.prune(clock.now_ms());
            controller.update(delta);
        }
    }

    size_t count(sim::WeaponEventType type) const {
        return static_cast<size_t>(std::count_if(
            log.begin(), log.end(), [type](const auto& ev) { return ev.type == type; }));
    }

    f32 hp(u32 id) const {
        const auto* t = registry.find(id);
        return t ? t->hp : 0;
    }
};

/// Definition skeleton: a given archetype with long cooldown so only one
/// activation happens in short runs.
inline defs::WeaponDefinition weapon(const char* key, defs::ArchetypeStats archetype,
                                     f32 base_damage = 10) {
    defs::WeaponDefinition def;
    def.key = key;
    def.name = key;
    def.base.cadence.delay_ms = 5000;
    def.base.targeting.mode = defs::TargetingMode::Nearest;
    def.base.targeting.range = 400;
    def.base.damage.base = base_damage;
    def.base.archetype = std::move(archetype);
    return def;
}

} // namespace salvo::test
