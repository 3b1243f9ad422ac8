#include "config/combat_config.hpp"
#include "core/log.hpp"
#include "core/types.hpp"
#include "defs/weapon_table.hpp"
#include "sim/damage_pipeline.hpp"
#include "sim/sim_clock.hpp"
#include "sim/target_registry.hpp"
#include "sim/weapon_events.hpp"
#include "sim/weapon_manager.hpp"
#include "sim/weapon_owner.hpp"

#include <algorithm>
#include <cstring>
#include <iostream>
#include <map>
#include <optional>
#include <string>
#include <vector>
#include <spdlog/spdlog.h>

namespace {

using salvo::f32;

struct Options {
    std::string defs_file = "data/weapons.lua";
    std::string combat_file = "data/combat.lua";
    std::string log_file;
    std::vector<std::string> loadout;
    std::vector<std::string> upgrades;
    salvo::u32 ticks = 600;
    salvo::u32 targets = 24;
    std::optional<salvo::u32> seed;
    bool verbose = false;
};

void print_usage() {
    std::cout << "salvo v0.1.0\n"
              << "Weapon firing and targeting simulation\n\n"
              << "Usage:\n"
              << "  salvo [options]\n\n"
              << "Options:\n"
              << "  --defs <path>      Weapon definition table (default: data/weapons.lua)\n"
              << "  --combat <path>    Combat settings (default: data/combat.lua)\n"
              << "  --loadout <a,b,c>  Weapons to equip (default: every defined weapon)\n"
              << "  --upgrade <a,b>    Upgrade these weapons once each before the run\n"
              << "  --ticks <n>        Number of sim ticks to run (default: 600)\n"
              << "  --targets <n>      Number of targets to spawn (default: 24)\n"
              << "  --seed <n>         Override the combat RNG seed\n"
              << "  --log <path>       Also write the log to a file\n"
              << "  --verbose          Log every weapon event\n"
              << "  --help             Show this help message\n";
}

std::vector<std::string> split_list(const char* arg) {
    std::vector<std::string> out;
    std::string current;
    for (const char* p = arg; *p; p++) {
        if (*p == ',') {
            if (!current.empty()) out.push_back(current);
            current.clear();
        } else {
            current += *p;
        }
    }
    if (!current.empty()) out.push_back(current);
    return out;
}

bool parse_count(const char* flag, const char* arg, salvo::u32& out) {
    char* end = nullptr;
    long val = std::strtol(arg, &end, 10);
    if (end == arg || *end != '\0' || val < 0 || val > 1'000'000) {
        spdlog::error("Invalid {} value: {}", flag, arg);
        return false;
    }
    out = static_cast<salvo::u32>(val);
    return true;
}

/// Returns nullopt when the process should exit (help or bad arguments).
std::optional<Options> parse_args(int argc, char* argv[], int& exit_code) {
    Options opts;
    for (int i = 1; i < argc; i++) {
        bool has_value = i + 1 < argc;
        if (std::strcmp(argv[i], "--defs") == 0 && has_value) {
            opts.defs_file = argv[++i];
        } else if (std::strcmp(argv[i], "--combat") == 0 && has_value) {
            opts.combat_file = argv[++i];
        } else if (std::strcmp(argv[i], "--loadout") == 0 && has_value) {
            opts.loadout = split_list(argv[++i]);
        } else if (std::strcmp(argv[i], "--upgrade") == 0 && has_value) {
            opts.upgrades = split_list(argv[++i]);
        } else if (std::strcmp(argv[i], "--log") == 0 && has_value) {
            opts.log_file = argv[++i];
        } else if (std::strcmp(argv[i], "--ticks") == 0 && has_value) {
            if (!parse_count("--ticks", argv[++i], opts.ticks)) {
                exit_code = 1;
                return std::nullopt;
            }
        } else if (std::strcmp(argv[i], "--targets") == 0 && has_value) {
            if (!parse_count("--targets", argv[++i], opts.targets)) {
                exit_code = 1;
                return std::nullopt;
            }
        } else if (std::strcmp(argv[i], "--seed") == 0 && has_value) {
            salvo::u32 seed = 0;
            if (!parse_count("--seed", argv[++i], seed)) {
                exit_code = 1;
                return std::nullopt;
            }
            opts.seed = seed;
        } else if (std::strcmp(argv[i], "--verbose") == 0) {
            opts.verbose = true;
        } else if (std::strcmp(argv[i], "--help") == 0) {
            print_usage();
            exit_code = 0;
            return std::nullopt;
        } else {
            spdlog::error("Unknown argument: {}", argv[i]);
            print_usage();
            exit_code = 1;
            return std::nullopt;
        }
    }
    return opts;
}

/// Targets start on a ring around the owner and walk inward.
void spawn_wave(salvo::sim::TargetRegistry& registry, salvo::sim::Vector2 center,
                salvo::u32 count) {
    using namespace salvo::sim;
    for (salvo::u32 i = 0; i < count; i++) {
        f32 angle = 2 * PI * static_cast<f32>(i) / static_cast<f32>(std::max(1u, count));
        f32 ring = 260.0f + 40.0f * static_cast<f32>(i % 4);
        f32 hp = 20.0f + 10.0f * static_cast<f32>(i % 5);
        registry.spawn(center + Vector2::from_angle(angle) * ring, hp, 12.0f);
    }
}

void advance_targets(salvo::sim::TargetRegistry& registry, salvo::sim::Vector2 center,
                     salvo::f64 delta_ms) {
    using namespace salvo::sim;
    constexpr f32 WALK_SPEED = 40.0f; // px/s
    f32 step = WALK_SPEED * static_cast<f32>(delta_ms / 1000.0);
    registry.for_each([&](Target& t) {
        if (!t.active) return;
        Vector2 to_center = center - t.position;
        if (to_center.length() > 24.0f) t.position += to_center.normalized() * step;
    });
}

} // namespace

int main(int argc, char* argv[]) {
    int exit_code = 0;
    auto opts = parse_args(argc, argv, exit_code);
    if (!opts) return exit_code;

    salvo::log::init(opts->log_file,
                     opts->verbose ? spdlog::level::debug : spdlog::level::info);

    salvo::defs::WeaponTable table;
    auto loaded = table.load_file(opts->defs_file);
    if (!loaded) {
        spdlog::error("Failed to load weapon table: {}", loaded.error().message);
        salvo::log::shutdown();
        return 1;
    }
    table.log_statistics();

    salvo::config::CombatConfig combat;
    auto combat_result = salvo::config::load_combat_config(opts->combat_file);
    if (combat_result) {
        combat = combat_result.value();
    } else {
        spdlog::warn("Using default combat settings: {}", combat_result.error().message);
    }
    if (opts->seed) combat.seed = *opts->seed;

    salvo::sim::SimClock clock;
    salvo::sim::TargetRegistry registry;
    salvo::sim::RegistryDamagePipeline damage(registry, combat.damage_mult);
    salvo::sim::EventBus events;
    salvo::sim::BasicOwner owner("player");
    owner.set_position({0, 0});
    owner.set_facing({1, 0});

    std::map<std::string, salvo::u32> activations;
    std::map<std::string, salvo::u32> skipped;
    events.subscribe([&](const salvo::sim::WeaponEvent& ev) {
        using salvo::sim::WeaponEventType;
        if (ev.type == WeaponEventType::FireStart) activations[ev.weapon_key]++;
        if (ev.type == WeaponEventType::SkippedFire) skipped[ev.weapon_key]++;
        if (opts->verbose) {
            spdlog::debug("[{:.0f}ms] {} {} target={} amount={:.1f} {}", clock.now_ms(),
                          salvo::sim::weapon_event_name(ev.type), ev.weapon_key,
                          ev.target_id, ev.amount, ev.reason);
        }
    });

    salvo::sim::WeaponManager manager(table, owner, registry, damage, events, clock,
                                      combat);

    std::vector<std::string> loadout = opts->loadout.empty() ? table.keys() : opts->loadout;
    auto equipped = manager.set_loadout(loadout);
    if (equipped.empty()) {
        spdlog::warn("Nothing equipped");
    }
    for (const auto& key : opts->upgrades) {
        auto desc = manager.describe_next_upgrade(key);
        auto r = manager.upgrade_weapon(key);
        if (!r) {
            spdlog::warn("Upgrade '{}': {}", key, r.error().message);
            continue;
        }
        spdlog::info("'{}' is now level {} ({})", key, r.value(), desc.value_or(""));
    }

    spawn_wave(registry, owner.position(), opts->targets);
    spdlog::info("Running {} ticks of {} ms against {} targets", opts->ticks, combat.tick_ms,
                 registry.active_count());

    for (salvo::u32 tick = 0; tick < opts->ticks; tick++) {
        salvo::f64 delta = clock.advance(combat.tick_ms);
        advance_targets(registry, owner.position(), delta);
        manager.update(delta);
        registry.sweep();

        if (registry.active_count() == 0) {
            spdlog::info("All targets down at {:.0f} ms", clock.now_ms());
            break;
        }
    }

    spdlog::info("=== Summary at {:.0f} ms ===", clock.now_ms());
    for (const auto& key : manager.loadout()) {
        const auto* ctrl = manager.controller(key);
        spdlog::info("  {:<14} level {}  activations {:>4}  skipped {:>3}  live {:>3}", key,
                     manager.weapon_level(key).value_or(0), activations[key], skipped[key],
                     ctrl ? ctrl->pool().active_count() : 0);
    }
    spdlog::info("  kills {}  damage {:.1f}  targets left {}", damage.kills(),
                 damage.total_damage(), registry.active_count());

    manager.destroy();
    salvo::log::shutdown();
    return 0;
}
