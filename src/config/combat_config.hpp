#pragma once

#include "core/result.hpp"
#include "core/types.hpp"
#include "sim/targeting_coordinator.hpp"

#include <string_view>

namespace salvo::config {

/// Run-wide combat settings, read from the `Combat` table of a Lua file.
struct CombatConfig {
    i32 max_level = 10;
    i32 default_level = 1;
    bool initial_jitter = false;   ///< Randomize each weapon's first shot
    f32 min_delay_ms = 40;
    u32 seed = 1337;
    f64 tick_ms = 16;
    f32 damage_mult = 1;
    sim::CoordinatorOptions coordinator;
};

/// Load from a Lua file defining `Combat = { ... }`. Missing fields keep
/// their defaults; wrong types and unknown fields are errors.
Result<CombatConfig> load_combat_config(const fs::path& path);
Result<CombatConfig> load_combat_config_string(std::string_view source);

} // namespace salvo::config
