#include "config/combat_config.hpp"
#include "lua/lua_state.hpp"
#include "lua/table_reader.hpp"

#include <spdlog/spdlog.h>

extern "C" {
#include <lua.h>
}

namespace salvo::config {

namespace {

void read_coordinator(lua::TableReader& t, sim::CoordinatorOptions& c) {
    if (auto v = t.number_in("candidateCount", 1, 64)) c.candidate_count = static_cast<u32>(*v);
    if (auto v = t.number_in("etaToleranceMs", 0, 10000)) c.eta_tolerance_ms = *v;
    if (auto v = t.number_in("expiryBufferMs", 0, 10000)) c.expiry_buffer_ms = *v;
    if (auto v = t.number_in("overkillTolerance", 0, 1e6)) c.overkill_tolerance = static_cast<f32>(*v);
    if (auto v = t.number_in("overkillPenaltyWeight", 0, 1e6)) c.overkill_penalty_weight = static_cast<f32>(*v);
    if (auto v = t.number_in("killshotWindow", 0, 1e6)) c.killshot_window = static_cast<f32>(*v);
    if (auto v = t.number_in("killshotBonus", 0, 1e6)) c.killshot_bonus = static_cast<f32>(*v);
}

template <typename Loader>
Result<CombatConfig> load_with(Loader&& run_script) {
    lua::LuaState state;
    if (!state.raw()) {
        return Error(ErrorKind::ScriptError, "Failed to create Lua state");
    }
    state.register_log_functions();

    auto ran = run_script(state);
    if (!ran) return ran.error();

    CombatConfig config;
    lua_State* L = state.raw();
    lua_getglobal(L, "Combat");
    if (lua_type(L, -1) != LUA_TTABLE) {
        lua_pop(L, 1);
        spdlog::warn("No Combat table found, using defaults");
        return config;
    }

    lua::TableReader t(L, lua_gettop(L), "Combat");
    if (auto v = t.number_in("maxLevel", 1, 100)) config.max_level = static_cast<i32>(*v);
    if (auto v = t.number_in("defaultLevel", 1, 100)) config.default_level = static_cast<i32>(*v);
    if (auto v = t.boolean("initialJitter")) config.initial_jitter = *v;
    if (auto v = t.number_in("minDelayMs", 0, 10000)) config.min_delay_ms = static_cast<f32>(*v);
    if (auto v = t.number_in("seed", 0, 4294967295.0)) config.seed = static_cast<u32>(*v);
    if (auto v = t.number_in("tickMs", 1, 1000)) config.tick_ms = *v;
    if (auto v = t.number_in("damageMult", 0, 1000)) config.damage_mult = static_cast<f32>(*v);
    t.table("coordinator", [&](lua::TableReader& c) { read_coordinator(c, config.coordinator); });

    auto checked = t.finish();
    lua_pop(L, 1);
    if (!checked) return checked.error();

    if (config.default_level > config.max_level) {
        return Error(ErrorKind::InvalidDefinition,
                     "Combat: defaultLevel exceeds maxLevel");
    }
    return config;
}

} // namespace

Result<CombatConfig> load_combat_config(const fs::path& path) {
    spdlog::info("Loading combat config: {}", path.string());
    return load_with([&](lua::LuaState& state) { return state.do_file(path); });
}

Result<CombatConfig> load_combat_config_string(std::string_view source) {
    return load_with([&](lua::LuaState& state) {
        return state.do_string(source, "=combat");
    });
}

} // namespace salvo::config
