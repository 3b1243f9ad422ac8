#include "defs/weapon_table.hpp"
#include "defs/definition_parser.hpp"
#include "lua/lua_state.hpp"

#include <map>
#include <spdlog/spdlog.h>

extern "C" {
#include <lua.h>
#include <lauxlib.h>
}

namespace salvo::defs {

namespace {

/// Registry refs of the tables passed to WeaponDefinition{...}, in call
/// order. Parsed after the script finishes so no Lua error unwinds
/// through C++ frames.
struct DefinitionSink {
    std::vector<int> refs;
};

int l_WeaponDefinition(lua_State* L) {
    luaL_checktype(L, 1, LUA_TTABLE);
    auto* sink = static_cast<DefinitionSink*>(
        lua::LuaState::get_registry_pointer(L, lua::REG_DEFINITION_SINK));
    if (!sink) {
        return luaL_error(L, "WeaponDefinition called outside a table load");
    }
    lua_pushvalue(L, 1);
    sink->refs.push_back(luaL_ref(L, LUA_REGISTRYINDEX));
    return 0;
}

} // namespace

template <typename Loader>
Result<void> WeaponTable::load_with(Loader&& run_script) {
    lua::LuaState state;
    if (!state.raw()) {
        return Error(ErrorKind::ScriptError, "Failed to create Lua state");
    }
    DefinitionSink sink;
    state.register_log_functions();
    state.register_function("WeaponDefinition", l_WeaponDefinition);
    state.set_registry_pointer(lua::REG_DEFINITION_SINK, &sink);

    auto ran = run_script(state);
    if (!ran) return ran;

    auto version = state.global_number("WeaponTableVersion");
    if (!version) {
        return Error(ErrorKind::InvalidDefinition,
                     "weapon table does not declare WeaponTableVersion");
    }
    if (static_cast<i32>(*version) != SUPPORTED_VERSION) {
        return Error(ErrorKind::InvalidDefinition,
                     "unsupported WeaponTableVersion " +
                         std::to_string(static_cast<i32>(*version)));
    }

    // Parse everything before committing so a failed load leaves the
    // table untouched.
    std::vector<WeaponDefinition> parsed;
    lua_State* L = state.raw();
    for (int ref : sink.refs) {
        lua_rawgeti(L, LUA_REGISTRYINDEX, ref);
        auto def = parse_weapon_definition(L, lua_gettop(L));
        lua_pop(L, 1);
        luaL_unref(L, LUA_REGISTRYINDEX, ref);
        if (!def) return def.error();
        parsed.push_back(std::move(def.value()));
    }

    std::unordered_map<std::string, size_t> seen;
    for (const auto& def : parsed) {
        if (index_.contains(def.key) || seen.contains(def.key)) {
            return Error(ErrorKind::InvalidDefinition,
                         "duplicate weapon key '" + def.key + "'");
        }
        seen.emplace(def.key, 0);
    }

    for (auto& def : parsed) {
        auto added = add(std::move(def));
        if (!added) return added;
    }
    return {};
}

Result<void> WeaponTable::load_file(const fs::path& path) {
    spdlog::info("Loading weapon table: {}", path.string());
    return load_with([&](lua::LuaState& state) { return state.do_file(path); });
}

Result<void> WeaponTable::load_string(std::string_view source,
                                      const char* chunk_name) {
    return load_with([&](lua::LuaState& state) {
        return state.do_string(source, chunk_name);
    });
}

Result<void> WeaponTable::add(WeaponDefinition def) {
    if (def.key.empty()) {
        return Error(ErrorKind::InvalidDefinition, "weapon definition without key");
    }
    if (index_.contains(def.key)) {
        return Error(ErrorKind::InvalidDefinition,
                     "duplicate weapon key '" + def.key + "'");
    }
    index_[def.key] = definitions_.size();
    definitions_.push_back(
        std::make_shared<const WeaponDefinition>(std::move(def)));
    return {};
}

std::shared_ptr<const WeaponDefinition> WeaponTable::find(
    std::string_view key) const {
    auto it = index_.find(std::string(key));
    return it != index_.end() ? definitions_[it->second] : nullptr;
}

std::vector<std::string> WeaponTable::keys() const {
    std::vector<std::string> result;
    result.reserve(definitions_.size());
    for (const auto& def : definitions_) result.push_back(def->key);
    return result;
}

void WeaponTable::log_statistics() const {
    std::map<std::string, size_t> by_kind;
    for (const auto& def : definitions_) {
        by_kind[archetype_kind_name(def->kind())]++;
    }
    spdlog::info("Weapon table: {} definitions", definitions_.size());
    for (const auto& [kind, n] : by_kind) {
        spdlog::info("  {}: {}", kind, n);
    }
}

} // namespace salvo::defs
