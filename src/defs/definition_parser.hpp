#pragma once

#include "core/result.hpp"
#include "defs/weapon_definition.hpp"

struct lua_State;

namespace salvo::defs {

/// Build a WeaponDefinition from the Lua table at stack index `index`.
/// Rejects unknown fields, unknown kinds and paths, and missing required
/// groups (key, kind, cadence.delayMs, damage.base).
Result<WeaponDefinition> parse_weapon_definition(lua_State* L, int index);

} // namespace salvo::defs
