#pragma once

#include "defs/modifier.hpp"
#include "defs/progression.hpp"
#include "defs/weapon_stats.hpp"

#include <map>
#include <string>
#include <vector>

namespace salvo::defs {

/// Immutable weapon template loaded from the definition table. Shared by
/// every equipped instance of the weapon.
struct WeaponDefinition {
    std::string key;
    std::string name;
    i32 max_level = 1;
    WeaponStats base;
    std::vector<Modifier> base_modifiers;
    std::map<i32, LevelSpec> progression; ///< Keyed by level, 2..max_level

    ArchetypeKind kind() const { return archetype_kind_of(base.archetype); }
};

} // namespace salvo::defs
