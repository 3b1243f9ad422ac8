#pragma once

#include "core/result.hpp"
#include "core/types.hpp"
#include "defs/weapon_definition.hpp"

#include <memory>
#include <string>
#include <string_view>
#include <unordered_map>
#include <vector>

namespace salvo::defs {

/// Versioned table of weapon definitions, loaded from a Lua data file:
///
///     WeaponTableVersion = 1
///     WeaponDefinition { key = 'bolt', kind = 'projectile', ... }
///
/// Every entry is validated at load; one bad entry fails the whole load.
class WeaponTable {
public:
    static constexpr i32 SUPPORTED_VERSION = 1;

    Result<void> load_file(const fs::path& path);
    Result<void> load_string(std::string_view source,
                             const char* chunk_name = "=weapons");

    /// Add a definition directly (used by tests and tools).
    Result<void> add(WeaponDefinition def);

    std::shared_ptr<const WeaponDefinition> find(std::string_view key) const;
    bool contains(std::string_view key) const { return find(key) != nullptr; }

    size_t count() const { return definitions_.size(); }

    /// Keys in load order.
    std::vector<std::string> keys() const;

    void log_statistics() const;

private:
    template <typename Loader>
    Result<void> load_with(Loader&& run_script);

    std::vector<std::shared_ptr<const WeaponDefinition>> definitions_;
    std::unordered_map<std::string, size_t> index_;
};

} // namespace salvo::defs
