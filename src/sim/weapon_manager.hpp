#pragma once

#include "core/result.hpp"
#include "core/types.hpp"
#include "defs/modifier.hpp"
#include "sim/targeting_coordinator.hpp"
#include "sim/weapon_controller.hpp"

#include <memory>
#include <optional>
#include <random>
#include <string>
#include <string_view>
#include <unordered_set>
#include <vector>

namespace salvo::config {
struct CombatConfig;
}

namespace salvo::defs {
class WeaponTable;
}

namespace salvo::sim {

class DamagePipeline;
class EventBus;
class SimClock;
class TargetRegistry;
class WeaponOwner;

/// Equip-time settings for add_weapon.
struct AddOptions {
    std::optional<i32> level;             ///< Configured default when empty
    std::vector<defs::Modifier> modifiers; ///< Initial per-weapon custom layer
};

/// Loadout and progression for one owner. Creates a controller per equipped
/// weapon, composes each weapon's modifier layers and routes per-tick
/// updates. Owns the shared targeting coordinator and combat RNG.
class WeaponManager {
public:
    WeaponManager(const defs::WeaponTable& table, const WeaponOwner& owner,
                  TargetRegistry& registry, DamagePipeline& damage,
                  EventBus& events, const SimClock& clock,
                  const config::CombatConfig& config);
    ~WeaponManager();

    WeaponManager(const WeaponManager&) = delete;
    WeaponManager& operator=(const WeaponManager&) = delete;

    /// Equip a weapon. Blocked additions emit a Blocked event and return
    /// the reason.
    Result<void> add_weapon(std::string_view key, AddOptions options = {});

    /// Unequip a weapon, tearing down its controller. Returns false if it
    /// was not equipped.
    bool remove_weapon(std::string_view key);

    /// Replace the loadout. Duplicates, unknown keys and keys outside the
    /// allow-list are dropped. Weapons kept across the call keep their
    /// level and controller. Returns the resulting loadout.
    std::vector<std::string> set_loadout(const std::vector<std::string>& keys);

    /// Raise a weapon one level. Returns the new level.
    Result<i32> upgrade_weapon(std::string_view key);

    /// Set a weapon's level directly, clamped to its maximum.
    Result<i32> set_weapon_level(std::string_view key, i32 level);

    /// Modifier applied after every per-weapon layer, to all weapons.
    void apply_global_modifier(const defs::Modifier& modifier);
    void clear_global_modifiers();
    const std::vector<defs::Modifier>& global_modifiers() const { return global_; }

    /// Per-weapon custom layer, applied between the base and level layers.
    Result<void> set_modifiers_for_weapon(std::string_view key,
                                          std::vector<defs::Modifier> modifiers);

    /// Restrict equippable weapons. Empty optional lifts the restriction.
    /// Currently equipped weapons outside the new list are removed.
    void set_allow_list(std::optional<std::vector<std::string>> keys);

    /// Whether add_weapon(key) would succeed, ignoring already-equipped.
    bool can_equip(std::string_view key) const;

    /// Add to the allow-list (if one is set) and equip.
    Result<void> grant_weapon(std::string_view key, AddOptions options = {});

    /// Remove from the allow-list (if one is set) and unequip.
    void revoke_weapon(std::string_view key);

    /// Swap one weapon for another in the same slot. The old weapon stays
    /// if the new one is blocked.
    Result<void> replace_weapon(std::string_view old_key, std::string_view new_key,
                                AddOptions options = {});

    /// Drop stale reservations, then advance every controller.
    void update(f64 delta_ms);

    /// Tear down every controller. The manager is empty afterwards.
    void destroy();

    std::vector<std::string> loadout() const;
    bool has_weapon(std::string_view key) const;
    std::optional<i32> weapon_level(std::string_view key) const;
    WeaponController* controller(std::string_view key);

    /// Description of the next level's bonuses, empty at max level.
    std::optional<std::string> describe_next_upgrade(std::string_view key) const;

    /// Highest level a weapon may reach under the current configuration.
    i32 level_cap(const defs::WeaponDefinition& def) const;

    TargetingCoordinator& coordinator() { return coordinator_; }
    const TargetingCoordinator& coordinator() const { return coordinator_; }

private:
    struct Slot {
        std::string key;
        i32 level = 1;
        std::vector<defs::Modifier> custom;
        std::unique_ptr<WeaponController> controller;
    };

    Slot* find_slot(std::string_view key);
    const Slot* find_slot(std::string_view key) const;

    std::optional<ErrorKind> check_equip(std::string_view key) const;
    Error block(std::string_view key, ErrorKind kind, std::string message);
    std::unique_ptr<WeaponController> make_controller(std::string_view key);

    /// base + custom + level + global
    std::vector<defs::Modifier> compose_modifiers(const Slot& slot) const;
    void refresh(Slot& slot);
    void emit(WeaponEventType type, std::string_view key, i32 level = 0);

    const defs::WeaponTable& table_;
    const WeaponOwner& owner_;
    TargetRegistry& registry_;
    DamagePipeline& damage_;
    EventBus& events_;
    const SimClock& clock_;
    const config::CombatConfig& config_;

    TargetingCoordinator coordinator_;
    std::mt19937 rng_;
    std::vector<Slot> slots_; ///< Equip order
    std::vector<defs::Modifier> global_;
    std::optional<std::unordered_set<std::string>> allow_list_;
};

} // namespace salvo::sim
