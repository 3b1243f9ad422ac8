#include "sim/weapon_manager.hpp"
#include "config/combat_config.hpp"
#include "defs/progression.hpp"
#include "defs/weapon_table.hpp"
#include "sim/target_registry.hpp"
#include "sim/sim_clock.hpp"
#include "sim/weapon_owner.hpp"

#include <algorithm>
#include <spdlog/spdlog.h>

namespace salvo::sim {

WeaponManager::WeaponManager(const defs::WeaponTable& table, const WeaponOwner& owner,
                             TargetRegistry& registry, DamagePipeline& damage,
                             EventBus& events, const SimClock& clock,
                             const config::CombatConfig& config)
    : table_(table),
      owner_(owner),
      registry_(registry),
      damage_(damage),
      events_(events),
      clock_(clock),
      config_(config),
      coordinator_(registry, config.coordinator),
      rng_(config.seed) {}

WeaponManager::~WeaponManager() {
    destroy();
}

// ---------------------------------------------------------------------------
// Loadout
// ---------------------------------------------------------------------------

Result<void> WeaponManager::add_weapon(std::string_view key, AddOptions options) {
    if (find_slot(key)) {
        return block(key, ErrorKind::AlreadyEquipped,
                     fmt::format("weapon '{}' is already equipped", key));
    }
    if (auto kind = check_equip(key)) {
        return block(key, *kind,
                     *kind == ErrorKind::UnknownWeapon
                         ? fmt::format("unknown weapon '{}'", key)
                         : fmt::format("weapon '{}' is not in the allow-list", key));
    }

    auto def = table_.find(key);
    Slot slot;
    slot.key = std::string(key);
    slot.level =
        std::clamp(options.level.value_or(config_.default_level), 1, level_cap(*def));
    slot.custom = std::move(options.modifiers);
    slot.controller = make_controller(key);
    refresh(slot);
    slots_.push_back(std::move(slot));

    spdlog::info("Equipped '{}' (level {})", key, slots_.back().level);
    emit(WeaponEventType::Added, key, slots_.back().level);
    emit(WeaponEventType::Changed, key);
    return {};
}

bool WeaponManager::remove_weapon(std::string_view key) {
    auto it = std::find_if(slots_.begin(), slots_.end(),
                           [&](const Slot& s) { return s.key == key; });
    if (it == slots_.end()) return false;

    std::string removed = it->key;
    it->controller->destroy();
    slots_.erase(it);
    coordinator_.release_by_weapon(removed);

    spdlog::info("Unequipped '{}'", removed);
    emit(WeaponEventType::Removed, removed);
    emit(WeaponEventType::Changed, removed);
    return true;
}

std::vector<std::string> WeaponManager::set_loadout(const std::vector<std::string>& keys) {
    std::vector<std::string> wanted;
    for (const auto& key : keys) {
        if (std::find(wanted.begin(), wanted.end(), key) != wanted.end()) continue;
        if (check_equip(key)) {
            spdlog::warn("Loadout: dropping '{}' ({})", key,
                         error_kind_name(*check_equip(key)));
            continue;
        }
        wanted.push_back(key);
    }

    if (wanted == loadout()) return wanted;

    std::vector<std::string> current = loadout();
    for (const auto& key : current) {
        if (std::find(wanted.begin(), wanted.end(), key) == wanted.end()) {
            remove_weapon(key);
        }
    }
    for (const auto& key : wanted) {
        if (!find_slot(key)) {
            auto r = add_weapon(key);
            if (!r) spdlog::warn("Loadout: {}", r.error().message);
        }
    }

    // Keep the requested order
    std::stable_sort(slots_.begin(), slots_.end(), [&](const Slot& a, const Slot& b) {
        return std::find(wanted.begin(), wanted.end(), a.key) <
               std::find(wanted.begin(), wanted.end(), b.key);
    });

    WeaponEvent ev;
    ev.type = WeaponEventType::LoadoutSet;
    events_.emit(ev);
    return loadout();
}

Result<i32> WeaponManager::upgrade_weapon(std::string_view key) {
    Slot* slot = find_slot(key);
    if (!slot) {
        return Error(ErrorKind::UnknownWeapon,
                     fmt::format("weapon '{}' is not equipped", key));
    }
    auto def = table_.find(key);
    if (slot->level >= level_cap(*def)) {
        return Error(ErrorKind::MaxLevel,
                     fmt::format("weapon '{}' is already at max level {}", key, slot->level));
    }

    std::string summary = defs::describe_level_upgrade(*def, slot->level, slot->level + 1);
    slot->level++;
    refresh(*slot);

    spdlog::info("Upgraded '{}' to level {}: {}", key, slot->level, summary);
    emit(WeaponEventType::Upgraded, key, slot->level);
    return slot->level;
}

Result<i32> WeaponManager::set_weapon_level(std::string_view key, i32 level) {
    Slot* slot = find_slot(key);
    if (!slot) {
        return Error(ErrorKind::UnknownWeapon,
                     fmt::format("weapon '{}' is not equipped", key));
    }
    auto def = table_.find(key);
    i32 clamped = std::clamp(level, 1, level_cap(*def));
    if (clamped != slot->level) {
        slot->level = clamped;
        refresh(*slot);
        emit(WeaponEventType::Upgraded, key, clamped);
    }
    return clamped;
}

// ---------------------------------------------------------------------------
// Modifiers
// ---------------------------------------------------------------------------

void WeaponManager::apply_global_modifier(const defs::Modifier& modifier) {
    global_.push_back(modifier);
    for (auto& slot : slots_) refresh(slot);
}

void WeaponManager::clear_global_modifiers() {
    if (global_.empty()) return;
    global_.clear();
    for (auto& slot : slots_) refresh(slot);
}

Result<void> WeaponManager::set_modifiers_for_weapon(std::string_view key,
                                                     std::vector<defs::Modifier> modifiers) {
    Slot* slot = find_slot(key);
    if (!slot) {
        return Error(ErrorKind::UnknownWeapon,
                     fmt::format("weapon '{}' is not equipped", key));
    }
    slot->custom = std::move(modifiers);
    refresh(*slot);
    return {};
}

std::vector<defs::Modifier> WeaponManager::compose_modifiers(const Slot& slot) const {
    auto def = table_.find(slot.key);
    std::vector<defs::Modifier> mods = def->base_modifiers;
    mods.insert(mods.end(), slot.custom.begin(), slot.custom.end());
    auto level_mods = defs::get_level_modifiers(*def, slot.level);
    mods.insert(mods.end(), level_mods.begin(), level_mods.end());
    mods.insert(mods.end(), global_.begin(), global_.end());
    return mods;
}

void WeaponManager::refresh(Slot& slot) {
    slot.controller->set_modifiers(compose_modifiers(slot));
}

// ---------------------------------------------------------------------------
// Allow-list
// ---------------------------------------------------------------------------

void WeaponManager::set_allow_list(std::optional<std::vector<std::string>> keys) {
    if (!keys) {
        allow_list_.reset();
        return;
    }
    allow_list_.emplace(keys->begin(), keys->end());

    std::vector<std::string> current = loadout();
    for (const auto& key : current) {
        if (!allow_list_->contains(key)) remove_weapon(key);
    }
}

bool WeaponManager::can_equip(std::string_view key) const {
    return !check_equip(key).has_value();
}

std::optional<ErrorKind> WeaponManager::check_equip(std::string_view key) const {
    if (!table_.contains(key)) return ErrorKind::UnknownWeapon;
    if (allow_list_ && !allow_list_->contains(std::string(key))) return ErrorKind::NotAllowed;
    return std::nullopt;
}

Result<void> WeaponManager::grant_weapon(std::string_view key, AddOptions options) {
    if (allow_list_ && table_.contains(key)) allow_list_->insert(std::string(key));
    return add_weapon(key, std::move(options));
}

void WeaponManager::revoke_weapon(std::string_view key) {
    if (allow_list_) allow_list_->erase(std::string(key));
    remove_weapon(key);
}

Result<void> WeaponManager::replace_weapon(std::string_view old_key,
                                           std::string_view new_key,
                                           AddOptions options) {
    if (old_key == new_key) return {};

    auto it = std::find_if(slots_.begin(), slots_.end(),
                           [&](const Slot& s) { return s.key == old_key; });
    if (it == slots_.end()) return add_weapon(new_key, std::move(options));

    if (find_slot(new_key)) {
        return block(new_key, ErrorKind::AlreadyEquipped,
                     fmt::format("weapon '{}' is already equipped", new_key));
    }
    if (auto kind = check_equip(new_key)) {
        return block(new_key, *kind,
                     fmt::format("cannot replace '{}' with '{}'", old_key, new_key));
    }

    size_t position = static_cast<size_t>(it - slots_.begin());
    if (!remove_weapon(old_key)) return Error(fmt::format("failed to remove '{}'", old_key));
    auto r = add_weapon(new_key, std::move(options));
    if (!r) return r;

    // Move the new weapon into the old one's slot
    std::rotate(slots_.begin() + static_cast<std::ptrdiff_t>(position), slots_.end() - 1,
                slots_.end());
    return {};
}

// ---------------------------------------------------------------------------
// Tick and queries
// ---------------------------------------------------------------------------

void WeaponManager::update(f64 delta_ms) {
    coordinator_.prune(clock_.now_ms());
    for (auto& slot : slots_) {
        slot.controller->update(delta_ms);
    }
}

void WeaponManager::destroy() {
    for (auto& slot : slots_) {
        slot.controller->destroy();
    }
    slots_.clear();
    coordinator_.clear();
}

std::vector<std::string> WeaponManager::loadout() const {
    std::vector<std::string> keys;
    keys.reserve(slots_.size());
    for (const auto& slot : slots_) keys.push_back(slot.key);
    return keys;
}

bool WeaponManager::has_weapon(std::string_view key) const {
    return find_slot(key) != nullptr;
}

std::optional<i32> WeaponManager::weapon_level(std::string_view key) const {
    const Slot* slot = find_slot(key);
    if (!slot) return std::nullopt;
    return slot->level;
}

WeaponController* WeaponManager::controller(std::string_view key) {
    Slot* slot = find_slot(key);
    return slot ? slot->controller.get() : nullptr;
}

std::optional<std::string> WeaponManager::describe_next_upgrade(std::string_view key) const {
    const Slot* slot = find_slot(key);
    if (!slot) return std::nullopt;
    auto def = table_.find(key);
    if (slot->level >= level_cap(*def)) return std::nullopt;
    return defs::describe_level_upgrade(*def, slot->level, slot->level + 1);
}

i32 WeaponManager::level_cap(const defs::WeaponDefinition& def) const {
    return std::max(1, std::min(def.max_level, config_.max_level));
}

// ---------------------------------------------------------------------------
// Helpers
// ---------------------------------------------------------------------------

WeaponManager::Slot* WeaponManager::find_slot(std::string_view key) {
    for (auto& slot : slots_) {
        if (slot.key == key) return &slot;
    }
    return nullptr;
}

const WeaponManager::Slot* WeaponManager::find_slot(std::string_view key) const {
    for (const auto& slot : slots_) {
        if (slot.key == key) return &slot;
    }
    return nullptr;
}

Error WeaponManager::block(std::string_view key, ErrorKind kind, std::string message) {
    spdlog::warn("Blocked '{}': {}", key, message);
    WeaponEvent ev;
    ev.type = WeaponEventType::Blocked;
    ev.weapon_key = std::string(key);
    ev.reason = error_kind_name(kind);
    events_.emit(ev);
    return Error(kind, std::move(message));
}

std::unique_ptr<WeaponController> WeaponManager::make_controller(std::string_view key) {
    CombatContext ctx{registry_, coordinator_, damage_, events_, clock_, rng_, config_};
    return std::make_unique<WeaponController>(table_.find(key), owner_, ctx);
}

void WeaponManager::emit(WeaponEventType type, std::string_view key, i32 level) {
    WeaponEvent ev;
    ev.type = type;
    ev.weapon_key = std::string(key);
    ev.level = level;
    events_.emit(ev);
}

} // namespace salvo::sim
