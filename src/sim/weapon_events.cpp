#include "sim/weapon_events.hpp"

#include <algorithm>

namespace salvo::sim {

const char* weapon_event_name(WeaponEventType type) {
    switch (type) {
    case WeaponEventType::Added: return "weapons:added";
    case WeaponEventType::Removed: return "weapons:removed";
    case WeaponEventType::Changed: return "weapons:changed";
    case WeaponEventType::Upgraded: return "weapons:upgraded";
    case WeaponEventType::LoadoutSet: return "weapons:loadout:set";
    case WeaponEventType::Blocked: return "weapons:blocked";
    case WeaponEventType::FireStart: return "weapon:fire:start";
    case WeaponEventType::FireEnd: return "weapon:fire:end";
    case WeaponEventType::Impact: return "weapon:impact";
    case WeaponEventType::Aoe: return "weapon:aoe";
    case WeaponEventType::SkippedFire: return "weapon:fire:skipped";
    case WeaponEventType::Killed: return "weapon:kill";
    }
    return "unknown";
}

EventBus::ListenerId EventBus::subscribe(Listener listener) {
    ListenerId id = next_id_++;
    listeners_.emplace_back(id, std::move(listener));
    return id;
}

void EventBus::unsubscribe(ListenerId id) {
    std::erase_if(listeners_, [id](const auto& entry) { return entry.first == id; });
}

void EventBus::emit(const WeaponEvent& event) const {
    // Snapshot so a listener may subscribe or unsubscribe while handling
    auto snapshot = listeners_;
    for (const auto& [id, listener] : snapshot) {
        listener(event);
    }
}

} // namespace salvo::sim
