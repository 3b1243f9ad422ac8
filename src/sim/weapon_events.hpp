#pragma once

#include "core/types.hpp"
#include "sim/vector2.hpp"

#include <functional>
#include <string>
#include <utility>
#include <vector>

namespace salvo::sim {

enum class WeaponEventType {
    Added,
    Removed,
    Changed,
    Upgraded,
    LoadoutSet,
    Blocked,
    FireStart,
    FireEnd,
    Impact,
    Aoe,
    SkippedFire,
    Killed,
};

/// Wire name of an event, e.g. "weapons:added" or "weapon:fire:start".
const char* weapon_event_name(WeaponEventType type);

struct WeaponEvent {
    WeaponEventType type;
    std::string weapon_key;
    std::string scope_id;   ///< FireStart/FireEnd pairing
    std::string reason;     ///< Blocked reason
    u32 target_id = 0;
    f32 amount = 0;         ///< Damage dealt (Impact/Aoe)
    u32 hits = 0;           ///< Targets hit (Aoe)
    i32 level = 0;
    Vector2 position;
};

/// Synchronous event dispatch to presentation listeners (audio, FX, HUD).
class EventBus {
public:
    using Listener = std::function<void(const WeaponEvent&)>;
    using ListenerId = u64;

    ListenerId subscribe(Listener listener);
    void unsubscribe(ListenerId id);

    /// Invoke every listener in subscription order.
    void emit(const WeaponEvent& event) const;

    size_t listener_count() const { return listeners_.size(); }

private:
    std::vector<std::pair<ListenerId, Listener>> listeners_;
    ListenerId next_id_ = 1;
};

} // namespace salvo::sim
