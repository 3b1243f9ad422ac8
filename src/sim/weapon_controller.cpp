#include "sim/weapon_controller.hpp"
#include "config/combat_config.hpp"
#include "sim/damage_pipeline.hpp"
#include "sim/sim_clock.hpp"
#include "sim/target_registry.hpp"
#include "sim/target_selection.hpp"
#include "sim/targeting_coordinator.hpp"
#include "sim/weapon_owner.hpp"

#include <algorithm>
#include <spdlog/spdlog.h>

namespace salvo::sim {

const char* controller_state_name(ControllerState state) {
    switch (state) {
    case ControllerState::Idle: return "idle";
    case ControllerState::Warmup: return "warmup";
    case ControllerState::Firing: return "firing";
    case ControllerState::Cooldown: return "cooldown";
    }
    return "unknown";
}

WeaponController::WeaponController(
    std::shared_ptr<const defs::WeaponDefinition> definition,
    const WeaponOwner& owner, CombatContext context)
    : definition_(std::move(definition)),
      owner_(owner),
      ctx_(context),
      stats_(definition_->base),
      pool_(static_cast<u32>(definition_->base.projectile.pool_size),
            &context.coordinator) {
    pool_.set_listener(this);
    set_modifiers(definition_->base_modifiers);

    if (auto* cross = std::get_if<defs::CrossArchetype>(&stats_.archetype)) {
        cross_axis_ = cross->start_axis;
    }

    f64 now = ctx_.clock.now_ms();
    next_fire_at_ms_ = now;
    last_rehit_clear_ms_ = now;
    if (ctx_.config.initial_jitter && stats_.cadence.delay_ms > 1) {
        std::uniform_real_distribution<f64> jitter(0.0, stats_.cadence.delay_ms - 1.0);
        next_fire_at_ms_ += jitter(ctx_.rng);
    }
}

WeaponController::~WeaponController() {
    destroy();
}

void WeaponController::set_modifiers(const std::vector<defs::Modifier>& modifiers) {
    stats_ = definition_->base;
    defs::apply_modifiers(stats_, modifiers, ctx_.config.min_delay_ms);
}

void WeaponController::update(f64 delta_ms) {
    if (destroyed_) return;
    f64 now = ctx_.clock.now_ms();

    pool_.update(delta_ms, now, ctx_.registry);
    refresh_orbit_hits(now);
    run_pending_effects(now);
    step_cadence(now);
}

void WeaponController::destroy() {
    if (destroyed_) return;
    destroyed_ = true;

    effects_.clear();
    pool_.release_all();
    ctx_.coordinator.release_by_weapon(key());

    // Anything still open ends here
    for (const auto& [scope, live] : live_per_scope_) {
        auto ev = make_event(WeaponEventType::FireEnd);
        ev.scope_id = scope_id(scope);
        ctx_.events.emit(ev);
    }
    live_per_scope_.clear();
    state_ = ControllerState::Idle;
}

// ---------------------------------------------------------------------------
// Cadence
// ---------------------------------------------------------------------------

bool WeaponController::needs_target() const {
    switch (definition_->kind()) {
    case defs::ArchetypeKind::Chain:
    case defs::ArchetypeKind::ChainThrow:
    case defs::ArchetypeKind::Strike:
        return true;
    default:
        return stats_.targeting.mode == defs::TargetingMode::Nearest;
    }
}

f32 WeaponController::shot_speed() const {
    switch (definition_->kind()) {
    case defs::ArchetypeKind::Projectile:
    case defs::ArchetypeKind::Burst:
    case defs::ArchetypeKind::Bazooka:
        return stats_.projectile.speed;
    default:
        return 0;
    }
}

f64 WeaponController::impact_latency_ms() const {
    f64 latency = stats_.cadence.warmup_ms;
    if (auto* slash = std::get_if<defs::SlashArchetype>(&stats_.archetype)) {
        latency += slash->hit_delay_ms;
    }
    if (auto* chain = std::get_if<defs::ChainThrowArchetype>(&stats_.archetype)) {
        latency += chain->per_hop_duration_ms;
    }
    if (std::holds_alternative<defs::StrikeArchetype>(stats_.archetype) &&
        stats_.aoe.timing == defs::AoeTiming::Animation) {
        latency += stats_.aoe.delay_ms;
    }
    return latency;
}

std::optional<WeaponController::Aim> WeaponController::acquire_aim(f64 now) const {
    Aim aim;
    aim.origin = owner_.position();
    Vector2 facing = owner_.facing_direction().normalized();

    if (needs_target()) {
        SelectionQuery query;
        query.origin = aim.origin;
        query.range = stats_.targeting.range;
        query.shot_damage = stats_.damage.base;
        query.speed = shot_speed();
        query.latency_ms = impact_latency_ms();
        query.now_ms = now;

        auto choice = select_target(ctx_.registry, ctx_.coordinator, query);
        if (!choice) return std::nullopt;
        const Target* t = ctx_.registry.find(choice->target_id);
        aim.target_id = choice->target_id;
        aim.point = t->position;
        aim.distance = choice->distance;
        aim.direction = (t->position - aim.origin).normalized();
        if (stats_.targeting.mode == defs::TargetingMode::Facing) {
            aim.direction = facing;
        }
        return aim;
    }

    aim.direction = facing;
    if (stats_.targeting.mode == defs::TargetingMode::Facing) {
        aim.distance = stats_.targeting.range;
        aim.point = aim.origin + facing * stats_.targeting.range;
    } else {
        aim.point = aim.origin;
    }
    return aim;
}

void WeaponController::step_cadence(f64 now) {
    if (state_ == ControllerState::Warmup) {
        if (now < warmup_until_ms_) return;
        if (!owner_.can_fire()) {
            state_ = ControllerState::Idle;
            return;
        }
        if (auto aim = acquire_aim(now)) {
            begin_activation(*aim, now);
        } else {
            state_ = ControllerState::Idle;
        }
        return;
    }

    if (now < next_fire_at_ms_) {
        state_ = activations_ > 0 ? ControllerState::Cooldown : ControllerState::Idle;
        return;
    }

    state_ = ControllerState::Idle;
    if (!owner_.can_fire()) return;

    // Without a target the timer stays armed, so the weapon fires the
    // moment one comes into range.
    auto aim = acquire_aim(now);
    if (!aim) return;

    if (stats_.cadence.warmup_ms > 0) {
        state_ = ControllerState::Warmup;
        warmup_until_ms_ = now + stats_.cadence.warmup_ms;
        return;
    }
    begin_activation(*aim, now);
}

void WeaponController::begin_activation(const Aim& aim, f64 now) {
    state_ = ControllerState::Firing;
    activations_++;
    next_fire_at_ms_ = now + stats_.cadence.delay_ms;

    u32 scope = ++scope_seq_;
    current_scope_ = scope;
    live_per_scope_[scope] = 1; // held by the activation itself

    auto ev = make_event(WeaponEventType::FireStart);
    ev.target_id = aim.target_id.value_or(0);
    ev.position = aim.point;
    ctx_.events.emit(ev);

    std::visit([&](const auto& archetype) { fire_archetype(archetype, aim, now); },
               stats_.archetype);

    untrack(scope);
    state_ = ControllerState::Cooldown;
}

// ---------------------------------------------------------------------------
// Projectile notifications
// ---------------------------------------------------------------------------

void WeaponController::on_projectile_hit(ProjectileHandle handle, Target& target) {
    auto& p = pool_.get(handle);
    current_scope_ = p.scope;
    if (p.reservation && p.target_id == target.id) {
        pool_.consume_reservation(handle);
    }

    Vector2 point = p.position;
    apply_hit(target, ctx_.damage.resolve(target, p.damage), point);

    switch (definition_->kind()) {
    case defs::ArchetypeKind::Ballistic:
        explode(handle, target.id);
        pool_.release(handle);
        return;
    case defs::ArchetypeKind::Bazooka:
        detonate(point, p.damage, ctx_.clock.now_ms());
        pool_.release(handle);
        return;
    case defs::ArchetypeKind::Circular:
        if (!pool_.consume_pierce(handle)) pool_.release(handle);
        return;
    default:
        break;
    }

    if (pool_.consume_pierce(handle)) return;
    explode(handle, target.id);
    pool_.release(handle);
}

void WeaponController::on_projectile_expired(ProjectileHandle handle,
                                             ExpiryReason /*reason*/) {
    auto& p = pool_.get(handle);
    current_scope_ = p.scope;

    switch (definition_->kind()) {
    case defs::ArchetypeKind::Bazooka:
        detonate(p.position, p.damage, ctx_.clock.now_ms());
        break;
    case defs::ArchetypeKind::Projectile:
    case defs::ArchetypeKind::Burst:
    case defs::ArchetypeKind::Ballistic:
        explode(handle, 0);
        break;
    default:
        break;
    }
    pool_.release(handle);
}

void WeaponController::on_projectile_released(const Projectile& projectile) {
    if (projectile.in_flight) untrack(projectile.scope);
}

void WeaponController::refresh_orbit_hits(f64 now) {
    auto* circular = std::get_if<defs::CircularArchetype>(&stats_.archetype);
    if (!circular || circular->rehit_interval_ms <= 0) return;
    if (now - last_rehit_clear_ms_ < circular->rehit_interval_ms) return;

    last_rehit_clear_ms_ = now;
    pool_.for_each_active([&](ProjectileHandle h, Projectile&) { pool_.clear_hits(h); });
}

void WeaponController::report_skipped(const char* reason) {
    spdlog::debug("{}: fire skipped ({})", key(), reason);
    auto ev = make_event(WeaponEventType::SkippedFire);
    ev.reason = reason;
    ctx_.events.emit(ev);
}

// ---------------------------------------------------------------------------
// Damage
// ---------------------------------------------------------------------------

f32 WeaponController::roll_damage() {
    f32 damage = stats_.damage.base;
    const auto& crit = stats_.damage.crit;
    if (crit.chance > 0) {
        std::uniform_real_distribution<f32> roll(0.0f, 1.0f);
        if (roll(ctx_.rng) < crit.chance) damage *= crit.mult;
    }
    return damage;
}

std::optional<ReservationId> WeaponController::reserve(u32 target_id,
                                                       f64 impact_ms, f32 raw) {
    const Target* t = ctx_.registry.find(target_id);
    if (!t) return std::nullopt;
    return ctx_.coordinator.reserve(key(), target_id, impact_ms,
                                    ctx_.damage.resolve(*t, raw));
}

void WeaponController::apply_hit(Target& target, f32 amount, Vector2 point) {
    if (!target.active) return;
    bool killed = ctx_.damage.apply(target, amount);

    auto ev = make_event(WeaponEventType::Impact);
    ev.target_id = target.id;
    ev.amount = amount;
    ev.position = point;
    ctx_.events.emit(ev);

    if (killed) {
        auto kill = make_event(WeaponEventType::Killed);
        kill.target_id = target.id;
        kill.position = target.position;
        ctx_.events.emit(kill);
    }
}

u32 WeaponController::apply_area(Vector2 center, f32 raw,
                                 const defs::ExplosionStats& area, u32 exclude_id,
                                 f32 arc_deg, Vector2 aim,
                                 std::vector<u32>* already_hit) {
    AreaQuery query;
    query.center = center;
    query.radius = area.radius;
    query.max_targets = area.max_targets;
    query.arc_deg = arc_deg;
    query.aim = aim;
    query.exclude_id = exclude_id;

    u32 hits = 0;
    f32 total = 0;
    for (const auto& hit : collect_area_targets(ctx_.registry, query)) {
        if (already_hit) {
            if (std::find(already_hit->begin(), already_hit->end(), hit.target_id) !=
                already_hit->end())
                continue;
            already_hit->push_back(hit.target_id);
        }
        Target* t = ctx_.registry.find(hit.target_id);
        if (!t || !t->active) continue;

        f32 amount = ctx_.damage.resolve(
            *t, raw * area.damage_mult * falloff_multiplier(area.falloff, hit.distance));
        bool killed = ctx_.damage.apply(*t, amount);
        total += amount;
        hits++;
        if (killed) {
            auto kill = make_event(WeaponEventType::Killed);
            kill.target_id = t->id;
            kill.position = t->position;
            ctx_.events.emit(kill);
        }
    }

    auto ev = make_event(WeaponEventType::Aoe);
    ev.position = center;
    ev.hits = hits;
    ev.amount = total;
    ctx_.events.emit(ev);
    return hits;
}

// ---------------------------------------------------------------------------
// Pending effects and fire scopes
// ---------------------------------------------------------------------------

void WeaponController::schedule(f64 due_ms, std::function<void(f64)> run) {
    track(current_scope_);
    effects_.push_back(PendingEffect{due_ms, current_scope_, std::move(run)});
}

void WeaponController::run_pending_effects(f64 now) {
    if (effects_.empty()) return;

    // Effects scheduled while running land in effects_ and wait for a
    // later tick.
    std::vector<PendingEffect> current;
    current.swap(effects_);
    for (auto& effect : current) {
        if (destroyed_) return;
        if (effect.due_ms > now) {
            effects_.push_back(std::move(effect));
            continue;
        }
        current_scope_ = effect.scope;
        effect.run(now);
        untrack(effect.scope);
    }
}

void WeaponController::track(u32 scope) {
    if (scope == 0) return;
    live_per_scope_[scope]++;
}

void WeaponController::untrack(u32 scope) {
    auto it = live_per_scope_.find(scope);
    if (it == live_per_scope_.end()) return;
    if (--it->second > 0) return;

    live_per_scope_.erase(it);
    auto ev = make_event(WeaponEventType::FireEnd);
    ev.scope_id = scope_id(scope);
    ctx_.events.emit(ev);
}

std::string WeaponController::scope_id(u32 scope) const {
    return fmt::format("{}:{}:{}", key(), owner_.name(), scope);
}

WeaponEvent WeaponController::make_event(WeaponEventType type) const {
    WeaponEvent ev;
    ev.type = type;
    ev.weapon_key = key();
    ev.scope_id = scope_id(current_scope_);
    return ev;
}

} // namespace salvo::sim
