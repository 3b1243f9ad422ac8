#include "sim/damage_pipeline.hpp"
#include "sim/target_registry.hpp"

#include <algorithm>
#include <spdlog/spdlog.h>

namespace salvo::sim {

RegistryDamagePipeline::RegistryDamagePipeline(TargetRegistry& registry,
                                               f32 damage_mult)
    : registry_(registry), damage_mult_(damage_mult) {}

f32 RegistryDamagePipeline::resolve(const Target& /*target*/, f32 raw) const {
    return std::max(0.0f, raw * damage_mult_);
}

bool RegistryDamagePipeline::apply(Target& target, f32 amount) {
    if (!target.active || amount <= 0) return false;

    target.hp -= amount;
    total_damage_ += amount;
    if (target.hp > 0) return false;

    target.hp = 0;
    registry_.deactivate(target.id);
    kills_++;
    spdlog::debug("Target #{} killed", target.id);
    if (on_kill_) on_kill_(target);
    return true;
}

} // namespace salvo::sim
