#pragma once

#include "core/types.hpp"

#include <functional>

namespace salvo::sim {

struct Target;
class TargetRegistry;

/// Converts raw weapon damage into applied damage. Resolution happens when
/// a shot is committed (so reservations predict the real amount), the
/// apply step when it lands.
class DamagePipeline {
public:
    virtual ~DamagePipeline() = default;

    virtual f32 resolve(const Target& target, f32 raw) const = 0;

    /// Subtract amount from the target. Returns true if this killed it.
    virtual bool apply(Target& target, f32 amount) = 0;
};

/// Default pipeline: a global multiplier and plain HP subtraction.
class RegistryDamagePipeline : public DamagePipeline {
public:
    using KillCallback = std::function<void(const Target&)>;

    explicit RegistryDamagePipeline(TargetRegistry& registry, f32 damage_mult = 1);

    f32 resolve(const Target& target, f32 raw) const override;
    bool apply(Target& target, f32 amount) override;

    void set_on_kill(KillCallback cb) { on_kill_ = std::move(cb); }

    f64 total_damage() const { return total_damage_; }
    u32 kills() const { return kills_; }

private:
    TargetRegistry& registry_;
    f32 damage_mult_;
    KillCallback on_kill_;
    f64 total_damage_ = 0;
    u32 kills_ = 0;
};

} // namespace salvo::sim
