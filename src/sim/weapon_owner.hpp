#pragma once

#include "sim/vector2.hpp"

#include <string>

namespace salvo::sim {

/// Entity that carries weapons. Read-only from the weapon engine's side.
class WeaponOwner {
public:
    virtual ~WeaponOwner() = default;

    virtual Vector2 position() const = 0;

    /// Unit vector the owner is facing.
    virtual Vector2 facing_direction() const = 0;

    /// False while the owner is stunned, dead or otherwise unable to attack.
    virtual bool can_fire() const { return true; }

    /// Label used in fire scope ids and logs.
    virtual std::string name() const { return "owner"; }
};

/// Owner whose state is set directly by the driver.
class BasicOwner : public WeaponOwner {
public:
    explicit BasicOwner(std::string name = "player") : name_(std::move(name)) {}

    Vector2 position() const override { return position_; }
    Vector2 facing_direction() const override { return facing_; }
    bool can_fire() const override { return can_fire_; }
    std::string name() const override { return name_; }

    void set_position(Vector2 p) { position_ = p; }
    void set_facing(Vector2 dir) { facing_ = dir.normalized(); }
    void set_can_fire(bool can_fire) { can_fire_ = can_fire; }

private:
    std::string name_;
    Vector2 position_;
    Vector2 facing_{1, 0};
    bool can_fire_ = true;
};

} // namespace salvo::sim
