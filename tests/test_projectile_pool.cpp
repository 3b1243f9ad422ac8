#include <catch2/catch_test_macros.hpp>
#include <catch2/matchers/catch_matchers_floating_point.hpp>

#include "sim/projectile_pool.hpp"
#include "sim/target_registry.hpp"
#include "sim/targeting_coordinator.hpp"
#include "sim/weapon_owner.hpp"

#include <algorithm>
#include <vector>

using namespace salvo;
using namespace salvo::sim;
using Catch::Matchers::WithinAbs;

namespace {

/// Records notifications; retires a shot once its pierce runs out.
struct RecordingListener : ProjectileListener {
    ProjectilePool* pool = nullptr;
    std::vector<u32> hits;
    std::vector<ExpiryReason> expiries;
    u32 released = 0;

    void on_projectile_hit(ProjectileHandle handle, Target& target) override {
        hits.push_back(target.id);
        if (!pool->consume_pierce(handle)) pool->release(handle);
    }
    void on_projectile_expired(ProjectileHandle, ExpiryReason reason) override {
        expiries.push_back(reason);
    }
    void on_projectile_released(const Projectile&) override { released++; }
};

FireParams straight(f32 speed, f32 lifetime_ms = 1000) {
    FireParams p;
    p.position = {0, 0};
    p.angle = 0;
    p.speed = speed;
    p.lifetime_ms = lifetime_ms;
    p.hit_radius = 4;
    return p;
}

} // namespace

TEST_CASE("Pool never exceeds capacity", "[pool]") {
    TargetRegistry registry;
    TargetingCoordinator coord(registry);
    ProjectilePool pool(3, &coord);

    std::vector<ProjectileHandle> handles;
    for (int i = 0; i < 5; i++) {
        if (auto h = pool.acquire()) handles.push_back(*h);
    }
    CHECK(handles.size() == 3);
    CHECK(pool.active_count() == 3);
    CHECK(pool.allocated_count() == 3);
    CHECK(pool.skipped_acquires() == 2);

    // Released slots are reused instead of growing
    pool.release(handles[1]);
    auto again = pool.acquire();
    REQUIRE(again);
    CHECK(*again == handles[1]);
    CHECK(pool.allocated_count() == 3);
}

TEST_CASE("Slots are created lazily", "[pool]") {
    ProjectilePool pool(120, nullptr);
    CHECK(pool.capacity() == 120);
    CHECK(pool.allocated_count() == 0);
    pool.acquire();
    CHECK(pool.allocated_count() == 1);
}

TEST_CASE("Double release is idempotent", "[pool]") {
    TargetRegistry registry;
    u32 t = registry.spawn({500, 0}, 10);
    TargetingCoordinator coord(registry);
    ProjectilePool pool(4, &coord);
    RecordingListener listener;
    listener.pool = &pool;
    pool.set_listener(&listener);

    auto h = pool.acquire();
    REQUIRE(h);
    auto params = straight(100);
    params.reservation = coord.reserve("bolt", t, 5000, 5);
    pool.fire(*h, params, 0);
    REQUIRE(coord.reservation_count() == 1);

    CHECK(pool.release(*h));
    CHECK_FALSE(pool.release(*h));
    CHECK(listener.released == 1);
    CHECK(pool.active_count() == 0);
    CHECK(coord.reservation_count() == 0);
}

TEST_CASE("Straight shots move and expire on lifetime", "[pool]") {
    TargetRegistry registry;
    ProjectilePool pool(2, nullptr);
    RecordingListener listener;
    listener.pool = &pool;
    pool.set_listener(&listener);

    auto h = pool.acquire();
    pool.fire(*h, straight(100, 250), 0);

    pool.update(100, 100, registry);
    CHECK_THAT(pool.get(*h).position.x, WithinAbs(10.0, 1e-3));
    CHECK(pool.active_count() == 1);

    pool.update(100, 200, registry);
    pool.update(100, 300, registry);
    REQUIRE(listener.expiries.size() == 1);
    CHECK(listener.expiries[0] == ExpiryReason::Lifetime);
    CHECK(pool.active_count() == 0);
}

TEST_CASE("Max distance releases without an expiry callback", "[pool]") {
    TargetRegistry registry;
    ProjectilePool pool(1, nullptr);
    RecordingListener listener;
    listener.pool = &pool;
    pool.set_listener(&listener);

    auto h = pool.acquire();
    auto params = straight(1000, 10000);
    params.max_distance = 150;
    pool.fire(*h, params, 0);

    pool.update(100, 100, registry);
    CHECK(pool.active_count() == 1);
    pool.update(100, 200, registry);
    CHECK(pool.active_count() == 0);
    CHECK(listener.expiries.empty());
    CHECK(listener.released == 1);
}

TEST_CASE("Pierce lets a shot pass through several targets once each", "[pool]") {
    TargetRegistry registry;
    u32 a = registry.spawn({20, 0}, 100, 7);
    u32 b = registry.spawn({40, 0}, 100, 7);
    u32 c = registry.spawn({60, 0}, 100, 7);
    ProjectilePool pool(1, nullptr);
    RecordingListener listener;
    listener.pool = &pool;
    pool.set_listener(&listener);

    auto h = pool.acquire();
    auto params = straight(200, 5000);
    params.pierce = 1;
    pool.fire(*h, params, 0);

    for (int i = 1; i <= 5; i++) {
        pool.update(50, 50.0 * i, registry);
    }
    REQUIRE(listener.hits.size() == 2);
    CHECK(listener.hits[0] == a);
    CHECK(listener.hits[1] == b);
    CHECK(pool.active_count() == 0);
    CHECK(std::find(listener.hits.begin(), listener.hits.end(), c) == listener.hits.end());
}

TEST_CASE("Ballistic shots return to launch height", "[pool]") {
    TargetRegistry registry;
    ProjectilePool pool(1, nullptr);
    RecordingListener listener;
    listener.pool = &pool;
    pool.set_listener(&listener);

    auto h = pool.acquire();
    FireParams params;
    params.trajectory = Trajectory::Ballistic;
    params.angle = -75 * DEG_TO_RAD;
    params.speed = 360;
    params.gravity = 900;
    params.lifetime_ms = 10000;
    pool.fire(*h, params, 0);

    f64 now = 0;
    for (int i = 0; i < 100 && pool.active_count() > 0; i++) {
        now += 16;
        pool.update(16, now, registry);
        if (pool.active_count() > 0) CHECK(pool.get(*h).position.y <= 1.0f);
    }
    REQUIRE(listener.expiries.size() == 1);
    CHECK(listener.expiries[0] == ExpiryReason::GroundReturn);
    // Flight time is about 2 * v * sin(75) / g
    CHECK(now > 700);
    CHECK(now < 850);
}

TEST_CASE("Orbiting shots follow their center", "[pool]") {
    TargetRegistry registry;
    ProjectilePool pool(1, nullptr);
    BasicOwner owner;
    owner.set_position({100, 100});

    auto h = pool.acquire();
    OrbitParams params;
    params.center = &owner;
    params.radius = 50;
    params.angular_velocity = PI; // half a turn per second
    params.lifetime_ms = 5000;
    pool.fire_orbit(*h, params, 0);
    CHECK_THAT(pool.get(*h).position.x, WithinAbs(150.0, 1e-3));

    owner.set_position({200, 100});
    pool.update(1000, 1000, registry);
    const auto& p = pool.get(*h);
    CHECK_THAT(distance(p.position, owner.position()), WithinAbs(50.0, 1e-2));
    CHECK_THAT(p.position.x, WithinAbs(150.0, 1e-2));
}

TEST_CASE("Re-firing a live handle replaces the flight", "[pool]") {
    TargetRegistry registry;
    u32 t = registry.spawn({500, 0}, 10);
    TargetingCoordinator coord(registry);
    ProjectilePool pool(1, &coord);

    auto h = pool.acquire();
    auto first = straight(100, 100);
    first.reservation = coord.reserve("bolt", t, 1000, 5);
    pool.fire(*h, first, 0);
    u32 generation = pool.get(*h).generation;

    pool.fire(*h, straight(100, 1000), 50);
    CHECK(coord.reservation_count() == 0);
    CHECK_FALSE(pool.is_current(*h, generation));
    CHECK(pool.get(*h).expires_at_ms == 1050.0);
}
