#include <doctest/doctest.h>

#include "piestack/enemy.hpp"

using namespace ps;

TEST_SUITE("enemy") {

TEST_CASE("fresh enemies enter from above the field") {
    DeterministicRng rng(3);
    for (int i = 0; i < 20; ++i) {
        const Enemy e = spawn_enemy(1, 1, 0, rng);
        CHECK(e.pos.y == -50.0f);
        CHECK(e.pos.x >= 50.0f);
        CHECK(e.pos.x <= 865.0f);
        CHECK(e.size == 30.0f);
        CHECK(e.target.y == enemy_profile(e.kind).hover_y);
        CHECK(e.health == doctest::Approx(enemy_profile(e.kind).health_factor * kEnemyBaseHealth));
        CHECK(e.health == e.max_health);
    }
}

TEST_CASE("spawning replays from the seed") {
    DeterministicRng a(11);
    DeterministicRng b(11);
    for (int i = 0; i < 10; ++i) {
        const Enemy ea = spawn_enemy(2, 3, i, a);
        const Enemy eb = spawn_enemy(2, 3, i, b);
        CHECK(ea.kind == eb.kind);
        CHECK(ea.pos.x == eb.pos.x);
    }
}

TEST_CASE("enemies ease towards their hover point") {
    Enemy e;
    e.kind = EnemyKind::Basic;
    e.pos = {100.0f, -50.0f};
    e.target = {100.0f, 150.0f};
    e.shoot_cd_ms = 2000.0f;
    CHECK(update_enemy(e, 16.0f, {100.0f, 1000.0f}).empty());
    CHECK(e.pos.y == doctest::Approx(-46.0f));
    CHECK(e.pos.x == 100.0f);
}

TEST_CASE("basic enemy fires an aimed spread on its cooldown") {
    Enemy e;
    e.kind = EnemyKind::Basic;
    e.pos = {100.0f, 150.0f};
    e.target = e.pos;
    e.shoot_cd_ms = 2000.0f;
    e.bullet_damage = 12.9f;
    CHECK(update_enemy(e, 1999.0f, {100.0f, 1000.0f}).empty());
    const auto shots = update_enemy(e, 1.0f, {100.0f, 1000.0f});
    REQUIRE(shots.size() == 3);
    CHECK(shots[1].angle == doctest::Approx(kPi / 2.0f));
    CHECK(shots[0].damage == doctest::Approx(12.0f));
    CHECK(e.shoot_timer_ms == 0.0f);
}

TEST_CASE("each archetype has its own attack") {
    Enemy e;
    e.pos = {300.0f, 150.0f};
    const Vec2 player{300.0f, 1000.0f};
    e.kind = EnemyKind::Circle;
    CHECK(enemy_attack(e, player).size() == 12);
    e.kind = EnemyKind::Spiral;
    CHECK(enemy_attack(e, player).size() == 15);
    e.kind = EnemyKind::Homing;
    const auto homing = enemy_attack(e, player);
    REQUIRE(homing.size() == 4);
    CHECK(homing[0].homing);
    CHECK(homing[0].speed == doctest::Approx(e.bullet_speed * 0.6f));
    e.kind = EnemyKind::Wave;
    CHECK(enemy_attack(e, player).size() == 8);
}

} // TEST_SUITE("enemy")
