#include <doctest/doctest.h>

#include "piestack/collision.hpp"
#include "piestack/geometry.hpp"
#include "piestack/patterns.hpp"

using namespace ps;

TEST_SUITE("geometry") {

TEST_CASE("distance and angle") {
    CHECK(distance({0.0f, 0.0f}, {3.0f, 4.0f}) == doctest::Approx(5.0f));
    CHECK(angle_to({0.0f, 0.0f}, {0.0f, 10.0f}) == doctest::Approx(kPi / 2.0f));
    CHECK(angle_to({0.0f, 0.0f}, {-10.0f, 0.0f}) == doctest::Approx(kPi));
}

TEST_CASE("normalize of zero vector stays zero") {
    const Vec2 n = normalize({0.0f, 0.0f});
    CHECK(n.x == 0.0f);
    CHECK(n.y == 0.0f);

    const Vec2 m = normalize({0.0f, -7.0f});
    CHECK(m.x == doctest::Approx(0.0f));
    CHECK(m.y == doctest::Approx(-1.0f));
}

TEST_CASE("move_towards steps along the heading") {
    const Vec2 p = move_towards({0.0f, 0.0f}, {10.0f, 0.0f}, 2.0f);
    CHECK(p.x == doctest::Approx(2.0f));
    CHECK(p.y == doctest::Approx(0.0f));
}

TEST_CASE("lerp and clamp") {
    CHECK(lerp(10.0f, 20.0f, 0.25f) == doctest::Approx(12.5f));
    CHECK(clamp(5.0f, 0.0f, 3.0f) == 3.0f);
    CHECK(clamp(-5.0f, 0.0f, 3.0f) == 0.0f);
    CHECK(clamp(1.5f, 0.0f, 3.0f) == 1.5f);
}

TEST_CASE("angle_delta takes the short way round") {
    CHECK(angle_delta(0.1f, 0.0f) == doctest::Approx(0.1f));
    CHECK(angle_delta(0.0f, 0.1f) == doctest::Approx(-0.1f));
    CHECK(angle_delta(kPi - 0.1f, -kPi + 0.1f) == doctest::Approx(-0.2f).epsilon(0.001));
    CHECK(angle_delta(-kPi + 0.1f, kPi - 0.1f) == doctest::Approx(0.2f).epsilon(0.001));
}

} // TEST_SUITE("geometry")

TEST_SUITE("collision") {

TEST_CASE("touching rectangles do not overlap") {
    const Rect a{0.0f, 0.0f, 10.0f, 10.0f};
    const Rect b{10.0f, 0.0f, 10.0f, 10.0f};
    const Rect c{9.5f, 0.0f, 10.0f, 10.0f};
    CHECK_FALSE(rects_overlap(a, b));
    CHECK(rects_overlap(a, c));
    CHECK(rects_overlap(c, a));
}

TEST_CASE("circles overlap at exactly the summed radius") {
    CHECK(circles_overlap({0.0f, 0.0f}, 4.0f, {10.0f, 0.0f}, 6.0f));
    CHECK_FALSE(circles_overlap({0.0f, 0.0f}, 4.0f, {10.5f, 0.0f}, 6.0f));
}

TEST_CASE("graze band excludes both edges") {
    CHECK_FALSE(in_graze_band(6.0f, 6.0f, 25.0f));
    CHECK(in_graze_band(6.5f, 6.0f, 25.0f));
    CHECK(in_graze_band(24.9f, 6.0f, 25.0f));
    CHECK_FALSE(in_graze_band(25.0f, 6.0f, 25.0f));
}

TEST_CASE("enemy bullet hits player within radius plus hitbox") {
    Player p;
    p.pos = {600.0f, 1300.0f};
    Bullet b = make_bullet({614.0f, 1300.0f}, 0.0f, 0.0f, palette::kRed);
    REQUIRE(b.radius == doctest::Approx(8.0f));
    CHECK(bullet_hits_player(b, p));

    b.pos.x = 614.5f;
    CHECK_FALSE(bullet_hits_player(b, p));
}

TEST_CASE("entity boxes use their hitbox extents") {
    Enemy e;
    e.pos = {100.0f, 100.0f};
    e.size = 30.0f;
    const Rect r = enemy_rect(e);
    CHECK(r.x == doctest::Approx(79.0f));
    CHECK(r.w == doctest::Approx(42.0f));

    Player p;
    p.pos = {50.0f, 50.0f};
    const Rect h = player_hitbox(p);
    CHECK(h.x == doctest::Approx(44.0f));
    CHECK(h.h == doctest::Approx(12.0f));

    PowerUp pu;
    pu.pos = {50.0f, 70.0f};
    CHECK(rects_overlap(powerup_rect(pu), h));
}

} // TEST_SUITE("collision")
