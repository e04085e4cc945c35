#include <doctest/doctest.h>

#include "piestack/player.hpp"

using namespace ps;

namespace {

void run(Player& p, const FrameInput& in, int ticks) {
    for (int i = 0; i < ticks; ++i) update_player(p, in, in.dt_ms);
}

} // namespace

TEST_SUITE("player") {

TEST_CASE("sprint drains phase and release regenerates it") {
    Player p;
    FrameInput in;
    in.sprint = true;
    in.dt_ms = 10.0f;

    run(p, in, 100);
    CHECK(p.phase.value == doctest::Approx(40.0f).epsilon(0.001));
    CHECK(p.phase_through);

    in.sprint = false;
    run(p, in, 100);
    CHECK(p.phase.value == doctest::Approx(80.0f).epsilon(0.001));
    CHECK_FALSE(p.phase_through);
}

TEST_CASE("sprint stops once phase is empty") {
    Player p;
    p.phase.value = 0.0f;
    FrameInput in;
    in.sprint = true;
    update_player(p, in, in.dt_ms);
    CHECK_FALSE(p.phase_through);
    CHECK(p.phase.value > 0.0f);
}

TEST_CASE("slow wins over sprint") {
    Player p;
    p.phase.value = 50.0f;
    const float x = p.pos.x;
    FrameInput in;
    in.slow = true;
    in.sprint = true;
    in.move_x = 1.0f;
    in.dt_ms = 100.0f;
    update_player(p, in, in.dt_ms);
    CHECK_FALSE(p.phase_through);
    CHECK(p.phase.value == doctest::Approx(54.0f));
    CHECK(p.pos.x == doctest::Approx(x + kPlayerSlowSpeed));
}

TEST_CASE("diagonal movement is scaled and clamped to the field") {
    Player p;
    p.pos = {300.0f, 300.0f};
    FrameInput in;
    in.move_x = 1.0f;
    in.move_y = -1.0f;
    update_player(p, in, in.dt_ms);
    CHECK(p.pos.x == doctest::Approx(300.0f + kPlayerSpeed * 0.707f));
    CHECK(p.pos.y == doctest::Approx(300.0f - kPlayerSpeed * 0.707f));
    CHECK(p.moving);

    p.pos = {20.0f, 20.0f};
    in.move_x = -3.0f;
    in.move_y = 0.0f;
    update_player(p, in, in.dt_ms);
    CHECK(p.pos.x == doctest::Approx(p.size));
}

TEST_CASE("sprint uses the fixed sprint speed") {
    Player p;
    p.pos = {300.0f, 300.0f};
    FrameInput in;
    in.sprint = true;
    in.move_x = 1.0f;
    update_player(p, in, in.dt_ms);
    CHECK(p.pos.x == doctest::Approx(309.0f));
}

TEST_CASE("combo multiplier follows thresholds") {
    Player p;
    for (int i = 0; i < 4; ++i) increment_combo(p);
    CHECK(p.combo_multiplier == doctest::Approx(1.0f));
    increment_combo(p);
    CHECK(p.combo_multiplier == doctest::Approx(1.5f));
    for (int i = 0; i < 10; ++i) increment_combo(p);
    CHECK(p.combo == 15);
    CHECK(p.combo_multiplier == doctest::Approx(2.0f));
    CHECK(combo_multiplier_for(30) == doctest::Approx(3.0f));
    CHECK(combo_multiplier_for(50) == doctest::Approx(5.0f));
    CHECK(combo_multiplier_for(500) == doctest::Approx(5.0f));
}

TEST_CASE("damage resets combo and starts invincibility") {
    Player p;
    for (int i = 0; i < 6; ++i) increment_combo(p);
    CHECK(take_damage(p, 10.0f) == HitOutcome::Damaged);
    CHECK(p.health == doctest::Approx(40.0f));
    CHECK(p.combo == 0);
    CHECK(p.combo_multiplier == doctest::Approx(1.0f));
    CHECK(p.invincible_ms == doctest::Approx(kPlayerInvincibilityMs));

    CHECK(take_damage(p, 10.0f) == HitOutcome::Blocked);
    CHECK(p.health == doctest::Approx(40.0f));
}

TEST_CASE("shield absorbs one hit and still resets combo") {
    Player p;
    p.shield = true;
    for (int i = 0; i < 6; ++i) increment_combo(p);
    CHECK(take_damage(p, 10.0f) == HitOutcome::ShieldAbsorbed);
    CHECK(p.health == doctest::Approx(kPlayerMaxHealth));
    CHECK_FALSE(p.shield);
    CHECK(p.combo == 0);
}

TEST_CASE("invincible ability blocks without touching combo") {
    Player p;
    p.ability_type = AbilityType::Invincible;
    p.ability.value = p.ability.max;
    REQUIRE(activate_ability(p));
    for (int i = 0; i < 6; ++i) increment_combo(p);
    CHECK(take_damage(p, 10.0f) == HitOutcome::Blocked);
    CHECK(p.combo == 6);
    CHECK(p.health == doctest::Approx(kPlayerMaxHealth));
    CHECK(ability_damage_multiplier(p) == doctest::Approx(1.0f));
}

TEST_CASE("lethal damage clamps health at zero") {
    Player p;
    p.health = 5.0f;
    CHECK(take_damage(p, 10.0f) == HitOutcome::Killed);
    CHECK(p.health == 0.0f);
    CHECK_FALSE(player_alive(p));
}

TEST_CASE("ability needs a full meter and runs for its duration") {
    Player p;
    p.ability.value = 99.0f;
    CHECK_FALSE(activate_ability(p));

    p.ability.add(5.0f);
    CHECK(p.ability.value == doctest::Approx(100.0f));
    REQUIRE(activate_ability(p));
    CHECK(p.ability.value == 0.0f);
    CHECK(p.ability_active);

    FrameInput in;
    in.dt_ms = 1000.0f;
    run(p, in, 4);
    CHECK(p.ability_active);
    run(p, in, 1);
    CHECK_FALSE(p.ability_active);
}

TEST_CASE("glass cannon drops health and triples damage") {
    Player p;
    p.ability_type = AbilityType::GlassCannon;
    p.ability.value = p.ability.max;
    REQUIRE(activate_ability(p));
    CHECK(p.health == doctest::Approx(20.0f));
    CHECK(effective_damage(p) == doctest::Approx(30.0f));
}

TEST_CASE("berserker grows stronger as health drops") {
    Player p;
    p.ability_type = AbilityType::Berserker;
    p.ability.value = p.ability.max;
    REQUIRE(activate_ability(p));
    CHECK(ability_damage_multiplier(p) == doctest::Approx(1.5f));
    p.health = 20.0f;
    CHECK(ability_damage_multiplier(p) == doctest::Approx(2.0f));
    p.health = 10.0f;
    CHECK(ability_damage_multiplier(p) == doctest::Approx(2.5f));
}

TEST_CASE("normal weapon fires one barrel then cools down") {
    Player p;
    const auto shots = fire(p);
    REQUIRE(shots.size() == 1);
    CHECK(shots[0].damage == doctest::Approx(kPlayerBulletDamage));
    CHECK(shots[0].vel.y < 0.0f);
    CHECK(p.shoot_cd_ms == doctest::Approx(kPlayerShootCooldownMs));
    CHECK(fire(p).empty());
    CHECK(p.shots_fired == 1);
}

TEST_CASE("power four adds weaker side barrels") {
    Player p;
    p.power_level = 4;
    const auto shots = fire(p);
    REQUIRE(shots.size() == 5);
    CHECK(shots[3].damage == doctest::Approx(7.0f));
    CHECK(shots[4].damage == doctest::Approx(7.0f));
}

TEST_CASE("weapon styles scale damage and cooldown") {
    Player p;
    p.weapon = WeaponStyle::Spread;
    const auto spread = fire(p);
    CHECK(spread.size() == 6);
    CHECK(spread[0].damage == doctest::Approx(8.0f));

    p.shoot_cd_ms = 0.0f;
    p.weapon = WeaponStyle::Burst;
    const auto burst = fire(p);
    REQUIRE(burst.size() == 1);
    CHECK(burst[0].damage == doctest::Approx(30.0f));
    CHECK(p.shoot_cd_ms == doctest::Approx(300.0f));

    p.shoot_cd_ms = 0.0f;
    p.weapon = WeaponStyle::Rapid;
    fire(p);
    CHECK(p.shoot_cd_ms == doctest::Approx(30.0f));
}

TEST_CASE("meters never leave their range") {
    Meter m{50.0f, 100.0f};
    m.add(500.0f);
    CHECK(m.value == 100.0f);
    CHECK(m.full());
    m.drain(1000.0f);
    CHECK(m.value == 0.0f);
    m.add(-10.0f);
    CHECK(m.value == 0.0f);
}

TEST_CASE("boss arrival strips power-ups") {
    Player p;
    p.damage_multiplier = 2.5f;
    p.shield = true;
    p.speed = 7.0f;
    p.weapon = WeaponStyle::Laser;
    p.power_level = 3;
    clear_powerups(p);
    CHECK(p.damage_multiplier == 1.0f);
    CHECK_FALSE(p.shield);
    CHECK(p.speed == kPlayerSpeed);
    CHECK(p.weapon == WeaponStyle::Normal);
    CHECK(p.power_level == 2);

    p.power_level = 1;
    clear_powerups(p);
    CHECK(p.power_level == 1);
}

} // TEST_SUITE("player")
