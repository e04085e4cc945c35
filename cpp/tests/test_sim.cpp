#include <doctest/doctest.h>

#include "piestack/boss.hpp"
#include "piestack/patterns.hpp"
#include "piestack/player.hpp"
#include "piestack/rng.hpp"
#include "piestack/sim.hpp"

#include <cmath>
#include <vector>

using namespace ps;

namespace {

Bullet enemy_bullet(uint64_t id, Vec2 pos, float damage = 10.0f) {
    Bullet b;
    b.id = id;
    b.pos = pos;
    b.vel = {0.0f, 0.0f};
    b.speed = 0.0f;
    b.damage = damage;
    return b;
}

Enemy parked_enemy(Vec2 pos) {
    Enemy e;
    e.pos = pos;
    e.target = pos;
    e.shoot_cd_ms = 100000.0f;
    return e;
}

FrameInput scripted_input(DeterministicRng& rng) {
    FrameInput in;
    in.move_x = rng.uniform(-1.0f, 1.0f);
    in.move_y = rng.uniform(-1.0f, 1.0f);
    in.fire = rng.chance(0.8f);
    in.sprint = rng.chance(0.2f);
    in.slow = rng.chance(0.2f);
    in.ability = rng.chance(0.01f);
    in.ultimate = rng.chance(0.01f);
    return in;
}

void run(Simulator& sim, const FrameInput& in, int ticks) {
    for (int i = 0; i < ticks; ++i) sim.step(in);
}

} // namespace

TEST_SUITE("sim") {

TEST_CASE("observation has a fixed shape") {
    Simulator sim(3);
    CHECK(sim.reset(3).size() == static_cast<size_t>(Simulator::observation_dim()));
    const auto res = sim.step(FrameInput{});
    CHECK(res.observation.size() == static_cast<size_t>(Simulator::observation_dim()));
    for (const float v : res.observation) CHECK(std::isfinite(v));
}

TEST_CASE("same seed and inputs replay the same run") {
    Simulator a(42);
    Simulator b(42);
    DeterministicRng ia(9);
    DeterministicRng ib(9);

    for (int i = 0; i < 3000; ++i) {
        const auto ra = a.step(scripted_input(ia));
        const auto rb = b.step(scripted_input(ib));
        REQUIRE(ra.observation == rb.observation);
        REQUIRE(ra.reward == rb.reward);
    }
    CHECK(a.state().score == b.state().score);
    CHECK(a.state().tick == b.state().tick);
    CHECK(a.state().enemies.size() == b.state().enemies.size());
    CHECK(a.state().enemy_bullets.size() == b.state().enemy_bullets.size());
    CHECK(a.state().next_bullet_id == b.state().next_bullet_id);
}

TEST_CASE("reset starts a fresh run") {
    Simulator sim(5);
    run(sim, FrameInput{}, 200);
    sim.reset(6);
    const auto& s = sim.state();
    CHECK(s.tick == 0);
    CHECK(s.score == 0);
    CHECK(s.seed == 6);
    CHECK(s.enemies.empty());
    CHECK(s.progression.stage == 1);
    CHECK(s.progression.spawn_timer_ms == 0.0f);
}

TEST_CASE("pause freezes the world until toggled again") {
    Simulator sim(1);
    FrameInput pause;
    pause.pause = true;

    sim.step(pause);
    CHECK(sim.state().play_state == PlayState::Paused);
    const auto tick = sim.state().tick;
    run(sim, FrameInput{}, 10);
    CHECK(sim.state().tick == tick);

    sim.step(pause);
    CHECK(sim.state().play_state == PlayState::Playing);
    CHECK(sim.state().tick == tick);
    sim.step(FrameInput{});
    CHECK(sim.state().tick == tick + 1);
}

TEST_CASE("a bullet grazes only once") {
    Simulator sim(1);
    auto& s = sim.mutable_state();
    const Vec2 p = s.player.pos;
    s.enemy_bullets.push_back(enemy_bullet(999, {p.x + 15.0f, p.y}));

    run(sim, FrameInput{}, 5);
    CHECK(sim.state().player.graze_count == 1);
    CHECK(sim.state().stats.grazes == 1);
    CHECK(sim.state().score == kGrazeScore);
    CHECK(sim.state().player.health == kPlayerMaxHealth);
    CHECK(sim.state().player.ability.value == doctest::Approx(kGrazeAbilityCharge));
}

TEST_CASE("enemy bullets damage the player and are consumed") {
    Simulator sim(1);
    auto& s = sim.mutable_state();
    s.enemy_bullets.push_back(enemy_bullet(999, s.player.pos));

    const auto res = sim.step(FrameInput{});
    CHECK(sim.state().player.health == doctest::Approx(40.0f));
    CHECK(sim.state().enemy_bullets.empty());
    CHECK(sim.state().player.grazed.empty());
    CHECK(res.reward < 0.0f);

    bool heard = false;
    for (const auto& snd : res.events.sounds) heard = heard || snd.cue == SoundCue::PlayerHit;
    CHECK(heard);
}

TEST_CASE("phasing through ignores bullet damage") {
    Simulator sim(1);
    auto& s = sim.mutable_state();
    s.enemy_bullets.push_back(enemy_bullet(999, s.player.pos));

    FrameInput in;
    in.sprint = true;
    sim.step(in);
    CHECK(sim.state().player.health == kPlayerMaxHealth);
    CHECK(sim.state().enemy_bullets.empty());
}

TEST_CASE("killing the boss clears the stage") {
    Simulator sim(1);
    sim.spawn_boss(BossArchetype::InfernoOven);
    REQUIRE(sim.state().boss.has_value());
    CHECK(sim.events().boss_spawned.has_value());
    sim.mutable_state().enemy_bullets.push_back(enemy_bullet(999, {100.0f, 100.0f}));

    CHECK_FALSE(sim.hit_boss(2999.0f));
    CHECK(sim.state().boss->health == doctest::Approx(1.0f));
    CHECK(boss_phase_for_health(sim.state().boss->health, sim.state().boss->max_health, 3) == 3);
    CHECK(sim.hit_boss(1.0f));

    const auto& s = sim.state();
    CHECK_FALSE(s.boss.has_value());
    CHECK(s.progression.stage == 2);
    CHECK(s.progression.wave == 1);
    CHECK(s.score == kScoreBossKill + kScoreStageComplete);
    CHECK(s.stats.bosses_defeated == 1);
    CHECK(s.enemy_bullets.empty());
    CHECK(s.player.ultimate.value == doctest::Approx(kBossKillUltimateCharge));
    CHECK_FALSE(sim.hit_boss(10.0f));
}

TEST_CASE("boss health drives its phase") {
    Simulator sim(1);
    sim.spawn_boss(BossArchetype::InfernoOven);
    auto& b = *sim.mutable_state().boss;
    b.state = BossState::Active;
    b.health = b.max_health * 0.1f;

    sim.step(FrameInput{});
    REQUIRE(sim.state().boss.has_value());
    CHECK(sim.state().boss->phase == 3);
    CHECK(sim.state().boss->state == BossState::PhaseTransition);
}

TEST_CASE("the boss takes one player bullet per tick") {
    Simulator sim(1);
    sim.spawn_boss(BossArchetype::InfernoOven);
    auto& s = sim.mutable_state();
    const Vec2 at = s.boss->pos;
    for (int i = 0; i < 4; ++i) {
        Bullet b = make_player_bullet(at, 0.0f, 10.0f);
        b.id = 100 + static_cast<uint64_t>(i);
        b.vel = {0.0f, 0.0f};
        s.player_bullets.push_back(b);
    }
    const float before = s.boss->health;

    sim.step(FrameInput{});
    CHECK(sim.state().boss->health == doctest::Approx(before - 10.0f));
    CHECK(sim.state().player_bullets.size() == 3);
    CHECK(sim.state().player.ultimate.value == doctest::Approx(kBossHitUltimateCharge));
}

TEST_CASE("an enemy takes one player bullet per tick") {
    Simulator sim(1);
    auto& s = sim.mutable_state();
    s.enemies.push_back(parked_enemy({300.0f, 300.0f}));
    s.enemies.front().health = 100.0f;
    s.enemies.front().max_health = 100.0f;
    for (int i = 0; i < 4; ++i) {
        Bullet b = make_player_bullet({300.0f, 300.0f}, 0.0f, 10.0f);
        b.id = 100 + static_cast<uint64_t>(i);
        b.vel = {0.0f, 0.0f};
        s.player_bullets.push_back(b);
    }

    sim.step(FrameInput{});
    REQUIRE(sim.state().enemies.size() == 1);
    CHECK(sim.state().enemies.front().health == doctest::Approx(90.0f));
    CHECK(sim.state().player_bullets.size() == 3);

    sim.step(FrameInput{});
    CHECK(sim.state().enemies.front().health == doctest::Approx(80.0f));
    CHECK(sim.state().player_bullets.size() == 2);
}

TEST_CASE("laser grid wipes enemies and bullets") {
    Simulator sim(1);
    auto& s = sim.mutable_state();
    s.enemies.push_back(parked_enemy({200.0f, 200.0f}));
    s.enemies.push_back(parked_enemy({500.0f, 300.0f}));
    s.enemy_bullets.push_back(enemy_bullet(999, {s.player.pos.x + 15.0f, s.player.pos.y}));
    s.player.grazed.insert(999);
    s.player.ultimate.value = kUltimateMax;

    FrameInput in;
    in.ultimate = true;
    const auto res = sim.step(in);

    CHECK(res.events.ultimate_activated);
    CHECK(sim.state().enemies.empty());
    CHECK(sim.state().stats.kills == 2);
    CHECK(sim.state().score == 2 * kScoreEnemyKill);
    CHECK(sim.state().enemy_bullets.empty());
    CHECK(sim.state().player.grazed.empty());
    CHECK(sim.state().player.ultimate.value == 0.0f);
    CHECK(sim.state().player.combo == 0);
}

TEST_CASE("ultimate needs a full meter") {
    Simulator sim(1);
    sim.mutable_state().player.ultimate.value = kUltimateMax - 1.0f;
    CHECK_FALSE(sim.activate_ultimate());
}

TEST_CASE("clone ultimate spawns shooters that fade out") {
    Simulator sim(1);
    auto& s = sim.mutable_state();
    s.player.ultimate_type = UltimateType::Clone;
    s.player.ultimate.value = kUltimateMax;

    FrameInput in;
    in.ultimate = true;
    sim.step(in);
    CHECK(sim.state().clones.size() == static_cast<size_t>(kCloneCount));

    run(sim, FrameInput{}, 9);
    CHECK(sim.state().player_bullets.size() >= static_cast<size_t>(kCloneCount));

    sim.mutable_state().clones.front().elapsed_ms = kCloneLifetimeMs - 10.0f;
    sim.step(FrameInput{});
    CHECK(sim.state().clones.size() == static_cast<size_t>(kCloneCount - 1));
}

TEST_CASE("glass cannon trades health for damage") {
    Simulator sim(1);
    auto& s = sim.mutable_state();
    s.player.ability_type = AbilityType::GlassCannon;
    s.player.ability.value = kAbilityMax;

    FrameInput in;
    in.ability = true;
    const auto res = sim.step(in);
    CHECK(res.events.ability_activated);
    CHECK(sim.state().player.ability_active);
    CHECK(sim.state().player.health == doctest::Approx(20.0f));
    CHECK(sim.state().player.ability.value == 0.0f);
}

TEST_CASE("death ends the run") {
    Simulator sim(1);
    auto& s = sim.mutable_state();
    s.player.health = 5.0f;
    s.enemy_bullets.push_back(enemy_bullet(999, s.player.pos));

    const auto res = sim.step(FrameInput{});
    CHECK(res.terminated);
    CHECK_FALSE(res.truncated);
    CHECK(res.events.player_died);
    CHECK(res.reward < -4.0f);
    CHECK(sim.run_over());

    const auto tick = sim.state().tick;
    const auto after = sim.step(FrameInput{});
    CHECK(after.terminated);
    CHECK(sim.state().tick == tick);
    CHECK(after.reward == doctest::Approx(0.01f));

    const RunRecord summary = sim.run_summary();
    CHECK(summary.total_runs == 1);
    CHECK(summary.best_stage == 1);
}

TEST_CASE("collecting a pickup applies it") {
    Simulator sim(1);
    auto& s = sim.mutable_state();
    PowerUp pu;
    pu.kind = PowerUpKind::Shield;
    pu.pos = s.player.pos;
    s.powerups.push_back(pu);

    const auto res = sim.step(FrameInput{});
    CHECK(sim.state().player.shield);
    CHECK(sim.state().powerups.empty());
    CHECK(res.score_delta == kScorePowerUpCollect);
}

TEST_CASE("waves advance on their timer") {
    Simulator sim(1);
    sim.mutable_state().progression.wave_timer_ms = kWaveDurationMs - 10.0f;

    const auto res = sim.step(FrameInput{});
    CHECK(res.events.wave_advanced);
    CHECK(sim.state().progression.wave == 2);
    CHECK(sim.state().progression.wave_timer_ms == 0.0f);
    CHECK(sim.state().progression.spawn_interval_ms == doctest::Approx(1380.0f));
}

TEST_CASE("the last wave hands over to a boss") {
    Simulator sim(1);
    auto& prog = sim.mutable_state().progression;
    prog.wave = kWavesPerStage;
    prog.wave_timer_ms = kWaveDurationMs - 10.0f;
    sim.mutable_state().enemies.push_back(parked_enemy({200.0f, 200.0f}));

    const auto res = sim.step(FrameInput{});
    CHECK(res.events.boss_spawned.has_value());
    REQUIRE(sim.state().boss.has_value());
    CHECK(sim.state().boss->state == BossState::Intro);
    CHECK(sim.state().enemies.empty());
    CHECK(sim.state().progression.stage == 1);
}

TEST_CASE("meters stay in range over a long run") {
    Simulator sim(11);
    DeterministicRng inputs(4);
    for (int i = 0; i < 5000 && !sim.run_over(); ++i) {
        const auto res = sim.step(scripted_input(inputs));
        const auto& p = sim.state().player;
        REQUIRE(p.phase.value >= 0.0f);
        REQUIRE(p.phase.value <= p.phase.max);
        REQUIRE(p.ability.value >= 0.0f);
        REQUIRE(p.ability.value <= p.ability.max);
        REQUIRE(p.ultimate.value >= 0.0f);
        REQUIRE(p.ultimate.value <= p.ultimate.max);
        REQUIRE(p.health >= 0.0f);
        REQUIRE(p.grazed.size() <= sim.state().enemy_bullets.size());
        REQUIRE(res.observation.size() == static_cast<size_t>(Simulator::observation_dim()));
    }
    CHECK(sim.state().player.shots_fired > 0);
}

} // TEST_SUITE("sim")
