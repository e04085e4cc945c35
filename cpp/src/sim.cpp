#include "piestack/sim.hpp"

#include "piestack/boss.hpp"
#include "piestack/collision.hpp"
#include "piestack/config.hpp"
#include "piestack/difficulty.hpp"
#include "piestack/enemy.hpp"
#include "piestack/patterns.hpp"
#include "piestack/player.hpp"
#include "piestack/powerup.hpp"

#include <algorithm>
#include <cassert>
#include <cmath>
#include <limits>
#include <utility>

namespace ps {
namespace {

constexpr float kAimUp = kPi * 1.5f;
constexpr float kDeathPenalty = 5.0f;
constexpr float kBossDropSpread = 30.0f;
constexpr int kBossDropCount = 3;
constexpr float kCloneSpawnOffsets[kCloneCount] = {-40.0f, 0.0f, 40.0f};

#ifndef NDEBUG
bool is_finite_vec(Vec2 v) {
    return std::isfinite(v.x) && std::isfinite(v.y);
}

bool meter_in_range(const Meter& m) {
    return m.value >= 0.0f && m.value <= m.max;
}
#endif

void drop_spent(std::vector<Bullet>& bullets) {
    bullets.erase(std::remove_if(bullets.begin(), bullets.end(), [](const Bullet& b) { return b.spent; }),
                  bullets.end());
}

} // namespace

Simulator::Simulator() : Simulator(0) {}

Simulator::Simulator(uint64_t seed) {
    reset(seed);
}

std::vector<float> Simulator::reset(uint64_t seed) {
    state_ = GameState{};
    state_.seed = seed;
    state_.progression.spawn_interval_ms = stage_spawn_interval(1);
    rng_.reseed(seed);
    events_ = TickEvents{};
    return build_observation(state_);
}

void Simulator::add_player_bullets(std::vector<Bullet>&& bullets) {
    for (auto& b : bullets) {
        b.id = state_.next_bullet_id++;
        state_.player_bullets.push_back(b);
    }
}

void Simulator::add_enemy_bullets(std::vector<Bullet>&& bullets) {
    for (auto& b : bullets) {
        b.id = state_.next_bullet_id++;
        state_.enemy_bullets.push_back(b);
    }
}

// Removing a bullet also forgets whether it grazed the player, so the graze
// set only ever holds ids of live bullets.
void Simulator::drop_spent_enemy_bullets() {
    auto& grazed = state_.player.grazed;
    for (const auto& b : state_.enemy_bullets) {
        if (b.spent) grazed.erase(b.id);
    }
    drop_spent(state_.enemy_bullets);
}

void Simulator::clear_enemy_bullets() {
    state_.enemy_bullets.clear();
    state_.player.grazed.clear();
}

void Simulator::award(ScoreKind kind, int points, Vec2 pos) {
    state_.score += points;
    events_.scores.push_back({kind, points, pos});
}

void Simulator::roll_drop(Vec2 pos) {
    if (auto drop = roll_powerup(pos, rng_)) {
        state_.powerups.push_back(*drop);
    }
}

std::optional<Vec2> Simulator::nearest_target(Vec2 from) const {
    std::optional<Vec2> best;
    float best_dist = std::numeric_limits<float>::max();
    if (state_.boss.has_value()) {
        best = state_.boss->pos;
        best_dist = distance(from, state_.boss->pos);
    }
    for (const auto& e : state_.enemies) {
        const float d = distance(from, e.pos);
        if (d < best_dist) {
            best_dist = d;
            best = e.pos;
        }
    }
    return best;
}

void Simulator::handle_activations(const FrameInput& input) {
    auto& p = state_.player;
    if (input.ability && activate_ability(p)) {
        events_.ability_activated = true;
        events_.sounds.push_back({SoundCue::PowerUp, 1.0f});
        events_.particles.push_back({p.pos, palette::kPurple, 20, 1.0f});
    }
    if (input.ultimate) {
        activate_ultimate();
    }
}

bool Simulator::activate_ultimate() {
    auto& p = state_.player;
    if (!p.ultimate.full()) return false;

    p.ultimate.empty();
    p.ultimate_visual_ms = kUltimateVisualMs;
    events_.ultimate_activated = true;

    float damage = 0.0f;
    switch (p.ultimate_type) {
    case UltimateType::LaserGrid: damage = kLaserGridDamage; break;
    case UltimateType::FullscreenLaser: damage = kFullscreenLaserDamage; break;
    case UltimateType::Clone:
        for (const float dx : kCloneSpawnOffsets) {
            Clone c;
            c.pos = {p.pos.x + dx, p.pos.y};
            state_.clones.push_back(c);
        }
        break;
    case UltimateType::Count: break;
    }

    if (damage > 0.0f) {
        clear_enemy_bullets();
        if (state_.boss.has_value()) {
            events_.particles.push_back({state_.boss->pos, palette::kRed, 30, 2.0f});
            hit_boss(damage);
        }

        for (auto& e : state_.enemies) {
            const float dealt = std::min(e.health, damage);
            e.health -= damage;
            state_.stats.damage_dealt += dealt;
            if (e.health <= 0.0f) {
                state_.stats.kills += 1;
                award(ScoreKind::Ultimate, kScoreEnemyKill, e.pos);
                events_.particles.push_back({e.pos, palette::kRed, 15, 1.0f});
            }
        }
        state_.enemies.erase(std::remove_if(state_.enemies.begin(), state_.enemies.end(),
                                            [](const Enemy& e) { return e.health <= 0.0f; }),
                             state_.enemies.end());
    }

    events_.sounds.push_back({SoundCue::BossHit, 1.0f});
    return true;
}

void Simulator::update_clones(float dt_ms) {
    const Vec2 anchor = state_.player.pos;
    std::vector<Bullet> shots;
    for (auto& c : state_.clones) {
        c.elapsed_ms += dt_ms;
        c.shoot_timer_ms += dt_ms;

        const float fade_start = c.lifetime_ms - kCloneFadeMs;
        if (c.elapsed_ms > fade_start) {
            const float t = std::clamp((c.elapsed_ms - fade_start) / kCloneFadeMs, 0.0f, 1.0f);
            c.alpha = static_cast<uint8_t>(180.0f * (1.0f - t));
        }

        c.pos.x = anchor.x + (c.pos.x - anchor.x) * kCloneTrail;
        c.pos.y = anchor.y + (c.pos.y - anchor.y) * kCloneTrail;

        if (c.elapsed_ms <= c.lifetime_ms && c.shoot_timer_ms >= kCloneShootCooldownMs) {
            c.shoot_timer_ms = 0.0f;
            const auto target = nearest_target(c.pos);
            const float angle = target.has_value() ? angle_to(c.pos, *target) : kAimUp;
            shots.push_back(make_player_bullet(c.pos, angle, kPlayerBulletDamage));
        }
    }
    state_.clones.erase(std::remove_if(state_.clones.begin(), state_.clones.end(),
                                       [](const Clone& c) { return c.elapsed_ms > c.lifetime_ms; }),
                        state_.clones.end());
    add_player_bullets(std::move(shots));
}

void Simulator::detect_tricks() {
    auto& p = state_.player;
    const auto trick = p.tricks.detect();
    if (!trick.has_value()) return;

    state_.stats.tricks += 1;
    award(ScoreKind::Trick, kScoreTrick, p.pos);
    events_.tricks.push_back({*trick, p.pos});
    events_.sounds.push_back({SoundCue::PowerUp, 1.0f});
}

void Simulator::update_player_bullets(float dt_ms) {
    for (auto& b : state_.player_bullets) {
        std::optional<Vec2> target;
        if (b.homing) target = nearest_target(b.pos);
        update_bullet(b, dt_ms, target.has_value() ? &*target : nullptr);
        if (bullet_expired(b)) b.spent = true;
    }
    drop_spent(state_.player_bullets);
}

void Simulator::update_enemy_bullets(float dt_ms) {
    const Vec2 player = state_.player.pos;
    for (auto& b : state_.enemy_bullets) {
        update_bullet(b, dt_ms, &player);
        if (bullet_expired(b)) b.spent = true;
    }
    drop_spent_enemy_bullets();
}

void Simulator::update_powerups(float dt_ms) {
    auto& p = state_.player;
    const Rect hitbox = player_hitbox(p);

    std::vector<PowerUp> kept;
    kept.reserve(state_.powerups.size());
    for (auto& pu : state_.powerups) {
        update_powerup(pu, dt_ms);
        if (powerup_expired(pu)) continue;
        if (rects_overlap(powerup_rect(pu), hitbox)) {
            apply_powerup(p, pu.kind);
            award(ScoreKind::PowerUp, kScorePowerUpCollect, pu.pos);
            events_.sounds.push_back({SoundCue::PowerUp, 1.0f});
            events_.particles.push_back({pu.pos, powerup_def(pu.kind).color, 10, 1.0f});
            continue;
        }
        kept.push_back(pu);
    }
    state_.powerups.swap(kept);
}

void Simulator::spawn_boss(std::optional<BossArchetype> archetype) {
    const int stage = state_.progression.stage;
    state_.boss = archetype.has_value() ? make_boss(*archetype, stage) : create_boss(stage, rng_);
    state_.enemies.clear();
    clear_powerups(state_.player);
    events_.boss_spawned = state_.boss->archetype;
}

bool Simulator::hit_boss(float damage) {
    if (!state_.boss.has_value()) return false;
    Boss& b = *state_.boss;
    const float before = b.health;
    const bool killed = damage_boss(b, damage);
    state_.stats.damage_dealt += before - b.health;
    if (killed) defeat_boss();
    return killed;
}

void Simulator::defeat_boss() {
    const Vec2 pos = state_.boss->pos;
    const Rgb color = boss_profile(state_.boss->archetype).color;

    award(ScoreKind::Boss, kScoreBossKill * state_.progression.stage, pos);
    events_.sounds.push_back({SoundCue::EnemyDeath, 1.0f});
    events_.particles.push_back({pos, color, 50, 2.0f});
    for (int i = 0; i < kBossDropCount; ++i) {
        roll_drop({pos.x + static_cast<float>(i - 1) * kBossDropSpread, pos.y});
    }
    state_.player.ultimate.add(kBossKillUltimateCharge);

    state_.stats.bosses_defeated += 1;
    events_.boss_defeated = true;
    state_.boss.reset();
    start_new_stage();
}

void Simulator::start_new_stage() {
    auto& prog = state_.progression;
    prog.stage += 1;
    prog.wave = 1;
    prog.wave_timer_ms = 0.0f;
    prog.spawn_timer_ms = 0.0f;
    prog.spawn_interval_ms = stage_spawn_interval(prog.stage);

    state_.enemies.clear();
    clear_enemy_bullets();
    award(ScoreKind::Stage, kScoreStageComplete, state_.player.pos);
    events_.stage_cleared = true;
}

void Simulator::update_boss_encounter(float dt_ms) {
    {
        Boss& b = *state_.boss;
        add_enemy_bullets(update_boss(b, dt_ms, state_.player.pos, rng_));
        if (b.state != BossState::Intro && should_drop_powerup(b)) {
            const float x = b.pos.x + static_cast<float>(rng_.uniform_int(-40, 40));
            roll_drop({x, b.pos.y + 50.0f});
        }
    }

    // The boss takes at most one player bullet per tick.
    auto& p = state_.player;
    for (auto& bullet : state_.player_bullets) {
        if (!rects_overlap(bullet_rect(bullet), boss_rect(*state_.boss))) continue;

        bullet.spent = true;
        if (!hit_boss(bullet.damage)) {
            p.ultimate.add(kBossHitUltimateCharge);
            events_.sounds.push_back({SoundCue::BossHit, 1.0f + (p.combo_multiplier - 1.0f) * 0.1f});
        }
        break;
    }
    drop_spent(state_.player_bullets);
}

void Simulator::kill_enemy(const Enemy& e) {
    auto& p = state_.player;
    increment_combo(p);
    award(ScoreKind::Enemy, static_cast<int>(static_cast<float>(kScoreEnemyKill) * p.combo_multiplier), e.pos);
    state_.stats.kills += 1;
    state_.stats.best_combo = std::max(state_.stats.best_combo, p.combo);
    p.ultimate.add(kKillUltimateCharge);
    p.ability.add(kKillAbilityCharge);
    events_.sounds.push_back({SoundCue::EnemyDeath, 1.0f + (p.combo_multiplier - 1.0f) * 0.15f});
    events_.particles.push_back({e.pos, enemy_profile(e.kind).color, 15, 1.0f});
    roll_drop(e.pos);
}

// Each enemy takes at most one player bullet per tick, the earliest fired
// one that overlaps it.
void Simulator::resolve_player_fire_on_enemies() {
    auto& p = state_.player;
    for (auto& e : state_.enemies) {
        const Rect er = enemy_rect(e);
        for (auto& bullet : state_.player_bullets) {
            if (bullet.spent || !rects_overlap(er, bullet_rect(bullet))) continue;

            bullet.spent = true;
            state_.stats.damage_dealt += std::min(e.health, bullet.damage);
            e.health -= bullet.damage;
            if (e.health <= 0.0f) {
                kill_enemy(e);
            } else {
                events_.sounds.push_back({SoundCue::EnemyHit, 1.0f + (p.combo_multiplier - 1.0f) * 0.08f});
            }
            break;
        }
    }
    drop_spent(state_.player_bullets);
    state_.enemies.erase(std::remove_if(state_.enemies.begin(), state_.enemies.end(),
                                        [](const Enemy& e) { return e.health <= 0.0f; }),
                         state_.enemies.end());
}

void Simulator::update_waves(float dt_ms) {
    auto& prog = state_.progression;
    prog.wave_timer_ms += dt_ms;
    prog.spawn_timer_ms += dt_ms;

    const int alive = static_cast<int>(state_.enemies.size());
    if (prog.spawn_timer_ms >= prog.spawn_interval_ms && alive < spawn_cap(prog.stage, prog.wave)) {
        state_.enemies.push_back(spawn_enemy(prog.stage, prog.wave, alive, rng_));
        prog.spawn_timer_ms = 0.0f;
    }

    for (auto& e : state_.enemies) {
        add_enemy_bullets(update_enemy(e, dt_ms, state_.player.pos));
    }
    resolve_player_fire_on_enemies();

    if (prog.wave_timer_ms >= kWaveDurationMs) {
        prog.wave += 1;
        prog.wave_timer_ms = 0.0f;
        prog.spawn_interval_ms = wave_spawn_interval(prog.stage, prog.wave);
        events_.wave_advanced = true;
        if (prog.wave > kWavesPerStage) {
            spawn_boss();
        }
    }
}

void Simulator::resolve_enemy_fire() {
    auto& p = state_.player;
    for (auto& b : state_.enemy_bullets) {
        const float d = distance(b.pos, p.pos);
        if (p.grazed.count(b.id) == 0 && in_graze_band(d, p.hitbox, kGrazeRadius)) {
            p.grazed.insert(b.id);
            p.graze_count += 1;
            p.ability.add(kGrazeAbilityCharge);
            state_.stats.grazes += 1;
            award(ScoreKind::Graze, kGrazeScore, b.pos);
        }

        if (!bullet_hits_player(b, p)) continue;
        b.spent = true;
        if (p.phase_through) continue;

        const HitOutcome outcome = take_damage(p, b.damage);
        if (outcome != HitOutcome::Blocked) {
            events_.sounds.push_back({SoundCue::PlayerHit, 1.0f});
            events_.particles.push_back({p.pos, palette::kNeonBlue, 20, 1.0f});
        }
    }
    drop_spent_enemy_bullets();
}

void Simulator::end_run() {
    state_.play_state = PlayState::GameOver;
    events_.player_died = true;
    events_.particles.push_back({state_.player.pos, palette::kNeonBlue, 60, 2.0f});
}

RunRecord Simulator::run_summary() const {
    RunRecord run{};
    run.total_kills = state_.stats.kills;
    run.total_grazes = state_.stats.grazes;
    run.best_combo = state_.stats.best_combo;
    run.best_score = state_.score;
    run.best_stage = state_.progression.stage;
    run.total_runs = 1;
    return run;
}

float Simulator::compute_reward(const RuntimeStats& prev_stats, int64_t score_delta, float prev_damage_taken,
                                bool died) const {
    float reward = 0.01f;
    reward += static_cast<float>(score_delta) * 0.001f;
    reward += static_cast<float>(state_.stats.grazes - prev_stats.grazes) * 0.05f;
    reward -= (state_.player.damage_taken - prev_damage_taken) * 0.05f;
    if (died) reward -= kDeathPenalty;
    return reward;
}

StepResult Simulator::step(const FrameInput& input) {
    events_ = TickEvents{};
    const RuntimeStats prev_stats = state_.stats;
    const int64_t prev_score = state_.score;
    const float prev_damage_taken = state_.player.damage_taken;
    const bool was_over = state_.play_state == PlayState::GameOver;

    // A pause press only toggles; the world resumes on the following tick.
    const bool toggled = input.pause && !was_over;
    if (toggled) {
        state_.play_state = state_.play_state == PlayState::Paused ? PlayState::Playing : PlayState::Paused;
    }

    if (!toggled && state_.play_state == PlayState::Playing) {
        const float dt = std::max(0.0f, input.dt_ms);

        handle_activations(input);
        update_player(state_.player, input, dt);
        update_clones(dt);
        detect_tricks();

        if (input.fire) {
            auto shots = fire(state_.player);
            if (!shots.empty()) {
                events_.sounds.push_back({SoundCue::PlayerShoot, 1.0f});
                add_player_bullets(std::move(shots));
            }
        }

        update_player_bullets(dt);
        update_enemy_bullets(dt);
        update_powerups(dt);

        if (state_.boss.has_value()) {
            update_boss_encounter(dt);
        } else {
            update_waves(dt);
        }

        resolve_enemy_fire();

        if (!player_alive(state_.player)) end_run();

        state_.elapsed_ms += dt;
        state_.tick += 1;

#ifndef NDEBUG
        const Player& p = state_.player;
        assert(is_finite_vec(p.pos));
        assert(p.health >= 0.0f && p.health <= p.max_health);
        assert(meter_in_range(p.phase));
        assert(meter_in_range(p.ability));
        assert(meter_in_range(p.ultimate));
        assert(p.combo >= 0);
        assert(p.grazed.size() <= state_.enemy_bullets.size());
        for (const auto& e : state_.enemies) {
            assert(is_finite_vec(e.pos));
            assert(e.health > 0.0f);
        }
        for (const auto& b : state_.enemy_bullets) {
            assert(is_finite_vec(b.pos));
            assert(b.id != 0);
        }
        if (state_.boss.has_value()) {
            assert(state_.boss->health >= 0.0f);
            assert(state_.boss->phase >= 1 && state_.boss->phase <= state_.boss->max_phases);
        }
#endif
    }

    StepResult out{};
    out.observation = build_observation(state_);
    out.score_delta = state_.score - prev_score;
    out.reward = compute_reward(prev_stats, out.score_delta, prev_damage_taken, !was_over && run_over());
    out.terminated = state_.play_state == PlayState::GameOver;
    out.truncated = !out.terminated && state_.elapsed_ms >= kEpisodeLimitMs;
    out.events = events_;

    const auto& prog = state_.progression;
    out.info.kills = state_.stats.kills;
    out.info.grazes = state_.stats.grazes;
    out.info.best_combo = state_.stats.best_combo;
    out.info.tricks = state_.stats.tricks;
    out.info.shots_fired = state_.player.shots_fired;
    out.info.damage_taken = state_.player.damage_taken;
    out.info.damage_dealt = state_.stats.damage_dealt;
    out.info.score = state_.score;
    out.info.stage = prog.stage;
    out.info.wave = prog.wave;
    out.info.scalars["time_alive_seconds"] = state_.elapsed_ms / 1000.0f;
    out.info.scalars["health"] = state_.player.health;
    out.info.scalars["combo"] = static_cast<float>(state_.player.combo);
    out.info.scalars["combo_multiplier"] = state_.player.combo_multiplier;
    out.info.scalars["phase_charge"] = state_.player.phase.value;
    out.info.scalars["ability_charge"] = state_.player.ability.value;
    out.info.scalars["ultimate_charge"] = state_.player.ultimate.value;
    out.info.scalars["enemies_alive"] = static_cast<float>(state_.enemies.size());
    out.info.scalars["enemy_bullets"] = static_cast<float>(state_.enemy_bullets.size());
    out.info.scalars["boss_health"] = state_.boss.has_value() ? state_.boss->health : 0.0f;
    out.info.scalars["bosses_defeated"] = static_cast<float>(state_.stats.bosses_defeated);
    return out;
}

} // namespace ps
