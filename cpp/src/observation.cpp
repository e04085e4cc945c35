#include "piestack/observation.hpp"

#include "piestack/config.hpp"

#include <algorithm>
#include <cmath>
#include <utility>

namespace ps {
namespace {

constexpr float kVelocityScale = 10.0f;
constexpr float kDistanceScale = 500.0f;

template <typename T>
std::vector<std::pair<float, const T*>> nearest_first(const std::vector<T>& items, Vec2 from) {
    std::vector<std::pair<float, const T*>> out;
    out.reserve(items.size());
    for (const auto& item : items) {
        const float dx = item.pos.x - from.x;
        const float dy = item.pos.y - from.y;
        out.push_back({dx * dx + dy * dy, &item});
    }
    std::stable_sort(out.begin(), out.end(), [](const auto& a, const auto& b) { return a.first < b.first; });
    return out;
}

float flag(bool v) { return v ? 1.0f : 0.0f; }

} // namespace

std::vector<float> build_observation(const GameState& state) {
    std::vector<float> obs;
    obs.reserve(kObservationSize);

    const auto& p = state.player;
    obs.push_back(p.pos.x / kPlayableWidth);
    obs.push_back(p.pos.y / kPlayableHeight);
    obs.push_back(p.health / std::max(1.0f, p.max_health));
    obs.push_back(p.phase.value / p.phase.max);
    obs.push_back(p.ability.value / p.ability.max);
    obs.push_back(p.ultimate.value / p.ultimate.max);
    obs.push_back(p.combo_multiplier / kComboMultipliers.back());
    obs.push_back(flag(p.invincible_ms > 0.0f));
    obs.push_back(flag(p.phase_through));
    obs.push_back(flag(p.shield));
    obs.push_back(flag(p.ability_active));
    obs.push_back(static_cast<float>(p.power_level) / kPlayerMaxPowerLevel);
    obs.push_back(p.damage_multiplier / kPlayerMaxDamageMultiplier);
    obs.push_back(static_cast<float>(p.weapon) / static_cast<float>(WeaponStyle::Count));

    const auto& prog = state.progression;
    obs.push_back(static_cast<float>(prog.stage) / 10.0f);
    obs.push_back(static_cast<float>(prog.wave) / kWavesPerStage);
    obs.push_back(prog.wave_timer_ms / kWaveDurationMs);
    if (state.boss.has_value()) {
        const Boss& b = *state.boss;
        obs.push_back(1.0f);
        obs.push_back(b.health / std::max(1.0f, b.max_health));
        obs.push_back(static_cast<float>(b.phase) / std::max(1, b.max_phases));
        obs.push_back((b.pos.x - p.pos.x) / kPlayableWidth);
        obs.push_back((b.pos.y - p.pos.y) / kPlayableHeight);
        obs.push_back(flag(b.state == BossState::Intro || b.state == BossState::PhaseTransition));
    } else {
        obs.insert(obs.end(), {0.0f, 0.0f, 0.0f, 0.0f, 0.0f, 0.0f});
    }

    const auto enemies = nearest_first(state.enemies, p.pos);
    for (int i = 0; i < kEnemyObsCount; ++i) {
        if (i < static_cast<int>(enemies.size())) {
            const Enemy& e = *enemies[static_cast<size_t>(i)].second;
            obs.push_back((e.pos.x - p.pos.x) / kPlayableWidth);
            obs.push_back((e.pos.y - p.pos.y) / kPlayableHeight);
            obs.push_back(std::sqrt(enemies[static_cast<size_t>(i)].first) / kDistanceScale);
            obs.push_back(e.health / std::max(1.0f, e.max_health));
        } else {
            obs.insert(obs.end(), {0.0f, 0.0f, 1.0f, 0.0f});
        }
    }

    const auto bullets = nearest_first(state.enemy_bullets, p.pos);
    for (int i = 0; i < kBulletObsCount; ++i) {
        if (i < static_cast<int>(bullets.size())) {
            const Bullet& b = *bullets[static_cast<size_t>(i)].second;
            obs.push_back((b.pos.x - p.pos.x) / kPlayableWidth);
            obs.push_back((b.pos.y - p.pos.y) / kPlayableHeight);
            obs.push_back(b.vel.x / kVelocityScale);
            obs.push_back(b.vel.y / kVelocityScale);
            obs.push_back(b.radius / kPlayerSize);
        } else {
            obs.insert(obs.end(), {0.0f, 0.0f, 0.0f, 0.0f, 0.0f});
        }
    }

    return obs;
}

} // namespace ps
