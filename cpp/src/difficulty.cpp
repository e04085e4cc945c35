#include "piestack/difficulty.hpp"

#include "piestack/config.hpp"

#include <algorithm>
#include <cmath>

namespace ps {

// Closed-form curves are evaluated in double and truncated, so integer
// results match the tuning tables exactly.

float scaling_base(Scaling category) {
    switch (category) {
    case Scaling::EnemySpeed: return 1.25f;
    case Scaling::EnemyHealth: return 1.25f;
    case Scaling::BulletSpeed: return 1.25f;
    case Scaling::SpawnRate: return 0.80f;
    case Scaling::BossHealth: return 1.30f;
    case Scaling::WaveScaling: return 1.25f;
    case Scaling::EnemyCount: return 1.35f;
    }
    return 1.0f;
}

float difficulty_exponent(int stage, int wave) {
    return static_cast<float>(stage - 1) + static_cast<float>(wave - 1) * kWaveDifficultyStep;
}

float scaling_factor(Scaling category, float exponent) {
    return static_cast<float>(std::pow(static_cast<double>(scaling_base(category)), static_cast<double>(exponent)));
}

float enemy_size_scale(int enemies_alive) {
    return static_cast<float>(std::max(0.4, 1.0 - static_cast<double>(enemies_alive) / 60.0));
}

float enemy_size(int enemies_alive) {
    const double scale = std::max(0.4, 1.0 - static_cast<double>(enemies_alive) / 60.0);
    const int size = static_cast<int>(static_cast<double>(kEnemyBaseSize) * scale);
    return static_cast<float>(std::max(static_cast<int>(kEnemyMinSize), size));
}

float enemy_bullet_damage(float exponent) {
    return kEnemyBaseBulletDamage *
           static_cast<float>(std::pow(static_cast<double>(kEnemyDamageGrowth), static_cast<double>(exponent)));
}

int spawn_cap(int stage, int wave) {
    const double growth = std::pow(1.35, stage - 1);
    const int cap = static_cast<int>(kEnemiesPerWave * growth) + (wave - 1) * 2;
    return std::min(cap, kMaxEnemiesOnScreen);
}

float stage_spawn_interval(int stage) {
    const int interval = static_cast<int>(kBaseSpawnIntervalMs * std::pow(0.8, stage - 1));
    return std::max(kMinSpawnIntervalMs, static_cast<float>(interval));
}

float wave_spawn_interval(int stage, int wave) {
    const double progress = static_cast<double>(wave - 1) / kWavesPerStage;
    const int interval = static_cast<int>(kBaseSpawnIntervalMs * std::pow(0.8, stage - 1) * (1.0 - progress * 0.4));
    return std::max(kMinSpawnIntervalMs, static_cast<float>(interval));
}

float boss_health(int stage) {
    return kBossBaseHealth * static_cast<float>(std::pow(1.30, stage - 1));
}

} // namespace ps
