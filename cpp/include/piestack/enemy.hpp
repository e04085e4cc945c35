#pragma once

#include "rng.hpp"
#include "state.hpp"

#include <vector>

namespace ps {

struct EnemyProfile {
    EnemyKind kind;
    const char* name;
    float health_factor;
    float shoot_cd_ms;
    float hover_y;
    float spin_rate;
    Rgb color;
};

const EnemyProfile& enemy_profile(EnemyKind kind);

EnemyKind pick_enemy_kind(int stage, int wave, DeterministicRng& rng);

// Scales a freshly drawn archetype to the current stage and wave; crowded
// screens spawn smaller enemies.
Enemy spawn_enemy(int stage, int wave, int enemies_alive, DeterministicRng& rng);

std::vector<Bullet> enemy_attack(const Enemy& e, Vec2 player);
std::vector<Bullet> update_enemy(Enemy& e, float dt_ms, Vec2 player);

} // namespace ps
