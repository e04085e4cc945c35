#pragma once

namespace ps {

enum class Scaling {
    EnemySpeed,
    EnemyHealth,
    BulletSpeed,
    SpawnRate,
    BossHealth,
    WaveScaling,
    EnemyCount
};

float scaling_base(Scaling category);

// Exponent applied to every scaling base: whole stages plus 0.3 per wave.
float difficulty_exponent(int stage, int wave);
float scaling_factor(Scaling category, float exponent);

float enemy_size_scale(int enemies_alive);
float enemy_size(int enemies_alive);
float enemy_bullet_damage(float exponent);

int spawn_cap(int stage, int wave);
float stage_spawn_interval(int stage);
float wave_spawn_interval(int stage, int wave);

float boss_health(int stage);

} // namespace ps
