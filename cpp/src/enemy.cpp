#include "piestack/enemy.hpp"

#include "piestack/difficulty.hpp"
#include "piestack/patterns.hpp"

#include <algorithm>
#include <cmath>

namespace ps {

namespace {

constexpr float kSpawnMargin = 50.0f;
constexpr float kSpawnY = -50.0f;
constexpr float kSettleDistance = 2.0f;

const EnemyProfile kProfiles[] = {
    {EnemyKind::Basic, "basic", 1.0f, 2000.0f, 150.0f, 0.0f, palette::kRed},
    {EnemyKind::Circle, "circle", 1.5f, 3000.0f, 120.0f, 0.001f, palette::kPurple},
    {EnemyKind::Spiral, "spiral", 1.3f, 1500.0f, 180.0f, 0.002f, palette::kOrange},
    {EnemyKind::Homing, "homing", 0.8f, 3500.0f, 140.0f, 0.0f, palette::kGreen},
    {EnemyKind::Wave, "wave", 1.0f, 2500.0f, 160.0f, 0.0f, palette::kYellow},
};

void ease_axis(float& pos, float target) {
    if (std::abs(pos - target) > kSettleDistance) pos += (target - pos) * kEnemyEaseRate;
}

} // namespace

const EnemyProfile& enemy_profile(EnemyKind kind) { return kProfiles[static_cast<size_t>(kind)]; }

EnemyKind pick_enemy_kind(int stage, int wave, DeterministicRng& rng) {
    const double progress = stage + (wave - 1) * 0.3;
    const int basic = std::max(1, static_cast<int>(6.0 - progress));
    return static_cast<EnemyKind>(rng.weighted_index({basic, 1, 1, 1, 1}));
}

Enemy spawn_enemy(int stage, int wave, int enemies_alive, DeterministicRng& rng) {
    const EnemyKind kind = pick_enemy_kind(stage, wave, rng);
    const EnemyProfile& profile = enemy_profile(kind);
    const float d = difficulty_exponent(stage, wave);

    Enemy e;
    e.kind = kind;
    e.pos = {static_cast<float>(rng.uniform_int(static_cast<int>(kSpawnMargin),
                                                static_cast<int>(kPlayableWidth - kSpawnMargin))),
             kSpawnY};
    e.target = {e.pos.x, profile.hover_y};
    e.health = profile.health_factor * kEnemyBaseHealth * scaling_factor(Scaling::EnemyHealth, d);
    e.max_health = e.health;
    e.size = enemy_size(enemies_alive);
    e.speed = kEnemyBaseSpeed * scaling_factor(Scaling::EnemySpeed, d);
    e.bullet_speed = kBulletSpeed * scaling_factor(Scaling::BulletSpeed, d);
    e.bullet_damage = enemy_bullet_damage(d);
    e.shoot_cd_ms = profile.shoot_cd_ms;
    return e;
}

std::vector<Bullet> enemy_attack(const Enemy& e, Vec2 player) {
    const Rgb color = enemy_profile(e.kind).color;
    const float damage = std::floor(e.bullet_damage);
    switch (e.kind) {
    case EnemyKind::Basic:
        return aimed_spread(e.pos, player, 3, 0.2f, e.bullet_speed, color, damage);
    case EnemyKind::Circle:
        return circle_pattern(e.pos, 12, e.bullet_speed, color, e.rotation, damage);
    case EnemyKind::Spiral:
        return spiral_pattern(e.pos, 15, e.bullet_speed, color, e.rotation, damage);
    case EnemyKind::Homing:
        return homing_bullets(e.pos, 4, e.bullet_speed * 0.6f, color, damage);
    case EnemyKind::Wave:
        return wave_pattern(e.pos, angle_to(e.pos, player), 8, e.bullet_speed, color, damage);
    case EnemyKind::Count:
        break;
    }
    return {};
}

std::vector<Bullet> update_enemy(Enemy& e, float dt_ms, Vec2 player) {
    e.rotation += dt_ms * enemy_profile(e.kind).spin_rate;
    e.movement_ms += dt_ms;
    e.shoot_timer_ms += dt_ms;

    ease_axis(e.pos.x, e.target.x);
    ease_axis(e.pos.y, e.target.y);

    if (e.shoot_timer_ms < e.shoot_cd_ms) return {};
    e.shoot_timer_ms = 0.0f;
    return enemy_attack(e, player);
}

} // namespace ps
