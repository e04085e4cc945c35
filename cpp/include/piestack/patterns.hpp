#pragma once

#include "rng.hpp"
#include "state.hpp"

#include <vector>

namespace ps {

Bullet make_bullet(Vec2 origin, float angle, float speed, Rgb color, float damage = kEnemyBaseBulletDamage,
                   bool homing = false);
Bullet make_player_bullet(Vec2 origin, float angle, float damage, BulletKind kind = BulletKind::Normal);

// Pattern generators. Each is a pure function of its arguments (random_burst
// additionally consumes the run stream) and returns bullets in a stable order.
std::vector<Bullet> circle_pattern(Vec2 origin, int count, float speed, Rgb color, float offset = 0.0f,
                                   float damage = kEnemyBaseBulletDamage);
std::vector<Bullet> spiral_pattern(Vec2 origin, int count, float speed, Rgb color, float rotation = 0.0f,
                                   float damage = kEnemyBaseBulletDamage);
std::vector<Bullet> aimed_spread(Vec2 origin, Vec2 target, int count, float spread, float speed, Rgb color,
                                 float damage = kEnemyBaseBulletDamage);
std::vector<Bullet> wave_pattern(Vec2 origin, float direction, int count, float speed, Rgb color,
                                 float damage = kEnemyBaseBulletDamage);
std::vector<Bullet> random_burst(Vec2 origin, int count, float min_speed, float max_speed, Rgb color,
                                 DeterministicRng& rng, float damage = kEnemyBaseBulletDamage);
std::vector<Bullet> homing_bullets(Vec2 origin, int count, float speed, Rgb color,
                                   float damage = kEnemyBaseBulletDamage);
std::vector<Bullet> cross_pattern(Vec2 origin, float speed, Rgb color, int thickness,
                                  float damage = kEnemyBaseBulletDamage);
std::vector<Bullet> double_spiral(Vec2 origin, int count, float speed, Rgb first, Rgb second,
                                  float rotation = 0.0f, float damage = kEnemyBaseBulletDamage);

void append(std::vector<Bullet>& out, std::vector<Bullet>&& more);

void steer_homing(Bullet& b, Vec2 target);
void update_bullet(Bullet& b, float dt_ms, const Vec2* target);
bool bullet_expired(const Bullet& b);

} // namespace ps
