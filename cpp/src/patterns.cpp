#include "piestack/patterns.hpp"

#include <algorithm>
#include <cmath>
#include <iterator>

namespace ps {
namespace {

constexpr float kSpiralArmStep = kPi / 4.0f;
constexpr float kSpiralSpeedStep = 0.1f;
constexpr float kDoubleSpiralStep = 0.3f;
constexpr float kCrossJitter = 0.1f;

} // namespace

Bullet make_bullet(Vec2 origin, float angle, float speed, Rgb color, float damage, bool homing) {
    Bullet b{};
    b.pos = origin;
    b.angle = angle;
    b.speed = speed;
    b.vel = velocity_from(angle, speed);
    b.color = color;
    b.damage = damage;
    b.homing = homing;
    if (homing) b.kind = BulletKind::Homing;
    return b;
}

Bullet make_player_bullet(Vec2 origin, float angle, float damage, BulletKind kind) {
    Bullet b = make_bullet(origin, angle, kPlayerBulletSpeed, palette::kCyan, damage);
    b.radius = kPlayerBulletSize;
    b.kind = kind;
    switch (kind) {
    case BulletKind::Laser:
        b.radius = 60.0f;
        b.speed = kPlayerBulletSpeed * 2.0f;
        b.color = palette::kRed;
        break;
    case BulletKind::Burst:
        b.radius = 10.0f;
        b.color = palette::kOrange;
        break;
    case BulletKind::Rapid:
        b.radius = 4.0f;
        b.damage *= 0.5f;
        break;
    case BulletKind::Homing:
        b.homing = true;
        b.speed = kPlayerBulletSpeed * 0.8f;
        b.color = palette::kGreen;
        break;
    case BulletKind::Normal:
        break;
    }
    b.vel = velocity_from(b.angle, b.speed);
    return b;
}

std::vector<Bullet> circle_pattern(Vec2 origin, int count, float speed, Rgb color, float offset, float damage) {
    std::vector<Bullet> out;
    if (count <= 0) return out;
    out.reserve(static_cast<size_t>(count));
    const float step = kTwoPi / static_cast<float>(count);
    for (int i = 0; i < count; ++i) {
        out.push_back(make_bullet(origin, static_cast<float>(i) * step + offset, speed, color, damage));
    }
    return out;
}

std::vector<Bullet> spiral_pattern(Vec2 origin, int count, float speed, Rgb color, float rotation, float damage) {
    std::vector<Bullet> out;
    out.reserve(static_cast<size_t>(std::max(0, count)));
    for (int i = 0; i < count; ++i) {
        const float fi = static_cast<float>(i);
        out.push_back(make_bullet(origin, fi * kSpiralArmStep + rotation, speed + fi * kSpiralSpeedStep, color, damage));
    }
    return out;
}

std::vector<Bullet> aimed_spread(Vec2 origin, Vec2 target, int count, float spread, float speed, Rgb color,
                                 float damage) {
    std::vector<Bullet> out;
    out.reserve(static_cast<size_t>(std::max(0, count)));
    const float base = angle_to(origin, target);
    const float centre = static_cast<float>(count - 1) * 0.5f;
    for (int i = 0; i < count; ++i) {
        const float offset = (static_cast<float>(i) - centre) * spread;
        out.push_back(make_bullet(origin, base + offset, speed, color, damage));
    }
    return out;
}

std::vector<Bullet> wave_pattern(Vec2 origin, float direction, int count, float speed, Rgb color, float damage) {
    std::vector<Bullet> out;
    out.reserve(static_cast<size_t>(std::max(0, count)));
    for (int i = 0; i < count; ++i) {
        const float angle = direction + std::sin(static_cast<float>(i) * 0.5f) * 0.5f;
        out.push_back(make_bullet(origin, angle, speed, color, damage));
    }
    return out;
}

std::vector<Bullet> random_burst(Vec2 origin, int count, float min_speed, float max_speed, Rgb color,
                                 DeterministicRng& rng, float damage) {
    std::vector<Bullet> out;
    out.reserve(static_cast<size_t>(std::max(0, count)));
    for (int i = 0; i < count; ++i) {
        const float angle = rng.uniform(0.0f, kTwoPi);
        const float speed = rng.uniform(min_speed, max_speed);
        out.push_back(make_bullet(origin, angle, speed, color, damage));
    }
    return out;
}

std::vector<Bullet> homing_bullets(Vec2 origin, int count, float speed, Rgb color, float damage) {
    std::vector<Bullet> out;
    if (count <= 0) return out;
    out.reserve(static_cast<size_t>(count));
    const float step = kTwoPi / static_cast<float>(count);
    for (int i = 0; i < count; ++i) {
        out.push_back(make_bullet(origin, static_cast<float>(i) * step, speed, color, damage, true));
    }
    return out;
}

std::vector<Bullet> cross_pattern(Vec2 origin, float speed, Rgb color, int thickness, float damage) {
    static constexpr float kArms[] = {0.0f, kPi, kPi / 2.0f, -kPi / 2.0f};
    std::vector<Bullet> out;
    out.reserve(static_cast<size_t>(std::max(0, thickness)) * 4);
    for (int i = 0; i < thickness; ++i) {
        const float jitter = static_cast<float>(i - thickness / 2) * kCrossJitter;
        for (const float arm : kArms) out.push_back(make_bullet(origin, arm + jitter, speed, color, damage));
    }
    return out;
}

std::vector<Bullet> double_spiral(Vec2 origin, int count, float speed, Rgb first, Rgb second, float rotation,
                                  float damage) {
    std::vector<Bullet> out;
    out.reserve(static_cast<size_t>(std::max(0, count)) * 2);
    for (int i = 0; i < count; ++i) {
        const float a = static_cast<float>(i) * kDoubleSpiralStep + rotation;
        out.push_back(make_bullet(origin, a, speed, first, damage));
        out.push_back(make_bullet(origin, a + kPi, speed, second, damage));
    }
    return out;
}

void append(std::vector<Bullet>& out, std::vector<Bullet>&& more) {
    out.insert(out.end(), std::make_move_iterator(more.begin()), std::make_move_iterator(more.end()));
}

void steer_homing(Bullet& b, Vec2 target) {
    const float desired = angle_to(b.pos, target);
    b.angle += angle_delta(desired, b.angle) * kHomingTurnRate;
    b.vel = velocity_from(b.angle, b.speed);
}

void update_bullet(Bullet& b, float dt_ms, const Vec2* target) {
    b.lifetime_ms = std::min(b.max_lifetime_ms, b.lifetime_ms + dt_ms);
    if (b.homing && target != nullptr) steer_homing(b, *target);
    b.pos.x += b.vel.x;
    b.pos.y += b.vel.y;
}

bool bullet_expired(const Bullet& b) {
    return b.pos.x < -kOffscreenMargin || b.pos.x > kScreenWidth + kOffscreenMargin ||
           b.pos.y < -kOffscreenMargin || b.pos.y > kGameAreaHeight + kOffscreenMargin ||
           b.lifetime_ms >= b.max_lifetime_ms;
}

} // namespace ps
