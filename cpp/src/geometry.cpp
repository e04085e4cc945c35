#include "piestack/geometry.hpp"

#include <algorithm>
#include <cmath>

namespace ps {

float length(Vec2 v) { return std::sqrt(v.x * v.x + v.y * v.y); }

float distance(Vec2 a, Vec2 b) { return length({a.x - b.x, a.y - b.y}); }

float angle_to(Vec2 from, Vec2 to) { return std::atan2(to.y - from.y, to.x - from.x); }

Vec2 normalize(Vec2 v) {
    const float l = length(v);
    if (l <= 1e-6f) return {0.0f, 0.0f};
    return {v.x / l, v.y / l};
}

Vec2 move_towards(Vec2 pos, Vec2 target, float speed) {
    const float angle = angle_to(pos, target);
    return {pos.x + std::cos(angle) * speed, pos.y + std::sin(angle) * speed};
}

Vec2 velocity_from(float angle, float speed) {
    return {std::cos(angle) * speed, std::sin(angle) * speed};
}

float lerp(float a, float b, float t) { return a + (b - a) * t; }

float clamp(float x, float lo, float hi) {
    return std::max(lo, std::min(x, hi));
}

float angle_delta(float to, float from) {
    float diff = to - from;
    while (diff > kPi) diff -= kTwoPi;
    while (diff <= -kPi) diff += kTwoPi;
    return diff;
}

} // namespace ps
