#pragma once

namespace ps {

constexpr float kPi = 3.14159265358979323846f;
constexpr float kTwoPi = 2.0f * kPi;

struct Vec2 {
    float x = 0.0f;
    float y = 0.0f;
};

float length(Vec2 v);
float distance(Vec2 a, Vec2 b);
float angle_to(Vec2 from, Vec2 to);
Vec2 normalize(Vec2 v);
Vec2 move_towards(Vec2 pos, Vec2 target, float speed);
Vec2 velocity_from(float angle, float speed);
float lerp(float a, float b, float t);
float clamp(float x, float lo, float hi);

// Signed shortest rotation from `from` to `to`, wrapped into (-pi, pi].
float angle_delta(float to, float from);

} // namespace ps
