#include "piestack/collision.hpp"

namespace ps {

namespace {

float sqr(float v) { return v * v; }

} // namespace

Rect centered_rect(Vec2 center, float half_extent) {
    return {center.x - half_extent, center.y - half_extent, half_extent * 2.0f, half_extent * 2.0f};
}

// Touching edges do not count as overlap.
bool rects_overlap(const Rect& a, const Rect& b) {
    return a.x < b.x + b.w && b.x < a.x + a.w && a.y < b.y + b.h && b.y < a.y + a.h;
}

bool circles_overlap(Vec2 a, float ra, Vec2 b, float rb) {
    return sqr(a.x - b.x) + sqr(a.y - b.y) <= sqr(ra + rb);
}

bool in_graze_band(float dist, float inner, float outer) { return dist > inner && dist < outer; }

Rect bullet_rect(const Bullet& b) { return centered_rect(b.pos, b.radius); }

Rect enemy_rect(const Enemy& e) { return centered_rect(e.pos, e.size * kEnemyHitboxFactor); }

Rect boss_rect(const Boss& b) { return centered_rect(b.pos, b.size * kEnemyHitboxFactor); }

Rect player_hitbox(const Player& p) { return centered_rect(p.pos, p.hitbox); }

Rect powerup_rect(const PowerUp& p) { return centered_rect(p.pos, p.size); }

bool bullet_hits_player(const Bullet& b, const Player& p) { return circles_overlap(b.pos, b.radius, p.pos, p.hitbox); }

} // namespace ps
