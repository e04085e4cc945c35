#pragma once

#include "state.hpp"

namespace ps {

// Axis-aligned box given by its top-left corner and extent.
struct Rect {
    float x = 0.0f;
    float y = 0.0f;
    float w = 0.0f;
    float h = 0.0f;
};

Rect centered_rect(Vec2 center, float half_extent);
bool rects_overlap(const Rect& a, const Rect& b);

bool circles_overlap(Vec2 a, float ra, Vec2 b, float rb);
bool in_graze_band(float dist, float inner, float outer);

Rect bullet_rect(const Bullet& b);
Rect enemy_rect(const Enemy& e);
Rect boss_rect(const Boss& b);
Rect player_hitbox(const Player& p);
Rect powerup_rect(const PowerUp& p);

// Enemy bullet against the player's hit circle.
bool bullet_hits_player(const Bullet& b, const Player& p);

} // namespace ps
