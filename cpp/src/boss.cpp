#include "piestack/boss.hpp"

#include "piestack/difficulty.hpp"
#include "piestack/patterns.hpp"

#include <algorithm>
#include <cmath>

namespace ps {

namespace {

constexpr float kArenaCentreX = kPlayableWidth / 2.0f;
constexpr float kArenaPadding = 20.0f;
constexpr float kDashIntervalMs = 3000.0f;
constexpr float kDashMs = 300.0f;
constexpr float kTeleportIntervalMs = 4000.0f;
constexpr float kTeleportHiddenMs = 500.0f;
constexpr float kChaosRetargetMs = 2000.0f;

void ease_to(Boss& b, float k) {
    b.pos.x += (b.target.x - b.pos.x) * k;
    b.pos.y += (b.target.y - b.pos.y) * k;
}

void keep_in_arena(Boss& b) {
    const float margin = b.size + kArenaPadding;
    b.pos.x = clamp(b.pos.x, margin, kPlayableWidth - margin);
    b.pos.y = clamp(b.pos.y, margin, kPlayableHeight - margin);
}

void move_sway(Boss& b, float, DeterministicRng&) {
    b.target = {kArenaCentreX + std::sin(b.movement_ms * 0.001f) * 150.0f, 150.0f};
    ease_to(b, 0.01f);
    keep_in_arena(b);
}

void move_inferno(Boss& b, float dt_ms, DeterministicRng& rng) {
    b.rotation += dt_ms * 0.001f;
    move_sway(b, dt_ms, rng);
}

void move_serpentine(Boss& b, float dt_ms, DeterministicRng&) {
    b.orbit += dt_ms * 0.002f;
    b.target = {kArenaCentreX + std::sin(b.orbit) * 200.0f, 180.0f + std::cos(b.orbit * 0.7f) * 30.0f};
    ease_to(b, 0.02f);
    keep_in_arena(b);
}

void move_orbital(Boss& b, float dt_ms, DeterministicRng&) {
    b.orbit += dt_ms * 0.0015f;
    b.target = {kArenaCentreX + std::cos(b.orbit) * 120.0f, 200.0f + std::sin(b.orbit) * 50.0f};
    ease_to(b, 0.015f);
    keep_in_arena(b);
}

void move_anchor(Boss& b, float dt_ms, DeterministicRng&) {
    b.rotation += dt_ms * 0.002f;
    b.target = {kArenaCentreX, 200.0f};
    ease_to(b, 0.01f);
    keep_in_arena(b);
}

void move_glide(Boss& b, float dt_ms, DeterministicRng&) {
    b.rotation += dt_ms * 0.0008f;
    b.target = {kArenaCentreX + std::sin(b.movement_ms * 0.0008f) * 100.0f, 200.0f};
    ease_to(b, 0.008f);
    keep_in_arena(b);
}

void move_dash(Boss& b, float dt_ms, DeterministicRng& rng) {
    b.maneuver_ms += dt_ms;
    if (b.maneuver_ms > kDashIntervalMs) {
        b.maneuver_ms = 0.0f;
        b.dash_ms = kDashMs;
        b.target.x = static_cast<float>(rng.uniform_int(100, static_cast<int>(kPlayableWidth) - 100));
    }
    if (b.dash_ms > 0.0f) {
        b.dash_ms -= dt_ms;
        b.pos.x += (b.target.x - b.pos.x) * 0.3f;
    } else {
        b.target.y = 200.0f;
        ease_to(b, 0.015f);
    }
    keep_in_arena(b);
}

void move_teleport(Boss& b, float dt_ms, DeterministicRng& rng) {
    b.maneuver_ms += dt_ms;
    if (b.maneuver_ms > kTeleportIntervalMs) {
        b.maneuver_ms = 0.0f;
        b.pos.x = static_cast<float>(rng.uniform_int(100, static_cast<int>(kPlayableWidth) - 100));
        b.pos.y = static_cast<float>(rng.uniform_int(100, 250));
        b.target = b.pos;
        b.visible = false;
    }
    keep_in_arena(b);
    if (b.maneuver_ms > kTeleportHiddenMs) b.visible = true;
}

void move_square(Boss& b, float dt_ms, DeterministicRng&) {
    b.rotation += dt_ms * 0.0012f;
    const float cycle = std::fmod(b.movement_ms * 0.0003f, 4.0f);
    const float left = 150.0f;
    const float right = kPlayableWidth - 150.0f;
    if (cycle < 1.0f) {
        b.target = {left, 180.0f};
    } else if (cycle < 2.0f) {
        b.target = {right, 180.0f};
    } else if (cycle < 3.0f) {
        b.target = {right, 280.0f};
    } else {
        b.target = {left, 280.0f};
    }
    ease_to(b, 0.015f);
    keep_in_arena(b);
}

void move_erratic(Boss& b, float dt_ms, DeterministicRng& rng) {
    if (std::fmod(b.movement_ms, kChaosRetargetMs) < dt_ms) {
        b.target.x = static_cast<float>(rng.uniform_int(80, static_cast<int>(kPlayableWidth) - 80));
        b.target.y = static_cast<float>(rng.uniform_int(150, 300));
    }
    ease_to(b, 0.025f);
    keep_in_arena(b);
}

void move_lissajous(Boss& b, float dt_ms, DeterministicRng&) {
    b.rotation += dt_ms * 0.0015f;
    const float a1 = b.movement_ms * 0.001f;
    const float a2 = b.movement_ms * 0.0015f;
    b.target = {kArenaCentreX + std::cos(a1) * 150.0f + std::sin(a2) * 80.0f, 220.0f + std::sin(a1) * 40.0f};
    ease_to(b, 0.015f);
    keep_in_arena(b);
}

// Shorthands used by the attack tables below.
float spd(const Boss& b, float f = 1.0f) { return b.bullet_speed * f; }
int ph(const Boss& b) { return b.phase; }

std::vector<Bullet> cardinal_fans(const Boss& b, const float (&angles)[4], int per_arm, float centre, float step,
                                  float speed, Rgb color) {
    std::vector<Bullet> out;
    for (const float angle : angles) {
        for (int i = 0; i < per_arm; ++i) {
            const float offset = (static_cast<float>(i) - centre) * step;
            out.push_back(make_bullet(b.pos, angle + offset, speed, color, b.bullet_damage));
        }
    }
    return out;
}

constexpr float kCardinals[4] = {0.0f, kPi / 2.0f, kPi, -kPi / 2.0f};
constexpr float kDiagonals[4] = {kPi / 4.0f, 3.0f * kPi / 4.0f, 5.0f * kPi / 4.0f, 7.0f * kPi / 4.0f};

} // namespace

std::vector<BossProfile> build_boss_roster() {
    using V = std::vector<Bullet>;
    using R = DeterministicRng;
    return {
        {BossArchetype::InfernoOven, "Inferno Oven", palette::kRed, 1500.0f, 3, 1.0f, false, &move_inferno,
         {
             [](const Boss& b, Vec2, R&) {
                 return circle_pattern(b.pos, 16 + ph(b) * 4, spd(b), palette::kRed, b.rotation, b.bullet_damage);
             },
             [](const Boss& b, Vec2, R&) {
                 V out = circle_pattern(b.pos, 12, spd(b), palette::kRed, 0.0f, b.bullet_damage);
                 append(out, circle_pattern(b.pos, 12, spd(b, 0.7f), palette::kOrange, kPi / 12.0f, b.bullet_damage));
                 return out;
             },
             [](const Boss& b, Vec2, R&) {
                 return spiral_pattern(b.pos, 20 + ph(b) * 5, spd(b), palette::kRed, b.rotation, b.bullet_damage);
             },
         }},
        {BossArchetype::PepperoniSerpent, "Pepperoni Serpent", palette::kPurple, 1350.0f, 3, 1.0f, false,
         &move_serpentine,
         {
             [](const Boss& b, Vec2 p, R&) {
                 return aimed_spread(b.pos, p, 5 + ph(b) * 2, 0.3f, spd(b), palette::kPurple, b.bullet_damage);
             },
             [](const Boss& b, Vec2 p, R&) {
                 return wave_pattern(b.pos, angle_to(b.pos, p), 10 + ph(b) * 2, spd(b), palette::kPink,
                                     b.bullet_damage);
             },
             [](const Boss& b, Vec2, R&) {
                 return cross_pattern(b.pos, spd(b), palette::kPurple, 3 + ph(b), b.bullet_damage);
             },
         }},
        {BossArchetype::FrozenPizzaMaker, "Frozen Pizza Maker", palette::kCyan, 1650.0f, 3, 1.0f, false,
         &move_orbital,
         {
             [](const Boss& b, Vec2, R&) {
                 return homing_bullets(b.pos, 4 + ph(b), spd(b, 0.7f), palette::kGreen, b.bullet_damage);
             },
             [](const Boss& b, Vec2, R& rng) {
                 return random_burst(b.pos, 15 + ph(b) * 5, spd(b, 0.5f), spd(b, 1.5f), palette::kCyan, rng,
                                     b.bullet_damage);
             },
             [](const Boss& b, Vec2, R&) {
                 V out = circle_pattern(b.pos, 12, spd(b), palette::kCyan, 0.0f, b.bullet_damage);
                 append(out, homing_bullets(b.pos, 3, spd(b, 0.6f), palette::kGreen, b.bullet_damage));
                 return out;
             },
         }},
        {BossArchetype::MegaPizzaTitan, "Mega Pizza Titan", palette::kOrange, 1200.0f, 3, 1.0f, false,
         &move_anchor,
         {
             [](const Boss& b, Vec2, R&) {
                 return double_spiral(b.pos, 25 + ph(b) * 5, spd(b), palette::kOrange, palette::kRed, b.rotation,
                                      b.bullet_damage);
             },
             [](const Boss& b, Vec2, R&) {
                 return cross_pattern(b.pos, spd(b, 1.2f), palette::kOrange, 4 + ph(b), b.bullet_damage);
             },
             [](const Boss& b, Vec2 p, R&) {
                 V out = spiral_pattern(b.pos, 18 + ph(b) * 4, spd(b, 1.1f), palette::kRed, b.rotation,
                                        b.bullet_damage);
                 append(out, aimed_spread(b.pos, p, 3, 0.15f, spd(b, 1.3f), palette::kYellow, b.bullet_damage));
                 return out;
             },
         }},
        {BossArchetype::IcedPizzaQueen, "Iced Pizza Queen", palette::kIce, 1875.0f, 3, 1.0f, false, &move_glide,
         {
             [](const Boss& b, Vec2, R&) {
                 V out;
                 for (int i = 0; i < 3; ++i) {
                     const float fi = static_cast<float>(i);
                     append(out, circle_pattern(b.pos, 20, spd(b, 0.6f + fi * 0.2f), palette::kIce,
                                                b.rotation + fi * 0.2f, b.bullet_damage));
                 }
                 return out;
             },
             [](const Boss& b, Vec2, R&) {
                 V out;
                 for (int i = 0; i < 6; ++i) {
                     const float angle = static_cast<float>(i) * kPi / 3.0f + b.rotation;
                     for (int j = 0; j < 3; ++j) {
                         out.push_back(make_bullet(b.pos, angle + static_cast<float>(j) * 0.1f - 0.1f, spd(b, 0.8f),
                                                   palette::kIce, b.bullet_damage));
                     }
                 }
                 return out;
             },
         }},
        {BossArchetype::CrispyBakerMaster, "Crispy Baker Master", palette::kYellow, 900.0f, 3, 1.0f, false,
         &move_dash,
         {
             [](const Boss& b, Vec2 p, R&) {
                 V out;
                 for (int i = 0; i < 3; ++i) {
                     const float fi = static_cast<float>(i);
                     append(out, aimed_spread(b.pos, p, 3, 0.2f + fi * 0.1f, spd(b, 1.2f + fi * 0.1f),
                                              palette::kYellow, b.bullet_damage));
                 }
                 return out;
             },
             [](const Boss& b, Vec2, R& rng) {
                 return random_burst(b.pos, 20 + ph(b) * 5, spd(b, 0.8f), spd(b, 1.8f), palette::kYellow, rng,
                                     b.bullet_damage);
             },
             [](const Boss& b, Vec2, R&) {
                 V out;
                 for (const float angle : kCardinals) {
                     append(out, wave_pattern(b.pos, angle, 6, spd(b, 1.1f), palette::kYellow, b.bullet_damage));
                 }
                 return out;
             },
         }},
        {BossArchetype::ShadowPizzaChef, "Shadow Pizza Chef", palette::kShadow, 1500.0f, 3, 1.0f, false,
         &move_teleport,
         {
             [](const Boss& b, Vec2, R&) {
                 return spiral_pattern(b.pos, 20 + ph(b) * 4, spd(b), palette::kShadow, b.movement_ms * 0.001f,
                                       b.bullet_damage);
             },
             [](const Boss& b, Vec2, R&) {
                 return circle_pattern(b.pos, 24 + ph(b) * 4, spd(b, 1.1f), palette::kPurple, 0.0f, b.bullet_damage);
             },
             [](const Boss& b, Vec2 p, R&) {
                 V out = homing_bullets(b.pos, 5 + ph(b), spd(b, 0.7f), palette::kGreen, b.bullet_damage);
                 append(out, aimed_spread(b.pos, p, 5, 0.25f, spd(b), palette::kShadow, b.bullet_damage));
                 return out;
             },
         }},
        {BossArchetype::PrismaPizza, "Prisma Pizza", palette::kPrisma, 1425.0f, 3, 1.0f, false, &move_square,
         {
             [](const Boss& b, Vec2, R&) {
                 return cardinal_fans(b, kCardinals, 4 + ph(b), 2.0f, 0.1f, spd(b), palette::kPrisma);
             },
             [](const Boss& b, Vec2, R&) {
                 V out = cross_pattern(b.pos, spd(b), palette::kPrisma, 4 + ph(b), b.bullet_damage);
                 append(out, cardinal_fans(b, kDiagonals, 3, 1.0f, 0.08f, spd(b), palette::kPurple));
                 return out;
             },
             [](const Boss& b, Vec2, R&) {
                 V out = circle_pattern(b.pos, 6, spd(b, 1.2f), palette::kPrisma, b.rotation, b.bullet_damage);
                 append(out, circle_pattern(b.pos, 12, spd(b, 0.8f), palette::kPurple, -b.rotation, b.bullet_damage));
                 return out;
             },
         }},
        {BossArchetype::ChaosPizzaChef, "Chaos Pizza Chef", palette::kChaos, 1050.0f, 3, 1.0f, true,
         &move_erratic,
         {
             [](const Boss& b, Vec2, R& rng) {
                 return random_burst(b.pos, 25 + ph(b) * 5, spd(b, 0.5f), spd(b, 1.5f), palette::kChaos, rng,
                                     b.bullet_damage);
             },
             [](const Boss& b, Vec2, R& rng) {
                 const float rotation = rng.unit() * kTwoPi;
                 return spiral_pattern(b.pos, 22, spd(b), palette::kRed, rotation, b.bullet_damage);
             },
             [](const Boss& b, Vec2 p, R&) {
                 return aimed_spread(b.pos, p, 7 + ph(b), 0.4f, spd(b, 1.2f), palette::kOrange, b.bullet_damage);
             },
             [](const Boss& b, Vec2, R&) {
                 V out = circle_pattern(b.pos, 16, spd(b), palette::kChaos, 0.0f, b.bullet_damage);
                 append(out, homing_bullets(b.pos, 3, spd(b, 0.6f), palette::kGreen, b.bullet_damage));
                 return out;
             },
         }},
        {BossArchetype::AncientPizzaMaster, "Ancient Pizza Master", palette::kAncient, 1275.0f, 4, 1.5f, false,
         &move_lissajous,
         {
             [](const Boss& b, Vec2, R&) {
                 return double_spiral(b.pos, 30 + ph(b) * 5, spd(b), palette::kAncient, palette::kPurple, b.rotation,
                                      b.bullet_damage);
             },
             [](const Boss& b, Vec2, R&) {
                 V out = circle_pattern(b.pos, 24 + ph(b) * 4, spd(b), palette::kAncient, b.rotation,
                                        b.bullet_damage);
                 append(out, circle_pattern(b.pos, 16, spd(b, 0.6f), palette::kPink, -b.rotation * 1.5f,
                                            b.bullet_damage));
                 return out;
             },
             [](const Boss& b, Vec2 p, R&) {
                 V out;
                 for (int i = 0; i < 4 + ph(b); ++i) {
                     const float fi = static_cast<float>(i);
                     append(out, aimed_spread(b.pos, p, 3, 0.15f + fi * 0.05f, spd(b, 0.9f + fi * 0.1f),
                                              palette::kOrange, b.bullet_damage));
                 }
                 return out;
             },
             [](const Boss& b, Vec2, R&) {
                 V out = homing_bullets(b.pos, 6 + ph(b), spd(b, 0.7f), palette::kGreen, b.bullet_damage);
                 append(out, spiral_pattern(b.pos, 25, spd(b, 1.1f), palette::kAncient, b.rotation, b.bullet_damage));
                 return out;
             },
             [](const Boss& b, Vec2, R&) {
                 V out = circle_pattern(b.pos, 20, spd(b, 1.2f), palette::kRed, 0.0f, b.bullet_damage);
                 append(out, cross_pattern(b.pos, spd(b), palette::kYellow, 5, b.bullet_damage));
                 append(out, homing_bullets(b.pos, 4, spd(b, 0.6f), palette::kGreen, b.bullet_damage));
                 return out;
             },
         }},
    };
}

const BossProfile& boss_profile(BossArchetype archetype) {
    static const std::vector<BossProfile> roster = build_boss_roster();
    return roster[static_cast<size_t>(archetype)];
}

int boss_phase_for_health(float health, float max_health, int max_phases) {
    if (max_health <= 0.0f) return max_phases;
    const float pct = health / max_health;
    const int phase = max_phases - static_cast<int>(std::floor(pct * static_cast<float>(max_phases)));
    return std::clamp(phase, 1, max_phases);
}

Boss make_boss(BossArchetype archetype, int stage) {
    const BossProfile& profile = boss_profile(archetype);
    const float d = static_cast<float>(stage - 1);

    Boss b;
    b.archetype = archetype;
    b.pos = {kScreenWidth / 2.0f, kGameAreaHeight / 2.0f};
    b.target = b.pos;
    b.health = boss_health(stage) * profile.health_multiplier;
    b.max_health = b.health;
    b.bullet_speed = kBulletSpeed * scaling_factor(Scaling::BulletSpeed, d);
    b.attack_cd_ms = profile.attack_cd_ms;
    b.max_phases = profile.max_phases;
    return b;
}

Boss create_boss(int stage, DeterministicRng& rng) {
    const int count = static_cast<int>(BossArchetype::Count);
    return make_boss(static_cast<BossArchetype>(rng.uniform_int(0, count - 1)), stage);
}

std::vector<Bullet> update_boss(Boss& b, float dt_ms, Vec2 player, DeterministicRng& rng) {
    if (b.state == BossState::Dead) return {};

    if (b.state == BossState::Intro) {
        b.intro_ms -= dt_ms;
        if (b.intro_ms <= 0.0f) b.state = BossState::Active;
        return {};
    }

    b.attack_timer_ms += dt_ms;
    b.movement_ms += dt_ms;
    b.powerup_timer_ms += dt_ms;

    const int phase = boss_phase_for_health(b.health, b.max_health, b.max_phases);
    if (phase != b.phase) {
        b.phase = phase;
        b.transition_ms = kBossPhaseTransitionMs;
        b.attack_timer_ms = 0.0f;
        b.state = BossState::PhaseTransition;
    }
    if (b.transition_ms > 0.0f) {
        b.transition_ms -= dt_ms;
        if (b.transition_ms <= 0.0f) b.state = BossState::Active;
        return {};
    }

    const BossProfile& profile = boss_profile(b.archetype);
    profile.movement(b, dt_ms, rng);

    if (b.attack_timer_ms < b.attack_cd_ms) return {};

    const int count = static_cast<int>(profile.attacks.size());
    int index = b.attack_index;
    if (profile.random_attack) index = std::min(rng.uniform_int(0, 3 + b.phase), count - 1);

    std::vector<Bullet> out;
    if (b.visible) out = profile.attacks[static_cast<size_t>(index)](b, player, rng);
    b.attack_timer_ms = 0.0f;
    b.attack_index = (b.attack_index + 1) % count;
    return out;
}

bool damage_boss(Boss& b, float damage) {
    if (b.state == BossState::Dead) return false;
    b.health = std::max(0.0f, b.health - damage);
    if (b.health > 0.0f) return false;
    b.state = BossState::Dead;
    return true;
}

bool should_drop_powerup(Boss& b) {
    if (b.powerup_timer_ms < kBossPowerUpDropIntervalMs) return false;
    b.powerup_timer_ms = 0.0f;
    return true;
}

} // namespace ps
