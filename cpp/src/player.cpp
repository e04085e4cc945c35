#include "piestack/player.hpp"

#include "piestack/patterns.hpp"

#include <algorithm>
#include <cmath>

namespace ps {

namespace {

constexpr float kDiagonalScale = 0.707f;
constexpr float kAimUp = kPi * 1.5f;
constexpr float kGlassCannonHealth = 20.0f;

struct Barrel {
    float dx;
    float dy;
    float angle;
    float damage_scale;
};

const WeaponProfile kWeapons[] = {
    {WeaponStyle::Normal, "normal", 1.0f, 1.0f, BulletKind::Normal},
    {WeaponStyle::Burst, "burst", 3.0f, 3.0f, BulletKind::Burst},
    {WeaponStyle::Laser, "laser", 1.5f, 0.5f, BulletKind::Laser},
    {WeaponStyle::Spread, "spread", 0.8f, 1.0f, BulletKind::Normal},
    {WeaponStyle::Homing, "homing", 1.2f, 1.5f, BulletKind::Homing},
    {WeaponStyle::Rapid, "rapid", 0.6f, 0.3f, BulletKind::Rapid},
};

const AbilityProfile kAbilities[] = {
    {AbilityType::Berserker, "berserker", 5000.0f},
    {AbilityType::GlassCannon, "glass_cannon", 8000.0f},
    {AbilityType::Invincible, "invincible", 10000.0f},
};

// Barrel offsets are relative to the ship centre; `s` is the ship size.
std::vector<Barrel> barrels(WeaponStyle style, int power, float s) {
    std::vector<Barrel> out;
    switch (style) {
    case WeaponStyle::Normal:
        if (power == 1) {
            out.push_back({0.0f, -s, 0.0f, 1.0f});
        } else if (power == 2) {
            out.push_back({-5.0f, -s, 0.0f, 1.0f});
            out.push_back({5.0f, -s, 0.0f, 1.0f});
        } else {
            out.push_back({0.0f, -s, 0.0f, 1.0f});
            out.push_back({-8.0f, -s, -0.1f, 1.0f});
            out.push_back({8.0f, -s, 0.1f, 1.0f});
        }
        if (power >= 4) {
            out.push_back({-15.0f, 0.0f, -0.2f, 0.7f});
            out.push_back({15.0f, 0.0f, 0.2f, 0.7f});
        }
        break;
    case WeaponStyle::Burst:
        out.push_back({0.0f, -s, 0.0f, 1.0f});
        if (power >= 2) {
            out.push_back({-10.0f, -s, -0.05f, 1.0f});
            out.push_back({10.0f, -s, 0.05f, 1.0f});
        }
        break;
    case WeaponStyle::Laser:
        for (int i = 0; i < 2 + power; ++i) out.push_back({0.0f, -s - static_cast<float>(i) * 2.0f, 0.0f, 1.0f});
        break;
    case WeaponStyle::Spread: {
        const int n = 5 + power;
        const float step = 0.6f / static_cast<float>(n);
        for (int i = 0; i < n; ++i) out.push_back({0.0f, -s, static_cast<float>(i - n / 2) * step, 1.0f});
        break;
    }
    case WeaponStyle::Homing:
        out.push_back({0.0f, -s, 0.0f, 1.0f});
        if (power >= 2) {
            out.push_back({-10.0f, 0.0f, -0.3f, 1.0f});
            out.push_back({10.0f, 0.0f, 0.3f, 1.0f});
        }
        if (power >= 4) {
            out.push_back({-5.0f, -5.0f, 0.0f, 1.0f});
            out.push_back({5.0f, -5.0f, 0.0f, 1.0f});
        }
        break;
    case WeaponStyle::Rapid:
        out.push_back({0.0f, -s, 0.0f, 1.0f});
        if (power >= 2) {
            out.push_back({-3.0f, -s, 0.0f, 1.0f});
            out.push_back({3.0f, -s, 0.0f, 1.0f});
        }
        if (power >= 3) {
            out.push_back({-6.0f, 0.0f, -0.05f, 1.0f});
            out.push_back({6.0f, 0.0f, 0.05f, 1.0f});
        }
        break;
    case WeaponStyle::Count:
        break;
    }
    return out;
}

float axis(float v) { return clamp(v, -1.0f, 1.0f); }

} // namespace

const WeaponProfile& weapon_profile(WeaponStyle style) { return kWeapons[static_cast<size_t>(style)]; }

const AbilityProfile& ability_profile(AbilityType type) { return kAbilities[static_cast<size_t>(type)]; }

const char* ultimate_name(UltimateType type) {
    switch (type) {
    case UltimateType::LaserGrid: return "laser_grid";
    case UltimateType::Clone: return "clone";
    case UltimateType::FullscreenLaser: return "fullscreen_laser";
    case UltimateType::Count: break;
    }
    return "ultimate";
}

void update_player(Player& p, const FrameInput& in, float dt_ms) {
    p.invincible_ms = std::max(0.0f, p.invincible_ms - dt_ms);
    p.shoot_cd_ms = std::max(0.0f, p.shoot_cd_ms - dt_ms);
    p.ultimate_visual_ms = std::max(0.0f, p.ultimate_visual_ms - dt_ms);

    if (p.ability_active) {
        p.ability_ms = std::max(0.0f, p.ability_ms - dt_ms);
        if (p.ability_ms <= 0.0f) p.ability_active = false;
    }

    const float seconds = dt_ms / 1000.0f;
    float speed = p.speed;
    if (in.slow) {
        speed = p.slow_speed;
        p.phase_through = false;
        p.phase.add(kPhaseRegenPerSecond * seconds);
    } else if (in.sprint && p.phase.value > 0.0f) {
        speed = kPlayerSpeed * kPlayerSprintFactor;
        p.phase_through = true;
        p.phase.drain(kPhaseDepletePerSecond * seconds);
    } else {
        p.phase_through = false;
        p.phase.add(kPhaseRegenPerSecond * seconds);
    }

    float dx = axis(in.move_x);
    float dy = axis(in.move_y);
    p.moving = dx != 0.0f || dy != 0.0f;
    if (dx != 0.0f && dy != 0.0f) {
        dx *= kDiagonalScale;
        dy *= kDiagonalScale;
    }
    p.pos.x = clamp(p.pos.x + dx * speed, p.size, kPlayableWidth - p.size);
    p.pos.y = clamp(p.pos.y + dy * speed, p.size, kPlayableHeight - p.size);

    p.tricks.tick_cooldown(dt_ms);
    p.tricks.record(p.pos, dt_ms);
}

std::vector<Bullet> fire(Player& p) {
    std::vector<Bullet> out;
    if (p.shoot_cd_ms > 0.0f) return out;

    const WeaponProfile& profile = weapon_profile(p.weapon);
    const float damage = effective_damage(p) * profile.damage_factor;
    for (const Barrel& b : barrels(p.weapon, p.power_level, p.size)) {
        out.push_back(make_player_bullet({p.pos.x + b.dx, p.pos.y + b.dy}, kAimUp + b.angle,
                                         damage * b.damage_scale, profile.kind));
    }

    p.shoot_cd_ms = kPlayerShootCooldownMs * profile.cooldown_factor;
    p.shots_fired += static_cast<int>(out.size());
    return out;
}

float ability_damage_multiplier(const Player& p) {
    if (!p.ability_active) return 1.0f;
    switch (p.ability_type) {
    case AbilityType::Berserker: {
        const float ratio = p.health / p.max_health;
        if (ratio < 0.3f) return 2.5f;
        if (ratio < 0.5f) return 2.0f;
        return 1.5f;
    }
    case AbilityType::GlassCannon: return 3.0f;
    case AbilityType::Invincible:
    case AbilityType::Count: break;
    }
    return 1.0f;
}

float effective_damage(const Player& p) {
    return kPlayerBulletDamage * p.damage_multiplier * ability_damage_multiplier(p);
}

HitOutcome take_damage(Player& p, float damage) {
    if (p.invincible_ms > 0.0f) return HitOutcome::Blocked;
    if (p.ability_active && p.ability_type == AbilityType::Invincible) return HitOutcome::Blocked;

    if (p.shield) {
        p.shield = false;
        reset_combo(p);
        return HitOutcome::ShieldAbsorbed;
    }

    p.health = std::max(0.0f, p.health - damage);
    p.damage_taken += damage;
    reset_combo(p);
    if (p.health <= 0.0f) return HitOutcome::Killed;

    p.invincible_ms = kPlayerInvincibilityMs;
    return HitOutcome::Damaged;
}

void heal(Player& p, float amount) { p.health = std::min(p.max_health, p.health + amount); }

bool player_alive(const Player& p) { return p.health > 0.0f; }

float combo_multiplier_for(int combo) {
    for (size_t i = kComboThresholds.size(); i-- > 0;) {
        if (combo >= kComboThresholds[i]) return kComboMultipliers[i];
    }
    return kComboMultipliers[0];
}

void increment_combo(Player& p) {
    ++p.combo;
    p.combo_multiplier = combo_multiplier_for(p.combo);
}

void reset_combo(Player& p) {
    p.combo = 0;
    p.combo_multiplier = combo_multiplier_for(0);
}

bool activate_ability(Player& p) {
    if (!p.ability.full() || p.ability_active) return false;
    p.ability.empty();
    p.ability_active = true;
    p.ability_ms = ability_profile(p.ability_type).duration_ms;
    if (p.ability_type == AbilityType::GlassCannon) p.health = std::min(p.max_health, kGlassCannonHealth);
    return true;
}

void cycle_weapon(Player& p) {
    const int n = static_cast<int>(WeaponStyle::Count);
    p.weapon = static_cast<WeaponStyle>((static_cast<int>(p.weapon) + 1) % n);
}

void cycle_ultimate(Player& p) {
    const int n = static_cast<int>(UltimateType::Count);
    p.ultimate_type = static_cast<UltimateType>((static_cast<int>(p.ultimate_type) + 1) % n);
}

void cycle_ability(Player& p) {
    const int n = static_cast<int>(AbilityType::Count);
    p.ability_type = static_cast<AbilityType>((static_cast<int>(p.ability_type) + 1) % n);
}

void clear_powerups(Player& p) {
    p.damage_multiplier = 1.0f;
    p.shield = false;
    p.speed = kPlayerSpeed;
    p.slow_speed = kPlayerSlowSpeed;
    p.weapon = WeaponStyle::Normal;
    p.power_level = std::max(1, p.power_level - 1);
}

} // namespace ps
