#include "piestack/powerup.hpp"

#include "piestack/player.hpp"
#include "piestack/rng.hpp"

#include <algorithm>
#include <array>

namespace ps {

std::vector<PowerUpDef> build_powerup_catalog() {
    return {
        {PowerUpKind::Health, "health", {255, 200, 80}, false},
        {PowerUpKind::Damage, "damage", {255, 50, 50}, false},
        {PowerUpKind::Speed, "speed", {255, 215, 0}, false},
        {PowerUpKind::Shield, "shield", {255, 200, 100}, false},
        {PowerUpKind::Power, "power", {255, 100, 50}, false},
        {PowerUpKind::Style, "style", {255, 140, 0}, false},
        {PowerUpKind::UltimateType, "ultimate_type", {255, 69, 0}, false},
        {PowerUpKind::AbilityBerserker, "ability_berserker", {255, 30, 30}, true},
        {PowerUpKind::AbilityGlassCannon, "ability_glass_cannon", {220, 180, 80}, true},
        {PowerUpKind::AbilityInvincible, "ability_invincible", {255, 165, 50}, true},
    };
}

const PowerUpDef& powerup_def(PowerUpKind kind) {
    static const std::vector<PowerUpDef> catalog = build_powerup_catalog();
    return catalog[static_cast<size_t>(kind)];
}

std::optional<PowerUp> roll_powerup(Vec2 pos, DeterministicRng& rng) {
    static constexpr std::array<PowerUpKind, 3> kAbilityPicks{
        PowerUpKind::AbilityBerserker, PowerUpKind::AbilityGlassCannon, PowerUpKind::AbilityInvincible};
    static constexpr std::array<PowerUpKind, 6> kCommon{
        PowerUpKind::Health, PowerUpKind::Damage, PowerUpKind::Power,
        PowerUpKind::Shield, PowerUpKind::Style, PowerUpKind::UltimateType};

    if (!rng.chance(kPowerUpDropChance)) return std::nullopt;

    PowerUp p;
    p.pos = pos;
    p.kind = rng.chance(kPowerUpAbilityChance) ? rng.choice(kAbilityPicks) : rng.choice(kCommon);
    return p;
}

void update_powerup(PowerUp& p, float dt_ms) {
    p.pos.y += kPowerUpFallSpeed;
    p.lifetime_ms -= dt_ms;
}

bool powerup_expired(const PowerUp& p) {
    return p.pos.y > kGameAreaHeight + kOffscreenMargin || p.lifetime_ms <= 0.0f;
}

void apply_powerup(Player& player, PowerUpKind kind) {
    switch (kind) {
    case PowerUpKind::Health:
        heal(player, 30.0f);
        break;
    case PowerUpKind::Damage:
        player.damage_multiplier = std::min(kPlayerMaxDamageMultiplier, player.damage_multiplier + 0.5f);
        break;
    case PowerUpKind::Speed:
        player.speed = std::min(kPlayerSpeed * 1.5f, player.speed + 1.0f);
        player.slow_speed = std::min(kPlayerSlowSpeed * 1.5f, player.slow_speed + 0.5f);
        break;
    case PowerUpKind::Shield:
        player.shield = true;
        break;
    case PowerUpKind::Power:
        player.power_level = std::min(kPlayerMaxPowerLevel, player.power_level + 1);
        break;
    case PowerUpKind::Style:
        cycle_weapon(player);
        break;
    case PowerUpKind::UltimateType:
        cycle_ultimate(player);
        break;
    case PowerUpKind::AbilityBerserker:
        player.ability_type = AbilityType::Berserker;
        break;
    case PowerUpKind::AbilityGlassCannon:
        player.ability_type = AbilityType::GlassCannon;
        break;
    case PowerUpKind::AbilityInvincible:
        player.ability_type = AbilityType::Invincible;
        break;
    case PowerUpKind::Count:
        break;
    }
}

} // namespace ps
