#pragma once

#include "config.hpp"
#include "geometry.hpp"

#include <cstdint>
#include <optional>
#include <vector>

namespace ps {

class DeterministicRng;
struct Player;

enum class PowerUpKind : uint8_t {
    Health,
    Damage,
    Speed,
    Shield,
    Power,
    Style,
    UltimateType,
    AbilityBerserker,
    AbilityGlassCannon,
    AbilityInvincible,
    Count
};

struct PowerUpDef {
    PowerUpKind kind;
    const char* name;
    Rgb color;
    bool ability_pick;
};

struct PowerUp {
    PowerUpKind kind = PowerUpKind::Health;
    Vec2 pos{};
    float size = kPowerUpSize;
    float lifetime_ms = kPowerUpLifetimeMs;
};

std::vector<PowerUpDef> build_powerup_catalog();
const PowerUpDef& powerup_def(PowerUpKind kind);

// Rolls the drop table at `pos`; most rolls yield nothing.
std::optional<PowerUp> roll_powerup(Vec2 pos, DeterministicRng& rng);

void update_powerup(PowerUp& p, float dt_ms);
bool powerup_expired(const PowerUp& p);
void apply_powerup(Player& player, PowerUpKind kind);

} // namespace ps
