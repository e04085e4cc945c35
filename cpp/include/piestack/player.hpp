#pragma once

#include "input.hpp"
#include "state.hpp"

#include <vector>

namespace ps {

struct WeaponProfile {
    WeaponStyle style;
    const char* name;
    float damage_factor;
    float cooldown_factor;
    BulletKind kind;
};

struct AbilityProfile {
    AbilityType type;
    const char* name;
    float duration_ms;
};

enum class HitOutcome : uint8_t {
    Blocked,
    ShieldAbsorbed,
    Damaged,
    Killed
};

const WeaponProfile& weapon_profile(WeaponStyle style);
const AbilityProfile& ability_profile(AbilityType type);
const char* ultimate_name(UltimateType type);

// Advances timers, meters and movement for one tick and records the new
// position for trick detection.
void update_player(Player& p, const FrameInput& in, float dt_ms);

// Emits one volley for the current weapon style, or nothing while cooling down.
std::vector<Bullet> fire(Player& p);

float ability_damage_multiplier(const Player& p);
float effective_damage(const Player& p);

HitOutcome take_damage(Player& p, float damage);
void heal(Player& p, float amount);
bool player_alive(const Player& p);

float combo_multiplier_for(int combo);
void increment_combo(Player& p);
void reset_combo(Player& p);

bool activate_ability(Player& p);

void cycle_weapon(Player& p);
void cycle_ultimate(Player& p);
void cycle_ability(Player& p);

// Boss arrival strips pickups: base damage and speeds, no shield, normal
// weapon and one power level lost.
void clear_powerups(Player& p);

} // namespace ps
