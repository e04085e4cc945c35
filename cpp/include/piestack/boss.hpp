#pragma once

#include "rng.hpp"
#include "state.hpp"

#include <vector>

namespace ps {

using BossMovementFn = void (*)(Boss& b, float dt_ms, DeterministicRng& rng);
using BossAttackFn = std::vector<Bullet> (*)(const Boss& b, Vec2 player, DeterministicRng& rng);

// Everything that distinguishes one archetype from another. The state machine
// in update_boss only ever reads this record.
struct BossProfile {
    BossArchetype archetype;
    const char* name;
    Rgb color;
    float attack_cd_ms;
    int max_phases;
    float health_multiplier;
    // Draws the next attack from the run stream instead of cycling the table.
    bool random_attack;
    BossMovementFn movement;
    std::vector<BossAttackFn> attacks;
};

std::vector<BossProfile> build_boss_roster();
const BossProfile& boss_profile(BossArchetype archetype);

int boss_phase_for_health(float health, float max_health, int max_phases);

Boss make_boss(BossArchetype archetype, int stage);
Boss create_boss(int stage, DeterministicRng& rng);

std::vector<Bullet> update_boss(Boss& b, float dt_ms, Vec2 player, DeterministicRng& rng);

// Returns true when this hit kills the boss.
bool damage_boss(Boss& b, float damage);

bool should_drop_powerup(Boss& b);

} // namespace ps
