#pragma once

#include "config.hpp"
#include "geometry.hpp"
#include "powerup.hpp"
#include "tricks.hpp"

#include <algorithm>
#include <cstdint>
#include <optional>
#include <unordered_set>
#include <vector>

namespace ps {

enum class BulletKind : uint8_t {
    Normal,
    Laser,
    Burst,
    Rapid,
    Homing
};

struct Bullet {
    uint64_t id = 0;
    Vec2 pos{};
    Vec2 vel{};
    float angle = 0.0f;
    float speed = kBulletSpeed;
    float radius = kBulletSize;
    float damage = kEnemyBaseBulletDamage;
    float lifetime_ms = 0.0f;
    float max_lifetime_ms = kBulletMaxLifetimeMs;
    bool homing = false;
    // Consumed by a hit this tick; filtered out at the end of its pass.
    bool spent = false;
    BulletKind kind = BulletKind::Normal;
    Rgb color = palette::kRed;
};

enum class WeaponStyle : uint8_t {
    Normal,
    Burst,
    Laser,
    Spread,
    Homing,
    Rapid,
    Count
};

enum class UltimateType : uint8_t {
    LaserGrid,
    Clone,
    FullscreenLaser,
    Count
};

enum class AbilityType : uint8_t {
    Berserker,
    GlassCannon,
    Invincible,
    Count
};

// Resource gauge kept inside [0, max] by every mutation.
struct Meter {
    float value = 0.0f;
    float max = 100.0f;

    void add(float amount) { value = std::clamp(value + amount, 0.0f, max); }
    void drain(float amount) { value = std::clamp(value - amount, 0.0f, max); }
    void empty() { value = 0.0f; }
    bool full() const { return value >= max; }
};

struct Player {
    Vec2 pos{kPlayerSpawnX, kPlayerSpawnY};
    float size = kPlayerSize;
    float hitbox = kPlayerHitboxRadius;
    float health = kPlayerMaxHealth;
    float max_health = kPlayerMaxHealth;
    float speed = kPlayerSpeed;
    float slow_speed = kPlayerSlowSpeed;
    float shoot_cd_ms = 0.0f;
    float invincible_ms = 0.0f;
    float damage_multiplier = 1.0f;
    int power_level = 1;
    bool shield = false;
    bool moving = false;
    WeaponStyle weapon = WeaponStyle::Normal;

    Meter phase{kPhaseMax, kPhaseMax};
    bool phase_through = false;

    Meter ability{0.0f, kAbilityMax};
    AbilityType ability_type = AbilityType::Berserker;
    bool ability_active = false;
    float ability_ms = 0.0f;

    Meter ultimate{0.0f, kUltimateMax};
    UltimateType ultimate_type = UltimateType::LaserGrid;
    float ultimate_visual_ms = 0.0f;

    int combo = 0;
    float combo_multiplier = kComboMultipliers[0];
    int graze_count = 0;
    std::unordered_set<uint64_t> grazed;

    int shots_fired = 0;
    float damage_taken = 0.0f;
    TrickDetector tricks;
};

enum class EnemyKind : uint8_t {
    Basic,
    Circle,
    Spiral,
    Homing,
    Wave,
    Count
};

struct Enemy {
    EnemyKind kind = EnemyKind::Basic;
    Vec2 pos{};
    Vec2 target{};
    float health = kEnemyBaseHealth;
    float max_health = kEnemyBaseHealth;
    float size = kEnemyBaseSize;
    float speed = kEnemyBaseSpeed;
    float bullet_speed = kBulletSpeed;
    float bullet_damage = kEnemyBaseBulletDamage;
    float shoot_cd_ms = 0.0f;
    float shoot_timer_ms = 0.0f;
    float movement_ms = 0.0f;
    float rotation = 0.0f;
};

enum class BossArchetype : uint8_t {
    InfernoOven,
    PepperoniSerpent,
    FrozenPizzaMaker,
    MegaPizzaTitan,
    IcedPizzaQueen,
    CrispyBakerMaster,
    ShadowPizzaChef,
    PrismaPizza,
    ChaosPizzaChef,
    AncientPizzaMaster,
    Count
};

enum class BossState : uint8_t {
    Intro,
    Active,
    PhaseTransition,
    Dead
};

struct Boss {
    BossArchetype archetype = BossArchetype::InfernoOven;
    BossState state = BossState::Intro;
    Vec2 pos{};
    Vec2 target{};
    float health = kBossBaseHealth;
    float max_health = kBossBaseHealth;
    float size = kBossSize;
    float bullet_speed = kBulletSpeed;
    float bullet_damage = kBossBulletDamage;
    int phase = 1;
    int max_phases = kBossDefaultPhases;
    float intro_ms = kBossIntroMs;
    float transition_ms = 0.0f;
    float attack_timer_ms = 0.0f;
    float attack_cd_ms = 1500.0f;
    int attack_index = 0;
    float powerup_timer_ms = 0.0f;
    float movement_ms = 0.0f;
    float rotation = 0.0f;
    // Archetype-specific movement scratch: dash/teleport clock, dash window,
    // serpentine or orbital angle.
    float maneuver_ms = 0.0f;
    float dash_ms = 0.0f;
    float orbit = 0.0f;
    bool visible = true;
};

struct Clone {
    Vec2 pos{};
    float elapsed_ms = 0.0f;
    float lifetime_ms = kCloneLifetimeMs;
    float shoot_timer_ms = 0.0f;
    uint8_t alpha = 180;
};

struct Progression {
    int stage = 1;
    int wave = 1;
    float wave_timer_ms = 0.0f;
    float spawn_timer_ms = 0.0f;
    float spawn_interval_ms = kBaseSpawnIntervalMs;
};

struct RuntimeStats {
    int kills = 0;
    int grazes = 0;
    int best_combo = 0;
    int tricks = 0;
    int bosses_defeated = 0;
    float damage_dealt = 0.0f;
};

struct GameState {
    uint64_t seed = 0;
    uint64_t tick = 0;
    float elapsed_ms = 0.0f;
    PlayState play_state = PlayState::Playing;
    int64_t score = 0;

    Progression progression{};
    Player player{};
    std::vector<Enemy> enemies;
    std::optional<Boss> boss;
    std::vector<Bullet> player_bullets;
    std::vector<Bullet> enemy_bullets;
    std::vector<PowerUp> powerups;
    std::vector<Clone> clones;

    uint64_t next_bullet_id = 1;
    RuntimeStats stats{};
};

} // namespace ps
