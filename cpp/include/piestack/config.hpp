#pragma once

#include <array>
#include <cstdint>

namespace ps {

// Positions and velocities are per tick; timers and lifetimes are milliseconds.
constexpr float kFixedDtMs = 1000.0f / 60.0f;

constexpr float kScreenWidth = 1200.0f;
constexpr float kScreenHeight = 1500.0f;
constexpr float kUiHeight = 100.0f;
constexpr float kGameAreaHeight = kScreenHeight - kUiHeight;
constexpr float kPlayableWidth = 915.0f;
constexpr float kPlayableHeight = 1320.0f;
constexpr float kOffscreenMargin = 50.0f;

constexpr float kPlayerSpawnX = kScreenWidth * 0.5f;
constexpr float kPlayerSpawnY = kGameAreaHeight - 100.0f;
constexpr float kPlayerSpeed = 5.0f;
constexpr float kPlayerSlowSpeed = 2.0f;
constexpr float kPlayerSprintFactor = 1.8f;
constexpr float kPlayerSize = 18.0f;
constexpr float kPlayerHitboxRadius = 6.0f;
constexpr float kPlayerMaxHealth = 50.0f;
constexpr float kPlayerShootCooldownMs = 100.0f;
constexpr float kPlayerBulletDamage = 10.0f;
constexpr float kPlayerBulletSpeed = 10.0f;
constexpr float kPlayerBulletSize = 6.0f;
constexpr float kPlayerInvincibilityMs = 500.0f;
constexpr int kPlayerMaxPowerLevel = 4;
constexpr float kPlayerMaxDamageMultiplier = 3.0f;

constexpr float kPhaseMax = 100.0f;
constexpr float kPhaseDepletePerSecond = 60.0f;
constexpr float kPhaseRegenPerSecond = 40.0f;
constexpr float kAbilityMax = 100.0f;
constexpr float kUltimateMax = 100.0f;

constexpr std::array<int, 5> kComboThresholds{0, 5, 15, 30, 50};
constexpr std::array<float, 5> kComboMultipliers{1.0f, 1.5f, 2.0f, 3.0f, 5.0f};

constexpr float kGrazeRadius = 25.0f;
constexpr int kGrazeScore = 5;
constexpr float kGrazeAbilityCharge = 2.0f;
constexpr float kKillAbilityCharge = 8.0f;
constexpr float kKillUltimateCharge = 2.0f;
constexpr float kBossHitUltimateCharge = 1.0f;
constexpr float kBossKillUltimateCharge = 5.0f;

constexpr float kEnemyBaseSpeed = 2.0f;
constexpr float kEnemyBaseSize = 30.0f;
constexpr float kEnemyMinSize = 12.0f;
constexpr float kEnemyBaseHealth = 50.0f;
constexpr float kEnemyBaseBulletDamage = 10.0f;
constexpr float kEnemyDamageGrowth = 1.2f;
constexpr float kEnemyEaseRate = 0.02f;
constexpr float kEnemyHitboxFactor = 0.7f;
constexpr int kEnemiesPerWave = 8;
constexpr int kMaxEnemiesOnScreen = 25;

constexpr float kBulletSpeed = 5.0f;
constexpr float kBulletSize = 8.0f;
constexpr float kBulletMaxLifetimeMs = 10000.0f;
constexpr float kHomingTurnRate = 0.02f;

constexpr float kBossSize = 80.0f;
constexpr float kBossBaseHealth = 3000.0f;
constexpr float kBossIntroMs = 2000.0f;
constexpr float kBossPhaseTransitionMs = 1000.0f;
constexpr float kBossPowerUpDropIntervalMs = 8000.0f;
constexpr int kBossDefaultPhases = 3;
constexpr float kBossBulletDamage = 10.0f;

constexpr float kPowerUpSize = 20.0f;
constexpr float kPowerUpFallSpeed = 2.0f;
constexpr float kPowerUpLifetimeMs = 10000.0f;
constexpr float kPowerUpDropChance = 0.65f;
constexpr float kPowerUpAbilityChance = 0.1f;

constexpr int kWavesPerStage = 5;
constexpr float kWaveDurationMs = 12000.0f;
constexpr float kBaseSpawnIntervalMs = 1500.0f;
constexpr float kMinSpawnIntervalMs = 300.0f;
constexpr float kWaveDifficultyStep = 0.3f;

constexpr int kScoreEnemyKill = 100;
constexpr int kScoreBossKill = 500;
constexpr int kScoreStageComplete = 10000;
constexpr int kScorePowerUpCollect = 50;
constexpr int kScoreTrick = 200;

constexpr float kCloneLifetimeMs = 8000.0f;
constexpr float kCloneFadeMs = 500.0f;
constexpr float kCloneShootCooldownMs = 100.0f;
constexpr float kCloneTrail = 0.95f;
constexpr int kCloneCount = 3;
constexpr float kUltimateVisualMs = 800.0f;
constexpr float kLaserGridDamage = 300.0f;
constexpr float kFullscreenLaserDamage = 2500.0f;

constexpr float kTrickWindowMs = 3000.0f;
constexpr int kTrickMinHistory = 20;

constexpr int kEnemyObsCount = 8;
constexpr int kBulletObsCount = 16;
constexpr float kEpisodeLimitMs = 10.0f * 60.0f * 1000.0f;

enum class RunMode {
    Rendered,
    Headless
};

enum class PlayState : uint8_t {
    Playing,
    Paused,
    GameOver
};

struct Rgb {
    uint8_t r = 255;
    uint8_t g = 255;
    uint8_t b = 255;
};

inline bool operator==(Rgb a, Rgb b) { return a.r == b.r && a.g == b.g && a.b == b.b; }

namespace palette {
constexpr Rgb kWhite{255, 255, 255};
constexpr Rgb kRed{255, 40, 40};
constexpr Rgb kGreen{0, 255, 150};
constexpr Rgb kBlue{0, 150, 255};
constexpr Rgb kYellow{255, 255, 0};
constexpr Rgb kPurple{180, 0, 255};
constexpr Rgb kCyan{0, 255, 255};
constexpr Rgb kOrange{255, 165, 0};
constexpr Rgb kPink{255, 105, 180};
constexpr Rgb kNeonBlue{0, 200, 255};
constexpr Rgb kNeonPink{255, 0, 200};
constexpr Rgb kIce{100, 200, 255};
constexpr Rgb kShadow{80, 0, 80};
constexpr Rgb kPrisma{200, 100, 255};
constexpr Rgb kChaos{150, 0, 0};
constexpr Rgb kAncient{255, 50, 150};
} // namespace palette

} // namespace ps
