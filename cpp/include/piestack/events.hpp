#pragma once

#include "state.hpp"
#include "tricks.hpp"

#include <cstdint>
#include <optional>
#include <string>
#include <unordered_map>
#include <vector>

namespace ps {

enum class SoundCue : uint8_t {
    EnemyHit,
    EnemyDeath,
    PlayerHit,
    PlayerShoot,
    BossHit,
    PowerUp
};

const char* sound_name(SoundCue cue);

struct SoundEvent {
    SoundCue cue = SoundCue::EnemyHit;
    float pitch = 1.0f;
};

enum class ScoreKind : uint8_t {
    Enemy,
    Boss,
    Stage,
    Graze,
    PowerUp,
    Trick,
    Ultimate
};

struct ScoreEvent {
    ScoreKind kind = ScoreKind::Enemy;
    int points = 0;
    Vec2 pos{};
};

struct ParticleRequest {
    Vec2 pos{};
    Rgb color{};
    int count = 0;
    float intensity = 1.0f;
};

struct TrickEvent {
    TrickKind kind = TrickKind::Loop;
    Vec2 pos{};
};

// Everything a presentation layer may react to after one tick. Consumers
// read these; none of them feed back into the simulation.
struct TickEvents {
    std::vector<SoundEvent> sounds;
    std::vector<ScoreEvent> scores;
    std::vector<ParticleRequest> particles;
    std::vector<TrickEvent> tricks;
    std::optional<BossArchetype> boss_spawned;
    bool boss_defeated = false;
    bool wave_advanced = false;
    bool stage_cleared = false;
    bool ability_activated = false;
    bool ultimate_activated = false;
    bool player_died = false;
};

struct StepInfo {
    int kills = 0;
    int grazes = 0;
    int best_combo = 0;
    int tricks = 0;
    int shots_fired = 0;
    float damage_taken = 0.0f;
    float damage_dealt = 0.0f;
    int64_t score = 0;
    int stage = 1;
    int wave = 1;
    std::unordered_map<std::string, float> scalars;
};

struct StepResult {
    std::vector<float> observation;
    float reward = 0.0f;
    int64_t score_delta = 0;
    bool terminated = false;
    bool truncated = false;
    TickEvents events;
    StepInfo info;
};

} // namespace ps
