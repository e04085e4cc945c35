#pragma once

#include "events.hpp"
#include "input.hpp"
#include "observation.hpp"
#include "rng.hpp"
#include "state.hpp"
#include "stats.hpp"

#include <cstdint>
#include <optional>
#include <vector>

namespace ps {

class Simulator {
  public:
    Simulator();
    explicit Simulator(uint64_t seed);

    std::vector<float> reset(uint64_t seed);
    StepResult step(const FrameInput& input);

    const GameState& state() const { return state_; }
    GameState& mutable_state() { return state_; }

    // Summary of the current run in the persistent record's shape.
    RunRecord run_summary() const;
    bool run_over() const { return state_.play_state == PlayState::GameOver; }

    // Ends the wave phase early. An unset archetype is drawn from the run stream.
    void spawn_boss(std::optional<BossArchetype> archetype = std::nullopt);
    // Applies damage to the live boss and resolves its death. Returns true on the kill.
    bool hit_boss(float damage);
    bool activate_ultimate();

    // Events of the tick in progress, or of the last tick once step returns.
    const TickEvents& events() const { return events_; }

    static constexpr int observation_dim() { return kObservationSize; }
    static constexpr int action_dim() { return 7; }

  private:
    GameState state_{};
    DeterministicRng rng_{0};
    TickEvents events_{};

    void add_player_bullets(std::vector<Bullet>&& bullets);
    void add_enemy_bullets(std::vector<Bullet>&& bullets);
    void drop_spent_enemy_bullets();
    void clear_enemy_bullets();

    void handle_activations(const FrameInput& input);
    void update_clones(float dt_ms);
    void detect_tricks();
    void update_player_bullets(float dt_ms);
    void update_enemy_bullets(float dt_ms);
    void update_powerups(float dt_ms);
    void update_boss_encounter(float dt_ms);
    void update_waves(float dt_ms);
    void resolve_player_fire_on_enemies();
    void resolve_enemy_fire();

    void roll_drop(Vec2 pos);
    void award(ScoreKind kind, int points, Vec2 pos);
    void kill_enemy(const Enemy& e);
    void defeat_boss();
    void start_new_stage();
    void end_run();

    std::optional<Vec2> nearest_target(Vec2 from) const;
    float compute_reward(const RuntimeStats& prev_stats, int64_t score_delta, float prev_damage_taken,
                         bool died) const;
};

} // namespace ps
