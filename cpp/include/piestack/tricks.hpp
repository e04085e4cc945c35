#pragma once

#include "geometry.hpp"

#include <array>
#include <cstddef>
#include <cstdint>
#include <deque>
#include <optional>
#include <vector>

namespace ps {

enum class TrickKind : uint8_t {
    BorderTrace,
    Loop,
    Helix,
    Spiral,
    WallDancer,
    CounterLoop
};

const char* trick_name(TrickKind kind);

struct TrickSample {
    Vec2 pos{};
    float dt_ms = 0.0f;
};

bool detect_loop(const std::vector<Vec2>& points);
bool detect_helix(const std::vector<Vec2>& points);
bool detect_spiral(const std::vector<Vec2>& points);
bool detect_wall_dancer(const std::vector<Vec2>& points);
bool detect_counter_loop(const std::vector<Vec2>& points);

// Watches the trailing movement window of the player and names the first
// maneuver it recognises. A fired trick suppresses detection for its cooldown.
class TrickDetector {
  public:
    void record(Vec2 pos, float dt_ms);
    void tick_cooldown(float dt_ms);
    std::optional<TrickKind> detect();
    void reset();

    const std::deque<TrickSample>& history() const { return history_; }
    float window_ms() const { return window_ms_; }
    float cooldown_ms() const { return cooldown_ms_; }
    bool all_borders_touched() const;

  private:
    std::vector<Vec2> tail(size_t count) const;

    std::deque<TrickSample> history_;
    float window_ms_ = 0.0f;
    std::array<bool, 4> borders_{};
    float cooldown_ms_ = 0.0f;
};

} // namespace ps
