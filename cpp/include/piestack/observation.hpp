#pragma once

#include "state.hpp"

#include <vector>

namespace ps {

constexpr int kPlayerObsSize = 14;
constexpr int kProgressObsSize = 9;
constexpr int kEnemyObsStride = 4;
constexpr int kBulletObsStride = 5;
constexpr int kObservationSize =
    kPlayerObsSize + kProgressObsSize + kEnemyObsCount * kEnemyObsStride + kBulletObsCount * kBulletObsStride;

// Fixed-length snapshot of the state relative to the player. Enemies and
// enemy bullets are sorted nearest first and padded when fewer are alive.
std::vector<float> build_observation(const GameState& state);

} // namespace ps
