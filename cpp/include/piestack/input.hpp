#pragma once

#include "config.hpp"

namespace ps {

// Per-tick input snapshot. Held controls are levels; ability, ultimate and
// pause are edge-triggered presses for this tick only.
struct FrameInput {
    float move_x = 0.0f;
    float move_y = 0.0f;
    bool fire = false;
    bool sprint = false;
    bool slow = false;
    bool ability = false;
    bool ultimate = false;
    bool pause = false;
    float dt_ms = kFixedDtMs;
};

} // namespace ps
