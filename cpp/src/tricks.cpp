#include "piestack/tricks.hpp"

#include "piestack/config.hpp"

#include <algorithm>
#include <cmath>
#include <numeric>

namespace ps {
namespace {

constexpr float kBorderTouchMargin = kPlayerSize + 5.0f;
constexpr float kWallProximity = 20.0f;
constexpr float kLoopMinRadius = 30.0f;
constexpr float kLoopMaxRadius = 150.0f;
constexpr float kLoopVarianceFactor = 0.3f;
constexpr float kBorderTraceCooldownMs = 5000.0f;
constexpr float kTrickCooldownMs = 3000.0f;

enum Border { kTop = 0, kBottom = 1, kLeft = 2, kRight = 3 };

Vec2 centroid(const std::vector<Vec2>& points) {
    Vec2 c{};
    for (const auto& p : points) {
        c.x += p.x;
        c.y += p.y;
    }
    const float n = static_cast<float>(points.size());
    return {c.x / n, c.y / n};
}

std::vector<float> radii_from_centroid(const std::vector<Vec2>& points) {
    const Vec2 c = centroid(points);
    std::vector<float> out;
    out.reserve(points.size());
    for (const auto& p : points) out.push_back(distance(p, c));
    return out;
}

float mean(const std::vector<float>& values, size_t first, size_t last) {
    if (last <= first) return 0.0f;
    const float sum = std::accumulate(values.begin() + static_cast<std::ptrdiff_t>(first),
                                      values.begin() + static_cast<std::ptrdiff_t>(last), 0.0f);
    return sum / static_cast<float>(last - first);
}

bool is_round(const std::vector<float>& radii) {
    const float avg = mean(radii, 0, radii.size());
    if (avg < kLoopMinRadius || avg > kLoopMaxRadius) return false;
    float variance = 0.0f;
    for (const float r : radii) variance += (r - avg) * (r - avg);
    variance /= static_cast<float>(radii.size());
    return variance < avg * kLoopVarianceFactor;
}

} // namespace

const char* trick_name(TrickKind kind) {
    switch (kind) {
    case TrickKind::BorderTrace: return "border_trace";
    case TrickKind::Loop: return "loop";
    case TrickKind::Helix: return "helix";
    case TrickKind::Spiral: return "spiral";
    case TrickKind::WallDancer: return "wall_dancer";
    case TrickKind::CounterLoop: return "counter_loop";
    }
    return "trick";
}

bool detect_loop(const std::vector<Vec2>& points) {
    if (points.size() < 20) return false;
    return is_round(radii_from_centroid(points));
}

bool detect_helix(const std::vector<Vec2>& points) {
    if (points.size() < 20) return false;
    int reversals = 0;
    for (size_t i = 2; i < points.size(); ++i) {
        const float dx1 = points[i - 1].x - points[i - 2].x;
        const float dx2 = points[i].x - points[i - 1].x;
        if ((dx1 > 0.0f && dx2 < 0.0f) || (dx1 < 0.0f && dx2 > 0.0f)) ++reversals;
    }
    return reversals >= 4;
}

bool detect_spiral(const std::vector<Vec2>& points) {
    if (points.size() < 30) return false;
    const auto radii = radii_from_centroid(points);
    const size_t half = radii.size() / 2;
    const float inner = mean(radii, 0, half);
    const float outer = mean(radii, half, radii.size());
    const float ratio = inner > 0.0f ? outer / inner : 1.0f;
    return ratio > 1.3f || ratio < 0.7f;
}

bool detect_wall_dancer(const std::vector<Vec2>& points) {
    if (points.size() < 15) return false;
    int touches = 0;
    for (size_t i = points.size() - 15; i < points.size(); ++i) {
        if (points[i].x < kWallProximity || points[i].x > kPlayableWidth - kWallProximity) ++touches;
    }
    return touches >= 4;
}

bool detect_counter_loop(const std::vector<Vec2>& points) {
    if (points.size() < 25) return false;
    if (!is_round(radii_from_centroid(points))) return false;

    int ccw = 0;
    for (size_t i = 1; i + 1 < points.size(); ++i) {
        const Vec2 a = points[i - 1];
        const Vec2 b = points[i];
        const Vec2 c = points[i + 1];
        const float cross = (b.x - a.x) * (c.y - b.y) - (b.y - a.y) * (c.x - b.x);
        if (cross > 0.0f) ++ccw;
    }
    return static_cast<float>(ccw) > static_cast<float>(points.size()) * 0.4f;
}

void TrickDetector::record(Vec2 pos, float dt_ms) {
    history_.push_back({pos, dt_ms});
    window_ms_ += dt_ms;
    while (window_ms_ > kTrickWindowMs && history_.size() > 10) {
        window_ms_ -= history_.front().dt_ms;
        history_.pop_front();
    }

    if (pos.x <= kBorderTouchMargin) borders_[kLeft] = true;
    if (pos.x >= kPlayableWidth - kBorderTouchMargin) borders_[kRight] = true;
    if (pos.y <= kBorderTouchMargin) borders_[kTop] = true;
    if (pos.y >= kPlayableHeight - kBorderTouchMargin) borders_[kBottom] = true;
}

void TrickDetector::tick_cooldown(float dt_ms) {
    cooldown_ms_ = std::max(0.0f, cooldown_ms_ - dt_ms);
}

bool TrickDetector::all_borders_touched() const {
    return borders_[kTop] && borders_[kBottom] && borders_[kLeft] && borders_[kRight];
}

std::vector<Vec2> TrickDetector::tail(size_t count) const {
    std::vector<Vec2> out;
    const size_t first = history_.size() > count ? history_.size() - count : 0;
    out.reserve(history_.size() - first);
    for (size_t i = first; i < history_.size(); ++i) out.push_back(history_[i].pos);
    return out;
}

std::optional<TrickKind> TrickDetector::detect() {
    if (cooldown_ms_ > 0.0f || history_.size() < static_cast<size_t>(kTrickMinHistory)) return std::nullopt;

    if (all_borders_touched()) {
        borders_ = {};
        cooldown_ms_ = kBorderTraceCooldownMs;
        return TrickKind::BorderTrace;
    }

    struct Probe {
        TrickKind kind;
        size_t window;
        bool (*test)(const std::vector<Vec2>&);
    };
    static constexpr Probe kProbes[] = {
        {TrickKind::Loop, 30, &detect_loop},
        {TrickKind::Helix, 25, &detect_helix},
        {TrickKind::Spiral, 35, &detect_spiral},
        {TrickKind::WallDancer, 20, &detect_wall_dancer},
        {TrickKind::CounterLoop, 30, &detect_counter_loop},
    };

    for (const auto& probe : kProbes) {
        if (history_.size() < probe.window) continue;
        if (probe.test(tail(probe.window))) {
            cooldown_ms_ = kTrickCooldownMs;
            return probe.kind;
        }
    }
    return std::nullopt;
}

void TrickDetector::reset() {
    history_.clear();
    window_ms_ = 0.0f;
    borders_ = {};
    cooldown_ms_ = 0.0f;
}

} // namespace ps
