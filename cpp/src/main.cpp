#include "piestack/boss.hpp"
#include "piestack/config.hpp"
#include "piestack/enemy.hpp"
#include "piestack/player.hpp"
#include "piestack/sim.hpp"
#include "piestack/stats.hpp"

#include <algorithm>
#include <cmath>
#include <cstdint>
#include <exception>
#include <iostream>
#include <limits>
#include <optional>
#include <stdexcept>
#include <string>

#ifdef PIESTACK_WITH_RAYLIB
#include <raylib.h>
#endif

namespace {

constexpr float kDodgeRadius = 60.0f;

struct CliOptions {
    ps::RunMode mode = ps::RunMode::Headless;
    std::uint64_t seed = 1337;
    int max_steps = 36000;
    std::optional<std::string> stats_path;
    bool verbose = false;
};

void print_usage() {
    std::cout << "Usage: piestack [--headless|--rendered] [--seed N] [--max-steps N] [--stats PATH] [--verbose]\n";
}

// Scripted input for headless runs: weaves across the lower field, always
// fires, slows down next to enemy bullets and spends charge as soon as it
// is full.
ps::FrameInput autopilot(const ps::GameState& state) {
    ps::FrameInput in{};
    const auto& p = state.player;
    const float t = static_cast<float>(state.tick);

    in.move_x = std::sin(t * 0.02f);
    in.move_y = std::cos(t * 0.011f) * 0.4f;
    in.fire = true;

    float nearest = std::numeric_limits<float>::max();
    for (const auto& b : state.enemy_bullets) {
        nearest = std::min(nearest, ps::distance(b.pos, p.pos));
    }
    in.slow = nearest < kDodgeRadius;
    in.sprint = !in.slow && nearest < kDodgeRadius * 1.5f && p.phase.value > 30.0f;

    in.ability = p.ability.full();
    in.ultimate = p.ultimate.full();
    return in;
}

void report_events(const ps::Simulator& sim, const ps::StepResult& res) {
    const auto& s = sim.state();
    for (const auto& trick : res.events.tricks) {
        std::cout << "tick=" << s.tick << " trick=" << ps::trick_name(trick.kind) << '\n';
    }
    if (res.events.boss_spawned.has_value()) {
        std::cout << "tick=" << s.tick << " boss=" << ps::boss_profile(*res.events.boss_spawned).name
                  << " stage=" << s.progression.stage << '\n';
    }
    if (res.events.stage_cleared) {
        std::cout << "tick=" << s.tick << " stage_cleared next_stage=" << s.progression.stage << '\n';
    }
    if (res.events.ultimate_activated) {
        std::cout << "tick=" << s.tick << " ultimate=" << ps::ultimate_name(s.player.ultimate_type) << '\n';
    }
}

void record_run(const ps::Simulator& sim, const std::string& path) {
    const ps::RunRecord totals = ps::merge_run(ps::load_run_record(path), sim.run_summary());
    if (!ps::save_run_record(path, totals)) {
        std::cerr << "Warning: could not write statistics to " << path << '\n';
        return;
    }
    std::cout << "stats runs=" << totals.total_runs << " best_score=" << totals.best_score
              << " best_stage=" << totals.best_stage << '\n';
}

#ifdef PIESTACK_WITH_RAYLIB
Color to_color(ps::Rgb c, unsigned char alpha = 255) {
    return Color{c.r, c.g, c.b, alpha};
}

ps::FrameInput keyboard_input() {
    ps::FrameInput in{};
    in.move_x = ((IsKeyDown(KEY_RIGHT) || IsKeyDown(KEY_D)) ? 1.0f : 0.0f) -
                ((IsKeyDown(KEY_LEFT) || IsKeyDown(KEY_A)) ? 1.0f : 0.0f);
    in.move_y = ((IsKeyDown(KEY_DOWN) || IsKeyDown(KEY_S)) ? 1.0f : 0.0f) -
                ((IsKeyDown(KEY_UP) || IsKeyDown(KEY_W)) ? 1.0f : 0.0f);
    in.fire = IsKeyDown(KEY_Z) || IsKeyDown(KEY_J);
    in.slow = IsKeyDown(KEY_LEFT_SHIFT);
    in.sprint = IsKeyDown(KEY_SPACE);
    in.ability = IsKeyPressed(KEY_C);
    in.ultimate = IsKeyPressed(KEY_X);
    in.pause = IsKeyPressed(KEY_P) || IsKeyPressed(KEY_ESCAPE);
    in.dt_ms = ps::kFixedDtMs;
    return in;
}

void draw_meter(int x, int y, const char* label, const ps::Meter& m, ps::Rgb color) {
    DrawText(label, x, y, 18, LIGHTGRAY);
    DrawRectangleLines(x + 90, y, 200, 18, GRAY);
    DrawRectangle(x + 90, y, static_cast<int>(200.0f * m.value / m.max), 18, to_color(color));
}

void draw_state(const ps::GameState& s) {
    DrawRectangleLinesEx({0.0f, 0.0f, ps::kPlayableWidth, ps::kPlayableHeight}, 2.0f, DARKGRAY);

    for (const auto& pu : s.powerups) {
        DrawRectangleV({pu.pos.x - pu.size, pu.pos.y - pu.size}, {pu.size * 2.0f, pu.size * 2.0f},
                       to_color(ps::powerup_def(pu.kind).color));
    }
    for (const auto& e : s.enemies) {
        DrawCircleV({e.pos.x, e.pos.y}, e.size, to_color(ps::enemy_profile(e.kind).color));
    }
    if (s.boss.has_value()) {
        const auto& b = *s.boss;
        const unsigned char alpha = b.visible ? 255 : 70;
        DrawCircleV({b.pos.x, b.pos.y}, b.size, to_color(ps::boss_profile(b.archetype).color, alpha));
        DrawRectangle(20, 20, static_cast<int>((ps::kPlayableWidth - 40.0f) * b.health / b.max_health), 12, RED);
        DrawText(TextFormat("%s  phase %d/%d", ps::boss_profile(b.archetype).name, b.phase, b.max_phases), 20, 36,
                 18, WHITE);
    }
    for (const auto& c : s.clones) {
        DrawCircleV({c.pos.x, c.pos.y}, ps::kPlayerSize, Color{0, 200, 255, c.alpha});
    }
    for (const auto& b : s.player_bullets) DrawCircleV({b.pos.x, b.pos.y}, b.radius, to_color(b.color));
    for (const auto& b : s.enemy_bullets) DrawCircleV({b.pos.x, b.pos.y}, b.radius, to_color(b.color));

    const auto& p = s.player;
    const unsigned char ship_alpha = (p.phase_through || p.invincible_ms > 0.0f) ? 120 : 255;
    DrawCircleV({p.pos.x, p.pos.y}, p.size, Color{0, 255, 150, ship_alpha});
    DrawCircleV({p.pos.x, p.pos.y}, p.hitbox, WHITE);
    if (p.shield) DrawCircleLines(static_cast<int>(p.pos.x), static_cast<int>(p.pos.y), p.size + 8.0f, SKYBLUE);
    if (p.ultimate_visual_ms > 0.0f) {
        DrawRectangle(0, 0, static_cast<int>(ps::kPlayableWidth), static_cast<int>(ps::kPlayableHeight),
                      Fade(WHITE, 0.25f * p.ultimate_visual_ms / ps::kUltimateVisualMs));
    }

    const int hud_x = static_cast<int>(ps::kPlayableWidth) + 20;
    DrawText(TextFormat("SCORE %lld", static_cast<long long>(s.score)), hud_x, 30, 24, WHITE);
    DrawText(TextFormat("STAGE %d  WAVE %d", s.progression.stage, s.progression.wave), hud_x, 64, 20, WHITE);
    DrawText(TextFormat("HP %.0f / %.0f", p.health, p.max_health), hud_x, 96, 20, WHITE);
    DrawText(TextFormat("COMBO %d  x%.1f", p.combo, p.combo_multiplier), hud_x, 124, 20, GOLD);
    DrawText(TextFormat("GRAZE %d", p.graze_count), hud_x, 152, 20, WHITE);
    DrawText(TextFormat("WEAPON %s  P%d", ps::weapon_profile(p.weapon).name, p.power_level), hud_x, 180, 18,
             LIGHTGRAY);
    draw_meter(hud_x - 10, 220, "PHASE", p.phase, ps::palette::kCyan);
    draw_meter(hud_x - 10, 250, "ABILITY", p.ability, ps::palette::kPurple);
    draw_meter(hud_x - 10, 280, "ULT", p.ultimate, ps::palette::kOrange);

    if (s.play_state == ps::PlayState::Paused) {
        DrawText("PAUSED", static_cast<int>(ps::kPlayableWidth / 2.0f) - 80, 600, 40, WHITE);
    }
    if (s.play_state == ps::PlayState::GameOver) {
        DrawText("GAME OVER", static_cast<int>(ps::kPlayableWidth / 2.0f) - 120, 600, 40, RED);
    }
}
#endif

} // namespace

int main(int argc, char** argv) {
    CliOptions opts;

    try {
        for (int i = 1; i < argc; ++i) {
            const std::string arg = argv[i];
#ifndef PIESTACK_WITH_RAYLIB
            if (arg == "--rendered") {
                std::cerr << "Rendered mode is unavailable: built without raylib.\n";
                return 2;
            }
#endif
            if (arg == "--headless") {
                opts.mode = ps::RunMode::Headless;
            } else if (arg == "--rendered") {
                opts.mode = ps::RunMode::Rendered;
            } else if (arg == "--seed" && i + 1 < argc) {
                opts.seed = std::stoull(argv[++i]);
            } else if (arg == "--max-steps" && i + 1 < argc) {
                opts.max_steps = std::stoi(argv[++i]);
            } else if (arg == "--stats" && i + 1 < argc) {
                opts.stats_path = std::string(argv[++i]);
            } else if (arg == "--verbose") {
                opts.verbose = true;
            } else if (arg == "--help" || arg == "-h") {
                print_usage();
                return 0;
            } else {
                throw std::invalid_argument("unknown or incomplete argument: " + arg);
            }
        }
        if (opts.max_steps < 1) {
            throw std::invalid_argument("--max-steps must be >= 1");
        }
    } catch (const std::exception& ex) {
        std::cerr << "Failed to parse CLI arguments: " << ex.what() << '\n';
        print_usage();
        return 2;
    }

    ps::Simulator sim(opts.seed);

#ifdef PIESTACK_WITH_RAYLIB
    if (opts.mode == ps::RunMode::Rendered) {
        InitWindow(static_cast<int>(ps::kScreenWidth), static_cast<int>(ps::kScreenHeight), "PIESTACK");
        SetExitKey(KEY_NULL);
        SetTargetFPS(60);

        while (!WindowShouldClose()) {
            const auto res = sim.step(keyboard_input());
            if (opts.verbose) report_events(sim, res);

            BeginDrawing();
            ClearBackground(BLACK);
            draw_state(sim.state());
            EndDrawing();

            if (sim.run_over() && IsKeyPressed(KEY_ENTER)) {
                break;
            }
        }

        CloseWindow();
        if (opts.stats_path.has_value()) record_run(sim, *opts.stats_path);
        return 0;
    }
#endif

    for (int i = 0; i < opts.max_steps; ++i) {
        const auto res = sim.step(autopilot(sim.state()));
        if (opts.verbose) report_events(sim, res);
        if (res.terminated || res.truncated) {
            break;
        }
    }

    const auto& end_state = sim.state();
    std::cout << "seed=" << opts.seed << " ticks=" << end_state.tick << " score=" << end_state.score
              << " stage=" << end_state.progression.stage << " wave=" << end_state.progression.wave
              << " kills=" << end_state.stats.kills << " grazes=" << end_state.stats.grazes
              << " dead=" << (sim.run_over() ? 1 : 0) << '\n';

    if (opts.stats_path.has_value()) record_run(sim, *opts.stats_path);
    return 0;
}
