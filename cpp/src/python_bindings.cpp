#include "piestack/config.hpp"
#include "piestack/sim.hpp"

#include <pybind11/numpy.h>
#include <pybind11/pybind11.h>
#include <pybind11/stl.h>

#include <algorithm>
#include <cmath>
#include <cstdint>
#include <cstring>
#include <vector>

namespace py = pybind11;

namespace {

py::array_t<float> as_numpy(const std::vector<float>& v) {
    py::array_t<float> arr(v.size());
    std::memcpy(arr.mutable_data(), v.data(), v.size() * sizeof(float));
    return arr;
}

ps::FrameInput input_from_array(const py::array_t<float, py::array::c_style | py::array::forcecast>& arr) {
    auto a = arr.unchecked<1>();
    ps::FrameInput out{};
    out.move_x = std::clamp(a(0), -1.0f, 1.0f);
    out.move_y = std::clamp(a(1), -1.0f, 1.0f);
    out.fire = a(2) >= 0.5f;
    out.sprint = a(3) >= 0.5f;
    out.slow = a(4) >= 0.5f;
    out.ability = a(5) >= 0.5f;
    out.ultimate = a(6) >= 0.5f;
    return out;
}

py::list sound_list(const ps::TickEvents& events) {
    py::list out;
    for (const auto& s : events.sounds) {
        out.append(py::make_tuple(ps::sound_name(s.cue), s.pitch));
    }
    return out;
}

py::list trick_list(const ps::TickEvents& events) {
    py::list out;
    for (const auto& t : events.tricks) {
        out.append(ps::trick_name(t.kind));
    }
    return out;
}

class PySimulator {
  public:
    PySimulator(std::uint64_t seed = 0, float episode_seconds = ps::kEpisodeLimitMs / 1000.0f)
        : episode_steps_(std::max(1, static_cast<int>(episode_seconds * 1000.0f / ps::kFixedDtMs))) {
        reset(seed);
    }

    py::array_t<float> reset(std::uint64_t seed) {
        steps_ = 0;
        return as_numpy(sim_.reset(seed));
    }

    py::tuple step(const py::array_t<float, py::array::c_style | py::array::forcecast>& action) {
        if (action.ndim() != 1 || action.shape(0) != ps::Simulator::action_dim()) {
            throw py::value_error("action must be a float32 array with shape (7,)");
        }
        auto out = sim_.step(input_from_array(action));
        steps_ += 1;

        out.truncated = out.truncated || (steps_ >= episode_steps_);

        py::dict info;
        info["score"] = out.info.score;
        info["score_delta"] = out.score_delta;
        info["stage"] = out.info.stage;
        info["wave"] = out.info.wave;
        info["kills"] = out.info.kills;
        info["grazes"] = out.info.grazes;
        info["best_combo"] = out.info.best_combo;
        info["tricks"] = out.info.tricks;
        info["shots_fired"] = out.info.shots_fired;
        info["damage_taken"] = out.info.damage_taken;
        info["damage_dealt"] = out.info.damage_dealt;
        info["is_paused"] = sim_.state().play_state == ps::PlayState::Paused;
        info["sounds"] = sound_list(out.events);
        info["trick_names"] = trick_list(out.events);
        info["boss_spawned"] = out.events.boss_spawned.has_value();
        info["boss_defeated"] = out.events.boss_defeated;
        info["stage_cleared"] = out.events.stage_cleared;

        for (const auto& [key, value] : out.info.scalars) {
            info[py::str(key)] = value;
        }

        auto obs = as_numpy(out.observation);
        auto obs_view = obs.mutable_unchecked<1>();
        for (py::ssize_t i = 0; i < obs_view.shape(0); ++i) {
            if (!std::isfinite(obs_view(i))) {
                obs_view(i) = 0.0f;
            }
        }

        float reward = out.reward;
        if (!std::isfinite(reward)) {
            reward = 0.0f;
        }

        return py::make_tuple(obs, reward, out.terminated, out.truncated, info);
    }

    py::dict run_summary() const {
        const ps::RunRecord run = sim_.run_summary();
        py::dict out;
        out["total_kills"] = run.total_kills;
        out["total_grazes"] = run.total_grazes;
        out["best_combo"] = run.best_combo;
        out["best_score"] = run.best_score;
        out["best_stage"] = run.best_stage;
        out["total_runs"] = run.total_runs;
        return out;
    }

    int obs_dim() const { return ps::Simulator::observation_dim(); }
    int action_dim() const { return ps::Simulator::action_dim(); }

    static py::array_t<float> action_low() {
        py::array_t<float> arr(7);
        auto a = arr.mutable_unchecked<1>();
        a(0) = -1.0f; // move_x
        a(1) = -1.0f; // move_y
        a(2) = 0.0f;  // fire
        a(3) = 0.0f;  // sprint
        a(4) = 0.0f;  // slow
        a(5) = 0.0f;  // ability
        a(6) = 0.0f;  // ultimate
        return arr;
    }

    static py::array_t<float> action_high() {
        py::array_t<float> arr(7);
        auto a = arr.mutable_unchecked<1>();
        for (py::ssize_t i = 0; i < 7; ++i) {
            a(i) = 1.0f;
        }
        return arr;
    }

  private:
    ps::Simulator sim_{};
    int steps_ = 0;
    int episode_steps_ = 1;
};

} // namespace

PYBIND11_MODULE(piestack_core, m) {
    py::class_<PySimulator>(m, "Simulator")
        .def(py::init<std::uint64_t, float>(), py::arg("seed") = 0, py::arg("episode_seconds") = 600.0f)
        .def("reset", &PySimulator::reset, py::arg("seed"))
        .def("step", &PySimulator::step, py::arg("action"))
        .def("run_summary", &PySimulator::run_summary)
        .def("obs_dim", &PySimulator::obs_dim)
        .def("action_dim", &PySimulator::action_dim)
        .def_static("action_low", &PySimulator::action_low)
        .def_static("action_high", &PySimulator::action_high);
}
