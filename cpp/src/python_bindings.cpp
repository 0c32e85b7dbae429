#include "trailrun/config.hpp"
#include "trailrun/headless.hpp"
#include "trailrun/input.hpp"
#include "trailrun/walk.hpp"

#include <pybind11/pybind11.h>
#include <pybind11/stl.h>

#include <cstdint>
#include <memory>
#include <stdexcept>
#include <string>
#include <vector>

namespace py = pybind11;

namespace {

py::dict snapshot(const tr::Walk& walk) {
    const tr::CharacterContext& ctx = tr::context_of(walk.boy().machine());

    py::list obstacles;
    for (const auto& obstacle : walk.obstacles()) {
        obstacles.append(obstacle->right());
    }

    py::dict out;
    out["state"] = tr::to_string(walk.boy().state());
    out["x"] = ctx.position.x;
    out["y"] = ctx.position.y;
    out["velocity_x"] = ctx.velocity.x;
    out["velocity_y"] = ctx.velocity.y;
    out["frame"] = ctx.frame;
    out["obstacles"] = obstacles;
    out["timeline"] = walk.timeline();
    out["knocked_out"] = walk.knocked_out();
    return out;
}

class PySession {
  public:
    PySession(const std::string& assets, std::uint64_t seed)
        : audio_(std::make_shared<tr::SilentAudio>()), game_(tr::RunnerConfig{}, audio_, seed) {
        tr::HeadlessAssetLoader loader(assets);
        game_.initialize(loader);
    }

    py::dict step(const std::vector<std::string>& keys) {
        tr::KeyState state;
        for (const auto& key : keys) {
            state.set_pressed(key);
        }
        game_.update(state);
        ticks_ += 1;
        return observe();
    }

    py::dict observe() const {
        const tr::Walk* walk = game_.walk();
        if (walk == nullptr) {
            throw std::runtime_error("session is not loaded");
        }
        return snapshot(*walk);
    }

    std::uint64_t ticks() const { return ticks_; }
    std::size_t sounds_played() const { return audio_->played.size(); }

  private:
    std::shared_ptr<tr::SilentAudio> audio_;
    tr::WalkTheDog game_;
    std::uint64_t ticks_ = 0;
};

} // namespace

PYBIND11_MODULE(trailrun_core, m) {
    m.attr("FRAME_SIZE_MS") = tr::kFrameSizeMs;

    py::class_<PySession>(m, "Session")
        .def(py::init<const std::string&, std::uint64_t>(), py::arg("assets"), py::arg("seed") = 0)
        .def("step", &PySession::step, py::arg("keys") = std::vector<std::string>{})
        .def("observe", &PySession::observe)
        .def_property_readonly("ticks", &PySession::ticks)
        .def_property_readonly("sounds_played", &PySession::sounds_played);
}
