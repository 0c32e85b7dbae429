#pragma once

#include "assets.hpp"
#include "config.hpp"
#include "input.hpp"
#include "platform.hpp"

#include <cstdint>

namespace tr {

class Game {
  public:
    virtual ~Game() = default;

    virtual void initialize(AssetLoader& loader) = 0;
    virtual void update(const KeyState& keys) = 0;
    virtual void draw(Renderer& renderer) const = 0;
};

class GameLoop {
  public:
    GameLoop(Game& game, KeyEventQueue& events, Renderer& renderer, double start_ms);

    int frame(double now_ms);

    const KeyState& key_state() const { return key_state_; }
    double accumulated_delta() const { return accumulated_delta_; }
    double last_frame() const { return last_frame_; }
    uint64_t steps() const { return steps_; }

  private:
    Game& game_;
    KeyEventQueue& events_;
    Renderer& renderer_;
    KeyState key_state_;
    double last_frame_;
    double accumulated_delta_ = 0.0;
    uint64_t steps_ = 0;
};

} // namespace tr
