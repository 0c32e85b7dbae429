#include "trailrun/game.hpp"

namespace tr {

GameLoop::GameLoop(Game& game, KeyEventQueue& events, Renderer& renderer, double start_ms)
    : game_(game), events_(events), renderer_(renderer), last_frame_(start_ms) {}

int GameLoop::frame(double now_ms) {
    process_input(key_state_, events_);

    accumulated_delta_ += now_ms - last_frame_;
    int ran = 0;
    while (accumulated_delta_ > kFrameSizeMs) {
        game_.update(key_state_);
        accumulated_delta_ -= kFrameSizeMs;
        ran += 1;
    }
    steps_ += static_cast<uint64_t>(ran);
    last_frame_ = now_ms;

    game_.draw(renderer_);
    return ran;
}

} // namespace tr
