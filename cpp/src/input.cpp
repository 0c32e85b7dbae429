#include "trailrun/input.hpp"

#include <iostream>
#include <utility>

namespace tr {

bool KeyEventQueue::push(KeyEvent event) {
    if (events_.size() >= capacity_) {
        dropped_ += 1;
        std::cerr << "Input queue full, dropping event for " << event.code << '\n';
        return false;
    }
    events_.push_back(std::move(event));
    return true;
}

bool KeyEventQueue::pop(KeyEvent& out) {
    if (events_.empty()) return false;
    out = std::move(events_.front());
    events_.pop_front();
    return true;
}

void process_input(KeyState& state, KeyEventQueue& events) {
    KeyEvent event;
    while (events.pop(event)) {
        if (event.action == KeyAction::Pressed) {
            state.set_pressed(event.code);
        } else {
            state.set_released(event.code);
        }
    }
}

} // namespace tr
