#pragma once

#include "config.hpp"

#include <cstddef>
#include <cstdint>
#include <deque>
#include <string>
#include <unordered_set>

namespace tr {

enum class KeyAction : uint8_t {
    Pressed,
    Released
};

// `code` follows KeyboardEvent.code naming ("ArrowRight", "Space", ...).
struct KeyEvent {
    KeyAction action = KeyAction::Pressed;
    std::string code;
};

// Bounded; events past capacity are dropped. Not synchronized, push and pop
// from the loop thread only.
class KeyEventQueue {
  public:
    explicit KeyEventQueue(std::size_t capacity = kInputQueueCapacity) : capacity_(capacity) {}

    bool push(KeyEvent event);
    bool pop(KeyEvent& out);

    std::size_t size() const { return events_.size(); }
    std::size_t dropped() const { return dropped_; }

  private:
    std::size_t capacity_;
    std::size_t dropped_ = 0;
    std::deque<KeyEvent> events_;
};

class KeyState {
  public:
    bool is_pressed(const std::string& code) const { return pressed_keys_.count(code) > 0; }

    void set_pressed(const std::string& code) { pressed_keys_.insert(code); }
    void set_released(const std::string& code) { pressed_keys_.erase(code); }

    std::size_t held_count() const { return pressed_keys_.size(); }

  private:
    std::unordered_set<std::string> pressed_keys_;
};

void process_input(KeyState& state, KeyEventQueue& events);

} // namespace tr
