#pragma once

#include "geometry.hpp"

#include <cstdint>

namespace tr {

struct ImageHandle {
    uint32_t id = 0;
    int width = 0;
    int height = 0;
};

struct SoundHandle {
    uint32_t id = 0;
};

class Renderer {
  public:
    virtual ~Renderer() = default;

    virtual void clear(const Rect& rect) = 0;
    virtual void draw_image(const ImageHandle& image, const Rect& frame, const Rect& destination) = 0;
    virtual void draw_entire_image(const ImageHandle& image, Point position) = 0;
    virtual void draw_bounding_box(const Rect& rect) = 0;
};

class Audio {
  public:
    virtual ~Audio() = default;

    virtual void play_sound(const SoundHandle& sound) = 0;
};

class Clock {
  public:
    virtual ~Clock() = default;

    virtual double now_ms() = 0;
};

} // namespace tr
