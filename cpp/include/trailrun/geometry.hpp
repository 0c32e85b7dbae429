#pragma once

namespace tr {

struct Point {
    int x = 0;
    int y = 0;
};

struct Rect {
    int x = 0;
    int y = 0;
    int width = 0;
    int height = 0;

    Point position() const { return {x, y}; }
    int right() const { return x + width; }
    int bottom() const { return y + height; }
    void set_x(int value) { x = value; }

    bool intersects(const Rect& other) const {
        return x < other.right() && right() > other.x && y < other.bottom() && bottom() > other.y;
    }
};

} // namespace tr
