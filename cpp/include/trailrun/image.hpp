#pragma once

#include "geometry.hpp"
#include "platform.hpp"

namespace tr {

class Image {
  public:
    Image(ImageHandle element, Point position);

    void draw(Renderer& renderer) const;
    void move_horizontally(int dx);
    void set_x(int x);

    const Rect& bounding_box() const { return bounding_box_; }
    int right() const { return bounding_box_.right(); }
    const ImageHandle& element() const { return element_; }

  private:
    ImageHandle element_;
    Point position_;
    Rect bounding_box_;
};

} // namespace tr
