#include "trailrun/image.hpp"

namespace tr {

Image::Image(ImageHandle element, Point position)
    : element_(element), position_(position), bounding_box_{position.x, position.y, element.width, element.height} {}

void Image::draw(Renderer& renderer) const {
    renderer.draw_entire_image(element_, position_);
}

void Image::move_horizontally(int dx) {
    set_x(position_.x + dx);
}

void Image::set_x(int x) {
    position_.x = x;
    bounding_box_.set_x(x);
}

} // namespace tr
