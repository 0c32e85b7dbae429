#include "trailrun/obstacle.hpp"

#include <utility>

namespace tr {

Platform::Platform(std::shared_ptr<const SpriteAtlas> atlas,
                   Point position,
                   const std::vector<std::string>& sprite_names,
                   const std::vector<Rect>& bounding_boxes)
    : atlas_(std::move(atlas)), position_(position) {
    sprites_.reserve(sprite_names.size());
    for (const auto& name : sprite_names) {
        sprites_.push_back(atlas_->cell(name));
    }

    bounding_boxes_.reserve(bounding_boxes.size());
    for (const auto& box : bounding_boxes) {
        bounding_boxes_.push_back({box.x + position.x, box.y + position.y, box.width, box.height});
    }
}

const Rect* Platform::intersects(const Rect& rect) const {
    for (const auto& box : bounding_boxes_) {
        if (box.intersects(rect)) return &box;
    }
    return nullptr;
}

void Platform::check_intersection(Runner& runner) const {
    const Rect* box_to_land_on = intersects(runner.bounding_box());
    if (box_to_land_on == nullptr) return;

    // Side-edge contact also lands.
    if (runner.velocity_y() > 0 && runner.pos_y() < position_.y) {
        runner.land_on(box_to_land_on->y);
    } else {
        runner.knock_out();
    }
}

void Platform::draw(Renderer& renderer) const {
    int x = 0;
    for (const auto& sprite : sprites_) {
        atlas_->draw(renderer,
                     sprite.frame,
                     {position_.x + x, position_.y, sprite.frame.width, sprite.frame.height});
        x += sprite.frame.width;
    }

    for (const auto& box : bounding_boxes_) {
        renderer.draw_bounding_box(box);
    }
}

void Platform::move_horizontally(int dx) {
    position_.x += dx;
    for (auto& box : bounding_boxes_) {
        box.set_x(box.x + dx);
    }
}

int Platform::right() const {
    if (bounding_boxes_.empty()) return 0;
    return bounding_boxes_.back().right();
}

Barrier::Barrier(Image image) : image_(std::move(image)) {}

void Barrier::check_intersection(Runner& runner) const {
    if (runner.bounding_box().intersects(image_.bounding_box())) {
        runner.knock_out();
    }
}

void Barrier::draw(Renderer& renderer) const {
    image_.draw(renderer);
    renderer.draw_bounding_box(image_.bounding_box());
}

void Barrier::move_horizontally(int dx) {
    image_.move_horizontally(dx);
}

int Barrier::right() const {
    return image_.right();
}

} // namespace tr
