#pragma once

#include "character.hpp"
#include "geometry.hpp"
#include "image.hpp"
#include "platform.hpp"
#include "sprite_sheet.hpp"

#include <memory>
#include <string>
#include <vector>

namespace tr {

class Obstacle {
  public:
    virtual ~Obstacle() = default;

    virtual void check_intersection(Runner& runner) const = 0;
    virtual void draw(Renderer& renderer) const = 0;
    virtual void move_horizontally(int dx) = 0;
    virtual int right() const = 0;
};

class Platform : public Obstacle {
  public:
    Platform(std::shared_ptr<const SpriteAtlas> atlas,
             Point position,
             const std::vector<std::string>& sprite_names,
             const std::vector<Rect>& bounding_boxes);

    void check_intersection(Runner& runner) const override;
    void draw(Renderer& renderer) const override;
    void move_horizontally(int dx) override;
    int right() const override;

    Point position() const { return position_; }
    const std::vector<Rect>& bounding_boxes() const { return bounding_boxes_; }

  private:
    const Rect* intersects(const Rect& rect) const;

    std::shared_ptr<const SpriteAtlas> atlas_;
    Point position_;
    std::vector<Rect> bounding_boxes_;
    std::vector<SpriteFrame> sprites_;
};

class Barrier : public Obstacle {
  public:
    explicit Barrier(Image image);

    void check_intersection(Runner& runner) const override;
    void draw(Renderer& renderer) const override;
    void move_horizontally(int dx) override;
    int right() const override;

    const Rect& bounding_box() const { return image_.bounding_box(); }

  private:
    Image image_;
};

} // namespace tr
