#pragma once

#include "geometry.hpp"
#include "platform.hpp"

#include <optional>
#include <string>
#include <string_view>
#include <unordered_map>
#include <utility>

namespace tr {

struct SpriteFrame {
    Rect frame{};
    std::optional<Rect> source_offset;

    Point offset() const {
        if (!source_offset.has_value()) return {0, 0};
        return source_offset->position();
    }
};

class SpriteSheet {
  public:
    SpriteSheet() = default;
    explicit SpriteSheet(std::unordered_map<std::string, SpriteFrame> frames) : frames_(std::move(frames)) {}

    void add(std::string name, SpriteFrame frame);

    const SpriteFrame* find(const std::string& name) const;

    const SpriteFrame& at(const std::string& name) const;

    std::size_t size() const { return frames_.size(); }

  private:
    std::unordered_map<std::string, SpriteFrame> frames_;
};

struct SpriteAtlas {
    SpriteSheet sheet;
    ImageHandle image{};

    const SpriteFrame& cell(const std::string& name) const { return sheet.at(name); }

    void draw(Renderer& renderer, const Rect& source, const Rect& destination) const {
        renderer.draw_image(image, source, destination);
    }
};

// TexturePacker JSON, hash or array layout.
SpriteSheet parse_sprite_sheet(std::string_view json);

} // namespace tr
