#include "trailrun/segment.hpp"

#include <algorithm>

namespace tr {

ObstacleList stone_and_platform(const ImageHandle& stone,
                                const std::shared_ptr<const SpriteAtlas>& atlas,
                                int offset_x,
                                const SegmentTuning& tuning) {
    ObstacleList out;
    out.push_back(std::make_unique<Barrier>(
        Image(stone, {offset_x + tuning.first_offset, tuning.stone_on_ground})));
    out.push_back(create_floating_platform(atlas, {offset_x + tuning.second_offset, tuning.low_platform}, tuning));
    return out;
}

ObstacleList platform_and_stone(const ImageHandle& stone,
                                const std::shared_ptr<const SpriteAtlas>& atlas,
                                int offset_x,
                                const SegmentTuning& tuning) {
    ObstacleList out;
    out.push_back(create_floating_platform(atlas, {offset_x + tuning.first_offset, tuning.high_platform}, tuning));
    out.push_back(std::make_unique<Barrier>(
        Image(stone, {offset_x + tuning.second_offset, tuning.stone_on_ground})));
    return out;
}

std::unique_ptr<Platform> create_floating_platform(const std::shared_ptr<const SpriteAtlas>& atlas,
                                                   Point position,
                                                   const SegmentTuning& tuning) {
    return std::make_unique<Platform>(
        atlas,
        position,
        std::vector<std::string>(tuning.platform_sprites.begin(), tuning.platform_sprites.end()),
        std::vector<Rect>(tuning.platform_boxes.begin(), tuning.platform_boxes.end()));
}

SegmentLayout SegmentPicker::next() {
    return layouts_(engine_) == 0 ? SegmentLayout::StoneThenPlatform : SegmentLayout::PlatformThenStone;
}

ObstacleList build_segment(SegmentLayout layout,
                           const ImageHandle& stone,
                           const std::shared_ptr<const SpriteAtlas>& atlas,
                           int offset_x,
                           const SegmentTuning& tuning) {
    switch (layout) {
        case SegmentLayout::StoneThenPlatform: return stone_and_platform(stone, atlas, offset_x, tuning);
        case SegmentLayout::PlatformThenStone: return platform_and_stone(stone, atlas, offset_x, tuning);
    }
    return {};
}

int rightmost(const ObstacleList& obstacles) {
    int best = 0;
    bool any = false;
    for (const auto& obstacle : obstacles) {
        best = any ? std::max(best, obstacle->right()) : obstacle->right();
        any = true;
    }
    return best;
}

} // namespace tr
