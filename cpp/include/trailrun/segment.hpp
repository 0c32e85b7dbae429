#pragma once

#include "config.hpp"
#include "obstacle.hpp"

#include <cstdint>
#include <memory>
#include <random>
#include <vector>

namespace tr {

using ObstacleList = std::vector<std::unique_ptr<Obstacle>>;

ObstacleList stone_and_platform(const ImageHandle& stone,
                                const std::shared_ptr<const SpriteAtlas>& atlas,
                                int offset_x,
                                const SegmentTuning& tuning);

ObstacleList platform_and_stone(const ImageHandle& stone,
                                const std::shared_ptr<const SpriteAtlas>& atlas,
                                int offset_x,
                                const SegmentTuning& tuning);

std::unique_ptr<Platform> create_floating_platform(const std::shared_ptr<const SpriteAtlas>& atlas,
                                                   Point position,
                                                   const SegmentTuning& tuning);

enum class SegmentLayout : uint8_t {
    StoneThenPlatform,
    PlatformThenStone
};

class SegmentPicker {
  public:
    explicit SegmentPicker(uint64_t seed) : engine_(seed) {}

    SegmentLayout next();

  private:
    std::mt19937_64 engine_;
    std::uniform_int_distribution<int> layouts_{0, 1};
};

ObstacleList build_segment(SegmentLayout layout,
                           const ImageHandle& stone,
                           const std::shared_ptr<const SpriteAtlas>& atlas,
                           int offset_x,
                           const SegmentTuning& tuning);

// Largest right() over the list, 0 when empty.
int rightmost(const ObstacleList& obstacles);

} // namespace tr
