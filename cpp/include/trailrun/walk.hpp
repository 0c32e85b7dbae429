#pragma once

#include "character.hpp"
#include "config.hpp"
#include "game.hpp"
#include "image.hpp"
#include "segment.hpp"

#include <array>
#include <cstdint>
#include <memory>
#include <optional>

namespace tr {

class Walk {
  public:
    Walk(std::shared_ptr<const RunnerConfig> config,
         Runner boy,
         ImageHandle background,
         std::shared_ptr<const SpriteAtlas> obstacle_atlas,
         ImageHandle stone,
         uint64_t seed);

    void update(const KeyState& keys);
    void draw(Renderer& renderer) const;

    int velocity() const { return -boy_.walking_speed(); }
    void generate_next_segment();

    const Runner& boy() const { return boy_; }
    Runner& boy() { return boy_; }
    const ObstacleList& obstacles() const { return obstacles_; }
    ObstacleList& obstacles() { return obstacles_; }
    const std::array<Image, 2>& backgrounds() const { return backgrounds_; }
    int timeline() const { return timeline_; }
    bool knocked_out() const { return boy_.knocked_out(); }

  private:
    void scroll_backgrounds(int velocity);

    std::shared_ptr<const RunnerConfig> config_;
    Runner boy_;
    std::array<Image, 2> backgrounds_;
    std::shared_ptr<const SpriteAtlas> obstacle_atlas_;
    ImageHandle stone_;
    ObstacleList obstacles_;
    int timeline_ = 0;
    SegmentPicker picker_;
};

class WalkTheDog : public Game {
  public:
    explicit WalkTheDog(RunnerConfig config = {}, std::shared_ptr<Audio> audio = nullptr, uint64_t seed = 0);

    void initialize(AssetLoader& loader) override;
    void update(const KeyState& keys) override;
    void draw(Renderer& renderer) const override;

    bool loaded() const { return walk_.has_value(); }
    const Walk* walk() const { return walk_ ? &*walk_ : nullptr; }
    Walk* walk() { return walk_ ? &*walk_ : nullptr; }
    const RunnerConfig& config() const { return *config_; }

  private:
    std::shared_ptr<const RunnerConfig> config_;
    std::shared_ptr<Audio> audio_;
    uint64_t seed_;
    std::optional<Walk> walk_;
};

} // namespace tr
