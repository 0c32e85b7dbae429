#include "trailrun/walk.hpp"

#include <algorithm>
#include <exception>
#include <iterator>
#include <optional>
#include <stdexcept>
#include <string>
#include <utility>
#include <vector>

namespace tr {
namespace {

constexpr const char* kKeyRight = "ArrowRight";
constexpr const char* kKeyDown = "ArrowDown";
constexpr const char* kKeyJump = "Space";

template <typename T>
std::optional<T> await_asset(std::future<T>& pending, const std::string& path, std::vector<std::string>& failures) {
    try {
        return pending.get();
    } catch (const std::exception& ex) {
        failures.push_back(path + ": " + ex.what());
        return std::nullopt;
    }
}

} // namespace

Walk::Walk(std::shared_ptr<const RunnerConfig> config,
           Runner boy,
           ImageHandle background,
           std::shared_ptr<const SpriteAtlas> obstacle_atlas,
           ImageHandle stone,
           uint64_t seed)
    : config_(std::move(config)),
      boy_(std::move(boy)),
      backgrounds_{Image(background, {0, 0}), Image(background, {background.width, 0})},
      obstacle_atlas_(std::move(obstacle_atlas)),
      stone_(stone),
      picker_(seed) {
    obstacles_ = stone_and_platform(stone_, obstacle_atlas_, 0, config_->segments);
    timeline_ = rightmost(obstacles_);
}

void Walk::update(const KeyState& keys) {
    if (keys.is_pressed(kKeyDown)) {
        boy_.slide();
    }
    if (keys.is_pressed(kKeyRight)) {
        boy_.run_right();
    }
    if (keys.is_pressed(kKeyJump)) {
        boy_.jump();
    }

    boy_.update();

    const int velocity = this->velocity();
    scroll_backgrounds(velocity);

    for (auto& obstacle : obstacles_) {
        obstacle->move_horizontally(velocity);
        obstacle->check_intersection(boy_);
    }
    obstacles_.erase(std::remove_if(obstacles_.begin(),
                                    obstacles_.end(),
                                    [](const std::unique_ptr<Obstacle>& obstacle) { return obstacle->right() <= 0; }),
                     obstacles_.end());

    if (timeline_ < config_->segments.timeline_minimum) {
        generate_next_segment();
    } else {
        timeline_ += velocity;
    }
}

void Walk::scroll_backgrounds(int velocity) {
    auto& [first, second] = backgrounds_;
    first.move_horizontally(velocity);
    second.move_horizontally(velocity);

    if (first.right() < 0) {
        first.set_x(second.right());
    }
    if (second.right() < 0) {
        second.set_x(first.right());
    }
}

void Walk::generate_next_segment() {
    const int offset_x = timeline_ + config_->segments.obstacle_buffer;
    ObstacleList next = build_segment(picker_.next(), stone_, obstacle_atlas_, offset_x, config_->segments);

    timeline_ = rightmost(next);
    std::move(next.begin(), next.end(), std::back_inserter(obstacles_));
}

void Walk::draw(Renderer& renderer) const {
    renderer.clear({0, 0, config_->canvas_width, config_->canvas_height});
    for (const auto& background : backgrounds_) {
        background.draw(renderer);
    }
    boy_.draw(renderer);
    for (const auto& obstacle : obstacles_) {
        obstacle->draw(renderer);
    }
}

WalkTheDog::WalkTheDog(RunnerConfig config, std::shared_ptr<Audio> audio, uint64_t seed)
    : config_(std::make_shared<const RunnerConfig>(std::move(config))), audio_(std::move(audio)), seed_(seed) {}

void WalkTheDog::initialize(AssetLoader& loader) {
    if (walk_.has_value()) {
        throw std::runtime_error("game is already initialized");
    }

    const AssetManifest& assets = config_->assets;
    auto character_sheet = loader.load_sprite_sheet(assets.character_sheet);
    auto character_image = loader.load_image(assets.character_image);
    auto background = loader.load_image(assets.background_image);
    auto stone = loader.load_image(assets.stone_image);
    auto jump_sound = loader.load_sound(assets.jump_sound);
    auto tiles_sheet = loader.load_sprite_sheet(assets.tiles_sheet);
    auto tiles_image = loader.load_image(assets.tiles_image);

    std::vector<std::string> failures;
    auto character_sheet_v = await_asset(character_sheet, assets.character_sheet, failures);
    auto character_image_v = await_asset(character_image, assets.character_image, failures);
    auto background_v = await_asset(background, assets.background_image, failures);
    auto stone_v = await_asset(stone, assets.stone_image, failures);
    auto jump_sound_v = await_asset(jump_sound, assets.jump_sound, failures);
    auto tiles_sheet_v = await_asset(tiles_sheet, assets.tiles_sheet, failures);
    auto tiles_image_v = await_asset(tiles_image, assets.tiles_image, failures);

    if (!failures.empty()) {
        std::string message = "failed to load " + std::to_string(failures.size()) + " asset(s)";
        for (const auto& failure : failures) {
            message += "; " + failure;
        }
        throw std::runtime_error(message);
    }

    auto character_atlas =
        std::make_shared<const SpriteAtlas>(SpriteAtlas{std::move(*character_sheet_v), *character_image_v});
    auto obstacle_atlas = std::make_shared<const SpriteAtlas>(SpriteAtlas{std::move(*tiles_sheet_v), *tiles_image_v});

    Runner boy(std::move(character_atlas),
               std::shared_ptr<const CharacterTuning>(config_, &config_->character),
               audio_,
               *jump_sound_v);

    walk_.emplace(config_, std::move(boy), *background_v, std::move(obstacle_atlas), *stone_v, seed_);
}

void WalkTheDog::update(const KeyState& keys) {
    if (walk_.has_value()) {
        walk_->update(keys);
    }
}

void WalkTheDog::draw(Renderer& renderer) const {
    if (walk_.has_value()) {
        walk_->draw(renderer);
    }
}

} // namespace tr
