#pragma once

#include "platform.hpp"
#include "sprite_sheet.hpp"

#include <future>
#include <string>

namespace tr {

class AssetLoader {
  public:
    virtual ~AssetLoader() = default;

    virtual std::future<ImageHandle> load_image(const std::string& path) = 0;
    virtual std::future<SpriteSheet> load_sprite_sheet(const std::string& path) = 0;
    virtual std::future<SoundHandle> load_sound(const std::string& path) = 0;
};

} // namespace tr
