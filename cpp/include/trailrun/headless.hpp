#pragma once

#include "assets.hpp"
#include "platform.hpp"

#include <cstddef>
#include <cstdint>
#include <string>
#include <vector>

namespace tr {

struct PngSize {
    int width = 0;
    int height = 0;
};

PngSize read_png_size(const std::string& path);

class HeadlessAssetLoader : public AssetLoader {
  public:
    explicit HeadlessAssetLoader(std::string root);

    std::future<ImageHandle> load_image(const std::string& path) override;
    std::future<SpriteSheet> load_sprite_sheet(const std::string& path) override;
    std::future<SoundHandle> load_sound(const std::string& path) override;

  private:
    std::string resolve(const std::string& path) const;

    std::string root_;
    uint32_t next_id_ = 1;
};

class NullRenderer : public Renderer {
  public:
    void clear(const Rect&) override { clears += 1; }
    void draw_image(const ImageHandle&, const Rect&, const Rect&) override { images += 1; }
    void draw_entire_image(const ImageHandle&, Point) override { images += 1; }
    void draw_bounding_box(const Rect&) override { outlines += 1; }

    std::size_t clears = 0;
    std::size_t images = 0;
    std::size_t outlines = 0;
};

class SilentAudio : public Audio {
  public:
    void play_sound(const SoundHandle& sound) override { played.push_back(sound.id); }

    std::vector<uint32_t> played;
};

class SteppedClock : public Clock {
  public:
    SteppedClock(double start_ms, double interval_ms) : now_(start_ms), interval_(interval_ms) {}

    double now_ms() override {
        const double out = now_;
        now_ += interval_;
        return out;
    }

  private:
    double now_;
    double interval_;
};

} // namespace tr
