#include "trailrun/config.hpp"
#include "trailrun/game.hpp"
#include "trailrun/headless.hpp"
#include "trailrun/input.hpp"
#include "trailrun/walk.hpp"

#include <cstdint>
#include <exception>
#include <iostream>
#include <memory>
#include <stdexcept>
#include <string>

#ifdef TRAILRUN_WITH_RAYLIB
#include <raylib.h>

#include <array>
#include <future>
#include <utility>
#include <vector>
#endif

namespace {

constexpr int kScriptedJumpInterval = 90;

#ifdef TRAILRUN_WITH_RAYLIB

template <typename T, typename F>
std::future<T> resolve_now(F&& load) {
    std::promise<T> promise;
    try {
        promise.set_value(load());
    } catch (const std::exception&) {
        promise.set_exception(std::current_exception());
    }
    return promise.get_future();
}

// Loads on the GL thread; futures come back already resolved.
class RaylibAssetLoader : public tr::AssetLoader {
  public:
    explicit RaylibAssetLoader(std::string root) : root_(std::move(root)) {}

    RaylibAssetLoader(const RaylibAssetLoader&) = delete;
    RaylibAssetLoader& operator=(const RaylibAssetLoader&) = delete;

    ~RaylibAssetLoader() override {
        for (const auto& texture : textures_) UnloadTexture(texture);
        for (const auto& sound : sounds_) UnloadSound(sound);
    }

    std::future<tr::ImageHandle> load_image(const std::string& path) override {
        return resolve_now<tr::ImageHandle>([&]() {
            const std::string full = resolve(path);
            const Texture2D texture = LoadTexture(full.c_str());
            if (texture.id == 0) {
                throw std::runtime_error("unable to load image " + full);
            }
            textures_.push_back(texture);
            return tr::ImageHandle{static_cast<uint32_t>(textures_.size()), texture.width, texture.height};
        });
    }

    std::future<tr::SpriteSheet> load_sprite_sheet(const std::string& path) override {
        return resolve_now<tr::SpriteSheet>([&]() {
            const std::string full = resolve(path);
            char* text = LoadFileText(full.c_str());
            if (text == nullptr) {
                throw std::runtime_error("unable to open " + full);
            }
            const std::string json(text);
            UnloadFileText(text);
            return tr::parse_sprite_sheet(json);
        });
    }

    std::future<tr::SoundHandle> load_sound(const std::string& path) override {
        return resolve_now<tr::SoundHandle>([&]() {
            const std::string full = resolve(path);
            if (!FileExists(full.c_str())) {
                throw std::runtime_error("unable to open sound " + full);
            }
            if (!IsAudioDeviceReady()) {
                std::cerr << "Audio device unavailable; " << full << " will not play\n";
                return tr::SoundHandle{0};
            }
            sounds_.push_back(LoadSound(full.c_str()));
            return tr::SoundHandle{static_cast<uint32_t>(sounds_.size())};
        });
    }

    const Texture2D* texture(const tr::ImageHandle& image) const {
        if (image.id == 0 || image.id > textures_.size()) return nullptr;
        return &textures_[image.id - 1];
    }

    const Sound* sound(const tr::SoundHandle& clip) const {
        if (clip.id == 0 || clip.id > sounds_.size()) return nullptr;
        return &sounds_[clip.id - 1];
    }

  private:
    std::string resolve(const std::string& path) const { return root_.empty() ? path : root_ + "/" + path; }

    std::string root_;
    std::vector<Texture2D> textures_;
    std::vector<Sound> sounds_;
};

class RaylibRenderer : public tr::Renderer {
  public:
    RaylibRenderer(const RaylibAssetLoader& assets, bool show_boxes) : assets_(assets), show_boxes_(show_boxes) {}

    void clear(const tr::Rect& rect) override { DrawRectangle(rect.x, rect.y, rect.width, rect.height, BLACK); }

    void draw_image(const tr::ImageHandle& image, const tr::Rect& frame, const tr::Rect& destination) override {
        const Texture2D* texture = assets_.texture(image);
        if (texture == nullptr) {
            throw std::runtime_error("draw with unknown image handle " + std::to_string(image.id));
        }
        DrawTexturePro(*texture,
                       {static_cast<float>(frame.x),
                        static_cast<float>(frame.y),
                        static_cast<float>(frame.width),
                        static_cast<float>(frame.height)},
                       {static_cast<float>(destination.x),
                        static_cast<float>(destination.y),
                        static_cast<float>(destination.width),
                        static_cast<float>(destination.height)},
                       {0.0f, 0.0f},
                       0.0f,
                       WHITE);
    }

    void draw_entire_image(const tr::ImageHandle& image, tr::Point position) override {
        const Texture2D* texture = assets_.texture(image);
        if (texture == nullptr) {
            throw std::runtime_error("draw with unknown image handle " + std::to_string(image.id));
        }
        DrawTexture(*texture, position.x, position.y, WHITE);
    }

    void draw_bounding_box(const tr::Rect& rect) override {
        if (!show_boxes_) return;
        DrawRectangleLinesEx({static_cast<float>(rect.x),
                              static_cast<float>(rect.y),
                              static_cast<float>(rect.width),
                              static_cast<float>(rect.height)},
                             1.0f,
                             RED);
    }

  private:
    const RaylibAssetLoader& assets_;
    bool show_boxes_;
};

class RaylibAudio : public tr::Audio {
  public:
    explicit RaylibAudio(const RaylibAssetLoader& assets) : assets_(assets) {}

    void play_sound(const tr::SoundHandle& clip) override {
        if (!IsAudioDeviceReady()) {
            throw std::runtime_error("audio device not ready");
        }
        const Sound* sound = assets_.sound(clip);
        if (sound == nullptr) {
            throw std::runtime_error("unknown sound handle " + std::to_string(clip.id));
        }
        PlaySound(*sound);
    }

  private:
    const RaylibAssetLoader& assets_;
};

struct KeyBinding {
    int raylib_key;
    const char* code;
};

constexpr std::array<KeyBinding, 5> kKeyBindings{{
    {KEY_RIGHT, "ArrowRight"},
    {KEY_LEFT, "ArrowLeft"},
    {KEY_UP, "ArrowUp"},
    {KEY_DOWN, "ArrowDown"},
    {KEY_SPACE, "Space"},
}};

void poll_keys(tr::KeyEventQueue& events) {
    for (const auto& binding : kKeyBindings) {
        if (IsKeyPressed(binding.raylib_key)) {
            events.push({tr::KeyAction::Pressed, binding.code});
        }
        if (IsKeyReleased(binding.raylib_key)) {
            events.push({tr::KeyAction::Released, binding.code});
        }
    }
}

int run_rendered(const std::string& assets_dir, std::uint64_t seed, bool show_boxes) {
    const tr::RunnerConfig config{};
    InitWindow(config.canvas_width, config.canvas_height, "Trailrun");
    InitAudioDevice();
    SetTargetFPS(60);

    int status = 0;
    {
        RaylibAssetLoader loader(assets_dir);
        auto audio = std::make_shared<RaylibAudio>(loader);
        RaylibRenderer renderer(loader, show_boxes);
        tr::WalkTheDog game(config, audio, seed);
        tr::KeyEventQueue events;

        try {
            game.initialize(loader);
        } catch (const std::exception& ex) {
            std::cerr << "Failed to initialize session: " << ex.what() << '\n';
            status = 2;
        }

        if (status == 0) {
            tr::GameLoop loop(game, events, renderer, GetTime() * 1000.0);
            try {
                while (!WindowShouldClose()) {
                    poll_keys(events);
                    BeginDrawing();
                    loop.frame(GetTime() * 1000.0);
                    EndDrawing();
                }
            } catch (const std::exception& ex) {
                EndDrawing();
                std::cerr << "Render loop failed: " << ex.what() << '\n';
                status = 2;
            }
        }
    }

    CloseAudioDevice();
    CloseWindow();
    return status;
}

#endif

int run_headless(const std::string& assets_dir, std::uint64_t seed, int max_steps, double display_hz) {
    tr::HeadlessAssetLoader loader(assets_dir);
    auto audio = std::make_shared<tr::SilentAudio>();
    tr::WalkTheDog game(tr::RunnerConfig{}, audio, seed);

    try {
        game.initialize(loader);
    } catch (const std::exception& ex) {
        std::cerr << "Failed to initialize session: " << ex.what() << '\n';
        return 2;
    }

    tr::NullRenderer renderer;
    tr::KeyEventQueue events;
    tr::SteppedClock clock(0.0, 1000.0 / display_hz);
    tr::GameLoop loop(game, events, renderer, clock.now_ms());

    events.push({tr::KeyAction::Pressed, "ArrowRight"});
    std::uint64_t callbacks = 0;
    std::uint64_t next_jump = kScriptedJumpInterval;
    bool jump_held = false;
    std::uint64_t jump_pressed_at = 0;

    try {
        while (loop.steps() < static_cast<std::uint64_t>(max_steps)) {
            // Space stays held until at least one step has seen it.
            if (jump_held && loop.steps() > jump_pressed_at) {
                events.push({tr::KeyAction::Released, "Space"});
                jump_held = false;
            } else if (!jump_held && loop.steps() >= next_jump) {
                events.push({tr::KeyAction::Pressed, "Space"});
                jump_held = true;
                jump_pressed_at = loop.steps();
                next_jump += kScriptedJumpInterval;
            }

            loop.frame(clock.now_ms());
            callbacks += 1;

            if (game.walk()->knocked_out()) {
                break;
            }
        }
    } catch (const std::exception& ex) {
        std::cerr << "Simulation failed: " << ex.what() << '\n';
        return 2;
    }

    const tr::Walk& walk = *game.walk();
    std::cout << "seed=" << seed << " steps=" << loop.steps() << " callbacks=" << callbacks
              << " state=" << tr::to_string(walk.boy().state()) << " obstacles=" << walk.obstacles().size()
              << " knocked_out=" << (walk.knocked_out() ? 1 : 0) << '\n';
    return 0;
}

void print_usage() {
    std::cout << "Usage: trailrun [--headless|--rendered] [--seed N] [--max-steps N] [--display-hz N] "
                 "[--assets DIR] [--boxes]\n";
}

} // namespace

int main(int argc, char** argv) {
#ifdef TRAILRUN_WITH_RAYLIB
    tr::RunMode mode = tr::RunMode::Rendered;
    bool show_boxes = false;
#else
    tr::RunMode mode = tr::RunMode::Headless;
#endif
    std::uint64_t seed = 1337;
    int max_steps = 36000;
    double display_hz = 144.0;
    std::string assets_dir = "assets";

    try {
        for (int i = 1; i < argc; ++i) {
            const std::string arg = argv[i];
            if (arg == "--headless") {
                mode = tr::RunMode::Headless;
            } else if (arg == "--rendered") {
#ifndef TRAILRUN_WITH_RAYLIB
                std::cerr << "Rendered mode is unavailable: built without raylib.\n";
                return 2;
#else
                mode = tr::RunMode::Rendered;
#endif
            } else if (arg == "--boxes") {
#ifdef TRAILRUN_WITH_RAYLIB
                show_boxes = true;
#endif
            } else if (arg == "--seed" && i + 1 < argc) {
                seed = std::stoull(argv[++i]);
            } else if (arg == "--max-steps" && i + 1 < argc) {
                max_steps = std::stoi(argv[++i]);
            } else if (arg == "--display-hz" && i + 1 < argc) {
                display_hz = std::stod(argv[++i]);
            } else if (arg == "--assets" && i + 1 < argc) {
                assets_dir = argv[++i];
            } else if (arg == "--help" || arg == "-h") {
                print_usage();
                return 0;
            } else {
                std::cerr << "Unknown or incomplete argument: " << arg << '\n';
                print_usage();
                return 2;
            }
        }
    } catch (const std::exception& ex) {
        std::cerr << "Failed to parse CLI arguments: " << ex.what() << '\n';
        return 2;
    }

    if (max_steps < 1) {
        std::cerr << "--max-steps must be >= 1\n";
        return 2;
    }
    if (!(display_hz > 0.0)) {
        std::cerr << "--display-hz must be > 0\n";
        return 2;
    }

#ifdef TRAILRUN_WITH_RAYLIB
    if (mode == tr::RunMode::Rendered) {
        return run_rendered(assets_dir, seed, show_boxes);
    }
#endif
    if (mode != tr::RunMode::Headless) {
        return 2;
    }
    return run_headless(assets_dir, seed, max_steps, display_hz);
}
