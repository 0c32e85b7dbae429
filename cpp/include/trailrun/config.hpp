#pragma once

#include "geometry.hpp"

#include <array>
#include <cstddef>
#include <string>

namespace tr {

constexpr double kFrameSizeMs = 1000.0 / 60.0;
constexpr int kCanvasWidth = 600;
constexpr int kCanvasHeight = 600;
constexpr int kFloor = 479;
constexpr int kStartingPointX = -20;
constexpr int kAnimationDivisor = 3;
constexpr int kTimelineMinimum = 1000;
constexpr int kObstacleBuffer = 20;
constexpr std::size_t kInputQueueCapacity = 256;

enum class RunMode {
    Rendered,
    Headless
};

struct CharacterTuning {
    int floor = kFloor;
    int canvas_height = kCanvasHeight;
    int starting_x = kStartingPointX;
    int running_speed = 4;
    int jump_speed = -25;
    int gravity = 1;
    int terminal_velocity = 20;

    int idle_frames = 29;
    int running_frames = 23;
    int sliding_frames = 14;
    int jumping_frames = 35;
    int falling_frames = 29;
    int animation_divisor = kAnimationDivisor;

    int box_x_inset = 18;
    int box_y_inset = 14;
    int box_width_inset = 28;

    int character_height() const { return canvas_height - floor; }
};

struct SegmentTuning {
    int stone_on_ground = 546;
    int low_platform = 420;
    int high_platform = 375;
    int first_offset = 150;
    int second_offset = 370;

    std::array<std::string, 3> platform_sprites{"13.png", "14.png", "15.png"};
    // Left cap, mid span, right cap; relative to the platform origin.
    std::array<Rect, 3> platform_boxes{
        Rect{0, 0, 60, 54},
        Rect{60, 0, 384 - (60 * 2), 93},
        Rect{384 - 60, 0, 60, 54},
    };

    int timeline_minimum = kTimelineMinimum;
    int obstacle_buffer = kObstacleBuffer;
};

struct AssetManifest {
    std::string character_sheet = "rhb.json";
    std::string character_image = "rhb.png";
    std::string background_image = "BG.png";
    std::string stone_image = "Stone.png";
    std::string tiles_sheet = "tiles.json";
    std::string tiles_image = "tiles.png";
    std::string jump_sound = "SFX_Jump_23.mp3";
};

struct RunnerConfig {
    int canvas_width = kCanvasWidth;
    int canvas_height = kCanvasHeight;
    CharacterTuning character{};
    SegmentTuning segments{};
    AssetManifest assets{};
};

} // namespace tr
