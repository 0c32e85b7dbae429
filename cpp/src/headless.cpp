#include "trailrun/headless.hpp"

#include <array>
#include <cstring>
#include <fstream>
#include <sstream>
#include <stdexcept>
#include <utility>

namespace tr {
namespace {

constexpr std::array<unsigned char, 8> kPngSignature{0x89, 'P', 'N', 'G', '\r', '\n', 0x1A, '\n'};

uint32_t read_be32(const unsigned char* p) {
    return (static_cast<uint32_t>(p[0]) << 24U) | (static_cast<uint32_t>(p[1]) << 16U) |
           (static_cast<uint32_t>(p[2]) << 8U) | static_cast<uint32_t>(p[3]);
}

std::string read_text_file(const std::string& path) {
    std::ifstream in(path, std::ios::binary);
    if (!in) {
        throw std::runtime_error("unable to open " + path);
    }
    std::ostringstream oss;
    oss << in.rdbuf();
    return oss.str();
}

} // namespace

PngSize read_png_size(const std::string& path) {
    std::ifstream in(path, std::ios::binary);
    if (!in) {
        throw std::runtime_error("unable to open image " + path);
    }

    // Signature, chunk length, "IHDR", width, height.
    std::array<unsigned char, 24> header{};
    in.read(reinterpret_cast<char*>(header.data()), static_cast<std::streamsize>(header.size()));
    if (in.gcount() != static_cast<std::streamsize>(header.size())) {
        throw std::runtime_error("image too short to be a PNG: " + path);
    }
    if (std::memcmp(header.data(), kPngSignature.data(), kPngSignature.size()) != 0) {
        throw std::runtime_error("not a PNG image: " + path);
    }
    if (std::memcmp(header.data() + 12, "IHDR", 4) != 0) {
        throw std::runtime_error("PNG image missing IHDR chunk: " + path);
    }

    const uint32_t width = read_be32(header.data() + 16);
    const uint32_t height = read_be32(header.data() + 20);
    if (width == 0 || height == 0 || width > 0x7FFFFFFFU || height > 0x7FFFFFFFU) {
        throw std::runtime_error("PNG image has invalid dimensions: " + path);
    }
    return {static_cast<int>(width), static_cast<int>(height)};
}

HeadlessAssetLoader::HeadlessAssetLoader(std::string root) : root_(std::move(root)) {}

std::string HeadlessAssetLoader::resolve(const std::string& path) const {
    if (root_.empty() || (!path.empty() && path.front() == '/')) return path;
    if (root_.back() == '/') return root_ + path;
    return root_ + "/" + path;
}

std::future<ImageHandle> HeadlessAssetLoader::load_image(const std::string& path) {
    const uint32_t id = next_id_++;
    return std::async(std::launch::async, [id, full = resolve(path)]() {
        const PngSize size = read_png_size(full);
        return ImageHandle{id, size.width, size.height};
    });
}

std::future<SpriteSheet> HeadlessAssetLoader::load_sprite_sheet(const std::string& path) {
    return std::async(std::launch::async, [full = resolve(path)]() {
        const std::string text = read_text_file(full);
        try {
            return parse_sprite_sheet(text);
        } catch (const std::runtime_error& ex) {
            throw std::runtime_error(full + ": " + ex.what());
        }
    });
}

std::future<SoundHandle> HeadlessAssetLoader::load_sound(const std::string& path) {
    const uint32_t id = next_id_++;
    return std::async(std::launch::async, [id, full = resolve(path)]() {
        std::ifstream in(full, std::ios::binary);
        if (!in) {
            throw std::runtime_error("unable to open sound " + full);
        }
        return SoundHandle{id};
    });
}

} // namespace tr
