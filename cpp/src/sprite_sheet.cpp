#include "trailrun/sprite_sheet.hpp"

#include <algorithm>
#include <cctype>
#include <cerrno>
#include <cstdlib>
#include <limits>
#include <stdexcept>
#include <string>
#include <utility>

namespace tr {
namespace {

constexpr int kMaxSkipDepth = 64;

class JsonCursor {
  public:
    explicit JsonCursor(std::string_view text) : text_(text) {}

    void skip_ws() {
        while (pos_ < text_.size() && std::isspace(static_cast<unsigned char>(text_[pos_]))) {
            ++pos_;
        }
    }

    bool at_end() {
        skip_ws();
        return pos_ >= text_.size();
    }

    bool peek(char c) {
        skip_ws();
        return pos_ < text_.size() && text_[pos_] == c;
    }

    bool consume(char c) {
        if (!peek(c)) return false;
        ++pos_;
        return true;
    }

    void expect(char c) {
        if (!consume(c)) {
            fail(std::string("expected '") + c + "'");
        }
    }

    std::string read_string() {
        expect('"');
        std::string out;
        while (pos_ < text_.size()) {
            const char c = text_[pos_++];
            if (c == '"') return out;
            if (c != '\\') {
                out.push_back(c);
                continue;
            }
            if (pos_ >= text_.size()) break;
            const char esc = text_[pos_++];
            switch (esc) {
                case 'n': out.push_back('\n'); break;
                case 't': out.push_back('\t'); break;
                case 'r': out.push_back('\r'); break;
                case 'b': out.push_back('\b'); break;
                case 'f': out.push_back('\f'); break;
                case 'u':
                    // Left undecoded.
                    out.append("\\u");
                    break;
                default: out.push_back(esc); break;
            }
        }
        fail("unterminated string");
    }

    int read_integer() {
        skip_ws();
        const std::size_t start = pos_;
        if (pos_ < text_.size() && text_[pos_] == '-') {
            ++pos_;
        }
        while (pos_ < text_.size() && std::isdigit(static_cast<unsigned char>(text_[pos_]))) {
            ++pos_;
        }
        if (pos_ < text_.size() && (text_[pos_] == '.' || text_[pos_] == 'e' || text_[pos_] == 'E')) {
            fail("expected an integer");
        }
        const std::string token(text_.substr(start, pos_ - start));
        if (token.empty() || token == "-") {
            pos_ = start;
            fail("expected number");
        }

        errno = 0;
        char* end_ptr = nullptr;
        const long parsed = std::strtol(token.c_str(), &end_ptr, 10);
        if (errno == ERANGE || parsed < std::numeric_limits<int>::min() || parsed > std::numeric_limits<int>::max()) {
            pos_ = start;
            fail("number out of range");
        }
        return static_cast<int>(parsed);
    }

    void skip_value() {
        skip_ws();
        if (pos_ >= text_.size()) fail("unexpected end of document");
        const char c = text_[pos_];
        if (c == '"') {
            read_string();
        } else if (c == '{' || c == '[') {
            if (++depth_ > kMaxSkipDepth) fail("document nested too deeply");
            if (c == '{') {
                for_each_member([this](const std::string&) { skip_value(); });
            } else {
                for_each_element([this]() { skip_value(); });
            }
            --depth_;
        } else if (c == '-' || std::isdigit(static_cast<unsigned char>(c))) {
            skip_number();
        } else if (!skip_literal("true") && !skip_literal("false") && !skip_literal("null")) {
            fail("unexpected character");
        }
    }

    template <typename F>
    void for_each_member(F&& on_member) {
        expect('{');
        if (consume('}')) return;
        while (true) {
            const std::string key = read_string();
            expect(':');
            on_member(key);
            if (consume(',')) continue;
            expect('}');
            return;
        }
    }

    template <typename F>
    void for_each_element(F&& on_element) {
        expect('[');
        if (consume(']')) return;
        while (true) {
            on_element();
            if (consume(',')) continue;
            expect(']');
            return;
        }
    }

    [[noreturn]] void fail(const std::string& what) const {
        throw std::runtime_error("sprite sheet parse error at offset " + std::to_string(pos_) + ": " + what);
    }

  private:
    void skip_number() {
        const std::size_t start = pos_;
        char* end_ptr = nullptr;
        const std::string rest(text_.substr(start, std::min<std::size_t>(text_.size() - start, 64)));
        std::strtod(rest.c_str(), &end_ptr);
        if (end_ptr == rest.c_str()) fail("expected number");
        pos_ += static_cast<std::size_t>(end_ptr - rest.c_str());
    }

    bool skip_literal(std::string_view literal) {
        if (text_.substr(pos_, literal.size()) != literal) return false;
        pos_ += literal.size();
        return true;
    }

    std::string_view text_;
    std::size_t pos_ = 0;
    int depth_ = 0;
};

Rect parse_rect(JsonCursor& cursor) {
    Rect rect{};
    bool seen[4] = {false, false, false, false};
    cursor.for_each_member([&](const std::string& key) {
        if (key == "x") {
            rect.x = cursor.read_integer();
            seen[0] = true;
        } else if (key == "y") {
            rect.y = cursor.read_integer();
            seen[1] = true;
        } else if (key == "w") {
            rect.width = cursor.read_integer();
            seen[2] = true;
        } else if (key == "h") {
            rect.height = cursor.read_integer();
            seen[3] = true;
        } else {
            cursor.skip_value();
        }
    });
    if (!(seen[0] && seen[1] && seen[2] && seen[3])) {
        cursor.fail("rectangle needs x, y, w and h");
    }
    return rect;
}

SpriteFrame parse_frame(JsonCursor& cursor, std::string* filename) {
    SpriteFrame frame{};
    bool has_frame = false;
    cursor.for_each_member([&](const std::string& key) {
        if (key == "frame") {
            frame.frame = parse_rect(cursor);
            has_frame = true;
        } else if (key == "spriteSourceSize") {
            frame.source_offset = parse_rect(cursor);
        } else if (key == "filename" && filename != nullptr) {
            *filename = cursor.read_string();
        } else {
            cursor.skip_value();
        }
    });
    if (!has_frame) {
        cursor.fail("frame entry without a \"frame\" rectangle");
    }
    return frame;
}

} // namespace

void SpriteSheet::add(std::string name, SpriteFrame frame) {
    frames_[std::move(name)] = frame;
}

const SpriteFrame* SpriteSheet::find(const std::string& name) const {
    const auto it = frames_.find(name);
    if (it == frames_.end()) return nullptr;
    return &it->second;
}

const SpriteFrame& SpriteSheet::at(const std::string& name) const {
    const SpriteFrame* frame = find(name);
    if (frame == nullptr) {
        throw std::runtime_error("sprite frame not found in atlas: " + name);
    }
    return *frame;
}

SpriteSheet parse_sprite_sheet(std::string_view json) {
    JsonCursor cursor(json);
    SpriteSheet sheet;
    bool has_frames = false;

    cursor.for_each_member([&](const std::string& key) {
        if (key != "frames") {
            cursor.skip_value();
            return;
        }
        has_frames = true;
        if (cursor.peek('[')) {
            cursor.for_each_element([&]() {
                std::string name;
                SpriteFrame frame = parse_frame(cursor, &name);
                if (name.empty()) {
                    cursor.fail("frame entry without a filename");
                }
                sheet.add(std::move(name), frame);
            });
        } else {
            cursor.for_each_member([&](const std::string& name) { sheet.add(name, parse_frame(cursor, nullptr)); });
        }
    });

    if (!cursor.at_end()) {
        cursor.fail("trailing characters after document");
    }
    if (!has_frames) {
        throw std::runtime_error("sprite sheet has no \"frames\" entry");
    }
    return sheet;
}

} // namespace tr
