#pragma once

#include "config.hpp"
#include "geometry.hpp"
#include "platform.hpp"
#include "sprite_sheet.hpp"

#include <cstdint>
#include <memory>
#include <string>
#include <utility>
#include <variant>

namespace tr {

struct CharacterContext {
    int frame = 0;
    Point position{};
    Point velocity{};
    std::shared_ptr<const CharacterTuning> tuning;
    std::shared_ptr<Audio> audio;
    SoundHandle jump_sound{};

    CharacterContext update(int frame_count) const;
    CharacterContext reset_frame() const;
    CharacterContext run_right() const;
    CharacterContext set_vertical_velocity(int y) const;
    CharacterContext stop() const;
    CharacterContext set_on(int height) const;
    CharacterContext fix_frame(int value) const;
    CharacterContext play_jump_sound() const;
};

namespace states {
struct Idle {};
struct Running {};
struct Sliding {};
struct Jumping {};
struct Falling {};
struct KnockedOut {};
} // namespace states

template <typename S>
class CharacterState {
  public:
    explicit CharacterState(CharacterContext context) : context_(std::move(context)) {}

    const CharacterContext& context() const { return context_; }

  private:
    CharacterContext context_;
};

using CharacterMachine = std::variant<CharacterState<states::Idle>,
                                      CharacterState<states::Running>,
                                      CharacterState<states::Sliding>,
                                      CharacterState<states::Jumping>,
                                      CharacterState<states::Falling>,
                                      CharacterState<states::KnockedOut>>;

enum class CharacterStateId : uint8_t {
    Idle,
    Running,
    Sliding,
    Jumping,
    Falling,
    KnockedOut
};

namespace events {
struct Run {};
struct Slide {};
struct Jump {};
struct KnockOut {};
struct Update {};
struct Land {
    int height = 0;
};
} // namespace events

using Event = std::variant<events::Run, events::Slide, events::Jump, events::KnockOut, events::Update, events::Land>;

CharacterState<states::Idle> make_idle(std::shared_ptr<const CharacterTuning> tuning,
                                       std::shared_ptr<Audio> audio,
                                       SoundHandle jump_sound);

// Typed transitions. Only the legal (state, event) pairs have an overload.
CharacterState<states::Running> run(CharacterState<states::Idle> state);
CharacterState<states::Sliding> slide(CharacterState<states::Running> state);
CharacterState<states::Jumping> jump(CharacterState<states::Running> state);

CharacterState<states::Falling> knock_out(CharacterState<states::Running> state);
CharacterState<states::Falling> knock_out(CharacterState<states::Jumping> state);
CharacterState<states::Falling> knock_out(CharacterState<states::Sliding> state);

CharacterState<states::Running> land_on(CharacterState<states::Running> state, int height);
CharacterState<states::Sliding> land_on(CharacterState<states::Sliding> state, int height);
CharacterState<states::Running> land_on(CharacterState<states::Jumping> state, int height);
CharacterState<states::KnockedOut> land_on(CharacterState<states::KnockedOut> state, int height);

CharacterState<states::Idle> update(CharacterState<states::Idle> state);
CharacterState<states::Running> update(CharacterState<states::Running> state);
CharacterMachine update(CharacterState<states::Sliding> state);
CharacterMachine update(CharacterState<states::Jumping> state);
CharacterMachine update(CharacterState<states::Falling> state);
CharacterState<states::KnockedOut> update(CharacterState<states::KnockedOut> state);

CharacterMachine transition(CharacterMachine machine, const Event& event);

const CharacterContext& context_of(const CharacterMachine& machine);
CharacterStateId state_id(const CharacterMachine& machine);
const char* animation_name(const CharacterMachine& machine);
const char* to_string(CharacterStateId id);

class Runner {
  public:
    Runner(std::shared_ptr<const SpriteAtlas> atlas,
           std::shared_ptr<const CharacterTuning> tuning,
           std::shared_ptr<Audio> audio,
           SoundHandle jump_sound);

    std::string frame_name() const;
    const SpriteFrame& current_sprite() const;

    void draw(Renderer& renderer) const;
    Rect destination_box() const;
    Rect bounding_box() const;

    void update();
    void run_right();
    void slide();
    void jump();
    void land_on(int height);
    void knock_out();

    int velocity_y() const { return context_of(machine_).velocity.y; }
    int pos_y() const { return context_of(machine_).position.y; }
    int walking_speed() const { return context_of(machine_).velocity.x; }

    CharacterStateId state() const { return state_id(machine_); }
    bool knocked_out() const { return state() == CharacterStateId::KnockedOut; }
    const CharacterMachine& machine() const { return machine_; }

  private:
    CharacterMachine machine_;
    std::shared_ptr<const SpriteAtlas> atlas_;
};

} // namespace tr
