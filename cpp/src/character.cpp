#include "trailrun/character.hpp"

#include <algorithm>
#include <exception>
#include <iostream>
#include <utility>

namespace tr {
namespace {

constexpr const char* kIdleFrameName = "Idle";
constexpr const char* kRunFrameName = "Run";
constexpr const char* kSlidingFrameName = "Slide";
constexpr const char* kJumpingFrameName = "Jump";
constexpr const char* kFallingFrameName = "Dead";

// Fallback for every (state, event) pair missing from the table.
template <typename S, typename E>
CharacterMachine dispatch(CharacterState<S> state, const E&) {
    return state;
}

template <typename S>
CharacterMachine dispatch(CharacterState<S> state, const events::Update&) {
    return update(std::move(state));
}

CharacterMachine dispatch(CharacterState<states::Idle> state, const events::Run&) {
    return run(std::move(state));
}

CharacterMachine dispatch(CharacterState<states::Running> state, const events::Slide&) {
    return slide(std::move(state));
}

CharacterMachine dispatch(CharacterState<states::Running> state, const events::Jump&) {
    return jump(std::move(state));
}

CharacterMachine dispatch(CharacterState<states::Running> state, const events::KnockOut&) {
    return knock_out(std::move(state));
}

CharacterMachine dispatch(CharacterState<states::Jumping> state, const events::KnockOut&) {
    return knock_out(std::move(state));
}

CharacterMachine dispatch(CharacterState<states::Sliding> state, const events::KnockOut&) {
    return knock_out(std::move(state));
}

CharacterMachine dispatch(CharacterState<states::Jumping> state, const events::Land& event) {
    return land_on(std::move(state), event.height);
}

CharacterMachine dispatch(CharacterState<states::Running> state, const events::Land& event) {
    return land_on(std::move(state), event.height);
}

CharacterMachine dispatch(CharacterState<states::Sliding> state, const events::Land& event) {
    return land_on(std::move(state), event.height);
}

CharacterMachine dispatch(CharacterState<states::KnockedOut> state, const events::Land& event) {
    return land_on(std::move(state), event.height);
}

struct StateIdOf {
    CharacterStateId operator()(const CharacterState<states::Idle>&) const { return CharacterStateId::Idle; }
    CharacterStateId operator()(const CharacterState<states::Running>&) const { return CharacterStateId::Running; }
    CharacterStateId operator()(const CharacterState<states::Sliding>&) const { return CharacterStateId::Sliding; }
    CharacterStateId operator()(const CharacterState<states::Jumping>&) const { return CharacterStateId::Jumping; }
    CharacterStateId operator()(const CharacterState<states::Falling>&) const { return CharacterStateId::Falling; }
    CharacterStateId operator()(const CharacterState<states::KnockedOut>&) const {
        return CharacterStateId::KnockedOut;
    }
};

} // namespace

CharacterContext CharacterContext::update(int frame_count) const {
    CharacterContext next = *this;
    next.velocity.y = std::min(next.velocity.y + tuning->gravity, tuning->terminal_velocity);

    if (next.frame < frame_count) {
        next.frame += 1;
    } else {
        next.frame = 0;
    }

    next.position.y = std::min(next.position.y + next.velocity.y, tuning->floor);
    return next;
}

CharacterContext CharacterContext::reset_frame() const {
    return fix_frame(0);
}

CharacterContext CharacterContext::run_right() const {
    CharacterContext next = *this;
    next.velocity.x += tuning->running_speed;
    return next;
}

CharacterContext CharacterContext::set_vertical_velocity(int y) const {
    CharacterContext next = *this;
    next.velocity.y = y;
    return next;
}

CharacterContext CharacterContext::stop() const {
    CharacterContext next = *this;
    next.velocity.x = 0;
    return next;
}

CharacterContext CharacterContext::set_on(int height) const {
    CharacterContext next = *this;
    next.position.y = height - tuning->character_height();
    next.velocity.y = 0;
    return next;
}

CharacterContext CharacterContext::fix_frame(int value) const {
    CharacterContext next = *this;
    next.frame = value;
    return next;
}

CharacterContext CharacterContext::play_jump_sound() const {
    if (audio) {
        try {
            audio->play_sound(jump_sound);
        } catch (const std::exception& ex) {
            std::cerr << "Error playing jump sound: " << ex.what() << '\n';
        }
    }
    return *this;
}

CharacterState<states::Idle> make_idle(std::shared_ptr<const CharacterTuning> tuning,
                                       std::shared_ptr<Audio> audio,
                                       SoundHandle jump_sound) {
    CharacterContext context{};
    context.position = {tuning->starting_x, tuning->floor};
    context.tuning = std::move(tuning);
    context.audio = std::move(audio);
    context.jump_sound = jump_sound;
    return CharacterState<states::Idle>(std::move(context));
}

CharacterState<states::Running> run(CharacterState<states::Idle> state) {
    return CharacterState<states::Running>(state.context().reset_frame().run_right());
}

CharacterState<states::Sliding> slide(CharacterState<states::Running> state) {
    return CharacterState<states::Sliding>(state.context().reset_frame());
}

CharacterState<states::Jumping> jump(CharacterState<states::Running> state) {
    const CharacterContext& ctx = state.context();
    return CharacterState<states::Jumping>(
        ctx.set_vertical_velocity(ctx.tuning->jump_speed).reset_frame().play_jump_sound());
}

CharacterState<states::Falling> knock_out(CharacterState<states::Running> state) {
    return CharacterState<states::Falling>(state.context().reset_frame().stop());
}

CharacterState<states::Falling> knock_out(CharacterState<states::Jumping> state) {
    return CharacterState<states::Falling>(state.context().reset_frame().stop());
}

CharacterState<states::Falling> knock_out(CharacterState<states::Sliding> state) {
    return CharacterState<states::Falling>(state.context().reset_frame().stop());
}

CharacterState<states::Running> land_on(CharacterState<states::Running> state, int height) {
    return CharacterState<states::Running>(state.context().set_on(height));
}

CharacterState<states::Sliding> land_on(CharacterState<states::Sliding> state, int height) {
    return CharacterState<states::Sliding>(state.context().set_on(height));
}

CharacterState<states::Running> land_on(CharacterState<states::Jumping> state, int height) {
    return CharacterState<states::Running>(state.context().reset_frame().set_on(height));
}

CharacterState<states::KnockedOut> land_on(CharacterState<states::KnockedOut> state, int height) {
    return CharacterState<states::KnockedOut>(state.context().set_on(height));
}

CharacterState<states::Idle> update(CharacterState<states::Idle> state) {
    const CharacterContext& ctx = state.context();
    return CharacterState<states::Idle>(ctx.update(ctx.tuning->idle_frames));
}

CharacterState<states::Running> update(CharacterState<states::Running> state) {
    const CharacterContext& ctx = state.context();
    return CharacterState<states::Running>(ctx.update(ctx.tuning->running_frames));
}

CharacterMachine update(CharacterState<states::Sliding> state) {
    const int sliding_frames = state.context().tuning->sliding_frames;
    CharacterContext next = state.context().update(sliding_frames);
    if (next.frame >= sliding_frames) {
        return CharacterState<states::Running>(next.reset_frame());
    }
    return CharacterState<states::Sliding>(std::move(next));
}

CharacterMachine update(CharacterState<states::Jumping> state) {
    const CharacterContext& ctx = state.context();
    CharacterState<states::Jumping> next(ctx.update(ctx.tuning->jumping_frames));
    if (next.context().position.y >= next.context().tuning->floor) {
        const int canvas_height = next.context().tuning->canvas_height;
        return land_on(std::move(next), canvas_height);
    }
    return next;
}

CharacterMachine update(CharacterState<states::Falling> state) {
    const int falling_frames = state.context().tuning->falling_frames;
    CharacterContext next = state.context().update(falling_frames);
    if (next.frame >= falling_frames) {
        return CharacterState<states::KnockedOut>(std::move(next));
    }
    return CharacterState<states::Falling>(std::move(next));
}

CharacterState<states::KnockedOut> update(CharacterState<states::KnockedOut> state) {
    const int falling_frames = state.context().tuning->falling_frames;
    return CharacterState<states::KnockedOut>(state.context().update(falling_frames).fix_frame(falling_frames - 1));
}

CharacterMachine transition(CharacterMachine machine, const Event& event) {
    return std::visit(
        [](auto state, const auto& ev) -> CharacterMachine { return dispatch(std::move(state), ev); },
        std::move(machine),
        event);
}

const CharacterContext& context_of(const CharacterMachine& machine) {
    return std::visit([](const auto& state) -> const CharacterContext& { return state.context(); }, machine);
}

CharacterStateId state_id(const CharacterMachine& machine) {
    return std::visit(StateIdOf{}, machine);
}

const char* animation_name(const CharacterMachine& machine) {
    switch (state_id(machine)) {
        case CharacterStateId::Idle: return kIdleFrameName;
        case CharacterStateId::Running: return kRunFrameName;
        case CharacterStateId::Sliding: return kSlidingFrameName;
        case CharacterStateId::Jumping: return kJumpingFrameName;
        case CharacterStateId::Falling:
        case CharacterStateId::KnockedOut: return kFallingFrameName;
    }
    return kIdleFrameName;
}

const char* to_string(CharacterStateId id) {
    switch (id) {
        case CharacterStateId::Idle: return "idle";
        case CharacterStateId::Running: return "running";
        case CharacterStateId::Sliding: return "sliding";
        case CharacterStateId::Jumping: return "jumping";
        case CharacterStateId::Falling: return "falling";
        case CharacterStateId::KnockedOut: return "knocked_out";
    }
    return "unknown";
}

Runner::Runner(std::shared_ptr<const SpriteAtlas> atlas,
               std::shared_ptr<const CharacterTuning> tuning,
               std::shared_ptr<Audio> audio,
               SoundHandle jump_sound)
    : machine_(make_idle(std::move(tuning), std::move(audio), jump_sound)), atlas_(std::move(atlas)) {}

std::string Runner::frame_name() const {
    const CharacterContext& ctx = context_of(machine_);
    return std::string(animation_name(machine_)) + " (" + std::to_string(ctx.frame / ctx.tuning->animation_divisor + 1) +
           ").png";
}

const SpriteFrame& Runner::current_sprite() const {
    return atlas_->cell(frame_name());
}

void Runner::draw(Renderer& renderer) const {
    const SpriteFrame& sprite = current_sprite();
    atlas_->draw(renderer, sprite.frame, destination_box());
    renderer.draw_bounding_box(bounding_box());
}

Rect Runner::destination_box() const {
    const SpriteFrame& sprite = current_sprite();
    const CharacterContext& ctx = context_of(machine_);
    const Point offset = sprite.offset();
    return {ctx.position.x + offset.x, ctx.position.y + offset.y, sprite.frame.width, sprite.frame.height};
}

Rect Runner::bounding_box() const {
    const CharacterTuning& tuning = *context_of(machine_).tuning;
    const Rect dest = destination_box();
    return {dest.x + tuning.box_x_inset,
            dest.y + tuning.box_y_inset,
            dest.width - tuning.box_width_inset,
            dest.height - tuning.box_y_inset};
}

void Runner::update() {
    machine_ = transition(std::move(machine_), events::Update{});
}

void Runner::run_right() {
    machine_ = transition(std::move(machine_), events::Run{});
}

void Runner::slide() {
    machine_ = transition(std::move(machine_), events::Slide{});
}

void Runner::jump() {
    machine_ = transition(std::move(machine_), events::Jump{});
}

void Runner::land_on(int height) {
    machine_ = transition(std::move(machine_), events::Land{height});
}

void Runner::knock_out() {
    machine_ = transition(std::move(machine_), events::KnockOut{});
}

} // namespace tr
