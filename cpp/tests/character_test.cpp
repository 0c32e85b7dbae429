#include "test_support.hpp"

#include "trailrun/character.hpp"
#include "trailrun/headless.hpp"

#include <gtest/gtest.h>

#include <algorithm>
#include <memory>
#include <optional>
#include <type_traits>
#include <utility>
#include <vector>

namespace {

using tr::CharacterMachine;
using tr::CharacterState;
using tr::CharacterStateId;
using tr::Event;
namespace states = tr::states;
namespace events = tr::events;

template <typename S, typename = void>
struct can_jump : std::false_type {};
template <typename S>
struct can_jump<S, std::void_t<decltype(tr::jump(std::declval<CharacterState<S>>()))>> : std::true_type {};

template <typename S, typename = void>
struct can_slide : std::false_type {};
template <typename S>
struct can_slide<S, std::void_t<decltype(tr::slide(std::declval<CharacterState<S>>()))>> : std::true_type {};

static_assert(can_jump<states::Running>::value, "running can jump");
static_assert(!can_jump<states::Idle>::value, "idle cannot jump");
static_assert(!can_jump<states::Jumping>::value, "no double jump");
static_assert(can_slide<states::Running>::value, "running can slide");
static_assert(!can_slide<states::KnockedOut>::value, "knocked out cannot slide");

std::vector<CharacterMachine> every_state(const tr::CharacterContext& ctx) {
    return {CharacterState<states::Idle>(ctx),
            CharacterState<states::Running>(ctx),
            CharacterState<states::Sliding>(ctx),
            CharacterState<states::Jumping>(ctx),
            CharacterState<states::Falling>(ctx),
            CharacterState<states::KnockedOut>(ctx)};
}

enum class EventKind { Run, Slide, Jump, KnockOut, Land };

Event make_event(EventKind kind) {
    switch (kind) {
        case EventKind::Run: return events::Run{};
        case EventKind::Slide: return events::Slide{};
        case EventKind::Jump: return events::Jump{};
        case EventKind::KnockOut: return events::KnockOut{};
        case EventKind::Land: return events::Land{400};
    }
    return events::Run{};
}

// Resulting state for every legal pair; anything absent must be a no-op.
std::optional<CharacterStateId> table(CharacterStateId from, EventKind event) {
    using S = CharacterStateId;
    switch (from) {
        case S::Idle:
            if (event == EventKind::Run) return S::Running;
            break;
        case S::Running:
            if (event == EventKind::Slide) return S::Sliding;
            if (event == EventKind::Jump) return S::Jumping;
            if (event == EventKind::KnockOut) return S::Falling;
            if (event == EventKind::Land) return S::Running;
            break;
        case S::Sliding:
            if (event == EventKind::KnockOut) return S::Falling;
            if (event == EventKind::Land) return S::Sliding;
            break;
        case S::Jumping:
            if (event == EventKind::KnockOut) return S::Falling;
            if (event == EventKind::Land) return S::Running;
            break;
        case S::Falling:
            break;
        case S::KnockedOut:
            if (event == EventKind::Land) return S::KnockedOut;
            break;
    }
    return std::nullopt;
}

void expect_same_physics(const tr::CharacterContext& a, const tr::CharacterContext& b) {
    EXPECT_EQ(a.frame, b.frame);
    EXPECT_EQ(a.position.x, b.position.x);
    EXPECT_EQ(a.position.y, b.position.y);
    EXPECT_EQ(a.velocity.x, b.velocity.x);
    EXPECT_EQ(a.velocity.y, b.velocity.y);
}

CharacterMachine running_machine(std::shared_ptr<tr::Audio> audio = nullptr) {
    return tr::transition(tr::make_idle(trtest::default_tuning(), std::move(audio), tr::SoundHandle{3}), events::Run{});
}

CharacterMachine apply_updates(CharacterMachine machine, int count) {
    for (int i = 0; i < count; ++i) {
        machine = tr::transition(std::move(machine), events::Update{});
    }
    return machine;
}

TEST(CharacterStateMachine, TransitionsFollowTableExhaustively) {
    const tr::CharacterContext ctx = trtest::airborne_context();
    const EventKind kinds[] = {EventKind::Run, EventKind::Slide, EventKind::Jump, EventKind::KnockOut, EventKind::Land};

    for (const auto& start : every_state(ctx)) {
        for (const EventKind kind : kinds) {
            const CharacterStateId from = tr::state_id(start);
            const CharacterMachine result = tr::transition(start, make_event(kind));
            const auto expected = table(from, kind);

            SCOPED_TRACE(std::string(tr::to_string(from)) + " event " + std::to_string(static_cast<int>(kind)));
            if (expected.has_value()) {
                EXPECT_EQ(tr::state_id(result), *expected);
            } else {
                EXPECT_EQ(tr::state_id(result), from);
                expect_same_physics(tr::context_of(result), ctx);
            }
        }
    }
}

TEST(CharacterStateMachine, UpdateIsAcceptedByEveryState) {
    const tr::CharacterContext ctx = trtest::airborne_context();
    for (const auto& start : every_state(ctx)) {
        const CharacterMachine result = tr::transition(start, events::Update{});
        EXPECT_EQ(tr::context_of(result).velocity.y, ctx.velocity.y + 1) << tr::to_string(tr::state_id(start));
    }
}

TEST(CharacterStateMachine, StartsIdleAtStartingPoint) {
    const auto idle = tr::make_idle(trtest::default_tuning(), nullptr, tr::SoundHandle{});
    EXPECT_EQ(idle.context().position.x, tr::kStartingPointX);
    EXPECT_EQ(idle.context().position.y, tr::kFloor);
    EXPECT_EQ(idle.context().frame, 0);
    EXPECT_EQ(idle.context().velocity.x, 0);
}

TEST(CharacterStateMachine, RunResetsFrameAndAddsRunningSpeed) {
    tr::CharacterContext ctx = trtest::airborne_context();
    ctx.velocity.x = 0;
    const auto running = tr::run(CharacterState<states::Idle>(ctx));
    EXPECT_EQ(running.context().frame, 0);
    EXPECT_EQ(running.context().velocity.x, 4);
}

TEST(CharacterStateMachine, JumpSetsJumpSpeedAndPlaysSound) {
    auto audio = std::make_shared<tr::SilentAudio>();
    const CharacterMachine jumping = tr::transition(running_machine(audio), events::Jump{});

    EXPECT_EQ(tr::state_id(jumping), CharacterStateId::Jumping);
    EXPECT_EQ(tr::context_of(jumping).velocity.y, -25);
    EXPECT_EQ(tr::context_of(jumping).frame, 0);
    ASSERT_EQ(audio->played.size(), 1u);
    EXPECT_EQ(audio->played.front(), 3u);
}

TEST(CharacterStateMachine, JumpSoundFailureDoesNotStopTheJump) {
    const CharacterMachine jumping =
        tr::transition(running_machine(std::make_shared<trtest::ThrowingAudio>()), events::Jump{});
    EXPECT_EQ(tr::state_id(jumping), CharacterStateId::Jumping);
    EXPECT_EQ(tr::context_of(jumping).velocity.y, -25);
}

TEST(CharacterStateMachine, KnockOutStopsHorizontalMotion) {
    CharacterMachine machine = apply_updates(running_machine(), 5);
    machine = tr::transition(std::move(machine), events::KnockOut{});
    EXPECT_EQ(tr::state_id(machine), CharacterStateId::Falling);
    EXPECT_EQ(tr::context_of(machine).velocity.x, 0);
    EXPECT_EQ(tr::context_of(machine).frame, 0);
}

TEST(CharacterStateMachine, GravityAccumulatesUntilTerminalVelocity) {
    tr::CharacterContext ctx = trtest::airborne_context();
    ctx.velocity = {0, 0};
    ctx.position.y = -10000;
    CharacterMachine machine = CharacterState<states::Idle>(ctx);

    for (int n = 1; n <= 40; ++n) {
        machine = tr::transition(std::move(machine), events::Update{});
        EXPECT_EQ(tr::context_of(machine).velocity.y, std::min(n * ctx.tuning->gravity, ctx.tuning->terminal_velocity));
    }
}

TEST(CharacterStateMachine, UpdateNeverSinksBelowFloor) {
    tr::CharacterContext ctx = trtest::airborne_context();
    ctx.position.y = tr::kFloor - 3;
    ctx.velocity.y = 19;
    const CharacterMachine machine = tr::transition(CharacterState<states::Running>(ctx), events::Update{});
    EXPECT_EQ(tr::context_of(machine).position.y, tr::kFloor);
}

TEST(CharacterStateMachine, LandingSnapsPositionAndZeroesVelocity) {
    const int character_height = trtest::default_tuning()->character_height();
    for (const int vy : {-12, 0, 17}) {
        tr::CharacterContext ctx = trtest::airborne_context();
        ctx.velocity.y = vy;
        const std::vector<CharacterMachine> landable = {CharacterState<states::Running>(ctx),
                                                        CharacterState<states::Sliding>(ctx),
                                                        CharacterState<states::Jumping>(ctx),
                                                        CharacterState<states::KnockedOut>(ctx)};
        for (const auto& machine : landable) {
            const CharacterMachine landed = tr::transition(machine, events::Land{420});
            EXPECT_EQ(tr::context_of(landed).position.y, 420 - character_height);
            EXPECT_EQ(tr::context_of(landed).velocity.y, 0);
        }
    }
}

TEST(CharacterStateMachine, JumpingLandsAsRunningWithFrameReset) {
    const CharacterMachine landed = tr::transition(CharacterState<states::Jumping>(trtest::airborne_context()),
                                                   events::Land{420});
    EXPECT_EQ(tr::state_id(landed), CharacterStateId::Running);
    EXPECT_EQ(tr::context_of(landed).frame, 0);
}

TEST(CharacterStateMachine, SlidingCompletesAfterSlidingFrames) {
    const int sliding_frames = trtest::default_tuning()->sliding_frames;
    CharacterMachine machine = tr::transition(running_machine(), events::Slide{});

    machine = apply_updates(std::move(machine), sliding_frames - 1);
    EXPECT_EQ(tr::state_id(machine), CharacterStateId::Sliding);

    machine = tr::transition(std::move(machine), events::Update{});
    EXPECT_EQ(tr::state_id(machine), CharacterStateId::Running);
    EXPECT_EQ(tr::context_of(machine).frame, 0);
}

TEST(CharacterStateMachine, JumpReturnsToRunningOnTheFloor) {
    CharacterMachine machine = tr::transition(running_machine(), events::Jump{});
    int ticks = 0;
    while (tr::state_id(machine) == CharacterStateId::Jumping && ticks < 500) {
        machine = tr::transition(std::move(machine), events::Update{});
        ticks += 1;
    }
    EXPECT_EQ(tr::state_id(machine), CharacterStateId::Running);
    EXPECT_EQ(tr::context_of(machine).position.y, tr::kFloor);
    EXPECT_EQ(tr::context_of(machine).velocity.y, 0);
    EXPECT_GT(ticks, 1);
}

TEST(CharacterStateMachine, FallingBecomesKnockedOutAtFrameCeiling) {
    const int falling_frames = trtest::default_tuning()->falling_frames;
    CharacterMachine machine = tr::transition(running_machine(), events::KnockOut{});

    machine = apply_updates(std::move(machine), falling_frames - 1);
    EXPECT_EQ(tr::state_id(machine), CharacterStateId::Falling);
    machine = tr::transition(std::move(machine), events::Update{});
    EXPECT_EQ(tr::state_id(machine), CharacterStateId::KnockedOut);
}

TEST(CharacterStateMachine, KnockedOutAbsorbsUpdatesAndPinsFrame) {
    const int falling_frames = trtest::default_tuning()->falling_frames;
    CharacterMachine machine = tr::transition(running_machine(), events::KnockOut{});
    machine = apply_updates(std::move(machine), falling_frames);
    ASSERT_EQ(tr::state_id(machine), CharacterStateId::KnockedOut);

    for (int i = 0; i < 100; ++i) {
        machine = tr::transition(std::move(machine), events::Update{});
        EXPECT_EQ(tr::state_id(machine), CharacterStateId::KnockedOut);
        EXPECT_EQ(tr::context_of(machine).frame, falling_frames - 1);
    }

    for (const Event& revive : {Event{events::Run{}}, Event{events::Jump{}}, Event{events::Slide{}}}) {
        EXPECT_EQ(tr::state_id(tr::transition(machine, revive)), CharacterStateId::KnockedOut);
    }
}

TEST(CharacterStateMachine, AnimationFrameWrapsAtCeiling) {
    const int idle_frames = trtest::default_tuning()->idle_frames;
    CharacterMachine machine = tr::make_idle(trtest::default_tuning(), nullptr, tr::SoundHandle{});
    machine = apply_updates(std::move(machine), idle_frames);
    EXPECT_EQ(tr::context_of(machine).frame, idle_frames);
    machine = tr::transition(std::move(machine), events::Update{});
    EXPECT_EQ(tr::context_of(machine).frame, 0);
}

TEST(CharacterStateMachine, RunThenUpdatesKeepsSingleSpeedIncrement) {
    CharacterMachine machine = apply_updates(running_machine(), 30);
    EXPECT_EQ(tr::state_id(machine), CharacterStateId::Running);
    EXPECT_EQ(tr::context_of(machine).velocity.x, 4);

    machine = tr::transition(std::move(machine), events::Run{});
    machine = tr::transition(std::move(machine), events::Run{});
    EXPECT_EQ(tr::context_of(machine).velocity.x, 4);
}

TEST(Runner, FrameNameAdvancesEveryThreeTicks) {
    tr::Runner runner = trtest::make_runner();
    EXPECT_EQ(runner.frame_name(), "Idle (1).png");
    runner.update();
    runner.update();
    EXPECT_EQ(runner.frame_name(), "Idle (1).png");
    runner.update();
    EXPECT_EQ(runner.frame_name(), "Idle (2).png");

    runner.run_right();
    EXPECT_EQ(runner.frame_name(), "Run (1).png");
    runner.knock_out();
    EXPECT_EQ(runner.frame_name(), "Dead (1).png");
}

TEST(Runner, BoundingBoxInsetsDestination) {
    tr::SpriteSheet sheet;
    sheet.add("Idle (1).png", tr::SpriteFrame{{0, 0, 100, 120}, tr::Rect{5, 7, 110, 130}});
    auto atlas = std::make_shared<const tr::SpriteAtlas>(tr::SpriteAtlas{std::move(sheet), tr::ImageHandle{1, 100, 120}});
    tr::Runner runner(atlas, trtest::default_tuning(), nullptr, tr::SoundHandle{});

    const tr::Rect dest = runner.destination_box();
    EXPECT_EQ(dest.x, tr::kStartingPointX + 5);
    EXPECT_EQ(dest.y, tr::kFloor + 7);
    EXPECT_EQ(dest.width, 100);
    EXPECT_EQ(dest.height, 120);

    const tr::Rect box = runner.bounding_box();
    EXPECT_EQ(box.x, dest.x + 18);
    EXPECT_EQ(box.y, dest.y + 14);
    EXPECT_EQ(box.width, 100 - 28);
    EXPECT_EQ(box.height, 120 - 14);
}

TEST(Runner, MissingFrameAtDrawTimeThrows) {
    tr::SpriteSheet sheet;
    sheet.add("Idle (1).png", tr::SpriteFrame{{0, 0, 100, 120}, std::nullopt});
    auto atlas = std::make_shared<const tr::SpriteAtlas>(tr::SpriteAtlas{std::move(sheet), tr::ImageHandle{1, 100, 120}});
    tr::Runner runner(atlas, trtest::default_tuning(), nullptr, tr::SoundHandle{});
    tr::NullRenderer renderer;

    EXPECT_NO_THROW(runner.draw(renderer));
    runner.run_right();
    EXPECT_THROW(runner.draw(renderer), std::runtime_error);
}

TEST(Runner, DrawIssuesSpriteAndOutline) {
    tr::Runner runner = trtest::make_runner();
    tr::NullRenderer renderer;
    runner.draw(renderer);
    EXPECT_EQ(renderer.images, 1u);
    EXPECT_EQ(renderer.outlines, 1u);
}

} // namespace
