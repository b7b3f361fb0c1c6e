#include <doctest/doctest.h>

#include <smileys/app/EventLoop.hpp>
#include <smileys/backend/SoftwareBackend.hpp>
#include <smileys/scene/Scene.hpp>

#include <chrono>
#include <cstdlib>
#include <utility>

using namespace SM;
using namespace SM::Backend;

namespace {

struct LoopFixture {
    SoftwareBackend backend{SoftwareBackend::Options{.seed = 2024}};
    Scene::SmileyScene scene = make_scene(backend);

    static auto make_scene(SoftwareBackend& backend) -> Scene::SmileyScene {
        auto scene = Scene::create_scene(backend, Scene::SceneLayout{});
        REQUIRE(scene.has_value());
        return std::move(*scene);
    }
};

} // namespace

TEST_SUITE("app.eventloop") {

TEST_CASE_FIXTURE(LoopFixture, "Pointer press moves the primary smiley and redraws once") {
    App::EventLoop loop{backend, scene};
    backend.queue_event(Event::pointer_press(120, 80));
    REQUIRE(loop.step().has_value());

    CHECK(scene.primary.entity().position() == Point{120, 80});
    CHECK(scene.secondary.entity().position() == Point{200, 160});
    CHECK(backend.present_count() == 1);
    CHECK(loop.state().events_dispatched == 1);
    CHECK(backend.window().pixel(75, 35) == scene.primary.color());
}

TEST_CASE_FIXTURE(LoopFixture, "Tick fires only after a full interval") {
    App::EventLoop loop{backend, scene};
    auto const primary_before = scene.primary.color();

    auto early = loop.check_tick(99);
    REQUIRE(early.has_value());
    CHECK_FALSE(*early);
    CHECK(backend.present_count() == 0);

    auto due = loop.check_tick(100);
    REQUIRE(due.has_value());
    CHECK(*due);
    CHECK(loop.state().last_tick_ms == 100);
    CHECK(loop.state().ticks == 1);
    CHECK(backend.present_count() == 1);
    CHECK(scene.primary.color().a == 255);
    CHECK(std::abs(int{scene.primary.color().r} - int{primary_before.r}) <= 30);

    auto again = loop.check_tick(199);
    REQUIRE(again.has_value());
    CHECK_FALSE(*again);
    auto next = loop.check_tick(200);
    REQUIRE(next.has_value());
    CHECK(*next);
    CHECK(loop.state().ticks == 2);
}

TEST_CASE_FIXTURE(LoopFixture, "Tick interval comes from the loop options") {
    App::LoopOptions options;
    options.tick_interval = std::chrono::milliseconds{250};
    App::EventLoop loop{backend, scene, options};
    CHECK(loop.options().tick_interval == std::chrono::milliseconds{250});

    auto early = loop.check_tick(249);
    REQUIRE(early.has_value());
    CHECK_FALSE(*early);
    auto due = loop.check_tick(250);
    REQUIRE(due.has_value());
    CHECK(*due);
    CHECK(loop.state().last_tick_ms == 250);
}

TEST_CASE_FIXTURE(LoopFixture, "Clock going backwards does not tick") {
    backend.set_time_ms(500);
    App::EventLoop loop{backend, scene};
    auto ticked = loop.check_tick(400);
    REQUIRE(ticked.has_value());
    CHECK_FALSE(*ticked);
    CHECK(loop.state().last_tick_ms == 500);
}

TEST_CASE_FIXTURE(LoopFixture, "Idle polling drives ticks from the backend clock") {
    App::EventLoop loop{backend, scene};
    for (int i = 0; i < 11; ++i) {
        REQUIRE(loop.step().has_value());
    }
    CHECK(backend.now_ms() == 110);
    CHECK(loop.state().ticks == 1);
    CHECK(backend.present_count() == 1);
}

TEST_CASE_FIXTURE(LoopFixture, "Escape and Q end the loop without drawing again") {
    SUBCASE("Escape") {
        backend.queue_event(Event::key_press(Key::Escape));
    }
    SUBCASE("Q") {
        backend.queue_event(Event::key_press(Key::Q));
    }
    SUBCASE("Window close") {
        backend.queue_event(Event::quit());
    }
    App::EventLoop loop{backend, scene};
    REQUIRE(loop.run().has_value());
    CHECK(loop.state().done);
    CHECK(backend.present_count() == 1);
    CHECK(loop.renderer().frames_rendered() == 1);
}

TEST_CASE_FIXTURE(LoopFixture, "Arrow keys move the secondary smiley by the step") {
    App::EventLoop loop{backend, scene};
    REQUIRE(loop.handle_event(Event::key_press(Key::Left)).has_value());
    CHECK(scene.secondary.entity().position() == Point{180, 160});
    REQUIRE(loop.handle_event(Event::key_press(Key::Right)).has_value());
    CHECK(scene.secondary.entity().position() == Point{200, 160});
    REQUIRE(loop.handle_event(Event::key_press(Key::Up)).has_value());
    CHECK(scene.secondary.entity().position() == Point{200, 140});
    REQUIRE(loop.handle_event(Event::key_press(Key::Down)).has_value());
    REQUIRE(loop.handle_event(Event::key_press(Key::Down)).has_value());
    CHECK(scene.secondary.entity().position() == Point{200, 180});

    CHECK(scene.primary.entity().position() == Point{320, 240});
    CHECK(backend.present_count() == 5);
}

TEST_CASE_FIXTURE(LoopFixture, "Space recolors both smileys within the random range") {
    App::EventLoop loop{backend, scene};
    REQUIRE(loop.handle_event(Event::key_press(Key::Space)).has_value());
    for (auto const color : {scene.primary.color(), scene.secondary.color()}) {
        for (int channel : {int{color.r}, int{color.g}, int{color.b}}) {
            CHECK(channel >= 50);
            CHECK(channel <= 224);
        }
        CHECK(color.a == 255);
    }
    CHECK(backend.present_count() == 1);
}

TEST_CASE_FIXTURE(LoopFixture, "Window events redraw, unknown input is ignored") {
    App::EventLoop loop{backend, scene};
    backend.resize_window(800, 600);
    REQUIRE(loop.step().has_value());
    CHECK(backend.present_count() == 1);
    CHECK(backend.last_frame()->width == 800);
    CHECK(backend.window().pixel(799, 599) == Colors::Background);

    REQUIRE(loop.handle_event(Event::key_press(Key::Unknown)).has_value());
    REQUIRE(loop.handle_event(Event{}).has_value());
    CHECK(backend.present_count() == 1);
    CHECK_FALSE(loop.state().done);
}

TEST_CASE_FIXTURE(LoopFixture, "dispatch_event reports the follow-up action") {
    App::LoopOptions options;
    auto quit = App::dispatch_event(Event::quit(), scene, options);
    REQUIRE(quit.has_value());
    CHECK(*quit == App::DispatchAction::Quit);

    auto press = App::dispatch_event(Event::pointer_press(1, 2), scene, options);
    REQUIRE(press.has_value());
    CHECK(*press == App::DispatchAction::Redraw);
    CHECK(scene.primary.entity().position() == Point{1, 2});

    options.move_step = 7;
    REQUIRE(App::dispatch_event(Event::key_press(Key::Right), scene, options).has_value());
    CHECK(scene.secondary.entity().position() == Point{207, 160});

    auto other = App::dispatch_event(Event{}, scene, options);
    REQUIRE(other.has_value());
    CHECK(*other == App::DispatchAction::None);
}

TEST_CASE_FIXTURE(LoopFixture, "Frame budget stops the loop") {
    App::LoopOptions options;
    options.max_frames = 5;
    App::EventLoop loop{backend, scene, options};
    REQUIRE(loop.run().has_value());
    CHECK(loop.renderer().frames_rendered() == 5);
    CHECK(loop.state().ticks == 4);
    CHECK_FALSE(loop.state().done);
}

TEST_CASE_FIXTURE(LoopFixture, "Allocation failure during a tick is reported") {
    App::EventLoop loop{backend, scene};
    backend.set_fail_allocations(true);
    auto ticked = loop.check_tick(100);
    REQUIRE_FALSE(ticked.has_value());
    CHECK(ticked.error().code == Error::Code::MemoryAllocationFailed);
}

}
