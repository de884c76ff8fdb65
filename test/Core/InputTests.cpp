#include <catch2/catch_test_macros.hpp>
#include <catch2/catch_approx.hpp>

#include <pfx/BrushRegistry.hpp>
#include <pfx/EventQueue.hpp>
#include <pfx/FrameTimer.hpp>
#include <pfx/Logger.hpp>
#include <pfx/StrokeTracker.hpp>
#include <thread>
#include <vector>

using namespace pfx;

namespace {

InputEvent event_at(float x, int32_t session = 0)
{
    InputEvent e;
    e.position = glm::vec2(x, 0.0f);
    e.session_id = session;
    return e;
}

} // namespace

TEST_CASE("Event queue keeps arrival order and drops oldest when full", "[input][queue]")
{
    Logger::instance().set_level(spdlog::level::err);
    EventQueue queue(4);

    SECTION("drain returns everything in order")
    {
        std::vector<InputEvent> events{event_at(1), event_at(2), event_at(3)};
        queue.push(events);
        REQUIRE(queue.size() == 3);

        auto drained = queue.drain();
        REQUIRE(drained.size() == 3);
        REQUIRE(drained[0].position.x == 1.0f);
        REQUIRE(drained[2].position.x == 3.0f);
        REQUIRE(queue.size() == 0);
    }

    SECTION("overflow discards the oldest events")
    {
        std::vector<InputEvent> events{event_at(1), event_at(2), event_at(3), event_at(4), event_at(5), event_at(6)};
        queue.push(events);
        REQUIRE(queue.size() == 4);
        REQUIRE(queue.dropped() == 2);

        auto drained = queue.drain();
        REQUIRE(drained.front().position.x == 3.0f);
        REQUIRE(drained.back().position.x == 6.0f);
    }

    SECTION("clear empties without counting drops")
    {
        std::vector<InputEvent> events{event_at(1), event_at(2)};
        queue.push(events);
        queue.clear();
        REQUIRE(queue.size() == 0);
        REQUIRE(queue.dropped() == 0);
    }

    SECTION("concurrent producers lose nothing below capacity")
    {
        EventQueue big(10'000);
        std::vector<std::thread> producers;
        for (int t = 0; t < 4; t++) {
            producers.emplace_back([&big, t]() {
                for (int i = 0; i < 500; i++) {
                    auto e = event_at(static_cast<float>(i), t);
                    big.push({&e, 1});
                }
            });
        }
        for (auto& producer : producers) {
            producer.join();
        }
        REQUIRE(big.size() == 2000);
        REQUIRE(big.dropped() == 0);
    }
}

TEST_CASE("Brush registry falls back to the default brush", "[input][brush]")
{
    Logger::instance().set_level(spdlog::level::err);
    BrushRegistry brushes(BrushRecord{.name = "base", .lifetime = 5.0f});

    SECTION("unknown sessions get the default")
    {
        REQUIRE(brushes.get(42).name == "base");
        REQUIRE(brushes.get(42).lifetime == Catch::Approx(5.0f));
    }

    SECTION("set, replace and remove")
    {
        brushes.set(1, BrushRecord{.name = "ink"});
        REQUIRE(brushes.get(1).name == "ink");
        REQUIRE(brushes.size() == 1);

        brushes.set(1, BrushRecord{.name = "chalk"});
        REQUIRE(brushes.get(1).name == "chalk");
        REQUIRE(brushes.size() == 1);

        REQUIRE(brushes.remove(1));
        REQUIRE_FALSE(brushes.remove(1));
        REQUIRE(brushes.get(1).name == "base");
    }

    SECTION("invalid values are corrected")
    {
        brushes.set(2, BrushRecord{.name = "broken", .size_scale = -1.0f, .lifetime = 0.0f,
                                   .lifetime_jitter = 3.0f, .particles_per_event = 0});
        auto brush = brushes.get(2);
        REQUIRE(brush.particles_per_event == 1);
        REQUIRE(brush.lifetime > 0.0f);
        REQUIRE(brush.lifetime_jitter < 1.0f);
        REQUIRE(brush.size_scale == 0.0f);
    }

    SECTION("jitter radius follows the mode")
    {
        BrushRecord paint{.jitter_mode = JitterMode::Paint};
        BrushRecord wide{.jitter_mode = JitterMode::Proportional};
        REQUIRE(paint.jitter_radius(50.0f) == Catch::Approx(2.0f));
        REQUIRE(wide.jitter_radius(50.0f) == Catch::Approx(10.0f));
    }
}

TEST_CASE("Stroke tracker emits one event per point", "[input][stroke]")
{
    Logger::instance().set_level(spdlog::level::err);
    BrushRegistry brushes;
    brushes.set(3, BrushRecord{.name = "red", .color_override = glm::vec4(0.5f, 0.0f, 0.0f, 0.5f)});
    StrokeTracker tracker(brushes, 10.0f);

    SECTION("begin then continue")
    {
        auto first = tracker.begin_stroke(3, {10.0f, 20.0f}, 0.5f);
        REQUIRE(first.session_id == 3);
        REQUIRE(first.size == Catch::Approx(10.0f));
        REQUIRE(first.color == glm::vec4(0.5f, 0.0f, 0.0f, 0.5f));
        REQUIRE(first.timestamp == Catch::Approx(0.5f));

        auto second = tracker.continue_stroke(3, {12.0f, 20.0f}, 0.5f);
        REQUIRE(second.has_value());
        REQUIRE(second->size == Catch::Approx(5.0f));
        REQUIRE(second->texture_index == ((first.texture_index + 1) & 7u));

        auto stats = tracker.statistics();
        REQUIRE(stats.active_strokes == 1);
        REQUIRE(stats.total_points == 2);
    }

    SECTION("pressure is clamped to the unit range")
    {
        tracker.begin_stroke(3, {0.0f, 0.0f});
        auto event = tracker.continue_stroke(3, {1.0f, 0.0f}, 4.0f);
        REQUIRE(event->size == Catch::Approx(10.0f));
    }

    SECTION("sessions without a brush paint white")
    {
        auto event = tracker.begin_stroke(8, {0.0f, 0.0f});
        REQUIRE(event.color == glm::vec4(1.0f));
    }

    SECTION("unknown sessions are rejected")
    {
        REQUIRE_FALSE(tracker.continue_stroke(99, {0.0f, 0.0f}).has_value());
        REQUIRE_FALSE(tracker.end_stroke(99));
        REQUIRE(tracker.velocity(99) == 0.0f);
    }

    SECTION("end and clear remove strokes")
    {
        tracker.begin_stroke(1, {0.0f, 0.0f});
        tracker.begin_stroke(2, {0.0f, 0.0f});
        REQUIRE(tracker.end_stroke(1));
        REQUIRE(tracker.statistics().active_strokes == 1);
        tracker.clear();
        REQUIRE(tracker.statistics().active_strokes == 0);
    }
}

TEST_CASE("Frame timer averages recorded frames", "[timer]")
{
    FrameTimer timer;
    REQUIRE(timer.average_ms() == 0.0);

    timer.record(2.0);
    timer.record(4.0);
    REQUIRE(timer.last_ms() == Catch::Approx(4.0));
    REQUIRE(timer.average_ms() == Catch::Approx(3.0));
    REQUIRE(timer.frame_count() == 2);

    timer.reset();
    REQUIRE(timer.frame_count() == 0);
    REQUIRE(timer.last_ms() == 0.0);
}
