#include <catch2/catch_test_macros.hpp>
#include <catch2/catch_approx.hpp>

#include "../TestEvents.hpp"
#include <pfx/FrameDriver.hpp>
#include <pfx/Logger.hpp>
#include <pfx/VulkanContext.hpp>
#include <algorithm>
#include <set>

using namespace pfx;
using pfx::test::event_grid;
using pfx::test::paint_event;

namespace {

ParticleSystemConfig small_config(uint32_t capacity)
{
    ParticleSystemConfig config;
    config.capacity = capacity;
    config.canvas_width = 64;
    config.canvas_height = 64;
    config.stats_log_interval = 0;
    return config;
}

} // namespace

TEST_CASE("Spawning is split into capped dispatches", "[gpu][spawn]")
{
    Logger::instance().set_level(spdlog::level::warn);
    VulkanContext ctx(VulkanContextConfig{.application_name = "Lifecycle Test"});

    auto driver_result = FrameDriver::create(ctx, small_config(4096));
    REQUIRE(driver_result.has_value());
    auto& driver = *driver_result;

    auto events = event_grid(2050);
    driver->process_input_events(events);
    driver->update(0.016f);

    REQUIRE(driver->last_dispatch_count() == 5);

    auto counters = driver->get_frame_counters();
    REQUIRE(counters.alive_count == 2050);
    REQUIRE(counters.spawned == 2050);
    REQUIRE(counters.freelist_count == 4096 - 2050);
    REQUIRE(counters.dropped == 0);

    SECTION("each dispatch carries its own spawn counter")
    {
        auto particles = driver->get_active_particles();
        REQUIRE(particles.size() == 2050);

        std::set<uint32_t> dispatches;
        for (const auto& p : particles) {
            dispatches.insert(p.spawn_serial);
            REQUIRE(recency_counter(p.recency_tag) == (p.spawn_serial & RECENCY_COUNTER_MASK));
            REQUIRE(recency_slot(p.recency_tag) < 4096);
            REQUIRE(p.spawn_serial < driver->spawn_counter());
        }
        REQUIRE(dispatches.size() == 5);
    }

    SECTION("no input, no dispatch")
    {
        driver->update(0.016f);
        REQUIRE(driver->last_dispatch_count() == 0);
        REQUIRE(driver->get_statistics().alive_count == 2050);
    }
}

TEST_CASE("Exhausted freelist drops the overflow", "[gpu][spawn]")
{
    Logger::instance().set_level(spdlog::level::err);
    VulkanContext ctx(VulkanContextConfig{.application_name = "Lifecycle Test"});

    auto driver_result = FrameDriver::create(ctx, small_config(1000));
    REQUIRE(driver_result.has_value());
    auto& driver = *driver_result;

    auto events = event_grid(1500);
    driver->process_input_events(events);
    driver->update(0.016f);

    auto counters = driver->get_frame_counters();
    REQUIRE(counters.alive_count == 1000);
    REQUIRE(counters.freelist_count == 0);
    REQUIRE(counters.spawned == 1000);
    REQUIRE(counters.dropped == 500);
    REQUIRE(driver->get_freelist_count() == 0);
}

TEST_CASE("Paint fades out cubically and is recycled once", "[gpu][update][cull]")
{
    Logger::instance().set_level(spdlog::level::warn);
    VulkanContext ctx(VulkanContextConfig{.application_name = "Lifecycle Test"});

    auto driver_result = FrameDriver::create(ctx, small_config(256));
    REQUIRE(driver_result.has_value());
    auto& driver = *driver_result;
    driver->brushes().set_default(BrushRecord{.name = "steady", .lifetime = 10.0f, .lifetime_jitter = 0.0f});

    auto event = paint_event({32.0f, 32.0f});
    driver->process_input_events({&event, 1});

    // Spawned and aged to the fade start in the same frame
    driver->update(6.0f);
    auto particles = driver->get_active_particles();
    REQUIRE(particles.size() == 1);
    REQUIRE(particles[0].max_lifetime == Catch::Approx(10.0f));
    REQUIRE(particles[0].age == Catch::Approx(6.0f));
    REQUIRE(particles[0].color.a == Catch::Approx(1.0f));

    // Halfway through the fade: 1 - 0.5^3
    driver->update(2.0f);
    particles = driver->get_active_particles();
    REQUIRE(particles.size() == 1);
    REQUIRE(particles[0].color.a == Catch::Approx(0.875f).margin(1e-4));

    // Alpha would be about 0.015, below the kill threshold
    driver->update(1.98f);
    REQUIRE(driver->get_active_particles().empty());

    auto counters = driver->get_frame_counters();
    REQUIRE(counters.alive_count == 0);
    REQUIRE(counters.freelist_pushes == 1);
    REQUIRE(counters.freelist_count == 256);

    SECTION("dead slots are not pushed again")
    {
        for (int i = 0; i < 5; i++) {
            driver->update(0.5f);
        }
        counters = driver->get_frame_counters();
        REQUIRE(counters.freelist_pushes == 1);
        REQUIRE(counters.freelist_count == 256);
    }

    SECTION("the freed slot is reused")
    {
        driver->process_input_events({&event, 1});
        driver->update(0.1f);
        counters = driver->get_frame_counters();
        REQUIRE(counters.alive_count == 1);
        REQUIRE(counters.freelist_count == 255);
    }
}

TEST_CASE("Freelist stays a set of dead slots under churn", "[gpu][spawn][cull]")
{
    Logger::instance().set_level(spdlog::level::warn);
    VulkanContext ctx(VulkanContextConfig{.application_name = "Lifecycle Test"});

    constexpr uint32_t capacity = 256;
    auto driver_result = FrameDriver::create(ctx, small_config(capacity));
    REQUIRE(driver_result.has_value());
    auto& driver = *driver_result;
    driver->brushes().set_default(BrushRecord{.name = "short", .lifetime = 1.0f, .lifetime_jitter = 0.0f});
    driver->brushes().set(1, BrushRecord{.name = "long", .lifetime = 100.0f, .lifetime_jitter = 0.0f});

    for (int round = 0; round < 6; round++) {
        auto events = event_grid(40 + static_cast<uint32_t>(round) * 7);
        for (int i = 0; i < 10; i++) {
            events.push_back(paint_event({static_cast<float>(i), 60.0f}, glm::vec4(1.0f), 8.0f, 1));
        }
        driver->process_input_events(events);
        driver->update(0.0f);
        // Short-lived paint dies, long-lived paint survives
        driver->update(1.5f);
    }

    auto particles = driver->get_active_particles();
    REQUIRE(particles.size() == 60);

    auto free_slots = driver->get_free_slots();
    REQUIRE(free_slots.size() == capacity - particles.size());

    std::set<uint32_t> free_set(free_slots.begin(), free_slots.end());
    REQUIRE(free_set.size() == free_slots.size());
    REQUIRE(*free_set.rbegin() < capacity);

    for (const auto& p : particles) {
        REQUIRE(p.session_id == 1);
        REQUIRE_FALSE(free_set.contains(recency_slot(p.recency_tag)));
    }

    auto counters = driver->get_frame_counters();
    REQUIRE(counters.alive_count == 60);
    REQUIRE(counters.freelist_count == static_cast<int32_t>(capacity - 60));
    REQUIRE(counters.dropped == 0);
}

TEST_CASE("Particles expire at the end of their lifetime", "[gpu][update]")
{
    Logger::instance().set_level(spdlog::level::warn);
    VulkanContext ctx(VulkanContextConfig{.application_name = "Lifecycle Test"});

    auto driver_result = FrameDriver::create(ctx, small_config(256));
    REQUIRE(driver_result.has_value());
    auto& driver = *driver_result;
    driver->brushes().set_default(BrushRecord{.name = "short", .lifetime = 1.0f, .lifetime_jitter = 0.0f});

    auto events = event_grid(10);
    driver->process_input_events(events);
    driver->update(0.0f);
    REQUIRE(driver->get_statistics().alive_count == 10);

    driver->update(1.5f);
    REQUIRE(driver->get_statistics().alive_count == 0);
    REQUIRE(driver->get_freelist_count() == 256);
}

TEST_CASE("Brush settings shape spawned particles", "[gpu][spawn][brush]")
{
    Logger::instance().set_level(spdlog::level::warn);
    VulkanContext ctx(VulkanContextConfig{.application_name = "Lifecycle Test"});

    auto driver_result = FrameDriver::create(ctx, small_config(256));
    REQUIRE(driver_result.has_value());
    auto& driver = *driver_result;

    driver->brushes().set(7, BrushRecord{
        .name = "spray",
        .size_scale = 2.0f,
        .color_override = glm::vec4(0.0f, 0.5f, 0.0f, 1.0f),
        .lifetime = 4.0f,
        .lifetime_jitter = 0.25f,
        .particles_per_event = 3,
        .jitter_mode = JitterMode::Proportional
    });

    auto event = paint_event({32.0f, 32.0f}, glm::vec4(1.0f, 0.0f, 0.0f, 1.0f), 10.0f, 7);
    driver->process_input_events({&event, 1});
    driver->update(0.0f);

    auto particles = driver->get_active_particles();
    REQUIRE(particles.size() == 3);

    for (const auto& p : particles) {
        REQUIRE(p.session_id == 7);
        // size 20, jittered by +-10%
        REQUIRE(p.size >= 18.0f - 1e-3f);
        REQUIRE(p.size <= 22.0f + 1e-3f);
        // jitter disk of 20 * 0.2
        REQUIRE(glm::length(glm::vec2(p.position) - event.position) <= 4.0f + 1e-3f);
        REQUIRE(p.max_lifetime >= 3.0f - 1e-3f);
        REQUIRE(p.max_lifetime <= 5.0f + 1e-3f);
        REQUIRE(p.color.r <= 0.05f + 1e-3f);
        REQUIRE(p.color.g == Catch::Approx(0.5f).margin(0.051f));
        REQUIRE(p.color.a == 1.0f);
        REQUIRE(p.velocity == glm::vec3(0.0f));
        REQUIRE(p.in_freelist == 0);
    }

    SECTION("all particles of one event share a dispatch")
    {
        auto counter = recency_counter(particles[0].recency_tag);
        REQUIRE(std::ranges::all_of(particles, [&](const Particle& p) {
            return recency_counter(p.recency_tag) == counter;
        }));
    }
}
