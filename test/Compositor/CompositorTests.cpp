#include <catch2/catch_test_macros.hpp>
#include <catch2/catch_approx.hpp>

#include "../TestEvents.hpp"
#include <pfx/FrameDriver.hpp>
#include <pfx/Logger.hpp>
#include <pfx/VulkanContext.hpp>
#include <algorithm>
#include <bit>

using namespace pfx;
using pfx::test::paint_event;

namespace {

constexpr int CANVAS = 32;

ParticleSystemConfig compositor_config(CompositeOrdering ordering, uint32_t max_batch_size = 512)
{
    ParticleSystemConfig config;
    config.capacity = 64;
    config.canvas_width = CANVAS;
    config.canvas_height = CANVAS;
    config.max_batch_size = max_batch_size;
    config.stats_log_interval = 0;
    config.composite_ordering = ordering;
    return config;
}

std::vector<glm::vec4> read_color(FrameDriver& driver)
{
    REQUIRE(driver.wait_idle().has_value());
    auto color = driver.get_color_buffer()->download_as<glm::vec4>();
    REQUIRE(color.has_value());
    return *color;
}

std::vector<float> read_depth(FrameDriver& driver)
{
    REQUIRE(driver.wait_idle().has_value());
    auto depth = driver.get_depth_buffer()->download_as<float>();
    REQUIRE(depth.has_value());
    return *depth;
}

std::size_t pixel(int x, int y)
{
    return static_cast<std::size_t>(y) * CANVAS + static_cast<std::size_t>(x);
}

} // namespace

TEST_CASE("Newest paint ends up on top", "[gpu][compositor]")
{
    Logger::instance().set_level(spdlog::level::warn);
    VulkanContext ctx(VulkanContextConfig{.application_name = "Compositor Test"});

    // One event per dispatch, so the blue event gets the later spawn counter
    auto driver_result = FrameDriver::create(ctx, compositor_config(CompositeOrdering::Serial, 1));
    REQUIRE(driver_result.has_value());
    auto& driver = *driver_result;

    std::vector<InputEvent> events{
        paint_event({16.0f, 16.0f}, glm::vec4(1.0f, 0.0f, 0.0f, 1.0f), 8.0f),
        paint_event({16.0f, 16.0f}, glm::vec4(0.0f, 0.0f, 1.0f, 1.0f), 8.0f)
    };
    driver->process_input_events(events);
    driver->update(0.0f);
    REQUIRE(driver->last_dispatch_count() == 2);
    driver->composite();

    auto color = read_color(*driver);
    auto center = color[pixel(16, 16)];
    REQUIRE(center.b > 0.9f);
    REQUIRE(center.r < 0.1f);
    REQUIRE(center.a == Catch::Approx(1.0f));

    SECTION("depth holds the newest particle")
    {
        auto particles = driver->get_active_particles();
        REQUIRE(particles.size() == 2);
        const uint32_t current = driver->spawn_counter();
        auto newest = std::ranges::min(particles, {}, [&](const Particle& p) {
            return particle_depth(p.age, p.spawn_serial, current);
        });
        REQUIRE(newest.color.b > 0.9f);

        auto depth = read_depth(*driver);
        REQUIRE(depth[pixel(16, 16)] == Catch::Approx(particle_depth(newest.age, newest.spawn_serial, current)));
    }

    SECTION("untouched pixels keep the clear values")
    {
        auto depth = read_depth(*driver);
        REQUIRE(color[pixel(0, 0)] == glm::vec4(0.0f));
        REQUIRE(depth[pixel(0, 0)] == Catch::Approx(10'000.0f));
    }

    SECTION("the canvas is rebuilt from scratch each frame")
    {
        driver->update(0.0f);
        driver->composite();
        auto again = read_color(*driver);
        REQUIRE(again[pixel(16, 16)].b > 0.9f);
        REQUIRE(again[pixel(16, 16)].a == Catch::Approx(1.0f));
    }
}

TEST_CASE("Disjoint particles are all drawn in parallel mode", "[gpu][compositor]")
{
    Logger::instance().set_level(spdlog::level::warn);
    VulkanContext ctx(VulkanContextConfig{.application_name = "Compositor Test"});

    auto driver_result = FrameDriver::create(ctx, compositor_config(CompositeOrdering::Parallel));
    REQUIRE(driver_result.has_value());
    auto& driver = *driver_result;

    std::vector<InputEvent> events{
        paint_event({6.0f, 6.0f}, glm::vec4(1.0f, 0.0f, 0.0f, 1.0f), 10.0f),
        paint_event({24.0f, 24.0f}, glm::vec4(0.0f, 1.0f, 0.0f, 1.0f), 10.0f)
    };
    driver->process_input_events(events);
    driver->update(0.0f);
    driver->composite();

    auto color = read_color(*driver);
    REQUIRE(color[pixel(6, 6)].r > 0.9f);
    REQUIRE(color[pixel(24, 24)].g > 0.9f);
    REQUIRE(color[pixel(15, 15)] == glm::vec4(0.0f));
}

TEST_CASE("Atlas sprites tint the texel by the particle color", "[gpu][compositor][atlas]")
{
    Logger::instance().set_level(spdlog::level::warn);
    VulkanContext ctx(VulkanContextConfig{.application_name = "Compositor Test"});

    auto driver_result = FrameDriver::create(ctx, compositor_config(CompositeOrdering::Serial));
    REQUIRE(driver_result.has_value());
    auto& driver = *driver_result;

    // 4 px tiles, white at half alpha
    constexpr uint32_t tile = 4;
    AtlasImage image{
        .width = tile * ATLAS_TILE_COUNT,
        .height = tile,
        .pixels = std::vector<uint32_t>(tile * tile * ATLAS_TILE_COUNT, pack_rgba8(255, 255, 255, 128))
    };
    REQUIRE(driver->set_atlas(image).has_value());

    // Tiny proportional jitter keeps the particle inside pixel (16, 16)
    driver->brushes().set_default(BrushRecord{.name = "precise", .jitter_mode = JitterMode::Proportional});
    auto event = paint_event({16.5f, 16.5f}, glm::vec4(1.0f, 0.0f, 0.0f, 1.0f), 1.0f);
    driver->process_input_events({&event, 1});
    driver->update(0.0f);
    driver->composite();

    auto color = read_color(*driver);
    auto texel_alpha = 128.0f / 255.0f;

    SECTION("sprite covers the tile around the particle")
    {
        auto center = color[pixel(16, 16)];
        REQUIRE(center.a == Catch::Approx(texel_alpha).margin(1e-3));
        REQUIRE(center.r == Catch::Approx(texel_alpha).margin(0.03));
        REQUIRE(center.g < 0.03f);

        REQUIRE(color[pixel(14, 14)].a == Catch::Approx(texel_alpha).margin(1e-3));
        REQUIRE(color[pixel(17, 17)].a == Catch::Approx(texel_alpha).margin(1e-3));
        REQUIRE(color[pixel(18, 18)] == glm::vec4(0.0f));
        REQUIRE(color[pixel(13, 16)] == glm::vec4(0.0f));
    }

    SECTION("removing the atlas falls back to disks")
    {
        REQUIRE(driver->set_atlas(std::nullopt).has_value());
        driver->update(0.0f);
        driver->composite();
        auto disk = read_color(*driver);
        REQUIRE(disk[pixel(16, 16)].a == Catch::Approx(1.0f));
    }

    SECTION("malformed atlases are rejected")
    {
        AtlasImage bad{.width = 10, .height = 4, .pixels = std::vector<uint32_t>(40, 0u)};
        REQUIRE_FALSE(driver->set_atlas(bad).has_value());
    }
}

TEST_CASE("Clearing wipes particles and canvas", "[gpu][compositor]")
{
    Logger::instance().set_level(spdlog::level::warn);
    VulkanContext ctx(VulkanContextConfig{.application_name = "Compositor Test"});

    auto driver_result = FrameDriver::create(ctx, compositor_config(CompositeOrdering::Parallel));
    REQUIRE(driver_result.has_value());
    auto& driver = *driver_result;

    auto event = paint_event({16.0f, 16.0f});
    driver->process_input_events({&event, 1});
    driver->update(0.0f);
    driver->composite();
    REQUIRE(driver->get_statistics().alive_count == 1);

    driver->process_input_events({&event, 1});
    driver->clear_all();

    auto counters = driver->get_frame_counters();
    REQUIRE(counters.alive_count == 0);
    REQUIRE(counters.freelist_count == 64);

    auto color = read_color(*driver);
    REQUIRE(std::ranges::all_of(color, [](const glm::vec4& c) { return c == glm::vec4(0.0f); }));

    // The event queued before the clear is gone too
    driver->update(0.0f);
    REQUIRE(driver->last_dispatch_count() == 0);
    REQUIRE(driver->get_statistics().alive_count == 0);
}

TEST_CASE("Resizing reallocates the render targets", "[gpu][compositor]")
{
    Logger::instance().set_level(spdlog::level::err);
    VulkanContext ctx(VulkanContextConfig{.application_name = "Compositor Test"});

    auto driver_result = FrameDriver::create(ctx, compositor_config(CompositeOrdering::Parallel));
    REQUIRE(driver_result.has_value());
    auto& driver = *driver_result;

    SECTION("new size is used for both targets")
    {
        driver->resize(40, 30);
        REQUIRE(driver->config().canvas_width == 40);
        REQUIRE(driver->config().canvas_height == 30);
        REQUIRE(driver->get_color_buffer()->size() == 40 * 30 * sizeof(glm::vec4));
        REQUIRE(driver->get_depth_buffer()->size() == 40 * 30 * sizeof(float));

        auto event = paint_event({35.0f, 25.0f}, glm::vec4(1.0f), 12.0f);
        driver->process_input_events({&event, 1});
        driver->update(0.0f);
        driver->composite();

        REQUIRE(driver->wait_idle().has_value());
        auto color = driver->get_color_buffer()->download_as<glm::vec4>();
        REQUIRE(color.has_value());
        REQUIRE((*color)[25 * 40 + 35].a == Catch::Approx(1.0f));
    }

    SECTION("size is clamped")
    {
        driver->resize(0, 20'000);
        REQUIRE(driver->config().canvas_width == MIN_CANVAS_EXTENT);
        REQUIRE(driver->config().canvas_height == MAX_CANVAS_EXTENT);
    }
}

TEST_CASE("A refused buffer resize keeps the old buffer", "[gpu][compositor]")
{
    Logger::instance().set_level(spdlog::level::off);
    VulkanContext ctx(VulkanContextConfig{.application_name = "Compositor Test"});

    auto buffer = GpuBuffer::create(ctx, {
        .size = 64 * sizeof(float),
        .location = MemoryLocation::DeviceLocal,
        .name = "resize target"
    });
    REQUIRE(buffer.has_value());
    REQUIRE(buffer->fill(std::bit_cast<uint32_t>(2.5f)).has_value());
    const vk::Buffer handle = buffer->buffer();

    REQUIRE_FALSE(buffer->resize(0).has_value());
    REQUIRE(buffer->buffer() == handle);
    REQUIRE(buffer->size() == 64 * sizeof(float));

    auto values = buffer->download_as<float>();
    REQUIRE(values.has_value());
    REQUIRE(std::ranges::all_of(*values, [](float v) { return v == 2.5f; }));

    SECTION("a successful resize swaps in a usable buffer")
    {
        REQUIRE(buffer->resize(16 * sizeof(float)).has_value());
        REQUIRE(buffer->size() == 16 * sizeof(float));
        REQUIRE(buffer->fill(0u).has_value());
        auto resized = buffer->download_as<float>();
        REQUIRE(resized.has_value());
        REQUIRE(resized->size() == 16);
    }
}

TEST_CASE("Repeated resizes keep the compositor bound to live targets", "[gpu][compositor]")
{
    Logger::instance().set_level(spdlog::level::err);
    VulkanContext ctx(VulkanContextConfig{.application_name = "Compositor Test"});

    auto driver_result = FrameDriver::create(ctx, compositor_config(CompositeOrdering::Parallel));
    REQUIRE(driver_result.has_value());
    auto& driver = *driver_result;

    for (int extent : {48, 24, 64}) {
        driver->resize(extent, extent);
        REQUIRE(driver->is_initialized());

        auto event = paint_event({12.0f, 12.0f}, glm::vec4(1.0f), 12.0f);
        driver->process_input_events({&event, 1});
        driver->update(0.0f);
        driver->composite();

        REQUIRE(driver->wait_idle().has_value());
        auto color = driver->get_color_buffer()->download_as<glm::vec4>();
        REQUIRE(color.has_value());
        REQUIRE(color->size() == static_cast<std::size_t>(extent * extent));
        REQUIRE((*color)[12 * static_cast<std::size_t>(extent) + 12].a == Catch::Approx(1.0f));
    }
}
