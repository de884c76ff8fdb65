#include <catch2/catch_test_macros.hpp>

#include "../TestEvents.hpp"
#include <pfx/FrameDriver.hpp>
#include <pfx/Logger.hpp>
#include <pfx/VulkanContext.hpp>
#include <chrono>
#include <thread>

using namespace pfx;
using namespace std::chrono_literals;
using pfx::test::event_grid;
using pfx::test::paint_event;

namespace {

ParticleSystemConfig driver_config()
{
    ParticleSystemConfig config;
    config.capacity = 512;
    config.canvas_width = 64;
    config.canvas_height = 64;
    config.stats_log_interval = 2;
    config.recovery = RecoveryPolicy{
        .initial_delay = 20ms,
        .backoff_factor = 2.0,
        .max_delay = 100ms,
        .max_attempts = 3
    };
    return config;
}

} // namespace

TEST_CASE("Frame driver reports statistics", "[gpu][driver]")
{
    Logger::instance().set_level(spdlog::level::warn);
    VulkanContext ctx(VulkanContextConfig{.application_name = "Driver Test"});

    auto driver_result = FrameDriver::create(ctx, driver_config());
    REQUIRE(driver_result.has_value());
    auto& driver = *driver_result;

    REQUIRE(driver->is_initialized());
    REQUIRE(driver->get_particle_buffer() != nullptr);
    REQUIRE(driver->get_depth_buffer() != nullptr);
    REQUIRE(driver->get_color_buffer() != nullptr);
    REQUIRE(driver->get_gpu_memory_usage_mb() > 0.0);

    auto events = event_grid(100);
    driver->process_input_events(events);
    driver->update(0.016f);
    driver->composite();
    driver->update(0.016f);

    auto stats = driver->get_statistics();
    REQUIRE(stats.capacity == 512);
    REQUIRE(stats.alive_count == 100);
    REQUIRE(stats.last_frame_ms >= 0.0);
    REQUIRE(stats.average_frame_ms >= 0.0);
    REQUIRE(driver->frame_index() == 2);
    REQUIRE(driver->get_freelist_count() == 412);
}

TEST_CASE("Invalid config is clamped at creation", "[gpu][driver]")
{
    Logger::instance().set_level(spdlog::level::err);
    VulkanContext ctx(VulkanContextConfig{.application_name = "Driver Test"});

    auto config = driver_config();
    config.max_batch_size = 100'000;
    config.canvas_width = 0;

    auto driver_result = FrameDriver::create(ctx, config);
    REQUIRE(driver_result.has_value());
    REQUIRE((*driver_result)->config().max_batch_size == MAX_SPAWN_BATCH);
    REQUIRE((*driver_result)->config().canvas_width == MIN_CANVAS_EXTENT);
}

TEST_CASE("Input beyond the pending limit drops the oldest events", "[gpu][driver]")
{
    Logger::instance().set_level(spdlog::level::err);
    VulkanContext ctx(VulkanContextConfig{.application_name = "Driver Test"});

    auto config = driver_config();
    config.max_batch_size = 4;
    config.max_pending_events = 8;
    auto driver_result = FrameDriver::create(ctx, config);
    REQUIRE(driver_result.has_value());
    auto& driver = *driver_result;

    auto events = event_grid(12);
    driver->process_input_events(events);
    REQUIRE(driver->dropped_input_events() == 4);

    driver->update(0.016f);
    REQUIRE(driver->last_dispatch_count() == 2);
    REQUIRE(driver->get_statistics().alive_count == 8);
}

TEST_CASE("Frame driver rebuilds after a device loss", "[gpu][driver][recovery]")
{
    Logger::instance().set_level(spdlog::level::err);
    VulkanContext ctx(VulkanContextConfig{.application_name = "Driver Test"});

    auto driver_result = FrameDriver::create(ctx, driver_config());
    REQUIRE(driver_result.has_value());
    auto& driver = *driver_result;

    auto event = paint_event({10.0f, 10.0f});
    driver->process_input_events({&event, 1});
    driver->update(0.016f);
    REQUIRE(driver->get_statistics().alive_count == 1);

    int resets = 0;
    driver->set_device_reset_handler([&resets](VulkanContext&) -> std::expected<void, std::string> {
        ++resets;
        return {};
    });

    driver->notify_device_lost();

    SECTION("every operation is a no-op while uninitialized")
    {
        REQUIRE_FALSE(driver->is_initialized());
        REQUIRE(driver->recovery().state() == DeviceRecovery::State::WaitingForRetry);
        REQUIRE(driver->get_particle_buffer() == nullptr);
        REQUIRE(driver->get_depth_buffer() == nullptr);
        REQUIRE(driver->get_color_buffer() == nullptr);
        REQUIRE(driver->get_statistics().alive_count == 0);
        REQUIRE(driver->get_freelist_count() == 0);
        REQUIRE(driver->get_active_particles().empty());
        REQUIRE(driver->get_gpu_memory_usage_mb() == 0.0);
        REQUIRE_FALSE(driver->wait_idle().has_value());

        driver->process_input_events({&event, 1});
        driver->composite();
        driver->clear_all();
        driver->resize(10, 10);
        REQUIRE(driver->config().canvas_width == 64);
    }

    SECTION("no attempt before the backoff delay")
    {
        driver->update(0.016f);
        REQUIRE_FALSE(driver->is_initialized());
        REQUIRE(resets == 0);
    }

    SECTION("state comes back empty after the delay")
    {
        std::this_thread::sleep_for(50ms);
        driver->update(0.016f);
        REQUIRE(resets == 1);
        REQUIRE(driver->is_initialized());
        REQUIRE(driver->recovery().state() == DeviceRecovery::State::Healthy);

        auto counters = driver->get_frame_counters();
        REQUIRE(counters.alive_count == 0);
        REQUIRE(counters.freelist_count == 512);

        driver->process_input_events({&event, 1});
        driver->update(0.016f);
        REQUIRE(driver->get_statistics().alive_count == 1);
    }
}

TEST_CASE("Frame driver gives up after repeated failed resets", "[gpu][driver][recovery]")
{
    Logger::instance().set_level(spdlog::level::off);
    VulkanContext ctx(VulkanContextConfig{.application_name = "Driver Test"});

    auto driver_result = FrameDriver::create(ctx, driver_config());
    REQUIRE(driver_result.has_value());
    auto& driver = *driver_result;

    int resets = 0;
    driver->set_device_reset_handler([&resets](VulkanContext&) -> std::expected<void, std::string> {
        ++resets;
        return std::unexpected("device still lost");
    });
    driver->notify_device_lost();

    for (int i = 0; i < 20 && driver->recovery().state() != DeviceRecovery::State::GaveUp; i++) {
        std::this_thread::sleep_for(110ms);
        driver->update(0.016f);
    }

    REQUIRE(driver->recovery().state() == DeviceRecovery::State::GaveUp);
    REQUIRE(resets == 3);
    REQUIRE_FALSE(driver->is_initialized());

    std::this_thread::sleep_for(110ms);
    driver->update(0.016f);
    REQUIRE(resets == 3);
}

TEST_CASE("Default reset handler recreates the logical device", "[gpu][driver][recovery]")
{
    Logger::instance().set_level(spdlog::level::err);
    VulkanContext ctx(VulkanContextConfig{.application_name = "Driver Test"});

    auto driver_result = FrameDriver::create(ctx, driver_config());
    REQUIRE(driver_result.has_value());
    auto& driver = *driver_result;
    REQUIRE(driver->set_atlas(TextureAtlas::generate_soft_brushes(8)).has_value());

    auto generation = ctx.device_generation();
    driver->notify_device_lost();
    std::this_thread::sleep_for(50ms);
    driver->update(0.016f);

    REQUIRE(driver->is_initialized());
    REQUIRE(ctx.device_generation() == generation + 1);

    auto event = paint_event({32.0f, 32.0f});
    driver->process_input_events({&event, 1});
    driver->update(0.016f);
    driver->composite();
    REQUIRE(driver->get_statistics().alive_count == 1);
}
