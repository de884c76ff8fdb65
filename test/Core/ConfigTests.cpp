#include <catch2/catch_test_macros.hpp>
#include <catch2/catch_approx.hpp>

#include <pfx/Logger.hpp>
#include <pfx/ParticleData.hpp>
#include <pfx/ParticleSystemConfig.hpp>

using namespace pfx;

TEST_CASE("Default config is already valid", "[config]")
{
    Logger::instance().set_level(spdlog::level::warn);
    ParticleSystemConfig config;
    auto checked = config.validated();

    REQUIRE(checked.capacity == 100'000);
    REQUIRE(checked.canvas_width == 1920);
    REQUIRE(checked.canvas_height == 1080);
    REQUIRE(checked.max_batch_size == 512);
    REQUIRE(checked.max_pending_events == 8192);
    REQUIRE(checked.fade_start == Catch::Approx(0.6f));
    REQUIRE(checked.base_lifetime == Catch::Approx(8.0f));
    REQUIRE(checked.depth_clear == Catch::Approx(10'000.0f));
    REQUIRE(checked.composite_ordering == CompositeOrdering::Parallel);
}

TEST_CASE("Out of range config values are clamped", "[config]")
{
    Logger::instance().set_level(spdlog::level::err);

    SECTION("capacity stays addressable by the recency tag")
    {
        ParticleSystemConfig config;
        config.capacity = 5'000'000;
        REQUIRE(config.validated().capacity == MAX_PARTICLE_CAPACITY);

        config.capacity = 0;
        REQUIRE(config.validated().capacity == 1);
    }

    SECTION("spawn batches never exceed 512 events")
    {
        ParticleSystemConfig config;
        config.max_batch_size = 4096;
        REQUIRE(config.validated().max_batch_size == MAX_SPAWN_BATCH);

        config.max_batch_size = 0;
        REQUIRE(config.validated().max_batch_size == 1);
    }

    SECTION("pending event capacity holds at least one batch")
    {
        ParticleSystemConfig config;
        config.max_batch_size = 256;
        config.max_pending_events = 10;
        REQUIRE(config.validated().max_pending_events == 256);
    }

    SECTION("canvas extent is clamped per axis")
    {
        ParticleSystemConfig config;
        config.canvas_width = -4;
        config.canvas_height = 100'000;
        auto checked = config.validated();
        REQUIRE(checked.canvas_width == MIN_CANVAS_EXTENT);
        REQUIRE(checked.canvas_height == MAX_CANVAS_EXTENT);
    }

    SECTION("fade start below one")
    {
        ParticleSystemConfig config;
        config.fade_start = 1.5f;
        REQUIRE(config.validated().fade_start < 1.0f);
        config.fade_start = -1.0f;
        REQUIRE(config.validated().fade_start == 0.0f);
    }

    SECTION("recovery policy keeps at least one attempt and a non-shrinking delay")
    {
        ParticleSystemConfig config;
        config.recovery.max_attempts = 0;
        config.recovery.backoff_factor = 0.5;
        auto checked = config.validated();
        REQUIRE(checked.recovery.max_attempts == 1);
        REQUIRE(checked.recovery.backoff_factor == 1.0);
    }
}
