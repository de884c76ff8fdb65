#include <catch2/catch_test_macros.hpp>

#include <pfx/DeviceRecovery.hpp>
#include <pfx/Logger.hpp>

using namespace pfx;
using namespace std::chrono_literals;

TEST_CASE("Device recovery schedules retries with backoff", "[recovery]")
{
    Logger::instance().set_level(spdlog::level::err);

    RecoveryPolicy policy{
        .initial_delay = 100ms,
        .backoff_factor = 2.0,
        .max_delay = 300ms,
        .max_attempts = 4
    };
    DeviceRecovery recovery(policy);
    auto t0 = DeviceRecovery::Clock::time_point{} + 10s;

    REQUIRE(recovery.state() == DeviceRecovery::State::Healthy);
    REQUIRE_FALSE(recovery.should_attempt(t0));

    recovery.on_device_lost(t0);

    SECTION("first attempt waits for the initial delay")
    {
        REQUIRE(recovery.state() == DeviceRecovery::State::WaitingForRetry);
        REQUIRE_FALSE(recovery.should_attempt(t0 + 99ms));
        REQUIRE(recovery.should_attempt(t0 + 100ms));
    }

    SECTION("repeated loss reports do not push the retry back")
    {
        recovery.on_device_lost(t0 + 50ms);
        REQUIRE(recovery.should_attempt(t0 + 100ms));
    }

    SECTION("delay doubles and is capped")
    {
        recovery.on_attempt_failed(t0 + 100ms);
        REQUIRE(recovery.next_delay() == 200ms);
        REQUIRE_FALSE(recovery.should_attempt(t0 + 299ms));
        REQUIRE(recovery.should_attempt(t0 + 300ms));

        recovery.on_attempt_failed(t0 + 300ms);
        REQUIRE(recovery.next_delay() == 300ms);
    }

    SECTION("gives up after the attempt budget")
    {
        auto now = t0;
        for (int i = 0; i < 4; i++) {
            now += recovery.next_delay();
            REQUIRE(recovery.should_attempt(now));
            recovery.on_attempt_failed(now);
        }
        REQUIRE(recovery.state() == DeviceRecovery::State::GaveUp);
        REQUIRE(recovery.attempts() == 4);
        REQUIRE_FALSE(recovery.should_attempt(now + 1h));

        // A lost device after giving up does not restart the schedule
        recovery.on_device_lost(now);
        REQUIRE(recovery.state() == DeviceRecovery::State::GaveUp);
    }

    SECTION("success resets the schedule")
    {
        recovery.on_attempt_failed(t0 + 100ms);
        recovery.on_recovered();
        REQUIRE(recovery.state() == DeviceRecovery::State::Healthy);
        REQUIRE(recovery.attempts() == 0);
        REQUIRE(recovery.next_delay() == 100ms);

        recovery.on_device_lost(t0 + 1s);
        REQUIRE(recovery.should_attempt(t0 + 1100ms));
    }
}

TEST_CASE("Only device loss triggers recovery", "[recovery]")
{
    REQUIRE(DeviceRecovery::is_device_lost(vk::Result::eErrorDeviceLost));
    REQUIRE_FALSE(DeviceRecovery::is_device_lost(vk::Result::eTimeout));
    REQUIRE_FALSE(DeviceRecovery::is_device_lost(vk::Result::eErrorOutOfDeviceMemory));
}
