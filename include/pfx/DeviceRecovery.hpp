#pragma once

#include <vulkan/vulkan.hpp>
#include <chrono>
#include <cstdint>

namespace pfx {

/**
 * @brief Backoff schedule for rebuilding GPU state after a device loss
 */
struct RecoveryPolicy {
    std::chrono::milliseconds initial_delay{100};
    double backoff_factor = 2.0;
    std::chrono::milliseconds max_delay{5000};
    uint32_t max_attempts = 8;
};

/**
 * @brief Device-loss state machine, free of any Vulkan objects
 *
 * Healthy -> WaitingForRetry on a loss. Each failed attempt doubles the delay
 * (capped) until max_attempts is reached, then GaveUp. A successful attempt
 * returns to Healthy and resets the schedule.
 */
class DeviceRecovery {
public:
    using Clock = std::chrono::steady_clock;

    enum class State {
        Healthy,
        WaitingForRetry,
        GaveUp
    };

    explicit DeviceRecovery(const RecoveryPolicy& policy = {});

    /// Record a loss. Ignored while a retry is already scheduled or after giving up.
    void on_device_lost(Clock::time_point now);

    [[nodiscard]] bool should_attempt(Clock::time_point now) const;

    /// Schedule the next attempt, or give up once the attempt budget is spent.
    void on_attempt_failed(Clock::time_point now);

    void on_recovered();

    [[nodiscard]] State state() const { return m_state; }
    [[nodiscard]] uint32_t attempts() const { return m_attempts; }
    [[nodiscard]] std::chrono::milliseconds next_delay() const { return m_next_delay; }
    [[nodiscard]] Clock::time_point next_attempt_at() const { return m_next_attempt; }

    [[nodiscard]] static bool is_device_lost(vk::Result result) {
        return result == vk::Result::eErrorDeviceLost;
    }

private:
    void schedule(Clock::time_point now);

    RecoveryPolicy m_policy;
    State m_state = State::Healthy;
    uint32_t m_attempts = 0;
    std::chrono::milliseconds m_next_delay;
    Clock::time_point m_next_attempt{};
};

} // namespace pfx
