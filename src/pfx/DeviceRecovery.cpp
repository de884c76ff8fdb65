#include <pfx/DeviceRecovery.hpp>
#include <pfx/Logger.hpp>
#include <algorithm>

namespace pfx {

DeviceRecovery::DeviceRecovery(const RecoveryPolicy& policy)
    : m_policy(policy)
    , m_next_delay(policy.initial_delay)
{}

void DeviceRecovery::on_device_lost(Clock::time_point now) {
    if (m_state != State::Healthy) {
        return;
    }
    m_state = State::WaitingForRetry;
    m_attempts = 0;
    m_next_delay = m_policy.initial_delay;
    schedule(now);
    Logger::instance().warn("Device lost, first recovery attempt in {} ms", m_next_delay.count());
}

bool DeviceRecovery::should_attempt(Clock::time_point now) const {
    return m_state == State::WaitingForRetry && now >= m_next_attempt;
}

void DeviceRecovery::on_attempt_failed(Clock::time_point now) {
    if (m_state != State::WaitingForRetry) {
        return;
    }

    ++m_attempts;
    if (m_attempts >= m_policy.max_attempts) {
        m_state = State::GaveUp;
        Logger::instance().error("Giving up device recovery after {} attempts", m_attempts);
        return;
    }

    auto grown = std::chrono::duration_cast<std::chrono::milliseconds>(
        std::chrono::duration<double, std::milli>(m_next_delay.count() * m_policy.backoff_factor));
    m_next_delay = std::min(grown, m_policy.max_delay);
    schedule(now);
    Logger::instance().warn("Recovery attempt {} failed, retrying in {} ms", m_attempts, m_next_delay.count());
}

void DeviceRecovery::on_recovered() {
    if (m_state != State::Healthy) {
        Logger::instance().info("Device recovered after {} failed attempts", m_attempts);
    }
    m_state = State::Healthy;
    m_attempts = 0;
    m_next_delay = m_policy.initial_delay;
}

void DeviceRecovery::schedule(Clock::time_point now) {
    m_next_attempt = now + m_next_delay;
}

} // namespace pfx
