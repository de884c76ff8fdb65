#include <pfx/EventQueue.hpp>
#include <pfx/Logger.hpp>
#include <algorithm>

namespace pfx {

EventQueue::EventQueue(std::size_t capacity)
    : m_capacity(std::max<std::size_t>(capacity, 1))
{}

void EventQueue::push(std::span<const InputEvent> events) {
    std::lock_guard lock(m_mutex);

    m_events.insert(m_events.end(), events.begin(), events.end());
    if (m_events.size() <= m_capacity) {
        return;
    }

    auto overflow = m_events.size() - m_capacity;
    m_events.erase(m_events.begin(), m_events.begin() + static_cast<std::ptrdiff_t>(overflow));
    m_dropped += overflow;

    // One warning per burst; drain() re-arms it
    if (!m_overflowing) {
        Logger::instance().warn("Input queue full ({} events), dropping oldest", m_capacity);
        m_overflowing = true;
    }
}

std::vector<InputEvent> EventQueue::drain() {
    std::lock_guard lock(m_mutex);
    std::vector<InputEvent> out(m_events.begin(), m_events.end());
    m_events.clear();
    m_overflowing = false;
    return out;
}

void EventQueue::clear() {
    std::lock_guard lock(m_mutex);
    m_events.clear();
    m_overflowing = false;
}

std::size_t EventQueue::size() const {
    std::lock_guard lock(m_mutex);
    return m_events.size();
}

uint64_t EventQueue::dropped() const {
    std::lock_guard lock(m_mutex);
    return m_dropped;
}

} // namespace pfx
