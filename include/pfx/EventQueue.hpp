#pragma once

#include "ParticleData.hpp"
#include <cstddef>
#include <cstdint>
#include <deque>
#include <mutex>
#include <span>
#include <vector>

namespace pfx {

/**
 * @brief Bounded queue of input events waiting for the next frame
 *
 * Producers push from any thread; the frame driver drains once per frame.
 * When full, the oldest events are discarded and counted.
 */
class EventQueue {
public:
    explicit EventQueue(std::size_t capacity);

    void push(std::span<const InputEvent> events);

    /// Remove and return every pending event in arrival order
    [[nodiscard]] std::vector<InputEvent> drain();

    void clear();

    [[nodiscard]] std::size_t size() const;
    [[nodiscard]] std::size_t capacity() const { return m_capacity; }

    /// Events discarded because the queue was full, since construction
    [[nodiscard]] uint64_t dropped() const;

private:
    mutable std::mutex m_mutex;
    std::size_t m_capacity;
    std::deque<InputEvent> m_events;
    uint64_t m_dropped = 0;
    bool m_overflowing = false;
};

} // namespace pfx
