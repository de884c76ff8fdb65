#pragma once

#include <cstdint>

namespace pfx {

/**
 * @brief Last and running-average frame time
 */
class FrameTimer {
public:
    void record(double milliseconds);
    void reset();

    [[nodiscard]] double last_ms() const { return m_last_ms; }
    [[nodiscard]] double average_ms() const;
    [[nodiscard]] uint64_t frame_count() const { return m_frame_count; }

private:
    double m_last_ms = 0.0;
    double m_total_ms = 0.0;
    uint64_t m_frame_count = 0;
};

} // namespace pfx
