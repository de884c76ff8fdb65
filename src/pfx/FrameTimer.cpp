#include <pfx/FrameTimer.hpp>

namespace pfx {

void FrameTimer::record(double milliseconds) {
    m_last_ms = milliseconds;
    m_total_ms += milliseconds;
    ++m_frame_count;
}

void FrameTimer::reset() {
    m_last_ms = 0.0;
    m_total_ms = 0.0;
    m_frame_count = 0;
}

double FrameTimer::average_ms() const {
    return m_frame_count == 0 ? 0.0 : m_total_ms / static_cast<double>(m_frame_count);
}

} // namespace pfx
