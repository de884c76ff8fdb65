#include <pfx/StrokeTracker.hpp>
#include <pfx/Logger.hpp>
#include <algorithm>

namespace pfx {

StrokeTracker::StrokeTracker(const BrushRegistry& brushes, float base_size)
    : m_brushes(&brushes)
    , m_base_size(base_size)
{}

InputEvent StrokeTracker::make_event(int32_t session, ActiveStroke& stroke, glm::vec2 position, float pressure,
                                     float timestamp) const
{
    auto brush = m_brushes->get(session);

    InputEvent event;
    event.position = position;
    event.color = brush.color_override.value_or(glm::vec4(1.0f));
    event.size = m_base_size * std::clamp(pressure, 0.0f, 1.0f);
    event.timestamp = timestamp;
    event.session_id = session;
    event.texture_index = stroke.next_texture++ & 7u;
    return event;
}

InputEvent StrokeTracker::begin_stroke(int32_t session, glm::vec2 position, float timestamp) {
    std::lock_guard lock(m_mutex);

    auto now = Clock::now();
    if (m_strokes.contains(session)) {
        Logger::instance().debug("Session {} restarted its stroke", session);
    }

    // Successive strokes start on different atlas tiles
    ActiveStroke stroke{
        .last_position = position,
        .start_time = now,
        .last_time = now,
        .points = 1,
        .velocity = 0.0f,
        .next_texture = m_strokes_started++
    };
    auto event = make_event(session, stroke, position, 1.0f, timestamp);
    m_strokes.insert_or_assign(session, stroke);

    Logger::instance().debug("Stroke started - session {}, position ({:.1f}, {:.1f})", session, position.x, position.y);
    return event;
}

std::optional<InputEvent> StrokeTracker::continue_stroke(int32_t session, glm::vec2 position, float pressure,
                                                         float timestamp)
{
    std::lock_guard lock(m_mutex);

    auto it = m_strokes.find(session);
    if (it == m_strokes.end()) {
        Logger::instance().warn("Stroke continued for unknown session {}", session);
        return std::nullopt;
    }
    auto& stroke = it->second;

    auto now = Clock::now();
    auto seconds = std::chrono::duration<float>(now - stroke.last_time).count();
    if (seconds > 0.0f) {
        stroke.velocity = glm::length(position - stroke.last_position) / seconds;
    }
    stroke.last_position = position;
    stroke.last_time = now;
    ++stroke.points;

    return make_event(session, stroke, position, pressure, timestamp);
}

bool StrokeTracker::end_stroke(int32_t session) {
    std::lock_guard lock(m_mutex);

    auto it = m_strokes.find(session);
    if (it == m_strokes.end()) {
        Logger::instance().warn("Stroke ended for unknown session {}", session);
        return false;
    }

    auto duration = std::chrono::duration<double>(Clock::now() - it->second.start_time).count();
    Logger::instance().debug("Stroke ended - session {}, duration {:.2f}s, points {}", session, duration,
                             it->second.points);
    m_strokes.erase(it);
    return true;
}

void StrokeTracker::clear() {
    std::lock_guard lock(m_mutex);
    m_strokes.clear();
}

StrokeStatistics StrokeTracker::statistics() const {
    std::lock_guard lock(m_mutex);
    StrokeStatistics stats{.active_strokes = m_strokes.size()};
    for (const auto& [session, stroke] : m_strokes) {
        stats.total_points += stroke.points;
    }
    return stats;
}

float StrokeTracker::velocity(int32_t session) const {
    std::lock_guard lock(m_mutex);
    auto it = m_strokes.find(session);
    return it == m_strokes.end() ? 0.0f : it->second.velocity;
}

} // namespace pfx
