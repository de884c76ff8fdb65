#pragma once

#include "BrushRegistry.hpp"
#include "ParticleData.hpp"
#include <chrono>
#include <cstddef>
#include <cstdint>
#include <mutex>
#include <optional>
#include <unordered_map>

namespace pfx {

struct StrokeStatistics {
    std::size_t active_strokes = 0;
    std::size_t total_points = 0;
};

/**
 * @brief Turns per-session stroke begin/continue/end calls into input events
 *
 * Each begin or continue yields one event sized base_size * pressure, colored by the
 * session's brush (white when the brush has no color), with a texture index that
 * advances by one per event. Brush size scale and lifetime are applied later by the
 * spawn pipeline.
 */
class StrokeTracker {
public:
    using Clock = std::chrono::steady_clock;

    explicit StrokeTracker(const BrushRegistry& brushes, float base_size = 4.0f);

    InputEvent begin_stroke(int32_t session, glm::vec2 position, float timestamp = 0.0f);

    /// nullopt when the session has no active stroke
    std::optional<InputEvent> continue_stroke(int32_t session, glm::vec2 position, float pressure = 1.0f,
                                              float timestamp = 0.0f);

    /// @return false when the session had no active stroke
    bool end_stroke(int32_t session);

    void clear();

    [[nodiscard]] StrokeStatistics statistics() const;

    /// Pixels per second of the last segment, 0 for unknown sessions
    [[nodiscard]] float velocity(int32_t session) const;

    void set_base_size(float size) { m_base_size = size; }
    [[nodiscard]] float base_size() const { return m_base_size; }

private:
    struct ActiveStroke {
        glm::vec2 last_position;
        Clock::time_point start_time;
        Clock::time_point last_time;
        std::size_t points = 0;
        float velocity = 0.0f;
        uint32_t next_texture = 0;
    };

    InputEvent make_event(int32_t session, ActiveStroke& stroke, glm::vec2 position, float pressure,
                          float timestamp) const;

    const BrushRegistry* m_brushes;
    float m_base_size;
    uint32_t m_strokes_started = 0;
    mutable std::mutex m_mutex;
    std::unordered_map<int32_t, ActiveStroke> m_strokes;
};

} // namespace pfx
