#pragma once

#include <pfx/ParticleData.hpp>
#include <vector>

namespace pfx::test {

inline InputEvent paint_event(glm::vec2 position, glm::vec4 color = glm::vec4(1.0f), float size = 8.0f,
                              int32_t session = 0)
{
    InputEvent event;
    event.position = position;
    event.color = color;
    event.size = size;
    event.session_id = session;
    return event;
}

/// count events spread along a row, wrapping every 64
inline std::vector<InputEvent> event_grid(uint32_t count)
{
    std::vector<InputEvent> events;
    events.reserve(count);
    for (uint32_t i = 0; i < count; i++) {
        events.push_back(paint_event({static_cast<float>(i % 64), static_cast<float>(i / 64)}));
    }
    return events;
}

} // namespace pfx::test
