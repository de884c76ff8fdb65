#pragma once

#include <glm/glm.hpp>
#include <cstddef>
#include <cstdint>
#include <mutex>
#include <optional>
#include <string>
#include <unordered_map>

namespace pfx {

enum class JitterMode {
    Paint,        ///< Fixed 2 px spread, concentrated paint
    Proportional  ///< Spread of size * 0.2
};

/**
 * @brief Per-session brush settings applied when input events are turned into particles
 */
struct BrushRecord {
    std::string name = "default";
    float size_scale = 1.0f;
    std::optional<glm::vec4> color_override;  ///< Premultiplied; replaces the event color when set
    float lifetime = 8.0f;                    ///< Seconds
    float lifetime_jitter = 0.1f;             ///< Relative, 0.1 = +-10%
    uint32_t particles_per_event = 1;
    JitterMode jitter_mode = JitterMode::Paint;

    /// Radius of the position jitter disk for a particle of the given size
    [[nodiscard]] float jitter_radius(float size) const {
        return jitter_mode == JitterMode::Paint ? 2.0f : size * 0.2f;
    }
};

/**
 * @brief Session id -> brush map with a default record for unknown sessions
 *
 * Safe to use from the input thread and the frame thread at the same time.
 */
class BrushRegistry {
public:
    explicit BrushRegistry(BrushRecord default_brush = {});

    void set(int32_t session, BrushRecord brush);

    /// Brush for a session; the default brush when none was set
    [[nodiscard]] BrushRecord get(int32_t session) const;

    /// @return true if a brush was registered for the session
    bool remove(int32_t session);

    void clear();

    [[nodiscard]] std::size_t size() const;

    void set_default(BrushRecord brush);
    [[nodiscard]] BrushRecord default_brush() const;

private:
    mutable std::mutex m_mutex;
    BrushRecord m_default;
    std::unordered_map<int32_t, BrushRecord> m_brushes;
};

} // namespace pfx
