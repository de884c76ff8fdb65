#include <pfx/ParticleSystemConfig.hpp>
#include <pfx/ParticleData.hpp>
#include <pfx/Logger.hpp>
#include <algorithm>

namespace pfx {

namespace {

template<class T>
T clamp_logged(T value, T low, T high, std::string_view field)
{
    T clamped = std::clamp(value, low, high);
    if (clamped != value) {
        Logger::instance().warn("Config '{}' = {} out of range, using {}", field, value, clamped);
    }
    return clamped;
}

} // anonymous namespace

ParticleSystemConfig ParticleSystemConfig::validated() const
{
    ParticleSystemConfig out = *this;

    out.capacity = clamp_logged(capacity, 1u, MAX_PARTICLE_CAPACITY, "capacity");
    out.canvas_width = clamp_logged(canvas_width, MIN_CANVAS_EXTENT, MAX_CANVAS_EXTENT, "canvas_width");
    out.canvas_height = clamp_logged(canvas_height, MIN_CANVAS_EXTENT, MAX_CANVAS_EXTENT, "canvas_height");
    out.max_batch_size = clamp_logged(max_batch_size, 1u, MAX_SPAWN_BATCH, "max_batch_size");
    out.max_pending_events = clamp_logged(max_pending_events, out.max_batch_size, 1u << 20, "max_pending_events");
    out.fade_start = clamp_logged(fade_start, 0.0f, 0.99f, "fade_start");
    out.base_lifetime = clamp_logged(base_lifetime, 0.001f, 3600.0f, "base_lifetime");
    out.depth_clear = clamp_logged(depth_clear, 1.0f, 1.0e30f, "depth_clear");

    if (out.recovery.max_attempts == 0) {
        Logger::instance().warn("Config 'recovery.max_attempts' = 0, using 1");
        out.recovery.max_attempts = 1;
    }
    if (out.recovery.backoff_factor < 1.0) {
        Logger::instance().warn("Config 'recovery.backoff_factor' = {} below 1, using 1", out.recovery.backoff_factor);
        out.recovery.backoff_factor = 1.0;
    }

    return out;
}

} // namespace pfx
