#include <pfx/BrushRegistry.hpp>
#include <pfx/Logger.hpp>
#include <algorithm>

namespace pfx {

namespace {

BrushRecord sanitize(BrushRecord brush)
{
    if (brush.particles_per_event == 0) {
        Logger::instance().warn("Brush '{}' spawns no particles, using 1 per event", brush.name);
        brush.particles_per_event = 1;
    }
    if (brush.lifetime <= 0.0f) {
        Logger::instance().warn("Brush '{}' has lifetime {}, using 8 s", brush.name, brush.lifetime);
        brush.lifetime = 8.0f;
    }
    brush.lifetime_jitter = std::clamp(brush.lifetime_jitter, 0.0f, 0.99f);
    brush.size_scale = std::max(brush.size_scale, 0.0f);
    return brush;
}

} // anonymous namespace

BrushRegistry::BrushRegistry(BrushRecord default_brush)
    : m_default(sanitize(std::move(default_brush)))
{}

void BrushRegistry::set(int32_t session, BrushRecord brush) {
    std::lock_guard lock(m_mutex);
    m_brushes.insert_or_assign(session, sanitize(std::move(brush)));
}

BrushRecord BrushRegistry::get(int32_t session) const {
    std::lock_guard lock(m_mutex);
    if (auto it = m_brushes.find(session); it != m_brushes.end()) {
        return it->second;
    }
    return m_default;
}

bool BrushRegistry::remove(int32_t session) {
    std::lock_guard lock(m_mutex);
    return m_brushes.erase(session) > 0;
}

void BrushRegistry::clear() {
    std::lock_guard lock(m_mutex);
    m_brushes.clear();
}

std::size_t BrushRegistry::size() const {
    std::lock_guard lock(m_mutex);
    return m_brushes.size();
}

void BrushRegistry::set_default(BrushRecord brush) {
    std::lock_guard lock(m_mutex);
    m_default = sanitize(std::move(brush));
}

BrushRecord BrushRegistry::default_brush() const {
    std::lock_guard lock(m_mutex);
    return m_default;
}

} // namespace pfx
