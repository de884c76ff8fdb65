// Headless stroke replay
// Paints a few synthetic strokes on an offscreen canvas and logs pool statistics each second.
// Usage: headless_strokes [frames] [capacity]

#include <pfx/FrameDriver.hpp>
#include <pfx/Logger.hpp>
#include <pfx/StrokeTracker.hpp>
#include <pfx/TextureAtlas.hpp>
#include <pfx/VulkanContext.hpp>
#include <spdlog/spdlog.h>
#include <cmath>
#include <cstdlib>
#include <format>
#include <numbers>
#include <vector>

int main(int argc, char** argv) {
    Logger::instance().set_level(spdlog::level::info);

    int frames = argc > 1 ? std::atoi(argv[1]) : 600;
    uint32_t capacity = argc > 2 ? static_cast<uint32_t>(std::atoi(argv[2])) : 50'000;
    constexpr float dt = 1.0f / 60.0f;
    constexpr int strokes = 4;

    try {
        pfx::VulkanContext context(pfx::VulkanContextConfig{.application_name = "PaintFX Headless"});

        pfx::ParticleSystemConfig config;
        config.capacity = capacity;
        config.canvas_width = 1024;
        config.canvas_height = 1024;
        config.stats_log_interval = 60;

        auto driver_result = pfx::FrameDriver::create(context, config);
        if (!driver_result) {
            Logger::instance().error("Failed to create frame driver: {}", driver_result.error());
            return 1;
        }
        auto& driver = *driver_result;

        if (auto atlas = driver->set_atlas(pfx::TextureAtlas::generate_soft_brushes(32)); !atlas) {
            Logger::instance().error("Failed to upload atlas: {}", atlas.error());
            return 1;
        }

        for (int32_t session = 0; session < strokes; session++) {
            driver->brushes().set(session, pfx::BrushRecord{
                .name = std::format("stroke{}", session),
                .size_scale = 1.0f + 0.5f * static_cast<float>(session),
                .color_override = glm::vec4(0.2f * static_cast<float>(session), 0.3f, 0.9f - 0.2f * static_cast<float>(session), 1.0f),
                .lifetime = 4.0f,
                .particles_per_event = 8,
                .jitter_mode = pfx::JitterMode::Proportional
            });
        }

        pfx::StrokeTracker tracker(driver->brushes(), 10.0f);
        std::vector<pfx::InputEvent> events;

        for (int frame = 0; frame < frames; frame++) {
            float t = static_cast<float>(frame) * dt;
            events.clear();

            for (int32_t session = 0; session < strokes; session++) {
                float phase = static_cast<float>(session) * std::numbers::pi_v<float> * 0.5f;
                glm::vec2 pos(512.0f + 300.0f * std::cos(t + phase), 512.0f + 300.0f * std::sin(2.0f * t + phase));
                if (frame == 0) {
                    events.push_back(tracker.begin_stroke(session, pos, t));
                } else if (auto event = tracker.continue_stroke(session, pos, 0.5f + 0.5f * std::sin(t), t)) {
                    events.push_back(*event);
                }
            }

            driver->process_input_events(events);
            driver->update(dt);
            driver->composite();
        }

        if (auto waited = driver->wait_idle(); !waited) {
            Logger::instance().error("Final wait failed: {}", waited.error());
            return 1;
        }

        auto stats = driver->get_statistics();
        Logger::instance().info("Done after {} frames: {} / {} alive, {:.3f} ms average, {:.1f} MB",
            frames, stats.alive_count, stats.capacity, stats.average_frame_ms, driver->get_gpu_memory_usage_mb());
        return 0;

    } catch (const std::exception& e) {
        Logger::instance().error("Unhandled exception: {}", e.what());
        return 1;
    }
}
