// Interactive paint canvas.
// Left-drag paints; particles fade over their lifetime and the canvas keeps what they left behind.
// Usage: paint_canvas [capacity] [lifetime_seconds]

#include <pfx/CanvasController.hpp>
#include <pfx/Logger.hpp>
#include <cstdlib>

int main(int argc, char** argv) {
    Logger::instance().set_level(spdlog::level::debug);

    pfx::CanvasConfig config{
        .window_width = 1280,
        .window_height = 720,
        .window_title = "PaintFX Canvas"
    };
    config.particles.capacity = argc > 1 ? static_cast<uint32_t>(std::atoi(argv[1])) : 200'000;
    config.particles.base_lifetime = argc > 2 ? static_cast<float>(std::atof(argv[2])) : 12.0f;

    try {
        auto controller = pfx::CanvasController::create(config);
        if (!controller) {
            Logger::instance().error("Canvas setup failed: {}", controller.error());
            return EXIT_FAILURE;
        }
        if (auto result = (*controller)->run(); !result) {
            Logger::instance().error("Canvas stopped: {}", result.error());
            return EXIT_FAILURE;
        }
    } catch (const std::exception& e) {
        // VulkanContext throws when no usable device exists
        Logger::instance().error("Unhandled exception: {}", e.what());
        return EXIT_FAILURE;
    }
    return EXIT_SUCCESS;
}
