#pragma once

#include "BrushRegistry.hpp"
#include "FrameDriver.hpp"
#include "ParticleSystemConfig.hpp"
#include "StrokeTracker.hpp"
#include "UICallback.hpp"
#include "VulkanContext.hpp"
#include "Window.hpp"
#include "frontends/CanvasPresenter.hpp"
#include <GLFW/glfw3.h>
#include <expected>
#include <memory>
#include <optional>
#include <vector>

namespace pfx {

/**
 * @brief Configuration for the paint canvas application
 */
struct CanvasConfig {
    int window_width = 1280;
    int window_height = 720;
    const char* window_title = "PaintFX Canvas";

    /// Canvas size follows the framebuffer; width and height here are ignored
    ParticleSystemConfig particles;
    uint32_t atlas_tile_size = 64;
    bool use_atlas = true;
};

/**
 * @brief Interactive paint canvas
 *
 * Owns the window, the frame driver and the presenter. Mouse drags become strokes on
 * session 0, the ImGui panel edits the default brush and shows the frame statistics.
 * After a device loss the presentation objects are torn down with the logical device
 * and rebuilt once the frame driver recovers.
 */
class CanvasController {
public:
    static std::expected<std::unique_ptr<CanvasController>, std::string> create(
        const CanvasConfig& config = {}
    );

    ~CanvasController();

    CanvasController(const CanvasController&) = delete;
    CanvasController& operator=(const CanvasController&) = delete;

    /**
     * @brief Run the main loop until the window is closed
     */
    std::expected<void, std::string> run();

    [[nodiscard]] FrameDriver& driver() { return *m_driver; }

    static constexpr int32_t MOUSE_SESSION = 0;

private:
    explicit CanvasController(const CanvasConfig& config);

    std::expected<void, std::string> initialize();

    /// ImGui Vulkan backend, presenter and image semaphores on the current device
    std::expected<void, std::string> create_presentation();
    void release_presentation();

    std::expected<void, std::string> reset_device(VulkanContext& context);

    void apply_brush();
    void bind_canvas_if_changed();
    void render_ui();
    void render_ui_callbacks(const std::vector<UICallback>& callbacks);
    [[nodiscard]] std::vector<UICallback> brush_callbacks();

    /// Window coordinates to canvas pixels
    [[nodiscard]] glm::vec2 to_canvas(double xpos, double ypos) const;

    void present_frame();
    void cleanup();

    friend void glfw_mouse_button_callback(GLFWwindow* window, int button, int action, int mods);
    friend void glfw_cursor_callback(GLFWwindow* window, double xpos, double ypos);
    friend void glfw_framebuffer_size_callback(GLFWwindow* window, int width, int height);

    CanvasConfig m_config;

    std::unique_ptr<VulkanContext> m_context;
    std::unique_ptr<Window> m_window;
    std::unique_ptr<FrameDriver> m_driver;
    std::unique_ptr<CanvasPresenter> m_presenter;
    std::unique_ptr<StrokeTracker> m_strokes;

    BrushRecord m_brush;
    glm::vec4 m_brush_color{0.1f, 0.2f, 0.8f, 1.0f};  // Straight alpha
    bool m_use_color = true;
    bool m_use_atlas = true;
    bool m_serial_composite = false;

    bool m_drawing = false;
    std::optional<glm::ivec2> m_pending_resize;

    const GpuBuffer* m_bound_color = nullptr;
    int m_bound_width = 0;
    int m_bound_height = 0;

    bool m_imgui_vulkan_ready = false;
    vk::DescriptorPool m_imgui_descriptor_pool;
    std::vector<vk::Semaphore> m_image_available_sems;
    uint32_t m_semaphore_index = 0;
    uint32_t m_current_frame = 0;
};

} // namespace pfx
