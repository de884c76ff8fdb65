#pragma once

#include <pfx/GpuBuffer.hpp>
#include <pfx/Shader.hpp>
#include <pfx/UICallback.hpp>
#include <pfx/VulkanContext.hpp>
#include <array>
#include <expected>
#include <memory>
#include <string>
#include <string_view>
#include <vector>

struct ImDrawData;

namespace pfx {

/**
 * @brief Everything the presenter needs to draw one swapchain image
 */
struct PresentFrameInfo {
    uint32_t image_index;
    uint32_t current_frame;
    vk::Semaphore image_available_semaphore;
    vk::Framebuffer framebuffer;
    vk::Extent2D extent;
    vk::RenderPass render_pass;
    ImDrawData* imgui_draw_data = nullptr;
};

/**
 * @brief Draws the canvas color buffer as a fullscreen triangle, then the ImGui overlay
 *
 * Reads the storage buffer the compositor writes. The caller must make sure the
 * compute work producing it has finished before render_frame().
 */
class CanvasPresenter {
public:
    static std::expected<std::unique_ptr<CanvasPresenter>, std::string> create(
        const VulkanContext& context,
        vk::RenderPass render_pass
    );

    ~CanvasPresenter();

    CanvasPresenter(const CanvasPresenter&) = delete;
    CanvasPresenter& operator=(const CanvasPresenter&) = delete;

    [[nodiscard]] std::string_view name() const { return "Canvas"; }

    /**
     * @brief Point the presenter at the canvas color buffer
     *
     * Do not call while a frame using the previous buffer is in flight.
     */
    void bind_canvas(const GpuBuffer& color, int width, int height);

    /**
     * @brief Record and submit one frame on the graphics queue
     *
     * @return Semaphore signaled when rendering has finished, to wait on for present
     */
    std::expected<vk::Semaphore, std::string> render_frame(const PresentFrameInfo& info);

    /// Reallocate the per-image semaphores after the swapchain changed
    std::expected<void, std::string> handle_swapchain_recreation(uint32_t new_image_count);

    [[nodiscard]] std::vector<UICallback> get_ui_callbacks();

    void set_paper(float brightness) { m_paper = brightness; }
    [[nodiscard]] float paper() const { return m_paper; }

    static constexpr std::size_t MAX_FRAMES_IN_FLIGHT = 2;

private:
    CanvasPresenter(const VulkanContext& context, vk::RenderPass render_pass);

    /// Command buffer and fence owned by one frame in flight
    struct FrameSlot {
        vk::CommandBuffer cmd;
        vk::Fence fence;
    };

    std::expected<void, std::string> initialize();
    std::expected<void, std::string> create_layouts();
    std::expected<void, std::string> create_pipeline();
    std::expected<void, std::string> create_frame_slots();
    void record_canvas(vk::CommandBuffer cmd, const vk::Extent2D& extent) const;
    void cleanup();

    const VulkanContext* m_context;
    vk::Device m_device;
    vk::RenderPass m_render_pass;

    std::unique_ptr<Shader> m_vertex_shader;
    std::unique_ptr<Shader> m_fragment_shader;
    vk::DescriptorSetLayout m_descriptor_layout;
    vk::PipelineLayout m_pipeline_layout;
    vk::Pipeline m_graphics_pipeline;

    vk::DescriptorPool m_descriptor_pool;
    vk::DescriptorSet m_descriptor_set;

    int m_canvas_width = 0;
    int m_canvas_height = 0;
    bool m_canvas_bound = false;
    float m_paper = 0.96f;

    vk::CommandPool m_command_pool;
    std::array<FrameSlot, MAX_FRAMES_IN_FLIGHT> m_frames{};
    std::vector<vk::Semaphore> m_render_finished;  // One per swapchain image
    std::vector<vk::Fence> m_image_owner;          // Fence of the frame last drawing each image
};

} // namespace pfx
