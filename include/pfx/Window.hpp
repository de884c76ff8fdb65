#pragma once

#include <pfx/Common.hpp>
#include <pfx/VulkanContext.hpp>
#include <vulkan/vulkan.hpp>
#include <expected>
#include <memory>
#include <optional>
#include <string>
#include <string_view>
#include <vector>

namespace pfx {

/// Per-image presentation targets, rebuilt together on resize
struct SwapchainTargets {
    vk::SwapchainKHR swapchain;
    vk::SurfaceFormatKHR format;
    vk::PresentModeKHR present_mode = vk::PresentModeKHR::eFifo;
    vk::Extent2D extent;
    std::vector<vk::Image> images;
    std::vector<vk::ImageView> views;
    std::vector<vk::Framebuffer> framebuffers;
};

/**
 * @brief GLFW window presenting the canvas through a swapchain
 *
 * Owns the surface, the swapchain targets and one render pass with a single
 * color attachment. Canvas depth lives in a storage buffer, so there is no
 * depth attachment. The context must have been created with presentation.
 */
class Window {
public:
    static std::expected<std::unique_ptr<Window>, std::string> create(
        const VulkanContext& context,
        int width,
        int height,
        std::string_view title
    );

    ~Window();

    Window(const Window&) = delete;
    Window& operator=(const Window&) = delete;

    [[nodiscard]] bool should_close() const;
    [[nodiscard]] GLFWwindow* handle() const { return m_handle; }

    [[nodiscard]] vk::RenderPass render_pass() const { return m_render_pass; }
    [[nodiscard]] vk::Extent2D extent() const { return m_targets.extent; }
    [[nodiscard]] uint32_t image_count() const {
        return static_cast<uint32_t>(m_targets.images.size());
    }
    [[nodiscard]] vk::Framebuffer framebuffer(uint32_t image_index) const {
        return m_targets.framebuffers[image_index];
    }

    /**
     * @brief Acquire the next swapchain image
     *
     * Rebuilds the targets when a resize is pending or the swapchain went
     * stale; in that case returns nullopt and the frame should be skipped.
     */
    [[nodiscard]] std::optional<uint32_t> acquire_next_image(vk::Semaphore signal_semaphore);

    /// @return false when the image was not presented and the targets need rebuilding
    [[nodiscard]] bool present(vk::Queue queue, vk::Semaphore wait_semaphore, uint32_t image_index);

    void mark_resize_needed() { m_resize_pending = true; }

    /// Destroy every object owned by the logical device; the surface survives
    void release_device_resources();

    /// Rebuild render pass and swapchain targets on the context's current device
    std::expected<void, std::string> rebuild_device_resources();

private:
    Window(const VulkanContext& context, GLFWwindow* handle);

    std::expected<void, std::string> build_render_pass(vk::Format color_format);
    std::expected<void, std::string> build_targets();
    std::expected<void, std::string> rebuild_targets();
    void destroy_targets();

    GLFWwindow* m_handle;
    const VulkanContext* m_context;
    vk::Device m_device;
    vk::SurfaceKHR m_surface;
    vk::RenderPass m_render_pass;
    SwapchainTargets m_targets;
    bool m_resize_pending = false;
};

} // namespace pfx
