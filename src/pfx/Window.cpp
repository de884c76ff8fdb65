#include <pfx/Window.hpp>
#include <pfx/Logger.hpp>
#include <algorithm>
#include <ranges>

namespace pfx {

namespace {

vk::SurfaceFormatKHR pick_format(const std::vector<vk::SurfaceFormatKHR>& formats) {
    auto srgb = std::ranges::find_if(formats, [](const vk::SurfaceFormatKHR& f) {
        return f.format == vk::Format::eB8G8R8A8Srgb
            && f.colorSpace == vk::ColorSpaceKHR::eSrgbNonlinear;
    });
    return srgb != formats.end() ? *srgb : formats.front();
}

// Mailbox keeps stroke latency low; FIFO is the guaranteed fallback
vk::PresentModeKHR pick_present_mode(const std::vector<vk::PresentModeKHR>& modes) {
    return std::ranges::contains(modes, vk::PresentModeKHR::eMailbox)
        ? vk::PresentModeKHR::eMailbox
        : vk::PresentModeKHR::eFifo;
}

vk::Extent2D pick_extent(const vk::SurfaceCapabilitiesKHR& caps, GLFWwindow* handle) {
    if (caps.currentExtent.width != UINT32_MAX) {
        return caps.currentExtent;
    }
    int fb_w = 0;
    int fb_h = 0;
    glfwGetFramebufferSize(handle, &fb_w, &fb_h);
    return vk::Extent2D{
        std::clamp(static_cast<uint32_t>(fb_w), caps.minImageExtent.width, caps.maxImageExtent.width),
        std::clamp(static_cast<uint32_t>(fb_h), caps.minImageExtent.height, caps.maxImageExtent.height)
    };
}

uint32_t pick_image_count(const vk::SurfaceCapabilitiesKHR& caps) {
    uint32_t count = caps.minImageCount + 1;
    if (caps.maxImageCount > 0) {
        count = std::min(count, caps.maxImageCount);
    }
    return count;
}

bool is_stale(vk::Result result) {
    return result == vk::Result::eErrorOutOfDateKHR || result == vk::Result::eSuboptimalKHR;
}

} // namespace

std::expected<std::unique_ptr<Window>, std::string> Window::create(
    const VulkanContext& context,
    int width,
    int height,
    std::string_view title
) {
    if (!context.presentation_enabled()) {
        return std::unexpected("Vulkan context was created without presentation support");
    }

    glfwWindowHint(GLFW_CLIENT_API, GLFW_NO_API);
    glfwWindowHint(GLFW_RESIZABLE, GLFW_TRUE);
    std::string title_str(title);
    GLFWwindow* handle = glfwCreateWindow(width, height, title_str.c_str(), nullptr, nullptr);
    if (!handle) {
        return std::unexpected("Failed to create GLFW window");
    }

    auto window = std::unique_ptr<Window>(new Window(context, handle));

    VkSurfaceKHR raw_surface = VK_NULL_HANDLE;
    if (glfwCreateWindowSurface(static_cast<VkInstance>(context.instance()), handle, nullptr, &raw_surface)
        != VK_SUCCESS) {
        return std::unexpected("Failed to create window surface");
    }
    window->m_surface = vk::SurfaceKHR(raw_surface);

    if (auto result = window->rebuild_device_resources(); !result) {
        return std::unexpected(result.error());
    }
    Logger::instance().info("Canvas window {}x{} ({} swapchain images)",
        window->extent().width, window->extent().height, window->image_count());
    return window;
}

Window::Window(const VulkanContext& context, GLFWwindow* handle)
    : m_handle(handle)
    , m_context(&context)
    , m_device(context.device())
{}

Window::~Window() {
    if (m_device) {
        release_device_resources();
    }
    if (m_surface) {
        m_context->instance().destroySurfaceKHR(m_surface);
    }
    glfwDestroyWindow(m_handle);
}

bool Window::should_close() const {
    return glfwWindowShouldClose(m_handle);
}

std::expected<void, std::string> Window::build_render_pass(vk::Format color_format) {
    auto color = vk::AttachmentDescription()
        .setFormat(color_format)
        .setSamples(vk::SampleCountFlagBits::e1)
        .setLoadOp(vk::AttachmentLoadOp::eClear)
        .setStoreOp(vk::AttachmentStoreOp::eStore)
        .setStencilLoadOp(vk::AttachmentLoadOp::eDontCare)
        .setStencilStoreOp(vk::AttachmentStoreOp::eDontCare)
        .setInitialLayout(vk::ImageLayout::eUndefined)
        .setFinalLayout(vk::ImageLayout::ePresentSrcKHR);
    vk::AttachmentReference color_ref{0, vk::ImageLayout::eColorAttachmentOptimal};

    auto subpass = vk::SubpassDescription()
        .setPipelineBindPoint(vk::PipelineBindPoint::eGraphics)
        .setColorAttachments(color_ref);

    // Wait for the acquire semaphore before writing the attachment
    auto acquire_dependency = vk::SubpassDependency()
        .setSrcSubpass(VK_SUBPASS_EXTERNAL)
        .setDstSubpass(0)
        .setSrcStageMask(vk::PipelineStageFlagBits::eColorAttachmentOutput)
        .setDstStageMask(vk::PipelineStageFlagBits::eColorAttachmentOutput)
        .setDstAccessMask(vk::AccessFlagBits::eColorAttachmentWrite);

    auto pass_res = m_device.createRenderPass(vk::RenderPassCreateInfo()
        .setAttachments(color)
        .setSubpasses(subpass)
        .setDependencies(acquire_dependency));
    CHECK_VK_RESULT(pass_res, "Could not create canvas render pass {}");
    m_render_pass = pass_res.value;
    return {};
}

std::expected<void, std::string> Window::build_targets() {
    auto gpu = m_context->physical_device();
    auto caps = gpu.getSurfaceCapabilitiesKHR(m_surface);
    CHECK_VK_RESULT(caps, "Could not query surface capabilities {}");
    auto formats = gpu.getSurfaceFormatsKHR(m_surface);
    CHECK_VK_RESULT(formats, "Could not query surface formats {}");
    auto modes = gpu.getSurfacePresentModesKHR(m_surface);
    CHECK_VK_RESULT(modes, "Could not query present modes {}");
    if (formats.value.empty()) {
        return std::unexpected("Surface reports no formats");
    }

    SwapchainTargets targets;
    targets.format = pick_format(formats.value);
    targets.present_mode = pick_present_mode(modes.value);
    targets.extent = pick_extent(caps.value, m_handle);

    auto swapchain_res = m_device.createSwapchainKHR(vk::SwapchainCreateInfoKHR()
        .setSurface(m_surface)
        .setMinImageCount(pick_image_count(caps.value))
        .setImageFormat(targets.format.format)
        .setImageColorSpace(targets.format.colorSpace)
        .setImageExtent(targets.extent)
        .setImageArrayLayers(1)
        .setImageUsage(vk::ImageUsageFlagBits::eColorAttachment)
        .setImageSharingMode(vk::SharingMode::eExclusive)
        .setPreTransform(caps.value.currentTransform)
        .setCompositeAlpha(vk::CompositeAlphaFlagBitsKHR::eOpaque)
        .setPresentMode(targets.present_mode)
        .setClipped(true));
    CHECK_VK_RESULT(swapchain_res, "Could not create swapchain {}");
    targets.swapchain = swapchain_res.value;
    // Owned from here on, so partial failures below are cleaned up by destroy_targets
    m_targets = std::move(targets);

    auto images_res = m_device.getSwapchainImagesKHR(m_targets.swapchain);
    CHECK_VK_RESULT(images_res, "Could not get swapchain images {}");
    m_targets.images = std::move(images_res.value);

    for (vk::Image image : m_targets.images) {
        auto view_res = m_device.createImageView(vk::ImageViewCreateInfo()
            .setImage(image)
            .setViewType(vk::ImageViewType::e2D)
            .setFormat(m_targets.format.format)
            .setSubresourceRange({vk::ImageAspectFlagBits::eColor, 0, 1, 0, 1}));
        CHECK_VK_RESULT(view_res, "Could not create swapchain image view {}");
        m_targets.views.push_back(view_res.value);

        auto fb_res = m_device.createFramebuffer(vk::FramebufferCreateInfo()
            .setRenderPass(m_render_pass)
            .setAttachments(view_res.value)
            .setWidth(m_targets.extent.width)
            .setHeight(m_targets.extent.height)
            .setLayers(1));
        CHECK_VK_RESULT(fb_res, "Could not create swapchain framebuffer {}");
        m_targets.framebuffers.push_back(fb_res.value);
    }
    return {};
}

std::expected<void, std::string> Window::rebuild_targets() {
    // A minimized window has a zero framebuffer; park until it comes back
    int fb_w = 0;
    int fb_h = 0;
    glfwGetFramebufferSize(m_handle, &fb_w, &fb_h);
    while (fb_w == 0 || fb_h == 0) {
        glfwWaitEvents();
        glfwGetFramebufferSize(m_handle, &fb_w, &fb_h);
    }

    if (auto wait = m_device.waitIdle(); wait != vk::Result::eSuccess) {
        return std::unexpected(std::format("waitIdle before swapchain rebuild failed: {}", to_string(wait)));
    }
    destroy_targets();
    if (auto result = build_targets(); !result) {
        return result;
    }
    Logger::instance().info("Swapchain rebuilt at {}x{}", m_targets.extent.width, m_targets.extent.height);
    return {};
}

void Window::destroy_targets() {
    for (vk::Framebuffer fb : m_targets.framebuffers) {
        m_device.destroyFramebuffer(fb);
    }
    for (vk::ImageView view : m_targets.views) {
        m_device.destroyImageView(view);
    }
    if (m_targets.swapchain) {
        m_device.destroySwapchainKHR(m_targets.swapchain);
    }
    m_targets = SwapchainTargets{};
}

std::optional<uint32_t> Window::acquire_next_image(vk::Semaphore signal_semaphore) {
    if (m_resize_pending) {
        m_resize_pending = false;
        if (auto result = rebuild_targets(); !result) {
            Logger::instance().error("Swapchain rebuild after resize failed: {}", result.error());
        }
        return std::nullopt;
    }

    auto acquired = m_device.acquireNextImageKHR(m_targets.swapchain, UINT64_MAX, signal_semaphore, nullptr);
    if (acquired.result == vk::Result::eSuccess) {
        return acquired.value;
    }
    // Suboptimal still signals the semaphore, so present this image and rebuild next frame
    if (acquired.result == vk::Result::eSuboptimalKHR) {
        m_resize_pending = true;
        return acquired.value;
    }
    if (acquired.result != vk::Result::eErrorOutOfDateKHR) {
        Logger::instance().error("acquireNextImageKHR failed: {}", to_string(acquired.result));
        return std::nullopt;
    }

    if (auto result = rebuild_targets(); !result) {
        Logger::instance().error("Swapchain rebuild failed: {}", result.error());
    }
    return std::nullopt;
}

bool Window::present(vk::Queue queue, vk::Semaphore wait_semaphore, uint32_t image_index) {
    auto info = vk::PresentInfoKHR()
        .setWaitSemaphores(wait_semaphore)
        .setSwapchains(m_targets.swapchain)
        .setImageIndices(image_index);

    // Out-of-date is routine on resize, so call the C entry point directly
    auto result = static_cast<vk::Result>(
        vkQueuePresentKHR(queue, reinterpret_cast<const VkPresentInfoKHR*>(&info)));
    if (result == vk::Result::eSuccess) {
        return true;
    }
    if (is_stale(result)) {
        m_resize_pending = true;
        return result == vk::Result::eSuboptimalKHR;
    }
    Logger::instance().error("presentKHR failed: {}", to_string(result));
    return false;
}

void Window::release_device_resources() {
    destroy_targets();
    if (m_render_pass) {
        m_device.destroyRenderPass(m_render_pass);
        m_render_pass = nullptr;
    }
}

std::expected<void, std::string> Window::rebuild_device_resources() {
    m_device = m_context->device();
    m_resize_pending = false;

    auto formats = m_context->physical_device().getSurfaceFormatsKHR(m_surface);
    CHECK_VK_RESULT(formats, "Could not query surface formats {}");
    if (formats.value.empty()) {
        return std::unexpected("Surface reports no formats");
    }
    if (auto result = build_render_pass(pick_format(formats.value).format); !result) {
        return result;
    }
    return build_targets();
}

} // namespace pfx
