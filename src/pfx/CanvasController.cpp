#include <pfx/CanvasController.hpp>
#include <pfx/Logger.hpp>
#include <pfx/TextureAtlas.hpp>
#include <imgui.h>
#include <imgui_impl_glfw.h>
#include <imgui_impl_vulkan.h>
#include <array>
#include <chrono>
#include <format>

namespace pfx {

void glfw_mouse_button_callback(GLFWwindow* window, int button, int action, [[maybe_unused]] int mods) {
    auto* controller = static_cast<CanvasController*>(glfwGetWindowUserPointer(window));
    if (!controller || button != GLFW_MOUSE_BUTTON_LEFT) return;

    if (action == GLFW_PRESS) {
        if (ImGui::GetCurrentContext() && ImGui::GetIO().WantCaptureMouse) return;

        double xpos = 0.0;
        double ypos = 0.0;
        glfwGetCursorPos(window, &xpos, &ypos);
        auto event = controller->m_strokes->begin_stroke(CanvasController::MOUSE_SESSION,
                                                          controller->to_canvas(xpos, ypos),
                                                          static_cast<float>(glfwGetTime()));
        controller->m_driver->process_input_events({&event, 1});
        controller->m_drawing = true;
    } else if (action == GLFW_RELEASE && controller->m_drawing) {
        controller->m_strokes->end_stroke(CanvasController::MOUSE_SESSION);
        controller->m_drawing = false;
    }
}

void glfw_cursor_callback(GLFWwindow* window, double xpos, double ypos) {
    auto* controller = static_cast<CanvasController*>(glfwGetWindowUserPointer(window));
    if (!controller || !controller->m_drawing) return;

    auto event = controller->m_strokes->continue_stroke(CanvasController::MOUSE_SESSION,
                                                         controller->to_canvas(xpos, ypos), 1.0f,
                                                         static_cast<float>(glfwGetTime()));
    if (event) {
        controller->m_driver->process_input_events({&*event, 1});
    }
}

void glfw_framebuffer_size_callback(GLFWwindow* window, int width, int height) {
    auto* controller = static_cast<CanvasController*>(glfwGetWindowUserPointer(window));
    if (!controller) return;

    controller->m_window->mark_resize_needed();
    // Minimized windows report 0x0; keep the canvas until a real size arrives
    if (width > 0 && height > 0) {
        controller->m_pending_resize = glm::ivec2(width, height);
    }
}

CanvasController::CanvasController(const CanvasConfig& config)
    : m_config(config)
    , m_use_atlas(config.use_atlas)
    , m_serial_composite(config.particles.composite_ordering == CompositeOrdering::Serial)
{
    m_brush.name = "mouse";
    m_brush.lifetime = config.particles.base_lifetime;
    m_brush.particles_per_event = 4;
    m_brush.jitter_mode = JitterMode::Proportional;
}

CanvasController::~CanvasController() {
    cleanup();
}

std::expected<std::unique_ptr<CanvasController>, std::string> CanvasController::create(const CanvasConfig& config) {
    auto controller = std::unique_ptr<CanvasController>(new CanvasController(config));

    if (auto result = controller->initialize(); !result) {
        return std::unexpected(result.error());
    }

    return controller;
}

std::expected<void, std::string> CanvasController::initialize() {
    Logger::instance().info("Initializing canvas controller...");

    try {
        m_context = std::make_unique<VulkanContext>(VulkanContextConfig{
            .application_name = "PaintFX Canvas",
            .enable_presentation = true
        });
    } catch (const std::exception& e) {
        return std::unexpected(std::format("Failed to create Vulkan context: {}", e.what()));
    }

    auto window_result = Window::create(*m_context, m_config.window_width, m_config.window_height,
                                        m_config.window_title);
    if (!window_result) {
        return std::unexpected(std::format("Failed to create window: {}", window_result.error()));
    }
    m_window = std::move(*window_result);

    auto particles = m_config.particles;
    particles.canvas_width = static_cast<int>(m_window->extent().width);
    particles.canvas_height = static_cast<int>(m_window->extent().height);

    auto driver = FrameDriver::create(*m_context, particles);
    if (!driver) {
        return std::unexpected(driver.error());
    }
    m_driver = std::move(*driver);

    if (m_use_atlas) {
        if (auto result = m_driver->set_atlas(TextureAtlas::generate_soft_brushes(m_config.atlas_tile_size)); !result) {
            return std::unexpected(std::format("Failed to upload brush atlas: {}", result.error()));
        }
    }

    m_driver->set_device_reset_handler([this](VulkanContext& context) { return reset_device(context); });

    m_strokes = std::make_unique<StrokeTracker>(m_driver->brushes(), 12.0f);
    apply_brush();

    // Installed before ImGui so its GLFW backend chains to them
    glfwSetWindowUserPointer(m_window->handle(), this);
    glfwSetMouseButtonCallback(m_window->handle(), glfw_mouse_button_callback);
    glfwSetCursorPosCallback(m_window->handle(), glfw_cursor_callback);
    glfwSetFramebufferSizeCallback(m_window->handle(), glfw_framebuffer_size_callback);

    IMGUI_CHECKVERSION();
    ImGui::CreateContext();
    ImGui::StyleColorsDark();
    ImGui_ImplGlfw_InitForVulkan(m_window->handle(), true);

    if (auto result = create_presentation(); !result) {
        return std::unexpected(result.error());
    }

    Logger::instance().info("Canvas controller initialized");
    return {};
}

std::expected<void, std::string> CanvasController::create_presentation() {
    auto device = m_context->device();

    std::vector<vk::DescriptorPoolSize> pool_sizes = {
        {vk::DescriptorType::eCombinedImageSampler, 100},
        {vk::DescriptorType::eSampledImage, 100},
        {vk::DescriptorType::eUniformBuffer, 100},
        {vk::DescriptorType::eStorageBuffer, 100}
    };

    auto imgui_pool_info = vk::DescriptorPoolCreateInfo()
        .setFlags(vk::DescriptorPoolCreateFlagBits::eFreeDescriptorSet)
        .setMaxSets(100)
        .setPoolSizes(pool_sizes);

    auto pool_res = device.createDescriptorPool(imgui_pool_info);
    CHECK_VK_RESULT(pool_res, "Failed to create ImGui descriptor pool: {}");
    m_imgui_descriptor_pool = pool_res.value;

    ImGui_ImplVulkan_InitInfo init_info{};
    init_info.Instance = static_cast<VkInstance>(m_context->instance());
    init_info.PhysicalDevice = static_cast<VkPhysicalDevice>(m_context->physical_device());
    init_info.Device = static_cast<VkDevice>(device);
    init_info.QueueFamily = m_context->queue_indices().graphics;
    init_info.Queue = static_cast<VkQueue>(m_context->graphics_queue());
    init_info.DescriptorPool = static_cast<VkDescriptorPool>(m_imgui_descriptor_pool);
    init_info.MinImageCount = 2;
    init_info.ImageCount = m_window->image_count();
    init_info.MSAASamples = VK_SAMPLE_COUNT_1_BIT;
    init_info.RenderPass = static_cast<VkRenderPass>(m_window->render_pass());
    init_info.Allocator = nullptr;
    init_info.CheckVkResultFn = nullptr;

    if (!ImGui_ImplVulkan_Init(&init_info)) {
        return std::unexpected("Failed to initialize ImGui Vulkan backend");
    }
    ImGui_ImplVulkan_CreateFontsTexture();
    m_imgui_vulkan_ready = true;

    auto presenter = CanvasPresenter::create(*m_context, m_window->render_pass());
    if (!presenter) {
        return std::unexpected(std::format("Failed to create presenter: {}", presenter.error()));
    }
    m_presenter = std::move(*presenter);

    if (auto result = m_presenter->handle_swapchain_recreation(m_window->image_count()); !result) {
        return result;
    }

    for (uint32_t i = 0; i < m_window->image_count(); i++) {
        auto sem_res = device.createSemaphore({});
        CHECK_VK_RESULT(sem_res, "Failed to create image available semaphore: {}");
        m_image_available_sems.push_back(sem_res.value);
    }
    m_semaphore_index = 0;
    m_current_frame = 0;

    // Forces a rebind against whatever the driver owns now
    m_bound_color = nullptr;
    return {};
}

void CanvasController::release_presentation() {
    auto device = m_context->device();

    m_presenter.reset();

    for (auto& sem : m_image_available_sems) {
        device.destroySemaphore(sem);
    }
    m_image_available_sems.clear();

    if (m_imgui_vulkan_ready) {
        ImGui_ImplVulkan_Shutdown();
        m_imgui_vulkan_ready = false;
    }
    if (m_imgui_descriptor_pool) {
        device.destroyDescriptorPool(m_imgui_descriptor_pool);
        m_imgui_descriptor_pool = nullptr;
    }
    m_bound_color = nullptr;
}

std::expected<void, std::string> CanvasController::reset_device(VulkanContext& context) {
    // The driver has already released its own resources
    release_presentation();
    m_window->release_device_resources();

    if (auto result = context.recreate_device(); !result) {
        return result;
    }
    if (auto result = m_window->rebuild_device_resources(); !result) {
        return result;
    }
    return create_presentation();
}

void CanvasController::apply_brush() {
    auto brush = m_brush;
    if (m_use_color) {
        // Brushes carry premultiplied color
        brush.color_override = glm::vec4(glm::vec3(m_brush_color) * m_brush_color.a, m_brush_color.a);
    } else {
        brush.color_override.reset();
    }
    m_driver->brushes().set_default(brush);
}

void CanvasController::bind_canvas_if_changed() {
    if (!m_presenter) return;

    const auto* color = m_driver->get_color_buffer();
    int width = m_driver->config().canvas_width;
    int height = m_driver->config().canvas_height;
    if (!color || (color == m_bound_color && width == m_bound_width && height == m_bound_height)) {
        return;
    }

    // The descriptor set may still be in use by an earlier frame
    auto idle_res = m_context->device().waitIdle();
    if (idle_res != vk::Result::eSuccess) {
        Logger::instance().error("Device wait before canvas rebind failed: {}", to_string(idle_res));
        return;
    }
    m_presenter->bind_canvas(*color, width, height);
    m_bound_color = color;
    m_bound_width = width;
    m_bound_height = height;
}

glm::vec2 CanvasController::to_canvas(double xpos, double ypos) const {
    int window_w = 0;
    int window_h = 0;
    int fb_w = 0;
    int fb_h = 0;
    glfwGetWindowSize(m_window->handle(), &window_w, &window_h);
    glfwGetFramebufferSize(m_window->handle(), &fb_w, &fb_h);
    if (window_w <= 0 || window_h <= 0) {
        return glm::vec2(static_cast<float>(xpos), static_cast<float>(ypos));
    }
    return glm::vec2(static_cast<float>(xpos * fb_w / window_w), static_cast<float>(ypos * fb_h / window_h));
}

std::vector<UICallback> CanvasController::brush_callbacks() {
    std::vector<UICallback> callbacks;
    callbacks.emplace_back("Size", ContinuousCallback{
        .setter = [this](float v) { m_strokes->set_base_size(v); },
        .getter = [this]() { return m_strokes->base_size(); },
        .min = 1.0f,
        .max = 128.0f,
        .logarithmic = true
    });
    callbacks.emplace_back("Lifetime (s)", ContinuousCallback{
        .setter = [this](float v) { m_brush.lifetime = v; apply_brush(); },
        .getter = [this]() { return m_brush.lifetime; },
        .min = 0.5f,
        .max = 60.0f,
        .logarithmic = true
    });
    callbacks.emplace_back("Particles per event", DiscreteCallback{
        .setter = [this](int v) { m_brush.particles_per_event = static_cast<uint32_t>(v); apply_brush(); },
        .getter = [this]() { return static_cast<int>(m_brush.particles_per_event); },
        .min = 1,
        .max = 32
    });
    callbacks.emplace_back("Wide jitter", ToggleCallback{
        .setter = [this](bool v) {
            m_brush.jitter_mode = v ? JitterMode::Proportional : JitterMode::Paint;
            apply_brush();
        },
        .getter = [this]() { return m_brush.jitter_mode == JitterMode::Proportional; }
    });
    callbacks.emplace_back("Use color", ToggleCallback{
        .setter = [this](bool v) { m_use_color = v; apply_brush(); },
        .getter = [this]() { return m_use_color; }
    });
    callbacks.emplace_back("Color", ColorCallback{
        .setter = [this](glm::vec4 c) { m_brush_color = c; apply_brush(); },
        .getter = [this]() { return m_brush_color; }
    });
    callbacks.emplace_back("Textured brushes", ToggleCallback{
        .setter = [this](bool v) {
            m_use_atlas = v;
            std::optional<AtlasImage> image;
            if (v) {
                image = TextureAtlas::generate_soft_brushes(m_config.atlas_tile_size);
            }
            if (auto result = m_driver->set_atlas(std::move(image)); !result) {
                Logger::instance().error("Failed to change brush atlas: {}", result.error());
            }
        },
        .getter = [this]() { return m_use_atlas; }
    });
    callbacks.emplace_back("Serial compositing", ToggleCallback{
        .setter = [this](bool v) {
            m_serial_composite = v;
            m_driver->set_composite_ordering(v ? CompositeOrdering::Serial : CompositeOrdering::Parallel);
        },
        .getter = [this]() { return m_serial_composite; }
    });
    callbacks.emplace_back("Clear canvas", ActionCallback{
        .action = [this]() {
            m_strokes->clear();
            m_drawing = false;
            m_driver->clear_all();
        }
    });
    return callbacks;
}

void CanvasController::render_ui_callbacks(const std::vector<UICallback>& callbacks) {
    for (const auto& callback : callbacks) {
        std::visit(overloaded{
            [&](const ContinuousCallback& cb) {
                float value = cb.getter();
                int flags = cb.logarithmic ? ImGuiSliderFlags_Logarithmic : 0;
                if (ImGui::SliderFloat(callback.field_name.c_str(), &value, cb.min, cb.max, "%.3f", flags)) {
                    cb.setter(value);
                }
            },
            [&](const DiscreteCallback& cb) {
                int value = cb.getter();
                if (ImGui::SliderInt(callback.field_name.c_str(), &value, cb.min, cb.max)) {
                    cb.setter(value);
                }
            },
            [&](const ToggleCallback& cb) {
                bool value = cb.getter();
                if (ImGui::Checkbox(callback.field_name.c_str(), &value)) {
                    cb.setter(value);
                }
            },
            [&](const ColorCallback& cb) {
                auto value = cb.getter();
                if (ImGui::ColorEdit4(callback.field_name.c_str(), &value.x)) {
                    cb.setter(value);
                }
            },
            [&](const ActionCallback& cb) {
                if (ImGui::Button(callback.field_name.c_str())) {
                    cb.action();
                }
            },
        }, callback.callback);
    }
}

void CanvasController::render_ui() {
    ImGui::Begin("Canvas");

    auto stats = m_driver->get_statistics();
    ImGui::Text("Particles: %u / %u", stats.alive_count, stats.capacity);
    ImGui::Text("Free slots: %d", m_driver->get_freelist_count());
    ImGui::Text("Frame: %.2f ms (avg %.2f ms)", stats.last_frame_ms, stats.average_frame_ms);
    ImGui::Text("Spawn dispatches: %u", m_driver->last_dispatch_count());
    ImGui::Text("GPU memory: %.1f MB", m_driver->get_gpu_memory_usage_mb());
    ImGui::Text("Canvas: %dx%d", m_driver->config().canvas_width, m_driver->config().canvas_height);
    if (auto dropped = m_driver->dropped_input_events(); dropped > 0) {
        ImGui::TextColored(ImVec4(1.0f, 0.6f, 0.2f, 1.0f), "Dropped input events: %llu",
                           static_cast<unsigned long long>(dropped));
    }

    ImGui::Separator();
    ImGui::Text("Brush:");
    render_ui_callbacks(brush_callbacks());

    if (m_presenter) {
        ImGui::Separator();
        ImGui::Text("%s:", m_presenter->name().data());
        render_ui_callbacks(m_presenter->get_ui_callbacks());
    }

    ImGui::Separator();
    ImGui::Text("FPS: %.1f", ImGui::GetIO().Framerate);
    ImGui::End();
}

void CanvasController::present_frame() {
    auto acquire_result = m_window->acquire_next_image(m_image_available_sems[m_semaphore_index]);
    if (!acquire_result) {
        if (auto result = m_presenter->handle_swapchain_recreation(m_window->image_count()); !result) {
            Logger::instance().error("Presenter swapchain recreation failed: {}", result.error());
        }
        return;
    }
    uint32_t image_index = *acquire_result;

    PresentFrameInfo info{
        .image_index = image_index,
        .current_frame = m_current_frame,
        .image_available_semaphore = m_image_available_sems[m_semaphore_index],
        .framebuffer = m_window->framebuffer(image_index),
        .extent = m_window->extent(),
        .render_pass = m_window->render_pass(),
        .imgui_draw_data = ImGui::GetDrawData()
    };

    auto render_finished = m_presenter->render_frame(info);
    if (!render_finished) {
        // Presentation errors are unrecoverable without a new device
        Logger::instance().error("Canvas presentation failed: {}", render_finished.error());
        m_driver->notify_device_lost();
        return;
    }

    if (!m_window->present(m_context->graphics_queue(), *render_finished, image_index)) {
        if (auto result = m_presenter->handle_swapchain_recreation(m_window->image_count()); !result) {
            Logger::instance().error("Presenter swapchain recreation failed: {}", result.error());
        }
    }

    m_current_frame = (m_current_frame + 1) % CanvasPresenter::MAX_FRAMES_IN_FLIGHT;
    m_semaphore_index = (m_semaphore_index + 1) % static_cast<uint32_t>(m_image_available_sems.size());
}

std::expected<void, std::string> CanvasController::run() {
    Logger::instance().info("Starting main loop...");

    auto last_frame_time = std::chrono::steady_clock::now();

    while (!m_window->should_close()) {
        auto current_frame_time = std::chrono::steady_clock::now();
        float delta_time = std::chrono::duration<float>(current_frame_time - last_frame_time).count();
        last_frame_time = current_frame_time;

        glfwPollEvents();

        if (m_pending_resize && m_driver->is_initialized()) {
            m_driver->resize(m_pending_resize->x, m_pending_resize->y);
            m_pending_resize.reset();
        }

        // The previous frame's draw still reads the color buffer the next frame clears
        if (m_presenter) {
            auto idle_res = m_context->graphics_queue().waitIdle();
            if (idle_res != vk::Result::eSuccess) {
                Logger::instance().error("Graphics queue wait failed: {}", to_string(idle_res));
                m_driver->notify_device_lost();
            }
        }

        m_driver->update(delta_time);
        m_driver->composite();

        if (!m_driver->is_initialized() || !m_presenter || !m_imgui_vulkan_ready) {
            continue;
        }

        ImGui_ImplVulkan_NewFrame();
        ImGui_ImplGlfw_NewFrame();
        ImGui::NewFrame();
        render_ui();
        ImGui::Render();

        // Panel actions may have submitted more compute work
        if (auto waited = m_driver->wait_idle(); !waited) {
            continue;
        }
        bind_canvas_if_changed();
        present_frame();
    }

    if (auto idle_res = m_context->device().waitIdle(); idle_res != vk::Result::eSuccess) {
        Logger::instance().warn("Device wait at shutdown failed: {}", to_string(idle_res));
    }

    Logger::instance().info("Shutdown complete");
    return {};
}

void CanvasController::cleanup() {
    if (m_context && m_context->device()) {
        if (auto idle_res = m_context->device().waitIdle(); idle_res != vk::Result::eSuccess) {
            Logger::instance().warn("Device wait during cleanup failed: {}", to_string(idle_res));
        }
        release_presentation();
    }

    if (ImGui::GetCurrentContext()) {
        ImGui_ImplGlfw_Shutdown();
        ImGui::DestroyContext();
    }

    // Driver resources go before the window and context they were created on
    m_strokes.reset();
    m_driver.reset();
    m_window.reset();
}

} // namespace pfx
