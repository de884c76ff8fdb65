#include <pfx/frontends/CanvasPresenter.hpp>
#include <pfx/Logger.hpp>
#include <imgui.h>
#include <imgui_impl_vulkan.h>
#include <array>
#include <format>

namespace pfx {

namespace {

struct PresentParams {
    int32_t canvas_width;
    int32_t canvas_height;
    float paper;
    float padding;
};

} // anonymous namespace

CanvasPresenter::CanvasPresenter(const VulkanContext& context, vk::RenderPass render_pass)
    : m_context(&context)
    , m_device(context.device())
    , m_render_pass(render_pass)
{}

CanvasPresenter::~CanvasPresenter() {
    cleanup();
}

std::expected<std::unique_ptr<CanvasPresenter>, std::string> CanvasPresenter::create(
    const VulkanContext& context,
    vk::RenderPass render_pass
) {
    auto presenter = std::unique_ptr<CanvasPresenter>(new CanvasPresenter(context, render_pass));

    if (auto result = presenter->initialize(); !result) {
        return std::unexpected(result.error());
    }

    Logger::instance().info("Created canvas presenter");
    return presenter;
}

std::expected<void, std::string> CanvasPresenter::initialize() {
    auto vert = Shader::load(m_device, "canvas.vert.slang");
    if (!vert) {
        return std::unexpected(std::format("Failed to load canvas vertex shader: {}", vert.error()));
    }
    m_vertex_shader = std::move(*vert);

    auto frag = Shader::load(m_device, "canvas.frag.slang");
    if (!frag) {
        return std::unexpected(std::format("Failed to load canvas fragment shader: {}", frag.error()));
    }
    m_fragment_shader = std::move(*frag);

    if (auto linked = check_stage_link(m_vertex_shader->reflection(), m_fragment_shader->reflection()); !linked) {
        return std::unexpected(std::format("Canvas stages do not link: {}", linked.error()));
    }
    const auto& push = m_fragment_shader->reflection().push_block;
    if (!push || push->size != sizeof(PresentParams)) {
        return std::unexpected(std::format("Canvas fragment push block must be {} bytes", sizeof(PresentParams)));
    }

    if (auto result = create_layouts(); !result) {
        return result;
    }
    if (auto result = create_pipeline(); !result) {
        return result;
    }
    return create_frame_slots();
}

std::expected<void, std::string> CanvasPresenter::create_layouts() {
    const auto& frag = m_fragment_shader->reflection();

    auto bindings = frag.layout_bindings();
    auto set_layout_res = m_device.createDescriptorSetLayout(vk::DescriptorSetLayoutCreateInfo().setBindings(bindings));
    CHECK_VK_RESULT(set_layout_res, "Failed to create canvas descriptor layout: {}");
    m_descriptor_layout = set_layout_res.value;

    auto push_range = *frag.push_range();
    auto layout_res = m_device.createPipelineLayout(vk::PipelineLayoutCreateInfo()
        .setSetLayouts(m_descriptor_layout)
        .setPushConstantRanges(push_range));
    CHECK_VK_RESULT(layout_res, "Failed to create canvas pipeline layout: {}");
    m_pipeline_layout = layout_res.value;

    vk::DescriptorPoolSize pool_size{vk::DescriptorType::eStorageBuffer, static_cast<uint32_t>(bindings.size())};
    auto pool_res = m_device.createDescriptorPool(vk::DescriptorPoolCreateInfo()
        .setMaxSets(1)
        .setPoolSizes(pool_size));
    CHECK_VK_RESULT(pool_res, "Failed to create canvas descriptor pool: {}");
    m_descriptor_pool = pool_res.value;

    auto set_res = m_device.allocateDescriptorSets(vk::DescriptorSetAllocateInfo()
        .setDescriptorPool(m_descriptor_pool)
        .setSetLayouts(m_descriptor_layout));
    CHECK_VK_RESULT(set_res, "Failed to allocate canvas descriptor set: {}");
    m_descriptor_set = set_res.value.front();
    return {};
}

std::expected<void, std::string> CanvasPresenter::create_pipeline() {
    std::array stages{m_vertex_shader->stage_info(), m_fragment_shader->stage_info()};

    // No vertex buffers: the triangle covering the viewport comes from SV_VertexID
    vk::PipelineVertexInputStateCreateInfo no_vertices;
    vk::PipelineInputAssemblyStateCreateInfo triangles({}, vk::PrimitiveTopology::eTriangleList);
    vk::PipelineViewportStateCreateInfo viewport({}, 1, nullptr, 1, nullptr);
    auto raster = vk::PipelineRasterizationStateCreateInfo()
        .setPolygonMode(vk::PolygonMode::eFill)
        .setCullMode(vk::CullModeFlagBits::eNone)
        .setLineWidth(1.0f);
    vk::PipelineMultisampleStateCreateInfo single_sample({}, vk::SampleCountFlagBits::e1);

    // The canvas is already composited; paper and strokes overwrite the attachment
    auto overwrite = vk::PipelineColorBlendAttachmentState()
        .setBlendEnable(false)
        .setColorWriteMask(vk::ColorComponentFlagBits::eR | vk::ColorComponentFlagBits::eG
            | vk::ColorComponentFlagBits::eB | vk::ColorComponentFlagBits::eA);
    auto blend = vk::PipelineColorBlendStateCreateInfo().setAttachments(overwrite);

    std::array dynamic{vk::DynamicState::eViewport, vk::DynamicState::eScissor};
    auto dynamic_state = vk::PipelineDynamicStateCreateInfo().setDynamicStates(dynamic);

    auto pipeline_res = m_device.createGraphicsPipeline(nullptr, vk::GraphicsPipelineCreateInfo()
        .setStages(stages)
        .setPVertexInputState(&no_vertices)
        .setPInputAssemblyState(&triangles)
        .setPViewportState(&viewport)
        .setPRasterizationState(&raster)
        .setPMultisampleState(&single_sample)
        .setPColorBlendState(&blend)
        .setPDynamicState(&dynamic_state)
        .setLayout(m_pipeline_layout)
        .setRenderPass(m_render_pass)
        .setSubpass(0));
    CHECK_VK_RESULT(pipeline_res, "Failed to create canvas pipeline: {}");
    m_graphics_pipeline = pipeline_res.value;
    return {};
}

std::expected<void, std::string> CanvasPresenter::create_frame_slots() {
    auto pool_res = m_device.createCommandPool(vk::CommandPoolCreateInfo()
        .setQueueFamilyIndex(m_context->queue_indices().graphics)
        .setFlags(vk::CommandPoolCreateFlagBits::eResetCommandBuffer));
    CHECK_VK_RESULT(pool_res, "Failed to create presenter command pool: {}");
    m_command_pool = pool_res.value;

    auto cmd_res = m_device.allocateCommandBuffers(vk::CommandBufferAllocateInfo()
        .setCommandPool(m_command_pool)
        .setLevel(vk::CommandBufferLevel::ePrimary)
        .setCommandBufferCount(static_cast<uint32_t>(MAX_FRAMES_IN_FLIGHT)));
    CHECK_VK_RESULT(cmd_res, "Failed to allocate presenter command buffers: {}");

    for (std::size_t i = 0; i < MAX_FRAMES_IN_FLIGHT; i++) {
        // Created signaled so the first wait on each slot returns at once
        auto fence_res = m_device.createFence(vk::FenceCreateInfo(vk::FenceCreateFlagBits::eSignaled));
        CHECK_VK_RESULT(fence_res, "Failed to create presenter fence: {}");
        m_frames[i] = FrameSlot{.cmd = cmd_res.value[i], .fence = fence_res.value};
    }
    // Per-image semaphores follow once the swapchain image count is known
    return {};
}

void CanvasPresenter::cleanup() {
    std::vector<vk::Fence> fences;
    for (const auto& frame : m_frames) {
        if (frame.fence) {
            fences.push_back(frame.fence);
        }
    }
    if (!fences.empty()) {
        if (auto result = m_device.waitForFences(fences, vk::True, UINT64_MAX); result != vk::Result::eSuccess) {
            Logger::instance().warn("Presenter fence wait failed during cleanup: {}", to_string(result));
        }
    }
    for (auto fence : fences) {
        m_device.destroyFence(fence);
    }
    m_frames = {};

    for (auto sem : m_render_finished) {
        m_device.destroySemaphore(sem);
    }
    m_render_finished.clear();
    m_image_owner.clear();

    if (m_command_pool) {
        m_device.destroyCommandPool(m_command_pool);
        m_command_pool = nullptr;
    }
    if (m_descriptor_pool) {
        m_device.destroyDescriptorPool(m_descriptor_pool);
        m_descriptor_pool = nullptr;
    }
    if (m_graphics_pipeline) {
        m_device.destroyPipeline(m_graphics_pipeline);
        m_graphics_pipeline = nullptr;
    }
    if (m_pipeline_layout) {
        m_device.destroyPipelineLayout(m_pipeline_layout);
        m_pipeline_layout = nullptr;
    }
    if (m_descriptor_layout) {
        m_device.destroyDescriptorSetLayout(m_descriptor_layout);
        m_descriptor_layout = nullptr;
    }
}

void CanvasPresenter::bind_canvas(const GpuBuffer& color, int width, int height) {
    auto buffer_info = color.get_descriptor_info();
    m_device.updateDescriptorSets(vk::WriteDescriptorSet()
        .setDstSet(m_descriptor_set)
        .setDstBinding(0)
        .setDescriptorType(vk::DescriptorType::eStorageBuffer)
        .setBufferInfo(buffer_info), {});
    m_canvas_width = width;
    m_canvas_height = height;
    m_canvas_bound = true;
}

void CanvasPresenter::record_canvas(vk::CommandBuffer cmd, const vk::Extent2D& extent) const {
    cmd.setViewport(0, vk::Viewport(0.0f, 0.0f, static_cast<float>(extent.width), static_cast<float>(extent.height),
        0.0f, 1.0f));
    cmd.setScissor(0, vk::Rect2D({0, 0}, extent));

    // Before the first bind only the cleared paper shows
    if (!m_canvas_bound) {
        return;
    }

    const PresentParams params{
        .canvas_width = m_canvas_width,
        .canvas_height = m_canvas_height,
        .paper = m_paper,
        .padding = 0.0f
    };
    cmd.bindPipeline(vk::PipelineBindPoint::eGraphics, m_graphics_pipeline);
    cmd.bindDescriptorSets(vk::PipelineBindPoint::eGraphics, m_pipeline_layout, 0, m_descriptor_set, {});
    cmd.pushConstants(m_pipeline_layout, vk::ShaderStageFlagBits::eFragment, 0, sizeof(params), &params);
    cmd.draw(3, 1, 0, 0);
}

std::expected<void, std::string> CanvasPresenter::handle_swapchain_recreation(uint32_t new_image_count) {
    auto idle = m_device.waitIdle();
    CHECK_VK_RESULT_VOID(idle, "Device wait before presenter rebuild failed: {}");

    for (auto sem : m_render_finished) {
        m_device.destroySemaphore(sem);
    }
    m_render_finished.clear();
    for (uint32_t i = 0; i < new_image_count; i++) {
        auto sem_res = m_device.createSemaphore({});
        CHECK_VK_RESULT(sem_res, "Failed to create render-finished semaphore: {}");
        m_render_finished.push_back(sem_res.value);
    }
    m_image_owner.assign(new_image_count, nullptr);

    Logger::instance().debug("Presenter tracking {} swapchain images", new_image_count);
    return {};
}

std::expected<vk::Semaphore, std::string> CanvasPresenter::render_frame(const PresentFrameInfo& info) {
    const auto& frame = m_frames[info.current_frame];

    auto wait = m_device.waitForFences(frame.fence, vk::True, UINT64_MAX);
    CHECK_VK_RESULT_VOID(wait, "Waiting for frame fence failed: {}");

    // A previous frame slot may still be drawing into this image
    if (auto owner = m_image_owner[info.image_index]; owner && owner != frame.fence) {
        auto owner_wait = m_device.waitForFences(owner, vk::True, UINT64_MAX);
        CHECK_VK_RESULT_VOID(owner_wait, "Waiting for image owner fence failed: {}");
    }
    m_image_owner[info.image_index] = frame.fence;

    auto reset = m_device.resetFences(frame.fence);
    CHECK_VK_RESULT_VOID(reset, "Resetting frame fence failed: {}");

    auto cmd = frame.cmd;
    auto cmd_reset = cmd.reset();
    CHECK_VK_RESULT_VOID(cmd_reset, "Resetting presenter command buffer failed: {}");
    auto begin = cmd.begin(vk::CommandBufferBeginInfo(vk::CommandBufferUsageFlagBits::eOneTimeSubmit));
    CHECK_VK_RESULT_VOID(begin, "Beginning presenter command buffer failed: {}");

    vk::ClearValue paper{vk::ClearColorValue(std::array<float, 4>{m_paper, m_paper, m_paper, 1.0f})};
    cmd.beginRenderPass(vk::RenderPassBeginInfo()
        .setRenderPass(info.render_pass)
        .setFramebuffer(info.framebuffer)
        .setRenderArea(vk::Rect2D({0, 0}, info.extent))
        .setClearValues(paper), vk::SubpassContents::eInline);
    record_canvas(cmd, info.extent);
    if (info.imgui_draw_data) {
        ImGui_ImplVulkan_RenderDrawData(info.imgui_draw_data, static_cast<VkCommandBuffer>(cmd));
    }
    cmd.endRenderPass();

    auto end = cmd.end();
    CHECK_VK_RESULT_VOID(end, "Ending presenter command buffer failed: {}");

    vk::Semaphore finished = m_render_finished[info.image_index];
    vk::PipelineStageFlags wait_stage = vk::PipelineStageFlagBits::eColorAttachmentOutput;
    auto submit = m_context->graphics_queue().submit(vk::SubmitInfo()
        .setWaitSemaphores(info.image_available_semaphore)
        .setWaitDstStageMask(wait_stage)
        .setCommandBuffers(cmd)
        .setSignalSemaphores(finished), frame.fence);
    CHECK_VK_RESULT_VOID(submit, "Canvas submit failed: {}");
    return finished;
}

std::vector<UICallback> CanvasPresenter::get_ui_callbacks() {
    std::vector<UICallback> callbacks;
    callbacks.emplace_back("Paper", ContinuousCallback{
        .setter = [this](float v) { set_paper(v); },
        .getter = [this]() { return paper(); },
        .min = 0.0f,
        .max = 1.0f
    });
    return callbacks;
}

} // namespace pfx
