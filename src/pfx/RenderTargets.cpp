#include <pfx/RenderTargets.hpp>
#include <pfx/ParticleSystemConfig.hpp>
#include <pfx/Logger.hpp>
#include <glm/glm.hpp>
#include <algorithm>
#include <bit>

namespace pfx {

RenderTargets::RenderTargets(const VulkanContext& context, int width, int height, float depth_clear,
                             GpuBuffer color, GpuBuffer depth)
    : m_context(&context)
    , m_width(width)
    , m_height(height)
    , m_depth_clear(depth_clear)
    , m_color(std::move(color))
    , m_depth(std::move(depth))
{}

namespace {

struct TargetBuffers {
    GpuBuffer color;
    GpuBuffer depth;
};

std::expected<TargetBuffers, std::string> allocate_targets(const VulkanContext& context, int width, int height) {
    auto pixels = static_cast<vk::DeviceSize>(width) * static_cast<vk::DeviceSize>(height);

    auto color = GpuBuffer::create(context, {
        .size = pixels * sizeof(glm::vec4),
        .location = MemoryLocation::DeviceLocal,
        .name = "color target"
    });
    if (!color) {
        return std::unexpected(color.error());
    }

    auto depth = GpuBuffer::create(context, {
        .size = pixels * sizeof(float),
        .location = MemoryLocation::DeviceLocal,
        .name = "depth target"
    });
    if (!depth) {
        return std::unexpected(depth.error());
    }
    return TargetBuffers{std::move(*color), std::move(*depth)};
}

} // anonymous namespace

std::expected<std::unique_ptr<RenderTargets>, std::string> RenderTargets::create(
    const VulkanContext& context,
    int width,
    int height,
    float depth_clear
) {
    width = std::clamp(width, MIN_CANVAS_EXTENT, MAX_CANVAS_EXTENT);
    height = std::clamp(height, MIN_CANVAS_EXTENT, MAX_CANVAS_EXTENT);

    auto buffers = allocate_targets(context, width, height);
    if (!buffers) {
        return std::unexpected(buffers.error());
    }

    auto targets = std::unique_ptr<RenderTargets>(new RenderTargets(
        context, width, height, depth_clear, std::move(buffers->color), std::move(buffers->depth)));
    if (auto cleared = targets->clear(); !cleared) {
        return std::unexpected(cleared.error());
    }
    return targets;
}

void RenderTargets::record_clear(vk::CommandBuffer cmd) const {
    m_color.record_fill(cmd, 0u);
    m_depth.record_fill(cmd, std::bit_cast<uint32_t>(m_depth_clear));
}

std::expected<void, std::string> RenderTargets::clear() {
    return submit_one_time_commands(*m_context, [this](vk::CommandBuffer cmd) {
        record_clear(cmd);
    });
}

std::expected<void, std::string> RenderTargets::resize(int width, int height) {
    width = std::clamp(width, MIN_CANVAS_EXTENT, MAX_CANVAS_EXTENT);
    height = std::clamp(height, MIN_CANVAS_EXTENT, MAX_CANVAS_EXTENT);

    // Both buffers are replaced together or not at all
    auto buffers = allocate_targets(*m_context, width, height);
    if (!buffers) {
        return std::unexpected(buffers.error());
    }
    m_color = std::move(buffers->color);
    m_depth = std::move(buffers->depth);
    m_width = width;
    m_height = height;

    Logger::instance().info("Render targets resized to {}x{}", width, height);
    return clear();
}

} // namespace pfx
