#include <pfx/GpuBuffer.hpp>
#include <pfx/Logger.hpp>
#include <algorithm>
#include <array>
#include <format>
#include <utility>

namespace pfx {

std::expected<void, std::string> submit_one_time_commands(
    const VulkanContext& context,
    const std::function<void(vk::CommandBuffer)>& record
) {
    auto device = context.device();

    auto pool_info = vk::CommandPoolCreateInfo()
        .setQueueFamilyIndex(context.queue_indices().compute)
        .setFlags(vk::CommandPoolCreateFlagBits::eTransient);
    auto pool_res = device.createCommandPool(pool_info);
    CHECK_VK_RESULT(pool_res, "Failed to create transient command pool: {}");
    vk::CommandPool pool = pool_res.value;

    auto fence_res = device.createFence(vk::FenceCreateInfo());
    if (fence_res.result != vk::Result::eSuccess) {
        device.destroyCommandPool(pool);
        return std::unexpected(std::format("Failed to create transfer fence: {}", to_string(fence_res.result)));
    }
    vk::Fence fence = fence_res.value;

    auto release = [&]() {
        device.destroyFence(fence);
        // Command buffer is freed with the pool
        device.destroyCommandPool(pool);
    };

    auto cmd_alloc_info = vk::CommandBufferAllocateInfo()
        .setCommandPool(pool)
        .setLevel(vk::CommandBufferLevel::ePrimary)
        .setCommandBufferCount(1);
    auto cmd_res = device.allocateCommandBuffers(cmd_alloc_info);
    if (cmd_res.result != vk::Result::eSuccess) {
        release();
        return std::unexpected(std::format("Failed to allocate command buffer: {}", to_string(cmd_res.result)));
    }
    vk::CommandBuffer cmd = cmd_res.value[0];

    auto begin_res = cmd.begin(vk::CommandBufferBeginInfo().setFlags(vk::CommandBufferUsageFlagBits::eOneTimeSubmit));
    if (begin_res != vk::Result::eSuccess) {
        release();
        return std::unexpected(std::format("Failed to begin command buffer: {}", to_string(begin_res)));
    }

    record(cmd);

    // Make transfer and shader writes visible to host reads of mapped memory
    auto host_barrier = vk::MemoryBarrier()
        .setSrcAccessMask(vk::AccessFlagBits::eTransferWrite | vk::AccessFlagBits::eShaderWrite)
        .setDstAccessMask(vk::AccessFlagBits::eHostRead);
    cmd.pipelineBarrier(
        vk::PipelineStageFlagBits::eTransfer | vk::PipelineStageFlagBits::eComputeShader,
        vk::PipelineStageFlagBits::eHost,
        {}, host_barrier, {}, {});

    auto end_res = cmd.end();
    if (end_res != vk::Result::eSuccess) {
        release();
        return std::unexpected(std::format("Failed to record commands: {}", to_string(end_res)));
    }

    auto submit_info = vk::SubmitInfo().setCommandBuffers(cmd);
    auto submit_res = context.compute_queue().submit(submit_info, fence);
    if (submit_res != vk::Result::eSuccess) {
        release();
        return std::unexpected(std::format("Failed to submit commands: {}", to_string(submit_res)));
    }

    auto wait_res = device.waitForFences(fence, vk::True, UINT64_MAX);
    release();
    CHECK_VK_RESULT_VOID(wait_res, "Waiting for one-time commands failed: {}");
    return {};
}

GpuBuffer::GpuBuffer(
    const VulkanContext& context,
    const GpuBufferConfig& config
)
    : m_context(&context)
    , m_device(context.device())
    , m_config(config)
    , m_buffer(nullptr)
    , m_memory(nullptr)
    , m_mapped(nullptr)
{}

std::expected<GpuBuffer, std::string> GpuBuffer::create(
    const VulkanContext& context,
    const GpuBufferConfig& config
) {
    if (config.size == 0) {
        return std::unexpected(std::format("Buffer '{}' must not be empty", config.name));
    }

    GpuBuffer buffer(context, config);

    if (auto result = buffer.create_buffer(); !result) {
        return std::unexpected(result.error());
    }

    Logger::instance().debug("Created buffer '{}': {:.2f} MB ({})",
        config.name,
        static_cast<double>(config.size) / (1024.0 * 1024.0),
        config.location == MemoryLocation::DeviceLocal ? "device local" : "host visible");

    return buffer;
}

GpuBuffer::~GpuBuffer() {
    destroy_buffer();
}

GpuBuffer::GpuBuffer(GpuBuffer&& other) noexcept
    : m_context(other.m_context)
    , m_device(other.m_device)
    , m_config(std::move(other.m_config))
    , m_buffer(std::exchange(other.m_buffer, nullptr))
    , m_memory(std::exchange(other.m_memory, nullptr))
    , m_mapped(std::exchange(other.m_mapped, nullptr))
{}

GpuBuffer& GpuBuffer::operator=(GpuBuffer&& other) noexcept {
    if (this != &other) {
        destroy_buffer();

        m_context = other.m_context;
        m_device = other.m_device;
        m_config = std::move(other.m_config);
        m_buffer = std::exchange(other.m_buffer, nullptr);
        m_memory = std::exchange(other.m_memory, nullptr);
        m_mapped = std::exchange(other.m_mapped, nullptr);
    }
    return *this;
}

std::expected<void, std::string> GpuBuffer::create_buffer() {
    const auto& indices = m_context->queue_indices();
    std::array<uint32_t, 2> families = {indices.graphics, indices.compute};

    auto buffer_info = vk::BufferCreateInfo()
        .setSize(m_config.size)
        .setUsage(vk::BufferUsageFlagBits::eStorageBuffer |
                  vk::BufferUsageFlagBits::eTransferSrc |
                  vk::BufferUsageFlagBits::eTransferDst |
                  m_config.additional_usage_flags)
        .setSharingMode(vk::SharingMode::eExclusive);

    if (indices.has_dedicated_compute()) {
        buffer_info.setSharingMode(vk::SharingMode::eConcurrent)
                   .setQueueFamilyIndices(families);
    }

    auto buffer_res = m_device.createBuffer(buffer_info);
    CHECK_VK_RESULT(buffer_res, "Failed to create buffer: {}");
    m_buffer = buffer_res.value;

    auto mem_reqs = m_device.getBufferMemoryRequirements(m_buffer);

    const auto properties = m_config.location == MemoryLocation::DeviceLocal
        ? vk::MemoryPropertyFlags{vk::MemoryPropertyFlagBits::eDeviceLocal}
        : vk::MemoryPropertyFlagBits::eHostVisible | vk::MemoryPropertyFlagBits::eHostCoherent;

    auto memory_type_result = find_memory_type(mem_reqs.memoryTypeBits, properties);
    if (!memory_type_result) {
        destroy_buffer();
        return std::unexpected(memory_type_result.error());
    }

    auto alloc_info = vk::MemoryAllocateInfo()
        .setAllocationSize(mem_reqs.size)
        .setMemoryTypeIndex(*memory_type_result);

    auto memory_res = m_device.allocateMemory(alloc_info);
    if (memory_res.result != vk::Result::eSuccess) {
        destroy_buffer();
        return std::unexpected(std::format("Failed to allocate memory for '{}': {}",
            m_config.name, to_string(memory_res.result)));
    }
    m_memory = memory_res.value;

    auto bind_res = m_device.bindBufferMemory(m_buffer, m_memory, 0);
    if (bind_res != vk::Result::eSuccess) {
        destroy_buffer();
        return std::unexpected(std::format("Failed to bind memory for '{}': {}", m_config.name, to_string(bind_res)));
    }

    if (m_config.location == MemoryLocation::HostVisible) {
        auto map_res = m_device.mapMemory(m_memory, 0, m_config.size);
        if (map_res.result != vk::Result::eSuccess) {
            destroy_buffer();
            return std::unexpected(std::format("Failed to map '{}': {}", m_config.name, to_string(map_res.result)));
        }
        m_mapped = map_res.value;
    }

    return {};
}

void GpuBuffer::destroy_buffer() {
    if (m_mapped) {
        m_device.unmapMemory(m_memory);
        m_mapped = nullptr;
    }
    if (m_buffer) {
        m_device.destroyBuffer(m_buffer);
        m_buffer = nullptr;
    }
    if (m_memory) {
        m_device.freeMemory(m_memory);
        m_memory = nullptr;
    }
}

std::expected<uint32_t, std::string> GpuBuffer::find_memory_type(
    uint32_t type_filter,
    vk::MemoryPropertyFlags properties
) const {
    auto mem_props = m_context->physical_device().getMemoryProperties();

    for (uint32_t i = 0; i < mem_props.memoryTypeCount; i++) {
        if ((type_filter & (1 << i)) &&
            (mem_props.memoryTypes[i].propertyFlags & properties) == properties) {
            return i;
        }
    }

    return std::unexpected(std::format("Failed to find suitable memory type for '{}'", m_config.name));
}

std::expected<void, std::string> GpuBuffer::upload(std::span<const std::byte> data, vk::DeviceSize offset) {
    if (offset + data.size() > m_config.size) {
        return std::unexpected(std::format("Upload of {} bytes at offset {} overflows '{}' ({} bytes)",
            data.size(), offset, m_config.name, m_config.size));
    }
    if (data.empty()) {
        return {};
    }

    if (m_mapped) {
        std::memcpy(static_cast<std::byte*>(m_mapped) + offset, data.data(), data.size());
        return {};
    }

    auto staging = GpuBuffer::create(*m_context, GpuBufferConfig{
        .size = data.size(),
        .location = MemoryLocation::HostVisible,
        .name = m_config.name + " staging"
    });
    if (!staging) {
        return std::unexpected(staging.error());
    }
    std::memcpy(staging->mapped(), data.data(), data.size());

    auto copy_region = vk::BufferCopy()
        .setSrcOffset(0)
        .setDstOffset(offset)
        .setSize(data.size());

    return submit_one_time_commands(*m_context, [&](vk::CommandBuffer cmd) {
        cmd.copyBuffer(staging->buffer(), m_buffer, copy_region);
    });
}

std::expected<std::vector<std::byte>, std::string> GpuBuffer::download() const {
    std::vector<std::byte> bytes(m_config.size);

    if (m_mapped) {
        std::memcpy(bytes.data(), m_mapped, bytes.size());
        return bytes;
    }

    auto staging = GpuBuffer::create(*m_context, GpuBufferConfig{
        .size = m_config.size,
        .location = MemoryLocation::HostVisible,
        .name = m_config.name + " readback"
    });
    if (!staging) {
        return std::unexpected(staging.error());
    }

    auto copy_region = vk::BufferCopy().setSize(m_config.size);
    auto result = submit_one_time_commands(*m_context, [&](vk::CommandBuffer cmd) {
        cmd.copyBuffer(m_buffer, staging->buffer(), copy_region);
    });
    if (!result) {
        return std::unexpected(result.error());
    }

    std::memcpy(bytes.data(), staging->mapped(), bytes.size());
    return bytes;
}

void GpuBuffer::record_fill(vk::CommandBuffer cmd, uint32_t word) const {
    cmd.fillBuffer(m_buffer, 0, VK_WHOLE_SIZE, word);
}

std::expected<void, std::string> GpuBuffer::fill(uint32_t word) {
    if (m_mapped) {
        auto* words = static_cast<uint32_t*>(m_mapped);
        std::fill(words, words + m_config.size / sizeof(uint32_t), word);
        return {};
    }
    return submit_one_time_commands(*m_context, [&](vk::CommandBuffer cmd) {
        record_fill(cmd, word);
    });
}

std::expected<void, std::string> GpuBuffer::resize(vk::DeviceSize new_size) {
    Logger::instance().debug("Resizing buffer '{}': {} -> {} bytes", m_config.name, m_config.size, new_size);

    auto config = m_config;
    config.size = new_size;
    auto replacement = create(*m_context, config);
    if (!replacement) {
        return std::unexpected(replacement.error());
    }
    *this = std::move(*replacement);
    return {};
}

} // namespace pfx
