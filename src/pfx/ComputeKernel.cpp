#include <pfx/ComputeKernel.hpp>
#include <pfx/Logger.hpp>
#include <format>

namespace pfx {

ComputeKernel::ComputeKernel(const VulkanContext& context, std::string_view module)
    : m_context(&context)
    , m_device(context.device())
    , m_name(module)
{}

std::expected<std::unique_ptr<ComputeKernel>, std::string> ComputeKernel::create(
    const VulkanContext& context,
    std::string_view module,
    std::size_t expected_push_size
) {
    auto kernel = std::unique_ptr<ComputeKernel>(new ComputeKernel(context, module));

    if (auto result = kernel->initialize(expected_push_size); !result) {
        return std::unexpected(std::format("Kernel '{}': {}", module, result.error()));
    }

    Logger::instance().debug("Created compute kernel '{}'", module);
    return kernel;
}

ComputeKernel::~ComputeKernel() {
    cleanup();
}

std::expected<void, std::string> ComputeKernel::initialize(std::size_t expected_push_size) {
    auto shader = Shader::load(m_device, m_name);
    if (!shader) {
        return std::unexpected(std::format("Failed to load shader: {}", shader.error()));
    }
    m_shader = std::move(*shader);

    const auto& refl = m_shader->reflection();
    if (refl.stage != vk::ShaderStageFlagBits::eCompute) {
        return std::unexpected("Shader is not a compute shader");
    }
    if (refl.workgroup_size[0] != KERNEL_GROUP_SIZE) {
        return std::unexpected(std::format("Workgroup size {} does not match {}", refl.workgroup_size[0], KERNEL_GROUP_SIZE));
    }

    m_push_size = refl.push_block ? refl.push_block->size : 0;
    if (m_push_size != expected_push_size) {
        return std::unexpected(std::format("Push constant size mismatch: shader {} bytes, host {} bytes",
            m_push_size, expected_push_size));
    }

    if (auto result = create_descriptor_layout(); !result) {
        return std::unexpected(result.error());
    }
    if (auto result = create_pipeline(); !result) {
        return std::unexpected(result.error());
    }
    if (auto result = create_descriptor_set(); !result) {
        return std::unexpected(result.error());
    }
    return {};
}

std::expected<void, std::string> ComputeKernel::create_descriptor_layout() {
    auto bindings = m_shader->reflection().layout_bindings();
    auto layout_info = vk::DescriptorSetLayoutCreateInfo()
        .setBindings(bindings);

    auto layout_res = m_device.createDescriptorSetLayout(layout_info);
    CHECK_VK_RESULT(layout_res, "Failed to create descriptor layout: {}");
    m_descriptor_layout = layout_res.value;
    return {};
}

std::expected<void, std::string> ComputeKernel::create_pipeline() {
    auto pipeline_layout_info = vk::PipelineLayoutCreateInfo()
        .setSetLayouts(m_descriptor_layout);

    auto range = m_shader->reflection().push_range();
    if (range) {
        pipeline_layout_info.setPushConstantRanges(*range);
    }

    auto layout_res = m_device.createPipelineLayout(pipeline_layout_info);
    CHECK_VK_RESULT(layout_res, "Failed to create pipeline layout: {}");
    m_pipeline_layout = layout_res.value;

    auto pipeline_info = vk::ComputePipelineCreateInfo()
        .setStage(m_shader->stage_info())
        .setLayout(m_pipeline_layout);

    auto pipeline_res = m_device.createComputePipeline(nullptr, pipeline_info);
    CHECK_VK_RESULT(pipeline_res, "Failed to create compute pipeline: {}");
    m_pipeline = pipeline_res.value;
    return {};
}

std::expected<void, std::string> ComputeKernel::create_descriptor_set() {
    const auto& bindings = m_shader->reflection().bindings;
    if (bindings.empty()) {
        return {};
    }

    uint32_t storage_count = 0;
    for (const auto& binding : bindings) {
        storage_count += binding.count;
    }
    auto pool_size = vk::DescriptorPoolSize(vk::DescriptorType::eStorageBuffer, storage_count);

    auto pool_info = vk::DescriptorPoolCreateInfo()
        .setMaxSets(1)
        .setPoolSizes(pool_size);

    auto pool_res = m_device.createDescriptorPool(pool_info);
    CHECK_VK_RESULT(pool_res, "Failed to create descriptor pool: {}");
    m_descriptor_pool = pool_res.value;

    auto alloc_info = vk::DescriptorSetAllocateInfo()
        .setDescriptorPool(m_descriptor_pool)
        .setSetLayouts(m_descriptor_layout);

    auto set_res = m_device.allocateDescriptorSets(alloc_info);
    CHECK_VK_RESULT(set_res, "Failed to allocate descriptor set: {}");
    m_descriptor_set = set_res.value[0];
    return {};
}

std::expected<void, std::string> ComputeKernel::bind_buffer(uint32_t binding, const GpuBuffer& buffer) {
    const auto* slot = m_shader->reflection().find_binding(binding);
    if (!slot) {
        return std::unexpected(std::format("Kernel '{}' has no binding {}", m_name, binding));
    }

    auto buffer_info = buffer.get_descriptor_info();
    auto write = vk::WriteDescriptorSet()
        .setDstSet(m_descriptor_set)
        .setDstBinding(binding)
        .setDstArrayElement(0)
        .setDescriptorType(slot->type)
        .setDescriptorCount(1)
        .setBufferInfo(buffer_info);

    m_device.updateDescriptorSets(write, {});
    Logger::instance().trace("Kernel '{}': binding {} ('{}') -> {}", m_name, binding, slot->name, buffer.name());
    return {};
}

void ComputeKernel::bind(vk::CommandBuffer cmd) const {
    cmd.bindPipeline(vk::PipelineBindPoint::eCompute, m_pipeline);
    if (m_descriptor_set) {
        cmd.bindDescriptorSets(vk::PipelineBindPoint::eCompute, m_pipeline_layout, 0, m_descriptor_set, {});
    }
}

void ComputeKernel::cleanup() {
    if (m_descriptor_pool) {
        // Descriptor set is freed with the pool
        m_device.destroyDescriptorPool(m_descriptor_pool);
        m_descriptor_pool = nullptr;
        m_descriptor_set = nullptr;
    }
    if (m_pipeline) {
        m_device.destroyPipeline(m_pipeline);
        m_pipeline = nullptr;
    }
    if (m_pipeline_layout) {
        m_device.destroyPipelineLayout(m_pipeline_layout);
        m_pipeline_layout = nullptr;
    }
    if (m_descriptor_layout) {
        m_device.destroyDescriptorSetLayout(m_descriptor_layout);
        m_descriptor_layout = nullptr;
    }
    m_shader.reset();
    Logger::instance().trace("Destroyed compute kernel '{}'", m_name);
}

// ============================================================================
// Barriers
// ============================================================================

namespace {

void memory_barrier(vk::CommandBuffer cmd,
                    vk::PipelineStageFlags src_stage, vk::AccessFlags src_access,
                    vk::PipelineStageFlags dst_stage, vk::AccessFlags dst_access)
{
    auto barrier = vk::MemoryBarrier()
        .setSrcAccessMask(src_access)
        .setDstAccessMask(dst_access);
    cmd.pipelineBarrier(src_stage, dst_stage, {}, barrier, {}, {});
}

} // anonymous namespace

void cmd_compute_barrier(vk::CommandBuffer cmd) {
    memory_barrier(cmd,
        vk::PipelineStageFlagBits::eComputeShader, vk::AccessFlagBits::eShaderWrite,
        vk::PipelineStageFlagBits::eComputeShader, vk::AccessFlagBits::eShaderRead | vk::AccessFlagBits::eShaderWrite);
}

void cmd_transfer_to_compute_barrier(vk::CommandBuffer cmd) {
    memory_barrier(cmd,
        vk::PipelineStageFlagBits::eTransfer, vk::AccessFlagBits::eTransferWrite,
        vk::PipelineStageFlagBits::eComputeShader, vk::AccessFlagBits::eShaderRead | vk::AccessFlagBits::eShaderWrite);
}

void cmd_compute_to_transfer_barrier(vk::CommandBuffer cmd) {
    memory_barrier(cmd,
        vk::PipelineStageFlagBits::eComputeShader, vk::AccessFlagBits::eShaderRead | vk::AccessFlagBits::eShaderWrite,
        vk::PipelineStageFlagBits::eTransfer, vk::AccessFlagBits::eTransferWrite);
}

} // namespace pfx
