#pragma once

#include "GpuBuffer.hpp"
#include "Shader.hpp"
#include <expected>
#include <memory>
#include <string>
#include <string_view>
#include <type_traits>

namespace pfx {

/// Threads per workgroup of every particle kernel; must match [numthreads] in the shaders.
inline constexpr uint32_t KERNEL_GROUP_SIZE = 256;

/**
 * @brief One compute pipeline with its descriptor set, built from shader reflection
 *
 * The descriptor set layout and the push-constant range are taken from the Slang
 * reflection of the entry point, so a kernel only needs its buffers bound.
 */
class ComputeKernel {
public:
    /**
     * @brief Compile a Slang module and build the pipeline around it
     *
     * @param context Vulkan context
     * @param module Slang module path relative to SHADER_DIR
     * @param expected_push_size Host-side size of the push-constant block, checked against reflection
     */
    static std::expected<std::unique_ptr<ComputeKernel>, std::string> create(
        const VulkanContext& context,
        std::string_view module,
        std::size_t expected_push_size
    );

    ~ComputeKernel();

    ComputeKernel(const ComputeKernel&) = delete;
    ComputeKernel& operator=(const ComputeKernel&) = delete;
    ComputeKernel(ComputeKernel&&) = delete;
    ComputeKernel& operator=(ComputeKernel&&) = delete;

    /**
     * @brief Point a storage-buffer binding at a buffer
     *
     * Must not be called while a command buffer using this kernel is pending.
     */
    std::expected<void, std::string> bind_buffer(uint32_t binding, const GpuBuffer& buffer);

    /**
     * @brief Record bind + push + dispatch
     */
    template<class Push>
    void record(vk::CommandBuffer cmd, const Push& push, uint32_t group_count) const {
        static_assert(std::is_trivially_copyable_v<Push>);
        bind(cmd);
        if (m_push_size > 0) {
            cmd.pushConstants(m_pipeline_layout, vk::ShaderStageFlagBits::eCompute, 0, sizeof(Push), &push);
        }
        cmd.dispatch(group_count, 1, 1);
    }

    [[nodiscard]] static uint32_t groups_for(uint32_t threads) {
        return (threads + KERNEL_GROUP_SIZE - 1) / KERNEL_GROUP_SIZE;
    }

    [[nodiscard]] const std::string& name() const { return m_name; }

private:
    ComputeKernel(const VulkanContext& context, std::string_view module);

    std::expected<void, std::string> initialize(std::size_t expected_push_size);
    std::expected<void, std::string> create_descriptor_layout();
    std::expected<void, std::string> create_pipeline();
    std::expected<void, std::string> create_descriptor_set();
    void bind(vk::CommandBuffer cmd) const;
    void cleanup();

    const VulkanContext* m_context;
    vk::Device m_device;
    std::string m_name;

    std::unique_ptr<Shader> m_shader;
    std::size_t m_push_size = 0;

    vk::DescriptorSetLayout m_descriptor_layout;
    vk::PipelineLayout m_pipeline_layout;
    vk::Pipeline m_pipeline;
    vk::DescriptorPool m_descriptor_pool;
    vk::DescriptorSet m_descriptor_set;
};

/**
 * @brief Make compute writes visible to the next compute dispatch in the same command buffer
 */
void cmd_compute_barrier(vk::CommandBuffer cmd);

/**
 * @brief Make fillBuffer/copyBuffer writes visible to the next compute dispatch
 */
void cmd_transfer_to_compute_barrier(vk::CommandBuffer cmd);

/**
 * @brief Make compute writes visible to a following fillBuffer/copyBuffer
 */
void cmd_compute_to_transfer_barrier(vk::CommandBuffer cmd);

} // namespace pfx
