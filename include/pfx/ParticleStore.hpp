#pragma once

#include "ComputeKernel.hpp"
#include "GpuBuffer.hpp"
#include "ParticleData.hpp"
#include <expected>
#include <memory>
#include <string>
#include <vector>

namespace pfx {

/**
 * @brief GPU-resident particle records, the free-slot stack and the counter block
 *
 * Slots are handed out by the spawn kernel (pop) and returned by the cull kernel
 * (push); the host only initialises the store and reads it back for diagnostics.
 */
class ParticleStore {
public:
    static std::expected<std::unique_ptr<ParticleStore>, std::string> create(
        const VulkanContext& context,
        uint32_t capacity
    );

    ParticleStore(const ParticleStore&) = delete;
    ParticleStore& operator=(const ParticleStore&) = delete;

    /**
     * @brief Record the init kernel: all slots dead and free, counters reset
     */
    void record_initialize(vk::CommandBuffer cmd) const;

    /**
     * @brief Run the init kernel and wait
     */
    std::expected<void, std::string> initialize();

    /**
     * @brief Record a reset of the alive counter, followed by a barrier for the cull kernel
     */
    void record_reset_alive(vk::CommandBuffer cmd) const;

    /**
     * @brief Counter block as last written by the GPU
     *
     * The buffer is host-coherent; the caller must make sure no frame is in flight.
     */
    [[nodiscard]] GpuCounters read_counters() const;

    [[nodiscard]] std::expected<std::vector<uint32_t>, std::string> read_freelist() const;
    [[nodiscard]] std::expected<std::vector<Particle>, std::string> read_particles() const;

    [[nodiscard]] uint32_t capacity() const { return m_capacity; }
    [[nodiscard]] vk::DeviceSize memory_usage_bytes() const;

    [[nodiscard]] const GpuBuffer& particles() const { return m_particles; }
    [[nodiscard]] const GpuBuffer& freelist() const { return m_freelist; }
    [[nodiscard]] const GpuBuffer& counters() const { return m_counters; }

private:
    ParticleStore(const VulkanContext& context, uint32_t capacity,
                  GpuBuffer particles, GpuBuffer freelist, GpuBuffer counters,
                  std::unique_ptr<ComputeKernel> init_kernel);

    const VulkanContext* m_context;
    uint32_t m_capacity;
    GpuBuffer m_particles;
    GpuBuffer m_freelist;
    GpuBuffer m_counters;
    std::unique_ptr<ComputeKernel> m_init_kernel;
};

} // namespace pfx
