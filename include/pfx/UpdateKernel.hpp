#pragma once

#include "ComputeKernel.hpp"
#include "ParticleStore.hpp"
#include <expected>
#include <memory>
#include <string>

namespace pfx {

/**
 * @brief Ages every live slot and applies the cubic fade
 *
 * Alpha stays 1 until age / max_lifetime reaches fade_start, then falls as
 * 1 - progress^3. Particles whose alpha drops below 0.02 are killed outright.
 */
class UpdateKernel {
public:
    static std::expected<std::unique_ptr<UpdateKernel>, std::string> create(
        const VulkanContext& context,
        const ParticleStore& store,
        float fade_start
    );

    void record(vk::CommandBuffer cmd, float delta_time) const;

    [[nodiscard]] float fade_start() const { return m_fade_start; }

private:
    UpdateKernel(const ParticleStore& store, std::unique_ptr<ComputeKernel> kernel, float fade_start);

    const ParticleStore* m_store;
    std::unique_ptr<ComputeKernel> m_kernel;
    float m_fade_start;
};

} // namespace pfx
