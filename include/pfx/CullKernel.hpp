#pragma once

#include "ComputeKernel.hpp"
#include "ParticleStore.hpp"
#include <expected>
#include <memory>
#include <string>

namespace pfx {

/**
 * @brief Counts live slots and returns dead ones to the freelist
 *
 * The in_freelist flag makes the push happen once per death, so running the
 * kernel again over an unchanged store pushes nothing.
 */
class CullKernel {
public:
    static std::expected<std::unique_ptr<CullKernel>, std::string> create(
        const VulkanContext& context,
        const ParticleStore& store
    );

    /// Records the alive-counter reset followed by the cull dispatch
    void record(vk::CommandBuffer cmd) const;

private:
    CullKernel(const ParticleStore& store, std::unique_ptr<ComputeKernel> kernel);

    const ParticleStore* m_store;
    std::unique_ptr<ComputeKernel> m_kernel;
};

} // namespace pfx
