#pragma once

#include "ComputeKernel.hpp"
#include "ParticleStore.hpp"
#include "ParticleSystemConfig.hpp"
#include "RenderTargets.hpp"
#include "TextureAtlas.hpp"
#include <expected>
#include <memory>
#include <string>

namespace pfx {

/**
 * @brief Depth-gated premultiplied source-over of every live particle into the render targets
 *
 * Each particle's depth is its age plus a recency rank, the number of spawn dispatches
 * since it was written, so newer paint lands on top.
 * In Parallel mode the depth read-test-write is not atomic across threads and
 * overlapping particles may blend in either order; Serial mode walks the slots in
 * index order from a single invocation and is deterministic.
 */
class Compositor {
public:
    static std::expected<std::unique_ptr<Compositor>, std::string> create(
        const VulkanContext& context,
        const ParticleStore& store,
        const RenderTargets& targets,
        CompositeOrdering ordering
    );

    /**
     * @brief Sprite atlas to sample, or nullptr for the disk footprint
     *
     * The atlas must outlive the compositor or be unset first.
     */
    std::expected<void, std::string> set_atlas(const TextureAtlas* atlas);

    /// Re-point the target bindings after RenderTargets::resize
    std::expected<void, std::string> rebind_targets();

    /// current_serial is the spawn counter the next spawn dispatch will use
    void record(vk::CommandBuffer cmd, uint32_t current_serial) const;

    void set_ordering(CompositeOrdering ordering) { m_ordering = ordering; }
    [[nodiscard]] CompositeOrdering ordering() const { return m_ordering; }
    [[nodiscard]] bool has_atlas() const { return m_atlas != nullptr; }

private:
    Compositor(const ParticleStore& store, const RenderTargets& targets, CompositeOrdering ordering,
               std::unique_ptr<ComputeKernel> disk_kernel, std::unique_ptr<ComputeKernel> atlas_kernel);

    const ParticleStore* m_store;
    const RenderTargets* m_targets;
    const TextureAtlas* m_atlas = nullptr;
    CompositeOrdering m_ordering;
    std::unique_ptr<ComputeKernel> m_disk_kernel;
    std::unique_ptr<ComputeKernel> m_atlas_kernel;
};

} // namespace pfx
