#include <pfx/Compositor.hpp>
#include <pfx/Logger.hpp>

namespace pfx {

namespace {

struct DiskParams {
    uint32_t capacity;
    int32_t width;
    int32_t height;
    uint32_t serial;
    uint32_t current_serial;
    uint32_t padding[3];
};

struct AtlasParams {
    uint32_t capacity;
    int32_t width;
    int32_t height;
    uint32_t serial;
    int32_t tile_size;
    uint32_t current_serial;
    uint32_t padding[2];
};

std::expected<void, std::string> bind_common(ComputeKernel& kernel, const ParticleStore& store,
                                             const RenderTargets& targets)
{
    for (auto result : {kernel.bind_buffer(0, store.particles()), kernel.bind_buffer(1, targets.color()),
                        kernel.bind_buffer(2, targets.depth())}) {
        if (!result) {
            return result;
        }
    }
    return {};
}

} // anonymous namespace

Compositor::Compositor(const ParticleStore& store, const RenderTargets& targets, CompositeOrdering ordering,
                       std::unique_ptr<ComputeKernel> disk_kernel, std::unique_ptr<ComputeKernel> atlas_kernel)
    : m_store(&store)
    , m_targets(&targets)
    , m_ordering(ordering)
    , m_disk_kernel(std::move(disk_kernel))
    , m_atlas_kernel(std::move(atlas_kernel))
{}

std::expected<std::unique_ptr<Compositor>, std::string> Compositor::create(
    const VulkanContext& context,
    const ParticleStore& store,
    const RenderTargets& targets,
    CompositeOrdering ordering
) {
    auto disk = ComputeKernel::create(context, "composite_disk.slang", sizeof(DiskParams));
    if (!disk) {
        return std::unexpected(disk.error());
    }
    auto atlas = ComputeKernel::create(context, "composite_atlas.slang", sizeof(AtlasParams));
    if (!atlas) {
        return std::unexpected(atlas.error());
    }

    auto compositor = std::unique_ptr<Compositor>(new Compositor(
        store, targets, ordering, std::move(*disk), std::move(*atlas)));
    if (auto bound = compositor->rebind_targets(); !bound) {
        return std::unexpected(bound.error());
    }
    return compositor;
}

std::expected<void, std::string> Compositor::set_atlas(const TextureAtlas* atlas) {
    if (atlas) {
        if (auto bound = m_atlas_kernel->bind_buffer(3, atlas->texels()); !bound) {
            return bound;
        }
        Logger::instance().info("Compositor using {} px atlas sprites", atlas->tile_size());
    } else {
        Logger::instance().info("Compositor using disk footprints");
    }
    m_atlas = atlas;
    return {};
}

std::expected<void, std::string> Compositor::rebind_targets() {
    if (auto bound = bind_common(*m_disk_kernel, *m_store, *m_targets); !bound) {
        return bound;
    }
    return bind_common(*m_atlas_kernel, *m_store, *m_targets);
}

void Compositor::record(vk::CommandBuffer cmd, uint32_t current_serial) const {
    const bool serial = m_ordering == CompositeOrdering::Serial;
    const uint32_t groups = serial ? 1u : ComputeKernel::groups_for(m_store->capacity());

    if (m_atlas) {
        AtlasParams params{
            .capacity = m_store->capacity(),
            .width = m_targets->width(),
            .height = m_targets->height(),
            .serial = serial ? 1u : 0u,
            .tile_size = static_cast<int32_t>(m_atlas->tile_size()),
            .current_serial = current_serial,
            .padding = {}
        };
        m_atlas_kernel->record(cmd, params, groups);
    } else {
        DiskParams params{
            .capacity = m_store->capacity(),
            .width = m_targets->width(),
            .height = m_targets->height(),
            .serial = serial ? 1u : 0u,
            .current_serial = current_serial,
            .padding = {}
        };
        m_disk_kernel->record(cmd, params, groups);
    }
    cmd_compute_barrier(cmd);
}

} // namespace pfx
