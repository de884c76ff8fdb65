#include <pfx/CullKernel.hpp>

namespace pfx {

namespace {

struct CullParams {
    uint32_t capacity;
    uint32_t padding[3];
};

} // anonymous namespace

CullKernel::CullKernel(const ParticleStore& store, std::unique_ptr<ComputeKernel> kernel)
    : m_store(&store)
    , m_kernel(std::move(kernel))
{}

std::expected<std::unique_ptr<CullKernel>, std::string> CullKernel::create(
    const VulkanContext& context,
    const ParticleStore& store
) {
    auto kernel = ComputeKernel::create(context, "cull.slang", sizeof(CullParams));
    if (!kernel) {
        return std::unexpected(kernel.error());
    }

    auto& k = **kernel;
    for (auto result : {k.bind_buffer(0, store.particles()), k.bind_buffer(1, store.freelist()),
                        k.bind_buffer(2, store.counters())}) {
        if (!result) {
            return std::unexpected(result.error());
        }
    }
    return std::unique_ptr<CullKernel>(new CullKernel(store, std::move(*kernel)));
}

void CullKernel::record(vk::CommandBuffer cmd) const {
    m_store->record_reset_alive(cmd);

    CullParams params{.capacity = m_store->capacity(), .padding = {}};
    m_kernel->record(cmd, params, ComputeKernel::groups_for(m_store->capacity()));
    cmd_compute_barrier(cmd);
}

} // namespace pfx
