#include <pfx/UpdateKernel.hpp>

namespace pfx {

namespace {

struct UpdateParams {
    float delta_time;
    float fade_start;
    uint32_t capacity;
    uint32_t padding;
};

} // anonymous namespace

UpdateKernel::UpdateKernel(const ParticleStore& store, std::unique_ptr<ComputeKernel> kernel, float fade_start)
    : m_store(&store)
    , m_kernel(std::move(kernel))
    , m_fade_start(fade_start)
{}

std::expected<std::unique_ptr<UpdateKernel>, std::string> UpdateKernel::create(
    const VulkanContext& context,
    const ParticleStore& store,
    float fade_start
) {
    auto kernel = ComputeKernel::create(context, "update.slang", sizeof(UpdateParams));
    if (!kernel) {
        return std::unexpected(kernel.error());
    }
    if (auto bound = (*kernel)->bind_buffer(0, store.particles()); !bound) {
        return std::unexpected(bound.error());
    }
    return std::unique_ptr<UpdateKernel>(new UpdateKernel(store, std::move(*kernel), fade_start));
}

void UpdateKernel::record(vk::CommandBuffer cmd, float delta_time) const {
    UpdateParams params{
        .delta_time = delta_time,
        .fade_start = m_fade_start,
        .capacity = m_store->capacity(),
        .padding = 0
    };
    m_kernel->record(cmd, params, ComputeKernel::groups_for(m_store->capacity()));
    cmd_compute_barrier(cmd);
}

} // namespace pfx
