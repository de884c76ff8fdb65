#include <pfx/ParticleStore.hpp>
#include <pfx/Logger.hpp>
#include <cstring>
#include <array>
#include <cstddef>
#include <format>
#include <utility>

namespace pfx {

namespace {

struct InitParams {
    uint32_t capacity;
    uint32_t padding[3];
};

} // anonymous namespace

ParticleStore::ParticleStore(const VulkanContext& context, uint32_t capacity,
                             GpuBuffer particles, GpuBuffer freelist, GpuBuffer counters,
                             std::unique_ptr<ComputeKernel> init_kernel)
    : m_context(&context)
    , m_capacity(capacity)
    , m_particles(std::move(particles))
    , m_freelist(std::move(freelist))
    , m_counters(std::move(counters))
    , m_init_kernel(std::move(init_kernel))
{}

std::expected<std::unique_ptr<ParticleStore>, std::string> ParticleStore::create(
    const VulkanContext& context,
    uint32_t capacity
) {
    if (capacity == 0 || capacity > MAX_PARTICLE_CAPACITY) {
        return std::unexpected(std::format("Particle capacity {} outside 1..{}", capacity, MAX_PARTICLE_CAPACITY));
    }

    auto particles = GpuBuffer::create(context, {
        .size = sizeof(Particle) * capacity,
        .location = MemoryLocation::DeviceLocal,
        .name = "particles"
    });
    if (!particles) {
        return std::unexpected(particles.error());
    }

    auto freelist = GpuBuffer::create(context, {
        .size = sizeof(uint32_t) * capacity,
        .location = MemoryLocation::DeviceLocal,
        .name = "freelist"
    });
    if (!freelist) {
        return std::unexpected(freelist.error());
    }

    auto counters = GpuBuffer::create(context, {
        .size = sizeof(GpuCounters),
        .location = MemoryLocation::HostVisible,
        .name = "counters"
    });
    if (!counters) {
        return std::unexpected(counters.error());
    }

    auto kernel = ComputeKernel::create(context, "freelist_init.slang", sizeof(InitParams));
    if (!kernel) {
        return std::unexpected(kernel.error());
    }

    const std::array<std::pair<uint32_t, const GpuBuffer*>, 3> bindings{{
        {0, &*particles}, {1, &*freelist}, {2, &*counters}
    }};
    for (const auto& [binding, buffer] : bindings) {
        if (auto bound = (*kernel)->bind_buffer(binding, *buffer); !bound) {
            return std::unexpected(bound.error());
        }
    }

    auto store = std::unique_ptr<ParticleStore>(new ParticleStore(
        context, capacity, std::move(*particles), std::move(*freelist), std::move(*counters), std::move(*kernel)));

    if (auto result = store->initialize(); !result) {
        return std::unexpected(std::format("Failed to initialise particle store: {}", result.error()));
    }

    Logger::instance().info("Created particle store: {} slots, {:.2f} MB", capacity,
        static_cast<double>(store->memory_usage_bytes()) / (1024.0 * 1024.0));
    return store;
}

void ParticleStore::record_initialize(vk::CommandBuffer cmd) const {
    InitParams params{.capacity = m_capacity, .padding = {}};
    m_init_kernel->record(cmd, params, ComputeKernel::groups_for(m_capacity));
    cmd_compute_barrier(cmd);
}

std::expected<void, std::string> ParticleStore::initialize() {
    return submit_one_time_commands(*m_context, [this](vk::CommandBuffer cmd) {
        record_initialize(cmd);
    });
}

void ParticleStore::record_reset_alive(vk::CommandBuffer cmd) const {
    cmd_compute_to_transfer_barrier(cmd);
    cmd.fillBuffer(m_counters.buffer(), offsetof(GpuCounters, alive_count), sizeof(uint32_t), 0);
    cmd_transfer_to_compute_barrier(cmd);
}

GpuCounters ParticleStore::read_counters() const {
    GpuCounters counters{};
    std::memcpy(&counters, m_counters.mapped(), sizeof(GpuCounters));
    return counters;
}

std::expected<std::vector<uint32_t>, std::string> ParticleStore::read_freelist() const {
    return m_freelist.download_as<uint32_t>();
}

std::expected<std::vector<Particle>, std::string> ParticleStore::read_particles() const {
    return m_particles.download_as<Particle>();
}

vk::DeviceSize ParticleStore::memory_usage_bytes() const {
    return m_particles.size() + m_freelist.size() + m_counters.size();
}

} // namespace pfx
