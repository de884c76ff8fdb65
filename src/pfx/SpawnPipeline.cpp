#include <pfx/SpawnPipeline.hpp>
#include <pfx/Logger.hpp>
#include <algorithm>
#include <format>

namespace pfx {

namespace {

struct SpawnParams {
    uint32_t event_offset;
    uint32_t event_count;
    uint32_t spawn_counter;
    uint32_t capacity;
};

} // anonymous namespace

std::vector<SpawnBatch> plan_spawn_batches(uint32_t event_count, uint32_t max_batch_size) {
    std::vector<SpawnBatch> batches;
    if (max_batch_size == 0) {
        return batches;
    }
    batches.reserve((event_count + max_batch_size - 1) / max_batch_size);
    for (uint32_t offset = 0; offset < event_count; offset += max_batch_size) {
        batches.push_back({offset, std::min(max_batch_size, event_count - offset)});
    }
    return batches;
}

GpuInputEvent resolve_event(const InputEvent& event, const BrushRecord& brush) {
    float size = event.size * brush.size_scale;
    return GpuInputEvent{
        .position = event.position,
        .size = size,
        .timestamp = event.timestamp,
        .color = brush.color_override.value_or(event.color),
        .session_id = event.session_id,
        .texture_index = event.texture_index & 7u,
        .rotation_hint = event.rotation_hint,
        .lifetime = brush.lifetime,
        .particle_count = std::max(brush.particles_per_event, 1u),
        .lifetime_jitter = brush.lifetime_jitter,
        .jitter_radius = brush.jitter_radius(size),
        .padding = 0
    };
}

SpawnPipeline::SpawnPipeline(const ParticleStore& store, GpuBuffer events, std::unique_ptr<ComputeKernel> kernel,
                             uint32_t max_pending_events, uint32_t max_batch_size)
    : m_store(&store)
    , m_events(std::move(events))
    , m_kernel(std::move(kernel))
    , m_max_pending_events(max_pending_events)
    , m_max_batch_size(max_batch_size)
{
    m_staging.reserve(max_pending_events);
}

std::expected<std::unique_ptr<SpawnPipeline>, std::string> SpawnPipeline::create(
    const VulkanContext& context,
    const ParticleStore& store,
    uint32_t max_pending_events,
    uint32_t max_batch_size
) {
    if (max_batch_size == 0 || max_pending_events == 0) {
        return std::unexpected("Spawn pipeline needs a non-zero batch size and event capacity");
    }

    auto events = GpuBuffer::create(context, {
        .size = sizeof(GpuInputEvent) * max_pending_events,
        .location = MemoryLocation::HostVisible,
        .name = "input events"
    });
    if (!events) {
        return std::unexpected(events.error());
    }

    auto kernel = ComputeKernel::create(context, "spawn.slang", sizeof(SpawnParams));
    if (!kernel) {
        return std::unexpected(kernel.error());
    }

    auto& k = **kernel;
    for (auto result : {k.bind_buffer(0, store.particles()), k.bind_buffer(1, store.freelist()),
                        k.bind_buffer(2, store.counters()), k.bind_buffer(3, *events)}) {
        if (!result) {
            return std::unexpected(result.error());
        }
    }

    return std::unique_ptr<SpawnPipeline>(new SpawnPipeline(
        store, std::move(*events), std::move(*kernel), max_pending_events, max_batch_size));
}

std::expected<uint32_t, std::string> SpawnPipeline::record(
    vk::CommandBuffer cmd,
    std::span<const InputEvent> events,
    const BrushRegistry& brushes
) {
    if (events.empty()) {
        return 0u;
    }
    if (events.size() > m_max_pending_events) {
        Logger::instance().warn("{} events exceed the spawn buffer, ignoring {}", events.size(),
            events.size() - m_max_pending_events);
        events = events.first(m_max_pending_events);
    }

    m_staging.clear();
    for (const auto& event : events) {
        m_staging.push_back(resolve_event(event, brushes.get(event.session_id)));
    }
    if (auto uploaded = m_events.upload(std::span<const GpuInputEvent>(m_staging)); !uploaded) {
        return std::unexpected(std::format("Failed to upload input events: {}", uploaded.error()));
    }

    auto batches = plan_spawn_batches(static_cast<uint32_t>(m_staging.size()), m_max_batch_size);
    for (const auto& batch : batches) {
        SpawnParams params{
            .event_offset = batch.offset,
            .event_count = batch.count,
            .spawn_counter = m_spawn_counter++,
            .capacity = m_store->capacity()
        };
        m_kernel->record(cmd, params, ComputeKernel::groups_for(batch.count));
        // Next dispatch pops from the freelist this one just changed
        cmd_compute_barrier(cmd);
    }

    Logger::instance().trace("Recorded {} spawn dispatches for {} events", batches.size(), m_staging.size());
    return static_cast<uint32_t>(batches.size());
}

} // namespace pfx
