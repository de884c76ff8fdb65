#pragma once

#include "BrushRegistry.hpp"
#include "ComputeKernel.hpp"
#include "ParticleStore.hpp"
#include <expected>
#include <memory>
#include <span>
#include <string>
#include <vector>

namespace pfx {

/**
 * @brief Slice of the pending events handled by one spawn dispatch
 */
struct SpawnBatch {
    uint32_t offset;
    uint32_t count;

    bool operator==(const SpawnBatch&) const = default;
};

/**
 * @brief Split event_count events into dispatches of at most max_batch_size
 */
[[nodiscard]] std::vector<SpawnBatch> plan_spawn_batches(uint32_t event_count, uint32_t max_batch_size);

/**
 * @brief Build the device-side event record from a host event and its session's brush
 */
[[nodiscard]] GpuInputEvent resolve_event(const InputEvent& event, const BrushRecord& brush);

/**
 * @brief Uploads pending input events and records the capped spawn dispatches
 *
 * The spawn counter advances once per dispatch, so every particle of a later
 * dispatch sorts in front of every particle of an earlier one.
 */
class SpawnPipeline {
public:
    static std::expected<std::unique_ptr<SpawnPipeline>, std::string> create(
        const VulkanContext& context,
        const ParticleStore& store,
        uint32_t max_pending_events,
        uint32_t max_batch_size
    );

    SpawnPipeline(const SpawnPipeline&) = delete;
    SpawnPipeline& operator=(const SpawnPipeline&) = delete;

    /**
     * @brief Resolve and upload events, then record one dispatch per batch
     *
     * Events beyond max_pending_events are ignored. The event buffer is written from
     * the host, so no frame using it may be in flight.
     *
     * @return Number of dispatches recorded
     */
    std::expected<uint32_t, std::string> record(
        vk::CommandBuffer cmd,
        std::span<const InputEvent> events,
        const BrushRegistry& brushes
    );

    [[nodiscard]] uint32_t spawn_counter() const { return m_spawn_counter; }
    [[nodiscard]] uint32_t max_batch_size() const { return m_max_batch_size; }
    [[nodiscard]] vk::DeviceSize memory_usage_bytes() const { return m_events.size(); }

private:
    SpawnPipeline(const ParticleStore& store, GpuBuffer events, std::unique_ptr<ComputeKernel> kernel,
                  uint32_t max_pending_events, uint32_t max_batch_size);

    const ParticleStore* m_store;
    GpuBuffer m_events;
    std::unique_ptr<ComputeKernel> m_kernel;
    uint32_t m_max_pending_events;
    uint32_t m_max_batch_size;
    uint32_t m_spawn_counter = 0;
    std::vector<GpuInputEvent> m_staging;
};

} // namespace pfx
