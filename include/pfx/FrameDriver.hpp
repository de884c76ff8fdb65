#pragma once

#include "BrushRegistry.hpp"
#include "DeviceRecovery.hpp"
#include "EventQueue.hpp"
#include "FrameTimer.hpp"
#include "GpuBuffer.hpp"
#include "ParticleData.hpp"
#include "ParticleSystemConfig.hpp"
#include "TextureAtlas.hpp"
#include <expected>
#include <functional>
#include <memory>
#include <optional>
#include <span>
#include <string>
#include <vector>

namespace pfx {

/**
 * @brief Snapshot returned by FrameDriver::get_statistics()
 *
 * Frame times are host wall time of update(): the wait for the previous frame's
 * fence, recording and submission. GPU execution of the submitted frame is not
 * included.
 */
struct FrameStatistics {
    uint32_t capacity = 0;
    uint32_t alive_count = 0;
    double last_frame_ms = 0.0;     ///< Host time of the last update()
    double average_frame_ms = 0.0;  ///< Running average of last_frame_ms
};

/**
 * @brief Runs the per-frame particle pipeline and owns every GPU resource of it
 *
 * A frame is: clear targets, spawn pending events in capped batches, update, reset the
 * alive counter, cull. composite() blends the live particles into the targets.
 * All GPU work is submitted from the thread calling update()/composite(); input events
 * may be queued from any thread.
 *
 * On device loss the GPU state is released and rebuilt from later update() calls
 * following the configured backoff. Until then the driver reports itself as
 * uninitialized and every frame operation is a no-op.
 */
class FrameDriver {
public:
    /// Called before GPU state is rebuilt after a device loss; default recreates the logical device
    using DeviceResetHandler = std::function<std::expected<void, std::string>(VulkanContext&)>;

    static std::expected<std::unique_ptr<FrameDriver>, std::string> create(
        VulkanContext& context,
        const ParticleSystemConfig& config = {}
    );

    ~FrameDriver();

    FrameDriver(const FrameDriver&) = delete;
    FrameDriver& operator=(const FrameDriver&) = delete;

    /**
     * @brief Advance the simulation by delta_time seconds and spawn queued input
     *
     * Waits for the previous frame before recording.
     */
    void update(float delta_time);

    /// Queue events for the next update()
    void process_input_events(std::span<const InputEvent> events);

    /// Blend all live particles into the color and depth targets
    void composite();

    /// Block until submitted GPU work has finished
    std::expected<void, std::string> wait_idle();

    [[nodiscard]] FrameStatistics get_statistics() const;
    [[nodiscard]] int32_t get_freelist_count() const;
    [[nodiscard]] GpuCounters get_frame_counters() const;

    /// Diagnostic readback of every live record
    [[nodiscard]] std::vector<Particle> get_active_particles() const;

    /// Diagnostic readback of the freelist entries below the current count
    [[nodiscard]] std::vector<uint32_t> get_free_slots() const;

    [[nodiscard]] double get_gpu_memory_usage_mb() const;

    /// Wipe the canvas, free every particle and drop pending input
    void clear_all();

    /// Recreate the render targets at the clamped size
    void resize(int width, int height);

    /// Sprite atlas for the compositor, nullopt for disk footprints
    std::expected<void, std::string> set_atlas(std::optional<AtlasImage> image);

    // Buffers are nullptr while uninitialized. Call wait_idle() before reading them.
    [[nodiscard]] const GpuBuffer* get_particle_buffer() const;
    [[nodiscard]] const GpuBuffer* get_depth_buffer() const;
    [[nodiscard]] const GpuBuffer* get_color_buffer() const;

    [[nodiscard]] bool is_initialized() const { return m_gpu != nullptr; }

    /// Report a device loss detected outside the driver
    void notify_device_lost();

    void set_device_reset_handler(DeviceResetHandler handler) { m_reset_handler = std::move(handler); }

    void set_composite_ordering(CompositeOrdering ordering);

    /// Spawn dispatches recorded by the last update()
    [[nodiscard]] uint32_t last_dispatch_count() const { return m_last_dispatch_count; }

    /// Spawn counter the next dispatch will use, 0 while uninitialized
    [[nodiscard]] uint32_t spawn_counter() const;

    [[nodiscard]] BrushRegistry& brushes() { return m_brushes; }
    [[nodiscard]] const ParticleSystemConfig& config() const { return m_config; }
    [[nodiscard]] const DeviceRecovery& recovery() const { return m_recovery; }
    [[nodiscard]] uint64_t frame_index() const { return m_frame_index; }
    [[nodiscard]] uint64_t dropped_input_events() const { return m_queue.dropped(); }

private:
    struct GpuState;

    FrameDriver(VulkanContext& context, const ParticleSystemConfig& config);

    std::expected<std::unique_ptr<GpuState>, std::string> build_gpu_state() const;

    /// Wait for the in-flight frame, then record and submit
    std::expected<void, std::string> submit(const std::function<void(vk::CommandBuffer)>& record);

    void handle_failure(vk::Result result, std::string_view what);
    void try_recover();
    void log_statistics() const;

    VulkanContext* m_context;
    ParticleSystemConfig m_config;
    BrushRegistry m_brushes;
    EventQueue m_queue;
    FrameTimer m_timer;
    DeviceRecovery m_recovery;
    DeviceResetHandler m_reset_handler;
    std::optional<AtlasImage> m_atlas_image;
    std::unique_ptr<GpuState> m_gpu;
    uint32_t m_last_dispatch_count = 0;
    uint64_t m_frame_index = 0;
};

} // namespace pfx
