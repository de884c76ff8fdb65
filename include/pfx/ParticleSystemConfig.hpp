#pragma once

#include "DeviceRecovery.hpp"
#include <cstdint>

namespace pfx {

enum class CompositeOrdering {
    Parallel,  ///< One thread per slot; overlapping writes race
    Serial     ///< One invocation walks every slot in index order; deterministic, slow
};

/**
 * @brief Configuration for the particle system and its frame driver
 *
 * Built with designated initializers; anything left out keeps the default.
 * Call validated() before use; out-of-range values are clamped, never rejected.
 */
struct ParticleSystemConfig {
    /// Number of particle slots
    uint32_t capacity = 100'000;

    /// Render target size in pixels
    int canvas_width = 1920;
    int canvas_height = 1080;

    /// Largest number of input events per spawn dispatch
    uint32_t max_batch_size = 512;

    /// Pending input events kept between frames; older events are dropped first
    uint32_t max_pending_events = 8192;

    /// Normalized age at which opacity starts to fall off
    float fade_start = 0.6f;

    /// Lifetime of paint when no brush overrides it
    float base_lifetime = 8.0f;

    /// Depth value the target is cleared to; must exceed any particle depth
    float depth_clear = 10'000.0f;

    /// Frames between statistics log lines, 0 disables them
    uint32_t stats_log_interval = 600;

    CompositeOrdering composite_ordering = CompositeOrdering::Parallel;

    RecoveryPolicy recovery = {};

    /**
     * @brief Copy with every field clamped into its supported range
     *
     * Each correction is logged as a warning.
     */
    [[nodiscard]] ParticleSystemConfig validated() const;
};

inline constexpr uint32_t MAX_SPAWN_BATCH = 512;
inline constexpr int MIN_CANVAS_EXTENT = 1;
inline constexpr int MAX_CANVAS_EXTENT = 16384;

} // namespace pfx
