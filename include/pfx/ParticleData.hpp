#pragma once

#include <glm/glm.hpp>
#include <vulkan/vulkan.hpp>
#include <algorithm>
#include <cstdint>

namespace pfx {

/**
 * @brief One slot of the particle store, shared byte-for-byte with particles.slang
 *
 * std430 layout, 80 bytes. A slot is alive while age < max_lifetime and color.a > 0.01.
 * Dead slots keep their last record until the spawn kernel overwrites them.
 */
struct Particle {
    glm::vec3 position;      ///< Canvas-space pixels (z unused)
    float size;              ///< Footprint diameter in pixels
    glm::vec3 velocity;      ///< Always zero; paint does not move once deposited
    float age;               ///< Seconds since spawn
    glm::vec4 color;         ///< Premultiplied RGBA
    float max_lifetime;      ///< Seconds
    uint32_t texture_index;  ///< Atlas tile, 0-7
    int32_t session_id;      ///< Input stream that produced the particle
    uint32_t recency_tag;    ///< pack_recency(spawn counter, slot)
    uint32_t in_freelist;    ///< 1 once the slot has been pushed back onto the freelist
    uint32_t spawn_serial;   ///< Full spawn counter of the dispatch that wrote the slot
    uint32_t padding[2];
};
static_assert(sizeof(Particle) == 80, "Particle must match the std430 layout in particles.slang");

/**
 * @brief Input event as consumed by the spawn kernel
 *
 * Built on the host from an InputEvent and the session's brush.
 */
struct GpuInputEvent {
    glm::vec2 position;
    float size;
    float timestamp;
    glm::vec4 color;
    int32_t session_id;
    uint32_t texture_index;
    float rotation_hint;
    float lifetime;          ///< Base lifetime before jitter
    uint32_t particle_count; ///< Particles to spawn for this event
    float lifetime_jitter;   ///< Relative, maxLifetime = lifetime * (1 +- jitter)
    float jitter_radius;     ///< Position jitter disk radius in pixels
    uint32_t padding;
};
static_assert(sizeof(GpuInputEvent) == 64, "GpuInputEvent must match the std430 layout in particles.slang");

/**
 * @brief Counter block written with atomics by the spawn, cull and init kernels
 *
 * freelist_count is signed because allocation decrements before it checks.
 * Lives in host-visible memory so statistics are a plain read after the frame fence.
 */
struct GpuCounters {
    int32_t freelist_count;
    uint32_t alive_count;
    uint32_t freelist_pushes;  ///< Total frees since the last initialisation
    uint32_t spawned;          ///< Total successful allocations since the last initialisation
    uint32_t dropped;          ///< Spawn attempts refused because the freelist was empty
    uint32_t padding[3];
};
static_assert(sizeof(GpuCounters) == 32, "GpuCounters must match the counter indices in particles.slang");

/**
 * @brief Event handed to the particle system by an input producer
 */
struct InputEvent {
    glm::vec2 position{0.0f};
    glm::vec4 color{1.0f};   ///< Premultiplied RGBA
    float size = 4.0f;
    float timestamp = 0.0f;  ///< Seconds, producer clock
    int32_t session_id = 0;
    uint32_t texture_index = 0;
    float rotation_hint = 0.0f;
};

// Recency tag: 12 bits of spawn counter above 20 bits of slot index.
inline constexpr uint32_t RECENCY_SLOT_BITS = 20;
inline constexpr uint32_t RECENCY_SLOT_MASK = (1u << RECENCY_SLOT_BITS) - 1;
inline constexpr uint32_t RECENCY_COUNTER_MASK = (1u << (32 - RECENCY_SLOT_BITS)) - 1;
inline constexpr float RECENCY_EPSILON = 1.0e-6f;

/// Largest store the recency tag can address.
inline constexpr uint32_t MAX_PARTICLE_CAPACITY = 1u << RECENCY_SLOT_BITS;

[[nodiscard]] constexpr uint32_t pack_recency(uint32_t spawn_counter, uint32_t slot)
{
    return ((spawn_counter & RECENCY_COUNTER_MASK) << RECENCY_SLOT_BITS) | (slot & RECENCY_SLOT_MASK);
}

[[nodiscard]] constexpr uint32_t recency_counter(uint32_t tag) { return tag >> RECENCY_SLOT_BITS; }
[[nodiscard]] constexpr uint32_t recency_slot(uint32_t tag) { return tag & RECENCY_SLOT_MASK; }

/// Ranks saturate here so the recency term stays well below one frame of age.
inline constexpr uint32_t RECENCY_RANK_CAP = 4095;

/**
 * @brief Dispatches between a particle's spawn and current_serial, saturated at RECENCY_RANK_CAP
 *
 * current_serial is the spawn counter of the next dispatch. The subtraction is
 * modulo 2^32, so the order holds across a wrap of the counter.
 */
[[nodiscard]] constexpr uint32_t recency_rank(uint32_t spawn_serial, uint32_t current_serial)
{
    return std::min(current_serial - spawn_serial, RECENCY_RANK_CAP);
}

/// Compositing depth of a particle; smaller is newer and wins the depth test.
[[nodiscard]] constexpr float particle_depth(float age, uint32_t spawn_serial, uint32_t current_serial)
{
    return age + static_cast<float>(recency_rank(spawn_serial, current_serial)) * RECENCY_EPSILON;
}

[[nodiscard]] inline bool is_alive(const Particle& particle)
{
    return particle.age < particle.max_lifetime && particle.color.a > 0.01f;
}

} // namespace pfx
