#pragma once

#include "VulkanContext.hpp"
#include <cstddef>
#include <cstring>
#include <expected>
#include <functional>
#include <span>
#include <string>
#include <vector>

namespace pfx {

enum class MemoryLocation
{
    DeviceLocal,   ///< GPU-only; transfers go through a staging buffer
    HostVisible    ///< Host-coherent and persistently mapped
};

/**
 * @brief Configuration for GPU buffer creation
 */
struct GpuBufferConfig {
    /// Size in bytes, must be non-zero
    vk::DeviceSize size = 0;

    MemoryLocation location = MemoryLocation::DeviceLocal;

    /// Usage flags beyond the default STORAGE_BUFFER | TRANSFER_SRC | TRANSFER_DST
    vk::BufferUsageFlags additional_usage_flags = {};

    /// Name used in log output
    std::string name = "buffer";
};

/**
 * @brief Record commands into a throwaway command buffer, submit them on the compute queue and wait
 *
 * Used for uploads, readbacks and one-off initialisation outside the frame loop.
 */
std::expected<void, std::string> submit_one_time_commands(
    const VulkanContext& context,
    const std::function<void(vk::CommandBuffer)>& record
);

/**
 * @brief RAII wrapper for a storage buffer and its memory
 *
 * Every GPU-resident array of the particle system (records, freelist, counters,
 * input events, render targets, atlas texels) is one of these. When the context
 * has a dedicated compute family the buffer is shared concurrently with the
 * graphics family so the presenter can read what the compute queue wrote.
 */
class GpuBuffer {
public:
    /**
     * @brief Create a buffer
     *
     * @param context Vulkan context
     * @param config Buffer configuration
     * @return GpuBuffer on success, error message on failure
     */
    static std::expected<GpuBuffer, std::string> create(
        const VulkanContext& context,
        const GpuBufferConfig& config
    );

    ~GpuBuffer();

    // Non-copyable
    GpuBuffer(const GpuBuffer&) = delete;
    GpuBuffer& operator=(const GpuBuffer&) = delete;

    // Movable
    GpuBuffer(GpuBuffer&& other) noexcept;
    GpuBuffer& operator=(GpuBuffer&& other) noexcept;

    [[nodiscard]] vk::Buffer buffer() const { return m_buffer; }
    [[nodiscard]] vk::DeviceSize size() const { return m_config.size; }
    [[nodiscard]] MemoryLocation location() const { return m_config.location; }
    [[nodiscard]] const std::string& name() const { return m_config.name; }

    /**
     * @brief Host pointer for HostVisible buffers, nullptr otherwise
     */
    [[nodiscard]] void* mapped() const { return m_mapped; }

    /**
     * @brief Get descriptor buffer info for binding
     */
    [[nodiscard]] vk::DescriptorBufferInfo get_descriptor_info() const {
        return vk::DescriptorBufferInfo()
            .setBuffer(m_buffer)
            .setOffset(0)
            .setRange(VK_WHOLE_SIZE);
    }

    /**
     * @brief Copy bytes into the buffer starting at offset
     */
    std::expected<void, std::string> upload(std::span<const std::byte> data, vk::DeviceSize offset = 0);

    template<class T>
    std::expected<void, std::string> upload(std::span<const T> values, vk::DeviceSize offset = 0) {
        return upload(std::as_bytes(values), offset);
    }

    /**
     * @brief Synchronous copy of the whole buffer back to the host
     *
     * Blocks until the transfer has finished. Meant for diagnostics and tests.
     */
    [[nodiscard]] std::expected<std::vector<std::byte>, std::string> download() const;

    template<class T>
    [[nodiscard]] std::expected<std::vector<T>, std::string> download_as() const {
        auto bytes = download();
        if (!bytes) {
            return std::unexpected(bytes.error());
        }
        std::vector<T> values(bytes->size() / sizeof(T));
        std::memcpy(values.data(), bytes->data(), values.size() * sizeof(T));
        return values;
    }

    /**
     * @brief Record a fill of the whole buffer with a repeated 32-bit word
     */
    void record_fill(vk::CommandBuffer cmd, uint32_t word) const;

    /**
     * @brief Fill the whole buffer with a repeated 32-bit word and wait for completion
     */
    std::expected<void, std::string> fill(uint32_t word);

    /**
     * @brief Resize the buffer
     *
     * Creates the new buffer before releasing the current one, so a failed resize
     * leaves the buffer and its size unchanged. Contents are undefined afterwards.
     */
    std::expected<void, std::string> resize(vk::DeviceSize new_size);

private:
    // Private constructor - use create() factory
    GpuBuffer(
        const VulkanContext& context,
        const GpuBufferConfig& config
    );

    std::expected<void, std::string> create_buffer();

    void destroy_buffer();

    std::expected<uint32_t, std::string> find_memory_type(
        uint32_t type_filter,
        vk::MemoryPropertyFlags properties
    ) const;

    const VulkanContext* m_context;
    vk::Device m_device;
    GpuBufferConfig m_config;

    vk::Buffer m_buffer;
    vk::DeviceMemory m_memory;
    void* m_mapped;
};

} // namespace pfx
