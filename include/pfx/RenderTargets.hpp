#pragma once

#include "GpuBuffer.hpp"
#include <expected>
#include <memory>
#include <string>

namespace pfx {

/**
 * @brief Canvas color (RGBA32F) and depth (R32F) storage buffers, row-major
 */
class RenderTargets {
public:
    static std::expected<std::unique_ptr<RenderTargets>, std::string> create(
        const VulkanContext& context,
        int width,
        int height,
        float depth_clear
    );

    RenderTargets(const RenderTargets&) = delete;
    RenderTargets& operator=(const RenderTargets&) = delete;

    /// Transparent black color, depth at the far value
    void record_clear(vk::CommandBuffer cmd) const;

    std::expected<void, std::string> clear();

    /**
     * @brief Reallocates both buffers at the clamped size; contents are cleared
     *
     * The new pair is allocated before the old one is released. On failure the
     * targets keep their previous buffers and size.
     */
    std::expected<void, std::string> resize(int width, int height);

    [[nodiscard]] int width() const { return m_width; }
    [[nodiscard]] int height() const { return m_height; }
    [[nodiscard]] uint32_t pixel_count() const { return static_cast<uint32_t>(m_width) * static_cast<uint32_t>(m_height); }
    [[nodiscard]] float depth_clear() const { return m_depth_clear; }

    [[nodiscard]] const GpuBuffer& color() const { return m_color; }
    [[nodiscard]] const GpuBuffer& depth() const { return m_depth; }

    [[nodiscard]] vk::DeviceSize memory_usage_bytes() const { return m_color.size() + m_depth.size(); }

private:
    RenderTargets(const VulkanContext& context, int width, int height, float depth_clear,
                  GpuBuffer color, GpuBuffer depth);

    const VulkanContext* m_context;
    int m_width;
    int m_height;
    float m_depth_clear;
    GpuBuffer m_color;
    GpuBuffer m_depth;
};

} // namespace pfx
