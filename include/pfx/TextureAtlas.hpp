#pragma once

#include "GpuBuffer.hpp"
#include <cstdint>
#include <expected>
#include <memory>
#include <span>
#include <string>
#include <vector>

namespace pfx {

inline constexpr uint32_t ATLAS_TILE_COUNT = 8;

/**
 * @brief Host-side RGBA8 atlas image: 8 square tiles in one row
 *
 * Pixels are packed little-endian, R in the low byte, straight (not premultiplied) alpha.
 */
struct AtlasImage {
    uint32_t width = 0;
    uint32_t height = 0;
    std::vector<uint32_t> pixels;

    [[nodiscard]] uint32_t tile_size() const { return height; }
};

[[nodiscard]] constexpr uint32_t pack_rgba8(uint8_t r, uint8_t g, uint8_t b, uint8_t a)
{
    return static_cast<uint32_t>(r) | (static_cast<uint32_t>(g) << 8) |
           (static_cast<uint32_t>(b) << 16) | (static_cast<uint32_t>(a) << 24);
}

/**
 * @brief Sprite atlas uploaded to a read-only storage buffer for the compositor
 */
class TextureAtlas {
public:
    /**
     * @brief Validate and upload an atlas image
     *
     * Fails unless width == 8 * tile_size, height == tile_size and the pixel count matches.
     */
    static std::expected<std::unique_ptr<TextureAtlas>, std::string> create(
        const VulkanContext& context,
        const AtlasImage& image
    );

    /**
     * @brief Procedural atlas of round soft brushes, tile i getting harder edges as i grows
     */
    [[nodiscard]] static AtlasImage generate_soft_brushes(uint32_t tile_size);

    [[nodiscard]] uint32_t tile_size() const { return m_tile_size; }
    [[nodiscard]] const GpuBuffer& texels() const { return m_texels; }

private:
    TextureAtlas(uint32_t tile_size, GpuBuffer texels);

    uint32_t m_tile_size;
    GpuBuffer m_texels;
};

} // namespace pfx
