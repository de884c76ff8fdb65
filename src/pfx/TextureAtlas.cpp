#include <pfx/TextureAtlas.hpp>
#include <pfx/Logger.hpp>
#include <algorithm>
#include <cmath>
#include <format>

namespace pfx {

TextureAtlas::TextureAtlas(uint32_t tile_size, GpuBuffer texels)
    : m_tile_size(tile_size)
    , m_texels(std::move(texels))
{}

std::expected<std::unique_ptr<TextureAtlas>, std::string> TextureAtlas::create(
    const VulkanContext& context,
    const AtlasImage& image
) {
    const auto tile = image.tile_size();
    if (tile == 0 || image.width != tile * ATLAS_TILE_COUNT) {
        return std::unexpected(std::format("Atlas must be {} square tiles in one row, got {}x{}",
            ATLAS_TILE_COUNT, image.width, image.height));
    }
    if (image.pixels.size() != static_cast<std::size_t>(image.width) * image.height) {
        return std::unexpected(std::format("Atlas has {} pixels, expected {}",
            image.pixels.size(), static_cast<std::size_t>(image.width) * image.height));
    }

    auto texels = GpuBuffer::create(context, {
        .size = image.pixels.size() * sizeof(uint32_t),
        .location = MemoryLocation::DeviceLocal,
        .name = "texture atlas"
    });
    if (!texels) {
        return std::unexpected(texels.error());
    }
    if (auto uploaded = texels->upload(std::span<const uint32_t>(image.pixels)); !uploaded) {
        return std::unexpected(uploaded.error());
    }

    Logger::instance().info("Loaded texture atlas {}x{} ({} px tiles)", image.width, image.height, tile);
    return std::unique_ptr<TextureAtlas>(new TextureAtlas(tile, std::move(*texels)));
}

AtlasImage TextureAtlas::generate_soft_brushes(uint32_t tile_size) {
    tile_size = std::max(tile_size, 1u);

    AtlasImage image{
        .width = tile_size * ATLAS_TILE_COUNT,
        .height = tile_size,
        .pixels = std::vector<uint32_t>(static_cast<std::size_t>(tile_size) * tile_size * ATLAS_TILE_COUNT, 0u)
    };

    const float radius = static_cast<float>(tile_size) * 0.5f;
    for (uint32_t t = 0; t < ATLAS_TILE_COUNT; ++t) {
        // 0 = very soft falloff, 1 = hard disk
        float hardness = static_cast<float>(t) / static_cast<float>(ATLAS_TILE_COUNT - 1);
        for (uint32_t y = 0; y < tile_size; ++y) {
            for (uint32_t x = 0; x < tile_size; ++x) {
                float dx = static_cast<float>(x) + 0.5f - radius;
                float dy = static_cast<float>(y) + 0.5f - radius;
                float d = std::sqrt(dx * dx + dy * dy) / radius;

                float alpha = 0.0f;
                if (d < 1.0f) {
                    float edge = std::clamp((1.0f - d) / std::max(1.0f - hardness, 0.05f), 0.0f, 1.0f);
                    alpha = edge * edge * (3.0f - 2.0f * edge);
                }
                auto a = static_cast<uint8_t>(std::lround(alpha * 255.0f));
                image.pixels[static_cast<std::size_t>(y) * image.width + t * tile_size + x] =
                    pack_rgba8(255, 255, 255, a);
            }
        }
    }
    return image;
}

} // namespace pfx
