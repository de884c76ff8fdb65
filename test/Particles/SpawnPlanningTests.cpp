#include <catch2/catch_test_macros.hpp>
#include <catch2/catch_approx.hpp>

#include <pfx/SpawnPipeline.hpp>
#include <pfx/TextureAtlas.hpp>

using namespace pfx;

TEST_CASE("Spawn batches are capped at the batch size", "[spawn][planning]")
{
    SECTION("no events, no dispatches")
    {
        REQUIRE(plan_spawn_batches(0, 512).empty());
    }

    SECTION("exact multiple")
    {
        auto batches = plan_spawn_batches(1024, 512);
        REQUIRE(batches == std::vector<SpawnBatch>{{0, 512}, {512, 512}});
    }

    SECTION("2050 events need five dispatches")
    {
        auto batches = plan_spawn_batches(2050, 512);
        REQUIRE(batches.size() == 5);
        REQUIRE(batches.back() == SpawnBatch{2048, 2});

        uint32_t covered = 0;
        for (const auto& batch : batches) {
            REQUIRE(batch.offset == covered);
            REQUIRE(batch.count <= 512);
            covered += batch.count;
        }
        REQUIRE(covered == 2050);
    }

    SECTION("single event batches")
    {
        REQUIRE(plan_spawn_batches(3, 1).size() == 3);
    }

    SECTION("zero batch size plans nothing")
    {
        REQUIRE(plan_spawn_batches(10, 0).empty());
    }
}

TEST_CASE("Events are resolved against the session brush", "[spawn][brush]")
{
    InputEvent event;
    event.position = {100.0f, 50.0f};
    event.color = glm::vec4(0.2f, 0.4f, 0.6f, 1.0f);
    event.size = 10.0f;
    event.session_id = 4;
    event.texture_index = 11;

    SECTION("default brush keeps the event color and size")
    {
        auto resolved = resolve_event(event, BrushRecord{});
        REQUIRE(resolved.position == event.position);
        REQUIRE(resolved.size == Catch::Approx(10.0f));
        REQUIRE(resolved.color == event.color);
        REQUIRE(resolved.session_id == 4);
        REQUIRE(resolved.lifetime == Catch::Approx(8.0f));
        REQUIRE(resolved.lifetime_jitter == Catch::Approx(0.1f));
        REQUIRE(resolved.particle_count == 1);
        REQUIRE(resolved.jitter_radius == Catch::Approx(2.0f));
    }

    SECTION("texture index wraps to the atlas")
    {
        REQUIRE(resolve_event(event, BrushRecord{}).texture_index == 3);
    }

    SECTION("brush overrides color, scale and lifetime")
    {
        BrushRecord brush{
            .name = "wide",
            .size_scale = 2.0f,
            .color_override = glm::vec4(1.0f, 0.0f, 0.0f, 1.0f),
            .lifetime = 3.0f,
            .lifetime_jitter = 0.0f,
            .particles_per_event = 6,
            .jitter_mode = JitterMode::Proportional
        };
        auto resolved = resolve_event(event, brush);
        REQUIRE(resolved.size == Catch::Approx(20.0f));
        REQUIRE(resolved.color == glm::vec4(1.0f, 0.0f, 0.0f, 1.0f));
        REQUIRE(resolved.lifetime == Catch::Approx(3.0f));
        REQUIRE(resolved.lifetime_jitter == 0.0f);
        REQUIRE(resolved.particle_count == 6);
        REQUIRE(resolved.jitter_radius == Catch::Approx(4.0f));
    }
}

TEST_CASE("Procedural brush atlas layout", "[atlas]")
{
    auto image = TextureAtlas::generate_soft_brushes(16);

    REQUIRE(image.width == 16 * ATLAS_TILE_COUNT);
    REQUIRE(image.height == 16);
    REQUIRE(image.tile_size() == 16);
    REQUIRE(image.pixels.size() == static_cast<std::size_t>(image.width) * image.height);

    auto alpha_at = [&](uint32_t tile, uint32_t x, uint32_t y) {
        return image.pixels[static_cast<std::size_t>(y) * image.width + tile * 16 + x] >> 24;
    };

    SECTION("corners are transparent and centers opaque-ish")
    {
        for (uint32_t tile = 0; tile < ATLAS_TILE_COUNT; tile++) {
            REQUIRE(alpha_at(tile, 0, 0) == 0);
            REQUIRE(alpha_at(tile, 8, 8) > 0);
        }
    }

    SECTION("later tiles have harder edges")
    {
        REQUIRE(alpha_at(7, 3, 8) >= alpha_at(0, 3, 8));
    }

    SECTION("texels are white with straight alpha")
    {
        REQUIRE((image.pixels[8 * image.width + 8] & 0x00FFFFFFu) == 0x00FFFFFFu);
    }
}

TEST_CASE("RGBA8 packing puts red in the low byte", "[atlas]")
{
    STATIC_REQUIRE(pack_rgba8(0x11, 0x22, 0x33, 0x44) == 0x44332211u);
}
