#include <catch2/catch_test_macros.hpp>

#include <pfx/CullKernel.hpp>
#include <pfx/Logger.hpp>
#include <pfx/ParticleStore.hpp>
#include <pfx/UpdateKernel.hpp>
#include <pfx/VulkanContext.hpp>
#include <algorithm>
#include <numeric>

using namespace pfx;

TEST_CASE("Particle store starts with every slot free", "[gpu][store]")
{
    Logger::instance().set_level(spdlog::level::warn);
    VulkanContext ctx(VulkanContextConfig{.application_name = "Store Test"});

    constexpr uint32_t capacity = 1000;
    auto store_result = ParticleStore::create(ctx, capacity);
    REQUIRE(store_result.has_value());
    auto& store = *store_result;

    SECTION("counters are reset")
    {
        auto counters = store->read_counters();
        REQUIRE(counters.freelist_count == static_cast<int32_t>(capacity));
        REQUIRE(counters.alive_count == 0);
        REQUIRE(counters.freelist_pushes == 0);
        REQUIRE(counters.spawned == 0);
        REQUIRE(counters.dropped == 0);
    }

    SECTION("freelist is a permutation of all slots")
    {
        auto freelist = store->read_freelist();
        REQUIRE(freelist.has_value());
        REQUIRE(freelist->size() == capacity);

        std::vector<uint32_t> expected(capacity);
        std::iota(expected.begin(), expected.end(), 0u);
        auto sorted = *freelist;
        std::ranges::sort(sorted);
        REQUIRE(sorted == expected);
    }

    SECTION("every record is dead and marked free")
    {
        auto particles = store->read_particles();
        REQUIRE(particles.has_value());
        REQUIRE(std::ranges::none_of(*particles, [](const Particle& p) { return is_alive(p); }));
        REQUIRE(std::ranges::all_of(*particles, [](const Particle& p) { return p.in_freelist == 1; }));
    }

    SECTION("initialising again gives the same state")
    {
        REQUIRE(store->initialize().has_value());
        REQUIRE(store->initialize().has_value());
        REQUIRE(store->read_counters().freelist_count == static_cast<int32_t>(capacity));

        auto freelist = store->read_freelist();
        REQUIRE(freelist.has_value());
        auto sorted = *freelist;
        std::ranges::sort(sorted);
        REQUIRE(std::ranges::adjacent_find(sorted) == sorted.end());
    }

    SECTION("memory usage covers records, freelist and counters")
    {
        REQUIRE(store->memory_usage_bytes() == capacity * (sizeof(Particle) + sizeof(uint32_t)) + sizeof(GpuCounters));
    }
}

TEST_CASE("Particle store rejects unaddressable capacities", "[gpu][store]")
{
    Logger::instance().set_level(spdlog::level::err);
    VulkanContext ctx(VulkanContextConfig{.application_name = "Store Test"});

    REQUIRE_FALSE(ParticleStore::create(ctx, 0).has_value());
    REQUIRE_FALSE(ParticleStore::create(ctx, MAX_PARTICLE_CAPACITY + 1).has_value());
}

TEST_CASE("Update and cull leave an empty store untouched", "[gpu][store][cull]")
{
    Logger::instance().set_level(spdlog::level::warn);
    VulkanContext ctx(VulkanContextConfig{.application_name = "Store Test"});

    constexpr uint32_t capacity = 512;
    auto store = ParticleStore::create(ctx, capacity);
    REQUIRE(store.has_value());
    auto update = UpdateKernel::create(ctx, **store, 0.6f);
    REQUIRE(update.has_value());
    auto cull = CullKernel::create(ctx, **store);
    REQUIRE(cull.has_value());

    for (int frame = 0; frame < 30; frame++) {
        auto submitted = submit_one_time_commands(ctx, [&](vk::CommandBuffer cmd) {
            (*update)->record(cmd, 0.016f);
            (*cull)->record(cmd);
        });
        REQUIRE(submitted.has_value());
    }

    auto counters = (*store)->read_counters();
    REQUIRE(counters.alive_count == 0);
    REQUIRE(counters.freelist_count == static_cast<int32_t>(capacity));
    REQUIRE(counters.freelist_pushes == 0);

    auto particles = (*store)->read_particles();
    REQUIRE(particles.has_value());
    REQUIRE(std::ranges::all_of(*particles, [](const Particle& p) { return p.in_freelist == 1; }));
}
