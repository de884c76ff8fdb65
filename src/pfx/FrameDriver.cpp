#include <pfx/FrameDriver.hpp>
#include <pfx/Compositor.hpp>
#include <pfx/CullKernel.hpp>
#include <pfx/Logger.hpp>
#include <pfx/ParticleStore.hpp>
#include <pfx/RenderTargets.hpp>
#include <pfx/SpawnPipeline.hpp>
#include <pfx/UpdateKernel.hpp>
#include <algorithm>
#include <chrono>
#include <format>
#include <iterator>

namespace pfx {

namespace {

constexpr uint64_t LOSS_FENCE_TIMEOUT_NS = 1'000'000'000;

} // anonymous namespace

struct FrameDriver::GpuState {
    vk::Device device;

    std::unique_ptr<ParticleStore> store;
    std::unique_ptr<RenderTargets> targets;
    std::unique_ptr<TextureAtlas> atlas;
    std::unique_ptr<SpawnPipeline> spawn;
    std::unique_ptr<UpdateKernel> update;
    std::unique_ptr<CullKernel> cull;
    std::unique_ptr<Compositor> compositor;

    vk::CommandPool command_pool;
    vk::CommandBuffer command_buffer;
    vk::Fence fence;

    ~GpuState() {
        if (fence) {
            device.destroyFence(fence);
        }
        if (command_pool) {
            // Command buffer is freed with the pool
            device.destroyCommandPool(command_pool);
        }
        Logger::instance().trace("Released frame driver GPU state");
    }
};

FrameDriver::FrameDriver(VulkanContext& context, const ParticleSystemConfig& config)
    : m_context(&context)
    , m_config(config)
    , m_brushes(BrushRecord{.name = "default", .lifetime = config.base_lifetime})
    , m_queue(config.max_pending_events)
    , m_recovery(config.recovery)
    , m_reset_handler([](VulkanContext& ctx) { return ctx.recreate_device(); })
{}

std::expected<std::unique_ptr<FrameDriver>, std::string> FrameDriver::create(
    VulkanContext& context,
    const ParticleSystemConfig& config
) {
    auto driver = std::unique_ptr<FrameDriver>(new FrameDriver(context, config.validated()));

    auto gpu = driver->build_gpu_state();
    if (!gpu) {
        return std::unexpected(std::format("Failed to create frame driver: {}", gpu.error()));
    }
    driver->m_gpu = std::move(*gpu);

    const auto& cfg = driver->m_config;
    Logger::instance().info("Frame driver ready: {} particles, {}x{} canvas, batches of {}",
        cfg.capacity, cfg.canvas_width, cfg.canvas_height, cfg.max_batch_size);
    return driver;
}

FrameDriver::~FrameDriver() {
    if (m_gpu) {
        auto result = m_context->device().waitForFences(m_gpu->fence, vk::True, UINT64_MAX);
        if (result != vk::Result::eSuccess) {
            Logger::instance().warn("Frame fence wait failed during shutdown: {}", to_string(result));
        }
    }
}

std::expected<std::unique_ptr<FrameDriver::GpuState>, std::string> FrameDriver::build_gpu_state() const {
    auto state = std::make_unique<GpuState>();
    state->device = m_context->device();

    auto store = ParticleStore::create(*m_context, m_config.capacity);
    if (!store) {
        return std::unexpected(store.error());
    }
    state->store = std::move(*store);

    auto targets = RenderTargets::create(*m_context, m_config.canvas_width, m_config.canvas_height,
                                         m_config.depth_clear);
    if (!targets) {
        return std::unexpected(targets.error());
    }
    state->targets = std::move(*targets);

    auto spawn = SpawnPipeline::create(*m_context, *state->store, m_config.max_pending_events,
                                       m_config.max_batch_size);
    if (!spawn) {
        return std::unexpected(spawn.error());
    }
    state->spawn = std::move(*spawn);

    auto update = UpdateKernel::create(*m_context, *state->store, m_config.fade_start);
    if (!update) {
        return std::unexpected(update.error());
    }
    state->update = std::move(*update);

    auto cull = CullKernel::create(*m_context, *state->store);
    if (!cull) {
        return std::unexpected(cull.error());
    }
    state->cull = std::move(*cull);

    auto compositor = Compositor::create(*m_context, *state->store, *state->targets, m_config.composite_ordering);
    if (!compositor) {
        return std::unexpected(compositor.error());
    }
    state->compositor = std::move(*compositor);

    if (m_atlas_image) {
        auto atlas = TextureAtlas::create(*m_context, *m_atlas_image);
        if (!atlas) {
            return std::unexpected(atlas.error());
        }
        state->atlas = std::move(*atlas);
        if (auto bound = state->compositor->set_atlas(state->atlas.get()); !bound) {
            return std::unexpected(bound.error());
        }
    }

    auto pool_info = vk::CommandPoolCreateInfo()
        .setQueueFamilyIndex(m_context->queue_indices().compute)
        .setFlags(vk::CommandPoolCreateFlagBits::eResetCommandBuffer);
    auto pool_res = state->device.createCommandPool(pool_info);
    CHECK_VK_RESULT(pool_res, "Failed to create frame command pool: {}");
    state->command_pool = pool_res.value;

    auto cmd_alloc_info = vk::CommandBufferAllocateInfo()
        .setCommandPool(state->command_pool)
        .setLevel(vk::CommandBufferLevel::ePrimary)
        .setCommandBufferCount(1);
    auto cmd_res = state->device.allocateCommandBuffers(cmd_alloc_info);
    CHECK_VK_RESULT(cmd_res, "Failed to allocate frame command buffer: {}");
    state->command_buffer = cmd_res.value[0];

    // Start signaled so the first frame does not wait
    auto fence_res = state->device.createFence(vk::FenceCreateInfo().setFlags(vk::FenceCreateFlagBits::eSignaled));
    CHECK_VK_RESULT(fence_res, "Failed to create frame fence: {}");
    state->fence = fence_res.value;

    return state;
}

std::expected<void, std::string> FrameDriver::submit(const std::function<void(vk::CommandBuffer)>& record) {
    auto device = m_context->device();
    auto cmd = m_gpu->command_buffer;

    if (auto waited = wait_idle(); !waited) {
        return waited;
    }

    auto reset_res = device.resetFences(m_gpu->fence);
    if (reset_res != vk::Result::eSuccess) {
        handle_failure(reset_res, "Resetting frame fence");
        return std::unexpected("Fence reset failed");
    }

    auto cmd_reset_res = cmd.reset();
    if (cmd_reset_res != vk::Result::eSuccess) {
        handle_failure(cmd_reset_res, "Resetting frame command buffer");
        return std::unexpected("Command buffer reset failed");
    }

    auto begin_res = cmd.begin(vk::CommandBufferBeginInfo().setFlags(vk::CommandBufferUsageFlagBits::eOneTimeSubmit));
    if (begin_res != vk::Result::eSuccess) {
        handle_failure(begin_res, "Beginning frame command buffer");
        return std::unexpected("Command buffer begin failed");
    }

    record(cmd);

    // Counters are read through mapped memory once the fence signals
    auto host_barrier = vk::MemoryBarrier()
        .setSrcAccessMask(vk::AccessFlagBits::eShaderWrite | vk::AccessFlagBits::eTransferWrite)
        .setDstAccessMask(vk::AccessFlagBits::eHostRead);
    cmd.pipelineBarrier(
        vk::PipelineStageFlagBits::eComputeShader | vk::PipelineStageFlagBits::eTransfer,
        vk::PipelineStageFlagBits::eHost,
        {}, host_barrier, {}, {});

    auto end_res = cmd.end();
    if (end_res != vk::Result::eSuccess) {
        handle_failure(end_res, "Ending frame command buffer");
        return std::unexpected("Command buffer end failed");
    }

    auto submit_info = vk::SubmitInfo().setCommandBuffers(cmd);
    auto submit_res = m_context->compute_queue().submit(submit_info, m_gpu->fence);
    if (submit_res != vk::Result::eSuccess) {
        handle_failure(submit_res, "Submitting frame");
        return std::unexpected("Submit failed");
    }
    return {};
}

std::expected<void, std::string> FrameDriver::wait_idle() {
    if (!m_gpu) {
        return std::unexpected("Frame driver is not initialized");
    }
    auto wait_res = m_context->device().waitForFences(m_gpu->fence, vk::True, UINT64_MAX);
    if (wait_res != vk::Result::eSuccess) {
        handle_failure(wait_res, "Waiting for frame fence");
        return std::unexpected(std::format("Frame fence wait failed: {}", to_string(wait_res)));
    }
    return {};
}

void FrameDriver::handle_failure(vk::Result result, std::string_view what) {
    if (DeviceRecovery::is_device_lost(result)) {
        Logger::instance().error("{}: device lost", what);
        notify_device_lost();
        return;
    }
    Logger::instance().error("{} failed: {}, frame skipped", what, to_string(result));
}

void FrameDriver::notify_device_lost() {
    if (m_gpu) {
        // Returns at once on a lost device; a healthy one gets to finish the frame
        auto wait_res = m_context->device().waitForFences(m_gpu->fence, vk::True, LOSS_FENCE_TIMEOUT_NS);
        if (wait_res != vk::Result::eSuccess) {
            Logger::instance().debug("In-flight frame did not complete: {}", to_string(wait_res));
        }
        m_gpu.reset();
        Logger::instance().warn("GPU state released after device loss");
    }
    m_recovery.on_device_lost(DeviceRecovery::Clock::now());
}

void FrameDriver::try_recover() {
    auto now = DeviceRecovery::Clock::now();
    if (!m_recovery.should_attempt(now)) {
        return;
    }

    Logger::instance().info("Attempting GPU recovery ({} of {})", m_recovery.attempts() + 1,
        m_config.recovery.max_attempts);

    auto rebuilt = m_reset_handler(*m_context).and_then([this]() { return build_gpu_state(); });
    if (!rebuilt) {
        Logger::instance().warn("GPU recovery attempt failed: {}", rebuilt.error());
        m_recovery.on_attempt_failed(DeviceRecovery::Clock::now());
        if (m_recovery.state() == DeviceRecovery::State::GaveUp) {
            Logger::instance().error("Giving up on GPU recovery after {} attempts", m_recovery.attempts());
        }
        return;
    }

    m_gpu = std::move(*rebuilt);
    m_recovery.on_recovered();
    m_last_dispatch_count = 0;
    Logger::instance().info("GPU state recovered");
}

void FrameDriver::update(float delta_time) {
    if (!m_gpu) {
        try_recover();
        return;
    }

    auto start = std::chrono::steady_clock::now();
    auto events = m_queue.drain();
    uint32_t dispatches = 0;
    std::string spawn_error;

    auto submitted = submit([&](vk::CommandBuffer cmd) {
        m_gpu->targets->record_clear(cmd);
        cmd_transfer_to_compute_barrier(cmd);

        auto spawned = m_gpu->spawn->record(cmd, events, m_brushes);
        if (spawned) {
            dispatches = *spawned;
        } else {
            spawn_error = spawned.error();
        }

        m_gpu->update->record(cmd, delta_time);
        m_gpu->cull->record(cmd);
    });
    if (!submitted) {
        return;
    }
    if (!spawn_error.empty()) {
        Logger::instance().error("Spawn skipped: {}", spawn_error);
    }
    m_last_dispatch_count = dispatches;

    auto elapsed = std::chrono::duration<double, std::milli>(std::chrono::steady_clock::now() - start);
    m_timer.record(elapsed.count());
    ++m_frame_index;

    if (m_config.stats_log_interval != 0 && m_frame_index % m_config.stats_log_interval == 0) {
        log_statistics();
    }
}

void FrameDriver::process_input_events(std::span<const InputEvent> events) {
    if (!m_gpu || events.empty()) {
        return;
    }
    m_queue.push(events);
}

void FrameDriver::composite() {
    if (!m_gpu) {
        return;
    }
    auto submitted = submit([this](vk::CommandBuffer cmd) {
        m_gpu->compositor->record(cmd, m_gpu->spawn->spawn_counter());
    });
    if (!submitted) {
        Logger::instance().debug("Composite skipped: {}", submitted.error());
    }
}

uint32_t FrameDriver::spawn_counter() const {
    return m_gpu ? m_gpu->spawn->spawn_counter() : 0;
}

FrameStatistics FrameDriver::get_statistics() const {
    FrameStatistics stats{
        .capacity = m_config.capacity,
        .alive_count = 0,
        .last_frame_ms = m_timer.last_ms(),
        .average_frame_ms = m_timer.average_ms()
    };
    if (m_gpu) {
        stats.alive_count = get_frame_counters().alive_count;
    }
    return stats;
}

int32_t FrameDriver::get_freelist_count() const {
    return m_gpu ? get_frame_counters().freelist_count : 0;
}

GpuCounters FrameDriver::get_frame_counters() const {
    if (!m_gpu) {
        return {};
    }
    auto wait_res = m_context->device().waitForFences(m_gpu->fence, vk::True, UINT64_MAX);
    if (wait_res != vk::Result::eSuccess) {
        // Loss is picked up by the next update()
        Logger::instance().warn("Counter read without a finished frame: {}", to_string(wait_res));
    }
    return m_gpu->store->read_counters();
}

std::vector<Particle> FrameDriver::get_active_particles() const {
    if (!m_gpu) {
        return {};
    }
    auto wait_res = m_context->device().waitForFences(m_gpu->fence, vk::True, UINT64_MAX);
    if (wait_res != vk::Result::eSuccess) {
        Logger::instance().warn("Particle readback skipped: {}", to_string(wait_res));
        return {};
    }

    auto particles = m_gpu->store->read_particles();
    if (!particles) {
        Logger::instance().error("Particle readback failed: {}", particles.error());
        return {};
    }
    std::vector<Particle> alive;
    std::ranges::copy_if(*particles, std::back_inserter(alive), [](const Particle& p) { return is_alive(p); });
    return alive;
}

std::vector<uint32_t> FrameDriver::get_free_slots() const {
    if (!m_gpu) {
        return {};
    }
    auto counters = get_frame_counters();
    auto freelist = m_gpu->store->read_freelist();
    if (!freelist) {
        Logger::instance().error("Freelist readback failed: {}", freelist.error());
        return {};
    }
    auto count = std::clamp<int32_t>(counters.freelist_count, 0, static_cast<int32_t>(freelist->size()));
    freelist->resize(static_cast<std::size_t>(count));
    return std::move(*freelist);
}

double FrameDriver::get_gpu_memory_usage_mb() const {
    if (!m_gpu) {
        return 0.0;
    }
    vk::DeviceSize bytes = m_gpu->store->memory_usage_bytes()
                         + m_gpu->spawn->memory_usage_bytes()
                         + m_gpu->targets->memory_usage_bytes();
    if (m_gpu->atlas) {
        bytes += m_gpu->atlas->texels().size();
    }
    return static_cast<double>(bytes) / (1024.0 * 1024.0);
}

void FrameDriver::clear_all() {
    if (!m_gpu) {
        return;
    }
    m_queue.clear();

    auto submitted = submit([this](vk::CommandBuffer cmd) {
        m_gpu->targets->record_clear(cmd);
        m_gpu->store->record_initialize(cmd);
    });
    if (!submitted) {
        Logger::instance().error("Clear failed: {}", submitted.error());
        return;
    }
    m_last_dispatch_count = 0;
    Logger::instance().info("Canvas cleared");
}

void FrameDriver::resize(int width, int height) {
    if (!m_gpu) {
        return;
    }
    if (auto waited = wait_idle(); !waited) {
        return;
    }

    int clamped_width = std::clamp(width, MIN_CANVAS_EXTENT, MAX_CANVAS_EXTENT);
    int clamped_height = std::clamp(height, MIN_CANVAS_EXTENT, MAX_CANVAS_EXTENT);
    if (clamped_width != width || clamped_height != height) {
        Logger::instance().warn("Canvas size {}x{} clamped to {}x{}", width, height, clamped_width, clamped_height);
    }

    // A failed allocation leaves the previous targets and their bindings in place
    if (auto resized = m_gpu->targets->resize(clamped_width, clamped_height); !resized) {
        Logger::instance().error("Resize failed, keeping {}x{}: {}",
            m_gpu->targets->width(), m_gpu->targets->height(), resized.error());
        return;
    }
    // The old buffers are gone, so descriptors that still name them cannot be used
    if (auto bound = m_gpu->compositor->rebind_targets(); !bound) {
        Logger::instance().error("Rebinding resized targets failed: {}", bound.error());
        notify_device_lost();
        return;
    }
    m_config.canvas_width = clamped_width;
    m_config.canvas_height = clamped_height;
}

std::expected<void, std::string> FrameDriver::set_atlas(std::optional<AtlasImage> image) {
    if (!m_gpu) {
        m_atlas_image = std::move(image);
        return {};
    }
    if (auto waited = wait_idle(); !waited) {
        return waited;
    }

    std::unique_ptr<TextureAtlas> atlas;
    if (image) {
        auto created = TextureAtlas::create(*m_context, *image);
        if (!created) {
            return std::unexpected(created.error());
        }
        atlas = std::move(*created);
    }

    if (auto bound = m_gpu->compositor->set_atlas(atlas.get()); !bound) {
        return bound;
    }
    m_gpu->atlas = std::move(atlas);
    m_atlas_image = std::move(image);
    return {};
}

const GpuBuffer* FrameDriver::get_particle_buffer() const {
    return m_gpu ? &m_gpu->store->particles() : nullptr;
}

const GpuBuffer* FrameDriver::get_depth_buffer() const {
    return m_gpu ? &m_gpu->targets->depth() : nullptr;
}

const GpuBuffer* FrameDriver::get_color_buffer() const {
    return m_gpu ? &m_gpu->targets->color() : nullptr;
}

void FrameDriver::set_composite_ordering(CompositeOrdering ordering) {
    m_config.composite_ordering = ordering;
    if (m_gpu) {
        m_gpu->compositor->set_ordering(ordering);
    }
}

void FrameDriver::log_statistics() const {
    auto counters = get_frame_counters();
    Logger::instance().debug("Frame {}: {}/{} alive, freelist {}, spawned {}, dropped {}, {:.2f} ms avg",
        m_frame_index, counters.alive_count, m_config.capacity, counters.freelist_count,
        counters.spawned, counters.dropped, m_timer.average_ms());
}

} // namespace pfx
