#include <pfx/VulkanContext.hpp>
#include <pfx/Logger.hpp>
#include <algorithm>
#include <array>
#include <cstring>
#include <optional>
#include <set>
#include <stdexcept>

VULKAN_HPP_DEFAULT_DISPATCH_LOADER_DYNAMIC_STORAGE

namespace pfx {

namespace {

#ifdef NDEBUG
constexpr bool ENABLE_VALIDATION = false;
#else
constexpr bool ENABLE_VALIDATION = true;
#endif

constexpr std::array VALIDATION_LAYERS = {
    "VK_LAYER_KHRONOS_validation"
};

// Validation output goes through the same logger as everything else, tagged
// so it does not carry the source location of this callback
vk::Bool32 debug_callback(
    vk::DebugUtilsMessageSeverityFlagBitsEXT severity,
    vk::DebugUtilsMessageTypeFlagsEXT,
    const vk::DebugUtilsMessengerCallbackDataEXT* data,
    void*)
{
    auto& logger = Logger::instance();
    logger.use_tag("[Validation]");
    using Severity = vk::DebugUtilsMessageSeverityFlagBitsEXT;
    if (severity == Severity::eError) {
        logger.error("{}", data->pMessage);
    } else if (severity == Severity::eWarning) {
        logger.warn("{}", data->pMessage);
    } else {
        logger.debug("{}", data->pMessage);
    }
    return vk::False;
}

bool validation_available()
{
    auto layers = vk::enumerateInstanceLayerProperties();
    if (layers.result != vk::Result::eSuccess) {
        Logger::instance().warn("Could not enumerate instance layers: {}", to_string(layers.result));
        return false;
    }
    return std::ranges::all_of(VALIDATION_LAYERS, [&](const char* wanted) {
        bool present = std::ranges::any_of(layers.value, [wanted](const vk::LayerProperties& layer) {
            return std::strcmp(wanted, layer.layerName) == 0;
        });
        if (!present) {
            Logger::instance().warn("Validation layer {} not installed", wanted);
        }
        return present;
    });
}

vk::DebugUtilsMessengerCreateInfoEXT messenger_info()
{
    using Severity = vk::DebugUtilsMessageSeverityFlagBitsEXT;
    using Type = vk::DebugUtilsMessageTypeFlagBitsEXT;
    return vk::DebugUtilsMessengerCreateInfoEXT()
        .setMessageSeverity(Severity::eWarning | Severity::eError)
        .setMessageType(Type::eGeneral | Type::eValidation | Type::ePerformance)
        .setPfnUserCallback(debug_callback);
}

void init_loader()
{
    static vk::detail::DynamicLoader loader;
    auto get_proc = loader.getProcAddress<PFN_vkGetInstanceProcAddr>("vkGetInstanceProcAddr");
    if (!get_proc) {
        throw std::runtime_error{"Vulkan loader not found"};
    }
    VULKAN_HPP_DEFAULT_DISPATCHER.init(get_proc);
}

std::vector<const char*> surface_extensions()
{
    if (!glfwInit()) {
        throw std::runtime_error{"Failed to initialize GLFW"};
    }
    uint32_t count = 0;
    const char** names = glfwGetRequiredInstanceExtensions(&count);
    if (!names) {
        throw std::runtime_error{"GLFW reports no Vulkan surface support"};
    }
    return {names, names + count};
}

vk::Instance create_instance(const VulkanContextConfig& config, bool validation)
{
    init_loader();

    auto app_info = vk::ApplicationInfo()
        .setPApplicationName(config.application_name.c_str())
        .setApplicationVersion(VK_MAKE_API_VERSION(0, 0, 1, 0))
        .setPEngineName("PaintFX")
        .setEngineVersion(VK_MAKE_API_VERSION(0, 0, 1, 0))
        .setApiVersion(VK_API_VERSION_1_3);

    auto extensions = config.enable_presentation ? surface_extensions() : std::vector<const char*>{};
    auto create_info = vk::InstanceCreateInfo().setPApplicationInfo(&app_info);

    // Chaining the messenger info also reports problems in vkCreateInstance itself
    auto debug_info = messenger_info();
    if (validation) {
        extensions.push_back(VK_EXT_DEBUG_UTILS_EXTENSION_NAME);
        create_info.setPEnabledLayerNames(VALIDATION_LAYERS).setPNext(&debug_info);
    }
    create_info.setPEnabledExtensionNames(extensions);

    auto instance_res = vk::createInstance(create_info);
    if (instance_res.result != vk::Result::eSuccess) {
        throw std::runtime_error{std::format("Failed to create instance: {}", to_string(instance_res.result))};
    }
    VULKAN_HPP_DEFAULT_DISPATCHER.init(instance_res.value);
    Logger::instance().debug("Created Vulkan instance ({} extensions, validation {})", extensions.size(),
                             validation ? "on" : "off");
    return instance_res.value;
}

vk::DebugUtilsMessengerEXT create_debug_messenger(vk::Instance instance, bool validation)
{
    if (!validation || !VULKAN_HPP_DEFAULT_DISPATCHER.vkCreateDebugUtilsMessengerEXT) {
        return nullptr;
    }
    auto messenger = instance.createDebugUtilsMessengerEXT(messenger_info());
    if (messenger.result != vk::Result::eSuccess) {
        Logger::instance().error("Failed to create debug messenger: {}", to_string(messenger.result));
        return nullptr;
    }
    return messenger.value;
}

/**
 * Every particle kernel runs 256-wide workgroups over storage buffers, on a
 * Vulkan 1.3 device. Among devices meeting that, discrete beats integrated
 * beats anything else; CI machines only expose software rasterizers.
 */
int device_score(vk::PhysicalDevice device)
{
    auto props = device.getProperties();
    if (props.apiVersion < VK_API_VERSION_1_3 || props.limits.maxComputeWorkGroupInvocations < 256
        || props.limits.maxComputeWorkGroupSize[0] < 256) {
        return -1;
    }
    switch (props.deviceType) {
        case vk::PhysicalDeviceType::eDiscreteGpu: return 3;
        case vk::PhysicalDeviceType::eIntegratedGpu: return 2;
        case vk::PhysicalDeviceType::eVirtualGpu: return 1;
        default: return 0;
    }
}

vk::PhysicalDevice select_physical_device(vk::Instance instance)
{
    auto devices = instance.enumeratePhysicalDevices();
    if (devices.result != vk::Result::eSuccess) {
        throw std::runtime_error{std::format("Failed to enumerate physical devices: {}", to_string(devices.result))};
    }
    if (devices.value.empty()) {
        throw std::runtime_error{"No Vulkan device found"};
    }

    auto best = std::ranges::max_element(devices.value, {}, device_score);
    if (device_score(*best) < 0) {
        throw std::runtime_error{"No Vulkan 1.3 device supports 256-wide compute workgroups"};
    }
    auto props = best->getProperties();
    Logger::instance().info("Selected {} ({})", props.deviceName.data(), vk::to_string(props.deviceType));
    return *best;
}

/// Graphics family for presentation; compute prefers a family without graphics
QueueFamilyIndices find_queue_families(vk::PhysicalDevice physical_device)
{
    auto families = physical_device.getQueueFamilyProperties();

    std::optional<uint32_t> graphics;
    std::optional<uint32_t> compute;
    for (uint32_t i = 0; i < families.size(); i++) {
        auto flags = families[i].queueFlags;
        bool has_graphics = static_cast<bool>(flags & vk::QueueFlagBits::eGraphics);
        if (has_graphics && !graphics) {
            graphics = i;
        }
        if ((flags & vk::QueueFlagBits::eCompute) && (!compute || !has_graphics)) {
            compute = i;
        }
    }
    if (!graphics || !compute) {
        throw std::runtime_error{"Device has no graphics or compute queue family"};
    }

    Logger::instance().debug("Queue families: graphics {}, compute {}", *graphics, *compute);
    return {*graphics, *compute};
}

std::expected<vk::Device, std::string> create_logical_device(vk::PhysicalDevice physical_device,
                                                             const QueueFamilyIndices& indices,
                                                             bool presentation)
{
    std::vector<vk::DeviceQueueCreateInfo> queue_create_infos;
    std::set<uint32_t> unique_families = {indices.graphics, indices.compute};

    float queue_priority = 1.0f;
    for (uint32_t family : unique_families) {
        auto queue_create_info = vk::DeviceQueueCreateInfo()
            .setQueueFamilyIndex(family)
            .setQueueCount(1)
            .setPQueuePriorities(&queue_priority);
        queue_create_infos.push_back(queue_create_info);
    }

    std::vector<const char*> extensions;
    if (presentation) {
        extensions.push_back(VK_KHR_SWAPCHAIN_EXTENSION_NAME);
    }

    // Slang lowers SV_VertexID through the draw-parameters builtins
    vk::PhysicalDeviceVulkan11Features supported11{};
    vk::PhysicalDeviceFeatures2 supported{};
    supported.pNext = &supported11;
    physical_device.getFeatures2(&supported);

    vk::PhysicalDeviceVulkan11Features vulkan11_features{};
    vulkan11_features.shaderDrawParameters = supported11.shaderDrawParameters;

    vk::PhysicalDeviceFeatures2 features2{};
    features2.pNext = &vulkan11_features;

    auto create_info = vk::DeviceCreateInfo()
        .setQueueCreateInfos(queue_create_infos)
        .setPEnabledExtensionNames(extensions)
        .setPNext(&features2);

    auto device_res = physical_device.createDevice(create_info);
	CHECK_VK_RESULT(device_res, "Failed to create device {}");
    Logger::instance().debug("Created logical device");
    return device_res.value;
}

} // anonymous namespace

VulkanContext::VulkanContext(const VulkanContextConfig& config)
    : m_config(config)
    , m_validation(ENABLE_VALIDATION && validation_available())
    , m_instance(create_instance(config, m_validation))
    , m_debug_messenger(create_debug_messenger(m_instance, m_validation))
    , m_physical_device(select_physical_device(m_instance))
    , m_queue_indices(find_queue_families(m_physical_device))
{
    if (auto result = recreate_device(); !result) {
        if (m_debug_messenger) {
            m_instance.destroyDebugUtilsMessengerEXT(m_debug_messenger);
        }
        m_instance.destroy();
        throw std::runtime_error{result.error()};
    }
    Logger::instance().info("Vulkan context ready (headers {}, presentation {})", VK_HEADER_VERSION,
                            m_config.enable_presentation ? "on" : "off");
}

VulkanContext::~VulkanContext()
{
    if (m_device) {
        m_device.destroy();
    }
    if (m_debug_messenger) {
        m_instance.destroyDebugUtilsMessengerEXT(m_debug_messenger);
    }
    m_instance.destroy();
}

std::expected<void, std::string> VulkanContext::recreate_device()
{
    if (m_device) {
        // A lost device reports eErrorDeviceLost here; destruction is still valid
        auto idle = m_device.waitIdle();
        if (idle != vk::Result::eSuccess) {
            Logger::instance().warn("waitIdle before device recreation returned {}", to_string(idle));
        }
        m_device.destroy();
        m_device = nullptr;
        Logger::instance().info("Destroyed logical device (generation {})", m_device_generation);
    }

    auto device = create_logical_device(m_physical_device, m_queue_indices, m_config.enable_presentation);
    if (!device) {
        return std::unexpected(device.error());
    }

    m_device = *device;
	VULKAN_HPP_DEFAULT_DISPATCHER.init(m_device);
    m_graphics_queue = m_device.getQueue(m_queue_indices.graphics, 0);
    m_compute_queue = m_device.getQueue(m_queue_indices.compute, 0);
    ++m_device_generation;
    return {};
}

} // namespace pfx
