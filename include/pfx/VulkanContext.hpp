//
// Created by chris on 1/6/26.
//

#ifndef PAINTFX_VULKANCONTEXT_HPP
#define PAINTFX_VULKANCONTEXT_HPP

#include "Common.hpp"
#include <expected>
#include <string>
#include <string_view>

namespace pfx {

struct QueueFamilyIndices
{
	uint32_t graphics;
	uint32_t compute;

	[[nodiscard]] bool has_dedicated_compute() const { return compute != graphics; }
};

/**
 * @brief Options for instance and device creation
 */
struct VulkanContextConfig
{
	std::string application_name = "PaintFX";

	/// Adds the GLFW surface extensions and VK_KHR_swapchain. Headless contexts leave this off.
	bool enable_presentation = false;
};

/**
 * @brief Owns the instance, physical/logical device and the queues every other object uses
 *
 * Construction throws std::runtime_error when no usable device exists.
 * The logical device can be rebuilt in place after a device loss.
 */
class VulkanContext
{
public:
	explicit VulkanContext(const VulkanContextConfig& config = {});
	~VulkanContext();

	VulkanContext(const VulkanContext&) = delete;
	VulkanContext& operator=(const VulkanContext&) = delete;
	VulkanContext(VulkanContext&&) = delete;
	VulkanContext& operator=(VulkanContext&&) = delete;

	[[nodiscard]] vk::Instance instance() const { return m_instance; }
	[[nodiscard]] vk::PhysicalDevice physical_device() const { return m_physical_device; }
	[[nodiscard]] vk::Device device() const { return m_device; }
	[[nodiscard]] const QueueFamilyIndices& queue_indices() const { return m_queue_indices; }
	[[nodiscard]] vk::Queue graphics_queue() const { return m_graphics_queue; }
	[[nodiscard]] vk::Queue compute_queue() const { return m_compute_queue; }
	[[nodiscard]] bool presentation_enabled() const { return m_config.enable_presentation; }

	/**
	 * @brief Number of times the logical device has been (re)created
	 *
	 * Objects holding device handles compare this against the value they were built with.
	 */
	[[nodiscard]] uint32_t device_generation() const { return m_device_generation; }

	/**
	 * @brief Destroy and recreate the logical device and its queues
	 *
	 * Every resource created from the previous device must be released before calling this.
	 */
	std::expected<void, std::string> recreate_device();

private:
	VulkanContextConfig m_config;
	bool m_validation;
	vk::Instance m_instance;
	vk::DebugUtilsMessengerEXT m_debug_messenger;
	vk::PhysicalDevice m_physical_device;
	QueueFamilyIndices m_queue_indices;
	vk::Device m_device;
	vk::Queue m_graphics_queue;
	vk::Queue m_compute_queue;
	uint32_t m_device_generation = 0;
};

} // namespace pfx

#endif // PAINTFX_VULKANCONTEXT_HPP
