//
// Created by chris on 1/7/26.
//

#ifndef PAINTFX_SHADER_HPP
#define PAINTFX_SHADER_HPP
#include <array>
#include <expected>
#include <memory>
#include <optional>
#include <slang.h>
#include <string>
#include <string_view>
#include <vector>

#include "Common.hpp"

namespace pfx {

/// One descriptor binding declared by an entry point
struct ShaderBinding
{
	std::string name;
	uint32_t binding;
	uint32_t set;
	uint32_t count;           // 1 unless the resource is an array
	vk::DescriptorType type;
	std::size_t element_size; // Stride of a structured buffer element, 0 if unknown
};

struct ShaderPushBlock
{
	std::string name;
	uint32_t offset;
	uint32_t size;
};

/// A user varying between two graphics stages; system values are not listed
struct StageVariable
{
	std::string name;
	uint32_t location;
	vk::Format format;
};

/**
 * @brief Everything the pipeline builders need from Slang reflection
 *
 * Layouts, push ranges and workgroup sizes are derived from this rather than
 * restated on the host side.
 */
struct ShaderReflection
{
	vk::ShaderStageFlagBits stage = vk::ShaderStageFlagBits::eCompute;
	std::array<uint32_t, 3> workgroup_size{1, 1, 1};
	std::vector<ShaderBinding> bindings;    // Sorted by binding index
	std::optional<ShaderPushBlock> push_block;
	std::vector<StageVariable> inputs;
	std::vector<StageVariable> outputs;

	[[nodiscard]] const ShaderBinding* find_binding(uint32_t binding) const;
	[[nodiscard]] std::vector<vk::DescriptorSetLayoutBinding> layout_bindings() const;
	[[nodiscard]] std::optional<vk::PushConstantRange> push_range() const;
};

/**
 * @brief Check that a vertex stage feeds every input of a fragment stage
 *
 * Fails on a stage order other than vertex then fragment, on a missing
 * location, or on a format mismatch at a location.
 */
std::expected<void, std::string> check_stage_link(const ShaderReflection& producer, const ShaderReflection& consumer);

/**
 * @brief A Slang entry point compiled to SPIR-V, with its reflection
 *
 * Modules are resolved against SHADER_DIR and compiled at runtime; the Slang
 * session caches modules shared between kernels.
 */
class Shader
{
public:
	static std::expected<std::unique_ptr<Shader>, std::string> load(
		vk::Device device, std::string_view module, std::string_view entry_point = "main");

	~Shader();

	Shader(const Shader&) = delete;
	Shader& operator=(const Shader&) = delete;

	[[nodiscard]] vk::ShaderModule module() const { return m_module; }
	[[nodiscard]] const ShaderReflection& reflection() const { return m_reflection; }
	[[nodiscard]] const std::string& name() const { return m_name; }
	[[nodiscard]] vk::PipelineShaderStageCreateInfo stage_info() const;

private:
	Shader(vk::Device device, vk::ShaderModule module, ShaderReflection reflection, std::string name);

	vk::Device m_device;
	vk::ShaderModule m_module;
	ShaderReflection m_reflection;
	std::string m_name;
};

} // namespace pfx

#endif // PAINTFX_SHADER_HPP
