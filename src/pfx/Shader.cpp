//
// Created by chris on 1/7/26.
//
#include <pfx/Logger.hpp>
#include <pfx/Shader.hpp>
#include <algorithm>
#include <slang-com-ptr.h>

namespace pfx {

namespace
{

using ComponentPtr = Slang::ComPtr<slang::IComponentType>;

// One SPIR-V session for the whole process; every kernel imports particles.slang
// from SHADER_DIR, so sharing the session compiles it once.
slang::ISession* spirv_session()
{
	static Slang::ComPtr<slang::IGlobalSession> global = []
	{
		Slang::ComPtr<slang::IGlobalSession> g;
		SlangGlobalSessionDesc desc = {};
		createGlobalSession(&desc, g.writeRef());
		return g;
	}();

	static Slang::ComPtr<slang::ISession> session = []
	{
		slang::TargetDesc target = {};
		target.format = SLANG_SPIRV;
		target.profile = global->findProfile("spirv_1_5");

		const char* search_paths[] = {SHADER_DIR};
		slang::SessionDesc desc = {};
		desc.targets = &target;
		desc.targetCount = 1;
		desc.searchPaths = search_paths;
		desc.searchPathCount = 1;

		Slang::ComPtr<slang::ISession> s;
		global->createSession(desc, s.writeRef());
		Logger::instance().debug("Slang SPIR-V session searching {}", SHADER_DIR);
		return s;
	}();

	return session.get();
}

/// Slang reports warnings and errors in the same blob; anything in it fails the load
std::expected<void, std::string> diagnostics_ok(slang::IBlob* diagnostics, std::string_view what)
{
	if (!diagnostics || diagnostics->getBufferSize() == 0)
	{
		return {};
	}
	std::string text{static_cast<const char*>(diagnostics->getBufferPointer()), diagnostics->getBufferSize()};
	Logger::instance().error("{} failed: {}", what, text);
	return std::unexpected{std::move(text)};
}

std::expected<ComponentPtr, std::string> compile_entry(std::string_view module_name, std::string_view entry_name)
{
	auto* session = spirv_session();
	Slang::ComPtr<slang::IBlob> diagnostics;

	const std::string module_str{module_name};
	Slang::ComPtr<slang::IModule> module(session->loadModule(module_str.c_str(), diagnostics.writeRef()));
	if (auto ok = diagnostics_ok(diagnostics.get(), std::format("Loading '{}'", module_name)); !ok)
	{
		return std::unexpected{ok.error()};
	}
	if (!module)
	{
		return std::unexpected{std::format("Module '{}' not found", module_name)};
	}

	const std::string entry_str{entry_name};
	Slang::ComPtr<slang::IEntryPoint> entry;
	module->findEntryPointByName(entry_str.c_str(), entry.writeRef());
	if (!entry)
	{
		return std::unexpected{std::format("Entry point '{}' not found in '{}'", entry_name, module_name)};
	}

	slang::IComponentType* parts[] = {module, entry};
	ComponentPtr composite;
	session->createCompositeComponentType(parts, 2, composite.writeRef(), diagnostics.writeRef());
	if (auto ok = diagnostics_ok(diagnostics.get(), "Composing program"); !ok)
	{
		return std::unexpected{ok.error()};
	}

	ComponentPtr linked;
	composite->link(linked.writeRef(), diagnostics.writeRef());
	if (auto ok = diagnostics_ok(diagnostics.get(), "Linking program"); !ok)
	{
		return std::unexpected{ok.error()};
	}
	return linked;
}

// ---------------------------------------------------------------------------
// Reflection
// ---------------------------------------------------------------------------

std::optional<vk::ShaderStageFlagBits> to_vk_stage(SlangStage stage)
{
	switch (stage)
	{
		case SLANG_STAGE_VERTEX: return vk::ShaderStageFlagBits::eVertex;
		case SLANG_STAGE_FRAGMENT: return vk::ShaderStageFlagBits::eFragment;
		case SLANG_STAGE_COMPUTE: return vk::ShaderStageFlagBits::eCompute;
		default: return std::nullopt;
	}
}

/// Varyings here are 32-bit scalars or vectors; wider or narrower types are reported as vec4
vk::Format varying_format(slang::TypeReflection* type)
{
	using ST = slang::TypeReflection::ScalarType;
	static constexpr std::array<vk::Format, 4> floats{vk::Format::eR32Sfloat, vk::Format::eR32G32Sfloat,
		vk::Format::eR32G32B32Sfloat, vk::Format::eR32G32B32A32Sfloat};
	static constexpr std::array<vk::Format, 4> ints{vk::Format::eR32Sint, vk::Format::eR32G32Sint,
		vk::Format::eR32G32B32Sint, vk::Format::eR32G32B32A32Sint};
	static constexpr std::array<vk::Format, 4> uints{vk::Format::eR32Uint, vk::Format::eR32G32Uint,
		vk::Format::eR32G32B32Uint, vk::Format::eR32G32B32A32Uint};

	auto components = std::max<std::size_t>(type->getElementCount(), 1);
	if (components <= 4)
	{
		switch (type->getScalarType())
		{
			case ST::Float32: return floats[components - 1];
			case ST::Int32: return ints[components - 1];
			case ST::UInt32: return uints[components - 1];
			default: break;
		}
	}
	Logger::instance().warn("Unrecognized varying type, assuming float4");
	return vk::Format::eR32G32B32A32Sfloat;
}

std::optional<vk::DescriptorType> to_vk_descriptor(slang::BindingType binding_type)
{
	using enum slang::BindingType;
	const auto raw = static_cast<uint32_t>(binding_type);
	const bool writable = (raw & static_cast<uint32_t>(MutableFlag)) != 0;

	switch (static_cast<slang::BindingType>(raw & static_cast<uint32_t>(BaseMask)))
	{
		// StructuredBuffer and RWStructuredBuffer both reflect as raw buffers
		case RawBuffer: return vk::DescriptorType::eStorageBuffer;
		case ConstantBuffer: return vk::DescriptorType::eUniformBuffer;
		case Texture: return writable ? vk::DescriptorType::eStorageImage : vk::DescriptorType::eSampledImage;
		case CombinedTextureSampler: return vk::DescriptorType::eCombinedImageSampler;
		case Sampler: return vk::DescriptorType::eSampler;
		case TypedBuffer:
			return writable ? vk::DescriptorType::eStorageTexelBuffer : vk::DescriptorType::eUniformTexelBuffer;
		default: return std::nullopt;
	}
}

std::size_t sized_extent(slang::TypeLayoutReflection* layout)
{
	while (layout)
	{
		if (auto size = layout->getSize(); size > 0)
		{
			return size;
		}
		auto* element = layout->getElementTypeLayout();
		layout = element != layout ? element : nullptr;
	}
	return 0;
}

std::expected<void, std::string> reflect_parameters(slang::ProgramLayout* program, ShaderReflection& out)
{
	for (unsigned p = 0; p < program->getParameterCount(); p++)
	{
		auto* param = program->getParameterByIndex(p);
		auto* layout = param->getTypeLayout();

		for (unsigned r = 0; r < layout->getBindingRangeCount(); r++)
		{
			auto binding_type = layout->getBindingRangeType(r);
			if (binding_type == slang::BindingType::VaryingInput || binding_type == slang::BindingType::VaryingOutput)
			{
				continue;
			}
			if (binding_type == slang::BindingType::PushConstant)
			{
				out.push_block = ShaderPushBlock{
					.name = param->getName(),
					.offset = static_cast<uint32_t>(param->getOffset()),
					.size = static_cast<uint32_t>(sized_extent(layout))};
				continue;
			}

			auto vk_type = to_vk_descriptor(binding_type);
			if (!vk_type)
			{
				return std::unexpected{std::format("Parameter '{}' has an unsupported binding type {}",
					param->getName(), static_cast<int>(binding_type))};
			}
			auto* leaf = layout->getBindingRangeLeafTypeLayout(r);
			out.bindings.push_back(ShaderBinding{
				.name = param->getName(),
				.binding = param->getBindingIndex() + r,
				.set = param->getBindingSpace(),
				.count = static_cast<uint32_t>(layout->getBindingRangeBindingCount(r)),
				.type = *vk_type,
				.element_size = leaf ? sized_extent(leaf) : 0});
		}
	}
	std::ranges::sort(out.bindings, {}, &ShaderBinding::binding);
	return {};
}

slang::TypeLayoutReflection* as_struct(slang::TypeLayoutReflection* layout)
{
	while (layout && layout->getKind() != slang::TypeReflection::Kind::Struct)
	{
		auto* element = layout->getElementTypeLayout();
		layout = element != layout ? element : nullptr;
	}
	return layout;
}

bool is_system_value(const char* semantic)
{
	return semantic && std::string_view{semantic}.starts_with("SV_");
}

void append_varyings(slang::TypeLayoutReflection* layout, std::vector<StageVariable>& out)
{
	auto* fields = as_struct(layout);
	if (!fields)
	{
		return;
	}
	for (unsigned f = 0; f < fields->getFieldCount(); f++)
	{
		auto* field = fields->getFieldByIndex(f);
		if (is_system_value(field->getSemanticName()))
		{
			continue;
		}
		out.push_back(StageVariable{
			.name = field->getName(),
			.location = field->getBindingIndex(),
			.format = varying_format(field->getTypeLayout()->getType())});
	}
}

void reflect_entry(slang::EntryPointReflection* entry, ShaderReflection& out)
{
	if (out.stage == vk::ShaderStageFlagBits::eCompute)
	{
		SlangUInt sizes[3] = {1, 1, 1};
		entry->getComputeThreadGroupSize(3, sizes);
		for (std::size_t i = 0; i < 3; i++)
		{
			out.workgroup_size[i] = static_cast<uint32_t>(sizes[i]);
		}
		return;
	}

	for (unsigned p = 0; p < entry->getParameterCount(); p++)
	{
		auto* param = entry->getParameterByIndex(p);
		if (!is_system_value(param->getSemanticName()))
		{
			append_varyings(param->getTypeLayout(), out.inputs);
		}
	}
	if (auto* result = entry->getResultVarLayout())
	{
		append_varyings(result->getTypeLayout(), out.outputs);
	}
}

std::expected<ShaderReflection, std::string> reflect(slang::IComponentType* linked)
{
	auto* program = linked->getLayout();
	if (program->getEntryPointCount() == 0)
	{
		return std::unexpected{std::string{"Program has no entry point"}};
	}
	auto* entry = program->getEntryPointByIndex(0);

	ShaderReflection out;
	auto stage = to_vk_stage(entry->getStage());
	if (!stage)
	{
		return std::unexpected{std::format("Unsupported shader stage {}", static_cast<int>(entry->getStage()))};
	}
	out.stage = *stage;

	if (auto result = reflect_parameters(program, out); !result)
	{
		return std::unexpected{result.error()};
	}
	reflect_entry(entry, out);
	return out;
}

} // anonymous namespace

const ShaderBinding* ShaderReflection::find_binding(uint32_t binding) const
{
	auto it = std::ranges::find(bindings, binding, &ShaderBinding::binding);
	return it != bindings.end() ? &*it : nullptr;
}

std::vector<vk::DescriptorSetLayoutBinding> ShaderReflection::layout_bindings() const
{
	std::vector<vk::DescriptorSetLayoutBinding> out;
	out.reserve(bindings.size());
	for (const auto& b : bindings)
	{
		out.emplace_back(b.binding, b.type, b.count, stage);
	}
	return out;
}

std::optional<vk::PushConstantRange> ShaderReflection::push_range() const
{
	if (!push_block)
	{
		return std::nullopt;
	}
	return vk::PushConstantRange{stage, push_block->offset, push_block->size};
}

std::expected<void, std::string> check_stage_link(const ShaderReflection& producer, const ShaderReflection& consumer)
{
	if (producer.stage != vk::ShaderStageFlagBits::eVertex || consumer.stage != vk::ShaderStageFlagBits::eFragment)
	{
		return std::unexpected{std::format("Cannot link {} into {}; only vertex into fragment is supported",
			vk::to_string(producer.stage), vk::to_string(consumer.stage))};
	}

	std::string problems;
	for (const auto& input : consumer.inputs)
	{
		auto it = std::ranges::find(producer.outputs, input.location, &StageVariable::location);
		if (it == producer.outputs.end())
		{
			problems += std::format("input '{}' at location {} has no vertex output; ", input.name, input.location);
		}
		else if (it->format != input.format)
		{
			problems += std::format("location {} is {} in vertex but {} in fragment; ", input.location,
				vk::to_string(it->format), vk::to_string(input.format));
		}
	}
	if (!problems.empty())
	{
		Logger::instance().error("Stage interface mismatch: {}", problems);
		return std::unexpected{std::move(problems)};
	}
	return {};
}

std::expected<std::unique_ptr<Shader>, std::string> Shader::load(
	vk::Device device, std::string_view module, std::string_view entry_point)
{
	auto linked = compile_entry(module, entry_point);
	if (!linked)
	{
		return std::unexpected{linked.error()};
	}

	auto reflection = reflect(linked->get());
	if (!reflection)
	{
		return std::unexpected{std::format("'{}': {}", module, reflection.error())};
	}

	Slang::ComPtr<slang::IBlob> spirv;
	Slang::ComPtr<slang::IBlob> diagnostics;
	(*linked)->getEntryPointCode(0, 0, spirv.writeRef(), diagnostics.writeRef());
	if (auto ok = diagnostics_ok(diagnostics.get(), "SPIR-V generation"); !ok)
	{
		return std::unexpected{ok.error()};
	}
	if (!spirv)
	{
		return std::unexpected{std::format("'{}': Slang produced no SPIR-V", module)};
	}

	auto module_res = device.createShaderModule(vk::ShaderModuleCreateInfo()
		.setCodeSize(spirv->getBufferSize())
		.setPCode(static_cast<const uint32_t*>(spirv->getBufferPointer())));
	CHECK_VK_RESULT(module_res, "Failed to create shader module {}");

	Logger::instance().debug("Loaded {} '{}' ({} bytes SPIR-V, {} bindings, push {} bytes)",
		vk::to_string(reflection->stage), module, spirv->getBufferSize(), reflection->bindings.size(),
		reflection->push_block ? reflection->push_block->size : 0);

	return std::unique_ptr<Shader>(
		new Shader(device, module_res.value, std::move(*reflection), std::string{module}));
}

Shader::Shader(vk::Device device, vk::ShaderModule module, ShaderReflection reflection, std::string name)
	: m_device(device)
	, m_module(module)
	, m_reflection(std::move(reflection))
	, m_name(std::move(name))
{
}

Shader::~Shader()
{
	m_device.destroyShaderModule(m_module);
}

vk::PipelineShaderStageCreateInfo Shader::stage_info() const
{
	// The emitted SPIR-V always names its entry point "main"
	return vk::PipelineShaderStageCreateInfo{}
		.setStage(m_reflection.stage)
		.setModule(m_module)
		.setPName("main");
}

} // namespace pfx
