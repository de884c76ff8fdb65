//
// Created by chris on 1/20/26.
//

#ifndef PAINTFX_UICALLBACK_HPP
#define PAINTFX_UICALLBACK_HPP

#include <functional>
#include <variant>
#include <string>

#include "Common.hpp"

namespace pfx
{

struct ContinuousCallback
{
	std::function<void(float)> setter;
	std::function<float()> getter;
	float min;
	float max;
	bool logarithmic = false;
};

struct DiscreteCallback
{
	std::function<void(int)> setter;
	std::function<int()> getter;
	int min;
	int max;
};

struct ToggleCallback
{
	std::function<void(bool)> setter;
	std::function<bool()> getter;
};

/// RGBA color, edited as straight alpha
struct ColorCallback
{
	std::function<void(glm::vec4)> setter;
	std::function<glm::vec4()> getter;
};

/// Button; fires once per click
struct ActionCallback
{
	std::function<void()> action;
};

using UIControl = std::variant<ContinuousCallback, DiscreteCallback, ToggleCallback, ColorCallback, ActionCallback>;

/**
 * @brief A named control the canvas panel renders as the matching ImGui widget
 *
 * Brush parameters and presenter settings are exposed this way so the panel
 * does not need to know which object owns them.
 */
struct UICallback
{
	std::string field_name;
	UIControl callback;

	template<class Control>
	UICallback(std::string name, Control control)
		: field_name(std::move(name)), callback(std::move(control)) {}
};

} // namespace pfx

#endif // PAINTFX_UICALLBACK_HPP
