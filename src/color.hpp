#pragma once

#include <cstdint>

namespace LineFlow {

struct Color {
	float r;
	float g;
	float b;
	float a;

	static constexpr Color from_rgb(float r, float g, float b, float a = 255.f) {
		return {r / 255.f, g / 255.f, b / 255.f, a / 255.f};
	}

	static constexpr Color from_rgba_uint(uint32_t rgba) {
		return from_rgb(static_cast<float>((rgba >> 24) & 0xFFu), static_cast<float>((rgba >> 16) & 0xFFu),
				static_cast<float>((rgba >> 8) & 0xFFu), static_cast<float>(rgba & 0xFFu));
	}

	constexpr bool is_transparent() const {
		return a <= 0.f;
	}

	constexpr bool operator==(const Color&) const = default;
};

}
