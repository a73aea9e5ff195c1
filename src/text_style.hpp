#pragma once

#include "color.hpp"

#include <cstdint>

namespace LineFlow {

using FontID = uint32_t;

struct TextStyle {
	FontID font{};
	float size{16.f};
	Color foreground{0.f, 0.f, 0.f, 1.f};
	// Fully transparent means no background is drawn
	Color background{0.f, 0.f, 0.f, 0.f};

	constexpr bool has_background() const {
		return !background.is_transparent();
	}

	constexpr bool operator==(const TextStyle&) const = default;
};

}
