#pragma once

#include <algorithm>
#include <limits>

namespace LineFlow {

struct Point {
	float x;
	float y;

	constexpr bool operator==(const Point&) const = default;
};

struct Size {
	float width;
	float height;

	constexpr bool operator==(const Size&) const = default;
};

/**
 * Axis aligned rectangle in container coordinates, y growing downwards. A default constructed rect is the
 * "null" rect returned by geometry queries that have no answer.
 */
struct Rect {
	float x;
	float y;
	float width;
	float height;

	constexpr float get_max_x() const {
		return x + width;
	}

	constexpr float get_max_y() const {
		return y + height;
	}

	constexpr float get_mid_y() const {
		return y + 0.5f * height;
	}

	constexpr bool is_null() const {
		return x == 0.f && y == 0.f && width == 0.f && height == 0.f;
	}

	constexpr bool is_empty() const {
		return width <= 0.f || height <= 0.f;
	}

	constexpr bool intersects(const Rect& other) const {
		return x < other.get_max_x() && other.x < get_max_x() && y < other.get_max_y() && other.y < get_max_y();
	}

	constexpr bool contains(Point p) const {
		return p.x >= x && p.x < get_max_x() && p.y >= y && p.y < get_max_y();
	}

	constexpr Rect united(const Rect& other) const {
		if (is_null()) {
			return other;
		}

		if (other.is_null()) {
			return *this;
		}

		auto minX = std::min(x, other.x);
		auto minY = std::min(y, other.y);

		return {
			.x = minX,
			.y = minY,
			.width = std::max(get_max_x(), other.get_max_x()) - minX,
			.height = std::max(get_max_y(), other.get_max_y()) - minY,
		};
	}

	constexpr bool operator==(const Rect&) const = default;
};

inline constexpr float UNBOUNDED_EXTENT = std::numeric_limits<float>::infinity();

}
