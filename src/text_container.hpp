#pragma once

#include "geometry.hpp"

#include <cstdint>

#include <vector>

namespace LineFlow {

using ContainerID = uint32_t;

inline constexpr ContainerID INVALID_CONTAINER = ~0u;

/**
 * Horizontal span available to a line fragment, in container coordinates.
 */
struct LineSegment {
	float x;
	float width;
};

/**
 * Region line fragments are placed in. Exclusion rects are subtracted from the container's bounds when
 * computing the space available to a line.
 */
class TextContainer {
	public:
		constexpr TextContainer() = default;
		constexpr explicit TextContainer(Size size)
				: m_size(size) {}

		void set_size(Size size);
		void set_exclusion_rects(std::vector<Rect> rects);
		void set_line_fragment_padding(float padding);

		/**
		 * Gets the leftmost free segment of the horizontal band [y, y + height) after removing exclusions and
		 * padding. Returns a zero width segment at the container's left edge if nothing is free.
		 */
		LineSegment get_line_segment(float y, float height) const;

		/**
		 * Whether a line of `height` starting at `y` ends inside the container.
		 */
		bool fits_line(float y, float height) const;

		Size get_size() const;
		const std::vector<Rect>& get_exclusion_rects() const;
		float get_line_fragment_padding() const;
	private:
		Size m_size{};
		std::vector<Rect> m_exclusionRects;
		float m_lineFragmentPadding{};
};

}
