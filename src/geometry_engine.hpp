#pragma once

#include "geometry.hpp"
#include "range.hpp"
#include "text_container.hpp"

#include <cstdint>

#include <optional>
#include <vector>

namespace LineFlow {

class LayoutManager;
struct LineFragment;

/**
 * Which side of a soft line wrap an insertion point at the wrap belongs to.
 */
enum class Affinity : uint8_t {
	// End of the earlier line
	UPSTREAM,
	// Start of the later line
	DOWNSTREAM,
};

/**
 * Rectangle and point queries over the layout of one container. Every query lays out as much text as it needs
 * first. Indices and points outside of the laid out text produce empty results.
 */
class GeometryEngine {
	public:
		explicit GeometryEngine(LayoutManager& layout);

		/**
		 * One rect per line fragment `range` touches. Without a selection, the rects of lines that `range`
		 * continues past reach the end of the line fragment; with one, `range` is first intersected with the
		 * selection and every rect is clipped to the glyphs it covers.
		 */
		std::vector<Rect> get_rects_for_glyph_range(GlyphRange range, ContainerID container,
				std::optional<GlyphRange> selection = std::nullopt);
		std::vector<Rect> get_rects_for_char_range(CharRange range, ContainerID container,
				std::optional<CharRange> selection = std::nullopt);

		Rect get_bounding_rect(GlyphRange range, ContainerID container);

		GlyphRange get_glyph_range_for_bounding_rect(const Rect& rect, ContainerID container);
		GlyphRange get_glyph_range_for_bounding_rect_without_layout(const Rect& rect,
				ContainerID container) const;

		uint32_t get_glyph_index_for_point(Point point, ContainerID container);
		/**
		 * Finds the glyph nearest to `point`: the line by its vertical position, then the glyph by its horizontal
		 * position. Below the last line, this is the last glyph of the container.
		 *
		 * @param outFraction How far through the glyph's advance `point` lies, clamped to [0, 1]
		 */
		uint32_t get_glyph_index_for_point(Point point, ContainerID container, float& outFraction);

		/**
		 * Character index an insertion point placed at `point` would take. Positions past the end of a soft
		 * wrapped line give the end of the line, which is drawn there with `Affinity::UPSTREAM`. Positions past
		 * the end of a hard broken line, or of a line ending in whitespace, snap to the start of its last cluster.
		 */
		uint32_t get_char_index_for_point(Point point, ContainerID container);

		/**
		 * Zero width rect at the insertion point before `charIndex`, as tall as its line. Inside a ligature, the
		 * position is interpolated across the ligature by code point.
		 */
		Rect get_insertion_rect(uint32_t charIndex, ContainerID container, Affinity affinity = Affinity::DOWNSTREAM);
	private:
		LayoutManager& m_layout;

		uint32_t hit_test_fragment(const LineFragment& fragment, float x, float& outFraction) const;
};

}
