#pragma once

#include "geometry.hpp"
#include "range.hpp"

#include <cstdint>

#include <span>
#include <vector>

namespace LineFlow {

class CharacterGlyphMap;

struct LineFragment {
	GlyphRange glyphs;
	CharRange chars;
	// The full band the line occupies, as wide as the container segment it was placed in
	Rect rect;
	// The portion of `rect` covered by glyphs
	Rect usedRect;
	// Distance from the top of `rect` to the baseline
	float baseline;
};

/**
 * Line fragments of a single container, ordered by glyph index.
 *
 * The first `get_valid_count()` fragments are up to date and partition a contiguous glyph range. Fragments past
 * that are stale: kept from before an edit with their character ranges shifted into post-edit coordinates so
 * that layout can reuse them once it reaches the same character at the same vertical position.
 */
class LineFragmentStore {
	public:
		void append(const LineFragment& fragment);
		void clear();

		/**
		 * Marks fragments from `fragmentIndex` onward stale after the characters in `oldEditRange` (pre-edit
		 * coordinates) were replaced by `oldEditRange.length + charDelta` characters. Fragments that start at or
		 * after the end of the edit are shifted and kept; the rest are dropped, including fragments that were
		 * already stale.
		 */
		void invalidate(size_t fragmentIndex, CharRange oldEditRange, int32_t charDelta);

		/**
		 * If the first stale fragment starts at `charIndex` and at vertical position `y`, revalidates the stale
		 * fragments, recomputing their glyph ranges from `map`. Adoption stops at the first fragment that doesn't
		 * continue where the previous one ended, starting from `charIndex` and `glyphIndex`; that fragment and
		 * the ones after it are dropped. Stale fragments starting before `charIndex` are dropped either way.
		 */
		bool try_adopt_stale(uint32_t charIndex, uint32_t glyphIndex, float y, const CharacterGlyphMap& map);

		void discard_all_stale();

		std::span<const LineFragment> get_fragments() const;
		std::span<const LineFragment> get_fragments_intersecting(const Rect& rect) const;

		/**
		 * Index of the valid fragment containing `glyphIndex`, or `get_valid_count()` if there is none.
		 */
		size_t find_fragment_for_glyph(uint32_t glyphIndex) const;

		const LineFragment& get_fragment(size_t fragmentIndex) const;

		size_t get_valid_count() const;
		bool empty() const;

		GlyphRange get_glyph_range() const;
		CharRange get_char_range() const;
		Rect get_used_rect() const;
	private:
		std::vector<LineFragment> m_fragments;
		size_t m_validCount{};
};

}
