#pragma once

#include "geometry.hpp"
#include "glyph_provider.hpp"
#include "layout_error.hpp"
#include "line_fragment_store.hpp"
#include "range.hpp"
#include "text_container.hpp"

#include <cstdint>

#include <string_view>
#include <vector>

namespace LineFlow {

class CharacterGlyphMap;
class GlyphStore;
class LineBreakStrategy;
class TextStorage;

enum class GlyphFlags : uint8_t;

/**
 * Produces glyphs for dirty character ranges and partitions glyphs into lines.
 */
class Typesetter {
	public:
		explicit Typesetter(GlyphProvider& provider);

		/**
		 * Regenerates the glyphs of a window around `dirtyRange` and splices them into `map` and `glyphs`. The
		 * window is widened to whitespace and mapping entry boundaries so that shaping sees whole words.
		 *
		 * On failure, `map` and `glyphs` are left unchanged.
		 *
		 * @param outWindow Receives the regenerated character range
		 */
		[[nodiscard]] LayoutError generate_glyphs(const TextStorage& storage, CharRange dirtyRange,
				CharacterGlyphMap& map, GlyphStore& glyphs, CharRange& outWindow);

		/**
		 * Lays out one line starting at `glyphStart` in `segment` at height `y`, assigning the locations of the
		 * line's glyphs. At least one cluster is placed, whatever the segment width. `glyphStart` must be below
		 * the glyph count.
		 */
		LineFragment layout_line(const CharacterGlyphMap& map, GlyphStore& glyphs, LineBreakStrategy& strategy,
				uint32_t glyphStart, LineSegment segment, float y) const;

		/**
		 * Expands `range` to the whitespace delimited words and mapping entries around it.
		 */
		static CharRange get_regeneration_window(std::string_view text, const CharacterGlyphMap& map,
				CharRange range);
	private:
		GlyphProvider& m_provider;
		std::vector<ProvidedGlyph> m_runGlyphs;

		LayoutError append_run_glyphs(const StyledRun& run, std::vector<ProvidedGlyph>& glyphs,
				std::vector<GlyphFlags>& flags);
		void append_line_break_glyph(CharRange breakChars, const TextStyle& style,
				std::vector<ProvidedGlyph>& glyphs, std::vector<GlyphFlags>& flags);
};

}
