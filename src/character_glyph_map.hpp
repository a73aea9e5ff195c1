#pragma once

#include "layout_error.hpp"
#include "range.hpp"

#include <cstdint>

#include <vector>

namespace LineFlow {

struct ProvidedGlyph;

/**
 * One cluster: a contiguous character range drawn by a contiguous glyph range. More characters than glyphs is a
 * ligature, more glyphs than characters a decomposition. An entry with no glyphs marks characters whose glyphs
 * have been invalidated and not yet regenerated.
 */
struct MappingEntry {
	CharRange chars;
	GlyphRange glyphs;
};

/**
 * Bidirectional mapping between character and glyph indices.
 *
 * Entries partition [0, get_char_count()) and [0, get_glyph_count()) and are monotonic in both index spaces, so
 * both directions resolve with a binary search over the entry start offsets.
 */
class CharacterGlyphMap {
	public:
		/**
		 * Replaces the entries covering `oldChars` with entries derived from the clusters of `glyphs`, which
		 * must describe exactly `newCharLength` characters starting at `oldChars.location`. Entries after the
		 * replaced range are shifted in both index spaces.
		 *
		 * `oldChars` must start and end on entry boundaries (see `get_enclosing_entries`), otherwise
		 * `LayoutError::UNALIGNED_RANGE` is returned. On failure the map is left unchanged.
		 *
		 * @param outOldGlyphs Receives the glyph range the replaced entries covered
		 */
		[[nodiscard]] LayoutError replace(CharRange oldChars, uint32_t newCharLength, const ProvidedGlyph* glyphs,
				uint32_t glyphCount, GlyphRange& outOldGlyphs);

		/**
		 * Widens `range` to the nearest entry boundaries, so that no cluster is partially covered.
		 */
		CharRange get_enclosing_entries(CharRange range) const;

		MappingEntry get_entry_for_char(uint32_t charIndex) const;
		MappingEntry get_entry_for_glyph(uint32_t glyphIndex) const;

		GlyphRange get_glyph_range(CharRange range) const;
		CharRange get_char_range(GlyphRange range) const;

		/**
		 * Index of the first glyph of the cluster containing `charIndex`; `get_glyph_count()` past the end.
		 */
		uint32_t get_glyph_index_for_char(uint32_t charIndex) const;

		bool is_cluster_boundary(uint32_t charIndex) const;
		bool has_unmapped_entries(CharRange range) const;

		size_t get_entry_count() const;
		MappingEntry get_entry(size_t entryIndex) const;

		uint32_t get_char_count() const;
		uint32_t get_glyph_count() const;
	private:
		std::vector<uint32_t> m_charStarts;
		std::vector<uint32_t> m_glyphStarts;
		uint32_t m_charCount{};
		uint32_t m_glyphCount{};

		size_t find_entry_for_char(uint32_t charIndex) const;
		size_t find_entry_for_glyph(uint32_t glyphIndex) const;
		size_t find_entry_starting_at(uint32_t charIndex) const;
};

}
