#pragma once

#include "common.hpp"
#include "range.hpp"

#include <cstdint>

#include <vector>

namespace LineFlow {

struct ProvidedGlyph;

enum class GlyphFlags : uint8_t {
	NONE = 0,
	// Not drawn and takes no horizontal space
	HIDDEN = 1,
	// Ends the line fragment containing it
	LINE_BREAK = 2,
};

LINEFLOW_DEFINE_ENUM_BITFLAG_OPERATORS(GlyphFlags)

/**
 * Per-glyph data in glyph index order. Locations are filled in by layout and are relative to the origin of the
 * line fragment holding the glyph.
 */
class GlyphStore {
	public:
		void replace(GlyphRange range, const ProvidedGlyph* glyphs, const GlyphFlags* flags, uint32_t count);
		void erase(GlyphRange range);

		void set_location(uint32_t glyphIndex, float x);

		uint32_t get_glyph_id(uint32_t glyphIndex) const;
		float get_advance(uint32_t glyphIndex) const;
		float get_ascent(uint32_t glyphIndex) const;
		float get_descent(uint32_t glyphIndex) const;
		float get_location(uint32_t glyphIndex) const;
		bool is_hidden(uint32_t glyphIndex) const;
		bool is_line_break(uint32_t glyphIndex) const;

		float get_total_advance(GlyphRange range) const;

		uint32_t get_glyph_count() const;
	private:
		struct GlyphData {
			uint32_t glyphID;
			float advance;
			float ascent;
			float descent;
			float location;
			GlyphFlags flags;
		};

		std::vector<GlyphData> m_glyphs;
};

}
