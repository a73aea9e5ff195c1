#include "glyph_store.hpp"

#include "glyph_provider.hpp"

using namespace LineFlow;

void GlyphStore::replace(GlyphRange range, const ProvidedGlyph* glyphs, const GlyphFlags* flags,
		uint32_t count) {
	auto first = m_glyphs.begin() + range.location;
	m_glyphs.erase(first, first + range.length);

	std::vector<GlyphData> inserted;
	inserted.reserve(count);

	for (uint32_t i = 0; i < count; ++i) {
		bool hidden = has_any(flags[i], GlyphFlags::HIDDEN);

		inserted.push_back({
			.glyphID = glyphs[i].glyphID,
			.advance = hidden ? 0.f : glyphs[i].advance,
			.ascent = glyphs[i].ascent,
			.descent = glyphs[i].descent,
			.location = 0.f,
			.flags = flags[i],
		});
	}

	m_glyphs.insert(m_glyphs.begin() + range.location, inserted.begin(), inserted.end());
}

void GlyphStore::erase(GlyphRange range) {
	auto first = m_glyphs.begin() + range.location;
	m_glyphs.erase(first, first + range.length);
}

void GlyphStore::set_location(uint32_t glyphIndex, float x) {
	m_glyphs[glyphIndex].location = x;
}

uint32_t GlyphStore::get_glyph_id(uint32_t glyphIndex) const {
	return m_glyphs[glyphIndex].glyphID;
}

float GlyphStore::get_advance(uint32_t glyphIndex) const {
	return m_glyphs[glyphIndex].advance;
}

float GlyphStore::get_ascent(uint32_t glyphIndex) const {
	return m_glyphs[glyphIndex].ascent;
}

float GlyphStore::get_descent(uint32_t glyphIndex) const {
	return m_glyphs[glyphIndex].descent;
}

float GlyphStore::get_location(uint32_t glyphIndex) const {
	return m_glyphs[glyphIndex].location;
}

bool GlyphStore::is_hidden(uint32_t glyphIndex) const {
	return has_any(m_glyphs[glyphIndex].flags, GlyphFlags::HIDDEN);
}

bool GlyphStore::is_line_break(uint32_t glyphIndex) const {
	return has_any(m_glyphs[glyphIndex].flags, GlyphFlags::LINE_BREAK);
}

float GlyphStore::get_total_advance(GlyphRange range) const {
	float total = 0.f;

	for (auto i = range.location; i < range.get_end(); ++i) {
		total += m_glyphs[i].advance;
	}

	return total;
}

uint32_t GlyphStore::get_glyph_count() const {
	return static_cast<uint32_t>(m_glyphs.size());
}
