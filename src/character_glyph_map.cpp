#include "character_glyph_map.hpp"

#include "binary_search.hpp"
#include "glyph_provider.hpp"

using namespace LineFlow;

static LayoutError build_entries(uint32_t charStart, uint32_t charLength, uint32_t glyphStart,
		const ProvidedGlyph* glyphs, uint32_t glyphCount, std::vector<uint32_t>& charStarts,
		std::vector<uint32_t>& glyphStarts);

LayoutError CharacterGlyphMap::replace(CharRange oldChars, uint32_t newCharLength, const ProvidedGlyph* glyphs,
		uint32_t glyphCount, GlyphRange& outOldGlyphs) {
	if (!is_cluster_boundary(oldChars.location) || !is_cluster_boundary(oldChars.get_end())) {
		return LayoutError::UNALIGNED_RANGE;
	}

	auto firstEntry = find_entry_starting_at(oldChars.location);
	auto endEntry = find_entry_starting_at(oldChars.get_end());
	auto oldGlyphStart = firstEntry == m_glyphStarts.size() ? m_glyphCount : m_glyphStarts[firstEntry];
	auto oldGlyphEnd = endEntry == m_glyphStarts.size() ? m_glyphCount : m_glyphStarts[endEntry];

	std::vector<uint32_t> newCharStarts;
	std::vector<uint32_t> newGlyphStarts;

	if (auto err = build_entries(oldChars.location, newCharLength, oldGlyphStart, glyphs, glyphCount,
			newCharStarts, newGlyphStarts); err != LayoutError::NONE) {
		return err;
	}

	auto charDelta = static_cast<int64_t>(newCharLength) - static_cast<int64_t>(oldChars.length);
	auto glyphDelta = static_cast<int64_t>(glyphCount) - static_cast<int64_t>(oldGlyphEnd - oldGlyphStart);

	for (auto i = endEntry; i < m_charStarts.size(); ++i) {
		m_charStarts[i] = static_cast<uint32_t>(m_charStarts[i] + charDelta);
		m_glyphStarts[i] = static_cast<uint32_t>(m_glyphStarts[i] + glyphDelta);
	}

	m_charStarts.erase(m_charStarts.begin() + firstEntry, m_charStarts.begin() + endEntry);
	m_glyphStarts.erase(m_glyphStarts.begin() + firstEntry, m_glyphStarts.begin() + endEntry);
	m_charStarts.insert(m_charStarts.begin() + firstEntry, newCharStarts.begin(), newCharStarts.end());
	m_glyphStarts.insert(m_glyphStarts.begin() + firstEntry, newGlyphStarts.begin(), newGlyphStarts.end());

	m_charCount = static_cast<uint32_t>(m_charCount + charDelta);
	m_glyphCount = static_cast<uint32_t>(m_glyphCount + glyphDelta);

	outOldGlyphs = GlyphRange::from_bounds(oldGlyphStart, oldGlyphEnd);

	return LayoutError::NONE;
}

CharRange CharacterGlyphMap::get_enclosing_entries(CharRange range) const {
	if (m_charStarts.empty() || range.location >= m_charCount) {
		return CharRange::from_bounds(std::min(range.location, m_charCount), m_charCount);
	}

	auto start = m_charStarts[find_entry_for_char(range.location)];
	auto end = range.get_end();

	if (end >= m_charCount) {
		end = m_charCount;
	}
	else if (!is_cluster_boundary(end)) {
		end = get_entry_for_char(end).chars.get_end();
	}

	return CharRange::from_bounds(start, end);
}

MappingEntry CharacterGlyphMap::get_entry_for_char(uint32_t charIndex) const {
	if (charIndex >= m_charCount) {
		return {{m_charCount, 0}, {m_glyphCount, 0}};
	}

	return get_entry(find_entry_for_char(charIndex));
}

MappingEntry CharacterGlyphMap::get_entry_for_glyph(uint32_t glyphIndex) const {
	if (glyphIndex >= m_glyphCount) {
		return {{m_charCount, 0}, {m_glyphCount, 0}};
	}

	return get_entry(find_entry_for_glyph(glyphIndex));
}

GlyphRange CharacterGlyphMap::get_glyph_range(CharRange range) const {
	if (range.location >= m_charCount) {
		return {m_glyphCount, 0};
	}

	auto first = get_entry_for_char(range.location);

	if (range.empty()) {
		return {first.glyphs.location, 0};
	}

	auto last = get_entry_for_char(std::min(range.get_end(), m_charCount) - 1);
	return GlyphRange::from_bounds(first.glyphs.location, last.glyphs.get_end());
}

CharRange CharacterGlyphMap::get_char_range(GlyphRange range) const {
	if (range.location >= m_glyphCount) {
		return {m_charCount, 0};
	}

	auto first = get_entry_for_glyph(range.location);

	if (range.empty()) {
		return {first.chars.location, 0};
	}

	auto last = get_entry_for_glyph(std::min(range.get_end(), m_glyphCount) - 1);
	return CharRange::from_bounds(first.chars.location, last.chars.get_end());
}

uint32_t CharacterGlyphMap::get_glyph_index_for_char(uint32_t charIndex) const {
	return get_entry_for_char(charIndex).glyphs.location;
}

bool CharacterGlyphMap::is_cluster_boundary(uint32_t charIndex) const {
	if (charIndex == 0 || charIndex >= m_charCount) {
		return charIndex <= m_charCount;
	}

	return m_charStarts[find_entry_for_char(charIndex)] == charIndex;
}

bool CharacterGlyphMap::has_unmapped_entries(CharRange range) const {
	if (range.location >= m_charCount) {
		return false;
	}

	auto end = std::min(range.get_end(), m_charCount);

	for (auto i = find_entry_for_char(range.location); i < m_charStarts.size() && m_charStarts[i] < end; ++i) {
		if (get_entry(i).glyphs.empty()) {
			return true;
		}
	}

	return false;
}

size_t CharacterGlyphMap::get_entry_count() const {
	return m_charStarts.size();
}

MappingEntry CharacterGlyphMap::get_entry(size_t entryIndex) const {
	auto charEnd = entryIndex + 1 == m_charStarts.size() ? m_charCount : m_charStarts[entryIndex + 1];
	auto glyphEnd = entryIndex + 1 == m_glyphStarts.size() ? m_glyphCount : m_glyphStarts[entryIndex + 1];

	return {
		.chars = CharRange::from_bounds(m_charStarts[entryIndex], charEnd),
		.glyphs = GlyphRange::from_bounds(m_glyphStarts[entryIndex], glyphEnd),
	};
}

uint32_t CharacterGlyphMap::get_char_count() const {
	return m_charCount;
}

uint32_t CharacterGlyphMap::get_glyph_count() const {
	return m_glyphCount;
}

size_t CharacterGlyphMap::find_entry_for_char(uint32_t charIndex) const {
	return binary_search_last<size_t>(0, m_charStarts.size(), [&](auto i) {
		return m_charStarts[i] <= charIndex;
	});
}

size_t CharacterGlyphMap::find_entry_for_glyph(uint32_t glyphIndex) const {
	// Entries without glyphs share their start with the following entry; the last match owns the glyph
	return binary_search_last<size_t>(0, m_glyphStarts.size(), [&](auto i) {
		return m_glyphStarts[i] <= glyphIndex;
	});
}

size_t CharacterGlyphMap::find_entry_starting_at(uint32_t charIndex) const {
	return binary_search<size_t>(0, m_charStarts.size(), [&](auto i) {
		return m_charStarts[i] < charIndex;
	});
}

// Static Functions

static LayoutError build_entries(uint32_t charStart, uint32_t charLength, uint32_t glyphStart,
		const ProvidedGlyph* glyphs, uint32_t glyphCount, std::vector<uint32_t>& charStarts,
		std::vector<uint32_t>& glyphStarts) {
	auto charEnd = charStart + charLength;

	if (charLength == 0) {
		return glyphCount == 0 ? LayoutError::NONE : LayoutError::CLUSTER_OUT_OF_RANGE;
	}

	// Characters whose glyphs are pending regeneration
	if (glyphCount == 0) {
		charStarts.push_back(charStart);
		glyphStarts.push_back(glyphStart);
		return LayoutError::NONE;
	}

	for (uint32_t i = 0; i < glyphCount; ++i) {
		auto cluster = glyphs[i].cluster;

		if (cluster < charStart || cluster >= charEnd) {
			return LayoutError::CLUSTER_OUT_OF_RANGE;
		}

		if (i > 0 && cluster < glyphs[i - 1].cluster) {
			return LayoutError::NON_MONOTONIC_CLUSTERS;
		}

		if (i == 0) {
			// Leading characters without a glyph of their own join the first cluster
			charStarts.push_back(charStart);
			glyphStarts.push_back(glyphStart);
		}
		else if (cluster != glyphs[i - 1].cluster) {
			charStarts.push_back(cluster);
			glyphStarts.push_back(glyphStart + i);
		}
	}

	return LayoutError::NONE;
}
