#include "line_fragment_store.hpp"

#include "binary_search.hpp"
#include "character_glyph_map.hpp"

#include <algorithm>

using namespace LineFlow;

void LineFragmentStore::append(const LineFragment& fragment) {
	// Appending a freshly laid fragment supersedes whatever stale fragments overlap it
	auto firstStale = m_fragments.begin() + m_validCount;
	auto firstKept = std::find_if(firstStale, m_fragments.end(), [&](auto& stale) {
		return stale.chars.location >= fragment.chars.get_end() && stale.rect.y >= fragment.rect.get_max_y();
	});
	m_fragments.erase(firstStale, firstKept);

	m_fragments.insert(m_fragments.begin() + m_validCount, fragment);
	++m_validCount;
}

void LineFragmentStore::clear() {
	m_fragments.clear();
	m_validCount = 0;
}

void LineFragmentStore::invalidate(size_t fragmentIndex, CharRange oldEditRange, int32_t charDelta) {
	auto newFragments = std::vector<LineFragment>(m_fragments.begin(),
			m_fragments.begin() + std::min(fragmentIndex, m_fragments.size()));

	// Fragments before the end of the edit may have read the edited text while choosing their breaks
	for (auto i = newFragments.size(); i < m_fragments.size(); ++i) {
		auto fragment = m_fragments[i];

		if (fragment.chars.location >= oldEditRange.get_end() && !fragment.chars.empty()) {
			fragment.chars.location = static_cast<uint32_t>(fragment.chars.location + charDelta);
			newFragments.push_back(fragment);
		}
	}

	m_validCount = std::min(m_validCount, fragmentIndex);
	m_fragments = std::move(newFragments);
}

bool LineFragmentStore::try_adopt_stale(uint32_t charIndex, uint32_t glyphIndex, float y,
		const CharacterGlyphMap& map) {
	auto firstStale = m_fragments.begin() + m_validCount;
	auto firstKept = std::find_if(firstStale, m_fragments.end(), [&](auto& stale) {
		return stale.chars.location >= charIndex;
	});
	m_fragments.erase(firstStale, firstKept);

	if (m_validCount == m_fragments.size()) {
		return false;
	}

	auto& candidate = m_fragments[m_validCount];

	if (candidate.chars.location != charIndex || candidate.rect.y != y
			|| candidate.chars.get_end() > map.get_char_count()) {
		return false;
	}

	auto nextChar = charIndex;
	auto nextGlyph = glyphIndex;

	for (auto i = m_validCount; i < m_fragments.size(); ++i) {
		auto& fragment = m_fragments[i];

		if (fragment.chars.location != nextChar || fragment.chars.get_end() > map.get_char_count()
				|| map.has_unmapped_entries(fragment.chars)) {
			m_fragments.resize(i);
			break;
		}

		fragment.glyphs = map.get_glyph_range(fragment.chars);

		// The fragments must still partition the glyphs
		if (fragment.glyphs.location != nextGlyph || fragment.glyphs.empty()) {
			m_fragments.resize(i);
			break;
		}

		nextChar = fragment.chars.get_end();
		nextGlyph = fragment.glyphs.get_end();
	}

	if (m_fragments.size() == m_validCount) {
		return false;
	}

	m_validCount = m_fragments.size();
	return true;
}

void LineFragmentStore::discard_all_stale() {
	m_fragments.resize(m_validCount);
}

std::span<const LineFragment> LineFragmentStore::get_fragments() const {
	return {m_fragments.data(), m_validCount};
}

std::span<const LineFragment> LineFragmentStore::get_fragments_intersecting(const Rect& rect) const {
	auto first = binary_search<size_t>(0, m_validCount, [&](auto i) {
		return m_fragments[i].rect.get_max_y() <= rect.y;
	});
	auto last = binary_search<size_t>(first, m_validCount - first, [&](auto i) {
		return m_fragments[i].rect.y < rect.get_max_y();
	});

	return {m_fragments.data() + first, last - first};
}

size_t LineFragmentStore::find_fragment_for_glyph(uint32_t glyphIndex) const {
	if (m_validCount == 0 || glyphIndex < m_fragments.front().glyphs.location) {
		return m_validCount;
	}

	auto index = binary_search_last<size_t>(0, m_validCount, [&](auto i) {
		return m_fragments[i].glyphs.location <= glyphIndex;
	});

	// Empty fragments share their start with the next fragment
	while (index + 1 < m_validCount && m_fragments[index + 1].glyphs.location == glyphIndex) {
		++index;
	}

	return m_fragments[index].glyphs.contains(glyphIndex) ? index : m_validCount;
}

const LineFragment& LineFragmentStore::get_fragment(size_t fragmentIndex) const {
	return m_fragments[fragmentIndex];
}

size_t LineFragmentStore::get_valid_count() const {
	return m_validCount;
}

bool LineFragmentStore::empty() const {
	return m_validCount == 0;
}

GlyphRange LineFragmentStore::get_glyph_range() const {
	if (m_validCount == 0) {
		return {};
	}

	return GlyphRange::from_bounds(m_fragments.front().glyphs.location,
			m_fragments[m_validCount - 1].glyphs.get_end());
}

CharRange LineFragmentStore::get_char_range() const {
	if (m_validCount == 0) {
		return {};
	}

	return CharRange::from_bounds(m_fragments.front().chars.location, m_fragments[m_validCount - 1].chars.get_end());
}

Rect LineFragmentStore::get_used_rect() const {
	Rect result{};

	for (size_t i = 0; i < m_validCount; ++i) {
		result = result.united(m_fragments[i].usedRect);
	}

	return result;
}
