#include "geometry_engine.hpp"

#include "binary_search.hpp"
#include "layout_manager.hpp"
#include "text_utils.hpp"

#include <unicode/uchar.h>
#include <unicode/utf8.h>

#include <algorithm>
#include <cmath>
#include <span>
#include <string_view>

using namespace LineFlow;

static size_t find_fragment_at_height(std::span<const LineFragment> fragments, float y);
static bool starts_with_whitespace(std::string_view text, CharRange range);

GeometryEngine::GeometryEngine(LayoutManager& layout)
		: m_layout(layout) {}

std::vector<Rect> GeometryEngine::get_rects_for_glyph_range(GlyphRange range, ContainerID container,
		std::optional<GlyphRange> selection) {
	if (selection) {
		if (!range.intersects(*selection)) {
			return {};
		}

		range = range.intersection(*selection);
	}

	if (range.empty() || container >= m_layout.get_container_count()) {
		return {};
	}

	m_layout.ensure_layout_for_glyph_range(range);

	auto& glyphs = m_layout.get_glyph_store();
	std::vector<Rect> result;

	for (auto& fragment : m_layout.get_fragments_without_layout(container)) {
		if (fragment.glyphs.location >= range.get_end()) {
			break;
		}

		if (!fragment.glyphs.intersects(range)) {
			continue;
		}

		auto lineRange = fragment.glyphs.intersection(range);
		auto lastGlyph = lineRange.get_end() - 1;
		auto minX = fragment.rect.x + glyphs.get_location(lineRange.location);
		auto maxX = fragment.rect.x + glyphs.get_location(lastGlyph) + glyphs.get_advance(lastGlyph);

		if (selection) {
			maxX = std::min(maxX, fragment.usedRect.get_max_x());
		}
		else if (range.get_end() > fragment.glyphs.get_end()) {
			auto lineEnd = fragment.rect.get_max_x();
			maxX = std::max(maxX, std::isfinite(lineEnd) ? lineEnd : fragment.usedRect.get_max_x());
		}

		result.push_back({minX, fragment.rect.y, std::max(maxX - minX, 0.f), fragment.rect.height});
	}

	return result;
}

std::vector<Rect> GeometryEngine::get_rects_for_char_range(CharRange range, ContainerID container,
		std::optional<CharRange> selection) {
	auto glyphRange = m_layout.get_glyph_range(range);

	if (selection) {
		return get_rects_for_glyph_range(glyphRange, container, m_layout.get_glyph_range(*selection));
	}

	return get_rects_for_glyph_range(glyphRange, container);
}

Rect GeometryEngine::get_bounding_rect(GlyphRange range, ContainerID container) {
	Rect result{};

	for (auto& rect : get_rects_for_glyph_range(range, container, range)) {
		result = result.united(rect);
	}

	return result;
}

GlyphRange GeometryEngine::get_glyph_range_for_bounding_rect(const Rect& rect, ContainerID container) {
	m_layout.ensure_layout_for_container(container);
	return get_glyph_range_for_bounding_rect_without_layout(rect, container);
}

GlyphRange GeometryEngine::get_glyph_range_for_bounding_rect_without_layout(const Rect& rect,
		ContainerID container) const {
	GlyphRange result{};
	bool found = false;

	for (auto& fragment : m_layout.get_fragments_without_layout(container)) {
		if (fragment.rect.y >= rect.get_max_y()) {
			break;
		}

		if (fragment.rect.get_max_y() <= rect.y) {
			continue;
		}

		result = found ? result.merged(fragment.glyphs) : fragment.glyphs;
		found = true;
	}

	return result;
}

uint32_t GeometryEngine::get_glyph_index_for_point(Point point, ContainerID container) {
	float fraction;
	return get_glyph_index_for_point(point, container, fraction);
}

uint32_t GeometryEngine::get_glyph_index_for_point(Point point, ContainerID container, float& outFraction) {
	auto fragments = m_layout.get_fragments(container);
	outFraction = 0.f;

	if (fragments.empty()) {
		return 0;
	}

	if (point.y >= fragments.back().rect.get_max_y()) {
		outFraction = 1.f;
		return fragments.back().glyphs.get_end() - 1;
	}

	return hit_test_fragment(fragments[find_fragment_at_height(fragments, point.y)], point.x, outFraction);
}

uint32_t GeometryEngine::get_char_index_for_point(Point point, ContainerID container) {
	auto fragments = m_layout.get_fragments(container);
	auto* extra = m_layout.get_extra_line_fragment();

	if (extra && extra->container == container && (fragments.empty() || point.y >= extra->fragment.rect.y)) {
		return extra->fragment.chars.location;
	}

	if (fragments.empty()) {
		return m_layout.get_char_range_for_container(container).location;
	}

	auto& fragment = fragments[find_fragment_at_height(fragments, point.y)];
	auto& map = m_layout.get_character_glyph_map();
	auto& glyphs = m_layout.get_glyph_store();
	auto text = m_layout.get_text_storage().get_text();

	float fraction;
	auto glyphIndex = hit_test_fragment(fragment, point.x, fraction);
	auto entry = map.get_entry_for_glyph(glyphIndex);

	if (glyphs.is_line_break(glyphIndex)) {
		return entry.chars.location;
	}

	// Pick the nearest code point boundary across the whole cluster
	auto clusterX = fragment.rect.x + glyphs.get_location(entry.glyphs.location);
	auto clusterWidth = glyphs.get_total_advance(entry.glyphs);
	auto clusterFraction = clusterWidth > 0.f ? std::clamp((point.x - clusterX) / clusterWidth, 0.f, 1.f) : 0.f;
	auto codePointCount = count_code_points(text, entry.chars);
	auto steps = static_cast<uint32_t>(std::lround(clusterFraction * static_cast<float>(codePointCount)));
	auto charIndex = advance_code_points(text, entry.chars.location, steps);

	// Past the end of a line, stay before a hard break or trailing whitespace. The end of a soft wrapped line is
	// also the start of the next one, which callers resolve with the affinity.
	if (charIndex >= fragment.chars.get_end()) {
		auto lastGlyph = fragment.glyphs.get_end() - 1;
		auto lastChars = map.get_entry_for_glyph(lastGlyph).chars;

		if (glyphs.is_line_break(lastGlyph) || (fragment.chars.get_end() < map.get_char_count()
				&& starts_with_whitespace(text, lastChars))) {
			return lastChars.location;
		}
	}

	return charIndex;
}

Rect GeometryEngine::get_insertion_rect(uint32_t charIndex, ContainerID container, Affinity affinity) {
	auto text = m_layout.get_text_storage().get_text();

	if (charIndex > text.size() || container >= m_layout.get_container_count()) {
		return {};
	}

	m_layout.ensure_layout_for_char_index(charIndex);

	auto& map = m_layout.get_character_glyph_map();
	auto& glyphs = m_layout.get_glyph_store();

	if (charIndex == text.size()) {
		if (auto* extra = m_layout.get_extra_line_fragment()) {
			if (extra->container != container) {
				return {};
			}

			auto& rect = extra->fragment.usedRect;
			return {rect.x, rect.y, 0.f, rect.height};
		}

		if (map.get_glyph_count() == 0) {
			return {};
		}

		auto lastGlyph = map.get_glyph_count() - 1;
		ContainerID lastContainer = INVALID_CONTAINER;
		auto* fragment = m_layout.get_fragment_for_glyph(lastGlyph, &lastContainer);

		if (!fragment || lastContainer != container) {
			return {};
		}

		return {fragment->rect.x + glyphs.get_location(lastGlyph) + glyphs.get_advance(lastGlyph), fragment->rect.y,
				0.f, fragment->rect.height};
	}

	auto entry = map.get_entry_for_char(charIndex);
	ContainerID fragmentContainer = INVALID_CONTAINER;
	auto* fragment = m_layout.get_fragment_for_glyph(entry.glyphs.location, &fragmentContainer);

	if (!fragment || fragmentContainer != container) {
		return {};
	}

	if (affinity == Affinity::UPSTREAM && charIndex == fragment->chars.location && fragment->glyphs.location > 0
			&& !glyphs.is_line_break(fragment->glyphs.location - 1)) {
		auto prevGlyph = fragment->glyphs.location - 1;
		ContainerID prevContainer = INVALID_CONTAINER;

		if (auto* prev = m_layout.get_fragment_for_glyph(prevGlyph, &prevContainer); prev
				&& prevContainer == container) {
			return {prev->rect.x + glyphs.get_location(prevGlyph) + glyphs.get_advance(prevGlyph), prev->rect.y, 0.f,
					prev->rect.height};
		}
	}

	auto x = fragment->rect.x + glyphs.get_location(entry.glyphs.location);

	if (charIndex > entry.chars.location) {
		auto before = count_code_points(text, CharRange::from_bounds(entry.chars.location, charIndex));
		auto total = count_code_points(text, entry.chars);
		x += glyphs.get_total_advance(entry.glyphs) * static_cast<float>(before) / static_cast<float>(total);
	}

	return {x, fragment->rect.y, 0.f, fragment->rect.height};
}

uint32_t GeometryEngine::hit_test_fragment(const LineFragment& fragment, float x, float& outFraction) const {
	auto& glyphs = m_layout.get_glyph_store();
	auto lastVisible = fragment.glyphs.location;
	bool foundVisible = false;

	for (auto i = fragment.glyphs.location; i < fragment.glyphs.get_end(); ++i) {
		if (glyphs.is_hidden(i)) {
			continue;
		}

		auto glyphX = fragment.rect.x + glyphs.get_location(i);
		auto advance = glyphs.get_advance(i);

		if (x < glyphX + advance) {
			outFraction = advance > 0.f ? std::clamp((x - glyphX) / advance, 0.f, 1.f) : 0.f;
			return i;
		}

		lastVisible = i;
		foundVisible = true;
	}

	// A line holding only hidden glyphs, like an empty line, hits its first glyph
	outFraction = foundVisible ? 1.f : 0.f;
	return lastVisible;
}

// Static Functions

static size_t find_fragment_at_height(std::span<const LineFragment> fragments, float y) {
	auto index = binary_search<size_t>(0, fragments.size(), [&](auto i) {
		return fragments[i].rect.get_max_y() <= y;
	});

	return std::min(index, fragments.size() - 1);
}

static bool starts_with_whitespace(std::string_view text, CharRange range) {
	if (range.empty() || range.location >= text.size()) {
		return false;
	}

	auto* chars = reinterpret_cast<const uint8_t*>(text.data());
	auto i = static_cast<int32_t>(range.location);
	UChar32 c;
	U8_NEXT(chars, i, static_cast<int32_t>(text.size()), c);

	return u_isWhitespace(c);
}
