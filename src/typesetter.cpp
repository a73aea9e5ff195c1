#include "typesetter.hpp"

#include "character_glyph_map.hpp"
#include "glyph_store.hpp"
#include "line_break_strategy.hpp"
#include "log.hpp"
#include "text_storage.hpp"
#include "text_utils.hpp"

#include <unicode/uchar.h>
#include <unicode/utf8.h>

#include <cassert>

using namespace LineFlow;

static bool is_word_separator(UChar32 c);

Typesetter::Typesetter(GlyphProvider& provider)
		: m_provider(provider) {}

LayoutError Typesetter::generate_glyphs(const TextStorage& storage, CharRange dirtyRange,
		CharacterGlyphMap& map, GlyphStore& glyphStore, CharRange& outWindow) {
	auto text = storage.get_text();
	auto window = get_regeneration_window(text, map, dirtyRange);

	std::vector<ProvidedGlyph> glyphs;
	std::vector<GlyphFlags> flags;
	LayoutError err = LayoutError::NONE;

	storage.get_style_runs().for_each_run_in_range(window.location, window.length,
			[&](uint32_t start, uint32_t limit, const TextStyle& style) {
		if (err != LayoutError::NONE) {
			return;
		}

		// Hard line breaks get glyphs of their own and split the run
		auto runStart = start;

		for (auto i = start; i < limit;) {
			auto breakLength = get_line_break_length(text, i);

			if (breakLength == 0) {
				i = advance_code_points(text, i, 1);
				continue;
			}

			if (i > runStart) {
				err = append_run_glyphs({text, CharRange::from_bounds(runStart, i), style}, glyphs, flags);

				if (err != LayoutError::NONE) {
					return;
				}
			}

			append_line_break_glyph({i, breakLength}, style, glyphs, flags);
			i += breakLength;
			runStart = i;
		}

		if (limit > runStart) {
			err = append_run_glyphs({text, CharRange::from_bounds(runStart, limit), style}, glyphs, flags);
		}
	});

	if (err != LayoutError::NONE) {
		return err;
	}

	GlyphRange oldGlyphs{};

	if (err = map.replace(window, window.length, glyphs.data(), static_cast<uint32_t>(glyphs.size()),
			oldGlyphs); err != LayoutError::NONE) {
		return err;
	}

	glyphStore.replace(oldGlyphs, glyphs.data(), flags.data(), static_cast<uint32_t>(glyphs.size()));
	outWindow = window;

	LINEFLOW_LOG_DEBUG("Regenerated chars [%u, %u) as %zu glyphs", window.location, window.get_end(),
			glyphs.size());

	return LayoutError::NONE;
}

LineFragment Typesetter::layout_line(const CharacterGlyphMap& map, GlyphStore& glyphs,
		LineBreakStrategy& strategy, uint32_t glyphStart, LineSegment segment, float y) const {
	assert(glyphStart < map.get_glyph_count() && "Typesetter::layout_line(): no glyphs left to lay out");

	auto glyphCount = map.get_glyph_count();
	auto glyphIndex = glyphStart;
	float lineWidthSoFar = 0.f;
	bool overflow = false;

	while (glyphIndex < glyphCount) {
		if (glyphs.is_line_break(glyphIndex)) {
			++glyphIndex;
			break;
		}

		auto advance = glyphs.get_advance(glyphIndex);

		if (lineWidthSoFar + advance > segment.width) {
			overflow = true;
			break;
		}

		lineWidthSoFar += advance;
		++glyphIndex;
	}

	auto lineEnd = glyphIndex;

	if (overflow) {
		auto lineStartChar = map.get_entry_for_glyph(glyphStart).chars.location;
		auto overflowEntry = map.get_entry_for_glyph(glyphIndex);
		auto breakChar = strategy.find_line_break(lineStartChar, overflowEntry.chars.location);

		// A break inside a cluster rounds down to the start of the cluster
		lineEnd = breakChar > lineStartChar ? map.get_glyph_index_for_char(breakChar) : glyphStart;

		// Without a usable word break, cut at the furthest cluster boundary that fits
		if (lineEnd <= glyphStart) {
			lineEnd = overflowEntry.glyphs.location;
		}

		// If no cluster fits on the line, force one to fit
		if (lineEnd <= glyphStart) {
			lineEnd = map.get_entry_for_glyph(glyphStart).glyphs.get_end();
		}
	}

	float x = 0.f;
	float maxAscent = 0.f;
	float maxDescent = 0.f;

	for (auto i = glyphStart; i < lineEnd; ++i) {
		glyphs.set_location(i, x);
		x += glyphs.get_advance(i);
		maxAscent = std::max(maxAscent, glyphs.get_ascent(i));
		maxDescent = std::max(maxDescent, glyphs.get_descent(i));
	}

	auto lineGlyphs = GlyphRange::from_bounds(glyphStart, lineEnd);
	auto height = maxAscent + maxDescent;

	return {
		.glyphs = lineGlyphs,
		.chars = map.get_char_range(lineGlyphs),
		.rect = {segment.x, y, segment.width, height},
		.usedRect = {segment.x, y, x, height},
		.baseline = maxAscent,
	};
}

CharRange Typesetter::get_regeneration_window(std::string_view text, const CharacterGlyphMap& map,
		CharRange range) {
	auto* chars = reinterpret_cast<const uint8_t*>(text.data());
	auto count = static_cast<int32_t>(text.size());
	auto window = map.get_enclosing_entries(range);

	// Entries never straddle whitespace in practice, so this settles after one or two passes
	for (;;) {
		auto start = static_cast<int32_t>(window.location);
		auto end = static_cast<int32_t>(window.get_end());
		UChar32 c;

		while (start > 0) {
			auto prev = start;
			U8_PREV(chars, 0, prev, c);

			if (is_word_separator(c)) {
				break;
			}

			start = prev;
		}

		while (end < count) {
			auto next = end;
			U8_NEXT(chars, next, count, c);

			if (is_word_separator(c)) {
				break;
			}

			end = next;
		}

		auto expanded = map.get_enclosing_entries(CharRange::from_bounds(static_cast<uint32_t>(start),
				static_cast<uint32_t>(end)));

		if (expanded == window) {
			return window;
		}

		window = expanded;
	}
}

LayoutError Typesetter::append_run_glyphs(const StyledRun& run, std::vector<ProvidedGlyph>& glyphs,
		std::vector<GlyphFlags>& flags) {
	m_runGlyphs.clear();
	m_provider.generate_glyphs(run, m_runGlyphs);

	for (size_t i = 0; i < m_runGlyphs.size(); ++i) {
		auto cluster = m_runGlyphs[i].cluster;

		if (!run.range.contains(cluster)) {
			LINEFLOW_LOG_ERROR("Glyph provider returned cluster %u outside of run [%u, %u)", cluster,
					run.range.location, run.range.get_end());
			return LayoutError::CLUSTER_OUT_OF_RANGE;
		}

		if (i > 0 && cluster < m_runGlyphs[i - 1].cluster) {
			LINEFLOW_LOG_ERROR("Glyph provider returned cluster %u after cluster %u", cluster,
					m_runGlyphs[i - 1].cluster);
			return LayoutError::NON_MONOTONIC_CLUSTERS;
		}
	}

	if (m_runGlyphs.empty()) {
		// The characters still need a cluster to be addressable
		auto metrics = m_provider.get_line_metrics(run.style);
		glyphs.push_back({0, run.range.location, 0.f, metrics.ascent, metrics.descent});
		flags.push_back(GlyphFlags::HIDDEN);
		return LayoutError::NONE;
	}

	glyphs.insert(glyphs.end(), m_runGlyphs.begin(), m_runGlyphs.end());
	flags.insert(flags.end(), m_runGlyphs.size(), GlyphFlags::NONE);

	return LayoutError::NONE;
}

void Typesetter::append_line_break_glyph(CharRange breakChars, const TextStyle& style,
		std::vector<ProvidedGlyph>& glyphs, std::vector<GlyphFlags>& flags) {
	auto metrics = m_provider.get_line_metrics(style);
	glyphs.push_back({0, breakChars.location, 0.f, metrics.ascent, metrics.descent});
	flags.push_back(GlyphFlags::HIDDEN | GlyphFlags::LINE_BREAK);
}

// Static Functions

static bool is_word_separator(UChar32 c) {
	return u_isWhitespace(c);
}
