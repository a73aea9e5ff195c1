#pragma once

#include "range.hpp"
#include "text_style.hpp"

#include <cstdint>

#include <string_view>
#include <vector>

namespace LineFlow {

/**
 * A glyph as produced by a `GlyphProvider`. `cluster` is the index of the first character of the cluster the
 * glyph belongs to. Within one run, clusters must be non-decreasing and lie inside the requested range.
 */
struct ProvidedGlyph {
	uint32_t glyphID;
	uint32_t cluster;
	float advance;
	float ascent;
	float descent;
};

struct LineMetrics {
	float ascent;
	float descent;
	float leading;

	constexpr float get_line_height() const {
		return ascent + descent + leading;
	}
};

/**
 * A run of characters sharing one style. `text` is the full text so providers can use surrounding characters as
 * shaping context; only characters inside `range` produce glyphs.
 */
struct StyledRun {
	std::string_view text;
	CharRange range;
	TextStyle style;
};

/**
 * Converts styled character runs into positioned glyph metrics. Implementations are selected when the layout
 * manager is constructed and are not owned by it.
 */
class GlyphProvider {
	public:
		virtual ~GlyphProvider() = default;

		/**
		 * Appends the glyphs for `run` to `output`, in logical order.
		 */
		virtual void generate_glyphs(const StyledRun& run, std::vector<ProvidedGlyph>& output) = 0;

		/**
		 * Metrics of a line containing only text in `style`; used for empty lines and the extra line fragment.
		 */
		virtual LineMetrics get_line_metrics(const TextStyle& style) = 0;
};

}
