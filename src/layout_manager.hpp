#pragma once

#include "character_glyph_map.hpp"
#include "display_observer.hpp"
#include "geometry.hpp"
#include "glyph_provider.hpp"
#include "glyph_store.hpp"
#include "invalidation_tracker.hpp"
#include "layout_config.hpp"
#include "layout_error.hpp"
#include "line_break_strategy.hpp"
#include "line_fragment_store.hpp"
#include "text_container.hpp"
#include "text_storage.hpp"
#include "typesetter.hpp"

#include <cstdint>

#include <functional>
#include <memory>
#include <optional>
#include <span>
#include <vector>

namespace LineFlow {

/**
 * The glyph-less line placed after text that is empty or ends with a hard line break, so that the end of the
 * text has a line to put the insertion point on.
 */
struct ExtraLineFragment {
	ContainerID container;
	LineFragment fragment;
};

struct VisibleGlyph {
	uint32_t glyphIndex;
	uint32_t glyphID;
	// Origin of the glyph on the baseline
	Point position;
	const TextStyle* style;
};

/**
 * Owns the derived layout state of a `TextStorage`: the character to glyph mapping, the glyphs, and the line
 * fragments of every container. Edits reported by the storage only record what became stale; glyphs and
 * fragments are rebuilt lazily by whichever query first needs them.
 *
 * Containers are identified by the order they were added in and text flows through them in that order.
 */
class LayoutManager {
	public:
		using ErrorHandler = std::function<void(LayoutError)>;

		explicit LayoutManager(TextStorage& storage, GlyphProvider& provider, LayoutConfig config = {});
		~LayoutManager();

		LayoutManager(const LayoutManager&) = delete;
		void operator=(const LayoutManager&) = delete;

		ContainerID add_container(Size size);
		void set_container_size(ContainerID id, Size size);
		void set_container_exclusion_rects(ContainerID id, std::vector<Rect> rects);
		const TextContainer* get_container(ContainerID id) const;
		uint32_t get_container_count() const;

		void set_line_break_strategy(std::unique_ptr<LineBreakStrategy> strategy);

		/**
		 * Lays out `range` and returns the part of its glyphs that landed in `container`.
		 */
		GlyphRange typeset(CharRange range, ContainerID container);

		void ensure_glyphs();
		void ensure_layout_for_char_index(uint32_t charIndex);
		void ensure_layout_for_char_range(CharRange range);
		void ensure_layout_for_glyph_range(GlyphRange range);
		void ensure_layout_for_container(ContainerID id);
		void ensure_layout();

		GlyphRange get_glyph_range(CharRange range);
		CharRange get_char_range(GlyphRange range);
		uint32_t get_glyph_count();

		std::span<const LineFragment> get_fragments(ContainerID id);
		std::span<const LineFragment> get_fragments_intersecting(const Rect& rect, ContainerID id);
		/**
		 * Fragments of `id` that are already valid; never lays anything out.
		 */
		std::span<const LineFragment> get_fragments_without_layout(ContainerID id) const;
		const LineFragment* get_fragment_for_glyph(uint32_t glyphIndex, ContainerID* outContainer = nullptr);
		const ExtraLineFragment* get_extra_line_fragment();

		GlyphRange get_glyph_range_for_container(ContainerID id);
		/**
		 * Characters laid out in `id`. The end of the text belongs to the container holding the extra line
		 * fragment, or the last glyph if there is none.
		 */
		CharRange get_char_range_for_container(ContainerID id);
		ContainerID get_container_for_char(uint32_t charIndex);

		/**
		 * Origin of the glyph relative to its line fragment, on the baseline.
		 */
		Point get_location_for_glyph(uint32_t glyphIndex);
		Rect get_used_rect(ContainerID id);

		LineMetrics get_default_line_metrics();

		const CharacterGlyphMap& get_character_glyph_map() const;
		const GlyphStore& get_glyph_store() const;
		const TextStorage& get_text_storage() const;
		const InvalidationTracker& get_invalidation_tracker() const;
		const LayoutConfig& get_config() const;

		void add_display_observer(DisplayObserver& observer);
		void remove_display_observer(DisplayObserver& observer);
		void invalidate_display(GlyphRange range);
		void invalidate_display(CharRange range);

		void set_error_handler(ErrorHandler handler);
		LayoutError get_last_error() const;
		void clear_error();

		/**
		 * Calls `func(Rect, Color)` for the laid out parts of `range` with a background color. `origin` is the
		 * position the container is drawn at.
		 */
		template <typename Functor>
		void draw_background(GlyphRange range, Point origin, Functor&& func);

		/**
		 * Calls `func(const VisibleGlyph&)` for every laid out glyph of `range` that isn't hidden.
		 */
		template <typename Functor>
		void draw_glyphs(GlyphRange range, Point origin, Functor&& func);
	private:
		struct ContainerEntry {
			TextContainer container;
			LineFragmentStore fragments;
		};

		// Where the next line goes
		struct LayoutCursor {
			uint32_t container;
			float y;
			uint32_t charIndex;
			uint32_t glyphIndex;
		};

		TextStorage& m_storage;
		GlyphProvider& m_provider;
		LayoutConfig m_config;
		Typesetter m_typesetter;
		std::unique_ptr<LineBreakStrategy> m_lineBreakStrategy;

		CharacterGlyphMap m_map;
		GlyphStore m_glyphs;
		InvalidationTracker m_tracker;
		std::vector<ContainerEntry> m_containers;
		std::optional<ExtraLineFragment> m_extraFragment;
		LayoutCursor m_cursor{};
		LineMetrics m_defaultMetrics{};
		bool m_layoutComplete{};

		std::vector<DisplayObserver*> m_displayObservers;
		ErrorHandler m_errorHandler;
		LayoutError m_lastError{LayoutError::NONE};
		TextStorage::ObserverID m_storageObserver{};

		void handle_text_edit(CharRange editedRange, int32_t changeInLength);
		void invalidate_layout(CharRange oldRange, int32_t changeInLength);
		void invalidate_containers_from(ContainerID id);
		uint32_t find_layout_restart(uint32_t charIndex) const;
		void reset_layout_cursor();

		void prepare_layout();
		bool lay_out_next_line();
		void finish_layout();

		void report_error(LayoutError error);

		template <typename Functor>
		void for_each_laid_fragment(GlyphRange range, Functor&& func);
};

template <typename Functor>
void LayoutManager::draw_background(GlyphRange range, Point origin, Functor&& func) {
	ensure_layout_for_glyph_range(range);

	for_each_laid_fragment(range, [&](const LineFragment& fragment) {
		auto glyphs = fragment.glyphs.intersection(range);
		auto chars = m_map.get_char_range(glyphs);

		m_storage.get_style_runs().for_each_run_in_range(chars.location, chars.length,
				[&](uint32_t start, uint32_t limit, const TextStyle& style) {
			if (!style.has_background()) {
				return;
			}

			auto runGlyphs = m_map.get_glyph_range(CharRange::from_bounds(start, limit)).intersection(glyphs);

			if (runGlyphs.empty()) {
				return;
			}

			auto lastGlyph = runGlyphs.get_end() - 1;
			auto minX = m_glyphs.get_location(runGlyphs.location);
			auto maxX = m_glyphs.get_location(lastGlyph) + m_glyphs.get_advance(lastGlyph);

			if (maxX > minX) {
				func(Rect{origin.x + fragment.rect.x + minX, origin.y + fragment.rect.y, maxX - minX,
						fragment.rect.height}, style.background);
			}
		});
	});
}

template <typename Functor>
void LayoutManager::draw_glyphs(GlyphRange range, Point origin, Functor&& func) {
	ensure_layout_for_glyph_range(range);

	for_each_laid_fragment(range, [&](const LineFragment& fragment) {
		auto glyphs = fragment.glyphs.intersection(range);

		for (auto i = glyphs.location; i < glyphs.get_end(); ++i) {
			if (m_glyphs.is_hidden(i)) {
				continue;
			}

			VisibleGlyph glyph{
				.glyphIndex = i,
				.glyphID = m_glyphs.get_glyph_id(i),
				.position = {origin.x + fragment.rect.x + m_glyphs.get_location(i),
						origin.y + fragment.rect.y + fragment.baseline},
				.style = &m_storage.get_style_at(m_map.get_entry_for_glyph(i).chars.location),
			};

			func(glyph);
		}
	});
}

template <typename Functor>
void LayoutManager::for_each_laid_fragment(GlyphRange range, Functor&& func) {
	for (auto& entry : m_containers) {
		for (auto& fragment : entry.fragments.get_fragments()) {
			if (fragment.glyphs.location >= range.get_end()) {
				break;
			}

			if (fragment.glyphs.intersects(range)) {
				func(fragment);
			}
		}
	}
}

}
