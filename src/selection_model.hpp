#pragma once

#include "geometry.hpp"
#include "geometry_engine.hpp"
#include "range.hpp"
#include "text_container.hpp"
#include "text_storage.hpp"
#include "text_style.hpp"

#include <unicode/uversion.h>

#include <cstdint>

#include <functional>
#include <vector>

U_NAMESPACE_BEGIN

class BreakIterator;

U_NAMESPACE_END

namespace LineFlow {

class LayoutManager;

enum class SelectionGranularity : uint8_t {
	CHARACTER,
	WORD,
	PARAGRAPH,
	LINE,
};

/**
 * The selection shared by every view of one text. Views hold a reference, register a listener, and change the
 * selection only through the setters; each change is broadcast to all listeners. A listener may change the
 * selection while being notified, but that change is not broadcast again.
 *
 * The selection follows edits to the text: indices after an edit shift with it and indices inside a replaced
 * range move to the end of the replacement.
 */
class SelectionModel {
	public:
		using Listener = std::function<void(const SelectionModel&)>;
		using ListenerID = uint32_t;

		explicit SelectionModel(TextStorage& storage, LayoutManager& layout, GeometryEngine& geometry);
		~SelectionModel();

		SelectionModel(const SelectionModel&) = delete;
		void operator=(const SelectionModel&) = delete;

		/**
		 * Sets the selected range, which also becomes the original range, and resets the typing style to the
		 * style of the text before the range.
		 */
		void set_selection(CharRange range, Affinity affinity = Affinity::DOWNSTREAM, bool stillSelecting = false);
		/**
		 * Expands `proposedRange` to `granularity` and selects the result. The original range stays as it was, so
		 * that a drag can keep extending from where it began.
		 */
		void select(CharRange proposedRange, SelectionGranularity granularity, bool stillSelecting = false);

		void set_affinity(Affinity affinity);
		void set_still_selecting(bool stillSelecting);
		void set_typing_style(const TextStyle& style);

		CharRange get_range() const;
		CharRange get_original_range() const;
		SelectionGranularity get_granularity() const;
		Affinity get_affinity() const;
		bool is_still_selecting() const;
		const TextStyle& get_typing_style() const;

		CharRange range_for_granularity(CharRange proposedRange, SelectionGranularity granularity);

		/**
		 * Rects to highlight the selection in `container`: the selected glyphs line by line, or the insertion
		 * point if the selection is empty.
		 */
		std::vector<Rect> get_highlight_rects(ContainerID container);

		ListenerID add_listener(Listener listener);
		void remove_listener(ListenerID id);
	private:
		struct ListenerEntry {
			ListenerID id;
			Listener callback;
		};

		TextStorage& m_storage;
		LayoutManager& m_layout;
		GeometryEngine& m_geometry;
		icu::BreakIterator* m_wordIter{};

		CharRange m_range{};
		CharRange m_originalRange{};
		SelectionGranularity m_granularity{SelectionGranularity::CHARACTER};
		Affinity m_affinity{Affinity::DOWNSTREAM};
		bool m_stillSelecting{};
		TextStyle m_typingStyle;

		std::vector<ListenerEntry> m_listeners;
		ListenerID m_nextListenerID{1};
		bool m_notifying{};
		TextStorage::ObserverID m_storageObserver{};

		void handle_text_edit(CharRange editedRange, int32_t changeInLength);
		void notify();

		CharRange clamp_to_text(CharRange range) const;
		CharRange get_word_range(CharRange range);
		CharRange get_paragraph_range(CharRange range) const;
		CharRange get_line_range(CharRange range);
};

}
