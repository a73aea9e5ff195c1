#include "selection_model.hpp"

#include "layout_manager.hpp"
#include "log.hpp"
#include "text_utils.hpp"

#include <unicode/brkiter.h>
#include <unicode/utext.h>
#include <unicode/utf8.h>

#include <algorithm>

using namespace LineFlow;

SelectionModel::SelectionModel(TextStorage& storage, LayoutManager& layout, GeometryEngine& geometry)
		: m_storage(storage)
		, m_layout(layout)
		, m_geometry(geometry)
		, m_typingStyle(layout.get_config().defaultStyle) {
	UErrorCode err{U_ZERO_ERROR};
	m_wordIter = icu::BreakIterator::createWordInstance(get_locale(layout.get_config().locale), err);

	if (U_FAILURE(err)) {
		LINEFLOW_LOG_ERROR("Failed to create word break iterator: %s", u_errorName(err));
		delete m_wordIter;
		m_wordIter = nullptr;
	}

	m_storageObserver = m_storage.add_observer([this](CharRange editedRange, int32_t changeInLength) {
		handle_text_edit(editedRange, changeInLength);
	});
}

SelectionModel::~SelectionModel() {
	m_storage.remove_observer(m_storageObserver);
	delete m_wordIter;
}

void SelectionModel::set_selection(CharRange range, Affinity affinity, bool stillSelecting) {
	m_range = clamp_to_text(range);
	m_originalRange = m_range;
	m_affinity = affinity;
	m_stillSelecting = stillSelecting;
	m_typingStyle = m_storage.get_style_at(m_range.location > 0 ? m_range.location - 1 : 0);
	notify();
}

void SelectionModel::select(CharRange proposedRange, SelectionGranularity granularity, bool stillSelecting) {
	m_range = range_for_granularity(proposedRange, granularity);
	m_granularity = granularity;
	m_stillSelecting = stillSelecting;
	m_typingStyle = m_storage.get_style_at(m_range.location > 0 ? m_range.location - 1 : 0);
	notify();
}

void SelectionModel::set_affinity(Affinity affinity) {
	m_affinity = affinity;
	notify();
}

void SelectionModel::set_still_selecting(bool stillSelecting) {
	m_stillSelecting = stillSelecting;
	notify();
}

void SelectionModel::set_typing_style(const TextStyle& style) {
	m_typingStyle = style;
	notify();
}

CharRange SelectionModel::get_range() const {
	return m_range;
}

CharRange SelectionModel::get_original_range() const {
	return m_originalRange;
}

SelectionGranularity SelectionModel::get_granularity() const {
	return m_granularity;
}

Affinity SelectionModel::get_affinity() const {
	return m_affinity;
}

bool SelectionModel::is_still_selecting() const {
	return m_stillSelecting;
}

const TextStyle& SelectionModel::get_typing_style() const {
	return m_typingStyle;
}

CharRange SelectionModel::range_for_granularity(CharRange proposedRange, SelectionGranularity granularity) {
	auto range = clamp_to_text(proposedRange);

	switch (granularity) {
		case SelectionGranularity::CHARACTER:
			return range;
		case SelectionGranularity::WORD:
			return get_word_range(range);
		case SelectionGranularity::PARAGRAPH:
			return get_paragraph_range(range);
		case SelectionGranularity::LINE:
			return get_line_range(range);
	}

	LINEFLOW_UNREACHABLE();
}

std::vector<Rect> SelectionModel::get_highlight_rects(ContainerID container) {
	if (m_range.empty()) {
		if (auto rect = m_geometry.get_insertion_rect(m_range.location, container, m_affinity); !rect.is_null()) {
			return {rect};
		}

		return {};
	}

	return m_geometry.get_rects_for_char_range(m_range, container, m_range);
}

SelectionModel::ListenerID SelectionModel::add_listener(Listener listener) {
	auto id = m_nextListenerID++;
	m_listeners.push_back({id, std::move(listener)});
	return id;
}

void SelectionModel::remove_listener(ListenerID id) {
	std::erase_if(m_listeners, [&](auto& entry) {
		return entry.id == id;
	});
}

// Private

void SelectionModel::handle_text_edit(CharRange editedRange, int32_t changeInLength) {
	if (changeInLength == 0) {
		return;
	}

	auto oldEnd = static_cast<uint32_t>(static_cast<int64_t>(editedRange.get_end()) - changeInLength);
	auto shift = [&](uint32_t index) {
		if (index >= oldEnd) {
			return static_cast<uint32_t>(static_cast<int64_t>(index) + changeInLength);
		}

		return index > editedRange.location ? editedRange.get_end() : index;
	};

	auto shiftRange = [&](CharRange range) {
		return CharRange::from_bounds(shift(range.location), shift(range.get_end()));
	};

	m_range = shiftRange(m_range);
	m_originalRange = shiftRange(m_originalRange);
	notify();
}

void SelectionModel::notify() {
	if (m_notifying) {
		return;
	}

	m_notifying = true;
	auto listeners = m_listeners;

	for (auto& entry : listeners) {
		entry.callback(*this);
	}

	m_notifying = false;
}

CharRange SelectionModel::clamp_to_text(CharRange range) const {
	auto length = m_storage.get_length();
	auto start = std::min(range.location, length);
	return CharRange::from_bounds(start, std::min(range.get_end(), length));
}

CharRange SelectionModel::get_word_range(CharRange range) {
	auto text = m_storage.get_text();
	auto length = static_cast<int32_t>(text.size());

	if (!m_wordIter || length == 0) {
		return range;
	}

	UErrorCode err{U_ZERO_ERROR};
	UText uText UTEXT_INITIALIZER;
	utext_openUTF8(&uText, text.data(), static_cast<int64_t>(text.size()), &err);
	m_wordIter->setText(&uText, err);
	utext_close(&uText);

	auto start = static_cast<int32_t>(range.location);
	auto end = static_cast<int32_t>(range.get_end());

	if (start == length) {
		start = m_wordIter->preceding(start);
	}
	else if (!m_wordIter->isBoundary(start)) {
		start = m_wordIter->preceding(start);
	}

	if (start == icu::BreakIterator::DONE) {
		start = 0;
	}

	if (end <= start || !m_wordIter->isBoundary(end)) {
		end = m_wordIter->following(std::max(start, end - 1));
	}

	if (end == icu::BreakIterator::DONE) {
		end = length;
	}

	return CharRange::from_bounds(static_cast<uint32_t>(start), static_cast<uint32_t>(end));
}

CharRange SelectionModel::get_paragraph_range(CharRange range) const {
	auto text = m_storage.get_text();
	auto* chars = reinterpret_cast<const uint8_t*>(text.data());
	auto length = static_cast<uint32_t>(text.size());

	auto start = static_cast<int32_t>(range.location);

	while (start > 0) {
		auto prev = start;
		UChar32 c;
		U8_PREV(chars, 0, prev, c);

		if (is_hard_line_break(c)) {
			break;
		}

		start = prev;
	}

	// The paragraph holding the last selected character; an empty range uses the character after it
	auto end = range.empty() ? range.location : range.get_end() - 1;

	if (!range.empty()) {
		auto last = static_cast<int32_t>(end);
		U8_SET_CP_START(chars, 0, last);
		end = static_cast<uint32_t>(last);
	}

	while (end < length) {
		if (auto breakLength = get_line_break_length(text, end); breakLength > 0) {
			end += breakLength;
			break;
		}

		end = advance_code_points(text, end, 1);
	}

	return CharRange::from_bounds(static_cast<uint32_t>(start), end);
}

CharRange SelectionModel::get_line_range(CharRange range) {
	auto lastChar = range.empty() ? range.location : range.get_end() - 1;
	auto firstGlyph = m_layout.get_glyph_range({range.location, 0}).location;
	auto lastGlyph = m_layout.get_glyph_range({lastChar, 0}).location;

	auto* first = m_layout.get_fragment_for_glyph(firstGlyph);

	if (!first) {
		return range;
	}

	auto start = first->chars.location;
	auto* last = m_layout.get_fragment_for_glyph(lastGlyph);

	return CharRange::from_bounds(start, last ? last->chars.get_end() : range.get_end());
}
