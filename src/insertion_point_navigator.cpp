#include "insertion_point_navigator.hpp"

#include "binary_search.hpp"
#include "common.hpp"
#include "geometry_engine.hpp"
#include "layout_manager.hpp"
#include "log.hpp"
#include "text_utils.hpp"

#include <unicode/brkiter.h>
#include <unicode/uchar.h>
#include <unicode/utext.h>
#include <unicode/utf8.h>

#include <algorithm>
#include <vector>

using namespace LineFlow;

InsertionPointNavigator::InsertionPointNavigator(LayoutManager& layout, GeometryEngine& geometry)
		: m_layout(layout)
		, m_geometry(geometry) {
	UErrorCode err{U_ZERO_ERROR};
	m_iter = icu::BreakIterator::createCharacterInstance(get_locale(layout.get_config().locale), err);

	if (U_FAILURE(err)) {
		LINEFLOW_LOG_ERROR("Failed to create character break iterator: %s", u_errorName(err));
		delete m_iter;
		m_iter = nullptr;
	}
}

InsertionPointNavigator::~InsertionPointNavigator() {
	delete m_iter;
}

uint32_t InsertionPointNavigator::move(MoveDirection direction, uint32_t from, uint32_t original, float distance,
		ContainerID container) {
	if (!m_iter || container >= m_layout.get_container_count()) {
		return from;
	}

	auto containerChars = m_layout.get_char_range_for_container(container);

	if (from < containerChars.location || from > containerChars.get_end()) {
		return from;
	}

	sync_text();

	switch (direction) {
		case MoveDirection::LEFT:
			return move_horizontally(false, from, distance, container, containerChars);
		case MoveDirection::RIGHT:
			return move_horizontally(true, from, distance, container, containerChars);
		case MoveDirection::UP:
			return move_vertically(false, from, original, distance, container, containerChars);
		case MoveDirection::DOWN:
			return move_vertically(true, from, original, distance, container, containerChars);
	}

	LINEFLOW_UNREACHABLE();
}

uint32_t InsertionPointNavigator::move_word(MoveDirection direction, uint32_t from) {
	if (!m_iter || from > m_layout.get_text_storage().get_length()) {
		return from;
	}

	sync_text();

	switch (direction) {
		case MoveDirection::LEFT:
			return prev_word(from);
		case MoveDirection::RIGHT:
			return next_word(from);
		default:
			return from;
	}
}

// Protected

uint32_t InsertionPointNavigator::move_horizontally(bool forward, uint32_t from, float distance,
		ContainerID container, CharRange containerChars) {
	auto minimal = forward ? next_position(from, containerChars) : prev_position(from, containerChars);

	if (distance <= 0.f) {
		return minimal;
	}

	auto rect = m_geometry.get_insertion_rect(from, container);

	if (rect.is_null()) {
		return minimal;
	}

	auto x = forward ? rect.x + distance : rect.x - distance;
	auto target = m_geometry.get_char_index_for_point({x, rect.get_mid_y()}, container);

	// The line ends before the requested distance does
	if (forward ? target <= from : target >= from) {
		return minimal;
	}

	return target;
}

uint32_t InsertionPointNavigator::move_vertically(bool down, uint32_t from, uint32_t original, float distance,
		ContainerID container, CharRange containerChars) {
	auto fromRect = m_geometry.get_insertion_rect(from, container);

	if (fromRect.is_null()) {
		return from;
	}

	auto originalRect = m_geometry.get_insertion_rect(original, container);
	auto targetX = originalRect.is_null() ? fromRect.x : originalRect.x;

	std::vector<Rect> lines;

	for (auto& fragment : m_layout.get_fragments(container)) {
		lines.push_back(fragment.rect);
	}

	if (auto* extra = m_layout.get_extra_line_fragment(); extra && extra->container == container) {
		lines.push_back(extra->fragment.rect);
	}

	if (lines.empty()) {
		return from;
	}

	float targetY;

	if (distance <= 0.f) {
		auto line = binary_search<size_t>(0, lines.size(), [&](auto i) {
			return lines[i].get_max_y() <= fromRect.get_mid_y();
		});

		if (down) {
			if (line + 1 >= lines.size()) {
				return containerChars.get_end();
			}

			targetY = lines[line + 1].get_mid_y();
		}
		else {
			if (line == 0) {
				return containerChars.location;
			}

			targetY = lines[std::min(line, lines.size()) - 1].get_mid_y();
		}
	}
	else {
		targetY = down ? fromRect.get_mid_y() + distance : fromRect.get_mid_y() - distance;

		if (targetY < lines.front().y) {
			return containerChars.location;
		}

		if (targetY >= lines.back().get_max_y()) {
			return containerChars.get_end();
		}
	}

	auto result = m_geometry.get_char_index_for_point({targetX, targetY}, container);

	// The distance didn't leave the current line
	if (result == from && distance > 0.f) {
		return move_vertically(down, from, original, 0.f, container, containerChars);
	}

	return result;
}

uint32_t InsertionPointNavigator::prev_position(uint32_t from, CharRange containerChars) {
	if (from <= containerChars.location) {
		return from;
	}

	auto prevIndex = m_iter->preceding(static_cast<int32_t>(from));

	if (prevIndex == icu::BreakIterator::DONE) {
		return containerChars.location;
	}

	// Step to the start of the cluster holding the previous grapheme, so a ligature is crossed in one move
	auto target = m_layout.get_character_glyph_map().get_entry_for_char(static_cast<uint32_t>(prevIndex))
			.chars.location;
	return std::max(target, containerChars.location);
}

uint32_t InsertionPointNavigator::next_position(uint32_t from, CharRange containerChars) {
	if (from >= containerChars.get_end()) {
		return from;
	}

	auto nextIndex = m_iter->following(static_cast<int32_t>(from));

	if (nextIndex == icu::BreakIterator::DONE) {
		return containerChars.get_end();
	}

	auto target = m_layout.get_character_glyph_map().get_entry_for_char(static_cast<uint32_t>(nextIndex) - 1)
			.chars.get_end();
	return std::min(target, containerChars.get_end());
}

// Private

void InsertionPointNavigator::sync_text() {
	auto text = m_layout.get_text_storage().get_text();

	UErrorCode err{U_ZERO_ERROR};
	UText uText UTEXT_INITIALIZER;
	utext_openUTF8(&uText, text.data(), static_cast<int64_t>(text.size()), &err);
	m_iter->setText(&uText, err);
	utext_close(&uText);
}

uint32_t InsertionPointNavigator::next_word(uint32_t cursor) {
	auto text = m_layout.get_text_storage().get_text();
	auto* chars = reinterpret_cast<const uint8_t*>(text.data());
	auto count = static_cast<int32_t>(text.size());

	if (static_cast<int32_t>(cursor) >= count) {
		return cursor;
	}

	UChar32 c;
	U8_GET(chars, 0, static_cast<int32_t>(cursor), count, c);
	bool lastWhitespace = u_isWhitespace(c);

	for (;;) {
		auto nextIndex = m_iter->following(static_cast<int32_t>(cursor));

		if (nextIndex == icu::BreakIterator::DONE) {
			break;
		}

		cursor = static_cast<uint32_t>(nextIndex);

		if (nextIndex >= count) {
			break;
		}

		U8_GET(chars, 0, nextIndex, count, c);
		bool whitespace = u_isWhitespace(c);

		if ((!whitespace && lastWhitespace) || is_hard_line_break(c)) {
			break;
		}

		lastWhitespace = whitespace;
	}

	return cursor;
}

uint32_t InsertionPointNavigator::prev_word(uint32_t cursor) {
	auto text = m_layout.get_text_storage().get_text();
	auto* chars = reinterpret_cast<const uint8_t*>(text.data());
	auto count = static_cast<int32_t>(text.size());
	UChar32 c;
	bool lastWhitespace = true;

	for (;;) {
		auto nextIndex = m_iter->preceding(static_cast<int32_t>(cursor));

		if (nextIndex == icu::BreakIterator::DONE) {
			break;
		}

		U8_GET(chars, 0, nextIndex, count, c);
		bool whitespace = u_isWhitespace(c);

		if (whitespace && !lastWhitespace) {
			break;
		}

		if (is_hard_line_break(c)) {
			return static_cast<uint32_t>(nextIndex);
		}

		cursor = static_cast<uint32_t>(nextIndex);
		lastWhitespace = whitespace;
	}

	return cursor;
}
