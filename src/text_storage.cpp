#include "text_storage.hpp"

#include <unicode/utf8.h>

#include <algorithm>

using namespace LineFlow;

TextStorage::TextStorage(const TextStyle& defaultStyle)
		: m_styles(defaultStyle, 0) {}

bool TextStorage::replace_characters(CharRange range, std::string_view replacement) {
	if (!is_valid_edit_range(range)) {
		return false;
	}

	auto styleIndex = range.location > 0 ? range.location - 1 : range.location;
	auto style = get_style_at(styleIndex);
	return replace_characters(range, replacement, style);
}

bool TextStorage::replace_characters(CharRange range, std::string_view replacement, const TextStyle& style) {
	if (!is_valid_edit_range(range)) {
		return false;
	}

	auto newLength = static_cast<uint32_t>(replacement.size());

	m_text.replace(range.location, range.length, replacement);
	m_styles.replace(range.location, range.length, newLength, style);

	notify({range.location, newLength}, static_cast<int32_t>(newLength) - static_cast<int32_t>(range.length));
	return true;
}

bool TextStorage::set_style(CharRange range, const TextStyle& style) {
	if (!is_valid_edit_range(range)) {
		return false;
	}

	if (range.empty()) {
		return true;
	}

	m_styles.set_value(range.location, range.get_end(), style);
	notify(range, 0);
	return true;
}

void TextStorage::set_text(std::string_view text) {
	auto oldLength = get_length();
	auto style = m_styles.get_run_value(0);

	m_text.assign(text);
	m_styles = ValueRuns<TextStyle>(style, get_length());

	notify({0, get_length()}, static_cast<int32_t>(get_length()) - static_cast<int32_t>(oldLength));
}

std::string_view TextStorage::get_text() const {
	return m_text;
}

uint32_t TextStorage::get_length() const {
	return static_cast<uint32_t>(m_text.size());
}

const TextStyle& TextStorage::get_style_at(uint32_t charIndex) const {
	return m_styles.get_value(charIndex);
}

const ValueRuns<TextStyle>& TextStorage::get_style_runs() const {
	return m_styles;
}

bool TextStorage::is_code_point_boundary(uint32_t charIndex) const {
	if (charIndex == 0 || charIndex == m_text.size()) {
		return true;
	}

	return charIndex < m_text.size() && !U8_IS_TRAIL(static_cast<uint8_t>(m_text[charIndex]));
}

TextStorage::ObserverID TextStorage::add_observer(EditObserver observer) {
	auto id = m_nextObserverID++;
	m_observers.push_back({id, std::move(observer)});
	return id;
}

void TextStorage::remove_observer(ObserverID id) {
	std::erase_if(m_observers, [&](auto& entry) {
		return entry.id == id;
	});
}

bool TextStorage::is_valid_edit_range(CharRange range) const {
	return range.get_end() <= get_length() && is_code_point_boundary(range.location)
			&& is_code_point_boundary(range.get_end());
}

void TextStorage::notify(CharRange editedRange, int32_t changeInLength) {
	// Observers may unregister themselves from inside the callback
	auto observers = m_observers;

	for (auto& entry : observers) {
		entry.callback(editedRange, changeInLength);
	}
}
