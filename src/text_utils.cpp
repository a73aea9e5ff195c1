#include "text_utils.hpp"

#include <unicode/locid.h>
#include <unicode/utf8.h>

#include <string>

using namespace LineFlow;

uint32_t LineFlow::get_line_break_length(std::string_view text, uint32_t index) {
	if (index >= text.size()) {
		return 0;
	}

	auto* chars = reinterpret_cast<const uint8_t*>(text.data());
	auto count = static_cast<int32_t>(text.size());
	auto i = static_cast<int32_t>(index);
	UChar32 c;
	U8_NEXT(chars, i, count, c);

	if (!is_hard_line_break(c)) {
		return 0;
	}

	if (c == CH_CR && i < count && chars[i] == CH_LF) {
		++i;
	}

	return static_cast<uint32_t>(i) - index;
}

bool LineFlow::ends_with_line_break(std::string_view text) {
	if (text.empty()) {
		return false;
	}

	auto* chars = reinterpret_cast<const uint8_t*>(text.data());
	auto i = static_cast<int32_t>(text.size());
	UChar32 c;
	U8_PREV(chars, 0, i, c);

	return is_hard_line_break(c);
}

uint32_t LineFlow::count_code_points(std::string_view text, CharRange range) {
	auto* chars = reinterpret_cast<const uint8_t*>(text.data());
	auto end = static_cast<int32_t>(std::min<size_t>(range.get_end(), text.size()));
	auto i = static_cast<int32_t>(range.location);
	uint32_t result = 0;

	while (i < end) {
		U8_FWD_1(chars, i, end);
		++result;
	}

	return result;
}

uint32_t LineFlow::advance_code_points(std::string_view text, uint32_t index, uint32_t count) {
	auto* chars = reinterpret_cast<const uint8_t*>(text.data());
	auto length = static_cast<int32_t>(text.size());
	auto i = static_cast<int32_t>(std::min<size_t>(index, text.size()));

	for (uint32_t n = 0; n < count && i < length; ++n) {
		U8_FWD_1(chars, i, length);
	}

	return static_cast<uint32_t>(i);
}

icu::Locale LineFlow::get_locale(std::string_view name) {
	if (name.empty()) {
		return icu::Locale::getDefault();
	}

	return icu::Locale(std::string(name).c_str());
}
