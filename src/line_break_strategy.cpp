#include "line_break_strategy.hpp"

#include "log.hpp"
#include "text_utils.hpp"

#include <unicode/brkiter.h>
#include <unicode/uchar.h>
#include <unicode/utext.h>
#include <unicode/utf8.h>

#include <utility>

using namespace LineFlow;

WordLineBreakStrategy::WordLineBreakStrategy(const icu::Locale& locale) {
	UErrorCode err{U_ZERO_ERROR};
	m_iter = icu::BreakIterator::createLineInstance(locale, err);

	if (U_FAILURE(err)) {
		LINEFLOW_LOG_ERROR("Failed to create line break iterator: %s", u_errorName(err));
		delete m_iter;
		m_iter = nullptr;
	}
}

WordLineBreakStrategy::~WordLineBreakStrategy() {
	delete m_iter;
}

WordLineBreakStrategy::WordLineBreakStrategy(WordLineBreakStrategy&& other) noexcept {
	*this = std::move(other);
}

WordLineBreakStrategy& WordLineBreakStrategy::operator=(WordLineBreakStrategy&& other) noexcept {
	std::swap(m_iter, other.m_iter);
	std::swap(m_text, other.m_text);
	return *this;
}

void WordLineBreakStrategy::set_text(std::string_view text) {
	m_text = text;

	if (!m_iter) {
		return;
	}

	UErrorCode err{U_ZERO_ERROR};
	UText uText UTEXT_INITIALIZER;
	utext_openUTF8(&uText, text.data(), static_cast<int64_t>(text.size()), &err);
	m_iter->setText(&uText, err);
	utext_close(&uText);
}

uint32_t WordLineBreakStrategy::find_line_break(uint32_t lineStart, uint32_t overflowIndex) {
	if (!m_iter) {
		return lineStart;
	}

	auto* chars = reinterpret_cast<const uint8_t*>(m_text.data());
	auto count = static_cast<int32_t>(m_text.size());
	auto charIndex = static_cast<int32_t>(overflowIndex);

	// Skip over whitespace because it can hang in the margin, but never past a hard line break
	UChar32 chr;
	while (charIndex < count) {
		U8_GET(chars, 0, charIndex, count, chr);

		if (!u_isWhitespace(chr) || is_hard_line_break(chr)) {
			break;
		}

		U8_FWD_1(chars, charIndex, count);
	}

	// Whitespace running into a hard line break hangs, and the line ends after the break
	if (charIndex < count && is_hard_line_break(chr)) {
		return static_cast<uint32_t>(charIndex) + get_line_break_length(m_text, static_cast<uint32_t>(charIndex));
	}

	// Return the break location that's at or before the character we stopped on. Note: if we're on a break, the
	// `U8_FWD_1` will cause `preceding` to back up to it.
	U8_FWD_1(chars, charIndex, count);
	auto breakIndex = m_iter->preceding(charIndex);

	if (breakIndex == icu::BreakIterator::DONE || breakIndex <= static_cast<int32_t>(lineStart)) {
		return lineStart;
	}

	// Whitespace before the break starts the next line
	auto result = breakIndex;

	while (result > static_cast<int32_t>(lineStart)) {
		auto prev = result;
		U8_PREV(chars, 0, prev, chr);

		if (!u_isWhitespace(chr) || is_hard_line_break(chr)) {
			break;
		}

		result = prev;
	}

	return static_cast<uint32_t>(result > static_cast<int32_t>(lineStart) ? result : breakIndex);
}
