#pragma once

#include <unicode/uversion.h>

#include <cstdint>

#include <string_view>

U_NAMESPACE_BEGIN

class BreakIterator;
class Locale;

U_NAMESPACE_END

namespace LineFlow {

/**
 * Chooses where a soft-wrapped line ends.
 */
class LineBreakStrategy {
	public:
		virtual ~LineBreakStrategy() = default;

		/**
		 * Called before every layout pass. `text` stays valid until the next call.
		 */
		virtual void set_text(std::string_view text) = 0;

		/**
		 * Returns the character index the line starting at `lineStart` should end at, given that the character
		 * at `overflowIndex` is the first one that didn't fit. A result at or before `lineStart` means no
		 * acceptable break exists and the line is cut at the last cluster that fits.
		 */
		virtual uint32_t find_line_break(uint32_t lineStart, uint32_t overflowIndex) = 0;
};

/**
 * Breaks at the word boundaries reported by an ICU line break iterator. Whitespace past the overflow point
 * hangs in the margin during the search, and whitespace before the chosen break moves to the next line.
 */
class WordLineBreakStrategy final : public LineBreakStrategy {
	public:
		explicit WordLineBreakStrategy(const icu::Locale& locale);
		~WordLineBreakStrategy();

		WordLineBreakStrategy(WordLineBreakStrategy&&) noexcept;
		WordLineBreakStrategy& operator=(WordLineBreakStrategy&&) noexcept;

		WordLineBreakStrategy(const WordLineBreakStrategy&) = delete;
		void operator=(const WordLineBreakStrategy&) = delete;

		void set_text(std::string_view text) override;
		uint32_t find_line_break(uint32_t lineStart, uint32_t overflowIndex) override;
	private:
		icu::BreakIterator* m_iter{};
		std::string_view m_text;
};

}
