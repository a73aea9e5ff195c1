#pragma once

#include "range.hpp"
#include "text_style.hpp"
#include "value_runs.hpp"

#include <cstdint>

#include <functional>
#include <string>
#include <string_view>
#include <vector>

namespace LineFlow {

/**
 * Styled UTF-8 text. Character indices are code unit offsets.
 *
 * Every mutation is reported to observers as `(editedRange, changeInLength)`, where `editedRange` is in
 * post-edit coordinates: the range of the new characters for a replacement, or the restyled range (with a
 * `changeInLength` of 0) for a style change.
 */
class TextStorage {
	public:
		using EditObserver = std::function<void(CharRange editedRange, int32_t changeInLength)>;
		using ObserverID = uint32_t;

		explicit TextStorage(const TextStyle& defaultStyle = {});

		TextStorage(TextStorage&&) noexcept = default;
		TextStorage& operator=(TextStorage&&) noexcept = default;

		TextStorage(const TextStorage&) = delete;
		void operator=(const TextStorage&) = delete;

		/**
		 * Replaces the characters in `range` with `replacement`. The inserted characters take the style of the
		 * character preceding `range` (or following it, at the start of the text).
		 *
		 * Returns false without modifying anything if `range` extends past the end of the text or either of its
		 * bounds splits a UTF-8 sequence.
		 */
		[[nodiscard]] bool replace_characters(CharRange range, std::string_view replacement);
		[[nodiscard]] bool replace_characters(CharRange range, std::string_view replacement,
				const TextStyle& style);
		[[nodiscard]] bool set_style(CharRange range, const TextStyle& style);

		void set_text(std::string_view text);

		std::string_view get_text() const;
		uint32_t get_length() const;

		const TextStyle& get_style_at(uint32_t charIndex) const;
		const ValueRuns<TextStyle>& get_style_runs() const;

		bool is_code_point_boundary(uint32_t charIndex) const;

		ObserverID add_observer(EditObserver observer);
		void remove_observer(ObserverID id);
	private:
		struct ObserverEntry {
			ObserverID id;
			EditObserver callback;
		};

		std::string m_text;
		ValueRuns<TextStyle> m_styles;
		std::vector<ObserverEntry> m_observers;
		ObserverID m_nextObserverID{1};

		bool is_valid_edit_range(CharRange range) const;
		void notify(CharRange editedRange, int32_t changeInLength);
};

}
