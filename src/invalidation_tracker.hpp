#pragma once

#include "range.hpp"

#include <cstdint>

#include <span>
#include <vector>

namespace LineFlow {

/**
 * Character ranges whose glyphs are out of date. Ranges are kept sorted and disjoint; touching ranges are
 * merged.
 */
class InvalidationTracker {
	public:
		void mark_dirty(CharRange range);
		void mark_clean(CharRange range);

		/**
		 * Moves the recorded ranges to account for `oldRange` (pre-edit coordinates) being replaced by
		 * `oldRange.length + changeInLength` characters. Ranges inside `oldRange` collapse onto the edit.
		 */
		void apply_edit(CharRange oldRange, int32_t changeInLength);

		void clear();

		bool has_dirty_ranges() const;
		CharRange get_first_dirty_range() const;
		bool is_dirty(CharRange range) const;

		std::span<const CharRange> get_dirty_ranges() const;
	private:
		std::vector<CharRange> m_dirtyRanges;
};

}
