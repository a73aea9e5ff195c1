#pragma once

#include <cstddef>
#include <type_traits>

namespace LineFlow {

/**
 * Returns the first index in [first, first + count) for which `cond` is false, assuming `cond` is true for a
 * prefix of the range and false afterwards. Returns `first + count` if `cond` holds for the whole range.
 */
template <typename Index, typename Condition>
constexpr Index binary_search(Index first, std::type_identity_t<Index> count, Condition&& cond) {
	while (count > 0) {
		auto step = count / 2;
		auto i = first + step;

		if (cond(i)) {
			first = i + 1;
			count -= step + 1;
		}
		else {
			count = step;
		}
	}

	return first;
}

/**
 * Returns the last index in [first, first + count) for which `cond` holds, or `first` if it holds for none.
 * Used for "containing entry" lookups over sorted start offsets.
 */
template <typename Index, typename Condition>
constexpr Index binary_search_last(Index first, std::type_identity_t<Index> count, Condition&& cond) {
	auto end = binary_search<Index>(first, count, cond);
	return end == first ? first : end - 1;
}

}
