#pragma once

#include <algorithm>
#include <cstdint>

namespace LineFlow {

struct CharIndexTag {};
struct GlyphIndexTag {};

/**
 * Half-open index range [location, location + length). Instantiated separately for the character and glyph
 * index spaces so that the two can't be mixed up.
 */
template <typename Tag>
struct IndexRange {
	uint32_t location{};
	uint32_t length{};

	constexpr uint32_t get_end() const {
		return location + length;
	}

	constexpr bool empty() const {
		return length == 0;
	}

	constexpr bool contains(uint32_t index) const {
		return index >= location && index < get_end();
	}

	constexpr bool contains(const IndexRange& other) const {
		return other.location >= location && other.get_end() <= get_end();
	}

	constexpr bool intersects(const IndexRange& other) const {
		return location < other.get_end() && other.location < get_end();
	}

	constexpr IndexRange intersection(const IndexRange& other) const {
		auto start = std::max(location, other.location);
		auto end = std::min(get_end(), other.get_end());
		return end > start ? IndexRange{start, end - start} : IndexRange{start, 0};
	}

	constexpr IndexRange merged(const IndexRange& other) const {
		auto start = std::min(location, other.location);
		return {start, std::max(get_end(), other.get_end()) - start};
	}

	static constexpr IndexRange from_bounds(uint32_t start, uint32_t end) {
		return {start, end > start ? end - start : 0};
	}

	constexpr bool operator==(const IndexRange&) const = default;
};

using CharRange = IndexRange<CharIndexTag>;
using GlyphRange = IndexRange<GlyphIndexTag>;

}
