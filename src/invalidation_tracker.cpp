#include "invalidation_tracker.hpp"

#include "binary_search.hpp"

using namespace LineFlow;

void InvalidationTracker::mark_dirty(CharRange range) {
	if (range.empty()) {
		return;
	}

	// First range that ends at or after the new one starts; touching ranges merge
	auto first = binary_search<size_t>(0, m_dirtyRanges.size(), [&](auto i) {
		return m_dirtyRanges[i].get_end() < range.location;
	});
	auto last = first;

	while (last < m_dirtyRanges.size() && m_dirtyRanges[last].location <= range.get_end()) {
		range = range.merged(m_dirtyRanges[last]);
		++last;
	}

	m_dirtyRanges.erase(m_dirtyRanges.begin() + first, m_dirtyRanges.begin() + last);
	m_dirtyRanges.insert(m_dirtyRanges.begin() + first, range);
}

void InvalidationTracker::mark_clean(CharRange range) {
	std::vector<CharRange> result;
	result.reserve(m_dirtyRanges.size() + 1);

	for (auto& dirty : m_dirtyRanges) {
		if (!dirty.intersects(range)) {
			result.push_back(dirty);
			continue;
		}

		if (dirty.location < range.location) {
			result.push_back(CharRange::from_bounds(dirty.location, range.location));
		}

		if (dirty.get_end() > range.get_end()) {
			result.push_back(CharRange::from_bounds(range.get_end(), dirty.get_end()));
		}
	}

	m_dirtyRanges = std::move(result);
}

void InvalidationTracker::apply_edit(CharRange oldRange, int32_t changeInLength) {
	auto newEnd = static_cast<uint32_t>(oldRange.get_end() + changeInLength);
	std::vector<CharRange> result;
	result.reserve(m_dirtyRanges.size());

	for (auto dirty : m_dirtyRanges) {
		if (dirty.get_end() <= oldRange.location) {
			result.push_back(dirty);
		}
		else if (dirty.location >= oldRange.get_end()) {
			dirty.location = static_cast<uint32_t>(dirty.location + changeInLength);
			result.push_back(dirty);
		}
		else {
			auto start = std::min(dirty.location, oldRange.location);
			auto end = dirty.get_end() > oldRange.get_end()
					? static_cast<uint32_t>(dirty.get_end() + changeInLength)
					: newEnd;
			auto collapsed = CharRange::from_bounds(start, end);

			if (!collapsed.empty()) {
				result.push_back(collapsed);
			}
		}
	}

	m_dirtyRanges.clear();

	for (auto& range : result) {
		mark_dirty(range);
	}
}

void InvalidationTracker::clear() {
	m_dirtyRanges.clear();
}

bool InvalidationTracker::has_dirty_ranges() const {
	return !m_dirtyRanges.empty();
}

CharRange InvalidationTracker::get_first_dirty_range() const {
	return m_dirtyRanges.empty() ? CharRange{} : m_dirtyRanges.front();
}

bool InvalidationTracker::is_dirty(CharRange range) const {
	for (auto& dirty : m_dirtyRanges) {
		if (dirty.intersects(range) || (range.empty() && dirty.contains(range.location))) {
			return true;
		}
	}

	return false;
}

std::span<const CharRange> InvalidationTracker::get_dirty_ranges() const {
	return m_dirtyRanges;
}
