#include "text_container.hpp"

#include <algorithm>

using namespace LineFlow;

void TextContainer::set_size(Size size) {
	m_size = size;
}

void TextContainer::set_exclusion_rects(std::vector<Rect> rects) {
	m_exclusionRects = std::move(rects);
}

void TextContainer::set_line_fragment_padding(float padding) {
	m_lineFragmentPadding = padding;
}

LineSegment TextContainer::get_line_segment(float y, float height) const {
	Rect band{0.f, y, std::max(m_size.width, 0.f), std::max(height, 0.f)};

	// Sweep the exclusions overlapping the band from left to right, stopping at the first gap
	std::vector<Rect> blockers;

	for (auto& rect : m_exclusionRects) {
		if (rect.y < band.get_max_y() && band.y < rect.get_max_y() && !rect.is_empty()) {
			blockers.push_back(rect);
		}
	}

	std::sort(blockers.begin(), blockers.end(), [](auto& a, auto& b) {
		return a.x < b.x;
	});

	auto segmentStart = 0.f;

	for (auto& rect : blockers) {
		if (rect.x - segmentStart > 2.f * m_lineFragmentPadding) {
			break;
		}

		segmentStart = std::max(segmentStart, rect.get_max_x());
	}

	auto segmentEnd = band.width;

	for (auto& rect : blockers) {
		if (rect.x >= segmentStart) {
			segmentEnd = std::min(segmentEnd, rect.x);
			break;
		}
	}

	if (segmentEnd - segmentStart <= 2.f * m_lineFragmentPadding) {
		return {std::min(segmentStart, band.width), 0.f};
	}

	return {segmentStart + m_lineFragmentPadding, segmentEnd - segmentStart - 2.f * m_lineFragmentPadding};
}

bool TextContainer::fits_line(float y, float height) const {
	return y + height <= m_size.height;
}

Size TextContainer::get_size() const {
	return m_size;
}

const std::vector<Rect>& TextContainer::get_exclusion_rects() const {
	return m_exclusionRects;
}

float TextContainer::get_line_fragment_padding() const {
	return m_lineFragmentPadding;
}
