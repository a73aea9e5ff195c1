#include "layout_manager.hpp"

#include "binary_search.hpp"
#include "log.hpp"
#include "text_utils.hpp"

#include <unicode/locid.h>
#include <unicode/uchar.h>
#include <unicode/utf8.h>

#include <algorithm>
#include <string_view>

using namespace LineFlow;

static uint32_t find_first_word_end(std::string_view text, uint32_t start, uint32_t limit);

LayoutManager::LayoutManager(TextStorage& storage, GlyphProvider& provider, LayoutConfig config)
		: m_storage(storage)
		, m_provider(provider)
		, m_config(std::move(config))
		, m_typesetter(provider)
		, m_lineBreakStrategy(std::make_unique<WordLineBreakStrategy>(get_locale(m_config.locale))) {
	m_storageObserver = m_storage.add_observer([this](CharRange editedRange, int32_t changeInLength) {
		handle_text_edit(editedRange, changeInLength);
	});

	if (auto length = m_storage.get_length(); length > 0) {
		handle_text_edit({0, length}, static_cast<int32_t>(length));
	}
}

LayoutManager::~LayoutManager() {
	m_storage.remove_observer(m_storageObserver);
}

ContainerID LayoutManager::add_container(Size size) {
	auto id = static_cast<ContainerID>(m_containers.size());
	m_containers.emplace_back();
	m_containers.back().container.set_size(size);
	m_containers.back().container.set_line_fragment_padding(m_config.lineFragmentPadding);

	// Glyphs that found no room before may fit now
	m_layoutComplete = false;
	m_extraFragment.reset();

	return id;
}

void LayoutManager::set_container_size(ContainerID id, Size size) {
	if (id >= m_containers.size()) {
		return;
	}

	m_containers[id].container.set_size(size);
	invalidate_containers_from(id);
}

void LayoutManager::set_container_exclusion_rects(ContainerID id, std::vector<Rect> rects) {
	if (id >= m_containers.size()) {
		return;
	}

	m_containers[id].container.set_exclusion_rects(std::move(rects));
	invalidate_containers_from(id);
}

const TextContainer* LayoutManager::get_container(ContainerID id) const {
	return id < m_containers.size() ? &m_containers[id].container : nullptr;
}

uint32_t LayoutManager::get_container_count() const {
	return static_cast<uint32_t>(m_containers.size());
}

void LayoutManager::set_line_break_strategy(std::unique_ptr<LineBreakStrategy> strategy) {
	if (!strategy) {
		return;
	}

	m_lineBreakStrategy = std::move(strategy);
	invalidate_containers_from(0);
}

GlyphRange LayoutManager::typeset(CharRange range, ContainerID container) {
	if (container >= m_containers.size()) {
		return {};
	}

	ensure_layout_for_char_range(range);

	auto glyphs = m_map.get_glyph_range(range);
	auto containerGlyphs = m_containers[container].fragments.get_glyph_range();

	if (!glyphs.intersects(containerGlyphs)) {
		return {};
	}

	return glyphs.intersection(containerGlyphs);
}

void LayoutManager::ensure_glyphs() {
	if (m_lastError != LayoutError::NONE) {
		return;
	}

	while (m_tracker.has_dirty_ranges()) {
		auto dirtyRange = m_tracker.get_first_dirty_range();
		CharRange window{};

		if (auto err = m_typesetter.generate_glyphs(m_storage, dirtyRange, m_map, m_glyphs, window);
				err != LayoutError::NONE) {
			report_error(err);
			return;
		}

		m_tracker.mark_clean(window);
		invalidate_layout(window, 0);
	}
}

void LayoutManager::ensure_layout_for_char_index(uint32_t charIndex) {
	prepare_layout();

	while (!m_layoutComplete && m_cursor.charIndex <= charIndex && lay_out_next_line()) {}
}

void LayoutManager::ensure_layout_for_char_range(CharRange range) {
	ensure_layout_for_char_index(range.empty() ? range.location : range.get_end() - 1);
}

void LayoutManager::ensure_layout_for_glyph_range(GlyphRange range) {
	ensure_glyphs();

	if (range.location >= m_map.get_glyph_count()) {
		ensure_layout_for_char_index(m_map.get_char_count());
	}
	else {
		ensure_layout_for_char_range(m_map.get_char_range(range));
	}
}

void LayoutManager::ensure_layout_for_container(ContainerID id) {
	prepare_layout();

	while (!m_layoutComplete && m_cursor.container <= id && lay_out_next_line()) {}
}

void LayoutManager::ensure_layout() {
	prepare_layout();

	while (!m_layoutComplete && lay_out_next_line()) {}
}

GlyphRange LayoutManager::get_glyph_range(CharRange range) {
	ensure_glyphs();
	return m_map.get_glyph_range(range);
}

CharRange LayoutManager::get_char_range(GlyphRange range) {
	ensure_glyphs();
	return m_map.get_char_range(range);
}

uint32_t LayoutManager::get_glyph_count() {
	ensure_glyphs();
	return m_map.get_glyph_count();
}

std::span<const LineFragment> LayoutManager::get_fragments(ContainerID id) {
	if (id >= m_containers.size()) {
		return {};
	}

	ensure_layout_for_container(id);
	return m_containers[id].fragments.get_fragments();
}

std::span<const LineFragment> LayoutManager::get_fragments_intersecting(const Rect& rect, ContainerID id) {
	if (id >= m_containers.size()) {
		return {};
	}

	ensure_layout_for_container(id);
	return m_containers[id].fragments.get_fragments_intersecting(rect);
}

std::span<const LineFragment> LayoutManager::get_fragments_without_layout(ContainerID id) const {
	if (id >= m_containers.size()) {
		return {};
	}

	return m_containers[id].fragments.get_fragments();
}

const LineFragment* LayoutManager::get_fragment_for_glyph(uint32_t glyphIndex, ContainerID* outContainer) {
	ensure_layout_for_glyph_range({glyphIndex, 1});

	for (ContainerID id = 0; id < m_containers.size(); ++id) {
		auto& store = m_containers[id].fragments;

		if (auto index = store.find_fragment_for_glyph(glyphIndex); index < store.get_valid_count()) {
			if (outContainer) {
				*outContainer = id;
			}

			return &store.get_fragment(index);
		}
	}

	return nullptr;
}

const ExtraLineFragment* LayoutManager::get_extra_line_fragment() {
	ensure_layout();
	return m_extraFragment ? &*m_extraFragment : nullptr;
}

GlyphRange LayoutManager::get_glyph_range_for_container(ContainerID id) {
	if (id >= m_containers.size()) {
		return {};
	}

	ensure_layout_for_container(id);
	return m_containers[id].fragments.get_glyph_range();
}

CharRange LayoutManager::get_char_range_for_container(ContainerID id) {
	if (id >= m_containers.size()) {
		return {};
	}

	ensure_layout_for_container(id);

	auto& store = m_containers[id].fragments;

	if (m_extraFragment && m_extraFragment->container == id) {
		auto extraChars = m_extraFragment->fragment.chars;
		return store.empty() ? extraChars : store.get_char_range().merged(extraChars);
	}

	return store.get_char_range();
}

ContainerID LayoutManager::get_container_for_char(uint32_t charIndex) {
	ensure_layout_for_char_index(charIndex);

	if (charIndex > m_map.get_char_count()) {
		return INVALID_CONTAINER;
	}

	if (charIndex == m_map.get_char_count()) {
		if (m_extraFragment) {
			return m_extraFragment->container;
		}

		if (m_map.get_glyph_count() == 0) {
			return INVALID_CONTAINER;
		}

		charIndex = m_map.get_char_count() - 1;
	}

	auto glyphIndex = m_map.get_glyph_index_for_char(charIndex);

	for (ContainerID id = 0; id < m_containers.size(); ++id) {
		if (m_containers[id].fragments.get_glyph_range().contains(glyphIndex)) {
			return id;
		}
	}

	return INVALID_CONTAINER;
}

Point LayoutManager::get_location_for_glyph(uint32_t glyphIndex) {
	if (auto* fragment = get_fragment_for_glyph(glyphIndex)) {
		return {m_glyphs.get_location(glyphIndex), fragment->baseline};
	}

	return {};
}

Rect LayoutManager::get_used_rect(ContainerID id) {
	if (id >= m_containers.size()) {
		return {};
	}

	ensure_layout_for_container(id);

	auto result = m_containers[id].fragments.get_used_rect();

	if (m_extraFragment && m_extraFragment->container == id) {
		result = result.united(m_extraFragment->fragment.usedRect);
	}

	return result;
}

LineMetrics LayoutManager::get_default_line_metrics() {
	return m_provider.get_line_metrics(m_config.defaultStyle);
}

const CharacterGlyphMap& LayoutManager::get_character_glyph_map() const {
	return m_map;
}

const GlyphStore& LayoutManager::get_glyph_store() const {
	return m_glyphs;
}

const TextStorage& LayoutManager::get_text_storage() const {
	return m_storage;
}

const InvalidationTracker& LayoutManager::get_invalidation_tracker() const {
	return m_tracker;
}

const LayoutConfig& LayoutManager::get_config() const {
	return m_config;
}

void LayoutManager::add_display_observer(DisplayObserver& observer) {
	m_displayObservers.push_back(&observer);
}

void LayoutManager::remove_display_observer(DisplayObserver& observer) {
	std::erase(m_displayObservers, &observer);
}

void LayoutManager::invalidate_display(GlyphRange range) {
	if (range.empty()) {
		return;
	}

	auto observers = m_displayObservers;

	for (auto* observer : observers) {
		observer->on_display_invalidated(range);
	}
}

void LayoutManager::invalidate_display(CharRange range) {
	auto observers = m_displayObservers;

	for (auto* observer : observers) {
		observer->on_display_invalidated(range);
	}
}

void LayoutManager::set_error_handler(ErrorHandler handler) {
	m_errorHandler = std::move(handler);
}

LayoutError LayoutManager::get_last_error() const {
	return m_lastError;
}

void LayoutManager::clear_error() {
	m_lastError = LayoutError::NONE;
}

// Private

void LayoutManager::handle_text_edit(CharRange editedRange, int32_t changeInLength) {
	m_lastError = LayoutError::NONE;

	auto oldRange = CharRange{editedRange.location,
			static_cast<uint32_t>(static_cast<int64_t>(editedRange.length) - changeInLength)};

	invalidate_layout(oldRange, changeInLength);

	// The edited entries become a single entry without glyphs until the next query regenerates them
	auto enclosing = m_map.get_enclosing_entries(oldRange);
	auto newLength = static_cast<uint32_t>(static_cast<int64_t>(enclosing.length) + changeInLength);
	GlyphRange oldGlyphs{};

	if (auto err = m_map.replace(enclosing, newLength, nullptr, 0, oldGlyphs); err != LayoutError::NONE) {
		report_error(err);
		return;
	}

	m_glyphs.erase(oldGlyphs);
	m_tracker.apply_edit(oldRange, changeInLength);
	CharRange dirtyRange{enclosing.location, newLength};

	// A deletion can still change how the characters on either side of it shape
	if (dirtyRange.empty() && m_map.get_char_count() > 0) {
		auto before = dirtyRange.location > 0 ? dirtyRange.location - 1 : 0;
		auto after = std::min(dirtyRange.location + 1, m_map.get_char_count());
		dirtyRange = m_map.get_enclosing_entries(CharRange::from_bounds(before, after));
	}

	m_tracker.mark_dirty(dirtyRange);

	LINEFLOW_LOG_DEBUG("Edit at [%u, %u) changed length by %d", editedRange.location, editedRange.get_end(),
			changeInLength);

	invalidate_display(editedRange);
}

void LayoutManager::invalidate_layout(CharRange oldRange, int32_t changeInLength) {
	m_layoutComplete = false;
	m_extraFragment.reset();

	auto restart = find_layout_restart(oldRange.location);

	for (auto& entry : m_containers) {
		auto fragments = entry.fragments.get_fragments();
		auto keepCount = binary_search<size_t>(0, fragments.size(), [&](auto i) {
			return fragments[i].chars.location < restart;
		});

		entry.fragments.invalidate(keepCount, oldRange, changeInLength);
	}

	reset_layout_cursor();
}

void LayoutManager::invalidate_containers_from(ContainerID id) {
	for (auto i = static_cast<size_t>(id); i < m_containers.size(); ++i) {
		m_containers[i].fragments.clear();
	}

	m_layoutComplete = false;
	m_extraFragment.reset();
	reset_layout_cursor();
}

uint32_t LayoutManager::find_layout_restart(uint32_t charIndex) const {
	std::vector<CharRange> lines;

	for (auto& entry : m_containers) {
		for (auto& fragment : entry.fragments.get_fragments()) {
			lines.push_back(fragment.chars);
		}
	}

	if (lines.empty()) {
		return 0;
	}

	// Text before `charIndex` is the same before and after the edit
	auto text = m_storage.get_text();
	auto get_line_start = [&](size_t line) {
		return line < lines.size() ? lines[line].location : lines.back().get_end();
	};

	// The edit belongs to the last line starting at or before it, or to the unlaid line after the last one
	auto line = charIndex >= lines.back().get_end() ? lines.size()
			: binary_search<size_t>(0, lines.size(), [&](auto i) {
				return lines[i].location <= charIndex;
			}) - 1;

	// Choosing where a line breaks reads ahead to the end of the first word after it, so an edit that far
	// along can move the break. Lines ending in a hard break don't read past it.
	auto restart = line;

	while (restart > 0) {
		auto& previous = lines[restart - 1];

		if (ends_with_line_break(text.substr(0, previous.get_end()))
				|| find_first_word_end(text, get_line_start(restart), charIndex) < charIndex) {
			break;
		}

		--restart;
	}

	return get_line_start(restart);
}

void LayoutManager::reset_layout_cursor() {
	m_cursor = {};

	for (uint32_t id = 0; id < m_containers.size(); ++id) {
		auto fragments = m_containers[id].fragments.get_fragments();

		if (!fragments.empty()) {
			auto& last = fragments.back();
			m_cursor = {id, last.rect.get_max_y(), last.chars.get_end(), last.glyphs.get_end()};
		}
	}
}

void LayoutManager::prepare_layout() {
	ensure_glyphs();

	if (!m_layoutComplete && m_lastError == LayoutError::NONE) {
		m_lineBreakStrategy->set_text(m_storage.get_text());
		m_defaultMetrics = get_default_line_metrics();
	}
}

bool LayoutManager::lay_out_next_line() {
	if (m_layoutComplete || m_lastError != LayoutError::NONE) {
		return false;
	}

	auto glyphCount = m_map.get_glyph_count();

	while (m_cursor.container < m_containers.size()) {
		auto& entry = m_containers[m_cursor.container];

		if (m_cursor.glyphIndex >= glyphCount) {
			finish_layout();
			return true;
		}

		if (entry.fragments.try_adopt_stale(m_cursor.charIndex, m_cursor.glyphIndex, m_cursor.y, m_map)) {
			LINEFLOW_LOG_DEBUG("Reused %zu line fragments starting at char %u", entry.fragments.get_valid_count(),
					m_cursor.charIndex);
			reset_layout_cursor();
			return true;
		}

		auto& container = entry.container;
		auto proposedHeight = m_defaultMetrics.get_line_height();
		auto segment = container.get_line_segment(m_cursor.y, proposedHeight);
		auto fragment = m_typesetter.layout_line(m_map, m_glyphs, *m_lineBreakStrategy, m_cursor.glyphIndex,
				segment, m_cursor.y);

		// A taller line may run into exclusions the proposed height missed
		if (fragment.rect.height > proposedHeight) {
			auto tallSegment = container.get_line_segment(m_cursor.y, fragment.rect.height);

			if (tallSegment.x != segment.x || tallSegment.width != segment.width) {
				fragment = m_typesetter.layout_line(m_map, m_glyphs, *m_lineBreakStrategy, m_cursor.glyphIndex,
						tallSegment, m_cursor.y);
			}
		}

		// Every container takes at least one line
		if (!entry.fragments.empty() && !container.fits_line(m_cursor.y, fragment.rect.height)) {
			entry.fragments.discard_all_stale();
			++m_cursor.container;
			m_cursor.y = 0.f;
			continue;
		}

		entry.fragments.append(fragment);
		m_cursor.y = fragment.rect.get_max_y();
		m_cursor.charIndex = fragment.chars.get_end();
		m_cursor.glyphIndex = fragment.glyphs.get_end();

		invalidate_display(fragment.glyphs);
		return true;
	}

	LINEFLOW_LOG_DEBUG("Out of containers with %u glyphs unlaid", glyphCount - m_cursor.glyphIndex);
	finish_layout();
	return false;
}

void LayoutManager::finish_layout() {
	m_layoutComplete = true;

	for (auto& entry : m_containers) {
		entry.fragments.discard_all_stale();
	}

	auto text = m_storage.get_text();

	if (m_cursor.glyphIndex < m_map.get_glyph_count() || (!text.empty() && !ends_with_line_break(text))) {
		return;
	}

	auto height = m_defaultMetrics.get_line_height();
	auto y = m_cursor.y;

	for (auto id = m_cursor.container; id < m_containers.size(); ++id, y = 0.f) {
		auto& entry = m_containers[id];

		if (!entry.fragments.empty() && !entry.container.fits_line(y, height)) {
			continue;
		}

		auto segment = entry.container.get_line_segment(y, height);
		auto charCount = m_map.get_char_count();

		m_extraFragment = ExtraLineFragment{
			.container = id,
			.fragment = {
				.glyphs = {m_map.get_glyph_count(), 0},
				.chars = {charCount, 0},
				.rect = {segment.x, y, segment.width, height},
				.usedRect = {segment.x, y, 0.f, height},
				.baseline = m_defaultMetrics.ascent,
			},
		};

		return;
	}
}

void LayoutManager::report_error(LayoutError error) {
	m_lastError = error;
	LINEFLOW_LOG_ERROR("Layout halted: %s", layout_error_to_string(error));

	if (m_errorHandler) {
		m_errorHandler(error);
	}
}

// Static Functions

// End of the first run of non-whitespace characters at or after `start`, or `limit` if the scan reaches it first
static uint32_t find_first_word_end(std::string_view text, uint32_t start, uint32_t limit) {
	auto* chars = reinterpret_cast<const uint8_t*>(text.data());
	auto end = static_cast<int32_t>(std::min<size_t>(limit, text.size()));
	auto i = static_cast<int32_t>(start);
	bool inWord = false;

	while (i < end) {
		auto next = i;
		UChar32 c;
		U8_NEXT(chars, next, end, c);

		if (!u_isWhitespace(c) || is_hard_line_break(c)) {
			inWord = true;
		}
		else if (inWord) {
			return static_cast<uint32_t>(i);
		}

		i = next;
	}

	return limit;
}
