#include <catch2/catch_test_macros.hpp>
#include <catch2/generators/catch_generators.hpp>
#include <catch2/generators/catch_generators_range.hpp>

#include "layout_fixture.hpp"

#include <insertion_point_navigator.hpp>

#include <algorithm>
#include <random>
#include <string>
#include <vector>

using namespace LineFlow;

namespace {

constexpr char g_alphabet[] = {'a', 'b', ' ', '\n'};

class RandomEditor {
	public:
		explicit RandomEditor(uint32_t seed)
				: m_rng(seed) {}

		uint32_t next(uint32_t bound) {
			return bound == 0 ? 0 : static_cast<uint32_t>(m_rng() % bound);
		}

		std::string make_text(uint32_t maxLength) {
			std::string result;
			auto length = next(maxLength + 1);

			for (uint32_t i = 0; i < length; ++i) {
				result.push_back(g_alphabet[next(sizeof(g_alphabet))]);
			}

			return result;
		}

		CharRange make_edit_range(uint32_t textLength) {
			auto location = next(textLength + 1);
			auto length = next(std::min(4u, textLength - location) + 1);
			return {location, length};
		}
	private:
		std::mt19937 m_rng;
};

struct PropertyFixture {
	float width;
	bool ligature;
	LayoutFixture fixture;

	PropertyFixture(std::string_view text, float lineWidth, bool withLigature)
			: width(lineWidth)
			, ligature(withLigature)
			, fixture(text, {lineWidth, UNBOUNDED_EXTENT}) {
		if (withLigature) {
			fixture.provider.add_ligature("ab", 500, 14.f);
		}
	}
};

std::vector<LineFragment> copy_fragments(LayoutFixture& f) {
	auto fragments = f.layout.get_fragments(f.container);
	return {fragments.begin(), fragments.end()};
}

void require_partition(LayoutFixture& f) {
	auto fragments = copy_fragments(f);
	uint32_t nextGlyph = 0;
	uint32_t nextChar = 0;

	for (auto& fragment : fragments) {
		REQUIRE(fragment.glyphs.location == nextGlyph);
		REQUIRE(fragment.chars.location == nextChar);
		REQUIRE_FALSE(fragment.glyphs.empty());
		nextGlyph = fragment.glyphs.get_end();
		nextChar = fragment.chars.get_end();
	}

	REQUIRE(nextGlyph == f.layout.get_glyph_count());
	REQUIRE(nextChar == f.storage.get_length());
}

void require_same_fragment(const LineFragment& a, const LineFragment& b) {
	REQUIRE(a.glyphs == b.glyphs);
	REQUIRE(a.chars == b.chars);
	REQUIRE(a.rect == b.rect);
	REQUIRE(a.usedRect == b.usedRect);
	REQUIRE(a.baseline == b.baseline);
}

void require_matches_fresh(PropertyFixture& p) {
	auto& f = p.fixture;
	PropertyFixture fresh(f.storage.get_text(), p.width, p.ligature);
	auto& g = fresh.fixture;

	auto fragments = copy_fragments(f);
	auto expected = copy_fragments(g);

	REQUIRE(fragments.size() == expected.size());

	for (size_t i = 0; i < fragments.size(); ++i) {
		require_same_fragment(fragments[i], expected[i]);
	}

	REQUIRE(f.layout.get_glyph_count() == g.layout.get_glyph_count());

	for (uint32_t i = 0; i < f.layout.get_glyph_count(); ++i) {
		REQUIRE(f.layout.get_location_for_glyph(i) == g.layout.get_location_for_glyph(i));
	}

	auto* extra = f.layout.get_extra_line_fragment();
	auto* expectedExtra = g.layout.get_extra_line_fragment();

	REQUIRE((extra == nullptr) == (expectedExtra == nullptr));

	if (extra) {
		require_same_fragment(extra->fragment, expectedExtra->fragment);
	}
}

void require_char_ranges_round_trip(LayoutFixture& f) {
	auto length = f.storage.get_length();

	for (uint32_t start = 0; start < length; ++start) {
		for (uint32_t end = start + 1; end <= length; ++end) {
			CharRange range = CharRange::from_bounds(start, end);
			REQUIRE(f.layout.get_char_range(f.layout.get_glyph_range(range)).contains(range));
		}
	}
}

void require_symmetric_moves(LayoutFixture& f) {
	InsertionPointNavigator nav(f.layout, f.geometry);
	auto length = f.storage.get_length();
	auto& map = f.layout.get_character_glyph_map();

	for (uint32_t i = 1; i < length; ++i) {
		if (!map.is_cluster_boundary(i)) {
			continue;
		}

		auto left = nav.move(MoveDirection::LEFT, i, i, 0.f, f.container);

		REQUIRE(left < i);
		REQUIRE(nav.move(MoveDirection::RIGHT, left, left, 0.f, f.container) == i);
	}
}

// Start of the line holding `charIndex` when only hard breaks count
uint32_t get_paragraph_start(std::string_view text, uint32_t charIndex) {
	auto pos = text.substr(0, charIndex).rfind('\n');
	return pos == std::string_view::npos ? 0 : static_cast<uint32_t>(pos + 1);
}

}

TEST_CASE("Random edits lay out the same as the edited text from scratch", "[LayoutProperties]") {
	auto width = GENERATE(0.f, 20.f, 35.f, 45.f, 50.f, 1000.f);
	auto ligature = GENERATE(false, true);
	auto seed = GENERATE(range(1u, 21u));

	RandomEditor editor(seed);
	PropertyFixture p(editor.make_text(24), width, ligature);
	auto& f = p.fixture;

	for (int step = 0; step < 16; ++step) {
		std::string text(f.storage.get_text());
		auto editRange = editor.make_edit_range(static_cast<uint32_t>(text.size()));
		auto replacement = editor.make_text(4);
		auto query = editor.next(3);

		INFO("Seed " << seed << ", step " << step << ": \"" << text << "\" [" << editRange.location << ", "
				<< editRange.get_end() << ") -> \"" << replacement << '"');

		if (query == 0) {
			REQUIRE(f.storage.replace_characters(editRange, replacement));
		}
		else if (query == 1) {
			REQUIRE(f.storage.replace_characters(editRange, replacement));
			f.layout.ensure_layout_for_char_index(editor.next(f.storage.get_length() + 1));
		}
		else {
			f.layout.ensure_layout();
			auto before = copy_fragments(f);

			REQUIRE(f.storage.replace_characters(editRange, replacement));
			f.layout.ensure_layout();

			// Lines before the last hard break ahead of the edit stay where they were
			auto unchangedEnd = get_paragraph_start(text, editRange.location);
			auto after = copy_fragments(f);

			for (size_t i = 0; i < before.size() && before[i].chars.get_end() <= unchangedEnd; ++i) {
				REQUIRE(i < after.size());
				require_same_fragment(after[i], before[i]);
			}

			require_partition(f);
			require_matches_fresh(p);
		}
	}

	f.layout.ensure_layout();
	require_partition(f);
	require_matches_fresh(p);
	require_char_ranges_round_trip(f);
	require_symmetric_moves(f);
}
