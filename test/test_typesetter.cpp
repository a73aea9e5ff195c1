#include <catch2/catch_test_macros.hpp>

#include "layout_fixture.hpp"

#include <line_break_strategy.hpp>
#include <typesetter.hpp>

using namespace LineFlow;

TEST_CASE("Lines break after the last word that fits", "[Typesetter]") {
	// h=8 e=8 l=10 o=12 ' '=2 w=10 r=8 d=8
	LayoutFixture f("hello world", {50.f, UNBOUNDED_EXTENT});

	auto fragments = f.layout.get_fragments(f.container);

	REQUIRE(fragments.size() == 2);

	REQUIRE(fragments[0].chars == CharRange{0, 5});
	REQUIRE(fragments[0].glyphs == GlyphRange{0, 5});
	REQUIRE(fragments[0].rect.x == 0.f);
	REQUIRE(fragments[0].rect.y == 0.f);
	REQUIRE(fragments[0].rect.width == 50.f);
	REQUIRE(fragments[0].rect.height == 16.f);
	REQUIRE(fragments[0].usedRect.width == 48.f);
	REQUIRE(fragments[0].baseline == 12.f);

	// The space starts the second line
	REQUIRE(fragments[1].chars == CharRange{5, 6});
	REQUIRE(fragments[1].rect.y == 16.f);
	REQUIRE(fragments[1].usedRect.width == 50.f);

	REQUIRE(f.layout.get_used_rect(f.container).height == 32.f);
}

TEST_CASE("Glyph locations are relative to their line", "[Typesetter]") {
	LayoutFixture f("hello world", {50.f, UNBOUNDED_EXTENT});

	REQUIRE(f.layout.get_location_for_glyph(1).x == 8.f);
	REQUIRE(f.layout.get_location_for_glyph(1).y == 12.f);
	REQUIRE(f.layout.get_location_for_glyph(6).x == 2.f);
}

TEST_CASE("Words longer than the line break between clusters", "[Typesetter]") {
	LayoutFixture f("abcdefghij", {35.f, UNBOUNDED_EXTENT});

	auto fragments = f.layout.get_fragments(f.container);

	REQUIRE(fragments.size() == 4);
	REQUIRE(fragments[0].chars == CharRange{0, 3});
	REQUIRE(fragments[1].chars == CharRange{3, 3});
	REQUIRE(fragments[2].chars == CharRange{6, 3});
	REQUIRE(fragments[3].chars == CharRange{9, 1});
}

TEST_CASE("Zero width containers take one cluster per line", "[Typesetter]") {
	LayoutFixture f("abc", {0.f, UNBOUNDED_EXTENT});

	auto fragments = f.layout.get_fragments(f.container);

	REQUIRE(fragments.size() == 3);

	for (uint32_t i = 0; i < 3; ++i) {
		REQUIRE(fragments[i].glyphs == GlyphRange{i, 1});
		REQUIRE(fragments[i].rect.y == 16.f * static_cast<float>(i));
	}
}

TEST_CASE("Ligatures are never split across lines", "[Typesetter]") {
	LayoutFixture f("fix", {15.f, UNBOUNDED_EXTENT});
	f.provider.add_ligature("fi", 1000, 20.f);

	auto fragments = f.layout.get_fragments(f.container);

	REQUIRE(f.layout.get_glyph_count() == 2);
	REQUIRE(fragments.size() == 2);
	REQUIRE(fragments[0].chars == CharRange{0, 2});
	REQUIRE(fragments[0].glyphs == GlyphRange{0, 1});
	REQUIRE(fragments[1].chars == CharRange{2, 1});
}

TEST_CASE("Hard line breaks", "[Typesetter]") {
	SECTION("End a line") {
		LayoutFixture f("ab\ncd");

		auto fragments = f.layout.get_fragments(f.container);
		auto& glyphs = f.layout.get_glyph_store();

		REQUIRE(fragments.size() == 2);
		REQUIRE(fragments[0].chars == CharRange{0, 3});
		REQUIRE(fragments[1].chars == CharRange{3, 2});
		REQUIRE(glyphs.is_line_break(2));
		REQUIRE(glyphs.is_hidden(2));
		REQUIRE(glyphs.get_advance(2) == 0.f);
		REQUIRE(f.layout.get_extra_line_fragment() == nullptr);
	}

	SECTION("CRLF is one cluster") {
		LayoutFixture f("a\r\nb");

		auto fragments = f.layout.get_fragments(f.container);

		REQUIRE(f.layout.get_glyph_count() == 3);
		REQUIRE(f.layout.get_character_glyph_map().get_entry_for_glyph(1).chars == CharRange{1, 2});
		REQUIRE(fragments.size() == 2);
		REQUIRE(fragments[1].chars == CharRange{3, 1});
	}

	SECTION("Unicode separators") {
		LayoutFixture f("a\xE2\x80\xA8" "b\xE2\x80\xA9" "c");

		REQUIRE(f.layout.get_fragments(f.container).size() == 3);
	}

	SECTION("Empty lines") {
		LayoutFixture f("a\n\nb");

		auto fragments = f.layout.get_fragments(f.container);

		REQUIRE(fragments.size() == 3);
		REQUIRE(fragments[1].chars == CharRange{2, 1});
		REQUIRE(fragments[1].rect.height == 16.f);
		REQUIRE(fragments[1].usedRect.width == 0.f);
	}

	SECTION("Trailing breaks add an extra line fragment") {
		LayoutFixture f("ab\n");

		REQUIRE(f.layout.get_fragments(f.container).size() == 1);

		auto* extra = f.layout.get_extra_line_fragment();
		REQUIRE(extra != nullptr);
		REQUIRE(extra->container == f.container);
		REQUIRE(extra->fragment.chars == CharRange{3, 0});
		REQUIRE(extra->fragment.rect.y == 16.f);
		REQUIRE(extra->fragment.rect.height == 16.f);
	}

	SECTION("Whitespace before a break stays on the line") {
		LayoutFixture f("hello  \nworld", {50.f, UNBOUNDED_EXTENT});

		auto fragments = f.layout.get_fragments(f.container);

		REQUIRE(fragments.size() == 2);
		REQUIRE(fragments[0].chars == CharRange{0, 8});
	}
}

TEST_CASE("Empty text", "[Typesetter]") {
	LayoutFixture f("");

	REQUIRE(f.layout.get_fragments(f.container).empty());
	REQUIRE(f.layout.get_glyph_count() == 0);

	auto* extra = f.layout.get_extra_line_fragment();
	REQUIRE(extra != nullptr);
	REQUIRE(extra->fragment.rect.y == 0.f);
	REQUIRE(extra->fragment.rect.height == 16.f);
	REQUIRE(extra->fragment.baseline == 12.f);
}

TEST_CASE("Lines are as tall as their tallest glyph", "[Typesetter]") {
	LayoutFixture f("ab\ncd");
	REQUIRE(f.storage.set_style({1, 1}, TextStyle{.size = 32.f}));

	auto fragments = f.layout.get_fragments(f.container);

	REQUIRE(fragments.size() == 2);
	REQUIRE(fragments[0].rect.height == 32.f);
	REQUIRE(fragments[0].baseline == 24.f);
	REQUIRE(fragments[1].rect.y == 32.f);
	REQUIRE(fragments[1].rect.height == 16.f);
}

TEST_CASE("Characters without glyphs stay addressable", "[Typesetter]") {
	LayoutFixture f("a\xE2\x80\x8B" "b");
	f.provider.add_glyphless(0x200B);

	REQUIRE(f.layout.get_glyph_count() == 2);
	REQUIRE(f.layout.get_character_glyph_map().get_entry_for_char(1).chars == CharRange{0, 4});

	SECTION("A run without any glyphs gets a hidden placeholder") {
		REQUIRE(f.storage.replace_characters({0, 5}, "\xE2\x80\x8B"));

		REQUIRE(f.layout.get_glyph_count() == 1);
		REQUIRE(f.layout.get_glyph_store().is_hidden(0));
		REQUIRE(f.layout.get_fragments(f.container).size() == 1);
	}
}

TEST_CASE("Container geometry", "[Typesetter]") {
	SECTION("Exclusions narrow the lines they overlap") {
		LayoutFixture f("hello world", {100.f, UNBOUNDED_EXTENT});
		f.layout.set_container_exclusion_rects(f.container, {{0.f, 0.f, 30.f, 16.f}});

		auto fragments = f.layout.get_fragments(f.container);

		REQUIRE(fragments.size() == 2);
		REQUIRE(fragments[0].chars == CharRange{0, 5});
		REQUIRE(fragments[0].rect.x == 30.f);
		REQUIRE(fragments[0].rect.width == 70.f);
		REQUIRE(fragments[1].rect.x == 0.f);
		REQUIRE(fragments[1].rect.width == 100.f);
	}

	SECTION("Padding insets both sides") {
		LayoutConfig config{.lineFragmentPadding = 5.f};
		LayoutFixture f("hello", {100.f, UNBOUNDED_EXTENT}, config);

		auto fragments = f.layout.get_fragments(f.container);

		REQUIRE(fragments.size() == 1);
		REQUIRE(fragments[0].rect.x == 5.f);
		REQUIRE(fragments[0].rect.width == 90.f);
	}

	SECTION("Resizing the container lays the text out again") {
		LayoutFixture f("hello world", {50.f, UNBOUNDED_EXTENT});
		REQUIRE(f.layout.get_fragments(f.container).size() == 2);

		f.layout.set_container_size(f.container, {200.f, UNBOUNDED_EXTENT});

		REQUIRE(f.layout.get_fragments(f.container).size() == 1);
	}
}

TEST_CASE("Text flows through containers in order", "[Typesetter]") {
	LayoutFixture f("hello world", {50.f, 16.f});
	auto second = f.layout.add_container({50.f, 16.f});

	auto first = f.layout.get_fragments(f.container);
	auto next = f.layout.get_fragments(second);

	REQUIRE(first.size() == 1);
	REQUIRE(next.size() == 1);
	REQUIRE(next[0].rect.y == 0.f);
	REQUIRE(f.layout.get_glyph_range_for_container(second) == GlyphRange{5, 6});
	REQUIRE(f.layout.get_char_range_for_container(f.container) == CharRange{0, 5});
	REQUIRE(f.layout.get_container_for_char(7) == second);
	REQUIRE(f.layout.get_container_for_char(11) == second);
	REQUIRE(f.layout.get_container_for_char(12) == INVALID_CONTAINER);
	REQUIRE(f.layout.typeset({3, 5}, second) == GlyphRange{5, 3});
}

TEST_CASE("Containers take at least one line", "[Typesetter]") {
	LayoutFixture f("hello world", {50.f, 0.f});

	auto fragments = f.layout.get_fragments(f.container);

	REQUIRE(fragments.size() == 1);
	REQUIRE(fragments[0].chars == CharRange{0, 5});

	SECTION("Glyphs without room stay unlaid") {
		REQUIRE(f.layout.get_fragment_for_glyph(7) == nullptr);
		REQUIRE(f.geometry.get_rects_for_glyph_range({7, 1}, f.container).empty());
		REQUIRE(f.layout.get_container_for_char(7) == INVALID_CONTAINER);
	}

	SECTION("Adding a container makes room") {
		auto second = f.layout.add_container({50.f, UNBOUNDED_EXTENT});
		REQUIRE(f.layout.get_fragments(second).size() == 1);
		REQUIRE(f.layout.get_fragment_for_glyph(7) != nullptr);
	}
}

TEST_CASE("Line break strategies can be replaced", "[Typesetter]") {
	// Breaks anywhere, ignoring words
	class ClusterLineBreakStrategy final : public LineBreakStrategy {
		public:
			void set_text(std::string_view) override {}

			uint32_t find_line_break(uint32_t, uint32_t overflowIndex) override {
				return overflowIndex;
			}
	};

	LayoutFixture f("hello world", {50.f, UNBOUNDED_EXTENT});
	f.layout.set_line_break_strategy(std::make_unique<ClusterLineBreakStrategy>());

	auto fragments = f.layout.get_fragments(f.container);

	REQUIRE(fragments.size() == 2);
	REQUIRE(fragments[0].chars == CharRange{0, 6});
}

TEST_CASE("Regeneration windows cover whole words", "[Typesetter]") {
	LayoutFixture f("one two three");
	f.layout.ensure_layout();

	auto& map = f.layout.get_character_glyph_map();

	REQUIRE(Typesetter::get_regeneration_window(f.storage.get_text(), map, {5, 1}) == CharRange{4, 3});
	REQUIRE(Typesetter::get_regeneration_window(f.storage.get_text(), map, {3, 1}) == CharRange{0, 7});
	REQUIRE(Typesetter::get_regeneration_window(f.storage.get_text(), map, {9, 0}) == CharRange{8, 5});
}
