#include <catch2/catch_test_macros.hpp>

#include <geometry_engine.hpp>
#include <harfbuzz_glyph_provider.hpp>
#include <layout_manager.hpp>
#include <text_storage.hpp>

#include <cstdio>

#include <filesystem>
#include <string_view>
#include <vector>

using namespace LineFlow;

static constexpr const char* g_sansPath = "/usr/share/fonts/truetype/dejavu/DejaVuSans.ttf";
static constexpr const char* g_monoPath = "/usr/share/fonts/truetype/dejavu/DejaVuSansMono.ttf";

static std::vector<ProvidedGlyph> shape(HarfBuzzGlyphProvider& provider, std::string_view text, CharRange range,
		const TextStyle& style = {}) {
	std::vector<ProvidedGlyph> glyphs;
	provider.generate_glyphs({text, range, style}, glyphs);
	return glyphs;
}

TEST_CASE("Loading fonts", "[HarfBuzzGlyphProvider]") {
	HarfBuzzGlyphProvider provider;
	FontID id = 99;

	SECTION("Missing files") {
		REQUIRE(provider.add_font("does/not/exist.ttf", 0, id) == GlyphProviderError::FILE_NOT_FOUND);
		REQUIRE(provider.get_font_count() == 0);
	}

	SECTION("Files that aren't fonts") {
		auto path = (std::filesystem::temp_directory_path() / "lineflow_not_a_font.ttf").string();
		auto* file = std::fopen(path.c_str(), "wb");
		REQUIRE(file);
		std::fputs("not a font", file);
		std::fclose(file);

		auto res = provider.add_font(path.c_str(), 0, id);
		std::filesystem::remove(path);

		REQUIRE(res == GlyphProviderError::INVALID_FONT);
		REQUIRE(provider.get_font_count() == 0);
	}

	SECTION("Fonts listed in a config") {
		if (!std::filesystem::exists(g_sansPath) || !std::filesystem::exists(g_monoPath)) {
			SKIP("System fonts not installed");
		}

		LayoutConfig config{};
		config.fonts = {{"Sans", g_sansPath, 0}, {"Mono", g_monoPath, 0}};

		REQUIRE(provider.load_fonts(config) == GlyphProviderError::NONE);
		REQUIRE(provider.get_font_count() == 2);

		config.fonts.push_back({"Missing", "does/not/exist.ttf", 0});
		REQUIRE(provider.load_fonts(config) == GlyphProviderError::FILE_NOT_FOUND);
	}

	SECTION("Without fonts, line metrics fall back to the style size") {
		auto metrics = provider.get_line_metrics(TextStyle{.size = 20.f});
		REQUIRE(metrics.ascent == 20.f);
		REQUIRE(metrics.descent == 0.f);
	}
}

TEST_CASE("Shaping with a system font", "[HarfBuzzGlyphProvider]") {
	if (!std::filesystem::exists(g_sansPath) || !std::filesystem::exists(g_monoPath)) {
		SKIP("System fonts not installed");
	}

	HarfBuzzGlyphProvider provider("en_US");
	FontID sans;
	FontID mono;

	REQUIRE(provider.add_font(g_sansPath, 0, sans) == GlyphProviderError::NONE);
	REQUIRE(provider.add_font(g_monoPath, 0, mono) == GlyphProviderError::NONE);
	REQUIRE(sans == 0);
	REQUIRE(mono == 1);

	SECTION("One glyph per letter with clusters in text coordinates") {
		auto glyphs = shape(provider, "hello world", {6, 5});

		REQUIRE(glyphs.size() == 5);

		for (uint32_t i = 0; i < glyphs.size(); ++i) {
			REQUIRE(glyphs[i].cluster == 6 + i);
			REQUIRE(glyphs[i].glyphID != 0);
			REQUIRE(glyphs[i].advance > 0.f);
			REQUIRE(glyphs[i].ascent > 0.f);
			REQUIRE(glyphs[i].descent > 0.f);
		}
	}

	SECTION("Sizes scale advances") {
		auto small = shape(provider, "m", {0, 1}, TextStyle{.font = sans, .size = 10.f});
		auto large = shape(provider, "m", {0, 1}, TextStyle{.font = sans, .size = 40.f});

		REQUIRE(small.size() == 1);
		REQUIRE(large.size() == 1);
		REQUIRE(large[0].advance > 3.5f * small[0].advance);
	}

	SECTION("Monospaced fonts") {
		auto glyphs = shape(provider, "il mW", {0, 5}, TextStyle{.font = mono});

		REQUIRE(glyphs.size() == 5);

		for (auto& glyph : glyphs) {
			REQUIRE(glyph.advance == glyphs[0].advance);
		}
	}

	SECTION("Unknown fonts fall back to the first font") {
		auto fallback = shape(provider, "abc", {0, 3}, TextStyle{.font = 7});
		auto first = shape(provider, "abc", {0, 3}, TextStyle{.font = sans});

		REQUIRE(fallback.size() == first.size());

		for (size_t i = 0; i < first.size(); ++i) {
			REQUIRE(fallback[i].glyphID == first[i].glyphID);
			REQUIRE(fallback[i].advance == first[i].advance);
		}
	}

	SECTION("Line metrics") {
		auto metrics = provider.get_line_metrics(TextStyle{.font = sans, .size = 32.f});

		REQUIRE(metrics.ascent > 0.f);
		REQUIRE(metrics.descent > 0.f);
		REQUIRE(metrics.leading >= 0.f);
		REQUIRE(metrics.get_line_height() > 32.f);
	}

	SECTION("Laying out text") {
		TextStorage storage;
		LayoutManager layout(storage, provider);
		auto container = layout.add_container({UNBOUNDED_EXTENT, UNBOUNDED_EXTENT});
		GeometryEngine geometry(layout);

		storage.set_text("hello\nworld");

		auto fragments = layout.get_fragments(container);

		REQUIRE(fragments.size() == 2);
		REQUIRE(fragments[0].chars == CharRange{0, 6});
		REQUIRE(fragments[1].chars == CharRange{6, 5});
		REQUIRE(fragments[1].rect.y == fragments[0].rect.get_max_y());
		REQUIRE(layout.get_glyph_count() == 11);
		REQUIRE(geometry.get_insertion_rect(11, container).x == fragments[1].usedRect.get_max_x());
	}
}
