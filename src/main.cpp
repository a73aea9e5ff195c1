#include <cstdio>
#include <cstdlib>

#include "file_read_bytes.hpp"
#include "harfbuzz_glyph_provider.hpp"
#include "layout_config.hpp"
#include "layout_manager.hpp"
#include "text_storage.hpp"

using namespace LineFlow;

static bool parse_extent(const char* arg, float& result);
static void print_fragment(const LineFragment& fragment);

int main(int argc, char** argv) {
	if (argc < 4 || argc > 5) {
		std::fprintf(stderr, "usage: %s <config.json> <text-file> <width> [height]\n", argv[0]);
		return 2;
	}

	Size containerSize{0.f, UNBOUNDED_EXTENT};

	if (!parse_extent(argv[3], containerSize.width) || (argc == 5 && !parse_extent(argv[4], containerSize.height))) {
		std::fprintf(stderr, "Container width and height must be non-negative numbers\n");
		return 2;
	}

	LayoutConfig config;
	if (auto res = load_layout_config_from_json_file(argv[1], config); res != ConfigError::NONE) {
		std::fprintf(stderr, "Failed to load config %s: %s\n", argv[1], config_error_to_string(res));
		return 1;
	}

	HarfBuzzGlyphProvider provider(config.locale);
	if (auto res = provider.load_fonts(config); res != GlyphProviderError::NONE) {
		std::fprintf(stderr, "Failed to load fonts: %s\n", glyph_provider_error_to_string(res));
		return 1;
	}

	if (provider.get_font_count() == 0) {
		std::fprintf(stderr, "Config %s names no fonts\n", argv[1]);
		return 1;
	}

	std::vector<char> fileData;
	if (!file_read_bytes(argv[2], fileData)) {
		std::fprintf(stderr, "Failed to read %s\n", argv[2]);
		return 1;
	}

	TextStorage storage(config.defaultStyle);
	storage.set_text(std::string_view(fileData.data(), fileData.size()));

	LayoutManager layoutManager(storage, provider, config);
	layoutManager.set_error_handler([](LayoutError error) {
		std::fprintf(stderr, "Layout failed: %s\n", layout_error_to_string(error));
	});

	auto container = layoutManager.add_container(containerSize);
	layoutManager.ensure_layout();

	if (layoutManager.get_last_error() != LayoutError::NONE) {
		return 1;
	}

	auto fragments = layoutManager.get_fragments(container);

	std::printf("%zu line fragments, %u glyphs\n", fragments.size(), layoutManager.get_glyph_count());

	for (auto& fragment : fragments) {
		print_fragment(fragment);
	}

	if (auto* extra = layoutManager.get_extra_line_fragment()) {
		std::printf("extra ");
		print_fragment(extra->fragment);
	}

	auto usedRect = layoutManager.get_used_rect(container);
	std::printf("used rect (%.2f, %.2f, %.2f, %.2f)\n", usedRect.x, usedRect.y, usedRect.width, usedRect.height);
}

static bool parse_extent(const char* arg, float& result) {
	char* end;
	result = std::strtof(arg, &end);
	return end != arg && *end == '\0' && result >= 0.f;
}

static void print_fragment(const LineFragment& fragment) {
	std::printf("glyphs [%u, %u) chars [%u, %u) rect (%.2f, %.2f, %.2f, %.2f) baseline %.2f\n",
			fragment.glyphs.location, fragment.glyphs.get_end(), fragment.chars.location, fragment.chars.get_end(),
			fragment.rect.x, fragment.rect.y, fragment.rect.width, fragment.rect.height, fragment.baseline);
}
