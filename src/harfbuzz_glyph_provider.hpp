#pragma once

#include "glyph_provider.hpp"
#include "layout_config.hpp"

#include <cstdint>

#include <string>
#include <string_view>
#include <unordered_map>
#include <vector>

struct FT_LibraryRec_;
struct FT_FaceRec_;
struct hb_buffer_t;
struct hb_font_t;

namespace LineFlow {

enum class GlyphProviderError : uint8_t {
	NONE,
	FILE_NOT_FOUND,
	INVALID_FONT,
};

constexpr const char* glyph_provider_error_to_string(GlyphProviderError error) {
	switch (error) {
		case GlyphProviderError::NONE:
			return "none";
		case GlyphProviderError::FILE_NOT_FOUND:
			return "file not found";
		case GlyphProviderError::INVALID_FONT:
			return "invalid font";
	}

	return "unknown";
}

/**
 * Shapes runs with HarfBuzz using fonts loaded through FreeType. `TextStyle::font` indexes the fonts in the
 * order they were added; a style naming a font that doesn't exist falls back to font 0.
 */
class HarfBuzzGlyphProvider final : public GlyphProvider {
	public:
		explicit HarfBuzzGlyphProvider(std::string_view locale = {});
		~HarfBuzzGlyphProvider() override;

		HarfBuzzGlyphProvider(const HarfBuzzGlyphProvider&) = delete;
		void operator=(const HarfBuzzGlyphProvider&) = delete;

		[[nodiscard]] GlyphProviderError add_font(const char* fileName, uint32_t faceIndex, FontID& outID);
		/**
		 * Adds every font of `config.fonts`, stopping at the first one that fails to load.
		 */
		[[nodiscard]] GlyphProviderError load_fonts(const LayoutConfig& config);

		uint32_t get_font_count() const;

		void generate_glyphs(const StyledRun& run, std::vector<ProvidedGlyph>& output) override;
		LineMetrics get_line_metrics(const TextStyle& style) override;
	private:
		struct SizedFont {
			FT_FaceRec_* ftFace;
			hb_font_t* hbFont;
		};

		struct FontFile {
			std::vector<char> fileData;
			uint32_t faceIndex;
			// Keyed by size in 26.6 fixed point
			std::unordered_map<int32_t, SizedFont> sizes;
		};

		FT_LibraryRec_* m_ftLibrary{};
		hb_buffer_t* m_buffer;
		std::string m_language;
		std::vector<FontFile> m_fonts;

		SizedFont* get_sized_font(const TextStyle& style);
};

}
