#include "harfbuzz_glyph_provider.hpp"

#include "file_read_bytes.hpp"
#include "log.hpp"
#include "text_utils.hpp"

#include <ft2build.h>
#include FT_FREETYPE_H

#include <hb.h>
#include <hb-ft.h>

#include <cmath>

using namespace LineFlow;

static LineMetrics get_size_metrics(FT_Face face);

HarfBuzzGlyphProvider::HarfBuzzGlyphProvider(std::string_view locale)
		: m_buffer(hb_buffer_create())
		, m_language(get_locale(locale).getLanguage()) {
	if (FT_Init_FreeType(&m_ftLibrary) != 0) {
		LINEFLOW_LOG_ERROR("Failed to initialize FreeType");
		m_ftLibrary = nullptr;
	}

	hb_buffer_set_cluster_level(m_buffer, HB_BUFFER_CLUSTER_LEVEL_MONOTONE_CHARACTERS);
}

HarfBuzzGlyphProvider::~HarfBuzzGlyphProvider() {
	for (auto& font : m_fonts) {
		for (auto& [size, sizedFont] : font.sizes) {
			hb_font_destroy(sizedFont.hbFont);
			FT_Done_Face(sizedFont.ftFace);
		}
	}

	hb_buffer_destroy(m_buffer);

	if (m_ftLibrary) {
		FT_Done_FreeType(m_ftLibrary);
	}
}

GlyphProviderError HarfBuzzGlyphProvider::add_font(const char* fileName, uint32_t faceIndex, FontID& outID) {
	if (!m_ftLibrary) {
		return GlyphProviderError::INVALID_FONT;
	}

	FontFile font{.faceIndex = faceIndex};

	if (!file_read_bytes(fileName, font.fileData)) {
		LINEFLOW_LOG_WARN("Failed to read font file %s", fileName);
		return GlyphProviderError::FILE_NOT_FOUND;
	}

	// Sized faces are created on demand; this only checks that the face loads
	FT_Face ftFace;
	if (FT_New_Memory_Face(m_ftLibrary, reinterpret_cast<const FT_Byte*>(font.fileData.data()),
			static_cast<FT_Long>(font.fileData.size()), static_cast<FT_Long>(faceIndex), &ftFace) != 0) {
		LINEFLOW_LOG_WARN("Failed to load face %u of font %s", faceIndex, fileName);
		return GlyphProviderError::INVALID_FONT;
	}

	FT_Done_Face(ftFace);

	outID = static_cast<FontID>(m_fonts.size());
	m_fonts.emplace_back(std::move(font));

	return GlyphProviderError::NONE;
}

GlyphProviderError HarfBuzzGlyphProvider::load_fonts(const LayoutConfig& config) {
	for (auto& source : config.fonts) {
		FontID id;
		if (auto res = add_font(source.uri.c_str(), source.faceIndex, id); res != GlyphProviderError::NONE) {
			LINEFLOW_LOG_WARN("Failed to load font %s: %s", source.name.c_str(),
					glyph_provider_error_to_string(res));
			return res;
		}
	}

	return GlyphProviderError::NONE;
}

uint32_t HarfBuzzGlyphProvider::get_font_count() const {
	return static_cast<uint32_t>(m_fonts.size());
}

void HarfBuzzGlyphProvider::generate_glyphs(const StyledRun& run, std::vector<ProvidedGlyph>& output) {
	auto* font = get_sized_font(run.style);

	if (!font || run.range.empty()) {
		return;
	}

	auto textLength = static_cast<uint32_t>(run.text.size());
	auto metrics = get_size_metrics(font->ftFace);

	hb_buffer_clear_contents(m_buffer);
	hb_buffer_set_language(m_buffer, hb_language_from_string(m_language.c_str(), -1));
	hb_buffer_set_direction(m_buffer, HB_DIRECTION_LTR);
	hb_buffer_set_flags(m_buffer, (hb_buffer_flags_t)((run.range.location == 0 ? HB_BUFFER_FLAG_BOT : 0)
			| (run.range.get_end() == textLength ? HB_BUFFER_FLAG_EOT : 0)));
	// The whole text goes in as context, so clusters come out as indices into it
	hb_buffer_add_utf8(m_buffer, run.text.data(), static_cast<int>(textLength), run.range.location,
			static_cast<int>(run.range.length));
	hb_buffer_guess_segment_properties(m_buffer);

	hb_shape(font->hbFont, m_buffer, nullptr, 0);

	auto glyphCount = hb_buffer_get_length(m_buffer);
	auto* glyphPositions = hb_buffer_get_glyph_positions(m_buffer, nullptr);
	auto* glyphInfos = hb_buffer_get_glyph_infos(m_buffer, nullptr);

	for (unsigned i = 0; i < glyphCount; ++i) {
		output.push_back({
			.glyphID = glyphInfos[i].codepoint,
			.cluster = glyphInfos[i].cluster,
			.advance = scalbnf(static_cast<float>(glyphPositions[i].x_advance), -6),
			.ascent = metrics.ascent,
			.descent = metrics.descent,
		});
	}
}

LineMetrics HarfBuzzGlyphProvider::get_line_metrics(const TextStyle& style) {
	if (auto* font = get_sized_font(style)) {
		return get_size_metrics(font->ftFace);
	}

	return {style.size, 0.f, 0.f};
}

// Private

HarfBuzzGlyphProvider::SizedFont* HarfBuzzGlyphProvider::get_sized_font(const TextStyle& style) {
	if (m_fonts.empty()) {
		return nullptr;
	}

	auto& font = m_fonts[style.font < m_fonts.size() ? style.font : 0];
	auto fixedSize = static_cast<int32_t>(std::lround(style.size * 64.f));

	if (auto it = font.sizes.find(fixedSize); it != font.sizes.end()) {
		return &it->second;
	}

	FT_Face ftFace;
	if (FT_New_Memory_Face(m_ftLibrary, reinterpret_cast<const FT_Byte*>(font.fileData.data()),
			static_cast<FT_Long>(font.fileData.size()), static_cast<FT_Long>(font.faceIndex), &ftFace) != 0) {
		return nullptr;
	}

	FT_Size_RequestRec sr{
		.type = FT_SIZE_REQUEST_TYPE_REAL_DIM,
		.height = static_cast<FT_Long>(fixedSize),
	};
	FT_Request_Size(ftFace, &sr);

	hb_font_t* hbFont = hb_ft_font_create(ftFace, nullptr);

	if (!hbFont) {
		FT_Done_Face(ftFace);
		return nullptr;
	}

	hb_ft_font_set_load_flags(hbFont, FT_LOAD_DEFAULT);

	return &font.sizes.emplace(fixedSize, SizedFont{ftFace, hbFont}).first->second;
}

// Static Functions

static LineMetrics get_size_metrics(FT_Face face) {
	auto& metrics = face->size->metrics;
	auto ascent = static_cast<float>(metrics.ascender) / 64.f;
	auto descent = -static_cast<float>(metrics.descender) / 64.f;
	auto leading = static_cast<float>(metrics.height) / 64.f - ascent - descent;

	return {ascent, descent, leading > 0.f ? leading : 0.f};
}
