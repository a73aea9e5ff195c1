#pragma once

#include "text_style.hpp"

#include <cstdint>

#include <string>
#include <string_view>
#include <vector>

namespace LineFlow {

enum class ConfigError : uint8_t {
	NONE,
	FILE_NOT_FOUND,
	INVALID_JSON,
};

struct FontSource {
	std::string name;
	std::string uri;
	uint32_t faceIndex{};
};

struct LayoutConfig {
	// Inset applied on both sides of every line segment
	float lineFragmentPadding{};
	// ICU locale name for break iterators; empty selects the default locale
	std::string locale;
	TextStyle defaultStyle{};
	// Fonts in FontID order
	std::vector<FontSource> fonts;
};

/**
 * Reads a configuration of the form
 *
 * {
 *     "line_fragment_padding": 2.0,
 *     "locale": "en_US",
 *     "default_style": {"font": 0, "size": 14, "foreground": 255, "background": 0},
 *     "fonts": [{"name": "Body", "uri": "fonts/Body.ttf", "face_index": 0}]
 * }
 *
 * Colors are packed 0xRRGGBBAA integers. Every key is optional; keys left out keep the value already in
 * `config`. On failure `config` may be partially updated.
 */
[[nodiscard]] ConfigError load_layout_config_from_json_file(const char* fileName, LayoutConfig& config);
[[nodiscard]] ConfigError load_layout_config_from_json_data(std::string_view data, LayoutConfig& config);

constexpr const char* config_error_to_string(ConfigError error) {
	switch (error) {
		case ConfigError::NONE:
			return "none";
		case ConfigError::FILE_NOT_FOUND:
			return "file not found";
		case ConfigError::INVALID_JSON:
			return "invalid JSON";
	}

	return "unknown";
}

}
