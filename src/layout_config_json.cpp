#include "layout_config.hpp"

#include "file_read_bytes.hpp"
#include "log.hpp"

#include <simdjson.h>

using namespace LineFlow;

static ConfigError read_style(simdjson::ondemand::object& styleObject, TextStyle& style);
static ConfigError read_color(simdjson::ondemand::object& object, std::string_view key, Color& color);

// Public Functions

ConfigError LineFlow::load_layout_config_from_json_file(const char* fileName, LayoutConfig& config) {
	std::vector<char> fileData;

	if (!file_read_bytes(fileName, fileData)) {
		LINEFLOW_LOG_WARN("Failed to read config file %s", fileName);
		return ConfigError::FILE_NOT_FOUND;
	}

	auto res = load_layout_config_from_json_data(std::string_view(fileData.data(), fileData.size()), config);

	if (res != ConfigError::NONE) {
		LINEFLOW_LOG_WARN("Failed to parse config file %s: %s", fileName, config_error_to_string(res));
	}

	return res;
}

ConfigError LineFlow::load_layout_config_from_json_data(std::string_view data, LayoutConfig& config) {
	simdjson::padded_string paddedData(data);
	simdjson::ondemand::parser parser;
	auto d = parser.iterate(paddedData);

	simdjson::ondemand::object root;
	if (d.get(root) != 0) {
		return ConfigError::INVALID_JSON;
	}

	for (auto field : root) {
		std::string_view key;
		if (field.unescaped_key().get(key) != 0) {
			return ConfigError::INVALID_JSON;
		}

		auto value = field.value();

		if (key == "line_fragment_padding") {
			double padding;
			if (value.get(padding) != 0 || padding < 0.0) {
				return ConfigError::INVALID_JSON;
			}

			config.lineFragmentPadding = static_cast<float>(padding);
		}
		else if (key == "locale") {
			std::string_view locale;
			if (value.get(locale) != 0) {
				return ConfigError::INVALID_JSON;
			}

			config.locale = locale;
		}
		else if (key == "default_style") {
			simdjson::ondemand::object styleObject;
			if (value.get(styleObject) != 0) {
				return ConfigError::INVALID_JSON;
			}

			if (auto res = read_style(styleObject, config.defaultStyle); res != ConfigError::NONE) {
				return res;
			}
		}
		else if (key == "fonts") {
			simdjson::ondemand::array fontArray;
			if (value.get(fontArray) != 0) {
				return ConfigError::INVALID_JSON;
			}

			config.fonts.clear();

			for (auto fontValue : fontArray) {
				simdjson::ondemand::object fontObject;
				if (fontValue.get(fontObject) != 0) {
					return ConfigError::INVALID_JSON;
				}

				auto& font = config.fonts.emplace_back();
				std::string_view name;
				std::string_view uri;
				int64_t faceIndex{};

				if (fontObject["name"].get(name) != 0) {
					return ConfigError::INVALID_JSON;
				}

				if (fontObject["uri"].get(uri) != 0) {
					return ConfigError::INVALID_JSON;
				}

				if (auto faceValue = fontObject["face_index"]; faceValue.error() == simdjson::SUCCESS) {
					if (faceValue.get(faceIndex) != 0 || faceIndex < 0) {
						return ConfigError::INVALID_JSON;
					}
				}

				font.name = name;
				font.uri = uri;
				font.faceIndex = static_cast<uint32_t>(faceIndex);
			}
		}
		else {
			LINEFLOW_LOG_WARN("Ignoring unknown config key %.*s", static_cast<int>(key.size()), key.data());
		}
	}

	return ConfigError::NONE;
}

// Static Functions

static ConfigError read_style(simdjson::ondemand::object& styleObject, TextStyle& style) {
	if (auto fontValue = styleObject["font"]; fontValue.error() == simdjson::SUCCESS) {
		int64_t font;
		if (fontValue.get(font) != 0 || font < 0) {
			return ConfigError::INVALID_JSON;
		}

		style.font = static_cast<FontID>(font);
	}

	if (auto sizeValue = styleObject["size"]; sizeValue.error() == simdjson::SUCCESS) {
		double size;
		if (sizeValue.get(size) != 0 || size <= 0.0) {
			return ConfigError::INVALID_JSON;
		}

		style.size = static_cast<float>(size);
	}

	if (auto res = read_color(styleObject, "foreground", style.foreground); res != ConfigError::NONE) {
		return res;
	}

	return read_color(styleObject, "background", style.background);
}

static ConfigError read_color(simdjson::ondemand::object& object, std::string_view key, Color& color) {
	auto colorValue = object[key];

	if (colorValue.error() == simdjson::NO_SUCH_FIELD) {
		return ConfigError::NONE;
	}

	uint64_t rgba;
	if (colorValue.get(rgba) != 0 || rgba > 0xFFFFFFFFull) {
		return ConfigError::INVALID_JSON;
	}

	color = Color::from_rgba_uint(static_cast<uint32_t>(rgba));
	return ConfigError::NONE;
}
