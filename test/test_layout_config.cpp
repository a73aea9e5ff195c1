#include <catch2/catch_test_macros.hpp>

#include <layout_config.hpp>

#include <cstdio>

#include <filesystem>
#include <string>

using namespace LineFlow;

TEST_CASE("Config from JSON data", "[LayoutConfig]") {
	LayoutConfig config{};

	SECTION("Every key") {
		auto res = load_layout_config_from_json_data(R"({
			"line_fragment_padding": 2.5,
			"locale": "de_DE",
			"default_style": {"font": 1, "size": 14, "foreground": 4278190335, "background": 255},
			"fonts": [
				{"name": "Body", "uri": "fonts/Body.ttf"},
				{"name": "Mono", "uri": "fonts/Mono.ttc", "face_index": 2}
			]
		})", config);

		REQUIRE(res == ConfigError::NONE);
		REQUIRE(config.lineFragmentPadding == 2.5f);
		REQUIRE(config.locale == "de_DE");
		REQUIRE(config.defaultStyle.font == 1);
		REQUIRE(config.defaultStyle.size == 14.f);
		REQUIRE(config.defaultStyle.foreground == Color::from_rgb(255.f, 0.f, 0.f));
		REQUIRE(config.defaultStyle.background == Color::from_rgb(0.f, 0.f, 0.f));
		REQUIRE(config.fonts.size() == 2);
		REQUIRE(config.fonts[0].name == "Body");
		REQUIRE(config.fonts[0].uri == "fonts/Body.ttf");
		REQUIRE(config.fonts[0].faceIndex == 0);
		REQUIRE(config.fonts[1].faceIndex == 2);
	}

	SECTION("Missing keys keep their values") {
		config.locale = "fr_FR";
		config.defaultStyle.size = 20.f;

		REQUIRE(load_layout_config_from_json_data(R"({"default_style": {"font": 3}})", config) == ConfigError::NONE);
		REQUIRE(config.locale == "fr_FR");
		REQUIRE(config.defaultStyle.font == 3);
		REQUIRE(config.defaultStyle.size == 20.f);
		REQUIRE(config.defaultStyle.background.is_transparent());
	}

	SECTION("Font lists are replaced") {
		config.fonts.push_back({"Old", "old.ttf", 0});

		REQUIRE(load_layout_config_from_json_data(R"({"fonts": []})", config) == ConfigError::NONE);
		REQUIRE(config.fonts.empty());
	}

	SECTION("Unknown keys are ignored") {
		REQUIRE(load_layout_config_from_json_data(R"({"theme": {"dark": true}, "locale": "ja"})", config)
				== ConfigError::NONE);
		REQUIRE(config.locale == "ja");
	}
}

TEST_CASE("Invalid config data", "[LayoutConfig]") {
	LayoutConfig config{};

	REQUIRE(load_layout_config_from_json_data("", config) == ConfigError::INVALID_JSON);
	REQUIRE(load_layout_config_from_json_data("[1, 2]", config) == ConfigError::INVALID_JSON);
	REQUIRE(load_layout_config_from_json_data(R"({"locale": 7})", config) == ConfigError::INVALID_JSON);
	REQUIRE(load_layout_config_from_json_data(R"({"line_fragment_padding": -1})", config)
			== ConfigError::INVALID_JSON);
	REQUIRE(load_layout_config_from_json_data(R"({"default_style": {"size": 0}})", config)
			== ConfigError::INVALID_JSON);
	REQUIRE(load_layout_config_from_json_data(R"({"default_style": {"foreground": 4294967296}})", config)
			== ConfigError::INVALID_JSON);
	REQUIRE(load_layout_config_from_json_data(R"({"fonts": [{"name": "Body"}]})", config)
			== ConfigError::INVALID_JSON);
	REQUIRE(load_layout_config_from_json_data(R"({"fonts": [{"name": "A", "uri": "a", "face_index": -1}]})",
			config) == ConfigError::INVALID_JSON);
}

TEST_CASE("Config from a file", "[LayoutConfig]") {
	LayoutConfig config{};

	SECTION("Missing file") {
		REQUIRE(load_layout_config_from_json_file("does/not/exist.json", config) == ConfigError::FILE_NOT_FOUND);
	}

	SECTION("Existing file") {
		auto path = (std::filesystem::temp_directory_path() / "lineflow_test_config.json").string();
		auto* file = std::fopen(path.c_str(), "wb");
		REQUIRE(file);

		std::string contents = R"({"locale": "en_GB", "line_fragment_padding": 1})";
		std::fwrite(contents.data(), 1, contents.size(), file);
		std::fclose(file);

		auto res = load_layout_config_from_json_file(path.c_str(), config);
		std::filesystem::remove(path);

		REQUIRE(res == ConfigError::NONE);
		REQUIRE(config.locale == "en_GB");
		REQUIRE(config.lineFragmentPadding == 1.f);
	}
}
