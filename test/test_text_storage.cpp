#include <catch2/catch_test_macros.hpp>

#include <text_storage.hpp>
#include <value_runs.hpp>

#include <tuple>
#include <vector>

using namespace LineFlow;

namespace {

struct RecordedEdit {
	CharRange range;
	int32_t changeInLength;

	bool operator==(const RecordedEdit&) const = default;
};

}

static constexpr TextStyle g_redStyle{.foreground = Color::from_rgb(255.f, 0.f, 0.f)};

TEST_CASE("Edits are reported in post-edit coordinates", "[TextStorage]") {
	TextStorage storage;
	std::vector<RecordedEdit> edits;
	storage.add_observer([&](CharRange range, int32_t changeInLength) {
		edits.push_back({range, changeInLength});
	});

	REQUIRE(storage.replace_characters({0, 0}, "abc"));
	REQUIRE(storage.replace_characters({1, 1}, "XY"));
	REQUIRE(storage.replace_characters({0, 2}, ""));

	REQUIRE(storage.get_text() == "Yc");
	REQUIRE(edits == std::vector<RecordedEdit>{{{0, 3}, 3}, {{1, 2}, 1}, {{0, 0}, -2}});
}

TEST_CASE("Invalid edits are rejected", "[TextStorage]") {
	TextStorage storage;
	storage.set_text("\xC3\xA9t\xC3\xA9");

	uint32_t notifications = 0;
	storage.add_observer([&](CharRange, int32_t) {
		++notifications;
	});

	SECTION("Past the end") {
		REQUIRE_FALSE(storage.replace_characters({4, 2}, "x"));
		REQUIRE_FALSE(storage.set_style({0, 6}, g_redStyle));
	}

	SECTION("Inside a UTF-8 sequence") {
		REQUIRE_FALSE(storage.replace_characters({1, 0}, "x"));
		REQUIRE_FALSE(storage.replace_characters({0, 1}, "x"));
		REQUIRE_FALSE(storage.replace_characters({2, 2}, "x"));
	}

	REQUIRE(notifications == 0);
	REQUIRE(storage.get_text() == "\xC3\xA9t\xC3\xA9");
	REQUIRE(storage.is_code_point_boundary(2));
	REQUIRE_FALSE(storage.is_code_point_boundary(4));
}

TEST_CASE("Styles", "[TextStorage]") {
	TextStorage storage;
	storage.set_text("abc");

	std::vector<RecordedEdit> edits;
	storage.add_observer([&](CharRange range, int32_t changeInLength) {
		edits.push_back({range, changeInLength});
	});

	REQUIRE(storage.set_style({1, 2}, g_redStyle));
	REQUIRE(edits == std::vector<RecordedEdit>{{{1, 2}, 0}});
	REQUIRE(storage.get_style_at(0) == TextStyle{});
	REQUIRE(storage.get_style_at(2) == g_redStyle);

	SECTION("Inserted text takes the style of the character before it") {
		REQUIRE(storage.replace_characters({3, 0}, "d"));
		REQUIRE(storage.get_style_at(3) == g_redStyle);

		REQUIRE(storage.replace_characters({1, 0}, "e"));
		REQUIRE(storage.get_style_at(1) == TextStyle{});
	}

	SECTION("Text inserted at the start takes the style of the character after it") {
		REQUIRE(storage.set_style({0, 1}, g_redStyle));
		REQUIRE(storage.replace_characters({0, 0}, "z"));
		REQUIRE(storage.get_style_at(0) == g_redStyle);
	}

	SECTION("Explicit styles") {
		TextStyle bigStyle{.size = 32.f};
		REQUIRE(storage.replace_characters({0, 1}, "AA", bigStyle));
		REQUIRE(storage.get_style_at(0) == bigStyle);
		REQUIRE(storage.get_style_at(1) == bigStyle);
		REQUIRE(storage.get_style_at(2) == g_redStyle);
		REQUIRE(storage.get_style_runs().get_run_count() == 2);
	}

	SECTION("Observers can be removed") {
		auto id = storage.add_observer([](CharRange, int32_t) {});
		storage.remove_observer(id);
		REQUIRE(storage.replace_characters({0, 0}, "x"));
		REQUIRE(edits.size() == 2);
	}
}

TEST_CASE("Value runs", "[ValueRuns]") {
	ValueRuns<int> runs(0, 10);

	runs.set_value(2, 5, 1);

	REQUIRE(runs.get_run_count() == 3);
	REQUIRE(runs.get_run_start(1) == 2);
	REQUIRE(runs.get_run_limit(1) == 5);
	REQUIRE(runs.get_run_value(1) == 1);
	REQUIRE(runs.get_value(1) == 0);
	REQUIRE(runs.get_value(3) == 1);
	REQUIRE(runs.get_value(5) == 0);

	SECTION("Iterating a range clips the runs") {
		std::vector<std::tuple<uint32_t, uint32_t, int>> visited;
		runs.for_each_run_in_range(1, 4, [&](uint32_t start, uint32_t limit, int value) {
			visited.emplace_back(start, limit, value);
		});

		REQUIRE(visited == std::vector<std::tuple<uint32_t, uint32_t, int>>{{1, 2, 0}, {2, 5, 1}});
	}

	SECTION("Setting a value merges equal neighbours") {
		runs.set_value(2, 5, 0);
		REQUIRE(runs.get_run_count() == 1);
		REQUIRE(runs.get_limit() == 10);
	}

	SECTION("Removing characters shrinks the runs") {
		runs.replace(3, 4, 0, 9);

		REQUIRE(runs.get_run_count() == 3);
		REQUIRE(runs.get_limit() == 6);
		REQUIRE(runs.get_value(2) == 1);
		REQUIRE(runs.get_value(3) == 0);
	}

	SECTION("Removing a whole run drops it") {
		runs.replace(2, 3, 0, 9);

		REQUIRE(runs.get_run_count() == 1);
		REQUIRE(runs.get_limit() == 7);
	}

	SECTION("Inserting characters") {
		runs.replace(10, 0, 2, 7);

		REQUIRE(runs.get_limit() == 12);
		REQUIRE(runs.get_value(11) == 7);
	}
}
