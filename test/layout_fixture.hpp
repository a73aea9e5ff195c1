#pragma once

#include "fixed_glyph_provider.hpp"

#include <geometry_engine.hpp>
#include <layout_manager.hpp>
#include <text_storage.hpp>

#include <string_view>

/**
 * A text storage laid out into one container by a `FixedGlyphProvider`. Extra containers can be added through
 * `layout`.
 */
struct LayoutFixture {
	FixedGlyphProvider provider;
	LineFlow::TextStorage storage;
	LineFlow::LayoutManager layout;
	LineFlow::GeometryEngine geometry;
	LineFlow::ContainerID container;

	explicit LayoutFixture(std::string_view text, LineFlow::Size size = {1000.f, LineFlow::UNBOUNDED_EXTENT},
			LineFlow::LayoutConfig config = {})
			: layout(storage, provider, std::move(config))
			, geometry(layout)
			, container(layout.add_container(size)) {
		storage.set_text(text);
	}
};
