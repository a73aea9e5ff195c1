#pragma once

#include "range.hpp"
#include "text_container.hpp"

#include <unicode/uversion.h>

#include <cstdint>

U_NAMESPACE_BEGIN

class BreakIterator;

U_NAMESPACE_END

namespace LineFlow {

class GeometryEngine;
class LayoutManager;

enum class MoveDirection : uint8_t {
	LEFT,
	RIGHT,
	UP,
	DOWN,
};

/**
 * Computes where the insertion point goes when it is moved within one container. Subclasses can override `move`
 * to customize movement.
 */
class InsertionPointNavigator {
	public:
		explicit InsertionPointNavigator(LayoutManager& layout, GeometryEngine& geometry);
		virtual ~InsertionPointNavigator();

		InsertionPointNavigator(const InsertionPointNavigator&) = delete;
		void operator=(const InsertionPointNavigator&) = delete;

		/**
		 * Moves the insertion point at `from` in `direction` by roughly `distance`. A `distance` of 0 requests the
		 * smallest move: one cluster left or right (a ligature is a single step), or one line up or down.
		 * Vertical moves keep to the horizontal position of `original`, so that repeated moves don't drift.
		 *
		 * Returns `from` only if it is already at the extreme of `container` in `direction`.
		 */
		virtual uint32_t move(MoveDirection direction, uint32_t from, uint32_t original, float distance,
				ContainerID container);

		/**
		 * Moves to the start of the next or previous word, stopping at hard line breaks. Only `LEFT` and `RIGHT`
		 * move.
		 */
		uint32_t move_word(MoveDirection direction, uint32_t from);
	protected:
		LayoutManager& m_layout;
		GeometryEngine& m_geometry;

		uint32_t move_horizontally(bool forward, uint32_t from, float distance, ContainerID container,
				CharRange containerChars);
		uint32_t move_vertically(bool down, uint32_t from, uint32_t original, float distance,
				ContainerID container, CharRange containerChars);

		uint32_t prev_position(uint32_t from, CharRange containerChars);
		uint32_t next_position(uint32_t from, CharRange containerChars);
	private:
		icu::BreakIterator* m_iter{};

		void sync_text();

		uint32_t next_word(uint32_t cursor);
		uint32_t prev_word(uint32_t cursor);
};

}
