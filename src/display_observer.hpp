#pragma once

#include "range.hpp"

namespace LineFlow {

/**
 * Rendering collaborator told which regions need to be redrawn. Notifications carry no geometry; the observer
 * resolves it lazily when it draws.
 */
class DisplayObserver {
	public:
		virtual ~DisplayObserver() = default;

		virtual void on_display_invalidated(GlyphRange glyphs) = 0;
		virtual void on_display_invalidated(CharRange chars) = 0;
};

}
