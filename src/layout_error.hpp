#pragma once

#include <cstdint>

namespace LineFlow {

enum class LayoutError : uint8_t {
	NONE,
	// A glyph provider returned clusters that decrease within a run
	NON_MONOTONIC_CLUSTERS,
	// A glyph provider returned a cluster outside of the requested character range
	CLUSTER_OUT_OF_RANGE,
	// A mapping update started or ended inside a cluster, or past the end of the text
	UNALIGNED_RANGE,
};

constexpr const char* layout_error_to_string(LayoutError error) {
	switch (error) {
		case LayoutError::NONE:
			return "none";
		case LayoutError::NON_MONOTONIC_CLUSTERS:
			return "non-monotonic glyph clusters";
		case LayoutError::CLUSTER_OUT_OF_RANGE:
			return "glyph cluster outside of the requested range";
		case LayoutError::UNALIGNED_RANGE:
			return "character range not aligned to cluster boundaries";
	}

	return "unknown";
}

}
