#pragma once

#include "range.hpp"

#include <unicode/umachine.h>
#include <unicode/uversion.h>

#include <cstdint>

#include <string_view>

U_NAMESPACE_BEGIN

class Locale;

U_NAMESPACE_END

namespace LineFlow {

inline constexpr UChar32 CH_LF = 0x000A;
inline constexpr UChar32 CH_CR = 0x000D;
inline constexpr UChar32 CH_LSEP = 0x2028;
inline constexpr UChar32 CH_PSEP = 0x2029;

constexpr bool is_hard_line_break(UChar32 c) {
	return c == CH_LF || c == CH_CR || c == CH_LSEP || c == CH_PSEP;
}

/**
 * Length in code units of the hard line break sequence starting at `index` (2 for CRLF), or 0 if there is none.
 */
uint32_t get_line_break_length(std::string_view text, uint32_t index);

/**
 * Whether `text` ends with a hard line break sequence.
 */
bool ends_with_line_break(std::string_view text);

uint32_t count_code_points(std::string_view text, CharRange range);

/**
 * Index `count` code points after `index`, clamped to the end of `text`.
 */
uint32_t advance_code_points(std::string_view text, uint32_t index, uint32_t count);

/**
 * ICU locale for `name`, or the default locale if `name` is empty.
 */
icu::Locale get_locale(std::string_view name);

}
