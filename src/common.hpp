#pragma once

#include <type_traits>

#define LINEFLOW_DEFINE_UNARY_ENUM_OPERATOR(T, op)													\
	constexpr T operator op(const T& a) noexcept {													\
		static_assert(std::is_enum_v<T>);															\
		return static_cast<T>(op static_cast<std::underlying_type_t<T>>(a));						\
	}

#define LINEFLOW_DEFINE_BINARY_ENUM_OPERATOR(T, op)													\
	constexpr T operator op(const T& a, const T& b) noexcept {										\
		static_assert(std::is_enum_v<T>);															\
		return static_cast<T>(static_cast<std::underlying_type_t<T>>(a)								\
				op static_cast<std::underlying_type_t<T>>(b));										\
	}

#define LINEFLOW_DEFINE_ASSIGNMENT_ENUM_OPERATOR(T, op)												\
	constexpr T operator op##=(T& a, const T& b) noexcept {											\
		static_assert(std::is_enum_v<T>);															\
		return a = static_cast<T>(static_cast<std::underlying_type_t<T>>(a)							\
				op static_cast<std::underlying_type_t<T>>(b));										\
	}

#define LINEFLOW_DEFINE_ENUM_BITFLAG_OPERATORS(Enum)												\
	LINEFLOW_DEFINE_UNARY_ENUM_OPERATOR(Enum, ~)													\
	LINEFLOW_DEFINE_BINARY_ENUM_OPERATOR(Enum, |)													\
	LINEFLOW_DEFINE_BINARY_ENUM_OPERATOR(Enum, &)													\
	LINEFLOW_DEFINE_ASSIGNMENT_ENUM_OPERATOR(Enum, |)												\
	LINEFLOW_DEFINE_ASSIGNMENT_ENUM_OPERATOR(Enum, &)												\
	constexpr bool has_any(Enum a, Enum b) noexcept {												\
		return static_cast<std::underlying_type_t<Enum>>(a & b) != 0;								\
	}

#if defined(__GNUC__) || defined(__clang__)
#define LINEFLOW_UNREACHABLE() __builtin_unreachable()
#elif defined(_MSC_VER)
#define LINEFLOW_UNREACHABLE() __assume(false)
#else
#include <cstdlib>
#define LINEFLOW_UNREACHABLE() std::abort()
#endif
