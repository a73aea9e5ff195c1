#pragma once

#include <cstdio>

// 0 = off, 1 = errors, 2 = warnings, 3 = debug
#ifndef LINEFLOW_LOG_LEVEL
#define LINEFLOW_LOG_LEVEL 2
#endif

#define LINEFLOW_LOG_IMPL(tag, fmt, ...)															\
	do {																							\
		std::fprintf(stderr, "[LineFlow] " tag ": " fmt "\n" __VA_OPT__(,) __VA_ARGS__);			\
	} while (0)

#if LINEFLOW_LOG_LEVEL >= 1
#define LINEFLOW_LOG_ERROR(fmt, ...) LINEFLOW_LOG_IMPL("ERROR", fmt __VA_OPT__(,) __VA_ARGS__)
#else
#define LINEFLOW_LOG_ERROR(fmt, ...) do {} while (0)
#endif

#if LINEFLOW_LOG_LEVEL >= 2
#define LINEFLOW_LOG_WARN(fmt, ...) LINEFLOW_LOG_IMPL("WARN", fmt __VA_OPT__(,) __VA_ARGS__)
#else
#define LINEFLOW_LOG_WARN(fmt, ...) do {} while (0)
#endif

#if LINEFLOW_LOG_LEVEL >= 3
#define LINEFLOW_LOG_DEBUG(fmt, ...) LINEFLOW_LOG_IMPL("DEBUG", fmt __VA_OPT__(,) __VA_ARGS__)
#else
#define LINEFLOW_LOG_DEBUG(fmt, ...) do {} while (0)
#endif
