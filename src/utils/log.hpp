#pragma once

#include <cstdio>


namespace idmap::log {

// set from --verbose
inline bool debug_enabled = false;

} // namespace idmap::log


// stdout carries the report, so both levels go to stderr

#ifndef LOG_DEBUG
#define LOG_DEBUG(format, ...)                                                                                          \
    do {                                                                                                                \
        if (::idmap::log::debug_enabled) {                                                                              \
            fprintf(stderr, "[%-35s: %-25s: line:%-4d] " format "\n", __FILE__, __FUNCTION__, __LINE__, ##__VA_ARGS__); \
        }                                                                                                               \
    } while (0)
#endif

#ifndef LOG_ERROR
#define LOG_ERROR(format, ...)                                                                                      \
    do {                                                                                                            \
        fprintf(stderr, "[%-35s: %-25s: line:%-4d] " format "\n", __FILE__, __FUNCTION__, __LINE__, ##__VA_ARGS__); \
    } while (0)
#endif
