#pragma once

#include <cstdlib>
#include <cstdio>
#include <cstring>
#include <iostream>

namespace witgen {
namespace debug {

/**
 * Debug and Profile Control
 *
 * Environment variables:
 * - WITGEN_PROFILE: Enable/disable profiling output (driver pass timings)
 *   Set to "1" or "true" to enable, "0" or "false" (or unset) to disable
 *
 * - WITGEN_DEBUG: Enable/disable debug output (solve decisions, ingested effects)
 *   Set to "1" or "true" to enable, "0" or "false" (or unset) to disable
 */

inline bool env_flag_enabled(const char* name) {
    const char* env = std::getenv(name);
    return env && (strcmp(env, "1") == 0 || strcmp(env, "true") == 0);
}

// Check if profiling is enabled
inline bool is_profile_enabled() {
    static int cached = -1;
    if (cached == -1) {
        cached = env_flag_enabled("WITGEN_PROFILE") ? 1 : 0;
    }
    return cached == 1;
}

// Check if debug printing is enabled
inline bool is_debug_enabled() {
    static int cached = -1;
    if (cached == -1) {
        cached = env_flag_enabled("WITGEN_DEBUG") ? 1 : 0;
    }
    return cached == 1;
}

} // namespace debug
} // namespace witgen

// Profile printing (timing measurements)
#define WITGEN_PROFILE_PRINT(...) \
    do { \
        if (witgen::debug::is_profile_enabled()) { \
            printf(__VA_ARGS__); \
        } \
    } while(0)

// Debug printing (solver decisions)
#define WITGEN_DEBUG_COUT(expr) \
    do { \
        if (witgen::debug::is_debug_enabled()) { \
            std::cout << expr; \
        } \
    } while(0)
