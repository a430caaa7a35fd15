#pragma once

#include "spdlog/spdlog.h"
#include <cstdlib>

/**
 * Runtime assertion that stays enabled in release builds.
 *
 * Reserved for internal invariants whose violation means a bug (an arena index
 * out of range, a weight matrix that lost its shape). Bad input from files or
 * the command line is reported through Result instead.
 *
 * Example:
 *   BIOMORPH_ASSERT(joint.segA < genome.segments.size(), "Joint references missing segment");
 */
#define BIOMORPH_ASSERT(condition, message)                                                 \
    do {                                                                                    \
        if (!(condition)) {                                                                 \
            spdlog::critical("ASSERTION FAILED: {} at {}:{}", message, __FILE__, __LINE__); \
            spdlog::critical("  Condition: {}", #condition);                                \
            std::abort();                                                                   \
        }                                                                                   \
    } while (0)
