#pragma once

/**
 * @file macros.hpp
 * @brief Utility macros for bulkstream
 */

#include <cstdlib>
#include <iostream>

namespace bulkstream {

// ─────────────────────────────────────────────────────────────────────────────
// Assertion Macros
// ─────────────────────────────────────────────────────────────────────────────

/**
 * @brief Assert that a condition is true (debug builds only)
 */
#ifdef NDEBUG
#define BULKSTREAM_ASSERT(condition, message) ((void)0)
#else
#define BULKSTREAM_ASSERT(condition, message)                                 \
    do {                                                                      \
        if (!(condition)) {                                                   \
            std::cerr << "Assertion failed: " << #condition << "\n"           \
                      << "Message: " << (message) << "\n"                     \
                      << "File: " << __FILE__ << "\n"                         \
                      << "Line: " << __LINE__ << std::endl;                   \
            std::abort();                                                     \
        }                                                                     \
    } while (false)
#endif

// ─────────────────────────────────────────────────────────────────────────────
// Utility Macros
// ─────────────────────────────────────────────────────────────────────────────

/**
 * @brief Disable copy constructor and assignment
 */
#define BULKSTREAM_DISALLOW_COPY(ClassName)        \
    ClassName(const ClassName&) = delete;          \
    ClassName& operator=(const ClassName&) = delete

/**
 * @brief Disable move constructor and assignment
 */
#define BULKSTREAM_DISALLOW_MOVE(ClassName)        \
    ClassName(ClassName&&) = delete;               \
    ClassName& operator=(ClassName&&) = delete

/**
 * @brief Disable copy and move
 */
#define BULKSTREAM_DISALLOW_COPY_AND_MOVE(ClassName)  \
    BULKSTREAM_DISALLOW_COPY(ClassName);              \
    BULKSTREAM_DISALLOW_MOVE(ClassName)

}  // namespace bulkstream
