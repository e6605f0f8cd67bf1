#pragma once

/**
 * @file macros.hpp
 * @brief Utility macros for mdfkit
 */

namespace mdfkit {

/**
 * @brief Disable copy constructor and assignment
 */
#define MDFKIT_DISALLOW_COPY(ClassName)            \
    ClassName(const ClassName&) = delete;          \
    ClassName& operator=(const ClassName&) = delete

/**
 * @brief Disable move constructor and assignment
 */
#define MDFKIT_DISALLOW_MOVE(ClassName)            \
    ClassName(ClassName&&) = delete;               \
    ClassName& operator=(ClassName&&) = delete

/**
 * @brief Disable copy and move
 */
#define MDFKIT_DISALLOW_COPY_AND_MOVE(ClassName)   \
    MDFKIT_DISALLOW_COPY(ClassName);               \
    MDFKIT_DISALLOW_MOVE(ClassName)

/**
 * @brief Default move operations
 */
#define MDFKIT_DEFAULT_MOVE(ClassName)             \
    ClassName(ClassName&&) = default;              \
    ClassName& operator=(ClassName&&) = default

}  // namespace mdfkit
