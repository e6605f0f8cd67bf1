#pragma once

/**
 * @file mdfkit.hpp
 * @brief Main include header for mdfkit
 *
 * Include this single header to access the public API of mdfkit.
 */

#include "mdfkit/database.hpp"
#include "mdfkit/status.hpp"
#include "recovery/recovery_scanner.hpp"

namespace mdfkit {

/**
 * @brief Get the version string of mdfkit
 * @return Version string in format "major.minor.patch"
 */
constexpr const char* version() noexcept {
    return "0.1.0";
}

constexpr int version_major() noexcept {
    return 0;
}

constexpr int version_minor() noexcept {
    return 1;
}

constexpr int version_patch() noexcept {
    return 0;
}

}  // namespace mdfkit
