#pragma once

/**
 * @file bulkstream.hpp
 * @brief Main include header for bulkstream
 *
 * Include this single header to access the public API of bulkstream.
 */

#include "bulkstream/pagination.hpp"
#include "bulkstream/resource_stream.hpp"
#include "bulkstream/result.hpp"
#include "bulkstream/sqlite_storage.hpp"
#include "bulkstream/status.hpp"
#include "bulkstream/storage.hpp"
#include "bulkstream/stream_config.hpp"
#include "bulkstream/stream_request.hpp"

namespace bulkstream {

/**
 * @brief Get the version string of bulkstream
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

}  // namespace bulkstream
