#pragma once

/**
 * @file stream_config.hpp
 * @brief Process-wide stream configuration
 */

#include <cstdint>

#include "bulkstream/status.hpp"

namespace bulkstream {

/**
 * @brief Tunables shared by every stream in the process
 *
 * A stream copies the configuration when it is constructed; later changes
 * only affect streams created afterwards.
 */
struct StreamConfig {
    /// Limit used when a request does not carry one
    uint64_t default_page_size = 10000;

    /// Upper bound on rows fetched from storage per call
    uint64_t rows_per_chunk = 500;

    /// Delay before each pull in milliseconds (0 = next scheduler tick)
    uint32_t throttle_ms = 0;

    /**
     * @brief Build a configuration from BULKSTREAM_* environment variables
     *
     * Unset or unparsable variables keep their default.
     */
    [[nodiscard]] static StreamConfig from_env();

    /**
     * @brief Check that the configuration can drive a stream
     */
    [[nodiscard]] Status validate() const;
};

/**
 * @brief Get the process-wide configuration (loaded from the environment once)
 */
StreamConfig process_config();

/**
 * @brief Replace the process-wide configuration
 */
void set_process_config(const StreamConfig& config);

}  // namespace bulkstream
