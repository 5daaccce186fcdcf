#pragma once

/**
 * @file stream_request.hpp
 * @brief Parameters of one document stream
 */

#include <cstdint>
#include <map>
#include <string>
#include <string_view>
#include <vector>

#include "bulkstream/status.hpp"
#include "bulkstream/stream_config.hpp"

namespace bulkstream {

/**
 * @brief What a stream returns; fixed once the stream is constructed
 *
 * A zero limit is accepted and yields an empty stream.
 */
struct StreamRequest {
    /// Resource types to include ("Patient", ...)
    std::vector<std::string> types;

    /// Logical records to emit
    uint64_t limit = 10000;

    /// Logical position of the first record
    uint64_t offset = 0;

    /// Copies of the physical result set to synthesize
    uint64_t multiplier = 1;

    /// Inject "__modified_date" into every document
    bool extended = false;

    /// Group filter (ignored for system-level requests)
    std::string group;

    /// Only rows modified at or after this timestamp
    std::string start;

    /// Export spanning all groups
    bool system_level = false;

    /**
     * @brief Columns the select statement must return
     */
    [[nodiscard]] std::vector<std::string> columns() const;

    /**
     * @brief Build a request from a file name and query parameters
     *
     * @param file File name such as "1.Patient.ndjson"; the resource type
     *             is its second dot-separated segment
     * @param params Query parameters: limit, offset, m, extended, group,
     *               _since, systemLevel
     * @param config Supplies the default limit
     * @param out Receives the request
     * @return kInvalidArgument when no resource type can be derived
     */
    [[nodiscard]] static Status from_params(
        std::string_view file, const std::map<std::string, std::string>& params,
        const StreamConfig& config, StreamRequest* out);
};

/**
 * @brief Extract the resource type from a file name like "1.Patient.ndjson"
 */
[[nodiscard]] Status parse_resource_type(std::string_view file, std::string* type);

}  // namespace bulkstream
