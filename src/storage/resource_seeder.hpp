#pragma once

/**
 * @file resource_seeder.hpp
 * @brief Synthetic documents for populating a data table
 */

#include <cstdint>
#include <random>
#include <string>

#include "bulkstream/sqlite_storage.hpp"
#include "common/status.hpp"

namespace bulkstream {

/**
 * @brief Options for seed_resources()
 */
struct SeedOptions {
  std::string fhir_type = "Patient";
  uint64_t count = 0;
  std::string group_id;
  uint64_t seed = 42;
};

/**
 * @brief Generate a random lowercase 8-4-4-4-12 identifier
 */
std::string make_uid(std::mt19937_64 &rng);

/**
 * @brief Build one document of the given type with a fresh identifier
 *
 * The document references a second identifier so that rewriting touches
 * more than the "id" field.
 */
StoredResource make_resource(const std::string &fhir_type, uint64_t ordinal,
                             std::mt19937_64 &rng);

/**
 * @brief Insert options.count synthetic documents in one transaction
 */
[[nodiscard]] Status seed_resources(SqliteStorage &storage,
                                    const SeedOptions &options);

} // namespace bulkstream
