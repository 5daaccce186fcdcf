/**
 * @file resource_seeder.cpp
 * @brief Synthetic document generation
 */

#include "storage/resource_seeder.hpp"

#include <spdlog/fmt/fmt.h>

#include "common/logger.hpp"

namespace bulkstream {

std::string make_uid(std::mt19937_64 &rng) {
  const uint64_t hi = rng();
  const uint64_t lo = rng();
  return fmt::format("{:08x}-{:04x}-{:04x}-{:04x}-{:012x}", hi >> 32,
                     (hi >> 16) & 0xffff, hi & 0xffff, lo >> 48,
                     lo & 0xffffffffffffULL);
}

StoredResource make_resource(const std::string &fhir_type, uint64_t ordinal,
                             std::mt19937_64 &rng) {
  StoredResource resource;
  resource.fhir_type = fhir_type;
  resource.resource_json = fmt::format(
      "{{\"resourceType\":\"{}\",\"id\":\"{}\",\"meta\":{{\"versionId\":\"1\"}},"
      "\"identifier\":[{{\"value\":\"{}\"}}],\"link\":{{\"reference\":\"{}/{}\"}}}}",
      fhir_type, make_uid(rng), ordinal, fhir_type, make_uid(rng));
  resource.modified_date =
      fmt::format("2020-01-{:02d}T00:00:00Z", ordinal % 28 + 1);
  return resource;
}

Status seed_resources(SqliteStorage &storage, const SeedOptions &options) {
  std::mt19937_64 rng(options.seed);

  BULKSTREAM_RETURN_IF_ERROR(storage.execute("BEGIN"));
  for (uint64_t i = 0; i < options.count; ++i) {
    StoredResource resource = make_resource(options.fhir_type, i, rng);
    resource.group_id = options.group_id;
    Status status = storage.insert_resource(resource);
    if (!status.ok()) {
      Status rollback = storage.execute("ROLLBACK");
      if (!rollback.ok()) {
        LOG_WARN("Rollback after failed seed: {}", rollback.to_string());
      }
      return status;
    }
  }
  BULKSTREAM_RETURN_IF_ERROR(storage.execute("COMMIT"));

  LOG_INFO("Seeded {} {} resources", options.count, options.fhir_type);
  return Status::Ok();
}

} // namespace bulkstream
