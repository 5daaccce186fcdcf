/**
 * @file config.cpp
 * @brief Runtime configuration loading
 */

#include "common/config.hpp"

#include <cstdlib>
#include <limits>
#include <mutex>

#include "bulkstream/stream_config.hpp"
#include "common/logger.hpp"
#include "common/params.hpp"

namespace bulkstream {

namespace {

uint64_t env_uint(const char *name, uint64_t fallback) {
  const char *raw = std::getenv(name);
  if (raw == nullptr) {
    return fallback;
  }
  auto value = try_parse_uint(raw);
  if (!value.has_value()) {
    LOG_WARN("{} is not an unsigned integer ('{}'), keeping {}", name, raw,
             fallback);
    return fallback;
  }
  return *value;
}

std::mutex config_mutex;

StreamConfig &mutable_process_config() {
  static StreamConfig instance = StreamConfig::from_env();
  return instance;
}

} // namespace

StreamConfig StreamConfig::from_env() {
  StreamConfig cfg;
  cfg.default_page_size = env_uint(config::kPageSizeEnv, config::kDefaultPageSize);
  cfg.rows_per_chunk =
      env_uint(config::kRowsPerChunkEnv, config::kDefaultRowsPerChunk);

  uint64_t throttle = env_uint(config::kThrottleEnv, config::kDefaultThrottleMs);
  if (throttle > std::numeric_limits<uint32_t>::max()) {
    throttle = config::kDefaultThrottleMs;
  }
  cfg.throttle_ms = static_cast<uint32_t>(throttle);
  return cfg;
}

Status StreamConfig::validate() const {
  if (rows_per_chunk == 0) {
    return Status::InvalidArgument("rows_per_chunk must be greater than zero");
  }
  return Status::Ok();
}

StreamConfig process_config() {
  std::lock_guard<std::mutex> lock(config_mutex);
  return mutable_process_config();
}

void set_process_config(const StreamConfig &config) {
  std::lock_guard<std::mutex> lock(config_mutex);
  mutable_process_config() = config;
}

} // namespace bulkstream
