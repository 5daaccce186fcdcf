/**
 * @file export_tool.cpp
 * @brief Command-line NDJSON export
 */

#include <iostream>
#include <map>
#include <string>
#include <string_view>

#include <boost/asio/io_context.hpp>

#include "bulkstream/bulkstream.hpp"
#include "common/logger.hpp"
#include "common/params.hpp"
#include "storage/resource_seeder.hpp"

namespace bulkstream {

struct ExportOptions {
  std::string db_path;
  std::string file;
  std::map<std::string, std::string> params;
  StreamConfig config;
  std::string log_level = "warn";
  uint64_t seed = 0;
};

void print_usage(std::ostream &out) {
  out << "bulkstream_export v" << version() << "\n"
      << "---------------------------------------------\n"
      << "Usage: bulkstream_export <db-path> <file> [options]\n"
      << "\n"
      << "  <file>             Output file name, e.g. 1.Patient.ndjson\n"
      << "\n"
      << "Options:\n"
      << "  --limit=N          Records to emit\n"
      << "  --offset=N         Logical position of the first record\n"
      << "  --m=N              Multiplier of the stored result set\n"
      << "  --extended         Inject __modified_date into every record\n"
      << "  --group=G          Only resources of group G\n"
      << "  --since=T          Only resources modified at or after T\n"
      << "  --system-level     Ignore the group filter\n"
      << "  --throttle=MS      Delay before each record\n"
      << "  --chunk=N          Rows fetched per storage call\n"
      << "  --log-level=L      trace, debug, info, warn, error, critical, off\n"
      << "  --seed=N           Populate an empty database with N resources\n";
}

/// Split "--name=value" into name and value; bare "--name" gets "true"
bool split_flag(std::string_view arg, std::string *name, std::string *value) {
  if (arg.size() <= 2 || arg.substr(0, 2) != "--") {
    return false;
  }
  arg.remove_prefix(2);
  auto eq = arg.find('=');
  if (eq == std::string_view::npos) {
    *name = std::string(arg);
    *value = "true";
  } else {
    *name = std::string(arg.substr(0, eq));
    *value = std::string(arg.substr(eq + 1));
  }
  return true;
}

Status parse_args(int argc, char *argv[], ExportOptions *options) {
  int positional = 0;
  options->config = process_config();

  for (int i = 1; i < argc; ++i) {
    std::string_view arg = argv[i];
    std::string name;
    std::string value;

    if (!split_flag(arg, &name, &value)) {
      if (positional == 0) {
        options->db_path = std::string(arg);
      } else if (positional == 1) {
        options->file = std::string(arg);
      } else {
        return Status::InvalidArgument("unexpected argument: " +
                                       std::string(arg));
      }
      ++positional;
      continue;
    }

    if (name == "limit" || name == "offset" || name == "m" ||
        name == "extended" || name == "group") {
      options->params[name] = value;
    } else if (name == "since") {
      options->params["_since"] = value;
    } else if (name == "system-level") {
      options->params["systemLevel"] = value;
    } else if (name == "throttle") {
      options->config.throttle_ms = static_cast<uint32_t>(
          parse_uint(value, options->config.throttle_ms));
    } else if (name == "chunk") {
      options->config.rows_per_chunk =
          parse_uint(value, options->config.rows_per_chunk);
    } else if (name == "log-level") {
      options->log_level = value;
    } else if (name == "seed") {
      options->seed = parse_uint(value, 0);
    } else {
      return Status::InvalidArgument("unknown option: --" + name);
    }
  }

  if (positional < 2) {
    return Status::InvalidArgument("expected <db-path> and <file>");
  }
  return Status::Ok();
}

Status seed_if_empty(SqliteStorage &storage, const StreamRequest &request,
                     uint64_t count) {
  uint64_t existing = 0;
  BULKSTREAM_RETURN_IF_ERROR(storage.count_resources(&existing));
  if (existing > 0) {
    LOG_INFO("Database already holds {} resources; not seeding", existing);
    return Status::Ok();
  }

  SeedOptions seed;
  seed.fhir_type = request.types.front();
  seed.count = count;
  seed.group_id = request.group;
  return seed_resources(storage, seed);
}

int run_export(const ExportOptions &options) {
  StreamRequest request;
  Status status = StreamRequest::from_params(options.file, options.params,
                                             options.config, &request);
  if (!status.ok()) {
    std::cerr << "Error: " << status.to_string() << "\n";
    return 1;
  }

  boost::asio::io_context io;
  SqliteStorage storage(io);
  status = storage.open(options.db_path);
  if (status.ok()) {
    status = storage.create_schema();
  }
  if (status.ok() && options.seed > 0) {
    status = seed_if_empty(storage, request, options.seed);
  }
  if (!status.ok()) {
    std::cerr << "Error: " << status.to_string() << "\n";
    return 1;
  }

  int exit_code = 0;
  ResourceStream stream(io, storage, std::move(request), options.config);
  stream.on_data([](std::string_view text) { std::cout << text; });
  stream.on_end([]() { std::cout.flush(); });
  stream.on_error([&exit_code](const Status &error) {
    std::cerr << "Error: " << error.to_string() << "\n";
    exit_code = 1;
  });
  stream.resume();
  io.run();

  return exit_code;
}

} // namespace bulkstream

int main(int argc, char *argv[]) {
  bulkstream::ExportOptions options;

  auto status = bulkstream::parse_args(argc, argv, &options);
  if (!status.ok()) {
    std::cerr << "Error: " << status.to_string() << "\n\n";
    bulkstream::print_usage(std::cerr);
    return 2;
  }

  bulkstream::Logger::init();
  if (!bulkstream::Logger::set_level(options.log_level)) {
    std::cerr << "Error: unknown log level: " << options.log_level << "\n";
    return 2;
  }

  try {
    return bulkstream::run_export(options);
  } catch (const std::exception &e) {
    std::cerr << "Error: " << e.what() << std::endl;
    return 1;
  }
}
