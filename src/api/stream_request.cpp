/**
 * @file stream_request.cpp
 * @brief Stream request parsing
 */

#include "bulkstream/stream_request.hpp"

#include "common/config.hpp"
#include "common/params.hpp"
#include "common/status.hpp"

namespace bulkstream {

namespace {

uint64_t uint_param(const std::map<std::string, std::string>& params,
                    const char* name, uint64_t fallback) {
    auto it = params.find(name);
    return it == params.end() ? fallback : parse_uint(it->second, fallback);
}

bool bool_param(const std::map<std::string, std::string>& params,
                const char* name) {
    auto it = params.find(name);
    return it != params.end() && parse_bool(it->second);
}

std::string string_param(const std::map<std::string, std::string>& params,
                         const char* name) {
    auto it = params.find(name);
    return it == params.end() ? std::string() : it->second;
}

}  // namespace

std::vector<std::string> StreamRequest::columns() const {
    std::vector<std::string> result = {config::kDocumentColumn};
    if (extended) {
        result.emplace_back(config::kModifiedColumn);
    }
    return result;
}

Status parse_resource_type(std::string_view file, std::string* type) {
    auto first = file.find('.');
    if (first == std::string_view::npos) {
        return Status::InvalidArgument("no resource type in file name: " +
                                       std::string(file));
    }
    auto rest = file.substr(first + 1);
    auto second = rest.find('.');
    auto segment = rest.substr(0, second);
    if (segment.empty()) {
        return Status::InvalidArgument("no resource type in file name: " +
                                       std::string(file));
    }
    *type = std::string(segment);
    return Status::Ok();
}

Status StreamRequest::from_params(std::string_view file,
                                  const std::map<std::string, std::string>& params,
                                  const StreamConfig& config,
                                  StreamRequest* out) {
    std::string type;
    BULKSTREAM_RETURN_IF_ERROR(parse_resource_type(file, &type));

    StreamRequest request;
    request.types = {type};

    request.limit = uint_param(params, "limit", config.default_page_size);
    request.offset = uint_param(params, "offset", 0);
    request.multiplier = uint_param(params, "m", config::kDefaultMultiplier);
    request.extended = bool_param(params, "extended");
    request.system_level = bool_param(params, "systemLevel");
    request.group = string_param(params, "group");
    request.start = string_param(params, "_since");

    *out = std::move(request);
    return Status::Ok();
}

}  // namespace bulkstream
