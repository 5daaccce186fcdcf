/**
 * @file emitter.cpp
 * @brief Emitter implementation
 */

#include "stream/emitter.hpp"

#include <nlohmann/json.hpp>

#include <stdexcept>
#include <type_traits>
#include <variant>

#include "common/config.hpp"
#include "common/logger.hpp"
#include "common/macros.hpp"
#include "stream/amplifier.hpp"

namespace bulkstream {

namespace {

nlohmann::ordered_json to_json(const Value &value) {
  return std::visit(
      [](const auto &v) -> nlohmann::ordered_json {
        using T = std::decay_t<decltype(v)>;
        if constexpr (std::is_same_v<T, std::monostate>) {
          return nullptr;
        } else {
          return v;
        }
      },
      value.variant());
}

} // namespace

Emitter::Emitter(const StreamRequest &request, StreamCursor &cursor,
                 RowChunk &chunk)
    : request_(request), cursor_(cursor), chunk_(chunk) {}

Status Emitter::next(EmitStep *step) {
  step->text.clear();

  if (cursor_.row_index >= request_.limit) {
    step->kind = EmitStep::Kind::kEnd;
    return Status::Ok();
  }

  auto row = chunk_.pop();
  if (!row.has_value()) {
    if (cursor_.rewound && chunk_.received() == 0) {
      // A replay found nothing to replay
      step->kind = EmitStep::Kind::kEnd;
    } else if (chunk_.was_full()) {
      step->kind = EmitStep::Kind::kRefill;
    } else if (Amplifier::can_replay(cursor_)) {
      Amplifier::rewind(cursor_);
      step->kind = EmitStep::Kind::kRefill;
    } else {
      step->kind = EmitStep::Kind::kEnd;
    }
    return Status::Ok();
  }

  auto &state = cursor_.pagination;
  const auto page = state.page_at(cursor_.row_index);
  BULKSTREAM_ASSERT(page >= state.page, "page must not decrease");
  state.page = page;

  std::string json;
  Status status = format(*row, &json);
  if (!status.ok()) {
    return status;
  }

  step->kind = EmitStep::Kind::kRecord;
  if (cursor_.row_index > 0) {
    step->text.push_back('\n');
  }
  step->text += json;

  LOG_TRACE("Record {} (page {}, round {})", cursor_.row_index, state.page,
            state.overflow);
  cursor_.row_index += 1;
  return Status::Ok();
}

Status Emitter::format(const Row &row, std::string *out) const {
  try {
    const auto &document = row[config::kDocumentColumn].as_string();
    std::string json = Amplifier::rewrite(document, cursor_.pagination);

    if (request_.extended) {
      auto parsed = nlohmann::ordered_json::parse(json);
      if (!parsed.is_object()) {
        return Status::Corruption("document is not a JSON object");
      }
      parsed[config::kModifiedDateField] =
          to_json(row[config::kModifiedColumn]);
      json = parsed.dump();
    }

    *out = std::move(json);
    return Status::Ok();
  } catch (const nlohmann::json::exception &e) {
    return Status::Corruption(std::string("malformed document: ") + e.what());
  } catch (const std::runtime_error &e) {
    return Status::Corruption(e.what());
  }
}

} // namespace bulkstream
