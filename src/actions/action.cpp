/**
 * @file action.cpp
 * @brief Action serialization and hashing
 */

#include "actions/action.h"

#include "utils/encoding.h"

namespace memex::actions {

std::string ZeroHashHex() {
  return std::string(utils::kSha256Size * 2, '0');
}

nlohmann::json ActionToJson(const Action& action, bool include_hash) {
  nlohmann::json record = {
      {"type", action.type},
      {"payload", action.payload},
      {"timestamp", utils::FormatTimestamp(action.timestamp)},
      {"prev_hash", action.prev_hash},
      {"state_hash", action.state_hash},
  };
  if (include_hash) {
    record["hash"] = action.hash;
  }
  return record;
}

utils::Expected<Action, utils::Error> ActionFromJson(const nlohmann::json& record) {
  auto corrupted = [](const std::string& message) {
    return utils::MakeUnexpected(utils::MakeError(utils::ErrorCode::kActionLogCorrupted, message));
  };

  if (!record.is_object()) {
    return corrupted("Action record is not a JSON object");
  }
  for (const char* field : {"type", "timestamp", "prev_hash", "state_hash", "hash"}) {
    auto iter = record.find(field);
    if (iter == record.end() || !iter->is_string()) {
      return corrupted(std::string("Action record field '") + field + "' is missing or not a string");
    }
  }

  Action action;
  action.type = record["type"].get<std::string>();
  action.prev_hash = record["prev_hash"].get<std::string>();
  action.state_hash = record["state_hash"].get<std::string>();
  action.hash = record["hash"].get<std::string>();
  if (record.contains("payload")) {
    action.payload = record["payload"];
  }

  auto timestamp = utils::ParseTimestamp(record["timestamp"].get<std::string>());
  if (!timestamp) {
    return corrupted("Action record has an invalid timestamp");
  }
  action.timestamp = *timestamp;

  return action;
}

std::string ComputeActionHash(const nlohmann::json& record) {
  nlohmann::json body = record;
  if (body.is_object()) {
    body.erase("hash");
  }
  return utils::HexEncode(utils::Sha256::Hash(body.dump()));
}

}  // namespace memex::actions
