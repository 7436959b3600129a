/**
 * @file node.cpp
 * @brief Node and link envelope serialization
 */

#include "repository/node.h"

namespace memex::repository {

namespace {

/**
 * @brief Read a required RFC 3339 timestamp field
 */
bool ReadTimestamp(const nlohmann::json& object, const char* key, utils::Timestamp* out) {
  auto iter = object.find(key);
  if (iter == object.end() || !iter->is_string()) {
    return false;
  }
  auto parsed = utils::ParseTimestamp(iter->get<std::string>());
  if (!parsed) {
    return false;
  }
  *out = *parsed;
  return true;
}

bool ReadString(const nlohmann::json& object, const char* key, std::string* out) {
  auto iter = object.find(key);
  if (iter == object.end() || !iter->is_string()) {
    return false;
  }
  *out = iter->get<std::string>();
  return true;
}

/**
 * @brief Parse bytes as a JSON object without throwing
 */
nlohmann::json ParseObject(std::string_view bytes) {
  auto parsed = nlohmann::json::parse(bytes.begin(), bytes.end(), nullptr, false);
  if (parsed.is_discarded() || !parsed.is_object()) {
    return nlohmann::json();
  }
  return parsed;
}

utils::Unexpected<utils::Error> InvalidEnvelope(const std::string& what) {
  return utils::MakeUnexpected(utils::MakeError(utils::ErrorCode::kEnvelopeInvalid, what));
}

}  // namespace

utils::Expected<std::string, utils::Error> SerializeNodeEnvelope(const Node& node, bool include_id) {
  try {
    nlohmann::json envelope;
    if (include_id) {
      envelope["id"] = node.id;
    }
    envelope["type"] = node.type;
    envelope["meta"] = node.meta.is_object() ? node.meta : nlohmann::json::object();
    envelope["created"] = utils::FormatTimestamp(node.created);
    envelope["modified"] = utils::FormatTimestamp(node.modified);
    return envelope.dump();
  } catch (const nlohmann::json::exception& e) {
    return InvalidEnvelope(std::string("Failed to serialize node: ") + e.what());
  }
}

utils::Expected<Node, utils::Error> ParseNodeEnvelope(std::string_view bytes) {
  nlohmann::json envelope = ParseObject(bytes);
  if (envelope.is_null()) {
    return InvalidEnvelope("Node envelope is not a JSON object");
  }

  Node node;
  if (!ReadString(envelope, "type", &node.type)) {
    return InvalidEnvelope("Node envelope has no type");
  }
  auto meta_iter = envelope.find("meta");
  if (meta_iter == envelope.end() || !meta_iter->is_object()) {
    return InvalidEnvelope("Node envelope has no meta object");
  }
  node.meta = *meta_iter;
  if (!ReadTimestamp(envelope, "created", &node.created) || !ReadTimestamp(envelope, "modified", &node.modified)) {
    return InvalidEnvelope("Node envelope has invalid timestamps");
  }
  // Optional, present for caller-keyed nodes
  if (envelope.contains("id") && !ReadString(envelope, "id", &node.id)) {
    return InvalidEnvelope("Node envelope id is not a string");
  }

  return node;
}

utils::Expected<std::string, utils::Error> SerializeLinkEnvelope(const Link& link) {
  try {
    nlohmann::json envelope;
    envelope["source"] = link.source;
    envelope["target"] = link.target;
    envelope["type"] = link.type;
    envelope["meta"] = link.meta.is_object() ? link.meta : nlohmann::json::object();
    envelope["created"] = utils::FormatTimestamp(link.created);
    envelope["modified"] = utils::FormatTimestamp(link.modified);
    return envelope.dump();
  } catch (const nlohmann::json::exception& e) {
    return InvalidEnvelope(std::string("Failed to serialize link: ") + e.what());
  }
}

utils::Expected<Link, utils::Error> ParseLinkEnvelope(std::string_view bytes) {
  nlohmann::json envelope = ParseObject(bytes);
  if (envelope.is_null()) {
    return InvalidEnvelope("Link envelope is not a JSON object");
  }

  Link link;
  if (!ReadString(envelope, "source", &link.source) || !ReadString(envelope, "target", &link.target) ||
      !ReadString(envelope, "type", &link.type)) {
    return InvalidEnvelope("Link envelope is missing source, target or type");
  }
  auto meta_iter = envelope.find("meta");
  if (meta_iter != envelope.end() && meta_iter->is_object()) {
    link.meta = *meta_iter;
  }
  if (!ReadTimestamp(envelope, "created", &link.created) || !ReadTimestamp(envelope, "modified", &link.modified)) {
    return InvalidEnvelope("Link envelope has invalid timestamps");
  }

  return link;
}

std::vector<std::string> ChunkAddresses(const nlohmann::json& meta) {
  std::vector<std::string> addresses;
  if (!meta.is_object()) {
    return addresses;
  }
  auto iter = meta.find(meta_keys::kChunks);
  if (iter == meta.end() || !iter->is_array()) {
    return addresses;
  }
  for (const auto& item : *iter) {
    if (item.is_string()) {
      addresses.push_back(item.get<std::string>());
    }
  }
  return addresses;
}

bool LinkOrderLess(const Link& lhs, const Link& rhs) {
  if (lhs.created != rhs.created) {
    return lhs.created < rhs.created;
  }
  auto lhs_order = lhs.meta.find(meta_keys::kOrder);
  auto rhs_order = rhs.meta.find(meta_keys::kOrder);
  if (lhs_order != lhs.meta.end() && rhs_order != rhs.meta.end() && lhs_order->is_number() &&
      rhs_order->is_number()) {
    return lhs_order->get<double>() < rhs_order->get<double>();
  }
  return false;
}

}  // namespace memex::repository
