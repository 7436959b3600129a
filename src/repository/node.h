/**
 * @file node.h
 * @brief Node and link types and their stored JSON envelopes
 */

#pragma once

#include <string>
#include <string_view>
#include <vector>

#include <nlohmann/json.hpp>

#include "utils/error.h"
#include "utils/expected.h"
#include "utils/time_utils.h"

namespace memex::repository {

/**
 * @brief Reserved metadata keys
 */
namespace meta_keys {
constexpr const char* kChunks = "chunks";  ///< Hex chunk addresses of the node content, in order
constexpr const char* kOrder = "order";    ///< Numeric tie-breaker for links created at the same instant
}  // namespace meta_keys

/**
 * @brief A typed node with content
 */
struct Node {
  std::string id;                                  ///< Caller id, or hex hash of the envelope
  std::string type;                                ///< Free-form type tag
  std::string content;                             ///< Raw content bytes
  nlohmann::json meta = nlohmann::json::object();  ///< Metadata (always has "chunks" once stored)
  utils::Timestamp created;
  utils::Timestamp modified;
};

/**
 * @brief A typed, directed relationship between two nodes
 */
struct Link {
  std::string source;
  std::string target;
  std::string type;
  nlohmann::json meta = nlohmann::json::object();
  utils::Timestamp created;
  utils::Timestamp modified;
};

/**
 * @brief Serialize the stored form of a node
 *
 * The envelope holds `type`, `meta`, `created` and `modified`; content lives
 * in the chunks listed in `meta.chunks`. `id` is included for caller-keyed
 * nodes only, since a content-addressed node's id is the envelope's own hash.
 *
 * @return kEnvelopeInvalid if the metadata cannot be serialized (e.g. invalid UTF-8)
 */
utils::Expected<std::string, utils::Error> SerializeNodeEnvelope(const Node& node, bool include_id);

/**
 * @brief Parse a stored node envelope (content is left empty)
 * @return kEnvelopeInvalid if the bytes are not a node envelope
 */
utils::Expected<Node, utils::Error> ParseNodeEnvelope(std::string_view bytes);

/**
 * @brief Serialize the stored form of a link
 */
utils::Expected<std::string, utils::Error> SerializeLinkEnvelope(const Link& link);

/**
 * @brief Parse a stored link envelope
 * @return kEnvelopeInvalid if the bytes are not a link envelope
 */
utils::Expected<Link, utils::Error> ParseLinkEnvelope(std::string_view bytes);

/**
 * @brief Hex chunk addresses listed in node metadata
 *
 * Entries that are not strings are ignored.
 */
std::vector<std::string> ChunkAddresses(const nlohmann::json& meta);

/**
 * @brief Ordering used by GetLinks(): creation time, then numeric meta "order"
 */
bool LinkOrderLess(const Link& lhs, const Link& rhs);

}  // namespace memex::repository
