/**
 * @file action.h
 * @brief Action records of the hash-chained mutation log
 */

#pragma once

#include <string>

#include <nlohmann/json.hpp>

#include "utils/error.h"
#include "utils/expected.h"
#include "utils/sha256.h"
#include "utils/time_utils.h"

namespace memex::actions {

/**
 * @brief Action type names written to the log
 */
namespace action_types {
constexpr const char* kAddNode = "add_node";
constexpr const char* kDeleteNode = "delete_node";
constexpr const char* kAddLink = "add_link";
constexpr const char* kDeleteLink = "delete_link";
constexpr const char* kRecoverTail = "recover_tail";  ///< Written by the log itself when it sets a torn tail aside
}  // namespace action_types

/**
 * @brief One logged mutation
 *
 * Hashes are lowercase hex SHA-256 strings. `hash` covers the JSON
 * serialization of every other field, so changing any of them (or the
 * predecessor's hash) breaks the chain.
 */
struct Action {
  std::string type;                                  ///< One of action_types
  nlohmann::json payload = nlohmann::json::object();  ///< Operation arguments
  utils::Timestamp timestamp;                        ///< When the action was recorded
  std::string prev_hash;                             ///< Hash of the preceding action (zeros for the first)
  std::string state_hash;                            ///< Digest of the affected entity after the mutation
  std::string hash;                                  ///< Self hash
};

/**
 * @brief Hex string of an all-zero digest
 */
std::string ZeroHashHex();

/**
 * @brief Serialize an action
 * @param action Action to serialize
 * @param include_hash Whether to include the self hash field
 */
nlohmann::json ActionToJson(const Action& action, bool include_hash = true);

/**
 * @brief Deserialize an action
 * @return kActionLogCorrupted if a field is missing or has the wrong type
 */
utils::Expected<Action, utils::Error> ActionFromJson(const nlohmann::json& record);

/**
 * @brief Compute the self hash of a serialized action
 *
 * Any "hash" member of @p record is ignored.
 */
std::string ComputeActionHash(const nlohmann::json& record);

}  // namespace memex::actions
