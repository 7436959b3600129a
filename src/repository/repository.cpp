/**
 * @file repository.cpp
 * @brief Graph repository implementation
 */

#include "repository/repository.h"

#include <fcntl.h>
#include <unistd.h>

#include <algorithm>
#include <cerrno>
#include <chrono>
#include <cstring>
#include <filesystem>
#include <mutex>

#include "utils/encoding.h"
#include "utils/sha256.h"
#include "utils/structured_log.h"
#include "version.h"

namespace memex::repository {

namespace fs = std::filesystem;

namespace {

constexpr mode_t kFileMode = 0644;

bool PreadExact(int fd, uint8_t* buf, size_t len, off_t offset) {
  size_t done = 0;
  while (done < len) {
    ssize_t n = ::pread(fd, buf + done, len - done, offset + static_cast<off_t>(done));
    if (n < 0 && errno == EINTR) {
      continue;
    }
    if (n <= 0) {
      return false;
    }
    done += static_cast<size_t>(n);
  }
  return true;
}

bool PwriteExact(int fd, const uint8_t* buf, size_t len, off_t offset) {
  size_t done = 0;
  while (done < len) {
    ssize_t n = ::pwrite(fd, buf + done, len - done, offset + static_cast<off_t>(done));
    if (n < 0) {
      if (errno == EINTR) {
        continue;
      }
      return false;
    }
    done += static_cast<size_t>(n);
  }
  return true;
}

/**
 * @brief Metadata argument as stored: null becomes an empty object
 */
utils::Expected<nlohmann::json, utils::Error> NormalizeMeta(const nlohmann::json& meta) {
  if (meta.is_null()) {
    return nlohmann::json::object();
  }
  if (!meta.is_object()) {
    return utils::MakeUnexpected(
        utils::MakeError(utils::ErrorCode::kInvalidArgument, "Metadata must be a JSON object"));
  }
  return meta;
}

// Keyed records are named by their key, hashed records by the lowercase hex digest
std::string CanonicalId(const storage::ChunkEntry& entry) {
  return entry.keyed ? entry.address : utils::HexEncode(entry.address);
}

nlohmann::json HexChunkList(const std::vector<std::string>& addresses) {
  nlohmann::json list = nlohmann::json::array();
  for (const auto& address : addresses) {
    list.push_back(utils::HexEncode(address));
  }
  return list;
}

}  // namespace

Repository::Repository(const config::Config& config)
    : config_(config), store_(config.storage), log_(config.storage.sync_writes) {}

Repository::~Repository() {
  bool open = false;
  {
    std::shared_lock<std::shared_mutex> lock(mutex_);
    open = state_ == State::kOpen;
  }
  if (open) {
    auto close_result = Close();
    if (!close_result) {
      utils::LogRepositoryError("close", path_, close_result.error().message());
    }
  }
}

// ============================================================================
// Lifecycle
// ============================================================================

utils::Expected<void, utils::Error> Repository::Create(const std::string& path) {
  std::unique_lock<std::shared_mutex> lock(mutex_);

  if (state_ == State::kClosed) {
    return CheckOpen();
  }
  if (state_ == State::kOpen) {
    return utils::MakeUnexpected(
        utils::MakeError(utils::ErrorCode::kInvalidArgument, "Repository is already open", path_));
  }

  // A leftover log would chain the new repository onto someone else's history
  std::string log_path = actions::ActionLog::LogPathFor(path, config_.actions.dir_name);
  std::error_code ec;
  auto log_size = fs::file_size(log_path, ec);
  if (!ec && log_size > 0) {
    return utils::MakeUnexpected(
        utils::MakeError(utils::ErrorCode::kRepositoryExists, "An action log already exists for this path", log_path));
  }

  utils::FDGuard guard(::open(path.c_str(), O_RDWR | O_CREAT | O_EXCL | O_CLOEXEC, kFileMode));
  if (!guard.IsValid()) {
    if (errno == EEXIST) {
      return utils::MakeUnexpected(
          utils::MakeError(utils::ErrorCode::kRepositoryExists, "Repository file already exists", path));
    }
    std::string error_msg = std::string("Failed to create repository file: ") + std::strerror(errno);
    utils::LogStorageError("repository_create", path, error_msg);
    return utils::MakeUnexpected(utils::MakeError(utils::ErrorCode::kStorageIOError, error_msg, path));
  }

  path_ = path;
  fd_ = std::move(guard);

  auto abandon = [&](const utils::Error& error) -> utils::Expected<void, utils::Error> {
    if (fd_.Close() != 0) {
      utils::LogStorageWarning("repository_create", std::string("close() failed: ") + std::strerror(errno));
    }
    if (::unlink(path_.c_str()) != 0) {
      utils::LogStorageWarning("repository_create",
                               "Failed to remove partially created " + path_ + ": " + std::strerror(errno));
    }
    path_.clear();
    return utils::MakeUnexpected(error);
  };

  int64_t now = utils::ToUnixSeconds(std::chrono::system_clock::now());
  RepositoryHeader header;
  header.creator = Version::Creator();
  header.created = now;
  header.modified = now;

  auto persist_result = PersistHeader(header);
  if (!persist_result) {
    return abandon(persist_result.error());
  }
  header_ = header;

  auto open_result = OpenComponents();
  if (!open_result) {
    return abandon(open_result.error());
  }

  state_ = State::kOpen;
  utils::LogStorageInfo("repository_create", "Created repository " + path_);
  return {};
}

utils::Expected<void, utils::Error> Repository::Open(const std::string& path) {
  std::unique_lock<std::shared_mutex> lock(mutex_);

  if (state_ == State::kClosed) {
    return CheckOpen();
  }
  if (state_ == State::kOpen) {
    return utils::MakeUnexpected(
        utils::MakeError(utils::ErrorCode::kInvalidArgument, "Repository is already open", path_));
  }

  utils::FDGuard guard(::open(path.c_str(), O_RDWR | O_CLOEXEC));
  if (!guard.IsValid()) {
    if (errno == ENOENT) {
      return utils::MakeUnexpected(
          utils::MakeError(utils::ErrorCode::kNotFound, "Repository file does not exist", path));
    }
    std::string error_msg = std::string("Failed to open repository file: ") + std::strerror(errno);
    utils::LogStorageError("repository_open", path, error_msg);
    return utils::MakeUnexpected(utils::MakeError(utils::ErrorCode::kStorageIOError, error_msg, path));
  }

  RepositoryHeaderBytes bytes{};
  if (!PreadExact(guard.Get(), bytes.data(), bytes.size(), 0)) {
    utils::LogStorageError("repository_open", path, "file is shorter than the repository header");
    return utils::MakeUnexpected(
        utils::MakeError(utils::ErrorCode::kStorageCorrupted, "File is shorter than the repository header", path));
  }

  auto header = DecodeRepositoryHeader(bytes.data());
  if (!header) {
    utils::LogStorageError("repository_open", path, header.error().message());
    return utils::MakeUnexpected(utils::MakeError(header.error().code(), header.error().message(), path));
  }
  auto version_result = CheckFormatVersion(*header);
  if (!version_result) {
    utils::LogStorageError("repository_open", path, version_result.error().message());
    return utils::MakeUnexpected(
        utils::MakeError(version_result.error().code(), version_result.error().message(), path));
  }
  if (header->minor_version != repository_format::kMinorVersion) {
    utils::LogStorageInfo("repository_open",
                          "Opening format " + FormatVersionString(header->major_version, header->minor_version) +
                              " with a " +
                              FormatVersionString(repository_format::kMajorVersion, repository_format::kMinorVersion) +
                              " reader");
  }

  path_ = path;
  fd_ = std::move(guard);
  header_ = *header;

  auto open_result = OpenComponents();
  if (!open_result) {
    if (fd_.Close() != 0) {
      utils::LogStorageWarning("repository_open", std::string("close() failed: ") + std::strerror(errno));
    }
    path_.clear();
    return open_result;
  }

  state_ = State::kOpen;
  utils::StructuredLog()
      .Event("repository_open")
      .Field("filepath", path_)
      .Field("format", FormatVersionString(header_.major_version, header_.minor_version))
      .Field("nodes", static_cast<uint64_t>(header_.node_count))
      .Field("edges", static_cast<uint64_t>(header_.edge_count))
      .Info();
  return {};
}

utils::Expected<void, utils::Error> Repository::Close() {
  std::unique_lock<std::shared_mutex> lock(mutex_);

  if (state_ == State::kClosed) {
    return CheckOpen();
  }
  bool was_open = state_ == State::kOpen;
  state_ = State::kClosed;
  if (!was_open) {
    return {};
  }

  store_.Close();
  log_.Close();
  if (fd_.Close() != 0) {
    std::string error_msg = std::string("close() failed: ") + std::strerror(errno);
    utils::LogStorageError("repository_close", path_, error_msg);
    return utils::MakeUnexpected(utils::MakeError(utils::ErrorCode::kStorageIOError, error_msg, path_));
  }
  return {};
}

bool Repository::IsOpen() const {
  std::shared_lock<std::shared_mutex> lock(mutex_);
  return state_ == State::kOpen;
}

// ============================================================================
// Nodes
// ============================================================================

utils::Expected<std::string, utils::Error> Repository::AddNode(std::string_view content, const std::string& type,
                                                               const nlohmann::json& meta) {
  std::unique_lock<std::shared_mutex> lock(mutex_);

  auto open_check = CheckOpen();
  if (!open_check) {
    return utils::MakeUnexpected(open_check.error());
  }
  auto normalized = NormalizeMeta(meta);
  if (!normalized) {
    return utils::MakeUnexpected(normalized.error());
  }

  auto chunks = store_.Put(content, storage::RecordKind::kContent);
  if (!chunks) {
    utils::LogRepositoryError("add_node", "", chunks.error().message());
    return utils::MakeUnexpected(chunks.error());
  }

  Node node;
  node.type = type;
  node.meta = *normalized;
  node.meta[meta_keys::kChunks] = HexChunkList(*chunks);
  node.created = NextTimestamp();
  node.modified = node.created;

  auto envelope = SerializeNodeEnvelope(node, false);
  if (!envelope) {
    ReleaseChunks(*chunks, storage::RecordKind::kContent);
    return utils::MakeUnexpected(envelope.error());
  }

  auto address = store_.PutWhole(*envelope, storage::RecordKind::kNode);
  if (!address) {
    utils::LogRepositoryError("add_node", "", address.error().message());
    ReleaseChunks(*chunks, storage::RecordKind::kContent);
    return utils::MakeUnexpected(address.error());
  }
  std::string id = utils::HexEncode(*address);

  RepositoryHeader updated = header_;
  ++updated.node_count;
  updated.modified = utils::ToUnixSeconds(node.modified);
  auto persist_result = PersistHeader(updated);
  if (!persist_result) {
    ReleaseChunks({*address}, storage::RecordKind::kNode);
    ReleaseChunks(*chunks, storage::RecordKind::kContent);
    return utils::MakeUnexpected(persist_result.error());
  }
  header_ = updated;

  utils::LogRepositoryEvent("add_node", id, type);
  auto record_result = RecordAction(actions::action_types::kAddNode,
                                    {{"id", id}, {"type", type}, {"meta", *normalized}},
                                    utils::Sha256::Hash(*envelope));
  if (!record_result) {
    return utils::MakeUnexpected(record_result.error());
  }
  return id;
}

utils::Expected<void, utils::Error> Repository::AddNodeWithID(const std::string& id, std::string_view content,
                                                              const std::string& type, const nlohmann::json& meta) {
  std::unique_lock<std::shared_mutex> lock(mutex_);

  auto open_check = CheckOpen();
  if (!open_check) {
    return open_check;
  }
  if (id.empty()) {
    return utils::MakeUnexpected(utils::MakeError(utils::ErrorCode::kInvalidArgument, "Node id must not be empty"));
  }
  auto normalized = NormalizeMeta(meta);
  if (!normalized) {
    return utils::MakeUnexpected(normalized.error());
  }

  // A keyed node already stored under this id is replaced
  bool replacing = false;
  std::vector<std::string> previous_chunks;
  auto existing = store_.Stat(id);
  if (existing && existing->keyed && existing->kind == storage::RecordKind::kNode && existing->address == id) {
    auto previous_bytes = store_.Get(id);
    if (!previous_bytes) {
      return utils::MakeUnexpected(previous_bytes.error());
    }
    auto previous = ParseNodeEnvelope(*previous_bytes);
    if (previous) {
      previous_chunks = ChunkAddresses(previous->meta);
    }
    replacing = true;
  }

  auto chunks = store_.Put(content, storage::RecordKind::kContent);
  if (!chunks) {
    utils::LogRepositoryError("add_node", id, chunks.error().message());
    return utils::MakeUnexpected(chunks.error());
  }

  Node node;
  node.id = id;
  node.type = type;
  node.meta = *normalized;
  node.meta[meta_keys::kChunks] = HexChunkList(*chunks);
  node.created = NextTimestamp();
  node.modified = node.created;

  auto envelope = SerializeNodeEnvelope(node, true);
  if (!envelope) {
    ReleaseChunks(*chunks, storage::RecordKind::kContent);
    return utils::MakeUnexpected(envelope.error());
  }

  auto put_result = store_.PutWithID(id, *envelope, storage::RecordKind::kNode);
  if (!put_result) {
    utils::LogRepositoryError("add_node", id, put_result.error().message());
    ReleaseChunks(*chunks, storage::RecordKind::kContent);
    return put_result;
  }

  RepositoryHeader updated = header_;
  if (!replacing) {
    ++updated.node_count;
  }
  updated.modified = utils::ToUnixSeconds(node.modified);
  auto persist_result = PersistHeader(updated);
  if (!persist_result) {
    if (!replacing) {
      ReleaseChunks({id}, storage::RecordKind::kNode);
      ReleaseChunks(*chunks, storage::RecordKind::kContent);
    }
    return persist_result;
  }
  header_ = updated;

  if (!previous_chunks.empty()) {
    auto release_result = store_.Delete(previous_chunks, storage::RecordKind::kContent);
    if (!release_result) {
      utils::LogRepositoryError("add_node", id,
                                "Failed to release replaced content: " + release_result.error().message());
      return release_result;
    }
  }

  utils::LogRepositoryEvent(replacing ? "replace_node" : "add_node", id, type);
  return RecordAction(actions::action_types::kAddNode, {{"id", id}, {"type", type}, {"meta", *normalized}},
                      utils::Sha256::Hash(*envelope));
}

utils::Expected<Node, utils::Error> Repository::GetNode(const std::string& id) const {
  std::shared_lock<std::shared_mutex> lock(mutex_);

  auto open_check = CheckOpen();
  if (!open_check) {
    return utils::MakeUnexpected(open_check.error());
  }
  return LoadNode(id);
}

utils::Expected<std::string, utils::Error> Repository::GetContent(const std::string& id) const {
  std::shared_lock<std::shared_mutex> lock(mutex_);

  auto open_check = CheckOpen();
  if (!open_check) {
    return utils::MakeUnexpected(open_check.error());
  }
  auto node = LoadNode(id);
  if (!node) {
    return utils::MakeUnexpected(node.error());
  }
  return std::move(node->content);
}

utils::Expected<void, utils::Error> Repository::DeleteNode(const std::string& id) {
  std::unique_lock<std::shared_mutex> lock(mutex_);

  auto open_check = CheckOpen();
  if (!open_check) {
    return open_check;
  }

  auto entry = store_.Stat(id, storage::RecordKind::kNode);
  if (!entry || entry->kind != storage::RecordKind::kNode) {
    if (entry || entry.error().code() == utils::ErrorCode::kStorageChunkNotFound) {
      return utils::MakeUnexpected(utils::MakeError(utils::ErrorCode::kNodeNotFound, "Node not found", id));
    }
    return utils::MakeUnexpected(entry.error());
  }
  auto node = LoadNode(id);
  if (!node) {
    return utils::MakeUnexpected(node.error());
  }
  const std::string& node_id = node->id;

  // Links first, so no link is left pointing at a missing node
  auto links = ScanLinks();
  if (!links) {
    return utils::MakeUnexpected(links.error());
  }
  for (const auto& stored : *links) {
    if (stored.link.source == node_id || stored.link.target == node_id) {
      auto remove_result = RemoveLink(stored);
      if (!remove_result) {
        return remove_result;
      }
    }
  }

  std::vector<std::string> chunks = ChunkAddresses(node->meta);
  if (!chunks.empty()) {
    auto release_result = store_.Delete(chunks, storage::RecordKind::kContent);
    if (!release_result) {
      utils::LogRepositoryError("delete_node", id, release_result.error().message());
      return release_result;
    }
  }
  auto delete_result = store_.Delete({entry->address}, storage::RecordKind::kNode);
  if (!delete_result) {
    utils::LogRepositoryError("delete_node", id, delete_result.error().message());
    return delete_result;
  }

  RepositoryHeader updated = header_;
  if (updated.node_count > 0) {
    --updated.node_count;
  }
  updated.modified = utils::ToUnixSeconds(std::chrono::system_clock::now());
  auto persist_result = PersistHeader(updated);
  if (!persist_result) {
    return persist_result;
  }
  header_ = updated;

  utils::LogRepositoryEvent("delete_node", node_id, node->type);
  return RecordAction(actions::action_types::kDeleteNode, {{"id", node_id}}, utils::ZeroDigest());
}

utils::Expected<std::vector<std::string>, utils::Error> Repository::ListNodes() const {
  std::shared_lock<std::shared_mutex> lock(mutex_);

  auto open_check = CheckOpen();
  if (!open_check) {
    return utils::MakeUnexpected(open_check.error());
  }

  std::vector<std::string> ids;
  for (const auto& entry : store_.ListChunks(storage::RecordKind::kNode)) {
    ids.push_back(CanonicalId(entry));
  }
  std::sort(ids.begin(), ids.end());
  return ids;
}

// ============================================================================
// Links
// ============================================================================

utils::Expected<void, utils::Error> Repository::AddLink(const std::string& source, const std::string& target,
                                                        const std::string& type, const nlohmann::json& meta) {
  std::unique_lock<std::shared_mutex> lock(mutex_);

  auto open_check = CheckOpen();
  if (!open_check) {
    return open_check;
  }
  auto normalized = NormalizeMeta(meta);
  if (!normalized) {
    return utils::MakeUnexpected(normalized.error());
  }

  std::string endpoints[2];
  const std::string* requested[2] = {&source, &target};
  for (size_t i = 0; i < 2; ++i) {
    auto resolved = ResolveNodeId(*requested[i]);
    if (!resolved) {
      if (resolved.error().code() == utils::ErrorCode::kNodeNotFound) {
        return utils::MakeUnexpected(utils::MakeError(utils::ErrorCode::kLinkEndpointMissing,
                                                      "Link endpoint does not exist", *requested[i]));
      }
      return utils::MakeUnexpected(resolved.error());
    }
    endpoints[i] = std::move(*resolved);
  }

  Link link;
  link.source = endpoints[0];
  link.target = endpoints[1];
  link.type = type;
  link.meta = *normalized;
  link.created = NextTimestamp();
  link.modified = link.created;

  auto envelope = SerializeLinkEnvelope(link);
  if (!envelope) {
    return utils::MakeUnexpected(envelope.error());
  }
  auto address = store_.PutWhole(*envelope, storage::RecordKind::kLink);
  if (!address) {
    utils::LogRepositoryError("add_link", link.source + "->" + link.target, address.error().message());
    return utils::MakeUnexpected(address.error());
  }

  RepositoryHeader updated = header_;
  ++updated.edge_count;
  updated.modified = utils::ToUnixSeconds(link.modified);
  auto persist_result = PersistHeader(updated);
  if (!persist_result) {
    ReleaseChunks({*address}, storage::RecordKind::kLink);
    return persist_result;
  }
  header_ = updated;

  utils::LogRepositoryEvent("add_link", link.source + "->" + link.target, type);
  return RecordAction(actions::action_types::kAddLink,
                      {{"source", link.source}, {"target", link.target}, {"type", type}, {"meta", *normalized}},
                      utils::Sha256::Hash(*envelope));
}

utils::Expected<std::vector<Link>, utils::Error> Repository::GetLinks(const std::string& node_id) const {
  std::shared_lock<std::shared_mutex> lock(mutex_);

  auto open_check = CheckOpen();
  if (!open_check) {
    return utils::MakeUnexpected(open_check.error());
  }

  auto canonical = CanonicalNodeId(node_id);
  if (!canonical) {
    return utils::MakeUnexpected(canonical.error());
  }

  auto stored = ScanLinks();
  if (!stored) {
    return utils::MakeUnexpected(stored.error());
  }
  std::vector<Link> links;
  for (auto& item : *stored) {
    if (item.link.source == *canonical || item.link.target == *canonical) {
      links.push_back(std::move(item.link));
    }
  }
  return links;
}

utils::Expected<void, utils::Error> Repository::DeleteLink(const std::string& source, const std::string& target,
                                                           const std::string& type) {
  std::unique_lock<std::shared_mutex> lock(mutex_);

  auto open_check = CheckOpen();
  if (!open_check) {
    return open_check;
  }

  auto canonical_source = CanonicalNodeId(source);
  if (!canonical_source) {
    return utils::MakeUnexpected(canonical_source.error());
  }
  auto canonical_target = CanonicalNodeId(target);
  if (!canonical_target) {
    return utils::MakeUnexpected(canonical_target.error());
  }

  auto stored = ScanLinks();
  if (!stored) {
    return utils::MakeUnexpected(stored.error());
  }
  auto match = std::find_if(stored->begin(), stored->end(), [&](const StoredLink& item) {
    return item.link.source == *canonical_source && item.link.target == *canonical_target && item.link.type == type;
  });
  if (match == stored->end()) {
    return {};
  }
  return RemoveLink(*match);
}

utils::Expected<std::vector<Link>, utils::Error> Repository::ListLinks() const {
  std::shared_lock<std::shared_mutex> lock(mutex_);

  auto open_check = CheckOpen();
  if (!open_check) {
    return utils::MakeUnexpected(open_check.error());
  }

  auto stored = ScanLinks();
  if (!stored) {
    return utils::MakeUnexpected(stored.error());
  }
  std::vector<Link> links;
  links.reserve(stored->size());
  for (auto& item : *stored) {
    links.push_back(std::move(item.link));
  }
  return links;
}

// ============================================================================
// Summary and history
// ============================================================================

utils::Expected<RepositoryStats, utils::Error> Repository::GetStats() const {
  std::shared_lock<std::shared_mutex> lock(mutex_);

  auto open_check = CheckOpen();
  if (!open_check) {
    return utils::MakeUnexpected(open_check.error());
  }

  RepositoryStats stats;
  stats.header = header_;
  stats.chunk_count = store_.GetChunkCount();
  stats.file_size = store_.GetFileSize();
  stats.path = path_;
  stats.action_log_path = log_.GetPath();
  return stats;
}

utils::Expected<std::vector<actions::Action>, utils::Error> Repository::GetHistory() const {
  std::shared_lock<std::shared_mutex> lock(mutex_);

  auto open_check = CheckOpen();
  if (!open_check) {
    return utils::MakeUnexpected(open_check.error());
  }
  return log_.GetHistory();
}

utils::Expected<bool, utils::Error> Repository::VerifyHistory() const {
  std::shared_lock<std::shared_mutex> lock(mutex_);

  auto open_check = CheckOpen();
  if (!open_check) {
    return utils::MakeUnexpected(open_check.error());
  }
  return log_.VerifyHistory();
}

// ============================================================================
// Private helpers
// ============================================================================

utils::Expected<void, utils::Error> Repository::CheckOpen() const {
  if (state_ != State::kOpen) {
    return utils::MakeUnexpected(utils::MakeError(utils::ErrorCode::kRepositoryClosed, "Repository is not open",
                                                  state_ == State::kClosed ? "closed" : "unopened"));
  }
  return {};
}

utils::Expected<void, utils::Error> Repository::OpenComponents() {
  auto store_result = store_.Open(path_, repository_format::kHeaderSize);
  if (!store_result) {
    return store_result;
  }
  auto log_result = log_.Open(actions::ActionLog::LogPathFor(path_, config_.actions.dir_name));
  if (!log_result) {
    store_.Close();
    return log_result;
  }
  return {};
}

utils::Expected<void, utils::Error> Repository::PersistHeader(const RepositoryHeader& header) {
  RepositoryHeaderBytes bytes = EncodeRepositoryHeader(header);
  if (!PwriteExact(fd_.Get(), bytes.data(), bytes.size(), 0)) {
    std::string error_msg = std::string("Failed to write repository header: ") + std::strerror(errno);
    utils::LogStorageError("repository_header", path_, error_msg);
    return utils::MakeUnexpected(utils::MakeError(utils::ErrorCode::kStorageIOError, error_msg, path_));
  }
  if (config_.storage.sync_writes && ::fsync(fd_.Get()) != 0) {
    std::string error_msg = std::string("fsync() failed: ") + std::strerror(errno);
    utils::LogStorageError("repository_header", path_, error_msg);
    return utils::MakeUnexpected(utils::MakeError(utils::ErrorCode::kStorageIOError, error_msg, path_));
  }
  return {};
}

utils::Expected<Node, utils::Error> Repository::LoadNode(const std::string& id) const {
  auto entry = store_.Stat(id, storage::RecordKind::kNode);
  if (!entry) {
    if (entry.error().code() == utils::ErrorCode::kStorageChunkNotFound) {
      return utils::MakeUnexpected(utils::MakeError(utils::ErrorCode::kNodeNotFound, "Node not found", id));
    }
    return utils::MakeUnexpected(entry.error());
  }
  if (entry->kind != storage::RecordKind::kNode) {
    return utils::MakeUnexpected(utils::MakeError(utils::ErrorCode::kNodeNotFound, "Id does not name a node", id));
  }

  auto bytes = store_.Get(id, storage::RecordKind::kNode);
  if (!bytes) {
    return utils::MakeUnexpected(bytes.error());
  }

  Node node;
  auto parsed = ParseNodeEnvelope(*bytes);
  if (parsed) {
    node = std::move(*parsed);
    auto content = store_.Get(ChunkAddresses(node.meta));
    if (!content) {
      utils::LogRepositoryError("get_node", id, content.error().message());
      return utils::MakeUnexpected(content.error());
    }
    node.content = std::move(*content);
  } else {
    // Not an envelope: expose the stored bytes as opaque content
    node.content = std::move(*bytes);
  }
  node.id = CanonicalId(*entry);
  return node;
}

utils::Expected<std::string, utils::Error> Repository::ResolveNodeId(const std::string& id) const {
  auto entry = store_.Stat(id, storage::RecordKind::kNode);
  if (!entry) {
    if (entry.error().code() == utils::ErrorCode::kStorageChunkNotFound) {
      return utils::MakeUnexpected(utils::MakeError(utils::ErrorCode::kNodeNotFound, "Node not found", id));
    }
    return utils::MakeUnexpected(entry.error());
  }
  if (entry->kind != storage::RecordKind::kNode) {
    return utils::MakeUnexpected(utils::MakeError(utils::ErrorCode::kNodeNotFound, "Id does not name a node", id));
  }
  return CanonicalId(*entry);
}

utils::Expected<std::string, utils::Error> Repository::CanonicalNodeId(const std::string& id) const {
  auto resolved = ResolveNodeId(id);
  if (!resolved && resolved.error().code() == utils::ErrorCode::kNodeNotFound) {
    return id;
  }
  return resolved;
}

utils::Expected<std::vector<Repository::StoredLink>, utils::Error> Repository::ScanLinks() const {
  std::vector<StoredLink> links;

  for (const auto& entry : store_.ListChunks(storage::RecordKind::kLink)) {
    auto bytes = store_.Get(entry.address, storage::RecordKind::kLink);
    if (!bytes) {
      return utils::MakeUnexpected(bytes.error());
    }
    auto link = ParseLinkEnvelope(*bytes);
    if (!link) {
      utils::StructuredLog()
          .Event("link_envelope_skipped")
          .Field("offset", entry.offset)
          .Field("reason", link.error().message())
          .Debug();
      continue;
    }
    links.push_back(StoredLink{entry.address, std::move(*link)});
  }

  std::stable_sort(links.begin(), links.end(),
                   [](const StoredLink& lhs, const StoredLink& rhs) { return LinkOrderLess(lhs.link, rhs.link); });
  return links;
}

utils::Expected<void, utils::Error> Repository::RemoveLink(const StoredLink& stored) {
  auto delete_result = store_.Delete({stored.address}, storage::RecordKind::kLink);
  if (!delete_result) {
    utils::LogRepositoryError("delete_link", stored.link.source + "->" + stored.link.target,
                              delete_result.error().message());
    return delete_result;
  }

  RepositoryHeader updated = header_;
  if (updated.edge_count > 0) {
    --updated.edge_count;
  }
  updated.modified = utils::ToUnixSeconds(std::chrono::system_clock::now());
  auto persist_result = PersistHeader(updated);
  if (!persist_result) {
    return persist_result;
  }
  header_ = updated;

  utils::LogRepositoryEvent("delete_link", stored.link.source + "->" + stored.link.target, stored.link.type);
  return RecordAction(actions::action_types::kDeleteLink,
                      {{"source", stored.link.source}, {"target", stored.link.target}, {"type", stored.link.type}},
                      utils::ZeroDigest());
}

utils::Expected<void, utils::Error> Repository::RecordAction(const std::string& type, const nlohmann::json& payload,
                                                             const utils::Digest& state_hash) {
  auto recorded = log_.RecordAction(type, payload, state_hash);
  if (!recorded) {
    // The data change is already durable; the log is now behind it
    utils::LogRepositoryError(type, path_, "Failed to record action: " + recorded.error().message());
    return utils::MakeUnexpected(recorded.error());
  }
  return {};
}

void Repository::ReleaseChunks(const std::vector<std::string>& addresses, storage::RecordKind kind) {
  if (addresses.empty()) {
    return;
  }
  auto release_result = store_.Delete(addresses, kind);
  if (!release_result) {
    utils::LogStorageWarning("repository_rollback",
                             "Failed to release records of an aborted mutation: " + release_result.error().message());
  }
}

utils::Timestamp Repository::NextTimestamp() {
  // Strictly increasing, so two envelopes written back to back never collide
  utils::Timestamp now = std::chrono::system_clock::now();
  if (now <= last_timestamp_) {
    now = last_timestamp_ + std::chrono::system_clock::duration(1);
  }
  last_timestamp_ = now;
  return now;
}

}  // namespace memex::repository
