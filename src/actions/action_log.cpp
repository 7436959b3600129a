/**
 * @file action_log.cpp
 * @brief Hash-chained action log implementation
 */

#include "actions/action_log.h"

#include <fcntl.h>
#include <unistd.h>

#include <cerrno>
#include <chrono>
#include <cstring>
#include <filesystem>
#include <fstream>
#include <sstream>
#include <string_view>

#include "utils/encoding.h"
#include "utils/endian.h"
#include "utils/structured_log.h"

namespace memex::actions {

namespace fs = std::filesystem;

namespace {

constexpr mode_t kFileMode = 0644;

/**
 * @brief write() until all bytes are written
 */
bool WriteFull(int fd, const char* data, size_t len) {
  size_t done = 0;
  while (done < len) {
    ssize_t n = ::write(fd, data + done, len - done);
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
 * @brief Try to interpret data[offset..] as one complete, self-consistent record
 * @return Record end offset, or 0 if the bytes do not form a valid record
 */
size_t RecordEndAt(const std::string& data, size_t offset, std::string* hash_out) {
  if (offset + kLengthPrefixSize > data.size()) {
    return 0;
  }
  uint32_t len = utils::LoadLE32(reinterpret_cast<const uint8_t*>(data.data() + offset));
  size_t body = offset + kLengthPrefixSize;
  if (len < 2 || len > kMaxRecordSize || len > data.size() - body) {
    return 0;
  }
  if (data[body] != '{' || data[body + len - 1] != '}') {
    return 0;
  }

  auto record = nlohmann::json::parse(data.begin() + static_cast<std::ptrdiff_t>(body),
                                      data.begin() + static_cast<std::ptrdiff_t>(body + len), nullptr, false);
  if (record.is_discarded() || !record.is_object()) {
    return 0;
  }
  auto hash_iter = record.find("hash");
  if (hash_iter == record.end() || !hash_iter->is_string()) {
    return 0;
  }
  std::string stored_hash = hash_iter->get<std::string>();
  if (ComputeActionHash(record) != stored_hash) {
    return 0;
  }

  *hash_out = stored_hash;
  return body + len;
}

/**
 * @brief Whether data[offset..] is a record cut short by a crash mid-append
 *
 * Either the length prefix itself is incomplete, or it holds a plausible
 * length that reaches past the end of the file and the body written so far
 * starts like a record.
 */
bool IsTornFrame(const std::string& data, size_t offset) {
  size_t tail = data.size() - offset;
  if (tail < kLengthPrefixSize) {
    return true;
  }
  uint32_t len = utils::LoadLE32(reinterpret_cast<const uint8_t*>(data.data() + offset));
  if (len < 2 || len > kMaxRecordSize || len <= tail - kLengthPrefixSize) {
    return false;
  }
  return tail == kLengthPrefixSize || data[offset + kLengthPrefixSize] == '{';
}

}  // namespace

utils::Expected<std::vector<nlohmann::json>, utils::Error> ParseRecords(const std::string& data) {
  std::vector<nlohmann::json> records;
  size_t pos = 0;

  while (pos < data.size()) {
    if (data.size() - pos < kLengthPrefixSize) {
      return utils::MakeUnexpected(utils::MakeError(utils::ErrorCode::kActionLogCorrupted,
                                                    "Truncated length prefix", "offset " + std::to_string(pos)));
    }
    uint32_t len = utils::LoadLE32(reinterpret_cast<const uint8_t*>(data.data() + pos));
    pos += kLengthPrefixSize;
    if (len > kMaxRecordSize || len > data.size() - pos) {
      return utils::MakeUnexpected(utils::MakeError(utils::ErrorCode::kActionLogCorrupted, "Truncated record",
                                                    "offset " + std::to_string(pos - kLengthPrefixSize)));
    }

    auto record = nlohmann::json::parse(data.begin() + static_cast<std::ptrdiff_t>(pos),
                                        data.begin() + static_cast<std::ptrdiff_t>(pos + len), nullptr, false);
    if (record.is_discarded()) {
      return utils::MakeUnexpected(utils::MakeError(utils::ErrorCode::kActionLogCorrupted, "Record is not valid JSON",
                                                    "offset " + std::to_string(pos - kLengthPrefixSize)));
    }
    records.push_back(std::move(record));
    pos += len;
  }

  return records;
}

ActionLog::ActionLog(bool sync_writes) : sync_writes_(sync_writes), last_hash_(ZeroHashHex()) {}

ActionLog::~ActionLog() {
  Close();
}

std::string ActionLog::LogPathFor(const std::string& repository_path, const std::string& dir_name) {
  fs::path repo(repository_path);
  return (repo.parent_path() / dir_name / (repo.filename().string() + ".log")).string();
}

utils::Expected<void, utils::Error> ActionLog::Open(const std::string& path) {
  std::lock_guard<std::mutex> lock(mutex_);

  if (fd_.IsValid()) {
    return utils::MakeUnexpected(
        utils::MakeError(utils::ErrorCode::kInvalidArgument, "Action log is already open", path_));
  }

  std::error_code ec;
  fs::path parent = fs::path(path).parent_path();
  if (!parent.empty()) {
    fs::create_directories(parent, ec);
    if (ec) {
      utils::LogActionLogError("open", path, "Failed to create directory: " + ec.message());
      return utils::MakeUnexpected(utils::MakeError(utils::ErrorCode::kActionLogIOError,
                                                    "Failed to create action log directory: " + ec.message(),
                                                    parent.string()));
    }
  }

  utils::FDGuard guard(::open(path.c_str(), O_RDWR | O_CREAT | O_APPEND | O_CLOEXEC, kFileMode));
  if (!guard.IsValid()) {
    std::string error_msg = std::string("Failed to open action log: ") + std::strerror(errno);
    utils::LogActionLogError("open", path, error_msg);
    return utils::MakeUnexpected(utils::MakeError(utils::ErrorCode::kActionLogIOError, error_msg, path));
  }

  path_ = path;
  fd_ = std::move(guard);

  auto recover_result = RecoverLastHash();
  if (!recover_result) {
    fd_.Close();
    return recover_result;
  }
  return {};
}

void ActionLog::Close() {
  std::lock_guard<std::mutex> lock(mutex_);
  if (fd_.IsValid() && fd_.Close() != 0) {
    utils::LogActionLogWarning("close", path_, std::string("close() failed: ") + std::strerror(errno));
  }
}

utils::Expected<void, utils::Error> ActionLog::RecoverLastHash() {
  auto data = ReadFile();
  if (!data) {
    return utils::MakeUnexpected(data.error());
  }

  last_hash_ = ZeroHashHex();
  if (data->empty()) {
    return {};
  }

  // Scan backward for the last offset that holds a complete, valid record
  size_t record_end = 0;
  std::string hash;
  if (data->size() >= kLengthPrefixSize) {
    for (size_t offset = data->size() - kLengthPrefixSize + 1; offset-- > 0;) {
      record_end = RecordEndAt(*data, offset, &hash);
      if (record_end != 0) {
        break;
      }
    }
  }

  if (record_end == 0) {
    // The first append never completed: the chain starts over from zeros
    if (!IsTornFrame(*data, 0)) {
      utils::LogActionLogError("recover", path_, "no valid action record found");
      return utils::MakeUnexpected(
          utils::MakeError(utils::ErrorCode::kActionLogCorrupted, "Action log contains no valid record", path_));
    }
    return SetAsideTail(*data, 0);
  }
  last_hash_ = hash;

  if (record_end == data->size()) {
    return {};
  }
  if (!IsTornFrame(*data, record_end)) {
    utils::LogActionLogWarning("recover", path_,
                               "Records after offset " + std::to_string(record_end) +
                                   " are invalid; chaining new actions to the last valid one");
    return {};
  }
  return SetAsideTail(*data, record_end);
}

utils::Expected<void, utils::Error> ActionLog::SetAsideTail(const std::string& data, size_t offset) {
  std::string_view tail(data.data() + offset, data.size() - offset);
  std::string torn_path = path_ + kTornSuffix;

  // The tail is kept before it is cut from the log
  utils::FDGuard torn(::open(torn_path.c_str(), O_WRONLY | O_CREAT | O_APPEND | O_CLOEXEC, kFileMode));
  if (!torn.IsValid()) {
    std::string error_msg = std::string("Failed to open torn tail file: ") + std::strerror(errno);
    utils::LogActionLogError("recover", torn_path, error_msg);
    return utils::MakeUnexpected(utils::MakeError(utils::ErrorCode::kActionLogIOError, error_msg, torn_path));
  }
  off_t torn_offset = ::lseek(torn.Get(), 0, SEEK_END);
  if (torn_offset < 0 || !WriteFull(torn.Get(), tail.data(), tail.size()) ||
      (sync_writes_ && ::fsync(torn.Get()) != 0)) {
    std::string error_msg = std::string("Failed to save torn tail: ") + std::strerror(errno);
    utils::LogActionLogError("recover", torn_path, error_msg);
    return utils::MakeUnexpected(utils::MakeError(utils::ErrorCode::kActionLogIOError, error_msg, torn_path));
  }

  if (::ftruncate(fd_.Get(), static_cast<off_t>(offset)) != 0) {
    std::string error_msg = std::string("Failed to truncate torn tail: ") + std::strerror(errno);
    utils::LogActionLogError("recover", path_, error_msg);
    return utils::MakeUnexpected(utils::MakeError(utils::ErrorCode::kActionLogIOError, error_msg, path_));
  }
  utils::LogActionLogWarning("recover", path_,
                             "Moved " + std::to_string(tail.size()) + " bytes of an incomplete record at offset " +
                                 std::to_string(offset) + " to " + torn_path);

  nlohmann::json payload = {{"offset", static_cast<uint64_t>(offset)},
                            {"bytes", static_cast<uint64_t>(tail.size())},
                            {"sha256", utils::HexEncode(utils::Sha256::Hash(tail))},
                            {"torn_file", torn_path},
                            {"torn_offset", static_cast<int64_t>(torn_offset)}};
  auto recorded = AppendLocked(action_types::kRecoverTail, payload, utils::ZeroDigest());
  if (!recorded) {
    return utils::MakeUnexpected(recorded.error());
  }
  return {};
}

utils::Expected<Action, utils::Error> ActionLog::RecordAction(const std::string& type, const nlohmann::json& payload,
                                                              const utils::Digest& state_hash) {
  std::lock_guard<std::mutex> lock(mutex_);

  if (!fd_.IsValid()) {
    return utils::MakeUnexpected(utils::MakeError(utils::ErrorCode::kInvalidArgument, "Action log is not open"));
  }
  return AppendLocked(type, payload, state_hash);
}

utils::Expected<Action, utils::Error> ActionLog::AppendLocked(const std::string& type, const nlohmann::json& payload,
                                                              const utils::Digest& state_hash) {
  Action action;
  action.type = type;
  action.payload = payload.is_null() ? nlohmann::json::object() : payload;
  action.timestamp = std::chrono::system_clock::now();
  action.prev_hash = last_hash_;
  action.state_hash = utils::HexEncode(state_hash);

  std::string body;
  try {
    nlohmann::json record = ActionToJson(action, false);
    action.hash = ComputeActionHash(record);
    record["hash"] = action.hash;
    body = record.dump();
  } catch (const nlohmann::json::exception& e) {
    utils::LogActionLogError("record", path_, e.what());
    return utils::MakeUnexpected(utils::MakeError(utils::ErrorCode::kActionLogSerializationError,
                                                  std::string("Failed to serialize action: ") + e.what(), type));
  }

  if (body.size() > kMaxRecordSize) {
    return utils::MakeUnexpected(
        utils::MakeError(utils::ErrorCode::kActionLogSerializationError, "Action record too large", type));
  }

  std::string frame(kLengthPrefixSize, '\0');
  utils::StoreLE32(reinterpret_cast<uint8_t*>(frame.data()), static_cast<uint32_t>(body.size()));
  frame.append(body);

  if (!WriteFull(fd_.Get(), frame.data(), frame.size())) {
    std::string error_msg = std::string("Failed to append action: ") + std::strerror(errno);
    utils::LogActionLogError("record", path_, error_msg);
    return utils::MakeUnexpected(utils::MakeError(utils::ErrorCode::kActionLogIOError, error_msg, path_));
  }
  if (sync_writes_ && ::fsync(fd_.Get()) != 0) {
    std::string error_msg = std::string("fsync() failed: ") + std::strerror(errno);
    utils::LogActionLogError("record", path_, error_msg);
    return utils::MakeUnexpected(utils::MakeError(utils::ErrorCode::kActionLogIOError, error_msg, path_));
  }

  last_hash_ = action.hash;
  return action;
}

utils::Expected<std::vector<Action>, utils::Error> ActionLog::GetHistory() const {
  std::lock_guard<std::mutex> lock(mutex_);

  auto data = ReadFile();
  if (!data) {
    return utils::MakeUnexpected(data.error());
  }
  auto records = ParseRecords(*data);
  if (!records) {
    return utils::MakeUnexpected(records.error());
  }

  std::vector<Action> history;
  history.reserve(records->size());
  for (const auto& record : *records) {
    auto action = ActionFromJson(record);
    if (!action) {
      return utils::MakeUnexpected(action.error());
    }
    history.push_back(std::move(*action));
  }
  return history;
}

utils::Expected<bool, utils::Error> ActionLog::VerifyHistory() const {
  std::lock_guard<std::mutex> lock(mutex_);

  auto data = ReadFile();
  if (!data) {
    return utils::MakeUnexpected(data.error());
  }
  auto records = ParseRecords(*data);
  if (!records) {
    utils::LogActionLogWarning("verify", path_, records.error().message());
    return false;
  }

  std::string expected_prev = ZeroHashHex();
  for (size_t i = 0; i < records->size(); ++i) {
    const auto& record = (*records)[i];
    auto action = ActionFromJson(record);
    if (!action) {
      utils::LogActionLogWarning("verify", path_,
                                 "Action " + std::to_string(i) + ": " + action.error().message());
      return false;
    }
    if (action->prev_hash != expected_prev) {
      utils::LogActionLogWarning("verify", path_, "Action " + std::to_string(i) + " does not link to its predecessor");
      return false;
    }
    std::string recomputed = ComputeActionHash(record);
    if (recomputed != action->hash) {
      utils::LogActionLogWarning("verify", path_, "Action " + std::to_string(i) + " hash mismatch");
      return false;
    }
    expected_prev = recomputed;
  }
  return true;
}

std::string ActionLog::GetLastHash() const {
  std::lock_guard<std::mutex> lock(mutex_);
  return last_hash_;
}

utils::Expected<std::string, utils::Error> ActionLog::ReadFile() const {
  if (path_.empty()) {
    return utils::MakeUnexpected(utils::MakeError(utils::ErrorCode::kInvalidArgument, "Action log is not open"));
  }

  std::ifstream ifs(path_, std::ios::binary);
  if (!ifs) {
    utils::LogActionLogError("read", path_, "Failed to open for reading");
    return utils::MakeUnexpected(
        utils::MakeError(utils::ErrorCode::kActionLogIOError, "Failed to open action log for reading", path_));
  }
  std::ostringstream contents;
  contents << ifs.rdbuf();
  if (ifs.bad()) {
    utils::LogActionLogError("read", path_, "Read error");
    return utils::MakeUnexpected(
        utils::MakeError(utils::ErrorCode::kActionLogIOError, "Failed to read action log", path_));
  }
  return contents.str();
}

}  // namespace memex::actions
