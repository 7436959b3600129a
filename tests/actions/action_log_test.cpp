/**
 * @file action_log_test.cpp
 * @brief Unit tests for the hash-chained action log
 */

#include "actions/action_log.h"

#include <gtest/gtest.h>

#include <filesystem>
#include <fstream>
#include <iterator>
#include <memory>

#include "utils/encoding.h"
#include "utils/endian.h"
#include "utils/sha256.h"

namespace memex::actions {
namespace {

class ActionLogTest : public ::testing::Test {
 protected:
  void SetUp() override {
    dir_ = std::filesystem::temp_directory_path() /
           ("memex_action_log_test_" + std::string(::testing::UnitTest::GetInstance()->current_test_info()->name()));
    std::filesystem::remove_all(dir_);
    path_ = ActionLog::LogPathFor((dir_ / "repo.memex").string(), ".actions");
  }

  void TearDown() override {
    std::error_code ec;
    std::filesystem::remove_all(dir_, ec);
  }

  std::unique_ptr<ActionLog> OpenLog() {
    auto log = std::make_unique<ActionLog>(false);
    auto result = log->Open(path_);
    EXPECT_TRUE(result) << result.error().to_string();
    return log;
  }

  std::string ReadAll() {
    std::ifstream file(path_, std::ios::binary);
    return std::string((std::istreambuf_iterator<char>(file)), std::istreambuf_iterator<char>());
  }

  void WriteAll(const std::string& data) {
    std::ofstream file(path_, std::ios::binary | std::ios::trunc);
    file << data;
  }

  std::string ReadTorn() {
    std::ifstream file(path_ + kTornSuffix, std::ios::binary);
    return std::string((std::istreambuf_iterator<char>(file)), std::istreambuf_iterator<char>());
  }

  void Append(const std::string& data) {
    std::ofstream file(path_, std::ios::binary | std::ios::app);
    file << data;
  }

  std::filesystem::path dir_;
  std::string path_;
};

// ============================================================================
// Recording
// ============================================================================

TEST_F(ActionLogTest, LogPathNextToRepository) {
  EXPECT_EQ(ActionLog::LogPathFor("/data/notes/repo.memex", ".actions"), "/data/notes/.actions/repo.memex.log");
}

TEST_F(ActionLogTest, EmptyLog) {
  auto log = OpenLog();
  EXPECT_TRUE(std::filesystem::exists(path_));
  EXPECT_EQ(log->GetLastHash(), ZeroHashHex());

  auto history = log->GetHistory();
  ASSERT_TRUE(history);
  EXPECT_TRUE(history->empty());

  auto verified = log->VerifyHistory();
  ASSERT_TRUE(verified);
  EXPECT_TRUE(*verified);
}

TEST_F(ActionLogTest, RecordsAreChained) {
  auto log = OpenLog();
  auto first = log->RecordAction(action_types::kAddNode, {{"id", "node-1"}, {"type", "test"}},
                                 utils::Sha256::Hash("node1"));
  auto second = log->RecordAction(action_types::kAddNode, {{"id", "node-2"}, {"type", "test"}});
  auto third = log->RecordAction(action_types::kDeleteNode, {{"id", "node-1"}});
  ASSERT_TRUE(first) << first.error().to_string();
  ASSERT_TRUE(second);
  ASSERT_TRUE(third);

  EXPECT_EQ(first->prev_hash, ZeroHashHex());
  EXPECT_EQ(second->prev_hash, first->hash);
  EXPECT_EQ(third->prev_hash, second->hash);
  EXPECT_EQ(first->state_hash, utils::HexEncode(utils::Sha256::Hash("node1")));
  EXPECT_EQ(second->state_hash, ZeroHashHex());
  EXPECT_EQ(log->GetLastHash(), third->hash);

  auto history = log->GetHistory();
  ASSERT_TRUE(history);
  ASSERT_EQ(history->size(), 3);
  EXPECT_EQ((*history)[0].type, action_types::kAddNode);
  EXPECT_EQ((*history)[0].payload["id"], "node-1");
  EXPECT_EQ((*history)[2].type, action_types::kDeleteNode);
  EXPECT_EQ((*history)[2].hash, third->hash);
  EXPECT_EQ((*history)[1].timestamp, second->timestamp);

  auto verified = log->VerifyHistory();
  ASSERT_TRUE(verified);
  EXPECT_TRUE(*verified);
}

TEST_F(ActionLogTest, SelfHashCoversRecordWithoutHash) {
  auto log = OpenLog();
  auto action = log->RecordAction(action_types::kAddLink, {{"source", "a"}, {"target", "b"}, {"type", "ref"}});
  ASSERT_TRUE(action);
  EXPECT_EQ(action->hash, ComputeActionHash(ActionToJson(*action, false)));
  EXPECT_EQ(action->hash, ComputeActionHash(ActionToJson(*action, true)));
}

TEST_F(ActionLogTest, ReopenContinuesChain) {
  std::string last_hash;
  {
    auto log = OpenLog();
    ASSERT_TRUE(log->RecordAction(action_types::kAddNode, {{"id", "node-1"}}));
    auto second = log->RecordAction(action_types::kAddNode, {{"id", "node-2"}});
    ASSERT_TRUE(second);
    last_hash = second->hash;
  }

  auto log = OpenLog();
  EXPECT_EQ(log->GetLastHash(), last_hash);
  auto third = log->RecordAction(action_types::kDeleteNode, {{"id", "node-2"}});
  ASSERT_TRUE(third);
  EXPECT_EQ(third->prev_hash, last_hash);
  EXPECT_TRUE(*log->VerifyHistory());
}

TEST_F(ActionLogTest, FramingIsLengthPrefixedJson) {
  {
    auto log = OpenLog();
    ASSERT_TRUE(log->RecordAction(action_types::kAddNode, {{"id", "node-1"}}));
  }
  std::string data = ReadAll();
  ASSERT_GT(data.size(), kLengthPrefixSize);
  uint32_t length = utils::LoadLE32(reinterpret_cast<const uint8_t*>(data.data()));
  EXPECT_EQ(length, data.size() - kLengthPrefixSize);
  EXPECT_EQ(data[kLengthPrefixSize], '{');
  EXPECT_EQ(data.back(), '}');
}

// ============================================================================
// Tampering and recovery
// ============================================================================

TEST_F(ActionLogTest, ModifiedRecordFailsVerification) {
  {
    auto log = OpenLog();
    ASSERT_TRUE(log->RecordAction(action_types::kAddNode, {{"id", "node-1"}}));
    ASSERT_TRUE(log->RecordAction(action_types::kAddNode, {{"id", "node-2"}}));
  }

  // Same length, still valid JSON, different content
  std::string data = ReadAll();
  size_t pos = data.find("node-1");
  ASSERT_NE(pos, std::string::npos);
  data[pos + 5] = '9';
  WriteAll(data);

  ActionLog log(false);
  ASSERT_TRUE(log.Open(path_));
  auto verified = log.VerifyHistory();
  ASSERT_TRUE(verified) << verified.error().to_string();
  EXPECT_FALSE(*verified);
}

TEST_F(ActionLogTest, BrokenLinkFailsVerification) {
  {
    auto log = OpenLog();
    ASSERT_TRUE(log->RecordAction(action_types::kAddNode, {{"id", "node-1"}}));
    ASSERT_TRUE(log->RecordAction(action_types::kAddNode, {{"id", "node-2"}}));
    ASSERT_TRUE(log->RecordAction(action_types::kAddNode, {{"id", "node-3"}}));
  }

  // Drop the middle record; every remaining record is individually valid
  std::string data = ReadAll();
  uint32_t first_len = utils::LoadLE32(reinterpret_cast<const uint8_t*>(data.data()));
  size_t second_start = kLengthPrefixSize + first_len;
  uint32_t second_len = utils::LoadLE32(reinterpret_cast<const uint8_t*>(data.data() + second_start));
  data.erase(second_start, kLengthPrefixSize + second_len);
  WriteAll(data);

  auto log = OpenLog();
  auto verified = log->VerifyHistory();
  ASSERT_TRUE(verified);
  EXPECT_FALSE(*verified);
}

TEST_F(ActionLogTest, TornTailIsSetAside) {
  size_t clean_size = 0;
  std::string last_hash;
  {
    auto log = OpenLog();
    auto action = log->RecordAction(action_types::kAddNode, {{"id", "node-1"}});
    ASSERT_TRUE(action);
    last_hash = action->hash;
  }
  clean_size = std::filesystem::file_size(path_);

  // A length prefix promising more bytes than were written
  std::string torn(kLengthPrefixSize, '\0');
  utils::StoreLE32(reinterpret_cast<uint8_t*>(torn.data()), 200);
  torn += "{\"type\":";
  Append(torn);

  auto log = OpenLog();
  EXPECT_EQ(ReadTorn(), torn);

  auto history = log->GetHistory();
  ASSERT_TRUE(history) << history.error().to_string();
  ASSERT_EQ(history->size(), 2);
  const Action& recovery = (*history)[1];
  EXPECT_EQ(recovery.type, action_types::kRecoverTail);
  EXPECT_EQ(recovery.prev_hash, last_hash);
  EXPECT_EQ(recovery.payload["offset"], clean_size);
  EXPECT_EQ(recovery.payload["bytes"], torn.size());
  EXPECT_EQ(recovery.payload["sha256"], utils::HexEncode(utils::Sha256::Hash(torn)));
  EXPECT_EQ(recovery.payload["torn_offset"], 0);
  EXPECT_EQ(log->GetLastHash(), recovery.hash);

  auto next = log->RecordAction(action_types::kAddNode, {{"id", "node-2"}});
  ASSERT_TRUE(next);
  EXPECT_EQ(next->prev_hash, recovery.hash);
  EXPECT_TRUE(*log->VerifyHistory());
}

TEST_F(ActionLogTest, PartialLengthPrefixIsSetAside) {
  {
    auto log = OpenLog();
    ASSERT_TRUE(log->RecordAction(action_types::kAddNode, {{"id", "node-1"}}));
  }
  Append(std::string(2, '\x10'));

  auto log = OpenLog();
  auto history = log->GetHistory();
  ASSERT_TRUE(history);
  ASSERT_EQ(history->size(), 2);
  EXPECT_EQ((*history)[1].type, action_types::kRecoverTail);
  EXPECT_EQ((*history)[1].payload["bytes"], 2);
  EXPECT_EQ(ReadTorn(), std::string(2, '\x10'));
}

TEST_F(ActionLogTest, TornFirstRecordStartsEmptyChain) {
  std::filesystem::create_directories(std::filesystem::path(path_).parent_path());
  WriteAll(std::string(2, '\x30'));

  auto log = OpenLog();
  ASSERT_TRUE(log->GetHistory());
  auto history = *log->GetHistory();
  ASSERT_EQ(history.size(), 1);
  EXPECT_EQ(history[0].type, action_types::kRecoverTail);
  EXPECT_EQ(history[0].prev_hash, ZeroHashHex());
  EXPECT_EQ(history[0].payload["offset"], 0);
  EXPECT_EQ(ReadTorn(), std::string(2, '\x30'));
  EXPECT_TRUE(*log->VerifyHistory());
}

TEST_F(ActionLogTest, TornFirstRecordBodyStartsEmptyChain) {
  std::filesystem::create_directories(std::filesystem::path(path_).parent_path());
  std::string torn(kLengthPrefixSize, '\0');
  utils::StoreLE32(reinterpret_cast<uint8_t*>(torn.data()), 180);
  torn += "{\"type\":";
  WriteAll(torn);

  auto log = OpenLog();
  auto first = log->RecordAction(action_types::kAddNode, {{"id", "node-1"}});
  ASSERT_TRUE(first);

  auto history = log->GetHistory();
  ASSERT_TRUE(history);
  ASSERT_EQ(history->size(), 2);
  EXPECT_EQ((*history)[0].type, action_types::kRecoverTail);
  EXPECT_EQ((*history)[1].prev_hash, (*history)[0].hash);
  EXPECT_EQ(ReadTorn(), torn);
  EXPECT_TRUE(*log->VerifyHistory());
}

TEST_F(ActionLogTest, DamagedLengthPrefixIsNeverDiscarded) {
  {
    auto log = OpenLog();
    ASSERT_TRUE(log->RecordAction(action_types::kAddNode, {{"id", "node-1"}}));
    ASSERT_TRUE(log->RecordAction(action_types::kAddNode, {{"id", "node-2"}}));
  }
  std::string original = ReadAll();
  uint32_t first_len = utils::LoadLE32(reinterpret_cast<const uint8_t*>(original.data()));
  size_t second_start = kLengthPrefixSize + first_len;
  uint32_t second_len = utils::LoadLE32(reinterpret_cast<const uint8_t*>(original.data() + second_start));

  // A longer length makes the intact second record look like a torn one
  std::string data = original;
  utils::StoreLE32(reinterpret_cast<uint8_t*>(data.data() + second_start), second_len + 100);
  WriteAll(data);

  auto log = OpenLog();
  EXPECT_EQ(ReadTorn(), data.substr(second_start));

  auto history = log->GetHistory();
  ASSERT_TRUE(history);
  ASSERT_EQ(history->size(), 2);
  EXPECT_EQ((*history)[0].payload["id"], "node-1");
  EXPECT_EQ((*history)[1].type, action_types::kRecoverTail);
  EXPECT_EQ((*history)[1].payload["offset"], second_start);
  EXPECT_EQ((*history)[1].payload["sha256"], utils::HexEncode(utils::Sha256::Hash(data.substr(second_start))));
}

TEST_F(ActionLogTest, ImplausibleLengthPrefixStaysInLog) {
  {
    auto log = OpenLog();
    ASSERT_TRUE(log->RecordAction(action_types::kAddNode, {{"id", "node-1"}}));
    ASSERT_TRUE(log->RecordAction(action_types::kAddNode, {{"id", "node-2"}}));
  }
  std::string data = ReadAll();
  uint32_t first_len = utils::LoadLE32(reinterpret_cast<const uint8_t*>(data.data()));
  size_t second_start = kLengthPrefixSize + first_len;
  data[second_start + 3] = '\x7f';
  WriteAll(data);

  auto log = OpenLog();
  EXPECT_EQ(ReadAll(), data);
  EXPECT_FALSE(std::filesystem::exists(path_ + kTornSuffix));
  auto verified = log->VerifyHistory();
  ASSERT_TRUE(verified);
  EXPECT_FALSE(*verified);
}

TEST_F(ActionLogTest, GarbageLogFailsOpen) {
  std::filesystem::create_directories(std::filesystem::path(path_).parent_path());
  WriteAll("this is not an action log");

  ActionLog log(false);
  auto result = log.Open(path_);
  ASSERT_FALSE(result);
  EXPECT_EQ(result.error().code(), utils::ErrorCode::kActionLogCorrupted);
}

TEST(ActionRecordsTest, ParseRecordsRejectsTruncatedRecord) {
  std::string data(kLengthPrefixSize, '\0');
  utils::StoreLE32(reinterpret_cast<uint8_t*>(data.data()), 50);
  data += "{}";

  auto records = ParseRecords(data);
  ASSERT_FALSE(records);
  EXPECT_EQ(records.error().code(), utils::ErrorCode::kActionLogCorrupted);
}

TEST(ActionRecordsTest, ActionFromJsonRequiresFields) {
  auto missing = ActionFromJson(nlohmann::json{{"type", "add_node"}});
  ASSERT_FALSE(missing);
  EXPECT_EQ(missing.error().code(), utils::ErrorCode::kActionLogCorrupted);
}

}  // namespace
}  // namespace memex::actions
