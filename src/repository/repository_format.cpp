/**
 * @file repository_format.cpp
 * @brief Repository header encoding
 */

#include "repository/repository_format.h"

#include <algorithm>
#include <cstring>

#include "utils/endian.h"

namespace memex::repository {

RepositoryHeaderBytes EncodeRepositoryHeader(const RepositoryHeader& header) {
  RepositoryHeaderBytes bytes{};

  std::memcpy(bytes.data() + repository_format::kMagicOffset, repository_format::kMagic.data(),
              repository_format::kMagic.size());
  bytes[repository_format::kMajorOffset] = header.major_version;
  bytes[repository_format::kMinorOffset] = header.minor_version;

  size_t creator_len = std::min(header.creator.size(), repository_format::kCreatorSize);
  std::memcpy(bytes.data() + repository_format::kCreatorOffset, header.creator.data(), creator_len);

  utils::StoreLE64(bytes.data() + repository_format::kCreatedOffset, static_cast<uint64_t>(header.created));
  utils::StoreLE64(bytes.data() + repository_format::kModifiedOffset, static_cast<uint64_t>(header.modified));
  utils::StoreLE32(bytes.data() + repository_format::kNodeCountOffset, header.node_count);
  utils::StoreLE32(bytes.data() + repository_format::kEdgeCountOffset, header.edge_count);
  utils::StoreLE64(bytes.data() + repository_format::kNodeIndexOffset, header.node_index);
  utils::StoreLE64(bytes.data() + repository_format::kEdgeIndexOffset, header.edge_index);

  return bytes;
}

utils::Expected<RepositoryHeader, utils::Error> DecodeRepositoryHeader(const uint8_t* bytes) {
  if (std::memcmp(bytes + repository_format::kMagicOffset, repository_format::kMagic.data(),
                  repository_format::kMagic.size()) != 0) {
    return utils::MakeUnexpected(
        utils::MakeError(utils::ErrorCode::kStorageInvalidMagic, "Not a memex repository (bad magic)"));
  }

  RepositoryHeader header;
  header.major_version = bytes[repository_format::kMajorOffset];
  header.minor_version = bytes[repository_format::kMinorOffset];

  const char* creator = reinterpret_cast<const char*>(bytes + repository_format::kCreatorOffset);
  header.creator.assign(creator, strnlen(creator, repository_format::kCreatorSize));

  header.created = static_cast<int64_t>(utils::LoadLE64(bytes + repository_format::kCreatedOffset));
  header.modified = static_cast<int64_t>(utils::LoadLE64(bytes + repository_format::kModifiedOffset));
  header.node_count = utils::LoadLE32(bytes + repository_format::kNodeCountOffset);
  header.edge_count = utils::LoadLE32(bytes + repository_format::kEdgeCountOffset);
  header.node_index = utils::LoadLE64(bytes + repository_format::kNodeIndexOffset);
  header.edge_index = utils::LoadLE64(bytes + repository_format::kEdgeIndexOffset);

  return header;
}

utils::Expected<void, utils::Error> CheckFormatVersion(const RepositoryHeader& header) {
  if (header.major_version != repository_format::kMajorVersion) {
    return utils::MakeUnexpected(utils::MakeError(
        utils::ErrorCode::kStorageVersionIncompatible,
        "Incompatible repository format " + FormatVersionString(header.major_version, header.minor_version) +
            " (supported: " +
            FormatVersionString(repository_format::kMajorVersion, repository_format::kMinorVersion) + ")"));
  }
  return {};
}

std::string FormatVersionString(uint8_t major_version, uint8_t minor_version) {
  return std::to_string(major_version) + "." + std::to_string(minor_version);
}

}  // namespace memex::repository
