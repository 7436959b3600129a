/**
 * @file encoding.cpp
 * @brief Hex and Base64 codecs
 */

#include "utils/encoding.h"

#include <array>
#include <cstdint>

namespace memex::utils {

namespace {

constexpr const char* kHexDigits = "0123456789abcdef";
constexpr const char* kBase64Alphabet = "ABCDEFGHIJKLMNOPQRSTUVWXYZabcdefghijklmnopqrstuvwxyz0123456789+/";
constexpr int kInvalidDigit = -1;

int HexValue(char chr) {
  if (chr >= '0' && chr <= '9') {
    return chr - '0';
  }
  if (chr >= 'a' && chr <= 'f') {
    return chr - 'a' + 10;  // NOLINT(cppcoreguidelines-avoid-magic-numbers)
  }
  if (chr >= 'A' && chr <= 'F') {
    return chr - 'A' + 10;  // NOLINT(cppcoreguidelines-avoid-magic-numbers)
  }
  return kInvalidDigit;
}

std::array<int, 256> BuildBase64DecodeTable() {
  std::array<int, 256> table{};
  table.fill(kInvalidDigit);
  for (int i = 0; i < 64; ++i) {  // NOLINT(cppcoreguidelines-avoid-magic-numbers)
    table[static_cast<uint8_t>(kBase64Alphabet[i])] = i;
  }
  return table;
}

}  // namespace

std::string HexEncode(std::string_view bytes) {
  std::string out;
  out.reserve(bytes.size() * 2);
  for (char chr : bytes) {
    auto byte = static_cast<uint8_t>(chr);
    out.push_back(kHexDigits[byte >> 4]);
    out.push_back(kHexDigits[byte & 0x0F]);
  }
  return out;
}

std::string HexEncode(const Digest& digest) {
  return HexEncode(std::string_view(reinterpret_cast<const char*>(digest.data()), digest.size()));
}

std::optional<std::string> HexDecode(std::string_view hex) {
  if (hex.size() % 2 != 0) {
    return std::nullopt;
  }
  std::string out;
  out.reserve(hex.size() / 2);
  for (size_t i = 0; i < hex.size(); i += 2) {
    int high = HexValue(hex[i]);
    int low = HexValue(hex[i + 1]);
    if (high == kInvalidDigit || low == kInvalidDigit) {
      return std::nullopt;
    }
    out.push_back(static_cast<char>((high << 4) | low));
  }
  return out;
}

bool IsHexDigest(std::string_view str) {
  if (str.size() != kSha256Size * 2) {
    return false;
  }
  for (char chr : str) {
    if (HexValue(chr) == kInvalidDigit) {
      return false;
    }
  }
  return true;
}

std::string Base64Encode(std::string_view bytes) {
  std::string out;
  out.reserve(((bytes.size() + 2) / 3) * 4);

  size_t i = 0;
  while (i + 3 <= bytes.size()) {
    uint32_t triple = (static_cast<uint8_t>(bytes[i]) << 16) | (static_cast<uint8_t>(bytes[i + 1]) << 8) |
                      static_cast<uint8_t>(bytes[i + 2]);
    out.push_back(kBase64Alphabet[(triple >> 18) & 0x3F]);
    out.push_back(kBase64Alphabet[(triple >> 12) & 0x3F]);
    out.push_back(kBase64Alphabet[(triple >> 6) & 0x3F]);
    out.push_back(kBase64Alphabet[triple & 0x3F]);
    i += 3;
  }

  size_t rest = bytes.size() - i;
  if (rest == 1) {
    uint32_t triple = static_cast<uint8_t>(bytes[i]) << 16;
    out.push_back(kBase64Alphabet[(triple >> 18) & 0x3F]);
    out.push_back(kBase64Alphabet[(triple >> 12) & 0x3F]);
    out.append("==");
  } else if (rest == 2) {
    uint32_t triple = (static_cast<uint8_t>(bytes[i]) << 16) | (static_cast<uint8_t>(bytes[i + 1]) << 8);
    out.push_back(kBase64Alphabet[(triple >> 18) & 0x3F]);
    out.push_back(kBase64Alphabet[(triple >> 12) & 0x3F]);
    out.push_back(kBase64Alphabet[(triple >> 6) & 0x3F]);
    out.push_back('=');
  }
  return out;
}

std::optional<std::string> Base64Decode(std::string_view encoded) {
  static const std::array<int, 256> kDecodeTable = BuildBase64DecodeTable();

  if (encoded.size() % 4 != 0) {
    return std::nullopt;
  }

  std::string out;
  out.reserve(encoded.size() / 4 * 3);

  for (size_t i = 0; i < encoded.size(); i += 4) {
    bool last_group = (i + 4 == encoded.size());
    int values[4];
    int padding = 0;
    for (int j = 0; j < 4; ++j) {
      char chr = encoded[i + j];
      if (chr == '=' && last_group && j >= 2) {
        values[j] = 0;
        ++padding;
        continue;
      }
      if (padding > 0) {
        return std::nullopt;  // data after padding
      }
      values[j] = kDecodeTable[static_cast<uint8_t>(chr)];
      if (values[j] == kInvalidDigit) {
        return std::nullopt;
      }
    }

    uint32_t triple = (static_cast<uint32_t>(values[0]) << 18) | (static_cast<uint32_t>(values[1]) << 12) |
                      (static_cast<uint32_t>(values[2]) << 6) | static_cast<uint32_t>(values[3]);
    out.push_back(static_cast<char>((triple >> 16) & 0xFF));
    if (padding < 2) {
      out.push_back(static_cast<char>((triple >> 8) & 0xFF));
    }
    if (padding < 1) {
      out.push_back(static_cast<char>(triple & 0xFF));
    }
  }
  return out;
}

}  // namespace memex::utils
