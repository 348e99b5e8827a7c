// Repository: MetaSEI
// Component: SEI UUID
// Purpose: The 16-byte uuid_iso_iec_11578 that tags user_data_unregistered payloads.
// Copyright (c) 2025 MetaSEI

#include "metasei/sei/SeiUuid.h"

#include <iomanip>
#include <sstream>

namespace metasei::sei {

namespace {

constexpr size_t kDashedUuidLength = 36;
constexpr size_t kHexUuidLength = 32;

int HexValue(char c) {
  if (c >= '0' && c <= '9') return c - '0';
  if (c >= 'a' && c <= 'f') return c - 'a' + 10;
  if (c >= 'A' && c <= 'F') return c - 'A' + 10;
  return -1;
}

std::optional<SeiUuid> ParseHexDigits(std::string_view hex) {
  if (hex.size() != kHexUuidLength) {
    return std::nullopt;
  }
  SeiUuid uuid{};
  for (size_t i = 0; i < kSeiUuidSize; ++i) {
    const int hi = HexValue(hex[2 * i]);
    const int lo = HexValue(hex[2 * i + 1]);
    if (hi < 0 || lo < 0) {
      return std::nullopt;
    }
    uuid[i] = static_cast<uint8_t>((hi << 4) | lo);
  }
  return uuid;
}

bool IsDashPosition(size_t i) {
  return i == 8 || i == 13 || i == 18 || i == 23;
}

}  // namespace

std::optional<SeiUuid> ParseSeiUuid(std::string_view text) {
  if (text.empty()) {
    return std::nullopt;
  }

  if (text.size() == kDashedUuidLength) {
    std::string hex;
    hex.reserve(kHexUuidLength);
    bool dashes_ok = true;
    for (size_t i = 0; i < text.size(); ++i) {
      if (IsDashPosition(i)) {
        dashes_ok = dashes_ok && text[i] == '-';
      } else {
        hex.push_back(text[i]);
      }
    }
    if (dashes_ok) {
      if (auto uuid = ParseHexDigits(hex)) {
        return uuid;
      }
    }
  }

  if (auto uuid = ParseHexDigits(text)) {
    return uuid;
  }

  if (text.size() > kSeiUuidSize) {
    return std::nullopt;
  }
  SeiUuid tag{};
  for (size_t i = 0; i < text.size(); ++i) {
    tag[i] = static_cast<uint8_t>(text[i]);
  }
  return tag;
}

std::string FormatSeiUuid(const SeiUuid& uuid) {
  std::ostringstream out;
  out << std::hex << std::setfill('0');
  for (size_t i = 0; i < uuid.size(); ++i) {
    if (i == 4 || i == 6 || i == 8 || i == 10) {
      out << '-';
    }
    out << std::setw(2) << static_cast<int>(uuid[i]);
  }
  return out.str();
}

}  // namespace metasei::sei
