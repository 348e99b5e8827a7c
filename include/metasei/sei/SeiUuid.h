// Repository: MetaSEI
// Component: SEI UUID
// Purpose: The 16-byte uuid_iso_iec_11578 that tags user_data_unregistered payloads.
// Copyright (c) 2025 MetaSEI

#ifndef METASEI_SEI_SEI_UUID_H_
#define METASEI_SEI_SEI_UUID_H_

#include <array>
#include <cstddef>
#include <cstdint>
#include <optional>
#include <string>
#include <string_view>

namespace metasei::sei {

constexpr size_t kSeiUuidSize = 16;

using SeiUuid = std::array<uint8_t, kSeiUuidSize>;

// Accepts, in order of precedence:
//   "12345678-1234-1234-1234-1234567890ab"  RFC-4122 text
//   "123456781234123412341234567890ab"      32 hex digits
//   "METADATA"                              ASCII tag of 1..16 chars, zero padded
// Returns std::nullopt for anything else (empty text, tags over 16 chars).
std::optional<SeiUuid> ParseSeiUuid(std::string_view text);

// Lower-case RFC-4122 layout: 8-4-4-4-12 hex digits.
std::string FormatSeiUuid(const SeiUuid& uuid);

}  // namespace metasei::sei

#endif  // METASEI_SEI_SEI_UUID_H_
