// Repository: MetaSEI
// Component: SEI Message Builder
// Purpose: Builds a complete user_data_unregistered SEI NAL unit.
// Copyright (c) 2025 MetaSEI

#ifndef METASEI_SEI_SEI_MESSAGE_BUILDER_H_
#define METASEI_SEI_SEI_MESSAGE_BUILDER_H_

#include "metasei/h264/NalUnit.h"
#include "metasei/sei/MetadataRecord.h"
#include "metasei/sei/SeiUuid.h"

#include <cstddef>
#include <cstdint>
#include <string_view>
#include <vector>

namespace metasei::sei {

// payloadType of user_data_unregistered (H.264 D.1).
constexpr uint32_t kSeiPayloadTypeUserDataUnregistered = 5;

// NAL header byte for an SEI unit: forbidden_zero_bit 0, nal_ref_idc 0, type 6.
constexpr uint8_t kSeiNalHeader = 0x06;

// RBSP trailing bits: stop bit followed by zero alignment bits.
constexpr uint8_t kRbspTrailingBits = 0x80;

// Appends value in SEI ff-coding: one 0xFF per full 255, then the remainder.
// Returns the number of bytes written.
size_t AppendSeiVarint(uint32_t value, std::vector<uint8_t>& out);

// Builds the SEI NAL unit
//   00 00 00 01 | 06 | EPB(05 <size> <uuid> <body> 80)
// With NalFraming::kLengthPrefixed the start code is replaced by the
// big-endian length of the escaped NAL unit. kAuto behaves as kAnnexB.
std::vector<uint8_t> BuildSeiNal(const SeiUuid& uuid, const uint8_t* body, size_t body_size,
                                 h264::NalFraming framing = h264::NalFraming::kAnnexB);

inline std::vector<uint8_t> BuildSeiNal(const SeiUuid& uuid, std::string_view body,
                                        h264::NalFraming framing = h264::NalFraming::kAnnexB) {
  return BuildSeiNal(uuid, reinterpret_cast<const uint8_t*>(body.data()), body.size(), framing);
}

// BuildSeiNal over the compact JSON text of `record`.
std::vector<uint8_t> BuildMetadataSeiNal(const SeiUuid& uuid, const MetadataRecord& record,
                                         h264::NalFraming framing = h264::NalFraming::kAnnexB);

}  // namespace metasei::sei

#endif  // METASEI_SEI_SEI_MESSAGE_BUILDER_H_
