// Repository: MetaSEI
// Component: SEI Message Parser
// Purpose: Recovers user_data_unregistered payloads and metadata records from a buffer.
// Copyright (c) 2025 MetaSEI

#ifndef METASEI_SEI_SEI_MESSAGE_PARSER_H_
#define METASEI_SEI_SEI_MESSAGE_PARSER_H_

#include "metasei/h264/NalUnit.h"
#include "metasei/sei/MetadataRecord.h"
#include "metasei/sei/SeiUuid.h"

#include <cstddef>
#include <cstdint>
#include <vector>

namespace metasei::sei {

// One sei_message() from an SEI RBSP.
// For payload_type 5 with at least 16 payload bytes, `uuid` holds the first
// 16 bytes and `body` the rest; otherwise `uuid` is zero and `body` holds
// the whole payload.
struct SeiMessage {
  uint32_t payload_type = 0;
  uint32_t payload_size = 0;
  SeiUuid uuid{};
  std::vector<uint8_t> body;

  bool IsUserDataUnregistered() const;
};

// Parses the sei_message() sequence of one SEI RBSP (NAL header removed,
// emulation prevention already undone). Stops at the rbsp trailing bits.
// A message whose size runs past the end ends parsing; the messages parsed
// before it are returned.
std::vector<SeiMessage> ParseSeiMessages(const uint8_t* rbsp, size_t size);

// Every user_data_unregistered message (any UUID) in every SEI NAL unit.
std::vector<SeiMessage> ExtractUserData(const uint8_t* data, size_t size,
                                        h264::NalFraming framing = h264::NalFraming::kAuto);

// Metadata records of every user_data_unregistered message tagged with
// `want_uuid`, in bitstream order. Messages whose body is not a UTF-8 JSON
// object are skipped.
std::vector<MetadataRecord> ExtractAll(const uint8_t* data, size_t size, const SeiUuid& want_uuid,
                                       h264::NalFraming framing = h264::NalFraming::kAuto);

inline std::vector<MetadataRecord> ExtractAll(const std::vector<uint8_t>& data,
                                              const SeiUuid& want_uuid,
                                              h264::NalFraming framing = h264::NalFraming::kAuto) {
  return ExtractAll(data.data(), data.size(), want_uuid, framing);
}

}  // namespace metasei::sei

#endif  // METASEI_SEI_SEI_MESSAGE_PARSER_H_
