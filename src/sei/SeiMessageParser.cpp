// Repository: MetaSEI
// Component: SEI Message Parser
// Purpose: Recovers user_data_unregistered payloads and metadata records from a buffer.
// Copyright (c) 2025 MetaSEI

#include "metasei/sei/SeiMessageParser.h"

#include "metasei/h264/EmulationPrevention.h"
#include "metasei/h264/NalScanner.h"
#include "metasei/sei/SeiMessageBuilder.h"

#include <algorithm>
#include <limits>
#include <utility>

namespace metasei::sei {

namespace {

constexpr size_t kMaxSeiValue = std::numeric_limits<uint32_t>::max();

// Reads one ff_byte-extended SEI value. Fails on truncation or as soon as the
// value exceeds `limit`.
bool ReadSeiVarint(const uint8_t* data, size_t size, size_t& pos, size_t limit,
                   uint32_t& value) {
  size_t accumulated = 0;
  while (pos < size && data[pos] == 0xFF) {
    accumulated += 0xFF;
    ++pos;
    if (accumulated > limit) {
      return false;
    }
  }
  if (pos >= size) {
    return false;
  }
  accumulated += data[pos++];
  if (accumulated > limit) {
    return false;
  }
  value = static_cast<uint32_t>(accumulated);
  return true;
}

bool MoreRbspData(const uint8_t* data, size_t size, size_t pos) {
  if (pos >= size) {
    return false;
  }
  return !(pos + 1 == size && data[pos] == kRbspTrailingBits);
}

}  // namespace

bool SeiMessage::IsUserDataUnregistered() const {
  return payload_type == kSeiPayloadTypeUserDataUnregistered && payload_size >= kSeiUuidSize;
}

std::vector<SeiMessage> ParseSeiMessages(const uint8_t* rbsp, size_t size) {
  std::vector<SeiMessage> messages;
  if (rbsp == nullptr) {
    return messages;
  }

  size_t pos = 0;
  while (MoreRbspData(rbsp, size, pos)) {
    SeiMessage message;
    if (!ReadSeiVarint(rbsp, size, pos, kMaxSeiValue, message.payload_type) ||
        !ReadSeiVarint(rbsp, size, pos, std::min(size, kMaxSeiValue), message.payload_size)) {
      break;
    }
    if (message.payload_size > size - pos) {
      break;
    }

    const uint8_t* payload = rbsp + pos;
    size_t body_offset = 0;
    if (message.IsUserDataUnregistered()) {
      std::copy(payload, payload + kSeiUuidSize, message.uuid.begin());
      body_offset = kSeiUuidSize;
    }
    message.body.assign(payload + body_offset, payload + message.payload_size);
    pos += message.payload_size;

    messages.push_back(std::move(message));
  }
  return messages;
}

std::vector<SeiMessage> ExtractUserData(const uint8_t* data, size_t size,
                                        h264::NalFraming framing) {
  std::vector<SeiMessage> found;
  h264::NalScanner scanner(data, size, framing);
  while (auto unit = scanner.Next()) {
    if (unit->type() != h264::NalUnitType::kSei) {
      continue;
    }
    // Skip the one-byte NAL header.
    const size_t rbsp_offset = unit->payload_offset + 1;
    // trailing_zero_8bits before the next start code are not part of the NAL unit.
    size_t rbsp_end = unit->end_offset;
    while (rbsp_end > rbsp_offset && data[rbsp_end - 1] == 0x00) {
      --rbsp_end;
    }
    if (rbsp_offset >= rbsp_end) {
      continue;
    }
    const std::vector<uint8_t> rbsp = h264::UnescapeRbsp(data + rbsp_offset, rbsp_end - rbsp_offset);
    for (auto& message : ParseSeiMessages(rbsp.data(), rbsp.size())) {
      if (message.IsUserDataUnregistered()) {
        found.push_back(std::move(message));
      }
    }
  }
  return found;
}

std::vector<MetadataRecord> ExtractAll(const uint8_t* data, size_t size, const SeiUuid& want_uuid,
                                       h264::NalFraming framing) {
  std::vector<MetadataRecord> records;
  for (const auto& message : ExtractUserData(data, size, framing)) {
    if (message.uuid != want_uuid) {
      continue;
    }
    if (auto record = DecodeMetadata(message.body.data(), message.body.size())) {
      records.push_back(std::move(*record));
    }
  }
  return records;
}

}  // namespace metasei::sei
