// Repository: MetaSEI
// Component: SEI Message Builder
// Purpose: Builds a complete user_data_unregistered SEI NAL unit.
// Copyright (c) 2025 MetaSEI

#include "metasei/sei/SeiMessageBuilder.h"

#include "metasei/h264/EmulationPrevention.h"

#include <iterator>

namespace metasei::sei {

namespace {
constexpr uint8_t kStartCode[] = {0x00, 0x00, 0x00, 0x01};
}  // namespace

size_t AppendSeiVarint(uint32_t value, std::vector<uint8_t>& out) {
  size_t written = 0;
  while (value >= 0xFF) {
    out.push_back(0xFF);
    value -= 0xFF;
    ++written;
  }
  out.push_back(static_cast<uint8_t>(value));
  return written + 1;
}

std::vector<uint8_t> BuildSeiNal(const SeiUuid& uuid, const uint8_t* body, size_t body_size,
                                 h264::NalFraming framing) {
  const size_t payload_size = kSeiUuidSize + body_size;

  std::vector<uint8_t> rbsp;
  rbsp.reserve(1 + payload_size / 0xFF + 1 + payload_size + 1);
  AppendSeiVarint(kSeiPayloadTypeUserDataUnregistered, rbsp);
  AppendSeiVarint(static_cast<uint32_t>(payload_size), rbsp);
  rbsp.insert(rbsp.end(), uuid.begin(), uuid.end());
  if (body_size > 0) {
    rbsp.insert(rbsp.end(), body, body + body_size);
  }
  rbsp.push_back(kRbspTrailingBits);

  const std::vector<uint8_t> escaped = h264::EscapeRbsp(rbsp);

  std::vector<uint8_t> nal;
  nal.reserve(sizeof(kStartCode) + 1 + escaped.size());
  if (framing == h264::NalFraming::kLengthPrefixed) {
    const uint32_t nal_size = static_cast<uint32_t>(1 + escaped.size());
    nal.push_back(static_cast<uint8_t>((nal_size >> 24) & 0xFF));
    nal.push_back(static_cast<uint8_t>((nal_size >> 16) & 0xFF));
    nal.push_back(static_cast<uint8_t>((nal_size >> 8) & 0xFF));
    nal.push_back(static_cast<uint8_t>(nal_size & 0xFF));
  } else {
    nal.insert(nal.end(), std::begin(kStartCode), std::end(kStartCode));
  }
  nal.push_back(kSeiNalHeader);
  nal.insert(nal.end(), escaped.begin(), escaped.end());
  return nal;
}

std::vector<uint8_t> BuildMetadataSeiNal(const SeiUuid& uuid, const MetadataRecord& record,
                                         h264::NalFraming framing) {
  return BuildSeiNal(uuid, EncodeMetadata(record), framing);
}

}  // namespace metasei::sei
