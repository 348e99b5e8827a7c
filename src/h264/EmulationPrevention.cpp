// Repository: MetaSEI
// Component: Emulation Prevention
// Purpose: RBSP <-> NAL payload transform for emulation_prevention_three_byte.
// Copyright (c) 2025 MetaSEI

#include "metasei/h264/EmulationPrevention.h"

namespace metasei::h264 {

namespace {
constexpr uint8_t kEmulationPreventionByte = 0x03;
}  // namespace

std::vector<uint8_t> EscapeRbsp(const uint8_t* rbsp, size_t size) {
  std::vector<uint8_t> out;
  // Worst case is one extra byte per two input bytes; most payloads need none.
  out.reserve(size + size / 64 + 1);

  int zeros = 0;
  for (size_t i = 0; i < size; ++i) {
    const uint8_t b = rbsp[i];
    if (zeros >= 2 && b <= 0x03) {
      out.push_back(kEmulationPreventionByte);
      zeros = 0;
    }
    out.push_back(b);
    zeros = (b == 0x00) ? zeros + 1 : 0;
  }
  return out;
}

std::vector<uint8_t> UnescapeRbsp(const uint8_t* payload, size_t size) {
  std::vector<uint8_t> out;
  out.reserve(size);

  int zeros = 0;
  for (size_t i = 0; i < size; ++i) {
    const uint8_t b = payload[i];
    if (zeros >= 2 && b == kEmulationPreventionByte) {
      zeros = 0;
      continue;
    }
    out.push_back(b);
    zeros = (b == 0x00) ? zeros + 1 : 0;
  }
  return out;
}

}  // namespace metasei::h264
