// Repository: MetaSEI
// Component: Emulation Prevention
// Purpose: RBSP <-> NAL payload transform for emulation_prevention_three_byte.
// Copyright (c) 2025 MetaSEI

#ifndef METASEI_H264_EMULATION_PREVENTION_H_
#define METASEI_H264_EMULATION_PREVENTION_H_

#include <cstddef>
#include <cstdint>
#include <vector>

namespace metasei::h264 {

// Inserts 0x03 after every 00 00 pair that is followed by a byte in 0x00..0x03.
// The zero run restarts after each inserted byte.
std::vector<uint8_t> EscapeRbsp(const uint8_t* rbsp, size_t size);

// Removes the 0x03 that follows every 00 00 pair. The byte after a removed
// 0x03 is payload even when it is itself 0x00..0x03.
std::vector<uint8_t> UnescapeRbsp(const uint8_t* payload, size_t size);

inline std::vector<uint8_t> EscapeRbsp(const std::vector<uint8_t>& rbsp) {
  return EscapeRbsp(rbsp.data(), rbsp.size());
}

inline std::vector<uint8_t> UnescapeRbsp(const std::vector<uint8_t>& payload) {
  return UnescapeRbsp(payload.data(), payload.size());
}

}  // namespace metasei::h264

#endif  // METASEI_H264_EMULATION_PREVENTION_H_
