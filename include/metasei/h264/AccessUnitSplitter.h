// Repository: MetaSEI
// Component: Access Unit Splitter
// Purpose: Splits a raw Annex-B elementary stream into access units.
// Copyright (c) 2025 MetaSEI

#ifndef METASEI_H264_ACCESS_UNIT_SPLITTER_H_
#define METASEI_H264_ACCESS_UNIT_SPLITTER_H_

#include <cstddef>
#include <cstdint>
#include <vector>

namespace metasei::h264 {

// Byte range of one access unit inside an elementary stream.
struct AccessUnitSpan {
  size_t offset = 0;
  size_t size = 0;
  bool is_keyframe = false;  // contains an IDR slice
};

// Splits an Annex-B stream at access unit boundaries (H.264 7.4.1.2.3,
// simplified). A new access unit starts at:
//  - an access unit delimiter,
//  - an SPS, PPS or SEI that follows a slice of the current access unit,
//  - a slice with first_mb_in_slice == 0 that follows a slice of the
//    current access unit.
// Bytes before the first start code are dropped.
std::vector<AccessUnitSpan> SplitAccessUnits(const uint8_t* data, size_t size);

}  // namespace metasei::h264

#endif  // METASEI_H264_ACCESS_UNIT_SPLITTER_H_
