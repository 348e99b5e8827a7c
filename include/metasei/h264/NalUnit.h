// Repository: MetaSEI
// Component: NAL Unit
// Purpose: Transient view of one H.264 NAL unit inside a caller-owned buffer.
// Copyright (c) 2025 MetaSEI

#ifndef METASEI_H264_NAL_UNIT_H_
#define METASEI_H264_NAL_UNIT_H_

#include <cstddef>
#include <cstdint>

namespace metasei::h264 {

// nal_unit_type values (H.264 Table 7-1) that this library distinguishes.
enum class NalUnitType : uint8_t {
  kUnspecified = 0,
  kSliceNonIdr = 1,
  kSliceDataPartitionA = 2,
  kSliceDataPartitionB = 3,
  kSliceDataPartitionC = 4,
  kSliceIdr = 5,
  kSei = 6,
  kSps = 7,
  kPps = 8,
  kAccessUnitDelimiter = 9,
  kEndOfSequence = 10,
  kEndOfStream = 11,
  kFillerData = 12,
  kSpsExtension = 13,
  kPrefixNal = 14,
  kSubsetSps = 15,
  kSliceExtension = 20,
};

// How NAL units are delimited inside a buffer.
enum class NalFraming {
  kAuto,            // start code at offset 0 => Annex-B, else length heuristic
  kAnnexB,          // 00 00 01 / 00 00 00 01 start codes
  kLengthPrefixed,  // 4-byte big-endian length before every NAL unit
};

// Length of the big-endian size field in length-prefixed framing.
constexpr size_t kLengthPrefixSize = 4;

// NalUnit is a view into a buffer owned by the caller.
//
// start_offset:   first byte of the start code (or length field)
// payload_offset: NAL header byte, i.e. start_offset + start_code_length
// end_offset:     one past the last byte of the NAL unit
//
// start_offset < payload_offset <= end_offset always holds.
struct NalUnit {
  size_t start_offset = 0;
  size_t payload_offset = 0;
  size_t end_offset = 0;
  uint8_t start_code_length = 0;  // 3 or 4 (length-prefixed framing reports 4)
  uint8_t nal_type = 0;           // low 5 bits of the NAL header

  size_t size() const { return end_offset - start_offset; }
  size_t payload_size() const { return end_offset - payload_offset; }
  NalUnitType type() const { return static_cast<NalUnitType>(nal_type); }
};

// True for the coded-slice types 1..5.
inline bool IsVclNalType(uint8_t nal_type) {
  return nal_type >= 1 && nal_type <= 5;
}

// True for the header types that may precede the first slice of an access
// unit and after which an SEI can be placed: AUD, SEI, SPS, PPS.
inline bool IsAccessUnitHeaderNalType(uint8_t nal_type) {
  switch (static_cast<NalUnitType>(nal_type)) {
    case NalUnitType::kAccessUnitDelimiter:
    case NalUnitType::kSei:
    case NalUnitType::kSps:
    case NalUnitType::kPps:
      return true;
    default:
      return false;
  }
}

}  // namespace metasei::h264

#endif  // METASEI_H264_NAL_UNIT_H_
