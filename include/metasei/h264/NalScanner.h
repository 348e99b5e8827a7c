// Repository: MetaSEI
// Component: NAL Unit Scanner
// Purpose: Cursor over the NAL units of an Annex-B or length-prefixed buffer.
// Copyright (c) 2025 MetaSEI

#ifndef METASEI_H264_NAL_SCANNER_H_
#define METASEI_H264_NAL_SCANNER_H_

#include "metasei/h264/NalUnit.h"

#include <cstddef>
#include <cstdint>
#include <optional>
#include <vector>

namespace metasei::h264 {

// Resolves kAuto for a concrete buffer.
// A buffer that opens with a start code is Annex-B unless its 4-byte
// big-endian length chain covers it exactly. Otherwise, if the first four
// bytes read as a value strictly between 0 and size, the buffer is taken as
// length-prefixed. Everything else is Annex-B.
NalFraming DetectFraming(const uint8_t* data, size_t size);

// NalScanner walks a buffer one NAL unit at a time.
//
// The scanner borrows the buffer; the caller keeps it alive for as long as
// the scanner or any NalUnit it produced is in use. Once Next() returns
// std::nullopt the scanner stays exhausted; scanning again means constructing
// a new scanner over the same buffer.
//
// Truncated data at the end of the buffer (a start code with nothing after
// it, a length field that runs past the end) ends the scan without error.
class NalScanner {
 public:
  NalScanner(const uint8_t* data, size_t size, NalFraming framing = NalFraming::kAuto);

  // Returns the next NAL unit in bitstream order, or std::nullopt when done.
  std::optional<NalUnit> Next();

  bool exhausted() const { return exhausted_; }

  // Framing in effect after kAuto was resolved.
  NalFraming framing() const { return framing_; }

 private:
  struct StartCode {
    size_t offset;
    uint8_t length;
  };

  std::optional<StartCode> FindStartCode(size_t from) const;
  std::optional<NalUnit> NextAnnexB();
  std::optional<NalUnit> NextLengthPrefixed();

  const uint8_t* data_;
  size_t size_;
  NalFraming framing_;
  bool exhausted_;

  // Annex-B: start code of the unit Next() will return.
  std::optional<StartCode> next_start_;
  // Length-prefixed: offset of the next length field.
  size_t position_;
};

// Collects every NAL unit of a buffer.
std::vector<NalUnit> ScanNalUnits(const uint8_t* data, size_t size,
                                  NalFraming framing = NalFraming::kAuto);

inline std::vector<NalUnit> ScanNalUnits(const std::vector<uint8_t>& data,
                                         NalFraming framing = NalFraming::kAuto) {
  return ScanNalUnits(data.data(), data.size(), framing);
}

}  // namespace metasei::h264

#endif  // METASEI_H264_NAL_SCANNER_H_
