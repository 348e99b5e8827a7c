// Repository: MetaSEI
// Component: Access Unit Splitter
// Purpose: Splits a raw Annex-B elementary stream into access units.
// Copyright (c) 2025 MetaSEI

#include "metasei/h264/AccessUnitSplitter.h"

#include "metasei/h264/NalScanner.h"

namespace metasei::h264 {

namespace {

// first_mb_in_slice is the first ue(v) of the slice header; it is 0 exactly
// when the first bit after the NAL header is set.
bool StartsNewPicture(const uint8_t* data, const NalUnit& unit) {
  const size_t header_end = unit.payload_offset + 1;
  return header_end < unit.end_offset && (data[header_end] & 0x80) != 0;
}

}  // namespace

std::vector<AccessUnitSpan> SplitAccessUnits(const uint8_t* data, size_t size) {
  std::vector<AccessUnitSpan> access_units;

  bool open = false;
  bool seen_slice = false;
  AccessUnitSpan current;

  auto close_current = [&](size_t end) {
    if (open && end > current.offset) {
      current.size = end - current.offset;
      access_units.push_back(current);
    }
    open = false;
    seen_slice = false;
    current = AccessUnitSpan{};
  };

  NalScanner scanner(data, size, NalFraming::kAnnexB);
  while (auto unit = scanner.Next()) {
    const NalUnitType type = unit->type();
    bool boundary = false;
    if (type == NalUnitType::kAccessUnitDelimiter) {
      boundary = true;
    } else if (type == NalUnitType::kSps || type == NalUnitType::kPps ||
               type == NalUnitType::kSei) {
      boundary = seen_slice;
    } else if (IsVclNalType(unit->nal_type)) {
      boundary = seen_slice && StartsNewPicture(data, *unit);
    }

    if (boundary || !open) {
      close_current(unit->start_offset);
      current.offset = unit->start_offset;
      open = true;
    }
    if (IsVclNalType(unit->nal_type)) {
      seen_slice = true;
    }
    if (type == NalUnitType::kSliceIdr) {
      current.is_keyframe = true;
    }
  }
  close_current(size);
  return access_units;
}

}  // namespace metasei::h264
