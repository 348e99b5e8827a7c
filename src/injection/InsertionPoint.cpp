// Repository: MetaSEI
// Component: Insertion Point Policy
// Purpose: Chooses the byte offset in an access unit where an SEI NAL unit may be spliced.
// Copyright (c) 2025 MetaSEI

#include "metasei/injection/InsertionPoint.h"

#include <algorithm>

namespace metasei::injection {

size_t FindInsertionPoint(const std::vector<h264::NalUnit>& nal_units) {
  size_t candidate = 0;
  for (const auto& unit : nal_units) {
    if (h264::IsVclNalType(unit.nal_type)) {
      return unit.start_offset;
    }
    if (h264::IsAccessUnitHeaderNalType(unit.nal_type)) {
      candidate = unit.end_offset;
    }
  }
  return candidate;
}

std::vector<uint8_t> SpliceAt(const uint8_t* data, size_t size, size_t point,
                              const std::vector<uint8_t>& insert) {
  point = std::min(point, size);
  std::vector<uint8_t> out;
  out.reserve(size + insert.size());
  out.insert(out.end(), data, data + point);
  out.insert(out.end(), insert.begin(), insert.end());
  out.insert(out.end(), data + point, data + size);
  return out;
}

}  // namespace metasei::injection
