// Repository: MetaSEI
// Component: Insertion Point Policy
// Purpose: Chooses the byte offset in an access unit where an SEI NAL unit may be spliced.
// Copyright (c) 2025 MetaSEI

#ifndef METASEI_INJECTION_INSERTION_POINT_H_
#define METASEI_INJECTION_INSERTION_POINT_H_

#include "metasei/h264/NalUnit.h"

#include <cstddef>
#include <cstdint>
#include <vector>

namespace metasei::injection {

// Walks the NAL units of one access unit in bitstream order.
//
//  - AUD, SEI, SPS and PPS move the candidate to just past the unit.
//  - The first coded slice (types 1..5) stops the walk; its start offset is
//    returned, so the SEI lands after every header unit and before the
//    slice's own start code.
//  - Without any slice, the candidate after the last header unit is
//    returned, or 0 when there is no header unit either.
//
// The result is always a NAL unit boundary (or 0).
size_t FindInsertionPoint(const std::vector<h264::NalUnit>& nal_units);

// Returns data[0, point) + insert + data[point, size).
std::vector<uint8_t> SpliceAt(const uint8_t* data, size_t size, size_t point,
                              const std::vector<uint8_t>& insert);

}  // namespace metasei::injection

#endif  // METASEI_INJECTION_INSERTION_POINT_H_
