// Repository: MetaSEI
// Component: NAL Unit Scanner
// Purpose: Cursor over the NAL units of an Annex-B or length-prefixed buffer.
// Copyright (c) 2025 MetaSEI

#include "metasei/h264/NalScanner.h"

namespace metasei::h264 {

namespace {

constexpr uint8_t kNalTypeMask = 0x1F;

uint32_t ReadBigEndian32(const uint8_t* p) {
  return (static_cast<uint32_t>(p[0]) << 24) | (static_cast<uint32_t>(p[1]) << 16) |
         (static_cast<uint32_t>(p[2]) << 8) | static_cast<uint32_t>(p[3]);
}

bool StartsWithStartCode(const uint8_t* data, size_t size) {
  if (size >= 3 && data[0] == 0x00 && data[1] == 0x00 && data[2] == 0x01) {
    return true;
  }
  return size >= 4 && data[0] == 0x00 && data[1] == 0x00 && data[2] == 0x00 &&
         data[3] == 0x01;
}

// True when 4-byte big-endian lengths, each followed by a non-empty NAL unit
// of that size, cover the buffer exactly.
bool LengthPrefixesTileBuffer(const uint8_t* data, size_t size) {
  size_t pos = 0;
  while (pos < size) {
    if (size - pos <= kLengthPrefixSize) {
      return false;
    }
    const uint32_t length = ReadBigEndian32(data + pos);
    pos += kLengthPrefixSize;
    if (length == 0 || length > size - pos) {
      return false;
    }
    pos += length;
  }
  return size > 0;
}

}  // namespace

NalFraming DetectFraming(const uint8_t* data, size_t size) {
  if (data == nullptr) {
    return NalFraming::kAnnexB;
  }
  // A first NAL of 1 or 256-511 bytes puts 00 00 00 01 / 00 00 01 xx in
  // front of a length-prefixed buffer too.
  if (StartsWithStartCode(data, size)) {
    return LengthPrefixesTileBuffer(data, size) ? NalFraming::kLengthPrefixed
                                                : NalFraming::kAnnexB;
  }
  if (size > kLengthPrefixSize) {
    const uint32_t first_length = ReadBigEndian32(data);
    if (first_length > 0 && first_length < size) {
      return NalFraming::kLengthPrefixed;
    }
  }
  return NalFraming::kAnnexB;
}

NalScanner::NalScanner(const uint8_t* data, size_t size, NalFraming framing)
    : data_(data),
      size_(data == nullptr ? 0 : size),
      framing_(framing == NalFraming::kAuto ? DetectFraming(data, size) : framing),
      exhausted_(size_ == 0),
      position_(0) {
  if (!exhausted_ && framing_ == NalFraming::kAnnexB) {
    next_start_ = FindStartCode(0);
  }
}

std::optional<NalUnit> NalScanner::Next() {
  if (exhausted_) {
    return std::nullopt;
  }
  auto unit = (framing_ == NalFraming::kLengthPrefixed) ? NextLengthPrefixed() : NextAnnexB();
  if (!unit) {
    exhausted_ = true;
  }
  return unit;
}

// Finds the first 00 00 01 at or after `from`. A zero byte directly before
// it (and not before `from`) turns it into a 4-byte start code.
std::optional<NalScanner::StartCode> NalScanner::FindStartCode(size_t from) const {
  for (size_t i = from; i + 2 < size_; ++i) {
    if (data_[i + 2] > 0x01) {
      // Neither data_[i..i+2] nor the next window starting at i+1 can match.
      ++i;
      continue;
    }
    if (data_[i] == 0x00 && data_[i + 1] == 0x00 && data_[i + 2] == 0x01) {
      if (i > from && data_[i - 1] == 0x00) {
        return StartCode{i - 1, 4};
      }
      return StartCode{i, 3};
    }
  }
  return std::nullopt;
}

std::optional<NalUnit> NalScanner::NextAnnexB() {
  if (!next_start_) {
    return std::nullopt;
  }

  NalUnit unit;
  unit.start_offset = next_start_->offset;
  unit.start_code_length = next_start_->length;
  unit.payload_offset = unit.start_offset + unit.start_code_length;
  if (unit.payload_offset >= size_) {
    // Start code with no NAL header behind it.
    next_start_.reset();
    return std::nullopt;
  }
  unit.nal_type = data_[unit.payload_offset] & kNalTypeMask;

  next_start_ = FindStartCode(unit.payload_offset + 1);
  unit.end_offset = next_start_ ? next_start_->offset : size_;
  return unit;
}

std::optional<NalUnit> NalScanner::NextLengthPrefixed() {
  if (position_ + kLengthPrefixSize > size_) {
    return std::nullopt;
  }
  const uint32_t nal_length = ReadBigEndian32(data_ + position_);
  const size_t payload_offset = position_ + kLengthPrefixSize;
  if (nal_length == 0 || nal_length > size_ - payload_offset) {
    return std::nullopt;
  }

  NalUnit unit;
  unit.start_offset = position_;
  unit.payload_offset = payload_offset;
  unit.end_offset = payload_offset + nal_length;
  unit.start_code_length = static_cast<uint8_t>(kLengthPrefixSize);
  unit.nal_type = data_[payload_offset] & kNalTypeMask;

  position_ = unit.end_offset;
  return unit;
}

std::vector<NalUnit> ScanNalUnits(const uint8_t* data, size_t size, NalFraming framing) {
  std::vector<NalUnit> units;
  NalScanner scanner(data, size, framing);
  while (auto unit = scanner.Next()) {
    units.push_back(*unit);
  }
  return units;
}

}  // namespace metasei::h264
