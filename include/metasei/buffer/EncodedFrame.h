// Repository: MetaSEI
// Component: Encoded Frame
// Purpose: One encoded access unit as handed over by the media pipeline host.
// Copyright (c) 2025 MetaSEI

#ifndef METASEI_BUFFER_ENCODED_FRAME_H_
#define METASEI_BUFFER_ENCODED_FRAME_H_

#include <cstdint>
#include <memory>
#include <vector>

namespace metasei::buffer
{

  // Timing and flags the host attaches to an access unit. Never interpreted
  // by the codec; copied verbatim when a frame is rewritten.
  struct EncodedFrameMetadata
  {
    int64_t pts;      // Presentation timestamp (stream timebase units)
    int64_t dts;      // Decode timestamp (stream timebase units)
    int64_t duration; // Frame duration (stream timebase units)
    bool is_keyframe; // Host's key-frame flag (IDR access unit)

    EncodedFrameMetadata()
        : pts(0), dts(0), duration(0), is_keyframe(false) {}

    EncodedFrameMetadata(int64_t p, int64_t d, int64_t dur, bool key)
        : pts(p), dts(d), duration(dur), is_keyframe(key) {}
  };

  // EncodedFrame holds the bytes of one access unit plus its metadata.
  struct EncodedFrame
  {
    EncodedFrameMetadata metadata;
    std::vector<uint8_t> data; // Annex-B or length-prefixed NAL units
  };

  using EncodedFramePtr = std::shared_ptr<const EncodedFrame>;

} // namespace metasei::buffer

#endif // METASEI_BUFFER_ENCODED_FRAME_H_
