// Repository: MetaSEI
// Component: Packet Injection
// Purpose: MetadataInjector bridge for FFmpeg AVPacket buffers.
// Copyright (c) 2025 MetaSEI

#ifndef METASEI_INJECTION_PACKET_INJECTION_HPP_
#define METASEI_INJECTION_PACKET_INJECTION_HPP_

#ifdef METASEI_FFMPEG_AVAILABLE

#include "metasei/injection/MetadataInjector.h"
#include "metasei/sei/MetadataRecord.h"

#include <vector>

extern "C" {
#include <libavcodec/avcodec.h>
}

namespace metasei::injection {

// Runs `in` through the injector. The key-frame flag is AV_PKT_FLAG_KEY.
//
// Returns:
//   1  `out` holds a new reference-counted packet with the SEI spliced in;
//      pts, dts, duration, flags, stream_index and side data are copied
//      from `in`.
//   0  the packet does not qualify; `out` is left untouched and the caller
//      forwards `in`.
//  <0  AVERROR code (invalid arguments, allocation failure).
int InjectPacket(MetadataInjector& injector, const AVPacket* in, AVPacket* out);

// Metadata records carried by `packet` under the injector's UUID.
std::vector<sei::MetadataRecord> ExtractPacket(const MetadataInjector& injector,
                                               const AVPacket* packet);

}  // namespace metasei::injection

#endif  // METASEI_FFMPEG_AVAILABLE

#endif  // METASEI_INJECTION_PACKET_INJECTION_HPP_
