// Repository: MetaSEI
// Component: Packet Injection
// Purpose: MetadataInjector bridge for FFmpeg AVPacket buffers.
// Copyright (c) 2025 MetaSEI

#include "metasei/injection/PacketInjection.hpp"

#ifdef METASEI_FFMPEG_AVAILABLE

#include <cerrno>
#include <cstring>
#include <iostream>
#include <limits>

extern "C" {
#include <libavutil/error.h>
}

namespace metasei::injection {

int InjectPacket(MetadataInjector& injector, const AVPacket* in, AVPacket* out) {
  if (!in || !out || in == out) {
    return AVERROR(EINVAL);
  }

  const bool is_keyframe = (in->flags & AV_PKT_FLAG_KEY) != 0;
  auto bytes = injector.Inject(in->data, in->size > 0 ? static_cast<size_t>(in->size) : 0,
                               is_keyframe);
  if (!bytes) {
    return 0;
  }
  if (bytes->size() > static_cast<size_t>(std::numeric_limits<int>::max())) {
    std::cerr << "[PacketInjection] Rewritten packet too large: " << bytes->size() << std::endl;
    return AVERROR(ERANGE);
  }

  av_packet_unref(out);
  int ret = av_new_packet(out, static_cast<int>(bytes->size()));
  if (ret < 0) {
    char errbuf[AV_ERROR_MAX_STRING_SIZE];
    av_strerror(ret, errbuf, AV_ERROR_MAX_STRING_SIZE);
    std::cerr << "[PacketInjection] Failed to allocate packet: " << errbuf << std::endl;
    return ret;
  }
  std::memcpy(out->data, bytes->data(), bytes->size());

  ret = av_packet_copy_props(out, in);
  if (ret < 0) {
    char errbuf[AV_ERROR_MAX_STRING_SIZE];
    av_strerror(ret, errbuf, AV_ERROR_MAX_STRING_SIZE);
    std::cerr << "[PacketInjection] Failed to copy packet properties: " << errbuf << std::endl;
    av_packet_unref(out);
    return ret;
  }
  return 1;
}

std::vector<sei::MetadataRecord> ExtractPacket(const MetadataInjector& injector,
                                               const AVPacket* packet) {
  if (!packet || !packet->data || packet->size <= 0) {
    return {};
  }
  return injector.Extract(packet->data, static_cast<size_t>(packet->size));
}

}  // namespace metasei::injection

#endif  // METASEI_FFMPEG_AVAILABLE
