// Repository: MetaSEI
// Component: Metadata Injector Configuration
// Purpose: Configuration and statistics structures for MetadataInjector.
// Copyright (c) 2025 MetaSEI

#ifndef METASEI_INJECTION_INJECTOR_CONFIG_H_
#define METASEI_INJECTION_INJECTOR_CONFIG_H_

#include "metasei/h264/NalUnit.h"

#include <cstdint>
#include <string>

namespace metasei::injection {

// Configuration for MetadataInjector
// POD struct - immutable after construction
struct InjectorConfig {
  std::string uuid = "METADATA";      // SEI UUID text (see ParseSeiUuid)
  int inject_every_n_frames = 0;      // 0 = key frames only
  std::string frame_key = "frame";    // Member that carries the running frame index
  h264::NalFraming framing = h264::NalFraming::kAuto;
};

// Statistics for MetadataInjector
struct InjectorStats {
  uint64_t frames_seen = 0;       // Calls to Inject
  uint64_t frames_injected = 0;   // Frames that received an SEI
  uint64_t bytes_injected = 0;    // Total SEI NAL bytes added
};

}  // namespace metasei::injection

#endif  // METASEI_INJECTION_INJECTOR_CONFIG_H_
