// Repository: MetaSEI
// Component: Metadata Injector
// Purpose: Host-facing adapter that splices metadata SEI units into encoded access units.
// Copyright (c) 2025 MetaSEI

#include "metasei/injection/MetadataInjector.h"

#include "metasei/h264/NalScanner.h"
#include "metasei/injection/InsertionPoint.h"
#include "metasei/sei/SeiMessageBuilder.h"
#include "metasei/sei/SeiMessageParser.h"

#include <iostream>
#include <utility>

namespace metasei::injection {

std::unique_ptr<MetadataInjector> MetadataInjector::Create(const InjectorConfig& config,
                                                           const sei::MetadataRecord& metadata) {
  const auto uuid = sei::ParseSeiUuid(config.uuid);
  if (!uuid) {
    std::cerr << "[MetadataInjector] Invalid SEI UUID: '" << config.uuid << "'" << std::endl;
    return nullptr;
  }
  if (config.inject_every_n_frames < 0) {
    std::cerr << "[MetadataInjector] inject_every_n_frames must be >= 0, got "
              << config.inject_every_n_frames << std::endl;
    return nullptr;
  }
  if (config.frame_key.empty()) {
    std::cerr << "[MetadataInjector] frame_key must not be empty" << std::endl;
    return nullptr;
  }
  if (!metadata.isNull() && !metadata.isObject()) {
    std::cerr << "[MetadataInjector] Metadata must be a JSON object" << std::endl;
    return nullptr;
  }

  auto injector = std::make_unique<MetadataInjector>(
      ConstructionKey(), config, *uuid,
      metadata.isNull() ? sei::MetadataRecord(Json::objectValue) : metadata);

  std::cout << "[MetadataInjector] Created | uuid=" << sei::FormatSeiUuid(*uuid)
            << " | every_n=" << config.inject_every_n_frames
            << " | frame_key=" << config.frame_key << std::endl;
  return injector;
}

MetadataInjector::MetadataInjector(ConstructionKey /*key*/, const InjectorConfig& config,
                                   const sei::SeiUuid& uuid, const sei::MetadataRecord& metadata)
    : config_(config),
      uuid_(uuid),
      metadata_(metadata),
      frame_counter_(0),
      frames_injected_(0),
      bytes_injected_(0),
      first_injection_logged_(false) {}

MetadataInjector::~MetadataInjector() = default;

bool MetadataInjector::SetMetadata(const sei::MetadataRecord& metadata) {
  if (!metadata.isObject()) {
    std::cerr << "[MetadataInjector] SetMetadata ignored: not a JSON object" << std::endl;
    return false;
  }
  std::lock_guard<std::mutex> lock(metadata_mutex_);
  metadata_ = metadata;
  return true;
}

sei::MetadataRecord MetadataInjector::metadata() const {
  std::lock_guard<std::mutex> lock(metadata_mutex_);
  return metadata_;
}

bool MetadataInjector::ShouldInject(uint64_t frame_index, bool is_keyframe) const {
  if (is_keyframe) {
    return true;
  }
  const int every_n = config_.inject_every_n_frames;
  return every_n > 0 && frame_index % static_cast<uint64_t>(every_n) == 0;
}

std::optional<std::vector<uint8_t>> MetadataInjector::Inject(const uint8_t* data, size_t size,
                                                             bool is_keyframe) {
  return Inject(data, size, is_keyframe, metadata());
}

std::optional<std::vector<uint8_t>> MetadataInjector::Inject(const uint8_t* data, size_t size,
                                                             bool is_keyframe,
                                                             const sei::MetadataRecord& metadata) {
  const uint64_t frame_index = frame_counter_.fetch_add(1) + 1;
  if (!ShouldInject(frame_index, is_keyframe)) {
    return std::nullopt;
  }

  // A per-call record that is not an object only contributes the frame index.
  sei::MetadataRecord record =
      metadata.isObject() ? metadata : sei::MetadataRecord(Json::objectValue);
  record[config_.frame_key] = static_cast<Json::Int64>(frame_index);

  const h264::NalFraming framing = (config_.framing == h264::NalFraming::kAuto)
                                       ? h264::DetectFraming(data, size)
                                       : config_.framing;
  const auto nal_units = h264::ScanNalUnits(data, size, framing);
  const size_t point = FindInsertionPoint(nal_units);
  const std::vector<uint8_t> sei_nal = sei::BuildMetadataSeiNal(uuid_, record, framing);

  frames_injected_.fetch_add(1);
  bytes_injected_.fetch_add(sei_nal.size());

  if (!first_injection_logged_.exchange(true)) {
    std::cout << "[MetadataInjector] First SEI injected | frame=" << frame_index
              << " | keyframe=" << (is_keyframe ? "yes" : "no") << " | offset=" << point
              << " | sei_bytes=" << sei_nal.size() << std::endl;
  }

  return SpliceAt(data, size, point, sei_nal);
}

buffer::EncodedFramePtr MetadataInjector::Inject(const buffer::EncodedFramePtr& frame) {
  return Inject(frame, metadata());
}

buffer::EncodedFramePtr MetadataInjector::Inject(const buffer::EncodedFramePtr& frame,
                                                 const sei::MetadataRecord& metadata) {
  if (!frame) {
    return frame;
  }
  auto bytes = Inject(frame->data.data(), frame->data.size(), frame->metadata.is_keyframe,
                      metadata);
  if (!bytes) {
    return frame;
  }
  auto rewritten = std::make_shared<buffer::EncodedFrame>();
  rewritten->metadata = frame->metadata;
  rewritten->data = std::move(*bytes);
  return rewritten;
}

std::vector<sei::MetadataRecord> MetadataInjector::Extract(const uint8_t* data,
                                                           size_t size) const {
  return sei::ExtractAll(data, size, uuid_, config_.framing);
}

std::vector<sei::MetadataRecord> MetadataInjector::Extract(
    const buffer::EncodedFrame& frame) const {
  return Extract(frame.data.data(), frame.data.size());
}

uint64_t MetadataInjector::frame_index() const {
  return frame_counter_.load();
}

InjectorStats MetadataInjector::Snapshot() const {
  InjectorStats stats;
  stats.frames_seen = frame_counter_.load();
  stats.frames_injected = frames_injected_.load();
  stats.bytes_injected = bytes_injected_.load();
  return stats;
}

}  // namespace metasei::injection
