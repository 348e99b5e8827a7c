// Repository: MetaSEI
// Component: Metadata Injector
// Purpose: Host-facing adapter that splices metadata SEI units into encoded access units.
// Copyright (c) 2025 MetaSEI

#ifndef METASEI_INJECTION_METADATA_INJECTOR_H_
#define METASEI_INJECTION_METADATA_INJECTOR_H_

#include "metasei/buffer/EncodedFrame.h"
#include "metasei/injection/InjectorConfig.h"
#include "metasei/sei/MetadataRecord.h"
#include "metasei/sei/SeiUuid.h"

#include <atomic>
#include <cstddef>
#include <cstdint>
#include <memory>
#include <mutex>
#include <optional>
#include <vector>

namespace metasei::injection {

// MetadataInjector rewrites encoded access units so that they carry a
// user_data_unregistered SEI with the current metadata record.
//
// Cadence:
// - Every call advances the frame index by one (the first frame is index 1).
// - Key frames always get an SEI.
// - With inject_every_n_frames = N > 0, frames whose index is a multiple of N
//   get one as well.
// - Other frames pass through untouched.
//
// The injected record is the metadata record with config.frame_key set to the
// frame index of the call.
//
// Thread Model:
// - Inject/Extract may be called from several threads; the frame index is
//   atomic and the metadata record is guarded by a mutex.
// - The host owns one injector per logical stream.
class MetadataInjector {
  struct ConstructionKey {
    explicit ConstructionKey() = default;
  };

 public:
  // Validates the configuration. Returns nullptr (after logging why) when
  // the UUID text does not parse, the cadence is negative, the frame key is
  // empty, or `metadata` is neither null nor a JSON object.
  static std::unique_ptr<MetadataInjector> Create(
      const InjectorConfig& config,
      const sei::MetadataRecord& metadata = sei::MetadataRecord(Json::objectValue));

  MetadataInjector(ConstructionKey key, const InjectorConfig& config, const sei::SeiUuid& uuid,
                   const sei::MetadataRecord& metadata);
  ~MetadataInjector();

  // Disable copy and move
  MetadataInjector(const MetadataInjector&) = delete;
  MetadataInjector& operator=(const MetadataInjector&) = delete;
  MetadataInjector(MetadataInjector&&) = delete;
  MetadataInjector& operator=(MetadataInjector&&) = delete;

  // Replaces the record used by the Inject overloads without a metadata
  // argument. Returns false (record unchanged) if it is not a JSON object.
  bool SetMetadata(const sei::MetadataRecord& metadata);
  sei::MetadataRecord metadata() const;

  // Byte-level injection. Returns std::nullopt when the frame does not
  // qualify; the caller keeps forwarding its original buffer in that case.
  std::optional<std::vector<uint8_t>> Inject(const uint8_t* data, size_t size, bool is_keyframe);
  std::optional<std::vector<uint8_t>> Inject(const uint8_t* data, size_t size, bool is_keyframe,
                                             const sei::MetadataRecord& metadata);

  // Frame-level injection. Returns `frame` itself when it does not qualify,
  // otherwise a new frame with the same EncodedFrameMetadata and the SEI
  // spliced into its data.
  buffer::EncodedFramePtr Inject(const buffer::EncodedFramePtr& frame);
  buffer::EncodedFramePtr Inject(const buffer::EncodedFramePtr& frame,
                                 const sei::MetadataRecord& metadata);

  // Records tagged with this injector's UUID.
  std::vector<sei::MetadataRecord> Extract(const uint8_t* data, size_t size) const;
  std::vector<sei::MetadataRecord> Extract(const buffer::EncodedFrame& frame) const;

  const InjectorConfig& config() const { return config_; }
  const sei::SeiUuid& uuid() const { return uuid_; }

  // Index assigned to the most recent Inject call (0 before the first).
  uint64_t frame_index() const;

  [[nodiscard]] InjectorStats Snapshot() const;

 private:

  bool ShouldInject(uint64_t frame_index, bool is_keyframe) const;

  const InjectorConfig config_;
  const sei::SeiUuid uuid_;

  mutable std::mutex metadata_mutex_;
  sei::MetadataRecord metadata_;

  std::atomic<uint64_t> frame_counter_;
  std::atomic<uint64_t> frames_injected_;
  std::atomic<uint64_t> bytes_injected_;
  std::atomic<bool> first_injection_logged_;
};

}  // namespace metasei::injection

#endif  // METASEI_INJECTION_METADATA_INJECTOR_H_
