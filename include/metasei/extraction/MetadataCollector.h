// Repository: MetaSEI
// Component: Metadata Collector
// Purpose: Receiver-side accumulation and de-duplication of extracted metadata records.
// Copyright (c) 2025 MetaSEI

#ifndef METASEI_EXTRACTION_METADATA_COLLECTOR_H_
#define METASEI_EXTRACTION_METADATA_COLLECTOR_H_

#include "metasei/h264/NalUnit.h"
#include "metasei/sei/MetadataRecord.h"
#include "metasei/sei/SeiUuid.h"

#include <cstddef>
#include <cstdint>
#include <memory>
#include <mutex>
#include <set>
#include <string>
#include <vector>

namespace metasei::extraction {

// Configuration for MetadataCollector
struct CollectorConfig {
  std::string uuid = "METADATA";
  h264::NalFraming framing = h264::NalFraming::kAuto;
  // Members left out when deciding whether a record was seen before. The
  // injector's running frame index differs on every repeat, so it is
  // ignored by default.
  std::vector<std::string> dedup_ignore_keys = {"frame"};
};

// Statistics for MetadataCollector
struct CollectorStats {
  uint64_t buffers_processed = 0;   // Calls to Consume
  uint64_t records_extracted = 0;   // Records decoded, repeats included
  uint64_t unique_records = 0;      // Records reported as new
};

// MetadataCollector consumes the buffers of one received stream and keeps
// the distinct metadata records found in them.
//
// Senders repeat the same record on every key frame; Consume() reports a
// record only the first time its content (minus dedup_ignore_keys) appears.
class MetadataCollector {
  struct ConstructionKey {
    explicit ConstructionKey() = default;
  };

 public:
  // Returns nullptr (after logging why) if the UUID text does not parse.
  static std::unique_ptr<MetadataCollector> Create(const CollectorConfig& config);

  MetadataCollector(ConstructionKey key, const CollectorConfig& config, const sei::SeiUuid& uuid);

  // Disable copy and move
  MetadataCollector(const MetadataCollector&) = delete;
  MetadataCollector& operator=(const MetadataCollector&) = delete;

  // Extracts the records of one buffer and returns the ones not seen before,
  // in bitstream order.
  std::vector<sei::MetadataRecord> Consume(const uint8_t* data, size_t size);

  // Most recent new record (null before the first).
  sei::MetadataRecord Latest() const;

  // Key-wise union of every new record; later records win on conflicts.
  sei::MetadataRecord Merged() const;

  // Writes Merged() as indented JSON. Returns false if nothing was collected
  // or the file cannot be written.
  bool WriteJsonFile(const std::string& path) const;

  const sei::SeiUuid& uuid() const { return uuid_; }

  [[nodiscard]] CollectorStats Snapshot() const;

 private:

  std::string DedupKey(const sei::MetadataRecord& record) const;

  const CollectorConfig config_;
  const sei::SeiUuid uuid_;

  mutable std::mutex mutex_;
  std::set<std::string> seen_;
  sei::MetadataRecord latest_;
  sei::MetadataRecord merged_;
  CollectorStats stats_;
};

}  // namespace metasei::extraction

#endif  // METASEI_EXTRACTION_METADATA_COLLECTOR_H_
