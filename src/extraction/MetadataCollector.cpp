// Repository: MetaSEI
// Component: Metadata Collector
// Purpose: Receiver-side accumulation and de-duplication of extracted metadata records.
// Copyright (c) 2025 MetaSEI

#include "metasei/extraction/MetadataCollector.h"

#include "metasei/sei/SeiMessageParser.h"

#include <fstream>
#include <iostream>
#include <utility>

namespace metasei::extraction {

std::unique_ptr<MetadataCollector> MetadataCollector::Create(const CollectorConfig& config) {
  const auto uuid = sei::ParseSeiUuid(config.uuid);
  if (!uuid) {
    std::cerr << "[MetadataCollector] Invalid SEI UUID: '" << config.uuid << "'" << std::endl;
    return nullptr;
  }
  std::cout << "[MetadataCollector] Looking for UUID " << sei::FormatSeiUuid(*uuid) << std::endl;
  return std::make_unique<MetadataCollector>(ConstructionKey(), config, *uuid);
}

MetadataCollector::MetadataCollector(ConstructionKey /*key*/, const CollectorConfig& config,
                                     const sei::SeiUuid& uuid)
    : config_(config),
      uuid_(uuid),
      latest_(Json::nullValue),
      merged_(Json::objectValue) {}

std::string MetadataCollector::DedupKey(const sei::MetadataRecord& record) const {
  sei::MetadataRecord trimmed = record;
  for (const auto& key : config_.dedup_ignore_keys) {
    trimmed.removeMember(key);
  }
  // Object members are written in sorted order, so equal content yields equal text.
  return sei::EncodeMetadata(trimmed);
}

std::vector<sei::MetadataRecord> MetadataCollector::Consume(const uint8_t* data, size_t size) {
  std::vector<sei::MetadataRecord> records = sei::ExtractAll(data, size, uuid_, config_.framing);

  std::vector<sei::MetadataRecord> fresh;
  std::lock_guard<std::mutex> lock(mutex_);
  ++stats_.buffers_processed;
  stats_.records_extracted += records.size();

  for (auto& record : records) {
    if (!seen_.insert(DedupKey(record)).second) {
      continue;
    }
    ++stats_.unique_records;
    for (const auto& name : record.getMemberNames()) {
      merged_[name] = record[name];
    }
    latest_ = record;

    std::cout << "[MetadataCollector] New metadata (#" << stats_.unique_records
              << "): " << sei::EncodeMetadata(record) << std::endl;
    fresh.push_back(std::move(record));
  }
  return fresh;
}

sei::MetadataRecord MetadataCollector::Latest() const {
  std::lock_guard<std::mutex> lock(mutex_);
  return latest_;
}

sei::MetadataRecord MetadataCollector::Merged() const {
  std::lock_guard<std::mutex> lock(mutex_);
  return merged_;
}

bool MetadataCollector::WriteJsonFile(const std::string& path) const {
  const sei::MetadataRecord merged = Merged();
  if (merged.empty()) {
    std::cerr << "[MetadataCollector] No metadata collected - not writing " << path << std::endl;
    return false;
  }

  std::ofstream out(path, std::ios::out | std::ios::trunc);
  if (!out) {
    std::cerr << "[MetadataCollector] Failed to open " << path << " for writing" << std::endl;
    return false;
  }

  Json::StreamWriterBuilder builder;
  builder["indentation"] = "  ";
  builder["emitUTF8"] = true;
  const std::unique_ptr<Json::StreamWriter> writer(builder.newStreamWriter());
  writer->write(merged, &out);
  out << '\n';
  if (!out) {
    std::cerr << "[MetadataCollector] Failed to write " << path << std::endl;
    return false;
  }

  std::cout << "[MetadataCollector] Metadata written to " << path << std::endl;
  return true;
}

CollectorStats MetadataCollector::Snapshot() const {
  std::lock_guard<std::mutex> lock(mutex_);
  return stats_;
}

}  // namespace metasei::extraction
