// Repository: MetaSEI
// Component: Metadata Record
// Purpose: Application metadata carried as UTF-8 JSON after the SEI UUID.
// Copyright (c) 2025 MetaSEI

#ifndef METASEI_SEI_METADATA_RECORD_H_
#define METASEI_SEI_METADATA_RECORD_H_

#include <cstddef>
#include <cstdint>
#include <optional>
#include <string>

#include <json/json.h>

namespace metasei::sei {

// A MetadataRecord is a Json::Value of objectValue type. Members may hold any
// JSON value (string, number, bool, null, object, array).
using MetadataRecord = Json::Value;

// Compact single-line UTF-8 JSON, e.g. {"frame":3,"user":"a"}.
std::string EncodeMetadata(const MetadataRecord& record);

// Strips trailing 0x00 / 0x80 padding, checks UTF-8, parses JSON.
// Returns std::nullopt unless the text is a well-formed JSON object.
std::optional<MetadataRecord> DecodeMetadata(const uint8_t* data, size_t size);

bool IsValidUtf8(const uint8_t* data, size_t size);

}  // namespace metasei::sei

#endif  // METASEI_SEI_METADATA_RECORD_H_
