// Repository: MetaSEI
// Component: Metadata Record
// Purpose: Application metadata carried as UTF-8 JSON after the SEI UUID.
// Copyright (c) 2025 MetaSEI

#include "metasei/sei/MetadataRecord.h"

#include <memory>

namespace metasei::sei {

namespace {

Json::StreamWriterBuilder MakeCompactWriter() {
  Json::StreamWriterBuilder builder;
  builder["indentation"] = "";
  builder["emitUTF8"] = true;
  return builder;
}

}  // namespace

std::string EncodeMetadata(const MetadataRecord& record) {
  static const Json::StreamWriterBuilder kWriter = MakeCompactWriter();
  return Json::writeString(kWriter, record);
}

std::optional<MetadataRecord> DecodeMetadata(const uint8_t* data, size_t size) {
  if (data == nullptr) {
    return std::nullopt;
  }
  while (size > 0 && (data[size - 1] == 0x00 || data[size - 1] == 0x80)) {
    --size;
  }
  if (size == 0 || !IsValidUtf8(data, size)) {
    return std::nullopt;
  }

  Json::CharReaderBuilder builder;
  builder["collectComments"] = false;
  builder["failIfExtra"] = true;
  const std::unique_ptr<Json::CharReader> reader(builder.newCharReader());

  const char* begin = reinterpret_cast<const char*>(data);
  MetadataRecord record;
  std::string errors;
  if (!reader->parse(begin, begin + size, &record, &errors)) {
    return std::nullopt;
  }
  if (!record.isObject()) {
    return std::nullopt;
  }
  return record;
}

bool IsValidUtf8(const uint8_t* data, size_t size) {
  size_t i = 0;
  while (i < size) {
    const uint8_t lead = data[i];
    size_t continuation = 0;
    uint32_t code_point = 0;
    if (lead < 0x80) {
      ++i;
      continue;
    } else if ((lead & 0xE0) == 0xC0) {
      continuation = 1;
      code_point = lead & 0x1F;
    } else if ((lead & 0xF0) == 0xE0) {
      continuation = 2;
      code_point = lead & 0x0F;
    } else if ((lead & 0xF8) == 0xF0) {
      continuation = 3;
      code_point = lead & 0x07;
    } else {
      return false;
    }
    if (continuation >= size - i) {
      return false;
    }
    for (size_t k = 1; k <= continuation; ++k) {
      const uint8_t b = data[i + k];
      if ((b & 0xC0) != 0x80) {
        return false;
      }
      code_point = (code_point << 6) | (b & 0x3F);
    }
    // Overlong forms, UTF-16 surrogates and values past U+10FFFF.
    if ((continuation == 1 && code_point < 0x80) ||
        (continuation == 2 && code_point < 0x800) ||
        (continuation == 3 && code_point < 0x10000) ||
        (code_point >= 0xD800 && code_point <= 0xDFFF) || code_point > 0x10FFFF) {
      return false;
    }
    i += continuation + 1;
  }
  return true;
}

}  // namespace metasei::sei
