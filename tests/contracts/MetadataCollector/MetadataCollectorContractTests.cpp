// Repository: MetaSEI
// Component: Metadata Collector Contract Tests
// Purpose: Contract tests for receiver-side metadata deduplication and sidecar output.
// Copyright (c) 2025 MetaSEI

#include "../../BaseContractTest.h"
#include "../ContractRegistryEnvironment.h"

#include <cstdint>
#include <cstdio>
#include <fstream>
#include <memory>
#include <sstream>
#include <string>
#include <type_traits>
#include <vector>

#include <gtest/gtest.h>
#include <json/json.h>

#include "metasei/extraction/MetadataCollector.h"
#include "metasei/sei/SeiMessageBuilder.h"
#include "metasei/sei/SeiUuid.h"
#include "../../fixtures/AccessUnitFactory.h"

using namespace metasei::extraction;
using namespace metasei::tests::fixtures;

namespace
{
  using metasei::tests::RegisterExpectedDomainCoverage;

  const bool kRegisterCoverage = []()
  {
    RegisterExpectedDomainCoverage("MetadataCollector",
                                   {"COL_001", "COL_002", "COL_003", "COL_004"});
    return true;
  }();

  // Key access unit carrying `record` under the default UUID.
  std::vector<uint8_t> TaggedAccessUnit(const Json::Value &record, const char *uuid = "METADATA")
  {
    return AccessUnitBuilder()
        .Aud()
        .Raw(metasei::sei::BuildMetadataSeiNal(*metasei::sei::ParseSeiUuid(uuid), record))
        .Idr()
        .Build();
  }

  Json::Value Record(const char *key, int value)
  {
    Json::Value record(Json::objectValue);
    record[key] = value;
    return record;
  }

  class MetadataCollectorContractTest : public metasei::tests::BaseContractTest
  {
  protected:
    [[nodiscard]] std::string DomainName() const override { return "MetadataCollector"; }

    [[nodiscard]] std::vector<std::string> CoveredRuleIds() const override
    {
      return {"COL_001", "COL_002", "COL_003", "COL_004"};
    }

    std::vector<Json::Value> Feed(MetadataCollector &collector, const std::vector<uint8_t> &au)
    {
      return collector.Consume(au.data(), au.size());
    }
  };

  // ======================================================================
  // COL_001: Repeats differing only in the frame index are reported once
  // ======================================================================
  TEST_F(MetadataCollectorContractTest, COL_001_DeduplicatesIgnoringFrameIndex)
  {
    auto collector = MetadataCollector::Create(CollectorConfig());
    ASSERT_NE(collector, nullptr);

    Json::Value first = Record("user", 7);
    first["frame"] = 1;
    Json::Value repeat = Record("user", 7);
    repeat["frame"] = 31;

    const auto fresh = Feed(*collector, TaggedAccessUnit(first));
    ASSERT_EQ(fresh.size(), 1u);
    EXPECT_EQ(fresh[0], first);
    EXPECT_TRUE(Feed(*collector, TaggedAccessUnit(repeat)).empty());
    EXPECT_TRUE(Feed(*collector, MakeDeltaAccessUnit()).empty());

    const auto stats = collector->Snapshot();
    EXPECT_EQ(stats.buffers_processed, 3u);
    EXPECT_EQ(stats.records_extracted, 2u);
    EXPECT_EQ(stats.unique_records, 1u);

    // With no ignored members every frame index is new.
    CollectorConfig strict;
    strict.dedup_ignore_keys.clear();
    auto strict_collector = MetadataCollector::Create(strict);
    ASSERT_NE(strict_collector, nullptr);
    EXPECT_EQ(Feed(*strict_collector, TaggedAccessUnit(first)).size(), 1u);
    EXPECT_EQ(Feed(*strict_collector, TaggedAccessUnit(repeat)).size(), 1u);
  }

  // ======================================================================
  // COL_002: Latest and merged views
  // ======================================================================
  TEST_F(MetadataCollectorContractTest, COL_002_LatestAndMergedViews)
  {
    auto collector = MetadataCollector::Create(CollectorConfig());
    ASSERT_NE(collector, nullptr);
    EXPECT_TRUE(collector->Latest().isNull());
    EXPECT_TRUE(collector->Merged().empty());

    Feed(*collector, TaggedAccessUnit(Record("a", 1)));
    Feed(*collector, TaggedAccessUnit(Record("b", 2)));
    Feed(*collector, TaggedAccessUnit(Record("a", 3)));

    EXPECT_EQ(collector->Latest(), Record("a", 3));

    Json::Value merged(Json::objectValue);
    merged["a"] = 3;
    merged["b"] = 2;
    EXPECT_EQ(collector->Merged(), merged);
  }

  // ======================================================================
  // COL_003: Sidecar JSON file
  // ======================================================================
  TEST_F(MetadataCollectorContractTest, COL_003_WritesIndentedSidecar)
  {
    auto collector = MetadataCollector::Create(CollectorConfig());
    ASSERT_NE(collector, nullptr);
    const std::string path = testing::TempDir() + "metasei_collector_sidecar.json";
    std::remove(path.c_str());

    // Nothing collected yet.
    EXPECT_FALSE(collector->WriteJsonFile(path));

    Json::Value record = Record("user", 1);
    record["title"] = "Cam 1";
    Feed(*collector, TaggedAccessUnit(record));
    // A later record without "title" does not drop it from the file.
    Feed(*collector, TaggedAccessUnit(Record("user", 2)));
    ASSERT_TRUE(collector->WriteJsonFile(path));

    std::ifstream in(path);
    ASSERT_TRUE(in.good());
    std::stringstream contents;
    contents << in.rdbuf();
    const std::string text = contents.str();
    EXPECT_NE(text.find("\n  \"title\" : \"Cam 1\""), std::string::npos) << text;

    Json::CharReaderBuilder builder;
    Json::Value parsed;
    std::string errors;
    std::istringstream stream(text);
    ASSERT_TRUE(Json::parseFromStream(builder, stream, &parsed, &errors)) << errors;
    EXPECT_EQ(parsed, collector->Merged());
    EXPECT_EQ(parsed["user"].asInt(), 2);
    EXPECT_EQ(parsed["title"].asString(), "Cam 1");
    EXPECT_NE(parsed, collector->Latest());

    std::remove(path.c_str());
    EXPECT_FALSE(collector->WriteJsonFile(testing::TempDir() + "no-such-dir/out.json"));
  }

  // ======================================================================
  // COL_004: UUID selection
  // ======================================================================
  TEST_F(MetadataCollectorContractTest, COL_004_OnlyConfiguredUuidIsCollected)
  {
    static_assert(!std::is_constructible_v<MetadataCollector, const CollectorConfig &,
                                           const metasei::sei::SeiUuid &>);

    CollectorConfig bad;
    bad.uuid = "not-a-valid-uuid-tag";
    EXPECT_EQ(MetadataCollector::Create(bad), nullptr);

    CollectorConfig config;
    config.uuid = "a3f1c2d4-0000-4000-8000-0000deadbeef";
    auto collector = MetadataCollector::Create(config);
    ASSERT_NE(collector, nullptr);

    EXPECT_TRUE(Feed(*collector, TaggedAccessUnit(Record("x", 1))).empty());
    const auto fresh =
        Feed(*collector, TaggedAccessUnit(Record("x", 2), "a3f1c2d4-0000-4000-8000-0000deadbeef"));
    ASSERT_EQ(fresh.size(), 1u);
    EXPECT_EQ(fresh[0]["x"].asInt(), 2);
  }

} // namespace
