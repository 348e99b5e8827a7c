// Repository: MetaSEI
// Component: NAL Unit Scanner Contract Tests
// Purpose: Contract tests for Annex-B / length-prefixed NAL unit scanning.
// Copyright (c) 2025 MetaSEI

#include "../../BaseContractTest.h"
#include "../ContractRegistryEnvironment.h"

#include <cstdint>
#include <vector>

#include <gtest/gtest.h>

#include "metasei/h264/NalScanner.h"
#include "../../fixtures/AccessUnitFactory.h"

using namespace metasei::h264;
using namespace metasei::tests::fixtures;

namespace
{
  using metasei::tests::RegisterExpectedDomainCoverage;

  const bool kRegisterCoverage = []()
  {
    RegisterExpectedDomainCoverage(
        "NalScanner",
        {"NAL_001", "NAL_002", "NAL_003", "NAL_004", "NAL_005", "NAL_006", "NAL_007"});
    return true;
  }();

  std::vector<uint8_t> Types(const std::vector<NalUnit> &units)
  {
    std::vector<uint8_t> types;
    for (const auto &unit : units)
    {
      types.push_back(unit.nal_type);
    }
    return types;
  }

  class NalScannerContractTest : public metasei::tests::BaseContractTest
  {
  protected:
    [[nodiscard]] std::string DomainName() const override { return "NalScanner"; }

    [[nodiscard]] std::vector<std::string> CoveredRuleIds() const override
    {
      return {"NAL_001", "NAL_002", "NAL_003", "NAL_004", "NAL_005", "NAL_006", "NAL_007"};
    }
  };

  // ======================================================================
  // NAL_001: Start codes and NAL types
  // ======================================================================
  TEST_F(NalScannerContractTest, NAL_001_ClassifiesUnitsBehindThreeAndFourByteStartCodes)
  {
    const auto four = MakeKeyAccessUnit();
    const auto units = ScanNalUnits(four);
    ASSERT_EQ(units.size(), 4u);
    EXPECT_EQ(Types(units), (std::vector<uint8_t>{9, 7, 8, 5}));
    for (const auto &unit : units)
    {
      EXPECT_EQ(unit.start_code_length, 4);
      EXPECT_EQ(unit.payload_offset, unit.start_offset + 4);
      EXPECT_LT(unit.start_offset, unit.payload_offset);
      EXPECT_LE(unit.payload_offset, unit.end_offset);
    }
    // Views are contiguous.
    for (size_t i = 1; i < units.size(); ++i)
    {
      EXPECT_EQ(units[i - 1].end_offset, units[i].start_offset);
    }
    EXPECT_EQ(units.back().end_offset, four.size());

    const auto three = AccessUnitBuilder(AccessUnitBuilder::Framing::kThreeByteStartCode)
                           .Aud()
                           .NonIdr()
                           .Build();
    const auto short_units = ScanNalUnits(three);
    ASSERT_EQ(short_units.size(), 2u);
    EXPECT_EQ(short_units[0].start_code_length, 3);
    EXPECT_EQ(short_units[0].start_offset, 0u);
    EXPECT_EQ(short_units[0].end_offset, 5u);
    EXPECT_EQ(short_units[1].type(), NalUnitType::kSliceNonIdr);
  }

  // ======================================================================
  // NAL_002: A zero before 00 00 01 makes a 4-byte start code
  // ======================================================================
  TEST_F(NalScannerContractTest, NAL_002_PrefersFourByteStartCode)
  {
    const std::vector<uint8_t> data = {0x00, 0x00, 0x01, 0x09, 0xF0,
                                       0x00, 0x00, 0x00, 0x01, 0x67, 0x42};
    const auto units = ScanNalUnits(data);
    ASSERT_EQ(units.size(), 2u);
    EXPECT_EQ(units[0].start_code_length, 3);
    EXPECT_EQ(units[0].end_offset, 5u);
    EXPECT_EQ(units[1].start_offset, 5u);
    EXPECT_EQ(units[1].start_code_length, 4);
    EXPECT_EQ(units[1].payload_offset, 9u);
    EXPECT_EQ(units[1].nal_type, 7);
  }

  // ======================================================================
  // NAL_003: Length-prefixed framing
  // ======================================================================
  TEST_F(NalScannerContractTest, NAL_003_DetectsLengthPrefixedFraming)
  {
    const auto avcc = AccessUnitBuilder(AccessUnitBuilder::Framing::kLengthPrefixed)
                          .Aud()
                          .Sps()
                          .Pps()
                          .Idr()
                          .Build();
    EXPECT_EQ(DetectFraming(avcc.data(), avcc.size()), NalFraming::kLengthPrefixed);

    NalScanner scanner(avcc.data(), avcc.size());
    EXPECT_EQ(scanner.framing(), NalFraming::kLengthPrefixed);

    const auto units = ScanNalUnits(avcc);
    ASSERT_EQ(units.size(), 4u);
    EXPECT_EQ(Types(units), (std::vector<uint8_t>{9, 7, 8, 5}));
    EXPECT_EQ(units[0].start_offset, 0u);
    EXPECT_EQ(units[0].payload_offset, 4u);
    EXPECT_EQ(units[0].end_offset, 6u);
    EXPECT_EQ(units.back().end_offset, avcc.size());

    // Start code at offset 0 wins over the length reading (00 00 00 01 == 1).
    const auto annexb = MakeKeyAccessUnit();
    EXPECT_EQ(DetectFraming(annexb.data(), annexb.size()), NalFraming::kAnnexB);

    // First word not below the buffer size: Annex-B.
    const std::vector<uint8_t> big = {0x00, 0x00, 0x10, 0x00, 0x65, 0x88};
    EXPECT_EQ(DetectFraming(big.data(), big.size()), NalFraming::kAnnexB);
  }

  // ======================================================================
  // NAL_004: Truncated trailing data ends the scan quietly
  // ======================================================================
  TEST_F(NalScannerContractTest, NAL_004_TruncatedTailYieldsPartialResult)
  {
    auto data = AccessUnitBuilder().Aud().Idr().Build();
    data.insert(data.end(), {0x00, 0x00, 0x00, 0x01});
    const auto units = ScanNalUnits(data);
    ASSERT_EQ(units.size(), 2u);
    EXPECT_EQ(units[1].nal_type, 5);
    EXPECT_EQ(units[1].end_offset, data.size() - 4);

    auto avcc = AccessUnitBuilder(AccessUnitBuilder::Framing::kLengthPrefixed).Aud().Build();
    avcc.insert(avcc.end(), {0x00, 0x00, 0x00, 0x40, 0x65, 0x88});
    const auto avcc_units = ScanNalUnits(avcc, NalFraming::kLengthPrefixed);
    ASSERT_EQ(avcc_units.size(), 1u);
    EXPECT_EQ(avcc_units[0].nal_type, 9);

    EXPECT_TRUE(ScanNalUnits(nullptr, 0).empty());
    const std::vector<uint8_t> garbage = {0x12, 0x34, 0x56};
    EXPECT_TRUE(ScanNalUnits(garbage, NalFraming::kAnnexB).empty());
  }

  // ======================================================================
  // NAL_005: Cursor semantics
  // ======================================================================
  TEST_F(NalScannerContractTest, NAL_005_CursorStaysExhaustedAndRestartsOnlyByRescan)
  {
    const auto data = MakeDeltaAccessUnit();
    NalScanner scanner(data.data(), data.size());
    EXPECT_FALSE(scanner.exhausted());

    auto first = scanner.Next();
    ASSERT_TRUE(first.has_value());
    EXPECT_EQ(first->nal_type, 9);
    auto second = scanner.Next();
    ASSERT_TRUE(second.has_value());
    EXPECT_EQ(second->nal_type, 1);

    EXPECT_FALSE(scanner.Next().has_value());
    EXPECT_TRUE(scanner.exhausted());
    EXPECT_FALSE(scanner.Next().has_value());

    NalScanner again(data.data(), data.size());
    auto replay = again.Next();
    ASSERT_TRUE(replay.has_value());
    EXPECT_EQ(replay->start_offset, first->start_offset);
    EXPECT_EQ(replay->end_offset, first->end_offset);

    NalScanner empty(nullptr, 0);
    EXPECT_TRUE(empty.exhausted());
    EXPECT_FALSE(empty.Next().has_value());
  }

  // ======================================================================
  // NAL_006: Explicit framing overrides the heuristic
  // ======================================================================
  TEST_F(NalScannerContractTest, NAL_006_ExplicitFramingOverridesDetection)
  {
    const auto avcc = AccessUnitBuilder(AccessUnitBuilder::Framing::kLengthPrefixed)
                          .Aud()
                          .Idr()
                          .Build();
    // Read as Annex-B there is no start code at all.
    EXPECT_TRUE(ScanNalUnits(avcc, NalFraming::kAnnexB).empty());
    EXPECT_EQ(ScanNalUnits(avcc, NalFraming::kLengthPrefixed).size(), 2u);

    const auto annexb = MakeKeyAccessUnit();
    NalScanner forced(annexb.data(), annexb.size(), NalFraming::kAnnexB);
    EXPECT_EQ(forced.framing(), NalFraming::kAnnexB);
  }

  // ======================================================================
  // NAL_007: Length prefixes that look like start codes
  // ======================================================================
  TEST_F(NalScannerContractTest, NAL_007_LengthPrefixThatMimicsStartCode)
  {
    // A 300-byte slice: the buffer opens with 00 00 01 2C.
    std::vector<uint8_t> slice(300, 0xAB);
    slice[0] = 0x65;
    const auto avcc = AccessUnitBuilder(AccessUnitBuilder::Framing::kLengthPrefixed)
                          .Add(slice)
                          .Idr()
                          .Build();
    ASSERT_EQ(avcc[2], 0x01);
    EXPECT_EQ(DetectFraming(avcc.data(), avcc.size()), NalFraming::kLengthPrefixed);

    const auto units = ScanNalUnits(avcc);
    ASSERT_EQ(units.size(), 2u);
    EXPECT_EQ(units[0].nal_type, 5);
    EXPECT_EQ(units[0].end_offset, 304u);
    EXPECT_EQ(units[1].start_offset, 304u);
    EXPECT_EQ(units[1].end_offset, avcc.size());

    // A one-byte first NAL: the buffer opens with 00 00 00 01.
    const auto tiny = AccessUnitBuilder(AccessUnitBuilder::Framing::kLengthPrefixed)
                          .Add({0x0C})
                          .Idr()
                          .Build();
    EXPECT_EQ(DetectFraming(tiny.data(), tiny.size()), NalFraming::kLengthPrefixed);
    EXPECT_EQ(Types(ScanNalUnits(tiny)), (std::vector<uint8_t>{12, 5}));

    // Real Annex-B input whose lengths do not add up keeps start-code framing.
    const auto annexb = MakeKeyAccessUnit();
    EXPECT_EQ(DetectFraming(annexb.data(), annexb.size()), NalFraming::kAnnexB);
    const auto three = AccessUnitBuilder(AccessUnitBuilder::Framing::kThreeByteStartCode)
                           .Add(slice)
                           .Build();
    EXPECT_EQ(DetectFraming(three.data(), three.size()), NalFraming::kAnnexB);
  }

} // namespace
