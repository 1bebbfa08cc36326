#include <sstream>
#include <string>

#include <gtest/gtest.h>
#include <nlohmann/json.hpp>

#include "replay/attribute.hpp"
#include "replay/errors.hpp"

namespace {

replay::RawAttributeRecord Record(std::uint16_t code, int owner, std::string value) {
  return replay::RawAttributeRecord{0x03E7, code, owner, std::move(value)};
}

std::string Bytes(const char* data, std::size_t len) { return std::string(data, len); }

}  // namespace

TEST(StripTrailingNullsTest, RemovesOnlyTrailingNulls) {
  EXPECT_EQ(replay::StripTrailingNulls(Bytes("Terr\0\0", 6)), "Terr");
  EXPECT_EQ(replay::StripTrailingNulls("Terr"), "Terr");
  EXPECT_EQ(replay::StripTrailingNulls(Bytes("a\0b\0", 4)), Bytes("a\0b", 3));
  EXPECT_EQ(replay::StripTrailingNulls(Bytes("\0\0\0", 3)), "");
  EXPECT_EQ(replay::StripTrailingNulls(""), "");
}

TEST(StripTrailingNullsTest, StripsExactlyKBytes) {
  for (std::size_t k = 0; k < 6; ++k) {
    std::string raw = Bytes("x\0y", 3) + std::string(k, '\0');
    auto stripped = replay::StripTrailingNulls(raw);
    EXPECT_EQ(stripped.size(), raw.size() - k) << k;
    EXPECT_EQ(stripped, Bytes("x\0y", 3));
  }
}

TEST(AttributeDecodeTest, RaceUsesSecondaryTable) {
  auto attr = replay::DecodeAttribute(Record(0x0BB9, 1, Bytes("Terr\0\0", 6)));
  EXPECT_EQ(attr.display_name, "Race");
  EXPECT_EQ(attr.owner_index, 1);
  EXPECT_EQ(attr.header, 0x03E7);
  ASSERT_FALSE(attr.HoldsInt());
  EXPECT_EQ(std::get<std::string>(attr.value), "Terran");
  EXPECT_EQ(attr.ToString(), "[1] Race: Terran");
}

TEST(AttributeDecodeTest, TeamCountIsComputedInteger) {
  auto attr = replay::DecodeAttribute(Record(0x07D2, 16, Bytes("2\0", 2)));
  EXPECT_EQ(attr.display_name, "Teams1v1");
  ASSERT_TRUE(attr.HoldsInt());
  EXPECT_EQ(std::get<int>(attr.value), 2);
}

TEST(AttributeDecodeTest, UnknownCodeKeepsStrippedRawValue) {
  auto attr = replay::DecodeAttribute(Record(0x1234, 3, Bytes("abc\0", 4)));
  EXPECT_EQ(attr.display_name, "Unknown");
  EXPECT_FALSE(attr.IsKnown());
  ASSERT_FALSE(attr.HoldsInt());
  EXPECT_EQ(std::get<std::string>(attr.value), "abc");
}

TEST(AttributeDecodeTest, UnknownCodeWithAllNullValueIsEmpty) {
  auto attr = replay::DecodeAttribute(Record(0x4321, 3, Bytes("\0\0\0\0", 4)));
  EXPECT_EQ(attr.display_name, "Unknown");
  EXPECT_EQ(std::get<std::string>(attr.value), "");
}

TEST(AttributeDecodeTest, KnownCodeWithoutTransformKeepsString) {
  auto attr = replay::DecodeAttribute(Record(0x0BBB, 2, Bytes("100\0", 4)));
  EXPECT_EQ(attr.display_name, "Handicap");
  EXPECT_EQ(std::get<std::string>(attr.value), "100");
}

TEST(AttributeDecodeTest, EmptyCategoryMapsToSingle) {
  auto attr = replay::DecodeAttribute(Record(0x0BC1, 16, Bytes("\0\0\0\0", 4)));
  EXPECT_EQ(attr.display_name, "Category");
  EXPECT_EQ(std::get<std::string>(attr.value), "Single");
}

TEST(AttributeDecodeTest, SecondaryTableMissThrowsUnknownCode) {
  try {
    replay::DecodeAttribute(Record(0x0BB9, 1, Bytes("Xel\0", 4)));
    FAIL() << "UnknownCode expected";
  } catch (const replay::UnknownCode& ex) {
    EXPECT_EQ(ex.key, "Xel");
    EXPECT_EQ(ex.code, "unknown_code");
    EXPECT_TRUE(ex.recoverable);
  }
}

TEST(AttributeDecodeTest, ToJsonCarriesTypedValue) {
  auto attr = replay::DecodeAttribute(Record(0x07D3, 16, Bytes("4\0", 2)));
  auto j = attr.ToJson();
  EXPECT_EQ(j["name"], "Teams2v2");
  EXPECT_EQ(j["owner"], 16);
  EXPECT_EQ(j["code"], 0x07D3);
  EXPECT_TRUE(j["value"].is_number_integer());
  EXPECT_EQ(j["value"].get<int>(), 4);
}

TEST(DecodeAllTest, SkipsFailedRecordAndKeepsOrder) {
  std::ostringstream log;
  replay::Observability observability(replay::LogLevel::kDebug, "test", log);
  auto config = replay::DefaultConfig();

  std::vector<replay::RawAttributeRecord> records{
      Record(0x0BB9, 1, Bytes("Prot\0", 5)),
      Record(0x0BBA, 1, Bytes("tc99", 4)),
      Record(0x7777, 2, Bytes("zz\0", 3)),
      Record(0x0BB8, 16, Bytes("Fasr", 4)),
  };

  auto report = replay::DecodeAll(records, config, observability);
  ASSERT_EQ(report.attributes.size(), 3u);
  EXPECT_EQ(report.attributes[0].ValueString(), "Protoss");
  EXPECT_EQ(report.attributes[1].display_name, "Unknown");
  EXPECT_EQ(report.attributes[2].ValueString(), "Faster");

  ASSERT_EQ(report.failures.size(), 1u);
  EXPECT_EQ(report.failures[0].index, 1u);
  EXPECT_EQ(report.failures[0].error_code, "unknown_code");
  EXPECT_EQ(report.failures[0].code, 0x0BBA);

  auto metrics = observability.Snapshot();
  EXPECT_EQ(metrics.attributes_decoded, 3u);
  EXPECT_EQ(metrics.attributes_unknown, 1u);
  EXPECT_EQ(metrics.decode_failures, 1u);

  EXPECT_NE(log.str().find("attribute_decode_failed"), std::string::npos);
  EXPECT_NE(report.trace_id.find("test-"), std::string::npos);
}

TEST(DecodeAllTest, StrictModeRethrows) {
  std::ostringstream log;
  replay::Observability observability(replay::LogLevel::kError, "test", log);
  auto config = replay::DefaultConfig();
  config.strict_decode = true;

  std::vector<replay::RawAttributeRecord> records{Record(0x0BBC, 1, Bytes("Nope", 4))};
  EXPECT_THROW(replay::DecodeAll(records, config, observability), replay::UnknownCode);
  EXPECT_EQ(observability.Snapshot().decode_failures, 1u);
  EXPECT_TRUE(log.str().empty());
}

TEST(DecodeAllTest, LogLinesAreJson) {
  std::ostringstream log;
  replay::Observability observability(replay::LogLevel::kInfo, "test", log);
  std::vector<replay::RawAttributeRecord> records{Record(0x0BB9, 1, Bytes("Zerg", 4))};
  replay::DecodeAll(records, replay::DefaultConfig(), observability);

  std::istringstream lines(log.str());
  std::string line;
  ASSERT_TRUE(std::getline(lines, line));
  auto j = nlohmann::json::parse(line);
  EXPECT_EQ(j["eventName"], "attributes_decoded");
  EXPECT_EQ(j["level"], "info");
  EXPECT_TRUE(j.contains("traceId"));
}

TEST(GroupByOwnerTest, GroupsPreserveInputOrder) {
  std::vector<replay::Attribute> attributes{
      replay::DecodeAttribute(Record(0x0BB9, 2, "Zerg")),
      replay::DecodeAttribute(Record(0x0BB9, 1, "Terr")),
      replay::DecodeAttribute(Record(0x0BBA, 2, "tc01")),
  };
  auto groups = replay::GroupByOwner(attributes);
  ASSERT_EQ(groups.size(), 2u);
  ASSERT_EQ(groups[2].size(), 2u);
  EXPECT_EQ(groups[2][0].ValueString(), "Zerg");
  EXPECT_EQ(groups[2][1].ValueString(), "Red");
  ASSERT_EQ(groups[1].size(), 1u);
  EXPECT_EQ(groups[1][0].ValueString(), "Terran");
}
