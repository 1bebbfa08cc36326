/*
 * 설명: 널 바이트 제거, 코드 테이블 조회, 값 변환을 거쳐 속성을 만든다.
 * 버전: v1.0.0
 * 관련 문서: DESIGN.md
 * 테스트: replay/tests/unit/attribute_decode_test.cpp
 */
#include "replay/attribute.hpp"

#include <sstream>

#include "replay/code_tables.hpp"
#include "replay/errors.hpp"

namespace replay {
namespace {
struct TransformVisitor {
  const std::string& stripped;
  std::uint16_t code;

  AttributeValue operator()(const NoTransform&) const { return stripped; }

  AttributeValue operator()(const TableLookup& lookup) const {
    auto it = lookup.table->find(stripped);
    if (it == lookup.table->end()) {
      std::ostringstream oss;
      oss << std::string(lookup.table_name) << " 테이블에 없는 값입니다: '" << stripped << "' (code=0x" << std::hex
          << code << ")";
      throw UnknownCode(oss.str(), stripped);
    }
    return it->second;
  }

  AttributeValue operator()(const ComputedValue& computed) const { return computed.compute(stripped); }
};
}  // namespace

std::string StripTrailingNulls(std::string_view raw) {
  auto end = raw.find_last_not_of('\0');
  if (end == std::string_view::npos) {
    return {};
  }
  return std::string(raw.substr(0, end + 1));
}

Attribute DecodeAttribute(const RawAttributeRecord& record) {
  Attribute attribute;
  attribute.header = record.header;
  attribute.code = record.code;
  attribute.owner_index = record.owner_index;

  std::string stripped = StripTrailingNulls(record.raw_value);
  auto entry = LookupAttributeCode(record.code);
  if (!entry) {
    attribute.value = std::move(stripped);
    return attribute;
  }
  attribute.display_name = std::string(entry->name);
  attribute.value = std::visit(TransformVisitor{stripped, record.code}, entry->transform);
  return attribute;
}

std::string Attribute::ValueString() const {
  if (const auto* number = std::get_if<int>(&value)) {
    return std::to_string(*number);
  }
  return std::get<std::string>(value);
}

std::string Attribute::ToString() const {
  std::ostringstream oss;
  oss << "[" << owner_index << "] " << display_name << ": " << ValueString();
  return oss.str();
}

nlohmann::json Attribute::ToJson() const {
  nlohmann::json j;
  j["header"] = header;
  j["code"] = code;
  j["owner"] = owner_index;
  j["name"] = display_name;
  if (HoldsInt()) {
    j["value"] = std::get<int>(value);
  } else {
    j["value"] = std::get<std::string>(value);
  }
  return j;
}

DecodeReport DecodeAll(const std::vector<RawAttributeRecord>& records, const DecoderConfig& config,
                       Observability& observability) {
  DecodeReport report;
  report.trace_id = observability.NextTraceId();
  report.attributes.reserve(records.size());

  for (std::size_t i = 0; i < records.size(); ++i) {
    const auto& record = records[i];
    try {
      Attribute attribute = DecodeAttribute(record);
      observability.IncrementDecoded();
      if (!attribute.IsKnown()) {
        observability.IncrementUnknown();
        observability.Log(LogContext{report.trace_id, "attribute_unknown", LogLevel::kDebug, record.owner_index,
                                     record.code, attribute.ValueString()});
      }
      report.attributes.push_back(std::move(attribute));
    } catch (const ReplayError& ex) {
      if (!ex.recoverable) {
        throw;
      }
      observability.IncrementFailure();
      observability.Log(LogContext{report.trace_id, "attribute_decode_failed", LogLevel::kWarn, record.owner_index,
                                   record.code, ex.what()});
      if (config.strict_decode) {
        throw;
      }
      report.failures.push_back(DecodeFailure{i, ex.code, record.code, record.owner_index, ex.what()});
    }
  }

  observability.Log(LogContext{report.trace_id, "attributes_decoded", LogLevel::kInfo, std::nullopt, std::nullopt,
                               std::to_string(report.attributes.size()) + " decoded, " +
                                   std::to_string(report.failures.size()) + " failed"});
  return report;
}

std::map<int, std::vector<Attribute>> GroupByOwner(const std::vector<Attribute>& attributes) {
  std::map<int, std::vector<Attribute>> groups;
  for (const auto& attribute : attributes) {
    groups[attribute.owner_index].push_back(attribute);
  }
  return groups;
}

}  // namespace replay
