/*
 * 설명: 원시 속성 레코드를 이름과 타입이 부여된 속성으로 디코딩한다.
 * 버전: v1.0.0
 * 관련 문서: DESIGN.md
 * 테스트: replay/tests/unit/attribute_decode_test.cpp
 */
#pragma once

#include <cstddef>
#include <cstdint>
#include <map>
#include <string>
#include <string_view>
#include <variant>
#include <vector>

#include <nlohmann/json.hpp>

#include "replay/config.hpp"
#include "replay/observability.hpp"

namespace replay {

inline constexpr std::string_view kUnknownAttributeName = "Unknown";

struct RawAttributeRecord {
  int header{0};
  std::uint16_t code{0};
  int owner_index{0};
  std::string raw_value;
};

using AttributeValue = std::variant<std::string, int>;

struct Attribute {
  int header{0};
  std::uint16_t code{0};
  int owner_index{0};
  std::string display_name{kUnknownAttributeName};
  AttributeValue value;

  bool IsKnown() const { return display_name != kUnknownAttributeName; }
  bool HoldsInt() const { return std::holds_alternative<int>(value); }
  std::string ValueString() const;
  std::string ToString() const;
  nlohmann::json ToJson() const;
};

std::string StripTrailingNulls(std::string_view raw);

// 보조 테이블에 없는 값은 UnknownCode, 계산 변환이 실패하면 InvalidValue를 던진다.
Attribute DecodeAttribute(const RawAttributeRecord& record);

struct DecodeFailure {
  std::size_t index;
  std::string error_code;
  std::uint16_t code;
  int owner_index;
  std::string message;
};

struct DecodeReport {
  std::string trace_id;
  std::vector<Attribute> attributes;
  std::vector<DecodeFailure> failures;
};

DecodeReport DecodeAll(const std::vector<RawAttributeRecord>& records, const DecoderConfig& config,
                       Observability& observability);

std::map<int, std::vector<Attribute>> GroupByOwner(const std::vector<Attribute>& attributes);

}  // namespace replay
