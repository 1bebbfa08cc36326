/*
 * 설명: 속성 코드 테이블과 보조 코드 테이블(종족, 색상, 난이도 등)을 정의한다.
 * 버전: v1.0.0
 * 관련 문서: DESIGN.md
 * 테스트: replay/tests/unit/code_table_test.cpp
 */
#pragma once

#include <array>
#include <cstdint>
#include <functional>
#include <map>
#include <optional>
#include <string>
#include <string_view>
#include <variant>

namespace replay {

using CodeTable = std::map<std::string, std::string, std::less<>>;

const CodeTable& PlayerTypeCodes();
const CodeTable& GameFormatCodes();
const CodeTable& GameSpeedCodes();
const CodeTable& RaceCodes();
const CodeTable& TeamColorCodes();
const CodeTable& DifficultyCodes();
const CodeTable& GameCategoryCodes();

enum class AttributeCode : std::uint16_t {
  kPlayerType = 0x01F4,
  kGameType = 0x07D1,
  kTeams1v1 = 0x07D2,
  kTeams2v2 = 0x07D3,
  kTeams3v3 = 0x07D4,
  kTeams4v4 = 0x07D5,
  kTeamsFFA = 0x07D6,
  kTeams5v5 = 0x07D7,
  kGameSpeed = 0x0BB8,
  kRace = 0x0BB9,
  kColor = 0x0BBA,
  kHandicap = 0x0BBB,
  kDifficulty = 0x0BBC,
  kCategory = 0x0BC1,
};

inline constexpr std::array<AttributeCode, 14> kKnownAttributeCodes{
    AttributeCode::kPlayerType, AttributeCode::kGameType,  AttributeCode::kTeams1v1,   AttributeCode::kTeams2v2,
    AttributeCode::kTeams3v3,   AttributeCode::kTeams4v4,  AttributeCode::kTeamsFFA,   AttributeCode::kTeams5v5,
    AttributeCode::kGameSpeed,  AttributeCode::kRace,      AttributeCode::kColor,      AttributeCode::kHandicap,
    AttributeCode::kDifficulty, AttributeCode::kCategory};

struct NoTransform {};

// 값 자체가 보조 테이블의 키인 경우.
struct TableLookup {
  std::string_view table_name;
  const CodeTable* table;
};

// 값에서 숫자 필드 하나를 뽑아내는 순수 함수.
struct ComputedValue {
  int (*compute)(std::string_view value);
};

using ValueTransform = std::variant<NoTransform, TableLookup, ComputedValue>;

struct AttributeCodeEntry {
  std::string_view name;
  ValueTransform transform;
};

AttributeCodeEntry Describe(AttributeCode code);
std::optional<AttributeCodeEntry> LookupAttributeCode(std::uint16_t code);

// 팀 수 속성: 첫 글자를 10진 숫자로 읽는다.
int FirstDigit(std::string_view value);

}  // namespace replay
