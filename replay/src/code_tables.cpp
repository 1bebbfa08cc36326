/*
 * 설명: 고정된 속성 코드 매핑과 보조 코드 테이블을 제공한다. 초기화 이후 변경되지 않는다.
 * 버전: v1.0.0
 * 관련 문서: DESIGN.md
 * 테스트: replay/tests/unit/code_table_test.cpp
 */
#include "replay/code_tables.hpp"

#include <algorithm>

#include "replay/errors.hpp"

namespace replay {

const CodeTable& PlayerTypeCodes() {
  static const CodeTable table{{"Humn", "Human"}, {"Comp", "Computer"}, {"Open", "Open"}, {"Clsd", "Closed"}};
  return table;
}

const CodeTable& GameFormatCodes() {
  static const CodeTable table{{"1v1", "1v1"}, {"2v2", "2v2"}, {"3v3", "3v3"}, {"4v4", "4v4"},
                               {"5v5", "5v5"}, {"6v6", "6v6"}, {"FFA", "FFA"}};
  return table;
}

const CodeTable& GameSpeedCodes() {
  static const CodeTable table{
      {"Slor", "Slower"}, {"Slow", "Slow"}, {"Norm", "Normal"}, {"Fast", "Fast"}, {"Fasr", "Faster"}};
  return table;
}

const CodeTable& RaceCodes() {
  static const CodeTable table{{"RAND", "Random"}, {"Terr", "Terran"}, {"Prot", "Protoss"}, {"Zerg", "Zerg"}};
  return table;
}

const CodeTable& TeamColorCodes() {
  static const CodeTable table{{"tc01", "Red"},         {"tc02", "Blue"},       {"tc03", "Teal"},
                               {"tc04", "Purple"},      {"tc05", "Yellow"},     {"tc06", "Orange"},
                               {"tc07", "Green"},       {"tc08", "Light Pink"}, {"tc09", "Violet"},
                               {"tc10", "Light Grey"},  {"tc11", "Dark Green"}, {"tc12", "Brown"},
                               {"tc13", "Light Green"}, {"tc14", "Dark Grey"},  {"tc15", "Pink"}};
  return table;
}

const CodeTable& DifficultyCodes() {
  static const CodeTable table{{"VyEy", "Very easy"}, {"Easy", "Easy"},      {"Medi", "Medium"},
                               {"Hard", "Hard"},      {"VyHd", "Very hard"}, {"Insa", "Insane"}};
  return table;
}

const CodeTable& GameCategoryCodes() {
  static const CodeTable table{{"Priv", "Private"}, {"Pub", "Public"}, {"Amm", "Ladder"}, {"", "Single"}};
  return table;
}

int FirstDigit(std::string_view value) {
  if (value.empty() || value[0] < '0' || value[0] > '9') {
    throw InvalidValue("팀 수 값의 첫 글자가 숫자가 아닙니다: '" + std::string(value) + "'");
  }
  return value[0] - '0';
}

AttributeCodeEntry Describe(AttributeCode code) {
  switch (code) {
    case AttributeCode::kPlayerType:
      return {"Player Type", TableLookup{"player type", &PlayerTypeCodes()}};
    case AttributeCode::kGameType:
      return {"Game Type", TableLookup{"game format", &GameFormatCodes()}};
    case AttributeCode::kTeams1v1:
      return {"Teams1v1", ComputedValue{&FirstDigit}};
    case AttributeCode::kTeams2v2:
      return {"Teams2v2", ComputedValue{&FirstDigit}};
    case AttributeCode::kTeams3v3:
      return {"Teams3v3", ComputedValue{&FirstDigit}};
    case AttributeCode::kTeams4v4:
      return {"Teams4v4", ComputedValue{&FirstDigit}};
    case AttributeCode::kTeamsFFA:
      return {"TeamsFFA", ComputedValue{&FirstDigit}};
    case AttributeCode::kTeams5v5:
      return {"Teams5v5", ComputedValue{&FirstDigit}};
    case AttributeCode::kGameSpeed:
      return {"Game Speed", TableLookup{"game speed", &GameSpeedCodes()}};
    case AttributeCode::kRace:
      return {"Race", TableLookup{"race", &RaceCodes()}};
    case AttributeCode::kColor:
      return {"Color", TableLookup{"team color", &TeamColorCodes()}};
    case AttributeCode::kHandicap:
      return {"Handicap", NoTransform{}};
    case AttributeCode::kDifficulty:
      return {"Difficulty", TableLookup{"difficulty", &DifficultyCodes()}};
    case AttributeCode::kCategory:
      return {"Category", TableLookup{"game category", &GameCategoryCodes()}};
  }
  throw IllegalState("등록되지 않은 속성 코드 열거값입니다");
}

std::optional<AttributeCodeEntry> LookupAttributeCode(std::uint16_t code) {
  auto it = std::find_if(kKnownAttributeCodes.begin(), kKnownAttributeCodes.end(),
                         [code](AttributeCode known) { return static_cast<std::uint16_t>(known) == code; });
  if (it == kKnownAttributeCodes.end()) {
    return std::nullopt;
  }
  return Describe(*it);
}

}  // namespace replay
