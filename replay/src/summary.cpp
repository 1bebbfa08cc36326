/*
 * 설명: 그래프 생성/검증과 요약 통계 텍스트 렌더링을 구현한다.
 * 버전: v1.0.0
 * 관련 문서: DESIGN.md
 * 테스트: replay/tests/unit/summary_test.cpp
 */
#include "replay/summary.hpp"

#include <array>
#include <sstream>

#include "replay/errors.hpp"

namespace replay {
namespace {
constexpr std::array<std::pair<std::string_view, std::string_view>, 11> kStatPrettyNames{{
    {"R", "Resources"},
    {"U", "Units"},
    {"S", "Structures"},
    {"O", "Overview"},
    {"AUR", "Average Unspent Resources"},
    {"RCR", "Resource Collection Rate"},
    {"WC", "Workers Created"},
    {"UT", "Units Trained"},
    {"KUC", "Killed Unit Count"},
    {"SB", "Structures Built"},
    {"SRC", "Structures Razed Count"},
}};

std::string TrimTrailingWhitespace(std::string text) {
  auto end = text.find_last_not_of(" \t\r\n");
  text.erase(end == std::string::npos ? 0 : end + 1);
  return text;
}
}  // namespace

Graph::Graph(std::vector<double> times, std::vector<double> values) : times_(std::move(times)), values_(std::move(values)) {
  if (times_.size() != values_.size()) {
    throw LengthMismatch("그래프 시간/값 길이가 다릅니다: " + std::to_string(times_.size()) + " != " +
                         std::to_string(values_.size()));
  }
}

Graph Graph::FromPoints(const std::vector<GraphPoint>& points) {
  std::vector<double> times;
  std::vector<double> values;
  times.reserve(points.size());
  values.reserve(points.size());
  for (const auto& point : points) {
    times.push_back(point.first);
    values.push_back(point.second);
  }
  return Graph(std::move(times), std::move(values));
}

std::string Graph::ToString() const { return "Graph with " + std::to_string(times_.size()) + " values"; }

nlohmann::json Graph::ToJson() const { return nlohmann::json{{"times", times_}, {"values", values_}}; }

std::optional<std::string_view> StatPrettyName(std::string_view code) {
  for (const auto& entry : kStatPrettyNames) {
    if (entry.first == code) {
      return entry.second;
    }
  }
  return std::nullopt;
}

PlayerSummary::PlayerSummary(int pid) : pid(pid) {}

void PlayerSummary::SetStat(const std::string& code, std::int64_t value) {
  auto it = std::find_if(stats_.begin(), stats_.end(), [&code](const auto& entry) { return entry.first == code; });
  if (it != stats_.end()) {
    it->second = value;
    return;
  }
  stats_.emplace_back(code, value);
}

std::optional<std::int64_t> PlayerSummary::Stat(std::string_view code) const {
  auto it = std::find_if(stats_.begin(), stats_.end(), [code](const auto& entry) { return entry.first == code; });
  if (it == stats_.end()) {
    return std::nullopt;
  }
  return it->second;
}

std::string PlayerSummary::GetStats() const {
  std::ostringstream oss;
  for (const auto& [code, value] : stats_) {
    auto pretty = StatPrettyName(code);
    if (!pretty) {
      throw UnknownStatCode("요약 통계 코드에 표시 이름이 없습니다: " + code, code);
    }
    oss << *pretty << ": " << value << "\n";
  }
  return TrimTrailingWhitespace(oss.str());
}

std::string PlayerSummary::ToString() const {
  std::ostringstream oss;
  oss << team_id << " - " << race << " - ";
  if (is_ai) {
    oss << "AI";
  } else {
    oss << subregion << "/" << bnet_id << "/";
  }
  return oss.str();
}

nlohmann::json PlayerSummary::ToJson() const {
  nlohmann::json stats = nlohmann::json::object();
  for (const auto& [code, value] : stats_) {
    stats[code] = value;
  }
  return nlohmann::json{{"pid", pid},
                        {"teamId", team_id},
                        {"race", race},
                        {"isAi", is_ai},
                        {"bnetId", bnet_id},
                        {"subregion", subregion},
                        {"armyGraph", army_graph.ToJson()},
                        {"incomeGraph", income_graph.ToJson()},
                        {"stats", stats}};
}

}  // namespace replay
