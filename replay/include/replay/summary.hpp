/*
 * 설명: 점수 화면 그래프(시간/값 시계열)와 플레이어별 요약 통계 컨테이너를 정의한다.
 * 버전: v1.0.0
 * 관련 문서: DESIGN.md
 * 테스트: replay/tests/unit/summary_test.cpp
 */
#pragma once

#include <algorithm>
#include <cstddef>
#include <cstdint>
#include <iterator>
#include <optional>
#include <string>
#include <string_view>
#include <utility>
#include <vector>

#include <nlohmann/json.hpp>

namespace replay {

using GraphPoint = std::pair<double, double>;

class Graph {
 public:
  // 두 시퀀스를 원소별로 묶어 순회한다. 저장된 벡터를 복사하지 않으며 여러 번 순회할 수 있다.
  class PointRange {
   public:
    class Iterator {
     public:
      using iterator_category = std::forward_iterator_tag;
      using value_type = GraphPoint;
      using difference_type = std::ptrdiff_t;
      using pointer = void;
      using reference = GraphPoint;

      Iterator(const Graph* graph, std::size_t index) : graph_(graph), index_(index) {}
      GraphPoint operator*() const { return {graph_->times_[index_], graph_->values_[index_]}; }
      Iterator& operator++() {
        ++index_;
        return *this;
      }
      Iterator operator++(int) {
        Iterator copy = *this;
        ++index_;
        return copy;
      }
      bool operator==(const Iterator& other) const { return graph_ == other.graph_ && index_ == other.index_; }
      bool operator!=(const Iterator& other) const { return !(*this == other); }

     private:
      const Graph* graph_;
      std::size_t index_;
    };

    explicit PointRange(const Graph* graph) : graph_(graph) {}
    Iterator begin() const { return Iterator(graph_, 0); }
    Iterator end() const { return Iterator(graph_, size()); }
    std::size_t size() const { return std::min(graph_->times_.size(), graph_->values_.size()); }
    bool empty() const { return size() == 0; }

   private:
    const Graph* graph_;
  };

  Graph() = default;
  Graph(std::vector<double> times, std::vector<double> values);
  static Graph FromPoints(const std::vector<GraphPoint>& points);

  const std::vector<double>& Times() const { return times_; }
  const std::vector<double>& Values() const { return values_; }
  PointRange AsPoints() const& { return PointRange(this); }
  // 범위는 그래프를 참조만 하므로 임시 객체에서는 만들 수 없다.
  PointRange AsPoints() const&& = delete;
  std::string ToString() const;
  nlohmann::json ToJson() const;

 private:
  std::vector<double> times_;
  std::vector<double> values_;
};

std::optional<std::string_view> StatPrettyName(std::string_view code);

class PlayerSummary {
 public:
  explicit PlayerSummary(int pid);

  int pid;
  int team_id{0};
  std::string race;
  bool is_ai{false};
  std::int64_t bnet_id{0};
  int subregion{0};
  Graph army_graph;
  Graph income_graph;

  // 같은 키를 다시 쓰면 값만 바뀌고 처음 삽입 순서는 유지된다.
  void SetStat(const std::string& code, std::int64_t value);
  std::optional<std::int64_t> Stat(std::string_view code) const;
  const std::vector<std::pair<std::string, std::int64_t>>& Stats() const { return stats_; }

  std::string GetStats() const;
  std::string ToString() const;
  nlohmann::json ToJson() const;

 private:
  std::vector<std::pair<std::string, std::int64_t>> stats_;
};

}  // namespace replay
