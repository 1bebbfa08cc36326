/*
 * 설명: 팀/플레이어/옵저버 신원 모델과 팀 해시, 결과 위임 로직을 정의한다.
 * 버전: v1.0.0
 * 관련 문서: DESIGN.md
 * 테스트: replay/tests/unit/team_identity_test.cpp, replay/tests/unit/player_identity_test.cpp
 */
#pragma once

#include <cstddef>
#include <cstdint>
#include <deque>
#include <map>
#include <optional>
#include <string>
#include <string_view>
#include <utility>
#include <vector>

#include <nlohmann/json.hpp>

#include "replay/attribute.hpp"

namespace replay {

enum class TeamResult { kWin, kLoss, kUnknown };

const char* ToString(TeamResult result);
TeamResult ParseTeamResult(std::string_view value);

struct Location {
  int x{0};
  int y{0};
  bool operator==(const Location& other) const { return x == other.x && y == other.y; }
  bool operator!=(const Location& other) const { return !(*this == other); }
};

struct Color {
  std::string name;
  int a{0};
  int r{0};
  int g{0};
  int b{0};
};

// 메시지/이벤트 스트림 내용은 외부 디코더가 채운다.
struct ChatEvent {
  std::uint32_t frame{0};
  int pid{0};
  std::string target;
  std::string text;
};

struct GameEvent {
  std::uint32_t frame{0};
  int pid{0};
  std::string name;
  nlohmann::json payload;
};

class Person {
 public:
  Person(int pid, std::string name);
  Person(const Person&) = default;
  Person(Person&&) = default;
  Person& operator=(const Person&) = default;
  Person& operator=(Person&&) = default;
  virtual ~Person() = default;

  virtual bool IsObserver() const = 0;
  virtual bool IsHuman() const = 0;

  int pid;
  std::string name;
  // 메시지 이벤트를 검사하는 외부 단계가 설정한다.
  bool recorder{false};
  std::vector<ChatEvent> messages;
  std::vector<GameEvent> events;
};

class Observer : public Person {
 public:
  Observer(int pid, std::string name);

  bool IsObserver() const override { return true; }
  bool IsHuman() const override { return true; }
};

class Roster;
class Team;

struct TeamHandle {
  const Roster* roster;
  std::size_t index;
};

class Player : public Person {
 public:
  static constexpr int kMaxHandicap = 100;

  Player(int pid, std::string name);

  bool IsObserver() const override { return false; }
  bool IsHuman() const override { return is_human; }

  bool HasTeam() const { return team_.has_value(); }
  const Team& GetTeam() const;
  TeamResult Result() const;
  std::string Url() const;
  // {필드} 자리표시자를 플레이어 자신의 필드로 치환한다. {{, }}는 중괄호 그대로.
  std::string Format(std::string_view format) const;
  std::map<std::string, std::string> Fields() const;
  std::string ToString() const;

  int Handicap() const { return handicap_; }
  void SetHandicap(int handicap);

  void ApplyAttribute(const Attribute& attribute);
  const std::vector<Attribute>& Attributes() const { return attributes_; }

  bool is_human{false};
  Color color;
  std::string pick_race;
  std::string play_race;
  std::string difficulty;
  std::string region;
  int subregion{0};
  std::int64_t bnet_uid{0};

 private:
  friend class Roster;

  std::optional<TeamHandle> team_;
  int handicap_{kMaxHandicap};
  std::vector<Attribute> attributes_;
};

class Team {
 public:
  explicit Team(int number);

  int Number() const { return number_; }
  const std::vector<Player>& Players() const { return players_; }
  std::vector<Player>::const_iterator begin() const { return players_.begin(); }
  std::vector<Player>::const_iterator end() const { return players_.end(); }

  TeamResult Result() const { return result_; }
  void SetResult(TeamResult result) { result_ = result; }

  // 라인업은 외부에서 조립해 넣는다.
  const std::string& Lineup() const { return lineup_; }
  void SetLineup(std::string lineup) { lineup_ = std::move(lineup); }

  // 현재 구성원의 url을 정렬해 ','로 이은 문자열의 SHA-256(소문자 hex). 매 호출마다 다시 계산한다.
  std::string Hash() const;
  nlohmann::json ToJson() const;

 private:
  friend class Roster;

  int number_;
  std::vector<Player> players_;
  TeamResult result_{TeamResult::kUnknown};
  std::string lineup_;
};

// 팀과 옵저버를 소유하는 아레나. 플레이어는 인덱스 핸들로 팀을 참조하므로 이동/복사를 막는다.
// 팀은 deque에 보관되어 CreateTeam이 반환한 참조는 로스터 수명 동안 유효하다.
class Roster {
 public:
  Roster() = default;
  Roster(const Roster&) = delete;
  Roster& operator=(const Roster&) = delete;
  Roster(Roster&&) = delete;
  Roster& operator=(Roster&&) = delete;

  Team& CreateTeam(int number);
  Team* FindTeam(int number);
  const Team* FindTeam(int number) const;
  const Team& TeamAt(std::size_t index) const;

  // 반환된 참조는 같은 팀에 다음 플레이어가 추가되기 전까지만 유효하다.
  Player& AddPlayer(int team_number, Player player);
  Observer& AddObserver(Observer observer);

  const std::deque<Team>& Teams() const { return teams_; }
  const std::vector<Observer>& Observers() const { return observers_; }
  std::vector<const Player*> Players() const;

  Player* FindPlayer(int pid);
  Person* FindPerson(int pid);
  const Person* FindPerson(int pid) const;

 private:
  std::deque<Team> teams_;
  std::vector<Observer> observers_;
};

}  // namespace replay
