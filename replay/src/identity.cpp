/*
 * 설명: 플레이어 url/결과 위임, 팀 해시 계산, 로스터 아레나를 구현한다.
 * 버전: v1.0.0
 * 관련 문서: DESIGN.md
 * 테스트: replay/tests/unit/team_identity_test.cpp, replay/tests/unit/player_identity_test.cpp
 */
#include "replay/identity.hpp"

#include <algorithm>
#include <iomanip>
#include <map>
#include <sstream>
#include <stdexcept>

#include <openssl/evp.h>

#include "replay/errors.hpp"

namespace replay {

namespace {
std::string BytesToHex(const unsigned char* data, std::size_t len) {
  std::ostringstream oss;
  for (std::size_t i = 0; i < len; ++i) {
    oss << std::hex << std::setw(2) << std::setfill('0') << static_cast<int>(data[i]);
  }
  return oss.str();
}

std::string Sha256Hex(const std::string& input) {
  unsigned char digest[EVP_MAX_MD_SIZE];
  unsigned int digest_len = 0;
  if (EVP_Digest(input.data(), input.size(), digest, &digest_len, EVP_sha256(), nullptr) != 1) {
    throw std::runtime_error("SHA-256 계산 실패");
  }
  return BytesToHex(digest, digest_len);
}

int ParseHandicap(const std::string& value) {
  if (value.empty() || value.size() > 3 ||
      !std::all_of(value.begin(), value.end(), [](char c) { return c >= '0' && c <= '9'; })) {
    throw InvalidValue("핸디캡 값이 숫자가 아닙니다: '" + value + "'");
  }
  return std::stoi(value);
}
}  // namespace

const char* ToString(TeamResult result) {
  switch (result) {
    case TeamResult::kWin:
      return "Win";
    case TeamResult::kLoss:
      return "Loss";
    case TeamResult::kUnknown:
      return "Unknown";
  }
  return "Unknown";
}

TeamResult ParseTeamResult(std::string_view value) {
  if (value == "Win") {
    return TeamResult::kWin;
  }
  if (value == "Loss") {
    return TeamResult::kLoss;
  }
  return TeamResult::kUnknown;
}

Person::Person(int pid, std::string name) : pid(pid), name(std::move(name)) {}

Observer::Observer(int pid, std::string name) : Person(pid, std::move(name)) {}

Player::Player(int pid, std::string name) : Person(pid, std::move(name)) {}

const Team& Player::GetTeam() const {
  if (!team_) {
    throw IllegalState("플레이어 " + std::to_string(pid) + "에 팀이 아직 지정되지 않았습니다");
  }
  return team_->roster->TeamAt(team_->index);
}

TeamResult Player::Result() const { return GetTeam().Result(); }

std::string Player::Url() const {
  if (!team_) {
    throw IllegalState("플레이어 " + std::to_string(pid) + "에 팀이 지정되기 전에 url을 읽을 수 없습니다");
  }
  std::vector<std::string> missing;
  if (region.empty()) {
    missing.push_back("region");
  }
  if (bnet_uid == 0) {
    missing.push_back("uid");
  }
  if (subregion == 0) {
    missing.push_back("subregion");
  }
  if (name.empty()) {
    missing.push_back("name");
  }
  if (!missing.empty()) {
    std::ostringstream oss;
    oss << "플레이어 " << pid << "의 프로필 url 필드가 비어 있습니다:";
    for (const auto& field : missing) {
      oss << " " << field;
    }
    throw IncompleteIdentity(oss.str());
  }
  std::ostringstream oss;
  oss << "http://" << region << ".battle.net/sc2/en/profile/" << bnet_uid << "/" << subregion << "/" << name << "/";
  return oss.str();
}

std::map<std::string, std::string> Player::Fields() const {
  return {{"pid", std::to_string(pid)},
          {"name", name},
          {"is_observer", IsObserver() ? "true" : "false"},
          {"is_human", is_human ? "true" : "false"},
          {"recorder", recorder ? "true" : "false"},
          {"color", color.name},
          {"pick_race", pick_race},
          {"play_race", play_race},
          {"difficulty", difficulty},
          {"handicap", std::to_string(handicap_)},
          {"region", region},
          {"subregion", std::to_string(subregion)},
          {"uid", std::to_string(bnet_uid)}};
}

std::string Player::Format(std::string_view format) const {
  const auto fields = Fields();
  auto field_value = [&fields](const std::string& field) -> const std::string& {
    auto it = fields.find(field);
    if (it == fields.end()) {
      throw MissingField("플레이어 필드에 없는 자리표시자입니다: {" + field + "}", field);
    }
    return it->second;
  };

  std::string out;
  out.reserve(format.size());
  for (std::size_t i = 0; i < format.size(); ++i) {
    char c = format[i];
    if (c == '{') {
      if (i + 1 < format.size() && format[i + 1] == '{') {
        out.push_back('{');
        ++i;
        continue;
      }
      auto close = format.find('}', i + 1);
      if (close == std::string_view::npos) {
        throw MissingField("닫히지 않은 자리표시자입니다", std::string(format.substr(i + 1)));
      }
      out += field_value(std::string(format.substr(i + 1, close - i - 1)));
      i = close;
    } else if (c == '}') {
      if (i + 1 >= format.size() || format[i + 1] != '}') {
        throw MissingField("짝이 없는 '}'입니다", std::string(format.substr(0, i + 1)));
      }
      ++i;
      out.push_back('}');
    } else {
      out.push_back(c);
    }
  }
  return out;
}

std::string Player::ToString() const {
  std::ostringstream oss;
  oss << "Player " << pid << " - " << name << " (" << play_race << ")";
  return oss.str();
}

void Player::SetHandicap(int handicap) {
  if (handicap < 0 || handicap > kMaxHandicap) {
    throw InvalidValue("핸디캡은 0~100 범위여야 합니다: " + std::to_string(handicap));
  }
  handicap_ = handicap;
}

void Player::ApplyAttribute(const Attribute& attribute) {
  const auto& attr_name = attribute.display_name;
  if (attr_name == "Race") {
    pick_race = attribute.ValueString();
  } else if (attr_name == "Color") {
    color.name = attribute.ValueString();
  } else if (attr_name == "Difficulty") {
    difficulty = attribute.ValueString();
  } else if (attr_name == "Player Type") {
    is_human = attribute.ValueString() == "Human";
  } else if (attr_name == "Handicap") {
    SetHandicap(ParseHandicap(attribute.ValueString()));
  }
  attributes_.push_back(attribute);
}

Team::Team(int number) : number_(number) {
  if (number < 1) {
    throw InvalidValue("팀 번호는 1 이상이어야 합니다: " + std::to_string(number));
  }
}

std::string Team::Hash() const {
  std::vector<std::string> urls;
  urls.reserve(players_.size());
  for (const auto& player : players_) {
    urls.push_back(player.Url());
  }
  std::sort(urls.begin(), urls.end());

  std::string raw;
  for (std::size_t i = 0; i < urls.size(); ++i) {
    if (i > 0) {
      raw += ",";
    }
    raw += urls[i];
  }
  return Sha256Hex(raw);
}

nlohmann::json Team::ToJson() const {
  nlohmann::json urls = nlohmann::json::array();
  for (const auto& player : players_) {
    urls.push_back(player.Url());
  }
  return nlohmann::json{{"number", number_},
                        {"result", ToString(result_)},
                        {"lineup", lineup_},
                        {"hash", Hash()},
                        {"players", urls}};
}

Team& Roster::CreateTeam(int number) {
  if (FindTeam(number) != nullptr) {
    throw IllegalState("이미 존재하는 팀 번호입니다: " + std::to_string(number));
  }
  teams_.emplace_back(number);
  return teams_.back();
}

Team* Roster::FindTeam(int number) {
  auto it = std::find_if(teams_.begin(), teams_.end(), [number](const Team& team) { return team.Number() == number; });
  return it == teams_.end() ? nullptr : &*it;
}

const Team* Roster::FindTeam(int number) const {
  auto it = std::find_if(teams_.begin(), teams_.end(), [number](const Team& team) { return team.Number() == number; });
  return it == teams_.end() ? nullptr : &*it;
}

const Team& Roster::TeamAt(std::size_t index) const {
  if (index >= teams_.size()) {
    throw IllegalState("팀 핸들이 로스터 범위를 벗어났습니다: " + std::to_string(index));
  }
  return teams_[index];
}

Player& Roster::AddPlayer(int team_number, Player player) {
  auto it = std::find_if(teams_.begin(), teams_.end(),
                         [team_number](const Team& team) { return team.Number() == team_number; });
  if (it == teams_.end()) {
    throw IllegalState("존재하지 않는 팀에 플레이어를 추가할 수 없습니다: " + std::to_string(team_number));
  }
  player.team_ = TeamHandle{this, static_cast<std::size_t>(it - teams_.begin())};
  it->players_.push_back(std::move(player));
  return it->players_.back();
}

Observer& Roster::AddObserver(Observer observer) {
  observers_.push_back(std::move(observer));
  return observers_.back();
}

std::vector<const Player*> Roster::Players() const {
  std::vector<const Player*> players;
  for (const auto& team : teams_) {
    for (const auto& player : team.players_) {
      players.push_back(&player);
    }
  }
  return players;
}

Player* Roster::FindPlayer(int pid) {
  for (auto& team : teams_) {
    for (auto& player : team.players_) {
      if (player.pid == pid) {
        return &player;
      }
    }
  }
  return nullptr;
}

Person* Roster::FindPerson(int pid) {
  if (auto* player = FindPlayer(pid)) {
    return player;
  }
  for (auto& observer : observers_) {
    if (observer.pid == pid) {
      return &observer;
    }
  }
  return nullptr;
}

const Person* Roster::FindPerson(int pid) const {
  for (const auto& team : teams_) {
    for (const auto& player : team.players_) {
      if (player.pid == pid) {
        return &player;
      }
    }
  }
  for (const auto& observer : observers_) {
    if (observer.pid == pid) {
      return &observer;
    }
  }
  return nullptr;
}

}  // namespace replay
