#include <string>
#include <utility>

#include <gtest/gtest.h>

#include "replay/attribute.hpp"
#include "replay/errors.hpp"
#include "replay/identity.hpp"

namespace {

replay::Player ProfiledPlayer() {
  replay::Player player(4, "Boxer");
  player.region = "kr";
  player.subregion = 1;
  player.bnet_uid = 2010;
  player.play_race = "Terran";
  return player;
}

std::string UrlOnTeam(replay::Player player) {
  replay::Roster roster;
  roster.CreateTeam(1);
  return roster.AddPlayer(1, std::move(player)).Url();
}

replay::Attribute Decode(std::uint16_t code, int owner, const std::string& value) {
  return replay::DecodeAttribute(replay::RawAttributeRecord{0, code, owner, value});
}

}  // namespace

TEST(PlayerIdentityTest, UrlFromProfileFields) {
  EXPECT_EQ(UrlOnTeam(ProfiledPlayer()), "http://kr.battle.net/sc2/en/profile/2010/1/Boxer/");
}

TEST(PlayerIdentityTest, UrlWithMissingFieldsThrows) {
  EXPECT_THROW(UrlOnTeam(replay::Player(1, "Nameless")), replay::IncompleteIdentity);

  auto no_region = ProfiledPlayer();
  no_region.region.clear();
  EXPECT_THROW(UrlOnTeam(no_region), replay::IncompleteIdentity);

  auto no_uid = ProfiledPlayer();
  no_uid.bnet_uid = 0;
  EXPECT_THROW(UrlOnTeam(no_uid), replay::IncompleteIdentity);

  auto no_subregion = ProfiledPlayer();
  no_subregion.subregion = 0;
  EXPECT_THROW(UrlOnTeam(no_subregion), replay::IncompleteIdentity);

  auto no_name = ProfiledPlayer();
  no_name.name.clear();
  EXPECT_THROW(UrlOnTeam(no_name), replay::IncompleteIdentity);
}

TEST(PlayerIdentityTest, UrlWithoutTeamIsIllegalState) {
  auto player = ProfiledPlayer();
  EXPECT_THROW(player.Url(), replay::IllegalState);

  replay::Player bare(2, "");
  EXPECT_THROW(bare.Url(), replay::IllegalState);
}

TEST(PlayerIdentityTest, ResultWithoutTeamIsIllegalState) {
  auto player = ProfiledPlayer();
  EXPECT_FALSE(player.HasTeam());
  EXPECT_THROW(player.Result(), replay::IllegalState);
  EXPECT_THROW(player.GetTeam(), replay::IllegalState);
}

TEST(PlayerIdentityTest, DefaultsPerInstance) {
  replay::Player a(1, "a");
  replay::Player b(2, "b");
  a.messages.push_back(replay::ChatEvent{10, 1, "all", "glhf"});
  a.events.push_back(replay::GameEvent{11, 1, "select", nlohmann::json::object()});
  EXPECT_TRUE(b.messages.empty());
  EXPECT_TRUE(b.events.empty());
  EXPECT_FALSE(a.IsObserver());
  EXPECT_FALSE(a.recorder);
  EXPECT_EQ(a.Handicap(), 100);
}

TEST(PlayerIdentityTest, FormatSubstitutesOwnFields) {
  auto player = ProfiledPlayer();
  EXPECT_EQ(player.Format("{name} ({play_race}) #{pid}"), "Boxer (Terran) #4");
  EXPECT_EQ(player.Format("{{{region}}}"), "{kr}");
  EXPECT_EQ(player.Format("no placeholders"), "no placeholders");
}

TEST(PlayerIdentityTest, FormatUnknownPlaceholderThrows) {
  auto player = ProfiledPlayer();
  try {
    player.Format("{result}");
    FAIL() << "MissingField expected";
  } catch (const replay::MissingField& ex) {
    EXPECT_EQ(ex.field, "result");
    EXPECT_EQ(ex.code, "missing_field");
  }
  EXPECT_THROW(player.Format("{name"), replay::MissingField);
}

TEST(PlayerIdentityTest, FormatLoneClosingBraceThrows) {
  auto player = ProfiledPlayer();
  EXPECT_THROW(player.Format("{name}}"), replay::MissingField);
  EXPECT_THROW(player.Format("a } b"), replay::MissingField);
  EXPECT_EQ(player.Format("}}{name}"), "}Boxer");
}

TEST(PlayerIdentityTest, ToStringShowsPlayRace) {
  EXPECT_EQ(ProfiledPlayer().ToString(), "Player 4 - Boxer (Terran)");
}

TEST(PlayerIdentityTest, ApplyAttributeProjectsKnownFields) {
  replay::Player player(1, "alice");
  player.ApplyAttribute(Decode(0x0BB9, 1, "Prot"));
  player.ApplyAttribute(Decode(0x0BBA, 1, "tc02"));
  player.ApplyAttribute(Decode(0x0BBC, 1, "Insa"));
  player.ApplyAttribute(Decode(0x01F4, 1, "Humn"));
  player.ApplyAttribute(Decode(0x0BBB, 1, std::string("75\0", 3)));
  player.ApplyAttribute(Decode(0x9999, 1, "misc"));

  EXPECT_EQ(player.pick_race, "Protoss");
  EXPECT_EQ(player.color.name, "Blue");
  EXPECT_EQ(player.difficulty, "Insane");
  EXPECT_TRUE(player.IsHuman());
  EXPECT_EQ(player.Handicap(), 75);
  EXPECT_EQ(player.Attributes().size(), 6u);

  player.ApplyAttribute(Decode(0x01F4, 1, "Comp"));
  EXPECT_FALSE(player.IsHuman());
}

TEST(PlayerIdentityTest, HandicapRangeIsEnforced) {
  replay::Player player(1, "alice");
  player.SetHandicap(0);
  EXPECT_EQ(player.Handicap(), 0);
  EXPECT_THROW(player.SetHandicap(101), replay::InvalidValue);
  EXPECT_THROW(player.SetHandicap(-1), replay::InvalidValue);
  EXPECT_THROW(player.ApplyAttribute(Decode(0x0BBB, 1, "abc")), replay::InvalidValue);
  EXPECT_EQ(player.Handicap(), 0);
}

TEST(LocationTest, ValueEquality) {
  replay::Location a{3, 4};
  replay::Location b{3, 4};
  replay::Location c{4, 3};
  EXPECT_EQ(a, b);
  EXPECT_NE(a, c);
}
