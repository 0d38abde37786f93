#include <gtest/gtest.h>

#include "tugchat/player.hpp"

TEST(PlayerTest, OptionalFieldsDefault) {
  auto player = tugchat::ParsePlayer({{"id", "p1"}, {"username", "Alice"}});
  ASSERT_TRUE(player.has_value());
  EXPECT_TRUE(player->channel_name.empty());
  EXPECT_TRUE(player->profile_image.empty());
  EXPECT_EQ(player->viewer_count, 0u);
}

TEST(PlayerTest, ViewerCountMustBeNonNegativeNumber) {
  EXPECT_FALSE(tugchat::ParsePlayer({{"id", "p1"}, {"username", "A"}, {"viewer_count", -1}}).has_value());
  EXPECT_FALSE(tugchat::ParsePlayer({{"id", "p1"}, {"username", "A"}, {"viewer_count", "12"}}).has_value());
  auto player = tugchat::ParsePlayer({{"id", "p1"}, {"username", "A"}, {"viewer_count", 12}});
  ASSERT_TRUE(player.has_value());
  EXPECT_EQ(player->viewer_count, 12u);
}

TEST(PlayerTest, EmptyIdentityIsRejected) {
  EXPECT_FALSE(tugchat::ParsePlayer({{"id", ""}, {"username", "A"}}).has_value());
  EXPECT_FALSE(tugchat::ParsePlayer({{"id", "p1"}, {"username", ""}}).has_value());
  EXPECT_FALSE(tugchat::ParsePlayer(nlohmann::json::array()).has_value());
}

TEST(PlayerTest, SnapshotCarriesProfileFields) {
  tugchat::Player player{"p1", "Alice", "alice_tv", "https://img.example/alice.png", 300};
  auto snapshot = tugchat::ToSnapshotJson(player);
  EXPECT_EQ(snapshot["id"], "p1");
  EXPECT_EQ(snapshot["username"], "Alice");
  EXPECT_EQ(snapshot["channel_name"], "alice_tv");
  EXPECT_EQ(snapshot["profile_image"], "https://img.example/alice.png");
  EXPECT_EQ(snapshot["viewer_count"], 300);
}
