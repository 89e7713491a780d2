#include <gtest/gtest.h>
#include <functional>
#include <unordered_set>
#include <nlohmann/json.hpp>
#include "Game.h"

static Game makeGame() {
    return Game("Red Dead Redemption 2", "Xbox One", Date{2018, 10, 26},
                "America 1899. The end of the wild west era has begun.", 97, 8.0);
}

TEST(GameTest, Accessors) {
    Game game = makeGame();
    EXPECT_EQ(game.getName(), "Red Dead Redemption 2");
    EXPECT_EQ(game.getPlatform(), "Xbox One");
    EXPECT_EQ(game.getReleaseDate(), (Date{2018, 10, 26}));
    EXPECT_EQ(game.getSummary(), "America 1899. The end of the wild west era has begun.");
    EXPECT_EQ(game.getMetaScore(), 97);
    EXPECT_DOUBLE_EQ(game.getUserReview(), 8.0);
}

TEST(GameTest, EqualityUsesAllFields) {
    Game game = makeGame();
    EXPECT_EQ(game, makeGame());

    EXPECT_NE(game, Game("Other", "Xbox One", Date{2018, 10, 26}, game.getSummary(), 97, 8.0));
    EXPECT_NE(game, Game(game.getName(), "PlayStation 4", Date{2018, 10, 26}, game.getSummary(), 97, 8.0));
    EXPECT_NE(game, Game(game.getName(), "Xbox One", Date{2018, 10, 27}, game.getSummary(), 97, 8.0));
    EXPECT_NE(game, Game(game.getName(), "Xbox One", Date{2018, 10, 26}, "Other", 97, 8.0));
    EXPECT_NE(game, Game(game.getName(), "Xbox One", Date{2018, 10, 26}, game.getSummary(), 96, 8.0));
    EXPECT_NE(game, Game(game.getName(), "Xbox One", Date{2018, 10, 26}, game.getSummary(), 97, 8.1));
}

TEST(GameTest, EqualGamesHashEqual) {
    std::hash<Game> hasher;
    EXPECT_EQ(hasher(makeGame()), hasher(makeGame()));

    std::unordered_set<Game> games;
    games.insert(makeGame());
    games.insert(makeGame());
    EXPECT_EQ(games.size(), 1u);
}

TEST(GameTest, ToJson) {
    nlohmann::json j = makeGame();
    EXPECT_EQ(j.at("name"), "Red Dead Redemption 2");
    EXPECT_EQ(j.at("platform"), "Xbox One");
    EXPECT_EQ(j.at("releaseDate"), "2018-10-26");
    EXPECT_EQ(j.at("metaScore"), 97);
    EXPECT_DOUBLE_EQ(j.at("userReview").get<double>(), 8.0);
}

TEST(GameTest, FromJson) {
    nlohmann::json j = nlohmann::json::parse(R"({
        "name": "SoulCalibur",
        "platform": "Dreamcast",
        "releaseDate": "1999-09-08",
        "summary": "Weapon based fighting.",
        "metaScore": 98,
        "userReview": 8.4
    })");

    Game game = j.get<Game>();
    EXPECT_EQ(game.getName(), "SoulCalibur");
    EXPECT_EQ(game.getPlatform(), "Dreamcast");
    EXPECT_EQ(game.getReleaseDate(), (Date{1999, 9, 8}));
    EXPECT_EQ(game.getMetaScore(), 98);
    EXPECT_DOUBLE_EQ(game.getUserReview(), 8.4);
}

TEST(GameTest, FromJsonRejectsBadDate) {
    nlohmann::json j = makeGame();
    j["releaseDate"] = "26-Oct-2018";
    EXPECT_THROW(j.get<Game>(), std::invalid_argument);
}

TEST(GameTest, FromJsonRejectsEmptyNameOrPlatform) {
    nlohmann::json j = makeGame();
    j["name"] = "";
    EXPECT_THROW(j.get<Game>(), std::invalid_argument);

    j = makeGame();
    j["platform"] = "";
    EXPECT_THROW(j.get<Game>(), std::invalid_argument);
}

TEST(GameTest, FromJsonMissingField) {
    nlohmann::json j = makeGame();
    j.erase("summary");
    EXPECT_THROW(j.get<Game>(), nlohmann::json::out_of_range);
}
