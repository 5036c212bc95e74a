#include <gtest/gtest.h>

#include "TestPlayers.h"
#include "courtplan/core/stats/RatingUpdater.h"

using namespace courtplan::core;
using courtplan::test::MakePlayers;

class RatingUpdaterTest : public ::testing::Test {
protected:
    RatingUpdaterTest() : roster_(MakePlayers(4)) {}

    static tournament::Match Scored(int team1_score, int team2_score) {
        tournament::Match match;
        match.round_number = 1;
        match.court = 1;
        match.team1 = {{"p1", "p2"}};
        match.team2 = {{"p3", "p4"}};
        match.team1_score = team1_score;
        match.team2_score = team2_score;
        match.completed = true;
        return match;
    }

    roster::Roster roster_;
    roster::PairHistory history_;
    stats::RatingUpdater updater_;
};

TEST_F(RatingUpdaterTest, ExpectedScoreEqualRatings) {
    EXPECT_NEAR(stats::RatingUpdater::ExpectedScore(5.0, 5.0), 0.5, 1e-9);
}

TEST_F(RatingUpdaterTest, ExpectedScoreSymmetry) {
    const double stronger = stats::RatingUpdater::ExpectedScore(7.0, 4.0);
    const double weaker = stats::RatingUpdater::ExpectedScore(4.0, 7.0);
    EXPECT_GT(stronger, 0.5);
    EXPECT_NEAR(stronger + weaker, 1.0, 1e-9);
}

TEST_F(RatingUpdaterTest, ExpectedScoreFourPointGap) {
    EXPECT_NEAR(stats::RatingUpdater::ExpectedScore(9.0, 5.0), 0.909, 0.001);
}

TEST_F(RatingUpdaterTest, WinRaisesWinnersAndLowersLosers) {
    std::string error;
    ASSERT_TRUE(updater_.Apply(Scored(15, 6), roster_, history_, &error)) << error;

    EXPECT_DOUBLE_EQ(roster_.player(0).rating, 5.25);
    EXPECT_DOUBLE_EQ(roster_.player(1).rating, 5.25);
    EXPECT_DOUBLE_EQ(roster_.player(2).rating, 4.75);
    EXPECT_DOUBLE_EQ(roster_.player(3).rating, 4.75);

    EXPECT_EQ(roster_.player(0).wins, 1);
    EXPECT_EQ(roster_.player(0).total_points, 15);
    EXPECT_EQ(roster_.player(3).losses, 1);
    EXPECT_EQ(roster_.player(3).total_points, 6);
    EXPECT_EQ(history_.partner_count(0, 1), 1);
    EXPECT_EQ(history_.opponent_count(0, 3), 1);
}

TEST_F(RatingUpdaterTest, UpsetMovesRatingsFurther) {
    roster_.mutable_player(2).rating = 7.0;
    roster_.mutable_player(3).rating = 7.0;
    std::string error;
    ASSERT_TRUE(updater_.Apply(Scored(11, 10), roster_, history_, &error)) << error;
    EXPECT_GT(roster_.player(0).rating - 5.0, 0.25);
    EXPECT_LT(roster_.player(2).rating - 7.0, -0.25);
}

TEST_F(RatingUpdaterTest, TieBetweenEqualTeamsKeepsRatings) {
    std::string error;
    ASSERT_TRUE(updater_.Apply(Scored(10, 10), roster_, history_, &error)) << error;
    for (const auto& player : roster_.players()) {
        EXPECT_DOUBLE_EQ(player.rating, 5.0);
        EXPECT_EQ(player.ties, 1);
        EXPECT_EQ(player.total_points, 10);
    }
}

TEST_F(RatingUpdaterTest, CustomKFactorScalesChange) {
    stats::RatingUpdater updater(1.0);
    std::string error;
    ASSERT_TRUE(updater.Apply(Scored(21, 0), roster_, history_, &error)) << error;
    EXPECT_DOUBLE_EQ(roster_.player(0).rating, 5.5);
}

TEST_F(RatingUpdaterTest, RejectsUnscoredMatch) {
    auto match = Scored(0, 0);
    match.team2_score.reset();
    std::string error;
    EXPECT_FALSE(updater_.Apply(match, roster_, history_, &error));
    EXPECT_FALSE(error.empty());
    EXPECT_EQ(roster_.player(0).matches_recorded(), 0);
}

TEST_F(RatingUpdaterTest, RejectsUnknownOrRepeatedPlayers) {
    auto unknown = Scored(5, 3);
    unknown.team2[1] = "ghost";
    std::string error;
    EXPECT_FALSE(updater_.Apply(unknown, roster_, history_, &error));
    EXPECT_NE(error.find("ghost"), std::string::npos);

    auto repeated = Scored(5, 3);
    repeated.team2[1] = "p1";
    EXPECT_FALSE(updater_.Apply(repeated, roster_, history_, &error));
    EXPECT_DOUBLE_EQ(roster_.player(0).rating, 5.0);
}

TEST_F(RatingUpdaterTest, SameResultIsRecordedOnce) {
    std::string error;
    ASSERT_TRUE(updater_.Apply(Scored(15, 6), roster_, history_, &error));
    EXPECT_FALSE(updater_.Apply(Scored(15, 6), roster_, history_, &error));
    EXPECT_EQ(roster_.player(0).wins, 1);
    EXPECT_EQ(history_.partner_count(0, 1), 1);
}

TEST_F(RatingUpdaterTest, MarkedMatchesAreNotApplied) {
    const auto match = Scored(15, 6);
    updater_.MarkRecorded(match);
    EXPECT_TRUE(updater_.IsRecorded(match));
    std::string error;
    EXPECT_FALSE(updater_.Apply(match, roster_, history_, &error));
    EXPECT_DOUBLE_EQ(roster_.player(0).rating, 5.0);
}
