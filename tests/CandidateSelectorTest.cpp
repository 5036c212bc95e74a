#include <gtest/gtest.h>

#include "TestPlayers.h"
#include "courtplan/core/tournament/CandidateSelector.h"

#include <algorithm>
#include <random>
#include <set>

using namespace courtplan::core;
using courtplan::test::LinkPartners;
using courtplan::test::MakePlayers;

namespace {

std::pair<int, int> PlayCountRange(const roster::Roster& roster) {
    int low = roster.player(0).play_count;
    int high = low;
    for (const auto& player : roster.players()) {
        low = std::min(low, player.play_count);
        high = std::max(high, player.play_count);
    }
    return {low, high};
}

}  // namespace

class CandidateSelectorTest : public ::testing::Test {
protected:
    std::mt19937 rng_{7};
};

TEST_F(CandidateSelectorTest, NinePlayersTwoCourtsEverybodySitsOnce) {
    roster::Roster roster(MakePlayers(9));
    tournament::CandidateSelector selector(roster, rng_);

    for (int round = 1; round <= 9; ++round) {
        const auto selection = selector.SelectForRound(round, 2, {}, false);
        ASSERT_EQ(selection.match_count, 2);
        ASSERT_EQ(selection.playing.size(), 8u);
        ASSERT_EQ(selection.sitting.size(), 1u);
        selector.CommitRound(selection);
    }

    for (const auto& player : roster.players()) {
        EXPECT_EQ(player.sit_count, 1) << player.id;
        EXPECT_EQ(player.play_count, 8) << player.id;
    }
}

TEST_F(CandidateSelectorTest, PlayCountsStayWithinOne) {
    roster::Roster roster(MakePlayers(10));
    tournament::CandidateSelector selector(roster, rng_);

    for (int round = 1; round <= 12; ++round) {
        selector.CommitRound(selector.SelectForRound(round, 2, {}, false));
        const auto [low, high] = PlayCountRange(roster);
        EXPECT_LE(high - low, 1) << "after round " << round;
    }
}

TEST_F(CandidateSelectorTest, PlayingAndSittingPartitionEligible) {
    roster::Roster roster(MakePlayers(11));
    tournament::CandidateSelector selector(roster, rng_);

    const auto selection = selector.SelectForRound(1, 3, {}, false);
    EXPECT_EQ(selection.match_count, 2);
    std::set<int> seen(selection.playing.begin(), selection.playing.end());
    seen.insert(selection.sitting.begin(), selection.sitting.end());
    EXPECT_EQ(seen.size(), 11u);
    EXPECT_EQ(selection.playing.size() + selection.sitting.size(), 11u);
}

TEST_F(CandidateSelectorTest, SkippedAndExcludedPlayersAreNotEligible) {
    auto players = MakePlayers(6);
    players[0].skip_rounds = {2};
    roster::Roster roster(players);
    tournament::CandidateSelector selector(roster, rng_);

    EXPECT_EQ(selector.EligiblePool(1, {}).size(), 6u);
    const auto round_two = selector.EligiblePool(2, {"p6"});
    EXPECT_EQ(round_two, (std::vector<int>{1, 2, 3, 4}));
}

TEST_F(CandidateSelectorTest, FewerThanFourEligibleEverybodySits) {
    roster::Roster roster(MakePlayers(6));
    tournament::CandidateSelector selector(roster, rng_);

    const auto selection = selector.SelectForRound(1, 2, {"p1", "p2", "p3"}, false);
    EXPECT_EQ(selection.match_count, 0);
    EXPECT_TRUE(selection.playing.empty());
    EXPECT_EQ(selection.sitting.size(), 3u);
}

TEST_F(CandidateSelectorTest, PartnersSitOutTogether) {
    auto players = MakePlayers(6);
    LinkPartners(players[0], players[1]);
    LinkPartners(players[2], players[3]);
    LinkPartners(players[4], players[5]);
    roster::Roster roster(players);
    tournament::CandidateSelector selector(roster, rng_);

    for (int round = 1; round <= 3; ++round) {
        const auto selection = selector.SelectForRound(round, 1, {}, true);
        ASSERT_EQ(selection.sitting.size(), 2u);
        const auto& sitter = roster.player(selection.sitting[0]);
        ASSERT_TRUE(sitter.partner_id.has_value());
        EXPECT_EQ(*sitter.partner_id, roster.player(selection.sitting[1]).id);
        selector.CommitRound(selection);
    }
    for (const auto& player : roster.players()) {
        EXPECT_EQ(player.sit_count, 1) << player.id;
    }
}

TEST_F(CandidateSelectorTest, CourtSelectionPrefersFewestPlays) {
    auto players = MakePlayers(6);
    for (int i = 0; i < 4; ++i) {
        players[static_cast<size_t>(i)].play_count = 2;
    }
    roster::Roster roster(players);
    tournament::CandidateSelector selector(roster, rng_);

    const auto selection = selector.SelectForCourt(3, {}, false);
    ASSERT_EQ(selection.match_count, 1);
    ASSERT_EQ(selection.playing.size(), 4u);
    EXPECT_NE(std::find(selection.playing.begin(), selection.playing.end(), 4), selection.playing.end());
    EXPECT_NE(std::find(selection.playing.begin(), selection.playing.end(), 5), selection.playing.end());
}

TEST_F(CandidateSelectorTest, CommitPlayersLeavesOthersUntouched) {
    roster::Roster roster(MakePlayers(6));
    tournament::CandidateSelector selector(roster, rng_);

    selector.CommitPlayers({0, 1, 2, 3});
    EXPECT_EQ(roster.player(0).play_count, 1);
    EXPECT_EQ(roster.player(0).consecutive_plays, 1);
    EXPECT_EQ(roster.player(4).play_count, 0);
    EXPECT_EQ(roster.player(4).sit_count, 0);
    EXPECT_EQ(roster.player(5).consecutive_sits, 0);
}
