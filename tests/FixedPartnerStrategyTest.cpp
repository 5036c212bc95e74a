#include <gtest/gtest.h>

#include "TestPlayers.h"
#include "courtplan/core/api/PairingEngine.h"

#include <set>

using namespace courtplan::core;
using courtplan::test::LinkPartners;
using courtplan::test::MakeConfig;
using courtplan::test::MakePlayers;

namespace {

bool IsPartnerTeam(const api::PairingEngine& engine, const std::array<std::string, 2>& team) {
    const auto* first = engine.roster().Find(team[0]);
    return first != nullptr && first->partner_id.has_value() && *first->partner_id == team[1];
}

bool HasReason(const tournament::Round& round, tournament::DegradationReason reason) {
    for (const auto& degradation : round.degradations) {
        if (degradation.reason == reason) {
            return true;
        }
    }
    return false;
}

std::set<std::string> PlayersOn(const tournament::Round& round) {
    std::set<std::string> ids;
    for (const auto& match : round.matches) {
        ids.insert(match.team1.begin(), match.team1.end());
        ids.insert(match.team2.begin(), match.team2.end());
    }
    return ids;
}

}  // namespace

class FixedPartnerTest : public ::testing::Test {
protected:
    static std::vector<roster::Player> Pairs(int pair_count) {
        auto players = MakePlayers(pair_count * 2);
        for (size_t i = 0; i + 1 < players.size(); i += 2) {
            LinkPartners(players[i], players[i + 1]);
        }
        return players;
    }
};

TEST_F(FixedPartnerTest, PartnersAlwaysShareATeam) {
    api::PairingEngine engine(Pairs(4), MakeConfig(tournament::TournamentFormat::kFixedPartner, 2));

    for (int round = 1; round <= 5; ++round) {
        const auto generated = engine.GenerateRound(round);
        ASSERT_EQ(generated.matches.size(), 2u);
        EXPECT_FALSE(generated.degraded());
        for (const auto& match : generated.matches) {
            EXPECT_TRUE(IsPartnerTeam(engine, match.team1)) << match.team1[0] << "/" << match.team1[1];
            EXPECT_TRUE(IsPartnerTeam(engine, match.team2)) << match.team2[0] << "/" << match.team2[1];
        }
    }
}

TEST_F(FixedPartnerTest, SittingPairSitsTogether) {
    api::PairingEngine engine(Pairs(3), MakeConfig(tournament::TournamentFormat::kFixedPartner, 1));

    for (int round = 1; round <= 3; ++round) {
        const auto generated = engine.GenerateRound(round);
        ASSERT_EQ(generated.matches.size(), 1u);
        ASSERT_EQ(generated.sitting_players.size(), 2u);
        const auto* sitter = engine.roster().Find(generated.sitting_players[0]);
        ASSERT_NE(sitter, nullptr);
        EXPECT_EQ(sitter->partner_id.value_or(""), generated.sitting_players[1]);
        EXPECT_FALSE(generated.degraded());
    }
}

TEST_F(FixedPartnerTest, BrokenPartnerMapStillProducesValidRound) {
    auto players = MakePlayers(8);
    players[0].partner_id = "p2";
    players[1].partner_id = "p3";
    players[4].partner_id = "missing";
    api::PairingEngine engine(players, MakeConfig(tournament::TournamentFormat::kFixedPartner, 2));

    const auto generated = engine.GenerateRound(1);
    ASSERT_EQ(generated.matches.size(), 2u);
    EXPECT_EQ(PlayersOn(generated).size(), 8u);
    EXPECT_TRUE(HasReason(generated, tournament::DegradationReason::kFixedPartnerFallback));
}

TEST_F(FixedPartnerTest, SinglesFillRemainingCourtByRating) {
    auto players = MakePlayers(8);
    LinkPartners(players[0], players[1]);
    LinkPartners(players[2], players[3]);
    api::PairingEngine engine(players, MakeConfig(tournament::TournamentFormat::kFixedPartner, 2));

    const auto generated = engine.GenerateRound(1);
    ASSERT_EQ(generated.matches.size(), 2u);
    EXPECT_EQ(PlayersOn(generated).size(), 8u);
    EXPECT_TRUE(HasReason(generated, tournament::DegradationReason::kFixedPartnerFallback));

    int partner_teams = 0;
    for (const auto& match : generated.matches) {
        partner_teams += IsPartnerTeam(engine, match.team1) ? 1 : 0;
        partner_teams += IsPartnerTeam(engine, match.team2) ? 1 : 0;
    }
    EXPECT_EQ(partner_teams, 2);
}

TEST_F(FixedPartnerTest, StrategyReportsPartnerUnits) {
    api::PairingEngine engine(Pairs(2), MakeConfig(tournament::TournamentFormat::kFixedPartner, 1));
    EXPECT_STREQ(engine.strategy_name(), "fixed_partner");
}
