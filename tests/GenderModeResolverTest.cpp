#include <gtest/gtest.h>

#include "TestPlayers.h"
#include "courtplan/core/api/PairingEngine.h"
#include "courtplan/core/tournament/GenderModeResolver.h"
#include "courtplan/core/tournament/MixedGenderStrategy.h"

#include <algorithm>
#include <map>
#include <set>
#include <string>
#include <vector>

using namespace courtplan::core;
using courtplan::test::MakeConfig;
using courtplan::test::MakeGenderedPlayers;
using courtplan::test::MakePlayer;
using courtplan::test::MakePlayers;
using tournament::DegradationReason;
using tournament::MatchComposition;
using tournament::MatchupPreference;
using tournament::TournamentFormat;

namespace {

roster::Gender GenderOf(const api::PairingEngine& engine, const std::string& id) {
    return engine.roster().Find(id)->gender;
}

bool TeamIsMixed(const api::PairingEngine& engine, const std::array<std::string, 2>& team) {
    return GenderOf(engine, team[0]) != GenderOf(engine, team[1]);
}

bool AllOf(const api::PairingEngine& engine, const tournament::Match& match, roster::Gender gender) {
    for (const auto* team : {&match.team1, &match.team2}) {
        for (const auto& id : *team) {
            if (GenderOf(engine, id) != gender) {
                return false;
            }
        }
    }
    return true;
}

int CountReason(const tournament::Round& round, DegradationReason reason) {
    int count = 0;
    for (const auto& degradation : round.degradations) {
        count += degradation.reason == reason ? 1 : 0;
    }
    return count;
}

bool CompositionHolds(const api::PairingEngine& engine, const tournament::Match& match) {
    switch (match.composition) {
        case MatchComposition::kMixed:
            return TeamIsMixed(engine, match.team1) && TeamIsMixed(engine, match.team2);
        case MatchComposition::kMaleOnly:
            return AllOf(engine, match, roster::Gender::kMale);
        case MatchComposition::kFemaleOnly:
            return AllOf(engine, match, roster::Gender::kFemale);
        case MatchComposition::kUnrestricted:
            return true;
    }
    return false;
}

}  // namespace

class GenderModeResolverTest : public ::testing::Test {};

TEST_F(GenderModeResolverTest, FormatOverridesPreference) {
    const tournament::GenderModeResolver mixed(TournamentFormat::kMixedMexicano, MatchupPreference::kAny);
    EXPECT_EQ(mixed.effective_preference(), MatchupPreference::kMixedOnly);
    EXPECT_STREQ(mixed.strategy().name(), "mixed_mexicano");

    const tournament::GenderModeResolver fixed(TournamentFormat::kFixedPartner, MatchupPreference::kMixedOnly);
    EXPECT_EQ(fixed.effective_preference(), MatchupPreference::kAny);
    EXPECT_TRUE(fixed.uses_partner_units());

    const tournament::GenderModeResolver wrapped(TournamentFormat::kAmericano, MatchupPreference::kMixedOnly);
    EXPECT_STREQ(wrapped.strategy().name(), "mixed_americano");
}

TEST_F(GenderModeResolverTest, LabelledGendersMustBePresent) {
    using tournament::CanForm;
    using tournament::GenderCount;

    EXPECT_FALSE(CanForm(GenderCount{0, 0, 4}, MatchComposition::kMaleOnly));
    EXPECT_FALSE(CanForm(GenderCount{0, 0, 4}, MatchComposition::kFemaleOnly));
    EXPECT_FALSE(CanForm(GenderCount{0, 0, 4}, MatchComposition::kMixed));
    EXPECT_TRUE(CanForm(GenderCount{0, 0, 4}, MatchComposition::kUnrestricted));

    EXPECT_TRUE(CanForm(GenderCount{1, 0, 3}, MatchComposition::kMaleOnly));
    EXPECT_FALSE(CanForm(GenderCount{1, 0, 3}, MatchComposition::kMixed));
    EXPECT_TRUE(CanForm(GenderCount{1, 1, 2}, MatchComposition::kMixed));
    EXPECT_FALSE(CanForm(GenderCount{3, 1, 0}, MatchComposition::kMixed));
    EXPECT_FALSE(CanForm(GenderCount{3, 1, 0}, MatchComposition::kMaleOnly));
}

TEST_F(GenderModeResolverTest, MixedOnlyFourMenFourWomen) {
    api::PairingEngine engine(MakeGenderedPlayers(4, 4),
                              MakeConfig(TournamentFormat::kMexicano, 2, MatchupPreference::kMixedOnly));

    for (int round = 1; round <= 4; ++round) {
        const auto generated = engine.GenerateRound(round);
        ASSERT_EQ(generated.matches.size(), 2u);
        EXPECT_FALSE(generated.degraded());
        for (const auto& match : generated.matches) {
            EXPECT_EQ(match.composition, MatchComposition::kMixed);
            EXPECT_TRUE(TeamIsMixed(engine, match.team1));
            EXPECT_TRUE(TeamIsMixed(engine, match.team2));
        }
    }
}

TEST_F(GenderModeResolverTest, MixedMexicanoUsesWildcardsForShortSide) {
    auto players = MakeGenderedPlayers(3, 3);
    players.push_back(MakePlayer("u1"));
    players.push_back(MakePlayer("u2"));
    api::PairingEngine engine(players, MakeConfig(TournamentFormat::kMixedMexicano, 2));

    const auto generated = engine.GenerateRound(1);
    ASSERT_EQ(generated.matches.size(), 2u);
    EXPECT_FALSE(generated.degraded());
    for (const auto& match : generated.matches) {
        EXPECT_EQ(match.composition, MatchComposition::kMixed);
    }
}

TEST_F(GenderModeResolverTest, MixedOnlyAllMenFallsBack) {
    std::vector<std::string> messages;
    api::PairingEngine engine(MakeGenderedPlayers(8, 0),
                              MakeConfig(TournamentFormat::kMexicano, 2, MatchupPreference::kMixedOnly),
                              [&messages](const std::string& message) { messages.push_back(message); });

    const auto generated = engine.GenerateRound(1);
    ASSERT_EQ(generated.matches.size(), 2u);
    EXPECT_EQ(CountReason(generated, DegradationReason::kMixedFallback), 1);
    for (const auto& match : generated.matches) {
        EXPECT_EQ(match.composition, MatchComposition::kUnrestricted);
        EXPECT_TRUE(AllOf(engine, match, roster::Gender::kMale));
    }

    bool logged = false;
    for (const auto& message : messages) {
        logged = logged || message.find("mixed_fallback") != std::string::npos;
    }
    EXPECT_TRUE(logged);
}

TEST_F(GenderModeResolverTest, MixedOnlySixMenTwoWomen) {
    api::PairingEngine engine(MakeGenderedPlayers(6, 2),
                              MakeConfig(TournamentFormat::kMexicano, 2, MatchupPreference::kMixedOnly));

    const auto generated = engine.GenerateRound(1);
    ASSERT_EQ(generated.matches.size(), 2u);
    int mixed = 0;
    int unrestricted = 0;
    for (const auto& match : generated.matches) {
        if (match.composition == MatchComposition::kMixed) {
            ++mixed;
            EXPECT_TRUE(TeamIsMixed(engine, match.team1));
            EXPECT_TRUE(TeamIsMixed(engine, match.team2));
        } else {
            ++unrestricted;
            EXPECT_TRUE(AllOf(engine, match, roster::Gender::kMale));
        }
    }
    EXPECT_EQ(mixed, 1);
    EXPECT_EQ(unrestricted, 1);
    EXPECT_EQ(CountReason(generated, DegradationReason::kMixedFallback), 1);
}

TEST_F(GenderModeResolverTest, RandomizedModesOnlyProduceValidCompositions) {
    api::PairingEngine engine(MakeGenderedPlayers(6, 6),
                              MakeConfig(TournamentFormat::kMexicano, 3, MatchupPreference::kRandomizedModes));

    int mixed_matches = 0;
    for (int round = 1; round <= 20; ++round) {
        const auto generated = engine.GenerateRound(round);
        ASSERT_EQ(generated.matches.size(), 3u);
        EXPECT_FALSE(generated.degraded());
        for (const auto& match : generated.matches) {
            switch (match.composition) {
                case MatchComposition::kMixed:
                    ++mixed_matches;
                    EXPECT_TRUE(TeamIsMixed(engine, match.team1));
                    EXPECT_TRUE(TeamIsMixed(engine, match.team2));
                    break;
                case MatchComposition::kMaleOnly:
                    EXPECT_TRUE(AllOf(engine, match, roster::Gender::kMale));
                    break;
                case MatchComposition::kFemaleOnly:
                    EXPECT_TRUE(AllOf(engine, match, roster::Gender::kFemale));
                    break;
                case MatchComposition::kUnrestricted:
                    ADD_FAILURE() << "unexpected unrestricted match in round " << round;
                    break;
            }
        }
    }
    EXPECT_GT(mixed_matches, 0);
}

TEST_F(GenderModeResolverTest, RandomizedModesWithoutFeasibleCompositionFallsBack) {
    api::PairingEngine engine(MakeGenderedPlayers(3, 1),
                              MakeConfig(TournamentFormat::kMexicano, 1, MatchupPreference::kRandomizedModes));

    const auto generated = engine.GenerateRound(1);
    ASSERT_EQ(generated.matches.size(), 1u);
    EXPECT_EQ(generated.matches[0].composition, MatchComposition::kUnrestricted);
    EXPECT_EQ(CountReason(generated, DegradationReason::kCompositionFallback), 1);
}

TEST_F(GenderModeResolverTest, RandomizedModesWithOnlyUnspecifiedPlayersStayUnrestricted) {
    api::PairingEngine engine(MakePlayers(8),
                              MakeConfig(TournamentFormat::kMexicano, 2, MatchupPreference::kRandomizedModes));

    for (int round = 1; round <= 10; ++round) {
        const auto generated = engine.GenerateRound(round);
        ASSERT_EQ(generated.matches.size(), 2u);
        for (const auto& match : generated.matches) {
            EXPECT_EQ(match.composition, MatchComposition::kUnrestricted);
        }
        EXPECT_EQ(CountReason(generated, DegradationReason::kCompositionFallback), 1);
    }
}

TEST_F(GenderModeResolverTest, MixedOnlyWithoutWomenIsNeverLabelledMixed) {
    auto players = MakeGenderedPlayers(4, 0);
    for (int i = 1; i <= 4; ++i) {
        players.push_back(MakePlayer("u" + std::to_string(i)));
    }
    api::PairingEngine engine(players, MakeConfig(TournamentFormat::kMexicano, 2, MatchupPreference::kMixedOnly));

    const auto generated = engine.GenerateRound(1);
    ASSERT_EQ(generated.matches.size(), 2u);
    EXPECT_EQ(CountReason(generated, DegradationReason::kMixedFallback), 1);
    for (const auto& match : generated.matches) {
        EXPECT_EQ(match.composition, MatchComposition::kUnrestricted);
    }
}

class AmericanoGenderTest : public ::testing::Test {
protected:
    // p1..p8 rated 8 down to 1, odd ids male and even ids female.
    static std::vector<roster::Player> AlternatingPlayers() {
        auto players = MakePlayers(8, 8.0, 1.0);
        for (size_t i = 0; i < players.size(); ++i) {
            players[i].gender = i % 2 == 0 ? roster::Gender::kMale : roster::Gender::kFemale;
        }
        return players;
    }

    // Plays 14 rounds on two courts and returns the opponent count per pair.
    static std::map<std::set<std::string>, int> PlayAndCountOpponents(MatchupPreference preference) {
        api::PairingEngine engine(AlternatingPlayers(), MakeConfig(TournamentFormat::kAmericano, 2, preference));
        std::map<std::set<std::string>, int> counts;
        for (int round = 1; round <= 14; ++round) {
            const auto generated = engine.GenerateRound(round);
            EXPECT_EQ(generated.matches.size(), 2u);
            EXPECT_FALSE(generated.degraded());
            for (const auto& match : generated.matches) {
                EXPECT_TRUE(CompositionHolds(engine, match)) << "round " << round;
                if (preference == MatchupPreference::kMixedOnly) {
                    EXPECT_EQ(match.composition, MatchComposition::kMixed);
                }
                for (const auto& a : match.team1) {
                    for (const auto& b : match.team2) {
                        counts[{a, b}] += 1;
                    }
                }
            }
        }
        return counts;
    }

    static int MaxCount(const std::map<std::set<std::string>, int>& counts) {
        int high = 0;
        for (const auto& entry : counts) {
            high = std::max(high, entry.second);
        }
        return high;
    }

    static size_t NeverOpposed(const std::map<std::set<std::string>, int>& counts) {
        return 28 - counts.size();
    }
};

// Rating clustering would rebuild the same two foursomes every round, giving
// 14 meetings for some pairs and 16 pairs that never face each other.

TEST_F(AmericanoGenderTest, AnyPreferenceRotatesOpponents) {
    const auto counts = PlayAndCountOpponents(MatchupPreference::kAny);
    EXPECT_LE(MaxCount(counts), 7);
    EXPECT_EQ(NeverOpposed(counts), 0u);
}

TEST_F(AmericanoGenderTest, MixedOnlyStillRotatesOpponents) {
    const auto counts = PlayAndCountOpponents(MatchupPreference::kMixedOnly);
    EXPECT_LE(MaxCount(counts), 7);
    EXPECT_EQ(NeverOpposed(counts), 0u);
}

TEST_F(AmericanoGenderTest, RandomizedModesStillRotateOpponents) {
    const auto counts = PlayAndCountOpponents(MatchupPreference::kRandomizedModes);
    EXPECT_LE(MaxCount(counts), 10);
    EXPECT_LE(NeverOpposed(counts), 10u);
}
