#pragma once

#include <array>
#include <optional>
#include <string>
#include <vector>

namespace courtplan::core::tournament {

enum class TournamentFormat {
    kMexicano,
    kAmericano,
    kFixedPartner,
    kMixedMexicano,
};

enum class MatchupPreference {
    kAny,
    kMixedOnly,
    kRandomizedModes,
};

enum class MatchComposition {
    kUnrestricted,
    kMixed,
    kMaleOnly,
    kFemaleOnly,
};

enum class DegradationReason {
    kInsufficientPlayers,
    kFixedPartnerFallback,
    kMixedFallback,
    kCompositionFallback,
};

struct Degradation {
    DegradationReason reason = DegradationReason::kInsufficientPlayers;
    std::string detail;
};

// Team assignment over roster indices, before courts are attached.
struct TeamPairing {
    std::array<int, 2> team1{{-1, -1}};
    std::array<int, 2> team2{{-1, -1}};
    MatchComposition composition = MatchComposition::kUnrestricted;
};

struct Match {
    int round_number = 0;
    int court = 0;
    std::array<std::string, 2> team1;
    std::array<std::string, 2> team2;
    std::optional<int> team1_score;
    std::optional<int> team2_score;
    bool completed = false;
    MatchComposition composition = MatchComposition::kUnrestricted;

    bool has_scores() const { return team1_score.has_value() && team2_score.has_value(); }
};

struct Round {
    int number = 0;
    std::vector<Match> matches;
    std::vector<std::string> sitting_players;
    std::vector<Degradation> degradations;

    bool degraded() const { return !degradations.empty(); }
};

// Identity of a generated match: round, court and its four players.
std::string MatchKey(const Match& match);

const char* ToString(TournamentFormat format);
const char* ToString(MatchupPreference preference);
const char* ToString(MatchComposition composition);
const char* ToString(DegradationReason reason);
bool ParseTournamentFormat(const std::string& value, TournamentFormat& format);
bool ParseMatchupPreference(const std::string& value, MatchupPreference& preference);
bool ParseMatchComposition(const std::string& value, MatchComposition& composition);
bool ParseDegradationReason(const std::string& value, DegradationReason& reason);

}  // namespace courtplan::core::tournament
