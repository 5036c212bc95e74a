#pragma once

#include <string>

namespace courtplan::core::stats {

enum class ScoringRule {
    // Every rally scores: both team scores add up to the points per match.
    kPoints,
    // First team to N games wins.
    kRace,
    // A fixed number of games is played; the scores add up to N.
    kFixedGames,
};

struct ScoringConfig {
    ScoringRule rule = ScoringRule::kPoints;
    int target = 21;
};

const char* ToString(ScoringRule rule);
bool ParseScoringRule(const std::string& value, ScoringRule& rule);

// Checks a score before it is handed to the engine.
bool ValidateScore(const ScoringConfig& config, int team1_score, int team2_score, std::string* error);

}  // namespace courtplan::core::stats
