#include "courtplan/core/stats/ScoreValidator.h"

#include <algorithm>

namespace courtplan::core::stats {

namespace {

bool Fail(std::string* error, const std::string& message) {
    if (error) {
        *error = message;
    }
    return false;
}

}  // namespace

const char* ToString(ScoringRule rule) {
    switch (rule) {
        case ScoringRule::kPoints:
            return "points";
        case ScoringRule::kRace:
            return "first_to";
        case ScoringRule::kFixedGames:
            return "total_games";
    }
    return "points";
}

bool ParseScoringRule(const std::string& value, ScoringRule& rule) {
    if (value == "points") {
        rule = ScoringRule::kPoints;
    } else if (value == "first_to") {
        rule = ScoringRule::kRace;
    } else if (value == "total_games") {
        rule = ScoringRule::kFixedGames;
    } else {
        return false;
    }
    return true;
}

bool ValidateScore(const ScoringConfig& config, int team1_score, int team2_score, std::string* error) {
    if (team1_score < 0 || team2_score < 0) {
        return Fail(error, "Scores cannot be negative");
    }
    if (config.target < 1) {
        return Fail(error, "Scoring target must be positive");
    }

    const int total = team1_score + team2_score;
    const int high = std::max(team1_score, team2_score);
    const int low = std::min(team1_score, team2_score);

    switch (config.rule) {
        case ScoringRule::kPoints:
            if (total != config.target) {
                return Fail(error, "Scores must add up to " + std::to_string(config.target) + " points");
            }
            return true;
        case ScoringRule::kRace:
            if (high != config.target || low >= config.target) {
                return Fail(error, "The winning team must reach exactly " + std::to_string(config.target) +
                                       " games and the other team fewer");
            }
            return true;
        case ScoringRule::kFixedGames:
            if (total != config.target) {
                return Fail(error, "Games must add up to " + std::to_string(config.target));
            }
            return true;
    }
    return Fail(error, "Unknown scoring rule");
}

}  // namespace courtplan::core::stats
