#pragma once

#include "courtplan/core/roster/Player.h"
#include "courtplan/core/stats/ScoreValidator.h"
#include "courtplan/core/tournament/TournamentTypes.h"

#include <cstdint>
#include <string>
#include <vector>

namespace courtplan::core::api {

struct EngineConfig {
    int courts = 1;
    tournament::TournamentFormat format = tournament::TournamentFormat::kMexicano;
    tournament::MatchupPreference matchup_preference = tournament::MatchupPreference::kAny;
    // 0 seeds from std::random_device.
    std::uint32_t seed = 0;
    double rating_k_factor = 0.5;
};

struct SessionConfig {
    std::string name;
    EngineConfig engine;
    stats::ScoringConfig scoring;
    std::vector<roster::Player> players;

    static bool LoadFromFile(const std::string& path, SessionConfig& config, std::string* error);
    static bool SaveToFile(const std::string& path, const SessionConfig& config, std::string* error);
    static std::string ToJsonString(const SessionConfig& config);
};

}  // namespace courtplan::core::api
