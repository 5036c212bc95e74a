#pragma once

#include "courtplan/core/api/EngineConfig.h"
#include "courtplan/core/roster/Player.h"
#include "courtplan/core/tournament/TournamentTypes.h"

#include <string>
#include <vector>

namespace courtplan::core::persist {

struct SessionState {
    int version = 1;
    api::SessionConfig config;
    // Live player records, counters included.
    std::vector<roster::Player> players;
    std::vector<tournament::Round> rounds;
    int current_round = 0;

    tournament::Round* FindRound(int number);
    const tournament::Round* FindRound(int number) const;
};

bool SaveSession(const std::string& path, const SessionState& state, std::string* error = nullptr);
bool LoadSession(const std::string& path, SessionState& state, std::string* error);

}  // namespace courtplan::core::persist
