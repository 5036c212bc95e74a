#pragma once

#include "courtplan/core/roster/Roster.h"
#include "courtplan/core/tournament/TournamentTypes.h"

#include <vector>

namespace courtplan::core::tournament {

class CourtAssigner {
public:
    // Whole round: pairing i plays on court i + 1.
    static std::vector<Match> AssignSequential(int round_number,
                                               const std::vector<TeamPairing>& pairings,
                                               const roster::Roster& roster);

    // Independent progression: one pairing on a named court.
    static Match AssignToCourt(int round_number,
                               int court,
                               const TeamPairing& pairing,
                               const roster::Roster& roster);

    // Ids of the eligible players that are not on any of the given matches.
    static std::vector<std::string> SittingPlayers(const std::vector<int>& eligible,
                                                   const std::vector<Match>& matches,
                                                   const roster::Roster& roster);
};

}  // namespace courtplan::core::tournament
