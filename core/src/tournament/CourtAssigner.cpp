#include "courtplan/core/tournament/CourtAssigner.h"

#include <unordered_set>

namespace courtplan::core::tournament {

std::vector<Match> CourtAssigner::AssignSequential(int round_number,
                                                   const std::vector<TeamPairing>& pairings,
                                                   const roster::Roster& roster) {
    std::vector<Match> matches;
    matches.reserve(pairings.size());
    for (size_t i = 0; i < pairings.size(); ++i) {
        matches.push_back(AssignToCourt(round_number, static_cast<int>(i) + 1, pairings[i], roster));
    }
    return matches;
}

Match CourtAssigner::AssignToCourt(int round_number,
                                   int court,
                                   const TeamPairing& pairing,
                                   const roster::Roster& roster) {
    Match match;
    match.round_number = round_number;
    match.court = court;
    match.composition = pairing.composition;
    match.team1 = {{roster.player(pairing.team1[0]).id, roster.player(pairing.team1[1]).id}};
    match.team2 = {{roster.player(pairing.team2[0]).id, roster.player(pairing.team2[1]).id}};
    return match;
}

std::vector<std::string> CourtAssigner::SittingPlayers(const std::vector<int>& eligible,
                                                       const std::vector<Match>& matches,
                                                       const roster::Roster& roster) {
    std::unordered_set<std::string> on_court;
    for (const auto& match : matches) {
        on_court.insert(match.team1.begin(), match.team1.end());
        on_court.insert(match.team2.begin(), match.team2.end());
    }
    std::vector<std::string> sitting;
    for (int index : eligible) {
        const auto& id = roster.player(index).id;
        if (on_court.count(id) == 0) {
            sitting.push_back(id);
        }
    }
    return sitting;
}

}  // namespace courtplan::core::tournament
