#pragma once

#include "courtplan/core/roster/Roster.h"

#include <random>
#include <string>
#include <unordered_set>
#include <vector>

namespace courtplan::core::tournament {

struct Selection {
    int round_number = 0;
    int match_count = 0;
    std::vector<int> eligible;
    std::vector<int> playing;
    std::vector<int> sitting;
};

class CandidateSelector {
public:
    static constexpr int kPlayersPerMatch = 4;

    CandidateSelector(roster::Roster& roster, std::mt19937& rng);

    // Everyone not skipping this round and not already placed elsewhere.
    std::vector<int> EligiblePool(int round_number, const std::unordered_set<std::string>& excluded_ids) const;

    // Up to `courts` matches; the players with the fewest sits so far sit out.
    Selection SelectForRound(int round_number,
                             int courts,
                             const std::unordered_set<std::string>& excluded_ids,
                             bool partner_units);

    // One match: the four players who most need to play.
    Selection SelectForCourt(int round_number,
                             const std::unordered_set<std::string>& excluded_ids,
                             bool partner_units);

    // Play/sit counters for every eligible player of a whole round.
    void CommitRound(const Selection& selection);
    // Play counters for the placed players only; nobody is marked as sitting.
    void CommitPlayers(const std::vector<int>& playing);

private:
    std::vector<int> PickUnits(std::vector<std::vector<int>> ordered_units, int count) const;
    std::vector<std::vector<int>> BuildUnits(const std::vector<int>& pool, bool partner_units) const;

    roster::Roster& roster_;
    std::mt19937& rng_;
};

}  // namespace courtplan::core::tournament
