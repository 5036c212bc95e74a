#include "courtplan/core/tournament/FixedPartnerStrategy.h"

#include "courtplan/core/tournament/SkillClusterStrategy.h"

#include <algorithm>
#include <limits>
#include <sstream>

namespace courtplan::core::tournament {

namespace {

constexpr size_t kOpponentWindow = 3;

struct TeamEntry {
    std::array<int, 2> members{{-1, -1}};
    int points = 0;
    double rating = 0.0;
};

int UnitOpponentCount(const roster::PairHistory& history, const TeamEntry& a, const TeamEntry& b) {
    int count = 0;
    for (int x : a.members) {
        for (int y : b.members) {
            count += history.opponent_count(x, y);
        }
    }
    return count;
}

}  // namespace

GroupingResult FixedPartnerStrategy::BuildMatches(const GroupingContext& context) {
    GroupingResult result;
    const auto& roster = *context.roster;
    const auto units = roster::FindPartnerUnits(roster, context.pool);

    std::vector<TeamEntry> teams;
    teams.reserve(units.pairs.size());
    for (const auto& [first, second] : units.pairs) {
        TeamEntry entry;
        entry.members = {{first, second}};
        entry.points = roster.player(first).total_points + roster.player(second).total_points;
        entry.rating = roster.player(first).rating + roster.player(second).rating;
        teams.push_back(entry);
    }
    if (context.rng != nullptr) {
        std::shuffle(teams.begin(), teams.end(), *context.rng);
    }
    std::stable_sort(teams.begin(), teams.end(), [](const TeamEntry& a, const TeamEntry& b) {
        if (a.points != b.points) {
            return a.points > b.points;
        }
        return a.rating > b.rating;
    });

    std::vector<int> leftovers = units.singles;
    if (teams.size() % 2 == 1) {
        const auto& odd = teams.back();
        leftovers.push_back(odd.members[0]);
        leftovers.push_back(odd.members[1]);
        teams.pop_back();
    }

    while (teams.size() >= 2 && static_cast<int>(result.pairings.size()) < context.match_count) {
        const TeamEntry first = teams.front();
        teams.erase(teams.begin());

        size_t best = 0;
        int best_count = std::numeric_limits<int>::max();
        const size_t window = std::min(kOpponentWindow, teams.size());
        for (size_t i = 0; i < window; ++i) {
            const int count = UnitOpponentCount(*context.history, first, teams[i]);
            if (count < best_count) {
                best_count = count;
                best = i;
            }
        }

        TeamPairing pairing;
        pairing.team1 = first.members;
        pairing.team2 = teams[best].members;
        result.pairings.push_back(pairing);
        teams.erase(teams.begin() + static_cast<std::ptrdiff_t>(best));
    }

    for (const auto& team : teams) {
        leftovers.push_back(team.members[0]);
        leftovers.push_back(team.members[1]);
    }

    const int remaining_matches = context.match_count - static_cast<int>(result.pairings.size());
    if (remaining_matches > 0 && leftovers.size() >= 4) {
        auto fallback = SkillClusterStrategy::Cluster(context, leftovers, remaining_matches);
        std::ostringstream detail;
        detail << leftovers.size() << " player(s) without a valid partner pair grouped by rating";
        result.degradations.push_back({DegradationReason::kFixedPartnerFallback, detail.str()});
        result.pairings.insert(result.pairings.end(), fallback.begin(), fallback.end());
    }
    return result;
}

}  // namespace courtplan::core::tournament
