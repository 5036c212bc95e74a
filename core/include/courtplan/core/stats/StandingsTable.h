#pragma once

#include "courtplan/core/roster/Player.h"
#include "courtplan/core/tournament/TournamentTypes.h"

#include <string>
#include <vector>

namespace courtplan::core::stats {

struct StandingRow {
    int rank = 0;
    std::string id;
    std::string name;
    int points = 0;
    int wins = 0;
    int losses = 0;
    int ties = 0;
    int matches = 0;
    int compensation_points = 0;

    double win_rate() const {
        if (matches == 0) {
            return 0.0;
        }
        return (static_cast<double>(wins) / static_cast<double>(matches)) * 100.0;
    }
};

enum class StandingsOrder {
    kPoints,
    kWins,
};

class StandingsTable {
public:
    explicit StandingsTable(const std::vector<roster::Player>& players);

    std::vector<StandingRow> Sorted(StandingsOrder order) const;
    const std::vector<StandingRow>& rows() const { return rows_; }

private:
    std::vector<StandingRow> rows_;
};

// Recomputes points, record and play/sit counts from the scored rounds, e.g.
// after a score was corrected. Ratings and streaks are left as they are.
void RebuildStatsFromRounds(std::vector<roster::Player>& players,
                            const std::vector<tournament::Round>& rounds);

// Players behind the most-played player get half a match worth of points,
// at most once. No-op when points_per_match is not positive.
void ApplyCompensation(std::vector<roster::Player>& players, int points_per_match);

}  // namespace courtplan::core::stats
