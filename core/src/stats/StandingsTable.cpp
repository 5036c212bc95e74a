#include "courtplan/core/stats/StandingsTable.h"

#include <algorithm>
#include <array>
#include <unordered_map>

namespace courtplan::core::stats {

namespace {

std::unordered_map<std::string, size_t> IndexById(const std::vector<roster::Player>& players) {
    std::unordered_map<std::string, size_t> index;
    for (size_t i = 0; i < players.size(); ++i) {
        index[players[i].id] = i;
    }
    return index;
}

}  // namespace

StandingsTable::StandingsTable(const std::vector<roster::Player>& players) {
    rows_.reserve(players.size());
    for (const auto& player : players) {
        StandingRow row;
        row.id = player.id;
        row.name = player.name;
        row.points = player.total_points;
        row.wins = player.wins;
        row.losses = player.losses;
        row.ties = player.ties;
        row.matches = player.wins + player.losses + player.ties;
        row.compensation_points = player.compensation_points;
        rows_.push_back(std::move(row));
    }
}

std::vector<StandingRow> StandingsTable::Sorted(StandingsOrder order) const {
    auto sorted = rows_;
    if (order == StandingsOrder::kPoints) {
        std::sort(sorted.begin(), sorted.end(), [](const auto& a, const auto& b) {
            if (a.points != b.points) {
                return a.points > b.points;
            }
            if (a.wins != b.wins) {
                return a.wins > b.wins;
            }
            if (a.losses != b.losses) {
                return a.losses < b.losses;
            }
            if (a.ties != b.ties) {
                return a.ties > b.ties;
            }
            return a.name < b.name;
        });
    } else {
        std::sort(sorted.begin(), sorted.end(), [](const auto& a, const auto& b) {
            if (a.wins != b.wins) {
                return a.wins > b.wins;
            }
            if (a.points != b.points) {
                return a.points > b.points;
            }
            return a.name < b.name;
        });
    }
    int rank = 1;
    for (auto& row : sorted) {
        row.rank = rank++;
    }
    return sorted;
}

void RebuildStatsFromRounds(std::vector<roster::Player>& players,
                            const std::vector<tournament::Round>& rounds) {
    for (auto& player : players) {
        player.total_points = 0;
        player.wins = 0;
        player.losses = 0;
        player.ties = 0;
        player.play_count = 0;
        player.sit_count = 0;
        player.compensation_points = 0;
    }
    const auto index = IndexById(players);

    auto apply_team = [&](const std::array<std::string, 2>& team, int own, int other) {
        for (const auto& id : team) {
            const auto it = index.find(id);
            if (it == index.end()) {
                continue;
            }
            auto& player = players[it->second];
            player.total_points += own;
            player.play_count += 1;
            if (own > other) {
                player.wins += 1;
            } else if (own < other) {
                player.losses += 1;
            } else {
                player.ties += 1;
            }
        }
    };

    for (const auto& round : rounds) {
        for (const auto& match : round.matches) {
            if (!match.has_scores()) {
                continue;
            }
            apply_team(match.team1, *match.team1_score, *match.team2_score);
            apply_team(match.team2, *match.team2_score, *match.team1_score);
        }
        for (const auto& id : round.sitting_players) {
            const auto it = index.find(id);
            if (it != index.end()) {
                players[it->second].sit_count += 1;
            }
        }
    }
}

void ApplyCompensation(std::vector<roster::Player>& players, int points_per_match) {
    if (points_per_match <= 0 || players.empty()) {
        return;
    }
    const int compensation = points_per_match / 2;
    int max_played = 0;
    for (const auto& player : players) {
        max_played = std::max(max_played, player.play_count);
    }
    for (auto& player : players) {
        if (player.play_count < max_played) {
            player.total_points += compensation;
            player.compensation_points = compensation;
        } else {
            player.compensation_points = 0;
        }
    }
}

}  // namespace courtplan::core::stats
