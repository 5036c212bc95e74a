#include "courtplan/core/stats/RatingUpdater.h"

#include <array>
#include <cmath>
#include <unordered_set>

namespace courtplan::core::stats {

namespace {

bool ResolveTeam(const roster::Roster& roster,
                 const std::array<std::string, 2>& ids,
                 std::array<int, 2>& out,
                 std::string* error) {
    for (size_t i = 0; i < ids.size(); ++i) {
        out[i] = roster.IndexOf(ids[i]);
        if (out[i] < 0) {
            if (error) {
                *error = "Unknown player id in match: " + ids[i];
            }
            return false;
        }
    }
    return true;
}

double Average(const roster::Roster& roster, const std::array<int, 2>& team) {
    return (roster.player(team[0]).rating + roster.player(team[1]).rating) / 2.0;
}

void ApplyToTeam(roster::Roster& roster,
                 const std::array<int, 2>& team,
                 int own_score,
                 double actual,
                 double delta) {
    for (int index : team) {
        auto& player = roster.mutable_player(index);
        player.total_points += own_score;
        if (actual > 0.5) {
            player.wins += 1;
        } else if (actual < 0.5) {
            player.losses += 1;
        } else {
            player.ties += 1;
        }
        player.rating += delta;
    }
}

}  // namespace

RatingUpdater::RatingUpdater(double k_factor) : k_factor_(k_factor > 0.0 ? k_factor : kDefaultKFactor) {}

double RatingUpdater::ExpectedScore(double own_rating, double opponent_rating) {
    return 1.0 / (1.0 + std::pow(10.0, (opponent_rating - own_rating) / kRatingScale));
}

bool RatingUpdater::Apply(const tournament::Match& match,
                          roster::Roster& roster,
                          roster::PairHistory& history,
                          std::string* error) {
    if (!match.has_scores()) {
        if (error) {
            *error = "Match on court " + std::to_string(match.court) + " has no score";
        }
        return false;
    }

    std::array<int, 2> team1{};
    std::array<int, 2> team2{};
    if (!ResolveTeam(roster, match.team1, team1, error) || !ResolveTeam(roster, match.team2, team2, error)) {
        return false;
    }
    const std::unordered_set<int> distinct = {team1[0], team1[1], team2[0], team2[1]};
    if (distinct.size() != 4) {
        if (error) {
            *error = "Match on court " + std::to_string(match.court) + " does not have four distinct players";
        }
        return false;
    }

    const std::string key = tournament::MatchKey(match);
    if (recorded_.count(key) > 0) {
        if (error) {
            *error = "Result already recorded for " + key;
        }
        return false;
    }

    const int score1 = *match.team1_score;
    const int score2 = *match.team2_score;
    const double actual1 = score1 > score2 ? 1.0 : (score1 < score2 ? 0.0 : 0.5);
    const double actual2 = 1.0 - actual1;

    const double average1 = Average(roster, team1);
    const double average2 = Average(roster, team2);
    const double delta1 = k_factor_ * (actual1 - ExpectedScore(average1, average2));
    const double delta2 = k_factor_ * (actual2 - ExpectedScore(average2, average1));

    ApplyToTeam(roster, team1, score1, actual1, delta1);
    ApplyToTeam(roster, team2, score2, actual2, delta2);

    history.RecordMatch(key, team1, team2);
    recorded_.insert(key);
    return true;
}

void RatingUpdater::MarkRecorded(const tournament::Match& match) {
    recorded_.insert(tournament::MatchKey(match));
}

bool RatingUpdater::IsRecorded(const tournament::Match& match) const {
    return recorded_.count(tournament::MatchKey(match)) > 0;
}

}  // namespace courtplan::core::stats
