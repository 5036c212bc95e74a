#pragma once

#include "courtplan/core/roster/PairHistory.h"
#include "courtplan/core/roster/Roster.h"
#include "courtplan/core/tournament/TournamentTypes.h"

#include <string>
#include <unordered_set>

namespace courtplan::core::stats {

// Folds a scored match into ratings, records and pair history.
class RatingUpdater {
public:
    static constexpr double kDefaultKFactor = 0.5;
    // Rating difference at which the stronger team is expected to win ~91% of the time.
    static constexpr double kRatingScale = 4.0;

    explicit RatingUpdater(double k_factor = kDefaultKFactor);

    static double ExpectedScore(double own_rating, double opponent_rating);

    // Returns false (and leaves everything untouched) when the match has no
    // scores, names unknown or repeated players, or was already recorded.
    bool Apply(const tournament::Match& match,
               roster::Roster& roster,
               roster::PairHistory& history,
               std::string* error);

    // Marks a match as already folded in, e.g. when restoring a saved session.
    void MarkRecorded(const tournament::Match& match);
    bool IsRecorded(const tournament::Match& match) const;

    double k_factor() const { return k_factor_; }

private:
    double k_factor_;
    std::unordered_set<std::string> recorded_;
};

}  // namespace courtplan::core::stats
