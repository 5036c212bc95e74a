#pragma once

#include "courtplan/core/tournament/GroupingStrategy.h"

#include <memory>

namespace courtplan::core::tournament {

// Picks the grouping composition per match for the configured matchup
// preference and falls back to ungendered grouping when the pool cannot
// support it.
class GenderModeResolver {
public:
    // Relative draw weights for randomized_modes.
    static constexpr int kMixedWeight = 70;
    static constexpr int kMaleOnlyWeight = 15;
    static constexpr int kFemaleOnlyWeight = 15;

    GenderModeResolver(TournamentFormat format, MatchupPreference preference);

    GroupingResult Resolve(const GroupingContext& context);

    const IGroupingStrategy& strategy() const { return *strategy_; }
    bool uses_partner_units() const { return strategy_->uses_partner_units(); }
    MatchupPreference effective_preference() const { return preference_; }

private:
    GroupingResult ResolveRandomized(const GroupingContext& context);

    MatchupPreference preference_;
    std::unique_ptr<IGroupingStrategy> strategy_;
};

}  // namespace courtplan::core::tournament
