#pragma once

#include "courtplan/core/tournament/GroupingStrategy.h"

namespace courtplan::core::tournament {

// Americano: builds each group of four from the players who have met each
// other least, then splits it to avoid repeated opponents.
class OpponentRotationStrategy final : public IGroupingStrategy {
public:
    const char* name() const override { return "americano"; }
    GroupingResult BuildMatches(const GroupingContext& context) override;

    // Seeds with a random admitted player, then adds whoever met the group least.
    std::vector<int> PickGroup(const GroupingContext& context,
                               const std::vector<int>& remaining,
                               const Admission& admit) const override;
    // Fewest repeated opponents, then fewest repeated partners.
    TeamPairing ChooseSplit(const GroupingContext& context,
                            const std::vector<TeamPairing>& candidates) const override;
};

}  // namespace courtplan::core::tournament
