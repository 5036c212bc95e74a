#pragma once

#include "courtplan/core/tournament/GroupingStrategy.h"

namespace courtplan::core::tournament {

// Mexicano: the four best-rated players share court 1, the next four court 2, ...
class SkillClusterStrategy final : public IGroupingStrategy {
public:
    const char* name() const override { return "mexicano"; }
    GroupingResult BuildMatches(const GroupingContext& context) override;

    static std::vector<TeamPairing> Cluster(const GroupingContext& context,
                                            const std::vector<int>& players,
                                            int match_count);
};

}  // namespace courtplan::core::tournament
