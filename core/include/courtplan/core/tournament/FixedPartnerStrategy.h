#pragma once

#include "courtplan/core/tournament/GroupingStrategy.h"

namespace courtplan::core::tournament {

// Registered partner pairs play as fixed teams; only the opposing team rotates.
// Players without a valid symmetric partnership are grouped by skill instead.
class FixedPartnerStrategy final : public IGroupingStrategy {
public:
    const char* name() const override { return "fixed_partner"; }
    bool uses_partner_units() const override { return true; }
    GroupingResult BuildMatches(const GroupingContext& context) override;
};

}  // namespace courtplan::core::tournament
