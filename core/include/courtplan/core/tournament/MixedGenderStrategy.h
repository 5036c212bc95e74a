#pragma once

#include "courtplan/core/tournament/GroupingStrategy.h"

#include <string>

namespace courtplan::core::tournament {

// Head count by gender. Unspecified players are wildcards that can fill a
// male or a female slot.
struct GenderCount {
    int males = 0;
    int females = 0;
    int wildcards = 0;

    int size() const { return males + females + wildcards; }
};

GenderCount CountGenders(const roster::Roster& roster, const std::vector<int>& players);

// Whether `group` can grow into four players of the composition with players
// from `rest`. A mixed match holds at most two men and two women, a
// single-gender match nobody of the other gender, and every gendered match at
// least one player of each gender its label names.
bool CanComplete(const GenderCount& group, const GenderCount& rest, MatchComposition composition);
bool CanForm(const GenderCount& pool, MatchComposition composition);

// Removes one match of the composition from `remaining`. `strategy` picks the
// players and the split, so the format's grouping rules still apply.
TeamPairing TakeComposedMatch(const GroupingContext& context,
                              const IGroupingStrategy& strategy,
                              std::vector<int>& remaining,
                              MatchComposition composition);

// Splits of {male side, male side, female side, female side} that keep every team mixed.
std::vector<TeamPairing> MixedSplitCandidates(const std::array<int, 4>& group);

// Every team one man and one woman while the pool allows it; the base strategy
// groups within that constraint and takes the rest of the pool unconstrained.
class MixedGenderStrategy final : public IGroupingStrategy {
public:
    explicit MixedGenderStrategy(std::unique_ptr<IGroupingStrategy> base);

    // "mixed_" + the base strategy's name.
    const char* name() const override { return name_.c_str(); }
    GroupingResult BuildMatches(const GroupingContext& context) override;

private:
    std::unique_ptr<IGroupingStrategy> base_;
    std::string name_;
};

}  // namespace courtplan::core::tournament
