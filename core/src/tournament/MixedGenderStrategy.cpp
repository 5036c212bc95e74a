#include "courtplan/core/tournament/MixedGenderStrategy.h"

#include "courtplan/core/tournament/SkillClusterStrategy.h"

#include <algorithm>
#include <sstream>
#include <stdexcept>

namespace courtplan::core::tournament {

namespace {

int GenderOrder(roster::Gender gender) {
    switch (gender) {
        case roster::Gender::kMale:
            return 0;
        case roster::Gender::kUnspecified:
            return 1;
        case roster::Gender::kFemale:
            return 2;
    }
    return 1;
}

// Best rating first; for mixed matches men, then wildcards, then women, so the
// first two fill the male side.
std::array<int, 4> ArrangeGroup(const roster::Roster& roster,
                                std::vector<int> group,
                                MatchComposition composition) {
    std::stable_sort(group.begin(), group.end(), [&roster](int a, int b) {
        return roster.player(a).rating > roster.player(b).rating;
    });
    if (composition == MatchComposition::kMixed) {
        std::stable_sort(group.begin(), group.end(), [&roster](int a, int b) {
            return GenderOrder(roster.player(a).gender) < GenderOrder(roster.player(b).gender);
        });
    }
    return {{group[0], group[1], group[2], group[3]}};
}

bool CanCompleteSingle(int same, int other, int rest_same, int rest_wildcards, int missing) {
    if (other > 0) {
        return false;
    }
    const int needed = same == 0 ? 1 : 0;
    return needed <= rest_same && needed <= missing && rest_same + rest_wildcards >= missing;
}

}  // namespace

GenderCount CountGenders(const roster::Roster& roster, const std::vector<int>& players) {
    GenderCount count;
    for (int index : players) {
        switch (roster.player(index).gender) {
            case roster::Gender::kMale:
                ++count.males;
                break;
            case roster::Gender::kFemale:
                ++count.females;
                break;
            case roster::Gender::kUnspecified:
                ++count.wildcards;
                break;
        }
    }
    return count;
}

bool CanComplete(const GenderCount& group, const GenderCount& rest, MatchComposition composition) {
    const int missing = 4 - group.size();
    if (missing < 0 || rest.size() < missing) {
        return false;
    }
    switch (composition) {
        case MatchComposition::kMixed: {
            if (group.males > 2 || group.females > 2) {
                return false;
            }
            const int need_males = group.males == 0 ? 1 : 0;
            const int need_females = group.females == 0 ? 1 : 0;
            const int max_males = std::min(rest.males, 2 - group.males);
            const int max_females = std::min(rest.females, 2 - group.females);
            return need_males <= max_males && need_females <= max_females &&
                   need_males + need_females <= missing &&
                   max_males + max_females + rest.wildcards >= missing;
        }
        case MatchComposition::kMaleOnly:
            return CanCompleteSingle(group.males, group.females, rest.males, rest.wildcards, missing);
        case MatchComposition::kFemaleOnly:
            return CanCompleteSingle(group.females, group.males, rest.females, rest.wildcards, missing);
        case MatchComposition::kUnrestricted:
            return true;
    }
    return false;
}

bool CanForm(const GenderCount& pool, MatchComposition composition) {
    return CanComplete(GenderCount{}, pool, composition);
}

TeamPairing TakeComposedMatch(const GroupingContext& context,
                              const IGroupingStrategy& strategy,
                              std::vector<int>& remaining,
                              MatchComposition composition) {
    const auto& roster = *context.roster;
    const GenderCount available = CountGenders(roster, remaining);
    const auto admit = [&roster, &available, composition](const std::vector<int>& group, int candidate) {
        auto grown = group;
        grown.push_back(candidate);
        const GenderCount taken = CountGenders(roster, grown);
        GenderCount rest;
        rest.males = available.males - taken.males;
        rest.females = available.females - taken.females;
        rest.wildcards = available.wildcards - taken.wildcards;
        return CanComplete(taken, rest, composition);
    };

    const auto group = strategy.PickGroup(context, remaining, admit);
    if (group.size() != 4) {
        throw std::logic_error("no " + std::string(ToString(composition)) + " group left in the pool");
    }
    for (int member : group) {
        remaining.erase(std::find(remaining.begin(), remaining.end(), member));
    }

    const auto arranged = ArrangeGroup(roster, group, composition);
    const auto candidates = composition == MatchComposition::kMixed ? MixedSplitCandidates(arranged)
                                                                    : SplitCandidates(arranged);
    auto pairing = strategy.ChooseSplit(context, candidates);
    pairing.composition = composition;
    return pairing;
}

std::vector<TeamPairing> MixedSplitCandidates(const std::array<int, 4>& group) {
    std::vector<TeamPairing> candidates(2);
    candidates[0].team1 = {{group[0], group[3]}};
    candidates[0].team2 = {{group[1], group[2]}};
    candidates[1].team1 = {{group[0], group[2]}};
    candidates[1].team2 = {{group[1], group[3]}};
    for (auto& candidate : candidates) {
        candidate.composition = MatchComposition::kMixed;
    }
    return candidates;
}

MixedGenderStrategy::MixedGenderStrategy(std::unique_ptr<IGroupingStrategy> base)
    : base_(std::move(base)) {
    if (!base_) {
        base_ = std::make_unique<SkillClusterStrategy>();
    }
    name_ = std::string("mixed_") + base_->name();
}

GroupingResult MixedGenderStrategy::BuildMatches(const GroupingContext& context) {
    GroupingResult result;
    const auto& roster = *context.roster;
    auto remaining = RankByRating(context, context.pool);

    while (static_cast<int>(result.pairings.size()) < context.match_count &&
           CanForm(CountGenders(roster, remaining), MatchComposition::kMixed)) {
        result.pairings.push_back(TakeComposedMatch(context, *base_, remaining, MatchComposition::kMixed));
    }

    const int mixed_matches = static_cast<int>(result.pairings.size());
    if (mixed_matches < context.match_count && remaining.size() >= 4) {
        GroupingContext rest = context;
        rest.pool = remaining;
        rest.match_count = context.match_count - mixed_matches;
        auto fallback = base_->BuildMatches(rest);
        std::ostringstream detail;
        detail << rest.match_count << " of " << context.match_count
               << " match(es) could not be mixed and were grouped by " << base_->name();
        result.degradations.push_back({DegradationReason::kMixedFallback, detail.str()});
        result.pairings.insert(result.pairings.end(), fallback.pairings.begin(), fallback.pairings.end());
        result.degradations.insert(result.degradations.end(),
                                   fallback.degradations.begin(),
                                   fallback.degradations.end());
    }

    SortByStrength(roster, result.pairings);
    return result;
}

}  // namespace courtplan::core::tournament
