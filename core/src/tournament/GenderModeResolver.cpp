#include "courtplan/core/tournament/GenderModeResolver.h"

#include "courtplan/core/tournament/MixedGenderStrategy.h"

#include <sstream>
#include <utility>

namespace courtplan::core::tournament {

GenderModeResolver::GenderModeResolver(TournamentFormat format, MatchupPreference preference)
    : preference_(preference), strategy_(CreateGroupingStrategy(format)) {
    if (format == TournamentFormat::kMixedMexicano) {
        preference_ = MatchupPreference::kMixedOnly;
    } else if (format == TournamentFormat::kFixedPartner) {
        preference_ = MatchupPreference::kAny;
    } else if (preference_ == MatchupPreference::kMixedOnly) {
        strategy_ = std::make_unique<MixedGenderStrategy>(std::move(strategy_));
    }
}

GroupingResult GenderModeResolver::Resolve(const GroupingContext& context) {
    if (context.match_count <= 0) {
        return {};
    }
    if (preference_ == MatchupPreference::kRandomizedModes) {
        return ResolveRandomized(context);
    }
    return strategy_->BuildMatches(context);
}

GroupingResult GenderModeResolver::ResolveRandomized(const GroupingContext& context) {
    GroupingResult result;
    const auto& roster = *context.roster;
    auto remaining = RankByRating(context, context.pool);

    const std::pair<MatchComposition, int> options[] = {
        {MatchComposition::kMixed, kMixedWeight},
        {MatchComposition::kMaleOnly, kMaleOnlyWeight},
        {MatchComposition::kFemaleOnly, kFemaleOnlyWeight},
    };

    int unrestricted = 0;
    for (int match = 0; match < context.match_count && remaining.size() >= 4; ++match) {
        const GenderCount available = CountGenders(roster, remaining);
        std::vector<MatchComposition> feasible;
        std::vector<int> weights;
        for (const auto& [composition, weight] : options) {
            if (CanForm(available, composition)) {
                feasible.push_back(composition);
                weights.push_back(weight);
            }
        }

        MatchComposition composition = MatchComposition::kUnrestricted;
        if (feasible.size() == 1 || context.rng == nullptr) {
            if (!feasible.empty()) {
                composition = feasible.front();
            }
        } else if (!feasible.empty()) {
            std::discrete_distribution<size_t> draw(weights.begin(), weights.end());
            composition = feasible[draw(*context.rng)];
        }
        if (composition == MatchComposition::kUnrestricted) {
            ++unrestricted;
        }

        result.pairings.push_back(TakeComposedMatch(context, *strategy_, remaining, composition));
    }

    if (unrestricted > 0) {
        std::ostringstream detail;
        detail << unrestricted << " match(es) had no feasible gender composition and were grouped by "
               << strategy_->name();
        result.degradations.push_back({DegradationReason::kCompositionFallback, detail.str()});
    }

    SortByStrength(roster, result.pairings);
    return result;
}

}  // namespace courtplan::core::tournament
