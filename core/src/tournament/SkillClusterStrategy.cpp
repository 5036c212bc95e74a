#include "courtplan/core/tournament/SkillClusterStrategy.h"

namespace courtplan::core::tournament {

GroupingResult SkillClusterStrategy::BuildMatches(const GroupingContext& context) {
    GroupingResult result;
    result.pairings = Cluster(context, context.pool, context.match_count);
    return result;
}

std::vector<TeamPairing> SkillClusterStrategy::Cluster(const GroupingContext& context,
                                                       const std::vector<int>& players,
                                                       int match_count) {
    std::vector<TeamPairing> pairings;
    const auto ranked = RankByRating(context, players);
    for (int match = 0; match < match_count; ++match) {
        const size_t offset = static_cast<size_t>(match) * 4;
        if (offset + 4 > ranked.size()) {
            break;
        }
        const std::array<int, 4> group = {
            {ranked[offset], ranked[offset + 1], ranked[offset + 2], ranked[offset + 3]}};
        pairings.push_back(ChooseBalancedSplit(context, SplitCandidates(group)));
    }
    return pairings;
}

}  // namespace courtplan::core::tournament
