#include "courtplan/core/tournament/OpponentRotationStrategy.h"

#include <algorithm>
#include <limits>

namespace courtplan::core::tournament {

namespace {

int MeetingCost(const roster::PairHistory& history, int candidate, const std::vector<int>& group) {
    int cost = 0;
    for (int member : group) {
        cost += history.opponent_count(candidate, member) + history.partner_count(candidate, member);
    }
    return cost;
}

bool Contains(const std::vector<int>& group, int index) {
    return std::find(group.begin(), group.end(), index) != group.end();
}

}  // namespace

GroupingResult OpponentRotationStrategy::BuildMatches(const GroupingContext& context) {
    GroupingResult result;
    const Admission anyone = [](const std::vector<int>&, int) { return true; };

    std::vector<int> remaining = context.pool;
    for (int match = 0; match < context.match_count && remaining.size() >= 4; ++match) {
        const auto group = PickGroup(context, remaining, anyone);
        for (int member : group) {
            remaining.erase(std::find(remaining.begin(), remaining.end(), member));
        }
        const std::array<int, 4> members = {{group[0], group[1], group[2], group[3]}};
        result.pairings.push_back(ChooseSplit(context, SplitCandidates(members)));
    }
    return result;
}

std::vector<int> OpponentRotationStrategy::PickGroup(const GroupingContext& context,
                                                     const std::vector<int>& remaining,
                                                     const Admission& admit) const {
    std::vector<int> order = remaining;
    if (context.rng != nullptr) {
        std::shuffle(order.begin(), order.end(), *context.rng);
    }

    std::vector<int> group;
    group.reserve(4);
    for (int candidate : order) {
        if (admit(group, candidate)) {
            group.push_back(candidate);
            break;
        }
    }

    while (!group.empty() && group.size() < 4) {
        int best = -1;
        int best_cost = std::numeric_limits<int>::max();
        for (int candidate : order) {
            if (Contains(group, candidate) || !admit(group, candidate)) {
                continue;
            }
            const int cost = MeetingCost(*context.history, candidate, group);
            if (cost < best_cost) {
                best_cost = cost;
                best = candidate;
            }
        }
        if (best < 0) {
            break;
        }
        group.push_back(best);
    }
    return group;
}

TeamPairing OpponentRotationStrategy::ChooseSplit(const GroupingContext& context,
                                                  const std::vector<TeamPairing>& candidates) const {
    TeamPairing best = candidates.front();
    int best_opponents = std::numeric_limits<int>::max();
    int best_partners = std::numeric_limits<int>::max();
    for (const auto& candidate : candidates) {
        const int opponents = OpponentCountSum(context, candidate);
        const int partners = PartnerCountSum(context, candidate);
        if (opponents < best_opponents || (opponents == best_opponents && partners < best_partners)) {
            best = candidate;
            best_opponents = opponents;
            best_partners = partners;
        }
    }
    return best;
}

}  // namespace courtplan::core::tournament
