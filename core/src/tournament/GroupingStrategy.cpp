#include "courtplan/core/tournament/GroupingStrategy.h"

#include "courtplan/core/tournament/FixedPartnerStrategy.h"
#include "courtplan/core/tournament/MixedGenderStrategy.h"
#include "courtplan/core/tournament/OpponentRotationStrategy.h"
#include "courtplan/core/tournament/SkillClusterStrategy.h"

#include <algorithm>
#include <cmath>

namespace courtplan::core::tournament {

namespace {

constexpr double kRatingEpsilon = 1e-9;

bool WerePartners(const GroupingContext& context, int a, int b) {
    if (context.previous_partners == nullptr) {
        return false;
    }
    const auto it = context.previous_partners->find(a);
    return it != context.previous_partners->end() && it->second == b;
}

}  // namespace

std::vector<int> IGroupingStrategy::PickGroup(const GroupingContext& /*context*/,
                                              const std::vector<int>& remaining,
                                              const Admission& admit) const {
    std::vector<int> group;
    group.reserve(4);
    for (int candidate : remaining) {
        if (group.size() == 4) {
            break;
        }
        if (admit(group, candidate)) {
            group.push_back(candidate);
        }
    }
    return group;
}

TeamPairing IGroupingStrategy::ChooseSplit(const GroupingContext& context,
                                           const std::vector<TeamPairing>& candidates) const {
    return ChooseBalancedSplit(context, candidates);
}

std::unique_ptr<IGroupingStrategy> CreateGroupingStrategy(TournamentFormat format) {
    switch (format) {
        case TournamentFormat::kAmericano:
            return std::make_unique<OpponentRotationStrategy>();
        case TournamentFormat::kFixedPartner:
            return std::make_unique<FixedPartnerStrategy>();
        case TournamentFormat::kMixedMexicano:
            return std::make_unique<MixedGenderStrategy>(std::make_unique<SkillClusterStrategy>());
        case TournamentFormat::kMexicano:
            break;
    }
    return std::make_unique<SkillClusterStrategy>();
}

std::vector<int> RankByRating(const GroupingContext& context, std::vector<int> players) {
    if (context.rng != nullptr) {
        std::shuffle(players.begin(), players.end(), *context.rng);
    }
    const auto& roster = *context.roster;
    std::stable_sort(players.begin(), players.end(), [&roster](int a, int b) {
        return roster.player(a).rating > roster.player(b).rating;
    });
    return players;
}

double TeamAverage(const roster::Roster& roster, const std::array<int, 2>& team) {
    return (roster.player(team[0]).rating + roster.player(team[1]).rating) / 2.0;
}

double RatingGap(const roster::Roster& roster, const TeamPairing& pairing) {
    return std::abs(TeamAverage(roster, pairing.team1) - TeamAverage(roster, pairing.team2));
}

double PairingAverage(const roster::Roster& roster, const TeamPairing& pairing) {
    return (TeamAverage(roster, pairing.team1) + TeamAverage(roster, pairing.team2)) / 2.0;
}

int RepeatedPartnerships(const GroupingContext& context, const TeamPairing& pairing) {
    int repeats = 0;
    for (const auto* team : {&pairing.team1, &pairing.team2}) {
        const int a = (*team)[0];
        const int b = (*team)[1];
        if (WerePartners(context, a, b) || WerePartners(context, b, a)) {
            ++repeats;
        }
    }
    return repeats;
}

int PartnerCountSum(const GroupingContext& context, const TeamPairing& pairing) {
    if (context.history == nullptr) {
        return 0;
    }
    return context.history->partner_count(pairing.team1[0], pairing.team1[1]) +
           context.history->partner_count(pairing.team2[0], pairing.team2[1]);
}

int OpponentCountSum(const GroupingContext& context, const TeamPairing& pairing) {
    if (context.history == nullptr) {
        return 0;
    }
    int sum = 0;
    for (int a : pairing.team1) {
        for (int b : pairing.team2) {
            sum += context.history->opponent_count(a, b);
        }
    }
    return sum;
}

std::vector<TeamPairing> SplitCandidates(const std::array<int, 4>& ranked) {
    std::vector<TeamPairing> candidates(3);
    candidates[0].team1 = {{ranked[0], ranked[3]}};
    candidates[0].team2 = {{ranked[1], ranked[2]}};
    candidates[1].team1 = {{ranked[0], ranked[2]}};
    candidates[1].team2 = {{ranked[1], ranked[3]}};
    candidates[2].team1 = {{ranked[0], ranked[1]}};
    candidates[2].team2 = {{ranked[2], ranked[3]}};
    return candidates;
}

TeamPairing ChooseBalancedSplit(const GroupingContext& context,
                                const std::vector<TeamPairing>& candidates) {
    TeamPairing best;
    bool have_best = false;
    int best_repeats = 0;
    double best_gap = 0.0;
    int best_partners = 0;

    for (const auto& candidate : candidates) {
        const int repeats = RepeatedPartnerships(context, candidate);
        const double gap = RatingGap(*context.roster, candidate);
        const int partners = PartnerCountSum(context, candidate);

        bool better = !have_best;
        if (!better && repeats != best_repeats) {
            better = repeats < best_repeats;
        } else if (!better && std::abs(gap - best_gap) > kRatingEpsilon) {
            better = gap < best_gap;
        } else if (!better) {
            better = partners < best_partners;
        }

        if (better) {
            best = candidate;
            have_best = true;
            best_repeats = repeats;
            best_gap = gap;
            best_partners = partners;
        }
    }
    return best;
}

void SortByStrength(const roster::Roster& roster, std::vector<TeamPairing>& pairings) {
    std::stable_sort(pairings.begin(), pairings.end(), [&roster](const auto& a, const auto& b) {
        return PairingAverage(roster, a) > PairingAverage(roster, b) + kRatingEpsilon;
    });
}

}  // namespace courtplan::core::tournament
