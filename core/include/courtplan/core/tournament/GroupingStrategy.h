#pragma once

#include "courtplan/core/roster/PairHistory.h"
#include "courtplan/core/roster/Roster.h"
#include "courtplan/core/tournament/TournamentTypes.h"

#include <array>
#include <functional>
#include <memory>
#include <random>
#include <unordered_map>
#include <vector>

namespace courtplan::core::tournament {

struct GroupingContext {
    const roster::Roster* roster = nullptr;
    const roster::PairHistory* history = nullptr;
    // Roster index -> partner in the most recent round that player played.
    const std::unordered_map<int, int>* previous_partners = nullptr;
    std::mt19937* rng = nullptr;
    std::vector<int> pool;
    int match_count = 0;
};

struct GroupingResult {
    std::vector<TeamPairing> pairings;
    std::vector<Degradation> degradations;
};

// Turns a playing pool of exactly 4 * match_count players into 2-vs-2 pairings.
class IGroupingStrategy {
public:
    // Whether `candidate` may join the partially built `group`.
    using Admission = std::function<bool(const std::vector<int>& group, int candidate)>;

    virtual ~IGroupingStrategy() = default;
    virtual const char* name() const = 0;
    // Whether sitting should be decided per partner pair instead of per player.
    virtual bool uses_partner_units() const { return false; }
    virtual GroupingResult BuildMatches(const GroupingContext& context) = 0;

    // Picks the four players of one match from `remaining` (rank order),
    // skipping players `admit` rejects. Gendered compositions build their
    // matches through this and ChooseSplit. The default takes the best-ranked
    // admitted players.
    virtual std::vector<int> PickGroup(const GroupingContext& context,
                                       const std::vector<int>& remaining,
                                       const Admission& admit) const;
    // The default is ChooseBalancedSplit.
    virtual TeamPairing ChooseSplit(const GroupingContext& context,
                                    const std::vector<TeamPairing>& candidates) const;
};

std::unique_ptr<IGroupingStrategy> CreateGroupingStrategy(TournamentFormat format);

// Random order among equal ratings, highest rating first.
std::vector<int> RankByRating(const GroupingContext& context, std::vector<int> players);

double TeamAverage(const roster::Roster& roster, const std::array<int, 2>& team);
double RatingGap(const roster::Roster& roster, const TeamPairing& pairing);
double PairingAverage(const roster::Roster& roster, const TeamPairing& pairing);
int RepeatedPartnerships(const GroupingContext& context, const TeamPairing& pairing);
int PartnerCountSum(const GroupingContext& context, const TeamPairing& pairing);
int OpponentCountSum(const GroupingContext& context, const TeamPairing& pairing);

// The three ways to split four players ranked best to worst, highest-with-lowest first.
std::vector<TeamPairing> SplitCandidates(const std::array<int, 4>& ranked);

// Fewest partnerships repeated from the previous round, then smallest rating
// gap, then fewest historical partnerships. Earlier candidates win ties.
TeamPairing ChooseBalancedSplit(const GroupingContext& context,
                                const std::vector<TeamPairing>& candidates);

// Court order: highest combined rating first, keeping relative order on ties.
void SortByStrength(const roster::Roster& roster, std::vector<TeamPairing>& pairings);

}  // namespace courtplan::core::tournament
