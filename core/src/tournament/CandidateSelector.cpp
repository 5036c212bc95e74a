#include "courtplan/core/tournament/CandidateSelector.h"

#include <algorithm>
#include <unordered_set>

namespace courtplan::core::tournament {

namespace {

struct UnitStats {
    double sit_count = 0.0;
    double play_count = 0.0;
    double consecutive_plays = 0.0;
    double consecutive_sits = 0.0;
};

UnitStats Average(const roster::Roster& roster, const std::vector<int>& unit) {
    UnitStats stats;
    for (int index : unit) {
        const auto& player = roster.player(index);
        stats.sit_count += player.sit_count;
        stats.play_count += player.play_count;
        stats.consecutive_plays += player.consecutive_plays;
        stats.consecutive_sits += player.consecutive_sits;
    }
    const double size = static_cast<double>(unit.size());
    stats.sit_count /= size;
    stats.play_count /= size;
    stats.consecutive_plays /= size;
    stats.consecutive_sits /= size;
    return stats;
}

// Who should sit first: fewest sits, then longest playing streak, then most plays.
bool SitsBefore(const UnitStats& a, const UnitStats& b) {
    if (a.sit_count != b.sit_count) {
        return a.sit_count < b.sit_count;
    }
    if (a.consecutive_plays != b.consecutive_plays) {
        return a.consecutive_plays > b.consecutive_plays;
    }
    return a.play_count > b.play_count;
}

// Who should play first: fewest plays, then longest sitting streak, then shortest playing streak.
bool PlaysBefore(const UnitStats& a, const UnitStats& b) {
    if (a.play_count != b.play_count) {
        return a.play_count < b.play_count;
    }
    if (a.consecutive_sits != b.consecutive_sits) {
        return a.consecutive_sits > b.consecutive_sits;
    }
    return a.consecutive_plays < b.consecutive_plays;
}

std::vector<int> Complement(const std::vector<int>& all, const std::vector<int>& subset) {
    const std::unordered_set<int> excluded(subset.begin(), subset.end());
    std::vector<int> rest;
    rest.reserve(all.size());
    for (int index : all) {
        if (excluded.count(index) == 0) {
            rest.push_back(index);
        }
    }
    return rest;
}

}  // namespace

CandidateSelector::CandidateSelector(roster::Roster& roster, std::mt19937& rng)
    : roster_(roster), rng_(rng) {}

std::vector<int> CandidateSelector::EligiblePool(int round_number,
                                                 const std::unordered_set<std::string>& excluded_ids) const {
    std::vector<int> eligible;
    eligible.reserve(static_cast<size_t>(roster_.size()));
    for (int i = 0; i < roster_.size(); ++i) {
        const auto& player = roster_.player(i);
        if (player.SkipsRound(round_number) || excluded_ids.count(player.id) > 0) {
            continue;
        }
        eligible.push_back(i);
    }
    return eligible;
}

Selection CandidateSelector::SelectForRound(int round_number,
                                            int courts,
                                            const std::unordered_set<std::string>& excluded_ids,
                                            bool partner_units) {
    Selection selection;
    selection.round_number = round_number;
    selection.eligible = EligiblePool(round_number, excluded_ids);

    const int eligible_count = static_cast<int>(selection.eligible.size());
    selection.match_count = std::max(0, std::min(courts, eligible_count / kPlayersPerMatch));
    const int sit_count = eligible_count - selection.match_count * kPlayersPerMatch;

    if (selection.match_count == 0) {
        selection.sitting = selection.eligible;
        return selection;
    }

    auto units = BuildUnits(selection.eligible, partner_units);
    std::stable_sort(units.begin(), units.end(), [this](const auto& a, const auto& b) {
        return SitsBefore(Average(roster_, a), Average(roster_, b));
    });
    selection.sitting = PickUnits(std::move(units), sit_count);
    selection.playing = Complement(selection.eligible, selection.sitting);
    return selection;
}

Selection CandidateSelector::SelectForCourt(int round_number,
                                            const std::unordered_set<std::string>& excluded_ids,
                                            bool partner_units) {
    Selection selection;
    selection.round_number = round_number;
    selection.eligible = EligiblePool(round_number, excluded_ids);

    if (static_cast<int>(selection.eligible.size()) < kPlayersPerMatch) {
        selection.sitting = selection.eligible;
        return selection;
    }
    selection.match_count = 1;

    auto units = BuildUnits(selection.eligible, partner_units);
    std::stable_sort(units.begin(), units.end(), [this](const auto& a, const auto& b) {
        return PlaysBefore(Average(roster_, a), Average(roster_, b));
    });
    selection.playing = PickUnits(std::move(units), kPlayersPerMatch);
    selection.sitting = Complement(selection.eligible, selection.playing);
    return selection;
}

void CandidateSelector::CommitRound(const Selection& selection) {
    CommitPlayers(selection.playing);
    for (int index : selection.sitting) {
        auto& player = roster_.mutable_player(index);
        player.sit_count += 1;
        player.consecutive_sits += 1;
        player.consecutive_plays = 0;
    }
}

void CandidateSelector::CommitPlayers(const std::vector<int>& playing) {
    for (int index : playing) {
        auto& player = roster_.mutable_player(index);
        player.play_count += 1;
        player.consecutive_plays += 1;
        player.consecutive_sits = 0;
    }
}

std::vector<std::vector<int>> CandidateSelector::BuildUnits(const std::vector<int>& pool,
                                                            bool partner_units) const {
    std::vector<int> shuffled = pool;
    std::shuffle(shuffled.begin(), shuffled.end(), rng_);

    std::vector<std::vector<int>> units;
    if (!partner_units) {
        units.reserve(shuffled.size());
        for (int index : shuffled) {
            units.push_back({index});
        }
        return units;
    }

    const auto partners = roster::FindPartnerUnits(roster_, shuffled);
    for (const auto& [first, second] : partners.pairs) {
        units.push_back({first, second});
    }
    for (int index : partners.singles) {
        units.push_back({index});
    }
    std::shuffle(units.begin(), units.end(), rng_);
    return units;
}

std::vector<int> CandidateSelector::PickUnits(std::vector<std::vector<int>> ordered_units, int count) const {
    std::vector<int> picked;
    if (count <= 0) {
        return picked;
    }
    std::vector<bool> taken(ordered_units.size(), false);
    int remaining = count;
    for (size_t i = 0; i < ordered_units.size() && remaining > 0; ++i) {
        const int size = static_cast<int>(ordered_units[i].size());
        if (size <= remaining) {
            picked.insert(picked.end(), ordered_units[i].begin(), ordered_units[i].end());
            taken[i] = true;
            remaining -= size;
        }
    }
    // Only pairs are left and an odd number of players is still needed: split one.
    for (size_t i = 0; i < ordered_units.size() && remaining > 0; ++i) {
        if (taken[i]) {
            continue;
        }
        for (int index : ordered_units[i]) {
            if (remaining == 0) {
                break;
            }
            picked.push_back(index);
            --remaining;
        }
    }
    return picked;
}

}  // namespace courtplan::core::tournament
