#include "courtplan/core/roster/PairHistory.h"

#include <algorithm>

namespace courtplan::core::roster {

namespace {

int Lookup(const std::unordered_map<long long, int>& counts, long long key) {
    const auto it = counts.find(key);
    return it == counts.end() ? 0 : it->second;
}

}  // namespace

long long PairHistory::PairKey(int a, int b) {
    const int low = std::min(a, b);
    const int high = std::max(a, b);
    return (static_cast<long long>(low) << 32) | static_cast<unsigned int>(high);
}

int PairHistory::partner_count(int a, int b) const {
    return Lookup(partners_, PairKey(a, b));
}

int PairHistory::opponent_count(int a, int b) const {
    return Lookup(opponents_, PairKey(a, b));
}

int PairHistory::total_opponents(int player) const {
    const auto it = opponent_totals_.find(player);
    return it == opponent_totals_.end() ? 0 : it->second;
}

void PairHistory::AddPartners(int a, int b) {
    if (a == b) {
        return;
    }
    partners_[PairKey(a, b)] += 1;
}

void PairHistory::AddOpponents(int a, int b) {
    if (a == b) {
        return;
    }
    opponents_[PairKey(a, b)] += 1;
    opponent_totals_[a] += 1;
    opponent_totals_[b] += 1;
}

bool PairHistory::RecordMatch(const std::string& match_key,
                              const std::array<int, 2>& team1,
                              const std::array<int, 2>& team2) {
    if (!recorded_matches_.insert(match_key).second) {
        return false;
    }
    AddPartners(team1[0], team1[1]);
    AddPartners(team2[0], team2[1]);
    for (int a : team1) {
        for (int b : team2) {
            AddOpponents(a, b);
        }
    }
    return true;
}

bool PairHistory::HasRecorded(const std::string& match_key) const {
    return recorded_matches_.count(match_key) > 0;
}

void PairHistory::Clear() {
    partners_.clear();
    opponents_.clear();
    opponent_totals_.clear();
    recorded_matches_.clear();
}

}  // namespace courtplan::core::roster
