#pragma once

#include <array>
#include <string>
#include <unordered_map>
#include <unordered_set>

namespace courtplan::core::roster {

// Symmetric partner/opponent counters over dense roster indices.
class PairHistory {
public:
    static long long PairKey(int a, int b);

    int partner_count(int a, int b) const;
    int opponent_count(int a, int b) const;
    int total_opponents(int player) const;

    void AddPartners(int a, int b);
    void AddOpponents(int a, int b);

    // Counts one match's two partnerships and four oppositions. A match is
    // counted at most once per key; returns false when the key was seen before.
    bool RecordMatch(const std::string& match_key,
                     const std::array<int, 2>& team1,
                     const std::array<int, 2>& team2);
    bool HasRecorded(const std::string& match_key) const;

    void Clear();

private:
    std::unordered_map<long long, int> partners_;
    std::unordered_map<long long, int> opponents_;
    std::unordered_map<int, int> opponent_totals_;
    std::unordered_set<std::string> recorded_matches_;
};

}  // namespace courtplan::core::roster
