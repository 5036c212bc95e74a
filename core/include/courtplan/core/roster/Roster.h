#pragma once

#include "courtplan/core/roster/Player.h"

#include <string>
#include <unordered_map>
#include <utility>
#include <vector>

namespace courtplan::core::roster {

// Pool members whose partner_id references each other, plus everyone left over.
struct PartnerUnits {
    std::vector<std::pair<int, int>> pairs;
    std::vector<int> singles;
};

class Roster {
public:
    // Throws ConfigurationError on empty or duplicate ids.
    explicit Roster(std::vector<Player> players);

    int size() const { return static_cast<int>(players_.size()); }
    const Player& player(int index) const { return players_[static_cast<size_t>(index)]; }
    Player& mutable_player(int index) { return players_[static_cast<size_t>(index)]; }
    const std::vector<Player>& players() const { return players_; }

    int IndexOf(const std::string& id) const;
    const Player* Find(const std::string& id) const;
    std::vector<int> AllIndices() const;

private:
    std::vector<Player> players_;
    std::unordered_map<std::string, int> index_by_id_;
};

PartnerUnits FindPartnerUnits(const Roster& roster, const std::vector<int>& pool);

}  // namespace courtplan::core::roster
