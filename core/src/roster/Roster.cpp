#include "courtplan/core/roster/Roster.h"

#include "courtplan/core/Errors.h"

#include <unordered_set>

namespace courtplan::core::roster {

Roster::Roster(std::vector<Player> players) : players_(std::move(players)) {
    index_by_id_.reserve(players_.size());
    for (size_t i = 0; i < players_.size(); ++i) {
        const auto& id = players_[i].id;
        if (id.empty()) {
            throw ConfigurationError("Player at position " + std::to_string(i) + " has no id");
        }
        if (!index_by_id_.emplace(id, static_cast<int>(i)).second) {
            throw ConfigurationError("Duplicate player id: " + id);
        }
    }
}

int Roster::IndexOf(const std::string& id) const {
    const auto it = index_by_id_.find(id);
    if (it == index_by_id_.end()) {
        return -1;
    }
    return it->second;
}

const Player* Roster::Find(const std::string& id) const {
    const int index = IndexOf(id);
    if (index < 0) {
        return nullptr;
    }
    return &players_[static_cast<size_t>(index)];
}

std::vector<int> Roster::AllIndices() const {
    std::vector<int> indices;
    indices.reserve(players_.size());
    for (int i = 0; i < size(); ++i) {
        indices.push_back(i);
    }
    return indices;
}

PartnerUnits FindPartnerUnits(const Roster& roster, const std::vector<int>& pool) {
    PartnerUnits units;
    const std::unordered_set<int> in_pool(pool.begin(), pool.end());
    std::unordered_set<int> paired;

    for (int index : pool) {
        if (paired.count(index) > 0) {
            continue;
        }
        const auto& player = roster.player(index);
        int partner = -1;
        if (player.partner_id.has_value() && *player.partner_id != player.id) {
            partner = roster.IndexOf(*player.partner_id);
        }
        if (partner >= 0 && in_pool.count(partner) > 0 && paired.count(partner) == 0) {
            const auto& other = roster.player(partner);
            if (other.partner_id.has_value() && *other.partner_id == player.id) {
                paired.insert(index);
                paired.insert(partner);
                units.pairs.emplace_back(index, partner);
                continue;
            }
        }
        units.singles.push_back(index);
    }

    return units;
}

}  // namespace courtplan::core::roster
