#pragma once

#include <optional>
#include <set>
#include <string>

namespace courtplan::core::roster {

enum class PlayerStatus {
    kActive,
    kLate,
    kNoShow,
    kDeparted,
    kInactive,
};

enum class Gender {
    kUnspecified,
    kMale,
    kFemale,
};

struct Player {
    std::string id;
    std::string name;
    double rating = 5.0;

    int play_count = 0;
    int sit_count = 0;
    int consecutive_plays = 0;
    int consecutive_sits = 0;

    int total_points = 0;
    int wins = 0;
    int losses = 0;
    int ties = 0;

    // Advisory only. The engine schedules every player it is given.
    PlayerStatus status = PlayerStatus::kActive;
    Gender gender = Gender::kUnspecified;
    std::optional<std::string> partner_id;
    std::set<int> skip_rounds;
    int compensation_points = 0;

    bool SkipsRound(int round_number) const { return skip_rounds.count(round_number) > 0; }
    int matches_recorded() const { return wins + losses + ties; }
};

const char* ToString(PlayerStatus status);
const char* ToString(Gender gender);
bool ParsePlayerStatus(const std::string& value, PlayerStatus& status);
bool ParseGender(const std::string& value, Gender& gender);

}  // namespace courtplan::core::roster
