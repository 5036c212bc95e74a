#include "courtplan/core/roster/Player.h"

namespace courtplan::core::roster {

const char* ToString(PlayerStatus status) {
    switch (status) {
        case PlayerStatus::kActive:
            return "active";
        case PlayerStatus::kLate:
            return "late";
        case PlayerStatus::kNoShow:
            return "no_show";
        case PlayerStatus::kDeparted:
            return "departed";
        case PlayerStatus::kInactive:
            return "inactive";
    }
    return "active";
}

const char* ToString(Gender gender) {
    switch (gender) {
        case Gender::kMale:
            return "male";
        case Gender::kFemale:
            return "female";
        case Gender::kUnspecified:
            return "unspecified";
    }
    return "unspecified";
}

bool ParsePlayerStatus(const std::string& value, PlayerStatus& status) {
    if (value == "active") {
        status = PlayerStatus::kActive;
    } else if (value == "late") {
        status = PlayerStatus::kLate;
    } else if (value == "no_show") {
        status = PlayerStatus::kNoShow;
    } else if (value == "departed") {
        status = PlayerStatus::kDeparted;
    } else if (value == "inactive") {
        status = PlayerStatus::kInactive;
    } else {
        return false;
    }
    return true;
}

bool ParseGender(const std::string& value, Gender& gender) {
    if (value == "male") {
        gender = Gender::kMale;
    } else if (value == "female") {
        gender = Gender::kFemale;
    } else if (value == "unspecified" || value.empty()) {
        gender = Gender::kUnspecified;
    } else {
        return false;
    }
    return true;
}

}  // namespace courtplan::core::roster
