#include "courtplan/core/tournament/TournamentTypes.h"

#include <algorithm>
#include <sstream>

namespace courtplan::core::tournament {

std::string MatchKey(const Match& match) {
    std::array<std::string, 4> ids = {match.team1[0], match.team1[1], match.team2[0], match.team2[1]};
    std::sort(ids.begin(), ids.end());
    std::ostringstream out;
    out << "r" << match.round_number << "_c" << match.court;
    for (const auto& id : ids) {
        out << "_" << id;
    }
    return out.str();
}

const char* ToString(TournamentFormat format) {
    switch (format) {
        case TournamentFormat::kMexicano:
            return "mexicano";
        case TournamentFormat::kAmericano:
            return "americano";
        case TournamentFormat::kFixedPartner:
            return "fixed_partner";
        case TournamentFormat::kMixedMexicano:
            return "mixed_mexicano";
    }
    return "mexicano";
}

const char* ToString(MatchupPreference preference) {
    switch (preference) {
        case MatchupPreference::kAny:
            return "any";
        case MatchupPreference::kMixedOnly:
            return "mixed_only";
        case MatchupPreference::kRandomizedModes:
            return "randomized_modes";
    }
    return "any";
}

const char* ToString(MatchComposition composition) {
    switch (composition) {
        case MatchComposition::kUnrestricted:
            return "unrestricted";
        case MatchComposition::kMixed:
            return "mixed";
        case MatchComposition::kMaleOnly:
            return "male_only";
        case MatchComposition::kFemaleOnly:
            return "female_only";
    }
    return "unrestricted";
}

const char* ToString(DegradationReason reason) {
    switch (reason) {
        case DegradationReason::kInsufficientPlayers:
            return "insufficient_players";
        case DegradationReason::kFixedPartnerFallback:
            return "fixed_partner_fallback";
        case DegradationReason::kMixedFallback:
            return "mixed_fallback";
        case DegradationReason::kCompositionFallback:
            return "composition_fallback";
    }
    return "insufficient_players";
}

bool ParseTournamentFormat(const std::string& value, TournamentFormat& format) {
    if (value == "mexicano") {
        format = TournamentFormat::kMexicano;
    } else if (value == "americano") {
        format = TournamentFormat::kAmericano;
    } else if (value == "fixed_partner") {
        format = TournamentFormat::kFixedPartner;
    } else if (value == "mixed_mexicano") {
        format = TournamentFormat::kMixedMexicano;
    } else {
        return false;
    }
    return true;
}

bool ParseMatchupPreference(const std::string& value, MatchupPreference& preference) {
    if (value == "any") {
        preference = MatchupPreference::kAny;
    } else if (value == "mixed_only") {
        preference = MatchupPreference::kMixedOnly;
    } else if (value == "randomized_modes") {
        preference = MatchupPreference::kRandomizedModes;
    } else {
        return false;
    }
    return true;
}

bool ParseMatchComposition(const std::string& value, MatchComposition& composition) {
    if (value == "unrestricted") {
        composition = MatchComposition::kUnrestricted;
    } else if (value == "mixed") {
        composition = MatchComposition::kMixed;
    } else if (value == "male_only") {
        composition = MatchComposition::kMaleOnly;
    } else if (value == "female_only") {
        composition = MatchComposition::kFemaleOnly;
    } else {
        return false;
    }
    return true;
}

bool ParseDegradationReason(const std::string& value, DegradationReason& reason) {
    if (value == "insufficient_players") {
        reason = DegradationReason::kInsufficientPlayers;
    } else if (value == "fixed_partner_fallback") {
        reason = DegradationReason::kFixedPartnerFallback;
    } else if (value == "mixed_fallback") {
        reason = DegradationReason::kMixedFallback;
    } else if (value == "composition_fallback") {
        reason = DegradationReason::kCompositionFallback;
    } else {
        return false;
    }
    return true;
}

}  // namespace courtplan::core::tournament
