#include "courtplan/core/persist/JsonCodec.h"

#include <array>
#include <exception>
#include <optional>
#include <vector>

namespace courtplan::core::persist {

namespace {

using roster::Player;
using tournament::Match;
using tournament::Round;

bool SetError(std::string* error, const std::string& message) {
    if (error) {
        *error = message;
    }
    return false;
}

nlohmann::json OptionalScore(const std::optional<int>& score) {
    if (score) {
        return *score;
    }
    return nullptr;
}

std::optional<int> ReadScore(const nlohmann::json& node, const char* key) {
    if (!node.contains(key) || node.at(key).is_null()) {
        return std::nullopt;
    }
    return node.at(key).get<int>();
}

bool ReadTeam(const nlohmann::json& node, const char* key, std::array<std::string, 2>& team, std::string* error) {
    if (!node.contains(key) || !node.at(key).is_array() || node.at(key).size() != 2) {
        return SetError(error, std::string("Match field '") + key + "' must list two player ids.");
    }
    team[0] = node.at(key).at(0).get<std::string>();
    team[1] = node.at(key).at(1).get<std::string>();
    return true;
}

}  // namespace

nlohmann::json PlayerToJson(const Player& player) {
    nlohmann::json node;
    node["id"] = player.id;
    node["name"] = player.name;
    node["rating"] = player.rating;
    node["play_count"] = player.play_count;
    node["sit_count"] = player.sit_count;
    node["consecutive_plays"] = player.consecutive_plays;
    node["consecutive_sits"] = player.consecutive_sits;
    node["total_points"] = player.total_points;
    node["wins"] = player.wins;
    node["losses"] = player.losses;
    node["ties"] = player.ties;
    node["status"] = roster::ToString(player.status);
    node["gender"] = roster::ToString(player.gender);
    if (player.partner_id) {
        node["partner_id"] = *player.partner_id;
    }
    if (!player.skip_rounds.empty()) {
        node["skip_rounds"] = player.skip_rounds;
    }
    if (player.compensation_points != 0) {
        node["compensation_points"] = player.compensation_points;
    }
    return node;
}

bool ParsePlayer(const nlohmann::json& node, Player& player, std::string* error) {
    if (!node.is_object() || !node.contains("id")) {
        return SetError(error, "Player entry is missing 'id'.");
    }
    try {
        player = Player{};
        player.id = node.at("id").get<std::string>();
        player.name = node.value("name", player.id);
        player.rating = node.value("rating", player.rating);
        player.play_count = node.value("play_count", 0);
        player.sit_count = node.value("sit_count", 0);
        player.consecutive_plays = node.value("consecutive_plays", 0);
        player.consecutive_sits = node.value("consecutive_sits", 0);
        player.total_points = node.value("total_points", 0);
        player.wins = node.value("wins", 0);
        player.losses = node.value("losses", 0);
        player.ties = node.value("ties", 0);
        player.compensation_points = node.value("compensation_points", 0);

        const std::string status = node.value("status", "active");
        if (!roster::ParsePlayerStatus(status, player.status)) {
            return SetError(error, "Unknown status '" + status + "' for player " + player.id);
        }
        const std::string gender = node.value("gender", "unspecified");
        if (!roster::ParseGender(gender, player.gender)) {
            return SetError(error, "Unknown gender '" + gender + "' for player " + player.id);
        }
        if (node.contains("partner_id") && !node.at("partner_id").is_null()) {
            player.partner_id = node.at("partner_id").get<std::string>();
        }
        if (node.contains("skip_rounds")) {
            for (const auto& round : node.at("skip_rounds")) {
                player.skip_rounds.insert(round.get<int>());
            }
        }
    } catch (const std::exception& ex) {
        return SetError(error, std::string("Failed to parse player: ") + ex.what());
    }
    return true;
}

nlohmann::json MatchToJson(const Match& match) {
    return {
        {"round", match.round_number},
        {"court", match.court},
        {"team1", match.team1},
        {"team2", match.team2},
        {"team1_score", OptionalScore(match.team1_score)},
        {"team2_score", OptionalScore(match.team2_score)},
        {"completed", match.completed},
        {"composition", tournament::ToString(match.composition)},
    };
}

bool ParseMatch(const nlohmann::json& node, Match& match, std::string* error) {
    try {
        match = Match{};
        match.round_number = node.value("round", 0);
        match.court = node.value("court", 0);
        if (!ReadTeam(node, "team1", match.team1, error) || !ReadTeam(node, "team2", match.team2, error)) {
            return false;
        }
        match.team1_score = ReadScore(node, "team1_score");
        match.team2_score = ReadScore(node, "team2_score");
        match.completed = node.value("completed", false);
        const std::string composition = node.value("composition", "unrestricted");
        if (!tournament::ParseMatchComposition(composition, match.composition)) {
            return SetError(error, "Unknown match composition: " + composition);
        }
    } catch (const std::exception& ex) {
        return SetError(error, std::string("Failed to parse match: ") + ex.what());
    }
    return true;
}

nlohmann::json RoundToJson(const Round& round) {
    nlohmann::json node;
    node["number"] = round.number;
    node["matches"] = nlohmann::json::array();
    for (const auto& match : round.matches) {
        node["matches"].push_back(MatchToJson(match));
    }
    node["sitting_players"] = round.sitting_players;
    if (!round.degradations.empty()) {
        node["degradations"] = nlohmann::json::array();
        for (const auto& degradation : round.degradations) {
            node["degradations"].push_back({
                {"reason", tournament::ToString(degradation.reason)},
                {"detail", degradation.detail},
            });
        }
    }
    return node;
}

bool ParseRound(const nlohmann::json& node, Round& round, std::string* error) {
    round = Round{};
    try {
        round.number = node.value("number", 0);
        if (node.contains("matches")) {
            for (const auto& match_node : node.at("matches")) {
                Match match;
                if (!ParseMatch(match_node, match, error)) {
                    return false;
                }
                if (match.round_number == 0) {
                    match.round_number = round.number;
                }
                round.matches.push_back(std::move(match));
            }
        }
        if (node.contains("sitting_players")) {
            round.sitting_players = node.at("sitting_players").get<std::vector<std::string>>();
        }
        if (node.contains("degradations")) {
            for (const auto& item : node.at("degradations")) {
                tournament::Degradation degradation;
                const std::string reason = item.value("reason", "");
                if (!tournament::ParseDegradationReason(reason, degradation.reason)) {
                    return SetError(error, "Unknown degradation reason: " + reason);
                }
                degradation.detail = item.value("detail", "");
                round.degradations.push_back(std::move(degradation));
            }
        }
    } catch (const std::exception& ex) {
        return SetError(error, std::string("Failed to parse round: ") + ex.what());
    }
    return true;
}

nlohmann::json EngineConfigToJson(const api::EngineConfig& config) {
    return {
        {"courts", config.courts},
        {"format", tournament::ToString(config.format)},
        {"matchup_preference", tournament::ToString(config.matchup_preference)},
        {"seed", config.seed},
        {"rating_k_factor", config.rating_k_factor},
    };
}

bool ParseEngineConfig(const nlohmann::json& node, api::EngineConfig& config, std::string* error) {
    try {
        config.courts = node.value("courts", config.courts);
        config.seed = node.value("seed", config.seed);
        config.rating_k_factor = node.value("rating_k_factor", config.rating_k_factor);
        const std::string format = node.value("format", tournament::ToString(config.format));
        if (!tournament::ParseTournamentFormat(format, config.format)) {
            return SetError(error, "Unknown tournament format: " + format);
        }
        const std::string preference =
            node.value("matchup_preference", tournament::ToString(config.matchup_preference));
        if (!tournament::ParseMatchupPreference(preference, config.matchup_preference)) {
            return SetError(error, "Unknown matchup preference: " + preference);
        }
    } catch (const std::exception& ex) {
        return SetError(error, std::string("Failed to parse engine config: ") + ex.what());
    }
    return true;
}

nlohmann::json ScoringToJson(const stats::ScoringConfig& scoring) {
    return {
        {"rule", stats::ToString(scoring.rule)},
        {"target", scoring.target},
    };
}

bool ParseScoring(const nlohmann::json& node, stats::ScoringConfig& scoring, std::string* error) {
    try {
        const std::string rule = node.value("rule", stats::ToString(scoring.rule));
        if (!stats::ParseScoringRule(rule, scoring.rule)) {
            return SetError(error, "Unknown scoring rule: " + rule);
        }
        scoring.target = node.value("target", scoring.target);
    } catch (const std::exception& ex) {
        return SetError(error, std::string("Failed to parse scoring: ") + ex.what());
    }
    if (scoring.target < 1) {
        return SetError(error, "Scoring target must be at least 1.");
    }
    return true;
}

}  // namespace courtplan::core::persist
