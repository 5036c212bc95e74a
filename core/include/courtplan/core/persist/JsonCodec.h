#pragma once

#include "courtplan/core/api/EngineConfig.h"
#include "courtplan/core/roster/Player.h"
#include "courtplan/core/tournament/TournamentTypes.h"

#include <nlohmann/json.hpp>

#include <string>

namespace courtplan::core::persist {

nlohmann::json PlayerToJson(const roster::Player& player);
bool ParsePlayer(const nlohmann::json& node, roster::Player& player, std::string* error);

nlohmann::json MatchToJson(const tournament::Match& match);
bool ParseMatch(const nlohmann::json& node, tournament::Match& match, std::string* error);

nlohmann::json RoundToJson(const tournament::Round& round);
bool ParseRound(const nlohmann::json& node, tournament::Round& round, std::string* error);

nlohmann::json EngineConfigToJson(const api::EngineConfig& config);
bool ParseEngineConfig(const nlohmann::json& node, api::EngineConfig& config, std::string* error);

nlohmann::json ScoringToJson(const stats::ScoringConfig& scoring);
bool ParseScoring(const nlohmann::json& node, stats::ScoringConfig& scoring, std::string* error);

}  // namespace courtplan::core::persist
