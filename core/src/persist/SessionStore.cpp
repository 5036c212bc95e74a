#include "courtplan/core/persist/SessionStore.h"

#include "courtplan/core/persist/JsonCodec.h"
#include "courtplan/core/util/AtomicFileWriter.h"

#include <nlohmann/json.hpp>

#include <fstream>

namespace courtplan::core::persist {

namespace {

constexpr int kSessionVersion = 1;

bool ReadSession(const nlohmann::json& root, SessionState& state, std::string* error) {
    state = SessionState{};
    state.version = root.value("version", kSessionVersion);
    if (state.version > kSessionVersion) {
        if (error) {
            *error = "Unsupported session version " + std::to_string(state.version);
        }
        return false;
    }
    state.current_round = root.value("current_round", 0);

    if (root.contains("config")) {
        const auto& config = root.at("config");
        state.config.name = config.value("name", "");
        if (config.contains("engine") && !ParseEngineConfig(config.at("engine"), state.config.engine, error)) {
            return false;
        }
        if (config.contains("scoring") && !ParseScoring(config.at("scoring"), state.config.scoring, error)) {
            return false;
        }
    }

    if (root.contains("players")) {
        for (const auto& node : root.at("players")) {
            roster::Player player;
            if (!ParsePlayer(node, player, error)) {
                return false;
            }
            state.players.push_back(std::move(player));
        }
    }

    if (root.contains("rounds")) {
        for (const auto& node : root.at("rounds")) {
            tournament::Round round;
            if (!ParseRound(node, round, error)) {
                return false;
            }
            state.rounds.push_back(std::move(round));
        }
    }

    for (const auto& round : state.rounds) {
        if (round.number > state.current_round) {
            state.current_round = round.number;
        }
    }
    return true;
}

}  // namespace

tournament::Round* SessionState::FindRound(int number) {
    for (auto& round : rounds) {
        if (round.number == number) {
            return &round;
        }
    }
    return nullptr;
}

const tournament::Round* SessionState::FindRound(int number) const {
    for (const auto& round : rounds) {
        if (round.number == number) {
            return &round;
        }
    }
    return nullptr;
}

bool SaveSession(const std::string& path, const SessionState& state, std::string* error) {
    nlohmann::json root;
    root["version"] = state.version;
    root["current_round"] = state.current_round;

    root["config"] = {
        {"name", state.config.name},
        {"engine", EngineConfigToJson(state.config.engine)},
        {"scoring", ScoringToJson(state.config.scoring)},
    };

    root["players"] = nlohmann::json::array();
    for (const auto& player : state.players) {
        root["players"].push_back(PlayerToJson(player));
    }

    root["rounds"] = nlohmann::json::array();
    for (const auto& round : state.rounds) {
        root["rounds"].push_back(RoundToJson(round));
    }

    return util::AtomicFileWriter::Write(path, root.dump(2), error);
}

bool LoadSession(const std::string& path, SessionState& state, std::string* error) {
    std::ifstream input(path);
    if (!input) {
        if (error) {
            *error = "Failed to open session: " + path;
        }
        return false;
    }

    nlohmann::json root;
    try {
        input >> root;
    } catch (const std::exception& ex) {
        if (error) {
            *error = std::string("Failed to parse session: ") + ex.what();
        }
        return false;
    }

    if (!root.is_object()) {
        if (error) {
            *error = "Session must be a JSON object: " + path;
        }
        return false;
    }
    try {
        return ReadSession(root, state, error);
    } catch (const std::exception& ex) {
        if (error) {
            *error = std::string("Invalid session: ") + ex.what();
        }
        return false;
    }
}

}  // namespace courtplan::core::persist
