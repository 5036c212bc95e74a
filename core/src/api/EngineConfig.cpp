#include "courtplan/core/api/EngineConfig.h"

#include "courtplan/core/persist/JsonCodec.h"
#include "courtplan/core/util/AtomicFileWriter.h"

#include <nlohmann/json.hpp>

#include <fstream>

namespace courtplan::core::api {

namespace {

bool LoadJson(const std::string& path, nlohmann::json& root, std::string* error) {
    std::ifstream input(path);
    if (!input) {
        if (error) {
            *error = "Failed to open config: " + path;
        }
        return false;
    }
    try {
        input >> root;
    } catch (const std::exception& ex) {
        if (error) {
            *error = std::string("Failed to parse JSON: ") + ex.what();
        }
        return false;
    }
    return true;
}

nlohmann::json ToJson(const SessionConfig& config) {
    nlohmann::json root;
    root["name"] = config.name;
    root["engine"] = persist::EngineConfigToJson(config.engine);
    root["scoring"] = persist::ScoringToJson(config.scoring);
    root["players"] = nlohmann::json::array();
    for (const auto& player : config.players) {
        root["players"].push_back(persist::PlayerToJson(player));
    }
    return root;
}

bool ReadConfig(const nlohmann::json& root, SessionConfig& config, std::string* error) {
    config = SessionConfig{};
    config.name = root.value("name", config.name);

    if (root.contains("engine") && !persist::ParseEngineConfig(root.at("engine"), config.engine, error)) {
        return false;
    }
    if (root.contains("scoring") && !persist::ParseScoring(root.at("scoring"), config.scoring, error)) {
        return false;
    }

    if (root.contains("players")) {
        for (const auto& node : root.at("players")) {
            roster::Player player;
            if (!persist::ParsePlayer(node, player, error)) {
                return false;
            }
            config.players.push_back(std::move(player));
        }
    }

    if (config.engine.courts < 1) {
        if (error) {
            *error = "Config must specify at least one court.";
        }
        return false;
    }
    return true;
}

}  // namespace

bool SessionConfig::LoadFromFile(const std::string& path, SessionConfig& config, std::string* error) {
    nlohmann::json root;
    if (!LoadJson(path, root, error)) {
        return false;
    }

    if (!root.is_object()) {
        if (error) {
            *error = "Config must be a JSON object: " + path;
        }
        return false;
    }
    try {
        return ReadConfig(root, config, error);
    } catch (const std::exception& ex) {
        if (error) {
            *error = std::string("Invalid config: ") + ex.what();
        }
        return false;
    }
}

bool SessionConfig::SaveToFile(const std::string& path, const SessionConfig& config, std::string* error) {
    return util::AtomicFileWriter::Write(path, ToJsonString(config), error);
}

std::string SessionConfig::ToJsonString(const SessionConfig& config) {
    return ToJson(config).dump(2);
}

}  // namespace courtplan::core::api
