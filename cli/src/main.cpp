#include "courtplan/core/Errors.h"
#include "courtplan/core/api/EngineConfig.h"
#include "courtplan/core/api/PairingEngine.h"
#include "courtplan/core/persist/SessionStore.h"
#include "courtplan/core/stats/ScoreValidator.h"
#include "courtplan/core/stats/StandingsTable.h"

#include <algorithm>
#include <exception>
#include <iomanip>
#include <iostream>
#include <memory>
#include <stdexcept>
#include <string>
#include <unordered_set>
#include <vector>

namespace {

using courtplan::core::api::PairingEngine;
using courtplan::core::api::SessionConfig;
using courtplan::core::persist::SessionState;
namespace stats = courtplan::core::stats;
namespace tournament = courtplan::core::tournament;

void PrintUsage() {
    std::cerr << "Usage:\n"
              << "  courtplancli init <config.json> <session.json>\n"
              << "  courtplancli next <session.json>\n"
              << "  courtplancli court <session.json> <court> <round> [excluded ids...]\n"
              << "  courtplancli score <session.json> <round> <court> <team1_score> <team2_score>\n"
              << "  courtplancli standings <session.json>\n";
}

bool ParseInt(const std::string& text, int& value) {
    try {
        size_t consumed = 0;
        value = std::stoi(text, &consumed);
        return consumed == text.size();
    } catch (const std::exception&) {
        return false;
    }
}

void LogToStderr(const std::string& message) {
    std::cerr << "[courtplan] " << message << '\n';
}

bool LoadState(const std::string& path, SessionState& state) {
    std::string error;
    if (!courtplan::core::persist::LoadSession(path, state, &error)) {
        std::cerr << "[courtplancli] " << error << '\n';
        return false;
    }
    return true;
}

bool SaveState(const std::string& path, const SessionState& state) {
    std::string error;
    if (!courtplan::core::persist::SaveSession(path, state, &error)) {
        std::cerr << "[courtplancli] Failed to save session: " << error << '\n';
        return false;
    }
    return true;
}

std::unique_ptr<PairingEngine> RestoreEngine(const SessionState& state) {
    auto engine = std::make_unique<PairingEngine>(state.players, state.config.engine, LogToStderr);
    engine->RestoreFromRounds(state.rounds);
    return engine;
}

std::string DisplayName(const PairingEngine& engine, const std::string& id) {
    const auto* player = engine.roster().Find(id);
    return player != nullptr && !player->name.empty() ? player->name : id;
}

void PrintMatch(const PairingEngine& engine, const tournament::Match& match) {
    std::cout << "  Court " << match.court << ": " << DisplayName(engine, match.team1[0]) << " & "
              << DisplayName(engine, match.team1[1]) << " vs " << DisplayName(engine, match.team2[0]) << " & "
              << DisplayName(engine, match.team2[1]);
    if (match.composition != tournament::MatchComposition::kUnrestricted) {
        std::cout << " [" << tournament::ToString(match.composition) << "]";
    }
    if (match.has_scores()) {
        std::cout << "  " << *match.team1_score << "-" << *match.team2_score;
    }
    std::cout << '\n';
}

void PrintRound(const PairingEngine& engine, const tournament::Round& round) {
    std::cout << "Round " << round.number << '\n';
    for (const auto& match : round.matches) {
        PrintMatch(engine, match);
    }
    if (!round.sitting_players.empty()) {
        std::cout << "  Sitting:";
        for (const auto& id : round.sitting_players) {
            std::cout << ' ' << DisplayName(engine, id);
        }
        std::cout << '\n';
    }
    for (const auto& degradation : round.degradations) {
        std::cout << "  Note: " << degradation.detail << '\n';
    }
}

// Folds a court's match into the stored round of the same number.
void MergeRound(SessionState& state, tournament::Round generated) {
    auto* existing = state.FindRound(generated.number);
    if (existing == nullptr) {
        state.rounds.push_back(std::move(generated));
        return;
    }
    for (auto& match : generated.matches) {
        existing->matches.push_back(std::move(match));
    }
    for (auto& degradation : generated.degradations) {
        existing->degradations.push_back(std::move(degradation));
    }
    std::unordered_set<std::string> on_court;
    for (const auto& match : existing->matches) {
        on_court.insert(match.team1.begin(), match.team1.end());
        on_court.insert(match.team2.begin(), match.team2.end());
    }
    existing->sitting_players.erase(std::remove_if(existing->sitting_players.begin(),
                                                   existing->sitting_players.end(),
                                                   [&](const std::string& id) { return on_court.count(id) > 0; }),
                                    existing->sitting_players.end());
}

int RunInit(const std::string& config_path, const std::string& session_path) {
    SessionConfig config;
    std::string error;
    if (!SessionConfig::LoadFromFile(config_path, config, &error)) {
        std::cerr << "[courtplancli] " << error << '\n';
        return 1;
    }

    // Rejects rosters the engine cannot run before anything is written.
    PairingEngine engine(config.players, config.engine, LogToStderr);

    SessionState state;
    state.config = config;
    state.players = config.players;
    if (!SaveState(session_path, state)) {
        return 1;
    }
    std::cout << "Session '" << config.name << "' created with " << engine.players().size() << " players on "
              << config.engine.courts << " court(s), format " << tournament::ToString(config.engine.format)
              << " (" << engine.strategy_name() << ")\n";
    return 0;
}

int RunNext(const std::string& session_path) {
    SessionState state;
    if (!LoadState(session_path, state)) {
        return 1;
    }
    auto engine = RestoreEngine(state);
    const auto round = engine->GenerateRound(state.current_round + 1);

    state.players = engine->players();
    state.current_round = round.number;
    state.rounds.push_back(round);
    if (!SaveState(session_path, state)) {
        return 1;
    }
    PrintRound(*engine, round);
    return 0;
}

int RunCourt(const std::string& session_path, int court, int round_number, std::vector<std::string> excluded) {
    SessionState state;
    if (!LoadState(session_path, state)) {
        return 1;
    }

    // Players still on another unscored court cannot be placed again.
    for (const auto& round : state.rounds) {
        for (const auto& match : round.matches) {
            if (match.has_scores() || match.court == court) {
                continue;
            }
            excluded.insert(excluded.end(), match.team1.begin(), match.team1.end());
            excluded.insert(excluded.end(), match.team2.begin(), match.team2.end());
        }
    }

    auto engine = RestoreEngine(state);
    auto round = engine->GenerateRoundForCourt(court, round_number, excluded);
    PrintRound(*engine, round);
    if (round.matches.empty()) {
        return 1;
    }

    state.players = engine->players();
    state.current_round = std::max(state.current_round, round_number);
    MergeRound(state, std::move(round));
    return SaveState(session_path, state) ? 0 : 1;
}

int RunScore(const std::string& session_path, int round_number, int court, int team1_score, int team2_score) {
    SessionState state;
    if (!LoadState(session_path, state)) {
        return 1;
    }

    std::string error;
    if (!stats::ValidateScore(state.config.scoring, team1_score, team2_score, &error)) {
        std::cerr << "[courtplancli] " << error << '\n';
        return 1;
    }

    auto* round = state.FindRound(round_number);
    tournament::Match* match = nullptr;
    if (round != nullptr) {
        for (auto& candidate : round->matches) {
            if (candidate.court == court) {
                match = &candidate;
            }
        }
    }
    if (match == nullptr) {
        std::cerr << "[courtplancli] No match on court " << court << " in round " << round_number << '\n';
        return 1;
    }

    const bool correction = match->has_scores();
    match->team1_score = team1_score;
    match->team2_score = team2_score;
    match->completed = true;

    if (correction) {
        // Ratings keep the original result; the record is recomputed from all scores.
        stats::RebuildStatsFromRounds(state.players, state.rounds);
        std::cout << "Corrected round " << round_number << " court " << court << '\n';
    } else {
        auto engine = RestoreEngine(state);
        if (!engine->RecordResult(*match, &error)) {
            std::cerr << "[courtplancli] " << error << '\n';
            return 1;
        }
        state.players = engine->players();
        std::cout << "Recorded round " << round_number << " court " << court << ": " << team1_score << "-"
                  << team2_score << '\n';
    }
    return SaveState(session_path, state) ? 0 : 1;
}

int RunStandings(const std::string& session_path) {
    SessionState state;
    if (!LoadState(session_path, state)) {
        return 1;
    }

    auto players = state.players;
    const int points_per_match =
        state.config.scoring.rule == stats::ScoringRule::kPoints ? state.config.scoring.target : 0;
    stats::ApplyCompensation(players, points_per_match);

    const stats::StandingsTable table(players);
    std::cout << std::left << std::setw(5) << "#" << std::setw(20) << "Player" << std::right << std::setw(7)
              << "Pts" << std::setw(5) << "W" << std::setw(5) << "L" << std::setw(5) << "T" << std::setw(8)
              << "Win%" << '\n';
    for (const auto& row : table.Sorted(stats::StandingsOrder::kPoints)) {
        std::cout << std::left << std::setw(5) << row.rank << std::setw(20) << row.name << std::right
                  << std::setw(7) << row.points << std::setw(5) << row.wins << std::setw(5) << row.losses
                  << std::setw(5) << row.ties << std::setw(7) << std::fixed << std::setprecision(1)
                  << row.win_rate() << "%";
        if (row.compensation_points > 0) {
            std::cout << "  (+" << row.compensation_points << ")";
        }
        std::cout << '\n';
    }
    return 0;
}

int Dispatch(const std::vector<std::string>& args) {
    const std::string& command = args[0];
    if (command == "init" && args.size() == 3) {
        return RunInit(args[1], args[2]);
    }
    if (command == "next" && args.size() == 2) {
        return RunNext(args[1]);
    }
    if (command == "standings" && args.size() == 2) {
        return RunStandings(args[1]);
    }
    if (command == "court" && args.size() >= 4) {
        int court = 0;
        int round = 0;
        if (!ParseInt(args[2], court) || !ParseInt(args[3], round)) {
            std::cerr << "[courtplancli] Court and round must be integers." << '\n';
            return 1;
        }
        return RunCourt(args[1], court, round, std::vector<std::string>(args.begin() + 4, args.end()));
    }
    if (command == "score" && args.size() == 6) {
        int round = 0;
        int court = 0;
        int team1 = 0;
        int team2 = 0;
        if (!ParseInt(args[2], round) || !ParseInt(args[3], court) || !ParseInt(args[4], team1) ||
            !ParseInt(args[5], team2)) {
            std::cerr << "[courtplancli] Round, court and scores must be integers." << '\n';
            return 1;
        }
        return RunScore(args[1], round, court, team1, team2);
    }
    PrintUsage();
    return 1;
}

}  // namespace

int main(int argc, char** argv) {
    if (argc < 2) {
        PrintUsage();
        return 1;
    }
    const std::vector<std::string> args(argv + 1, argv + argc);
    try {
        return Dispatch(args);
    } catch (const courtplan::core::ConfigurationError& ex) {
        std::cerr << "[courtplancli] Invalid configuration: " << ex.what() << '\n';
    } catch (const std::invalid_argument& ex) {
        std::cerr << "[courtplancli] " << ex.what() << '\n';
    } catch (const std::exception& ex) {
        std::cerr << "[courtplancli] Unexpected error: " << ex.what() << '\n';
    }
    return 1;
}
