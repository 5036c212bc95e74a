#pragma once

#include "courtplan/core/api/EngineConfig.h"
#include "courtplan/core/roster/PairHistory.h"
#include "courtplan/core/roster/Roster.h"
#include "courtplan/core/stats/RatingUpdater.h"
#include "courtplan/core/tournament/CandidateSelector.h"
#include "courtplan/core/tournament/GenderModeResolver.h"
#include "courtplan/core/tournament/TournamentTypes.h"

#include <functional>
#include <random>
#include <string>
#include <unordered_map>
#include <vector>

namespace courtplan::core::api {

// Owns the roster and pairing history of one session and produces rounds
// from them. Player counters only change through this class.
class PairingEngine {
public:
    static constexpr int kMinimumPlayers = 4;

    // Throws ConfigurationError for fewer than four players, duplicate ids or no courts.
    PairingEngine(std::vector<roster::Player> players,
                  EngineConfig config,
                  std::function<void(const std::string&)> log_fn = {});

    PairingEngine(const PairingEngine&) = delete;
    PairingEngine& operator=(const PairingEngine&) = delete;

    // Fills up to config().courts courts. Throws std::invalid_argument for round_number < 1.
    tournament::Round GenerateRound(int round_number);

    // Fills a single court from players not in excluded_ids, e.g. those still
    // on other courts. Throws std::invalid_argument for round_number or court < 1.
    tournament::Round GenerateRoundForCourt(int court,
                                            int round_number,
                                            const std::vector<std::string>& excluded_ids);

    bool RecordResult(const tournament::Match& match, std::string* error = nullptr);

    // Replays saved rounds into the pair history; scored matches count as recorded.
    void RestoreFromRounds(const std::vector<tournament::Round>& rounds);

    const roster::Roster& roster() const { return roster_; }
    const std::vector<roster::Player>& players() const { return roster_.players(); }
    const roster::PairHistory& history() const { return history_; }
    const EngineConfig& config() const { return config_; }
    const char* strategy_name() const { return resolver_.strategy().name(); }

private:
    tournament::GroupingContext MakeContext(std::vector<int> pool, int match_count);
    void RecordGenerated(const std::vector<tournament::Match>& matches);
    void RememberPartners(const std::vector<tournament::Match>& matches);
    void ReportDegradations(const tournament::Round& round) const;
    void Log(const std::string& message) const;

    EngineConfig config_;
    std::function<void(const std::string&)> log_fn_;
    roster::Roster roster_;
    roster::PairHistory history_;
    std::mt19937 rng_;
    tournament::GenderModeResolver resolver_;
    tournament::CandidateSelector selector_;
    stats::RatingUpdater updater_;
    std::unordered_map<int, int> previous_partners_;
};

}  // namespace courtplan::core::api
