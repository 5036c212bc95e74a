#include "courtplan/core/api/PairingEngine.h"

#include "courtplan/core/Errors.h"
#include "courtplan/core/tournament/CourtAssigner.h"

#include <algorithm>
#include <array>
#include <cstdint>
#include <random>
#include <stdexcept>
#include <unordered_set>
#include <utility>

namespace courtplan::core::api {

namespace {

std::vector<roster::Player> CheckedPlayers(std::vector<roster::Player> players) {
    if (static_cast<int>(players.size()) < PairingEngine::kMinimumPlayers) {
        throw ConfigurationError("Minimum " + std::to_string(PairingEngine::kMinimumPlayers) +
                                 " players required, got " + std::to_string(players.size()));
    }
    return players;
}

const EngineConfig& CheckedConfig(const EngineConfig& config) {
    if (config.courts < 1) {
        throw ConfigurationError("At least one court is required, got " + std::to_string(config.courts));
    }
    return config;
}

std::uint32_t SeedFor(const EngineConfig& config) {
    if (config.seed != 0) {
        return config.seed;
    }
    std::random_device device;
    return device();
}

void CheckRoundNumber(int round_number) {
    if (round_number < 1) {
        throw std::invalid_argument("Round number must be a positive integer");
    }
}

bool ResolveTeams(const roster::Roster& roster,
                  const tournament::Match& match,
                  std::array<int, 2>& team1,
                  std::array<int, 2>& team2) {
    for (size_t i = 0; i < 2; ++i) {
        team1[i] = roster.IndexOf(match.team1[i]);
        team2[i] = roster.IndexOf(match.team2[i]);
        if (team1[i] < 0 || team2[i] < 0) {
            return false;
        }
    }
    return true;
}

std::vector<int> PlayersOf(const std::vector<tournament::TeamPairing>& pairings) {
    std::vector<int> playing;
    playing.reserve(pairings.size() * 4);
    for (const auto& pairing : pairings) {
        playing.insert(playing.end(), pairing.team1.begin(), pairing.team1.end());
        playing.insert(playing.end(), pairing.team2.begin(), pairing.team2.end());
    }
    return playing;
}

tournament::Degradation TooFewPlayers(int eligible) {
    return {tournament::DegradationReason::kInsufficientPlayers,
            std::to_string(eligible) + " eligible player(s), at least " +
                std::to_string(tournament::CandidateSelector::kPlayersPerMatch) + " needed for a match"};
}

}  // namespace

PairingEngine::PairingEngine(std::vector<roster::Player> players,
                             EngineConfig config,
                             std::function<void(const std::string&)> log_fn)
    : config_(CheckedConfig(config)),
      log_fn_(std::move(log_fn)),
      roster_(CheckedPlayers(std::move(players))),
      rng_(SeedFor(config_)),
      resolver_(config_.format, config_.matchup_preference),
      selector_(roster_, rng_),
      updater_(config_.rating_k_factor) {}

tournament::Round PairingEngine::GenerateRound(int round_number) {
    CheckRoundNumber(round_number);

    tournament::Round round;
    round.number = round_number;

    auto selection = selector_.SelectForRound(round_number, config_.courts, {}, resolver_.uses_partner_units());
    tournament::GroupingResult grouped;
    if (selection.match_count > 0) {
        grouped = resolver_.Resolve(MakeContext(selection.playing, selection.match_count));
    }

    round.matches = tournament::CourtAssigner::AssignSequential(round_number, grouped.pairings, roster_);
    round.sitting_players = tournament::CourtAssigner::SittingPlayers(selection.eligible, round.matches, roster_);
    round.degradations = std::move(grouped.degradations);
    if (round.matches.empty() && !selection.eligible.empty()) {
        round.degradations.push_back(TooFewPlayers(static_cast<int>(selection.eligible.size())));
    }

    selection.playing = PlayersOf(grouped.pairings);
    const std::unordered_set<int> placed(selection.playing.begin(), selection.playing.end());
    selection.sitting.clear();
    for (int index : selection.eligible) {
        if (placed.count(index) == 0) {
            selection.sitting.push_back(index);
        }
    }
    selector_.CommitRound(selection);

    RecordGenerated(round.matches);
    RememberPartners(round.matches);
    ReportDegradations(round);
    Log("Round " + std::to_string(round_number) + ": " + std::to_string(round.matches.size()) +
        " match(es), " + std::to_string(round.sitting_players.size()) + " sitting");
    return round;
}

tournament::Round PairingEngine::GenerateRoundForCourt(int court,
                                                       int round_number,
                                                       const std::vector<std::string>& excluded_ids) {
    CheckRoundNumber(round_number);
    if (court < 1) {
        throw std::invalid_argument("Court number must be a positive integer");
    }

    tournament::Round round;
    round.number = round_number;

    const std::unordered_set<std::string> excluded(excluded_ids.begin(), excluded_ids.end());
    const auto selection = selector_.SelectForCourt(round_number, excluded, resolver_.uses_partner_units());
    tournament::GroupingResult grouped;
    if (selection.match_count > 0) {
        grouped = resolver_.Resolve(MakeContext(selection.playing, 1));
    }

    if (grouped.pairings.empty()) {
        round.sitting_players = tournament::CourtAssigner::SittingPlayers(selection.eligible, {}, roster_);
        round.degradations.push_back(TooFewPlayers(static_cast<int>(selection.eligible.size())));
        ReportDegradations(round);
        return round;
    }

    round.matches.push_back(
        tournament::CourtAssigner::AssignToCourt(round_number, court, grouped.pairings.front(), roster_));
    round.sitting_players = tournament::CourtAssigner::SittingPlayers(selection.eligible, round.matches, roster_);
    round.degradations = std::move(grouped.degradations);

    selector_.CommitPlayers(PlayersOf({grouped.pairings.front()}));
    RecordGenerated(round.matches);
    RememberPartners(round.matches);
    ReportDegradations(round);
    Log("Court " + std::to_string(court) + " round " + std::to_string(round_number) + ": " +
        round.matches.front().team1[0] + "/" + round.matches.front().team1[1] + " vs " +
        round.matches.front().team2[0] + "/" + round.matches.front().team2[1]);
    return round;
}

bool PairingEngine::RecordResult(const tournament::Match& match, std::string* error) {
    std::string reason;
    if (!updater_.Apply(match, roster_, history_, &reason)) {
        Log("Result rejected: " + reason);
        if (error) {
            *error = reason;
        }
        return false;
    }
    return true;
}

void PairingEngine::RestoreFromRounds(const std::vector<tournament::Round>& rounds) {
    std::vector<const tournament::Round*> ordered;
    ordered.reserve(rounds.size());
    for (const auto& round : rounds) {
        ordered.push_back(&round);
    }
    std::stable_sort(ordered.begin(), ordered.end(), [](const auto* a, const auto* b) {
        return a->number < b->number;
    });

    int skipped = 0;
    for (const auto* round : ordered) {
        for (const auto& match : round->matches) {
            std::array<int, 2> team1{};
            std::array<int, 2> team2{};
            if (!ResolveTeams(roster_, match, team1, team2)) {
                ++skipped;
                continue;
            }
            history_.RecordMatch(tournament::MatchKey(match), team1, team2);
            if (match.has_scores()) {
                updater_.MarkRecorded(match);
            }
        }
        RememberPartners(round->matches);
    }
    if (skipped > 0) {
        Log("Restore skipped " + std::to_string(skipped) + " match(es) naming unknown players");
    }
}

tournament::GroupingContext PairingEngine::MakeContext(std::vector<int> pool, int match_count) {
    tournament::GroupingContext context;
    context.roster = &roster_;
    context.history = &history_;
    context.previous_partners = &previous_partners_;
    context.rng = &rng_;
    context.pool = std::move(pool);
    context.match_count = match_count;
    return context;
}

void PairingEngine::RecordGenerated(const std::vector<tournament::Match>& matches) {
    for (const auto& match : matches) {
        std::array<int, 2> team1{};
        std::array<int, 2> team2{};
        if (ResolveTeams(roster_, match, team1, team2)) {
            history_.RecordMatch(tournament::MatchKey(match), team1, team2);
        }
    }
}

void PairingEngine::RememberPartners(const std::vector<tournament::Match>& matches) {
    for (const auto& match : matches) {
        std::array<int, 2> team1{};
        std::array<int, 2> team2{};
        if (!ResolveTeams(roster_, match, team1, team2)) {
            continue;
        }
        previous_partners_[team1[0]] = team1[1];
        previous_partners_[team1[1]] = team1[0];
        previous_partners_[team2[0]] = team2[1];
        previous_partners_[team2[1]] = team2[0];
    }
}

void PairingEngine::ReportDegradations(const tournament::Round& round) const {
    for (const auto& degradation : round.degradations) {
        Log("Round " + std::to_string(round.number) + " degraded (" + tournament::ToString(degradation.reason) +
            "): " + degradation.detail);
    }
}

void PairingEngine::Log(const std::string& message) const {
    if (log_fn_) {
        log_fn_(message);
    }
}

}  // namespace courtplan::core::api
