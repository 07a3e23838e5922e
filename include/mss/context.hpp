#pragma once

#include "mss/config.hpp"
#include "mss/types.hpp"
#include <expected>
#include <string>
#include <vector>

namespace mss {

// Player-history collaborator. Implementations must be safe for concurrent
// const calls; the batch scorer shares one instance across workers.
class PlayerHistoryLookup {
public:
    virtual ~PlayerHistoryLookup() = default;

    virtual std::expected<PlayerHistory, LookupError> history(
        const std::string& player_id, TimePoint before) const = 0;
};

enum class HistoryMode { Strict, Lenient };

struct Participant {
    std::string player_id;
    Role role = Role::Batter;
    bool home_team = false;
};

std::vector<Participant> participants(const Moment& moment);

CareerStage career_stage(Role role, const PlayerHistory& history, const ContextConfig& config);

double seasons_played(Role role, const PlayerHistory& history, const ContextConfig& config);

// Mean performance over the last `window` appearances strictly before `before`.
// Returns the number of appearances actually used through `used`.
double trailing_baseline(const std::vector<Appearance>& appearances, TimePoint before,
                         int window, int& used);

Side side_for(double signed_delta_wp);

// Builds a participant's context. In Strict mode a short trailing window is an
// InsufficientHistory error; in Lenient mode the context is built from what is
// available and flagged low-confidence. The caller picks the mode.
std::expected<PlayerContext, ScoreError> enrich_participant(
    const Moment& moment, const Participant& participant,
    const PlayerHistoryLookup& lookup, const ContextConfig& config,
    HistoryMode mode = HistoryMode::Strict);

std::expected<std::vector<PlayerContext>, ScoreError> enrich_moment(
    const Moment& moment, const PlayerHistoryLookup& lookup,
    const ContextConfig& config, HistoryMode mode = HistoryMode::Strict);

} // namespace mss
