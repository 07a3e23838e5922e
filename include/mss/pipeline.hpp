#pragma once

#include "mss/config.hpp"
#include "mss/context.hpp"
#include "mss/types.hpp"
#include <expected>
#include <string>
#include <vector>

namespace mss {

// Scores one moment for every participant with a non-trivial role (batter and
// pitcher, plus fielders when batch.score_fielders is set). Either all results
// for the moment are returned or none: a failing participant aborts only this
// moment. With the "skip" history policy a short history yields no results.
std::expected<std::vector<MSSResult>, ScoreError> score(
    const Moment& moment, const PlayerHistoryLookup& lookup,
    const std::vector<SentimentObservation>& observations,
    const EngineConfig& config, const WeightSet& weights);

struct MomentFailure {
    std::string moment_id;
    std::string stage;
    std::string kind;
    std::string message;
    std::vector<std::string> fields;
};

struct BatchResult {
    std::vector<MSSResult> results;
    std::vector<MomentFailure> failures;
    int moments = 0;
    int skipped = 0;
};

// Builds and scores independent moments on config.batch.workers threads.
// Results come back sorted by (moment id, player id); failures by moment id.
BatchResult score_batch(const std::vector<RawEvent>& events,
                        const PlayerHistoryLookup& lookup,
                        const std::vector<SentimentObservation>& observations,
                        const EngineConfig& config, const WeightSet& weights);

} // namespace mss
