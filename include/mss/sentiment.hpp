#pragma once

#include "mss/config.hpp"
#include "mss/types.hpp"
#include <string>
#include <vector>

namespace mss {

// Non-increasing in elapsed hours, 1.0 at zero.
double recency_decay(double offset_hours, const SentimentConfig& config);

double source_weight(SentimentSource source, const SentimentConfig& config);

// Observations for one (moment, player) pair. Player-tagged observations are
// taken as-is; moment-level ones are read from the beneficiary's point of view
// and flipped for adversely affected players.
std::vector<SentimentObservation> observations_for(
    const std::vector<SentimentObservation>& all, const std::string& moment_id,
    const std::string& player_id, Side side);

// Recency- and volume-weighted mean polarity in [-1, 1]. Non-finite entries,
// non-positive volumes and observations from before the moment are discarded.
SentimentSignal aggregate_sentiment(const std::vector<SentimentObservation>& observations,
                                    const SentimentConfig& config);

} // namespace mss
