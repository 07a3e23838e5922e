#include "mss/sentiment.hpp"
#include <algorithm>
#include <cmath>
#include <spdlog/spdlog.h>

namespace mss {

double recency_decay(double offset_hours, const SentimentConfig& config) {
    double t = std::max(0.0, offset_hours);
    switch (config.decay) {
        case DecayKind::Exponential:
            return std::pow(0.5, t / config.half_life_hours);
        case DecayKind::Linear:
            // Reaches zero after two half-lives.
            return std::max(0.0, 1.0 - t / (2.0 * config.half_life_hours));
    }
    return 1.0;
}

double source_weight(SentimentSource source, const SentimentConfig& config) {
    switch (source) {
        case SentimentSource::Media: return config.media_weight;
        case SentimentSource::Fan: return config.fan_weight;
        case SentimentSource::Social: return config.social_weight;
    }
    return 1.0;
}

std::vector<SentimentObservation> observations_for(
    const std::vector<SentimentObservation>& all, const std::string& moment_id,
    const std::string& player_id, Side side) {

    std::vector<SentimentObservation> result;
    for (auto& obs : all) {
        if (obs.moment_id != moment_id) continue;
        if (obs.player_id) {
            if (*obs.player_id == player_id) result.push_back(obs);
            continue;
        }
        auto shared = obs;
        if (side == Side::Adverse) shared.polarity = -shared.polarity;
        result.push_back(std::move(shared));
    }
    return result;
}

SentimentSignal aggregate_sentiment(const std::vector<SentimentObservation>& observations,
                                    const SentimentConfig& config) {
    struct Weighted {
        double polarity;
        double weight;
    };

    SentimentSignal signal;
    std::vector<Weighted> kept;
    for (auto& obs : observations) {
        if (!std::isfinite(obs.polarity) || !std::isfinite(obs.volume) ||
            !std::isfinite(obs.offset_hours) || obs.volume <= 0.0 || obs.offset_hours < 0.0) {
            signal.discarded++;
            continue;
        }
        double w = obs.volume * source_weight(obs.source, config) *
                   recency_decay(obs.offset_hours, config);
        if (w <= 0.0) {
            signal.discarded++;
            continue;
        }
        kept.push_back({std::clamp(obs.polarity, -1.0, 1.0), w});
    }

    for (auto& k : kept) signal.total_weight += k.weight;

    if (kept.empty() || signal.total_weight <= 0.0) {
        signal.value = 0.0;
        signal.no_data = true;
        return signal;
    }

    // Normalize weights first so a single observation carries weight exactly 1.
    double value = 0.0;
    for (auto& k : kept) {
        value += k.polarity * (k.weight / signal.total_weight);
    }
    signal.value = std::clamp(value, -1.0, 1.0);
    signal.used = static_cast<int>(kept.size());

    if (signal.discarded > 0) {
        spdlog::debug("Sentiment: used {}, discarded {}", signal.used, signal.discarded);
    }
    return signal;
}

} // namespace mss
