#include "mss/composer.hpp"
#include <algorithm>
#include <cmath>
#include <spdlog/spdlog.h>

namespace mss {

namespace {

double stage_factor(CareerStage stage, const ComposerConfig& config) {
    switch (stage) {
        case CareerStage::Rookie: return config.rookie_factor;
        case CareerStage::Prime: return config.prime_factor;
        case CareerStage::Veteran: return config.veteran_factor;
    }
    return 1.0;
}

// Fraction of the career level the trailing baseline has fallen short by.
double slump_depth(const PlayerContext& context) {
    double gap = context.career_performance - context.baseline;
    if (gap <= 0.0) return 0.0;
    double scale = std::abs(context.career_performance);
    double depth = scale > 1e-9 ? gap / scale : gap;
    return std::clamp(depth, 0.0, 1.0);
}

} // namespace

double context_multiplier(const PlayerContext& context, const ComposerConfig& config) {
    double slump = 1.0 + config.slump_sensitivity * slump_depth(context);
    return std::min(stage_factor(context.stage, config) * slump, config.max_multiplier);
}

MSSResult compose(const Moment& moment, const PlayerContext& context, double statistical,
                  const SentimentSignal& sentiment, const WeightSet& weights,
                  const ComposerConfig& config) {
    ScoreBreakdown b;
    b.statistical = statistical;
    b.narrative = sentiment.value;
    b.context_multiplier = context_multiplier(context, config);
    b.w1 = weights.w1;
    b.w2 = weights.w2;
    b.statistical_term = b.w1 * b.statistical;
    b.narrative_term = b.w2 * b.narrative * b.context_multiplier;
    b.raw = b.statistical_term + b.narrative_term;

    double bound = std::min(config.score_bound, max_score_bound);
    double composite = std::clamp(b.raw, -bound, bound);
    b.clamped = composite != b.raw;

    MSSResult result{
        .moment_id = moment.id,
        .player_id = context.player_id,
        .weight_version = weights.version,
        .role = context.role,
        .side = context.side,
        .stage = context.stage,
        .delta_wp = moment.delta_wp(),
        .baseline = context.baseline,
        .composite = composite,
        .no_sentiment_data = sentiment.no_data,
        .low_confidence = context.low_confidence,
        .breakdown = b,
    };

    spdlog::debug("MSS {} / {} = {:.2f} (S {:.3f}, N {:.3f}, x{:.2f}, v{})",
                  result.moment_id, result.player_id, result.composite,
                  b.statistical, b.narrative, b.context_multiplier, weights.version);
    return result;
}

} // namespace mss
