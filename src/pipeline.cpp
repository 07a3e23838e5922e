#include "mss/pipeline.hpp"
#include "mss/composer.hpp"
#include "mss/impact.hpp"
#include "mss/moment_builder.hpp"
#include "mss/sentiment.hpp"
#include <algorithm>
#include <atomic>
#include <cmath>
#include <iterator>
#include <mutex>
#include <optional>
#include <thread>
#include <tuple>
#include <unordered_map>
#include <spdlog/spdlog.h>

namespace mss {

namespace {

struct MomentOutcome {
    std::vector<MSSResult> results;
    std::optional<MomentFailure> failure;
    bool skipped = false;
};

MomentOutcome run_moment(const RawEvent& event, const PlayerHistoryLookup& lookup,
                         const std::vector<SentimentObservation>& observations,
                         const EngineConfig& config, const WeightSet& weights) {
    MomentOutcome out;

    auto moment = build_moment(event);
    if (!moment) {
        out.failure = MomentFailure{
            .moment_id = event.moment_id,
            .stage = "build",
            .kind = to_string(moment.error().kind),
            .message = moment.error().message,
            .fields = moment.error().fields,
        };
        return out;
    }

    auto scored = score(*moment, lookup, observations, config, weights);
    if (!scored) {
        auto& err = scored.error();
        out.failure = MomentFailure{
            .moment_id = moment->id,
            .stage = "score",
            .kind = to_string(err.kind),
            .message = err.player_id + ": " + err.message,
        };
        return out;
    }

    out.skipped = scored->empty();
    out.results = std::move(*scored);
    return out;
}

} // namespace

std::expected<std::vector<MSSResult>, ScoreError> score(
    const Moment& moment, const PlayerHistoryLookup& lookup,
    const std::vector<SentimentObservation>& observations,
    const EngineConfig& config, const WeightSet& weights) {

    if (!std::isfinite(weights.w1) || !std::isfinite(weights.w2)) {
        return std::unexpected(ScoreError{
            .kind = ScoreErrorKind::InvalidConfig,
            .moment_id = moment.id,
            .message = "weight set v" + std::to_string(weights.version) + " is not finite",
        });
    }

    auto policy = config.batch.history_policy;
    auto mode = policy == HistoryPolicy::Flag ? HistoryMode::Lenient : HistoryMode::Strict;

    // All sub-terms for every participant are computed before anything is emitted.
    std::vector<MSSResult> results;
    for (auto& participant : participants(moment)) {
        if (participant.role == Role::Fielder && !config.batch.score_fielders) continue;

        auto ctx = enrich_participant(moment, participant, lookup, config.context, mode);
        if (!ctx) {
            if (ctx.error().kind == ScoreErrorKind::InsufficientHistory &&
                policy == HistoryPolicy::Skip) {
                spdlog::warn("Skipping moment {}: {} ({})", moment.id,
                             ctx.error().message, ctx.error().player_id);
                return std::vector<MSSResult>{};
            }
            return std::unexpected(ctx.error());
        }

        double s = statistical_component(moment, *ctx, config.impact);
        auto relevant = observations_for(observations, moment.id, ctx->player_id, ctx->side);
        auto sentiment = aggregate_sentiment(relevant, config.sentiment);
        results.push_back(compose(moment, *ctx, s, sentiment, weights, config.composer));
    }
    return results;
}

BatchResult score_batch(const std::vector<RawEvent>& events,
                        const PlayerHistoryLookup& lookup,
                        const std::vector<SentimentObservation>& observations,
                        const EngineConfig& config, const WeightSet& weights) {

    std::unordered_map<std::string, std::vector<SentimentObservation>> by_moment;
    for (auto& obs : observations) by_moment[obs.moment_id].push_back(obs);
    static const std::vector<SentimentObservation> none;

    BatchResult batch;
    batch.moments = static_cast<int>(events.size());

    std::mutex results_mutex;
    std::atomic<size_t> next{0};

    auto worker = [&] {
        while (true) {
            size_t i = next.fetch_add(1);
            if (i >= events.size()) break;

            auto& event = events[i];
            auto it = by_moment.find(event.moment_id);
            auto& relevant = it != by_moment.end() ? it->second : none;
            auto outcome = run_moment(event, lookup, relevant, config, weights);

            std::lock_guard lock(results_mutex);
            if (outcome.failure) {
                batch.failures.push_back(std::move(*outcome.failure));
            } else if (outcome.skipped) {
                batch.skipped++;
            }
            std::ranges::move(outcome.results, std::back_inserter(batch.results));
        }
    };

    int n_workers = std::clamp(config.batch.workers, 1, std::max(1, batch.moments));
    std::vector<std::thread> threads;
    for (int w = 0; w < n_workers; ++w) threads.emplace_back(worker);
    for (auto& t : threads) t.join();

    std::ranges::sort(batch.results, [](const MSSResult& a, const MSSResult& b) {
        return std::tie(a.moment_id, a.player_id) < std::tie(b.moment_id, b.player_id);
    });
    std::ranges::sort(batch.failures, {}, &MomentFailure::moment_id);

    spdlog::info("Scored {} moments: {} results, {} failed, {} skipped",
                 batch.moments, batch.results.size(), batch.failures.size(), batch.skipped);
    return batch;
}

} // namespace mss
