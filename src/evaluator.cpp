#include "mss/evaluator.hpp"
#include "mss/analytics.hpp"
#include <algorithm>
#include <cmath>
#include <tuple>
#include <unordered_map>
#include <unordered_set>
#include <spdlog/spdlog.h>

namespace mss {

namespace {

std::string key_of(const std::string& moment_id, const std::string& player_id) {
    return moment_id + "|" + player_id;
}

int sign_of(double v) {
    return (v > 0.0) - (v < 0.0);
}

GroupMetrics group_metrics(const std::string& name,
                           const std::vector<const PredictionRecord*>& records,
                           std::vector<CalibrationIssue>& issues) {
    GroupMetrics g;
    g.group = name;
    g.records = static_cast<int>(records.size());
    if (records.empty()) return g;

    std::vector<double> scores, realized, abs_scores, abs_realized;
    std::vector<double> shift_scores, shifts;
    std::vector<std::pair<double, double>> calibration_points;
    double mad_sum = 0.0;
    double mse_sum = 0.0;
    int hits = 0, directional = 0;
    int inside = 0, periods = 0;

    for (auto* r : records) {
        auto& eval = *r->evaluation();
        double score = r->result().composite;
        double change = eval.realized_mean_change;

        scores.push_back(score);
        realized.push_back(change);
        abs_scores.push_back(std::abs(score));
        abs_realized.push_back(std::abs(change));
        mad_sum += eval.mean_abs_deviation;
        mse_sum += eval.rmse * eval.rmse;
        inside += eval.inside_interval;
        periods += eval.periods_compared;

        if (sign_of(score) != 0 && sign_of(change) != 0) {
            directional++;
            if (sign_of(score) == sign_of(change)) hits++;
        }

        if (eval.realized_shift) {
            shift_scores.push_back(score);
            shifts.push_back(*eval.realized_shift);
        }

        double predicted = 0.0;
        for (size_t i = 0; i < eval.observed_delta.size(); ++i) {
            if (std::isfinite(eval.observed_delta[i])) predicted += r->trajectory()[i].expected;
        }
        calibration_points.emplace_back(predicted / eval.periods_compared, change);
    }

    double n = static_cast<double>(records.size());
    g.mean_abs_deviation = mad_sum / n;
    g.rmse = std::sqrt(mse_sum / n);
    g.directional_hit_rate = directional > 0 ? static_cast<double>(hits) / directional : 0.0;
    g.interval_coverage = periods > 0 ? static_cast<double>(inside) / periods : 0.0;

    g.correlation = pearson(scores, realized);
    if (!g.correlation) {
        std::string kind = records.size() < 2             ? "too-few-records"
                           : variance(realized) < 1e-12   ? "zero-variance-observed"
                                                          : "zero-variance-score";
        issues.push_back({name, kind, "correlation undefined over " +
                                          std::to_string(records.size()) + " records"});
    }
    g.magnitude_correlation = pearson(abs_scores, abs_realized);
    if (shifts.size() >= 2) g.shift_correlation = pearson(shift_scores, shifts);

    auto line = fit_line(calibration_points);
    if (!line.degenerate) {
        g.calibration_slope = line.slope;
        g.calibration_intercept = line.intercept;
        g.calibration_r_squared = line.r_squared;
    } else if (records.size() >= 2) {
        issues.push_back({name, "calibration-line-degenerate",
                          "predicted mean change does not vary across records"});
    }

    return g;
}

} // namespace

CalibrationReport evaluate(std::vector<PredictionRecord>& records,
                           const std::vector<ObservedOutcome>& outcomes) {
    CalibrationReport report;
    report.records_total = static_cast<int>(records.size());

    std::unordered_map<std::string, const ObservedOutcome*> by_key;
    for (auto& o : outcomes) {
        if (!by_key.emplace(key_of(o.moment_id, o.player_id), &o).second) {
            report.issues.push_back({"all", "duplicate-outcome",
                                     "second outcome for " + key_of(o.moment_id, o.player_id) +
                                         " ignored"});
        }
    }

    std::unordered_set<std::string> matched;
    for (auto& record : records) {
        auto key = key_of(record.result().moment_id, record.result().player_id);
        auto it = by_key.find(key);
        if (it == by_key.end()) continue;
        matched.insert(key);

        if (record.evaluated()) {
            report.issues.push_back({"all", "already-evaluated",
                                     key + " keeps its first observed outcome"});
            continue;
        }
        if (auto recorded = record.record_outcome(*it->second); !recorded) {
            report.issues.push_back({"all", "outcome-rejected", key + ": " + recorded.error().message});
        }
    }
    report.outcomes_unmatched = static_cast<int>(by_key.size() - matched.size());

    std::vector<const PredictionRecord*> all, batters, pitchers;
    for (auto& record : records) {
        if (!record.evaluated()) continue;
        all.push_back(&record);
        if (record.result().role == Role::Batter) batters.push_back(&record);
        if (record.result().role == Role::Pitcher) pitchers.push_back(&record);

        auto& eval = *record.evaluation();
        report.record_errors.push_back({
            .moment_id = record.result().moment_id,
            .player_id = record.result().player_id,
            .composite = record.result().composite,
            .mean_abs_deviation = eval.mean_abs_deviation,
            .rmse = eval.rmse,
            .realized_mean_change = eval.realized_mean_change,
            .periods_compared = eval.periods_compared,
        });
    }
    report.records_evaluated = static_cast<int>(all.size());

    std::ranges::sort(report.record_errors, [](const RecordError& a, const RecordError& b) {
        return std::tie(a.moment_id, a.player_id) < std::tie(b.moment_id, b.player_id);
    });

    if (all.empty()) {
        report.issues.push_back({"all", "empty", "no evaluated records"});
        return report;
    }

    report.groups.push_back(group_metrics("all", all, report.issues));
    if (!batters.empty()) report.groups.push_back(group_metrics("batter", batters, report.issues));
    if (!pitchers.empty()) report.groups.push_back(group_metrics("pitcher", pitchers, report.issues));

    for (auto& issue : report.issues) {
        spdlog::warn("Calibration [{}] {}: {}", issue.group, issue.kind, issue.detail);
    }
    spdlog::info("Evaluated {} of {} records ({} outcomes unmatched)",
                 report.records_evaluated, report.records_total, report.outcomes_unmatched);
    return report;
}

std::expected<RefitResult, RefitError> refit(
    const std::vector<PredictionRecord>& records,
    const std::vector<ObservedOutcome>& outcomes,
    VersionRegistry& registry, const EngineConfig& config) {

    std::unordered_map<std::string, const ObservedOutcome*> by_key;
    for (auto& o : outcomes) by_key.emplace(key_of(o.moment_id, o.player_id), &o);

    RefitResult result;
    std::vector<TrainingSample> samples;
    std::vector<std::pair<const MSSResult*, double>> targets;

    for (auto& record : records) {
        std::optional<RecordEvaluation> eval = record.evaluation();
        if (!eval) {
            auto it = by_key.find(key_of(record.result().moment_id, record.result().player_id));
            if (it == by_key.end()) continue;
            PredictionRecord scratch = record;
            if (auto ok = scratch.record_outcome(*it->second); !ok) {
                result.issues.push_back({"all", "outcome-rejected", ok.error().message});
                continue;
            }
            eval = scratch.evaluation();
        }
        samples.push_back({features_of(record.result()), eval->observed_delta});
        targets.emplace_back(&record.result(), eval->realized_mean_change);
    }

    if (samples.empty()) {
        return std::unexpected(RefitError{"no prediction records with observed outcomes"});
    }
    result.samples = static_cast<int>(samples.size());

    auto base_model = registry.latest_model();
    int model_version = registry.reserve_model_version();
    auto fitted = base_model
        ? base_model->refit(samples, model_version, config.predictor)
        : std::expected<std::shared_ptr<const TrajectoryModel>, PredictError>(
              LinearTrajectoryModel::fit(samples, model_version, config.predictor));
    if (!fitted) {
        return std::unexpected(RefitError{"model refit failed: " + fitted.error().message});
    }

    // Composer weights: no-intercept least squares of realized change on the
    // two weighted terms, rescaled to keep the base weights' total magnitude.
    auto base = registry.latest_weights();
    WeightSet next{
        .version = 0,
        .parent = base ? std::optional<int>(base->version) : std::nullopt,
        .w1 = base ? base->w1 : config.composer.w1,
        .w2 = base ? base->w2 : config.composer.w2,
    };

    double s11 = 0, s12 = 0, s22 = 0, s1y = 0, s2y = 0;
    for (auto& [r, y] : targets) {
        double x1 = r->breakdown.statistical;
        double x2 = r->breakdown.narrative * r->breakdown.context_multiplier;
        s11 += x1 * x1;
        s12 += x1 * x2;
        s22 += x2 * x2;
        s1y += x1 * y;
        s2y += x2 * y;
    }

    auto beta = solve_linear_system({{s11, s12}, {s12, s22}}, {s1y, s2y});
    if (!beta) {
        next.note = "weights carried over: components not separately identifiable";
        result.issues.push_back({"all", "weights-unidentified", next.note});
    } else {
        double b1 = std::max(0.0, (*beta)[0]);
        double b2 = std::max(0.0, (*beta)[1]);
        if (b1 + b2 <= 0.0) {
            next.note = "weights carried over: no positive association with outcomes";
            result.issues.push_back({"all", "non-positive-fit", next.note});
        } else {
            double total = std::abs(next.w1) + std::abs(next.w2);
            next.w1 = total * b1 / (b1 + b2);
            next.w2 = total * b2 / (b1 + b2);
            next.note = "refit on " + std::to_string(targets.size()) + " records";
        }
    }

    registry.publish_model(*fitted);
    result.model = *fitted;
    result.weights = registry.publish_weights(std::move(next));

    for (auto& issue : result.issues) {
        spdlog::warn("Refit [{}] {}: {}", issue.group, issue.kind, issue.detail);
    }
    spdlog::info("Refit produced weights v{} and model v{} from {} samples",
                 result.weights->version, result.model->version(), result.samples);
    return result;
}

std::expected<std::shared_ptr<const TrajectoryModel>, RefitError> train(
    const std::vector<MSSResult>& results,
    const std::vector<ObservedOutcome>& outcomes,
    VersionRegistry& registry, const EngineConfig& config) {

    std::unordered_map<std::string, const ObservedOutcome*> by_key;
    for (auto& o : outcomes) by_key.emplace(key_of(o.moment_id, o.player_id), &o);

    std::vector<TrainingSample> samples;
    for (auto& r : results) {
        auto it = by_key.find(key_of(r.moment_id, r.player_id));
        if (it == by_key.end()) continue;

        TrainingSample sample{.features = features_of(r)};
        for (double v : it->second->values) sample.realized_delta.push_back(v - r.baseline);
        samples.push_back(std::move(sample));
    }

    int version = registry.reserve_model_version();
    auto fitted = LinearTrajectoryModel::fit(samples, version, config.predictor);
    if (!fitted) {
        return std::unexpected(RefitError{"training failed: " + fitted.error().message});
    }

    std::shared_ptr<const TrajectoryModel> model = *fitted;
    registry.publish_model(model);
    spdlog::info("Trained model v{} from {} scored results", version, samples.size());
    return model;
}

} // namespace mss
