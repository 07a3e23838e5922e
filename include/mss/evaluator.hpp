#pragma once

#include "mss/config.hpp"
#include "mss/predictor.hpp"
#include "mss/types.hpp"
#include "mss/versions.hpp"
#include <expected>
#include <memory>
#include <optional>
#include <string>
#include <vector>

namespace mss {

struct RecordError {
    std::string moment_id;
    std::string player_id;
    double composite = 0.0;
    double mean_abs_deviation = 0.0;
    double rmse = 0.0;
    double realized_mean_change = 0.0;
    int periods_compared = 0;
};

struct GroupMetrics {
    std::string group;
    int records = 0;
    double mean_abs_deviation = 0.0;
    double rmse = 0.0;
    std::optional<double> correlation;
    std::optional<double> magnitude_correlation;
    std::optional<double> shift_correlation;
    double directional_hit_rate = 0.0;
    double interval_coverage = 0.0;
    // realized mean change against predicted mean change
    double calibration_slope = 0.0;
    double calibration_intercept = 0.0;
    double calibration_r_squared = 0.0;
};

struct CalibrationIssue {
    std::string group;
    std::string kind;
    std::string detail;
};

struct CalibrationReport {
    int records_total = 0;
    int records_evaluated = 0;
    int outcomes_unmatched = 0;
    std::vector<RecordError> record_errors;
    std::vector<GroupMetrics> groups;
    std::vector<CalibrationIssue> issues;
};

// Records the matching outcomes on records that are still "predicted" and
// reports per-record errors plus batch metrics for the "all", "batter" and
// "pitcher" groups. Degenerate groups are reported as issues, never thrown.
CalibrationReport evaluate(std::vector<PredictionRecord>& records,
                           const std::vector<ObservedOutcome>& outcomes);

struct RefitResult {
    std::shared_ptr<const WeightSet> weights;
    std::shared_ptr<const TrajectoryModel> model;
    int samples = 0;
    std::vector<CalibrationIssue> issues;
};

struct RefitError {
    std::string message;
};

// Fits new composer weights and a new trajectory model against the observed
// outcomes and publishes both as new versions. Existing records, results and
// versions are left untouched.
std::expected<RefitResult, RefitError> refit(
    const std::vector<PredictionRecord>& records,
    const std::vector<ObservedOutcome>& outcomes,
    VersionRegistry& registry, const EngineConfig& config);

// Fits the first trajectory model straight from scored results and their
// observed outcomes, for a registry that has no model to predict with yet.
std::expected<std::shared_ptr<const TrajectoryModel>, RefitError> train(
    const std::vector<MSSResult>& results,
    const std::vector<ObservedOutcome>& outcomes,
    VersionRegistry& registry, const EngineConfig& config);

} // namespace mss
