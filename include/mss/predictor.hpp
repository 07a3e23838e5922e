#pragma once

#include "mss/config.hpp"
#include "mss/types.hpp"
#include <expected>
#include <memory>
#include <optional>
#include <string>
#include <vector>

namespace mss {

struct PredictionFeatures {
    double statistical = 0.0;
    double narrative = 0.0;
    double multiplier = 1.0;
    double baseline = 0.0;
    Role role = Role::Batter;
};

PredictionFeatures features_of(const MSSResult& result);

// realized_delta[k] is the observed change against baseline in period k + 1.
struct TrainingSample {
    PredictionFeatures features;
    std::vector<double> realized_delta;
};

// Feature set in, per-period trajectory with intervals out. Fitted models are
// immutable; refitting always yields a new instance under a new version, fit
// with the predictor settings in force at refit time.
class TrajectoryModel {
public:
    virtual ~TrajectoryModel() = default;

    virtual int version() const = 0;
    virtual bool trained() const = 0;
    virtual int horizon() const = 0;

    virtual std::vector<TrajectoryPoint> trajectory(const PredictionFeatures& features) const = 0;

    virtual std::expected<std::shared_ptr<const TrajectoryModel>, PredictError> refit(
        const std::vector<TrainingSample>& samples, int new_version,
        const PredictorConfig& config) const = 0;
};

struct PeriodCoefficients {
    std::vector<double> beta; // intercept, S, N, multiplier, baseline, pitcher
    double sigma = 0.0;
    int samples = 0;
};

// Per-period ridge regression. Coefficients on S and N are kept non-negative,
// so a larger statistical or narrative component never lowers the forecast.
class LinearTrajectoryModel final : public TrajectoryModel {
public:
    static constexpr int feature_count = 6;

    LinearTrajectoryModel(int version, PredictorConfig config);
    LinearTrajectoryModel(int version, PredictorConfig config,
                          std::vector<PeriodCoefficients> periods);

    static std::expected<std::shared_ptr<const LinearTrajectoryModel>, PredictError> fit(
        const std::vector<TrainingSample>& samples, int version, const PredictorConfig& config);

    int version() const override { return version_; }
    bool trained() const override { return !periods_.empty(); }
    int horizon() const override { return config_.horizon; }

    std::vector<TrajectoryPoint> trajectory(const PredictionFeatures& features) const override;

    std::expected<std::shared_ptr<const TrajectoryModel>, PredictError> refit(
        const std::vector<TrainingSample>& samples, int new_version,
        const PredictorConfig& config) const override;

    const std::vector<PeriodCoefficients>& periods() const { return periods_; }
    const PredictorConfig& config() const { return config_; }

private:
    int version_;
    PredictorConfig config_;
    std::vector<PeriodCoefficients> periods_;
};

enum class OutcomeErrorKind { AlreadyEvaluated, KeyMismatch, NoOverlap, NonFinite };

struct OutcomeError {
    OutcomeErrorKind kind = OutcomeErrorKind::AlreadyEvaluated;
    std::string message;
};

// Links a score to its forecast. Moves from "predicted" to "evaluated" exactly
// once, when the observed trajectory is recorded.
class PredictionRecord {
public:
    PredictionRecord(MSSResult result, int model_version,
                     std::vector<TrajectoryPoint> trajectory);

    const MSSResult& result() const { return result_; }
    int model_version() const { return model_version_; }
    const std::vector<TrajectoryPoint>& trajectory() const { return trajectory_; }

    bool evaluated() const { return evaluation_.has_value(); }
    const std::optional<ObservedOutcome>& observed() const { return observed_; }
    const std::optional<RecordEvaluation>& evaluation() const { return evaluation_; }

    std::expected<void, OutcomeError> record_outcome(const ObservedOutcome& outcome);

private:
    MSSResult result_;
    int model_version_;
    std::vector<TrajectoryPoint> trajectory_;
    std::optional<ObservedOutcome> observed_;
    std::optional<RecordEvaluation> evaluation_;
};

std::expected<PredictionRecord, PredictError> predict(
    const MSSResult& result, const std::shared_ptr<const TrajectoryModel>& model);

} // namespace mss
