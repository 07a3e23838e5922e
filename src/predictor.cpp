#include "mss/predictor.hpp"
#include "mss/analytics.hpp"
#include <algorithm>
#include <array>
#include <cmath>
#include <spdlog/spdlog.h>

namespace mss {

namespace {

constexpr int n_features = LinearTrajectoryModel::feature_count;
constexpr int col_statistical = 1;
constexpr int col_narrative = 2;

std::array<double, n_features> design_row(const PredictionFeatures& f) {
    return {1.0, f.statistical, f.narrative, f.multiplier, f.baseline,
            f.role == Role::Pitcher ? 1.0 : 0.0};
}

double dot(const std::vector<double>& beta, const std::array<double, n_features>& x) {
    double sum = 0.0;
    for (int i = 0; i < n_features; ++i) sum += beta[i] * x[i];
    return sum;
}

// Ridge solve over the active columns; inactive columns get a zero coefficient.
std::optional<std::vector<double>> solve_ridge(
    const std::vector<std::array<double, n_features>>& rows,
    const std::vector<double>& y, const std::array<bool, n_features>& active, double lambda) {

    std::vector<std::vector<double>> a(n_features, std::vector<double>(n_features, 0.0));
    std::vector<double> b(n_features, 0.0);

    for (size_t r = 0; r < rows.size(); ++r) {
        for (int i = 0; i < n_features; ++i) {
            b[i] += rows[r][i] * y[r];
            for (int j = 0; j < n_features; ++j) a[i][j] += rows[r][i] * rows[r][j];
        }
    }
    for (int i = 1; i < n_features; ++i) a[i][i] += lambda;

    for (int i = 0; i < n_features; ++i) {
        if (active[i]) continue;
        for (int j = 0; j < n_features; ++j) {
            a[i][j] = 0.0;
            a[j][i] = 0.0;
        }
        a[i][i] = 1.0;
        b[i] = 0.0;
    }
    return solve_linear_system(std::move(a), std::move(b));
}

std::expected<PeriodCoefficients, PredictError> fit_period(
    const std::vector<std::array<double, n_features>>& rows,
    const std::vector<double>& y, const PredictorConfig& config) {

    std::array<bool, n_features> active{};
    active.fill(true);

    // Columns that never vary away from zero carry no information.
    for (int i = 1; i < n_features; ++i) {
        bool any = std::ranges::any_of(rows, [&](const auto& r) { return r[i] != 0.0; });
        if (!any) active[i] = false;
    }

    std::vector<double> beta;
    for (int attempt = 0; attempt < 3; ++attempt) {
        auto solved = solve_ridge(rows, y, active, config.ridge_lambda);
        if (!solved) {
            return std::unexpected(PredictError{
                PredictErrorKind::InvalidInput, "singular design matrix; raise ridge_lambda"});
        }
        beta = std::move(*solved);

        bool adjusted = false;
        for (int col : {col_statistical, col_narrative}) {
            if (active[col] && beta[col] < 0.0) {
                active[col] = false;
                adjusted = true;
            }
        }
        if (!adjusted) break;
    }
    for (int col : {col_statistical, col_narrative}) beta[col] = std::max(0.0, beta[col]);

    int n = static_cast<int>(rows.size());
    int p = static_cast<int>(std::ranges::count(active, true));
    double ssr = 0.0;
    for (int r = 0; r < n; ++r) {
        double e = y[r] - dot(beta, rows[r]);
        ssr += e * e;
    }

    return PeriodCoefficients{
        .beta = std::move(beta),
        .sigma = std::sqrt(ssr / std::max(1, n - p)),
        .samples = n,
    };
}

} // namespace

PredictionFeatures features_of(const MSSResult& result) {
    return {
        .statistical = result.breakdown.statistical,
        .narrative = result.breakdown.narrative,
        .multiplier = result.breakdown.context_multiplier,
        .baseline = result.baseline,
        .role = result.role,
    };
}

LinearTrajectoryModel::LinearTrajectoryModel(int version, PredictorConfig config)
    : version_(version), config_(config) {}

LinearTrajectoryModel::LinearTrajectoryModel(int version, PredictorConfig config,
                                             std::vector<PeriodCoefficients> periods)
    : version_(version), config_(config), periods_(std::move(periods)) {}

std::expected<std::shared_ptr<const LinearTrajectoryModel>, PredictError>
LinearTrajectoryModel::fit(const std::vector<TrainingSample>& samples, int version,
                           const PredictorConfig& config) {

    std::vector<PeriodCoefficients> periods;
    for (int k = 0; k < config.horizon; ++k) {
        std::vector<std::array<double, n_features>> rows;
        std::vector<double> y;
        for (auto& s : samples) {
            if (static_cast<int>(s.realized_delta.size()) <= k) continue;
            if (!std::isfinite(s.realized_delta[k])) continue;
            rows.push_back(design_row(s.features));
            y.push_back(s.realized_delta[k]);
        }

        if (static_cast<int>(rows.size()) < config.min_training_samples) {
            if (k == 0) {
                return std::unexpected(PredictError{
                    PredictErrorKind::InvalidInput,
                    "need at least " + std::to_string(config.min_training_samples) +
                        " training samples, got " + std::to_string(rows.size())});
            }
            // Later periods with thin coverage reuse the previous period's fit.
            auto inherited = periods.back();
            inherited.samples = 0;
            periods.push_back(std::move(inherited));
            continue;
        }

        auto coeffs = fit_period(rows, y, config);
        if (!coeffs) return std::unexpected(coeffs.error());
        periods.push_back(std::move(*coeffs));
    }

    spdlog::info("Fitted trajectory model v{} on {} samples over {} periods",
                 version, samples.size(), config.horizon);
    return std::make_shared<const LinearTrajectoryModel>(version, config, std::move(periods));
}

std::vector<TrajectoryPoint> LinearTrajectoryModel::trajectory(
    const PredictionFeatures& features) const {

    std::vector<TrajectoryPoint> points;
    auto x = design_row(features);
    for (int k = 0; k < static_cast<int>(periods_.size()); ++k) {
        auto& p = periods_[k];
        double expected = dot(p.beta, x);
        double half_width = config_.interval_z * p.sigma;
        points.push_back({
            .period = k + 1,
            .expected = expected,
            .lower = expected - half_width,
            .upper = expected + half_width,
        });
    }
    return points;
}

std::expected<std::shared_ptr<const TrajectoryModel>, PredictError>
LinearTrajectoryModel::refit(const std::vector<TrainingSample>& samples, int new_version,
                             const PredictorConfig& config) const {
    auto fitted = fit(samples, new_version, config);
    if (!fitted) return std::unexpected(fitted.error());
    return std::shared_ptr<const TrajectoryModel>(*fitted);
}

PredictionRecord::PredictionRecord(MSSResult result, int model_version,
                                   std::vector<TrajectoryPoint> trajectory)
    : result_(std::move(result)),
      model_version_(model_version),
      trajectory_(std::move(trajectory)) {}

std::expected<void, OutcomeError> PredictionRecord::record_outcome(const ObservedOutcome& outcome) {
    if (evaluated()) {
        return std::unexpected(OutcomeError{OutcomeErrorKind::AlreadyEvaluated,
                                            "record already evaluated"});
    }
    if (outcome.moment_id != result_.moment_id || outcome.player_id != result_.player_id) {
        return std::unexpected(OutcomeError{OutcomeErrorKind::KeyMismatch,
                                            "outcome belongs to " + outcome.moment_id + "/" +
                                                outcome.player_id});
    }

    int k = static_cast<int>(std::min(trajectory_.size(), outcome.values.size()));
    if (k == 0) {
        return std::unexpected(OutcomeError{OutcomeErrorKind::NoOverlap,
                                            "no observed periods overlap the forecast"});
    }

    // NaN marks a period the player sat out: it keeps its slot in
    // observed_delta but is not compared.
    RecordEvaluation eval;
    std::vector<double> compared;
    double abs_sum = 0.0;
    double sq_sum = 0.0;
    for (int i = 0; i < k; ++i) {
        double value = outcome.values[i];
        if (std::isnan(value)) {
            eval.observed_delta.push_back(value);
            continue;
        }
        if (!std::isfinite(value)) {
            return std::unexpected(OutcomeError{OutcomeErrorKind::NonFinite,
                                                "non-finite observed value in period " +
                                                    std::to_string(i + 1)});
        }
        double delta = value - result_.baseline;
        double err = trajectory_[i].expected - delta;
        eval.observed_delta.push_back(delta);
        compared.push_back(delta);
        abs_sum += std::abs(err);
        sq_sum += err * err;
        if (delta >= trajectory_[i].lower && delta <= trajectory_[i].upper) eval.inside_interval++;
    }
    if (compared.empty()) {
        return std::unexpected(OutcomeError{OutcomeErrorKind::NoOverlap,
                                            "no observed periods overlap the forecast"});
    }

    double n = static_cast<double>(compared.size());
    eval.periods_compared = static_cast<int>(compared.size());
    eval.mean_abs_deviation = abs_sum / n;
    eval.rmse = std::sqrt(sq_sum / n);
    eval.realized_mean_change = mean(compared);
    eval.realized_shift = outcome.realized_shift;

    observed_ = outcome;
    evaluation_ = std::move(eval);
    return {};
}

std::expected<PredictionRecord, PredictError> predict(
    const MSSResult& result, const std::shared_ptr<const TrajectoryModel>& model) {

    if (!model) {
        return std::unexpected(PredictError{PredictErrorKind::UnknownVersion,
                                            "no model registered under that version"});
    }
    if (!model->trained()) {
        return std::unexpected(PredictError{
            PredictErrorKind::UntrainedModel,
            "model v" + std::to_string(model->version()) + " has not been fit on any batch"});
    }

    auto features = features_of(result);
    if (!std::isfinite(features.statistical) || !std::isfinite(features.narrative) ||
        !std::isfinite(features.multiplier) || !std::isfinite(features.baseline)) {
        return std::unexpected(PredictError{PredictErrorKind::InvalidInput,
                                            "non-finite score components"});
    }

    return PredictionRecord(result, model->version(), model->trajectory(features));
}

} // namespace mss
