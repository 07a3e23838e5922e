#include <gtest/gtest.h>
#include "mss/evaluator.hpp"
#include <algorithm>
#include <cmath>

using namespace mss;

namespace {

MSSResult make_result(int i, double s, double n, Role role = Role::Batter) {
    MSSResult r;
    r.moment_id = "m" + std::to_string(i);
    r.player_id = "p" + std::to_string(i);
    r.weight_version = 1;
    r.role = role;
    r.baseline = 0.700;
    r.breakdown.statistical = s;
    r.breakdown.narrative = n;
    r.breakdown.context_multiplier = 1.0;
    r.breakdown.w1 = 60.0;
    r.breakdown.w2 = 40.0;
    r.composite = 60.0 * s + 40.0 * n;
    return r;
}

std::vector<MSSResult> make_results(int count) {
    std::vector<MSSResult> results;
    for (int i = 0; i < count; ++i) {
        double s = -0.3 + 0.6 * i / (count - 1);
        double n = std::cos(i * 2.3) * 0.5;
        results.push_back(make_result(i, s, n, i % 3 == 0 ? Role::Pitcher : Role::Batter));
    }
    return results;
}

// Observed values track the statistical component more than the narrative one.
std::vector<ObservedOutcome> make_outcomes(const std::vector<MSSResult>& results, int periods) {
    std::vector<ObservedOutcome> outcomes;
    for (auto& r : results) {
        ObservedOutcome o{.moment_id = r.moment_id, .player_id = r.player_id};
        for (int k = 0; k < periods; ++k) {
            o.values.push_back(r.baseline + 0.30 * r.breakdown.statistical +
                               0.05 * r.breakdown.narrative + 0.002 * ((k + 1) % 3));
        }
        outcomes.push_back(std::move(o));
    }
    return outcomes;
}

EngineConfig make_config() {
    EngineConfig c;
    c.context.trailing_window = 5;
    c.predictor.horizon = 3;
    c.predictor.ridge_lambda = 0.01;
    return c;
}

std::vector<PredictionRecord> make_records(const std::vector<MSSResult>& results,
                                           VersionRegistry& registry) {
    auto config = make_config();
    auto model = train(results, make_outcomes(results, 3), registry, config);
    EXPECT_TRUE(model.has_value());

    std::vector<PredictionRecord> records;
    for (auto& r : results) {
        auto record = predict(r, *model);
        EXPECT_TRUE(record.has_value());
        records.push_back(std::move(*record));
    }
    return records;
}

const CalibrationIssue* find_issue(const CalibrationReport& report, const std::string& kind) {
    auto it = std::ranges::find(report.issues, kind, &CalibrationIssue::kind);
    return it != report.issues.end() ? &*it : nullptr;
}

} // namespace

TEST(Evaluate, ReportsGroupsAndPositiveCorrelation) {
    VersionRegistry registry;
    auto results = make_results(24);
    auto records = make_records(results, registry);

    auto report = evaluate(records, make_outcomes(results, 3));
    EXPECT_EQ(report.records_total, 24);
    EXPECT_EQ(report.records_evaluated, 24);
    EXPECT_EQ(report.outcomes_unmatched, 0);
    EXPECT_EQ(report.record_errors.size(), 24u);

    ASSERT_EQ(report.groups.size(), 3u);
    EXPECT_EQ(report.groups[0].group, "all");
    EXPECT_EQ(report.groups[1].group, "batter");
    EXPECT_EQ(report.groups[2].group, "pitcher");
    EXPECT_EQ(report.groups[1].records + report.groups[2].records, 24);

    auto& all = report.groups[0];
    ASSERT_TRUE(all.correlation.has_value());
    EXPECT_GT(*all.correlation, 0.5);
    EXPECT_GE(all.directional_hit_rate, 0.5);
    EXPECT_GE(all.interval_coverage, 0.0);
    EXPECT_LE(all.interval_coverage, 1.0);
}

TEST(Evaluate, ZeroVarianceOutcomesBecomeIssueNotError) {
    VersionRegistry registry;
    auto results = make_results(10);
    auto records = make_records(results, registry);

    std::vector<ObservedOutcome> flat;
    for (auto& r : results) {
        flat.push_back({.moment_id = r.moment_id, .player_id = r.player_id,
                        .values = {0.700, 0.700, 0.700}});
    }

    auto report = evaluate(records, flat);
    EXPECT_EQ(report.records_evaluated, 10);
    ASSERT_FALSE(report.groups.empty());
    EXPECT_FALSE(report.groups[0].correlation.has_value());
    auto* issue = find_issue(report, "zero-variance-observed");
    ASSERT_NE(issue, nullptr);
    EXPECT_EQ(issue->group, "all");
}

TEST(Evaluate, EmptyBatchIsReported) {
    std::vector<PredictionRecord> records;
    auto report = evaluate(records, {});
    EXPECT_EQ(report.records_evaluated, 0);
    EXPECT_TRUE(report.groups.empty());
    EXPECT_NE(find_issue(report, "empty"), nullptr);
}

TEST(Evaluate, KeepsFirstOutcomeOnReevaluation) {
    VersionRegistry registry;
    auto results = make_results(8);
    auto records = make_records(results, registry);

    auto outcomes = make_outcomes(results, 3);
    evaluate(records, outcomes);
    double first = records[0].evaluation()->realized_mean_change;

    for (auto& o : outcomes) {
        for (auto& v : o.values) v += 1.0;
    }
    auto again = evaluate(records, outcomes);
    EXPECT_DOUBLE_EQ(records[0].evaluation()->realized_mean_change, first);
    EXPECT_NE(find_issue(again, "already-evaluated"), nullptr);
}

TEST(Evaluate, CountsUnmatchedAndDuplicateOutcomes) {
    VersionRegistry registry;
    auto results = make_results(6);
    auto records = make_records(results, registry);

    auto outcomes = make_outcomes(results, 3);
    outcomes.push_back(outcomes.front());
    outcomes.push_back({.moment_id = "elsewhere", .player_id = "nobody", .values = {0.5}});

    auto report = evaluate(records, outcomes);
    EXPECT_EQ(report.outcomes_unmatched, 1);
    EXPECT_NE(find_issue(report, "duplicate-outcome"), nullptr);
}

TEST(Train, NeedsEnoughMatchedOutcomes) {
    VersionRegistry registry;
    auto results = make_results(6);
    auto model = train(results, {}, registry, make_config());
    EXPECT_FALSE(model.has_value());
    EXPECT_TRUE(registry.model_versions().empty());
}

TEST(Refit, PublishesNewVersionsAndLeavesOldOnesUntouched) {
    VersionRegistry registry;
    auto base = registry.publish_weights({.w1 = 60.0, .w2 = 40.0, .note = "initial"});
    auto results = make_results(20);
    auto records = make_records(results, registry);
    auto old_model = registry.latest_model();
    ASSERT_NE(old_model, nullptr);

    auto outcomes = make_outcomes(results, 3);
    evaluate(records, outcomes);
    auto snapshot = records[3].trajectory();

    auto refitted = refit(records, outcomes, registry, make_config());
    ASSERT_TRUE(refitted.has_value());

    EXPECT_EQ(refitted->weights->version, base->version + 1);
    EXPECT_EQ(refitted->weights->parent, base->version);
    EXPECT_EQ(refitted->model->version(), old_model->version() + 1);
    EXPECT_EQ(refitted->samples, 20);

    EXPECT_EQ(registry.weights(base->version), base);
    EXPECT_DOUBLE_EQ(base->w1, 60.0);
    EXPECT_DOUBLE_EQ(base->w2, 40.0);
    EXPECT_EQ(registry.model(old_model->version()), old_model);
    EXPECT_EQ(registry.latest_model(), refitted->model);

    EXPECT_EQ(records[3].model_version(), old_model->version());
    EXPECT_EQ(records[3].trajectory().size(), snapshot.size());
    EXPECT_EQ(records[3].trajectory()[0].expected, snapshot[0].expected);
}

TEST(Refit, PreservesTotalWeightAndFavoursPredictiveComponent) {
    VersionRegistry registry;
    registry.publish_weights({.w1 = 50.0, .w2 = 50.0});
    auto results = make_results(20);
    auto records = make_records(results, registry);

    auto refitted = refit(records, make_outcomes(results, 3), registry, make_config());
    ASSERT_TRUE(refitted.has_value());
    EXPECT_NEAR(refitted->weights->w1 + refitted->weights->w2, 100.0, 1e-9);
    EXPECT_GT(refitted->weights->w1, refitted->weights->w2);
}

TEST(Refit, NoOutcomesIsAnError) {
    VersionRegistry registry;
    std::vector<PredictionRecord> records;
    auto refitted = refit(records, {}, registry, make_config());
    EXPECT_FALSE(refitted.has_value());
    EXPECT_TRUE(registry.weight_versions().empty());
}
