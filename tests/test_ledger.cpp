#include <gtest/gtest.h>
#include "mss/history_store.hpp"
#include "mss/json_io.hpp"
#include "mss/ledger.hpp"
#include "mss/moment_builder.hpp"
#include <cmath>
#include <filesystem>
#include <fstream>
#include <limits>

using namespace mss;
using namespace std::chrono;

namespace {

class LedgerTest : public ::testing::Test {
protected:
    std::filesystem::path dir = std::filesystem::temp_directory_path() / "mss_ledger_test";

    void SetUp() override { std::filesystem::remove_all(dir); }
    void TearDown() override { std::filesystem::remove_all(dir); }
};

MSSResult make_result(const std::string& moment, const std::string& player, int version = 1) {
    MSSResult r;
    r.moment_id = moment;
    r.player_id = player;
    r.weight_version = version;
    r.role = Role::Pitcher;
    r.side = Side::Adverse;
    r.stage = CareerStage::Rookie;
    r.delta_wp = -0.21;
    r.baseline = -1.5;
    r.breakdown = {.statistical = -0.21, .narrative = -0.4, .context_multiplier = 1.25,
                   .w1 = 60.0, .w2 = 40.0, .statistical_term = -12.6,
                   .narrative_term = -20.0, .raw = -32.6};
    r.composite = -32.6;
    return r;
}

std::shared_ptr<const LinearTrajectoryModel> make_model(int version) {
    PredictorConfig c;
    c.horizon = 2;
    PeriodCoefficients period{
        .beta = {0.0, 0.2, 0.05, 0.0, 0.0, 0.0},
        .sigma = 0.1,
        .samples = 12,
    };
    return std::make_shared<const LinearTrajectoryModel>(
        version, c, std::vector<PeriodCoefficients>(2, period));
}

} // namespace

TEST_F(LedgerTest, RejectsDuplicateResultKeys) {
    Ledger ledger(dir);
    EXPECT_TRUE(ledger.record_result(make_result("m1", "p1")).has_value());
    EXPECT_TRUE(ledger.record_result(make_result("m1", "p1", 2)).has_value());

    auto dup = ledger.record_result(make_result("m1", "p1"));
    ASSERT_FALSE(dup.has_value());
    EXPECT_EQ(ledger.results().size(), 2u);
}

TEST_F(LedgerTest, KeysSurviveReopen) {
    {
        Ledger ledger(dir);
        ASSERT_TRUE(ledger.record_result(make_result("m1", "p1")).has_value());
    }
    Ledger reopened(dir);
    EXPECT_TRUE(reopened.contains(LedgerStream::Results, "m1|p1|v1"));
    EXPECT_FALSE(reopened.record_result(make_result("m1", "p1")).has_value());

    auto results = reopened.results();
    ASSERT_EQ(results.size(), 1u);
    EXPECT_EQ(results[0].role, Role::Pitcher);
    EXPECT_DOUBLE_EQ(results[0].composite, -32.6);
    EXPECT_DOUBLE_EQ(results[0].breakdown.context_multiplier, 1.25);
}

TEST_F(LedgerTest, SkipsMalformedLines) {
    {
        Ledger ledger(dir);
        ASSERT_TRUE(ledger.record_result(make_result("m1", "p1")).has_value());
    }
    {
        std::ofstream f(dir / "results.jsonl", std::ios::app);
        f << "{not json\n";
    }
    Ledger reopened(dir);
    EXPECT_EQ(reopened.results().size(), 1u);
    EXPECT_TRUE(reopened.record_result(make_result("m2", "p1")).has_value());
    EXPECT_EQ(reopened.results().size(), 2u);
}

TEST_F(LedgerTest, EvaluatedPredictionSupersedesPredicted) {
    Ledger ledger(dir);
    auto model = make_model(3);
    auto record = predict(make_result("m1", "p1"), model);
    ASSERT_TRUE(record.has_value());
    ASSERT_TRUE(ledger.record_prediction(*record).has_value());
    EXPECT_FALSE(ledger.record_prediction(*record).has_value());

    ObservedOutcome o{.moment_id = "m1", .player_id = "p1", .values = {-1.0, -2.5},
                      .realized_shift = 44.0};
    ASSERT_TRUE(record->record_outcome(o).has_value());
    ASSERT_TRUE(ledger.record_prediction(*record).has_value());

    auto loaded = ledger.predictions();
    ASSERT_EQ(loaded.size(), 1u);
    EXPECT_TRUE(loaded[0].evaluated());
    EXPECT_EQ(loaded[0].model_version(), 3);
    EXPECT_DOUBLE_EQ(loaded[0].evaluation()->realized_mean_change,
                     record->evaluation()->realized_mean_change);
    EXPECT_EQ(loaded[0].evaluation()->realized_shift, 44.0);
    EXPECT_EQ(loaded[0].trajectory().size(), 2u);
}

TEST_F(LedgerTest, RestoresRegistryVersions) {
    {
        Ledger ledger(dir);
        ASSERT_TRUE(ledger.record_weights({.version = 1, .w1 = 60.0, .w2 = 40.0}).has_value());
        ASSERT_TRUE(ledger.record_weights({.version = 2, .parent = 1, .w1 = 70.0, .w2 = 30.0})
                        .has_value());
        ASSERT_TRUE(ledger.record_model(*make_model(1)).has_value());
        EXPECT_FALSE(ledger.record_model(*make_model(1)).has_value());
    }

    Ledger reopened(dir);
    VersionRegistry registry;
    EXPECT_EQ(reopened.restore(registry), 3);
    EXPECT_EQ(registry.weight_versions(), (std::vector<int>{1, 2}));
    EXPECT_EQ(registry.latest_weights()->parent, 1);
    EXPECT_DOUBLE_EQ(registry.latest_weights()->w1, 70.0);

    auto model = registry.model(1);
    ASSERT_NE(model, nullptr);
    EXPECT_TRUE(model->trained());
    EXPECT_EQ(model->horizon(), 2);
    EXPECT_EQ(registry.reserve_model_version(), 2);
}

TEST_F(LedgerTest, HistoryStoreFiltersFutureAppearances) {
    auto now = system_clock::from_time_t(1700000000);
    PlayerHistory h;
    h.player_id = "p1";
    h.career_plate_appearances = 900;
    h.appearances = {
        {"g1", now - hours(48), 0.7},
        {"g2", now - hours(24), 0.8},
        {"g3", now + hours(24), 0.9},
    };

    HistoryStore store(dir / "history");
    ASSERT_TRUE(store.store(h));

    HistoryStore fresh(dir / "history");
    auto loaded = fresh.history("p1", now);
    ASSERT_TRUE(loaded.has_value());
    EXPECT_EQ(loaded->career_plate_appearances, 900);
    EXPECT_EQ(loaded->appearances.size(), 2u);

    auto missing = fresh.history("nobody", now);
    ASSERT_FALSE(missing.has_value());
    EXPECT_EQ(missing.error().player_id, "nobody");
}

TEST_F(LedgerTest, HistoryStoreLoadsBatchFile) {
    std::filesystem::create_directories(dir);
    {
        std::ofstream f(dir / "histories.json");
        f << R"([
            {"player_id": "a", "career_plate_appearances": 100,
             "appearances": [{"game_id": "g1", "date": "2023-06-01T19:05:00", "performance": 0.6}]},
            {"career_plate_appearances": 5},
            {"player_id": "b", "career_innings_pitched": 400.5, "appearances": []}
        ])";
    }

    HistoryStore store(dir / "history");
    auto loaded = store.load_file(dir / "histories.json");
    ASSERT_TRUE(loaded.has_value());
    EXPECT_EQ(*loaded, 2);

    auto a = store.history("a", system_clock::from_time_t(1800000000));
    ASSERT_TRUE(a.has_value());
    ASSERT_EQ(a->appearances.size(), 1u);
    EXPECT_DOUBLE_EQ(a->appearances[0].performance, 0.6);
}

TEST_F(LedgerTest, HistoryStorePersistsLoadedHistories) {
    std::filesystem::create_directories(dir);
    {
        std::ofstream f(dir / "histories.json");
        f << R"([
            {"player_id": "a", "career_plate_appearances": 100,
             "appearances": [{"game_id": "g1", "date": "2023-06-01T19:05:00", "performance": 0.6},
                             {"game_id": "g2", "date": "June first", "performance": 0.9}]}
        ])";
    }

    HistoryStore store(dir / "history");
    ASSERT_TRUE(store.load_file(dir / "histories.json").has_value());
    auto persisted = store.persist();
    ASSERT_TRUE(persisted.has_value());
    EXPECT_EQ(*persisted, 1);
    EXPECT_TRUE(std::filesystem::exists(dir / "history" / "a.json"));

    HistoryStore fresh(dir / "history");
    auto a = fresh.history("a", system_clock::from_time_t(1800000000));
    ASSERT_TRUE(a.has_value());
    EXPECT_EQ(a->career_plate_appearances, 100);
    // The appearance with an unreadable date was dropped on load.
    ASSERT_EQ(a->appearances.size(), 1u);
    EXPECT_EQ(a->appearances[0].game_id, "g1");
}

TEST_F(LedgerTest, PredictionWithSkippedPeriodReloads) {
    auto record = predict(make_result("m1", "p1"), make_model(1));
    ASSERT_TRUE(record.has_value());
    ObservedOutcome o{.moment_id = "m1", .player_id = "p1",
                      .values = {-1.4, std::numeric_limits<double>::quiet_NaN()}};
    ASSERT_TRUE(record->record_outcome(o).has_value());

    auto text = prediction_to_json(*record).dump();
    auto reloaded = prediction_from_json(nlohmann::json::parse(text));
    ASSERT_TRUE(reloaded.has_value());
    ASSERT_TRUE(reloaded->evaluated());
    EXPECT_EQ(reloaded->evaluation()->periods_compared, 1);
    ASSERT_EQ(reloaded->observed()->values.size(), 2u);
    EXPECT_TRUE(std::isnan(reloaded->observed()->values[1]));
}

TEST(JsonIo, ParsesRawEventFields) {
    auto e = parse_raw_event(nlohmann::json::parse(R"({
        "moment_id": "m7", "game_id": "g7", "timestamp": 1700000000,
        "inning": 9, "half": "bottom", "season_phase": "postseason", "outcome": "home_run",
        "score_before": {"home": 3, "away": 4}, "score_after": {"home": 5, "away": 4},
        "wp_before": 0.22, "wp_after": 1.0,
        "batter_id": "b", "pitcher_id": "p", "fielder_ids": ["lf"],
        "pitches": [{"number": 1, "pitch_type": "FF", "speed_mph": 98.2, "result": "hit"}]
    })"));
    EXPECT_EQ(e.moment_id, "m7");
    ASSERT_TRUE(e.timestamp.has_value());
    EXPECT_EQ(system_clock::to_time_t(*e.timestamp), 1700000000);
    EXPECT_EQ(e.home_score_after, 5);
    ASSERT_TRUE(e.wp_after.has_value());
    EXPECT_DOUBLE_EQ(*e.wp_after, 1.0);
    ASSERT_EQ(e.pitches.size(), 1u);
    EXPECT_DOUBLE_EQ(e.pitches[0].speed_mph, 98.2);
}

TEST(JsonIo, MissingWinProbabilityStaysUnset) {
    auto e = parse_raw_event(nlohmann::json::parse(R"({"moment_id": "m1", "wp_before": null})"));
    EXPECT_FALSE(e.wp_before.has_value());
    EXPECT_FALSE(e.wp_after.has_value());
    EXPECT_FALSE(e.timestamp.has_value());
}

TEST(JsonIo, MalformedTimestampIsReportedMissing) {
    auto e = parse_raw_event(nlohmann::json::parse(R"({
        "moment_id": "m1", "game_id": "g1", "timestamp": "not-a-date",
        "inning": 3, "half": "top", "season_phase": "regular", "outcome": "single",
        "wp_before": 0.5, "wp_after": 0.45, "batter_id": "b", "pitcher_id": "p"
    })"));
    EXPECT_FALSE(e.timestamp.has_value());

    auto m = build_moment(e);
    ASSERT_FALSE(m.has_value());
    EXPECT_EQ(m.error().kind, MalformedKind::MissingField);
    EXPECT_EQ(m.error().fields, std::vector<std::string>{"timestamp"});
}

TEST(JsonIo, TimestampNeedsEveryField) {
    EXPECT_FALSE(parse_timestamp("2023-06-01").has_value());
    EXPECT_FALSE(parse_timestamp("2023-13-01T10:00:00").has_value());
    EXPECT_FALSE(parse_timestamp(nlohmann::json(true)).has_value());
    auto t = parse_timestamp("2023-11-14T22:13:20");
    ASSERT_TRUE(t.has_value());
    EXPECT_EQ(system_clock::to_time_t(*t), 1700000000);
}

TEST(JsonIo, EventsCarryRispAndContactData) {
    auto o = parse_observed_outcome(nlohmann::json::parse(R"({
        "moment_id": "m1", "player_id": "p", "role": "pitcher",
        "before": [{"event": "strikeout", "pitch_speeds": [94.0, 95.0]},
                   {"event": "field_out", "risp": true, "launch_speed": 99.0, "launch_angle": 20.0}],
        "periods": [[{"event": "strikeout", "pitch_speeds": [96.5]},
                     {"event": "field_out", "risp": true, "launch_speed": 85.0, "launch_angle": 2.0}],
                    []]
    })"));
    ASSERT_EQ(o.values.size(), 2u);
    EXPECT_TRUE(std::isfinite(o.values[0]));
    EXPECT_TRUE(std::isnan(o.values[1]));
    // Velocity and barrel rate allowed both improved; every rate is unchanged.
    ASSERT_TRUE(o.realized_shift.has_value());
    EXPECT_GT(*o.realized_shift, 50.0);
}

TEST(JsonIo, OutcomeFromPeriodEvents) {
    auto o = parse_observed_outcome(nlohmann::json::parse(R"({
        "moment_id": "m1", "player_id": "b", "role": "batter",
        "before": ["strikeout", "single"],
        "periods": [["home_run"], ["field_out", {"event": "double", "runs_scored": 1}]]
    })"));
    ASSERT_EQ(o.values.size(), 2u);
    EXPECT_DOUBLE_EQ(o.values[0], 5.0);
    EXPECT_DOUBLE_EQ(o.values[1], 0.5 + 1.0);
    EXPECT_TRUE(o.realized_shift.has_value());
}
