#include <gtest/gtest.h>
#include "mss/composer.hpp"
#include "mss/context.hpp"
#include "mss/impact.hpp"
#include "mss/json_io.hpp"

using namespace mss;
using namespace std::chrono;

namespace {

Moment make_moment(double wp_before, double wp_after, SeasonPhase phase) {
    Moment m;
    m.id = "m1";
    m.game_id = "g1";
    m.timestamp = system_clock::from_time_t(1700000000);
    m.inning = 9;
    m.half = HalfInning::Bottom;
    m.phase = phase;
    m.wp_before = wp_before;
    m.wp_after = wp_after;
    m.batter_id = "rookie";
    m.pitcher_id = "closer";
    return m;
}

PlayerContext make_context(const Moment& m, CareerStage stage, double baseline = 0.750,
                           double career = 0.750) {
    PlayerContext c;
    c.player_id = "rookie";
    c.role = Role::Batter;
    c.stage = stage;
    c.baseline = baseline;
    c.career_performance = career;
    c.home_team = true;
    c.signed_delta_wp = m.delta_wp();
    c.side = side_for(c.signed_delta_wp);
    return c;
}

SentimentSignal signal(double value) {
    SentimentSignal s;
    s.value = value;
    s.used = 1;
    s.total_weight = 1.0;
    return s;
}

WeightSet weights(double w1 = 60.0, double w2 = 40.0) {
    return {.version = 1, .w1 = w1, .w2 = w2};
}

} // namespace

TEST(Composer, PostseasonRookieScenario) {
    ComposerConfig config;
    config.rookie_factor = 1.2;
    ImpactConfig impact;

    auto m = make_moment(0.30, 0.65, SeasonPhase::Postseason);
    auto ctx = make_context(m, CareerStage::Rookie);
    double s = statistical_component(m, ctx, impact);
    EXPECT_NEAR(s, 0.525, 1e-12);
    EXPECT_NEAR(context_multiplier(ctx, config), 1.2, 1e-12);

    auto r = compose(m, ctx, s, signal(0.2), weights(), config);
    EXPECT_NEAR(r.composite, 41.1, 1e-9);
    EXPECT_NEAR(r.breakdown.statistical_term, 31.5, 1e-9);
    EXPECT_NEAR(r.breakdown.narrative_term, 9.6, 1e-9);
    EXPECT_FALSE(r.breakdown.clamped);
    EXPECT_FALSE(r.no_sentiment_data);
    EXPECT_EQ(r.weight_version, 1);
    EXPECT_EQ(r.side, Side::Beneficiary);
}

TEST(Composer, BreakdownSumsToRaw) {
    ComposerConfig config;
    auto m = make_moment(0.55, 0.41, SeasonPhase::Regular);
    auto ctx = make_context(m, CareerStage::Veteran, 0.600, 0.800);

    auto r = compose(m, ctx, statistical_component(m, ctx, ImpactConfig{}), signal(-0.35),
                     weights(55.0, 45.0), config);
    auto& b = r.breakdown;
    EXPECT_DOUBLE_EQ(b.raw, b.statistical_term + b.narrative_term);
    EXPECT_DOUBLE_EQ(b.statistical_term, b.w1 * b.statistical);
    EXPECT_DOUBLE_EQ(b.narrative_term, b.w2 * b.narrative * b.context_multiplier);
    EXPECT_DOUBLE_EQ(r.composite, b.raw);
    EXPECT_LT(r.composite, 0.0);
}

TEST(Composer, ClampsToScoreBound) {
    ComposerConfig config;
    config.score_bound = 50.0;
    auto m = make_moment(0.05, 0.95, SeasonPhase::Postseason);
    auto ctx = make_context(m, CareerStage::Rookie);

    auto r = compose(m, ctx, statistical_component(m, ctx, ImpactConfig{}), signal(1.0),
                     weights(), config);
    EXPECT_DOUBLE_EQ(r.composite, 50.0);
    EXPECT_TRUE(r.breakdown.clamped);
    EXPECT_GT(r.breakdown.raw, 50.0);
}

TEST(Composer, OversizedBoundStillCapsAtHundred) {
    ComposerConfig config;
    config.score_bound = 1000.0;
    auto m = make_moment(0.05, 0.95, SeasonPhase::Postseason);
    auto ctx = make_context(m, CareerStage::Rookie);

    auto r = compose(m, ctx, statistical_component(m, ctx, ImpactConfig{}), signal(1.0),
                     weights(), config);
    ASSERT_GT(r.breakdown.raw, 100.0);
    EXPECT_DOUBLE_EQ(r.composite, 100.0);
    EXPECT_TRUE(r.breakdown.clamped);
}

TEST(Composer, NoSentimentFlagPropagates) {
    SentimentSignal none;
    none.no_data = true;
    auto m = make_moment(0.40, 0.50, SeasonPhase::Regular);
    auto ctx = make_context(m, CareerStage::Prime);

    auto r = compose(m, ctx, 0.1, none, weights(), ComposerConfig{});
    EXPECT_TRUE(r.no_sentiment_data);
    EXPECT_DOUBLE_EQ(r.breakdown.narrative_term, 0.0);
    EXPECT_NEAR(r.composite, 6.0, 1e-12);
}

TEST(ContextMultiplier, RookiesAndSlumpsRaiseIt) {
    ComposerConfig config;
    auto m = make_moment(0.40, 0.50, SeasonPhase::Regular);

    double prime = context_multiplier(make_context(m, CareerStage::Prime), config);
    double rookie = context_multiplier(make_context(m, CareerStage::Rookie), config);
    double slumping = context_multiplier(make_context(m, CareerStage::Prime, 0.600, 0.800), config);

    EXPECT_DOUBLE_EQ(prime, 1.0);
    EXPECT_GT(rookie, prime);
    EXPECT_NEAR(slumping, 1.0 + 0.5 * 0.25, 1e-12);
}

TEST(ContextMultiplier, CappedAtMaximum) {
    ComposerConfig config;
    config.rookie_factor = 1.8;
    config.slump_sensitivity = 2.0;
    config.max_multiplier = 2.0;
    auto m = make_moment(0.40, 0.50, SeasonPhase::Regular);

    auto ctx = make_context(m, CareerStage::Rookie, 0.100, 0.900);
    EXPECT_DOUBLE_EQ(context_multiplier(ctx, config), 2.0);
}

TEST(Composer, RepeatedRunsSerializeIdentically) {
    auto m = make_moment(0.30, 0.65, SeasonPhase::Postseason);
    auto ctx = make_context(m, CareerStage::Rookie, 0.700, 0.800);
    ComposerConfig config;
    ImpactConfig impact;

    std::string first;
    for (int i = 0; i < 5; ++i) {
        auto r = compose(m, ctx, statistical_component(m, ctx, impact), signal(0.2),
                         weights(), config);
        auto dumped = result_to_json(r).dump();
        if (i == 0) first = dumped;
        EXPECT_EQ(dumped, first);
    }
}

TEST(Composer, ResultSurvivesJsonRoundTrip) {
    auto m = make_moment(0.62, 0.18, SeasonPhase::Regular);
    auto ctx = make_context(m, CareerStage::Veteran, 0.650, 0.700);
    auto r = compose(m, ctx, statistical_component(m, ctx, ImpactConfig{}), signal(-0.6),
                     weights(), ComposerConfig{});

    auto back = result_from_json(nlohmann::json::parse(result_to_json(r).dump()));
    EXPECT_EQ(back.moment_id, r.moment_id);
    EXPECT_EQ(back.side, Side::Adverse);
    EXPECT_EQ(back.stage, CareerStage::Veteran);
    EXPECT_DOUBLE_EQ(back.composite, r.composite);
    EXPECT_DOUBLE_EQ(back.breakdown.raw, r.breakdown.raw);
    EXPECT_DOUBLE_EQ(back.breakdown.context_multiplier, r.breakdown.context_multiplier);
}
