#include <gtest/gtest.h>
#include "mss/config.hpp"
#include <cstdlib>
#include <fstream>
#include <filesystem>
#include <limits>

using namespace mss;

namespace {

class EnvTest : public ::testing::Test {
protected:
    std::filesystem::path test_env_path = "test_mss_env_file.env";

    void TearDown() override {
        std::filesystem::remove(test_env_path);
    }

    void write_env(const std::string& content) {
        std::ofstream f(test_env_path);
        f << content;
    }
};

class ConfigTest : public ::testing::Test {
protected:
    void TearDown() override {
        for (auto* key : {"MSS_TRAILING_WINDOW", "MSS_W1", "MSS_HISTORY_POLICY",
                          "MSS_PHASE_WEIGHT_POSTSEASON", "MSS_WORKERS"}) {
            ::unsetenv(key);
        }
    }
};

const char* minimal_config = R"({"context": {"trailing_window": 10}})";

} // namespace

TEST_F(EnvTest, ParsesSimpleKeyValue) {
    write_env("MSS_TEST_KEY=my_value\n");
    auto vars = load_env(test_env_path);
    EXPECT_EQ(vars["MSS_TEST_KEY"], "my_value");
    ::unsetenv("MSS_TEST_KEY");
}

TEST_F(EnvTest, StripsQuotesAndSkipsComments) {
    write_env("# weights\nMSS_TEST_A=\"60\"\n\nMSS_TEST_B='40'\n");
    auto vars = load_env(test_env_path);
    EXPECT_EQ(vars.size(), 2u);
    EXPECT_EQ(vars["MSS_TEST_A"], "60");
    EXPECT_EQ(vars["MSS_TEST_B"], "40");
    ::unsetenv("MSS_TEST_A");
    ::unsetenv("MSS_TEST_B");
}

TEST_F(EnvTest, HandlesSpacesAroundEquals) {
    write_env("  MSS_TEST_KEY  =  value  \n");
    auto vars = load_env(test_env_path);
    EXPECT_EQ(vars["MSS_TEST_KEY"], "value");
    ::unsetenv("MSS_TEST_KEY");
}

TEST_F(EnvTest, MissingFileReturnsEmpty) {
    auto vars = load_env("nonexistent.env");
    EXPECT_TRUE(vars.empty());
}

TEST_F(EnvTest, DoesNotOverwriteExistingEnv) {
    ::setenv("MSS_TEST_EXISTING", "original", 1);
    write_env("MSS_TEST_EXISTING=overwritten\n");
    load_env(test_env_path);
    EXPECT_EQ(std::string(::getenv("MSS_TEST_EXISTING")), "original");
    ::unsetenv("MSS_TEST_EXISTING");
}

TEST_F(EnvTest, GetEnvReturnsNulloptForMissing) {
    EXPECT_FALSE(get_env("DEFINITELY_NOT_SET_12345").has_value());
}

TEST_F(ConfigTest, TrailingWindowIsRequired) {
    auto config = parse_config(R"({"composer": {"w1": 50}})");
    ASSERT_FALSE(config.has_value());
    EXPECT_EQ(config.error().key, "context.trailing_window");
}

TEST_F(ConfigTest, DefaultsFillUnsetOptions) {
    auto config = parse_config(minimal_config);
    ASSERT_TRUE(config.has_value());
    EXPECT_EQ(config->context.trailing_window, 10);
    EXPECT_DOUBLE_EQ(config->composer.w1, 60.0);
    EXPECT_DOUBLE_EQ(config->composer.w2, 40.0);
    EXPECT_DOUBLE_EQ(config->impact.postseason_phase_weight, 1.5);
    EXPECT_EQ(config->batch.history_policy, HistoryPolicy::Fail);
    EXPECT_EQ(config->sentiment.decay, DecayKind::Exponential);
}

TEST_F(ConfigTest, ReadsEverySection) {
    auto config = parse_config(R"({
        "context": {"trailing_window": 15, "min_prior_appearances": 5},
        "impact": {"regular_phase_weight": 1.0, "postseason_phase_weight": 2.0},
        "sentiment": {"decay": "linear", "half_life_hours": 6,
                      "source_weights": {"media": 1.5, "fan": 0.5}},
        "composer": {"w1": 70, "w2": 30, "score_bound": 50},
        "predictor": {"horizon": 7, "interval_z": 1.645},
        "batch": {"history_policy": "flag", "score_fielders": true, "workers": 2},
        "log_level": "debug"
    })");
    ASSERT_TRUE(config.has_value()) << config.error().message;
    EXPECT_EQ(config->context.min_prior_appearances, 5);
    EXPECT_DOUBLE_EQ(config->impact.postseason_phase_weight, 2.0);
    EXPECT_EQ(config->sentiment.decay, DecayKind::Linear);
    EXPECT_DOUBLE_EQ(config->sentiment.media_weight, 1.5);
    EXPECT_DOUBLE_EQ(config->sentiment.social_weight, 1.0);
    EXPECT_DOUBLE_EQ(config->composer.w1, 70.0);
    EXPECT_EQ(config->predictor.horizon, 7);
    EXPECT_EQ(config->batch.history_policy, HistoryPolicy::Flag);
    EXPECT_TRUE(config->batch.score_fielders);
    EXPECT_EQ(config->log_level, "debug");
}

TEST_F(ConfigTest, RejectsWrongType) {
    auto config = parse_config(R"({"context": {"trailing_window": "ten"}})");
    ASSERT_FALSE(config.has_value());
    EXPECT_EQ(config.error().key, "context.trailing_window");
}

TEST_F(ConfigTest, RejectsUnknownPolicy) {
    auto config = parse_config(
        R"({"context": {"trailing_window": 10}, "batch": {"history_policy": "retry"}})");
    ASSERT_FALSE(config.has_value());
    EXPECT_EQ(config.error().key, "batch.history_policy");
}

TEST_F(ConfigTest, PostseasonMustOutweighRegular) {
    auto config = parse_config(R"({"context": {"trailing_window": 10},
                                   "impact": {"postseason_phase_weight": 1.0}})");
    ASSERT_FALSE(config.has_value());
    EXPECT_EQ(config.error().key, "impact.postseason_phase_weight");
}

TEST_F(ConfigTest, ValidateRejectsBadValues) {
    EngineConfig config;
    config.context.trailing_window = 10;
    EXPECT_TRUE(validate_config(config).has_value());

    auto bad = config;
    bad.sentiment.half_life_hours = 0.0;
    EXPECT_EQ(validate_config(bad).error().key, "sentiment.half_life_hours");

    bad = config;
    bad.predictor.horizon = 0;
    EXPECT_EQ(validate_config(bad).error().key, "predictor.horizon");

    bad = config;
    bad.context.trailing_window = 0;
    EXPECT_EQ(validate_config(bad).error().key, "context.trailing_window");

    bad = config;
    bad.composer.score_bound = 1000.0;
    EXPECT_EQ(validate_config(bad).error().key, "composer.score_bound");

    bad = config;
    bad.composer.w1 = std::numeric_limits<double>::quiet_NaN();
    EXPECT_EQ(validate_config(bad).error().key, "composer.w1");

    bad = config;
    bad.impact.postseason_phase_weight = std::numeric_limits<double>::infinity();
    EXPECT_EQ(validate_config(bad).error().key, "impact.postseason_phase_weight");

    bad = config;
    bad.predictor.ridge_lambda = std::numeric_limits<double>::quiet_NaN();
    EXPECT_EQ(validate_config(bad).error().key, "predictor.ridge_lambda");
}

TEST_F(ConfigTest, RejectsScoreBoundAboveHundred) {
    auto config = parse_config(R"({"context": {"trailing_window": 10},
                                   "composer": {"score_bound": 250}})");
    ASSERT_FALSE(config.has_value());
    EXPECT_EQ(config.error().key, "composer.score_bound");
}

TEST_F(ConfigTest, NonFiniteEnvironmentWeightIsRejected) {
    auto config = parse_config(minimal_config);
    ASSERT_TRUE(config.has_value());

    ::setenv("MSS_W1", "nan", 1);
    auto applied = apply_env_overrides(*config);
    ASSERT_FALSE(applied.has_value());
    EXPECT_EQ(applied.error().key, "composer.w1");
}

TEST_F(ConfigTest, EnvironmentOverridesFileValues) {
    auto config = parse_config(minimal_config);
    ASSERT_TRUE(config.has_value());

    ::setenv("MSS_TRAILING_WINDOW", "20", 1);
    ::setenv("MSS_W1", "75.5", 1);
    ::setenv("MSS_HISTORY_POLICY", "skip", 1);
    ASSERT_TRUE(apply_env_overrides(*config).has_value());
    EXPECT_EQ(config->context.trailing_window, 20);
    EXPECT_DOUBLE_EQ(config->composer.w1, 75.5);
    EXPECT_EQ(config->batch.history_policy, HistoryPolicy::Skip);
}

TEST_F(ConfigTest, EnvironmentCanSupplyTrailingWindow) {
    EngineConfig config;
    EXPECT_FALSE(apply_env_overrides(config).has_value());

    ::setenv("MSS_TRAILING_WINDOW", "8", 1);
    EXPECT_TRUE(apply_env_overrides(config).has_value());
    EXPECT_EQ(config.context.trailing_window, 8);
}

TEST_F(ConfigTest, MalformedEnvironmentValueIsRejected) {
    auto config = parse_config(minimal_config);
    ASSERT_TRUE(config.has_value());

    ::setenv("MSS_WORKERS", "four", 1);
    auto applied = apply_env_overrides(*config);
    ASSERT_FALSE(applied.has_value());
    EXPECT_EQ(applied.error().key, "MSS_WORKERS");
}

TEST_F(ConfigTest, LoadConfigReportsMissingFile) {
    auto config = load_config("does_not_exist.json");
    ASSERT_FALSE(config.has_value());
}
