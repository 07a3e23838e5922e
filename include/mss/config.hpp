#pragma once

#include "mss/types.hpp"
#include <expected>
#include <filesystem>
#include <optional>
#include <string>
#include <unordered_map>

namespace mss {

enum class HistoryPolicy { Fail, Flag, Skip };
enum class DecayKind { Exponential, Linear };

struct ContextConfig {
    // Trailing window size. Required: there is no fallback value.
    std::optional<int> trailing_window;
    int min_prior_appearances = 1;
    int plate_appearances_per_season = 502;
    double innings_per_season = 162.0;
    double rookie_max_seasons = 1.0;
    double veteran_min_seasons = 10.0;
};

struct ImpactConfig {
    double regular_phase_weight = 1.0;
    double postseason_phase_weight = 1.5;
};

struct SentimentConfig {
    DecayKind decay = DecayKind::Exponential;
    double half_life_hours = 24.0;
    double media_weight = 1.0;
    double fan_weight = 1.0;
    double social_weight = 1.0;
};

// Composite scores never leave [-100, 100], whatever score_bound says.
inline constexpr double max_score_bound = 100.0;

struct ComposerConfig {
    double w1 = 60.0;
    double w2 = 40.0;
    double score_bound = 100.0;
    double rookie_factor = 1.25;
    double prime_factor = 1.0;
    double veteran_factor = 1.0;
    double slump_sensitivity = 0.5;
    double max_multiplier = 2.0;
};

struct PredictorConfig {
    int horizon = 10;
    double ridge_lambda = 1.0;
    double interval_z = 1.96;
    int min_training_samples = 3;
};

struct BatchConfig {
    HistoryPolicy history_policy = HistoryPolicy::Fail;
    bool score_fielders = false;
    int workers = 4;
};

struct EngineConfig {
    ContextConfig context;
    ImpactConfig impact;
    SentimentConfig sentiment;
    ComposerConfig composer;
    PredictorConfig predictor;
    BatchConfig batch;
    std::string log_level = "info";
};

std::string to_string(HistoryPolicy policy);
std::optional<HistoryPolicy> parse_history_policy(const std::string& s);

// Reads KEY=value lines into the process environment without overwriting
// variables that are already set.
std::unordered_map<std::string, std::string> load_env(
    const std::filesystem::path& path = ".env");

std::optional<std::string> get_env(const std::string& key);

std::expected<EngineConfig, ConfigError> parse_config(const std::string& text);
std::expected<EngineConfig, ConfigError> load_config(const std::filesystem::path& path);

// MSS_* environment variables take precedence over file values.
std::expected<void, ConfigError> apply_env_overrides(EngineConfig& config);

std::expected<void, ConfigError> validate_config(const EngineConfig& config);

} // namespace mss
