#include "mss/config.hpp"
#include <cmath>
#include <cstdlib>
#include <fstream>
#include <sstream>
#include <stdexcept>
#include <string>
#include <nlohmann/json.hpp>

namespace mss {

namespace {

std::string trim(std::string_view sv) {
    auto start = sv.find_first_not_of(" \t\r\n");
    if (start == std::string_view::npos) return "";
    auto end = sv.find_last_not_of(" \t\r\n");
    return std::string(sv.substr(start, end - start + 1));
}

std::string strip_quotes(const std::string& s) {
    if (s.size() >= 2 &&
        ((s.front() == '"' && s.back() == '"') ||
         (s.front() == '\'' && s.back() == '\''))) {
        return s.substr(1, s.size() - 2);
    }
    return s;
}

const nlohmann::json& section_of(const nlohmann::json& root, const char* name) {
    static const nlohmann::json empty = nlohmann::json::object();
    if (root.contains(name) && root[name].is_object()) return root[name];
    return empty;
}

// Reads the optional keys of one section and keeps the first type error.
class SectionReader {
public:
    SectionReader(const nlohmann::json& section, std::string prefix)
        : section_(section), prefix_(std::move(prefix)) {}

    template <typename T>
    SectionReader& read(const char* key, T& out) {
        if (error_ || !section_.contains(key) || section_[key].is_null()) return *this;
        try {
            out = section_[key].get<T>();
        } catch (const nlohmann::json::exception& e) {
            error_ = ConfigError{prefix_ + key, e.what()};
        }
        return *this;
    }

    const std::optional<ConfigError>& error() const { return error_; }

private:
    const nlohmann::json& section_;
    std::string prefix_;
    std::optional<ConfigError> error_;
};

std::expected<double, ConfigError> env_double(const std::string& key, double fallback) {
    auto raw = get_env(key);
    if (!raw) return fallback;
    try {
        size_t pos = 0;
        double v = std::stod(*raw, &pos);
        if (pos != raw->size()) throw std::invalid_argument("trailing characters");
        return v;
    } catch (const std::exception&) {
        return std::unexpected(ConfigError{key, "not a number: " + *raw});
    }
}

std::expected<int, ConfigError> env_int(const std::string& key, int fallback) {
    auto raw = get_env(key);
    if (!raw) return fallback;
    try {
        size_t pos = 0;
        int v = std::stoi(*raw, &pos);
        if (pos != raw->size()) throw std::invalid_argument("trailing characters");
        return v;
    } catch (const std::exception&) {
        return std::unexpected(ConfigError{key, "not an integer: " + *raw});
    }
}

} // namespace

std::string to_string(HistoryPolicy policy) {
    switch (policy) {
        case HistoryPolicy::Fail: return "fail";
        case HistoryPolicy::Flag: return "flag";
        case HistoryPolicy::Skip: return "skip";
    }
    return "fail";
}

std::optional<HistoryPolicy> parse_history_policy(const std::string& s) {
    if (s == "fail") return HistoryPolicy::Fail;
    if (s == "flag") return HistoryPolicy::Flag;
    if (s == "skip") return HistoryPolicy::Skip;
    return std::nullopt;
}

std::unordered_map<std::string, std::string> load_env(
    const std::filesystem::path& path) {

    std::unordered_map<std::string, std::string> vars;
    std::ifstream file(path);
    if (!file.is_open()) return vars;

    std::string line;
    while (std::getline(file, line)) {
        auto trimmed = trim(line);
        if (trimmed.empty() || trimmed[0] == '#') continue;

        auto eq = trimmed.find('=');
        if (eq == std::string::npos) continue;

        auto key = trim(trimmed.substr(0, eq));
        auto val = strip_quotes(trim(trimmed.substr(eq + 1)));

        if (!key.empty()) {
            vars[key] = val;
            ::setenv(key.c_str(), val.c_str(), 0); // don't overwrite existing
        }
    }

    return vars;
}

std::optional<std::string> get_env(const std::string& key) {
    if (auto* val = std::getenv(key.c_str())) {
        return std::string(val);
    }
    return std::nullopt;
}

std::expected<EngineConfig, ConfigError> parse_config(const std::string& text) {
    nlohmann::json root;
    try {
        root = nlohmann::json::parse(text);
    } catch (const nlohmann::json::parse_error& e) {
        return std::unexpected(ConfigError{"", std::string("JSON parse error: ") + e.what()});
    }
    if (!root.is_object()) {
        return std::unexpected(ConfigError{"", "configuration root must be an object"});
    }

    EngineConfig config;

    auto& context = section_of(root, "context");
    if (!context.contains("trailing_window")) {
        return std::unexpected(ConfigError{
            "context.trailing_window", "trailing window size must be set explicitly"});
    }
    int window = 0;
    SectionReader ctx(context, "context.");
    ctx.read("trailing_window", window)
        .read("min_prior_appearances", config.context.min_prior_appearances)
        .read("plate_appearances_per_season", config.context.plate_appearances_per_season)
        .read("innings_per_season", config.context.innings_per_season)
        .read("rookie_max_seasons", config.context.rookie_max_seasons)
        .read("veteran_min_seasons", config.context.veteran_min_seasons);
    if (ctx.error()) return std::unexpected(*ctx.error());
    config.context.trailing_window = window;

    SectionReader impact(section_of(root, "impact"), "impact.");
    impact.read("regular_phase_weight", config.impact.regular_phase_weight)
        .read("postseason_phase_weight", config.impact.postseason_phase_weight);
    if (impact.error()) return std::unexpected(*impact.error());

    auto& sentiment_section = section_of(root, "sentiment");
    std::string decay = "exponential";
    SectionReader sentiment(sentiment_section, "sentiment.");
    sentiment.read("decay", decay).read("half_life_hours", config.sentiment.half_life_hours);
    if (sentiment.error()) return std::unexpected(*sentiment.error());
    if (decay == "exponential") config.sentiment.decay = DecayKind::Exponential;
    else if (decay == "linear") config.sentiment.decay = DecayKind::Linear;
    else return std::unexpected(ConfigError{"sentiment.decay", "unknown decay: " + decay});

    SectionReader sources(section_of(sentiment_section, "source_weights"),
                          "sentiment.source_weights.");
    sources.read("media", config.sentiment.media_weight)
        .read("fan", config.sentiment.fan_weight)
        .read("social", config.sentiment.social_weight);
    if (sources.error()) return std::unexpected(*sources.error());

    SectionReader composer(section_of(root, "composer"), "composer.");
    composer.read("w1", config.composer.w1)
        .read("w2", config.composer.w2)
        .read("score_bound", config.composer.score_bound)
        .read("rookie_factor", config.composer.rookie_factor)
        .read("prime_factor", config.composer.prime_factor)
        .read("veteran_factor", config.composer.veteran_factor)
        .read("slump_sensitivity", config.composer.slump_sensitivity)
        .read("max_multiplier", config.composer.max_multiplier);
    if (composer.error()) return std::unexpected(*composer.error());

    SectionReader predictor(section_of(root, "predictor"), "predictor.");
    predictor.read("horizon", config.predictor.horizon)
        .read("ridge_lambda", config.predictor.ridge_lambda)
        .read("interval_z", config.predictor.interval_z)
        .read("min_training_samples", config.predictor.min_training_samples);
    if (predictor.error()) return std::unexpected(*predictor.error());

    std::string policy = "fail";
    SectionReader batch(section_of(root, "batch"), "batch.");
    batch.read("history_policy", policy)
        .read("score_fielders", config.batch.score_fielders)
        .read("workers", config.batch.workers);
    if (batch.error()) return std::unexpected(*batch.error());
    auto parsed_policy = parse_history_policy(policy);
    if (!parsed_policy) {
        return std::unexpected(ConfigError{"batch.history_policy", "unknown policy: " + policy});
    }
    config.batch.history_policy = *parsed_policy;

    SectionReader top(root, "");
    top.read("log_level", config.log_level);
    if (top.error()) return std::unexpected(*top.error());

    if (auto valid = validate_config(config); !valid) {
        return std::unexpected(valid.error());
    }
    return config;
}

std::expected<EngineConfig, ConfigError> load_config(const std::filesystem::path& path) {
    std::ifstream file(path);
    if (!file.is_open()) {
        return std::unexpected(ConfigError{"", "cannot open " + path.string()});
    }
    std::stringstream buffer;
    buffer << file.rdbuf();
    return parse_config(buffer.str());
}

std::expected<void, ConfigError> apply_env_overrides(EngineConfig& config) {
    if (get_env("MSS_TRAILING_WINDOW")) {
        auto v = env_int("MSS_TRAILING_WINDOW", 0);
        if (!v) return std::unexpected(v.error());
        config.context.trailing_window = *v;
    }

    auto min_prior = env_int("MSS_MIN_PRIOR_APPEARANCES", config.context.min_prior_appearances);
    if (!min_prior) return std::unexpected(min_prior.error());
    config.context.min_prior_appearances = *min_prior;

    auto regular = env_double("MSS_PHASE_WEIGHT_REGULAR", config.impact.regular_phase_weight);
    if (!regular) return std::unexpected(regular.error());
    config.impact.regular_phase_weight = *regular;

    auto post = env_double("MSS_PHASE_WEIGHT_POSTSEASON", config.impact.postseason_phase_weight);
    if (!post) return std::unexpected(post.error());
    config.impact.postseason_phase_weight = *post;

    auto half_life = env_double("MSS_SENTIMENT_HALF_LIFE_HOURS", config.sentiment.half_life_hours);
    if (!half_life) return std::unexpected(half_life.error());
    config.sentiment.half_life_hours = *half_life;

    auto w1 = env_double("MSS_W1", config.composer.w1);
    if (!w1) return std::unexpected(w1.error());
    config.composer.w1 = *w1;

    auto w2 = env_double("MSS_W2", config.composer.w2);
    if (!w2) return std::unexpected(w2.error());
    config.composer.w2 = *w2;

    auto horizon = env_int("MSS_PREDICTION_HORIZON", config.predictor.horizon);
    if (!horizon) return std::unexpected(horizon.error());
    config.predictor.horizon = *horizon;

    auto workers = env_int("MSS_WORKERS", config.batch.workers);
    if (!workers) return std::unexpected(workers.error());
    config.batch.workers = *workers;

    if (auto policy = get_env("MSS_HISTORY_POLICY")) {
        auto parsed = parse_history_policy(*policy);
        if (!parsed) {
            return std::unexpected(ConfigError{"MSS_HISTORY_POLICY", "unknown policy: " + *policy});
        }
        config.batch.history_policy = *parsed;
    }

    if (auto level = get_env("MSS_LOG_LEVEL")) config.log_level = *level;

    return validate_config(config);
}

std::expected<void, ConfigError> validate_config(const EngineConfig& config) {
    auto fail = [](const char* key, const char* msg) {
        return std::unexpected(ConfigError{key, msg});
    };

    struct NamedValue {
        const char* key;
        double value;
    };
    const NamedValue reals[] = {
        {"context.innings_per_season", config.context.innings_per_season},
        {"context.rookie_max_seasons", config.context.rookie_max_seasons},
        {"context.veteran_min_seasons", config.context.veteran_min_seasons},
        {"impact.regular_phase_weight", config.impact.regular_phase_weight},
        {"impact.postseason_phase_weight", config.impact.postseason_phase_weight},
        {"sentiment.half_life_hours", config.sentiment.half_life_hours},
        {"sentiment.source_weights.media", config.sentiment.media_weight},
        {"sentiment.source_weights.fan", config.sentiment.fan_weight},
        {"sentiment.source_weights.social", config.sentiment.social_weight},
        {"composer.w1", config.composer.w1},
        {"composer.w2", config.composer.w2},
        {"composer.score_bound", config.composer.score_bound},
        {"composer.rookie_factor", config.composer.rookie_factor},
        {"composer.prime_factor", config.composer.prime_factor},
        {"composer.veteran_factor", config.composer.veteran_factor},
        {"composer.slump_sensitivity", config.composer.slump_sensitivity},
        {"composer.max_multiplier", config.composer.max_multiplier},
        {"predictor.ridge_lambda", config.predictor.ridge_lambda},
        {"predictor.interval_z", config.predictor.interval_z},
    };
    for (auto& [key, value] : reals) {
        if (!std::isfinite(value)) return fail(key, "must be a finite number");
    }

    if (!config.context.trailing_window)
        return fail("context.trailing_window", "trailing window size must be set explicitly");
    if (*config.context.trailing_window < 1)
        return fail("context.trailing_window", "must be at least 1");
    if (config.context.min_prior_appearances < 1)
        return fail("context.min_prior_appearances", "must be at least 1");
    if (config.context.min_prior_appearances > *config.context.trailing_window)
        return fail("context.min_prior_appearances", "cannot exceed the trailing window");
    if (config.context.plate_appearances_per_season < 1)
        return fail("context.plate_appearances_per_season", "must be positive");
    if (config.context.innings_per_season <= 0.0)
        return fail("context.innings_per_season", "must be positive");
    if (config.context.rookie_max_seasons > config.context.veteran_min_seasons)
        return fail("context.rookie_max_seasons", "must not exceed veteran_min_seasons");

    if (config.impact.regular_phase_weight <= 0.0)
        return fail("impact.regular_phase_weight", "must be positive");
    if (config.impact.postseason_phase_weight <= config.impact.regular_phase_weight)
        return fail("impact.postseason_phase_weight", "must be greater than the regular weight");

    if (config.sentiment.half_life_hours <= 0.0)
        return fail("sentiment.half_life_hours", "must be positive");
    if (config.sentiment.media_weight < 0.0 || config.sentiment.fan_weight < 0.0 ||
        config.sentiment.social_weight < 0.0)
        return fail("sentiment.source_weights", "must not be negative");

    if (config.composer.score_bound <= 0.0 || config.composer.score_bound > max_score_bound)
        return fail("composer.score_bound", "must be in (0, 100]");
    if (config.composer.rookie_factor <= 0.0 || config.composer.prime_factor <= 0.0 ||
        config.composer.veteran_factor <= 0.0)
        return fail("composer.stage_factors", "must be positive");
    if (config.composer.slump_sensitivity < 0.0)
        return fail("composer.slump_sensitivity", "must not be negative");
    if (config.composer.max_multiplier < 1.0)
        return fail("composer.max_multiplier", "must be at least 1");

    if (config.predictor.horizon < 1)
        return fail("predictor.horizon", "must be at least 1");
    if (config.predictor.ridge_lambda < 0.0)
        return fail("predictor.ridge_lambda", "must not be negative");
    if (config.predictor.interval_z <= 0.0)
        return fail("predictor.interval_z", "must be positive");
    if (config.predictor.min_training_samples < 1)
        return fail("predictor.min_training_samples", "must be at least 1");

    if (config.batch.workers < 1)
        return fail("batch.workers", "must be at least 1");

    return {};
}

} // namespace mss
