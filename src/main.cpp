#include "mss/config.hpp"
#include "mss/display.hpp"
#include "mss/evaluator.hpp"
#include "mss/history_store.hpp"
#include "mss/json_io.hpp"
#include "mss/ledger.hpp"
#include "mss/pipeline.hpp"
#include "mss/predictor.hpp"
#include "mss/versions.hpp"
#include <iostream>
#include <set>
#include <string>
#include <tuple>
#include <spdlog/spdlog.h>
#include <spdlog/sinks/stdout_color_sinks.h>

namespace {

struct CliArgs {
    std::string command;
    std::string config_path;
    std::string env_path = ".env";
    std::string ledger_dir = "data/ledger";
    std::string history_dir = "data/history";
    std::string moments_path;
    std::string histories_path;
    std::string sentiment_path;
    std::string outcomes_path;
    std::optional<int> weight_version;
    std::optional<int> model_version;
    std::string moment_id;
    std::string log_level;
    mss::OutputFormat format = mss::OutputFormat::Table;
};

void print_usage() {
    std::cerr << R"(Usage: mss-engine <command> [options]
Commands:
  score      Score raw moments and append the results to the ledger
  train      Fit the first trajectory model from scored results
  predict    Forecast trajectories for scored results
  evaluate   Record observed outcomes and report calibration
  refit      Publish new weights and a new model from observed outcomes
Options:
  --config <file>           Engine configuration (JSON)
  --env <file>              Environment file (default: .env)
  --ledger <dir>            Ledger directory (default: data/ledger)
  --history-dir <dir>       Per-player history files (default: data/history)
  --moments <file>          Raw moment events (score)
  --histories <file>        Player histories (score), saved under --history-dir
  --sentiment <file>        Sentiment observations (score)
  --outcomes <file>         Observed outcomes (train, evaluate, refit)
  --weights <version>       Weight set to score with (default: latest)
  --model <version>         Model to predict with (default: latest)
  --moment <id>             Restrict predict to one moment
  --format <table|csv|json> Output format (default: table)
  --log-level <level>       trace|debug|info|warn|error
)";
}

std::optional<CliArgs> parse_args(int argc, char* argv[]) {
    if (argc < 2) return std::nullopt;

    static const std::set<std::string> commands{"score", "train", "predict", "evaluate", "refit"};
    CliArgs args;
    args.command = argv[1];
    if (!commands.contains(args.command)) {
        std::cerr << "Unknown command: " << args.command << "\n";
        return std::nullopt;
    }

    for (int i = 2; i < argc; i += 2) {
        std::string flag = argv[i];
        if (i + 1 >= argc) {
            std::cerr << "Missing value for " << flag << "\n";
            return std::nullopt;
        }
        std::string val = argv[i + 1];

        try {
            if (flag == "--config") args.config_path = val;
            else if (flag == "--env") args.env_path = val;
            else if (flag == "--ledger") args.ledger_dir = val;
            else if (flag == "--history-dir") args.history_dir = val;
            else if (flag == "--moments") args.moments_path = val;
            else if (flag == "--histories") args.histories_path = val;
            else if (flag == "--sentiment") args.sentiment_path = val;
            else if (flag == "--outcomes") args.outcomes_path = val;
            else if (flag == "--weights") args.weight_version = std::stoi(val);
            else if (flag == "--model") args.model_version = std::stoi(val);
            else if (flag == "--moment") args.moment_id = val;
            else if (flag == "--log-level") args.log_level = val;
            else if (flag == "--format") {
                auto format = mss::parse_output_format(val);
                if (!format) {
                    std::cerr << "Unknown format: " << val << "\n";
                    return std::nullopt;
                }
                args.format = *format;
            }
            else {
                std::cerr << "Unknown option: " << flag << "\n";
                return std::nullopt;
            }
        } catch (const std::logic_error&) {
            std::cerr << "Invalid number for " << flag << ": " << val << "\n";
            return std::nullopt;
        }
    }
    return args;
}

void setup_logging(const std::string& level) {
    auto console_sink = std::make_shared<spdlog::sinks::stderr_color_sink_mt>();
    auto logger = std::make_shared<spdlog::logger>("mss", console_sink);
    spdlog::set_default_logger(logger);
    spdlog::set_level(spdlog::level::from_str(level));
    spdlog::set_pattern("[%Y-%m-%d %H:%M:%S.%e] [%^%l%$] %v");
}

std::optional<mss::EngineConfig> load_engine_config(const CliArgs& args) {
    mss::load_env(args.env_path);

    mss::EngineConfig config;
    if (!args.config_path.empty()) {
        auto loaded = mss::load_config(args.config_path);
        if (!loaded) {
            spdlog::error("Config {}: {}", loaded.error().key, loaded.error().message);
            return std::nullopt;
        }
        config = std::move(*loaded);
    }

    if (auto env = mss::apply_env_overrides(config); !env) {
        spdlog::error("Config {}: {}", env.error().key, env.error().message);
        return std::nullopt;
    }
    if (!args.log_level.empty()) config.log_level = args.log_level;

    if (auto valid = mss::validate_config(config); !valid) {
        spdlog::error("Config {}: {}", valid.error().key, valid.error().message);
        return std::nullopt;
    }
    return config;
}

template <typename T, typename Parse>
std::optional<std::vector<T>> read_items(const std::string& path, Parse parse) {
    auto items = mss::read_json_array(path);
    if (!items) {
        spdlog::error("{}", items.error());
        return std::nullopt;
    }
    std::vector<T> out;
    try {
        for (auto& item : *items) out.push_back(parse(item));
    } catch (const nlohmann::json::exception& e) {
        spdlog::error("{}: item {}: {}", path, out.size(), e.what());
        return std::nullopt;
    }
    return out;
}

std::optional<std::vector<mss::ObservedOutcome>> read_outcomes(const CliArgs& args) {
    if (args.outcomes_path.empty()) {
        spdlog::error("{} requires --outcomes", args.command);
        return std::nullopt;
    }
    return read_items<mss::ObservedOutcome>(args.outcomes_path, mss::parse_observed_outcome);
}

void log_ledger_error(const mss::LedgerError& e) {
    spdlog::warn("Ledger {}: {}", e.key, e.message);
}

int run_score(const CliArgs& args, const mss::EngineConfig& config, mss::Ledger& ledger,
              mss::VersionRegistry& registry) {
    if (args.moments_path.empty()) {
        spdlog::error("score requires --moments");
        return 1;
    }

    auto weights = args.weight_version ? registry.weights(*args.weight_version)
                                       : registry.latest_weights();
    if (!weights && args.weight_version) {
        spdlog::error("No weight set v{}", *args.weight_version);
        return 1;
    }
    if (!weights) {
        weights = registry.publish_weights({.w1 = config.composer.w1,
                                            .w2 = config.composer.w2,
                                            .note = "initial weights from configuration"});
        if (auto r = ledger.record_weights(*weights); !r) log_ledger_error(r.error());
    }

    auto events = read_items<mss::RawEvent>(args.moments_path, mss::parse_raw_event);
    if (!events) return 1;

    std::vector<mss::SentimentObservation> observations;
    if (!args.sentiment_path.empty()) {
        auto obs = read_items<mss::SentimentObservation>(args.sentiment_path,
                                                         mss::parse_observation);
        if (!obs) return 1;
        observations = std::move(*obs);
    }

    mss::HistoryStore histories(args.history_dir);
    if (!args.histories_path.empty()) {
        if (auto loaded = histories.load_file(args.histories_path); !loaded) {
            spdlog::error("{}", loaded.error());
            return 1;
        }
        if (auto persisted = histories.persist(); !persisted) {
            spdlog::warn("{}", persisted.error());
        }
    }

    auto batch = mss::score_batch(*events, histories, observations, config, *weights);
    for (auto& r : batch.results) {
        if (auto recorded = ledger.record_result(r); !recorded) log_ledger_error(recorded.error());
    }

    mss::display_results(batch.results, args.format);
    mss::display_failures(batch.failures, args.format);
    return batch.failures.empty() ? 0 : 2;
}

int run_train(const CliArgs& args, const mss::EngineConfig& config, mss::Ledger& ledger,
              mss::VersionRegistry& registry) {
    auto outcomes = read_outcomes(args);
    if (!outcomes) return 1;

    auto model = mss::train(ledger.results(), *outcomes, registry, config);
    if (!model) {
        spdlog::error("{}", model.error().message);
        return 1;
    }
    if (auto r = ledger.record_model(**model); !r) log_ledger_error(r.error());
    std::cout << "Trained model v" << (*model)->version() << "\n";
    return 0;
}

int run_predict(const CliArgs& args, mss::Ledger& ledger, mss::VersionRegistry& registry) {
    auto model = args.model_version ? registry.model(*args.model_version)
                                    : registry.latest_model();
    if (!model && !args.model_version) {
        // A fresh registry has only the untrained placeholder.
        model = std::make_shared<const mss::LinearTrajectoryModel>(0, mss::PredictorConfig{});
    }

    std::set<std::tuple<std::string, std::string, int>> predicted;
    for (auto& p : ledger.predictions()) {
        predicted.emplace(p.result().moment_id, p.result().player_id, p.model_version());
    }

    std::vector<mss::PredictionRecord> records;
    for (auto& result : ledger.results()) {
        if (!args.moment_id.empty() && result.moment_id != args.moment_id) continue;

        auto record = mss::predict(result, model);
        if (!record) {
            spdlog::error("Predict {}/{}: {} ({})", result.moment_id, result.player_id,
                          record.error().message, mss::to_string(record.error().kind));
            return 1;
        }
        auto key = std::make_tuple(result.moment_id, result.player_id, record->model_version());
        if (!predicted.contains(key)) {
            if (auto r = ledger.record_prediction(*record); !r) log_ledger_error(r.error());
        }
        records.push_back(std::move(*record));
    }

    mss::display_predictions(records, args.format);
    return 0;
}

int run_evaluate(const CliArgs& args, mss::Ledger& ledger) {
    auto outcomes = read_outcomes(args);
    if (!outcomes) return 1;

    auto records = ledger.predictions();
    auto report = mss::evaluate(records, *outcomes);
    for (auto& record : records) {
        if (!record.evaluated()) continue;
        if (ledger.contains(mss::LedgerStream::Predictions, mss::prediction_key(record))) continue;
        if (auto r = ledger.record_prediction(record); !r) log_ledger_error(r.error());
    }

    mss::display_report(report, args.format);
    return 0;
}

int run_refit(const CliArgs& args, const mss::EngineConfig& config, mss::Ledger& ledger,
              mss::VersionRegistry& registry) {
    auto outcomes = read_outcomes(args);
    if (!outcomes) return 1;

    auto result = mss::refit(ledger.predictions(), *outcomes, registry, config);
    if (!result) {
        spdlog::error("{}", result.error().message);
        return 1;
    }
    if (auto r = ledger.record_weights(*result->weights); !r) log_ledger_error(r.error());
    if (auto r = ledger.record_model(*result->model); !r) log_ledger_error(r.error());

    mss::display_refit(*result, args.format);
    return 0;
}

} // namespace

int main(int argc, char* argv[]) {
    auto args = parse_args(argc, argv);
    if (!args) {
        print_usage();
        return 1;
    }

    setup_logging(args->log_level.empty() ? "info" : args->log_level);
    auto config = load_engine_config(*args);
    if (!config) return 1;
    spdlog::set_level(spdlog::level::from_str(config->log_level));

    mss::Ledger ledger(args->ledger_dir);
    mss::VersionRegistry registry;
    ledger.restore(registry);

    if (args->command == "score") return run_score(*args, *config, ledger, registry);
    if (args->command == "train") return run_train(*args, *config, ledger, registry);
    if (args->command == "predict") return run_predict(*args, ledger, registry);
    if (args->command == "evaluate") return run_evaluate(*args, ledger);
    return run_refit(*args, *config, ledger, registry);
}
