#include "mss/ledger.hpp"
#include "mss/json_io.hpp"
#include <algorithm>
#include <fstream>
#include <map>
#include <tuple>
#include <spdlog/spdlog.h>

namespace mss {

namespace {

constexpr LedgerStream all_streams[] = {
    LedgerStream::Results, LedgerStream::Predictions, LedgerStream::Weights, LedgerStream::Models,
};

std::string stream_key(LedgerStream stream, const std::string& key) {
    return to_string(stream) + "/" + key;
}

std::string key_from_line(LedgerStream stream, const nlohmann::json& j) {
    switch (stream) {
        case LedgerStream::Results:
            return j.at("moment_id").get<std::string>() + "|" +
                   j.at("player_id").get<std::string>() + "|v" +
                   std::to_string(j.at("weight_version").get<int>());
        case LedgerStream::Predictions:
            return j.at("moment_id").get<std::string>() + "|" +
                   j.at("player_id").get<std::string>() + "|m" +
                   std::to_string(j.at("model_version").get<int>()) + "|" +
                   j.at("state").get<std::string>();
        case LedgerStream::Weights:
        case LedgerStream::Models:
            return "v" + std::to_string(j.at("version").get<int>());
    }
    return "";
}

} // namespace

std::string to_string(LedgerStream stream) {
    switch (stream) {
        case LedgerStream::Results: return "results";
        case LedgerStream::Predictions: return "predictions";
        case LedgerStream::Weights: return "weights";
        case LedgerStream::Models: return "models";
    }
    return "unknown";
}

std::string result_key(const MSSResult& result) {
    return result.moment_id + "|" + result.player_id + "|v" +
           std::to_string(result.weight_version);
}

std::string prediction_key(const PredictionRecord& record) {
    return record.result().moment_id + "|" + record.result().player_id + "|m" +
           std::to_string(record.model_version()) + "|" +
           (record.evaluated() ? "evaluated" : "predicted");
}

Ledger::Ledger(std::filesystem::path dir) : dir_(std::move(dir)) {
    std::filesystem::create_directories(dir_);
    for (auto stream : all_streams) {
        for (auto& line : read_lines(stream)) {
            try {
                keys_.insert(stream_key(stream, key_from_line(stream, line)));
            } catch (const nlohmann::json::exception& e) {
                spdlog::warn("Ledger {}: entry without a key: {}", to_string(stream), e.what());
            }
        }
    }
    spdlog::debug("Ledger at {} holds {} entries", dir_.string(), keys_.size());
}

std::filesystem::path Ledger::path_for(LedgerStream stream) const {
    return dir_ / (to_string(stream) + ".jsonl");
}

std::vector<nlohmann::json> Ledger::read_lines(LedgerStream stream) const {
    std::vector<nlohmann::json> lines;
    std::ifstream file(path_for(stream));
    if (!file.is_open()) return lines;

    std::string line;
    int number = 0;
    while (std::getline(file, line)) {
        number++;
        if (line.empty()) continue;
        try {
            lines.push_back(nlohmann::json::parse(line));
        } catch (const nlohmann::json::parse_error&) {
            spdlog::warn("Ledger {}: skipping malformed line {}", to_string(stream), number);
        }
    }
    return lines;
}

std::expected<void, LedgerError> Ledger::append(LedgerStream stream, const std::string& key,
                                                const nlohmann::json& entry) {
    std::lock_guard lock(mutex_);
    auto full_key = stream_key(stream, key);
    if (keys_.contains(full_key)) {
        return std::unexpected(LedgerError{full_key, "entry already recorded"});
    }

    std::ofstream file(path_for(stream), std::ios::app);
    if (!file.is_open()) {
        return std::unexpected(LedgerError{full_key, "cannot open " + path_for(stream).string()});
    }
    file << entry.dump() << '\n';
    file.flush();
    if (!file) return std::unexpected(LedgerError{full_key, "write failed"});

    keys_.insert(full_key);
    return {};
}

bool Ledger::contains(LedgerStream stream, const std::string& key) const {
    std::lock_guard lock(mutex_);
    return keys_.contains(stream_key(stream, key));
}

std::expected<void, LedgerError> Ledger::record_result(const MSSResult& result) {
    return append(LedgerStream::Results, result_key(result), result_to_json(result));
}

std::expected<void, LedgerError> Ledger::record_prediction(const PredictionRecord& record) {
    return append(LedgerStream::Predictions, prediction_key(record), prediction_to_json(record));
}

std::expected<void, LedgerError> Ledger::record_weights(const WeightSet& weights) {
    return append(LedgerStream::Weights, "v" + std::to_string(weights.version),
                  weights_to_json(weights));
}

std::expected<void, LedgerError> Ledger::record_model(const TrajectoryModel& model) {
    auto key = "v" + std::to_string(model.version());
    auto* linear = dynamic_cast<const LinearTrajectoryModel*>(&model);
    if (!linear) return std::unexpected(LedgerError{key, "unsupported model type"});
    return append(LedgerStream::Models, key, model_to_json(*linear));
}

std::vector<MSSResult> Ledger::results() const {
    std::vector<MSSResult> out;
    for (auto& line : read_lines(LedgerStream::Results)) {
        try {
            out.push_back(result_from_json(line));
        } catch (const nlohmann::json::exception& e) {
            spdlog::warn("Ledger results: skipping entry: {}", e.what());
        }
    }
    return out;
}

std::vector<PredictionRecord> Ledger::predictions() const {
    // Evaluated entries supersede the predicted entry of the same record.
    std::map<std::tuple<std::string, std::string, int>, PredictionRecord> latest;
    for (auto& line : read_lines(LedgerStream::Predictions)) {
        auto record = prediction_from_json(line);
        if (!record) {
            spdlog::warn("Ledger predictions: skipping unreadable entry");
            continue;
        }
        auto key = std::make_tuple(record->result().moment_id, record->result().player_id,
                                   record->model_version());
        auto it = latest.find(key);
        if (it == latest.end()) {
            latest.emplace(std::move(key), std::move(*record));
        } else if (record->evaluated() && !it->second.evaluated()) {
            it->second = std::move(*record);
        }
    }

    std::vector<PredictionRecord> out;
    for (auto& [_, record] : latest) out.push_back(std::move(record));
    return out;
}

std::vector<WeightSet> Ledger::weights() const {
    std::vector<WeightSet> out;
    for (auto& line : read_lines(LedgerStream::Weights)) {
        try {
            out.push_back(weights_from_json(line));
        } catch (const nlohmann::json::exception& e) {
            spdlog::warn("Ledger weights: skipping entry: {}", e.what());
        }
    }
    std::ranges::sort(out, {}, &WeightSet::version);
    return out;
}

int Ledger::restore(VersionRegistry& registry) const {
    int restored = 0;
    for (auto& w : weights()) {
        registry.publish_weights(std::move(w));
        restored++;
    }

    std::vector<std::shared_ptr<const LinearTrajectoryModel>> models;
    for (auto& line : read_lines(LedgerStream::Models)) {
        try {
            models.push_back(model_from_json(line));
        } catch (const std::exception& e) {
            spdlog::warn("Ledger models: skipping entry: {}", e.what());
        }
    }
    std::ranges::sort(models, {}, [](const auto& m) { return m->version(); });
    for (auto& m : models) {
        if (registry.publish_model(m)) restored++;
    }

    spdlog::info("Restored {} versions from {}", restored, dir_.string());
    return restored;
}

} // namespace mss
