#pragma once

#include "mss/predictor.hpp"
#include "mss/types.hpp"
#include "mss/versions.hpp"
#include <expected>
#include <filesystem>
#include <mutex>
#include <string>
#include <unordered_set>
#include <vector>
#include <nlohmann/json.hpp>

namespace mss {

enum class LedgerStream { Results, Predictions, Weights, Models };

std::string to_string(LedgerStream stream);

// Append-only store of emitted results, prediction records, weight sets and
// models, one JSON line per entry and one file per stream. Entries are never
// rewritten; a second entry under an existing key is rejected.
class Ledger {
public:
    explicit Ledger(std::filesystem::path dir = "data/ledger");

    std::expected<void, LedgerError> record_result(const MSSResult& result);
    // Keyed by (moment, player, model version, state), so a record may appear
    // once as "predicted" and once as "evaluated".
    std::expected<void, LedgerError> record_prediction(const PredictionRecord& record);
    std::expected<void, LedgerError> record_weights(const WeightSet& weights);
    std::expected<void, LedgerError> record_model(const TrajectoryModel& model);

    std::vector<MSSResult> results() const;
    // The latest state of each prediction record.
    std::vector<PredictionRecord> predictions() const;
    std::vector<WeightSet> weights() const;

    // Publishes every stored weight set and model, in version order.
    int restore(VersionRegistry& registry) const;

    bool contains(LedgerStream stream, const std::string& key) const;

private:
    std::filesystem::path dir_;
    mutable std::mutex mutex_;
    std::unordered_set<std::string> keys_;

    std::filesystem::path path_for(LedgerStream stream) const;
    std::vector<nlohmann::json> read_lines(LedgerStream stream) const;
    std::expected<void, LedgerError> append(LedgerStream stream, const std::string& key,
                                            const nlohmann::json& entry);
};

std::string result_key(const MSSResult& result);
std::string prediction_key(const PredictionRecord& record);

} // namespace mss
