#pragma once

#include "mss/evaluator.hpp"
#include "mss/pipeline.hpp"
#include "mss/predictor.hpp"
#include "mss/types.hpp"
#include <expected>
#include <filesystem>
#include <memory>
#include <optional>
#include <string>
#include <nlohmann/json.hpp>

namespace mss {

std::optional<TimePoint> parse_timestamp(const nlohmann::json& j);

// Input records. Missing or mistyped fields fall back to empty values so the
// moment builder can report them field by field.
RawEvent parse_raw_event(const nlohmann::json& j);
SentimentObservation parse_observation(const nlohmann::json& j);
PlayerHistory parse_history(const nlohmann::json& j);
ObservedOutcome parse_observed_outcome(const nlohmann::json& j);

nlohmann::json result_to_json(const MSSResult& result);
MSSResult result_from_json(const nlohmann::json& j);

nlohmann::json prediction_to_json(const PredictionRecord& record);
std::optional<PredictionRecord> prediction_from_json(const nlohmann::json& j);

nlohmann::json weights_to_json(const WeightSet& weights);
WeightSet weights_from_json(const nlohmann::json& j);

nlohmann::json model_to_json(const LinearTrajectoryModel& model);
std::shared_ptr<const LinearTrajectoryModel> model_from_json(const nlohmann::json& j);

nlohmann::json failure_to_json(const MomentFailure& failure);
nlohmann::json report_to_json(const CalibrationReport& report);

// Reads a file holding a JSON array (or an object with an "items" array).
std::expected<nlohmann::json, std::string> read_json_array(const std::filesystem::path& path);

} // namespace mss
