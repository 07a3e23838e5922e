#pragma once

#include "mss/evaluator.hpp"
#include "mss/pipeline.hpp"
#include "mss/predictor.hpp"
#include "mss/types.hpp"
#include <optional>
#include <string>
#include <vector>

namespace mss {

enum class OutputFormat { Table, Csv, Json };

std::optional<OutputFormat> parse_output_format(const std::string& s);

void display_results(const std::vector<MSSResult>& results, OutputFormat format);
void display_failures(const std::vector<MomentFailure>& failures, OutputFormat format);
void display_predictions(const std::vector<PredictionRecord>& records, OutputFormat format);
void display_report(const CalibrationReport& report, OutputFormat format);
void display_refit(const RefitResult& refit, OutputFormat format);

} // namespace mss
