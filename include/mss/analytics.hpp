#pragma once

#include <optional>
#include <utility>
#include <vector>

namespace mss {

struct LinearFit {
    double slope = 0.0;
    double intercept = 0.0;
    double r_squared = 0.0;
    bool degenerate = true;
};

double mean(const std::vector<double>& values);

double variance(const std::vector<double>& values);

// nullopt when fewer than two pairs or either side has zero variance.
std::optional<double> pearson(const std::vector<double>& xs, const std::vector<double>& ys);

LinearFit fit_line(const std::vector<std::pair<double, double>>& points);

// Gaussian elimination with partial pivoting; nullopt for a singular system.
std::optional<std::vector<double>> solve_linear_system(
    std::vector<std::vector<double>> a, std::vector<double> b);

} // namespace mss
