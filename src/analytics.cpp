#include "mss/analytics.hpp"
#include <cmath>
#include <numeric>

namespace mss {

double mean(const std::vector<double>& values) {
    if (values.empty()) return 0.0;
    return std::accumulate(values.begin(), values.end(), 0.0) / values.size();
}

double variance(const std::vector<double>& values) {
    if (values.size() < 2) return 0.0;
    double m = mean(values);
    double ss = 0.0;
    for (double v : values) ss += (v - m) * (v - m);
    return ss / values.size();
}

std::optional<double> pearson(const std::vector<double>& xs, const std::vector<double>& ys) {
    if (xs.size() != ys.size() || xs.size() < 2) return std::nullopt;

    double mx = mean(xs);
    double my = mean(ys);
    double sxy = 0, sxx = 0, syy = 0;
    for (size_t i = 0; i < xs.size(); ++i) {
        double dx = xs[i] - mx;
        double dy = ys[i] - my;
        sxy += dx * dy;
        sxx += dx * dx;
        syy += dy * dy;
    }
    if (sxx < 1e-12 || syy < 1e-12) return std::nullopt;
    return sxy / std::sqrt(sxx * syy);
}

LinearFit fit_line(const std::vector<std::pair<double, double>>& points) {
    LinearFit fit;
    if (points.size() < 2) return fit;

    // Least squares linear regression
    double n = static_cast<double>(points.size());
    double sum_x = 0, sum_y = 0, sum_xy = 0, sum_xx = 0;
    for (auto& [x, y] : points) {
        sum_x += x;
        sum_y += y;
        sum_xy += x * y;
        sum_xx += x * x;
    }

    double denom = n * sum_xx - sum_x * sum_x;
    if (std::abs(denom) < 1e-10) return fit;

    fit.slope = (n * sum_xy - sum_x * sum_y) / denom;
    fit.intercept = (sum_y - fit.slope * sum_x) / n;
    fit.degenerate = false;

    // R²
    double y_mean = sum_y / n;
    double ss_tot = 0, ss_res = 0;
    for (auto& [x, y] : points) {
        double y_pred = fit.slope * x + fit.intercept;
        ss_tot += (y - y_mean) * (y - y_mean);
        ss_res += (y - y_pred) * (y - y_pred);
    }

    fit.r_squared = ss_tot > 1e-10 ? 1.0 - ss_res / ss_tot : 0.0;
    return fit;
}

std::optional<std::vector<double>> solve_linear_system(
    std::vector<std::vector<double>> a, std::vector<double> b) {

    size_t n = b.size();
    if (a.size() != n) return std::nullopt;

    for (size_t col = 0; col < n; ++col) {
        size_t pivot = col;
        for (size_t row = col + 1; row < n; ++row) {
            if (std::abs(a[row][col]) > std::abs(a[pivot][col])) pivot = row;
        }
        if (std::abs(a[pivot][col]) < 1e-12) return std::nullopt;
        std::swap(a[col], a[pivot]);
        std::swap(b[col], b[pivot]);

        for (size_t row = col + 1; row < n; ++row) {
            double factor = a[row][col] / a[col][col];
            for (size_t k = col; k < n; ++k) a[row][k] -= factor * a[col][k];
            b[row] -= factor * b[col];
        }
    }

    std::vector<double> x(n, 0.0);
    for (size_t i = n; i-- > 0;) {
        double sum = b[i];
        for (size_t k = i + 1; k < n; ++k) sum -= a[i][k] * x[k];
        x[i] = sum / a[i][i];
    }
    return x;
}

} // namespace mss
