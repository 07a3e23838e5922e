#include "mss/display.hpp"
#include "mss/json_io.hpp"
#include <algorithm>
#include <cmath>
#include <iomanip>
#include <iostream>
#include <sstream>
#include <ftxui/dom/canvas.hpp>
#include <ftxui/dom/elements.hpp>
#include <ftxui/dom/table.hpp>
#include <ftxui/screen/screen.hpp>

namespace mss {

namespace {

using namespace ftxui;

// -- Formatting helpers --

std::string f2(double v) {
    std::ostringstream oss;
    oss << std::fixed << std::setprecision(2) << v;
    return oss.str();
}

std::string f3(double v) {
    std::ostringstream oss;
    oss << std::fixed << std::setprecision(3) << v;
    return oss.str();
}

std::string fpct(double v) {
    std::ostringstream oss;
    oss << std::fixed << std::setprecision(1) << (v * 100.0) << "%";
    return oss.str();
}

std::string fopt(const std::optional<double>& v) {
    return v ? f3(*v) : "n/a";
}

std::string flags_of(const MSSResult& r) {
    std::string flags;
    if (r.no_sentiment_data) flags += "no-sentiment ";
    if (r.low_confidence) flags += "low-confidence ";
    if (r.breakdown.clamped) flags += "clamped ";
    if (!flags.empty()) flags.pop_back();
    return flags;
}

Color score_color(double v) {
    if (v > 0.0) return Color::Green;
    if (v < 0.0) return Color::Red;
    return Color::GrayDark;
}

Color corr_color(const std::optional<double>& v) {
    if (!v) return Color::GrayDark;
    if (*v >= 0.5) return Color::Green;
    if (*v >= 0.2) return Color::Yellow;
    return Color::Red;
}

Color coverage_color(double v) {
    if (v >= 0.9) return Color::Green;
    if (v >= 0.7) return Color::Yellow;
    return Color::Red;
}

void print(Element doc) {
    auto screen = Screen::Create(Dimension::Fit(doc));
    Render(screen, doc);
    screen.Print();
    std::cout << "\n";
}

void print_csv(const std::vector<std::vector<std::string>>& rows) {
    for (auto& row : rows) {
        for (size_t i = 0; i < row.size(); ++i) {
            if (i > 0) std::cout << ",";
            std::cout << row[i];
        }
        std::cout << "\n";
    }
}

Table bordered_table(const std::vector<std::vector<std::string>>& rows) {
    auto table = Table(rows);
    table.SelectRow(0).Decorate(bold);
    table.SelectRow(0).SeparatorVertical(LIGHT);
    table.SelectAll().Border(LIGHT);
    return table;
}

// -- Graph helpers --

Element make_trajectory_graph(const std::vector<TrajectoryPoint>& points, int width = 60,
                              int height = 12) {
    if (points.empty()) return text("No trajectory") | dim;

    double vmin = points.front().lower;
    double vmax = points.front().upper;
    for (auto& p : points) {
        vmin = std::min(vmin, p.lower);
        vmax = std::max(vmax, p.upper);
    }
    double vspan = vmax - vmin;
    if (vspan < 0.001) vspan = 1.0;

    int canvas_w = width * 2;
    int canvas_h = height * 4;
    auto c = Canvas(canvas_w, canvas_h);
    int n = static_cast<int>(points.size());
    double x_step = n > 1 ? static_cast<double>(canvas_w - 4) / (n - 1) : 0;

    auto y_of = [&](double v) {
        return canvas_h - 2 - static_cast<int>(((v - vmin) / vspan) * (canvas_h - 4));
    };

    for (int i = 1; i < n; ++i) {
        int x0 = static_cast<int>((i - 1) * x_step) + 2;
        int x1 = static_cast<int>(i * x_step) + 2;
        c.DrawPointLine(x0, y_of(points[i - 1].upper), x1, y_of(points[i].upper), Color::GrayDark);
        c.DrawPointLine(x0, y_of(points[i - 1].lower), x1, y_of(points[i].lower), Color::GrayDark);
        c.DrawPointLine(x0, y_of(points[i - 1].expected), x1, y_of(points[i].expected),
                        Color::Cyan);
    }

    return vbox({
        hbox({
            text(f3(vmax) + " ") | dim | size(WIDTH, EQUAL, 9),
            canvas(std::move(c)),
        }),
        hbox({
            text(f3(vmin) + " ") | dim | size(WIDTH, EQUAL, 9),
            text(std::string(width - 9, ' ')),
        }),
    });
}

// -- Render functions --

Element render_results(const std::vector<MSSResult>& results) {
    if (results.empty()) return text("No scores.") | dim;

    std::vector<std::vector<std::string>> rows;
    rows.push_back({"Moment", "Player", "Role", "Side", "Stage", "dWP", "S", "N",
                    "Mult", "MSS", "Weights", "Flags"});
    for (auto& r : results) {
        rows.push_back({
            r.moment_id, r.player_id, to_string(r.role), to_string(r.side),
            to_string(r.stage), f3(r.delta_wp), f3(r.breakdown.statistical),
            f3(r.breakdown.narrative), f2(r.breakdown.context_multiplier),
            f2(r.composite), "v" + std::to_string(r.weight_version), flags_of(r),
        });
    }

    auto table = bordered_table(rows);
    for (size_t i = 1; i < rows.size(); ++i) {
        auto& r = results[i - 1];
        table.SelectCell(9, i).Decorate(color(score_color(r.composite)));
        table.SelectCell(9, i).Decorate(bold);
    }

    return vbox({
        text("Momentum Shift Scores") | bold | color(Color::Cyan),
        separator(),
        table.Render(),
    });
}

Element render_failures(const std::vector<MomentFailure>& failures) {
    std::vector<std::vector<std::string>> rows;
    rows.push_back({"Moment", "Stage", "Kind", "Message"});
    for (auto& f : failures) rows.push_back({f.moment_id, f.stage, f.kind, f.message});

    auto table = bordered_table(rows);
    for (size_t i = 1; i < rows.size(); ++i) table.SelectCell(2, i).Decorate(color(Color::Red));

    return vbox({
        text("Rejected Moments") | bold | color(Color::Red),
        separator(),
        table.Render(),
    });
}

Element render_predictions(const std::vector<PredictionRecord>& records) {
    if (records.empty()) return text("No predictions.") | dim;

    std::vector<std::vector<std::string>> rows;
    rows.push_back({"Moment", "Player", "MSS", "Model", "Periods", "First", "Last", "State"});
    for (auto& r : records) {
        auto& t = r.trajectory();
        rows.push_back({
            r.result().moment_id, r.result().player_id, f2(r.result().composite),
            "v" + std::to_string(r.model_version()), std::to_string(t.size()),
            t.empty() ? "" : f3(t.front().expected) + " [" + f3(t.front().lower) + ", " +
                                 f3(t.front().upper) + "]",
            t.empty() ? "" : f3(t.back().expected) + " [" + f3(t.back().lower) + ", " +
                                 f3(t.back().upper) + "]",
            r.evaluated() ? "evaluated" : "predicted",
        });
    }

    auto table = bordered_table(rows);
    for (size_t i = 1; i < rows.size(); ++i) {
        table.SelectCell(2, i).Decorate(color(score_color(records[i - 1].result().composite)));
    }

    Elements blocks{
        text("Performance Trajectories") | bold | color(Color::Cyan),
        separator(),
        table.Render(),
    };
    if (records.size() == 1) {
        blocks.push_back(text(""));
        blocks.push_back(text("  Expected change vs baseline (interval in gray)") | bold);
        blocks.push_back(make_trajectory_graph(records.front().trajectory()));
    }
    return vbox(blocks);
}

Element render_report(const CalibrationReport& report) {
    std::vector<std::vector<std::string>> rows;
    rows.push_back({"Group", "Records", "MAD", "RMSE", "Corr", "|Corr|", "Shift Corr",
                    "Direction", "Coverage", "Cal. Slope", "Cal. R2"});
    for (auto& g : report.groups) {
        rows.push_back({
            g.group, std::to_string(g.records), f3(g.mean_abs_deviation), f3(g.rmse),
            fopt(g.correlation), fopt(g.magnitude_correlation), fopt(g.shift_correlation),
            fpct(g.directional_hit_rate), fpct(g.interval_coverage),
            f3(g.calibration_slope), f3(g.calibration_r_squared),
        });
    }

    auto table = bordered_table(rows);
    for (size_t i = 1; i < rows.size(); ++i) {
        auto& g = report.groups[i - 1];
        table.SelectCell(4, i).Decorate(color(corr_color(g.correlation)));
        table.SelectCell(8, i).Decorate(color(coverage_color(g.interval_coverage)));
    }

    Elements issues;
    for (auto& issue : report.issues) {
        issues.push_back(hbox({
            text("  [" + issue.group + "] ") | dim,
            text(issue.kind) | color(Color::Yellow),
            text("  " + issue.detail) | dim,
        }));
    }

    return vbox({
        hbox({
            text(" Calibration") | bold,
            text("  |  "),
            text("Records: " + std::to_string(report.records_evaluated) + "/" +
                 std::to_string(report.records_total)),
            text("  |  "),
            text("Unmatched outcomes: " + std::to_string(report.outcomes_unmatched)),
        }) | borderLight | color(Color::Cyan),
        report.groups.empty() ? text("No evaluated records.") | dim : table.Render(),
        issues.empty() ? text("") : vbox(issues),
    });
}

} // namespace

std::optional<OutputFormat> parse_output_format(const std::string& s) {
    if (s == "table") return OutputFormat::Table;
    if (s == "csv") return OutputFormat::Csv;
    if (s == "json") return OutputFormat::Json;
    return std::nullopt;
}

void display_results(const std::vector<MSSResult>& results, OutputFormat format) {
    switch (format) {
        case OutputFormat::Json: {
            nlohmann::json out = nlohmann::json::array();
            for (auto& r : results) out.push_back(result_to_json(r));
            std::cout << out.dump(2) << "\n";
            break;
        }
        case OutputFormat::Csv: {
            std::vector<std::vector<std::string>> rows;
            rows.push_back({"moment_id", "player_id", "role", "side", "stage", "delta_wp",
                            "statistical", "narrative", "context_multiplier", "w1", "w2",
                            "raw", "composite", "weight_version", "flags"});
            for (auto& r : results) {
                auto& b = r.breakdown;
                rows.push_back({
                    r.moment_id, r.player_id, to_string(r.role), to_string(r.side),
                    to_string(r.stage), f3(r.delta_wp), f3(b.statistical), f3(b.narrative),
                    f3(b.context_multiplier), f2(b.w1), f2(b.w2), f3(b.raw), f3(r.composite),
                    std::to_string(r.weight_version), flags_of(r),
                });
            }
            print_csv(rows);
            break;
        }
        case OutputFormat::Table:
            print(render_results(results));
            break;
    }
}

void display_failures(const std::vector<MomentFailure>& failures, OutputFormat format) {
    if (failures.empty()) return;
    switch (format) {
        case OutputFormat::Json: {
            nlohmann::json out = nlohmann::json::array();
            for (auto& f : failures) out.push_back(failure_to_json(f));
            std::cerr << out.dump(2) << "\n";
            break;
        }
        case OutputFormat::Csv:
            for (auto& f : failures) {
                std::cerr << f.moment_id << "," << f.stage << "," << f.kind << "\n";
            }
            break;
        case OutputFormat::Table:
            print(render_failures(failures));
            break;
    }
}

void display_predictions(const std::vector<PredictionRecord>& records, OutputFormat format) {
    switch (format) {
        case OutputFormat::Json: {
            nlohmann::json out = nlohmann::json::array();
            for (auto& r : records) out.push_back(prediction_to_json(r));
            std::cout << out.dump(2) << "\n";
            break;
        }
        case OutputFormat::Csv: {
            std::vector<std::vector<std::string>> rows;
            rows.push_back({"moment_id", "player_id", "model_version", "period",
                            "expected", "lower", "upper"});
            for (auto& r : records) {
                for (auto& p : r.trajectory()) {
                    rows.push_back({
                        r.result().moment_id, r.result().player_id,
                        std::to_string(r.model_version()), std::to_string(p.period),
                        f3(p.expected), f3(p.lower), f3(p.upper),
                    });
                }
            }
            print_csv(rows);
            break;
        }
        case OutputFormat::Table:
            print(render_predictions(records));
            break;
    }
}

void display_report(const CalibrationReport& report, OutputFormat format) {
    switch (format) {
        case OutputFormat::Json:
            std::cout << report_to_json(report).dump(2) << "\n";
            break;
        case OutputFormat::Csv: {
            std::vector<std::vector<std::string>> rows;
            rows.push_back({"group", "records", "mad", "rmse", "correlation",
                            "magnitude_correlation", "directional_hit_rate",
                            "interval_coverage", "calibration_slope"});
            for (auto& g : report.groups) {
                rows.push_back({
                    g.group, std::to_string(g.records), f3(g.mean_abs_deviation), f3(g.rmse),
                    fopt(g.correlation), fopt(g.magnitude_correlation),
                    f3(g.directional_hit_rate), f3(g.interval_coverage),
                    f3(g.calibration_slope),
                });
            }
            print_csv(rows);
            break;
        }
        case OutputFormat::Table:
            print(render_report(report));
            break;
    }
}

void display_refit(const RefitResult& refit, OutputFormat format) {
    if (format == OutputFormat::Json) {
        nlohmann::json issues = nlohmann::json::array();
        for (auto& i : refit.issues) {
            issues.push_back({{"group", i.group}, {"kind", i.kind}, {"detail", i.detail}});
        }
        std::cout << nlohmann::json{
            {"weights", weights_to_json(*refit.weights)},
            {"model_version", refit.model->version()},
            {"samples", refit.samples},
            {"issues", issues},
        }.dump(2) << "\n";
        return;
    }

    auto& w = *refit.weights;
    if (format == OutputFormat::Csv) {
        print_csv({{"weight_version", "parent", "w1", "w2", "model_version", "samples"},
                   {std::to_string(w.version), w.parent ? std::to_string(*w.parent) : "",
                    f3(w.w1), f3(w.w2), std::to_string(refit.model->version()),
                    std::to_string(refit.samples)}});
        return;
    }

    auto stat_box = [](const std::string& label, const std::string& value) {
        return vbox({
            text(value) | bold | center,
            text(label) | dim | center,
        }) | size(WIDTH, EQUAL, 14) | borderLight;
    };

    Elements issues;
    for (auto& issue : refit.issues) {
        issues.push_back(hbox({
            text("  " + issue.kind) | color(Color::Yellow),
            text("  " + issue.detail) | dim,
        }));
    }

    print(vbox({
        text("Recalibration") | bold | color(Color::Cyan),
        separator(),
        hbox({
            stat_box("Weights", "v" + std::to_string(w.version)),
            stat_box("w1", f3(w.w1)),
            stat_box("w2", f3(w.w2)),
            stat_box("Model", "v" + std::to_string(refit.model->version())),
            stat_box("Samples", std::to_string(refit.samples)),
        }),
        w.note.empty() ? text("") : text("  " + w.note) | dim,
        issues.empty() ? text("") : vbox(issues),
    }));
}

} // namespace mss
