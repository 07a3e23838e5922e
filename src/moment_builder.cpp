#include "mss/moment_builder.hpp"
#include <algorithm>
#include <cmath>
#include <spdlog/spdlog.h>

namespace mss {

namespace {

std::string join(const std::vector<std::string>& fields) {
    std::string out;
    for (auto& f : fields) {
        if (!out.empty()) out += ", ";
        out += f;
    }
    return out;
}

// The out-of-range fields, if any, follow the fields that decided the kind.
std::unexpected<MalformedMomentError> reject(const RawEvent& raw, MalformedKind kind,
                                             std::vector<std::string> fields,
                                             const std::vector<std::string>& out_of_range = {}) {
    auto message = to_string(kind) + ": " + join(fields);
    if (!out_of_range.empty()) {
        message += "; " + to_string(MalformedKind::OutOfRange) + ": " + join(out_of_range);
        fields.insert(fields.end(), out_of_range.begin(), out_of_range.end());
    }
    spdlog::debug("Rejected moment '{}': {}", raw.moment_id, message);
    return std::unexpected(MalformedMomentError{
        .kind = kind,
        .fields = std::move(fields),
        .message = std::move(message),
    });
}

bool valid_probability(double p) {
    return std::isfinite(p) && p >= 0.0 && p <= 1.0;
}

} // namespace

std::expected<Moment, MalformedMomentError> build_moment(const RawEvent& raw) {
    std::vector<std::string> missing;
    if (raw.moment_id.empty()) missing.push_back("moment_id");
    if (raw.game_id.empty()) missing.push_back("game_id");
    if (!raw.timestamp) missing.push_back("timestamp");
    if (raw.half.empty()) missing.push_back("half");
    if (raw.season_phase.empty()) missing.push_back("season_phase");
    if (raw.outcome.empty()) missing.push_back("outcome");
    if (!raw.wp_before) missing.push_back("wp_before");
    if (!raw.wp_after) missing.push_back("wp_after");
    if (raw.batter_id.empty()) missing.push_back("batter_id");
    if (raw.pitcher_id.empty()) missing.push_back("pitcher_id");
    for (size_t i = 0; i < raw.fielder_ids.size(); ++i) {
        if (raw.fielder_ids[i].empty()) {
            missing.push_back("fielder_ids[" + std::to_string(i) + "]");
        }
    }

    std::vector<std::string> out_of_range;
    auto half = parse_half_inning(raw.half);
    auto phase = parse_season_phase(raw.season_phase);
    if (!raw.half.empty() && !half) out_of_range.push_back("half");
    if (!raw.season_phase.empty() && !phase) out_of_range.push_back("season_phase");
    if (raw.inning < 1) out_of_range.push_back("inning");
    if (raw.wp_before && !valid_probability(*raw.wp_before)) out_of_range.push_back("wp_before");
    if (raw.wp_after && !valid_probability(*raw.wp_after)) out_of_range.push_back("wp_after");
    if (raw.home_score_before < 0) out_of_range.push_back("home_score_before");
    if (raw.away_score_before < 0) out_of_range.push_back("away_score_before");
    if (raw.home_score_after < 0) out_of_range.push_back("home_score_after");
    if (raw.away_score_after < 0) out_of_range.push_back("away_score_after");
    for (size_t i = 0; i < raw.pitches.size(); ++i) {
        auto& p = raw.pitches[i];
        if (!std::isfinite(p.speed_mph) || p.speed_mph < 0.0) {
            out_of_range.push_back("pitches[" + std::to_string(i) + "].speed_mph");
        }
    }
    if (!missing.empty()) {
        return reject(raw, MalformedKind::MissingField, std::move(missing), out_of_range);
    }
    if (!out_of_range.empty()) return reject(raw, MalformedKind::OutOfRange, std::move(out_of_range));

    Moment m{
        .id = raw.moment_id,
        .game_id = raw.game_id,
        .timestamp = *raw.timestamp,
        .inning = raw.inning,
        .half = *half,
        .phase = *phase,
        .outcome = parse_outcome(raw.outcome),
        .before = {raw.home_score_before, raw.away_score_before},
        .after = {raw.home_score_after, raw.away_score_after},
        .wp_before = *raw.wp_before,
        .wp_after = *raw.wp_after,
        .batter_id = raw.batter_id,
        .pitcher_id = raw.pitcher_id,
        .fielder_ids = raw.fielder_ids,
        .pitches = raw.pitches,
    };

    std::vector<std::string> inconsistent;
    if (m.after.home < m.before.home) inconsistent.push_back("home_score_after");
    if (m.after.away < m.before.away) inconsistent.push_back("away_score_after");

    // Only the batting team can score during its own plate appearance.
    int fielding_runs = m.home_batting() ? m.after.away - m.before.away
                                         : m.after.home - m.before.home;
    if (fielding_runs != 0) {
        inconsistent.push_back(m.home_batting() ? "away_score_after" : "home_score_after");
    }

    int runs = m.batting_runs_scored();
    auto batting_after = m.home_batting() ? "home_score_after" : "away_score_after";
    switch (m.outcome) {
        case OutcomeType::HomeRun:
            if (runs < 1 || runs > 4) inconsistent.push_back(batting_after);
            break;
        case OutcomeType::Strikeout:
            if (runs > 1) inconsistent.push_back(batting_after);
            break;
        case OutcomeType::WalkOff:
            if (!m.home_batting()) inconsistent.push_back("half");
            if (m.inning < 9) inconsistent.push_back("inning");
            if (m.differential_before() > 0 || m.differential_after() <= 0)
                inconsistent.push_back(batting_after);
            break;
        case OutcomeType::BlownSave:
            // The fielding team held the lead before and no longer does.
            if (m.differential_before() >= 0 || m.differential_after() < 0)
                inconsistent.push_back(batting_after);
            break;
        default:
            break;
    }

    if (m.batter_id == m.pitcher_id) inconsistent.push_back("pitcher_id");
    for (size_t i = 0; i < m.fielder_ids.size(); ++i) {
        if (m.fielder_ids[i] == m.batter_id) {
            inconsistent.push_back("fielder_ids[" + std::to_string(i) + "]");
        }
    }

    for (size_t i = 0; i < m.pitches.size(); ++i) {
        if (m.pitches[i].number != static_cast<int>(i) + 1) {
            inconsistent.push_back("pitches[" + std::to_string(i) + "].number");
            break;
        }
    }

    if (!inconsistent.empty()) {
        std::sort(inconsistent.begin(), inconsistent.end());
        inconsistent.erase(std::unique(inconsistent.begin(), inconsistent.end()),
                           inconsistent.end());
        return reject(raw, MalformedKind::InconsistentState, std::move(inconsistent));
    }

    spdlog::debug("Built moment {} ({} {} {}, dWP {:+.3f})", m.id, to_string(m.outcome),
                  to_string(m.half), m.inning, m.delta_wp());
    return m;
}

} // namespace mss
