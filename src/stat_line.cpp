#include "mss/stat_line.hpp"
#include <algorithm>
#include <limits>

namespace mss {

namespace {

struct Component {
    const char* name;
    double change;
    double scale;
    double weight;
};

RealizedShift weigh(const std::vector<Component>& parts) {
    if (parts.empty()) return {};

    RealizedShift shift;
    shift.available = true;

    double total_weight = 0.0;
    double weighted_sum = 0.0;
    for (auto& c : parts) {
        double normalized = std::clamp(c.change / c.scale, -1.0, 1.0);
        shift.components.emplace_back(c.name, normalized);
        weighted_sum += normalized * c.weight;
        total_weight += c.weight;
    }

    shift.score = 50.0 + (weighted_sum / total_weight) * 50.0;
    return shift;
}

// Adds a component when both periods have the reading. Improvement is a rise
// unless lower_is_better.
void add_if_present(std::vector<Component>& parts, const char* name,
                    std::optional<double> before, std::optional<double> after,
                    double scale, double weight, bool lower_is_better = false) {
    if (!before || !after) return;
    double change = lower_is_better ? *before - *after : *after - *before;
    parts.push_back({name, change, scale, weight});
}

bool is_out(OutcomeType o) {
    return o == OutcomeType::Strikeout || o == OutcomeType::FieldOut ||
           o == OutcomeType::ForceOut || o == OutcomeType::Sacrifice;
}

bool is_hit(OutcomeType o) {
    return o == OutcomeType::Single || o == OutcomeType::Double ||
           o == OutcomeType::Triple || o == OutcomeType::HomeRun;
}

bool is_at_bat(OutcomeType o) {
    return o != OutcomeType::Walk && o != OutcomeType::HitByPitch &&
           o != OutcomeType::Sacrifice;
}

bool is_moment_label(OutcomeType o) {
    return o == OutcomeType::WalkOff || o == OutcomeType::BlownSave || o == OutcomeType::Other;
}

// Both lines keep the same RISP and batted-ball counters.
template <typename Line>
void tally_context(Line& line, const PlateAppearanceEvent& e) {
    if (e.risp.value_or(false) && is_at_bat(e.outcome)) {
        line.risp_at_bats++;
        if (is_hit(e.outcome)) line.risp_hits++;
    }
    if (e.launch_speed) {
        line.batted_balls++;
        if (is_barrel(e)) line.barrels++;
    }
}

constexpr double not_available = std::numeric_limits<double>::quiet_NaN();

} // namespace

bool is_barrel(const PlateAppearanceEvent& event) {
    if (!event.launch_speed || !event.launch_angle) return false;
    return *event.launch_speed >= 98.0 && *event.launch_angle >= 8.0 &&
           *event.launch_angle <= 32.0;
}

BatterLine summarize_batter(const std::vector<PlateAppearanceEvent>& events) {
    BatterLine line;
    for (auto& e : events) {
        if (is_moment_label(e.outcome)) continue;

        switch (e.outcome) {
            case OutcomeType::Single: line.singles++; break;
            case OutcomeType::Double: line.doubles++; break;
            case OutcomeType::Triple: line.triples++; break;
            case OutcomeType::HomeRun: line.home_runs++; break;
            case OutcomeType::Walk: line.walks++; break;
            case OutcomeType::HitByPitch: line.hit_by_pitch++; break;
            case OutcomeType::Strikeout: line.strikeouts++; break;
            default: break;
        }
        line.plate_appearances++;
        if (is_at_bat(e.outcome)) line.at_bats++;

        tally_context(line, e);
        if (e.launch_speed) line.launch_speed_sum += *e.launch_speed;
    }
    return line;
}

PitcherLine summarize_pitcher(const std::vector<PlateAppearanceEvent>& events) {
    PitcherLine line;
    for (auto& e : events) {
        if (is_moment_label(e.outcome)) continue;

        line.batters_faced++;
        line.runs_allowed += std::max(0, e.runs_scored);

        if (is_hit(e.outcome)) line.hits++;
        switch (e.outcome) {
            case OutcomeType::HomeRun: line.home_runs++; break;
            case OutcomeType::Walk: line.walks++; break;
            case OutcomeType::Strikeout: line.strikeouts++; break;
            case OutcomeType::DoublePlay: line.outs += 2; break;
            default: break;
        }
        if (is_out(e.outcome)) line.outs++;

        tally_context(line, e);
        for (double speed : e.pitch_speeds) {
            if (speed <= 0.0) continue;
            line.pitches_timed++;
            line.pitch_speed_sum += speed;
        }
    }
    return line;
}

double performance_index(const BatterLine& line) {
    if (line.plate_appearances == 0) return not_available;
    return line.ops();
}

double performance_index(const PitcherLine& line) {
    if (line.outs == 0) return not_available;
    return -(13.0 * line.home_runs + 3.0 * line.walks - 2.0 * line.strikeouts) /
           line.innings_pitched();
}

double performance_index(Role role, const std::vector<PlateAppearanceEvent>& events) {
    if (role == Role::Pitcher) return performance_index(summarize_pitcher(events));
    return performance_index(summarize_batter(events));
}

RealizedShift realized_shift(const BatterLine& before, const BatterLine& after) {
    if (before.plate_appearances == 0 || after.plate_appearances == 0) return {};

    std::vector<Component> parts = {
        {"batting_avg", after.batting_avg() - before.batting_avg(), 0.050, 0.15},
        {"on_base_pct", after.on_base_pct() - before.on_base_pct(), 0.050, 0.15},
        {"slugging_pct", after.slugging_pct() - before.slugging_pct(), 0.100, 0.15},
        {"home_run_rate", after.home_run_rate() - before.home_run_rate(), 0.030, 0.10},
        // Fewer strikeouts is an improvement.
        {"strikeout_rate", before.strikeout_rate() - after.strikeout_rate(), 0.050, 0.10},
    };
    add_if_present(parts, "barrel_rate", before.barrel_rate(), after.barrel_rate(), 0.030, 0.15);
    add_if_present(parts, "launch_speed", before.avg_launch_speed(), after.avg_launch_speed(),
                   2.0, 0.10);
    add_if_present(parts, "situational", before.risp_avg(), after.risp_avg(), 0.070, 0.10);
    return weigh(parts);
}

RealizedShift realized_shift(const PitcherLine& before, const PitcherLine& after) {
    if (before.batters_faced == 0 || after.batters_faced == 0) return {};

    std::vector<Component> parts;
    add_if_present(parts, "era", before.era(), after.era(), 1.0, 0.15, true);
    add_if_present(parts, "whip", before.whip(), after.whip(), 0.300, 0.15, true);
    add_if_present(parts, "k_per_9", before.k_per_9(), after.k_per_9(), 1.5, 0.15);
    add_if_present(parts, "bb_per_9", before.bb_per_9(), after.bb_per_9(), 1.0, 0.10, true);
    add_if_present(parts, "hr_per_9", before.hr_per_9(), after.hr_per_9(), 0.5, 0.10, true);
    add_if_present(parts, "barrel_rate", before.barrel_rate_allowed(),
                   after.barrel_rate_allowed(), 0.030, 0.15, true);
    add_if_present(parts, "velocity", before.avg_velocity(), after.avg_velocity(), 1.0, 0.10);
    add_if_present(parts, "situational", before.risp_avg_against(), after.risp_avg_against(),
                   0.050, 0.10, true);
    return weigh(parts);
}

ObservedOutcome outcome_from_events(
    const std::string& moment_id, const std::string& player_id, Role role,
    const std::vector<PlateAppearanceEvent>& before,
    const std::vector<std::vector<PlateAppearanceEvent>>& periods) {

    ObservedOutcome outcome{.moment_id = moment_id, .player_id = player_id};

    std::vector<PlateAppearanceEvent> all_after;
    for (auto& period : periods) {
        outcome.values.push_back(performance_index(role, period));
        all_after.insert(all_after.end(), period.begin(), period.end());
    }

    RealizedShift shift = role == Role::Pitcher
        ? realized_shift(summarize_pitcher(before), summarize_pitcher(all_after))
        : realized_shift(summarize_batter(before), summarize_batter(all_after));
    if (shift.available) outcome.realized_shift = shift.score;

    return outcome;
}

} // namespace mss
