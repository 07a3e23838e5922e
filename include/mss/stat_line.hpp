#pragma once

#include "mss/types.hpp"
#include <optional>
#include <string>
#include <utility>
#include <vector>

namespace mss {

struct PlateAppearanceEvent {
    OutcomeType outcome = OutcomeType::Other;
    int runs_scored = 0;
    // Runner on second or third when the plate appearance began.
    std::optional<bool> risp;
    std::optional<double> launch_speed; // mph
    std::optional<double> launch_angle; // degrees
    std::vector<double> pitch_speeds;   // release speeds, mph
};

// A barrel leaves the bat at 98 mph or more with a launch angle of 8 to 32 degrees.
bool is_barrel(const PlateAppearanceEvent& event);

struct BatterLine {
    int plate_appearances = 0;
    int at_bats = 0;
    int singles = 0;
    int doubles = 0;
    int triples = 0;
    int home_runs = 0;
    int walks = 0;
    int strikeouts = 0;
    int hit_by_pitch = 0;

    int risp_at_bats = 0;
    int risp_hits = 0;
    int batted_balls = 0; // with a recorded launch speed
    int barrels = 0;
    double launch_speed_sum = 0.0;

    int hits() const { return singles + doubles + triples + home_runs; }
    double batting_avg() const {
        return at_bats > 0 ? static_cast<double>(hits()) / at_bats : 0.0;
    }
    double on_base_pct() const {
        return plate_appearances > 0
                   ? static_cast<double>(hits() + walks + hit_by_pitch) / plate_appearances
                   : 0.0;
    }
    double slugging_pct() const {
        return at_bats > 0 ? static_cast<double>(singles + 2 * doubles + 3 * triples +
                                                 4 * home_runs) / at_bats
                           : 0.0;
    }
    double ops() const { return on_base_pct() + slugging_pct(); }
    double home_run_rate() const {
        return at_bats > 0 ? static_cast<double>(home_runs) / at_bats : 0.0;
    }
    double strikeout_rate() const {
        return plate_appearances > 0 ? static_cast<double>(strikeouts) / plate_appearances : 0.0;
    }

    std::optional<double> risp_avg() const {
        if (risp_at_bats == 0) return std::nullopt;
        return static_cast<double>(risp_hits) / risp_at_bats;
    }
    std::optional<double> barrel_rate() const {
        if (batted_balls == 0) return std::nullopt;
        return static_cast<double>(barrels) / batted_balls;
    }
    std::optional<double> avg_launch_speed() const {
        if (batted_balls == 0) return std::nullopt;
        return launch_speed_sum / batted_balls;
    }
};

// Rate stats need at least one recorded out; a pitcher who retired nobody has
// no innings to divide by.
struct PitcherLine {
    int batters_faced = 0;
    int outs = 0;
    int hits = 0;
    int walks = 0;
    int strikeouts = 0;
    int home_runs = 0;
    int runs_allowed = 0;

    int risp_at_bats = 0;
    int risp_hits = 0;
    int batted_balls = 0;
    int barrels = 0;
    int pitches_timed = 0;
    double pitch_speed_sum = 0.0;

    double innings_pitched() const { return outs / 3.0; }
    std::optional<double> per_nine(int count) const {
        if (outs == 0) return std::nullopt;
        return 9.0 * count / innings_pitched();
    }
    std::optional<double> era() const { return per_nine(runs_allowed); }
    std::optional<double> whip() const {
        if (outs == 0) return std::nullopt;
        return (hits + walks) / innings_pitched();
    }
    std::optional<double> k_per_9() const { return per_nine(strikeouts); }
    std::optional<double> bb_per_9() const { return per_nine(walks); }
    std::optional<double> hr_per_9() const { return per_nine(home_runs); }
    double k_bb_ratio() const {
        return walks > 0 ? static_cast<double>(strikeouts) / walks : strikeouts;
    }

    std::optional<double> risp_avg_against() const {
        if (risp_at_bats == 0) return std::nullopt;
        return static_cast<double>(risp_hits) / risp_at_bats;
    }
    std::optional<double> barrel_rate_allowed() const {
        if (batted_balls == 0) return std::nullopt;
        return static_cast<double>(barrels) / batted_balls;
    }
    std::optional<double> avg_velocity() const {
        if (pitches_timed == 0) return std::nullopt;
        return pitch_speed_sum / pitches_timed;
    }
};

BatterLine summarize_batter(const std::vector<PlateAppearanceEvent>& events);
PitcherLine summarize_pitcher(const std::vector<PlateAppearanceEvent>& events);

// Higher is better for both roles: OPS for batters, the negated FIP core
// (13HR + 3BB - 2K) / IP for pitchers. NaN when the line has no plate
// appearances, or for a pitcher with no recorded outs.
double performance_index(const BatterLine& line);
double performance_index(const PitcherLine& line);
double performance_index(Role role, const std::vector<PlateAppearanceEvent>& events);

struct RealizedShift {
    bool available = false;
    double score = 50.0; // 0-100, 50 is neutral
    std::vector<std::pair<std::string, double>> components;
};

// Clamped, normalized change of each component between the two periods,
// weighted into a 0-100 score. Batted-ball, velocity and RISP components join
// only when both periods carry that data.
RealizedShift realized_shift(const BatterLine& before, const BatterLine& after);
RealizedShift realized_shift(const PitcherLine& before, const PitcherLine& after);

// One performance index reading per post-moment period (NaN for a period the
// player sat out), plus the realized shift between the pre-moment events and
// all post-moment events.
ObservedOutcome outcome_from_events(
    const std::string& moment_id, const std::string& player_id, Role role,
    const std::vector<PlateAppearanceEvent>& before,
    const std::vector<std::vector<PlateAppearanceEvent>>& periods);

} // namespace mss
