#pragma once

#include <chrono>
#include <optional>
#include <string>
#include <vector>

namespace mss {

using TimePoint = std::chrono::system_clock::time_point;

enum class SeasonPhase { Regular, Postseason };
enum class HalfInning { Top, Bottom };

enum class OutcomeType {
    Single,
    Double,
    Triple,
    HomeRun,
    Walk,
    HitByPitch,
    Strikeout,
    FieldOut,
    ForceOut,
    DoublePlay,
    Sacrifice,
    FieldError,
    WalkOff,
    BlownSave,
    Other,
};

enum class Role { Batter, Pitcher, Fielder };
enum class CareerStage { Rookie, Prime, Veteran };
enum class Side { Beneficiary, Adverse, Neutral };
enum class SentimentSource { Media, Fan, Social };

// Raw input

struct Pitch {
    int number = 0;
    std::string pitch_type;
    double speed_mph = 0.0;
    std::string result;
};

// Win probabilities are the home team's win expectancy.
struct RawEvent {
    std::string moment_id;
    std::string game_id;
    std::optional<TimePoint> timestamp;
    int inning = 0;
    std::string half;
    std::string season_phase;
    std::string outcome;
    int home_score_before = 0;
    int away_score_before = 0;
    int home_score_after = 0;
    int away_score_after = 0;
    std::optional<double> wp_before;
    std::optional<double> wp_after;
    std::string batter_id;
    std::string pitcher_id;
    std::vector<std::string> fielder_ids;
    std::vector<Pitch> pitches;
};

// Canonical moment

struct GameScore {
    int home = 0;
    int away = 0;
};

struct Moment {
    std::string id;
    std::string game_id;
    TimePoint timestamp;
    int inning = 0;
    HalfInning half = HalfInning::Top;
    SeasonPhase phase = SeasonPhase::Regular;
    OutcomeType outcome = OutcomeType::Other;
    GameScore before;
    GameScore after;
    double wp_before = 0.0;
    double wp_after = 0.0;
    std::string batter_id;
    std::string pitcher_id;
    std::vector<std::string> fielder_ids;
    std::vector<Pitch> pitches;

    double delta_wp() const { return wp_after - wp_before; }
    bool home_batting() const { return half == HalfInning::Bottom; }

    int batting_runs_scored() const {
        return home_batting() ? after.home - before.home : after.away - before.away;
    }

    // Batting team perspective.
    int differential_before() const {
        return home_batting() ? before.home - before.away : before.away - before.home;
    }
    int differential_after() const {
        return home_batting() ? after.home - after.away : after.away - after.home;
    }
};

// Player history as returned by the history store

struct Appearance {
    std::string game_id;
    TimePoint date;
    double performance = 0.0;
};

struct PlayerHistory {
    std::string player_id;
    int career_plate_appearances = 0;
    double career_innings_pitched = 0.0;
    double career_performance = 0.0;
    std::vector<Appearance> appearances;
};

struct PlayerContext {
    std::string player_id;
    Role role = Role::Batter;
    CareerStage stage = CareerStage::Prime;
    double seasons_played = 0.0;
    double baseline = 0.0;
    double career_performance = 0.0;
    int window_used = 0;
    bool home_team = false;
    Side side = Side::Neutral;
    double signed_delta_wp = 0.0;
    bool low_confidence = false;
};

// Sentiment

struct SentimentObservation {
    std::string moment_id;
    std::optional<std::string> player_id;
    SentimentSource source = SentimentSource::Media;
    double polarity = 0.0;
    double volume = 1.0;
    double offset_hours = 0.0;
};

struct SentimentSignal {
    double value = 0.0;
    int used = 0;
    int discarded = 0;
    double total_weight = 0.0;
    bool no_data = false;
};

// Scores

struct ScoreBreakdown {
    double statistical = 0.0;
    double narrative = 0.0;
    double context_multiplier = 1.0;
    double w1 = 0.0;
    double w2 = 0.0;
    double statistical_term = 0.0;
    double narrative_term = 0.0;
    double raw = 0.0;
    bool clamped = false;
};

struct MSSResult {
    std::string moment_id;
    std::string player_id;
    int weight_version = 0;
    Role role = Role::Batter;
    Side side = Side::Neutral;
    CareerStage stage = CareerStage::Prime;
    double delta_wp = 0.0;
    double baseline = 0.0;
    double composite = 0.0;
    bool no_sentiment_data = false;
    bool low_confidence = false;
    ScoreBreakdown breakdown;
};

// Predictions and ground truth

struct TrajectoryPoint {
    int period = 0;
    double expected = 0.0;
    double lower = 0.0;
    double upper = 0.0;
};

// values are absolute per-period performance index readings.
struct ObservedOutcome {
    std::string moment_id;
    std::string player_id;
    std::vector<double> values;
    std::optional<double> realized_shift;
};

struct RecordEvaluation {
    std::vector<double> observed_delta;
    int periods_compared = 0;
    double mean_abs_deviation = 0.0;
    double rmse = 0.0;
    double realized_mean_change = 0.0;
    int inside_interval = 0;
    std::optional<double> realized_shift;
};

// Versioned calibration state

struct WeightSet {
    int version = 0;
    std::optional<int> parent;
    double w1 = 0.0;
    double w2 = 0.0;
    std::string note;
};

// Errors

enum class MalformedKind { MissingField, OutOfRange, InconsistentState };

struct MalformedMomentError {
    MalformedKind kind = MalformedKind::MissingField;
    std::vector<std::string> fields;
    std::string message;
};

enum class ScoreErrorKind { InsufficientHistory, CollaboratorFailure, InvalidConfig };

struct ScoreError {
    ScoreErrorKind kind = ScoreErrorKind::InsufficientHistory;
    std::string moment_id;
    std::string player_id;
    std::string message;
    int available = 0;
    int required = 0;
};

enum class PredictErrorKind { UntrainedModel, UnknownVersion, InvalidInput };

struct PredictError {
    PredictErrorKind kind = PredictErrorKind::UntrainedModel;
    std::string message;
};

struct LookupError {
    std::string player_id;
    std::string message;
};

struct ConfigError {
    std::string key;
    std::string message;
};

struct LedgerError {
    std::string key;
    std::string message;
};

// Enum names

std::string to_string(SeasonPhase phase);
std::string to_string(HalfInning half);
std::string to_string(OutcomeType outcome);
std::string to_string(Role role);
std::string to_string(CareerStage stage);
std::string to_string(Side side);
std::string to_string(SentimentSource source);
std::string to_string(MalformedKind kind);
std::string to_string(ScoreErrorKind kind);
std::string to_string(PredictErrorKind kind);

std::optional<SeasonPhase> parse_season_phase(const std::string& s);
std::optional<HalfInning> parse_half_inning(const std::string& s);
OutcomeType parse_outcome(const std::string& s);
std::optional<Role> parse_role(const std::string& s);
std::optional<CareerStage> parse_career_stage(const std::string& s);
std::optional<Side> parse_side(const std::string& s);
std::optional<SentimentSource> parse_sentiment_source(const std::string& s);

} // namespace mss
