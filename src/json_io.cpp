#include "mss/json_io.hpp"
#include "mss/stat_line.hpp"
#include <cstdio>
#include <ctime>
#include <fstream>
#include <limits>
#include <stdexcept>
#include <spdlog/spdlog.h>

namespace mss {

namespace {

TimePoint parse_epoch(int64_t epoch_secs) {
    return std::chrono::system_clock::from_time_t(static_cast<time_t>(epoch_secs));
}

std::optional<TimePoint> parse_iso8601(const std::string& s) {
    std::tm tm{};
    int matched = sscanf(s.c_str(), "%d-%d-%dT%d:%d:%d",
                         &tm.tm_year, &tm.tm_mon, &tm.tm_mday,
                         &tm.tm_hour, &tm.tm_min, &tm.tm_sec);
    if (matched != 6) return std::nullopt;
    if (tm.tm_mon < 1 || tm.tm_mon > 12 || tm.tm_mday < 1 || tm.tm_mday > 31 ||
        tm.tm_hour < 0 || tm.tm_hour > 23 || tm.tm_min < 0 || tm.tm_min > 59 ||
        tm.tm_sec < 0 || tm.tm_sec > 60) {
        return std::nullopt;
    }
    tm.tm_year -= 1900;
    tm.tm_mon -= 1;
    return std::chrono::system_clock::from_time_t(timegm(&tm));
}

int safe_int(const nlohmann::json& j, const std::string& key, int fallback = 0) {
    if (j.contains(key) && !j[key].is_null() && j[key].is_number())
        return j[key].get<int>();
    return fallback;
}

double safe_double(const nlohmann::json& j, const std::string& key, double fallback = 0.0) {
    if (j.contains(key) && !j[key].is_null() && j[key].is_number())
        return j[key].get<double>();
    return fallback;
}

std::optional<double> opt_double(const nlohmann::json& j, const std::string& key) {
    if (j.contains(key) && j[key].is_number()) return j[key].get<double>();
    return std::nullopt;
}

std::string safe_str(const nlohmann::json& j, const std::string& key,
                     const std::string& fallback = "") {
    if (j.contains(key) && !j[key].is_null() && j[key].is_string())
        return j[key].get<std::string>();
    return fallback;
}

bool safe_bool(const nlohmann::json& j, const std::string& key, bool fallback = false) {
    if (j.contains(key) && j[key].is_boolean()) return j[key].get<bool>();
    return fallback;
}

std::vector<PlateAppearanceEvent> parse_events(const nlohmann::json& j) {
    std::vector<PlateAppearanceEvent> events;
    if (!j.is_array()) return events;
    for (auto& e : j) {
        if (e.is_string()) {
            events.push_back({.outcome = parse_outcome(e.get<std::string>())});
        } else if (e.is_object()) {
            PlateAppearanceEvent pa{
                .outcome = parse_outcome(safe_str(e, "event")),
                .runs_scored = safe_int(e, "runs_scored"),
                .launch_speed = opt_double(e, "launch_speed"),
                .launch_angle = opt_double(e, "launch_angle"),
            };
            if (e.contains("risp") && e["risp"].is_boolean()) pa.risp = e["risp"].get<bool>();
            if (e.contains("pitch_speeds") && e["pitch_speeds"].is_array()) {
                for (auto& v : e["pitch_speeds"]) {
                    if (v.is_number()) pa.pitch_speeds.push_back(v.get<double>());
                }
            }
            events.push_back(std::move(pa));
        }
    }
    return events;
}

// Null entries stand for periods without a reading.
std::vector<double> parse_values(const nlohmann::json& j) {
    std::vector<double> values;
    if (!j.is_array()) return values;
    for (auto& v : j) {
        values.push_back(v.is_number() ? v.get<double>()
                                       : std::numeric_limits<double>::quiet_NaN());
    }
    return values;
}

nlohmann::json opt_to_json(const std::optional<double>& v) {
    return v ? nlohmann::json(*v) : nlohmann::json(nullptr);
}

} // namespace

std::optional<TimePoint> parse_timestamp(const nlohmann::json& j) {
    if (j.is_number_integer()) return parse_epoch(j.get<int64_t>());
    if (j.is_string()) return parse_iso8601(j.get<std::string>());
    return std::nullopt;
}

RawEvent parse_raw_event(const nlohmann::json& j) {
    RawEvent e;
    e.moment_id = safe_str(j, "moment_id");
    e.game_id = safe_str(j, "game_id");
    if (j.contains("timestamp") && !j["timestamp"].is_null()) {
        e.timestamp = parse_timestamp(j["timestamp"]);
    }
    e.inning = safe_int(j, "inning");
    e.half = safe_str(j, "half");
    e.season_phase = safe_str(j, "season_phase");
    e.outcome = safe_str(j, "outcome");

    if (j.contains("score_before") && j["score_before"].is_object()) {
        e.home_score_before = safe_int(j["score_before"], "home");
        e.away_score_before = safe_int(j["score_before"], "away");
    }
    if (j.contains("score_after") && j["score_after"].is_object()) {
        e.home_score_after = safe_int(j["score_after"], "home");
        e.away_score_after = safe_int(j["score_after"], "away");
    }

    e.wp_before = opt_double(j, "wp_before");
    e.wp_after = opt_double(j, "wp_after");
    e.batter_id = safe_str(j, "batter_id");
    e.pitcher_id = safe_str(j, "pitcher_id");

    if (j.contains("fielder_ids") && j["fielder_ids"].is_array()) {
        for (auto& f : j["fielder_ids"]) {
            e.fielder_ids.push_back(f.is_string() ? f.get<std::string>() : "");
        }
    }
    if (j.contains("pitches") && j["pitches"].is_array()) {
        for (auto& p : j["pitches"]) {
            e.pitches.push_back({
                .number = safe_int(p, "number"),
                .pitch_type = safe_str(p, "pitch_type"),
                .speed_mph = safe_double(p, "speed_mph"),
                .result = safe_str(p, "result"),
            });
        }
    }
    return e;
}

SentimentObservation parse_observation(const nlohmann::json& j) {
    SentimentObservation obs;
    obs.moment_id = safe_str(j, "moment_id");
    auto player = safe_str(j, "player_id");
    if (!player.empty()) obs.player_id = player;
    obs.source = parse_sentiment_source(safe_str(j, "source", "media"))
                     .value_or(SentimentSource::Media);
    obs.polarity = safe_double(j, "polarity");
    obs.volume = safe_double(j, "volume", 1.0);
    obs.offset_hours = safe_double(j, "offset_hours");
    return obs;
}

PlayerHistory parse_history(const nlohmann::json& j) {
    PlayerHistory h;
    h.player_id = safe_str(j, "player_id");
    h.career_plate_appearances = safe_int(j, "career_plate_appearances");
    h.career_innings_pitched = safe_double(j, "career_innings_pitched");
    h.career_performance = safe_double(j, "career_performance");
    if (j.contains("appearances") && j["appearances"].is_array()) {
        for (auto& a : j["appearances"]) {
            auto game_id = safe_str(a, "game_id");
            std::optional<TimePoint> date;
            if (a.contains("date")) date = parse_timestamp(a["date"]);
            if (!date) {
                spdlog::warn("Dropping appearance {} of {}: unreadable date", game_id,
                             h.player_id);
                continue;
            }
            h.appearances.push_back({
                .game_id = game_id,
                .date = *date,
                .performance = safe_double(a, "performance"),
            });
        }
    }
    return h;
}

ObservedOutcome parse_observed_outcome(const nlohmann::json& j) {
    auto moment_id = safe_str(j, "moment_id");
    auto player_id = safe_str(j, "player_id");

    if (j.contains("periods") && j["periods"].is_array()) {
        auto role = parse_role(safe_str(j, "role", "batter")).value_or(Role::Batter);
        std::vector<std::vector<PlateAppearanceEvent>> periods;
        for (auto& p : j["periods"]) periods.push_back(parse_events(p));
        auto before = j.contains("before") ? parse_events(j["before"])
                                           : std::vector<PlateAppearanceEvent>{};
        return outcome_from_events(moment_id, player_id, role, before, periods);
    }

    ObservedOutcome o{.moment_id = moment_id, .player_id = player_id};
    if (j.contains("values")) o.values = parse_values(j["values"]);
    o.realized_shift = opt_double(j, "realized_shift");
    return o;
}

nlohmann::json result_to_json(const MSSResult& r) {
    auto& b = r.breakdown;
    return {
        {"moment_id", r.moment_id},
        {"player_id", r.player_id},
        {"weight_version", r.weight_version},
        {"role", to_string(r.role)},
        {"side", to_string(r.side)},
        {"stage", to_string(r.stage)},
        {"delta_wp", r.delta_wp},
        {"baseline", r.baseline},
        {"composite", r.composite},
        {"no_sentiment_data", r.no_sentiment_data},
        {"low_confidence", r.low_confidence},
        {"breakdown", {
            {"statistical", b.statistical},
            {"narrative", b.narrative},
            {"context_multiplier", b.context_multiplier},
            {"w1", b.w1},
            {"w2", b.w2},
            {"statistical_term", b.statistical_term},
            {"narrative_term", b.narrative_term},
            {"raw", b.raw},
            {"clamped", b.clamped},
        }},
    };
}

MSSResult result_from_json(const nlohmann::json& j) {
    MSSResult r;
    r.moment_id = j.at("moment_id").get<std::string>();
    r.player_id = j.at("player_id").get<std::string>();
    r.weight_version = j.at("weight_version").get<int>();
    r.role = parse_role(safe_str(j, "role")).value_or(Role::Batter);
    r.side = parse_side(safe_str(j, "side")).value_or(Side::Neutral);
    r.stage = parse_career_stage(safe_str(j, "stage")).value_or(CareerStage::Prime);
    r.delta_wp = safe_double(j, "delta_wp");
    r.baseline = safe_double(j, "baseline");
    r.composite = j.at("composite").get<double>();
    r.no_sentiment_data = safe_bool(j, "no_sentiment_data");
    r.low_confidence = safe_bool(j, "low_confidence");

    auto& b = j.at("breakdown");
    r.breakdown = {
        .statistical = b.at("statistical").get<double>(),
        .narrative = b.at("narrative").get<double>(),
        .context_multiplier = b.at("context_multiplier").get<double>(),
        .w1 = b.at("w1").get<double>(),
        .w2 = b.at("w2").get<double>(),
        .statistical_term = b.at("statistical_term").get<double>(),
        .narrative_term = b.at("narrative_term").get<double>(),
        .raw = b.at("raw").get<double>(),
        .clamped = safe_bool(b, "clamped"),
    };
    return r;
}

nlohmann::json prediction_to_json(const PredictionRecord& record) {
    nlohmann::json trajectory = nlohmann::json::array();
    for (auto& p : record.trajectory()) {
        trajectory.push_back({
            {"period", p.period},
            {"expected", p.expected},
            {"lower", p.lower},
            {"upper", p.upper},
        });
    }

    nlohmann::json j = {
        {"moment_id", record.result().moment_id},
        {"player_id", record.result().player_id},
        {"model_version", record.model_version()},
        {"state", record.evaluated() ? "evaluated" : "predicted"},
        {"result", result_to_json(record.result())},
        {"trajectory", trajectory},
    };

    if (record.observed()) {
        auto& o = *record.observed();
        j["observed"] = {
            {"values", o.values},
            {"realized_shift", opt_to_json(o.realized_shift)},
        };
    }
    if (record.evaluation()) {
        auto& e = *record.evaluation();
        j["evaluation"] = {
            {"observed_delta", e.observed_delta},
            {"periods_compared", e.periods_compared},
            {"mean_abs_deviation", e.mean_abs_deviation},
            {"rmse", e.rmse},
            {"realized_mean_change", e.realized_mean_change},
            {"inside_interval", e.inside_interval},
        };
    }
    return j;
}

std::optional<PredictionRecord> prediction_from_json(const nlohmann::json& j) {
    try {
        auto result = result_from_json(j.at("result"));
        std::vector<TrajectoryPoint> trajectory;
        for (auto& p : j.at("trajectory")) {
            trajectory.push_back({
                .period = p.at("period").get<int>(),
                .expected = p.at("expected").get<double>(),
                .lower = p.at("lower").get<double>(),
                .upper = p.at("upper").get<double>(),
            });
        }

        PredictionRecord record(std::move(result), j.at("model_version").get<int>(),
                                std::move(trajectory));

        // The evaluation is re-derived from the stored observation.
        if (j.contains("observed") && j["observed"].is_object()) {
            ObservedOutcome o{
                .moment_id = record.result().moment_id,
                .player_id = record.result().player_id,
                .values = parse_values(j["observed"].at("values")),
                .realized_shift = opt_double(j["observed"], "realized_shift"),
            };
            if (!record.record_outcome(o)) return std::nullopt;
        }
        return record;
    } catch (const nlohmann::json::exception&) {
        return std::nullopt;
    }
}

nlohmann::json weights_to_json(const WeightSet& w) {
    return {
        {"version", w.version},
        {"parent", w.parent ? nlohmann::json(*w.parent) : nlohmann::json(nullptr)},
        {"w1", w.w1},
        {"w2", w.w2},
        {"note", w.note},
    };
}

WeightSet weights_from_json(const nlohmann::json& j) {
    WeightSet w;
    w.version = j.at("version").get<int>();
    if (j.contains("parent") && j["parent"].is_number_integer()) {
        w.parent = j["parent"].get<int>();
    }
    w.w1 = j.at("w1").get<double>();
    w.w2 = j.at("w2").get<double>();
    w.note = safe_str(j, "note");
    return w;
}

nlohmann::json model_to_json(const LinearTrajectoryModel& model) {
    auto& c = model.config();
    nlohmann::json periods = nlohmann::json::array();
    for (auto& p : model.periods()) {
        periods.push_back({
            {"beta", p.beta},
            {"sigma", p.sigma},
            {"samples", p.samples},
        });
    }
    return {
        {"version", model.version()},
        {"kind", "linear"},
        {"horizon", c.horizon},
        {"ridge_lambda", c.ridge_lambda},
        {"interval_z", c.interval_z},
        {"min_training_samples", c.min_training_samples},
        {"periods", periods},
    };
}

std::shared_ptr<const LinearTrajectoryModel> model_from_json(const nlohmann::json& j) {
    PredictorConfig c;
    c.horizon = j.at("horizon").get<int>();
    c.ridge_lambda = safe_double(j, "ridge_lambda", c.ridge_lambda);
    c.interval_z = safe_double(j, "interval_z", c.interval_z);
    c.min_training_samples = safe_int(j, "min_training_samples", c.min_training_samples);

    std::vector<PeriodCoefficients> periods;
    for (auto& p : j.at("periods")) {
        auto beta = p.at("beta").get<std::vector<double>>();
        if (static_cast<int>(beta.size()) != LinearTrajectoryModel::feature_count) {
            throw std::invalid_argument("model coefficients have the wrong width");
        }
        periods.push_back({
            .beta = std::move(beta),
            .sigma = p.at("sigma").get<double>(),
            .samples = safe_int(p, "samples"),
        });
    }
    return std::make_shared<const LinearTrajectoryModel>(j.at("version").get<int>(), c,
                                                         std::move(periods));
}

nlohmann::json failure_to_json(const MomentFailure& f) {
    return {
        {"moment_id", f.moment_id},
        {"stage", f.stage},
        {"kind", f.kind},
        {"message", f.message},
        {"fields", f.fields},
    };
}

nlohmann::json report_to_json(const CalibrationReport& report) {
    nlohmann::json groups = nlohmann::json::array();
    for (auto& g : report.groups) {
        groups.push_back({
            {"group", g.group},
            {"records", g.records},
            {"mean_abs_deviation", g.mean_abs_deviation},
            {"rmse", g.rmse},
            {"correlation", opt_to_json(g.correlation)},
            {"magnitude_correlation", opt_to_json(g.magnitude_correlation)},
            {"shift_correlation", opt_to_json(g.shift_correlation)},
            {"directional_hit_rate", g.directional_hit_rate},
            {"interval_coverage", g.interval_coverage},
            {"calibration_slope", g.calibration_slope},
            {"calibration_intercept", g.calibration_intercept},
            {"calibration_r_squared", g.calibration_r_squared},
        });
    }

    nlohmann::json records = nlohmann::json::array();
    for (auto& r : report.record_errors) {
        records.push_back({
            {"moment_id", r.moment_id},
            {"player_id", r.player_id},
            {"composite", r.composite},
            {"mean_abs_deviation", r.mean_abs_deviation},
            {"rmse", r.rmse},
            {"realized_mean_change", r.realized_mean_change},
            {"periods_compared", r.periods_compared},
        });
    }

    nlohmann::json issues = nlohmann::json::array();
    for (auto& i : report.issues) {
        issues.push_back({{"group", i.group}, {"kind", i.kind}, {"detail", i.detail}});
    }

    return {
        {"records_total", report.records_total},
        {"records_evaluated", report.records_evaluated},
        {"outcomes_unmatched", report.outcomes_unmatched},
        {"groups", groups},
        {"records", records},
        {"issues", issues},
    };
}

std::expected<nlohmann::json, std::string> read_json_array(const std::filesystem::path& path) {
    std::ifstream file(path);
    if (!file.is_open()) return std::unexpected("cannot open " + path.string());

    nlohmann::json j;
    try {
        j = nlohmann::json::parse(file);
    } catch (const nlohmann::json::parse_error& e) {
        return std::unexpected(path.string() + ": " + e.what());
    }

    if (j.is_object() && j.contains("items")) j = j["items"];
    if (!j.is_array()) return std::unexpected(path.string() + ": expected a JSON array");
    return j;
}

} // namespace mss
