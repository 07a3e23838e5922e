#include "mss/context.hpp"
#include <algorithm>
#include <spdlog/spdlog.h>

namespace mss {

std::vector<Participant> participants(const Moment& moment) {
    bool home_batting = moment.home_batting();

    std::vector<Participant> result;
    result.push_back({.player_id = moment.batter_id, .role = Role::Batter, .home_team = home_batting});
    result.push_back({.player_id = moment.pitcher_id, .role = Role::Pitcher, .home_team = !home_batting});

    for (auto& id : moment.fielder_ids) {
        bool seen = std::ranges::any_of(result, [&](const Participant& p) { return p.player_id == id; });
        if (seen) continue;
        result.push_back({.player_id = id, .role = Role::Fielder, .home_team = !home_batting});
    }
    return result;
}

double seasons_played(Role role, const PlayerHistory& history, const ContextConfig& config) {
    if (role == Role::Pitcher) {
        return history.career_innings_pitched / config.innings_per_season;
    }
    return static_cast<double>(history.career_plate_appearances) /
           config.plate_appearances_per_season;
}

CareerStage career_stage(Role role, const PlayerHistory& history, const ContextConfig& config) {
    double seasons = seasons_played(role, history, config);
    if (seasons < config.rookie_max_seasons) return CareerStage::Rookie;
    if (seasons > config.veteran_min_seasons) return CareerStage::Veteran;
    return CareerStage::Prime;
}

double trailing_baseline(const std::vector<Appearance>& appearances, TimePoint before,
                         int window, int& used) {
    std::vector<const Appearance*> prior;
    for (auto& a : appearances) {
        if (a.date < before) prior.push_back(&a);
    }
    std::ranges::sort(prior, {}, [](const Appearance* a) { return a->date; });

    int n = static_cast<int>(prior.size());
    used = std::min(window, n);
    if (used == 0) return 0.0;

    double sum = 0.0;
    for (int i = n - used; i < n; ++i) {
        sum += prior[i]->performance;
    }
    return sum / used;
}

Side side_for(double signed_delta_wp) {
    if (signed_delta_wp > 0.0) return Side::Beneficiary;
    if (signed_delta_wp < 0.0) return Side::Adverse;
    return Side::Neutral;
}

std::expected<PlayerContext, ScoreError> enrich_participant(
    const Moment& moment, const Participant& participant,
    const PlayerHistoryLookup& lookup, const ContextConfig& config,
    HistoryMode mode) {

    if (!config.trailing_window || *config.trailing_window < 1) {
        return std::unexpected(ScoreError{
            .kind = ScoreErrorKind::InvalidConfig,
            .moment_id = moment.id,
            .player_id = participant.player_id,
            .message = "trailing window size is not configured",
        });
    }
    int window = *config.trailing_window;

    auto history = lookup.history(participant.player_id, moment.timestamp);
    if (!history) {
        return std::unexpected(ScoreError{
            .kind = ScoreErrorKind::CollaboratorFailure,
            .moment_id = moment.id,
            .player_id = participant.player_id,
            .message = "history lookup failed: " + history.error().message,
        });
    }

    int used = 0;
    double baseline = trailing_baseline(history->appearances, moment.timestamp, window, used);
    int required = config.min_prior_appearances;

    bool short_window = used < required;
    if (short_window && mode == HistoryMode::Strict) {
        return std::unexpected(ScoreError{
            .kind = ScoreErrorKind::InsufficientHistory,
            .moment_id = moment.id,
            .player_id = participant.player_id,
            .message = "only " + std::to_string(used) + " prior appearances, need " +
                       std::to_string(required),
            .available = used,
            .required = required,
        });
    }
    if (used == 0) baseline = history->career_performance;

    double signed_dwp = participant.home_team ? moment.delta_wp() : -moment.delta_wp();

    PlayerContext ctx{
        .player_id = participant.player_id,
        .role = participant.role,
        .stage = career_stage(participant.role, *history, config),
        .seasons_played = seasons_played(participant.role, *history, config),
        .baseline = baseline,
        .career_performance = history->career_performance,
        .window_used = used,
        .home_team = participant.home_team,
        .side = side_for(signed_dwp),
        .signed_delta_wp = signed_dwp,
        .low_confidence = short_window,
    };

    spdlog::debug("Context {} / {}: {} {} baseline {:.3f} over {} (side {}{})",
                  moment.id, ctx.player_id, to_string(ctx.role), to_string(ctx.stage),
                  ctx.baseline, ctx.window_used, to_string(ctx.side),
                  ctx.low_confidence ? ", low confidence" : "");
    return ctx;
}

std::expected<std::vector<PlayerContext>, ScoreError> enrich_moment(
    const Moment& moment, const PlayerHistoryLookup& lookup,
    const ContextConfig& config, HistoryMode mode) {

    std::vector<PlayerContext> contexts;
    for (auto& p : participants(moment)) {
        auto ctx = enrich_participant(moment, p, lookup, config, mode);
        if (!ctx) return std::unexpected(ctx.error());
        contexts.push_back(std::move(*ctx));
    }
    return contexts;
}

} // namespace mss
