#include "mss/types.hpp"
#include <algorithm>
#include <cctype>
#include <unordered_map>

namespace mss {

namespace {

std::string lower(std::string s) {
    std::ranges::transform(s, s.begin(),
                           [](unsigned char c) { return static_cast<char>(std::tolower(c)); });
    return s;
}

} // namespace

std::string to_string(SeasonPhase phase) {
    return phase == SeasonPhase::Postseason ? "postseason" : "regular";
}

std::string to_string(HalfInning half) {
    return half == HalfInning::Bottom ? "bottom" : "top";
}

std::string to_string(OutcomeType outcome) {
    switch (outcome) {
        case OutcomeType::Single: return "single";
        case OutcomeType::Double: return "double";
        case OutcomeType::Triple: return "triple";
        case OutcomeType::HomeRun: return "home_run";
        case OutcomeType::Walk: return "walk";
        case OutcomeType::HitByPitch: return "hit_by_pitch";
        case OutcomeType::Strikeout: return "strikeout";
        case OutcomeType::FieldOut: return "field_out";
        case OutcomeType::ForceOut: return "force_out";
        case OutcomeType::DoublePlay: return "double_play";
        case OutcomeType::Sacrifice: return "sacrifice";
        case OutcomeType::FieldError: return "field_error";
        case OutcomeType::WalkOff: return "walk_off";
        case OutcomeType::BlownSave: return "blown_save";
        case OutcomeType::Other: return "other";
    }
    return "other";
}

std::string to_string(Role role) {
    switch (role) {
        case Role::Batter: return "batter";
        case Role::Pitcher: return "pitcher";
        case Role::Fielder: return "fielder";
    }
    return "batter";
}

std::string to_string(CareerStage stage) {
    switch (stage) {
        case CareerStage::Rookie: return "rookie";
        case CareerStage::Prime: return "prime";
        case CareerStage::Veteran: return "veteran";
    }
    return "prime";
}

std::string to_string(Side side) {
    switch (side) {
        case Side::Beneficiary: return "beneficiary";
        case Side::Adverse: return "adverse";
        case Side::Neutral: return "neutral";
    }
    return "neutral";
}

std::string to_string(SentimentSource source) {
    switch (source) {
        case SentimentSource::Media: return "media";
        case SentimentSource::Fan: return "fan";
        case SentimentSource::Social: return "social";
    }
    return "media";
}

std::string to_string(MalformedKind kind) {
    switch (kind) {
        case MalformedKind::MissingField: return "missing-field";
        case MalformedKind::OutOfRange: return "out-of-range";
        case MalformedKind::InconsistentState: return "inconsistent-state";
    }
    return "missing-field";
}

std::string to_string(ScoreErrorKind kind) {
    switch (kind) {
        case ScoreErrorKind::InsufficientHistory: return "insufficient-history";
        case ScoreErrorKind::CollaboratorFailure: return "collaborator-failure";
        case ScoreErrorKind::InvalidConfig: return "invalid-config";
    }
    return "insufficient-history";
}

std::string to_string(PredictErrorKind kind) {
    switch (kind) {
        case PredictErrorKind::UntrainedModel: return "untrained-model";
        case PredictErrorKind::UnknownVersion: return "unknown-version";
        case PredictErrorKind::InvalidInput: return "invalid-input";
    }
    return "untrained-model";
}

std::optional<SeasonPhase> parse_season_phase(const std::string& s) {
    auto v = lower(s);
    if (v == "regular" || v == "r") return SeasonPhase::Regular;
    if (v == "postseason" || v == "post" || v == "p") return SeasonPhase::Postseason;
    return std::nullopt;
}

std::optional<HalfInning> parse_half_inning(const std::string& s) {
    auto v = lower(s);
    if (v == "top" || v == "t") return HalfInning::Top;
    if (v == "bottom" || v == "bot" || v == "b") return HalfInning::Bottom;
    return std::nullopt;
}

OutcomeType parse_outcome(const std::string& s) {
    static const std::unordered_map<std::string, OutcomeType> names = {
        {"single", OutcomeType::Single},
        {"double", OutcomeType::Double},
        {"triple", OutcomeType::Triple},
        {"home_run", OutcomeType::HomeRun},
        {"walk", OutcomeType::Walk},
        {"intent_walk", OutcomeType::Walk},
        {"hit_by_pitch", OutcomeType::HitByPitch},
        {"strikeout", OutcomeType::Strikeout},
        {"field_out", OutcomeType::FieldOut},
        {"force_out", OutcomeType::ForceOut},
        {"double_play", OutcomeType::DoublePlay},
        {"grounded_into_double_play", OutcomeType::DoublePlay},
        {"strikeout_double_play", OutcomeType::DoublePlay},
        {"sacrifice", OutcomeType::Sacrifice},
        {"sac_fly", OutcomeType::Sacrifice},
        {"sac_bunt", OutcomeType::Sacrifice},
        {"field_error", OutcomeType::FieldError},
        {"walk_off", OutcomeType::WalkOff},
        {"blown_save", OutcomeType::BlownSave},
    };
    auto it = names.find(lower(s));
    return it != names.end() ? it->second : OutcomeType::Other;
}

std::optional<Role> parse_role(const std::string& s) {
    auto v = lower(s);
    if (v == "batter") return Role::Batter;
    if (v == "pitcher") return Role::Pitcher;
    if (v == "fielder") return Role::Fielder;
    return std::nullopt;
}

std::optional<CareerStage> parse_career_stage(const std::string& s) {
    auto v = lower(s);
    if (v == "rookie") return CareerStage::Rookie;
    if (v == "prime") return CareerStage::Prime;
    if (v == "veteran") return CareerStage::Veteran;
    return std::nullopt;
}

std::optional<Side> parse_side(const std::string& s) {
    auto v = lower(s);
    if (v == "beneficiary") return Side::Beneficiary;
    if (v == "adverse") return Side::Adverse;
    if (v == "neutral") return Side::Neutral;
    return std::nullopt;
}

std::optional<SentimentSource> parse_sentiment_source(const std::string& s) {
    auto v = lower(s);
    if (v == "media") return SentimentSource::Media;
    if (v == "fan") return SentimentSource::Fan;
    if (v == "social") return SentimentSource::Social;
    return std::nullopt;
}

} // namespace mss
