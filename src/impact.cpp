#include "mss/impact.hpp"

namespace mss {

double phase_weight(SeasonPhase phase, const ImpactConfig& config) {
    return phase == SeasonPhase::Postseason ? config.postseason_phase_weight
                                            : config.regular_phase_weight;
}

double statistical_component(const Moment& moment, const ImpactConfig& config) {
    return moment.delta_wp() * phase_weight(moment.phase, config);
}

double statistical_component(const Moment& moment, const PlayerContext& context,
                             const ImpactConfig& config) {
    return context.signed_delta_wp * phase_weight(moment.phase, config);
}

} // namespace mss
