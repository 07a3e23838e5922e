#pragma once

#include "mss/config.hpp"
#include "mss/types.hpp"

namespace mss {

double phase_weight(SeasonPhase phase, const ImpactConfig& config);

// S = dWP x phaseWeight, with dWP taken from the home team's perspective.
double statistical_component(const Moment& moment, const ImpactConfig& config);

// Same component signed for the player's own team.
double statistical_component(const Moment& moment, const PlayerContext& context,
                             const ImpactConfig& config);

} // namespace mss
