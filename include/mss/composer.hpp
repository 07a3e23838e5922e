#pragma once

#include "mss/config.hpp"
#include "mss/types.hpp"

namespace mss {

// Stage factor times a slump factor, capped at max_multiplier. Earlier career
// stages and baselines further below the career level give larger values.
double context_multiplier(const PlayerContext& context, const ComposerConfig& config);

// composite = clamp(w1*S + w2*N*multiplier, +-score_bound). Every sub-term is
// computed before the result is emitted; raw equals the sum of the two terms.
MSSResult compose(const Moment& moment, const PlayerContext& context, double statistical,
                  const SentimentSignal& sentiment, const WeightSet& weights,
                  const ComposerConfig& config);

} // namespace mss
