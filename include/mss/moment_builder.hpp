#pragma once

#include "mss/types.hpp"
#include <expected>

namespace mss {

// Validates a raw event and normalizes it into a Moment. Problems are
// reported in three passes (missing fields, out-of-range values, then
// inconsistent game state); the error lists every offending field of the
// first failing pass.
std::expected<Moment, MalformedMomentError> build_moment(const RawEvent& raw);

} // namespace mss
