#include "rapport/core/decaying_value.h"

#include <algorithm>
#include <cmath>

namespace rapport {

double DecayingValue::effective() const {
  // Guard against inverted bounds set by hand; std::clamp requires lo <= hi.
  const double lo = std::min(lower_, upper_);
  const double hi = std::max(lower_, upper_);
  return std::clamp(base_ + delta_, lo, hi);
}

void DecayingValue::apply_decay(Duration elapsed) {
  if (!half_life_) return;
  if (half_life_->as_seconds() <= 0 || elapsed.as_seconds() <= 0) return;

  const double ratio = static_cast<double>(elapsed.as_seconds()) / static_cast<double>(half_life_->as_seconds());
  delta_ *= std::pow(0.5, ratio);
}

} // namespace rapport
