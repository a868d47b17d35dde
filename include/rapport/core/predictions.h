#pragma once

#include "rapport/core/enums.h"

namespace rapport {

class Relationship;

inline constexpr double kConfideBaseThreshold = 0.6;
inline constexpr double kHelpBaseThreshold = 0.4;
inline constexpr double kPredictionRiskSlope = 0.3;

// Buckets a continuous risk level: <0.25 Low, <0.5 Medium, <0.75 High, else Critical.
StakesLevel risk_to_stakes(double risk_level);

// Risk enters twice: through the stakes bucket inside the decision and through
// the threshold (base + 0.3 * risk_level), so rejection steepens with risk.
bool would_confide(const Relationship& rel, Direction d, double trustor_propensity, double risk_level);
bool would_help(const Relationship& rel, Direction d, double trustor_propensity, double risk_level);

} // namespace rapport
