#include "rapport/core/perceived_risk.h"

#include <algorithm>

namespace rapport {
namespace {

double sensitivity_term(double trustor_sensitivity) {
  return (std::clamp(trustor_sensitivity, 0.0, 1.0) - 0.5) * kTrustorSensitivityScale;
}

} // namespace

double PerceivedRisk::compute_for_stakes(StakesLevel stakes) const {
  double total = effective() + stakes_risk_contribution(stakes);
  if (betrayal_history_) total += kBetrayalRiskIncrease;
  return std::clamp(total, 0.0, 1.0);
}

double PerceivedRisk::compute_with_stage_modifier(StakesLevel stakes, double stage_modifier) const {
  return std::clamp(compute_for_stakes(stakes) + stage_modifier, 0.0, 1.0);
}

double PerceivedRisk::compute_for_trustor(StakesLevel stakes, double trustor_sensitivity) const {
  return std::clamp(compute_for_stakes(stakes) + sensitivity_term(trustor_sensitivity), 0.0, 1.0);
}

double PerceivedRisk::compute_subjective(StakesLevel stakes, double stage_modifier,
                                         double trustor_sensitivity) const {
  return std::clamp(compute_with_stage_modifier(stakes, stage_modifier) + sensitivity_term(trustor_sensitivity),
                    0.0, 1.0);
}

} // namespace rapport
