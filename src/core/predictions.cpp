#include "rapport/core/predictions.h"

#include "rapport/core/relationship.h"

namespace rapport {

StakesLevel risk_to_stakes(double risk_level) {
  if (risk_level >= 0.75) return StakesLevel::Critical;
  if (risk_level >= 0.5) return StakesLevel::High;
  if (risk_level >= 0.25) return StakesLevel::Medium;
  return StakesLevel::Low;
}

bool would_confide(const Relationship& rel, Direction d, double trustor_propensity, double risk_level) {
  const TrustDecision decision = rel.compute_trust_decision(d, trustor_propensity, risk_to_stakes(risk_level));
  return decision.disclosure_willingness() > kConfideBaseThreshold + risk_level * kPredictionRiskSlope;
}

bool would_help(const Relationship& rel, Direction d, double trustor_propensity, double risk_level) {
  const TrustDecision decision = rel.compute_trust_decision(d, trustor_propensity, risk_to_stakes(risk_level));
  return decision.support_willingness() > kHelpBaseThreshold + risk_level * kPredictionRiskSlope;
}

} // namespace rapport
