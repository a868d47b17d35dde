#include "rapport/core/trust_decision.h"

#include "rapport/core/trustworthiness.h"

namespace rapport {

TrustSnapshot::TrustSnapshot(double propensity, const TrustworthinessFactors& trustworthiness, double base_risk,
                             RelationshipStage stage, double history, double context_multiplier)
    : propensity_(std::clamp(propensity, 0.0, 1.0)),
      competence_(trustworthiness.competence_effective()),
      benevolence_(trustworthiness.benevolence_effective()),
      integrity_(trustworthiness.integrity_effective()),
      base_risk_(std::clamp(base_risk, 0.0, 1.0)),
      history_(std::clamp(history, 0.0, 1.0)),
      context_multiplier_(std::clamp(context_multiplier, 0.0, 2.0)),
      stage_(stage) {}

double TrustSnapshot::compute_risk(StakesLevel stakes) const {
  return std::clamp(base_risk_ + stakes_risk_contribution(stakes) + risk_modifier(stage_), 0.0, 1.0);
}

TrustDecision TrustSnapshot::compute_decision(StakesLevel stakes) const {
  const StageWeights w = weights();
  const double risk = compute_risk(stakes);
  const auto willingness = [&](double domain_trustworthiness) {
    const double base = w.propensity_weight * propensity_ + w.trustworthiness_weight * domain_trustworthiness;
    return std::clamp(base * context_multiplier_ - kTrustRiskWeight * risk, 0.0, 1.0);
  };
  return TrustDecision(willingness(competence_), willingness(benevolence_), willingness(integrity_),
                       history_ * 0.3 + w.decision_certainty * 0.7, history_ * 0.4 + w.trustee_confidence * 0.6);
}

} // namespace rapport
