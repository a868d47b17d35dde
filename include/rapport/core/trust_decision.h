#pragma once

#include <algorithm>

#include "rapport/core/enums.h"
#include "rapport/core/stage.h"

namespace rapport {

class TrustworthinessFactors;

// Risk weight subtracted from every willingness in a trust decision.
inline constexpr double kTrustRiskWeight = 0.5;

// Willingness to be vulnerable toward one trustee, per trust domain.
//
// decision_certainty is how settled the trustor is about this judgment;
// trustee_confidence is how well the trustor thinks they know the trustee.
// All fields are clamped to [0,1] at construction.
class TrustDecision {
 public:
  TrustDecision() : TrustDecision(0.3, 0.3, 0.2, 0.3, 0.3) {}
  TrustDecision(double task_willingness, double support_willingness, double disclosure_willingness,
                double decision_certainty, double trustee_confidence)
      : task_(clamp01(task_willingness)),
        support_(clamp01(support_willingness)),
        disclosure_(clamp01(disclosure_willingness)),
        certainty_(clamp01(decision_certainty)),
        trustee_confidence_(clamp01(trustee_confidence)) {}

  static TrustDecision no_trust() { return TrustDecision(0.0, 0.0, 0.0, 0.0, 0.0); }
  static TrustDecision full_trust() { return TrustDecision(1.0, 1.0, 1.0, 1.0, 1.0); }

  double task_willingness() const { return task_; }
  double support_willingness() const { return support_; }
  double disclosure_willingness() const { return disclosure_; }
  double decision_certainty() const { return certainty_; }
  double trustee_confidence() const { return trustee_confidence_; }
  double confidence() const { return certainty_; }

  // Strict threshold checks.
  bool would_delegate_task(double threshold) const { return task_ > threshold; }
  bool would_seek_support(double threshold) const { return support_ > threshold; }
  bool would_disclose(double threshold) const { return disclosure_ > threshold; }
  bool fully_willing(double threshold) const {
    return task_ > threshold && support_ > threshold && disclosure_ > threshold;
  }
  bool any_willing(double threshold) const {
    return task_ > threshold || support_ > threshold || disclosure_ > threshold;
  }

  bool operator==(const TrustDecision& o) const {
    return task_ == o.task_ && support_ == o.support_ && disclosure_ == o.disclosure_ &&
           certainty_ == o.certainty_ && trustee_confidence_ == o.trustee_confidence_;
  }
  bool operator!=(const TrustDecision& o) const { return !(*this == o); }

 private:
  static double clamp01(double v) { return std::clamp(v, 0.0, 1.0); }

  double task_;
  double support_;
  double disclosure_;
  double certainty_;
  double trustee_confidence_;
};

// Situational factors that make trusting easier or harder regardless of who
// the trustee is. Every factor lives in [0,1] and defaults to 0.5.
struct TrustContext {
  double social_norms{0.5};
  double institutional_safeguards{0.5};
  double time_pressure{0.5};
  double institutional_support{0.5};
  double cultural_expectations{0.5};

  // clamp(0.5 + mean(encouraging factors) - 0.1 * time_pressure, 0.5, 1.5)
  double compute_multiplier() const {
    const auto c = [](double v) { return std::clamp(v, 0.0, 1.0); };
    const double encouragement =
        (c(social_norms) + c(institutional_safeguards) + c(institutional_support) + c(cultural_expectations)) / 4.0;
    return std::clamp(0.5 + encouragement - c(time_pressure) * 0.1, 0.5, 1.5);
  }
};

// The inputs of one trust judgment frozen into plain numbers.
//
// Lets a decision be computed without a Relationship, for instance from
// stored or hypothetical values. Propensity, base risk and history are
// clamped to [0,1] and the context multiplier to [0,2].
class TrustSnapshot {
 public:
  TrustSnapshot(double propensity, const TrustworthinessFactors& trustworthiness, double base_risk,
                RelationshipStage stage, double history, double context_multiplier = 1.0);

  double propensity() const { return propensity_; }
  double perceived_competence() const { return competence_; }
  double perceived_benevolence() const { return benevolence_; }
  double perceived_integrity() const { return integrity_; }
  double base_risk() const { return base_risk_; }
  double history() const { return history_; }
  double context_multiplier() const { return context_multiplier_; }
  RelationshipStage stage() const { return stage_; }
  StageWeights weights() const { return stage_weights(stage_); }

  // clamp(base_risk + stakes contribution + stage modifier, 0, 1)
  double compute_risk(StakesLevel stakes) const;

  TrustDecision compute_decision(StakesLevel stakes) const;

 private:
  double propensity_;
  double competence_;
  double benevolence_;
  double integrity_;
  double base_risk_;
  double history_;
  double context_multiplier_;
  RelationshipStage stage_;
};

} // namespace rapport
