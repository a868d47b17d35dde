#include <cmath>
#include <iostream>
#include <string>

#include "rapport/core/stage.h"
#include "rapport/core/trust_decision.h"

#define RAPPORT_ASSERT(expr) \
  do { \
    if (!(expr)) { \
      std::cerr << "ASSERT failed: " #expr " (" << __FILE__ << ":" << __LINE__ << ")\n"; \
      return 1; \
    } \
  } while (0)

namespace {

bool near(double a, double b, double eps = 1e-9) { return std::fabs(a - b) <= eps; }

} // namespace

int test_stage() {
  using rapport::RelationshipStage;

  for (RelationshipStage s : rapport::kAllRelationshipStages) {
    RAPPORT_ASSERT(near(rapport::propensity_weight(s) + rapport::trustworthiness_weight(s), 1.0));
    const rapport::StageWeights w = rapport::stage_weights(s);
    RAPPORT_ASSERT(w.decision_certainty >= 0.0 && w.decision_certainty <= 1.0);
    RAPPORT_ASSERT(w.trustee_confidence >= 0.0 && w.trustee_confidence <= 1.0);
    RAPPORT_ASSERT(std::string(rapport::relationship_stage_description(s)).size() > 0);
  }

  RAPPORT_ASSERT(near(rapport::risk_modifier(RelationshipStage::Stranger), 0.3));
  RAPPORT_ASSERT(near(rapport::risk_modifier(RelationshipStage::Intimate), -0.1));
  RAPPORT_ASSERT(near(rapport::risk_modifier(RelationshipStage::Estranged), 0.4));
  RAPPORT_ASSERT(near(rapport::propensity_weight(RelationshipStage::Acquaintance), 0.4));
  RAPPORT_ASSERT(near(rapport::trustworthiness_weight(RelationshipStage::Established), 0.8));

  // Strangers lean on disposition more than intimates do.
  RAPPORT_ASSERT(rapport::propensity_weight(RelationshipStage::Stranger) >
                 rapport::propensity_weight(RelationshipStage::Intimate));

  RAPPORT_ASSERT(rapport::is_positive_stage(RelationshipStage::Intimate));
  RAPPORT_ASSERT(!rapport::is_positive_stage(RelationshipStage::Estranged));
  RAPPORT_ASSERT(rapport::is_developed_stage(RelationshipStage::Established));
  RAPPORT_ASSERT(!rapport::is_developed_stage(RelationshipStage::Stranger));
  RAPPORT_ASSERT(std::string(rapport::relationship_stage_id(RelationshipStage::Acquaintance)) == "acquaintance");

  const rapport::StageTransitionError err{RelationshipStage::Stranger, RelationshipStage::Intimate};
  RAPPORT_ASSERT(err.message().find("stranger") != std::string::npos);

  // TrustDecision clamps and compares strictly.
  {
    const rapport::TrustDecision d(1.4, -0.2, 0.5, 2.0, 0.4);
    RAPPORT_ASSERT(near(d.task_willingness(), 1.0));
    RAPPORT_ASSERT(near(d.support_willingness(), 0.0));
    RAPPORT_ASSERT(near(d.decision_certainty(), 1.0));
    RAPPORT_ASSERT(near(d.confidence(), 1.0));
    RAPPORT_ASSERT(!d.would_disclose(0.5));
    RAPPORT_ASSERT(d.would_disclose(0.49));
    RAPPORT_ASSERT(d.would_delegate_task(0.9));
    RAPPORT_ASSERT(!d.would_seek_support(0.0));
    RAPPORT_ASSERT(d.any_willing(0.6));
    RAPPORT_ASSERT(!d.fully_willing(0.1));
    RAPPORT_ASSERT(rapport::TrustDecision::full_trust().fully_willing(0.99));
    RAPPORT_ASSERT(!rapport::TrustDecision::no_trust().any_willing(0.0));

    const rapport::TrustDecision def;
    RAPPORT_ASSERT(near(def.disclosure_willingness(), 0.2));
    RAPPORT_ASSERT(near(def.task_willingness(), 0.3));
  }

  // Context multiplier.
  {
    rapport::TrustContext neutral;
    RAPPORT_ASSERT(near(neutral.compute_multiplier(), 0.95));

    rapport::TrustContext supportive{1.0, 1.0, 0.0, 1.0, 1.0};
    RAPPORT_ASSERT(near(supportive.compute_multiplier(), 1.5));

    rapport::TrustContext hostile{0.0, 0.0, 1.0, 0.0, 0.0};
    RAPPORT_ASSERT(near(hostile.compute_multiplier(), 0.5));
  }

  return 0;
}
