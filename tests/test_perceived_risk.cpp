#include <cmath>
#include <iostream>

#include "rapport/core/perceived_risk.h"

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

int test_perceived_risk() {
  using rapport::PerceivedRisk;
  using rapport::StakesLevel;

  PerceivedRisk r;
  RAPPORT_ASSERT(near(r.effective(), 0.3));
  RAPPORT_ASSERT(near(r.compute_for_stakes(StakesLevel::Low), 0.3));
  RAPPORT_ASSERT(near(r.compute_for_stakes(StakesLevel::Medium), 0.5));
  RAPPORT_ASSERT(near(r.compute_for_stakes(StakesLevel::High), 0.7));
  RAPPORT_ASSERT(near(r.compute_for_stakes(StakesLevel::Critical), 0.9));

  // Higher stakes never lower risk.
  double prev = 0.0;
  for (StakesLevel s : rapport::kAllStakesLevels) {
    const double v = r.compute_for_stakes(s);
    RAPPORT_ASSERT(v >= prev);
    prev = v;
  }

  // Neutral extra terms agree with the plain query.
  for (StakesLevel s : rapport::kAllStakesLevels) {
    RAPPORT_ASSERT(near(r.compute_with_stage_modifier(s, 0.0), r.compute_for_stakes(s)));
    RAPPORT_ASSERT(near(r.compute_for_trustor(s, 0.5), r.compute_for_stakes(s)));
    RAPPORT_ASSERT(near(r.compute_subjective(s, 0.0, 0.5), r.compute_for_stakes(s)));
  }

  RAPPORT_ASSERT(near(r.compute_for_trustor(StakesLevel::Low, 1.0), 0.5));
  RAPPORT_ASSERT(near(r.compute_for_trustor(StakesLevel::Low, 0.0), 0.1));
  RAPPORT_ASSERT(near(r.compute_with_stage_modifier(StakesLevel::Low, -0.1), 0.2));
  RAPPORT_ASSERT(near(r.compute_with_stage_modifier(StakesLevel::Critical, 0.4), 1.0));

  rapport::Vulnerability v;
  v.type = rapport::VulnerabilityType::Emotional;
  v.stakes = StakesLevel::High;
  RAPPORT_ASSERT(near(v.risk_contribution(), 0.4));
  RAPPORT_ASSERT(near(r.compute_for_vulnerability(v), 0.7));

  // Betrayal adds a permanent +0.3, still clamped.
  r.mark_betrayal();
  RAPPORT_ASSERT(r.has_betrayal_history());
  RAPPORT_ASSERT(near(r.compute_for_stakes(StakesLevel::Low), 0.6));
  RAPPORT_ASSERT(near(r.compute_for_stakes(StakesLevel::High), 1.0));
  r.apply_decay(rapport::Duration::days(1000));
  RAPPORT_ASSERT(r.has_betrayal_history());
  r.clear_betrayal_history();
  RAPPORT_ASSERT(near(r.compute_for_stakes(StakesLevel::Low), 0.3));

  // The stored delta decays with a 7-day half-life.
  r.add_delta(0.4);
  RAPPORT_ASSERT(near(r.effective(), 0.7));
  r.apply_decay(rapport::Duration::days(7));
  RAPPORT_ASSERT(near(r.effective(), 0.5));

  return 0;
}
