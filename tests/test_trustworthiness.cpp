#include <cmath>
#include <iostream>
#include <vector>

#include "rapport/core/antecedent.h"
#include "rapport/core/trustworthiness.h"

#define RAPPORT_ASSERT(expr) \
  do { \
    if (!(expr)) { \
      std::cerr << "ASSERT failed: " #expr " (" << __FILE__ << ":" << __LINE__ << ")\n"; \
      return 1; \
    } \
  } while (0)

namespace {

using rapport::AntecedentDirection;
using rapport::AntecedentType;
using rapport::Duration;
using rapport::LifeDomain;
using rapport::Timestamp;
using rapport::TrustAntecedent;

bool near(double a, double b, double eps = 1e-9) { return std::fabs(a - b) <= eps; }

TrustAntecedent pos(Timestamp t, AntecedentType type, double m) {
  return TrustAntecedent(t, type, AntecedentDirection::Positive, m, "test");
}

TrustAntecedent neg(Timestamp t, AntecedentType type, double m) {
  return TrustAntecedent(t, type, AntecedentDirection::Negative, m, "test");
}

} // namespace

int test_trustworthiness() {
  using rapport::TrustworthinessFactors;
  const Timestamp t0 = Timestamp::from_ymd_hms(2024, 1, 1);

  // Defaults sit at 0.3 everywhere.
  {
    const TrustworthinessFactors tw;
    RAPPORT_ASSERT(near(tw.competence_effective(), 0.3));
    RAPPORT_ASSERT(near(tw.benevolence_effective(), 0.3));
    RAPPORT_ASSERT(near(tw.integrity_effective(), 0.3));
    RAPPORT_ASSERT(near(tw.overall(), 0.3));
  }

  // An empty history zeroes every delta.
  {
    TrustworthinessFactors tw;
    tw.add_competence_delta(0.2);
    tw.add_benevolence_delta(-0.1);
    tw.add_integrity_delta(0.3);
    tw.recompute_from_antecedents({});
    RAPPORT_ASSERT(near(tw.competence_effective(), 0.3));
    RAPPORT_ASSERT(near(tw.benevolence_effective(), 0.3));
    RAPPORT_ASSERT(near(tw.integrity_effective(), 0.3));
  }

  // Negativity bias: an equal-magnitude negative moves 2.5x as far as a positive.
  {
    TrustworthinessFactors up;
    up.recompute_from_antecedents({pos(t0, AntecedentType::Benevolence, 0.1)});
    TrustworthinessFactors down;
    down.recompute_from_antecedents({neg(t0, AntecedentType::Benevolence, 0.1)});

    const double gain = up.benevolence().delta();
    const double loss = -down.benevolence().delta();
    RAPPORT_ASSERT(near(gain, 0.04));
    RAPPORT_ASSERT(near(loss, 0.1));
    RAPPORT_ASSERT(near(loss / gain, 2.5, 1e-6));
  }

  // Positives within 180 days of a negative are discounted to 0.7x.
  {
    TrustworthinessFactors inside;
    inside.recompute_from_antecedents(
        {neg(t0, AntecedentType::Benevolence, 0.1), pos(t0 + Duration::days(30), AntecedentType::Integrity, 0.5)});
    TrustworthinessFactors outside;
    outside.recompute_from_antecedents(
        {neg(t0, AntecedentType::Benevolence, 0.1), pos(t0 + Duration::days(200), AntecedentType::Integrity, 0.5)});

    RAPPORT_ASSERT(near(inside.integrity().delta(), 0.4 * 0.5 * 0.7));
    RAPPORT_ASSERT(near(outside.integrity().delta(), 0.4 * 0.5));
    RAPPORT_ASSERT(inside.integrity_effective() < outside.integrity_effective());
  }

  // Antecedents fade with a 180-day half-life of their age at the newest entry.
  {
    TrustworthinessFactors tw;
    tw.recompute_from_antecedents(
        {pos(t0, AntecedentType::Integrity, 1.0), pos(t0 + Duration::days(180), AntecedentType::Benevolence, 0.1)});
    RAPPORT_ASSERT(near(tw.integrity().delta(), 0.4 * 0.5, 1e-9));
  }

  // Replay order follows timestamps, not insertion order.
  {
    TrustworthinessFactors a;
    a.recompute_from_antecedents(
        {pos(t0, AntecedentType::Integrity, 0.6), neg(t0 + Duration::days(1), AntecedentType::Integrity, 0.2)});
    TrustworthinessFactors b;
    b.recompute_from_antecedents(
        {neg(t0 + Duration::days(1), AntecedentType::Integrity, 0.2), pos(t0, AntecedentType::Integrity, 0.6)});
    RAPPORT_ASSERT(near(a.integrity().delta(), b.integrity().delta(), 1e-12));
  }

  // Competence is per life domain; untouched domains keep their delta.
  {
    TrustworthinessFactors tw;
    tw.add_competence_delta_in(LifeDomain::Social, 0.05);
    tw.recompute_from_antecedents({TrustAntecedent(t0, AntecedentType::Ability, AntecedentDirection::Positive,
                                                   0.5, "shipped on time", LifeDomain::Work)});
    RAPPORT_ASSERT(near(tw.competence_in(LifeDomain::Work), 0.3 + 0.2));
    RAPPORT_ASSERT(near(tw.competence_in(LifeDomain::Social), 0.35));
    RAPPORT_ASSERT(near(tw.competence_in(LifeDomain::Financial), 0.3));
  }

  // A domain-less Ability antecedent counts toward every domain.
  {
    TrustworthinessFactors tw;
    tw.recompute_from_antecedents({pos(t0, AntecedentType::Ability, 0.5)});
    for (LifeDomain d : rapport::kAllLifeDomains) RAPPORT_ASSERT(near(tw.competence_in(d), 0.5));
  }

  // Large negatives clamp at 0.
  {
    TrustworthinessFactors tw(0.1, 0.1, 0.1);
    tw.recompute_from_antecedents({neg(t0, AntecedentType::Integrity, 1.0)});
    RAPPORT_ASSERT(near(tw.integrity_effective(), 0.0));
    RAPPORT_ASSERT(near(tw.integrity().delta(), -0.1));
  }

  // Recompute is deterministic.
  {
    const std::vector<TrustAntecedent> history{pos(t0, AntecedentType::Ability, 0.3),
                                               neg(t0 + Duration::days(3), AntecedentType::Benevolence, 0.4),
                                               pos(t0 + Duration::days(9), AntecedentType::Integrity, 0.7)};
    TrustworthinessFactors a;
    TrustworthinessFactors b;
    a.recompute_from_antecedents(history);
    b.recompute_from_antecedents(history);
    RAPPORT_ASSERT(a == b);
  }

  // Magnitude is clamped on construction.
  {
    const TrustAntecedent a = pos(t0, AntecedentType::Ability, 4.0);
    RAPPORT_ASSERT(near(a.magnitude(), 1.0));
    RAPPORT_ASSERT(a.trust_domain() == rapport::TrustDomain::Task);
    RAPPORT_ASSERT(neg(t0, AntecedentType::Integrity, -1.0).magnitude() == 0.0);
  }

  return 0;
}
