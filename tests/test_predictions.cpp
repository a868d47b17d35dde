#include <iostream>

#include "rapport/core/predictions.h"
#include "rapport/core/relationship.h"

#define RAPPORT_ASSERT(expr) \
  do { \
    if (!(expr)) { \
      std::cerr << "ASSERT failed: " #expr " (" << __FILE__ << ":" << __LINE__ << ")\n"; \
      return 1; \
    } \
  } while (0)

int test_predictions() {
  using rapport::Direction;
  using rapport::StakesLevel;

  RAPPORT_ASSERT(rapport::risk_to_stakes(0.0) == StakesLevel::Low);
  RAPPORT_ASSERT(rapport::risk_to_stakes(0.249) == StakesLevel::Low);
  RAPPORT_ASSERT(rapport::risk_to_stakes(0.25) == StakesLevel::Medium);
  RAPPORT_ASSERT(rapport::risk_to_stakes(0.5) == StakesLevel::High);
  RAPPORT_ASSERT(rapport::risk_to_stakes(0.75) == StakesLevel::Critical);
  RAPPORT_ASSERT(rapport::risk_to_stakes(1.0) == StakesLevel::Critical);

  // A default stranger pair: disclosure 0.54 + 0.12 - 0.5 * 1.0 = 0.16 at full risk.
  {
    const rapport::Relationship r("alice", "bob");
    RAPPORT_ASSERT(!r.would_a_confide_in_b(0.9, 1.0));
    RAPPORT_ASSERT(!r.would_b_confide_in_a(0.9, 1.0));
    // 0.54 + 0.12 - 0.3 = 0.36, below the 0.6 confide threshold.
    RAPPORT_ASSERT(!r.would_a_confide_in_b(0.9, 0.0));
    // Same willingness for help, below 0.4.
    RAPPORT_ASSERT(!r.would_a_help_b(0.9, 0.0));
  }

  // Maximal integrity in one direction only.
  {
    rapport::Relationship r("alice", "bob");
    r.trustworthiness(Direction::AToB).add_integrity_delta(0.7);
    // 0.54 + 0.4 - 0.3 = 0.64 > 0.6
    RAPPORT_ASSERT(r.would_a_confide_in_b(0.9, 0.0));
    RAPPORT_ASSERT(!r.would_b_confide_in_a(0.9, 0.0));
    RAPPORT_ASSERT(!r.would_a_confide_in_b(0.9, 1.0));
  }

  // Maximal benevolence enables help.
  {
    rapport::Relationship r("alice", "bob");
    r.trustworthiness(Direction::BToA).add_benevolence_delta(0.7);
    // 0.54 + 0.4 - 0.3 = 0.64 > 0.4
    RAPPORT_ASSERT(r.would_b_help_a(0.9, 0.0));
    RAPPORT_ASSERT(!r.would_a_help_b(0.9, 0.0));
    RAPPORT_ASSERT(rapport::would_help(r, Direction::BToA, 0.9, 0.0));
  }

  // Rejection is monotonic in risk.
  {
    rapport::Relationship r("alice", "bob");
    r.set_stage(rapport::RelationshipStage::Intimate);
    r.shared().add_history_delta(1.0);
    r.trustworthiness(Direction::AToB).add_integrity_delta(0.7);
    bool seen_no = false;
    for (int i = 0; i <= 20; ++i) {
      const double risk = i / 20.0;
      const bool yes = r.would_a_confide_in_b(0.8, risk);
      if (seen_no) RAPPORT_ASSERT(!yes);
      if (!yes) seen_no = true;
    }
    RAPPORT_ASSERT(r.would_a_confide_in_b(0.8, 0.0));
  }

  return 0;
}
