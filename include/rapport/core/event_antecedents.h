#pragma once

#include <cstddef>
#include <optional>
#include <string>
#include <vector>

#include "rapport/core/antecedent.h"
#include "rapport/core/relationship.h"
#include "rapport/core/time.h"

namespace rapport {

// How one kind of event turns into a trust antecedent.
struct AntecedentMapping {
  AntecedentType type{AntecedentType::Ability};
  AntecedentDirection direction{AntecedentDirection::Positive};
  double base_magnitude{0.0};
  std::string context;
  std::optional<LifeDomain> life_domain;
};

// Something the source entity did that the target entity observed.
struct TrustEvent {
  Timestamp timestamp;
  EntityId source; // trustee: the actor being judged
  EntityId target; // trustor: the observer
  double severity{1.0};
  std::vector<AntecedentMapping> mappings;
};

// Appends one antecedent per mapping to every relationship where the target
// trusts the source, then recomputes that direction's trustworthiness.
//
// Magnitude is clamp(base * severity, 0, 1) scaled by the pair's interaction
// consistency into [0.5, 1]. Non-positive magnitudes are dropped.
// Returns the number of antecedents appended.
std::size_t process_event_antecedents(const TrustEvent& event, std::vector<Relationship>& relationships);

} // namespace rapport
