#pragma once

#include <optional>

#include "rapport/core/decaying_value.h"
#include "rapport/core/rel_path.h"
#include "rapport/core/time.h"

namespace rapport {

// Dimensions both parties share. History never decays and only grows.
class SharedDimensions {
 public:
  SharedDimensions();

  double affinity_effective() const { return affinity_.effective(); }
  double respect_effective() const { return respect_.effective(); }
  double tension_effective() const { return tension_.effective(); }
  double intimacy_effective() const { return intimacy_.effective(); }
  double history_effective() const { return history_.effective(); }

  const DecayingValue& get(SharedPath p) const;
  DecayingValue& get(SharedPath p);

  // History ignores non-positive amounts.
  void add_delta(SharedPath p, double amount);

  void add_affinity_delta(double amount) { add_delta(SharedPath::Affinity, amount); }
  void add_respect_delta(double amount) { add_delta(SharedPath::Respect, amount); }
  void add_tension_delta(double amount) { add_delta(SharedPath::Tension, amount); }
  void add_intimacy_delta(double amount) { add_delta(SharedPath::Intimacy, amount); }
  void add_history_delta(double amount) { add_delta(SharedPath::History, amount); }

  void apply_decay(Duration elapsed);

  // Leaves history alone.
  void reset_deltas();

  bool operator==(const SharedDimensions& o) const {
    return affinity_ == o.affinity_ && respect_ == o.respect_ && tension_ == o.tension_ &&
           intimacy_ == o.intimacy_ && history_ == o.history_;
  }
  bool operator!=(const SharedDimensions& o) const { return !(*this == o); }

 private:
  DecayingValue affinity_;
  DecayingValue respect_;
  DecayingValue tension_;
  DecayingValue intimacy_;
  DecayingValue history_;
};

// How one party feels toward the other; a relationship holds one per direction.
class DirectionalDimensions {
 public:
  DirectionalDimensions();

  double warmth_effective() const { return warmth_.effective(); }
  double resentment_effective() const { return resentment_.effective(); }
  double dependence_effective() const { return dependence_.effective(); }
  double attraction_effective() const { return attraction_.effective(); }
  double attachment_effective() const { return attachment_.effective(); }
  double jealousy_effective() const { return jealousy_.effective(); }
  double fear_effective() const { return fear_.effective(); }
  double obligation_effective() const { return obligation_.effective(); }

  // nullptr for Trust and PerceivedRisk, which live outside this struct.
  const DecayingValue* get(DirectionalKind k) const;
  DecayingValue* get(DirectionalKind k);

  void add_warmth_delta(double amount) { warmth_.add_delta(amount); }
  void add_resentment_delta(double amount) { resentment_.add_delta(amount); }
  void add_dependence_delta(double amount) { dependence_.add_delta(amount); }
  void add_attraction_delta(double amount) { attraction_.add_delta(amount); }
  void add_attachment_delta(double amount) { attachment_.add_delta(amount); }
  void add_jealousy_delta(double amount) { jealousy_.add_delta(amount); }
  void add_fear_delta(double amount) { fear_.add_delta(amount); }
  void add_obligation_delta(double amount) { obligation_.add_delta(amount); }

  void apply_decay(Duration elapsed);
  void reset_deltas();

  bool operator==(const DirectionalDimensions& o) const;
  bool operator!=(const DirectionalDimensions& o) const { return !(*this == o); }

 private:
  DecayingValue warmth_;
  DecayingValue resentment_;
  DecayingValue dependence_;
  DecayingValue attraction_;
  DecayingValue attachment_;
  DecayingValue jealousy_;
  DecayingValue fear_;
  DecayingValue obligation_;
};

// Observed rhythm of contact between the two parties.
struct InteractionPattern {
  double frequency{0.0};   // [0,1]
  double consistency{0.0}; // [0,1]
  std::optional<Timestamp> last_interaction;

  bool operator==(const InteractionPattern& o) const {
    return frequency == o.frequency && consistency == o.consistency && last_interaction == o.last_interaction;
  }
  bool operator!=(const InteractionPattern& o) const { return !(*this == o); }
};

} // namespace rapport
