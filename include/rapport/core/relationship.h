#pragma once

#include <cstddef>
#include <optional>
#include <stdexcept>
#include <string>
#include <vector>

#include "rapport/core/antecedent.h"
#include "rapport/core/dimensions.h"
#include "rapport/core/enums.h"
#include "rapport/core/perceived_risk.h"
#include "rapport/core/rel_path.h"
#include "rapport/core/stage.h"
#include "rapport/core/time.h"
#include "rapport/core/trust_decision.h"
#include "rapport/core/trustworthiness.h"

namespace rapport {

using EntityId = std::string;

// Hard precondition failures when building relationships.
class RelationshipError : public std::runtime_error {
 public:
  enum class Kind { SelfRelationship, EmptyEntityId, DuplicatePair };

  RelationshipError(Kind kind, const std::string& what) : std::runtime_error(what), kind_(kind) {}

  Kind kind() const { return kind_; }

 private:
  Kind kind_;
};

// Pairwise relationship between two distinct entities.
//
// Owns everything about the pair: one shared dimension set, and per
// direction an antecedent history, trustworthiness factors, perceived risk
// and directional dimensions. AToB is A's view of B.
//
// Not internally synchronized. Distinct relationships may be updated in
// parallel; updates to one relationship must be serialized by the caller.
class Relationship {
 public:
  static constexpr std::size_t kMaxAntecedentHistory = 100;

  // Throws RelationshipError for an empty id or a == b.
  Relationship(EntityId a, EntityId b);

  const std::string& id() const { return id_; }
  const EntityId& entity_a() const { return entity_a_; }
  const EntityId& entity_b() const { return entity_b_; }
  bool involves(const EntityId& e) const { return e == entity_a_ || e == entity_b_; }

  // The counterpart of `e`, or nullptr when `e` is not part of this relationship.
  const EntityId* other(const EntityId& e) const;

  // Direction in which `trustor` perceives `trustee`, if both belong here.
  std::optional<Direction> direction_between(const EntityId& trustor, const EntityId& trustee) const;

  // --- bonds / schema / stage ---
  const std::vector<BondType>& bonds() const { return bonds_; }
  void add_bond(BondType b);
  void remove_bond(BondType b);
  bool has_bond(BondType b) const;

  RelationshipSchema schema() const { return schema_; }
  void set_schema(RelationshipSchema s) { schema_ = s; }

  RelationshipStage stage() const { return stage_; }

  // Every transition is currently permitted; returns true. On a refused
  // transition it would return false and fill *error.
  bool set_stage(RelationshipStage stage, StageTransitionError* error = nullptr);

  // --- owned state ---
  const SharedDimensions& shared() const { return shared_; }
  SharedDimensions& shared() { return shared_; }
  const InteractionPattern& pattern() const { return pattern_; }
  InteractionPattern& pattern() { return pattern_; }

  const TrustworthinessFactors& trustworthiness(Direction d) const { return side(d).trustworthiness; }
  TrustworthinessFactors& trustworthiness(Direction d) { return side(d).trustworthiness; }
  const PerceivedRisk& perceived_risk(Direction d) const { return side(d).risk; }
  PerceivedRisk& perceived_risk(Direction d) { return side(d).risk; }
  const DirectionalDimensions& directional(Direction d) const { return side(d).dims; }
  DirectionalDimensions& directional(Direction d) { return side(d).dims; }

  // --- antecedent log ---

  // Appends, records the timestamp if the antecedent is negative, then keeps
  // only the kMaxAntecedentHistory most recent entries by timestamp.
  void append_antecedent(Direction d, TrustAntecedent antecedent);
  const std::vector<TrustAntecedent>& antecedent_history(Direction d) const { return side(d).history; }
  std::optional<Timestamp> last_negative_antecedent(Direction d) const { return side(d).last_negative; }

  // Replays the direction's full history into its trustworthiness deltas.
  void recompute_trustworthiness(Direction d);

  // --- generic path access ---

  // nullptr for Stage and computed paths.
  const DecayingValue* get(const RelPath& path) const;
  DecayingValue* get_mut(const RelPath& path);

  std::optional<double> value_at(const RelPath& path) const;

  // Both return false when the path has no stored value. The history path
  // never moves down: negative deltas and lower bases are refused.
  bool add_delta_at(const RelPath& path, double amount);
  bool set_base_at(const RelPath& path, double base);

  // --- trust decisions ---

  TrustDecision compute_trust_decision(Direction d, double trustor_propensity, StakesLevel stakes) const {
    return compute_trust_decision_with_context(d, trustor_propensity, stakes, 1.0);
  }

  // context_multiplier is clamped to [0,2] and scales the non-risk part of each willingness.
  TrustDecision compute_trust_decision_with_context(Direction d, double trustor_propensity, StakesLevel stakes,
                                                    double context_multiplier) const;

  TrustDecision compute_trust_decision_in(Direction d, double trustor_propensity, StakesLevel stakes,
                                          const TrustContext& context) const {
    return compute_trust_decision_with_context(d, trustor_propensity, stakes, context.compute_multiplier());
  }

  // Freezes the current view in direction `d`. Base risk carries the
  // betrayal increase but no stakes.
  TrustSnapshot trust_snapshot(Direction d, double trustor_propensity, double context_multiplier = 1.0) const;

  bool would_a_confide_in_b(double trustor_propensity, double risk_level) const;
  bool would_b_confide_in_a(double trustor_propensity, double risk_level) const;
  bool would_a_help_b(double trustor_propensity, double risk_level) const;
  bool would_b_help_a(double trustor_propensity, double risk_level) const;

  // Periodic tick. Callers must apply elapsed time in increasing order.
  void apply_decay(Duration elapsed);

  bool operator==(const Relationship& o) const;
  bool operator!=(const Relationship& o) const { return !(*this == o); }

 private:
  struct Side {
    TrustworthinessFactors trustworthiness;
    PerceivedRisk risk;
    DirectionalDimensions dims;
    std::vector<TrustAntecedent> history;
    std::optional<Timestamp> last_negative;

    bool operator==(const Side& o) const {
      return trustworthiness == o.trustworthiness && risk == o.risk && dims == o.dims && history == o.history &&
             last_negative == o.last_negative;
    }
  };

  const Side& side(Direction d) const { return d == Direction::AToB ? a_to_b_ : b_to_a_; }
  Side& side(Direction d) { return d == Direction::AToB ? a_to_b_ : b_to_a_; }

  std::string id_;
  EntityId entity_a_;
  EntityId entity_b_;
  std::vector<BondType> bonds_;
  RelationshipSchema schema_{RelationshipSchema::Peer};
  RelationshipStage stage_{RelationshipStage::Stranger};
  SharedDimensions shared_;
  InteractionPattern pattern_;
  Side a_to_b_;
  Side b_to_a_;
};

} // namespace rapport
