#include "rapport/core/relationship.h"

#include <algorithm>
#include <initializer_list>
#include <string>
#include <utility>

#include "rapport/core/predictions.h"
#include "rapport/util/log.h"

namespace rapport {

Relationship::Relationship(EntityId a, EntityId b) : entity_a_(std::move(a)), entity_b_(std::move(b)) {
  if (entity_a_.empty() || entity_b_.empty()) {
    throw RelationshipError(RelationshipError::Kind::EmptyEntityId, "Entity id must not be empty");
  }
  if (entity_a_ == entity_b_) {
    throw RelationshipError(RelationshipError::Kind::SelfRelationship,
                            "Cannot create relationship between an entity and itself: " + entity_a_);
  }
  id_ = "rel_" + entity_a_ + "_" + entity_b_;
}

const EntityId* Relationship::other(const EntityId& e) const {
  if (e == entity_a_) return &entity_b_;
  if (e == entity_b_) return &entity_a_;
  return nullptr;
}

std::optional<Direction> Relationship::direction_between(const EntityId& trustor, const EntityId& trustee) const {
  if (trustor == entity_a_ && trustee == entity_b_) return Direction::AToB;
  if (trustor == entity_b_ && trustee == entity_a_) return Direction::BToA;
  return std::nullopt;
}

void Relationship::add_bond(BondType b) {
  if (has_bond(b)) return;
  bonds_.push_back(b);
}

void Relationship::remove_bond(BondType b) {
  bonds_.erase(std::remove(bonds_.begin(), bonds_.end(), b), bonds_.end());
}

bool Relationship::has_bond(BondType b) const {
  return std::find(bonds_.begin(), bonds_.end(), b) != bonds_.end();
}

bool Relationship::set_stage(RelationshipStage stage, StageTransitionError* error) {
  (void)error;
  if (stage != stage_) {
    log::debug(id_, std::string("stage ") + relationship_stage_id(stage_) + " -> " + relationship_stage_id(stage));
  }
  stage_ = stage;
  return true;
}

void Relationship::append_antecedent(Direction d, TrustAntecedent antecedent) {
  Side& s = side(d);
  if (antecedent.is_negative()) s.last_negative = antecedent.timestamp();

  s.history.push_back(std::move(antecedent));
  if (s.history.size() <= kMaxAntecedentHistory) return;

  std::stable_sort(s.history.begin(), s.history.end(), [](const TrustAntecedent& x, const TrustAntecedent& y) {
    return x.timestamp() < y.timestamp();
  });
  const std::size_t overflow = s.history.size() - kMaxAntecedentHistory;
  s.history.erase(s.history.begin(), s.history.begin() + static_cast<std::ptrdiff_t>(overflow));
  log::debug(id_, "pruned " + std::to_string(overflow) + " antecedent(s) from " + direction_id(d));
}

void Relationship::recompute_trustworthiness(Direction d) {
  Side& s = side(d);
  s.trustworthiness.recompute_from_antecedents(s.history);
}

const DecayingValue* Relationship::get(const RelPath& path) const {
  switch (path.scope) {
    case RelPath::Scope::Shared: return &shared_.get(path.shared);
    case RelPath::Scope::Directional: {
      const Side& s = side(path.direction);
      switch (path.directional.kind) {
        case DirectionalKind::Trust: return s.trustworthiness.get(path.directional.trust);
        case DirectionalKind::PerceivedRisk: return &s.risk.value();
        default: return s.dims.get(path.directional.kind);
      }
    }
    case RelPath::Scope::Stage: return nullptr;
  }
  return nullptr;
}

DecayingValue* Relationship::get_mut(const RelPath& path) {
  return const_cast<DecayingValue*>(static_cast<const Relationship&>(*this).get(path));
}

std::optional<double> Relationship::value_at(const RelPath& path) const {
  const DecayingValue* v = get(path);
  if (!v) return std::nullopt;
  return v->effective();
}

bool Relationship::add_delta_at(const RelPath& path, double amount) {
  if (path.scope == RelPath::Scope::Shared && path.shared == SharedPath::History) {
    if (amount <= 0.0) return false;
  }
  DecayingValue* v = get_mut(path);
  if (!v) return false;
  v->add_delta(amount);
  return true;
}

bool Relationship::set_base_at(const RelPath& path, double base) {
  DecayingValue* v = get_mut(path);
  if (!v) return false;
  if (path.scope == RelPath::Scope::Shared && path.shared == SharedPath::History && base < v->base()) return false;
  v->set_base(base);
  return true;
}

TrustDecision Relationship::compute_trust_decision_with_context(Direction d, double trustor_propensity,
                                                                StakesLevel stakes,
                                                                double context_multiplier) const {
  const Side& s = side(d);
  const StageWeights w = stage_weights(stage_);
  const double propensity = std::clamp(trustor_propensity, 0.0, 1.0);
  const double multiplier = std::clamp(context_multiplier, 0.0, 2.0);
  const double perceived_risk = s.risk.compute_with_stage_modifier(stakes, w.risk_modifier);

  const auto willingness = [&](double domain_trustworthiness) {
    const double base = w.propensity_weight * propensity + w.trustworthiness_weight * domain_trustworthiness;
    return std::clamp(base * multiplier - kTrustRiskWeight * perceived_risk, 0.0, 1.0);
  };

  const double history = shared_.history_effective();
  return TrustDecision(willingness(s.trustworthiness.competence_effective()),
                       willingness(s.trustworthiness.benevolence_effective()),
                       willingness(s.trustworthiness.integrity_effective()),
                       history * 0.3 + w.decision_certainty * 0.7,
                       history * 0.4 + w.trustee_confidence * 0.6);
}

TrustSnapshot Relationship::trust_snapshot(Direction d, double trustor_propensity, double context_multiplier) const {
  const Side& s = side(d);
  return TrustSnapshot(trustor_propensity, s.trustworthiness, s.risk.compute_for_stakes(StakesLevel::Low), stage_,
                       shared_.history_effective(), context_multiplier);
}

bool Relationship::would_a_confide_in_b(double trustor_propensity, double risk_level) const {
  return would_confide(*this, Direction::AToB, trustor_propensity, risk_level);
}

bool Relationship::would_b_confide_in_a(double trustor_propensity, double risk_level) const {
  return would_confide(*this, Direction::BToA, trustor_propensity, risk_level);
}

bool Relationship::would_a_help_b(double trustor_propensity, double risk_level) const {
  return would_help(*this, Direction::AToB, trustor_propensity, risk_level);
}

bool Relationship::would_b_help_a(double trustor_propensity, double risk_level) const {
  return would_help(*this, Direction::BToA, trustor_propensity, risk_level);
}

void Relationship::apply_decay(Duration elapsed) {
  shared_.apply_decay(elapsed);
  for (Side* s : {&a_to_b_, &b_to_a_}) {
    s->trustworthiness.apply_decay(elapsed);
    s->risk.apply_decay(elapsed);
    s->dims.apply_decay(elapsed);
  }
}

bool Relationship::operator==(const Relationship& o) const {
  return id_ == o.id_ && entity_a_ == o.entity_a_ && entity_b_ == o.entity_b_ && bonds_ == o.bonds_ &&
         schema_ == o.schema_ && stage_ == o.stage_ && shared_ == o.shared_ && pattern_ == o.pattern_ &&
         a_to_b_ == o.a_to_b_ && b_to_a_ == o.b_to_a_;
}

} // namespace rapport
