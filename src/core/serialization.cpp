#include "rapport/core/serialization.h"

#include <initializer_list>
#include <string>
#include <vector>

#include "rapport/core/enums.h"
#include "rapport/core/rel_path.h"

namespace rapport {
namespace {

using json::Array;
using json::Object;
using json::Value;

Value value_to_json(const DecayingValue& v) {
  Object o;
  o["base"] = v.base();
  o["delta"] = v.delta();
  o["effective"] = v.effective();
  return o;
}

Value antecedent_to_json(const TrustAntecedent& a) {
  Object o;
  o["timestamp"] = a.timestamp().to_string();
  o["type"] = std::string(antecedent_type_id(a.type()));
  o["direction"] = std::string(antecedent_direction_id(a.direction()));
  o["magnitude"] = a.magnitude();
  o["context"] = a.context();
  if (a.life_domain()) o["life_domain"] = std::string(life_domain_id(*a.life_domain()));
  return o;
}

Value trustworthiness_to_json(const TrustworthinessFactors& tw) {
  Object competence;
  for (LifeDomain d : kAllLifeDomains) competence[life_domain_id(d)] = value_to_json(tw.competence(d));

  Object o;
  o["competence"] = competence;
  o["benevolence"] = value_to_json(tw.benevolence());
  o["integrity"] = value_to_json(tw.integrity());
  o["overall"] = tw.overall();
  return o;
}

Value direction_to_json(const Relationship& rel, Direction d) {
  Object risk;
  risk["value"] = value_to_json(rel.perceived_risk(d).value());
  risk["betrayal_history"] = rel.perceived_risk(d).has_betrayal_history();

  const DirectionalDimensions& dims = rel.directional(d);
  Object dimensions;
  for (DirectionalKind k : {DirectionalKind::Warmth, DirectionalKind::Resentment, DirectionalKind::Dependence,
                            DirectionalKind::Attraction, DirectionalKind::Attachment, DirectionalKind::Jealousy,
                            DirectionalKind::Fear, DirectionalKind::Obligation}) {
    if (const DecayingValue* v = dims.get(k)) dimensions[directional_kind_id(k)] = value_to_json(*v);
  }

  Array history;
  for (const auto& a : rel.antecedent_history(d)) history.push_back(antecedent_to_json(a));

  Object o;
  o["trustworthiness"] = trustworthiness_to_json(rel.trustworthiness(d));
  o["perceived_risk"] = risk;
  o["dimensions"] = dimensions;
  o["antecedents"] = history;
  if (const auto last = rel.last_negative_antecedent(d)) o["last_negative_antecedent"] = last->to_string();
  return o;
}

} // namespace

json::Value serialize_relationship_to_json_value(const Relationship& rel) {
  Object shared;
  for (SharedPath p : {SharedPath::Affinity, SharedPath::Respect, SharedPath::Tension, SharedPath::Intimacy,
                       SharedPath::History}) {
    shared[shared_path_id(p)] = value_to_json(rel.shared().get(p));
  }

  Array bonds;
  for (BondType b : rel.bonds()) bonds.push_back(std::string(bond_type_id(b)));

  Object pattern;
  pattern["frequency"] = rel.pattern().frequency;
  pattern["consistency"] = rel.pattern().consistency;
  if (rel.pattern().last_interaction) pattern["last_interaction"] = rel.pattern().last_interaction->to_string();

  Object root;
  root["id"] = rel.id();
  root["entity_a"] = rel.entity_a();
  root["entity_b"] = rel.entity_b();
  root["stage"] = std::string(relationship_stage_id(rel.stage()));
  root["schema"] = std::string(relationship_schema_id(rel.schema()));
  root["bonds"] = bonds;
  root["pattern"] = pattern;
  root["shared"] = shared;
  root[direction_id(Direction::AToB)] = direction_to_json(rel, Direction::AToB);
  root[direction_id(Direction::BToA)] = direction_to_json(rel, Direction::BToA);
  return root;
}

std::string serialize_relationship_to_json(const Relationship& rel, int indent) {
  return json::stringify(serialize_relationship_to_json_value(rel), indent);
}

std::string serialize_relationships_to_json(const std::vector<Relationship>& rels, int indent) {
  Array arr;
  arr.reserve(rels.size());
  for (const auto& r : rels) arr.push_back(serialize_relationship_to_json_value(r));
  Object root;
  root["relationships"] = arr;
  return json::stringify(root, indent);
}

} // namespace rapport
