#include "rapport/core/enum_strings.h"

#include "rapport/util/strings.h"

namespace rapport {
namespace {

std::string normalize(const std::string& s) { return to_lower(trim_copy(s)); }

// Linear match against the enum's own id function over [0, count).
template <typename E, typename IdFn>
std::optional<E> match_id(const std::string& s, int count, IdFn id) {
  const std::string key = normalize(s);
  for (int i = 0; i < count; ++i) {
    const E e = static_cast<E>(i);
    if (key == id(e)) return e;
  }
  return std::nullopt;
}

} // namespace

std::optional<LifeDomain> life_domain_from_string(const std::string& s) {
  return match_id<LifeDomain>(s, static_cast<int>(kLifeDomainCount), life_domain_id);
}

std::optional<TrustDomain> trust_domain_from_string(const std::string& s) {
  return match_id<TrustDomain>(s, 3, trust_domain_id);
}

std::optional<Direction> direction_from_string(const std::string& s) {
  const std::string key = normalize(s);
  if (key == "a_to_b" || key == "atob" || key == "a->b") return Direction::AToB;
  if (key == "b_to_a" || key == "btoa" || key == "b->a") return Direction::BToA;
  return std::nullopt;
}

std::optional<StakesLevel> stakes_level_from_string(const std::string& s) {
  return match_id<StakesLevel>(s, 4, stakes_level_id);
}

std::optional<VulnerabilityType> vulnerability_type_from_string(const std::string& s) {
  return match_id<VulnerabilityType>(s, 6, vulnerability_type_id);
}

std::optional<BondType> bond_type_from_string(const std::string& s) {
  return match_id<BondType>(s, 13, bond_type_id);
}

std::optional<RelationshipSchema> relationship_schema_from_string(const std::string& s) {
  return match_id<RelationshipSchema>(s, 8, relationship_schema_id);
}

std::optional<RelationshipStage> relationship_stage_from_string(const std::string& s) {
  return match_id<RelationshipStage>(s, 5, relationship_stage_id);
}

std::optional<AntecedentType> antecedent_type_from_string(const std::string& s) {
  return match_id<AntecedentType>(s, 3, antecedent_type_id);
}

std::optional<AntecedentDirection> antecedent_direction_from_string(const std::string& s) {
  return match_id<AntecedentDirection>(s, 2, antecedent_direction_id);
}

} // namespace rapport
