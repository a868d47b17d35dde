#pragma once

#include <optional>
#include <string>

#include "rapport/core/antecedent.h"
#include "rapport/core/enums.h"
#include "rapport/core/stage.h"

namespace rapport {

// Parsers for the lowercase ids produced by the *_id() functions.
//
// Matching is case-insensitive and ignores surrounding whitespace; unknown
// strings yield std::nullopt rather than a default.
std::optional<LifeDomain> life_domain_from_string(const std::string& s);
std::optional<TrustDomain> trust_domain_from_string(const std::string& s);
std::optional<Direction> direction_from_string(const std::string& s);
std::optional<StakesLevel> stakes_level_from_string(const std::string& s);
std::optional<VulnerabilityType> vulnerability_type_from_string(const std::string& s);
std::optional<BondType> bond_type_from_string(const std::string& s);
std::optional<RelationshipSchema> relationship_schema_from_string(const std::string& s);
std::optional<RelationshipStage> relationship_stage_from_string(const std::string& s);
std::optional<AntecedentType> antecedent_type_from_string(const std::string& s);
std::optional<AntecedentDirection> antecedent_direction_from_string(const std::string& s);

} // namespace rapport
