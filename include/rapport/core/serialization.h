#pragma once

#include <string>

#include "rapport/core/relationship.h"
#include "rapport/util/json.h"

namespace rapport {

// Full snapshot of a relationship: identity, stage, bonds, schema, pattern,
// shared dimensions, and per direction the trustworthiness factors,
// perceived risk, directional dimensions and antecedent history.
//
// Every stored value is exported as {"base", "delta", "effective"}.
json::Value serialize_relationship_to_json_value(const Relationship& rel);
std::string serialize_relationship_to_json(const Relationship& rel, int indent = 2);

// Export of several relationships as {"relationships": [...]}.
std::string serialize_relationships_to_json(const std::vector<Relationship>& rels, int indent = 2);

} // namespace rapport
