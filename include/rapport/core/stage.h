#pragma once

#include <array>
#include <cstdint>
#include <string>

namespace rapport {

// Developmental stage of a relationship.
//
// Stranger is the starting point. Estranged can be entered from any stage and
// marks deterioration rather than an ended relationship.
enum class RelationshipStage : std::uint8_t {
  Stranger = 0,
  Acquaintance = 1,
  Established = 2,
  Intimate = 3,
  Estranged = 4,
};

inline constexpr std::array<RelationshipStage, 5> kAllRelationshipStages{
    RelationshipStage::Stranger, RelationshipStage::Acquaintance, RelationshipStage::Established,
    RelationshipStage::Intimate, RelationshipStage::Estranged};

// Per-stage constants of the trust decision.
//
// propensity_weight + trustworthiness_weight == 1 for every stage: the less
// developed the relationship, the more the trustor leans on disposition.
struct StageWeights {
  double propensity_weight;
  double trustworthiness_weight;
  double risk_modifier;
  // Blend targets for decision certainty vs. confidence in the trustee's attributes.
  double decision_certainty;
  double trustee_confidence;
};

inline constexpr StageWeights stage_weights(RelationshipStage s) {
  switch (s) {
    case RelationshipStage::Stranger: return StageWeights{0.6, 0.4, 0.3, 0.1, 0.1};
    case RelationshipStage::Acquaintance: return StageWeights{0.4, 0.6, 0.2, 0.3, 0.4};
    case RelationshipStage::Established: return StageWeights{0.2, 0.8, 0.0, 0.6, 0.7};
    case RelationshipStage::Intimate: return StageWeights{0.1, 0.9, -0.1, 0.9, 0.9};
    // Well known, but the willingness judgment itself is conflicted.
    case RelationshipStage::Estranged: return StageWeights{0.3, 0.7, 0.4, 0.5, 0.8};
  }
  return StageWeights{0.6, 0.4, 0.3, 0.1, 0.1};
}

inline constexpr double propensity_weight(RelationshipStage s) { return stage_weights(s).propensity_weight; }
inline constexpr double trustworthiness_weight(RelationshipStage s) { return stage_weights(s).trustworthiness_weight; }
inline constexpr double risk_modifier(RelationshipStage s) { return stage_weights(s).risk_modifier; }

inline constexpr bool is_positive_stage(RelationshipStage s) {
  return s == RelationshipStage::Acquaintance || s == RelationshipStage::Established ||
         s == RelationshipStage::Intimate;
}

inline constexpr bool is_developed_stage(RelationshipStage s) {
  return s == RelationshipStage::Established || s == RelationshipStage::Intimate;
}

inline const char* relationship_stage_id(RelationshipStage s) {
  switch (s) {
    case RelationshipStage::Stranger: return "stranger";
    case RelationshipStage::Acquaintance: return "acquaintance";
    case RelationshipStage::Established: return "established";
    case RelationshipStage::Intimate: return "intimate";
    case RelationshipStage::Estranged: return "estranged";
  }
  return "stranger";
}

inline const char* relationship_stage_description(RelationshipStage s) {
  switch (s) {
    case RelationshipStage::Stranger: return "No significant interaction history";
    case RelationshipStage::Acquaintance: return "Limited interactions, forming impressions";
    case RelationshipStage::Established: return "Regular relationship with consistent patterns";
    case RelationshipStage::Intimate: return "Deep trust and extensive history";
    case RelationshipStage::Estranged: return "Previously close but now deteriorated";
  }
  return "";
}

// Describes a refused stage change. No transition is refused today; the type
// is part of the set_stage() contract so callers already handle it.
struct StageTransitionError {
  RelationshipStage from{RelationshipStage::Stranger};
  RelationshipStage to{RelationshipStage::Stranger};

  std::string message() const {
    return std::string("Invalid stage transition from ") + relationship_stage_id(from) + " to " +
           relationship_stage_id(to);
  }
};

} // namespace rapport
