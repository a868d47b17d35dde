#pragma once

#include <array>
#include <cstddef>
#include <cstdint>

namespace rapport {

// --- domain enumerations shared by the trust model ---
//
// Each enum has a stable lowercase id (used by exports, scenario files and
// state paths) and a human-readable label. Parsers live in enum_strings.h.

// Life area in which competence is judged. Competence in one area says
// nothing about competence in another.
enum class LifeDomain : std::uint8_t {
  Work = 0,
  Academic = 1,
  Social = 2,
  Athletic = 3,
  Creative = 4,
  Financial = 5,
  Health = 6,
  Relationship = 7,
};

inline constexpr std::size_t kLifeDomainCount = 8;

inline constexpr std::array<LifeDomain, kLifeDomainCount> kAllLifeDomains{
    LifeDomain::Work,      LifeDomain::Academic,  LifeDomain::Social, LifeDomain::Athletic,
    LifeDomain::Creative,  LifeDomain::Financial, LifeDomain::Health, LifeDomain::Relationship,
};

inline constexpr std::size_t life_domain_index(LifeDomain d) { return static_cast<std::size_t>(d); }

inline const char* life_domain_id(LifeDomain d) {
  switch (d) {
    case LifeDomain::Work: return "work";
    case LifeDomain::Academic: return "academic";
    case LifeDomain::Social: return "social";
    case LifeDomain::Athletic: return "athletic";
    case LifeDomain::Creative: return "creative";
    case LifeDomain::Financial: return "financial";
    case LifeDomain::Health: return "health";
    case LifeDomain::Relationship: return "relationship";
  }
  return "work";
}

// Which willingness a trust signal ultimately feeds.
enum class TrustDomain : std::uint8_t {
  Task = 0,       // delegating work (competence)
  Support = 1,    // relying on help (benevolence)
  Disclosure = 2, // sharing secrets (integrity)
};

inline const char* trust_domain_id(TrustDomain d) {
  switch (d) {
    case TrustDomain::Task: return "task";
    case TrustDomain::Support: return "support";
    case TrustDomain::Disclosure: return "disclosure";
  }
  return "task";
}

// Perspective within a relationship. AToB is how entity A perceives entity B.
enum class Direction : std::uint8_t {
  AToB = 0,
  BToA = 1,
};

inline constexpr Direction opposite(Direction d) {
  return d == Direction::AToB ? Direction::BToA : Direction::AToB;
}

inline const char* direction_id(Direction d) { return d == Direction::AToB ? "a_to_b" : "b_to_a"; }
inline const char* direction_label(Direction d) { return d == Direction::AToB ? "A to B" : "B to A"; }

enum class StakesLevel : std::uint8_t {
  Low = 0,
  Medium = 1,
  High = 2,
  Critical = 3,
};

inline constexpr std::array<StakesLevel, 4> kAllStakesLevels{
    StakesLevel::Low, StakesLevel::Medium, StakesLevel::High, StakesLevel::Critical};

// Risk added on top of the trustor's baseline for an action at these stakes.
inline constexpr double stakes_risk_contribution(StakesLevel s) {
  switch (s) {
    case StakesLevel::Low: return 0.0;
    case StakesLevel::Medium: return 0.2;
    case StakesLevel::High: return 0.4;
    case StakesLevel::Critical: return 0.6;
  }
  return 0.0;
}

inline const char* stakes_level_id(StakesLevel s) {
  switch (s) {
    case StakesLevel::Low: return "low";
    case StakesLevel::Medium: return "medium";
    case StakesLevel::High: return "high";
    case StakesLevel::Critical: return "critical";
  }
  return "low";
}

// What the trustor stands to lose.
enum class VulnerabilityType : std::uint8_t {
  Identity = 0,
  Resources = 1,
  Safety = 2,
  Relationship = 3,
  Reputation = 4,
  Emotional = 5,
};

inline const char* vulnerability_type_id(VulnerabilityType v) {
  switch (v) {
    case VulnerabilityType::Identity: return "identity";
    case VulnerabilityType::Resources: return "resources";
    case VulnerabilityType::Safety: return "safety";
    case VulnerabilityType::Relationship: return "relationship";
    case VulnerabilityType::Reputation: return "reputation";
    case VulnerabilityType::Emotional: return "emotional";
  }
  return "resources";
}

enum class BondType : std::uint8_t {
  Peer = 0,
  Mentor,
  Mentee,
  Family,
  Friend,
  Colleague,
  Romantic,
  Rival,
  Authority,
  Subordinate,
  Parent,
  Child,
  Sibling,
};

inline const char* bond_type_id(BondType b) {
  switch (b) {
    case BondType::Peer: return "peer";
    case BondType::Mentor: return "mentor";
    case BondType::Mentee: return "mentee";
    case BondType::Family: return "family";
    case BondType::Friend: return "friend";
    case BondType::Colleague: return "colleague";
    case BondType::Romantic: return "romantic";
    case BondType::Rival: return "rival";
    case BondType::Authority: return "authority";
    case BondType::Subordinate: return "subordinate";
    case BondType::Parent: return "parent";
    case BondType::Child: return "child";
    case BondType::Sibling: return "sibling";
  }
  return "peer";
}

inline bool is_family_bond(BondType b) {
  return b == BondType::Family || b == BondType::Parent || b == BondType::Child || b == BondType::Sibling;
}

// The bond the other party holds. Symmetric bonds map to themselves.
inline BondType reciprocal_bond(BondType b) {
  switch (b) {
    case BondType::Mentor: return BondType::Mentee;
    case BondType::Mentee: return BondType::Mentor;
    case BondType::Authority: return BondType::Subordinate;
    case BondType::Subordinate: return BondType::Authority;
    case BondType::Parent: return BondType::Child;
    case BondType::Child: return BondType::Parent;
    default: return b;
  }
}

// Structural template of a relationship (hierarchy, family shape, rivalry).
enum class RelationshipSchema : std::uint8_t {
  Peer = 0,
  Mentor,
  Subordinate,
  Romantic,
  Family,
  Nuclear,
  Extended,
  Rival,
};

inline const char* relationship_schema_id(RelationshipSchema s) {
  switch (s) {
    case RelationshipSchema::Peer: return "peer";
    case RelationshipSchema::Mentor: return "mentor";
    case RelationshipSchema::Subordinate: return "subordinate";
    case RelationshipSchema::Romantic: return "romantic";
    case RelationshipSchema::Family: return "family";
    case RelationshipSchema::Nuclear: return "nuclear";
    case RelationshipSchema::Extended: return "extended";
    case RelationshipSchema::Rival: return "rival";
  }
  return "peer";
}

inline bool is_hierarchical(RelationshipSchema s) {
  return s == RelationshipSchema::Mentor || s == RelationshipSchema::Subordinate;
}

} // namespace rapport
