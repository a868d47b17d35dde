#pragma once

#include <algorithm>
#include <cstdint>
#include <optional>
#include <string>
#include <utility>

#include "rapport/core/enums.h"
#include "rapport/core/time.h"

namespace rapport {

// Trustworthiness factor an antecedent speaks to.
enum class AntecedentType : std::uint8_t {
  Ability = 0,
  Benevolence = 1,
  Integrity = 2,
};

enum class AntecedentDirection : std::uint8_t {
  Positive = 0,
  Negative = 1,
};

inline constexpr TrustDomain antecedent_trust_domain(AntecedentType t) {
  switch (t) {
    case AntecedentType::Ability: return TrustDomain::Task;
    case AntecedentType::Benevolence: return TrustDomain::Support;
    case AntecedentType::Integrity: return TrustDomain::Disclosure;
  }
  return TrustDomain::Task;
}

inline const char* antecedent_type_id(AntecedentType t) {
  switch (t) {
    case AntecedentType::Ability: return "ability";
    case AntecedentType::Benevolence: return "benevolence";
    case AntecedentType::Integrity: return "integrity";
  }
  return "ability";
}

inline const char* antecedent_direction_id(AntecedentDirection d) {
  return d == AntecedentDirection::Positive ? "positive" : "negative";
}

// One observed, signed, trust-relevant act by the trustee.
//
// Immutable once built. Magnitude is clamped to [0,1]. life_domain is only
// meaningful for Ability antecedents; when absent an Ability antecedent
// counts toward every competence domain.
class TrustAntecedent {
 public:
  TrustAntecedent(Timestamp timestamp, AntecedentType type, AntecedentDirection direction, double magnitude,
                  std::string context, std::optional<LifeDomain> life_domain = std::nullopt)
      : timestamp_(timestamp),
        type_(type),
        direction_(direction),
        magnitude_(std::clamp(magnitude, 0.0, 1.0)),
        context_(std::move(context)),
        life_domain_(life_domain) {}

  Timestamp timestamp() const { return timestamp_; }
  AntecedentType type() const { return type_; }
  AntecedentDirection direction() const { return direction_; }
  double magnitude() const { return magnitude_; }
  const std::string& context() const { return context_; }
  TrustDomain trust_domain() const { return antecedent_trust_domain(type_); }
  std::optional<LifeDomain> life_domain() const { return life_domain_; }

  bool is_negative() const { return direction_ == AntecedentDirection::Negative; }

  bool operator==(const TrustAntecedent& o) const {
    return timestamp_ == o.timestamp_ && type_ == o.type_ && direction_ == o.direction_ &&
           magnitude_ == o.magnitude_ && context_ == o.context_ && life_domain_ == o.life_domain_;
  }
  bool operator!=(const TrustAntecedent& o) const { return !(*this == o); }

 private:
  Timestamp timestamp_;
  AntecedentType type_;
  AntecedentDirection direction_;
  double magnitude_;
  std::string context_;
  std::optional<LifeDomain> life_domain_;
};

} // namespace rapport
