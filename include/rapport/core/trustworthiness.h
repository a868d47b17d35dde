#pragma once

#include <array>
#include <vector>

#include "rapport/core/antecedent.h"
#include "rapport/core/decaying_value.h"
#include "rapport/core/enums.h"
#include "rapport/core/rel_path.h"
#include "rapport/core/time.h"

namespace rapport {

// --- trustworthiness (Mayer: ability, benevolence, integrity) ---
//
// How one party perceives the other. Competence is tracked per life domain;
// every domain is present from construction and never removed.

inline constexpr Duration kCompetenceHalfLife = Duration::days(30);
inline constexpr Duration kBenevolenceHalfLife = Duration::days(14);
inline constexpr Duration kIntegrityHalfLife = Duration::days(60);
inline constexpr double kDefaultTrustworthinessBase = 0.3;

// Replay tuning.
inline constexpr double kAntecedentSmoothingAlpha = 0.4;
inline constexpr double kNegativeAntecedentWeight = 2.5;
inline constexpr double kRebuildingPositiveWeight = 0.7;
inline constexpr Duration kRebuildingWindow = Duration::days(180);
inline constexpr double kAntecedentDecayHalfLifeDays = 180.0;

class TrustworthinessFactors {
 public:
  TrustworthinessFactors();
  TrustworthinessFactors(double competence_base, double benevolence_base, double integrity_base);

  double competence_in(LifeDomain d) const { return competence_[life_domain_index(d)].effective(); }

  // Mean effective competence across all domains.
  double competence_effective() const;
  double benevolence_effective() const { return benevolence_.effective(); }
  double integrity_effective() const { return integrity_.effective(); }

  // Mean of competence, benevolence and integrity.
  double overall() const;

  const DecayingValue& competence(LifeDomain d) const { return competence_[life_domain_index(d)]; }
  DecayingValue& competence(LifeDomain d) { return competence_[life_domain_index(d)]; }
  const DecayingValue& benevolence() const { return benevolence_; }
  DecayingValue& benevolence() { return benevolence_; }
  const DecayingValue& integrity() const { return integrity_; }
  DecayingValue& integrity() { return integrity_; }

  // nullptr for computed paths (SupportWillingness). Competence maps to the Work domain.
  const DecayingValue* get(TrustPath p) const;
  DecayingValue* get(TrustPath p);

  void add_competence_delta_in(LifeDomain d, double amount) { competence(d).add_delta(amount); }
  // Adds to every competence domain.
  void add_competence_delta(double amount);
  void add_benevolence_delta(double amount) { benevolence_.add_delta(amount); }
  void add_integrity_delta(double amount) { integrity_.add_delta(amount); }

  // Rebuild deltas from a full antecedent history (see trustworthiness.cpp).
  void recompute_from_antecedents(const std::vector<TrustAntecedent>& history);

  void apply_decay(Duration elapsed);
  void reset_deltas();

  bool operator==(const TrustworthinessFactors& o) const {
    return competence_ == o.competence_ && benevolence_ == o.benevolence_ && integrity_ == o.integrity_;
  }
  bool operator!=(const TrustworthinessFactors& o) const { return !(*this == o); }

 private:
  std::array<DecayingValue, kLifeDomainCount> competence_;
  DecayingValue benevolence_;
  DecayingValue integrity_;
};

} // namespace rapport
