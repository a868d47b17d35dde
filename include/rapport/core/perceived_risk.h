#pragma once

#include "rapport/core/decaying_value.h"
#include "rapport/core/enums.h"
#include "rapport/core/time.h"

namespace rapport {

inline constexpr Duration kPerceivedRiskHalfLife = Duration::days(7);
inline constexpr double kDefaultPerceivedRiskBase = 0.3;
inline constexpr double kBetrayalRiskIncrease = 0.3;
inline constexpr double kTrustorSensitivityScale = 0.4;

// A concrete exposure: what could be lost, and how much is at stake.
struct Vulnerability {
  VulnerabilityType type{VulnerabilityType::Resources};
  StakesLevel stakes{StakesLevel::Low};

  double risk_contribution() const { return stakes_risk_contribution(stakes); }
};

// The trustor's sense of how dangerous it is to depend on the trustee.
//
// Every compute_* query is additive and clamped to [0,1]; with the extra
// terms at neutral (stage modifier 0, sensitivity 0.5) they all agree with
// compute_for_stakes().
class PerceivedRisk {
 public:
  PerceivedRisk() : PerceivedRisk(kDefaultPerceivedRiskBase) {}
  explicit PerceivedRisk(double base) : risk_(DecayingValue::unit(base, kPerceivedRiskHalfLife)) {}

  double effective() const { return risk_.effective(); }
  double base() const { return risk_.base(); }
  double delta() const { return risk_.delta(); }

  const DecayingValue& value() const { return risk_; }
  DecayingValue& value() { return risk_; }

  bool has_betrayal_history() const { return betrayal_history_; }

  // One-way latch; only test fixtures clear it.
  void mark_betrayal() { betrayal_history_ = true; }
  void clear_betrayal_history() { betrayal_history_ = false; }

  double compute_for_stakes(StakesLevel stakes) const;
  double compute_for_vulnerability(const Vulnerability& v) const { return compute_for_stakes(v.stakes); }
  double compute_with_stage_modifier(StakesLevel stakes, double stage_modifier) const;

  // sensitivity in [0,1] (clamped) shifts risk by (sensitivity - 0.5) * 0.4.
  double compute_for_trustor(StakesLevel stakes, double trustor_sensitivity) const;
  double compute_subjective(StakesLevel stakes, double stage_modifier, double trustor_sensitivity) const;

  void add_delta(double amount) { risk_.add_delta(amount); }
  void set_delta(double delta) { risk_.set_delta(delta); }
  void set_base(double base) { risk_.set_base(base); }
  void reset_delta() { risk_.reset_delta(); }
  void apply_decay(Duration elapsed) { risk_.apply_decay(elapsed); }

  bool operator==(const PerceivedRisk& o) const {
    return risk_ == o.risk_ && betrayal_history_ == o.betrayal_history_;
  }
  bool operator!=(const PerceivedRisk& o) const { return !(*this == o); }

 private:
  DecayingValue risk_;
  bool betrayal_history_{false};
};

} // namespace rapport
