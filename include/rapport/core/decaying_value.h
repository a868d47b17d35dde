#pragma once

#include <optional>

#include "rapport/core/time.h"

namespace rapport {

// A bounded scalar made of a stable base plus a transient delta.
//
// effective() = clamp(base + delta, lower, upper). Decay only ever shrinks the
// delta toward zero; the base is untouched. A value without a half-life
// (e.g. shared relationship history) never decays.
//
// Always embedded by value in an owner; there is no shared ownership.
class DecayingValue {
 public:
  DecayingValue() = default;
  DecayingValue(double base, double lower, double upper, std::optional<Duration> half_life)
      : base_(base), lower_(lower), upper_(upper), half_life_(half_life) {}

  // Unit-interval value with the given half-life.
  static DecayingValue unit(double base, Duration half_life) { return DecayingValue(base, 0.0, 1.0, half_life); }

  // Unit-interval value that never decays.
  static DecayingValue unit_no_decay(double base) { return DecayingValue(base, 0.0, 1.0, std::nullopt); }

  double base() const { return base_; }
  double delta() const { return delta_; }
  double lower_bound() const { return lower_; }
  double upper_bound() const { return upper_; }
  const std::optional<Duration>& half_life() const { return half_life_; }
  bool decays() const { return half_life_.has_value(); }

  double effective() const;
  double effective_raw() const { return base_ + delta_; }

  void set_base(double base) { base_ = base; }
  void set_delta(double delta) { delta_ = delta; }
  void add_delta(double amount) { delta_ += amount; }
  void reset_delta() { delta_ = 0.0; }

  void set_half_life(Duration half_life) { half_life_ = half_life; }
  void clear_half_life() { half_life_.reset(); }

  // delta *= 0.5^(elapsed / half_life). No-op without a half-life, for a
  // non-positive half-life, or for non-positive elapsed time.
  void apply_decay(Duration elapsed);

  bool operator==(const DecayingValue& o) const {
    return base_ == o.base_ && delta_ == o.delta_ && lower_ == o.lower_ && upper_ == o.upper_ &&
           half_life_ == o.half_life_;
  }
  bool operator!=(const DecayingValue& o) const { return !(*this == o); }

 private:
  double base_{0.5};
  double delta_{0.0};
  double lower_{0.0};
  double upper_{1.0};
  std::optional<Duration> half_life_{Duration::days(7)};
};

} // namespace rapport
