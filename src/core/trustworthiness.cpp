#include "rapport/core/trustworthiness.h"

#include <algorithm>
#include <cmath>
#include <optional>
#include <sstream>

#include "rapport/util/log.h"

namespace rapport {
namespace {

double update_ema(double previous, double value) {
  return (1.0 - kAntecedentSmoothingAlpha) * previous + kAntecedentSmoothingAlpha * value;
}

// Re-anchor the stored delta so effective() equals clamp(base + ema).
void apply_ema(DecayingValue& v, double ema) {
  const double base = v.base();
  const double target = std::clamp(base + ema, 0.0, 1.0);
  v.set_delta(target - base);
}

std::array<DecayingValue, kLifeDomainCount> make_competence(double base) {
  std::array<DecayingValue, kLifeDomainCount> out;
  out.fill(DecayingValue::unit(base, kCompetenceHalfLife));
  return out;
}

} // namespace

TrustworthinessFactors::TrustworthinessFactors()
    : TrustworthinessFactors(kDefaultTrustworthinessBase, kDefaultTrustworthinessBase,
                             kDefaultTrustworthinessBase) {}

TrustworthinessFactors::TrustworthinessFactors(double competence_base, double benevolence_base,
                                               double integrity_base)
    : competence_(make_competence(competence_base)),
      benevolence_(DecayingValue::unit(benevolence_base, kBenevolenceHalfLife)),
      integrity_(DecayingValue::unit(integrity_base, kIntegrityHalfLife)) {}

double TrustworthinessFactors::competence_effective() const {
  double sum = 0.0;
  for (const auto& v : competence_) sum += v.effective();
  return sum / static_cast<double>(competence_.size());
}

double TrustworthinessFactors::overall() const {
  return (competence_effective() + benevolence_effective() + integrity_effective()) / 3.0;
}

const DecayingValue* TrustworthinessFactors::get(TrustPath p) const {
  switch (p) {
    case TrustPath::Competence: return &competence(LifeDomain::Work);
    case TrustPath::Benevolence: return &benevolence_;
    case TrustPath::Integrity: return &integrity_;
    case TrustPath::SupportWillingness: return nullptr;
  }
  return nullptr;
}

DecayingValue* TrustworthinessFactors::get(TrustPath p) {
  return const_cast<DecayingValue*>(static_cast<const TrustworthinessFactors&>(*this).get(p));
}

void TrustworthinessFactors::add_competence_delta(double amount) {
  for (auto& v : competence_) v.add_delta(amount);
}

// Replays the whole history against the newest antecedent's timestamp:
//
// - each antecedent fades with a 180-day half-life of its age,
// - negatives weigh 2.5x; positives inside the 180-day window after the most
//   recent negative seen so far weigh 0.7x,
// - one EMA (alpha 0.4) per target, folded in chronological order.
//
// Only the deltas are rewritten. Competence domains that no Ability
// antecedent touched keep their current delta.
void TrustworthinessFactors::recompute_from_antecedents(const std::vector<TrustAntecedent>& history) {
  if (history.empty()) {
    reset_deltas();
    return;
  }

  std::vector<const TrustAntecedent*> sorted;
  sorted.reserve(history.size());
  for (const auto& a : history) sorted.push_back(&a);
  std::stable_sort(sorted.begin(), sorted.end(), [](const TrustAntecedent* x, const TrustAntecedent* y) {
    return x->timestamp() < y->timestamp();
  });

  const Timestamp reference = sorted.back()->timestamp();

  std::array<std::optional<double>, kLifeDomainCount> competence_ema;
  double benevolence_ema = 0.0;
  double integrity_ema = 0.0;
  std::optional<Timestamp> last_negative;

  for (const TrustAntecedent* a : sorted) {
    const double age_days = (reference - a->timestamp()).as_days_f64();
    const double decay = std::exp(-age_days * std::log(2.0) / kAntecedentDecayHalfLifeDays);

    double weight = 1.0;
    if (a->is_negative()) {
      last_negative = a->timestamp();
      weight = kNegativeAntecedentWeight;
    } else if (last_negative && (a->timestamp() - *last_negative) <= kRebuildingWindow) {
      weight = kRebuildingPositiveWeight;
    }

    const double sign = a->is_negative() ? -1.0 : 1.0;
    const double signed_value = sign * a->magnitude() * weight * decay;

    switch (a->type()) {
      case AntecedentType::Ability:
        if (const auto domain = a->life_domain()) {
          auto& ema = competence_ema[life_domain_index(*domain)];
          ema = update_ema(ema.value_or(0.0), signed_value);
        } else {
          for (auto& ema : competence_ema) ema = update_ema(ema.value_or(0.0), signed_value);
        }
        break;
      case AntecedentType::Benevolence:
        benevolence_ema = update_ema(benevolence_ema, signed_value);
        break;
      case AntecedentType::Integrity:
        integrity_ema = update_ema(integrity_ema, signed_value);
        break;
    }
  }

  for (std::size_t i = 0; i < competence_.size(); ++i) {
    if (competence_ema[i]) apply_ema(competence_[i], *competence_ema[i]);
  }
  apply_ema(benevolence_, benevolence_ema);
  apply_ema(integrity_, integrity_ema);

  if (log::enabled(log::Level::Debug)) {
    std::ostringstream ss;
    ss << "trust recompute: " << history.size() << " antecedents, benevolence=" << benevolence_ema
       << " integrity=" << integrity_ema;
    log::debug(ss.str());
  }
}

void TrustworthinessFactors::apply_decay(Duration elapsed) {
  for (auto& v : competence_) v.apply_decay(elapsed);
  benevolence_.apply_decay(elapsed);
  integrity_.apply_decay(elapsed);
}

void TrustworthinessFactors::reset_deltas() {
  for (auto& v : competence_) v.reset_delta();
  benevolence_.reset_delta();
  integrity_.reset_delta();
}

} // namespace rapport
