#include "rapport/core/dimensions.h"

#include <initializer_list>

namespace rapport {

SharedDimensions::SharedDimensions()
    : affinity_(DecayingValue::unit(0.1, Duration::days(14))),
      respect_(DecayingValue::unit(0.2, Duration::days(21))),
      tension_(DecayingValue::unit(0.0, Duration::days(7))),
      intimacy_(DecayingValue::unit(0.0, Duration::days(30))),
      history_(DecayingValue::unit_no_decay(0.0)) {}

const DecayingValue& SharedDimensions::get(SharedPath p) const {
  switch (p) {
    case SharedPath::Affinity: return affinity_;
    case SharedPath::Respect: return respect_;
    case SharedPath::Tension: return tension_;
    case SharedPath::Intimacy: return intimacy_;
    case SharedPath::History: return history_;
  }
  return affinity_;
}

DecayingValue& SharedDimensions::get(SharedPath p) {
  return const_cast<DecayingValue&>(static_cast<const SharedDimensions&>(*this).get(p));
}

void SharedDimensions::add_delta(SharedPath p, double amount) {
  if (p == SharedPath::History && amount <= 0.0) return;
  get(p).add_delta(amount);
}

void SharedDimensions::apply_decay(Duration elapsed) {
  affinity_.apply_decay(elapsed);
  respect_.apply_decay(elapsed);
  tension_.apply_decay(elapsed);
  intimacy_.apply_decay(elapsed);
}

void SharedDimensions::reset_deltas() {
  affinity_.reset_delta();
  respect_.reset_delta();
  tension_.reset_delta();
  intimacy_.reset_delta();
}

DirectionalDimensions::DirectionalDimensions()
    : warmth_(DecayingValue::unit(0.2, Duration::days(14))),
      resentment_(DecayingValue::unit(0.0, Duration::days(14))),
      dependence_(DecayingValue::unit(0.0, Duration::days(14))),
      attraction_(DecayingValue::unit(0.0, Duration::days(14))),
      attachment_(DecayingValue::unit(0.0, Duration::days(30))),
      jealousy_(DecayingValue::unit(0.0, Duration::days(7))),
      fear_(DecayingValue::unit(0.0, Duration::days(7))),
      obligation_(DecayingValue::unit(0.0, Duration::days(30))) {}

const DecayingValue* DirectionalDimensions::get(DirectionalKind k) const {
  switch (k) {
    case DirectionalKind::Warmth: return &warmth_;
    case DirectionalKind::Resentment: return &resentment_;
    case DirectionalKind::Dependence: return &dependence_;
    case DirectionalKind::Attraction: return &attraction_;
    case DirectionalKind::Attachment: return &attachment_;
    case DirectionalKind::Jealousy: return &jealousy_;
    case DirectionalKind::Fear: return &fear_;
    case DirectionalKind::Obligation: return &obligation_;
    case DirectionalKind::Trust:
    case DirectionalKind::PerceivedRisk: return nullptr;
  }
  return nullptr;
}

DecayingValue* DirectionalDimensions::get(DirectionalKind k) {
  return const_cast<DecayingValue*>(static_cast<const DirectionalDimensions&>(*this).get(k));
}

void DirectionalDimensions::apply_decay(Duration elapsed) {
  for (DecayingValue* v : {&warmth_, &resentment_, &dependence_, &attraction_, &attachment_, &jealousy_, &fear_,
                           &obligation_}) {
    v->apply_decay(elapsed);
  }
}

void DirectionalDimensions::reset_deltas() {
  for (DecayingValue* v : {&warmth_, &resentment_, &dependence_, &attraction_, &attachment_, &jealousy_, &fear_,
                           &obligation_}) {
    v->reset_delta();
  }
}

bool DirectionalDimensions::operator==(const DirectionalDimensions& o) const {
  return warmth_ == o.warmth_ && resentment_ == o.resentment_ && dependence_ == o.dependence_ &&
         attraction_ == o.attraction_ && attachment_ == o.attachment_ && jealousy_ == o.jealousy_ &&
         fear_ == o.fear_ && obligation_ == o.obligation_;
}

} // namespace rapport
