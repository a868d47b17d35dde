#include "rapport/core/simulation.h"

#include <algorithm>
#include <cstdint>
#include <string>

#include "rapport/util/log.h"
#include "rapport/util/strings.h"

namespace rapport {

Simulation::Simulation(Timestamp start, SimConfig cfg) : cfg_(cfg), now_(start) {
  if (cfg_.decay_step_hours <= 0) cfg_.decay_step_hours = 24;
}

Relationship& Simulation::add_relationship(const EntityId& a, const EntityId& b) {
  if (find(a, b)) {
    throw RelationshipError(RelationshipError::Kind::DuplicatePair,
                            "Relationship already exists between " + a + " and " + b);
  }
  relationships_.emplace_back(a, b);
  return relationships_.back();
}

Relationship* Simulation::find(const EntityId& x, const EntityId& y) {
  for (auto& r : relationships_) {
    if (r.direction_between(x, y)) return &r;
  }
  return nullptr;
}

const Relationship* Simulation::find(const EntityId& x, const EntityId& y) const {
  for (const auto& r : relationships_) {
    if (r.direction_between(x, y)) return &r;
  }
  return nullptr;
}

std::size_t Simulation::process_event(const TrustEvent& event) {
  const std::size_t appended = process_event_antecedents(event, relationships_);
  if (appended == 0) {
    log::debug("event " + event.source + " -> " + event.target + " matched no relationship");
    return 0;
  }

  if (cfg_.log_trust_updates) {
    for (const auto& r : relationships_) {
      const std::optional<Direction> dir = r.direction_between(event.target, event.source);
      if (!dir) continue;
      const TrustworthinessFactors& tw = r.trustworthiness(*dir);
      log::info(r.id(), event.target + " now sees " + event.source + ": competence " +
                          format_fixed(tw.competence_effective()) + ", benevolence " +
                          format_fixed(tw.benevolence_effective()) + ", integrity " +
                          format_fixed(tw.integrity_effective()));
    }
  }
  return appended;
}

void Simulation::advance_hours(int hours) { advance_by(static_cast<std::int64_t>(hours)); }

void Simulation::advance_days(int days) { advance_by(static_cast<std::int64_t>(days) * 24); }

void Simulation::advance_by(std::int64_t hours) {
  if (hours <= 0) return;

  const std::int64_t max_step = cfg_.decay_step_hours;
  std::int64_t remaining = hours;
  while (remaining > 0) {
    const std::int64_t step = std::min(remaining, max_step);
    tick(Duration::hours(step));
    remaining -= step;
  }
}

void Simulation::tick(Duration step) {
  for (auto& r : relationships_) r.apply_decay(step);
  now_ = now_ + step;
}

} // namespace rapport
