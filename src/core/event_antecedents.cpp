#include "rapport/core/event_antecedents.h"

#include <algorithm>
#include <string>

#include "rapport/util/log.h"
#include "rapport/util/strings.h"

namespace rapport {
namespace {

double consistency_factor(const InteractionPattern& pattern) {
  return 0.5 + 0.5 * std::clamp(pattern.consistency, 0.0, 1.0);
}

} // namespace

std::size_t process_event_antecedents(const TrustEvent& event, std::vector<Relationship>& relationships) {
  if (event.source.empty() || event.target.empty() || event.mappings.empty()) return 0;

  std::size_t appended = 0;
  for (Relationship& rel : relationships) {
    const std::optional<Direction> dir = rel.direction_between(event.target, event.source);
    if (!dir) continue;

    const double consistency = consistency_factor(rel.pattern());
    std::size_t here = 0;
    for (const AntecedentMapping& m : event.mappings) {
      const double magnitude = std::clamp(m.base_magnitude * event.severity, 0.0, 1.0) * consistency;
      if (magnitude <= 0.0) continue;
      rel.append_antecedent(*dir, TrustAntecedent(event.timestamp, m.type, m.direction, magnitude, m.context,
                                                  m.life_domain));
      ++here;
    }
    if (here == 0) {
      if (log::enabled(log::Level::Debug)) {
        log::debug(rel.id(), "event " + event.source + " -> " + event.target + " produced no antecedents");
      }
      continue;
    }

    rel.recompute_trustworthiness(*dir);
    appended += here;
    if (log::enabled(log::Level::Debug)) {
      const TrustworthinessFactors& tw = rel.trustworthiness(*dir);
      log::debug(rel.id(), std::string(direction_id(*dir)) + ": +" + std::to_string(here) +
                           " antecedent(s), competence=" + format_fixed(tw.competence_effective()) +
                           " benevolence=" + format_fixed(tw.benevolence_effective()) +
                           " integrity=" + format_fixed(tw.integrity_effective()));
    }
  }
  return appended;
}

} // namespace rapport
