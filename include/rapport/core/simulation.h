#pragma once

#include <cstddef>
#include <cstdint>
#include <vector>

#include "rapport/core/event_antecedents.h"
#include "rapport/core/relationship.h"
#include "rapport/core/time.h"

namespace rapport {

struct SimConfig {
  // Granularity of decay when advancing time. Larger steps are cheaper and
  // give identical results, since decay composes multiplicatively.
  int decay_step_hours{24};

  // Emit an info line for every relationship touched by process_event().
  bool log_trust_updates{false};
};

// Owns a set of independent pairwise relationships and a simulated clock.
//
// Routes observed events to the matching relationships and applies decay as
// time moves forward. It never schedules interactions itself.
class Simulation {
 public:
  explicit Simulation(Timestamp start, SimConfig cfg = {});

  const SimConfig& cfg() const { return cfg_; }
  Timestamp now() const { return now_; }

  // Throws RelationshipError if a == b, an id is empty, or the unordered
  // pair already exists.
  //
  // Relationships live in a std::vector: the returned reference, and any
  // pointer from find(), is invalidated by the next add_relationship().
  // Look the pair up again after adding instead of holding on to it.
  Relationship& add_relationship(const EntityId& a, const EntityId& b);

  // Order-insensitive lookup; nullptr if absent.
  Relationship* find(const EntityId& x, const EntityId& y);
  const Relationship* find(const EntityId& x, const EntityId& y) const;

  std::vector<Relationship>& relationships() { return relationships_; }
  const std::vector<Relationship>& relationships() const { return relationships_; }

  // Returns the number of antecedents appended across all relationships.
  std::size_t process_event(const TrustEvent& event);

  // Non-positive spans are ignored. Spans are summed in 64-bit hours, so
  // any int day count is safe.
  void advance_hours(int hours);
  void advance_days(int days);

 private:
  void advance_by(std::int64_t hours);
  void tick(Duration step);

  SimConfig cfg_;
  Timestamp now_;
  std::vector<Relationship> relationships_;
};

} // namespace rapport
