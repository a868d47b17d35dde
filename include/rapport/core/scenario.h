#pragma once

#include <cstddef>
#include <cstdint>
#include <optional>
#include <string>
#include <vector>

#include "rapport/core/event_antecedents.h"
#include "rapport/core/relationship.h"
#include "rapport/core/simulation.h"
#include "rapport/core/time.h"

namespace rapport {

// Initial configuration of one relationship in a scenario file.
struct RelationshipSetup {
  EntityId a;
  EntityId b;
  RelationshipStage stage{RelationshipStage::Stranger};
  RelationshipSchema schema{RelationshipSchema::Peer};
  std::vector<BondType> bonds;
  double consistency{0.0};
};

enum class ScenarioStepKind : std::uint8_t {
  AdvanceDays = 0,
  Event = 1,
  Decide = 2,
  Confide = 3,
  Help = 4,
};

const char* scenario_step_kind_id(ScenarioStepKind k);

// One scripted step. Only the fields relevant to `kind` are read.
//
// For queries, `direction` is relative to the relationship as it was set up
// (a_to_b is how its first entity perceives the second).
struct ScenarioStep {
  ScenarioStepKind kind{ScenarioStepKind::AdvanceDays};

  int days{0};

  // Event. A missing timestamp means "the simulation clock when the step runs".
  TrustEvent event;
  bool event_has_timestamp{false};

  // Queries.
  EntityId a;
  EntityId b;
  Direction direction{Direction::AToB};
  double propensity{0.5};
  StakesLevel stakes{StakesLevel::Low};
  double risk{0.0};
};

struct Scenario {
  Timestamp start;
  std::vector<RelationshipSetup> relationships;
  std::vector<ScenarioStep> steps;
};

// Result of running one step.
struct StepOutcome {
  std::size_t index{0};
  ScenarioStepKind kind{ScenarioStepKind::AdvanceDays};
  Timestamp at;
  std::size_t antecedents_appended{0};
  std::optional<TrustDecision> decision;
  std::optional<bool> verdict;

  // One-line human readable description.
  std::string summary;
};

// Parses a scenario document. Throws std::runtime_error naming the offending
// step or relationship on malformed input.
Scenario parse_scenario_json(const std::string& text);

// Builds a simulation from the scenario's setup and runs every step in order.
// Throws RelationshipError for bad setups or queries on unknown pairs.
std::vector<StepOutcome> run_scenario(const Scenario& scenario, Simulation& sim);

// Convenience: constructs the simulation at scenario.start and runs it.
Simulation make_scenario_simulation(const Scenario& scenario, SimConfig cfg = {});

} // namespace rapport
