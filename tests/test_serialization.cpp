#include <cmath>
#include <iostream>
#include <stdexcept>
#include <string>
#include <vector>

#include "rapport/core/scenario.h"
#include "rapport/core/serialization.h"
#include "rapport/util/json.h"

#define RAPPORT_ASSERT(expr) \
  do { \
    if (!(expr)) { \
      std::cerr << "ASSERT failed: " #expr " (" << __FILE__ << ":" << __LINE__ << ")\n"; \
      return 1; \
    } \
  } while (0)

namespace {

bool near(double a, double b, double eps = 1e-9) { return std::fabs(a - b) <= eps; }

std::string scenario_error(const std::string& text) {
  try {
    (void)rapport::parse_scenario_json(text);
  } catch (const std::runtime_error& e) {
    return e.what();
  }
  return {};
}

const char* kScenario = R"({
  "start": "2024-03-01",
  "relationships": [
    {"a": "alice", "b": "bob", "stage": "acquaintance", "schema": "peer",
     "bonds": ["colleague"], "consistency": 1.0}
  ],
  "steps": [
    {"confide": {"a": "alice", "b": "bob", "direction": "a_to_b", "propensity": 0.9, "risk": 0.0}},
    {"event": {"source": "bob", "target": "alice", "severity": 1.0, "mappings": [
      {"type": "integrity", "direction": "positive", "magnitude": 1.0, "context": "kept a secret"},
      {"type": "ability", "direction": "positive", "magnitude": 0.5, "life_domain": "work"}
    ]}},
    {"advance_days": 2},
    {"decide": {"a": "alice", "b": "bob", "direction": "a_to_b", "propensity": 0.5, "stakes": "medium"}},
    {"help": {"a": "bob", "b": "alice", "direction": "b_to_a", "propensity": 0.5, "risk": 0.9}}
  ]
})";

} // namespace

int test_serialization() {
  using rapport::Direction;
  namespace json = rapport::json;

  // Relationship export.
  {
    rapport::Relationship r("alice", "bob");
    r.add_bond(rapport::BondType::Friend);
    r.shared().add_affinity_delta(0.2);
    r.perceived_risk(Direction::BToA).mark_betrayal();
    r.append_antecedent(Direction::AToB,
                        rapport::TrustAntecedent(rapport::Timestamp::parse_iso("2024-01-02"),
                                                 rapport::AntecedentType::Ability,
                                                 rapport::AntecedentDirection::Negative, 0.5, "missed deadline",
                                                 rapport::LifeDomain::Work));

    const json::Value v = json::parse(rapport::serialize_relationship_to_json(r));
    RAPPORT_ASSERT(v.at("id").string_value() == "rel_alice_bob");
    RAPPORT_ASSERT(v.at("stage").string_value() == "stranger");
    RAPPORT_ASSERT(v.at("schema").string_value() == "peer");
    RAPPORT_ASSERT(v.at("bonds").array().size() == 1);
    RAPPORT_ASSERT(v.at("bonds").array()[0].string_value() == "friend");

    const json::Value& affinity = v.at("shared").at("affinity");
    RAPPORT_ASSERT(near(affinity.at("base").number_value(), 0.1));
    RAPPORT_ASSERT(near(affinity.at("delta").number_value(), 0.2));
    RAPPORT_ASSERT(near(affinity.at("effective").number_value(), 0.3));

    const json::Value& ab = v.at("a_to_b");
    RAPPORT_ASSERT(ab.at("antecedents").array().size() == 1);
    const json::Value& a0 = ab.at("antecedents").array()[0];
    RAPPORT_ASSERT(a0.at("type").string_value() == "ability");
    RAPPORT_ASSERT(a0.at("direction").string_value() == "negative");
    RAPPORT_ASSERT(a0.at("life_domain").string_value() == "work");
    RAPPORT_ASSERT(a0.at("timestamp").string_value() == "2024-01-02T00:00:00");
    RAPPORT_ASSERT(ab.at("last_negative_antecedent").string_value() == "2024-01-02T00:00:00");
    RAPPORT_ASSERT(ab.at("trustworthiness").at("competence").at("health").is_object());
    RAPPORT_ASSERT(ab.at("dimensions").at("warmth").is_object());

    const json::Value& ba = v.at("b_to_a");
    RAPPORT_ASSERT(ba.at("perceived_risk").at("betrayal_history").bool_value());
    RAPPORT_ASSERT(ba.find("last_negative_antecedent") == nullptr);

    // Export is deterministic.
    RAPPORT_ASSERT(rapport::serialize_relationship_to_json(r) == rapport::serialize_relationship_to_json(r));

    const std::vector<rapport::Relationship> rels{r};
    const json::Value all = json::parse(rapport::serialize_relationships_to_json(rels));
    RAPPORT_ASSERT(all.at("relationships").array().size() == 1);
  }

  // Scenario parsing and running.
  {
    const rapport::Scenario sc = rapport::parse_scenario_json(kScenario);
    RAPPORT_ASSERT(sc.relationships.size() == 1);
    RAPPORT_ASSERT(sc.relationships[0].stage == rapport::RelationshipStage::Acquaintance);
    RAPPORT_ASSERT(sc.steps.size() == 5);
    RAPPORT_ASSERT(sc.steps[1].event.mappings.size() == 2);
    RAPPORT_ASSERT(sc.steps[1].event.mappings[1].life_domain == rapport::LifeDomain::Work);
    RAPPORT_ASSERT(sc.steps[3].stakes == rapport::StakesLevel::Medium);

    rapport::Simulation sim = rapport::make_scenario_simulation(sc);
    const rapport::Relationship* rel = sim.find("alice", "bob");
    RAPPORT_ASSERT(rel != nullptr);
    RAPPORT_ASSERT(rel->has_bond(rapport::BondType::Colleague));

    const auto outcomes = rapport::run_scenario(sc, sim);
    RAPPORT_ASSERT(outcomes.size() == 5);

    // Acquaintance, integrity 0.3: 0.36 + 0.18 - 0.5 * 0.5 = 0.29, below 0.6.
    RAPPORT_ASSERT(outcomes[0].verdict.has_value());
    RAPPORT_ASSERT(!*outcomes[0].verdict);

    RAPPORT_ASSERT(outcomes[1].antecedents_appended == 2);
    RAPPORT_ASSERT(outcomes[1].at == rapport::Timestamp::parse_iso("2024-03-01"));
    RAPPORT_ASSERT(rel->antecedent_history(Direction::AToB)[0].timestamp() == outcomes[1].at);

    RAPPORT_ASSERT(outcomes[2].at == rapport::Timestamp::parse_iso("2024-03-03"));
    RAPPORT_ASSERT(outcomes[3].decision.has_value());
    RAPPORT_ASSERT(outcomes[3].decision->disclosure_willingness() > 0.0);
    RAPPORT_ASSERT(outcomes[4].verdict.has_value());
    RAPPORT_ASSERT(!*outcomes[4].verdict);
    RAPPORT_ASSERT(!outcomes[3].summary.empty());
  }

  // Malformed scenarios name the problem.
  {
    RAPPORT_ASSERT(scenario_error(R"({"relationships": []})").find("start") != std::string::npos);
    RAPPORT_ASSERT(scenario_error(R"({"start": "2024-01-01", "steps": [{"jump": 1}]})").find("step 0") !=
                   std::string::npos);
    RAPPORT_ASSERT(scenario_error(R"({"start": "2024-01-01", "relationships": [{"a": "x", "b": "y",
                                   "bonds": ["nemesis"]}]})")
                       .find("nemesis") != std::string::npos);
    RAPPORT_ASSERT(!scenario_error("{not json").empty());

    // Day counts must be whole and small enough to convert to hours.
    const std::string too_many =
        scenario_error(R"({"start": "2024-01-01", "steps": [{"advance_days": 1}, {"advance_days": 4294967297}]})");
    RAPPORT_ASSERT(too_many.find("step 1") != std::string::npos);
    RAPPORT_ASSERT(too_many.find("advance_days") != std::string::npos);
    RAPPORT_ASSERT(scenario_error(R"({"start": "2024-01-01", "steps": [{"advance_days": 1e300}]})").find("step 0") !=
                   std::string::npos);
    RAPPORT_ASSERT(scenario_error(R"({"start": "2024-01-01", "steps": [{"advance_days": 2.5}]})").find("whole") !=
                   std::string::npos);
    RAPPORT_ASSERT(scenario_error(R"({"start": "2024-01-01", "steps": [{"advance_days": -1}]})").find("negative") !=
                   std::string::npos);
    const rapport::Scenario longest =
        rapport::parse_scenario_json(R"({"start": "2024-01-01", "steps": [{"advance_days": 89478485}]})");
    RAPPORT_ASSERT(longest.steps[0].days == 89478485);

    // Queries on unknown pairs fail at run time.
    const rapport::Scenario sc = rapport::parse_scenario_json(
        R"({"start": "2024-01-01", "steps": [{"decide": {"a": "x", "b": "y"}}]})");
    rapport::Simulation sim = rapport::make_scenario_simulation(sc);
    bool threw = false;
    try {
      (void)rapport::run_scenario(sc, sim);
    } catch (const std::runtime_error&) {
      threw = true;
    }
    RAPPORT_ASSERT(threw);
  }

  return 0;
}
