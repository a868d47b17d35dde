#include "rapport/core/scenario.h"

#include <algorithm>
#include <cmath>
#include <limits>
#include <stdexcept>
#include <string>
#include <utility>

#include "rapport/core/enum_strings.h"
#include "rapport/core/predictions.h"
#include "rapport/util/json.h"
#include "rapport/util/log.h"
#include "rapport/util/strings.h"

namespace rapport {
namespace {

using json::Value;

// Largest span whose hour count still fits in an int.
constexpr int kMaxAdvanceDays = std::numeric_limits<int>::max() / 24;

[[noreturn]] void fail(const std::string& where, const std::string& msg) {
  throw std::runtime_error("Scenario " + where + ": " + msg);
}

std::string require_string(const Value& o, const std::string& key, const std::string& where) {
  const Value* v = o.find(key);
  if (!v || !v->is_string()) fail(where, "missing string field '" + key + "'");
  return v->string_value();
}

double optional_number(const Value& o, const std::string& key, double def, const std::string& where) {
  const Value* v = o.find(key);
  if (!v) return def;
  if (!v->is_number()) fail(where, "field '" + key + "' must be a number");
  return v->number_value();
}

template <typename E, typename Parser>
E optional_enum(const Value& o, const std::string& key, E def, Parser parse, const std::string& where) {
  const Value* v = o.find(key);
  if (!v) return def;
  if (!v->is_string()) fail(where, "field '" + key + "' must be a string");
  const std::optional<E> e = parse(v->string_value());
  if (!e) fail(where, "unknown " + key + " '" + v->string_value() + "'");
  return *e;
}

RelationshipSetup parse_setup(const Value& v, const std::string& where) {
  if (!v.is_object()) fail(where, "expected an object");
  RelationshipSetup s;
  s.a = require_string(v, "a", where);
  s.b = require_string(v, "b", where);
  s.stage = optional_enum(v, "stage", s.stage, relationship_stage_from_string, where);
  s.schema = optional_enum(v, "schema", s.schema, relationship_schema_from_string, where);
  s.consistency = optional_number(v, "consistency", s.consistency, where);
  if (const Value* bonds = v.find("bonds")) {
    if (!bonds->is_array()) fail(where, "'bonds' must be an array");
    for (const auto& b : bonds->array()) {
      const std::optional<BondType> bt = bond_type_from_string(b.string_value());
      if (!bt) fail(where, "unknown bond '" + b.string_value() + "'");
      s.bonds.push_back(*bt);
    }
  }
  return s;
}

AntecedentMapping parse_mapping(const Value& v, const std::string& where) {
  if (!v.is_object()) fail(where, "mapping must be an object");
  AntecedentMapping m;
  const std::string type = require_string(v, "type", where);
  const std::optional<AntecedentType> t = antecedent_type_from_string(type);
  if (!t) fail(where, "unknown antecedent type '" + type + "'");
  m.type = *t;
  m.direction = optional_enum(v, "direction", m.direction, antecedent_direction_from_string, where);
  m.base_magnitude = optional_number(v, "magnitude", 0.0, where);
  if (const Value* c = v.find("context")) m.context = c->string_value();
  if (const Value* d = v.find("life_domain")) {
    const std::optional<LifeDomain> ld = life_domain_from_string(d->string_value());
    if (!ld) fail(where, "unknown life_domain '" + d->string_value() + "'");
    m.life_domain = *ld;
  }
  return m;
}

void parse_query(const Value& v, ScenarioStep& step, const std::string& where) {
  if (!v.is_object()) fail(where, "expected an object");
  step.a = require_string(v, "a", where);
  step.b = require_string(v, "b", where);
  step.direction = optional_enum(v, "direction", step.direction, direction_from_string, where);
  step.propensity = optional_number(v, "propensity", step.propensity, where);
  step.stakes = optional_enum(v, "stakes", step.stakes, stakes_level_from_string, where);
  step.risk = optional_number(v, "risk", step.risk, where);
}

ScenarioStep parse_step(const Value& v, const std::string& where) {
  if (!v.is_object()) fail(where, "expected an object");
  ScenarioStep step;

  if (const Value* days = v.find("advance_days")) {
    if (!days->is_number()) fail(where, "'advance_days' must be a number");
    const double n = days->number_value();
    if (n < 0) fail(where, "'advance_days' must not be negative");
    if (std::floor(n) != n) fail(where, "'advance_days' must be a whole number of days");
    if (n > kMaxAdvanceDays) fail(where, "'advance_days' must be at most " + std::to_string(kMaxAdvanceDays));
    step.kind = ScenarioStepKind::AdvanceDays;
    step.days = static_cast<int>(n);
    return step;
  }

  if (const Value* ev = v.find("event")) {
    if (!ev->is_object()) fail(where, "'event' must be an object");
    step.kind = ScenarioStepKind::Event;
    step.event.source = require_string(*ev, "source", where);
    step.event.target = require_string(*ev, "target", where);
    step.event.severity = optional_number(*ev, "severity", 1.0, where);
    if (const Value* ts = ev->find("timestamp")) {
      step.event.timestamp = Timestamp::parse_iso(ts->string_value());
      step.event_has_timestamp = true;
    }
    const Value* mappings = ev->find("mappings");
    if (!mappings || !mappings->is_array()) fail(where, "event needs a 'mappings' array");
    for (const auto& m : mappings->array()) step.event.mappings.push_back(parse_mapping(m, where));
    return step;
  }

  if (const Value* q = v.find("decide")) {
    step.kind = ScenarioStepKind::Decide;
    parse_query(*q, step, where);
    return step;
  }
  if (const Value* q = v.find("confide")) {
    step.kind = ScenarioStepKind::Confide;
    parse_query(*q, step, where);
    return step;
  }
  if (const Value* q = v.find("help")) {
    step.kind = ScenarioStepKind::Help;
    parse_query(*q, step, where);
    return step;
  }

  fail(where, "unknown step (expected advance_days, event, decide, confide or help)");
}

const Relationship& lookup(const Simulation& sim, const ScenarioStep& step, const std::string& where) {
  const Relationship* rel = sim.find(step.a, step.b);
  if (!rel) fail(where, "no relationship between '" + step.a + "' and '" + step.b + "'");
  return *rel;
}

std::string decision_summary(const TrustDecision& d) {
  return "task=" + format_fixed(d.task_willingness()) + " support=" + format_fixed(d.support_willingness()) +
         " disclosure=" + format_fixed(d.disclosure_willingness()) + " certainty=" +
         format_fixed(d.decision_certainty()) + " trustee_confidence=" + format_fixed(d.trustee_confidence());
}

} // namespace

const char* scenario_step_kind_id(ScenarioStepKind k) {
  switch (k) {
    case ScenarioStepKind::AdvanceDays: return "advance_days";
    case ScenarioStepKind::Event: return "event";
    case ScenarioStepKind::Decide: return "decide";
    case ScenarioStepKind::Confide: return "confide";
    case ScenarioStepKind::Help: return "help";
  }
  return "advance_days";
}

Scenario parse_scenario_json(const std::string& text) {
  const Value root = json::parse(text);
  if (!root.is_object()) fail("root", "expected an object");

  Scenario sc;
  sc.start = Timestamp::parse_iso(require_string(root, "start", "root"));

  if (const Value* rels = root.find("relationships")) {
    if (!rels->is_array()) fail("root", "'relationships' must be an array");
    const auto& arr = rels->array();
    for (std::size_t i = 0; i < arr.size(); ++i) {
      sc.relationships.push_back(parse_setup(arr[i], "relationship " + std::to_string(i)));
    }
  }

  if (const Value* steps = root.find("steps")) {
    if (!steps->is_array()) fail("root", "'steps' must be an array");
    const auto& arr = steps->array();
    for (std::size_t i = 0; i < arr.size(); ++i) {
      sc.steps.push_back(parse_step(arr[i], "step " + std::to_string(i)));
    }
  }
  return sc;
}

Simulation make_scenario_simulation(const Scenario& scenario, SimConfig cfg) {
  Simulation sim(scenario.start, cfg);
  for (const auto& s : scenario.relationships) {
    Relationship& rel = sim.add_relationship(s.a, s.b);
    rel.set_stage(s.stage);
    rel.set_schema(s.schema);
    for (BondType b : s.bonds) rel.add_bond(b);
    rel.pattern().consistency = std::clamp(s.consistency, 0.0, 1.0);
  }
  return sim;
}

std::vector<StepOutcome> run_scenario(const Scenario& scenario, Simulation& sim) {
  std::vector<StepOutcome> out;
  out.reserve(scenario.steps.size());

  for (std::size_t i = 0; i < scenario.steps.size(); ++i) {
    const ScenarioStep& step = scenario.steps[i];
    const std::string where = "step " + std::to_string(i);

    StepOutcome o;
    o.index = i;
    o.kind = step.kind;

    switch (step.kind) {
      case ScenarioStepKind::AdvanceDays: {
        sim.advance_days(step.days);
        o.summary = "advanced " + std::to_string(step.days) + " day(s) to " + sim.now().to_string();
        break;
      }
      case ScenarioStepKind::Event: {
        TrustEvent ev = step.event;
        if (!step.event_has_timestamp) ev.timestamp = sim.now();
        o.antecedents_appended = sim.process_event(ev);
        o.summary = ev.source + " -> " + ev.target + ": " + std::to_string(o.antecedents_appended) +
                    " antecedent(s) recorded";
        break;
      }
      case ScenarioStepKind::Decide: {
        const Relationship& rel = lookup(sim, step, where);
        const TrustDecision d = rel.compute_trust_decision(step.direction, step.propensity, step.stakes);
        o.decision = d;
        o.summary = std::string("decide ") + rel.id() + " " + direction_id(step.direction) + " [" +
                    stakes_level_id(step.stakes) + "]: " + decision_summary(d);
        break;
      }
      case ScenarioStepKind::Confide:
      case ScenarioStepKind::Help: {
        const Relationship& rel = lookup(sim, step, where);
        const bool confide = step.kind == ScenarioStepKind::Confide;
        const bool yes = confide ? would_confide(rel, step.direction, step.propensity, step.risk)
                                 : would_help(rel, step.direction, step.propensity, step.risk);
        o.verdict = yes;
        o.summary = std::string(scenario_step_kind_id(step.kind)) + " " + rel.id() + " " +
                    direction_id(step.direction) + " risk=" + format_fixed(step.risk, 2) + ": " +
                    (yes ? "yes" : "no");
        break;
      }
    }

    o.at = sim.now();
    log::debug("scenario " + where, o.summary);
    out.push_back(std::move(o));
  }
  return out;
}

} // namespace rapport
