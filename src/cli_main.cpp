#include <exception>
#include <iostream>
#include <optional>
#include <string>
#include <vector>

#include "rapport/core/scenario.h"
#include "rapport/core/serialization.h"
#include "rapport/core/simulation.h"
#include "rapport/util/file_io.h"
#include "rapport/util/log.h"
#include "rapport/util/strings.h"

namespace {

#ifndef RAPPORT_VERSION
#define RAPPORT_VERSION "unknown"
#endif

int get_int_arg(int argc, char** argv, const std::string& key, int def) {
  for (int i = 1; i < argc - 1; ++i) {
    if (argv[i] == key) return std::stoi(argv[i + 1]);
  }
  return def;
}

std::string get_str_arg(int argc, char** argv, const std::string& key, const std::string& def) {
  for (int i = 1; i < argc - 1; ++i) {
    if (argv[i] == key) return argv[i + 1];
  }
  return def;
}

bool has_flag(int argc, char** argv, const std::string& flag) {
  for (int i = 1; i < argc; ++i) {
    if (argv[i] == flag) return true;
  }
  return false;
}

std::optional<rapport::log::Level> parse_log_level(const std::string& raw) {
  const std::string s = rapport::to_lower(rapport::trim_copy(raw));
  if (s == "debug") return rapport::log::Level::Debug;
  if (s == "info") return rapport::log::Level::Info;
  if (s == "warn" || s == "warning") return rapport::log::Level::Warn;
  if (s == "error") return rapport::log::Level::Error;
  if (s == "off" || s == "none") return rapport::log::Level::Off;
  return std::nullopt;
}

void print_usage(const char* exe) {
  std::cout << "Rapport CLI v" << RAPPORT_VERSION << "\n\n";
  std::cout << "Usage: " << (exe ? exe : "rapport_cli") << " --scenario PATH [options]\n\n";
  std::cout << "Options:\n";
  std::cout << "  --scenario PATH     Scenario JSON to run (relationships + scripted steps)\n";
  std::cout << "  --export PATH       Write the final relationships as JSON after the run\n";
  std::cout << "  --decay-step N      Decay granularity in hours when advancing time (default: 24)\n";
  std::cout << "  --log-trust         Log trustworthiness after every event\n";
  std::cout << "  --log-level LEVEL   debug|info|warn|error|off (default: info)\n";
  std::cout << "  --dump              Print the final relationships JSON to stdout\n";
  std::cout << "  --quiet             Suppress step output (useful for scripts)\n";
  std::cout << "  -h, --help          Show this help\n";
  std::cout << "  --version           Print version and exit\n";
}

} // namespace

int main(int argc, char** argv) {
  try {
    if (has_flag(argc, argv, "--version")) {
      std::cout << RAPPORT_VERSION << "\n";
      return 0;
    }
    if (has_flag(argc, argv, "--help") || has_flag(argc, argv, "-h")) {
      print_usage(argv[0]);
      return 0;
    }

    const std::string level_raw = get_str_arg(argc, argv, "--log-level", "info");
    const auto level = parse_log_level(level_raw);
    if (!level) {
      std::cerr << "Unknown --log-level: " << level_raw << "\n\n";
      print_usage(argv[0]);
      return 2;
    }
    rapport::log::set_level(*level);

    const std::string scenario_path = get_str_arg(argc, argv, "--scenario", "");
    const std::string export_path = get_str_arg(argc, argv, "--export", "");
    const bool quiet = has_flag(argc, argv, "--quiet");

    if (scenario_path.empty()) {
      std::cerr << "--scenario is required\n\n";
      print_usage(argv[0]);
      return 2;
    }

    rapport::SimConfig cfg;
    cfg.decay_step_hours = get_int_arg(argc, argv, "--decay-step", cfg.decay_step_hours);
    cfg.log_trust_updates = has_flag(argc, argv, "--log-trust");

    const rapport::Scenario scenario = rapport::parse_scenario_json(rapport::read_text_file(scenario_path));
    rapport::Simulation sim = rapport::make_scenario_simulation(scenario, cfg);
    rapport::log::info("Loaded " + std::to_string(sim.relationships().size()) + " relationship(s), " +
                       std::to_string(scenario.steps.size()) + " step(s) from " + scenario_path);

    const std::vector<rapport::StepOutcome> outcomes = rapport::run_scenario(scenario, sim);
    if (!quiet) {
      for (const auto& o : outcomes) {
        std::cout << "[" << o.at.to_string() << "] #" << o.index << " " << o.summary << "\n";
      }
    }

    if (!export_path.empty()) {
      rapport::write_text_file(export_path, rapport::serialize_relationships_to_json(sim.relationships()));
      if (!quiet) std::cout << "Relationships written to " << export_path << "\n";
    }

    if (has_flag(argc, argv, "--dump")) {
      std::cout << "\n--- JSON ---\n" << rapport::serialize_relationships_to_json(sim.relationships()) << "\n";
    }

    return 0;
  } catch (const std::exception& e) {
    rapport::log::error(std::string("Fatal: ") + e.what());
    return 1;
  }
}
