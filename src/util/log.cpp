#include "rapport/util/log.h"

#include <atomic>
#include <iostream>
#include <mutex>
#include <utility>

namespace rapport::log {
namespace {

std::atomic<Level> g_level{Level::Info};

// Guards the sink and serializes writes through it.
std::mutex g_sink_mu;
Sink g_sink;

void write_stderr(Level lvl, const std::string& subject, const std::string& msg) {
  std::cerr << format_line(lvl, subject, msg) << '\n';
}

void emit(Level lvl, const std::string& subject, const std::string& msg) {
  if (!enabled(lvl)) return;
  std::lock_guard<std::mutex> lock(g_sink_mu);
  if (g_sink) {
    g_sink(lvl, subject, msg);
  } else {
    write_stderr(lvl, subject, msg);
  }
}

} // namespace

void set_level(Level lvl) { g_level.store(lvl); }
Level level() { return g_level.load(); }

bool enabled(Level lvl) {
  const Level current = g_level.load();
  return current != Level::Off && lvl != Level::Off && lvl >= current;
}

const char* level_id(Level lvl) {
  switch (lvl) {
    case Level::Debug: return "DEBUG";
    case Level::Info: return "INFO";
    case Level::Warn: return "WARN";
    case Level::Error: return "ERROR";
    case Level::Off: return "OFF";
  }
  return "?";
}

void set_sink(Sink sink) {
  std::lock_guard<std::mutex> lock(g_sink_mu);
  g_sink = std::move(sink);
}

std::string format_line(Level lvl, const std::string& subject, const std::string& msg) {
  std::string line = std::string("[") + level_id(lvl) + "] ";
  if (!subject.empty()) line += subject + ": ";
  return line + msg;
}

void debug(const std::string& msg) { emit(Level::Debug, {}, msg); }
void info(const std::string& msg) { emit(Level::Info, {}, msg); }
void warn(const std::string& msg) { emit(Level::Warn, {}, msg); }
void error(const std::string& msg) { emit(Level::Error, {}, msg); }

void debug(const std::string& subject, const std::string& msg) { emit(Level::Debug, subject, msg); }
void info(const std::string& subject, const std::string& msg) { emit(Level::Info, subject, msg); }
void warn(const std::string& subject, const std::string& msg) { emit(Level::Warn, subject, msg); }

} // namespace rapport::log
