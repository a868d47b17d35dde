#pragma once

#include <functional>
#include <string>

namespace rapport::log {

enum class Level { Debug = 0, Info = 1, Warn = 2, Error = 3, Off = 4 };

void set_level(Level lvl);
Level level();

// True if a message at `lvl` would currently be emitted.
//
// Callers that build expensive debug strings should check this first.
bool enabled(Level lvl);

const char* level_id(Level lvl);

// Every emitted message goes through the sink. `subject` names what the line
// is about (usually a relationship id such as "rel_alice_bob") and may be empty.
using Sink = std::function<void(Level lvl, const std::string& subject, const std::string& msg)>;

// Replaces the sink; an empty function restores the stderr sink.
void set_sink(Sink sink);

// "[LEVEL] subject: msg", or "[LEVEL] msg" without a subject.
std::string format_line(Level lvl, const std::string& subject, const std::string& msg);

void debug(const std::string& msg);
void info(const std::string& msg);
void warn(const std::string& msg);
void error(const std::string& msg);

void debug(const std::string& subject, const std::string& msg);
void info(const std::string& subject, const std::string& msg);
void warn(const std::string& subject, const std::string& msg);

} // namespace rapport::log
