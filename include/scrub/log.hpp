#pragma once

#include <scrub/result.hpp>
#include <string>
#include <cstdio>

namespace scrub::log {

enum Level { Trace, Debug, Info, Warn, Error };

void set_level(Level lvl);
Level get_level();

// Map "trace", "debug", "info", "warn"/"warning" or "error" to a level
Result<Level> parse_level(const std::string& name);

void set_color_enabled(bool enabled);
bool is_color_enabled();

void trace(const char* fmt, ...);
void debug(const char* fmt, ...);
void info(const char* fmt, ...);
void warn(const char* fmt, ...);
void error(const char* fmt, ...);

// Log a formatted ScrubError at Error level, one line per part
void report(const ScrubError& err);

// Returns the name string for a level
const char* level_name(Level lvl);

} // namespace scrub::log
